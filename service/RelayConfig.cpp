#include "RelayConfig.hpp"
#include "mediarelay/RuntimeLogging.hpp"
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <chrono>
#include <climits>
#include <optional>
#include <utility>
Q_LOGGING_CATEGORY(mrConfig, "mediarelay.config")

using mediarelay::KnownHostsPolicy;
using mediarelay::SessionOptions;

namespace {

// Reads one integer key in [lo, hi]; absent keys keep the default.
bool readInt(QSettings &s, const char *key, long long &inOut, long long lo,
             long long hi, std::string &err) {
    if (!s.contains(key))
        return true;
    bool ok = false;
    const long long v = s.value(key).toString().trimmed().toLongLong(&ok);
    if (!ok) {
        err = s.group().toStdString() + "/" + key + " is not an integer";
        return false;
    }
    if (v < lo || v > hi) {
        err = s.group().toStdString() + "/" + key + " out of range (" +
              std::to_string(lo) + ".." + std::to_string(hi) + ")";
        return false;
    }
    inOut = v;
    return true;
}

bool readDouble(QSettings &s, const char *key, double &inOut,
                std::string &err) {
    if (!s.contains(key))
        return true;
    bool ok = false;
    const double v = s.value(key).toString().trimmed().toDouble(&ok);
    if (!ok) {
        err = s.group().toStdString() + "/" + key + " is not a number";
        return false;
    }
    inOut = v;
    return true;
}

std::optional<std::string> readOptional(QSettings &s, const char *key) {
    const QString v = s.value(key).toString();
    if (v.isEmpty())
        return std::nullopt;
    return v.toStdString();
}

bool readEndpoint(QSettings &s, const char *group, SessionOptions &opt,
                  std::string &err) {
    s.beginGroup(group);
    opt.host = s.value("host").toString().trimmed().toStdString();
    long long port = opt.port;
    long long ioTimeoutMs = opt.io_timeout_ms;
    if (!readInt(s, "port", port, 1, 65535, err) ||
        !readInt(s, "ioTimeoutMs", ioTimeoutMs, 0, INT_MAX, err)) {
        s.endGroup();
        return false;
    }
    opt.port = static_cast<std::uint16_t>(port);
    opt.io_timeout_ms = static_cast<long>(ioTimeoutMs);
    opt.username = s.value("user").toString().trimmed().toStdString();
    opt.password = readOptional(s, "password");
    opt.private_key_path = readOptional(s, "keyPath");
    opt.private_key_passphrase = readOptional(s, "keyPassphrase");
    opt.known_hosts_path = readOptional(s, "knownHosts");
    const QString policy =
        s.value("knownHostsPolicy", "strict").toString().trimmed().toLower();
    if (!mediarelay::parseKnownHostsPolicy(policy.toStdString(),
                                           opt.known_hosts_policy)) {
        err = std::string(group) + "/knownHostsPolicy must be strict, " +
              "accept-new or off";
        s.endGroup();
        return false;
    }
    const QString root = s.value("remoteRoot", "/").toString().trimmed();
    opt.remote_root = root.isEmpty() ? std::string("/") : root.toStdString();
    s.endGroup();
    return true;
}

} // namespace

bool RelayConfig::load(const QString &path, RelayConfig &out,
                       std::string &err) {
    RelayConfig cfg;
    if (!path.isEmpty()) {
        if (!QFileInfo::exists(path)) {
            err = "Config file not found: " + path.toStdString();
            return false;
        }
        QSettings s(path, QSettings::IniFormat);
        if (s.status() != QSettings::NoError) {
            err = "Config file could not be parsed: " + path.toStdString();
            return false;
        }

        s.beginGroup("Scheduler");
        long long bulk = cfg.scheduler.bulkSlots;
        long long interactive = cfg.scheduler.interactiveSlots;
        long long wakeMs = cfg.scheduler.wakeInterval.count();
        const bool schedOk =
            readInt(s, "bulkSlots", bulk, 0, INT_MAX, err) &&
            readInt(s, "interactiveSlots", interactive, 0, INT_MAX, err) &&
            readInt(s, "wakeIntervalMs", wakeMs, 1, INT_MAX, err);
        s.endGroup();
        if (!schedOk)
            return false;
        cfg.scheduler.bulkSlots = static_cast<int>(bulk);
        cfg.scheduler.interactiveSlots = static_cast<int>(interactive);
        cfg.scheduler.wakeInterval = std::chrono::milliseconds(wakeMs);

        s.beginGroup("Transfer");
        auto &chunk = cfg.executor.chunk;
        long long minChunk = static_cast<long long>(chunk.minChunkBytes);
        long long initChunk = static_cast<long long>(chunk.initialChunkBytes);
        long long maxChunk = static_cast<long long>(chunk.maxChunkBytes);
        long long windowMs = chunk.sampleWindow.count();
        const bool xferOk =
            readInt(s, "minChunkBytes", minChunk, 1, LLONG_MAX, err) &&
            readInt(s, "initialChunkBytes", initChunk, 1, LLONG_MAX, err) &&
            readInt(s, "maxChunkBytes", maxChunk, 1, LLONG_MAX, err) &&
            readInt(s, "sampleWindowMs", windowMs, 1, INT_MAX, err) &&
            readDouble(s, "lowMBps", chunk.lowMBps, err) &&
            readDouble(s, "mediumMBps", chunk.mediumMBps, err) &&
            readDouble(s, "highMBps", chunk.highMBps, err);
        cfg.executor.stagingDir =
            s.value("stagingDir").toString().trimmed().toStdString();
        s.endGroup();
        if (!xferOk)
            return false;
        chunk.minChunkBytes = static_cast<std::size_t>(minChunk);
        chunk.initialChunkBytes = static_cast<std::size_t>(initChunk);
        chunk.maxChunkBytes = static_cast<std::size_t>(maxChunk);
        chunk.sampleWindow = std::chrono::milliseconds(windowMs);

        if (!readEndpoint(s, "Source", cfg.source, err) ||
            !readEndpoint(s, "Sink", cfg.sink, err))
            return false;

        s.beginGroup("Registry");
        cfg.registryPath = s.value("path").toString().trimmed();
        long long maxAccess = cfg.maxAccessCount;
        const bool regOk =
            readInt(s, "maxAccessCount", maxAccess, 1, INT_MAX, err);
        s.endGroup();
        if (!regOk)
            return false;
        cfg.maxAccessCount = static_cast<int>(maxAccess);
    }

    const std::string tempOverride =
        mediarelay::envOverride(mediarelay::kTempDirVar);
    if (!tempOverride.empty())
        cfg.executor.stagingDir = tempOverride;

    if (!cfg.validate(err))
        return false;

    qCInfo(mrConfig) << "Config loaded"
                     << "file=" << (path.isEmpty() ? QString("<defaults>") : path)
                     << "bulkSlots=" << cfg.scheduler.bulkSlots
                     << "interactiveSlots=" << cfg.scheduler.interactiveSlots
                     << "stagingDir="
                     << (cfg.executor.stagingDir.empty()
                             ? QString("<system temp>")
                             : QString::fromStdString(cfg.executor.stagingDir));
    out = std::move(cfg);
    return true;
}

bool RelayConfig::validate(std::string &err) const {
    if (!scheduler.validate(err))
        return false;
    if (!executor.chunk.validate(err))
        return false;
    if (maxAccessCount < 1) {
        err = "Registry/maxAccessCount must be at least 1";
        return false;
    }
    return true;
}
