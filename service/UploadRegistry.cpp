// JSON-backed upload registry.
#include "UploadRegistry.hpp"
#include "mediarelay/RuntimeLogging.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QSaveFile>
#include <utility>
Q_LOGGING_CATEGORY(mrRegistry, "mediarelay.registry")

namespace {

QString idLabel(const std::string &id) {
    return QString::fromStdString(mediarelay::redacted(id));
}

} // namespace

UploadRegistry::UploadRegistry(QString path, int maxAccessCount,
                               mediarelay::TransferSink *sink)
    : path_(std::move(path)),
      maxAccessCount_(maxAccessCount < 1 ? 1 : maxAccessCount), sink_(sink) {}

bool UploadRegistry::load(std::string &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    records_.clear();
    if (path_.isEmpty())
        return true;
    QFile file(path_);
    if (!file.exists())
        return true;
    if (!file.open(QIODevice::ReadOnly)) {
        err = "Could not open registry: " + file.errorString().toStdString();
        return false;
    }
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        err = "Registry is not valid JSON: " + perr.errorString().toStdString();
        return false;
    }
    const QJsonObject items = doc.object().value("items").toObject();
    for (auto it = items.begin(); it != items.end(); ++it) {
        if (!it.value().isObject())
            continue;
        const QJsonObject obj = it.value().toObject();
        UploadRecord rec;
        rec.remoteId = obj.value("remoteId").toString().toStdString();
        if (rec.remoteId.empty())
            continue;
        rec.displayName = obj.value("displayName").toString().toStdString();
        rec.uploadedAt = QDateTime::fromString(
            obj.value("uploadedAt").toString(), Qt::ISODate);
        rec.sizeBytes =
            static_cast<std::uint64_t>(obj.value("sizeBytes").toDouble(0));
        rec.accessCount = obj.value("accessCount").toInt(0);
        records_[it.key().toStdString()] = std::move(rec);
    }
    qCInfo(mrRegistry) << "Registry loaded" << "records=" << records_.size();
    return true;
}

bool UploadRegistry::save(std::string &err) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return saveLocked(err);
}

bool UploadRegistry::saveLocked(std::string &err) const {
    if (path_.isEmpty())
        return true;
    const QFileInfo fi(path_);
    if (!QDir().mkpath(fi.absolutePath())) {
        err = "Could not create registry directory: " +
              fi.absolutePath().toStdString();
        return false;
    }
    QJsonObject items;
    for (const auto &kv : records_) {
        QJsonObject obj;
        obj.insert("remoteId", QString::fromStdString(kv.second.remoteId));
        obj.insert("displayName",
                   QString::fromStdString(kv.second.displayName));
        obj.insert("uploadedAt", kv.second.uploadedAt.toString(Qt::ISODate));
        obj.insert("sizeBytes", static_cast<double>(kv.second.sizeBytes));
        obj.insert("accessCount", kv.second.accessCount);
        items.insert(QString::fromStdString(kv.first), obj);
    }
    QJsonObject root;
    root.insert("version", 1);
    root.insert("items", items);

    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        err = "Could not write registry: " + file.errorString().toStdString();
        return false;
    }
    const QByteArray payload = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        file.cancelWriting();
        err = "Could not write registry: " + file.errorString().toStdString();
        return false;
    }
    if (!file.commit()) {
        err = "Could not commit registry: " + file.errorString().toStdString();
        return false;
    }
    return true;
}

void UploadRegistry::persistLocked(const char *reason) {
    std::string err;
    if (!saveLocked(err)) {
        qCWarning(mrRegistry) << "Registry save failed" << "after=" << reason
                              << "error=" << QString::fromStdString(err);
    }
}

std::optional<std::string>
UploadRegistry::isDurablyStored(const std::string &id) {
    std::string remoteId;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = records_.find(id);
        if (it == records_.end())
            return std::nullopt;
        if (it->second.accessCount >= maxAccessCount_) {
            qCInfo(mrRegistry) << "Record expired (access limit)"
                               << "id=" << idLabel(id)
                               << "accessCount=" << it->second.accessCount;
            records_.erase(it);
            persistLocked("expire");
            return std::nullopt;
        }
        remoteId = it->second.remoteId;
    }
    if (!sink_)
        return remoteId;

    std::string err;
    const bool present = sink_->exists(remoteId, err);
    if (present)
        return remoteId;
    if (!err.empty()) {
        // Existence unknown: transfer again rather than hand out a dead id,
        // but keep the record for the next check.
        qCWarning(mrRegistry) << "Sink existence check failed"
                              << "id=" << idLabel(id)
                              << "error=" << QString::fromStdString(err);
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(id);
    if (it != records_.end() && it->second.remoteId == remoteId) {
        qCInfo(mrRegistry) << "Dropping stale record" << "id=" << idLabel(id);
        records_.erase(it);
        persistLocked("stale");
    }
    return std::nullopt;
}

void UploadRegistry::recordStored(const mediarelay::TransferTask &task,
                                  const std::string &remoteId,
                                  std::uint64_t sizeBytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    UploadRecord rec;
    rec.remoteId = remoteId;
    rec.displayName = task.displayName;
    rec.uploadedAt = QDateTime::currentDateTimeUtc();
    rec.sizeBytes = sizeBytes;
    rec.accessCount = 0;
    records_[task.id] = std::move(rec);
    qCInfo(mrRegistry) << "Recorded upload" << "id=" << idLabel(task.id)
                       << "name=" << QString::fromStdString(task.displayName)
                       << "bytes=" << sizeBytes;
    persistLocked("record");
}

bool UploadRegistry::noteAccess(const std::string &id, int &remaining) {
    std::lock_guard<std::mutex> lk(mtx_);
    remaining = 0;
    auto it = records_.find(id);
    if (it == records_.end())
        return false;
    if (it->second.accessCount >= maxAccessCount_)
        return false;
    it->second.accessCount += 1;
    remaining = maxAccessCount_ - it->second.accessCount;
    persistLocked("access");
    return true;
}

std::size_t UploadRegistry::purgeExpired() {
    std::lock_guard<std::mutex> lk(mtx_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.accessCount >= maxAccessCount_) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        qCInfo(mrRegistry) << "Purged expired records" << "count=" << removed;
        persistLocked("purge");
    }
    return removed;
}

std::optional<UploadRecord> UploadRegistry::find(const std::string &id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(id);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::size_t UploadRegistry::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return records_.size();
}
