// Daemon configuration read from an INI file through QSettings.
#pragma once
#include <QString>
#include <string>
#include "DownloadScheduler.hpp"
#include "mediarelay/AdaptiveTransferExecutor.hpp"
#include "mediarelay/SessionOptions.hpp"

struct RelayConfig {
    SchedulerConfig scheduler;
    mediarelay::ExecutorConfig executor;
    mediarelay::SessionOptions source;
    mediarelay::SessionOptions sink;
    QString registryPath; // empty: in-memory registry
    int maxAccessCount = 4;

    // Reads path (groups Scheduler, Transfer, Source, Sink, Registry) over
    // the defaults, then applies MEDIA_RELAY_TEMP_DIR. An empty path yields
    // the defaults. Fails on unreadable files, malformed numbers and
    // inconsistent values.
    static bool load(const QString &path, RelayConfig &out, std::string &err);

    bool validate(std::string &err) const;
};
