// Persistent record of objects already relayed to the sink. Serves as the
// scheduler's DedupProbe so repeat requests short-circuit to the stored
// remote id.
#pragma once
#include <QDateTime>
#include <QString>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "mediarelay/DedupProbe.hpp"
#include "mediarelay/TransferSink.hpp"

struct UploadRecord {
    std::string remoteId;
    std::string displayName;
    QDateTime uploadedAt;
    std::uint64_t sizeBytes = 0;
    int accessCount = 0;
};

class UploadRegistry : public mediarelay::DedupProbe {
public:
    // An empty path keeps the registry in memory only. When sink is set,
    // records are only trusted while the sink still has the object.
    explicit UploadRegistry(QString path, int maxAccessCount = 4,
                            mediarelay::TransferSink *sink = nullptr);

    // A missing file is an empty registry, not an error.
    bool load(std::string &err);
    // Written through QSaveFile, so a crash never leaves a torn file.
    bool save(std::string &err) const;

    // Remote id when the record exists, is below the access limit and the
    // sink still reports the object. Stale records are dropped.
    std::optional<std::string> isDurablyStored(const std::string &id) override;
    void recordStored(const mediarelay::TransferTask &task,
                      const std::string &remoteId,
                      std::uint64_t sizeBytes) override;

    // Counts one access to a stored object. Returns false when the id is
    // unknown or already at the limit; remaining is the accesses left.
    bool noteAccess(const std::string &id, int &remaining);

    // Drops every record at the access limit. Returns how many went.
    std::size_t purgeExpired();

    std::optional<UploadRecord> find(const std::string &id) const;
    std::size_t size() const;
    int maxAccessCount() const { return maxAccessCount_; }
    const QString &path() const { return path_; }

private:
    bool saveLocked(std::string &err) const;
    void persistLocked(const char *reason);

    QString path_;
    int maxAccessCount_ = 4;
    mediarelay::TransferSink *sink_ = nullptr;
    mutable std::mutex mtx_;
    std::map<std::string, UploadRecord> records_;
};
