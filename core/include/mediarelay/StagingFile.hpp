// Ephemeral local file holding bytes between source read and sink upload.
// The destructor always removes it, whatever the outcome of the run.
#pragma once
#include "TransferTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace mediarelay {

class StagingFile {
public:
    explicit StagingFile(std::string path);
    ~StagingFile();

    StagingFile(const StagingFile &) = delete;
    StagingFile &operator=(const StagingFile &) = delete;

    // Creates (truncating) the file for writing.
    bool open(std::string &err);
    bool append(const char *data, std::size_t n, std::string &err);
    // Flushes and closes; the file stays on disk until discard()/destructor.
    bool close(std::string &err);
    // Closes if needed and deletes the file. Safe to call more than once.
    void discard();

    const std::string &path() const { return path_; }
    std::uint64_t bytesWritten() const { return written_; }

    // <dir>/temp_<sanitized id>_<idDigest(id)>.part. Ids that sanitize to
    // the same text still get distinct files.
    static std::string pathFor(const std::string &dir, const TransferTask &task);

private:
    std::string path_;
    std::FILE *fp_ = nullptr;
    std::uint64_t written_ = 0;
};

} // namespace mediarelay
