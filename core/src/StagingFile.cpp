#include "mediarelay/StagingFile.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace mediarelay {

StagingFile::StagingFile(std::string path) : path_(std::move(path)) {}

StagingFile::~StagingFile() { discard(); }

bool StagingFile::open(std::string &err) {
    if (fp_)
        return true;
    std::error_code ec;
    const fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);
    if (ec) {
        err = "Could not create staging directory: " + ec.message();
        return false;
    }
    fp_ = std::fopen(path_.c_str(), "wb");
    if (!fp_) {
        err = std::string("Could not open staging file: ") +
              std::strerror(errno);
        return false;
    }
    written_ = 0;
    return true;
}

bool StagingFile::append(const char *data, std::size_t n, std::string &err) {
    if (!fp_) {
        err = "Staging file is not open";
        return false;
    }
    if (n == 0)
        return true;
    if (std::fwrite(data, 1, n, fp_) != n) {
        err = std::string("Staging write failed: ") + std::strerror(errno);
        return false;
    }
    written_ += n;
    return true;
}

bool StagingFile::close(std::string &err) {
    if (!fp_)
        return true;
    const bool flushed = std::fflush(fp_) == 0;
    const bool closed = std::fclose(fp_) == 0;
    fp_ = nullptr;
    if (!flushed || !closed) {
        err = std::string("Staging flush failed: ") + std::strerror(errno);
        return false;
    }
    return true;
}

void StagingFile::discard() {
    if (fp_) {
        std::fclose(fp_);
        fp_ = nullptr;
    }
    if (path_.empty())
        return;
    std::error_code ec;
    fs::remove(path_, ec);
}

std::string StagingFile::pathFor(const std::string &dir,
                                 const TransferTask &task) {
    fs::path base = dir.empty() ? fs::temp_directory_path() : fs::path(dir);
    return (base / ("temp_" + sanitizeFileName(task.id) + "_" +
                    idDigest(task.id) + ".part"))
        .string();
}

} // namespace mediarelay
