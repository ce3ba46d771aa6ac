#include "mediarelay/SftpTransfer.hpp"
#include "mediarelay/Libssh2Session.hpp"
#include <libssh2_sftp.h>

#include <cstdio>
#include <filesystem>
#include <utility>
#include <vector>

namespace mediarelay {

namespace {

// Owns the session and the open read handle for one resolved object.
class SftpObjectHandle : public ObjectHandle {
public:
    SftpObjectHandle(std::unique_ptr<Libssh2Session> session,
                     LIBSSH2_SFTP_HANDLE *handle, std::optional<std::uint64_t> size)
        : session_(std::move(session)), handle_(handle), size_(size) {}

    ~SftpObjectHandle() override {
        session_->closeHandle(handle_);
        session_->disconnect();
    }

    std::optional<std::uint64_t> sizeBytes() const override { return size_; }

    ReadStatus readChunk(std::size_t chunkSizeBytes, std::vector<char> &out,
                         std::string &err) override {
        out.resize(chunkSizeBytes);
        std::size_t filled = 0;
        // libssh2 returns at most one SFTP packet per call; keep reading until
        // the chunk is full or the stream ends.
        while (filled < chunkSizeBytes) {
            const ssize_t n = session_->read(handle_, out.data() + filled,
                                             chunkSizeBytes - filled);
            if (n < 0) {
                out.clear();
                err = "SFTP read failed";
                return ReadStatus::Error;
            }
            if (n == 0)
                break;
            filled += static_cast<std::size_t>(n);
        }
        out.resize(filled);
        return filled == 0 ? ReadStatus::EndOfStream : ReadStatus::Data;
    }

private:
    std::unique_ptr<Libssh2Session> session_;
    LIBSSH2_SFTP_HANDLE *handle_ = nullptr;
    std::optional<std::uint64_t> size_;
};

std::string parentOf(const std::string &remotePath) {
    const std::size_t slash = remotePath.find_last_of('/');
    if (slash == std::string::npos || slash == 0)
        return "/";
    return remotePath.substr(0, slash);
}

} // namespace

SftpTransferSource::SftpTransferSource(SessionOptions opt)
    : opt_(std::move(opt)) {}

std::string SftpTransferSource::remotePathFor(const ObjectLocator &loc) const {
    return joinRemotePath(joinRemotePath(opt_.remote_root, loc.container),
                          loc.objectRef);
}

std::unique_ptr<ObjectHandle>
SftpTransferSource::resolve(const ObjectLocator &loc, std::string &err) {
    auto session = std::make_unique<Libssh2Session>();
    if (!session->connect(opt_, err))
        return nullptr;

    const std::string remote = remotePathFor(loc);
    std::uint64_t size = 0;
    bool hasSize = false;
    std::string statErr;
    if (!session->statSize(remote, size, hasSize, statErr)) {
        err = statErr.empty() ? "Remote object not found: " + remote : statErr;
        return nullptr;
    }
    LIBSSH2_SFTP_HANDLE *h = session->openRead(remote, err);
    if (!h)
        return nullptr;
    std::optional<std::uint64_t> reported;
    if (hasSize)
        reported = size;
    return std::make_unique<SftpObjectHandle>(std::move(session), h, reported);
}

SftpTransferSink::SftpTransferSink(SessionOptions opt) : opt_(std::move(opt)) {}

std::string SftpTransferSink::remotePathFor(const std::string &localStagingPath,
                                            const std::string &displayName) const {
    const std::string key = idDigest(
        std::filesystem::path(localStagingPath).filename().string());
    return joinRemotePath(joinRemotePath(opt_.remote_root, key), displayName);
}

bool SftpTransferSink::upload(const std::string &localStagingPath,
                              const std::string &displayName,
                              std::string &remoteId, std::string &err) {
    std::FILE *in = std::fopen(localStagingPath.c_str(), "rb");
    if (!in) {
        err = "Could not open staging file: " + localStagingPath;
        return false;
    }

    Libssh2Session session;
    if (!session.connect(opt_, err)) {
        std::fclose(in);
        return false;
    }

    const std::string finalPath = remotePathFor(localStagingPath, displayName);
    const std::string partPath = finalPath + ".part";
    if (!session.mkdirs(parentOf(finalPath), err)) {
        std::fclose(in);
        return false;
    }
    std::uint64_t existingSize = 0;
    bool hasSize = false;
    std::string statErr;
    if (session.statSize(finalPath, existingSize, hasSize, statErr)) {
        std::fclose(in);
        err = "Remote object already exists: " + finalPath;
        return false;
    }
    if (!statErr.empty()) {
        std::fclose(in);
        err = statErr;
        return false;
    }

    LIBSSH2_SFTP_HANDLE *wh = session.openWrite(partPath, err);
    if (!wh) {
        std::fclose(in);
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buffer(CHUNK);
    bool ok = true;
    for (;;) {
        const std::size_t n = std::fread(buffer.data(), 1, CHUNK, in);
        if (n > 0 && !session.writeAll(wh, buffer.data(), n, err)) {
            ok = false;
            break;
        }
        if (n < CHUNK) {
            if (std::ferror(in)) {
                err = "Local read failed: " + localStagingPath;
                ok = false;
            }
            break;
        }
    }
    std::fclose(in);
    session.closeHandle(wh);

    if (!ok) {
        std::string rmErr;
        if (!session.removeFile(partPath, rmErr))
            err += " (cleanup: " + rmErr + ")";
        return false;
    }
    if (!session.rename(partPath, finalPath, err)) {
        std::string rmErr;
        if (!session.removeFile(partPath, rmErr))
            err += " (cleanup: " + rmErr + ")";
        return false;
    }
    remoteId = finalPath;
    return true;
}

bool SftpTransferSink::exists(const std::string &remoteId, std::string &err) {
    Libssh2Session session;
    if (!session.connect(opt_, err))
        return false;
    std::uint64_t size = 0;
    bool hasSize = false;
    return session.statSize(remoteId, size, hasSize, err);
}

} // namespace mediarelay
