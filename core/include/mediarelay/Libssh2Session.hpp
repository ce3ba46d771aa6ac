#pragma once
#include "SessionOptions.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

// Forward declarations of the internal libssh2 types (leading underscore).
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace mediarelay {

// One TCP socket + SSH session + SFTP channel. Not thread-safe: each
// transfer opens its own session.
class Libssh2Session {
public:
    Libssh2Session();
    ~Libssh2Session();

    Libssh2Session(const Libssh2Session &) = delete;
    Libssh2Session &operator=(const Libssh2Session &) = delete;

    bool connect(const SessionOptions &opt, std::string &err);
    void disconnect();
    bool isConnected() const { return connected_; }

    // Size via sftp stat. Returns false with empty err when the path does
    // not exist.
    bool statSize(const std::string &remote, std::uint64_t &size,
                  bool &hasSize, std::string &err);

    _LIBSSH2_SFTP_HANDLE *openRead(const std::string &remote,
                                   std::string &err);
    _LIBSSH2_SFTP_HANDLE *openWrite(const std::string &remote,
                                    std::string &err);
    // Bytes read, 0 at EOF, negative on error.
    ssize_t read(_LIBSSH2_SFTP_HANDLE *h, char *buf, std::size_t len);
    bool writeAll(_LIBSSH2_SFTP_HANDLE *h, const char *buf, std::size_t len,
                  std::string &err);
    void closeHandle(_LIBSSH2_SFTP_HANDLE *h);

    bool mkdirs(const std::string &remoteDir, std::string &err);
    bool rename(const std::string &from, const std::string &to,
                std::string &err);
    bool removeFile(const std::string &remote, std::string &err);
    // Directory must be empty.
    bool removeDir(const std::string &remote, std::string &err);

private:
    bool tcpConnect(const std::string &host, std::uint16_t port,
                    std::string &err);
    bool verifyHostKey(const SessionOptions &opt, std::string &err);
    bool authenticate(const SessionOptions &opt, std::string &err);
    bool tryAgentAuth(const std::string &user);
    // False when the socket is gone.
    bool sendKeepalive();

    bool connected_ = false;
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;
};

// "/root" + "a/b" -> "/root/a/b"
std::string joinRemotePath(const std::string &base, const std::string &rel);

} // namespace mediarelay
