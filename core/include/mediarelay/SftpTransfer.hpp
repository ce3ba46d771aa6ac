// SFTP-backed collaborators. Every resolve/upload opens its own
// Libssh2Session, so concurrent slots never share an SSH channel.
#pragma once
#include "SessionOptions.hpp"
#include "TransferSink.hpp"
#include "TransferSource.hpp"
#include <memory>
#include <string>

namespace mediarelay {

// Reads <remote_root>/<container>/<objectRef> from an SFTP server.
class SftpTransferSource : public TransferSource {
public:
    explicit SftpTransferSource(SessionOptions opt);

    std::unique_ptr<ObjectHandle> resolve(const ObjectLocator &loc,
                                          std::string &err) override;

    // Remote path a locator maps to.
    std::string remotePathFor(const ObjectLocator &loc) const;

private:
    SessionOptions opt_;
};

// Writes <remote_root>/<key>/<displayName>.part, then renames it into place.
// <key> is idDigest() of the staging file name, so two objects never share a
// remote path. An existing object at the final path fails the upload; it is
// never replaced. The returned remote id is the final absolute path.
class SftpTransferSink : public TransferSink {
public:
    explicit SftpTransferSink(SessionOptions opt);

    bool upload(const std::string &localStagingPath,
                const std::string &displayName, std::string &remoteId,
                std::string &err) override;
    bool exists(const std::string &remoteId, std::string &err) override;

    std::string remotePathFor(const std::string &localStagingPath,
                              const std::string &displayName) const;

private:
    SessionOptions opt_;
};

} // namespace mediarelay
