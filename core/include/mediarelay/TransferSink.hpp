// Abstract durable storage for staged objects.
#pragma once
#include <string>

namespace mediarelay {

class TransferSink {
public:
    virtual ~TransferSink() = default;

    // Upload the staged file; on success remoteId holds the durable
    // identifier. Implementations must not leave a partial object visible
    // under the final identifier when they fail.
    virtual bool upload(const std::string &localStagingPath,
                        const std::string &displayName, std::string &remoteId,
                        std::string &err) = 0;

    // True when remoteId still resolves. Leaves err empty for "does not
    // exist" and fills it when the check itself failed.
    virtual bool exists(const std::string &remoteId, std::string &err) = 0;
};

} // namespace mediarelay
