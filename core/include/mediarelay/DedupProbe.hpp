// Lookup of objects that were already relayed, consulted before enqueue.
#pragma once
#include "TransferTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace mediarelay {

class DedupProbe {
public:
    virtual ~DedupProbe() = default;

    // Remote identifier when id is durably stored and still resolvable.
    virtual std::optional<std::string> isDurablyStored(const std::string &id) = 0;

    // Called after a successful transfer. Default: nothing to remember.
    virtual void recordStored(const TransferTask &task,
                              const std::string &remoteId,
                              std::uint64_t sizeBytes) {
        (void)task;
        (void)remoteId;
        (void)sizeBytes;
    }
};

} // namespace mediarelay
