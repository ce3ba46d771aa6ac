// Abstract source of objects to relay. Concrete backends (SFTP, mock) must
// respect this API so the executor stays decoupled from the transport.
#pragma once
#include "TransferTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mediarelay {

// One resolved object, readable front to back. A handle is used by a single
// executor run at a time and is not required to be thread-safe.
class ObjectHandle {
public:
    enum class ReadStatus { Data, EndOfStream, Error };

    virtual ~ObjectHandle() = default;

    // Total size when the source knows it. A reported size of 0 is treated
    // by the executor as unknown.
    virtual std::optional<std::uint64_t> sizeBytes() const = 0;

    // Reads up to chunkSizeBytes into out (resized to the bytes read).
    // Data: out is non-empty. EndOfStream: nothing left. Error: err is set.
    virtual ReadStatus readChunk(std::size_t chunkSizeBytes,
                                 std::vector<char> &out,
                                 std::string &err) = 0;
};

class TransferSource {
public:
    virtual ~TransferSource() = default;

    // Locate the object and open it for reading. Returns nullptr and fills
    // err when the object or the source is unavailable.
    virtual std::unique_ptr<ObjectHandle> resolve(const ObjectLocator &loc,
                                                  std::string &err) = 0;
};

} // namespace mediarelay
