#pragma once
#include "TransferSink.hpp"
#include "TransferSource.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mediarelay {

// Blocks mock reads until opened. Lets tests hold a transfer "running".
class MockGate {
public:
    explicit MockGate(bool open = false) : open_(open) {}

    void open();
    bool isOpen() const;
    // False when the timeout elapsed with the gate still closed.
    bool waitOpen(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    bool open_ = false;
};

struct MockObject {
    std::uint64_t sizeBytes = 0;
    bool reportSize = true;  // false: sizeBytes() is unknown
    // Serve a read error once this many bytes were delivered.
    std::optional<std::uint64_t> failAfterBytes;
    // Signal end of stream early (reported size stays sizeBytes).
    std::optional<std::uint64_t> endAfterBytes;
    std::shared_ptr<MockGate> gate;
    char fill = 'x';
};

// In-memory source keyed by "container:objectRef".
class MockTransferSource : public TransferSource {
public:
    void addObject(const ObjectLocator &loc, MockObject obj);
    void setUnavailable(bool unavailable) { unavailable_ = unavailable; }
    // Gate wait bound; a read still blocked after it reports an error.
    void setGateTimeout(std::chrono::milliseconds t) { gateTimeout_ = t; }

    std::unique_ptr<ObjectHandle> resolve(const ObjectLocator &loc,
                                          std::string &err) override;

    int resolveCount(const std::string &id) const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, MockObject> objects_;
    std::unordered_map<std::string, int> resolves_;
    bool unavailable_ = false;
    std::chrono::milliseconds gateTimeout_{10000};
};

struct MockUpload {
    std::string displayName;
    std::string remoteId;
    std::uint64_t sizeBytes = 0;
    bool stagingExisted = false;
};

// In-memory sink; can be told to reject uploads (quota full).
class MockTransferSink : public TransferSink {
public:
    void setRejectUploads(bool reject, std::string reason = "Quota exceeded");
    void forget(const std::string &remoteId);

    bool upload(const std::string &localStagingPath,
                const std::string &displayName, std::string &remoteId,
                std::string &err) override;
    bool exists(const std::string &remoteId, std::string &err) override;

    std::vector<MockUpload> uploads() const;

private:
    mutable std::mutex mtx_;
    std::vector<MockUpload> uploads_;
    std::unordered_map<std::string, std::uint64_t> stored_;
    bool reject_ = false;
    std::string rejectReason_;
    int nextId_ = 1;
};

} // namespace mediarelay
