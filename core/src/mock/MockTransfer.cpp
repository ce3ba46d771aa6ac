#include "mediarelay/MockTransfer.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace mediarelay {

void MockGate::open() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        open_ = true;
    }
    cv_.notify_all();
}

bool MockGate::isOpen() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return open_;
}

bool MockGate::waitOpen(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this] { return open_; });
}

namespace {

class MockObjectHandle : public ObjectHandle {
public:
    MockObjectHandle(MockObject obj, std::chrono::milliseconds gateTimeout)
        : obj_(std::move(obj)), gateTimeout_(gateTimeout) {}

    std::optional<std::uint64_t> sizeBytes() const override {
        if (!obj_.reportSize)
            return std::nullopt;
        return obj_.sizeBytes;
    }

    ReadStatus readChunk(std::size_t chunkSizeBytes, std::vector<char> &out,
                         std::string &err) override {
        out.clear();
        if (obj_.gate && !obj_.gate->waitOpen(gateTimeout_)) {
            err = "Mock gate timed out";
            return ReadStatus::Error;
        }
        if (obj_.failAfterBytes && served_ >= *obj_.failAfterBytes) {
            err = "Mock read failure after " + std::to_string(served_) +
                  " bytes";
            return ReadStatus::Error;
        }
        std::uint64_t limit = obj_.sizeBytes;
        if (obj_.endAfterBytes)
            limit = std::min(limit, *obj_.endAfterBytes);
        if (obj_.failAfterBytes)
            limit = std::min(limit, *obj_.failAfterBytes);
        if (served_ >= limit)
            return ReadStatus::EndOfStream;
        const std::uint64_t n =
            std::min<std::uint64_t>(chunkSizeBytes, limit - served_);
        out.assign(static_cast<std::size_t>(n), obj_.fill);
        served_ += n;
        return ReadStatus::Data;
    }

private:
    MockObject obj_;
    std::chrono::milliseconds gateTimeout_;
    std::uint64_t served_ = 0;
};

} // namespace

void MockTransferSource::addObject(const ObjectLocator &loc, MockObject obj) {
    std::lock_guard<std::mutex> lk(mtx_);
    objects_[makeTaskId(loc)] = std::move(obj);
}

std::unique_ptr<ObjectHandle>
MockTransferSource::resolve(const ObjectLocator &loc, std::string &err) {
    const std::string id = makeTaskId(loc);
    std::lock_guard<std::mutex> lk(mtx_);
    ++resolves_[id];
    if (unavailable_) {
        err = "Mock source unavailable";
        return nullptr;
    }
    auto it = objects_.find(id);
    if (it == objects_.end()) {
        err = "Object not found in mock: " + id;
        return nullptr;
    }
    return std::make_unique<MockObjectHandle>(it->second, gateTimeout_);
}

int MockTransferSource::resolveCount(const std::string &id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = resolves_.find(id);
    return it == resolves_.end() ? 0 : it->second;
}

void MockTransferSink::setRejectUploads(bool reject, std::string reason) {
    std::lock_guard<std::mutex> lk(mtx_);
    reject_ = reject;
    rejectReason_ = std::move(reason);
}

void MockTransferSink::forget(const std::string &remoteId) {
    std::lock_guard<std::mutex> lk(mtx_);
    stored_.erase(remoteId);
}

bool MockTransferSink::upload(const std::string &localStagingPath,
                              const std::string &displayName,
                              std::string &remoteId, std::string &err) {
    std::error_code ec;
    const bool present = fs::exists(localStagingPath, ec);
    const std::uint64_t size =
        present ? static_cast<std::uint64_t>(
                      fs::file_size(localStagingPath, ec))
                : 0;
    std::lock_guard<std::mutex> lk(mtx_);
    if (reject_) {
        err = rejectReason_;
        return false;
    }
    if (!present) {
        err = "Staging file missing: " + localStagingPath;
        return false;
    }
    MockUpload up;
    up.displayName = displayName;
    up.remoteId = "mock-" + std::to_string(nextId_++);
    up.sizeBytes = size;
    up.stagingExisted = present;
    stored_[up.remoteId] = size;
    remoteId = up.remoteId;
    uploads_.push_back(std::move(up));
    return true;
}

bool MockTransferSink::exists(const std::string &remoteId, std::string &err) {
    err.clear();
    std::lock_guard<std::mutex> lk(mtx_);
    return stored_.count(remoteId) > 0;
}

std::vector<MockUpload> MockTransferSink::uploads() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return uploads_;
}

} // namespace mediarelay
