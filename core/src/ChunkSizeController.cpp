#include "mediarelay/ChunkSizeController.hpp"

#include <algorithm>

namespace mediarelay {

namespace {
constexpr double kMiB = 1024.0 * 1024.0;
constexpr std::size_t kMaxSamples = 32;
} // namespace

bool AdaptiveChunkConfig::validate(std::string &err) const {
    if (minChunkBytes == 0) {
        err = "Minimum chunk size must be positive";
        return false;
    }
    if (minChunkBytes > maxChunkBytes) {
        err = "Minimum chunk size exceeds maximum chunk size";
        return false;
    }
    if (initialChunkBytes < minChunkBytes ||
        initialChunkBytes > maxChunkBytes) {
        err = "Initial chunk size must lie between minimum and maximum";
        return false;
    }
    if (sampleWindow.count() <= 0) {
        err = "Sampling window must be positive";
        return false;
    }
    if (!(lowMBps > 0.0 && lowMBps <= mediumMBps && mediumMBps <= highMBps)) {
        err = "Throughput thresholds must satisfy 0 < low <= medium <= high";
        return false;
    }
    return true;
}

const char *chunkAdjustmentName(ChunkAdjustment a) {
    switch (a) {
    case ChunkAdjustment::None:
        return "None";
    case ChunkAdjustment::Grew:
        return "Grew";
    case ChunkAdjustment::Shrank:
        return "Shrank";
    case ChunkAdjustment::Held:
        return "Held";
    }
    return "Unknown";
}

ChunkSizeController::ChunkSizeController(const AdaptiveChunkConfig &cfg,
                                         Clock::time_point start)
    : cfg_(cfg), windowStart_(start) {
    if (cfg_.minChunkBytes == 0)
        cfg_.minChunkBytes = 1;
    if (cfg_.maxChunkBytes < cfg_.minChunkBytes)
        cfg_.maxChunkBytes = cfg_.minChunkBytes;
    chunkSize_ = std::clamp(cfg_.initialChunkBytes, cfg_.minChunkBytes,
                            cfg_.maxChunkBytes);
}

void ChunkSizeController::pushSample(double mbps) {
    samples_.push_back(mbps);
    if (samples_.size() > kMaxSamples)
        samples_.pop_front();
}

ChunkAdjustment ChunkSizeController::record(std::size_t bytes,
                                            Clock::time_point now) {
    bytesThisWindow_ += bytes;
    totalBytes_ += bytes;
    const auto elapsed = now - windowStart_;
    if (elapsed < cfg_.sampleWindow)
        return ChunkAdjustment::None;

    const double seconds = std::chrono::duration<double>(elapsed).count();
    const double mbps = (double(bytesThisWindow_) / kMiB) / seconds;
    lastMBps_ = mbps;
    peakMBps_ = std::max(peakMBps_, mbps);
    pushSample(mbps);

    ChunkAdjustment result = ChunkAdjustment::Held;
    if (mbps > cfg_.highMBps && chunkSize_ < cfg_.maxChunkBytes) {
        chunkSize_ = std::min(chunkSize_ * 2, cfg_.maxChunkBytes);
        result = ChunkAdjustment::Grew;
        ++adjustments_;
    } else if (mbps < cfg_.lowMBps && chunkSize_ > cfg_.minChunkBytes) {
        chunkSize_ = std::max(chunkSize_ / 2, cfg_.minChunkBytes);
        result = ChunkAdjustment::Shrank;
        ++adjustments_;
    }

    bytesThisWindow_ = 0;
    windowStart_ = now;
    return result;
}

void ChunkSizeController::finish(Clock::time_point now) {
    const auto elapsed = now - windowStart_;
    if (bytesThisWindow_ == 0 || elapsed.count() <= 0)
        return;
    // Tail window: a sample only. Chunk size and peak stay untouched.
    const double seconds = std::chrono::duration<double>(elapsed).count();
    pushSample((double(bytesThisWindow_) / kMiB) / seconds);
    bytesThisWindow_ = 0;
    windowStart_ = now;
}

} // namespace mediarelay
