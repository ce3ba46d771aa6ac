// Throughput-driven read chunk sizing. Every sampling window the measured
// rate is compared with the thresholds: above `high` the chunk doubles (up
// to max), below `low` it halves (down to min), otherwise it is kept.
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace mediarelay {

struct AdaptiveChunkConfig {
    std::size_t minChunkBytes = 2 * 1024 * 1024;
    std::size_t initialChunkBytes = 5 * 1024 * 1024;
    std::size_t maxChunkBytes = 50 * 1024 * 1024;
    std::chrono::milliseconds sampleWindow{5000};
    // MB/s, with MB = 1024 * 1024 bytes
    double lowMBps = 2.0;
    double mediumMBps = 5.0;
    double highMBps = 10.0;

    bool validate(std::string &err) const;
};

enum class ChunkAdjustment {
    None,  // window still open
    Grew,
    Shrank,
    Held
};

const char *chunkAdjustmentName(ChunkAdjustment a);

class ChunkSizeController {
public:
    using Clock = std::chrono::steady_clock;

    // Out-of-order configs are clamped: initial is forced into [min, max].
    ChunkSizeController(const AdaptiveChunkConfig &cfg, Clock::time_point start);

    // Accounts bytes received at `now`. When the sampling window has
    // elapsed, classifies its throughput, adjusts the chunk size and resets
    // the window counters.
    ChunkAdjustment record(std::size_t bytes, Clock::time_point now);

    // Closes a trailing partial window at end of stream. Its throughput is
    // kept for statistics only and never changes the chunk size.
    void finish(Clock::time_point now);

    std::size_t chunkSize() const { return chunkSize_; }
    double lastThroughputMBps() const { return lastMBps_; }
    double peakThroughputMBps() const { return peakMBps_; }
    int adjustments() const { return adjustments_; }
    const std::deque<double> &samples() const { return samples_; }
    std::uint64_t totalBytes() const { return totalBytes_; }

private:
    void pushSample(double mbps);

    AdaptiveChunkConfig cfg_;
    std::size_t chunkSize_ = 0;
    Clock::time_point windowStart_;
    std::uint64_t bytesThisWindow_ = 0;
    std::uint64_t totalBytes_ = 0;
    double lastMBps_ = 0.0;
    double peakMBps_ = 0.0;
    int adjustments_ = 0;
    std::deque<double> samples_;
};

} // namespace mediarelay
