// Runs one object's transfer end to end: source -> staging file -> sink.
// The read chunk size follows the measured throughput (ChunkSizeController).
#pragma once
#include "ChunkSizeController.hpp"
#include "TransferSink.hpp"
#include "TransferSource.hpp"
#include "TransferTypes.hpp"
#include <functional>
#include <string>

namespace mediarelay {

struct ExecutorConfig {
    AdaptiveChunkConfig chunk;
    std::string stagingDir; // empty = system temp directory
};

class AdaptiveTransferExecutor {
public:
    using Clock = ChunkSizeController::Clock;
    using ClockFn = std::function<Clock::time_point()>;
    using ProgressCB = std::function<void(const TransferProgress &)>;
    using AdjustmentCB = std::function<void(ChunkAdjustment,
                                            std::size_t /*oldSize*/,
                                            std::size_t /*newSize*/,
                                            double /*mbps*/)>;

    // Source and sink are not owned and must outlive the executor. A custom
    // clock lets tests simulate throughput.
    AdaptiveTransferExecutor(TransferSource &source, TransferSink &sink,
                             ExecutorConfig cfg, ClockFn clock = {});

    // shouldCancel is polled before every chunk read and before the upload.
    // The staging file is gone when this returns, whatever the outcome.
    TransferResult run(const TransferTask &task,
                       const std::function<bool()> &shouldCancel,
                       const ProgressCB &progress = {},
                       const AdjustmentCB &onAdjust = {});

    const ExecutorConfig &config() const { return cfg_; }

private:
    TransferSource &source_;
    TransferSink &sink_;
    ExecutorConfig cfg_;
    ClockFn clock_;
};

} // namespace mediarelay
