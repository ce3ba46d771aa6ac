// Adaptive executor: pulls the object into a staging file with a chunk size
// that tracks throughput, then hands the complete file to the sink.
#include "mediarelay/AdaptiveTransferExecutor.hpp"
#include "mediarelay/StagingFile.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace mediarelay {

namespace {
constexpr double kMiB = 1024.0 * 1024.0;
} // namespace

AdaptiveTransferExecutor::AdaptiveTransferExecutor(TransferSource &source,
                                                   TransferSink &sink,
                                                   ExecutorConfig cfg,
                                                   ClockFn clock)
    : source_(source), sink_(sink), cfg_(std::move(cfg)),
      clock_(std::move(clock)) {
    if (!clock_)
        clock_ = [] { return Clock::now(); };
}

TransferResult
AdaptiveTransferExecutor::run(const TransferTask &task,
                              const std::function<bool()> &shouldCancel,
                              const ProgressCB &progress,
                              const AdjustmentCB &onAdjust) {
    TransferResult res;
    const auto startedAt = clock_();
    auto cancelled = [&shouldCancel]() -> bool {
        return shouldCancel && shouldCancel();
    };
    auto fail = [&res](ErrorKind kind, std::string msg) {
        res.outcome = kind == ErrorKind::Cancelled ? TransferOutcome::Cancelled
                                                   : TransferOutcome::Failure;
        res.errorKind = kind;
        res.error = std::move(msg);
        res.remoteId.clear();
    };
    ChunkSizeController ctl(cfg_.chunk, startedAt);
    auto finalize = [&]() -> TransferResult & {
        const auto now = clock_();
        ctl.finish(now);
        res.bytesTransferred = ctl.totalBytes();
        res.elapsedSeconds =
            std::chrono::duration<double>(now - startedAt).count();
        res.averageMBps = res.elapsedSeconds > 0.0
                              ? (double(res.bytesTransferred) / kMiB) /
                                    res.elapsedSeconds
                              : 0.0;
        res.peakMBps = ctl.peakThroughputMBps();
        res.finalChunkSize = ctl.chunkSize();
        res.adjustments = ctl.adjustments();
        return res;
    };

    if (cancelled()) {
        fail(ErrorKind::Cancelled, "Cancelled before start");
        return finalize();
    }

    std::string err;
    auto handle = source_.resolve(task.locator, err);
    if (!handle) {
        fail(ErrorKind::SourceUnavailable,
             err.empty() ? "Source could not resolve object" : err);
        return finalize();
    }

    // A size of 0 means the source does not know; read to end of stream.
    std::uint64_t total = 0;
    if (auto sz = handle->sizeBytes(); sz.has_value())
        total = *sz;
    const bool sizeKnown = total > 0;

    StagingFile staging(StagingFile::pathFor(cfg_.stagingDir, task));
    if (!staging.open(err)) {
        fail(ErrorKind::StagingError, err);
        return finalize();
    }

    TransferProgress prog;
    prog.bytesTotal = total;
    std::vector<char> buf;
    std::uint64_t done = 0;

    while (true) {
        if (cancelled()) {
            staging.discard();
            fail(ErrorKind::Cancelled, "Cancelled by request");
            return finalize();
        }
        if (sizeKnown && done >= total)
            break;

        std::size_t want = ctl.chunkSize();
        if (sizeKnown)
            want = static_cast<std::size_t>(
                std::min<std::uint64_t>(want, total - done));

        err.clear();
        const auto st = handle->readChunk(want, buf, err);
        if (st == ObjectHandle::ReadStatus::Error) {
            staging.discard();
            fail(ErrorKind::SourceReadError,
                 err.empty() ? "Source read failed" : err);
            return finalize();
        }
        if (st == ObjectHandle::ReadStatus::EndOfStream) {
            if (sizeKnown && done < total) {
                staging.discard();
                fail(ErrorKind::SourceReadError,
                     "Source ended after " + std::to_string(done) + " of " +
                         std::to_string(total) + " bytes");
                return finalize();
            }
            break;
        }

        if (!staging.append(buf.data(), buf.size(), err)) {
            staging.discard();
            fail(ErrorKind::StagingError, err);
            return finalize();
        }
        done += buf.size();

        const std::size_t before = ctl.chunkSize();
        const ChunkAdjustment adj = ctl.record(buf.size(), clock_());
        if (adj != ChunkAdjustment::None && onAdjust)
            onAdjust(adj, before, ctl.chunkSize(), ctl.lastThroughputMBps());

        if (progress) {
            prog.bytesDone = done;
            prog.chunkSize = ctl.chunkSize();
            prog.throughputMBps = ctl.lastThroughputMBps();
            prog.samples.assign(ctl.samples().begin(), ctl.samples().end());
            progress(prog);
        }
    }

    if (!staging.close(err)) {
        staging.discard();
        fail(ErrorKind::StagingError, err);
        return finalize();
    }
    if (cancelled()) {
        staging.discard();
        fail(ErrorKind::Cancelled, "Cancelled before upload");
        return finalize();
    }

    std::string remoteId;
    err.clear();
    if (!sink_.upload(staging.path(), task.displayName, remoteId, err) ||
        remoteId.empty()) {
        staging.discard();
        fail(ErrorKind::SinkUploadError,
             err.empty() ? "Sink rejected upload" : err);
        return finalize();
    }
    staging.discard();

    res.outcome = TransferOutcome::Success;
    res.errorKind = ErrorKind::None;
    res.error.clear();
    res.remoteId = remoteId;
    return finalize();
}

} // namespace mediarelay
