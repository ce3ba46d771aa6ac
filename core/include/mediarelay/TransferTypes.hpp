// Shared types between the scheduler, the executor and the collaborator
// backends. Plain structs so the service layer can copy them into snapshots.
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mediarelay {

enum class PriorityClass {
    Interactive, // play-now requests, latency sensitive
    Bulk         // season/batch requests, tolerant of delay
};

enum class SlotKind { BulkReserved, InteractiveReserved };

// Where a TransferSource finds the object: container (channel, share, bucket)
// plus an object reference inside it.
struct ObjectLocator {
    std::string container;
    std::string objectRef;
};

struct TransferTask {
    std::string id; // dedup key, see makeTaskId()
    ObjectLocator locator;
    std::string displayName; // derived once at creation
    PriorityClass priorityClass = PriorityClass::Bulk;
    std::chrono::system_clock::time_point enqueuedAt{};
    // Observability only; never consulted by scheduling.
    std::optional<std::string> groupContext; // series
    std::optional<std::string> groupDetail;  // season
    std::optional<std::string> itemTitle;    // episode title
};

struct EnqueueResult {
    enum class Status { Accepted, AlreadyQueued, AlreadyComplete };
    Status status = Status::Accepted;
    std::string remoteId;       // set for AlreadyComplete
    std::size_t queuePosition = 0; // 1-based position in its class when Accepted
};

enum class TransferOutcome { Success, Failure, Cancelled };

enum class ErrorKind {
    None,
    DuplicateRequest,
    AlreadyComplete,
    SourceUnavailable,
    SourceReadError,
    StagingError,
    SinkUploadError,
    Cancelled
};

// Ephemeral per-run state, owned by the executor while a slot is occupied.
struct TransferProgress {
    std::uint64_t bytesDone = 0;
    std::uint64_t bytesTotal = 0; // 0 = unknown
    std::size_t chunkSize = 0;
    double throughputMBps = 0.0;  // last completed sampling window
    std::vector<double> samples;  // rolling window history (MB/s)
};

struct TransferResult {
    TransferOutcome outcome = TransferOutcome::Failure;
    ErrorKind errorKind = ErrorKind::None;
    std::string error;
    std::string remoteId;
    std::uint64_t bytesTransferred = 0;
    double elapsedSeconds = 0.0;
    double averageMBps = 0.0;
    double peakMBps = 0.0;
    std::size_t finalChunkSize = 0;
    int adjustments = 0;
};

struct ActiveSlotInfo {
    int slotId = -1;
    SlotKind slotKind = SlotKind::BulkReserved;
    std::string id;
    std::string displayName;
    PriorityClass priorityClass = PriorityClass::Bulk;
    std::optional<std::string> groupContext;
    std::optional<std::string> groupDetail;
    std::optional<std::string> itemTitle;
    TransferProgress progress;
};

struct QueuedTaskInfo {
    std::string id;
    std::string displayName;
    std::optional<std::string> groupContext;
    std::optional<std::string> groupDetail;
    std::optional<std::string> itemTitle;
    std::chrono::system_clock::time_point enqueuedAt{};
};

struct SchedulerStatus {
    std::size_t queuedInteractive = 0;
    std::size_t queuedBulk = 0;
    std::vector<ActiveSlotInfo> active;
    std::uint64_t completed = 0;
    std::uint64_t failed = 0; // includes cancelled runs
    std::uint64_t cancelled = 0;
    std::uint64_t interactiveCompleted = 0;
    std::uint64_t bulkCompleted = 0;
    std::uint64_t interactiveFailed = 0;
    std::uint64_t bulkFailed = 0;
    std::uint64_t totalQueued = 0;
    int totalSlots = 0;
    int bulkSlots = 0;
    int interactiveSlots = 0;
    int availableSlots = 0;
    int activeInteractive = 0;
    int activeBulk = 0;
    std::vector<QueuedTaskInfo> queuedInteractiveDetail;
    std::vector<QueuedTaskInfo> queuedBulkDetail;
};

const char *priorityClassName(PriorityClass p);
const char *slotKindName(SlotKind k);
const char *outcomeName(TransferOutcome o);
const char *errorKindName(ErrorKind k);
const char *enqueueStatusName(EnqueueResult::Status s);

// "container:objectRef"
std::string makeTaskId(const ObjectLocator &loc);

// Splits "container/object/ref" at the first '/'. Returns false when either
// part is empty.
bool parseLocator(const std::string &text, ObjectLocator &out,
                  std::string &err);

// Replaces path separators, ':' and control characters with '_'.
std::string sanitizeFileName(const std::string &raw);

// 16 lowercase hex digits of the 64-bit FNV-1a hash of `raw`. Keeps names
// apart whose sanitized forms coincide.
std::string idDigest(const std::string &raw);

// Basename of objectRef with path separators and control characters
// replaced; falls back to the sanitized task id.
std::string deriveDisplayName(const ObjectLocator &loc);

TransferTask makeTask(const ObjectLocator &loc, PriorityClass priority);

} // namespace mediarelay
