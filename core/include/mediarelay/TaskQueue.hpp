// Pending transfer requests split by priority class, plus the dedup index
// that covers both queued and running tasks.
#pragma once
#include "TransferTypes.hpp"
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mediarelay {

// Not synchronized: the owner (DownloadScheduler) serializes every call
// under its own mutex.
class TaskQueue {
public:
    // Accepted or AlreadyQueued. Durable-storage checks belong to the caller.
    EnqueueResult::Status enqueue(const TransferTask &task);

    // Head of Interactive if any, else head of Bulk. The returned task stays
    // in the dedup index as running until markFinished().
    std::optional<TransferTask> dequeueNext();

    // Head of the given class only.
    std::optional<TransferTask> dequeue(PriorityClass p);

    // Removes a still-queued task. False when the id is unknown or running.
    bool removeQueued(const std::string &id);

    // Drops the id from the dedup index once its run is over.
    void markFinished(const std::string &id);

    // Removes every queued task; running entries stay indexed.
    std::size_t clearQueued();

    bool contains(const std::string &id) const;
    bool isQueued(const std::string &id) const;
    bool isRunning(const std::string &id) const;

    std::size_t size(PriorityClass p) const;
    bool empty(PriorityClass p) const { return size(p) == 0; }
    // 1-based position within its class; 0 when not queued.
    std::size_t positionOf(const std::string &id) const;

    std::vector<QueuedTaskInfo> snapshot(PriorityClass p) const;

private:
    enum class EntryState { Queued, Running };

    std::deque<TransferTask> &collection(PriorityClass p);
    const std::deque<TransferTask> &collection(PriorityClass p) const;

    std::deque<TransferTask> interactive_;
    std::deque<TransferTask> bulk_;
    std::unordered_map<std::string, EntryState> index_;
};

} // namespace mediarelay
