#include "mediarelay/TaskQueue.hpp"

#include <algorithm>

namespace mediarelay {

std::deque<TransferTask> &TaskQueue::collection(PriorityClass p) {
    return p == PriorityClass::Interactive ? interactive_ : bulk_;
}

const std::deque<TransferTask> &TaskQueue::collection(PriorityClass p) const {
    return p == PriorityClass::Interactive ? interactive_ : bulk_;
}

EnqueueResult::Status TaskQueue::enqueue(const TransferTask &task) {
    if (index_.count(task.id) > 0)
        return EnqueueResult::Status::AlreadyQueued;
    collection(task.priorityClass).push_back(task);
    index_.emplace(task.id, EntryState::Queued);
    return EnqueueResult::Status::Accepted;
}

std::optional<TransferTask> TaskQueue::dequeueNext() {
    if (!interactive_.empty())
        return dequeue(PriorityClass::Interactive);
    return dequeue(PriorityClass::Bulk);
}

std::optional<TransferTask> TaskQueue::dequeue(PriorityClass p) {
    auto &q = collection(p);
    if (q.empty())
        return std::nullopt;
    TransferTask t = std::move(q.front());
    q.pop_front();
    index_[t.id] = EntryState::Running;
    return t;
}

bool TaskQueue::removeQueued(const std::string &id) {
    auto it = index_.find(id);
    if (it == index_.end() || it->second != EntryState::Queued)
        return false;
    for (auto *q : {&interactive_, &bulk_}) {
        auto pos = std::find_if(q->begin(), q->end(),
                                [&id](const TransferTask &t) {
                                    return t.id == id;
                                });
        if (pos != q->end()) {
            q->erase(pos);
            break;
        }
    }
    index_.erase(it);
    return true;
}

void TaskQueue::markFinished(const std::string &id) {
    auto it = index_.find(id);
    if (it != index_.end() && it->second == EntryState::Running)
        index_.erase(it);
}

std::size_t TaskQueue::clearQueued() {
    const std::size_t dropped = interactive_.size() + bulk_.size();
    for (auto *q : {&interactive_, &bulk_}) {
        for (const auto &t : *q)
            index_.erase(t.id);
        q->clear();
    }
    return dropped;
}

bool TaskQueue::contains(const std::string &id) const {
    return index_.count(id) > 0;
}

bool TaskQueue::isQueued(const std::string &id) const {
    auto it = index_.find(id);
    return it != index_.end() && it->second == EntryState::Queued;
}

bool TaskQueue::isRunning(const std::string &id) const {
    auto it = index_.find(id);
    return it != index_.end() && it->second == EntryState::Running;
}

std::size_t TaskQueue::size(PriorityClass p) const {
    return collection(p).size();
}

std::size_t TaskQueue::positionOf(const std::string &id) const {
    for (auto *q : {&interactive_, &bulk_}) {
        for (std::size_t i = 0; i < q->size(); ++i) {
            if ((*q)[i].id == id)
                return i + 1;
        }
    }
    return 0;
}

std::vector<QueuedTaskInfo> TaskQueue::snapshot(PriorityClass p) const {
    const auto &q = collection(p);
    std::vector<QueuedTaskInfo> out;
    out.reserve(q.size());
    for (const auto &t : q) {
        QueuedTaskInfo info;
        info.id = t.id;
        info.displayName = t.displayName;
        info.groupContext = t.groupContext;
        info.groupDetail = t.groupDetail;
        info.itemTitle = t.itemTitle;
        info.enqueuedAt = t.enqueuedAt;
        out.push_back(std::move(info));
    }
    return out;
}

} // namespace mediarelay
