// Scheduler loop: admits queued tasks into slots and runs each one in its
// own worker thread with an isolated source/sink session.
#include "DownloadScheduler.hpp"
#include "mediarelay/RuntimeLogging.hpp"
#include <QLoggingCategory>
#include <algorithm>
#include <map>
#include <optional>
#include <utility>
Q_LOGGING_CATEGORY(mrSched, "mediarelay.scheduler")

using namespace mediarelay;

namespace {

// Display name, plus the dedup id when sensitive logging is enabled.
QString taskLabel(const std::string &displayName, const std::string &id) {
    QString label = QString::fromStdString(displayName);
    if (sensitiveLoggingEnabled())
        label += QStringLiteral(" [") + QString::fromStdString(id) +
                 QStringLiteral("]");
    return label;
}

QString taskLabel(const TransferTask &t) {
    return taskLabel(t.displayName, t.id);
}

double toMiB(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // namespace

bool SchedulerConfig::validate(std::string &err) const {
    if (bulkSlots < 0) {
        err = "Bulk slot count cannot be negative";
        return false;
    }
    if (interactiveSlots < 1) {
        err = "At least one interactive slot is required";
        return false;
    }
    if (wakeInterval.count() <= 0) {
        err = "Wake interval must be positive";
        return false;
    }
    return true;
}

DownloadScheduler::DownloadScheduler(TransferSource &source,
                                     TransferSink &sink, SchedulerConfig cfg,
                                     ExecutorConfig execCfg,
                                     DedupProbe *probe, QObject *parent)
    : QObject(parent), source_(source), sink_(sink), probe_(probe),
      cfg_(cfg), execCfg_(std::move(execCfg)) {}

DownloadScheduler::~DownloadScheduler() { stop(); }

bool DownloadScheduler::start(std::string &err) {
    if (started_.load()) {
        err = "Scheduler already started";
        return false;
    }
    if (!cfg_.validate(err))
        return false;
    if (!execCfg_.chunk.validate(err))
        return false;
    if (cfg_.bulkSlots == 0) {
        qCWarning(mrSched)
            << "No bulk slots configured; bulk tasks will never be admitted";
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        slots_ = SlotAllocator(cfg_.bulkSlots, cfg_.interactiveSlots);
    }
    stopping_ = false;
    started_ = true;
    loopThread_ = std::thread([this]() { loop(); });
    qCInfo(mrSched) << "Scheduler started"
                    << "bulkSlots=" << cfg_.bulkSlots
                    << "interactiveSlots=" << cfg_.interactiveSlots
                    << "wakeIntervalMs=" << cfg_.wakeInterval.count();
    return true;
}

void DownloadScheduler::stop() {
    if (!started_.load() && !loopThread_.joinable())
        return;
    qCInfo(mrSched) << "Scheduler stop requested";
    stopping_ = true;
    const std::size_t hit = cancelAll();
    wake();
    if (loopThread_.joinable())
        loopThread_.join();

    std::unordered_map<int, std::thread> workersToJoin;
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        workersToJoin.swap(workers_);
        finished.swap(finishedWorkers_);
    }
    for (auto &kv : workersToJoin) {
        if (kv.second.joinable())
            kv.second.join();
    }
    for (auto &th : finished) {
        if (th.joinable())
            th.join();
    }
    started_ = false;
    qCInfo(mrSched) << "Scheduler stopped" << "canceled=" << hit;
}

void DownloadScheduler::wake() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        wakePending_ = true;
    }
    cv_.notify_all();
}

EnqueueResult DownloadScheduler::enqueue(const TransferTask &task) {
    EnqueueResult r;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (queue_.contains(task.id)) {
            r.status = EnqueueResult::Status::AlreadyQueued;
            r.queuePosition = queue_.positionOf(task.id);
        }
    }
    if (r.status == EnqueueResult::Status::AlreadyQueued) {
        qCInfo(mrSched) << "Enqueue duplicate" << "task=" << taskLabel(task)
                        << "priority=" << priorityClassName(task.priorityClass);
        return r;
    }

    // The probe may hit the sink over the network; keep it outside mtx_.
    if (probe_) {
        if (auto remote = probe_->isDurablyStored(task.id)) {
            r.status = EnqueueResult::Status::AlreadyComplete;
            r.remoteId = *remote;
            qCInfo(mrSched) << "Enqueue already complete"
                            << "task=" << taskLabel(task);
            return r;
        }
    }

    {
        std::lock_guard<std::mutex> lk(mtx_);
        // Re-checked: another caller may have queued the same id meanwhile.
        r.status = queue_.enqueue(task);
        if (r.status == EnqueueResult::Status::Accepted)
            ++totalQueued_;
        r.queuePosition = queue_.positionOf(task.id);
    }
    if (r.status != EnqueueResult::Status::Accepted) {
        qCInfo(mrSched) << "Enqueue duplicate" << "task=" << taskLabel(task)
                        << "priority=" << priorityClassName(task.priorityClass);
        return r;
    }

    qCInfo(mrSched) << "Enqueue accepted" << "task=" << taskLabel(task)
                    << "priority=" << priorityClassName(task.priorityClass)
                    << "position=" << r.queuePosition;
    wake();
    emit statusChanged();
    return r;
}

std::vector<EnqueueResult>
DownloadScheduler::enqueueBatch(const std::vector<TransferTask> &tasks) {
    std::vector<EnqueueResult> results;
    results.reserve(tasks.size());
    int accepted = 0;
    for (const auto &t : tasks) {
        results.push_back(enqueue(t));
        if (results.back().status == EnqueueResult::Status::Accepted)
            ++accepted;
    }
    if (!tasks.empty()) {
        const TransferTask &first = tasks.front();
        qCInfo(mrSched) << "Batch enqueued"
                        << "series="
                        << QString::fromStdString(
                               first.groupContext.value_or("Unknown"))
                        << "season="
                        << QString::fromStdString(
                               first.groupDetail.value_or("Unknown"))
                        << "items=" << tasks.size() << "accepted=" << accepted;
    }
    return results;
}

bool DownloadScheduler::cancel(const std::string &id) {
    bool removedQueued = false;
    bool signalled = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (queue_.removeQueued(id)) {
            removedQueued = true;
        } else if (queue_.isRunning(id)) {
            canceledTasks_.insert(id);
            signalled = true;
        }
    }
    const QString label = QString::fromStdString(redacted(id));
    if (removedQueued) {
        qCInfo(mrSched) << "Removed from queue" << "id=" << label;
        emit statusChanged();
        return true;
    }
    if (signalled) {
        qCInfo(mrSched) << "Cancellation signalled to running transfer"
                        << "id=" << label;
        wake();
        return true;
    }
    return false;
}

std::size_t DownloadScheduler::cancelAll() {
    std::size_t hit = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        hit += queue_.clearQueued();
        for (const auto &kv : active_) {
            canceledTasks_.insert(kv.second.id);
            ++hit;
        }
    }
    if (hit > 0) {
        qCInfo(mrSched) << "cancelAll" << "count=" << hit;
        emit statusChanged();
    }
    return hit;
}

SchedulerStatus DownloadScheduler::status() const {
    SchedulerStatus st;
    std::lock_guard<std::mutex> lk(mtx_);
    st.queuedInteractive = queue_.size(PriorityClass::Interactive);
    st.queuedBulk = queue_.size(PriorityClass::Bulk);
    std::map<int, ActiveSlotInfo> ordered(active_.begin(), active_.end());
    for (auto &kv : ordered)
        st.active.push_back(std::move(kv.second));
    st.completed = completed_;
    st.failed = failed_;
    st.cancelled = cancelled_;
    st.interactiveCompleted = interactiveCompleted_;
    st.bulkCompleted = bulkCompleted_;
    st.interactiveFailed = interactiveFailed_;
    st.bulkFailed = bulkFailed_;
    st.totalQueued = totalQueued_;
    st.totalSlots = slots_.totalSlots();
    st.bulkSlots = slots_.bulkSlots();
    st.interactiveSlots = slots_.interactiveSlots();
    st.availableSlots = slots_.freeCount();
    st.activeInteractive = slots_.occupiedBy(PriorityClass::Interactive);
    st.activeBulk = slots_.occupiedBy(PriorityClass::Bulk);
    st.queuedInteractiveDetail = queue_.snapshot(PriorityClass::Interactive);
    st.queuedBulkDetail = queue_.snapshot(PriorityClass::Bulk);
    return st;
}

bool DownloadScheduler::isInProgress(const std::string &id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.contains(id);
}

bool DownloadScheduler::isIdle() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.empty(PriorityClass::Interactive) &&
           queue_.empty(PriorityClass::Bulk) && active_.empty();
}

bool DownloadScheduler::admitNextLocked(Admission &out) {
    // Interactive work first, into its own slots or an idle bulk one.
    PriorityClass cls = PriorityClass::Interactive;
    std::optional<int> slotId;
    if (!queue_.empty(PriorityClass::Interactive))
        slotId = slots_.findFree(PriorityClass::Interactive);
    if (!slotId && !queue_.empty(PriorityClass::Bulk)) {
        cls = PriorityClass::Bulk;
        slotId = slots_.findFree(PriorityClass::Bulk);
    }
    if (!slotId)
        return false;

    std::optional<TransferTask> task = queue_.dequeue(cls);
    if (!task)
        return false;
    if (!slots_.occupy(*slotId, task->id, cls)) {
        // findFree() just returned this slot under the same lock.
        qCWarning(mrSched) << "Slot refused admission" << "slot=" << *slotId
                           << "task=" << taskLabel(*task);
        queue_.markFinished(task->id);
        return false;
    }

    ActiveSlotInfo info;
    info.slotId = *slotId;
    info.slotKind = slots_.slot(*slotId)->kind;
    info.id = task->id;
    info.displayName = task->displayName;
    info.priorityClass = cls;
    info.groupContext = task->groupContext;
    info.groupDetail = task->groupDetail;
    info.itemTitle = task->itemTitle;
    info.progress.chunkSize = execCfg_.chunk.initialChunkBytes;
    active_[*slotId] = std::move(info);

    out.slotId = *slotId;
    out.kind = active_[*slotId].slotKind;
    out.task = std::move(*task);
    return true;
}

void DownloadScheduler::loop() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (!stopping_.load()) {
        std::vector<Admission> admitted;
        Admission a;
        while (admitNextLocked(a)) {
            admitted.push_back(std::move(a));
            a = Admission{};
        }
        lk.unlock();
        for (const auto &adm : admitted) {
            qCInfo(mrSched) << "Admitted" << "slot=" << adm.slotId
                            << "slotKind=" << slotKindName(adm.kind)
                            << "priority="
                            << priorityClassName(adm.task.priorityClass)
                            << "task=" << taskLabel(adm.task);
            launchWorker(adm);
            emit taskAdmitted(adm.slotId, QString::fromStdString(adm.task.id));
        }
        joinFinishedWorkers();
        if (!admitted.empty())
            emit statusChanged();
        lk.lock();
        if (!admitted.empty())
            continue;
        if (!wakePending_ && !stopping_.load()) {
            cv_.wait_for(lk, cfg_.wakeInterval, [this]() {
                return wakePending_ || stopping_.load();
            });
        }
        wakePending_ = false;
    }
}

void DownloadScheduler::launchWorker(const Admission &a) {
    std::lock_guard<std::mutex> wl(workersMutex_);
    auto it = workers_.find(a.slotId);
    if (it != workers_.end()) {
        // The previous run on this slot already released it; park its handle.
        if (it->second.joinable())
            finishedWorkers_.push_back(std::move(it->second));
        workers_.erase(it);
    }
    const int slotId = a.slotId;
    TransferTask task = a.task;
    workers_[slotId] = std::thread(
        [this, slotId, task]() { runWorker(slotId, task); });
}

void DownloadScheduler::joinFinishedWorkers() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        finished.swap(finishedWorkers_);
    }
    for (auto &th : finished) {
        if (th.joinable())
            th.join();
    }
}

void DownloadScheduler::runWorker(int slotId, const TransferTask &task) {
    // Releases the slot even when the executor throws.
    struct SlotReleaseGuard {
        DownloadScheduler *self = nullptr;
        int slotId = -1;
        const TransferTask *task = nullptr;
        TransferResult result;
        bool done = false;
        ~SlotReleaseGuard() {
            if (!done)
                self->finishRun(slotId, *task, result);
        }
    };
    SlotReleaseGuard guard;
    guard.self = this;
    guard.slotId = slotId;
    guard.task = &task;
    guard.result.outcome = TransferOutcome::Failure;
    guard.result.errorKind = ErrorKind::SourceReadError;
    guard.result.error = "Transfer aborted";

    const std::string id = task.id;
    auto shouldCancel = [this, id]() {
        if (stopping_.load())
            return true;
        std::lock_guard<std::mutex> lk(mtx_);
        return canceledTasks_.count(id) > 0;
    };
    auto onProgress = [this, slotId](const TransferProgress &p) {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = active_.find(slotId);
        if (it != active_.end())
            it->second.progress = p;
    };
    const QString label = taskLabel(task);
    auto onAdjust = [slotId, label](ChunkAdjustment adj, std::size_t oldSize,
                                    std::size_t newSize, double mbps) {
        if (adj != ChunkAdjustment::Grew && adj != ChunkAdjustment::Shrank)
            return;
        qCInfo(mrSched) << "Chunk size" << chunkAdjustmentName(adj)
                        << "slot=" << slotId << "task=" << label
                        << "throughputMBps=" << mbps
                        << "oldMiB=" << toMiB(oldSize)
                        << "newMiB=" << toMiB(newSize);
    };

    try {
        AdaptiveTransferExecutor exec(source_, sink_, execCfg_);
        guard.result = exec.run(task, shouldCancel, onProgress, onAdjust);
    } catch (const std::exception &e) {
        qCWarning(mrSched) << "Transfer threw" << "slot=" << slotId
                           << "task=" << label << "what=" << e.what();
        guard.result = TransferResult{};
        guard.result.outcome = TransferOutcome::Failure;
        guard.result.errorKind = ErrorKind::SourceReadError;
        guard.result.error = e.what();
    }
    guard.done = true;
    finishRun(slotId, task, guard.result);
}

void DownloadScheduler::finishRun(int slotId, const TransferTask &task,
                                  const TransferResult &result) {
    const QString label = taskLabel(task);
    // Remember the object before the id leaves the dedup index, so a racing
    // enqueue sees AlreadyComplete instead of starting a second run.
    if (result.outcome == TransferOutcome::Success && probe_)
        probe_->recordStored(task, result.remoteId, result.bytesTransferred);

    bool released = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        released = slots_.release(slotId);
        active_.erase(slotId);
        queue_.markFinished(task.id);
        canceledTasks_.erase(task.id);
        const bool interactive =
            task.priorityClass == PriorityClass::Interactive;
        switch (result.outcome) {
        case TransferOutcome::Success:
            ++completed_;
            if (interactive)
                ++interactiveCompleted_;
            else
                ++bulkCompleted_;
            break;
        case TransferOutcome::Cancelled:
            ++cancelled_;
            ++failed_;
            if (interactive)
                ++interactiveFailed_;
            else
                ++bulkFailed_;
            break;
        case TransferOutcome::Failure:
            ++failed_;
            if (interactive)
                ++interactiveFailed_;
            else
                ++bulkFailed_;
            break;
        }
    }
    if (!released) {
        qCWarning(mrSched) << "Slot was already idle at completion"
                           << "slot=" << slotId << "task=" << label;
    }

    switch (result.outcome) {
    case TransferOutcome::Success:
        qCInfo(mrSched) << "Transfer complete" << "slot=" << slotId
                        << "task=" << label
                        << "totalMiB=" << toMiB(result.bytesTransferred)
                        << "elapsedSec=" << result.elapsedSeconds
                        << "avgMBps=" << result.averageMBps
                        << "peakMBps=" << result.peakMBps
                        << "finalChunkMiB=" << toMiB(result.finalChunkSize)
                        << "adjustments=" << result.adjustments;
        break;
    case TransferOutcome::Cancelled:
        qCInfo(mrSched) << "Transfer cancelled" << "slot=" << slotId
                        << "task=" << label
                        << "bytes=" << result.bytesTransferred;
        break;
    case TransferOutcome::Failure:
        qCWarning(mrSched) << "Transfer failed" << "slot=" << slotId
                           << "task=" << label
                           << "kind=" << errorKindName(result.errorKind)
                           << "error="
                           << QString::fromStdString(result.error);
        break;
    }

    wake();
    emit taskFinished(QString::fromStdString(task.id),
                      QString::fromLatin1(outcomeName(result.outcome)),
                      QString::fromStdString(result.remoteId),
                      QString::fromStdString(result.error));
    emit statusChanged();
}

void DownloadScheduler::logDetailedStatus() const {
    const SchedulerStatus st = status();
    const QString rule(80, QChar('='));
    qCInfo(mrSched).noquote() << rule;
    qCInfo(mrSched).noquote() << "DETAILED QUEUE STATUS";
    qCInfo(mrSched).noquote() << rule;

    if (st.active.empty()) {
        qCInfo(mrSched).noquote() << "Active: none";
    } else {
        qCInfo(mrSched).noquote() << "Active:";
        for (const auto &a : st.active) {
            QString line = QString("  [slot %1] %2 (%3)")
                               .arg(a.slotId)
                               .arg(QString::fromLatin1(
                                   priorityClassName(a.priorityClass)))
                               .arg(QString::fromLatin1(
                                   slotKindName(a.slotKind)));
            if (a.groupContext && a.groupDetail) {
                line += QString(" %1 - %2: %3")
                            .arg(QString::fromStdString(*a.groupContext))
                            .arg(QString::fromStdString(*a.groupDetail))
                            .arg(QString::fromStdString(
                                a.itemTitle.value_or(a.displayName)));
            } else {
                line += ": " + QString::fromStdString(a.displayName);
            }
            if (a.progress.bytesTotal > 0) {
                line += QString(" %1/%2 MiB")
                            .arg(toMiB(a.progress.bytesDone), 0, 'f', 1)
                            .arg(toMiB(a.progress.bytesTotal), 0, 'f', 1);
            } else {
                line += QString(" %1 MiB")
                            .arg(toMiB(a.progress.bytesDone), 0, 'f', 1);
            }
            qCInfo(mrSched).noquote() << line;
        }
    }

    const std::size_t kInteractiveShown = 5;
    if (!st.queuedInteractiveDetail.empty()) {
        qCInfo(mrSched).noquote()
            << QString("Interactive queue (%1):").arg(st.queuedInteractive);
        for (std::size_t i = 0;
             i < st.queuedInteractiveDetail.size() && i < kInteractiveShown;
             ++i) {
            const auto &q = st.queuedInteractiveDetail[i];
            qCInfo(mrSched).noquote()
                << QString("  %1. %2").arg(i + 1).arg(
                       QString::fromStdString(q.displayName));
        }
        if (st.queuedInteractiveDetail.size() > kInteractiveShown) {
            qCInfo(mrSched).noquote()
                << QString("  ... and %1 more")
                       .arg(st.queuedInteractiveDetail.size() -
                            kInteractiveShown);
        }
    }

    if (!st.queuedBulkDetail.empty()) {
        qCInfo(mrSched).noquote()
            << QString("Bulk queue (%1):").arg(st.queuedBulk);
        // Grouped by series/season in first-seen order.
        std::vector<std::pair<QString, std::vector<const QueuedTaskInfo *>>>
            groups;
        for (const auto &q : st.queuedBulkDetail) {
            const QString key =
                QString("%1 - %2")
                    .arg(QString::fromStdString(
                        q.groupContext.value_or("Unknown")))
                    .arg(QString::fromStdString(
                        q.groupDetail.value_or("Unknown")));
            auto it = std::find_if(groups.begin(), groups.end(),
                                   [&key](const auto &g) {
                                       return g.first == key;
                                   });
            if (it == groups.end()) {
                groups.emplace_back(key,
                                    std::vector<const QueuedTaskInfo *>{});
                it = groups.end() - 1;
            }
            it->second.push_back(&q);
        }
        const std::size_t kPerGroupShown = 3;
        for (const auto &g : groups) {
            qCInfo(mrSched).noquote()
                << QString("  %1 (%2 items)").arg(g.first).arg(g.second.size());
            for (std::size_t i = 0; i < g.second.size() && i < kPerGroupShown;
                 ++i) {
                const QueuedTaskInfo *q = g.second[i];
                qCInfo(mrSched).noquote()
                    << QString("    - %1").arg(QString::fromStdString(
                           q->itemTitle.value_or(q->displayName)));
            }
            if (g.second.size() > kPerGroupShown) {
                qCInfo(mrSched).noquote()
                    << QString("    ... and %1 more")
                           .arg(g.second.size() - kPerGroupShown);
            }
        }
    }

    qCInfo(mrSched).noquote()
        << QString("Slots: %1 total, %2 available, %3 interactive active, "
                   "%4 bulk active")
               .arg(st.totalSlots)
               .arg(st.availableSlots)
               .arg(st.activeInteractive)
               .arg(st.activeBulk);
    qCInfo(mrSched).noquote()
        << QString("Counters: queued=%1 completed=%2 (interactive %3, bulk "
                   "%4) failed=%5 cancelled=%6")
               .arg(st.totalQueued)
               .arg(st.completed)
               .arg(st.interactiveCompleted)
               .arg(st.bulkCompleted)
               .arg(st.failed)
               .arg(st.cancelled);
    qCInfo(mrSched).noquote() << rule;
}
