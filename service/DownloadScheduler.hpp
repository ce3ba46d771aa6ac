// Two-class download scheduler: interactive requests are admitted ahead of
// bulk ones and may borrow idle bulk slots. Each admitted task runs in its
// own worker thread through an AdaptiveTransferExecutor.
#pragma once
#include <QObject>
#include <QString>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "mediarelay/AdaptiveTransferExecutor.hpp"
#include "mediarelay/DedupProbe.hpp"
#include "mediarelay/SlotAllocator.hpp"
#include "mediarelay/TaskQueue.hpp"

struct SchedulerConfig {
    int bulkSlots = 3;
    int interactiveSlots = 1;
    // Upper bound on how long the loop sleeps without a wake event.
    std::chrono::milliseconds wakeInterval{2000};

    bool validate(std::string &err) const;
};

class DownloadScheduler : public QObject {
    Q_OBJECT
public:
    // Source, sink and probe are not owned. probe may be null (no
    // durable-storage short-circuit).
    DownloadScheduler(mediarelay::TransferSource &source,
                      mediarelay::TransferSink &sink, SchedulerConfig cfg,
                      mediarelay::ExecutorConfig execCfg,
                      mediarelay::DedupProbe *probe = nullptr,
                      QObject *parent = nullptr);
    ~DownloadScheduler() override;

    // Builds the slot table and starts the loop thread. Fails on an
    // unusable slot configuration; nothing else is fatal.
    bool start(std::string &err);
    // Cancels running work cooperatively, clears the queues and joins
    // every thread. Safe to call more than once.
    void stop();
    bool isStarted() const { return started_.load(); }

    // Tasks may be enqueued before start(); they wait for the loop.
    mediarelay::EnqueueResult enqueue(const mediarelay::TransferTask &task);
    std::vector<mediarelay::EnqueueResult>
    enqueueBatch(const std::vector<mediarelay::TransferTask> &tasks);

    // Queued: removed with no side effects. Running: cancellation is
    // signalled to the executor. False when the id is unknown.
    bool cancel(const std::string &id);
    // Cancels every queued and running task. Returns how many were hit.
    std::size_t cancelAll();

    mediarelay::SchedulerStatus status() const;
    // True while the id is queued or occupying a slot.
    bool isInProgress(const std::string &id) const;
    // Nothing queued and no slot occupied.
    bool isIdle() const;

    // Multi-line dump of slots, queue heads and counters to the log.
    void logDetailedStatus() const;

    const SchedulerConfig &config() const { return cfg_; }

signals:
    void taskAdmitted(int slotId, const QString &id);
    void taskFinished(const QString &id, const QString &outcome,
                      const QString &remoteId, const QString &error);
    void statusChanged();

private:
    struct Admission {
        int slotId = -1;
        mediarelay::SlotKind kind = mediarelay::SlotKind::BulkReserved;
        mediarelay::TransferTask task;
    };

    void loop();
    // One pass of the admission rule. Caller holds mtx_.
    bool admitNextLocked(Admission &out);
    void launchWorker(const Admission &a);
    void runWorker(int slotId, const mediarelay::TransferTask &task);
    void finishRun(int slotId, const mediarelay::TransferTask &task,
                   const mediarelay::TransferResult &result);
    void joinFinishedWorkers();
    void wake();

    mediarelay::TransferSource &source_;
    mediarelay::TransferSink &sink_;
    mediarelay::DedupProbe *probe_ = nullptr;
    SchedulerConfig cfg_;
    mediarelay::ExecutorConfig execCfg_;

    // mtx_ guards the queue, the slot table, the active-run details, the
    // cancel set and the counters.
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool wakePending_ = false;
    mediarelay::TaskQueue queue_;
    mediarelay::SlotAllocator slots_{0, 0};
    std::unordered_map<int, mediarelay::ActiveSlotInfo> active_;
    std::unordered_set<std::string> canceledTasks_;
    std::uint64_t completed_ = 0;
    std::uint64_t failed_ = 0;
    std::uint64_t cancelled_ = 0;
    std::uint64_t interactiveCompleted_ = 0;
    std::uint64_t bulkCompleted_ = 0;
    std::uint64_t interactiveFailed_ = 0;
    std::uint64_t bulkFailed_ = 0;
    std::uint64_t totalQueued_ = 0;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::thread loopThread_;

    // worker threads per slot; finished handles are parked until the loop
    // (or stop) joins them outside mtx_
    std::mutex workersMutex_;
    std::unordered_map<int, std::thread> workers_;
    std::vector<std::thread> finishedWorkers_;
};
