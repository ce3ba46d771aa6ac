// Scheduler and service-layer tests without external framework (run via
// CTest). Gated mock objects hold transfers "running" so slot decisions can
// be observed deterministically.
#include "DownloadScheduler.hpp"
#include "RelayConfig.hpp"
#include "SeasonManifest.hpp"
#include "StatusJson.hpp"
#include "UploadRegistry.hpp"
#include "mediarelay/MockTransfer.hpp"
#include "mediarelay/StagingFile.hpp"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QtGlobal>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace mediarelay;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

template <typename Pred> bool waitFor(Pred pred, int timeoutMs = 5000) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

TransferTask task(const std::string &ref,
                  PriorityClass p = PriorityClass::Bulk) {
    return makeTask(ObjectLocator{"chan", ref}, p);
}

std::string idOf(const std::string &ref) { return "chan:" + ref; }

class RecordingProbe : public DedupProbe {
public:
    std::optional<std::string> isDurablyStored(const std::string &id) override {
        std::lock_guard<std::mutex> lk(mtx);
        auto it = stored.find(id);
        if (it == stored.end())
            return std::nullopt;
        return it->second;
    }

    void recordStored(const TransferTask &task, const std::string &remoteId,
                      std::uint64_t sizeBytes) override {
        std::lock_guard<std::mutex> lk(mtx);
        stored[task.id] = remoteId;
        lastSize = sizeBytes;
        ++recordCalls;
    }

    int recordCount() {
        std::lock_guard<std::mutex> lk(mtx);
        return recordCalls;
    }

    std::mutex mtx;
    std::map<std::string, std::string> stored;
    std::atomic<std::uint64_t> lastSize{0};
    int recordCalls = 0;
};

struct FinishedEvent {
    std::string id;
    std::string outcome;
    std::string remoteId;
    std::string error;
};

// Scheduler over mock collaborators. Every gate is opened before teardown
// so no worker is left blocked.
struct Harness {
    explicit Harness(int bulk = 3, int interactive = 1,
                     DedupProbe *probe = nullptr) {
        source.setGateTimeout(std::chrono::milliseconds(5000));
        SchedulerConfig cfg;
        cfg.bulkSlots = bulk;
        cfg.interactiveSlots = interactive;
        cfg.wakeInterval = std::chrono::milliseconds(100);
        ExecutorConfig exec;
        exec.stagingDir = tmp.path().toStdString();
        sched = std::make_unique<DownloadScheduler>(source, sink, cfg, exec,
                                                    probe);
        QObject::connect(sched.get(), &DownloadScheduler::taskAdmitted,
                         [this](int slotId, const QString &id) {
                             std::lock_guard<std::mutex> lk(eventsMutex);
                             admitted.emplace_back(slotId, id.toStdString());
                         });
        QObject::connect(
            sched.get(), &DownloadScheduler::taskFinished,
            [this](const QString &id, const QString &outcome,
                   const QString &remoteId, const QString &error) {
                std::lock_guard<std::mutex> lk(eventsMutex);
                finished.push_back({id.toStdString(), outcome.toStdString(),
                                    remoteId.toStdString(),
                                    error.toStdString()});
            });
    }

    ~Harness() {
        for (auto &g : gates)
            g->open();
        sched.reset();
    }

    bool start() {
        std::string err;
        return sched->start(err);
    }

    std::shared_ptr<MockGate> addGated(const std::string &ref,
                                       std::uint64_t size = 64 * 1024) {
        auto gate = std::make_shared<MockGate>();
        MockObject obj;
        obj.sizeBytes = size;
        obj.gate = gate;
        source.addObject({"chan", ref}, obj);
        gates.push_back(gate);
        return gate;
    }

    void addObject(const std::string &ref, std::uint64_t size = 64 * 1024) {
        MockObject obj;
        obj.sizeBytes = size;
        source.addObject({"chan", ref}, obj);
    }

    SchedulerStatus status() const { return sched->status(); }

    bool waitActive(std::size_t n) {
        return waitFor([&] { return status().active.size() == n; });
    }

    bool waitIdle() {
        return waitFor([&] { return sched->isIdle(); });
    }

    std::optional<ActiveSlotInfo> activeFor(const std::string &id) const {
        for (const auto &a : status().active) {
            if (a.id == id)
                return a;
        }
        return std::nullopt;
    }

    std::vector<FinishedEvent> finishedEvents() {
        std::lock_guard<std::mutex> lk(eventsMutex);
        return finished;
    }

    QTemporaryDir tmp;
    MockTransferSource source;
    MockTransferSink sink;
    std::vector<std::shared_ptr<MockGate>> gates;
    std::unique_ptr<DownloadScheduler> sched;

    std::mutex eventsMutex;
    std::vector<std::pair<int, std::string>> admitted;
    std::vector<FinishedEvent> finished;
};

void test_start_validation(TestContext &t) {
    MockTransferSource src;
    MockTransferSink sink;
    std::string err;

    SchedulerConfig noInteractive;
    noInteractive.interactiveSlots = 0;
    DownloadScheduler a(src, sink, noInteractive, ExecutorConfig{});
    t.check(!a.start(err), "zero interactive slots must fail to start");
    t.checkContains(err, "interactive", "error should name interactive slots");

    SchedulerConfig negative;
    negative.bulkSlots = -1;
    DownloadScheduler b(src, sink, negative, ExecutorConfig{});
    err.clear();
    t.check(!b.start(err), "negative bulk slots must fail to start");

    ExecutorConfig badChunks;
    badChunks.chunk.minChunkBytes = badChunks.chunk.maxChunkBytes + 1;
    DownloadScheduler c(src, sink, SchedulerConfig{}, badChunks);
    err.clear();
    t.check(!c.start(err), "invalid chunk config must fail to start");

    DownloadScheduler d(src, sink, SchedulerConfig{}, ExecutorConfig{});
    err.clear();
    t.check(d.config().bulkSlots == 3 && d.config().interactiveSlots == 1 &&
                d.config().wakeInterval.count() == 2000,
            "default scheduler config should be 3 bulk + 1 interactive");
    t.check(d.start(err), "default config should start: " + err);
    t.check(!d.start(err), "second start should be refused");
    const SchedulerStatus st = d.status();
    t.check(st.totalSlots == 4 && st.bulkSlots == 3 && st.interactiveSlots == 1,
            "default slot table should be 3 bulk + 1 interactive");
    d.stop();
    d.stop();
    t.check(!d.isStarted(), "stop should be idempotent");
}

// Scenarios 1-3: bulk fill, interactive reserved slot, interactive borrowing
// a freed bulk slot ahead of older bulk work.
void test_two_class_admission(TestContext &t) {
    Harness h;
    std::vector<std::shared_ptr<MockGate>> bulkGates;
    for (int i = 1; i <= 5; ++i)
        bulkGates.push_back(h.addGated("B" + std::to_string(i)));
    auto i1Gate = h.addGated("I1");
    auto i2Gate = h.addGated("I2");
    t.check(h.start(), "scheduler should start");

    for (int i = 1; i <= 5; ++i) {
        const auto r = h.sched->enqueue(task("B" + std::to_string(i)));
        t.check(r.status == EnqueueResult::Status::Accepted,
                "bulk enqueue should be accepted");
    }
    t.check(h.waitActive(3), "three bulk tasks should start");
    SchedulerStatus st = h.status();
    t.check(st.queuedBulk == 2, "B4 and B5 should stay queued");
    for (int i = 0; i < 3 && i < static_cast<int>(st.active.size()); ++i) {
        t.check(st.active[i].slotId == i &&
                    st.active[i].id == idOf("B" + std::to_string(i + 1)),
                "B1..B3 should run in bulk slots 0..2");
    }
    t.check(st.availableSlots == 1, "interactive slot should stay idle");

    h.sched->enqueue(task("I1", PriorityClass::Interactive));
    t.check(h.waitActive(4), "I1 should be admitted immediately");
    auto i1 = h.activeFor(idOf("I1"));
    t.check(i1 && i1->slotId == 3 &&
                i1->slotKind == SlotKind::InteractiveReserved,
            "I1 should take the interactive reserved slot");
    t.check(h.status().queuedBulk == 2, "bulk queue should be untouched");

    h.sched->enqueue(task("I2", PriorityClass::Interactive));
    t.check(waitFor([&] { return h.status().queuedInteractive == 1; }),
            "I2 should wait while every slot is busy");

    bulkGates[0]->open();
    t.check(waitFor([&] { return h.activeFor(idOf("I2")).has_value(); }),
            "I2 should be admitted when B1 frees its slot");
    auto i2 = h.activeFor(idOf("I2"));
    t.check(i2 && i2->slotId == 0 && i2->slotKind == SlotKind::BulkReserved &&
                i2->priorityClass == PriorityClass::Interactive,
            "I2 should borrow B1's bulk reserved slot");
    st = h.status();
    t.check(st.queuedBulk == 2, "B4 should still wait behind I2");
    t.check(st.completed == 1 && st.bulkCompleted == 1, "B1 should count");
    t.check(st.activeInteractive == 2 && st.activeBulk == 2,
            "two interactive and two bulk transfers should be running");

    for (auto &g : h.gates)
        g->open();
    t.check(h.waitIdle(), "all work should drain");
    st = h.status();
    t.check(st.completed == 7 && st.failed == 0, "seven transfers complete");
    t.check(st.interactiveCompleted == 2 && st.bulkCompleted == 5,
            "completion counters should split by class");
    t.check(st.totalQueued == 7, "totalQueued should count accepted tasks");
    t.check(h.sink.uploads().size() == 7, "sink should hold seven objects");
    t.check(waitFor([&] { return h.finishedEvents().size() == 7; }),
            "taskFinished once per task");
    t.check(QDir(h.tmp.path()).entryList(QDir::Files).isEmpty(),
            "no staging file should survive");
}

// Scenario 4: duplicate enqueue runs once.
void test_duplicate_enqueue(TestContext &t) {
    Harness h;
    auto gate = h.addGated("X");
    t.check(h.start(), "scheduler should start");

    const auto first = h.sched->enqueue(task("X"));
    const auto second = h.sched->enqueue(task("X"));
    t.check(first.status == EnqueueResult::Status::Accepted,
            "first enqueue should be accepted");
    t.check(second.status == EnqueueResult::Status::AlreadyQueued,
            "second enqueue should be AlreadyQueued");
    t.check(h.waitActive(1), "X should start");
    const auto third = h.sched->enqueue(task("X", PriorityClass::Interactive));
    t.check(third.status == EnqueueResult::Status::AlreadyQueued,
            "enqueue while running should be AlreadyQueued");
    t.check(h.sched->isInProgress(idOf("X")), "X should be in progress");

    gate->open();
    t.check(h.waitIdle(), "X should finish");
    t.check(h.source.resolveCount(idOf("X")) == 1, "X should run only once");
    t.check(h.sink.uploads().size() == 1, "X should upload only once");
    t.check(!h.sched->isInProgress(idOf("X")),
            "finished task should leave the dedup index");
}

// Scenario 6 plus cancellation of running work.
void test_cancel(TestContext &t) {
    Harness h(1, 1);
    auto bulkGate = h.addGated("run");
    h.addObject("later");
    t.check(h.start(), "scheduler should start");

    h.sched->enqueue(task("run"));
    t.check(h.waitActive(1), "first bulk task should run");
    h.sched->enqueue(task("later"));
    SchedulerStatus before = h.status();
    t.check(before.queuedBulk == 1, "second bulk task should wait");

    t.check(h.sched->cancel(idOf("later")), "queued cancel should succeed");
    SchedulerStatus after = h.status();
    t.check(after.queuedBulk == 0, "cancelled task should leave the queue");
    t.check(after.active.size() == before.active.size() &&
                after.completed == before.completed &&
                after.failed == before.failed,
            "queued cancel should not touch active/completed/failed");
    t.check(!h.sched->isInProgress(idOf("later")),
            "cancelled task is no longer in progress");
    t.check(!h.sched->cancel(idOf("later")), "second cancel should fail");
    t.check(!h.sched->cancel(idOf("unknown")), "unknown id cancel fails");

    t.check(h.sched->cancel(idOf("run")), "running cancel should be signalled");
    t.check(!bulkGate->isOpen(), "running task should still be held");
    bulkGate->open();
    t.check(waitFor([&] { return h.status().cancelled == 1; }),
            "running task should end as cancelled");
    SchedulerStatus done = h.status();
    t.check(done.failed == 1, "cancelled runs count as failed");
    t.check(done.active.empty() && done.availableSlots == 2,
            "slot should be released after cancellation");
    t.check(h.sink.uploads().empty(), "cancelled run must not upload");
    t.check(QDir(h.tmp.path()).entryList(QDir::Files).isEmpty(),
            "cancelled run must leave no staging file");
    t.check(waitFor([&] { return h.finishedEvents().size() == 1; }),
            "taskFinished should fire for the cancelled run");
    const auto events = h.finishedEvents();
    t.check(events.size() == 1 && events[0].outcome == "Cancelled",
            "taskFinished should report Cancelled");
    t.check(h.source.resolveCount(idOf("later")) == 0,
            "cancelled queued task never reaches the source");
}

void test_failure_accounting(TestContext &t) {
    Harness h;
    MockObject flaky;
    flaky.sizeBytes = 256 * 1024;
    flaky.failAfterBytes = 1024;
    h.source.addObject({"chan", "flaky"}, flaky);
    t.check(h.start(), "scheduler should start");

    h.sched->enqueue(task("missing"));
    h.sched->enqueue(task("flaky", PriorityClass::Interactive));
    t.check(h.waitIdle(), "failing tasks should finish");
    t.check(waitFor([&] { return h.finishedEvents().size() == 2; }),
            "taskFinished should fire for both failures");

    const SchedulerStatus st = h.status();
    t.check(st.failed == 2 && st.completed == 0, "two failures expected");
    t.check(st.bulkFailed == 1 && st.interactiveFailed == 1,
            "failure counters should split by class");
    t.check(st.cancelled == 0, "failures are not cancellations");
    t.check(st.availableSlots == st.totalSlots, "every slot released");
    for (const auto &e : h.finishedEvents()) {
        t.check(e.outcome == "Failure", "outcome should be Failure");
        t.check(!e.error.empty(), "failure should carry a reason");
    }
    t.check(!h.sched->isInProgress(idOf("missing")),
            "failed task should leave the dedup index");

    // No automatic retry: re-enqueue is the caller's choice.
    h.addObject("missing");
    const auto again = h.sched->enqueue(task("missing"));
    t.check(again.status == EnqueueResult::Status::Accepted,
            "failed id can be re-enqueued");
    t.check(h.waitIdle(), "retry should finish");
    t.check(h.status().completed == 1, "explicit retry should succeed");
}

// Mock source whose resolve() throws for the first `throws` calls.
class ThrowingSource : public MockTransferSource {
public:
    explicit ThrowingSource(int throws) : throwsLeft(throws) {}

    std::unique_ptr<ObjectHandle> resolve(const ObjectLocator &loc,
                                          std::string &err) override {
        if (throwsLeft.fetch_sub(1) > 0)
            throw std::runtime_error("source backend crashed");
        return MockTransferSource::resolve(loc, err);
    }

    std::atomic<int> throwsLeft;
};

void test_transfer_exception_releases_slot(TestContext &t) {
    QTemporaryDir tmp;
    ThrowingSource source(1);
    MockTransferSink sink;
    MockObject obj;
    obj.sizeBytes = 64 * 1024;
    source.addObject({"chan", "boom"}, obj);

    SchedulerConfig cfg;
    cfg.bulkSlots = 1;
    cfg.interactiveSlots = 1;
    cfg.wakeInterval = std::chrono::milliseconds(100);
    ExecutorConfig exec;
    exec.stagingDir = tmp.path().toStdString();
    DownloadScheduler sched(source, sink, cfg, exec);

    std::mutex mtx;
    std::vector<FinishedEvent> finished;
    QObject::connect(&sched, &DownloadScheduler::taskFinished,
                     [&](const QString &id, const QString &outcome,
                         const QString &remoteId, const QString &error) {
                         std::lock_guard<std::mutex> lk(mtx);
                         finished.push_back({id.toStdString(),
                                             outcome.toStdString(),
                                             remoteId.toStdString(),
                                             error.toStdString()});
                     });
    auto finishedCount = [&] {
        std::lock_guard<std::mutex> lk(mtx);
        return finished.size();
    };

    std::string err;
    t.check(sched.start(err), "scheduler should start: " + err);
    const auto first = sched.enqueue(task("boom"));
    t.check(first.status == EnqueueResult::Status::Accepted,
            "task should be accepted");
    t.check(waitFor([&] { return finishedCount() == 1; }),
            "throwing transfer should still finish");
    t.check(waitFor([&] { return sched.isIdle(); }), "scheduler goes idle");

    const SchedulerStatus st = sched.status();
    t.check(st.failed == 1 && st.bulkFailed == 1 && st.completed == 0,
            "exception counts as one bulk failure");
    t.check(st.cancelled == 0, "exception is not a cancellation");
    t.check(st.availableSlots == st.totalSlots && st.active.empty(),
            "slot should be released after the exception");
    t.check(!sched.isInProgress(idOf("boom")),
            "thrown task should leave the dedup index");
    {
        std::lock_guard<std::mutex> lk(mtx);
        t.check(finished.size() == 1 && finished[0].outcome == "Failure",
                "taskFinished should report Failure");
        if (!finished.empty())
            t.checkContains(finished[0].error, "source backend crashed",
                            "exception text should be the reason");
    }

    const auto again = sched.enqueue(task("boom"));
    t.check(again.status == EnqueueResult::Status::Accepted,
            "thrown task can be re-enqueued");
    t.check(waitFor([&] { return finishedCount() == 2; }),
            "re-enqueued task should finish");
    t.check(waitFor([&] { return sched.status().completed == 1; }),
            "re-enqueued task should succeed once the source recovers");
    sched.stop();
}

void test_sink_rejection_counts_as_failure(TestContext &t) {
    Harness h;
    h.addObject("quota");
    h.sink.setRejectUploads(true);
    t.check(h.start(), "scheduler should start");
    h.sched->enqueue(task("quota"));
    t.check(waitFor([&] { return h.finishedEvents().size() == 1; }),
            "sink rejection should finish the task");
    t.check(h.status().failed == 1, "sink rejection counts as failed");
    const auto events = h.finishedEvents();
    t.check(events.size() == 1, "one finished event expected");
    if (!events.empty())
        t.checkContains(events[0].error, "Quota", "reason should propagate");
}

void test_already_complete_probe(TestContext &t) {
    RecordingProbe probe;
    probe.stored[idOf("old")] = "remote-9";
    Harness h(3, 1, &probe);
    h.addObject("fresh", 4096);
    t.check(h.start(), "scheduler should start");

    const auto r = h.sched->enqueue(task("old"));
    t.check(r.status == EnqueueResult::Status::AlreadyComplete,
            "stored object should be AlreadyComplete");
    t.check(r.remoteId == "remote-9", "existing remote id should be returned");
    t.check(!h.sched->isInProgress(idOf("old")),
            "AlreadyComplete must not queue anything");
    t.check(h.status().totalQueued == 0, "nothing should be counted as queued");

    h.sched->enqueue(task("fresh"));
    t.check(h.waitIdle(), "fresh object should transfer");
    t.check(waitFor([&] { return probe.recordCount() == 1; }),
            "successful run should be recorded in the probe");
    t.check(probe.lastSize.load() == 4096, "recorded size should be the byte count");
    const auto again = h.sched->enqueue(task("fresh"));
    t.check(again.status == EnqueueResult::Status::AlreadyComplete,
            "recorded object should short-circuit the next request");
}

void test_enqueue_batch(TestContext &t) {
    Harness h(0, 1);
    h.addGated("blocker");
    t.check(h.start(), "scheduler with no bulk slots should start");

    std::vector<TransferTask> season;
    for (int i = 1; i <= 4; ++i) {
        TransferTask tk = task("S1E" + std::to_string(i));
        tk.groupContext = "Show";
        tk.groupDetail = "Season 1";
        tk.itemTitle = "Episode " + std::to_string(i);
        season.push_back(tk);
    }
    season.push_back(season.front());
    const auto results = h.sched->enqueueBatch(season);
    t.check(results.size() == 5, "one result per batch item");
    t.check(results[0].status == EnqueueResult::Status::Accepted &&
                results[3].status == EnqueueResult::Status::Accepted,
            "batch items should be accepted");
    t.check(results[4].status == EnqueueResult::Status::AlreadyQueued,
            "duplicate inside a batch should be AlreadyQueued");
    t.check(results[2].queuePosition == 3, "positions follow batch order");

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    const SchedulerStatus st = h.status();
    t.check(st.active.empty() && st.queuedBulk == 4,
            "bulk work never takes the interactive slot");
    t.check(st.queuedBulkDetail.size() == 4 &&
                st.queuedBulkDetail[0].groupContext == std::string("Show"),
            "queue detail should carry the group context");
    h.sched->logDetailedStatus();

    const QJsonObject json = statusToJson(st);
    t.check(json.value("queued").toObject().value("bulk").toInt() == 4,
            "status JSON should report queued bulk work");
    t.check(json.value("slots").toObject().value("bulkSlots").toInt() == 0,
            "status JSON should report slot allocation");
    t.check(json.value("bulkQueue").toArray().size() == 4,
            "status JSON should list queued bulk items");
    t.check(h.sched->cancelAll() == 4, "cancelAll should clear the queue");
}

void test_upload_registry(TestContext &t) {
    QTemporaryDir tmp;
    const QString path = tmp.filePath("registry/uploads.json");
    MockTransferSink sink;
    MockTransferSource src;
    MockObject obj;
    obj.sizeBytes = 2048;
    src.addObject({"chan", "ep"}, obj);

    // Put a real object in the sink so exists() has something to find.
    ExecutorConfig exec;
    exec.stagingDir = tmp.path().toStdString();
    AdaptiveTransferExecutor runner(src, sink, exec);
    const TransferTask tk = task("ep");
    const TransferResult res = runner.run(tk, {});
    t.check(res.outcome == TransferOutcome::Success, "seed upload succeeds");

    UploadRegistry reg(path, 2, &sink);
    std::string err;
    t.check(reg.load(err), "missing registry file should load as empty");
    t.check(!reg.isDurablyStored(tk.id), "unknown id is not stored");
    reg.recordStored(tk, res.remoteId, res.bytesTransferred);
    t.check(reg.isDurablyStored(tk.id) == std::optional<std::string>(res.remoteId),
            "recorded id should resolve while the sink has it");
    t.check(QFile::exists(path), "registry should be persisted");

    UploadRegistry reloaded(path, 2, &sink);
    t.check(reloaded.load(err), "registry should reload: " + err);
    const auto rec = reloaded.find(tk.id);
    t.check(rec && rec->remoteId == res.remoteId && rec->sizeBytes == 2048 &&
                rec->displayName == "ep",
            "reloaded record should keep its fields");

    int remaining = -1;
    t.check(reloaded.noteAccess(tk.id, remaining) && remaining == 1,
            "first access leaves one");
    t.check(reloaded.noteAccess(tk.id, remaining) && remaining == 0,
            "second access reaches the limit");
    t.check(!reloaded.noteAccess(tk.id, remaining),
            "access beyond the limit is refused");
    t.check(!reloaded.isDurablyStored(tk.id),
            "record at the access limit is no longer trusted");
    t.check(!reloaded.find(tk.id), "expired record should be dropped");

    reg.recordStored(tk, res.remoteId, res.bytesTransferred);
    sink.forget(res.remoteId);
    t.check(!reg.isDurablyStored(tk.id),
            "record whose object vanished should not be trusted");
    t.check(reg.size() == 0, "stale record should be dropped");

    QFile bad(tmp.filePath("bad.json"));
    t.check(bad.open(QIODevice::WriteOnly), "bad file should be writable");
    bad.write("{ not json");
    bad.close();
    UploadRegistry broken(tmp.filePath("bad.json"));
    t.check(!broken.load(err), "malformed registry should fail to load");
}

void writeFile(const QString &path, const QByteArray &content) {
    QFile f(path);
    if (f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        f.write(content);
}

void test_relay_config(TestContext &t) {
    QTemporaryDir tmp;
    qunsetenv("MEDIA_RELAY_TEMP_DIR");
    RelayConfig defaults;
    std::string err;
    t.check(RelayConfig::load(QString(), defaults, err),
            "empty path should yield defaults");
    t.check(defaults.scheduler.bulkSlots == 3 &&
                defaults.scheduler.interactiveSlots == 1 &&
                defaults.scheduler.wakeInterval.count() == 2000,
            "default scheduler settings");
    t.check(defaults.maxAccessCount == 4, "default access limit is 4");

    const QString ini = tmp.filePath("relay.ini");
    writeFile(ini, "[Scheduler]\n"
                   "bulkSlots=2\n"
                   "interactiveSlots=2\n"
                   "wakeIntervalMs=500\n"
                   "[Transfer]\n"
                   "minChunkBytes=1048576\n"
                   "initialChunkBytes=2097152\n"
                   "maxChunkBytes=8388608\n"
                   "highMBps=20\n"
                   "stagingDir=/var/tmp/relay\n"
                   "[Source]\n"
                   "host=source.example\n"
                   "port=2222\n"
                   "user=reader\n"
                   "knownHostsPolicy=accept-new\n"
                   "remoteRoot=/data/media\n"
                   "ioTimeoutMs=1500\n"
                   "[Sink]\n"
                   "host=sink.example\n"
                   "user=writer\n"
                   "keyPath=/keys/id_ed25519\n"
                   "[Registry]\n"
                   "path=/var/lib/relay/uploads.json\n"
                   "maxAccessCount=6\n");
    RelayConfig cfg;
    t.check(RelayConfig::load(ini, cfg, err), "config should load: " + err);
    t.check(cfg.scheduler.bulkSlots == 2 && cfg.scheduler.interactiveSlots == 2,
            "slot counts should be read");
    t.check(cfg.scheduler.wakeInterval.count() == 500, "wake interval read");
    t.check(cfg.executor.chunk.maxChunkBytes == 8388608 &&
                cfg.executor.chunk.highMBps == 20.0,
            "transfer settings should be read");
    t.check(cfg.executor.chunk.lowMBps == 2.0, "unset keys keep defaults");
    t.check(cfg.executor.stagingDir == "/var/tmp/relay", "staging dir read");
    t.check(cfg.source.host == "source.example" && cfg.source.port == 2222 &&
                cfg.source.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
                cfg.source.remote_root == "/data/media",
            "source endpoint should be read");
    t.check(cfg.source.io_timeout_ms == 1500 && cfg.sink.io_timeout_ms == 60000,
            "I/O timeout should be read, defaulting to 60 s");
    t.check(cfg.sink.private_key_path == std::optional<std::string>(
                                             "/keys/id_ed25519") &&
                !cfg.sink.password.has_value(),
            "sink credentials should be read");
    t.check(cfg.registryPath == "/var/lib/relay/uploads.json" &&
                cfg.maxAccessCount == 6,
            "registry settings should be read");

    qputenv("MEDIA_RELAY_TEMP_DIR", "/scratch/relay");
    RelayConfig overridden;
    t.check(RelayConfig::load(ini, overridden, err), "reload with override");
    t.check(overridden.executor.stagingDir == "/scratch/relay",
            "MEDIA_RELAY_TEMP_DIR should override the staging dir");
    qunsetenv("MEDIA_RELAY_TEMP_DIR");

    const QString zero = tmp.filePath("zero.ini");
    writeFile(zero, "[Scheduler]\ninteractiveSlots=0\n");
    RelayConfig rejected;
    t.check(!RelayConfig::load(zero, rejected, err),
            "zero interactive slots should be rejected");

    const QString policy = tmp.filePath("policy.ini");
    writeFile(policy, "[Source]\nknownHostsPolicy=sometimes\n");
    t.check(!RelayConfig::load(policy, rejected, err),
            "unknown known_hosts policy should be rejected");
    t.checkContains(err, "knownHostsPolicy", "error should name the key");

    const QString notNumber = tmp.filePath("nan.ini");
    writeFile(notNumber, "[Transfer]\nsampleWindowMs=soon\n");
    t.check(!RelayConfig::load(notNumber, rejected, err),
            "non-numeric values should be rejected");

    // 2^32 + 3 would narrow to 3 slots.
    const QString wrapped = tmp.filePath("wrapped.ini");
    writeFile(wrapped, "[Scheduler]\nbulkSlots=4294967299\n");
    t.check(!RelayConfig::load(wrapped, rejected, err),
            "slot count beyond int range should be rejected");
    t.checkContains(err, "bulkSlots", "error should name the slot key");
    t.checkContains(err, "out of range", "error should say out of range");

    writeFile(wrapped, "[Scheduler]\ninteractiveSlots=4294967297\n");
    t.check(!RelayConfig::load(wrapped, rejected, err),
            "interactive count beyond int range should be rejected");

    writeFile(wrapped, "[Registry]\nmaxAccessCount=4294967300\n");
    t.check(!RelayConfig::load(wrapped, rejected, err),
            "access limit beyond int range should be rejected");
    t.checkContains(err, "maxAccessCount", "error should name the key");

    writeFile(wrapped, "[Sink]\nioTimeoutMs=-1\n");
    t.check(!RelayConfig::load(wrapped, rejected, err),
            "negative I/O timeout should be rejected");

    writeFile(wrapped, "[Source]\nport=65536\n");
    t.check(!RelayConfig::load(wrapped, rejected, err),
            "port above 65535 should be rejected");
    t.checkContains(err, "Source/port", "error should name the endpoint");

    t.check(!RelayConfig::load(tmp.filePath("absent.ini"), rejected, err),
            "missing config file should be reported");
}

void test_season_manifest(TestContext &t) {
    std::vector<TransferTask> tasks;
    std::string err;
    const QString text = "# series: Some Show\n"
                         "# season: Season 2\n"
                         "chan/2001 | Opening\n"
                         "\n"
                         "# a comment\n"
                         "chan/2002\n"
                         "# season: Season 3\n"
                         "chan/3001\n";
    t.check(parseSeasonManifest(text, tasks, err), "manifest should parse");
    t.check(tasks.size() == 3, "three entries expected");
    if (tasks.size() == 3) {
        t.check(tasks[0].groupContext == std::string("Some Show") &&
                    tasks[0].groupDetail == std::string("Season 2") &&
                    tasks[0].itemTitle == std::string("Opening"),
                "first entry should carry series, season and title");
        t.check(!tasks[1].itemTitle.has_value(), "title is optional");
        t.check(tasks[2].groupDetail == std::string("Season 3"),
                "season header should switch the group");
        t.check(tasks[2].priorityClass == PriorityClass::Bulk,
                "manifest entries are bulk work");
    }
    t.check(!parseSeasonManifest("chan/1\nbroken\n", tasks, err),
            "bad locator should fail");
    t.checkContains(err, "line 2", "error should name the line");
}

} // namespace

int main() {
    TestContext t;
    test_start_validation(t);
    test_two_class_admission(t);
    test_duplicate_enqueue(t);
    test_cancel(t);
    test_failure_accounting(t);
    test_transfer_exception_releases_slot(t);
    test_sink_rejection_counts_as_failure(t);
    test_already_complete_probe(t);
    test_enqueue_batch(t);
    test_upload_registry(t);
    test_relay_config(t);
    test_season_manifest(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] mediarelay_scheduler_tests\n";
    return EXIT_SUCCESS;
}
