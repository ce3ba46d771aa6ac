#include "StatusJson.hpp"
#include <QDateTime>
#include <QJsonArray>
#include <QTimeZone>
#include <chrono>
#include <optional>
#include <string>

using namespace mediarelay;

namespace {

QJsonValue optionalString(const std::optional<std::string> &v) {
    return v ? QJsonValue(QString::fromStdString(*v)) : QJsonValue();
}

QJsonObject queuedToJson(const QueuedTaskInfo &q) {
    QJsonObject o;
    o.insert("id", QString::fromStdString(q.id));
    o.insert("displayName", QString::fromStdString(q.displayName));
    o.insert("series", optionalString(q.groupContext));
    o.insert("season", optionalString(q.groupDetail));
    o.insert("title", optionalString(q.itemTitle));
    const qint64 ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          q.enqueuedAt.time_since_epoch())
                          .count();
    o.insert("enqueuedAt",
             QDateTime::fromMSecsSinceEpoch(ms, QTimeZone::utc()).toString(Qt::ISODate));
    return o;
}

} // namespace

QJsonObject statusToJson(const SchedulerStatus &st) {
    QJsonObject queued;
    queued.insert("interactive", static_cast<qint64>(st.queuedInteractive));
    queued.insert("bulk", static_cast<qint64>(st.queuedBulk));

    QJsonArray active;
    QJsonObject slotPriorities;
    for (const auto &a : st.active) {
        QJsonObject o;
        o.insert("slotId", a.slotId);
        o.insert("slotKind", QString::fromLatin1(slotKindName(a.slotKind)));
        o.insert("id", QString::fromStdString(a.id));
        o.insert("displayName", QString::fromStdString(a.displayName));
        o.insert("priorityClass",
                 QString::fromLatin1(priorityClassName(a.priorityClass)));
        o.insert("series", optionalString(a.groupContext));
        o.insert("season", optionalString(a.groupDetail));
        o.insert("bytesDone", static_cast<double>(a.progress.bytesDone));
        if (a.progress.bytesTotal > 0) {
            o.insert("bytesTotal", static_cast<double>(a.progress.bytesTotal));
            o.insert("percent", 100.0 * static_cast<double>(a.progress.bytesDone) /
                                    static_cast<double>(a.progress.bytesTotal));
        }
        o.insert("chunkSize", static_cast<double>(a.progress.chunkSize));
        o.insert("throughputMBps", a.progress.throughputMBps);
        active.append(o);
        slotPriorities.insert(QString::number(a.slotId),
                              QString::fromLatin1(
                                  priorityClassName(a.priorityClass)));
    }

    QJsonObject slotInfo;
    slotInfo.insert("total", st.totalSlots);
    slotInfo.insert("bulkSlots", st.bulkSlots);
    slotInfo.insert("interactiveSlots", st.interactiveSlots);
    slotInfo.insert("available", st.availableSlots);
    slotInfo.insert("activeSlots", static_cast<qint64>(st.active.size()));
    slotInfo.insert("activeInteractive", st.activeInteractive);
    slotInfo.insert("activeBulk", st.activeBulk);
    slotInfo.insert("slotPriorities", slotPriorities);

    QJsonObject stats;
    stats.insert("totalQueued", static_cast<double>(st.totalQueued));
    stats.insert("interactiveCompleted",
                 static_cast<double>(st.interactiveCompleted));
    stats.insert("bulkCompleted", static_cast<double>(st.bulkCompleted));
    stats.insert("interactiveFailed", static_cast<double>(st.interactiveFailed));
    stats.insert("bulkFailed", static_cast<double>(st.bulkFailed));
    stats.insert("cancelled", static_cast<double>(st.cancelled));

    QJsonArray interactiveDetail;
    for (const auto &q : st.queuedInteractiveDetail)
        interactiveDetail.append(queuedToJson(q));
    QJsonArray bulkDetail;
    for (const auto &q : st.queuedBulkDetail)
        bulkDetail.append(queuedToJson(q));

    QJsonObject root;
    root.insert("queued", queued);
    root.insert("active", active);
    root.insert("completed", static_cast<double>(st.completed));
    root.insert("failed", static_cast<double>(st.failed));
    root.insert("slots", slotInfo);
    root.insert("stats", stats);
    root.insert("interactiveQueue", interactiveDetail);
    root.insert("bulkQueue", bulkDetail);
    return root;
}

QJsonObject enqueueResultToJson(const TransferTask &task,
                                const EnqueueResult &r) {
    QJsonObject o;
    o.insert("id", QString::fromStdString(task.id));
    o.insert("displayName", QString::fromStdString(task.displayName));
    o.insert("priorityClass",
             QString::fromLatin1(priorityClassName(task.priorityClass)));
    o.insert("status", QString::fromLatin1(enqueueStatusName(r.status)));
    if (r.status == EnqueueResult::Status::AlreadyComplete)
        o.insert("remoteId", QString::fromStdString(r.remoteId));
    if (r.queuePosition > 0)
        o.insert("position", static_cast<qint64>(r.queuePosition));
    return o;
}
