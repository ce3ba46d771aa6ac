// Daemon entry point: wire the SFTP source/sink, the upload registry and the
// scheduler, enqueue the requested work and report until idle.
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>
#include <string>
#include <vector>
#include "DownloadScheduler.hpp"
#include "RelayConfig.hpp"
#include "SeasonManifest.hpp"
#include "StatusJson.hpp"
#include "UploadRegistry.hpp"
#include "mediarelay/RuntimeLogging.hpp"
#include "mediarelay/SftpTransfer.hpp"
Q_LOGGING_CATEGORY(mrApp, "mediarelay.app")

using namespace mediarelay;

static bool collectTasks(const QStringList &locators, PriorityClass cls,
                         std::vector<TransferTask> &out, std::string &err) {
    for (const QString &text : locators) {
        ObjectLocator loc;
        if (!parseLocator(text.trimmed().toStdString(), loc, err))
            return false;
        out.push_back(makeTask(loc, cls));
    }
    return true;
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("mediarelayd");
    QCoreApplication::setOrganizationName("mediarelay");

    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} %{type} "
                       "%{category}: %{message}");
    if (isDevEnvironment())
        QLoggingCategory::setFilterRules("mediarelay.*.debug=true");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Relays objects from a source to durable storage with two-class "
        "slot scheduling.");
    parser.addHelpOption();
    const QCommandLineOption configOpt(
        "config", "INI configuration file.", "ini");
    const QCommandLineOption interactiveOpt(
        QStringList{"i", "interactive"},
        "Enqueue an interactive transfer (repeatable).", "container/object");
    const QCommandLineOption bulkOpt(QStringList{"b", "bulk"},
                                     "Enqueue a bulk transfer (repeatable).",
                                     "container/object");
    const QCommandLineOption seasonOpt(
        "season", "Enqueue every entry of a season manifest as bulk work.",
        "manifest");
    const QCommandLineOption intervalOpt(
        "status-interval", "Status report period in milliseconds.", "ms",
        "5000");
    const QCommandLineOption keepRunningOpt(
        "keep-running", "Keep running after the queue drains.");
    parser.addOption(configOpt);
    parser.addOption(interactiveOpt);
    parser.addOption(bulkOpt);
    parser.addOption(seasonOpt);
    parser.addOption(intervalOpt);
    parser.addOption(keepRunningOpt);
    parser.process(app);

    RelayConfig cfg;
    std::string err;
    if (!RelayConfig::load(parser.value(configOpt), cfg, err)) {
        qCCritical(mrApp) << "Invalid configuration:"
                          << QString::fromStdString(err);
        return 2;
    }
    if (cfg.source.host.empty() || cfg.sink.host.empty()) {
        qCCritical(mrApp) << "Source/host and Sink/host must be configured";
        return 2;
    }
    bool intervalOk = false;
    const int statusIntervalMs = parser.value(intervalOpt).toInt(&intervalOk);
    if (!intervalOk || statusIntervalMs <= 0) {
        qCCritical(mrApp) << "--status-interval must be a positive integer";
        return 2;
    }

    std::vector<TransferTask> interactive;
    std::vector<TransferTask> bulk;
    if (!collectTasks(parser.values(interactiveOpt),
                      PriorityClass::Interactive, interactive, err) ||
        !collectTasks(parser.values(bulkOpt), PriorityClass::Bulk, bulk,
                      err)) {
        qCCritical(mrApp) << QString::fromStdString(err);
        return 2;
    }
    std::vector<std::vector<TransferTask>> seasons;
    for (const QString &manifest : parser.values(seasonOpt)) {
        std::vector<TransferTask> items;
        if (!loadSeasonManifest(manifest, items, err)) {
            qCCritical(mrApp) << QString::fromStdString(err);
            return 2;
        }
        seasons.push_back(std::move(items));
    }

    SftpTransferSource source(cfg.source);
    SftpTransferSink sink(cfg.sink);
    UploadRegistry registry(cfg.registryPath, cfg.maxAccessCount, &sink);
    if (!registry.load(err)) {
        qCCritical(mrApp) << "Registry:" << QString::fromStdString(err);
        return 2;
    }
    const std::size_t purged = registry.purgeExpired();
    qCInfo(mrApp) << "Registry ready" << "records=" << registry.size()
                  << "purged=" << purged
                  << "maxAccessCount=" << registry.maxAccessCount();

    DownloadScheduler scheduler(source, sink, cfg.scheduler, cfg.executor,
                                &registry);
    if (!scheduler.start(err)) {
        qCCritical(mrApp) << "Scheduler could not start:"
                          << QString::fromStdString(err);
        return 2;
    }
    if (sensitiveLoggingEnabled()) {
        qCInfo(mrApp) << "Endpoints"
                      << "source=" << QString::fromStdString(cfg.source.host)
                      << "sink=" << QString::fromStdString(cfg.sink.host)
                      << "sourceKnownHosts="
                      << knownHostsPolicyName(cfg.source.known_hosts_policy)
                      << "sinkKnownHosts="
                      << knownHostsPolicyName(cfg.sink.known_hosts_policy);
    }

    int failures = 0;
    QObject::connect(
        &scheduler, &DownloadScheduler::taskFinished, &app,
        [&failures](const QString &id, const QString &outcome,
                    const QString &remoteId, const QString &error) {
            Q_UNUSED(id);
            if (outcome == QLatin1String(outcomeName(TransferOutcome::Success))) {
                QTextStream(stdout) << "done " << remoteId << Qt::endl;
                return;
            }
            ++failures;
            QTextStream(stdout) << outcome.toLower() << " " << error
                                << Qt::endl;
        },
        Qt::QueuedConnection);

    auto printResult = [](const TransferTask &t, const EnqueueResult &r) {
        const QJsonDocument doc(enqueueResultToJson(t, r));
        QTextStream(stdout) << doc.toJson(QJsonDocument::Compact) << Qt::endl;
    };
    for (const auto &t : interactive)
        printResult(t, scheduler.enqueue(t));
    for (const auto &t : bulk)
        printResult(t, scheduler.enqueue(t));
    for (const auto &items : seasons) {
        const std::vector<EnqueueResult> results =
            scheduler.enqueueBatch(items);
        for (std::size_t i = 0; i < items.size(); ++i)
            printResult(items[i], results[i]);
    }

    const bool keepRunning = parser.isSet(keepRunningOpt);
    QTimer statusTimer;
    statusTimer.setInterval(statusIntervalMs);
    QObject::connect(&statusTimer, &QTimer::timeout, &app, [&scheduler]() {
        const QJsonDocument doc(statusToJson(scheduler.status()));
        QTextStream(stdout) << doc.toJson(QJsonDocument::Compact) << Qt::endl;
        scheduler.logDetailedStatus();
    });
    statusTimer.start();

    QTimer idleTimer;
    idleTimer.setInterval(250);
    QObject::connect(&idleTimer, &QTimer::timeout, &app,
                     [&scheduler, keepRunning]() {
                         if (!keepRunning && scheduler.isIdle())
                             QCoreApplication::quit();
                     });
    idleTimer.start();

    const int rc = app.exec();
    scheduler.stop();
    // Deliver taskFinished events queued during shutdown.
    QCoreApplication::processEvents();

    if (!registry.save(err)) {
        qCWarning(mrApp) << "Registry not saved:"
                         << QString::fromStdString(err);
    }

    const SchedulerStatus st = scheduler.status();
    QTextStream(stdout) << QJsonDocument(statusToJson(st)).toJson(
                               QJsonDocument::Compact)
                        << Qt::endl;
    qCInfo(mrApp) << "Exiting" << "completed=" << st.completed
                  << "failed=" << st.failed;
    if (rc != 0)
        return rc;
    return st.failed == 0 && failures == 0 ? 0 : 1;
}
