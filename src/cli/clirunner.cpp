#include "clirunner.h"
#include "healthcheck.h"
#include "statusreport.h"
#include "services/adaptivecontroller.h"
#include "services/autosync.h"
#include "services/connectionprobe.h"
#include "services/errorhandler.h"
#include "services/metricsstore.h"
#include "services/rsyncexecutor.h"
#include "services/syncconfig.h"
#include "services/syncservice.h"
#include "models/taskpool.h"
#include "utils/formatutils.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QEventLoop>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QTimer>

#include <functional>

QStringList CliRunner::commands()
{
    return {QStringLiteral("upload"), QStringLiteral("download"),
            QStringLiteral("upload-dir"), QStringLiteral("download-dir"),
            QStringLiteral("sync"), QStringLiteral("diff"),
            QStringLiteral("test-connection"), QStringLiteral("health"),
            QStringLiteral("config")};
}

CliRunner::CliRunner(const CliOptions &options, QObject *parent)
    : QObject(parent)
    , options_(options)
    , out_(stdout)
    , config_(new SyncConfig(this))
    , controller_(new AdaptiveController(this))
    , metrics_(new MetricsStore(this))
{
    pool_ = new TaskPool(config_, controller_, metrics_, this);
    executor_ = new RsyncExecutor(config_, this);
    pool_->setExecutor(executor_);
    service_ = new SyncService(config_, pool_, this);
    probe_ = new ConnectionProbe(config_, this);
    errorHandler_ = new ErrorHandler(this);

    connect(probe_, &ConnectionProbe::probeFinished,
            controller_, &AdaptiveController::recordProbe);
    connect(service_, &SyncService::requestRejected,
            errorHandler_, &ErrorHandler::handleRejectedRequest);
    connect(pool_, &TaskPool::taskFailed,
            errorHandler_, &ErrorHandler::handleTaskFailed);
    connect(service_, &SyncService::statusMessage, this, [this](const QString &message, int) {
        printLine(message);
    });
    connect(pool_, &TaskPool::taskRetrying, this,
            [this](TaskId id, int attempt, int delayMs, const QString &error) {
        printLine(tr("Task %1 attempt %2 failed, retrying in %3 ms: %4")
                      .arg(id).arg(attempt).arg(delayMs).arg(error));
    });
}

CliRunner::~CliRunner() = default;

void CliRunner::setExecutor(ITransferExecutor *executor)
{
    executor_ = executor;
    pool_->setExecutor(executor);
}

void CliRunner::printLine(const QString &line)
{
    out_ << line << Qt::endl;
}

bool CliRunner::loadConfig()
{
    const QString startDir = options_.configDir.isEmpty() ? QDir::currentPath() : options_.configDir;
    return config_->loadProjectFile(startDir, &configError_);
}

int CliRunner::run()
{
    if (!commands().contains(options_.command)) {
        printLine(tr("Unknown command: %1").arg(options_.command));
        return ExitUsage;
    }

    if (options_.command == QLatin1String("config")) {
        return runConfig();
    }
    if (options_.command == QLatin1String("health")) {
        return runHealth();
    }

    if (!loadConfig()) {
        errorHandler_->handleError(ErrorCategory::Validation, ErrorSeverity::Critical,
                                   tr("Configuration error"), configError_);
        return ExitUsage;
    }

    const QStringList problems = config_->validate();
    if (!problems.isEmpty()) {
        errorHandler_->handleConfigErrors(problems);
        return ExitUsage;
    }

    if (options_.command == QLatin1String("test-connection")) {
        return runTestConnection();
    }
    if (options_.command == QLatin1String("diff")) {
        return runDiff();
    }
    if (options_.command == QLatin1String("sync")
        && (options_.watch || (config_->settings().autoSync && options_.paths.isEmpty()))) {
        return runWatch();
    }
    return runTransfers();
}

int CliRunner::runConfig()
{
    if (!loadConfig()) {
        printLine(configError_);
        return ExitUsage;
    }

    printLine(tr("Config file: %1").arg(config_->configFilePath()));
    printLine(QString::fromUtf8(QJsonDocument(config_->toJson()).toJson(QJsonDocument::Indented)).trimmed());

    const QStringList problems = config_->validate();
    if (problems.isEmpty()) {
        printLine(tr("Configuration is valid"));
        return ExitSuccess;
    }

    printLine(tr("Configuration problems:"));
    for (const QString &problem : problems) {
        printLine(QStringLiteral("  - ") + problem);
    }
    return ExitUsage;
}

int CliRunner::runHealth()
{
    const bool loaded = loadConfig();

    HealthCheck check(config_, probe_);
    const QList<HealthItem> items = check.run(loaded ? QString() : configError_);
    printLine(HealthCheck::format(items));

    return HealthCheck::hasErrors(items) ? ExitFailure : ExitSuccess;
}

bool CliRunner::runProbe(double *latencyMs)
{
    bool success = false;
    double latency = 0.0;

    QEventLoop loop;
    QMetaObject::Connection connection = connect(probe_, &ConnectionProbe::probeFinished, &loop,
        [&](bool ok, double ms) {
            success = ok;
            latency = ms;
            loop.quit();
        });

    probe_->probe();
    if (probe_->isProbing()) {
        loop.exec();
    }
    disconnect(connection);

    if (latencyMs) {
        *latencyMs = latency;
    }
    return success;
}

int CliRunner::runTestConnection()
{
    double latency = 0.0;
    if (runProbe(&latency)) {
        printLine(tr("Host %1 reachable, latency %2 ms")
                      .arg(config_->settings().host)
                      .arg(latency, 0, 'f', 1));
    } else {
        printLine(tr("Host %1 unreachable on port %2")
                      .arg(config_->settings().host)
                      .arg(config_->settings().port));
    }

    bool sshOk = false;
    QString message;

    QEventLoop loop;
    QMetaObject::Connection connection = connect(probe_, &ConnectionProbe::sshTestFinished, &loop,
        [&](bool ok, const QString &text) {
            sshOk = ok;
            message = text;
            loop.quit();
        });

    probe_->testSsh();
    if (probe_->isTestingSsh()) {
        loop.exec();
    }
    disconnect(connection);

    printLine(message);
    if (!sshOk) {
        errorHandler_->handleConnectionError(message);
        return ExitFailure;
    }
    return ExitSuccess;
}

bool CliRunner::waitForPool()
{
    if (pool_->isIdle()) {
        return true;
    }

    bool timedOut = false;
    QEventLoop loop;
    connect(pool_, &TaskPool::allTasksFinished, &loop, &QEventLoop::quit);

    QTimer deadline;
    deadline.setSingleShot(true);
    if (options_.timeoutMs > 0) {
        connect(&deadline, &QTimer::timeout, &loop, [&]() {
            timedOut = true;
            loop.quit();
        });
        deadline.start(options_.timeoutMs);
    }

    loop.exec();

    if (timedOut) {
        qWarning() << "CliRunner: timed out after" << options_.timeoutMs << "ms, cancelling";
        pool_->cancelAll();
        printLine(tr("Timed out after %1 ms").arg(options_.timeoutMs));
        return false;
    }
    return true;
}

int CliRunner::runTransfers()
{
    if (options_.probe) {
        double latency = 0.0;
        if (runProbe(&latency)) {
            qInfo() << "CliRunner: probe latency" << latency << "ms";
        } else {
            qWarning() << "CliRunner: probe failed, continuing with default parameters";
        }
    }

    const QString &command = options_.command;
    const QStringList &paths = options_.paths;
    SubmitResult result;

    auto submitEach = [&](const std::function<SubmitResult(const QString &)> &submit) {
        if (paths.isEmpty()) {
            return SubmitResult::failure(SubmitError::Validation, tr("Directory path is required"));
        }
        SubmitResult combined;
        for (const QString &path : paths) {
            const SubmitResult single = submit(path);
            if (!single.ok()) {
                pool_->cancelAll();
                return single;
            }
            combined.taskIds.append(single.taskIds);
        }
        return combined;
    };

    if (command == QLatin1String("upload")) {
        result = paths.size() == 1 ? service_->uploadFile(paths.first())
                                   : service_->syncFiles(paths, TransferDirection::Upload);
    } else if (command == QLatin1String("download")) {
        result = paths.size() == 1 ? service_->downloadFile(paths.first())
                                   : service_->syncFiles(paths, TransferDirection::Download);
    } else if (command == QLatin1String("upload-dir")) {
        result = submitEach([this](const QString &path) { return service_->uploadDirectory(path); });
    } else if (command == QLatin1String("download-dir")) {
        result = submitEach([this](const QString &path) { return service_->downloadDirectory(path); });
    } else {
        result = paths.isEmpty() ? service_->syncAll()
                                 : service_->syncFiles(paths, TransferDirection::Upload);
    }

    if (!result.ok()) {
        printLine(result.message);
        return ExitUsage;
    }
    if (result.taskIds.isEmpty()) {
        printLine(result.message);
        return ExitSuccess;
    }

    return finishTransfers(waitForPool());
}

int CliRunner::finishTransfers(bool finished)
{
    printLine(StatusReport::formatHistory(metrics_->history()));
    printLine(StatusReport::format(pool_->status()));

    if (!finished) {
        return ExitFailure;
    }
    const PoolMetrics m = metrics_->metrics();
    return (m.failed == 0 && m.cancelled == 0) ? ExitSuccess : ExitFailure;
}

bool CliRunner::isItemizedChange(const QString &line)
{
    // YXcstpoguax update flags, or a deletion notice
    static const QRegularExpression rx(QStringLiteral(R"(^([<>ch.][fdLDS]\S{9}|\*deleting)\s)"));
    return rx.match(line).hasMatch();
}

int CliRunner::runDiff()
{
    differences_.clear();
    QMetaObject::Connection connection = connect(pool_, &TaskPool::taskOutput, this,
        [this](TaskId, const QString &line, bool isError) {
            if (!isError && isItemizedChange(line)) {
                differences_.append(line);
            }
        });

    const QStringList targets = options_.paths.isEmpty() ? QStringList{QString()} : options_.paths;
    for (const QString &target : targets) {
        const SubmitResult result = service_->compare(target);
        if (!result.ok()) {
            disconnect(connection);
            pool_->cancelAll();
            printLine(result.message);
            return ExitUsage;
        }
    }

    const bool finished = waitForPool();
    disconnect(connection);

    if (differences_.isEmpty()) {
        printLine(tr("No differences found"));
    } else {
        printLine(tr("%1 differences:").arg(differences_.size()));
        for (const QString &line : differences_) {
            printLine(QStringLiteral("  ") + line);
        }
    }
    printLine(StatusReport::format(pool_->status()));

    if (!finished) {
        return ExitFailure;
    }
    const PoolMetrics m = metrics_->metrics();
    return (m.failed == 0 && m.cancelled == 0) ? ExitSuccess : ExitFailure;
}

int CliRunner::runWatch()
{
    if (!options_.paths.isEmpty()) {
        printLine(tr("--watch syncs the whole local_path and takes no paths"));
        return ExitUsage;
    }

    AutoSync autoSync(config_, service_, pool_);
    autoSync.applySettings();
    autoSync.setPeriodicSync(true);

    QEventLoop loop;
    connect(&autoSync, &AutoSync::cycleStarted, &loop,
            [&](int cycle, int taskCount, const QString &) {
        LOG_VERBOSE() << "CliRunner: cycle" << cycle << "submitted" << taskCount << "tasks";
        if (options_.watchCycles > 0 && cycle >= options_.watchCycles) {
            autoSync.setEnabled(false);
            loop.quit();
        }
    });
    connect(&autoSync, &AutoSync::cycleSkipped, this, [this](const QString &reason) {
        printLine(tr("Skipping sync: %1").arg(reason));
    });
    connect(&autoSync, &AutoSync::filesSaved, this, [this](const QStringList &paths, int) {
        printLine(tr("Uploading %1 saved files").arg(paths.size()));
    });

    // The timeout ends the watch; it is not a failure
    QTimer deadline;
    deadline.setSingleShot(true);
    if (options_.timeoutMs > 0) {
        connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);
        deadline.start(options_.timeoutMs);
    }

    printLine(tr("Syncing %1 every %2")
                  .arg(config_->localRoot(), rsyncq::formatDuration(autoSync.interval())));
    autoSync.setEnabled(true);
    loop.exec();
    autoSync.setEnabled(false);

    return finishTransfers(waitForPool());
}
