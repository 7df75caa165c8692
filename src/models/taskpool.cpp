#include "taskpool.h"
#include "services/syncconfig.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QFileInfo>
#include <QTimer>
#include <algorithm>

TaskPool::TaskPool(SyncConfig *config,
                   AdaptiveController *controller,
                   MetricsStore *metrics,
                   QObject *parent)
    : QObject(parent)
    , config_(config)
    , controller_(controller)
    , metrics_(metrics)
    , interBatchTimer_(new QTimer(this))
{
    interBatchTimer_->setSingleShot(true);
    connect(interBatchTimer_, &QTimer::timeout, this, &TaskPool::scheduleAdmission);

    if (controller_) {
        connect(controller_, &AdaptiveController::paramsChanged,
                this, &TaskPool::scheduleAdmission);
    }
    if (config_) {
        connect(config_, &SyncConfig::changed, this, &TaskPool::onConfigChanged);
    }
    onConfigChanged();
}

TaskPool::~TaskPool()
{
    // Disconnect from the executor BEFORE members are destroyed so that a
    // late finished() cannot reach a half-destroyed pool.
    if (executor_) {
        disconnect(executor_, nullptr, this, nullptr);
    }
}

void TaskPool::setExecutor(ITransferExecutor *executor)
{
    if (executor_ == executor) {
        return;
    }
    if (executor_) {
        disconnect(executor_, nullptr, this, nullptr);
    }

    executor_ = executor;

    if (executor_) {
        connect(executor_, &ITransferExecutor::finished,
                this, &TaskPool::onExecutorFinished);
        connect(executor_, &ITransferExecutor::startFailed,
                this, &TaskPool::onExecutorStartFailed);
        connect(executor_, &ITransferExecutor::progress,
                this, &TaskPool::onExecutorProgress);
        connect(executor_, &ITransferExecutor::outputLine,
                this, &TaskPool::onExecutorOutput);
        scheduleAdmission();
    }
}

void TaskPool::setInterBatchDelay(int ms)
{
    interBatchDelayMs_ = std::max(ms, 0);
}

void TaskPool::setFinishedTaskLimit(int limit)
{
    finishedTaskLimit_ = std::max(limit, 1);
    pruneFinished();
}

void TaskPool::setWaitPollInterval(int ms)
{
    waitPollMs_ = std::max(ms, 1);
}

void TaskPool::onConfigChanged()
{
    if (!controller_ || !config_) {
        return;
    }
    const SyncSettings &s = config_->settings();
    AdaptiveBaseline baseline;
    baseline.concurrencyCeiling = s.maxConnections;
    baseline.batchSize = s.batchSize;
    baseline.timeoutMs = s.connectionTimeoutMs;
    controller_->setBaseline(baseline);
}

// ---------------------------------------------------------------------------
// Deferred event processing
// ---------------------------------------------------------------------------

void TaskPool::scheduleAdmission()
{
    eventQueue_.enqueue([this]() { admit(); });

    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &TaskPool::processEventQueue);
    }
}

void TaskPool::processEventQueue()
{
    eventProcessingScheduled_ = false;

    // Re-entrancy guard: if we're already processing, let the outer call finish
    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &TaskPool::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void TaskPool::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

// ---------------------------------------------------------------------------
// Submission
// ---------------------------------------------------------------------------

FileCategory TaskPool::defaultTier(TaskKind kind, const QStringList &paths, qint64 totalBytes) const
{
    if (kind == TaskKind::Directory) {
        return FileCategory::Large;
    }

    const QString &first = paths.first();
    qint64 size = totalBytes;
    if (kind == TaskKind::Batch || size <= 0) {
        const QFileInfo info(first);
        size = info.isFile() ? info.size() : 0;
    }
    return FileClassifier::classify(first, size).category;
}

SubmitResult TaskPool::submit(TaskKind kind,
                              TransferDirection direction,
                              const QStringList &paths,
                              const SubmitOptions &options)
{
    if (paths.isEmpty()) {
        return SubmitResult::failure(SubmitError::Validation, tr("No paths given"));
    }
    if (kind != TaskKind::Batch && paths.size() != 1) {
        return SubmitResult::failure(SubmitError::Validation,
                                     tr("A %1 task takes exactly one path")
                                         .arg(QString::fromLatin1(taskKindToString(kind))));
    }
    for (const QString &path : paths) {
        if (path.trimmed().isEmpty()) {
            return SubmitResult::failure(SubmitError::Validation, tr("Empty path in request"));
        }
    }
    if (!executor_) {
        return SubmitResult::failure(SubmitError::NotConfigured, tr("No transfer executor configured"));
    }

    TransferTask task;
    task.id = nextId_++;
    task.kind = kind;
    task.direction = direction;
    task.paths = paths;
    task.sourceRoot = options.sourceRoot;
    if (task.sourceRoot.isEmpty() && config_) {
        task.sourceRoot = config_->localRoot();
    }
    task.remotePath = options.remotePath;
    if (task.remotePath.isEmpty() && config_) {
        task.remotePath = kind == TaskKind::Batch
            ? config_->settings().remotePath
            : config_->remotePathFor(paths.first());
    }
    task.tier = options.tier ? *options.tier : defaultTier(kind, paths, options.totalBytes);
    task.totalBytes = options.totalBytes;
    task.batchNumber = options.batchNumber;
    task.batchCount = options.batchCount;
    task.dryRun = options.dryRun;
    task.continuation = options.continuation;
    task.createdAt = QDateTime::currentDateTime();
    task.sequence = nextSequence_++;

    const TaskId id = task.id;
    const int tier = static_cast<int>(task.tier);
    tasks_.insert(id, task);
    pending_[tier].append(id);
    ++activeCount_;

    LOG_VERBOSE() << "TaskPool: queued" << id << taskKindToString(kind)
                  << directionToString(direction) << task.displayName()
                  << "tier" << fileCategoryToString(task.tier);

    emit taskSubmitted(id);
    emit statusChanged();
    scheduleAdmission();

    SubmitResult result;
    result.taskIds.append(id);
    return result;
}

// ---------------------------------------------------------------------------
// Admission and dispatch
// ---------------------------------------------------------------------------

TaskId TaskPool::takeNextPending()
{
    for (QList<TaskId> &queue : pending_) {
        while (!queue.isEmpty()) {
            const TaskId id = queue.takeFirst();
            auto it = tasks_.constFind(id);
            if (it != tasks_.constEnd() && it->status == TaskStatus::Pending && !it->awaitingRetry) {
                return id;
            }
        }
    }
    return 0;
}

void TaskPool::admit()
{
    if (!executor_) {
        return;
    }
    if (interBatchTimer_->isActive()) {
        // Resumed by the timer
        return;
    }

    const int limit = controller_ ? controller_->params().maxConcurrency
                                  : AdaptiveController::DefaultConcurrency;

    while (running_.size() < limit) {
        const TaskId id = takeNextPending();
        if (id == 0) {
            break;
        }
        dispatch(id);
    }
}

QString TaskPool::remoteEndpoint(const QString &remotePath) const
{
    return config_ ? config_->remoteDestination(remotePath) : remotePath;
}

TransferRequest TaskPool::buildRequest(const TransferTask &task) const
{
    const AdaptiveParams params = controller_ ? controller_->params() : AdaptiveParams();

    TransferRequest request;
    request.kind = task.kind;
    request.direction = task.direction;
    request.compress = params.compressionEnabled;
    request.dryRun = task.dryRun;
    request.timeoutMs = params.timeoutMs;

    const bool upload = task.direction == TransferDirection::Upload;

    if (task.kind == TaskKind::Batch) {
        const QDir root(task.sourceRoot);
        for (const QString &path : task.paths) {
            request.files.append(QFileInfo(path).isAbsolute() ? root.relativeFilePath(path) : path);
        }
        request.source = upload ? task.sourceRoot : remoteEndpoint(task.remotePath);
        request.destination = upload ? remoteEndpoint(task.remotePath) : task.sourceRoot;
    } else {
        const QString &local = task.paths.first();
        request.source = upload ? local : remoteEndpoint(task.remotePath);
        request.destination = upload ? remoteEndpoint(task.remotePath) : local;
    }
    return request;
}

void TaskPool::dispatch(TaskId id)
{
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return;
    }

    it->status = TaskStatus::Running;
    it->attempts += 1;
    it->startedAt = QDateTime::currentDateTime();
    it->bytesTransferred = 0;
    outputTails_.remove(id);

    const TransferRequest request = buildRequest(*it);
    const int attempt = it->attempts;

    QString error;
    const TransferHandle handle = executor_->start(request, &error);

    if (handle == 0) {
        // No attempt was made, so the retry policy does not apply
        qWarning() << "TaskPool: could not start task" << id << ":" << error;
        TaskResult result;
        result.success = false;
        result.message = tr("Failed to start transfer: %1").arg(error);
        finishTask(id, TaskStatus::Failed, result);
        return;
    }

    it = tasks_.find(id);
    if (it == tasks_.end()) {
        return;
    }
    it->handle = handle;
    running_.insert(handle, id);

    LOG_VERBOSE() << "TaskPool: started" << id << "attempt" << attempt
                  << "running" << running_.size();
    emit taskStarted(id);
    emit statusChanged();
}

// ---------------------------------------------------------------------------
// Executor signals
// ---------------------------------------------------------------------------

void TaskPool::onExecutorProgress(TransferHandle handle, qint64 bytes, int percent)
{
    const TaskId id = running_.value(handle, 0);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return;
    }
    it->bytesTransferred = std::max(it->bytesTransferred, bytes);
    emit taskProgress(id, bytes, percent);
}

void TaskPool::onExecutorOutput(TransferHandle handle, const QString &line, bool isError)
{
    const TaskId id = running_.value(handle, 0);
    if (id == 0) {
        return;
    }

    QStringList &tail = outputTails_[id];
    tail.append(line);
    while (tail.size() > OutputTailLines) {
        tail.removeFirst();
    }

    LOG_VERBOSE() << "TaskPool:" << id << (isError ? "stderr:" : "stdout:") << line;
    emit taskOutput(id, line, isError);
}

void TaskPool::onExecutorStartFailed(TransferHandle handle, const QString &message)
{
    const TaskId id = running_.take(handle);
    if (id == 0) {
        return;
    }

    qWarning() << "TaskPool: task" << id << "failed to start:" << message;
    TaskResult result;
    result.success = false;
    result.message = tr("Failed to start transfer: %1").arg(message);
    finishTask(id, TaskStatus::Failed, result);
}

void TaskPool::onExecutorFinished(TransferHandle handle, int exitCode, const QString &errorText)
{
    const TaskId id = running_.take(handle);
    auto it = tasks_.find(id);
    if (id == 0 || it == tasks_.end()) {
        // Cancelled while running; the task is already terminal
        return;
    }

    it->handle = 0;
    const bool isBatch = it->kind == TaskKind::Batch;
    const qint64 durationMs = it->startedAt.msecsTo(QDateTime::currentDateTime());

    if (isBatch && interBatchDelayMs_ > 0) {
        startInterBatchPause();
    }

    if (exitCode != 0) {
        handleFailure(id, exitCode, errorText);
        return;
    }

    // A dry run moves no file data, so it says nothing about throughput
    const qint64 bytes = it->dryRun ? 0 : std::max(it->totalBytes, it->bytesTransferred);
    it->bytesTransferred = bytes;
    if (controller_ && !it->dryRun) {
        controller_->recordTransfer(bytes, durationMs, true, ErrorClass::Other);
    }

    it = tasks_.find(id);
    TaskResult result;
    result.success = true;
    result.exitCode = 0;
    if (isBatch) {
        result.message = it->batchNumber > 0
            ? tr("Batch %1 completed (%2 files)").arg(it->batchNumber).arg(it->fileCount())
            : tr("Batch completed (%1 files)").arg(it->fileCount());
    } else if (it->dryRun) {
        result.message = tr("Comparison completed");
    } else {
        result.message = tr("Transfer completed");
    }
    finishTask(id, TaskStatus::Completed, result);
}

void TaskPool::handleFailure(TaskId id, int exitCode, const QString &errorText)
{
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return;
    }

    const ErrorClass errorClass = RetryPolicy::classify(exitCode, errorText);
    const qint64 durationMs = it->startedAt.msecsTo(QDateTime::currentDateTime());
    const QString error = errorText.trimmed().isEmpty()
        ? tr("exit code %1").arg(exitCode)
        : errorText.trimmed();

    if (controller_) {
        controller_->recordTransfer(0, durationMs, false, errorClass);
    }

    it = tasks_.find(id);
    const RetryDecision decision = retryPolicy_.decide(errorClass, it->attempts);

    if (decision.retry) {
        it->status = TaskStatus::Pending;
        it->awaitingRetry = true;
        const int attempt = it->attempts;

        qInfo() << "TaskPool: task" << id << "failed (" << errorClassToString(errorClass)
                << ") on attempt" << attempt << ", retrying in" << decision.delayMs << "ms";

        QTimer::singleShot(decision.delayMs, this, [this, id]() { onRetryDelayElapsed(id); });
        emit taskRetrying(id, attempt, decision.delayMs, error);
        emit statusChanged();
        scheduleAdmission();
        return;
    }

    QString message = decision.reason + QStringLiteral(": ") + error;
    if (it->kind == TaskKind::Batch) {
        message = it->batchNumber > 0
            ? tr("Batch %1 failed (%2 files): %3").arg(it->batchNumber).arg(it->fileCount()).arg(message)
            : tr("Batch failed (%1 files): %2").arg(it->fileCount()).arg(message);
    }

    TaskResult result;
    result.success = false;
    result.message = message;
    result.errorClass = errorClass;
    result.exitCode = exitCode;
    finishTask(id, TaskStatus::Failed, result);
}

void TaskPool::onRetryDelayElapsed(TaskId id)
{
    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->status != TaskStatus::Pending || !it->awaitingRetry) {
        // Cancelled or removed during the delay
        return;
    }

    it->awaitingRetry = false;
    pending_[static_cast<int>(it->tier)].append(id);
    LOG_VERBOSE() << "TaskPool: task" << id << "re-queued for attempt" << it->attempts + 1;
    scheduleAdmission();
}

void TaskPool::startInterBatchPause()
{
    interBatchTimer_->start(interBatchDelayMs_);
}

// ---------------------------------------------------------------------------
// Terminal transitions
// ---------------------------------------------------------------------------

void TaskPool::finishTask(TaskId id, TaskStatus status, const TaskResult &result)
{
    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->isTerminal()) {
        return;
    }

    it->status = status;
    it->handle = 0;
    it->awaitingRetry = false;
    it->result = result;
    it->result->outputTail = outputTails_.take(id);
    --activeCount_;

    // Copy before notifying: a continuation may submit new tasks
    const TransferTask snapshot = *it;

    if (metrics_) {
        TransferRecord record;
        record.taskId = id;
        record.path = snapshot.displayName();
        record.kind = snapshot.kind;
        record.fileCount = snapshot.fileCount();
        record.direction = snapshot.direction;
        record.startedAt = snapshot.startedAt.isValid() ? snapshot.startedAt : snapshot.createdAt;
        record.finishedAt = QDateTime::currentDateTime();
        record.status = status;
        record.bytesTransferred = status == TaskStatus::Completed ? snapshot.bytesTransferred : 0;
        record.message = result.message;
        metrics_->append(record);
    }

    switch (status) {
    case TaskStatus::Completed:
        qInfo() << "TaskPool: completed" << id << snapshot.displayName();
        emit taskCompleted(id);
        break;
    case TaskStatus::Failed:
        qWarning() << "TaskPool: failed" << id << snapshot.displayName() << "-" << result.message;
        emit taskFailed(id, result.message);
        break;
    case TaskStatus::Cancelled:
        qInfo() << "TaskPool: cancelled" << id << snapshot.displayName();
        emit taskCancelled(id);
        break;
    case TaskStatus::Pending:
    case TaskStatus::Running:
        break;
    }

    if (snapshot.continuation) {
        snapshot.continuation(snapshot);
    }

    finished_.enqueue(id);
    pruneFinished();

    emit statusChanged();
    scheduleAdmission();

    if (activeCount_ == 0) {
        emit allTasksFinished();
    }
}

bool TaskPool::cancel(TaskId id)
{
    auto it = tasks_.find(id);
    if (it == tasks_.end() || it->isTerminal()) {
        return false;
    }

    if (it->status == TaskStatus::Running) {
        const TransferHandle handle = it->handle;
        running_.remove(handle);
        if (executor_ && handle != 0) {
            executor_->terminate(handle);
        }
    } else {
        pending_[static_cast<int>(it->tier)].removeAll(id);
    }

    TaskResult result;
    result.success = false;
    result.message = tr("Task cancelled");
    finishTask(id, TaskStatus::Cancelled, result);
    return true;
}

int TaskPool::cancelAll()
{
    QList<TaskId> ids;
    for (auto it = tasks_.cbegin(); it != tasks_.cend(); ++it) {
        if (!it->isTerminal()) {
            ids.append(it.key());
        }
    }
    std::sort(ids.begin(), ids.end());

    int cancelled = 0;
    for (TaskId id : ids) {
        if (cancel(id)) {
            ++cancelled;
        }
    }
    return cancelled;
}

// ---------------------------------------------------------------------------
// Synchronous wait
// ---------------------------------------------------------------------------

WaitResult TaskPool::waitForTask(TaskId id, int timeoutMs)
{
    QElapsedTimer elapsed;
    elapsed.start();

    while (true) {
        auto it = tasks_.constFind(id);
        if (it == tasks_.constEnd()) {
            WaitResult missing;
            missing.message = tr("Task not found: %1").arg(id);
            return missing;
        }

        if (it->isTerminal()) {
            WaitResult done;
            done.success = it->status == TaskStatus::Completed;
            done.status = it->status;
            done.message = it->result ? it->result->message : QString();
            return done;
        }

        const qint64 remaining = timeoutMs - elapsed.elapsed();
        if (remaining <= 0) {
            qWarning() << "TaskPool: wait for task" << id << "timed out after" << timeoutMs << "ms";
            cancel(id);
            WaitResult timedOut;
            timedOut.message = tr("timeout");
            timedOut.status = TaskStatus::Cancelled;
            return timedOut;
        }

        QEventLoop loop;
        QTimer::singleShot(static_cast<int>(std::min<qint64>(waitPollMs_, remaining)),
                           &loop, &QEventLoop::quit);
        loop.exec();
    }
}

WaitResult TaskPool::submitAndWait(TaskKind kind,
                                   TransferDirection direction,
                                   const QStringList &paths,
                                   const SubmitOptions &options,
                                   int timeoutMs)
{
    const SubmitResult submitted = submit(kind, direction, paths, options);
    if (!submitted.ok()) {
        WaitResult rejected;
        rejected.message = submitted.message;
        rejected.status = TaskStatus::Failed;
        return rejected;
    }
    return waitForTask(submitted.taskId(), timeoutMs);
}

// ---------------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------------

std::optional<TransferTask> TaskPool::task(TaskId id) const
{
    auto it = tasks_.constFind(id);
    if (it == tasks_.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

int TaskPool::pendingCount() const
{
    return activeCount_ - running_.size();
}

PoolStatus TaskPool::status() const
{
    PoolStatus s;
    if (metrics_) {
        s.metrics = metrics_->metrics();
        s.completed = s.metrics.completed;
        s.failed = s.metrics.failed;
        s.cancelled = s.metrics.cancelled;
    }
    s.params = controller_ ? controller_->params() : AdaptiveParams();
    s.running = running_.size();
    s.pending = pendingCount();

    for (auto it = tasks_.cbegin(); it != tasks_.cend(); ++it) {
        if (!it->isTerminal()) {
            s.activeTasks.append(*it);
        }
    }
    std::sort(s.activeTasks.begin(), s.activeTasks.end(),
              [](const TransferTask &a, const TransferTask &b) { return a.sequence < b.sequence; });
    return s;
}

void TaskPool::pruneFinished()
{
    while (finished_.size() > finishedTaskLimit_) {
        const TaskId oldest = finished_.dequeue();
        tasks_.remove(oldest);
    }
}

int TaskPool::clearFinished()
{
    finished_.clear();
    int removed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->isTerminal()) {
            it = tasks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}
