/**
 * @file taskpool.h
 * @brief Admission and execution engine for transfer tasks.
 */

#ifndef TASKPOOL_H
#define TASKPOOL_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QQueue>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

#include "services/adaptivecontroller.h"
#include "services/itransferexecutor.h"
#include "services/metricsstore.h"
#include "services/retrypolicy.h"
#include "transfertask.h"

class QTimer;
class SyncConfig;

/**
 * @brief Snapshot of the pool returned by TaskPool::status().
 */
struct PoolStatus {
    PoolMetrics metrics;
    int pending = 0;     ///< Pending tasks, including those waiting out a retry delay
    int running = 0;
    int completed = 0;   ///< Lifetime count
    int failed = 0;      ///< Lifetime count
    int cancelled = 0;   ///< Lifetime count
    AdaptiveParams params;
    QList<TransferTask> activeTasks;  ///< Pending and running tasks in submission order
};

/**
 * @brief Outcome reported by the blocking wait calls.
 */
struct WaitResult {
    bool success = false;
    QString message;
    TaskStatus status = TaskStatus::Pending;
};

/**
 * @brief Owns all tasks and runs them through the executor.
 *
 * TaskPool is the single writer of task status and results. Pending tasks
 * wait in one FIFO per priority tier (config > small > medium > binary >
 * large). Admission runs after every submission, completion and parameter
 * change and starts tasks until the running count reaches
 * AdaptiveParams::maxConcurrency, always draining higher tiers first.
 *
 * A failed invocation is classified and handed to the RetryPolicy. A retried
 * task goes back to Pending and re-enters its tier's queue once the delay
 * has elapsed; it never bypasses the concurrency limit. Cancellation is
 * immediate on the pool's side and best-effort on the executor's.
 *
 * All state changes caused by executor signals are applied directly, while
 * admission itself is deferred through an event queue so that it never runs
 * re-entrantly from inside a signal handler.
 *
 * @par Example usage:
 * @code
 * TaskPool *pool = new TaskPool(config, controller, metrics, this);
 * pool->setExecutor(new RsyncExecutor(config, pool));
 *
 * SubmitOptions options;
 * options.continuation = [](const TransferTask &task) {
 *     qInfo() << task.displayName() << taskStatusToString(task.status);
 * };
 * SubmitResult result = pool->submit(TaskKind::SingleFile, TransferDirection::Upload,
 *                                    {"/project/src/main.cpp"}, options);
 * @endcode
 */
class TaskPool : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultInterBatchDelayMs = 100;
    static constexpr int DefaultWaitTimeoutMs = 300000;
    static constexpr int DefaultWaitPollMs = 100;
    static constexpr int OutputTailLines = 20;
    static constexpr int DefaultFinishedTaskLimit = 1000;

    /**
     * @brief Constructs a pool.
     * @param config Configuration provider (not owned).
     * @param controller Source of AdaptiveParams, fed with transfer outcomes (not owned).
     * @param metrics Store receiving a record for every terminal task (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    TaskPool(SyncConfig *config,
             AdaptiveController *controller,
             MetricsStore *metrics,
             QObject *parent = nullptr);
    ~TaskPool() override;

    /// @name Collaborators
    /// @{
    void setExecutor(ITransferExecutor *executor);
    [[nodiscard]] ITransferExecutor *executor() const { return executor_; }

    void setRetryPolicy(const RetryPolicy &policy) { retryPolicy_ = policy; }
    [[nodiscard]] const RetryPolicy &retryPolicy() const { return retryPolicy_; }

    [[nodiscard]] SyncConfig *config() const { return config_; }
    [[nodiscard]] AdaptiveController *adaptiveController() const { return controller_; }
    [[nodiscard]] MetricsStore *metricsStore() const { return metrics_; }
    /// @}

    /// @name Timing
    /// @{

    /// @brief Pause in admissions after a batch invocation ends.
    void setInterBatchDelay(int ms);
    [[nodiscard]] int interBatchDelay() const { return interBatchDelayMs_; }

    /**
     * @brief Number of terminal tasks kept for task() and waitForTask().
     *
     * Older terminal tasks are dropped, oldest first, once their
     * continuation has run. Their records stay in the MetricsStore.
     */
    void setFinishedTaskLimit(int limit);
    [[nodiscard]] int finishedTaskLimit() const { return finishedTaskLimit_; }

    /// @brief Interval at which waitForTask() re-checks the task.
    void setWaitPollInterval(int ms);
    [[nodiscard]] int waitPollInterval() const { return waitPollMs_; }
    /// @}

    /// @name Submission
    /// @{

    /**
     * @brief Enqueues a task and returns without waiting for it.
     *
     * Single-file and directory tasks take exactly one path; a batch takes
     * one or more. The remote path defaults to the config mapping of the
     * first path and the tier to its classification.
     *
     * @return The new task id, or a Validation/NotConfigured error.
     */
    SubmitResult submit(TaskKind kind,
                        TransferDirection direction,
                        const QStringList &paths,
                        const SubmitOptions &options = SubmitOptions());

    /**
     * @brief Cancels a pending or running task.
     * @return True if the task moved to Cancelled; false if unknown or already terminal.
     */
    bool cancel(TaskId id);

    /// @brief Cancels every non-terminal task. Returns how many were cancelled.
    int cancelAll();

    /**
     * @brief Blocks, running a local event loop, until the task is terminal.
     *
     * The task is polled every waitPollInterval() ms. When @p timeoutMs
     * elapses first the task is cancelled and the result carries the
     * message "timeout".
     */
    WaitResult waitForTask(TaskId id, int timeoutMs = DefaultWaitTimeoutMs);

    /// @brief submit() followed by waitForTask().
    WaitResult submitAndWait(TaskKind kind,
                             TransferDirection direction,
                             const QStringList &paths,
                             const SubmitOptions &options = SubmitOptions(),
                             int timeoutMs = DefaultWaitTimeoutMs);
    /// @}

    /// @name Inspection
    /// @{
    [[nodiscard]] std::optional<TransferTask> task(TaskId id) const;
    [[nodiscard]] bool contains(TaskId id) const { return tasks_.contains(id); }
    [[nodiscard]] int runningCount() const { return running_.size(); }
    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] int activeCount() const { return activeCount_; }
    [[nodiscard]] bool isIdle() const { return activeCount_ == 0; }
    [[nodiscard]] PoolStatus status() const;

    /// @brief Removes terminal tasks from the pool. Returns how many were removed.
    int clearFinished();
    /// @}

    /// For testing: immediately process all pending events
    void flushEventQueue();

signals:
    void taskSubmitted(TaskId id);
    void taskStarted(TaskId id);
    void taskProgress(TaskId id, qint64 bytes, int percent);
    void taskOutput(TaskId id, const QString &line, bool isError);
    void taskRetrying(TaskId id, int attempt, int delayMs, const QString &error);
    void taskCompleted(TaskId id);
    void taskFailed(TaskId id, const QString &message);
    void taskCancelled(TaskId id);
    void statusChanged();
    void allTasksFinished();

private slots:
    void onExecutorFinished(TransferHandle handle, int exitCode, const QString &errorText);
    void onExecutorStartFailed(TransferHandle handle, const QString &message);
    void onExecutorProgress(TransferHandle handle, qint64 bytes, int percent);
    void onExecutorOutput(TransferHandle handle, const QString &line, bool isError);
    void onConfigChanged();

private:
    void scheduleAdmission();  // Defers admit() to prevent re-entrancy
    void processEventQueue();
    void admit();
    [[nodiscard]] TaskId takeNextPending();
    void dispatch(TaskId id);
    [[nodiscard]] TransferRequest buildRequest(const TransferTask &task) const;
    [[nodiscard]] QString remoteEndpoint(const QString &remotePath) const;

    void handleFailure(TaskId id, int exitCode, const QString &errorText);
    void onRetryDelayElapsed(TaskId id);
    void finishTask(TaskId id, TaskStatus status, const TaskResult &result);
    void startInterBatchPause();
    void pruneFinished();

    [[nodiscard]] FileCategory defaultTier(TaskKind kind, const QStringList &paths, qint64 totalBytes) const;

    SyncConfig *config_ = nullptr;
    QPointer<AdaptiveController> controller_;
    QPointer<MetricsStore> metrics_;
    QPointer<ITransferExecutor> executor_;
    RetryPolicy retryPolicy_;

    QHash<TaskId, TransferTask> tasks_;
    QList<TaskId> pending_[FileCategoryCount];
    QHash<TransferHandle, TaskId> running_;
    QHash<TaskId, QStringList> outputTails_;
    QQueue<TaskId> finished_;  // Terminal tasks still held, oldest first
    int finishedTaskLimit_ = DefaultFinishedTaskLimit;
    TaskId nextId_ = 1;
    quint64 nextSequence_ = 1;
    int activeCount_ = 0;

    int interBatchDelayMs_ = DefaultInterBatchDelayMs;
    int waitPollMs_ = DefaultWaitPollMs;
    QTimer *interBatchTimer_ = nullptr;

    // Deferred event processing (prevents re-entrancy from signal handlers)
    QQueue<std::function<void()>> eventQueue_;
    bool eventProcessingScheduled_ = false;
    bool processingEvents_ = false;
};

Q_DECLARE_METATYPE(PoolStatus)

#endif // TASKPOOL_H
