/**
 * @file syncservice.h
 * @brief Turns user transfer requests into validated task pool submissions.
 */

#ifndef SYNCSERVICE_H
#define SYNCSERVICE_H

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

#include "filebatcher.h"
#include "models/taskpool.h"

class SyncConfig;

/**
 * @brief One execution unit produced by SyncService::plan().
 */
struct PlannedUnit {
    TaskKind kind = TaskKind::SingleFile;
    FileCategory tier = FileCategory::Small;
    QList<BatchFile> files;
    qint64 totalBytes = 0;
    int batchNumber = 0;  ///< 1-based among the plan's batches, 0 for single files
};

/**
 * @brief Ordered execution units for a multi-file request.
 */
struct SyncPlan {
    QList<PlannedUnit> units;
    int batchCount = 0;

    [[nodiscard]] bool isEmpty() const { return units.isEmpty(); }
    [[nodiscard]] int fileCount() const;
};

/**
 * @brief Front end for transfer requests.
 *
 * SyncService validates requests synchronously (missing paths, missing
 * upload subjects, size limits and configuration) and submits the resulting
 * execution units to the TaskPool. Multi-file requests are classified,
 * grouped by tier and batched: configuration and large files become
 * single-file tasks, the other tiers are split by the FileBatcher.
 *
 * @par Example usage:
 * @code
 * SyncService *service = new SyncService(config, pool, this);
 * connect(service, &SyncService::statusMessage, this, &Cli::printStatus);
 *
 * SubmitResult result = service->uploadFile("/project/src/main.cpp");
 * if (!result.ok()) {
 *     qWarning() << result.message;
 * }
 * service->syncAll();
 * @endcode
 */
class SyncService : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs a sync service.
     * @param config Configuration provider (not owned).
     * @param pool Task pool to submit to (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    SyncService(SyncConfig *config, TaskPool *pool, QObject *parent = nullptr);
    ~SyncService() override;

    /// @name Single Subjects
    /// @{

    /**
     * @brief Uploads one local file, or a directory when the path is one.
     * @param localPath Path under the configured local_path.
     * @param continuation Called once the task is terminal (optional).
     */
    SubmitResult uploadFile(const QString &localPath,
                            const TaskContinuation &continuation = TaskContinuation());

    /**
     * @brief Downloads the remote counterpart of a local path.
     * @param localPath Local destination under the configured local_path.
     */
    SubmitResult downloadFile(const QString &localPath,
                              const TaskContinuation &continuation = TaskContinuation());

    SubmitResult uploadDirectory(const QString &localDir,
                                 const TaskContinuation &continuation = TaskContinuation());
    SubmitResult downloadDirectory(const QString &localDir,
                                   const TaskContinuation &continuation = TaskContinuation());

    /**
     * @brief Compares a local file or directory with its remote counterpart.
     *
     * Runs rsync as a dry run with itemized changes; nothing is transferred.
     * The differences arrive as TaskPool::taskOutput lines.
     * @param localPath File or directory; local_path itself when empty.
     */
    SubmitResult compare(const QString &localPath = QString(),
                         const TaskContinuation &continuation = TaskContinuation());
    /// @}

    /// @name Multiple Files
    /// @{

    /**
     * @brief Classifies, batches and submits a set of files.
     *
     * Uploads skip files that do not exist or exceed max_file_size; the
     * request fails only when nothing is left. The continuation is attached
     * to every submitted task.
     */
    SubmitResult syncFiles(const QStringList &paths,
                           TransferDirection direction,
                           const TaskContinuation &continuation = TaskContinuation());

    /**
     * @brief Uploads every file under local_path that passes the filters.
     *
     * Succeeds with "No files to sync" and no tasks when nothing matches.
     */
    SubmitResult syncAll(const TaskContinuation &continuation = TaskContinuation());

    /**
     * @brief Files under local_path that pass the include/exclude filters.
     * @return Absolute paths in a stable (sorted) order.
     */
    [[nodiscard]] QStringList scanLocalFiles() const;

    /**
     * @brief Groups files into execution units, highest tier first.
     * @param files Candidate files with their sizes, in request order.
     * @param batchSize Maximum number of files per batch.
     */
    [[nodiscard]] static SyncPlan plan(const QList<BatchFile> &files, int batchSize);
    /// @}

    /// @name Pool Access
    /// @{
    bool cancel(TaskId id);
    int cancelAll();
    [[nodiscard]] PoolStatus status() const;
    /// @}

signals:
    void statusMessage(const QString &message, int timeout);

    /// @brief A request was refused before anything was submitted.
    void requestRejected(SubmitError error, const QString &message);

private:
    [[nodiscard]] SubmitResult reject(SubmitError error, const QString &message);
    [[nodiscard]] bool checkConfigured(SubmitResult *result);
    [[nodiscard]] bool isUnderLocalRoot(const QString &path) const;
    SubmitResult submitSingle(TaskKind kind, TransferDirection direction, const QString &path,
                              qint64 size, const TaskContinuation &continuation);

    SyncConfig *config_ = nullptr;
    TaskPool *pool_ = nullptr;
};

#endif // SYNCSERVICE_H
