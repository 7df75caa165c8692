/**
 * @file transfertask.h
 * @brief Data model of scheduled transfer work.
 */

#ifndef TRANSFERTASK_H
#define TRANSFERTASK_H

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

#include "services/fileclassifier.h"
#include "services/retrypolicy.h"

using TaskId = quint64;
using TransferHandle = quint64;

enum class TaskKind { SingleFile, Directory, Batch };

enum class TransferDirection { Upload, Download };

/**
 * @brief Lifecycle of a task.
 *
 * Pending -> Running -> {Completed | Failed}; Pending and Running may move to
 * Cancelled on request. A failed attempt that is retried goes back to
 * Pending. Completed, Failed and Cancelled are terminal.
 */
enum class TaskStatus { Pending, Running, Completed, Failed, Cancelled };

[[nodiscard]] inline const char* taskKindToString(TaskKind kind) {
    switch (kind) {
        case TaskKind::SingleFile: return "file";
        case TaskKind::Directory: return "directory";
        case TaskKind::Batch: return "batch";
    }
    return "unknown";
}

[[nodiscard]] inline const char* directionToString(TransferDirection direction) {
    switch (direction) {
        case TransferDirection::Upload: return "upload";
        case TransferDirection::Download: return "download";
    }
    return "unknown";
}

[[nodiscard]] inline const char* taskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] inline bool isTerminalStatus(TaskStatus status) {
    return status == TaskStatus::Completed
        || status == TaskStatus::Failed
        || status == TaskStatus::Cancelled;
}

/**
 * @brief Outcome of a task, set once it reaches a terminal state.
 */
struct TaskResult {
    bool success = false;
    QString message;
    ErrorClass errorClass = ErrorClass::Other;
    int exitCode = -1;
    QStringList outputTail;  ///< Last lines the executor reported, if any
};

struct TransferTask;

/// Completion notification invoked once when a task becomes terminal.
using TaskContinuation = std::function<void(const TransferTask &task)>;

/**
 * @brief Options accompanying a submission.
 */
struct SubmitOptions {
    QString remotePath;   ///< Remote counterpart; derived from config when empty
    QString sourceRoot;   ///< Root that batch paths are relative to; config local_path when empty
    std::optional<FileCategory> tier;  ///< Priority tier; classified from the subject when unset
    qint64 totalBytes = 0;
    int batchNumber = 0;  ///< 1-based position within a multi-batch request
    int batchCount = 0;
    bool dryRun = false;  ///< Compare with the other side instead of transferring
    TaskContinuation continuation;
};

/**
 * @brief One schedulable unit of transfer work.
 *
 * The subject paths are fixed at creation. While the status is Running the
 * task holds exactly one executor handle; otherwise handle is 0.
 */
struct TransferTask {
    TaskId id = 0;
    TaskKind kind = TaskKind::SingleFile;
    TransferDirection direction = TransferDirection::Upload;
    QStringList paths;
    QString remotePath;
    QString sourceRoot;
    FileCategory tier = FileCategory::Small;
    qint64 totalBytes = 0;
    int batchNumber = 0;
    int batchCount = 0;
    bool dryRun = false;

    TaskStatus status = TaskStatus::Pending;
    std::optional<TaskResult> result;
    QDateTime createdAt;
    QDateTime startedAt;
    quint64 sequence = 0;  ///< Submission order, FIFO tie-break within a tier
    int attempts = 0;
    TransferHandle handle = 0;
    bool awaitingRetry = false;
    qint64 bytesTransferred = 0;
    TaskContinuation continuation;

    [[nodiscard]] bool isTerminal() const { return isTerminalStatus(status); }
    [[nodiscard]] int fileCount() const { return paths.size(); }

    /// First subject path; for batches a "N files" description.
    [[nodiscard]] QString displayName() const
    {
        if (kind == TaskKind::Batch) {
            return QStringLiteral("batch of %1 files").arg(paths.size());
        }
        return paths.isEmpty() ? QString() : paths.first();
    }
};

/**
 * @brief Synchronous submission error categories.
 */
enum class SubmitError {
    None,
    Validation,     ///< Missing or malformed subject
    NotFound,       ///< Upload subject does not exist
    SizeExceeded,   ///< Subject exceeds the configured maximum size
    NotConfigured   ///< Required configuration is missing
};

[[nodiscard]] inline const char* submitErrorToString(SubmitError error) {
    switch (error) {
        case SubmitError::None: return "none";
        case SubmitError::Validation: return "validation";
        case SubmitError::NotFound: return "not-found";
        case SubmitError::SizeExceeded: return "size-exceeded";
        case SubmitError::NotConfigured: return "not-configured";
    }
    return "unknown";
}

/**
 * @brief Return value of submission entry points.
 */
struct SubmitResult {
    SubmitError error = SubmitError::None;
    QString message;
    QList<TaskId> taskIds;

    [[nodiscard]] bool ok() const { return error == SubmitError::None; }
    [[nodiscard]] TaskId taskId() const { return taskIds.isEmpty() ? 0 : taskIds.first(); }

    static SubmitResult failure(SubmitError error, const QString &message)
    {
        SubmitResult result;
        result.error = error;
        result.message = message;
        return result;
    }
};

Q_DECLARE_METATYPE(TransferTask)

#endif // TRANSFERTASK_H
