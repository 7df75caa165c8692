/**
 * @file itransferexecutor.h
 * @brief Interface for transfer executor implementations.
 *
 * This interface allows dependency injection of the process that moves
 * bytes, so the scheduler can be driven by a mock in tests.
 */

#ifndef ITRANSFEREXECUTOR_H
#define ITRANSFEREXECUTOR_H

#include <QObject>
#include <QString>
#include <QStringList>

#include "models/transfertask.h"

/**
 * @brief Fully resolved description of one executor invocation.
 */
struct TransferRequest {
    TaskKind kind = TaskKind::SingleFile;
    TransferDirection direction = TransferDirection::Upload;
    QString source;       ///< Source endpoint; for batches the directory the files are relative to
    QString destination;  ///< Destination endpoint
    QStringList files;    ///< Relative paths of a batch, empty otherwise
    bool compress = false;
    bool dryRun = false;  ///< Report itemized differences without transferring
    int timeoutMs = 30000;
};

/**
 * @brief Abstract interface for transfer executors.
 *
 * An executor starts one invocation per call to start() and reports its
 * outcome exactly once, through finished() or startFailed(). All signals
 * are delivered on the thread that owns the executor.
 *
 * @par Example usage:
 * @code
 * // Production code
 * ITransferExecutor *executor = new RsyncExecutor(config, this);
 *
 * // Test code
 * ITransferExecutor *executor = new MockTransferExecutor(this);
 *
 * pool->setExecutor(executor);
 * @endcode
 */
class ITransferExecutor : public QObject
{
    Q_OBJECT

public:
    explicit ITransferExecutor(QObject *parent = nullptr) : QObject(parent) {}
    ~ITransferExecutor() override = default;

    /**
     * @brief Starts a transfer.
     * @param request Resolved endpoints and parameters.
     * @param errorMessage Receives the reason when the invocation cannot start.
     * @return Non-zero handle on success, 0 if the invocation could not start.
     */
    virtual TransferHandle start(const TransferRequest &request, QString *errorMessage) = 0;

    /**
     * @brief Requests termination of a running invocation.
     *
     * finished() is still emitted for the handle once the process exits.
     */
    virtual void terminate(TransferHandle handle) = 0;

    [[nodiscard]] virtual bool isRunning(TransferHandle handle) const = 0;

signals:
    /// @brief A line of process output.
    void outputLine(TransferHandle handle, const QString &line, bool isError);

    /// @brief Progress parsed from the output.
    void progress(TransferHandle handle, qint64 bytes, int percent);

    /**
     * @brief The invocation exited.
     * @param exitCode Process exit code; 0 means success.
     * @param errorText Collected error output, empty on success.
     */
    void finished(TransferHandle handle, int exitCode, const QString &errorText);

    /// @brief The process could not be launched after start() returned a handle.
    void startFailed(TransferHandle handle, const QString &message);
};

#endif // ITRANSFEREXECUTOR_H
