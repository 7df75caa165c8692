/**
 * @file rsyncexecutor.h
 * @brief Transfer executor that runs rsync over ssh through QProcess.
 */

#ifndef RSYNCEXECUTOR_H
#define RSYNCEXECUTOR_H

#include <QByteArray>
#include <QHash>
#include <QProcess>
#include <QString>
#include <QStringList>

#include "itransferexecutor.h"

class QTemporaryFile;
class SyncConfig;

/**
 * @brief Runs one rsync process per transfer request.
 *
 * Arguments come from the current SyncConfig at start time: the configured
 * rsync flags, "-z" when the request asks for compression, the ssh command
 * line passed with "-e", and "--timeout". Dry runs add "--dry-run
 * --itemize-changes" so the output lists what would change. Batches write their relative file
 * list to a temporary file passed with "--files-from" and "--relative".
 *
 * terminate() sends SIGTERM and kills the process if it is still alive
 * after KillGraceMs.
 */
class RsyncExecutor : public ITransferExecutor
{
    Q_OBJECT

public:
    static constexpr int KillGraceMs = 3000;

    /**
     * @brief Progress fields parsed from one rsync --progress line.
     */
    struct ProgressInfo {
        bool valid = false;
        qint64 bytes = 0;
        int percent = 0;
    };

    /**
     * @brief Constructs an executor.
     * @param config Configuration read at each start (not owned).
     * @param parent Optional parent QObject for memory management.
     */
    explicit RsyncExecutor(SyncConfig *config, QObject *parent = nullptr);
    ~RsyncExecutor() override;

    TransferHandle start(const TransferRequest &request, QString *errorMessage) override;
    void terminate(TransferHandle handle) override;
    [[nodiscard]] bool isRunning(TransferHandle handle) const override;

    [[nodiscard]] int runningCount() const { return invocations_.size(); }

    /**
     * @brief Builds the rsync argument list for a request.
     * @param request Resolved request.
     * @param config Source of rsync and ssh options.
     * @param fileListPath Path of the --files-from list for batch requests.
     */
    [[nodiscard]] static QStringList buildArguments(const TransferRequest &request,
                                                    const SyncConfig &config,
                                                    const QString &fileListPath = QString());

    /**
     * @brief Parses a line such as "  32,768 100%  31.25MB/s  0:00:00 (xfr#1, to-chk=0/1)".
     */
    [[nodiscard]] static ProgressInfo parseProgressLine(const QString &line);

private slots:
    void onReadyReadStandardOutput();
    void onReadyReadStandardError();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessError(QProcess::ProcessError error);

private:
    struct Invocation {
        TransferHandle handle = 0;
        QProcess *process = nullptr;
        QTemporaryFile *fileList = nullptr;  // Owned by process
        QByteArray stdoutBuffer;
        QByteArray stderrBuffer;
        QStringList errorLines;
    };

    [[nodiscard]] Invocation *invocationFor(QObject *sender);
    [[nodiscard]] QTemporaryFile *writeFileList(const QStringList &files, QString *errorMessage);
    void emitLines(Invocation &invocation, QByteArray &buffer, bool isError, bool flush);
    void release(TransferHandle handle);

    SyncConfig *config_ = nullptr;
    QHash<TransferHandle, Invocation> invocations_;
    TransferHandle nextHandle_ = 1;
};

#endif // RSYNCEXECUTOR_H
