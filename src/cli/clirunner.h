/**
 * @file clirunner.h
 * @brief Wires the services together and executes one command-line command.
 */

#ifndef CLIRUNNER_H
#define CLIRUNNER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QTextStream>

class AdaptiveController;
class AutoSync;
class ConnectionProbe;
class ErrorHandler;
class ITransferExecutor;
class MetricsStore;
class SyncConfig;
class SyncService;
class TaskPool;

/**
 * @brief Parsed command-line request.
 */
struct CliOptions {
    QString command;
    QStringList paths;
    QString configDir;   ///< Start directory of the project file search; current dir when empty
    int timeoutMs = 0;   ///< Bound on waiting for the submitted tasks; 0 waits indefinitely
    bool probe = false;  ///< Seed network stats with a latency probe first
    bool watch = false;  ///< sync: keep syncing every sync_interval instead of once
    int watchCycles = 0; ///< Stop watching after this many cycles; 0 watches until the timeout
};

/**
 * @brief Runs a single command against a freshly wired service graph.
 *
 * Exit codes: ExitSuccess when every submitted task completed, ExitFailure
 * when a task failed, was cancelled or the wait timed out, ExitUsage for
 * rejected requests and configuration errors. "health" exits with
 * ExitFailure when any check reports an error; "diff" exits with
 * ExitSuccess whether or not differences were found.
 */
class CliRunner : public QObject
{
    Q_OBJECT

public:
    static constexpr int ExitSuccess = 0;
    static constexpr int ExitFailure = 1;
    static constexpr int ExitUsage = 2;

    /// @brief Commands accepted by run().
    [[nodiscard]] static QStringList commands();

    explicit CliRunner(const CliOptions &options, QObject *parent = nullptr);
    ~CliRunner() override;

    /**
     * @brief Replaces the rsync executor, e.g. with a test double.
     *
     * Must be called before run(); ownership is not taken.
     */
    void setExecutor(ITransferExecutor *executor);

    /// @brief Executes the command and returns the process exit code.
    int run();

    [[nodiscard]] SyncConfig *config() const { return config_; }
    [[nodiscard]] TaskPool *pool() const { return pool_; }

    /// @brief Itemized change lines collected by the last "diff".
    [[nodiscard]] QStringList differences() const { return differences_; }

    /// @brief True for rsync --itemize-changes lines such as ">f.st...... notes.txt".
    [[nodiscard]] static bool isItemizedChange(const QString &line);

private:
    [[nodiscard]] bool loadConfig();
    [[nodiscard]] int runConfig();
    [[nodiscard]] int runTestConnection();
    [[nodiscard]] int runHealth();
    [[nodiscard]] int runDiff();
    [[nodiscard]] int runTransfers();
    [[nodiscard]] int runWatch();
    [[nodiscard]] int finishTransfers(bool finished);
    [[nodiscard]] bool runProbe(double *latencyMs);
    [[nodiscard]] bool waitForPool();
    void printLine(const QString &line);

    CliOptions options_;
    QTextStream out_;

    SyncConfig *config_ = nullptr;
    AdaptiveController *controller_ = nullptr;
    MetricsStore *metrics_ = nullptr;
    TaskPool *pool_ = nullptr;
    ITransferExecutor *executor_ = nullptr;
    SyncService *service_ = nullptr;
    ConnectionProbe *probe_ = nullptr;
    ErrorHandler *errorHandler_ = nullptr;
    QString configError_;
    QStringList differences_;
};

#endif // CLIRUNNER_H
