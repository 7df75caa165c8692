/**
 * @file errorhandler.h
 * @brief Centralized error reporting for consistent user-facing messages.
 *
 * This service standardizes how errors are categorized, reported and logged
 * across the application.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>
#include <QStringList>

#include "models/transfertask.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Validation,  ///< Rejected requests and configuration problems
    Transfer,    ///< Transfers that ran and failed
    Connection,  ///< Unreachable host, ssh or network failures
    System       ///< General system/application errors
};

/**
 * @brief Severity levels determining how errors are reported.
 */
enum class ErrorSeverity {
    Info,      ///< Informational, short status message
    Warning,   ///< Warning, longer status message
    Critical   ///< Critical, status message without timeout
};

/**
 * @brief Centralized error reporting service.
 *
 * ErrorHandler gives every error source the same treatment:
 * - Categorizes errors for appropriate handling
 * - Chooses how long the status message stays visible from the severity
 * - Logs errors through the Qt message handlers
 * - Counts errors so callers can derive an exit status
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(service, &SyncService::requestRejected,
 *         handler, &ErrorHandler::handleRejectedRequest);
 * connect(pool, &TaskPool::taskFailed,
 *         handler, &ErrorHandler::handleTaskFailed);
 *
 * handler->handleError(ErrorCategory::System,
 *                      ErrorSeverity::Warning,
 *                      "Cannot write report",
 *                      "Permission denied");
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    explicit ErrorHandler(QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /// @name Generic Error Handling
    /// @{

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());
    /// @}

    /// @name Counters
    /// @{
    [[nodiscard]] int errorCount() const { return errorCount_; }
    [[nodiscard]] int criticalCount() const { return criticalCount_; }
    [[nodiscard]] int countFor(ErrorCategory category) const;
    void resetCounters();
    /// @}

    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

public slots:
    /// @name Convenience Handlers for Common Error Sources
    /// @{

    /**
     * @brief Handles a request refused before submission (warning severity).
     */
    void handleRejectedRequest(SubmitError error, const QString &message);

    /**
     * @brief Handles a task that reached the failed state (warning severity).
     * @param id The failed task.
     * @param message The task's result message, which already names the
     *        batch and its file count for batch tasks.
     */
    void handleTaskFailed(TaskId id, const QString &message);

    /**
     * @brief Handles a connection error (critical severity).
     */
    void handleConnectionError(const QString &message);

    /**
     * @brief Reports every configuration problem (critical severity).
     */
    void handleConfigErrors(const QStringList &errors);
    /// @}

signals:
    /**
     * @brief Emitted to display a status message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    /**
     * @brief Gets the status message timeout for a severity level.
     * @param severity The error severity.
     * @return Timeout in milliseconds.
     */
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

    int errorCount_ = 0;
    int criticalCount_ = 0;
    int categoryCounts_[4] = {0, 0, 0, 0};
};

#endif // ERRORHANDLER_H
