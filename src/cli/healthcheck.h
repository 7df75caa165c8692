/**
 * @file healthcheck.h
 * @brief Environment diagnostics behind the "health" command.
 *
 * Checks that the rsync and ssh programs run, that the project file
 * loads and validates, that local paths are usable and, when the
 * configuration is complete, that a non-interactive ssh login works.
 */

#ifndef HEALTHCHECK_H
#define HEALTHCHECK_H

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>

class ConnectionProbe;
class SyncConfig;

/**
 * @brief Severity of one health check finding.
 */
enum class HealthLevel {
    Ok,
    Info,
    Warning,  ///< Works, but something should be looked at
    Error     ///< Transfers will fail
};

[[nodiscard]] inline const char* healthLevelToString(HealthLevel level) {
    switch (level) {
        case HealthLevel::Ok: return "ok";
        case HealthLevel::Info: return "info";
        case HealthLevel::Warning: return "warning";
        case HealthLevel::Error: return "error";
    }
    return "unknown";
}

/**
 * @brief One line of the health report.
 */
struct HealthItem {
    QString section;
    HealthLevel level = HealthLevel::Ok;
    QString message;
};

/**
 * @brief Runs the health checks and collects their findings.
 *
 * Tool checks run the configured programs synchronously with a bounded
 * wait. The ssh login test goes through ConnectionProbe and blocks in a
 * local event loop until it reports.
 *
 * @par Example usage:
 * @code
 * HealthCheck check(config, probe);
 * const QList<HealthItem> items = check.run();
 * qInfo().noquote() << HealthCheck::format(items);
 * @endcode
 */
class HealthCheck : public QObject
{
    Q_OBJECT

public:
    static constexpr int ToolTimeoutMs = 5000;

    /**
     * @param config Configuration under test (not owned).
     * @param probe Used for the ssh login test (not owned).
     */
    HealthCheck(SyncConfig *config, ConnectionProbe *probe, QObject *parent = nullptr);
    ~HealthCheck() override;

    /// @brief Enables the ssh login test; on by default.
    void setSshLoginEnabled(bool enabled) { sshLoginEnabled_ = enabled; }

    /**
     * @brief Runs every check.
     * @param configError Why the project file could not be loaded, if it could not.
     */
    QList<HealthItem> run(const QString &configError = QString());

    [[nodiscard]] static bool hasErrors(const QList<HealthItem> &items);
    [[nodiscard]] static QString format(const QList<HealthItem> &items);

    /// @brief "3.2.7" from "rsync  version 3.2.7  protocol version 31"; empty if absent.
    [[nodiscard]] static QString parseRsyncVersion(const QString &output);

    /// @brief "9.6p1" from "OpenSSH_9.6p1, OpenSSL 3.0.13"; empty if absent.
    [[nodiscard]] static QString parseSshVersion(const QString &output);

private:
    void checkRsync();
    void checkSsh();
    void checkConfiguration(const QString &configError);
    void checkPaths();
    void checkSshLogin();

    void add(const QString &section, HealthLevel level, const QString &message);
    [[nodiscard]] bool runTool(const QString &program, const QStringList &args,
                               QString *output, QString *error) const;

    SyncConfig *config_ = nullptr;
    ConnectionProbe *probe_ = nullptr;
    bool sshLoginEnabled_ = true;
    QList<HealthItem> items_;
};

#endif // HEALTHCHECK_H
