/**
 * @file connectionprobe.h
 * @brief Measures reachability and latency of the configured remote host.
 */

#ifndef CONNECTIONPROBE_H
#define CONNECTIONPROBE_H

#include <QElapsedTimer>
#include <QObject>
#include <QProcess>
#include <QString>

class QTcpSocket;
class QTimer;
class SyncConfig;

/**
 * @brief Runs connectivity probes against the remote host.
 *
 * probe() opens a TCP connection to the configured ssh port and reports the
 * time to connect. Its result is meant to feed
 * AdaptiveController::recordProbe(). testSsh() runs a non-interactive ssh
 * command and reports whether authentication succeeded.
 *
 * @par Example usage:
 * @code
 * ConnectionProbe *probe = new ConnectionProbe(config, this);
 * connect(probe, &ConnectionProbe::probeFinished,
 *         controller, &AdaptiveController::recordProbe);
 * probe->probe();
 * @endcode
 */
class ConnectionProbe : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultProbeTimeoutMs = 5000;
    static constexpr int SshConnectTimeoutSecs = 10;

    explicit ConnectionProbe(SyncConfig *config, QObject *parent = nullptr);
    ~ConnectionProbe() override;

    void setProbeTimeout(int ms) { probeTimeoutMs_ = ms; }
    [[nodiscard]] int probeTimeout() const { return probeTimeoutMs_; }

    [[nodiscard]] bool isProbing() const { return socket_ != nullptr; }
    [[nodiscard]] bool isTestingSsh() const { return sshProcess_ != nullptr; }

    /// @brief Arguments for the ssh connection test command.
    [[nodiscard]] static QStringList sshTestArguments(const SyncConfig &config);

public slots:
    /**
     * @brief Starts a TCP latency probe.
     *
     * Ignored while a probe is already in flight.
     */
    void probe();

    /// @brief Starts an ssh authentication test.
    void testSsh();

    /// @brief Aborts any probe or test in flight without reporting it.
    void abort();

signals:
    /**
     * @brief A probe completed.
     * @param success True if the host accepted the connection.
     * @param latencyMs Time to connect; 0 on failure.
     */
    void probeFinished(bool success, double latencyMs);

    /// @brief The ssh test completed with a user-presentable message.
    void sshTestFinished(bool success, const QString &message);

private slots:
    void onSocketConnected();
    void onSocketError();
    void onProbeTimeout();
    void onSshFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onSshError(QProcess::ProcessError error);

private:
    void finishProbe(bool success, double latencyMs);
    void finishSsh(bool success, const QString &message);

    SyncConfig *config_ = nullptr;
    int probeTimeoutMs_ = DefaultProbeTimeoutMs;

    QTcpSocket *socket_ = nullptr;
    QTimer *probeTimer_ = nullptr;
    QElapsedTimer elapsed_;

    QProcess *sshProcess_ = nullptr;
};

#endif // CONNECTIONPROBE_H
