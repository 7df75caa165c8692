#include "connectionprobe.h"
#include "syncconfig.h"

#include <QDebug>
#include <QTcpSocket>
#include <QTimer>

ConnectionProbe::ConnectionProbe(SyncConfig *config, QObject *parent)
    : QObject(parent)
    , config_(config)
    , probeTimer_(new QTimer(this))
{
    probeTimer_->setSingleShot(true);
    connect(probeTimer_, &QTimer::timeout, this, &ConnectionProbe::onProbeTimeout);
}

ConnectionProbe::~ConnectionProbe()
{
    abort();
}

QStringList ConnectionProbe::sshTestArguments(const SyncConfig &config)
{
    const SyncSettings &s = config.settings();

    QStringList args;
    args << QStringLiteral("-p") << QString::number(s.port);
    if (!s.privateKeyPath.isEmpty()) {
        args << QStringLiteral("-i") << SyncConfig::expandHome(s.privateKeyPath);
    }
    args << QStringLiteral("-o") << QStringLiteral("BatchMode=yes")
         << QStringLiteral("-o") << QStringLiteral("ConnectTimeout=%1").arg(SshConnectTimeoutSecs)
         << QStringLiteral("-o") << QStringLiteral("LogLevel=ERROR")
         << QStringLiteral("-o") << QStringLiteral("StrictHostKeyChecking=no")
         << QStringLiteral("-o") << QStringLiteral("UserKnownHostsFile=/dev/null");

    const QString target = s.username.isEmpty() ? s.host : s.username + '@' + s.host;
    args << target << QStringLiteral("echo 'Connection successful'");
    return args;
}

void ConnectionProbe::probe()
{
    if (socket_) {
        return;
    }
    if (!config_ || config_->settings().host.isEmpty()) {
        qWarning() << "ConnectionProbe: no host configured";
        emit probeFinished(false, 0.0);
        return;
    }

    const SyncSettings &s = config_->settings();
    socket_ = new QTcpSocket(this);
    connect(socket_, &QTcpSocket::connected, this, &ConnectionProbe::onSocketConnected);
    connect(socket_, &QTcpSocket::errorOccurred, this, &ConnectionProbe::onSocketError);

    elapsed_.start();
    probeTimer_->start(probeTimeoutMs_);
    socket_->connectToHost(s.host, static_cast<quint16>(s.port));
}

void ConnectionProbe::onSocketConnected()
{
    const double latency = static_cast<double>(elapsed_.nsecsElapsed()) / 1.0e6;
    qDebug() << "ConnectionProbe: connected in" << latency << "ms";
    finishProbe(true, latency);
}

void ConnectionProbe::onSocketError()
{
    if (!socket_) {
        return;
    }
    qDebug() << "ConnectionProbe: probe failed:" << socket_->errorString();
    finishProbe(false, 0.0);
}

void ConnectionProbe::onProbeTimeout()
{
    qDebug() << "ConnectionProbe: probe timed out after" << probeTimeoutMs_ << "ms";
    finishProbe(false, 0.0);
}

void ConnectionProbe::finishProbe(bool success, double latencyMs)
{
    if (!socket_) {
        return;
    }
    probeTimer_->stop();

    QTcpSocket *socket = socket_;
    socket_ = nullptr;
    socket->disconnect(this);
    socket->abort();
    socket->deleteLater();

    emit probeFinished(success, latencyMs);
}

void ConnectionProbe::testSsh()
{
    if (sshProcess_) {
        return;
    }
    if (!config_ || config_->settings().host.isEmpty()) {
        emit sshTestFinished(false, tr("No host configured"));
        return;
    }

    sshProcess_ = new QProcess(this);
    connect(sshProcess_, qOverload<int, QProcess::ExitStatus>(&QProcess::finished),
            this, &ConnectionProbe::onSshFinished);
    connect(sshProcess_, &QProcess::errorOccurred, this, &ConnectionProbe::onSshError);

    sshProcess_->start(config_->settings().sshProgram, sshTestArguments(*config_));
}

void ConnectionProbe::onSshFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    if (!sshProcess_) {
        return;
    }

    const QString output = QString::fromUtf8(sshProcess_->readAllStandardOutput()).trimmed();
    const QString errors = QString::fromUtf8(sshProcess_->readAllStandardError()).trimmed();

    if (exitStatus == QProcess::NormalExit && exitCode == 0
        && output.contains(QLatin1String("Connection successful"))) {
        finishSsh(true, tr("SSH connection successful"));
    } else {
        const QString reason = errors.isEmpty() ? tr("exit code %1").arg(exitCode) : errors;
        finishSsh(false, tr("SSH connection failed: %1").arg(reason));
    }
}

void ConnectionProbe::onSshError(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart || !sshProcess_) {
        return;
    }
    finishSsh(false, tr("Failed to start ssh: %1").arg(sshProcess_->errorString()));
}

void ConnectionProbe::finishSsh(bool success, const QString &message)
{
    QProcess *process = sshProcess_;
    sshProcess_ = nullptr;
    process->disconnect(this);
    process->deleteLater();

    if (success) {
        qInfo() << "ConnectionProbe:" << message;
    } else {
        qWarning() << "ConnectionProbe:" << message;
    }
    emit sshTestFinished(success, message);
}

void ConnectionProbe::abort()
{
    probeTimer_->stop();
    if (socket_) {
        socket_->disconnect(this);
        socket_->abort();
        socket_->deleteLater();
        socket_ = nullptr;
    }
    if (sshProcess_) {
        sshProcess_->disconnect(this);
        if (sshProcess_->state() != QProcess::NotRunning) {
            sshProcess_->kill();
            sshProcess_->waitForFinished(1000);
        }
        sshProcess_->deleteLater();
        sshProcess_ = nullptr;
    }
}
