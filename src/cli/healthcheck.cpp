#include "healthcheck.h"
#include "services/connectionprobe.h"
#include "services/syncconfig.h"

#include <QDebug>
#include <QEventLoop>
#include <QFileInfo>
#include <QProcess>
#include <QRegularExpression>

namespace {

const QFileDevice::Permissions kGroupOrOther =
    QFileDevice::ReadGroup | QFileDevice::WriteGroup | QFileDevice::ExeGroup
    | QFileDevice::ReadOther | QFileDevice::WriteOther | QFileDevice::ExeOther;

} // namespace

HealthCheck::HealthCheck(SyncConfig *config, ConnectionProbe *probe, QObject *parent)
    : QObject(parent)
    , config_(config)
    , probe_(probe)
{
}

HealthCheck::~HealthCheck() = default;

QList<HealthItem> HealthCheck::run(const QString &configError)
{
    items_.clear();
    checkRsync();
    checkSsh();
    checkConfiguration(configError);
    checkPaths();
    checkSshLogin();
    return items_;
}

void HealthCheck::add(const QString &section, HealthLevel level, const QString &message)
{
    items_.append(HealthItem{section, level, message});
}

bool HealthCheck::runTool(const QString &program, const QStringList &args,
                          QString *output, QString *error) const
{
    QProcess process;
    process.setProcessChannelMode(QProcess::MergedChannels);
    process.start(program, args);

    if (!process.waitForStarted(ToolTimeoutMs)) {
        *error = process.errorString();
        return false;
    }
    if (!process.waitForFinished(ToolTimeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        *error = tr("no response after %1 ms").arg(ToolTimeoutMs);
        return false;
    }

    *output = QString::fromUtf8(process.readAll());
    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        *error = tr("exit code %1").arg(process.exitCode());
        return false;
    }
    return true;
}

void HealthCheck::checkRsync()
{
    const QString section = QStringLiteral("rsync");
    const QString program = config_->settings().rsyncProgram;

    QString output;
    QString error;
    if (!runTool(program, {QStringLiteral("--version")}, &output, &error)) {
        add(section, HealthLevel::Error, tr("rsync not usable: %1 (%2)").arg(program, error));
        add(section, HealthLevel::Info, tr("Install rsync with the system package manager"));
        return;
    }

    const QString version = parseRsyncVersion(output);
    add(section, HealthLevel::Ok, version.isEmpty() ? tr("rsync found (version unknown)")
                                                    : tr("rsync found: version %1").arg(version));
}

void HealthCheck::checkSsh()
{
    const QString section = QStringLiteral("ssh");
    const QString program = config_->settings().sshProgram;

    QString output;
    QString error;
    if (!runTool(program, {QStringLiteral("-V")}, &output, &error)) {
        add(section, HealthLevel::Error, tr("ssh not usable: %1 (%2)").arg(program, error));
        return;
    }

    const QString version = parseSshVersion(output);
    add(section, HealthLevel::Ok, version.isEmpty() ? tr("ssh found (version unknown)")
                                                    : tr("ssh found: OpenSSH %1").arg(version));

    if (qEnvironmentVariableIsEmpty("SSH_AUTH_SOCK")) {
        add(section, HealthLevel::Info, tr("ssh agent not running (optional)"));
    } else {
        add(section, HealthLevel::Ok, tr("ssh agent is available"));
    }
}

void HealthCheck::checkConfiguration(const QString &configError)
{
    const QString section = QStringLiteral("configuration");

    if (!config_->isLoadedFromFile()) {
        add(section, HealthLevel::Error,
            configError.isEmpty() ? tr("No rsync project file loaded") : configError);
        return;
    }

    const QString path = config_->configFilePath();
    add(section, HealthLevel::Ok, tr("Project file: %1").arg(path));

    if (QFileInfo(path).permissions() & kGroupOrOther) {
        add(section, HealthLevel::Warning,
            tr("Project file is accessible by other users: %1").arg(path));
    }

    const QStringList problems = config_->validate();
    if (problems.isEmpty()) {
        add(section, HealthLevel::Ok, tr("Configuration is valid"));
        return;
    }
    for (const QString &problem : problems) {
        add(section, HealthLevel::Error, problem);
    }
}

void HealthCheck::checkPaths()
{
    const QString section = QStringLiteral("paths");

    const QString root = config_->localRoot();
    if (!root.isEmpty()) {
        const QFileInfo info(root);
        if (!info.isDir()) {
            add(section, HealthLevel::Error, tr("Local path is not a directory: %1").arg(root));
        } else if (!info.isWritable()) {
            add(section, HealthLevel::Warning,
                tr("Local path is not writable, downloads will fail: %1").arg(root));
        } else {
            add(section, HealthLevel::Ok, tr("Local path accessible: %1").arg(root));
        }
    }

    const QString key = SyncConfig::expandHome(config_->settings().privateKeyPath);
    if (!key.isEmpty() && QFileInfo::exists(key) && (QFileInfo(key).permissions() & kGroupOrOther)) {
        // ssh refuses keys that others can read
        add(section, HealthLevel::Warning,
            tr("Private key is accessible by other users: %1").arg(key));
    }
}

void HealthCheck::checkSshLogin()
{
    if (!sshLoginEnabled_ || !probe_ || !config_->isConfigured()) {
        return;
    }

    bool success = false;
    QString message;

    QEventLoop loop;
    QMetaObject::Connection connection = connect(probe_, &ConnectionProbe::sshTestFinished, &loop,
        [&](bool ok, const QString &text) {
            success = ok;
            message = text;
            loop.quit();
        });

    probe_->testSsh();
    if (probe_->isTestingSsh()) {
        loop.exec();
    }
    disconnect(connection);

    add(QStringLiteral("connection"), success ? HealthLevel::Ok : HealthLevel::Error, message);
}

bool HealthCheck::hasErrors(const QList<HealthItem> &items)
{
    for (const HealthItem &item : items) {
        if (item.level == HealthLevel::Error) {
            return true;
        }
    }
    return false;
}

QString HealthCheck::format(const QList<HealthItem> &items)
{
    QStringList lines;
    QString section;
    int errors = 0;
    int warnings = 0;

    for (const HealthItem &item : items) {
        if (item.section != section) {
            section = item.section;
            lines << section + ':';
        }
        lines << QStringLiteral("  [%1] %2")
                     .arg(QString::fromLatin1(healthLevelToString(item.level)), item.message);
        if (item.level == HealthLevel::Error) {
            ++errors;
        } else if (item.level == HealthLevel::Warning) {
            ++warnings;
        }
    }

    if (errors > 0) {
        lines << tr("Health check failed: %1 errors, %2 warnings").arg(errors).arg(warnings);
    } else if (warnings > 0) {
        lines << tr("Health check passed with %1 warnings").arg(warnings);
    } else {
        lines << tr("Health check passed");
    }
    return lines.join('\n');
}

QString HealthCheck::parseRsyncVersion(const QString &output)
{
    static const QRegularExpression rx(QStringLiteral(R"(rsync\s+version\s+v?(\S+))"));
    const QRegularExpressionMatch match = rx.match(output);
    return match.hasMatch() ? match.captured(1) : QString();
}

QString HealthCheck::parseSshVersion(const QString &output)
{
    static const QRegularExpression rx(QStringLiteral(R"(OpenSSH[_\s]+([^,\s]+))"));
    const QRegularExpressionMatch match = rx.match(output);
    return match.hasMatch() ? match.captured(1) : QString();
}
