#include "rsyncexecutor.h"
#include "syncconfig.h"
#include "utils/logging.h"

#include <QDebug>
#include <QDir>
#include <QRegularExpression>
#include <QTemporaryFile>
#include <QTimer>

#include <algorithm>

namespace {

const char *const HandleProperty = "rsyncHandle";

} // namespace

RsyncExecutor::RsyncExecutor(SyncConfig *config, QObject *parent)
    : ITransferExecutor(parent)
    , config_(config)
{
}

RsyncExecutor::~RsyncExecutor()
{
    for (auto it = invocations_.begin(); it != invocations_.end(); ++it) {
        QProcess *process = it->process;
        process->disconnect(this);
        if (process->state() != QProcess::NotRunning) {
            process->kill();
            process->waitForFinished(1000);
        }
    }
}

QStringList RsyncExecutor::buildArguments(const TransferRequest &request,
                                          const SyncConfig &config,
                                          const QString &fileListPath)
{
    QStringList args = config.rsyncOptions();

    if (request.dryRun) {
        args << QStringLiteral("--dry-run") << QStringLiteral("--itemize-changes");
    }

    if (request.compress && !args.contains(QStringLiteral("-z"))) {
        args << QStringLiteral("-z");
    }
    if (request.kind == TaskKind::Directory && !args.contains(QStringLiteral("-a"))) {
        args << QStringLiteral("-r");
    }

    args << QStringLiteral("--timeout=%1").arg(std::max(1, request.timeoutMs / 1000));

    const SyncSettings &settings = config.settings();
    if (!settings.host.isEmpty()) {
        QStringList ssh;
        ssh << settings.sshProgram << config.sshOptions();
        args << QStringLiteral("-e") << ssh.join(' ');
    }

    if (request.kind == TaskKind::Batch) {
        args << QStringLiteral("--files-from=%1").arg(fileListPath)
             << QStringLiteral("--relative");
    }

    QString source = request.source;
    if ((request.kind == TaskKind::Directory || request.kind == TaskKind::Batch)
        && !source.endsWith('/')) {
        // Trailing slash: transfer the directory contents, not the directory itself
        source += '/';
    }

    args << source << request.destination;
    return args;
}

RsyncExecutor::ProgressInfo RsyncExecutor::parseProgressLine(const QString &line)
{
    static const QRegularExpression progressRx(
        QStringLiteral(R"(^\s*([\d,.]+)\s+(\d{1,3})%\s+\S+\s+\d+:\d{2}:\d{2})"));

    ProgressInfo info;
    const QRegularExpressionMatch match = progressRx.match(line);
    if (!match.hasMatch()) {
        return info;
    }

    QString digits = match.captured(1);
    digits.remove(',');
    digits.remove('.');

    bool ok = false;
    const qint64 bytes = digits.toLongLong(&ok);
    if (!ok) {
        return info;
    }

    info.valid = true;
    info.bytes = bytes;
    info.percent = std::clamp(match.captured(2).toInt(), 0, 100);
    return info;
}

TransferHandle RsyncExecutor::start(const TransferRequest &request, QString *errorMessage)
{
    if (!config_) {
        if (errorMessage) {
            *errorMessage = tr("No configuration available");
        }
        return 0;
    }

    QTemporaryFile *fileList = nullptr;
    if (request.kind == TaskKind::Batch) {
        fileList = writeFileList(request.files, errorMessage);
        if (!fileList) {
            return 0;
        }
    }

    auto *process = new QProcess(this);
    if (fileList) {
        fileList->setParent(process);
    }

    const QString program = config_->settings().rsyncProgram;
    const QStringList args = buildArguments(request, *config_,
                                            fileList ? fileList->fileName() : QString());

    const TransferHandle handle = nextHandle_++;
    process->setProperty(HandleProperty, handle);

    Invocation invocation;
    invocation.handle = handle;
    invocation.process = process;
    invocation.fileList = fileList;
    invocations_.insert(handle, invocation);

    connect(process, &QProcess::readyReadStandardOutput,
            this, &RsyncExecutor::onReadyReadStandardOutput);
    connect(process, &QProcess::readyReadStandardError,
            this, &RsyncExecutor::onReadyReadStandardError);
    connect(process, qOverload<int, QProcess::ExitStatus>(&QProcess::finished),
            this, &RsyncExecutor::onProcessFinished);
    connect(process, &QProcess::errorOccurred,
            this, &RsyncExecutor::onProcessError);

    LOG_VERBOSE() << "RsyncExecutor: starting" << handle << program << args;
    process->start(program, args);
    return handle;
}

QTemporaryFile *RsyncExecutor::writeFileList(const QStringList &files, QString *errorMessage)
{
    auto *fileList = new QTemporaryFile(QDir::tempPath() + QStringLiteral("/rsyncq-files-XXXXXX"), this);
    if (!fileList->open()) {
        if (errorMessage) {
            *errorMessage = tr("Cannot create file list: %1").arg(fileList->errorString());
        }
        fileList->deleteLater();
        return nullptr;
    }

    const QByteArray content = files.join('\n').toUtf8() + '\n';
    if (fileList->write(content) != content.size() || !fileList->flush()) {
        if (errorMessage) {
            *errorMessage = tr("Cannot write file list: %1").arg(fileList->errorString());
        }
        fileList->deleteLater();
        return nullptr;
    }
    fileList->close();
    return fileList;
}

void RsyncExecutor::terminate(TransferHandle handle)
{
    auto it = invocations_.find(handle);
    if (it == invocations_.end()) {
        return;
    }

    QProcess *process = it->process;
    if (process->state() == QProcess::NotRunning) {
        return;
    }

    qDebug() << "RsyncExecutor: terminating" << handle;
    process->terminate();
    QTimer::singleShot(KillGraceMs, process, [process]() {
        if (process->state() != QProcess::NotRunning) {
            qWarning() << "RsyncExecutor: process did not exit after SIGTERM, killing";
            process->kill();
        }
    });
}

bool RsyncExecutor::isRunning(TransferHandle handle) const
{
    return invocations_.contains(handle);
}

RsyncExecutor::Invocation *RsyncExecutor::invocationFor(QObject *object)
{
    if (!object) {
        return nullptr;
    }
    const TransferHandle handle = object->property(HandleProperty).toULongLong();
    auto it = invocations_.find(handle);
    return it == invocations_.end() ? nullptr : &it.value();
}

void RsyncExecutor::emitLines(Invocation &invocation, QByteArray &buffer, bool isError, bool flush)
{
    // rsync rewrites progress lines with '\r'
    buffer.replace('\r', '\n');

    int newline = buffer.indexOf('\n');
    while (newline >= 0 || (flush && !buffer.isEmpty())) {
        const int end = newline >= 0 ? newline : buffer.size();
        const QString line = QString::fromUtf8(buffer.left(end)).trimmed();
        buffer.remove(0, newline >= 0 ? end + 1 : end);

        if (!line.isEmpty()) {
            const TransferHandle handle = invocation.handle;
            if (isError) {
                invocation.errorLines.append(line);
            } else {
                const ProgressInfo info = parseProgressLine(line);
                if (info.valid) {
                    emit progress(handle, info.bytes, info.percent);
                }
            }
            emit outputLine(handle, line, isError);
        }
        newline = buffer.indexOf('\n');
    }
}

void RsyncExecutor::onReadyReadStandardOutput()
{
    Invocation *invocation = invocationFor(sender());
    if (!invocation) {
        return;
    }
    invocation->stdoutBuffer.append(invocation->process->readAllStandardOutput());
    emitLines(*invocation, invocation->stdoutBuffer, false, false);
}

void RsyncExecutor::onReadyReadStandardError()
{
    Invocation *invocation = invocationFor(sender());
    if (!invocation) {
        return;
    }
    invocation->stderrBuffer.append(invocation->process->readAllStandardError());
    emitLines(*invocation, invocation->stderrBuffer, true, false);
}

void RsyncExecutor::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    Invocation *invocation = invocationFor(sender());
    if (!invocation) {
        return;
    }

    invocation->stdoutBuffer.append(invocation->process->readAllStandardOutput());
    invocation->stderrBuffer.append(invocation->process->readAllStandardError());
    emitLines(*invocation, invocation->stdoutBuffer, false, true);
    emitLines(*invocation, invocation->stderrBuffer, true, true);

    const TransferHandle handle = invocation->handle;
    int code = exitCode;
    QString errorText = invocation->errorLines.join('\n');

    if (exitStatus == QProcess::CrashExit) {
        code = code != 0 ? code : -1;
        if (errorText.isEmpty()) {
            errorText = tr("rsync terminated: %1").arg(invocation->process->errorString());
        }
    } else if (code != 0 && errorText.isEmpty()) {
        errorText = tr("rsync exited with code %1").arg(code);
    }

    LOG_VERBOSE() << "RsyncExecutor: finished" << handle << "exit" << code;
    release(handle);
    emit finished(handle, code, code == 0 ? QString() : errorText);
}

void RsyncExecutor::onProcessError(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart) {
        // Other errors are followed by finished()
        return;
    }

    Invocation *invocation = invocationFor(sender());
    if (!invocation) {
        return;
    }

    const TransferHandle handle = invocation->handle;
    const QString message = tr("Failed to start %1: %2")
                                .arg(invocation->process->program(),
                                     invocation->process->errorString());
    qWarning() << "RsyncExecutor:" << message;
    release(handle);

    // QProcess may report FailedToStart from inside start(), before the
    // caller has recorded the handle
    QTimer::singleShot(0, this, [this, handle, message]() {
        emit startFailed(handle, message);
    });
}

void RsyncExecutor::release(TransferHandle handle)
{
    auto it = invocations_.find(handle);
    if (it == invocations_.end()) {
        return;
    }
    QProcess *process = it->process;
    invocations_.erase(it);
    process->disconnect(this);
    process->deleteLater();
}
