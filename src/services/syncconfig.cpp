#include "syncconfig.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>

namespace {

QStringList toStringList(const QJsonValue &value)
{
    QStringList result;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &item : array) {
        if (item.isString()) {
            result.append(item.toString());
        }
    }
    return result;
}

QString joinRemote(const QString &base, const QString &relative)
{
    if (base.isEmpty()) {
        return relative;
    }
    if (relative.isEmpty() || relative == QLatin1String(".")) {
        return base;
    }
    if (base.endsWith('/')) {
        return base + relative;
    }
    return base + '/' + relative;
}

} // namespace

SyncConfig::SyncConfig(QObject *parent)
    : QObject(parent)
{
}

SyncConfig::~SyncConfig() = default;

QStringList SyncConfig::projectFileNames()
{
    return {QStringLiteral(".rsync.json"), QStringLiteral(".rsync.jsonc"),
            QStringLiteral("rsync.json"), QStringLiteral("rsync.jsonc")};
}

QString SyncConfig::findProjectFile(const QString &startDir)
{
    QDir dir(startDir);
    if (!dir.exists()) {
        return QString();
    }
    dir.makeAbsolute();

    const QStringList names = projectFileNames();
    while (true) {
        for (const QString &name : names) {
            if (QFileInfo(dir.filePath(name)).isFile()) {
                return dir.absoluteFilePath(name);
            }
        }
        if (!dir.cdUp()) {
            break;
        }
    }
    return QString();
}

bool SyncConfig::loadProjectFile(const QString &startDir, QString *errorMessage)
{
    const QString path = findProjectFile(startDir);
    if (path.isEmpty()) {
        if (errorMessage) {
            *errorMessage = tr("No rsync project file found from %1").arg(startDir);
        }
        return false;
    }
    return loadFile(path, errorMessage);
}

bool SyncConfig::loadFile(const QString &path, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = tr("Cannot open %1: %2").arg(path, file.errorString());
        }
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(stripJsonComments(file.readAll()), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = tr("Failed to parse rsync config file %1: %2")
                                .arg(path, parseError.errorString());
        }
        return false;
    }

    SyncSettings merged;
    mergeJson(merged, doc.object(), QFileInfo(path).absolutePath());
    settings_ = merged;
    configFilePath_ = QFileInfo(path).absoluteFilePath();

    qInfo() << "SyncConfig: loaded configuration from" << configFilePath_;
    emit changed();
    return true;
}

void SyncConfig::applyOverrides(const QJsonObject &overrides)
{
    if (overrides.isEmpty()) {
        return;
    }
    mergeJson(settings_, overrides);
    emit changed();
}

void SyncConfig::setSettings(const SyncSettings &settings)
{
    settings_ = settings;
    settings_.localPath = resolvePath(settings.localPath);
    emit changed();
}

QByteArray SyncConfig::stripJsonComments(const QByteArray &data)
{
    QByteArray out;
    out.reserve(data.size());

    bool inString = false;
    bool escaped = false;
    int i = 0;
    const int n = data.size();

    while (i < n) {
        const char c = data.at(i);

        if (inString) {
            out.append(c);
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            ++i;
            continue;
        }

        if (c == '"') {
            inString = true;
            out.append(c);
            ++i;
        } else if (c == '/' && i + 1 < n && data.at(i + 1) == '/') {
            while (i < n && data.at(i) != '\n') {
                ++i;
            }
        } else if (c == '/' && i + 1 < n && data.at(i + 1) == '*') {
            i += 2;
            while (i + 1 < n && !(data.at(i) == '*' && data.at(i + 1) == '/')) {
                ++i;
            }
            i += 2;
        } else {
            out.append(c);
            ++i;
        }
    }
    return out;
}

void SyncConfig::mergeJson(SyncSettings &s, const QJsonObject &o, const QString &baseDir)
{
    if (o.contains("host")) s.host = o.value("host").toString();
    if (o.contains("username")) s.username = o.value("username").toString();
    if (o.contains("port")) s.port = o.value("port").toInt(s.port);
    if (o.contains("private_key_path")) s.privateKeyPath = expandHome(o.value("private_key_path").toString());
    if (o.contains("local_path")) s.localPath = resolvePath(o.value("local_path").toString(), baseDir);
    if (o.contains("remote_path")) s.remotePath = o.value("remote_path").toString();

    if (o.contains("auto_sync")) s.autoSync = o.value("auto_sync").toBool(s.autoSync);
    if (o.contains("sync_on_save")) s.syncOnSave = o.value("sync_on_save").toBool(s.syncOnSave);
    if (o.contains("sync_interval")) s.syncIntervalMs = o.value("sync_interval").toInt(s.syncIntervalMs);
    if (o.contains("config_file_reminder")) {
        s.configFileReminder = o.value("config_file_reminder").toBool(s.configFileReminder);
    }

    if (o.contains("include_patterns")) s.includePatterns = toStringList(o.value("include_patterns"));
    if (o.contains("exclude_patterns")) s.excludePatterns = toStringList(o.value("exclude_patterns"));
    if (o.contains("max_file_size")) {
        s.maxFileSize = static_cast<qint64>(o.value("max_file_size").toDouble(static_cast<double>(s.maxFileSize)));
    }

    if (o.contains("max_connections")) s.maxConnections = o.value("max_connections").toInt(s.maxConnections);
    if (o.contains("batch_size")) s.batchSize = o.value("batch_size").toInt(s.batchSize);
    if (o.contains("connection_timeout")) {
        s.connectionTimeoutMs = o.value("connection_timeout").toInt(s.connectionTimeoutMs);
    }
    if (o.contains("rsync_program")) s.rsyncProgram = o.value("rsync_program").toString(s.rsyncProgram);
    if (o.contains("ssh_program")) s.sshProgram = o.value("ssh_program").toString(s.sshProgram);

    if (o.value("rsync_options").isObject()) {
        const QJsonObject r = o.value("rsync_options").toObject();
        RsyncFlags &f = s.rsync;
        f.archive = r.value("archive").toBool(f.archive);
        f.compress = r.value("compress").toBool(f.compress);
        f.progress = r.value("progress").toBool(f.progress);
        f.stats = r.value("stats").toBool(f.stats);
        f.deleteExtraneous = r.value("delete").toBool(f.deleteExtraneous);
        f.checksum = r.value("checksum").toBool(f.checksum);
        f.verbose = r.value("verbose").toBool(f.verbose);
    }
}

QString SyncConfig::localRoot() const
{
    return resolvePath(settings_.localPath);
}

bool SyncConfig::isConfigured() const
{
    return !settings_.host.isEmpty()
        && !settings_.username.isEmpty()
        && !settings_.localPath.isEmpty()
        && !settings_.remotePath.isEmpty();
}

QStringList SyncConfig::validate() const
{
    QStringList errors;
    const SyncSettings &s = settings_;

    if (s.host.isEmpty()) {
        errors << tr("host is required");
    }
    if (s.localPath.isEmpty()) {
        errors << tr("local_path is required");
    } else if (!QFileInfo::exists(localRoot())) {
        errors << tr("local_path does not exist: %1").arg(s.localPath);
    }
    if (s.remotePath.isEmpty()) {
        errors << tr("remote_path is required");
    }
    if (!s.privateKeyPath.isEmpty() && !QFileInfo::exists(expandHome(s.privateKeyPath))) {
        errors << tr("private_key_path does not exist: %1").arg(expandHome(s.privateKeyPath));
    }
    if (s.port < 1 || s.port > 65535) {
        errors << tr("port must be between 1 and 65535");
    }
    if (s.maxConnections < 1) {
        errors << tr("max_connections must be at least 1");
    }
    if (s.batchSize < 1) {
        errors << tr("batch_size must be at least 1");
    }
    if (s.syncIntervalMs < 1) {
        errors << tr("sync_interval must be a positive number of milliseconds");
    }
    return errors;
}

QJsonObject SyncConfig::toJson() const
{
    const SyncSettings &s = settings_;
    QJsonObject rsync;
    rsync["archive"] = s.rsync.archive;
    rsync["compress"] = s.rsync.compress;
    rsync["progress"] = s.rsync.progress;
    rsync["stats"] = s.rsync.stats;
    rsync["delete"] = s.rsync.deleteExtraneous;
    rsync["checksum"] = s.rsync.checksum;
    rsync["verbose"] = s.rsync.verbose;

    QJsonObject o;
    o["host"] = s.host;
    o["username"] = s.username;
    o["port"] = s.port;
    o["private_key_path"] = s.privateKeyPath;
    o["local_path"] = s.localPath;
    o["remote_path"] = s.remotePath;
    o["auto_sync"] = s.autoSync;
    o["sync_on_save"] = s.syncOnSave;
    o["sync_interval"] = s.syncIntervalMs;
    o["config_file_reminder"] = s.configFileReminder;
    o["include_patterns"] = QJsonArray::fromStringList(s.includePatterns);
    o["exclude_patterns"] = QJsonArray::fromStringList(s.excludePatterns);
    o["max_file_size"] = static_cast<double>(s.maxFileSize);
    o["max_connections"] = s.maxConnections;
    o["batch_size"] = s.batchSize;
    o["connection_timeout"] = s.connectionTimeoutMs;
    o["rsync_program"] = s.rsyncProgram;
    o["ssh_program"] = s.sshProgram;
    o["rsync_options"] = rsync;
    return o;
}

QStringList SyncConfig::rsyncOptions() const
{
    const RsyncFlags &f = settings_.rsync;
    QStringList options;
    if (f.archive) options << QStringLiteral("-a");
    if (f.compress) options << QStringLiteral("-z");
    if (f.progress) options << QStringLiteral("--progress");
    if (f.stats) options << QStringLiteral("--stats");
    if (f.deleteExtraneous) options << QStringLiteral("--delete");
    if (f.checksum) options << QStringLiteral("-c");
    if (f.verbose) options << QStringLiteral("-v");

    // Preserve permissions, owner and group
    options << QStringLiteral("-p") << QStringLiteral("-o") << QStringLiteral("-g");
    return options;
}

QStringList SyncConfig::sshOptions() const
{
    QStringList options;
    options << QStringLiteral("-p") << QString::number(settings_.port);
    if (!settings_.privateKeyPath.isEmpty()) {
        options << QStringLiteral("-i") << expandHome(settings_.privateKeyPath);
    }
    options << QStringLiteral("-o") << QStringLiteral("StrictHostKeyChecking=no")
            << QStringLiteral("-o") << QStringLiteral("UserKnownHostsFile=/dev/null")
            << QStringLiteral("-o")
            << QStringLiteral("ConnectTimeout=%1").arg(settings_.connectionTimeoutMs / 1000);
    return options;
}

QString SyncConfig::remoteDestination(const QString &remotePath) const
{
    if (settings_.host.isEmpty()) {
        return remotePath;
    }
    const QString userHost = settings_.username.isEmpty()
        ? settings_.host
        : settings_.username + '@' + settings_.host;
    return userHost + ':' + remotePath;
}

QString SyncConfig::remotePathFor(const QString &localPath) const
{
    QString relative = relativePath(localPath);
    if (relative == QDir::cleanPath(localPath) && QFileInfo(localPath).isAbsolute()) {
        relative = QFileInfo(localPath).fileName();
    }
    return joinRemote(settings_.remotePath, relative);
}

QString SyncConfig::relativePath(const QString &fullPath) const
{
    const QString full = QDir::cleanPath(QDir::fromNativeSeparators(fullPath));
    if (settings_.localPath.isEmpty()) {
        return full;
    }

    const QString base = localRoot();
    if (full == base) {
        return QStringLiteral(".");
    }
    const QString prefix = base.endsWith('/') ? base : base + '/';
    if (full.startsWith(prefix)) {
        return full.mid(prefix.size());
    }
    return full;
}

bool SyncConfig::isFileSizeAllowed(qint64 size) const
{
    if (settings_.maxFileSize <= 0) {
        return true;
    }
    return size <= settings_.maxFileSize;
}

bool SyncConfig::shouldTransfer(const QString &relativePath) const
{
    for (const QString &pattern : settings_.excludePatterns) {
        if (matchesPattern(relativePath, pattern)) {
            return false;
        }
    }

    if (settings_.includePatterns.isEmpty()) {
        return true;
    }
    for (const QString &pattern : settings_.includePatterns) {
        if (matchesPattern(relativePath, pattern)) {
            return true;
        }
    }
    return false;
}

bool SyncConfig::matchesPattern(const QString &relativePath, const QString &pattern)
{
    if (pattern.isEmpty()) {
        return false;
    }

    const QStringList components = relativePath.split('/', Qt::SkipEmptyParts);

    if (pattern.endsWith('/')) {
        const QRegularExpression dirRx(
            QRegularExpression::wildcardToRegularExpression(pattern.chopped(1)));
        // Every component but the last names a directory
        for (int i = 0; i + 1 < components.size(); ++i) {
            if (dirRx.match(components.at(i)).hasMatch()) {
                return true;
            }
        }
        return false;
    }

    const QRegularExpression rx(QRegularExpression::wildcardToRegularExpression(pattern));
    const QString fileName = components.isEmpty() ? relativePath : components.last();
    return rx.match(fileName).hasMatch() || rx.match(relativePath).hasMatch();
}

QString SyncConfig::expandHome(const QString &path)
{
    if (path == QLatin1String("~")) {
        return QDir::homePath();
    }
    if (path.startsWith(QLatin1String("~/"))) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}

QString SyncConfig::resolvePath(const QString &path, const QString &baseDir)
{
    if (path.isEmpty()) {
        return path;
    }
    const QString expanded = QDir::fromNativeSeparators(expandHome(path));
    if (QDir::isAbsolutePath(expanded)) {
        return QDir::cleanPath(expanded);
    }
    const QDir base(baseDir.isEmpty() ? QDir::currentPath() : baseDir);
    return QDir::cleanPath(base.absoluteFilePath(expanded));
}
