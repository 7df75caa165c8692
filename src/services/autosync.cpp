#include "autosync.h"
#include "syncconfig.h"
#include "syncservice.h"
#include "models/taskpool.h"
#include "utils/logging.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QTimer>
#include <algorithm>

namespace {

qint64 modifiedMs(const QFileInfo &info)
{
    return info.lastModified().toMSecsSinceEpoch();
}

} // namespace

AutoSync::AutoSync(SyncConfig *config, SyncService *service, TaskPool *pool, QObject *parent)
    : QObject(parent)
    , config_(config)
    , service_(service)
    , pool_(pool)
    , intervalTimer_(new QTimer(this))
    , debounceTimer_(new QTimer(this))
{
    intervalTimer_->setInterval(DefaultIntervalMs);
    connect(intervalTimer_, &QTimer::timeout, this, &AutoSync::onIntervalTimer);

    debounceTimer_->setSingleShot(true);
    debounceTimer_->setInterval(SaveDebounceMs);
    connect(debounceTimer_, &QTimer::timeout, this, &AutoSync::onDebounceTimer);
}

AutoSync::~AutoSync() = default;

void AutoSync::applySettings()
{
    const SyncSettings &settings = config_->settings();
    setInterval(settings.syncIntervalMs);
    setPeriodicSync(settings.autoSync);
    setSyncOnSave(settings.syncOnSave);
}

void AutoSync::setEnabled(bool enabled)
{
    if (enabled_ == enabled) {
        return;
    }

    enabled_ = enabled;

    if (enabled) {
        cycleCount_ = 0;
        if (periodicSync_) {
            intervalTimer_->start();
            QTimer::singleShot(0, this, &AutoSync::onIntervalTimer);
        }
        if (syncOnSave_) {
            startWatching();
        }
        qInfo() << "AutoSync: enabled, interval" << interval() << "ms"
                << "periodic" << periodicSync_ << "on save" << syncOnSave_;
    } else {
        intervalTimer_->stop();
        debounceTimer_->stop();
        saved_.clear();
        stopWatching();
        qInfo() << "AutoSync: disabled after" << cycleCount_ << "cycles";
    }
}

void AutoSync::setPeriodicSync(bool enabled)
{
    if (periodicSync_ == enabled) {
        return;
    }
    periodicSync_ = enabled;

    if (!enabled_) {
        return;
    }
    if (enabled) {
        intervalTimer_->start();
    } else {
        intervalTimer_->stop();
    }
}

void AutoSync::setInterval(int intervalMs)
{
    intervalTimer_->setInterval(intervalMs > 0 ? intervalMs : DefaultIntervalMs);
}

int AutoSync::interval() const
{
    return intervalTimer_->interval();
}

void AutoSync::setSyncOnSave(bool enabled)
{
    if (syncOnSave_ == enabled) {
        return;
    }
    syncOnSave_ = enabled;

    if (!enabled_) {
        return;
    }
    if (enabled) {
        startWatching();
    } else {
        debounceTimer_->stop();
        saved_.clear();
        stopWatching();
    }
}

QStringList AutoSync::watchedPaths() const
{
    if (!watcher_) {
        return QStringList();
    }
    return watcher_->directories() + watcher_->files();
}

void AutoSync::onIntervalTimer()
{
    if (enabled_ && periodicSync_) {
        runCycle();
    }
}

bool AutoSync::runCycle()
{
    if (pool_ && !pool_->isIdle()) {
        const QString reason = tr("Previous sync still running (%1 tasks)").arg(pool_->activeCount());
        LOG_VERBOSE() << "AutoSync: skipping cycle," << reason;
        emit cycleSkipped(reason);
        return false;
    }

    ++cycleCount_;
    const SubmitResult result = service_->syncAll();
    if (!result.ok()) {
        qWarning() << "AutoSync: cycle" << cycleCount_ << "failed:" << result.message;
    }
    emit cycleStarted(cycleCount_, result.taskIds.size(), result.message);
    return true;
}

bool AutoSync::isSyncCandidate(const QString &path) const
{
    const QFileInfo info(path);
    if (!info.isFile()) {
        return false;
    }

    const QString root = config_->localRoot();
    if (root.isEmpty() || !path.startsWith(root.endsWith('/') ? root : root + '/')) {
        return false;
    }
    return config_->shouldTransfer(config_->relativePath(path))
        && config_->isFileSizeAllowed(info.size());
}

void AutoSync::notifySaved(const QString &path)
{
    if (!enabled_ || !syncOnSave_) {
        return;
    }

    const QString absolute = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
    if (!isSyncCandidate(absolute)) {
        LOG_VERBOSE() << "AutoSync: ignoring save of" << absolute;
        return;
    }

    modified_.insert(absolute, modifiedMs(QFileInfo(absolute)));
    saved_.insert(absolute);
    debounceTimer_->start();
}

void AutoSync::onDebounceTimer()
{
    if (saved_.isEmpty()) {
        return;
    }

    QStringList paths(saved_.cbegin(), saved_.cend());
    std::sort(paths.begin(), paths.end());
    saved_.clear();

    const SubmitResult result = service_->syncFiles(paths, TransferDirection::Upload);
    if (!result.ok()) {
        qWarning() << "AutoSync: upload of saved files failed:" << result.message;
        return;
    }
    emit filesSaved(paths, result.taskIds.size());
}

void AutoSync::startWatching()
{
    if (watcher_) {
        return;
    }

    watcher_ = new QFileSystemWatcher(this);
    connect(watcher_, &QFileSystemWatcher::fileChanged, this, &AutoSync::onFileChanged);
    connect(watcher_, &QFileSystemWatcher::directoryChanged, this, &AutoSync::onDirectoryChanged);

    const QString root = config_->localRoot();
    if (root.isEmpty() || !QFileInfo(root).isDir()) {
        qWarning() << "AutoSync: cannot watch missing local path" << root;
        return;
    }

    QSet<QString> directories{root};
    const QStringList files = service_->scanLocalFiles();
    for (const QString &file : files) {
        watchFile(file);
        directories.insert(QFileInfo(file).absolutePath());
    }
    // New files only show up as directory changes
    watcher_->addPaths(QStringList(directories.cbegin(), directories.cend()));

    qInfo() << "AutoSync: watching" << files.size() << "files in" << directories.size() << "directories";
}

void AutoSync::stopWatching()
{
    if (watcher_) {
        disconnect(watcher_, nullptr, this, nullptr);
        watcher_->deleteLater();
        watcher_ = nullptr;
    }
    modified_.clear();
}

void AutoSync::watchFile(const QString &path)
{
    modified_.insert(path, modifiedMs(QFileInfo(path)));
    if (!watcher_->files().contains(path)) {
        watcher_->addPath(path);
    }
}

void AutoSync::onFileChanged(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists()) {
        // Replaced by rename; the directory change picks up the new file
        modified_.remove(path);
        return;
    }

    if (!watcher_->files().contains(path)) {
        watcher_->addPath(path);
    }
    if (modified_.value(path, -1) != modifiedMs(info)) {
        notifySaved(path);
    }
}

void AutoSync::onDirectoryChanged(const QString &path)
{
    const QFileInfoList entries = QDir(path).entryInfoList(QDir::Files | QDir::Hidden);
    for (const QFileInfo &entry : entries) {
        const QString file = QDir::cleanPath(entry.absoluteFilePath());
        if (!isSyncCandidate(file)) {
            continue;
        }
        if (modified_.value(file, -1) != modifiedMs(entry)) {
            watchFile(file);
            notifySaved(file);
        }
    }
}
