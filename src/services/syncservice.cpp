#include "syncservice.h"
#include "syncconfig.h"
#include "utils/formatutils.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <algorithm>

int SyncPlan::fileCount() const
{
    int count = 0;
    for (const PlannedUnit &unit : units) {
        count += unit.files.size();
    }
    return count;
}

SyncService::SyncService(SyncConfig *config, TaskPool *pool, QObject *parent)
    : QObject(parent)
    , config_(config)
    , pool_(pool)
{
}

SyncService::~SyncService() = default;

SubmitResult SyncService::reject(SubmitError error, const QString &message)
{
    qWarning() << "SyncService:" << submitErrorToString(error) << "-" << message;
    emit requestRejected(error, message);
    return SubmitResult::failure(error, message);
}

bool SyncService::checkConfigured(SubmitResult *result)
{
    if (config_ && config_->isConfigured()) {
        return true;
    }
    *result = reject(SubmitError::NotConfigured,
                     tr("Rsync is not configured: host, username, local_path and remote_path are required"));
    return false;
}

bool SyncService::isUnderLocalRoot(const QString &path) const
{
    const QString root = config_->localRoot();
    const QString clean = QDir::cleanPath(path);
    return clean.startsWith(root.endsWith('/') ? root : root + '/');
}

SubmitResult SyncService::submitSingle(TaskKind kind,
                                       TransferDirection direction,
                                       const QString &path,
                                       qint64 size,
                                       const TaskContinuation &continuation)
{
    SubmitOptions options;
    options.totalBytes = size;
    options.continuation = continuation;

    const SubmitResult result = pool_->submit(kind, direction, {path}, options);
    if (!result.ok()) {
        emit requestRejected(result.error, result.message);
        return result;
    }

    const QString name = QFileInfo(path).fileName();
    if (direction == TransferDirection::Upload) {
        emit statusMessage(kind == TaskKind::Directory ? tr("Queued folder upload: %1").arg(name)
                                                       : tr("Queued upload: %1").arg(name), 3000);
    } else {
        emit statusMessage(kind == TaskKind::Directory ? tr("Queued folder download: %1").arg(name)
                                                       : tr("Queued download: %1").arg(name), 3000);
    }
    return result;
}

SubmitResult SyncService::uploadFile(const QString &localPath, const TaskContinuation &continuation)
{
    if (localPath.trimmed().isEmpty()) {
        return reject(SubmitError::Validation, tr("File path is required"));
    }
    SubmitResult result;
    if (!checkConfigured(&result)) {
        return result;
    }

    const QFileInfo info(localPath);
    if (!info.exists()) {
        return reject(SubmitError::NotFound, tr("File does not exist: %1").arg(localPath));
    }
    if (info.isDir()) {
        return submitSingle(TaskKind::Directory, TransferDirection::Upload,
                            info.absoluteFilePath(), 0, continuation);
    }
    if (!config_->isFileSizeAllowed(info.size())) {
        return reject(SubmitError::SizeExceeded,
                      tr("File size exceeds limit: %1 (%2 > %3)")
                          .arg(localPath,
                               rsyncq::formatFileSize(info.size()),
                               rsyncq::formatFileSize(config_->settings().maxFileSize)));
    }
    return submitSingle(TaskKind::SingleFile, TransferDirection::Upload,
                        info.absoluteFilePath(), info.size(), continuation);
}

SubmitResult SyncService::downloadFile(const QString &localPath, const TaskContinuation &continuation)
{
    if (localPath.trimmed().isEmpty()) {
        return reject(SubmitError::Validation, tr("File path is required"));
    }
    SubmitResult result;
    if (!checkConfigured(&result)) {
        return result;
    }

    const QFileInfo info(localPath);
    const QString parentDir = info.absolutePath();
    if (!QDir().mkpath(parentDir)) {
        return reject(SubmitError::Validation, tr("Cannot create directory: %1").arg(parentDir));
    }
    return submitSingle(TaskKind::SingleFile, TransferDirection::Download,
                        info.absoluteFilePath(), 0, continuation);
}

SubmitResult SyncService::uploadDirectory(const QString &localDir, const TaskContinuation &continuation)
{
    if (localDir.trimmed().isEmpty()) {
        return reject(SubmitError::Validation, tr("Directory path is required"));
    }
    SubmitResult result;
    if (!checkConfigured(&result)) {
        return result;
    }

    const QFileInfo info(localDir);
    if (!info.isDir()) {
        return reject(SubmitError::NotFound, tr("Directory does not exist: %1").arg(localDir));
    }
    return submitSingle(TaskKind::Directory, TransferDirection::Upload,
                        info.absoluteFilePath(), 0, continuation);
}

SubmitResult SyncService::downloadDirectory(const QString &localDir, const TaskContinuation &continuation)
{
    if (localDir.trimmed().isEmpty()) {
        return reject(SubmitError::Validation, tr("Directory path is required"));
    }
    SubmitResult result;
    if (!checkConfigured(&result)) {
        return result;
    }

    const QString absolute = QFileInfo(localDir).absoluteFilePath();
    if (!QDir().mkpath(absolute)) {
        return reject(SubmitError::Validation, tr("Cannot create directory: %1").arg(absolute));
    }
    return submitSingle(TaskKind::Directory, TransferDirection::Download,
                        absolute, 0, continuation);
}

SubmitResult SyncService::compare(const QString &localPath, const TaskContinuation &continuation)
{
    SubmitResult result;
    if (!checkConfigured(&result)) {
        return result;
    }

    const QString target = localPath.trimmed().isEmpty() ? config_->localRoot() : localPath;
    const QFileInfo info(target);
    if (!info.exists()) {
        return reject(SubmitError::NotFound, tr("Path does not exist: %1").arg(target));
    }

    SubmitOptions options;
    options.totalBytes = info.isDir() ? 0 : info.size();
    options.continuation = continuation;
    options.dryRun = true;

    const TaskKind kind = info.isDir() ? TaskKind::Directory : TaskKind::SingleFile;
    result = pool_->submit(kind, TransferDirection::Upload, {info.absoluteFilePath()}, options);
    if (!result.ok()) {
        emit requestRejected(result.error, result.message);
        return result;
    }

    emit statusMessage(tr("Checking differences: %1").arg(info.fileName()), 3000);
    return result;
}

SyncPlan SyncService::plan(const QList<BatchFile> &files, int batchSize)
{
    QList<BatchFile> byTier[FileCategoryCount];
    for (const BatchFile &file : files) {
        const Classification c = FileClassifier::classify(file.path, file.size);
        byTier[c.priority].append(file);
    }

    SyncPlan result;
    for (int tier = 0; tier < FileCategoryCount; ++tier) {
        const auto category = static_cast<FileCategory>(tier);

        if (!FileClassifier::isBatchable(category)) {
            for (const BatchFile &file : byTier[tier]) {
                PlannedUnit unit;
                unit.kind = TaskKind::SingleFile;
                unit.tier = category;
                unit.files.append(file);
                unit.totalBytes = file.size;
                result.units.append(unit);
            }
            continue;
        }

        const QList<FileBatch> batches = FileBatcher::partition(byTier[tier], category, batchSize);
        for (const FileBatch &batch : batches) {
            PlannedUnit unit;
            unit.kind = TaskKind::Batch;
            unit.tier = category;
            unit.files = batch.files;
            unit.totalBytes = batch.totalBytes;
            unit.batchNumber = ++result.batchCount;
            result.units.append(unit);
        }
    }
    return result;
}

SubmitResult SyncService::syncFiles(const QStringList &paths,
                                    TransferDirection direction,
                                    const TaskContinuation &continuation)
{
    if (paths.isEmpty()) {
        return reject(SubmitError::Validation, tr("File paths are required"));
    }
    SubmitResult result;
    if (!checkConfigured(&result)) {
        return result;
    }

    const SyncSettings &settings = config_->settings();
    const QDir root(config_->localRoot());
    const bool upload = direction == TransferDirection::Upload;

    QList<BatchFile> underRoot;
    QList<BatchFile> outsideRoot;
    int skipped = 0;

    for (const QString &path : paths) {
        if (path.trimmed().isEmpty()) {
            ++skipped;
            continue;
        }

        QString absolute = path;
        if (QFileInfo(path).isRelative()) {
            absolute = QFileInfo::exists(path) ? QFileInfo(path).absoluteFilePath()
                                               : root.absoluteFilePath(path);
        }
        absolute = QDir::cleanPath(absolute);

        const QFileInfo info(absolute);
        qint64 size = 0;
        if (upload) {
            if (!info.isFile()) {
                qDebug() << "SyncService: skipping missing file" << path;
                ++skipped;
                continue;
            }
            size = info.size();
            if (!config_->isFileSizeAllowed(size)) {
                qDebug() << "SyncService: skipping oversized file" << path;
                ++skipped;
                continue;
            }
        } else if (info.isFile()) {
            size = info.size();
        }

        BatchFile file{absolute, size};
        if (isUnderLocalRoot(absolute)) {
            underRoot.append(file);
        } else {
            outsideRoot.append(file);
        }
    }

    if (underRoot.isEmpty() && outsideRoot.isEmpty()) {
        return reject(SubmitError::Validation, tr("No valid files to sync"));
    }

    const int batchSize = pool_->adaptiveController()
        ? pool_->adaptiveController()->params().batchSize
        : settings.batchSize;
    const SyncPlan syncPlan = plan(underRoot, batchSize);

    for (const PlannedUnit &unit : syncPlan.units) {
        SubmitOptions options;
        options.tier = unit.tier;
        options.totalBytes = unit.totalBytes;
        options.continuation = continuation;

        QStringList unitPaths;
        for (const BatchFile &file : unit.files) {
            unitPaths.append(file.path);
        }

        if (unit.kind == TaskKind::Batch) {
            options.sourceRoot = root.absolutePath();
            options.batchNumber = unit.batchNumber;
            options.batchCount = syncPlan.batchCount;
        }

        const SubmitResult submitted = pool_->submit(unit.kind, direction, unitPaths, options);
        if (!submitted.ok()) {
            emit requestRejected(submitted.error, submitted.message);
            return submitted;
        }
        result.taskIds.append(submitted.taskIds);
    }

    // Files outside local_path cannot share a --files-from root
    for (const BatchFile &file : outsideRoot) {
        SubmitOptions options;
        options.totalBytes = file.size;
        options.continuation = continuation;
        const SubmitResult submitted = pool_->submit(TaskKind::SingleFile, direction, {file.path}, options);
        if (!submitted.ok()) {
            emit requestRejected(submitted.error, submitted.message);
            return submitted;
        }
        result.taskIds.append(submitted.taskIds);
    }

    const int fileCount = underRoot.size() + outsideRoot.size();
    result.message = tr("Queued %1 tasks for %2 files").arg(result.taskIds.size()).arg(fileCount);
    if (skipped > 0) {
        result.message += tr(" (%1 skipped)").arg(skipped);
    }
    qInfo() << "SyncService:" << result.message;
    emit statusMessage(result.message, 3000);
    return result;
}

QStringList SyncService::scanLocalFiles() const
{
    QStringList files;
    if (!config_) {
        return files;
    }

    const QString root = config_->localRoot();
    if (root.isEmpty() || !QFileInfo(root).isDir()) {
        return files;
    }

    QDirIterator it(root, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        if (config_->shouldTransfer(config_->relativePath(path))) {
            files.append(path);
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

SubmitResult SyncService::syncAll(const TaskContinuation &continuation)
{
    SubmitResult result;
    if (!checkConfigured(&result)) {
        return result;
    }

    const QString root = config_->localRoot();
    if (!QFileInfo(root).isDir()) {
        return reject(SubmitError::NotFound, tr("Local path does not exist: %1").arg(root));
    }

    const QStringList files = scanLocalFiles();
    if (files.isEmpty()) {
        result.message = tr("No files to sync");
        emit statusMessage(result.message, 3000);
        return result;
    }
    return syncFiles(files, TransferDirection::Upload, continuation);
}

bool SyncService::cancel(TaskId id)
{
    return pool_->cancel(id);
}

int SyncService::cancelAll()
{
    const int cancelled = pool_->cancelAll();
    if (cancelled > 0) {
        emit statusMessage(tr("Cancelled %1 tasks").arg(cancelled), 3000);
    }
    return cancelled;
}

PoolStatus SyncService::status() const
{
    return pool_->status();
}
