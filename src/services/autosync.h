/**
 * @file autosync.h
 * @brief Periodic and on-save synchronization of the local_path tree.
 */

#ifndef AUTOSYNC_H
#define AUTOSYNC_H

#include <QHash>
#include <QObject>
#include <QPointer>
#include <QSet>
#include <QString>
#include <QStringList>

class QFileSystemWatcher;
class QTimer;
class SyncConfig;
class SyncService;
class TaskPool;

/**
 * @brief Drives SyncService::syncAll() on a timer and uploads saved files.
 *
 * Periodic sync and sync-on-save are switched separately and both only
 * act while the object is enabled. With periodic sync, a cycle runs
 * immediately and then every interval.
 * A cycle that comes due while the pool still has outstanding tasks is
 * skipped, so cycles never pile up behind a slow transfer.
 *
 * With sync-on-save, a QFileSystemWatcher follows the files under
 * local_path. Saved files that pass the include/exclude filters are
 * collected for SaveDebounceMs and uploaded together through
 * SyncService::syncFiles().
 *
 * @par Example usage:
 * @code
 * AutoSync *autoSync = new AutoSync(config, service, pool, this);
 * autoSync->applySettings();
 * connect(autoSync, &AutoSync::cycleStarted, this, &Cli::onCycle);
 * autoSync->setEnabled(true);
 * @endcode
 */
class AutoSync : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultIntervalMs = 30000;
    static constexpr int SaveDebounceMs = 300;

    AutoSync(SyncConfig *config, SyncService *service, TaskPool *pool, QObject *parent = nullptr);
    ~AutoSync() override;

    /// @brief Takes auto_sync, sync_interval and sync_on_save from the configuration.
    void applySettings();

    void setEnabled(bool enabled);
    [[nodiscard]] bool isEnabled() const { return enabled_; }

    /// @brief Runs syncAll() every interval while enabled; off by default.
    void setPeriodicSync(bool enabled);
    [[nodiscard]] bool periodicSync() const { return periodicSync_; }

    /// @brief Values below 1 select DefaultIntervalMs.
    void setInterval(int intervalMs);
    [[nodiscard]] int interval() const;

    void setSyncOnSave(bool enabled);
    [[nodiscard]] bool syncOnSave() const { return syncOnSave_; }

    /// @brief Cycles started since the last setEnabled(true).
    [[nodiscard]] int cycleCount() const { return cycleCount_; }

    /// @brief Paths the file watcher follows; empty without sync-on-save.
    [[nodiscard]] QStringList watchedPaths() const;

public slots:
    /**
     * @brief Runs one sync cycle now, unless the pool is busy.
     * @return True if the cycle ran.
     */
    bool runCycle();

    /// @brief Queues a saved file for upload after the debounce delay; ignored unless sync-on-save is active.
    void notifySaved(const QString &path);

signals:
    /**
     * @brief A cycle ran.
     * @param cycle 1-based cycle number.
     * @param taskCount Tasks submitted, 0 when nothing needed syncing.
     */
    void cycleStarted(int cycle, int taskCount, const QString &message);

    /// @brief A cycle came due while earlier tasks were still outstanding.
    void cycleSkipped(const QString &reason);

    /// @brief Saved files were submitted for upload.
    void filesSaved(const QStringList &paths, int taskCount);

private slots:
    void onIntervalTimer();
    void onDebounceTimer();
    void onFileChanged(const QString &path);
    void onDirectoryChanged(const QString &path);

private:
    void startWatching();
    void stopWatching();
    void watchFile(const QString &path);
    [[nodiscard]] bool isSyncCandidate(const QString &path) const;

    SyncConfig *config_ = nullptr;
    SyncService *service_ = nullptr;
    QPointer<TaskPool> pool_;

    QTimer *intervalTimer_ = nullptr;
    QTimer *debounceTimer_ = nullptr;
    QFileSystemWatcher *watcher_ = nullptr;

    bool enabled_ = false;
    bool periodicSync_ = false;
    bool syncOnSave_ = false;
    int cycleCount_ = 0;

    QHash<QString, qint64> modified_;  ///< Last seen mtime (ms) per watched file
    QSet<QString> saved_;              ///< Pending the debounce
};

#endif // AUTOSYNC_H
