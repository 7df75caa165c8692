/**
 * @file syncconfig.h
 * @brief Project configuration provider: loading, merging, validation and
 *        derived rsync/ssh arguments.
 */

#ifndef SYNCCONFIG_H
#define SYNCCONFIG_H

#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>

/**
 * @brief rsync flags toggled by the "rsync_options" config object.
 */
struct RsyncFlags {
    bool archive = true;           ///< -a
    bool compress = false;         ///< -z on every transfer; otherwise AdaptiveParams decides
    bool progress = true;          ///< --progress
    bool stats = true;             ///< --stats
    bool deleteExtraneous = false; ///< --delete
    bool checksum = false;         ///< -c
    bool verbose = false;          ///< -v
};

/**
 * @brief All configuration values with their defaults.
 */
struct SyncSettings {
    // Connection
    QString host;
    QString username;
    int port = 22;
    QString privateKeyPath = QStringLiteral("~/.ssh/id_rsa");

    // Paths
    QString localPath;
    QString remotePath;

    // Sync behavior
    bool autoSync = false;
    bool syncOnSave = true;
    int syncIntervalMs = 30000;
    bool configFileReminder = true;

    // Filtering
    QStringList includePatterns;
    QStringList excludePatterns = {QStringLiteral(".git/"), QStringLiteral("*.tmp"),
                                   QStringLiteral("*.log"), QStringLiteral(".DS_Store")};
    qint64 maxFileSize = 10485760;  ///< 0 disables the limit

    // Performance
    int maxConnections = 5;
    int batchSize = 50;
    int connectionTimeoutMs = 30000;

    RsyncFlags rsync;
    QString rsyncProgram = QStringLiteral("rsync");
    QString sshProgram = QStringLiteral("ssh");
};

/**
 * @brief Read-only configuration source for the scheduler and executors.
 *
 * Values are merged defaults -> project file -> explicit overrides. Consumers
 * read settings() at each decision instead of caching them.
 *
 * @par Example usage:
 * @code
 * SyncConfig *config = new SyncConfig(this);
 * QString error;
 * if (!config->loadProjectFile(QDir::currentPath(), &error)) {
 *     qWarning() << error;
 * }
 * const QStringList problems = config->validate();
 * @endcode
 */
class SyncConfig : public QObject
{
    Q_OBJECT

public:
    explicit SyncConfig(QObject *parent = nullptr);
    ~SyncConfig() override;

    /// @name Loading
    /// @{

    /// @brief Project file names searched in each directory, in order.
    [[nodiscard]] static QStringList projectFileNames();

    /**
     * @brief Finds the nearest project file from @p startDir upward.
     * @return Absolute path, or an empty string when none exists.
     */
    [[nodiscard]] static QString findProjectFile(const QString &startDir);

    /**
     * @brief Locates and loads the nearest project file.
     * @param startDir Directory the upward search starts in.
     * @param errorMessage Receives the reason on failure (optional).
     * @return True if a file was found and parsed.
     */
    bool loadProjectFile(const QString &startDir, QString *errorMessage = nullptr);

    /**
     * @brief Loads one JSON/JSONC file over the defaults.
     * @return True on success; settings are left unchanged on failure.
     */
    bool loadFile(const QString &path, QString *errorMessage = nullptr);

    /// @brief Merges explicit override values on top of the current settings.
    void applyOverrides(const QJsonObject &overrides);

    /// @brief Replaces all settings.
    void setSettings(const SyncSettings &settings);

    /// @brief Removes // and /* */ comments outside of string literals.
    [[nodiscard]] static QByteArray stripJsonComments(const QByteArray &data);

    /**
     * @brief Overwrites the fields of @p settings present in @p object.
     *
     * A relative local_path is resolved against @p baseDir, or against the
     * working directory when @p baseDir is empty.
     */
    static void mergeJson(SyncSettings &settings, const QJsonObject &object,
                          const QString &baseDir = QString());
    /// @}

    /// @name Access
    /// @{
    [[nodiscard]] const SyncSettings &settings() const { return settings_; }
    [[nodiscard]] QString configFilePath() const { return configFilePath_; }
    [[nodiscard]] bool isLoadedFromFile() const { return !configFilePath_.isEmpty(); }

    /// @brief Absolute, cleaned local_path; empty when unset.
    [[nodiscard]] QString localRoot() const;

    /// @brief True when host, username, local_path and remote_path are set.
    [[nodiscard]] bool isConfigured() const;

    /// @brief Returns human-readable problems; empty when valid.
    [[nodiscard]] QStringList validate() const;

    [[nodiscard]] QJsonObject toJson() const;
    /// @}

    /// @name Derived Values
    /// @{
    [[nodiscard]] QStringList rsyncOptions() const;
    [[nodiscard]] QStringList sshOptions() const;

    /// @brief "user@host:path", or @p path alone when no host is configured.
    [[nodiscard]] QString remoteDestination(const QString &remotePath) const;

    /// @brief Remote counterpart of a local path under local_path.
    [[nodiscard]] QString remotePathFor(const QString &localPath) const;

    /// @brief Path relative to local_path, or @p fullPath unchanged when outside it.
    [[nodiscard]] QString relativePath(const QString &fullPath) const;

    [[nodiscard]] bool isFileSizeAllowed(qint64 size) const;

    /**
     * @brief Applies exclude then include patterns to a relative path.
     *
     * A pattern ending in "/" matches a directory anywhere in the path.
     * Other patterns are globs tested against the file name and the whole
     * relative path. With include patterns set, a path must match one.
     */
    [[nodiscard]] bool shouldTransfer(const QString &relativePath) const;

    [[nodiscard]] static QString expandHome(const QString &path);

    /// @brief Expands "~" and makes @p path absolute against @p baseDir.
    [[nodiscard]] static QString resolvePath(const QString &path, const QString &baseDir = QString());
    /// @}

signals:
    void changed();

private:
    [[nodiscard]] static bool matchesPattern(const QString &relativePath, const QString &pattern);

    SyncSettings settings_;
    QString configFilePath_;
};

#endif // SYNCCONFIG_H
