/**
 * @file fileclassifier.h
 * @brief Assigns a transfer category and priority tier to candidate files.
 */

#ifndef FILECLASSIFIER_H
#define FILECLASSIFIER_H

#include <QString>
#include <QtGlobal>

/**
 * @brief Transfer category of a file, in admission priority order.
 *
 * The numeric value is the priority tier: lower values are admitted first.
 */
enum class FileCategory {
    Config = 0,  ///< Well-known configuration files, always individual and first
    Small,       ///< Smaller than 1 MiB
    Medium,      ///< 1 MiB up to 10 MiB
    Binary,      ///< Media, archive or executable extension, any size
    Large        ///< 10 MiB or more, always individual, never batched
};

/// Number of FileCategory values (and priority tiers).
inline constexpr int FileCategoryCount = 5;

/// @brief Convert FileCategory to a lowercase name for logs and reports
[[nodiscard]] inline const char* fileCategoryToString(FileCategory category) {
    switch (category) {
        case FileCategory::Config: return "config";
        case FileCategory::Small: return "small";
        case FileCategory::Medium: return "medium";
        case FileCategory::Binary: return "binary";
        case FileCategory::Large: return "large";
    }
    return "unknown";
}

/**
 * @brief Result of classifying one file.
 */
struct Classification {
    FileCategory category = FileCategory::Small;
    int priority = 0;  ///< Tier index, 0 is the highest priority

    [[nodiscard]] bool isBatchable() const;
};

/**
 * @brief Pure classification of files by name, extension and size.
 *
 * Rules are evaluated in order: configuration pattern, binary extension,
 * then size thresholds. A file that is both a configuration file and has a
 * binary extension is classified as Config. No filesystem access is made;
 * the caller supplies the size.
 *
 * @par Example usage:
 * @code
 * Classification c = FileClassifier::classify("src/app/settings.json", 512);
 * // c.category == FileCategory::Config, c.priority == 0
 * @endcode
 */
class FileClassifier
{
public:
    static constexpr qint64 SmallFileLimit = 1024 * 1024;         ///< Small: size < 1 MiB
    static constexpr qint64 LargeFileThreshold = 10 * 1024 * 1024; ///< Large: size >= 10 MiB

    /**
     * @brief Classifies a file given its path and size.
     * @param path File path, absolute or relative; only the name is inspected.
     * @param size File size in bytes.
     */
    [[nodiscard]] static Classification classify(const QString &path, qint64 size);

    /**
     * @brief Classifies a file given its name, extension and size.
     * @param fileName File name without directories.
     * @param extension Last suffix without the dot (case-insensitive).
     * @param size File size in bytes.
     */
    [[nodiscard]] static Classification classify(const QString &fileName,
                                                 const QString &extension,
                                                 qint64 size);

    /// @brief True if the name matches the configuration file pattern table.
    [[nodiscard]] static bool isConfigFile(const QString &fileName);

    /// @brief True if the extension is in the media/archive/executable table.
    [[nodiscard]] static bool isBinaryExtension(const QString &extension);

    /// @brief Priority tier for a category (0 is highest).
    [[nodiscard]] static int priorityOf(FileCategory category);

    /// @brief Config and Large files are scheduled individually, the rest in batches.
    [[nodiscard]] static bool isBatchable(FileCategory category);
};

#endif // FILECLASSIFIER_H
