#include "fileclassifier.h"

#include <QFileInfo>

namespace {

struct NamePattern {
    enum Match { Suffix, Prefix, Exact };
    Match match;
    const char *text;
};

// Well-known configuration files, matched against the file name.
constexpr NamePattern kConfigPatterns[] = {
    {NamePattern::Suffix, ".json"},
    {NamePattern::Suffix, ".yaml"},
    {NamePattern::Suffix, ".yml"},
    {NamePattern::Suffix, ".toml"},
    {NamePattern::Suffix, ".ini"},
    {NamePattern::Suffix, ".conf"},
    {NamePattern::Suffix, ".cfg"},
    {NamePattern::Suffix, ".env"},
    {NamePattern::Suffix, ".mk"},
    {NamePattern::Prefix, "Makefile"},
    {NamePattern::Exact, ".gitignore"},
    {NamePattern::Exact, ".gitattributes"},
    {NamePattern::Prefix, "README"},
    {NamePattern::Prefix, "LICENSE"},
};

constexpr const char *kBinaryExtensions[] = {
    "exe", "dll", "so", "dylib", "bin", "app",
    "jpg", "jpeg", "png", "gif", "bmp", "ico",
    "mp3", "mp4", "avi", "mov", "wav", "flac",
    "zip", "tar", "gz", "rar", "7z", "pdf",
    "doc", "docx", "xls", "xlsx", "ppt", "pptx",
};

bool matches(const NamePattern &pattern, const QString &fileName)
{
    const QLatin1String text(pattern.text);
    switch (pattern.match) {
    case NamePattern::Suffix:
        return fileName.endsWith(text);
    case NamePattern::Prefix:
        return fileName.startsWith(text);
    case NamePattern::Exact:
        return fileName == text;
    }
    return false;
}

} // namespace

bool Classification::isBatchable() const
{
    return FileClassifier::isBatchable(category);
}

Classification FileClassifier::classify(const QString &path, qint64 size)
{
    const QFileInfo info(path);
    return classify(info.fileName(), info.suffix(), size);
}

Classification FileClassifier::classify(const QString &fileName,
                                        const QString &extension,
                                        qint64 size)
{
    FileCategory category;
    if (isConfigFile(fileName)) {
        category = FileCategory::Config;
    } else if (isBinaryExtension(extension)) {
        category = FileCategory::Binary;
    } else if (size < SmallFileLimit) {
        category = FileCategory::Small;
    } else if (size < LargeFileThreshold) {
        category = FileCategory::Medium;
    } else {
        category = FileCategory::Large;
    }

    Classification result;
    result.category = category;
    result.priority = priorityOf(category);
    return result;
}

bool FileClassifier::isConfigFile(const QString &fileName)
{
    if (fileName.isEmpty()) {
        return false;
    }
    for (const NamePattern &pattern : kConfigPatterns) {
        if (matches(pattern, fileName)) {
            return true;
        }
    }
    return false;
}

bool FileClassifier::isBinaryExtension(const QString &extension)
{
    if (extension.isEmpty()) {
        return false;
    }
    const QString lower = extension.toLower();
    for (const char *binaryExt : kBinaryExtensions) {
        if (lower == QLatin1String(binaryExt)) {
            return true;
        }
    }
    return false;
}

int FileClassifier::priorityOf(FileCategory category)
{
    return static_cast<int>(category);
}

bool FileClassifier::isBatchable(FileCategory category)
{
    return category != FileCategory::Config && category != FileCategory::Large;
}
