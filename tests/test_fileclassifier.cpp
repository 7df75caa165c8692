#include <QtTest>

#include "services/fileclassifier.h"

Q_DECLARE_METATYPE(FileCategory)

class TestFileClassifier : public QObject
{
    Q_OBJECT

private slots:
    // ========== Configuration files ==========

    void testConfigPatterns_data()
    {
        QTest::addColumn<QString>("path");

        QTest::newRow("json") << "src/app/settings.json";
        QTest::newRow("yaml") << "deploy.yaml";
        QTest::newRow("yml") << ".github/workflows/ci.yml";
        QTest::newRow("toml") << "Cargo.toml";
        QTest::newRow("ini") << "php.ini";
        QTest::newRow("conf") << "nginx.conf";
        QTest::newRow("cfg") << "setup.cfg";
        QTest::newRow("env") << ".env";
        QTest::newRow("mk") << "rules.mk";
        QTest::newRow("makefile") << "Makefile";
        QTest::newRow("makefile-variant") << "Makefile.am";
        QTest::newRow("gitignore") << ".gitignore";
        QTest::newRow("gitattributes") << ".gitattributes";
        QTest::newRow("readme") << "README.md";
        QTest::newRow("license") << "LICENSE";
    }

    void testConfigPatterns()
    {
        QFETCH(QString, path);
        const Classification c = FileClassifier::classify(path, 512);
        QCOMPARE(c.category, FileCategory::Config);
        QCOMPARE(c.priority, 0);
        QVERIFY(!c.isBatchable());
    }

    void testConfigWinsOverSize()
    {
        // A 20 MiB package-lock.json is still a config file
        const Classification c = FileClassifier::classify("package-lock.json", 20LL * 1024 * 1024);
        QCOMPARE(c.category, FileCategory::Config);
    }

    void testConfigWinsOverBinaryExtension()
    {
        // README.pdf matches both the README prefix and the pdf extension
        const Classification c = FileClassifier::classify("README.pdf", 100);
        QCOMPARE(c.category, FileCategory::Config);
    }

    void testConfigMatchIsOnFileNameOnly()
    {
        QVERIFY(!FileClassifier::isConfigFile("notes.txt"));
        QCOMPARE(FileClassifier::classify("config.json/data.txt", 10).category, FileCategory::Small);
    }

    // ========== Binary files ==========

    void testBinaryExtensions_data()
    {
        QTest::addColumn<QString>("path");
        QTest::addColumn<qint64>("size");

        QTest::newRow("png small") << "assets/logo.png" << qint64(2048);
        QTest::newRow("mp4 huge") << "video/intro.mp4" << qint64(500LL * 1024 * 1024);
        QTest::newRow("zip") << "release.zip" << qint64(3 * 1024 * 1024);
        QTest::newRow("uppercase") << "PHOTO.JPG" << qint64(4096);
        QTest::newRow("so") << "lib/libfoo.so" << qint64(1);
        QTest::newRow("docx") << "report.docx" << qint64(70000);
    }

    void testBinaryExtensions()
    {
        QFETCH(QString, path);
        QFETCH(qint64, size);

        const Classification c = FileClassifier::classify(path, size);
        QCOMPARE(c.category, FileCategory::Binary);
        QCOMPARE(c.priority, 3);
        QVERIFY(c.isBatchable());
    }

    void testNoExtensionIsNotBinary()
    {
        QVERIFY(!FileClassifier::isBinaryExtension(QString()));
        QCOMPARE(FileClassifier::classify("bin/run", 100).category, FileCategory::Small);
    }

    // ========== Size thresholds ==========

    void testSizeBoundaries_data()
    {
        QTest::addColumn<qint64>("size");
        QTest::addColumn<FileCategory>("expected");

        QTest::newRow("empty") << qint64(0) << FileCategory::Small;
        QTest::newRow("500KB") << qint64(500 * 1024) << FileCategory::Small;
        QTest::newRow("just under 1MiB") << FileClassifier::SmallFileLimit - 1 << FileCategory::Small;
        QTest::newRow("exactly 1MiB") << FileClassifier::SmallFileLimit << FileCategory::Medium;
        QTest::newRow("2MB") << qint64(2 * 1024 * 1024) << FileCategory::Medium;
        QTest::newRow("just under 10MiB") << FileClassifier::LargeFileThreshold - 1 << FileCategory::Medium;
        QTest::newRow("exactly 10MiB") << FileClassifier::LargeFileThreshold << FileCategory::Large;
        QTest::newRow("15MB") << qint64(15 * 1024 * 1024) << FileCategory::Large;
    }

    void testSizeBoundaries()
    {
        QFETCH(qint64, size);
        QFETCH(FileCategory, expected);

        QCOMPARE(FileClassifier::classify("src/data.txt", size).category, expected);
    }

    // ========== Priorities ==========

    void testPriorityOrder()
    {
        QVERIFY(FileClassifier::priorityOf(FileCategory::Config) < FileClassifier::priorityOf(FileCategory::Small));
        QVERIFY(FileClassifier::priorityOf(FileCategory::Small) < FileClassifier::priorityOf(FileCategory::Medium));
        QVERIFY(FileClassifier::priorityOf(FileCategory::Medium) < FileClassifier::priorityOf(FileCategory::Binary));
        QVERIFY(FileClassifier::priorityOf(FileCategory::Binary) < FileClassifier::priorityOf(FileCategory::Large));
        QCOMPARE(FileClassifier::priorityOf(FileCategory::Large), FileCategoryCount - 1);
    }

    void testBatchableCategories()
    {
        QVERIFY(!FileClassifier::isBatchable(FileCategory::Config));
        QVERIFY(FileClassifier::isBatchable(FileCategory::Small));
        QVERIFY(FileClassifier::isBatchable(FileCategory::Medium));
        QVERIFY(FileClassifier::isBatchable(FileCategory::Binary));
        QVERIFY(!FileClassifier::isBatchable(FileCategory::Large));
    }

    void testDeterministic()
    {
        const Classification a = FileClassifier::classify("src/main.cpp", 1234);
        const Classification b = FileClassifier::classify("src/main.cpp", 1234);
        QCOMPARE(a.category, b.category);
        QCOMPARE(a.priority, b.priority);
    }

    void testCategoryNames()
    {
        QCOMPARE(QString(fileCategoryToString(FileCategory::Config)), QString("config"));
        QCOMPARE(QString(fileCategoryToString(FileCategory::Large)), QString("large"));
    }
};

QTEST_MAIN(TestFileClassifier)
#include "test_fileclassifier.moc"
