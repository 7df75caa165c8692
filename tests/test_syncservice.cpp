#include <QtTest>
#include <QDir>
#include <QFile>
#include <QJsonObject>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "mocks/mocktransferexecutor.h"
#include "models/taskpool.h"
#include "services/adaptivecontroller.h"
#include "services/metricsstore.h"
#include "services/syncconfig.h"
#include "services/syncservice.h"

class TestSyncService : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir = nullptr;
    SyncConfig *config = nullptr;
    AdaptiveController *controller = nullptr;
    MetricsStore *metrics = nullptr;
    MockTransferExecutor *mockExecutor = nullptr;
    TaskPool *pool = nullptr;
    SyncService *service = nullptr;

    QString root() const { return tempDir->path(); }

    QString createFile(const QString &relative, qint64 size = 16)
    {
        const QString path = root() + '/' + relative;
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile file(path);
        if (file.open(QIODevice::WriteOnly)) {
            file.resize(size);
            file.close();
        }
        return path;
    }

    TransferTask taskAt(const SubmitResult &result, int index) const
    {
        return *pool->task(result.taskIds.at(index));
    }

    static QList<BatchFile> smallFiles(int count)
    {
        QList<BatchFile> files;
        for (int i = 0; i < count; ++i) {
            files.append(BatchFile{QStringLiteral("/project/src/file%1.cpp").arg(i), 100});
        }
        return files;
    }

private slots:
    void init()
    {
        tempDir = new QTemporaryDir();
        QVERIFY(tempDir->isValid());

        config = new SyncConfig(this);
        QJsonObject o;
        o["host"] = "build.example.com";
        o["username"] = "deploy";
        o["local_path"] = root();
        o["remote_path"] = "/srv/app";
        o["private_key_path"] = "";
        config->applyOverrides(o);

        controller = new AdaptiveController(this);
        metrics = new MetricsStore(this);
        pool = new TaskPool(config, controller, metrics, this);
        mockExecutor = new MockTransferExecutor(this);
        pool->setExecutor(mockExecutor);
        pool->setInterBatchDelay(0);
        service = new SyncService(config, pool, this);
    }

    void cleanup()
    {
        delete service;
        service = nullptr;
        delete pool;
        pool = nullptr;
        delete mockExecutor;
        mockExecutor = nullptr;
        delete metrics;
        metrics = nullptr;
        delete controller;
        controller = nullptr;
        delete config;
        config = nullptr;
        delete tempDir;
        tempDir = nullptr;
    }

    // ========== Single file upload ==========

    void testUploadFileQueuesTask()
    {
        const QString path = createFile("src/main.cpp", 500 * 1024);
        QSignalSpy statusSpy(service, &SyncService::statusMessage);

        const SubmitResult result = service->uploadFile(path);

        QVERIFY(result.ok());
        QCOMPARE(result.taskIds.size(), 1);
        const TransferTask task = taskAt(result, 0);
        QCOMPARE(task.kind, TaskKind::SingleFile);
        QCOMPARE(task.direction, TransferDirection::Upload);
        QCOMPARE(task.totalBytes, qint64(500 * 1024));
        QCOMPARE(task.remotePath, QString("/srv/app/src/main.cpp"));

        QCOMPARE(statusSpy.count(), 1);
        QCOMPARE(statusSpy.at(0).at(0).toString(), QString("Queued upload: main.cpp"));
        QCOMPARE(statusSpy.at(0).at(1).toInt(), 3000);
    }

    void testUploadFileRequiresPath()
    {
        QSignalSpy rejectedSpy(service, &SyncService::requestRejected);

        const SubmitResult result = service->uploadFile("  ");

        QCOMPARE(result.error, SubmitError::Validation);
        QCOMPARE(result.message, QString("File path is required"));
        QCOMPARE(rejectedSpy.count(), 1);
        QCOMPARE(pool->activeCount(), 0);
    }

    void testUploadFileMissing()
    {
        const QString path = root() + "/missing.txt";
        const SubmitResult result = service->uploadFile(path);

        QCOMPARE(result.error, SubmitError::NotFound);
        QCOMPARE(result.message, QString("File does not exist: %1").arg(path));
    }

    void testUploadFileTooLarge()
    {
        const QString path = createFile("data/dump.sql", 11 * 1024 * 1024);

        const SubmitResult result = service->uploadFile(path);

        QCOMPARE(result.error, SubmitError::SizeExceeded);
        QVERIFY(result.message.startsWith("File size exceeds limit: "));
        QCOMPARE(pool->activeCount(), 0);
    }

    void testUploadFileNotConfigured()
    {
        const QString path = createFile("a.txt");
        QJsonObject o;
        o["host"] = "";
        config->applyOverrides(o);

        const SubmitResult result = service->uploadFile(path);

        QCOMPARE(result.error, SubmitError::NotConfigured);
        QCOMPARE(result.message,
                 QString("Rsync is not configured: host, username, local_path and remote_path are required"));
    }

    void testUploadFileOnDirectoryUploadsDirectory()
    {
        createFile("assets/logo.png");
        const SubmitResult result = service->uploadFile(root() + "/assets");

        QVERIFY(result.ok());
        QCOMPARE(taskAt(result, 0).kind, TaskKind::Directory);
    }

    // ========== Single file download ==========

    void testDownloadFileCreatesParentDirectory()
    {
        const QString path = root() + "/fresh/nested/config.yaml";
        QSignalSpy statusSpy(service, &SyncService::statusMessage);

        const SubmitResult result = service->downloadFile(path);

        QVERIFY(result.ok());
        QVERIFY(QFileInfo(root() + "/fresh/nested").isDir());
        const TransferTask task = taskAt(result, 0);
        QCOMPARE(task.direction, TransferDirection::Download);
        QCOMPARE(task.remotePath, QString("/srv/app/fresh/nested/config.yaml"));
        QCOMPARE(statusSpy.at(0).at(0).toString(), QString("Queued download: config.yaml"));
    }

    void testDownloadFileRequiresPath()
    {
        QCOMPARE(service->downloadFile("").error, SubmitError::Validation);
    }

    // ========== Directories ==========

    void testUploadDirectory()
    {
        createFile("web/index.html");
        QSignalSpy statusSpy(service, &SyncService::statusMessage);

        const SubmitResult result = service->uploadDirectory(root() + "/web");

        QVERIFY(result.ok());
        const TransferTask task = taskAt(result, 0);
        QCOMPARE(task.kind, TaskKind::Directory);
        QCOMPARE(task.tier, FileCategory::Large);
        QCOMPARE(task.remotePath, QString("/srv/app/web"));
        QCOMPARE(statusSpy.at(0).at(0).toString(), QString("Queued folder upload: web"));
    }

    void testUploadDirectoryValidation()
    {
        SubmitResult result = service->uploadDirectory("");
        QCOMPARE(result.error, SubmitError::Validation);
        QCOMPARE(result.message, QString("Directory path is required"));

        const QString missing = root() + "/nowhere";
        result = service->uploadDirectory(missing);
        QCOMPARE(result.error, SubmitError::NotFound);
        QCOMPARE(result.message, QString("Directory does not exist: %1").arg(missing));

        result = service->uploadDirectory(createFile("plain.txt"));
        QCOMPARE(result.error, SubmitError::NotFound);
    }

    void testDownloadDirectoryCreatesTarget()
    {
        const QString target = root() + "/restore/assets";

        const SubmitResult result = service->downloadDirectory(target);

        QVERIFY(result.ok());
        QVERIFY(QFileInfo(target).isDir());
        QCOMPARE(taskAt(result, 0).direction, TransferDirection::Download);
    }

    // ========== Compare ==========

    void testCompareWholeTreeIsDryRunOfRoot()
    {
        createFile("src/main.cpp");
        QSignalSpy statusSpy(service, &SyncService::statusMessage);

        const SubmitResult result = service->compare();

        QVERIFY(result.ok());
        QCOMPARE(result.taskIds.size(), 1);
        const TransferTask task = taskAt(result, 0);
        QCOMPARE(task.kind, TaskKind::Directory);
        QVERIFY(task.dryRun);
        QCOMPARE(task.paths, QStringList{QFileInfo(root()).absoluteFilePath()});
        QCOMPARE(task.remotePath, QString("/srv/app"));
        QCOMPARE(statusSpy.count(), 1);
        QVERIFY(statusSpy.at(0).at(0).toString().startsWith("Checking differences: "));

        pool->flushEventQueue();
        QCOMPARE(mockExecutor->mockStartCount(), 1);
        QVERIFY(mockExecutor->mockStartRequests().at(0).dryRun);
    }

    void testCompareSingleFile()
    {
        const QString path = createFile("config/app.yaml", 300);

        const SubmitResult result = service->compare(path);

        QVERIFY(result.ok());
        const TransferTask task = taskAt(result, 0);
        QCOMPARE(task.kind, TaskKind::SingleFile);
        QVERIFY(task.dryRun);
        QCOMPARE(task.totalBytes, qint64(300));
        QCOMPARE(task.remotePath, QString("/srv/app/config/app.yaml"));
    }

    void testCompareMissingPath()
    {
        const QString missing = root() + "/gone.txt";
        QSignalSpy rejectedSpy(service, &SyncService::requestRejected);

        const SubmitResult result = service->compare(missing);

        QCOMPARE(result.error, SubmitError::NotFound);
        QCOMPARE(result.message, QString("Path does not exist: %1").arg(missing));
        QCOMPARE(rejectedSpy.count(), 1);
        QCOMPARE(pool->status().pending, 0);
    }

    void testUploadIsNotDryRun()
    {
        const SubmitResult result = service->uploadFile(createFile("a.txt"));
        QVERIFY(!taskAt(result, 0).dryRun);
    }

    // ========== Planning ==========

    void testPlanSplitsBatchableTiers()
    {
        const SyncPlan plan = SyncService::plan(smallFiles(120), 50);

        QCOMPARE(plan.units.size(), 3);
        QCOMPARE(plan.batchCount, 3);
        QCOMPARE(plan.units.at(0).files.size(), 50);
        QCOMPARE(plan.units.at(1).files.size(), 50);
        QCOMPARE(plan.units.at(2).files.size(), 20);
        QCOMPARE(plan.units.at(2).batchNumber, 3);
        QCOMPARE(plan.fileCount(), 120);
        for (const PlannedUnit &unit : plan.units) {
            QCOMPARE(unit.kind, TaskKind::Batch);
        }
    }

    void testPlanOrdersTiersAndKeepsSinglesApart()
    {
        QList<BatchFile> files;
        files.append(BatchFile{"/p/big.iso", 20LL * 1024 * 1024});
        files.append(BatchFile{"/p/photo.png", 300 * 1024});
        files.append(BatchFile{"/p/src/a.cpp", 1000});
        files.append(BatchFile{"/p/data.csv", 2 * 1024 * 1024});
        files.append(BatchFile{"/p/package.json", 800});
        files.append(BatchFile{"/p/tsconfig.json", 400});
        files.append(BatchFile{"/p/src/b.cpp", 2000});

        const SyncPlan plan = SyncService::plan(files, 50);

        QCOMPARE(plan.units.size(), 6);
        QCOMPARE(plan.units.at(0).kind, TaskKind::SingleFile);
        QCOMPARE(plan.units.at(0).tier, FileCategory::Config);
        QCOMPARE(plan.units.at(0).files.first().path, QString("/p/package.json"));
        QCOMPARE(plan.units.at(1).files.first().path, QString("/p/tsconfig.json"));

        QCOMPARE(plan.units.at(2).kind, TaskKind::Batch);
        QCOMPARE(plan.units.at(2).tier, FileCategory::Small);
        QCOMPARE(plan.units.at(2).files.size(), 2);
        QCOMPARE(plan.units.at(2).totalBytes, qint64(3000));
        QCOMPARE(plan.units.at(2).batchNumber, 1);

        QCOMPARE(plan.units.at(3).tier, FileCategory::Medium);
        QCOMPARE(plan.units.at(4).tier, FileCategory::Binary);
        QCOMPARE(plan.units.at(4).batchNumber, 3);

        QCOMPARE(plan.units.at(5).kind, TaskKind::SingleFile);
        QCOMPARE(plan.units.at(5).tier, FileCategory::Large);
        QCOMPARE(plan.units.at(5).batchNumber, 0);
        QCOMPARE(plan.batchCount, 3);
    }

    void testPlanEmpty()
    {
        const SyncPlan plan = SyncService::plan({}, 50);
        QVERIFY(plan.isEmpty());
        QCOMPARE(plan.batchCount, 0);
    }

    // ========== Multiple files ==========

    void testSyncFilesMixedSizes()
    {
        QJsonObject o;
        o["max_file_size"] = 0;
        config->applyOverrides(o);

        const QStringList paths = {
            createFile("src/app.js", 500 * 1024),
            createFile("data/table.dat", 2 * 1024 * 1024),
            createFile("data/dump.sql", 15 * 1024 * 1024)
        };

        const SubmitResult result = service->syncFiles(paths, TransferDirection::Upload);

        QVERIFY(result.ok());
        QCOMPARE(result.taskIds.size(), 3);
        QCOMPARE(result.message, QString("Queued 3 tasks for 3 files"));

        const TransferTask small = taskAt(result, 0);
        QCOMPARE(small.kind, TaskKind::Batch);
        QCOMPARE(small.tier, FileCategory::Small);
        QCOMPARE(small.batchNumber, 1);
        QCOMPARE(small.batchCount, 2);
        QCOMPARE(small.sourceRoot, QDir(root()).absolutePath());

        const TransferTask medium = taskAt(result, 1);
        QCOMPARE(medium.kind, TaskKind::Batch);
        QCOMPARE(medium.tier, FileCategory::Medium);

        const TransferTask large = taskAt(result, 2);
        QCOMPARE(large.kind, TaskKind::SingleFile);
        QCOMPARE(large.tier, FileCategory::Large);
        QCOMPARE(large.totalBytes, qint64(15 * 1024 * 1024));
    }

    void testSyncFilesSkipsOversizedAndMissing()
    {
        const QStringList paths = {
            createFile("src/app.js", 500 * 1024),
            createFile("data/dump.sql", 15 * 1024 * 1024),
            root() + "/ghost.txt"
        };

        const SubmitResult result = service->syncFiles(paths, TransferDirection::Upload);

        QVERIFY(result.ok());
        QCOMPARE(result.taskIds.size(), 1);
        QCOMPARE(result.message, QString("Queued 1 tasks for 1 files (2 skipped)"));
    }

    void testSyncFilesRequiresPaths()
    {
        const SubmitResult result = service->syncFiles({}, TransferDirection::Upload);
        QCOMPARE(result.error, SubmitError::Validation);
        QCOMPARE(result.message, QString("File paths are required"));
    }

    void testSyncFilesNothingValid()
    {
        QSignalSpy rejectedSpy(service, &SyncService::requestRejected);

        const SubmitResult result = service->syncFiles({root() + "/a", ""}, TransferDirection::Upload);

        QCOMPARE(result.error, SubmitError::Validation);
        QCOMPARE(result.message, QString("No valid files to sync"));
        QCOMPARE(rejectedSpy.count(), 1);
    }

    void testSyncFilesConfigFilesIndividually()
    {
        const QStringList paths = {
            createFile("src/a.cpp"),
            createFile("package.json"),
            createFile("src/b.cpp")
        };

        const SubmitResult result = service->syncFiles(paths, TransferDirection::Upload);

        QCOMPARE(result.taskIds.size(), 2);
        QCOMPARE(taskAt(result, 0).kind, TaskKind::SingleFile);
        QCOMPARE(taskAt(result, 0).tier, FileCategory::Config);
        QCOMPARE(taskAt(result, 1).kind, TaskKind::Batch);
        QCOMPARE(taskAt(result, 1).fileCount(), 2);
    }

    void testSyncFilesOutsideRootBecomeSingleTasks()
    {
        QTemporaryDir elsewhere;
        QVERIFY(elsewhere.isValid());
        const QString outside = elsewhere.path() + "/notes.txt";
        QFile file(outside);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("notes");
        file.close();

        const SubmitResult result = service->syncFiles({createFile("a.txt"), outside},
                                                       TransferDirection::Upload);

        QCOMPARE(result.taskIds.size(), 2);
        QCOMPARE(taskAt(result, 0).kind, TaskKind::Batch);
        const TransferTask single = taskAt(result, 1);
        QCOMPARE(single.kind, TaskKind::SingleFile);
        QCOMPARE(single.remotePath, QString("/srv/app/notes.txt"));
    }

    void testSyncFilesRelativePathsResolveAgainstRoot()
    {
        createFile("src/relative.cpp");

        const SubmitResult result = service->syncFiles({"src/relative.cpp"}, TransferDirection::Upload);

        QVERIFY(result.ok());
        QCOMPARE(taskAt(result, 0).paths.first(), root() + "/src/relative.cpp");
    }

    void testSyncFilesDownloadAcceptsMissingLocalFiles()
    {
        const SubmitResult result = service->syncFiles({root() + "/a.txt", root() + "/b.txt"},
                                                       TransferDirection::Download);

        QVERIFY(result.ok());
        QCOMPARE(result.taskIds.size(), 1);
        QCOMPARE(taskAt(result, 0).direction, TransferDirection::Download);
    }

    void testSyncFilesUsesAdaptiveBatchSize()
    {
        QJsonObject o;
        o["batch_size"] = 2;
        config->applyOverrides(o);

        QStringList paths;
        for (int i = 0; i < 5; ++i) {
            paths << createFile(QStringLiteral("src/f%1.cpp").arg(i));
        }

        const SubmitResult result = service->syncFiles(paths, TransferDirection::Upload);

        QCOMPARE(result.taskIds.size(), 3);
        QCOMPARE(taskAt(result, 2).fileCount(), 1);
        QCOMPARE(taskAt(result, 2).batchCount, 3);
    }

    void testContinuationAttachedToEveryTask()
    {
        int notifications = 0;
        const SubmitResult result = service->syncFiles(
            {createFile("a.txt"), createFile("b.yaml"), createFile("c.txt")},
            TransferDirection::Upload,
            [&notifications](const TransferTask &) { ++notifications; });

        QCOMPARE(result.taskIds.size(), 2);
        pool->flushEventQueue();
        mockExecutor->mockCompleteAll();
        pool->flushEventQueue();
        mockExecutor->mockCompleteAll();

        QCOMPARE(notifications, 2);
    }

    // ========== Whole tree ==========

    void testScanLocalFilesAppliesFilters()
    {
        createFile("src/main.cpp");
        createFile(".git/config");
        createFile("build/out.tmp");
        createFile("server.log");
        createFile("README.md");

        const QStringList files = service->scanLocalFiles();

        QCOMPARE(files, QStringList({root() + "/README.md", root() + "/src/main.cpp"}));
    }

    void testSyncAllNothingToSync()
    {
        createFile("debug.log");
        QSignalSpy statusSpy(service, &SyncService::statusMessage);

        const SubmitResult result = service->syncAll();

        QVERIFY(result.ok());
        QVERIFY(result.taskIds.isEmpty());
        QCOMPARE(result.message, QString("No files to sync"));
        QCOMPARE(statusSpy.count(), 1);
    }

    void testSyncAllMissingRoot()
    {
        const QString missing = root() + "/gone";
        QJsonObject o;
        o["local_path"] = missing;
        config->applyOverrides(o);

        const SubmitResult result = service->syncAll();

        QCOMPARE(result.error, SubmitError::NotFound);
        QCOMPARE(result.message, QString("Local path does not exist: %1").arg(missing));
    }

    void testSyncAllSubmitsEverything()
    {
        createFile("index.html");
        createFile("css/site.css");
        createFile("config.toml");

        const SubmitResult result = service->syncAll();

        QVERIFY(result.ok());
        QCOMPARE(result.taskIds.size(), 2);
        QCOMPARE(result.message, QString("Queued 2 tasks for 3 files"));
    }

    // ========== Relative local_path ==========

    void testProjectFileInParentWithRelativeLocalPath()
    {
        const QString projectDir = root() + "/project";
        QDir().mkpath(projectDir + "/tools/scripts");
        QFile projectFile(projectDir + "/.rsync.json");
        QVERIFY(projectFile.open(QIODevice::WriteOnly));
        projectFile.write("{\n"
                          "  \"host\": \"build.example.com\",\n"
                          "  \"username\": \"deploy\",\n"
                          "  \"local_path\": \".\",\n"
                          "  \"remote_path\": \"/srv/app\",\n"
                          "  \"private_key_path\": \"\",\n"
                          "  \"exclude_patterns\": [\".rsync.json\"]\n"
                          "}\n");
        projectFile.close();

        const QString srcFile = createFile("project/src/a.c");
        const QString libFile = createFile("project/lib/a.c");

        QString error;
        QVERIFY2(config->loadProjectFile(projectDir + "/tools/scripts", &error), qPrintable(error));
        QCOMPARE(config->localRoot(), QDir::cleanPath(projectDir));

        const SubmitResult result = service->syncAll();

        QVERIFY(result.ok());
        QCOMPARE(result.taskIds.size(), 1);
        const TransferTask batch = taskAt(result, 0);
        QCOMPARE(batch.kind, TaskKind::Batch);
        QCOMPARE(batch.sourceRoot, QDir::cleanPath(projectDir));
        QCOMPARE(batch.paths, QStringList({libFile, srcFile}));
        QCOMPARE(batch.remotePath, QString("/srv/app"));
    }

    void testRelativeLocalPathKeepsSubdirectories()
    {
        const QString srcFile = createFile("src/a.c");
        const QString libFile = createFile("lib/a.c");

        const QString previous = QDir::currentPath();
        QVERIFY(QDir::setCurrent(root()));
        QJsonObject o;
        o["local_path"] = ".";
        config->applyOverrides(o);
        QVERIFY(QDir::setCurrent(previous));

        const SubmitResult batched = service->syncFiles({srcFile, libFile}, TransferDirection::Upload);
        QVERIFY(batched.ok());
        QCOMPARE(batched.taskIds.size(), 1);
        QCOMPARE(taskAt(batched, 0).kind, TaskKind::Batch);

        const SubmitResult first = service->uploadFile(srcFile);
        const SubmitResult second = service->uploadFile(libFile);
        QCOMPARE(taskAt(first, 0).remotePath, QString("/srv/app/src/a.c"));
        QCOMPARE(taskAt(second, 0).remotePath, QString("/srv/app/lib/a.c"));
    }

    void testSameFileNameInDifferentDirectories()
    {
        const QString srcFile = createFile("src/index.ts", 20 * 1024 * 1024);
        const QString testFile = createFile("test/index.ts", 20 * 1024 * 1024);
        QJsonObject o;
        o["max_file_size"] = 0;
        config->applyOverrides(o);

        const SubmitResult result = service->syncFiles({srcFile, testFile}, TransferDirection::Upload);

        QVERIFY(result.ok());
        QCOMPARE(result.taskIds.size(), 2);
        QCOMPARE(taskAt(result, 0).remotePath, QString("/srv/app/src/index.ts"));
        QCOMPARE(taskAt(result, 1).remotePath, QString("/srv/app/test/index.ts"));
    }

    // ========== Pool access ==========

    void testCancelAllReportsCount()
    {
        service->syncFiles({createFile("a.txt"), createFile("b.json")}, TransferDirection::Upload);
        QSignalSpy statusSpy(service, &SyncService::statusMessage);

        QCOMPARE(service->cancelAll(), 2);
        QCOMPARE(statusSpy.count(), 1);
        QCOMPARE(statusSpy.at(0).at(0).toString(), QString("Cancelled 2 tasks"));
        QCOMPARE(service->status().cancelled, 2);

        QCOMPARE(service->cancelAll(), 0);
        QCOMPARE(statusSpy.count(), 1);
    }

    void testCancelSingleTask()
    {
        const SubmitResult result = service->uploadFile(createFile("a.txt"));
        QVERIFY(service->cancel(result.taskId()));
        QVERIFY(!service->cancel(result.taskId()));
    }
};

QTEST_MAIN(TestSyncService)
#include "test_syncservice.moc"
