#include <QtTest>
#include <QDir>
#include <QJsonObject>
#include <QSignalSpy>

#include "services/rsyncexecutor.h"
#include "services/syncconfig.h"

class TestRsyncExecutor : public QObject
{
    Q_OBJECT

private:
    SyncConfig *config = nullptr;
    RsyncExecutor *executor = nullptr;

    void configureRemote()
    {
        QJsonObject o;
        o["host"] = "build.example.com";
        o["username"] = "deploy";
        o["port"] = 2222;
        o["private_key_path"] = "/keys/deploy";
        o["local_path"] = "/project";
        o["remote_path"] = "/srv/app";
        config->applyOverrides(o);
    }

    void useProgram(const QString &program)
    {
        QJsonObject o;
        o["rsync_program"] = program;
        config->applyOverrides(o);
    }

    static TransferRequest uploadRequest(const QString &source, const QString &destination)
    {
        TransferRequest request;
        request.kind = TaskKind::SingleFile;
        request.direction = TransferDirection::Upload;
        request.source = source;
        request.destination = destination;
        return request;
    }

private slots:
    void init()
    {
        config = new SyncConfig(this);
        executor = new RsyncExecutor(config, this);
    }

    void cleanup()
    {
        delete executor;
        executor = nullptr;
        delete config;
        config = nullptr;
    }

    // ========== Argument construction ==========

    void testSingleFileArguments()
    {
        configureRemote();
        TransferRequest request = uploadRequest("/project/src/main.cpp",
                                                "deploy@build.example.com:/srv/app/src/main.cpp");
        request.timeoutMs = 60000;

        const QStringList args = RsyncExecutor::buildArguments(request, *config);

        const QStringList expected = {
            "-a", "--progress", "--stats", "-p", "-o", "-g",
            "--timeout=60",
            "-e", "ssh -p 2222 -i /keys/deploy -o StrictHostKeyChecking=no "
                  "-o UserKnownHostsFile=/dev/null -o ConnectTimeout=30",
            "/project/src/main.cpp",
            "deploy@build.example.com:/srv/app/src/main.cpp"
        };
        QCOMPARE(args, expected);
    }

    void testCompressionAddedOnce()
    {
        TransferRequest request = uploadRequest("/a", "/b");
        request.compress = true;
        QCOMPARE(RsyncExecutor::buildArguments(request, *config).count("-z"), 1);

        request.compress = false;
        QVERIFY(!RsyncExecutor::buildArguments(request, *config).contains("-z"));

        QJsonObject flags;
        flags["compress"] = true;
        QJsonObject o;
        o["rsync_options"] = flags;
        config->applyOverrides(o);
        QCOMPARE(RsyncExecutor::buildArguments(request, *config).count("-z"), 1);

        request.compress = true;
        QCOMPARE(RsyncExecutor::buildArguments(request, *config).count("-z"), 1);
    }

    void testLocalModeHasNoRemoteShell()
    {
        const QStringList args = RsyncExecutor::buildArguments(uploadRequest("/a", "/b"), *config);
        QVERIFY(!args.contains("-e"));
        QCOMPARE(args.last(), QString("/b"));
    }

    void testTimeoutFloorIsOneSecond()
    {
        TransferRequest request = uploadRequest("/a", "/b");
        request.timeoutMs = 200;
        QVERIFY(RsyncExecutor::buildArguments(request, *config).contains("--timeout=1"));
    }

    void testDirectoryCopiesContents()
    {
        TransferRequest request = uploadRequest("/project/assets", "/srv/app/assets");
        request.kind = TaskKind::Directory;

        const QStringList args = RsyncExecutor::buildArguments(request, *config);
        QCOMPARE(args.at(args.size() - 2), QString("/project/assets/"));
        QVERIFY(!args.contains("-r"));  // -a already recurses

        QJsonObject flags;
        flags["archive"] = false;
        QJsonObject o;
        o["rsync_options"] = flags;
        config->applyOverrides(o);
        QVERIFY(RsyncExecutor::buildArguments(request, *config).contains("-r"));
    }

    void testBatchUsesFileList()
    {
        configureRemote();
        TransferRequest request = uploadRequest("/project", "deploy@build.example.com:/srv/app");
        request.kind = TaskKind::Batch;
        request.files = {"src/a.cpp", "src/b.cpp"};

        const QStringList args = RsyncExecutor::buildArguments(request, *config, "/tmp/list");

        QVERIFY(args.contains("--files-from=/tmp/list"));
        QVERIFY(args.contains("--relative"));
        QCOMPARE(args.at(args.size() - 2), QString("/project/"));
        QCOMPARE(args.last(), QString("deploy@build.example.com:/srv/app"));
        QVERIFY(!args.contains("src/a.cpp"));
    }

    void testDryRunItemizesChanges()
    {
        configureRemote();
        TransferRequest request = uploadRequest("/project/src", "deploy@build.example.com:/srv/app/src");
        request.kind = TaskKind::Directory;
        request.dryRun = true;

        const QStringList args = RsyncExecutor::buildArguments(request, *config);

        QVERIFY(args.contains("--dry-run"));
        QVERIFY(args.contains("--itemize-changes"));
        QCOMPARE(args.at(args.size() - 2), QString("/project/src/"));

        request.dryRun = false;
        QVERIFY(!RsyncExecutor::buildArguments(request, *config).contains("--dry-run"));
    }

    // ========== Progress parsing ==========

    void testParseProgressLine_data()
    {
        QTest::addColumn<QString>("line");
        QTest::addColumn<bool>("valid");
        QTest::addColumn<qint64>("bytes");
        QTest::addColumn<int>("percent");

        QTest::newRow("complete") << "     32,768 100%   31.25MB/s    0:00:00 (xfr#1, to-chk=0/1)"
                                  << true << qint64(32768) << 100;
        QTest::newRow("partial") << "  1,048,576  45%    2.00MB/s    0:00:03"
                                 << true << qint64(1048576) << 45;
        QTest::newRow("dotted locale") << "  2.097.152  12%  1.00MB/s  0:01:10"
                                       << true << qint64(2097152) << 12;
        QTest::newRow("file name") << "src/main.cpp" << false << qint64(0) << 0;
        QTest::newRow("stats") << "Total transferred file size: 32,768 bytes" << false << qint64(0) << 0;
        QTest::newRow("empty") << "" << false << qint64(0) << 0;
    }

    void testParseProgressLine()
    {
        QFETCH(QString, line);
        QFETCH(bool, valid);
        QFETCH(qint64, bytes);
        QFETCH(int, percent);

        const RsyncExecutor::ProgressInfo info = RsyncExecutor::parseProgressLine(line);
        QCOMPARE(info.valid, valid);
        if (valid) {
            QCOMPARE(info.bytes, bytes);
            QCOMPARE(info.percent, percent);
        }
    }

    // ========== Process lifecycle ==========

    void testSuccessfulProcessReportsFinished()
    {
        useProgram("/bin/echo");
        QSignalSpy finishedSpy(executor, &ITransferExecutor::finished);
        QSignalSpy outputSpy(executor, &ITransferExecutor::outputLine);

        QString error;
        const TransferHandle handle = executor->start(uploadRequest("/src/a", "/dst/a"), &error);
        QVERIFY(handle != 0);
        QVERIFY(executor->isRunning(handle));

        QVERIFY(finishedSpy.wait(5000));
        QCOMPARE(finishedSpy.at(0).at(0).value<TransferHandle>(), handle);
        QCOMPARE(finishedSpy.at(0).at(1).toInt(), 0);
        QVERIFY(finishedSpy.at(0).at(2).toString().isEmpty());

        QVERIFY(outputSpy.count() >= 1);
        QVERIFY(outputSpy.at(0).at(1).toString().endsWith("/src/a /dst/a"));
        QVERIFY(!executor->isRunning(handle));
        QCOMPARE(executor->runningCount(), 0);
    }

    void testFailingProcessReportsExitCode()
    {
        useProgram("/bin/false");
        QSignalSpy finishedSpy(executor, &ITransferExecutor::finished);

        QString error;
        const TransferHandle handle = executor->start(uploadRequest("/src/a", "/dst/a"), &error);
        QVERIFY(handle != 0);

        QVERIFY(finishedSpy.wait(5000));
        QCOMPARE(finishedSpy.at(0).at(1).toInt(), 1);
        QCOMPARE(finishedSpy.at(0).at(2).toString(), QString("rsync exited with code 1"));
    }

    void testMissingProgramReportsStartFailed()
    {
        useProgram("/nonexistent/rsyncq-test-rsync");
        QSignalSpy startFailedSpy(executor, &ITransferExecutor::startFailed);
        QSignalSpy finishedSpy(executor, &ITransferExecutor::finished);

        QString error;
        const TransferHandle handle = executor->start(uploadRequest("/src/a", "/dst/a"), &error);
        QVERIFY(handle != 0);

        QVERIFY(startFailedSpy.wait(5000));
        QCOMPARE(startFailedSpy.at(0).at(0).value<TransferHandle>(), handle);
        QVERIFY(startFailedSpy.at(0).at(1).toString().startsWith("Failed to start"));
        QCOMPARE(finishedSpy.count(), 0);
    }

    void testBatchFileListWritten()
    {
        useProgram("/bin/echo");
        QSignalSpy outputSpy(executor, &ITransferExecutor::outputLine);
        QSignalSpy finishedSpy(executor, &ITransferExecutor::finished);

        TransferRequest request = uploadRequest("/project", "/srv/app");
        request.kind = TaskKind::Batch;
        request.files = {"a.txt", "b.txt"};

        QString error;
        QVERIFY(executor->start(request, &error) != 0);
        QVERIFY(finishedSpy.wait(5000));

        const QString echoed = outputSpy.at(0).at(1).toString();
        QVERIFY(echoed.contains("--files-from=" + QDir::tempPath() + "/rsyncq-files-"));
        QVERIFY(echoed.contains("--relative"));
    }

    void testBatchFileListFailureStartsNothing()
    {
        useProgram("/bin/echo");
        const QByteArray previous = qgetenv("TMPDIR");
        qputenv("TMPDIR", "/nonexistent/rsyncq-tmp");

        TransferRequest request = uploadRequest("/project", "/srv/app");
        request.kind = TaskKind::Batch;
        request.files = {"a.txt"};

        QString error;
        const TransferHandle handle = executor->start(request, &error);

        if (previous.isEmpty()) {
            qunsetenv("TMPDIR");
        } else {
            qputenv("TMPDIR", previous);
        }

        QCOMPARE(handle, TransferHandle(0));
        QVERIFY(error.startsWith("Cannot create file list"));
        QCOMPARE(executor->runningCount(), 0);
    }
};

QTEST_MAIN(TestRsyncExecutor)
#include "test_rsyncexecutor.moc"
