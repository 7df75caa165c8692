#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>

#include "cli/clirunner.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("rsyncq");
    app.setApplicationVersion(RSYNCQ_VERSION);

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Schedules batched rsync transfers between a project and its remote copy");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Directory to start the project file search from", "dir");
    parser.addOption(configOption);

    QCommandLineOption timeoutOption(
        QStringList() << "t" << "timeout",
        "Give up waiting for transfers after <ms> milliseconds", "ms");
    parser.addOption(timeoutOption);

    QCommandLineOption probeOption(
        QStringList() << "probe",
        "Measure latency to the host before scheduling");
    parser.addOption(probeOption);

    QCommandLineOption watchOption(
        QStringList() << "w" << "watch",
        "sync: keep syncing every sync_interval and upload saved files");
    parser.addOption(watchOption);

    QCommandLineOption cyclesOption(
        QStringList() << "cycles",
        "Stop watching after <n> sync cycles", "n");
    parser.addOption(cyclesOption);

    parser.addPositionalArgument("command", CliRunner::commands().join(", "));
    parser.addPositionalArgument("paths", "Files or directories", "[paths...]");

    parser.process(app);

    // Set verbose logging flag
    if (rsyncq::initVerboseLogging(parser.isSet(verboseOption))) {
        qDebug() << "Verbose logging enabled";
    }

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(CliRunner::ExitUsage);
    }

    CliOptions options;
    options.command = positional.takeFirst();
    options.paths = positional;
    options.configDir = parser.value(configOption);
    options.probe = parser.isSet(probeOption);
    options.watch = parser.isSet(watchOption) || parser.isSet(cyclesOption);

    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        options.timeoutMs = parser.value(timeoutOption).toInt(&ok);
        if (!ok || options.timeoutMs < 0) {
            qCritical() << "Invalid --timeout value:" << parser.value(timeoutOption);
            return CliRunner::ExitUsage;
        }
    }

    if (parser.isSet(cyclesOption)) {
        bool ok = false;
        options.watchCycles = parser.value(cyclesOption).toInt(&ok);
        if (!ok || options.watchCycles < 1) {
            qCritical() << "Invalid --cycles value:" << parser.value(cyclesOption);
            return CliRunner::ExitUsage;
        }
    }

    CliRunner runner(options);
    return runner.run();
}
