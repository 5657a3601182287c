#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QDebug>
#include <QSettings>
#include <QTextStream>
#include <cstdio>
#include <memory>
#include "consolecontroller.h"
#include "services/localfilesystem.h"
#include "services/transferengine.h"
#include "services/transfersettings.h"
#include "utils/logging.h"

namespace {

int usageError(const QCommandLineParser &parser, const QString &message)
{
    QTextStream err(stderr);
    err << message << Qt::endl << Qt::endl << parser.helpText();
    return ConsoleController::ExitUsageError;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("twinfm");
    app.setApplicationVersion(TWINFM_VERSION);
    app.setOrganizationName("twinfm");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Copy, move or delete files the way the twin-pane commander does");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(verboseOption);

    QCommandLineOption conflictOption(
        QStringList() << "c" << "conflict",
        "What to do with existing destination entries: skip, overwrite, rename or ask.",
        "policy");
    parser.addOption(conflictOption);

    QCommandLineOption abortOption(
        QStringList() << "a" << "abort-on-error",
        "Stop at the first failed item instead of carrying on.");
    parser.addOption(abortOption);

    QCommandLineOption settingsOption(
        QStringList() << "s" << "settings",
        "Read transfer settings from an INI file.",
        "file");
    parser.addOption(settingsOption);

    parser.addPositionalArgument("command", "copy (F5), move (F6) or delete (F8).");
    parser.addPositionalArgument("sources", "Files and folders to process.", "<source>...");
    parser.addPositionalArgument("destination", "Target folder (copy and move only).", "[destination]");

    parser.process(app);

    // Set verbose logging flag
    twinfm::setVerboseLogging(parser.isSet(verboseOption));

    if (twinfm::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    TransferSettings settings;
    if (parser.isSet(settingsOption)) {
        const QString path = parser.value(settingsOption);
        if (!QFile::exists(path)) {
            return usageError(parser, QString("Settings file not found: %1").arg(path));
        }
        QSettings file(path, QSettings::IniFormat);
        settings = TransferSettings::load(file);
    } else {
        settings = TransferSettings::load();
    }

    ConflictPolicy policy = settings.defaultConflictPolicy;
    if (parser.isSet(conflictOption)) {
        bool ok = false;
        policy = conflictPolicyFromString(parser.value(conflictOption), &ok);
        if (!ok) {
            return usageError(parser, QString("Unknown conflict policy: %1").arg(parser.value(conflictOption)));
        }
    }

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        return usageError(parser, "Missing command");
    }

    const QString command = args.takeFirst().toLower();
    OperationType operation = OperationType::Copy;
    if (command == "copy") {
        operation = OperationType::Copy;
    } else if (command == "move") {
        operation = OperationType::Move;
    } else if (command == "delete") {
        operation = OperationType::Delete;
    } else {
        return usageError(parser, QString("Unknown command: %1").arg(command));
    }

    // The working directory plays the source pane, the destination the other one.
    PaneContext sourcePane;
    sourcePane.currentDirectory = QDir::currentPath();
    PaneContext targetPane;
    if (operation != OperationType::Delete) {
        if (args.size() < 2) {
            return usageError(parser, "Expected at least one source and a destination");
        }
        targetPane.currentDirectory = QDir(sourcePane.currentDirectory).absoluteFilePath(args.takeLast());
    } else if (args.isEmpty()) {
        return usageError(parser, "Expected at least one source");
    }
    sourcePane.selection = args;

    TransferRequest request = TransferRequest::fromPanes(operation, sourcePane, targetPane, policy);
    request.errorPolicy = parser.isSet(abortOption) ? ErrorPolicy::AbortOnFirstError
                                                     : settings.defaultErrorPolicy();

    TransferEngine engine(std::make_shared<LocalFileSystem>(), settings);

    // Answers are read from the descriptor so the controller can watch it for input.
    QFile input;
    QFile output;
    if (!input.open(fileno(stdin), QIODevice::ReadOnly) || !output.open(stdout, QIODevice::WriteOnly)) {
        qCritical() << "Cannot open standard streams";
        return ConsoleController::ExitFailed;
    }

    ConsoleController controller(&engine, &input, &output);
    QObject::connect(&controller, &ConsoleController::finished, &app, &QCoreApplication::exit);

    if (!controller.start(request)) {
        return controller.exitCode();
    }

    return app.exec();
}
