/************************************************************************\

    PhotoDedup - Duplicate photo detection core
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>
#include <QTextStream>

#include "ContentHasher.h"
#include "DeletionCoordinator.h"
#include "DirectoryScanner.h"
#include "DuplicateGrouper.h"
#include "HashJobs.h"
#include "ImageRepository.h"
#include "LibraryCommands.h"
#include "LibraryDatabase.h"
#include "LibraryIndexer.h"
#include "LoggingUtils.h"
#include "ScanLock.h"
#include "ScannerPreferences.h"

namespace {

struct ExitCodes {
    static constexpr int ok = 0;
    static constexpr int commandFailed = 1;
    static constexpr int usage = 2;
};

int printResult(const QVariantMap &result)
{
    QTextStream out(stdout);
    out << QJsonDocument(QJsonObject::fromVariantMap(result)).toJson(QJsonDocument::Indented);
    out.flush();
    return result.value("success").toBool() ? ExitCodes::ok : ExitCodes::commandFailed;
}

int usageError(QCommandLineParser &parser, const QString &message)
{
    QTextStream err(stderr);
    err << message << "\n\n" << parser.helpText();
    err.flush();
    return ExitCodes::usage;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("PhotoDedup");
    QCoreApplication::setApplicationName("PhotoDedup");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Find and remove duplicate photos."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "scan | duplicates | index | stats | groups | trash-duplicates");
    parser.addPositionalArgument("arguments", "Directory or files for the command.", "[arguments...]");

    const QCommandLineOption databaseOption("database", "SQLite library file.", "file");
    const QCommandLineOption settingsOption("settings", "INI settings file.", "file");
    const QCommandLineOption rootOption("root", "Root directory to select before the command.", "dir");
    const QCommandLineOption keepOption("keep", "Index of the file to keep.", "index");
    const QCommandLineOption recursiveOption("recursive", "Include subdirectories.");
    const QCommandLineOption verboseOption("verbose", "Log debug messages.");
    const QCommandLineOption logDirOption("log-dir", "Folder for log files.", "dir");
    parser.addOptions({databaseOption, settingsOption, rootOption, keepOption, recursiveOption, verboseOption,
                       logDirOption});
    parser.process(app);

    LoggingUtils::LogFileOptions logOptions;
    logOptions.directory = parser.isSet(logDirOption)
        ? parser.value(logDirOption)
        : QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/logs");
    logOptions.minimumLevel = parser.isSet(verboseOption) ? QtDebugMsg : QtInfoMsg;
    if (!LoggingUtils::installMessageHandler(logOptions)) {
        QTextStream(stderr) << "Cannot open log file in " << logOptions.directory << "\n";
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usageError(parser, QStringLiteral("Missing command."));
    }
    const QString command = positional.first();
    const QStringList arguments = positional.mid(1);

    LibraryDatabase database(parser.value(databaseOption));
    OperationError openError;
    if (!database.open(&openError)) {
        return printResult(LibraryCommands::failure(openError));
    }

    ScannerPreferences preferences(parser.value(settingsOption));
    DirectoryScanner scanner(preferences);
    ContentHasher hasher;
    ImageRepository images(database);
    DuplicateGrouper grouper(database);
    SystemTrashBackend trash;
    DeletionCoordinator deletion(trash);
    LibraryIndexer indexer(scanner, hasher, images, grouper);
    RootScanRegistry scans;
    LibraryCommands commands(scanner, hasher, grouper, deletion, indexer, scans);

    if (parser.isSet(rootOption)) {
        const QVariantMap selected = commands.setRoot(parser.value(rootOption));
        if (!selected.value("success").toBool()) {
            return printResult(selected);
        }
    }

    if (command == QLatin1String("scan")) {
        return printResult(commands.scanDirectory(arguments.value(0), true));
    }
    if (command == QLatin1String("duplicates")) {
        if (arguments.isEmpty()) {
            return usageError(parser, QStringLiteral("duplicates needs a directory."));
        }
        if (!parser.isSet(rootOption)) {
            const QVariantMap selected = commands.useTemporaryRoot(arguments.first());
            if (!selected.value("success").toBool()) {
                return printResult(selected);
            }
        }
        QTextStream err(stderr);
        return printResult(commands.scanDuplicates(arguments.first(), parser.isSet(recursiveOption),
                                                   [&err](const JobProgress &progress) {
            err << "\r" << jobPhaseName(progress.phase) << " " << progress.completed << "/" << progress.total;
            err.flush();
        }));
    }
    if (command == QLatin1String("index")) {
        if (!arguments.isEmpty()) {
            const QVariantMap selected = commands.setRoot(arguments.first());
            if (!selected.value("success").toBool()) {
                return printResult(selected);
            }
        }
        return printResult(commands.indexLibrary());
    }
    if (command == QLatin1String("stats")) {
        return printResult(commands.duplicateStats());
    }
    if (command == QLatin1String("groups")) {
        return printResult(commands.duplicateGroups());
    }
    if (command == QLatin1String("trash-duplicates")) {
        bool ok = false;
        const int keepIndex = parser.value(keepOption).toInt(&ok);
        if (!ok || arguments.size() < 2) {
            return usageError(parser, QStringLiteral("trash-duplicates needs --keep and at least two files."));
        }
        return printResult(commands.trashDuplicates(arguments, keepIndex));
    }

    return usageError(parser, QStringLiteral("Unknown command: %1").arg(command));
}
