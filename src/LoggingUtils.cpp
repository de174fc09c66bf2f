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

#include "LoggingUtils.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

#include <cstdio>

Q_LOGGING_CATEGORY(lcHasher, "photodedup.hasher")
Q_LOGGING_CATEGORY(lcScanner, "photodedup.scanner")
Q_LOGGING_CATEGORY(lcDuplicates, "photodedup.duplicates")
Q_LOGGING_CATEGORY(lcTrash, "photodedup.trash")
Q_LOGGING_CATEGORY(lcDatabase, "photodedup.database")
Q_LOGGING_CATEGORY(lcIndexer, "photodedup.indexer")
Q_LOGGING_CATEGORY(lcCommands, "photodedup.commands")

namespace {

struct LogConstants {
    static constexpr char baseName[] = "photodedup";
    static constexpr char suffix[] = ".log";
};

struct LogState {
    QMutex mutex;
    LoggingUtils::LogFileOptions options;
    QFile file;
    bool installed = false;
    QtMessageHandler previous = nullptr;
};

LogState &logState()
{
    static LogState state;
    return state;
}

// Qt message types are not ordered by severity.
int severity(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return 0;
    case QtInfoMsg:
        return 1;
    case QtWarningMsg:
        return 2;
    case QtCriticalMsg:
        return 3;
    case QtFatalMsg:
        return 4;
    }
    return 0;
}

QString levelName(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtInfoMsg:
        return QStringLiteral("INFO");
    case QtWarningMsg:
        return QStringLiteral("WARN");
    case QtCriticalMsg:
        return QStringLiteral("ERROR");
    case QtFatalMsg:
        return QStringLiteral("FATAL");
    }
    return QStringLiteral("INFO");
}

QString rotatedName(const QString &directory, int index)
{
    const QString name = index == 0
        ? QStringLiteral("%1%2").arg(QLatin1String(LogConstants::baseName), QLatin1String(LogConstants::suffix))
        : QStringLiteral("%1.%2%3").arg(QLatin1String(LogConstants::baseName)).arg(index).arg(QLatin1String(LogConstants::suffix));
    return QDir(directory).filePath(name);
}

/**
 * @brief Shifts photodedup.N.log files up by one and drops the oldest.
 * @param state Logger state; the file must be closed by the caller.
 */
void rotateFiles(LogState &state)
{
    const QString directory = state.options.directory;
    const int maxFiles = qMax(1, state.options.maxFiles);
    QFile::remove(rotatedName(directory, maxFiles - 1));
    for (int index = maxFiles - 2; index >= 0; --index) {
        const QString from = rotatedName(directory, index);
        if (QFileInfo::exists(from)) {
            QFile::rename(from, rotatedName(directory, index + 1));
        }
    }
}

bool openLogFile(LogState &state)
{
    if (state.options.directory.isEmpty()) {
        return false;
    }
    if (!QDir().mkpath(state.options.directory)) {
        return false;
    }
    state.file.setFileName(rotatedName(state.options.directory, 0));
    return state.file.open(QIODevice::Append | QIODevice::Text);
}

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    LogState &state = logState();
    QMutexLocker locker(&state.mutex);
    if (severity(type) < severity(state.options.minimumLevel)) {
        return;
    }

    const QString line = LoggingUtils::formatLogLine(type, context.category, message);
    if (state.options.writeToConsole) {
        const QByteArray bytes = line.toLocal8Bit();
        std::fprintf(stderr, "%s\n", bytes.constData());
        std::fflush(stderr);
    }

    if (state.file.isOpen()) {
        if (state.file.size() >= state.options.maxFileSize) {
            state.file.close();
            rotateFiles(state);
            openLogFile(state);
        }
        if (state.file.isOpen()) {
            QTextStream stream(&state.file);
            stream << line << '\n';
        }
    }
}

} // namespace

namespace LoggingUtils {

/**
 * @brief Installs the process-wide message handler writing to stderr and a rotating log file.
 * @param options Target directory, minimum level and rotation limits.
 * @return True when the log file could be opened, false when only console output is active.
 */
bool installMessageHandler(const LogFileOptions &options)
{
    LogState &state = logState();
    bool fileReady = false;
    {
        QMutexLocker locker(&state.mutex);
        if (state.file.isOpen()) {
            state.file.close();
        }
        state.options = options;
        fileReady = openLogFile(state);
        if (!state.installed) {
            state.previous = qInstallMessageHandler(messageHandler);
            state.installed = true;
        }
    }

    if (severity(options.minimumLevel) <= severity(QtDebugMsg)) {
        QLoggingCategory::setFilterRules(QStringLiteral("photodedup.*.debug=true"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("photodedup.*.debug=false"));
    }
    return fileReady;
}

void uninstallMessageHandler()
{
    LogState &state = logState();
    QMutexLocker locker(&state.mutex);
    if (!state.installed) {
        return;
    }
    qInstallMessageHandler(state.previous);
    state.previous = nullptr;
    state.installed = false;
    if (state.file.isOpen()) {
        state.file.close();
    }
}

QString logFilePath()
{
    LogState &state = logState();
    QMutexLocker locker(&state.mutex);
    if (state.options.directory.isEmpty()) {
        return QString();
    }
    return rotatedName(state.options.directory, 0);
}

QString formatLogLine(QtMsgType type, const char *category, const QString &message)
{
    const QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    const QString categoryName = category ? QString::fromLatin1(category) : QStringLiteral("default");
    return QStringLiteral("%1 [%2] %3: %4").arg(timestamp, levelName(type), categoryName, message);
}

} // namespace LoggingUtils
