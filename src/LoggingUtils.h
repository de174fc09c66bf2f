#pragma once

#include <QLoggingCategory>
#include <QString>
#include <QtGlobal>

Q_DECLARE_LOGGING_CATEGORY(lcHasher)
Q_DECLARE_LOGGING_CATEGORY(lcScanner)
Q_DECLARE_LOGGING_CATEGORY(lcDuplicates)
Q_DECLARE_LOGGING_CATEGORY(lcTrash)
Q_DECLARE_LOGGING_CATEGORY(lcDatabase)
Q_DECLARE_LOGGING_CATEGORY(lcIndexer)
Q_DECLARE_LOGGING_CATEGORY(lcCommands)

namespace LoggingUtils {

struct LogFileOptions {
    QString directory;
    QtMsgType minimumLevel = QtInfoMsg;
    qint64 maxFileSize = 10 * 1024 * 1024;
    int maxFiles = 5;
    bool writeToConsole = true;
};

bool installMessageHandler(const LogFileOptions &options);
void uninstallMessageHandler();
QString logFilePath();
QString formatLogLine(QtMsgType type, const char *category, const QString &message);

} // namespace LoggingUtils
