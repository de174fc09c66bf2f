#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>
#include <QtGlobal>

enum class ErrorCode {
    None = 0,
    InvalidDirectory,
    FileNotFound,
    IoError,
    InvalidArgument,
    AccessDenied,
    DatabaseError,
    Busy
};

struct OperationError {
    ErrorCode code = ErrorCode::None;
    QString message;
};

QString errorCodeName(ErrorCode code);
void setError(OperationError *error, ErrorCode code, const QString &message);

struct FileEntry {
    QString path;
    QString name;
    QString extension;
    qint64 size = 0;
    QDateTime modified;
    bool isImage = false;
};

struct HashResult {
    QString path;
    QString hash;
    QString algorithm;
    qint64 size = 0;
};

struct DuplicateGroup {
    QString hash;
    qint64 fileSize = 0;
    QStringList files;
};

struct DuplicateSpace {
    qint64 totalWastedBytes = 0;
    int totalGroups = 0;
    int totalDuplicateFiles = 0;
};

struct ScanStats {
    int totalFiles = 0;
    qint64 totalSize = 0;
    int imageFiles = 0;
    int directories = 0;
    QDateTime lastScanned;
};

QVariantMap toVariantMap(const FileEntry &entry);
QVariantMap toVariantMap(const HashResult &result);
QVariantMap toVariantMap(const DuplicateGroup &group);
QVariantMap toVariantMap(const ScanStats &stats);
