#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include "CoreTypes.h"

class LibraryDatabase;
class QSqlQuery;

struct ImageRecord {
    qint64 id = 0;
    QString path;
    QString filename;
    QString directory;
    QString hash;
    QString perceptualHash;
    qint64 size = 0;
    int width = 0;
    int height = 0;
    QString format;
    QDateTime takenAt;
    QString cameraMake;
    QString cameraModel;
    QString thumbnailPath;
    qint64 fileModified = 0;
    QDateTime lastScanned;
};

QVariantMap toVariantMap(const ImageRecord &record);

/**
 * @brief Row access to the images table.
 *
 * Records are keyed by their unique path. The hash column may repeat; that
 * repetition is what the duplicate grouper works from.
 */
class ImageRepository
{
public:
    explicit ImageRepository(LibraryDatabase &database);

    bool upsert(const ImageRecord &record, qint64 *id = nullptr, OperationError *error = nullptr);

    bool findById(qint64 id, ImageRecord *record, OperationError *error = nullptr) const;
    bool findByPath(const QString &path, ImageRecord *record, OperationError *error = nullptr) const;
    QVector<ImageRecord> findByHash(const QString &hash, OperationError *error = nullptr) const;
    QVector<ImageRecord> findUnderDirectory(const QString &directory, OperationError *error = nullptr) const;
    QStringList findDuplicateHashes(OperationError *error = nullptr) const;

    bool deleteById(qint64 id, OperationError *error = nullptr);
    bool deleteByPath(const QString &path, OperationError *error = nullptr);
    bool updateLastScanned(qint64 id, OperationError *error = nullptr);

    qint64 count(OperationError *error = nullptr) const;

private:
    QVector<ImageRecord> collect(QSqlQuery &query, const char *operation, OperationError *error) const;

    LibraryDatabase &m_database;
};
