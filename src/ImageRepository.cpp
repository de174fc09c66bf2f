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

#include "ImageRepository.h"

#include <QDir>
#include <QSqlQuery>
#include <QVariant>

#include "LibraryDatabase.h"

namespace {

const char *const selectColumns =
    "SELECT id, path, filename, directory, hash, perceptual_hash, size, width, height, format,"
    " taken_at, camera_make, camera_model, thumbnail_path, file_modified_at, last_scanned_at"
    " FROM images";

QVariant nullableText(const QString &value)
{
    return value.isEmpty() ? QVariant() : QVariant(value);
}

QVariant nullableInt(int value)
{
    return value > 0 ? QVariant(value) : QVariant();
}

QVariant nullableDate(const QDateTime &value)
{
    return value.isValid() ? QVariant(value.toString(Qt::ISODate)) : QVariant();
}

ImageRecord readRecord(const QSqlQuery &query)
{
    ImageRecord record;
    record.id = query.value(0).toLongLong();
    record.path = query.value(1).toString();
    record.filename = query.value(2).toString();
    record.directory = query.value(3).toString();
    record.hash = query.value(4).toString();
    record.perceptualHash = query.value(5).toString();
    record.size = query.value(6).toLongLong();
    record.width = query.value(7).toInt();
    record.height = query.value(8).toInt();
    record.format = query.value(9).toString();
    record.takenAt = LibraryDatabase::parseTimestamp(query.value(10));
    record.cameraMake = query.value(11).toString();
    record.cameraModel = query.value(12).toString();
    record.thumbnailPath = query.value(13).toString();
    record.fileModified = query.value(14).toLongLong();
    record.lastScanned = LibraryDatabase::parseTimestamp(query.value(15));
    return record;
}

} // namespace

QVariantMap toVariantMap(const ImageRecord &record)
{
    QVariantMap map;
    map.insert("id", record.id);
    map.insert("path", record.path);
    map.insert("filename", record.filename);
    map.insert("directory", record.directory);
    map.insert("hash", record.hash);
    map.insert("size", record.size);
    map.insert("width", record.width);
    map.insert("height", record.height);
    map.insert("format", record.format);
    map.insert("fileModified", record.fileModified);
    if (record.lastScanned.isValid()) {
        map.insert("lastScanned", record.lastScanned.toString(Qt::ISODate));
    }
    return map;
}

ImageRepository::ImageRepository(LibraryDatabase &database)
    : m_database(database)
{
}

/**
 * @brief Inserts a record or updates the existing row with the same path.
 * @param record Record to store; id is ignored, filename and directory are derived when empty.
 * @param id Optional output row id.
 * @param error Optional error output.
 * @return True on success.
 */
bool ImageRepository::upsert(const ImageRecord &record, qint64 *id, OperationError *error)
{
    if (record.path.isEmpty() || record.hash.isEmpty()) {
        setError(error, ErrorCode::InvalidArgument, QStringLiteral("Image record needs a path and a hash"));
        return false;
    }

    const QString filename = record.filename.isEmpty()
        ? record.path.section(QLatin1Char('/'), -1)
        : record.filename;
    const QString directory = record.directory.isEmpty()
        ? QDir::cleanPath(record.path.section(QLatin1Char('/'), 0, -2))
        : record.directory;

    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral(
        "INSERT INTO images (path, filename, directory, hash, perceptual_hash, size, width, height, format,"
        " taken_at, camera_make, camera_model, thumbnail_path, file_modified_at, last_scanned_at)"
        " VALUES (?, ?, ?, ?, NULL, ?, ?, ?, ?, ?, ?, ?, ?, ?, CURRENT_TIMESTAMP)"
        " ON CONFLICT(path) DO UPDATE SET"
        " filename = excluded.filename,"
        " directory = excluded.directory,"
        " hash = excluded.hash,"
        " size = excluded.size,"
        " width = excluded.width,"
        " height = excluded.height,"
        " format = excluded.format,"
        " taken_at = COALESCE(excluded.taken_at, images.taken_at),"
        " camera_make = COALESCE(excluded.camera_make, images.camera_make),"
        " camera_model = COALESCE(excluded.camera_model, images.camera_model),"
        " thumbnail_path = COALESCE(excluded.thumbnail_path, images.thumbnail_path),"
        " file_modified_at = excluded.file_modified_at,"
        " last_scanned_at = CURRENT_TIMESTAMP"));
    query.addBindValue(record.path);
    query.addBindValue(filename);
    query.addBindValue(directory);
    query.addBindValue(record.hash);
    query.addBindValue(record.size);
    query.addBindValue(nullableInt(record.width));
    query.addBindValue(nullableInt(record.height));
    query.addBindValue(nullableText(record.format));
    query.addBindValue(nullableDate(record.takenAt));
    query.addBindValue(nullableText(record.cameraMake));
    query.addBindValue(nullableText(record.cameraModel));
    query.addBindValue(nullableText(record.thumbnailPath));
    query.addBindValue(record.fileModified);
    if (!m_database.exec(query, "upsert image", error)) {
        return false;
    }

    if (id) {
        ImageRecord stored;
        if (!findByPath(record.path, &stored, error)) {
            return false;
        }
        *id = stored.id;
    }
    return true;
}

bool ImageRepository::findById(qint64 id, ImageRecord *record, OperationError *error) const
{
    QSqlQuery query(m_database.database());
    query.prepare(QLatin1String(selectColumns) + QStringLiteral(" WHERE id = ?"));
    query.addBindValue(id);
    const QVector<ImageRecord> rows = collect(query, "find image by id", error);
    if (rows.isEmpty()) {
        if (error && error->code == ErrorCode::None) {
            setError(error, ErrorCode::FileNotFound, QStringLiteral("Image %1 not found").arg(id));
        }
        return false;
    }
    if (record) {
        *record = rows.first();
    }
    return true;
}

bool ImageRepository::findByPath(const QString &path, ImageRecord *record, OperationError *error) const
{
    QSqlQuery query(m_database.database());
    query.prepare(QLatin1String(selectColumns) + QStringLiteral(" WHERE path = ?"));
    query.addBindValue(path);
    const QVector<ImageRecord> rows = collect(query, "find image by path", error);
    if (rows.isEmpty()) {
        if (error && error->code == ErrorCode::None) {
            setError(error, ErrorCode::FileNotFound, QStringLiteral("No image record for %1").arg(path));
        }
        return false;
    }
    if (record) {
        *record = rows.first();
    }
    return true;
}

QVector<ImageRecord> ImageRepository::findByHash(const QString &hash, OperationError *error) const
{
    QSqlQuery query(m_database.database());
    query.prepare(QLatin1String(selectColumns) + QStringLiteral(" WHERE hash = ? ORDER BY path"));
    query.addBindValue(hash);
    return collect(query, "find images by hash", error);
}

/**
 * @brief Returns every record stored in a directory or any of its subdirectories.
 */
QVector<ImageRecord> ImageRepository::findUnderDirectory(const QString &directory, OperationError *error) const
{
    const QString cleaned = QDir::cleanPath(directory);
    const QString prefix = cleaned.endsWith(QLatin1Char('/')) ? cleaned : cleaned + QLatin1Char('/');

    QSqlQuery query(m_database.database());
    query.prepare(QLatin1String(selectColumns)
                  + QStringLiteral(" WHERE directory = ? OR substr(path, 1, ?) = ? ORDER BY path"));
    query.addBindValue(cleaned);
    query.addBindValue(prefix.size());
    query.addBindValue(prefix);
    return collect(query, "find images under directory", error);
}

QStringList ImageRepository::findDuplicateHashes(OperationError *error) const
{
    QStringList hashes;
    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral(
        "SELECT hash FROM images GROUP BY hash HAVING COUNT(*) > 1 ORDER BY COUNT(*) DESC, hash"));
    if (!m_database.exec(query, "find duplicate hashes", error)) {
        return hashes;
    }
    while (query.next()) {
        hashes.append(query.value(0).toString());
    }
    return hashes;
}

bool ImageRepository::deleteById(qint64 id, OperationError *error)
{
    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral("DELETE FROM images WHERE id = ?"));
    query.addBindValue(id);
    return m_database.exec(query, "delete image", error);
}

bool ImageRepository::deleteByPath(const QString &path, OperationError *error)
{
    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral("DELETE FROM images WHERE path = ?"));
    query.addBindValue(path);
    return m_database.exec(query, "delete image by path", error);
}

bool ImageRepository::updateLastScanned(qint64 id, OperationError *error)
{
    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral("UPDATE images SET last_scanned_at = CURRENT_TIMESTAMP WHERE id = ?"));
    query.addBindValue(id);
    return m_database.exec(query, "update last scanned", error);
}

qint64 ImageRepository::count(OperationError *error) const
{
    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral("SELECT COUNT(*) FROM images"));
    if (!m_database.exec(query, "count images", error) || !query.next()) {
        return 0;
    }
    return query.value(0).toLongLong();
}

QVector<ImageRecord> ImageRepository::collect(QSqlQuery &query, const char *operation, OperationError *error) const
{
    QVector<ImageRecord> rows;
    if (!m_database.exec(query, operation, error)) {
        return rows;
    }
    while (query.next()) {
        rows.append(readRecord(query));
    }
    return rows;
}
