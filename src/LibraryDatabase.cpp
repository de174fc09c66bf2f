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

#include "LibraryDatabase.h"

#include <QAtomicInt>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSqlError>
#include <QSqlQuery>
#include <QStandardPaths>

#include "LoggingUtils.h"

namespace {

struct DatabaseConstants {
    static constexpr char driver[] = "QSQLITE";
    static constexpr char fileName[] = "photo_library.db";
    static constexpr char memoryPath[] = ":memory:";
    static constexpr int busyTimeoutMs = 5000;
};

QString nextConnectionName()
{
    static QAtomicInt counter = 0;
    return QStringLiteral("photodedup-library-%1").arg(counter.fetchAndAddRelaxed(1));
}

} // namespace

/**
 * @brief Creates a library bound to a database file.
 * @param databasePath SQLite file path, ":memory:" for a private in-memory store,
 *        or empty for the default application data location.
 */
LibraryDatabase::LibraryDatabase(const QString &databasePath)
    : m_path(databasePath.isEmpty() ? defaultDatabasePath() : databasePath)
    , m_connectionName(nextConnectionName())
{
}

LibraryDatabase::~LibraryDatabase()
{
    close();
}

QString LibraryDatabase::defaultDatabasePath()
{
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dataDir).filePath(QLatin1String(DatabaseConstants::fileName));
}

QString LibraryDatabase::inMemoryPath()
{
    return QLatin1String(DatabaseConstants::memoryPath);
}

/**
 * @brief Parses a timestamp column, accepting ISO strings and SQLite CURRENT_TIMESTAMP values.
 * @return Parsed date time, invalid for NULL columns.
 */
QDateTime LibraryDatabase::parseTimestamp(const QVariant &value)
{
    if (value.isNull()) {
        return QDateTime();
    }
    const QString text = value.toString();
    QDateTime date = QDateTime::fromString(text, Qt::ISODate);
    if (!date.isValid()) {
        // CURRENT_TIMESTAMP is "YYYY-MM-DD HH:MM:SS" in UTC.
        date = QDateTime::fromString(text, QStringLiteral("yyyy-MM-dd HH:mm:ss"));
        date.setTimeSpec(Qt::UTC);
    }
    return date;
}

/**
 * @brief Opens the connection, applies pragmas and pending migrations.
 * @param error Optional error output.
 * @return True when the database is ready for use.
 */
bool LibraryDatabase::open(OperationError *error)
{
    if (m_open) {
        return true;
    }

    if (m_path != inMemoryPath()) {
        const QString dir = QFileInfo(m_path).absolutePath();
        if (!QDir().mkpath(dir)) {
            setError(error, ErrorCode::DatabaseError,
                     QCoreApplication::translate("LibraryDatabase", "Cannot create database folder %1").arg(dir));
            return false;
        }
    }

    QSqlDatabase db = QSqlDatabase::addDatabase(QLatin1String(DatabaseConstants::driver), m_connectionName);
    db.setDatabaseName(m_path);
    db.setConnectOptions(QStringLiteral("QSQLITE_BUSY_TIMEOUT=%1").arg(DatabaseConstants::busyTimeoutMs));
    if (!db.open()) {
        setError(error, ErrorCode::DatabaseError, db.lastError().text());
        qCCritical(lcDatabase) << "Failed to open database" << m_path << db.lastError().text();
        db = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
        return false;
    }
    m_open = true;
    qCInfo(lcDatabase) << "Database connection established" << m_path;

    if (!applyPragmas(error) || !runMigrations(error)) {
        close();
        return false;
    }
    return true;
}

void LibraryDatabase::close()
{
    if (!m_open) {
        return;
    }
    {
        QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
        if (db.isOpen()) {
            db.close();
        }
    }
    QSqlDatabase::removeDatabase(m_connectionName);
    m_open = false;
    qCInfo(lcDatabase) << "Database connection closed" << m_path;
}

bool LibraryDatabase::isOpen() const
{
    return m_open;
}

QString LibraryDatabase::databasePath() const
{
    return m_path;
}

QSqlDatabase LibraryDatabase::database() const
{
    return QSqlDatabase::database(m_connectionName, false);
}

int LibraryDatabase::schemaVersion() const
{
    QSqlQuery query(database());
    if (!query.exec(QStringLiteral("SELECT MAX(version) FROM migrations")) || !query.next()) {
        return 0;
    }
    return query.value(0).toInt();
}

bool LibraryDatabase::healthCheck(QString *message) const
{
    if (!m_open) {
        if (message) {
            *message = QCoreApplication::translate("LibraryDatabase", "Database not initialized");
        }
        return false;
    }
    QSqlQuery query(database());
    if (!query.exec(QStringLiteral("SELECT 1")) || !query.next()) {
        if (message) {
            *message = QCoreApplication::translate("LibraryDatabase", "Database health check failed: %1")
                           .arg(query.lastError().text());
        }
        return false;
    }
    if (message) {
        *message = QCoreApplication::translate("LibraryDatabase", "Database is healthy");
    }
    return true;
}

QVariantMap LibraryDatabase::tableCounts() const
{
    QVariantMap counts;
    const QStringList tables = {
        QStringLiteral("images"),
        QStringLiteral("duplicate_groups"),
        QStringLiteral("duplicate_items")
    };
    for (const QString &table : tables) {
        QSqlQuery query(database());
        if (query.exec(QStringLiteral("SELECT COUNT(*) FROM %1").arg(table)) && query.next()) {
            counts.insert(table, query.value(0).toLongLong());
        }
    }
    counts.insert("path", m_path);
    return counts;
}

/**
 * @brief Executes a prepared query, logging and reporting failures.
 * @param query Prepared query with bound values.
 * @param operation Short operation name used in logs.
 * @param error Optional error output.
 * @return True on success.
 */
bool LibraryDatabase::exec(QSqlQuery &query, const char *operation, OperationError *error) const
{
    qCDebug(lcDatabase) << "Repository operation:" << operation;
    if (query.exec()) {
        return true;
    }
    const QString text = query.lastError().text();
    qCWarning(lcDatabase) << "Repository operation failed:" << operation << text;
    setError(error, ErrorCode::DatabaseError, QStringLiteral("%1: %2").arg(QLatin1String(operation), text));
    return false;
}

bool LibraryDatabase::exec(const QString &statement, const char *operation, OperationError *error) const
{
    QSqlQuery query(database());
    if (!query.prepare(statement)) {
        const QString text = query.lastError().text();
        qCWarning(lcDatabase) << "Failed to prepare" << operation << text;
        setError(error, ErrorCode::DatabaseError, QStringLiteral("%1: %2").arg(QLatin1String(operation), text));
        return false;
    }
    return exec(query, operation, error);
}

bool LibraryDatabase::applyPragmas(OperationError *error)
{
    if (!exec(QStringLiteral("PRAGMA foreign_keys = ON"), "enable foreign keys", error)) {
        return false;
    }
    if (m_path == inMemoryPath()) {
        return true;
    }
    // journal_mode returns a row; QSqlQuery::exec is enough to apply it.
    QSqlQuery query(database());
    if (!query.exec(QStringLiteral("PRAGMA journal_mode = WAL"))) {
        qCWarning(lcDatabase) << "Could not enable WAL journal" << query.lastError().text();
    }
    return exec(QStringLiteral("PRAGMA synchronous = NORMAL"), "set synchronous mode", error);
}

QVector<LibraryDatabase::Migration> LibraryDatabase::migrations()
{
    return {
        {1, "Create initial schema", {
            QStringLiteral(
                "CREATE TABLE images ("
                " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                " path TEXT UNIQUE NOT NULL,"
                " filename TEXT NOT NULL,"
                " directory TEXT NOT NULL,"
                " hash TEXT NOT NULL,"
                " perceptual_hash TEXT,"
                " size INTEGER NOT NULL,"
                " width INTEGER,"
                " height INTEGER,"
                " format TEXT,"
                " taken_at DATETIME,"
                " camera_make TEXT,"
                " camera_model TEXT,"
                " thumbnail_path TEXT,"
                " file_modified_at INTEGER,"
                " created_at DATETIME DEFAULT CURRENT_TIMESTAMP,"
                " last_scanned_at DATETIME DEFAULT CURRENT_TIMESTAMP)"),
            QStringLiteral(
                "CREATE TABLE duplicate_groups ("
                " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                " hash TEXT UNIQUE NOT NULL,"
                " count INTEGER NOT NULL DEFAULT 0,"
                " total_size INTEGER NOT NULL DEFAULT 0,"
                " created_at DATETIME DEFAULT CURRENT_TIMESTAMP,"
                " updated_at DATETIME DEFAULT CURRENT_TIMESTAMP)"),
            QStringLiteral(
                "CREATE TABLE duplicate_items ("
                " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                " group_id INTEGER NOT NULL,"
                " image_id INTEGER NOT NULL UNIQUE,"
                " created_at DATETIME DEFAULT CURRENT_TIMESTAMP,"
                " FOREIGN KEY (group_id) REFERENCES duplicate_groups(id) ON DELETE CASCADE,"
                " FOREIGN KEY (image_id) REFERENCES images(id) ON DELETE CASCADE)"),
            QStringLiteral("CREATE INDEX idx_images_hash ON images(hash)"),
            QStringLiteral("CREATE INDEX idx_images_directory ON images(directory)"),
            QStringLiteral("CREATE INDEX idx_images_perceptual_hash ON images(perceptual_hash)"),
            QStringLiteral("CREATE INDEX idx_duplicate_items_group_id ON duplicate_items(group_id)")
        }}
    };
}

/**
 * @brief Applies every migration newer than the recorded schema version.
 *
 * Each migration runs in its own transaction together with its bookkeeping row.
 */
bool LibraryDatabase::runMigrations(OperationError *error)
{
    if (!exec(QStringLiteral(
                  "CREATE TABLE IF NOT EXISTS migrations ("
                  " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                  " version INTEGER UNIQUE NOT NULL,"
                  " description TEXT NOT NULL,"
                  " applied_at DATETIME DEFAULT CURRENT_TIMESTAMP)"),
              "create migrations table", error)) {
        return false;
    }

    const int currentVersion = schemaVersion();
    qCInfo(lcDatabase) << "Current database version" << currentVersion;

    const QVector<Migration> all = migrations();
    for (const Migration &migration : all) {
        if (migration.version <= currentVersion) {
            continue;
        }
        qCInfo(lcDatabase) << "Applying migration" << migration.version << migration.description;

        Transaction transaction(*this);
        if (!transaction.isActive()) {
            setError(error, ErrorCode::DatabaseError, database().lastError().text());
            return false;
        }
        for (const QString &statement : migration.statements) {
            if (!exec(statement, migration.description, error)) {
                qCCritical(lcDatabase) << "Migration failed" << migration.version;
                return false;
            }
        }
        QSqlQuery record(database());
        record.prepare(QStringLiteral("INSERT INTO migrations (version, description) VALUES (?, ?)"));
        record.addBindValue(migration.version);
        record.addBindValue(QString::fromLatin1(migration.description));
        if (!exec(record, "record migration", error) || !transaction.commit(error)) {
            return false;
        }
    }
    return true;
}

Transaction::Transaction(const LibraryDatabase &database)
    : m_database(database.database())
{
    m_active = m_database.isValid() && m_database.transaction();
    if (!m_active) {
        qCWarning(lcDatabase) << "Could not begin transaction" << m_database.lastError().text();
    }
}

Transaction::~Transaction()
{
    if (m_active) {
        m_database.rollback();
        qCDebug(lcDatabase) << "Transaction rolled back";
    }
}

bool Transaction::isActive() const
{
    return m_active;
}

bool Transaction::commit(OperationError *error)
{
    if (!m_active) {
        setError(error, ErrorCode::DatabaseError, QStringLiteral("No active transaction"));
        return false;
    }
    if (!m_database.commit()) {
        setError(error, ErrorCode::DatabaseError, m_database.lastError().text());
        qCWarning(lcDatabase) << "Commit failed" << m_database.lastError().text();
        return false;
    }
    m_active = false;
    return true;
}
