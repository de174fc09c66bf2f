#pragma once

#include <QDateTime>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>
#include <QVector>

#include "CoreTypes.h"

class QSqlQuery;

/**
 * @brief Owns one SQLite connection holding images, duplicate groups and their members.
 *
 * Each instance registers its own uniquely named Qt SQL connection, so several
 * libraries (or test fixtures) can be open at the same time. The connection
 * must be used from the thread that opened it.
 */
class LibraryDatabase
{
public:
    explicit LibraryDatabase(const QString &databasePath = QString());
    ~LibraryDatabase();

    LibraryDatabase(const LibraryDatabase &) = delete;
    LibraryDatabase &operator=(const LibraryDatabase &) = delete;

    static QString defaultDatabasePath();
    static QString inMemoryPath();
    static QDateTime parseTimestamp(const QVariant &value);

    bool open(OperationError *error = nullptr);
    void close();
    bool isOpen() const;

    QString databasePath() const;
    QSqlDatabase database() const;
    int schemaVersion() const;

    bool healthCheck(QString *message = nullptr) const;
    QVariantMap tableCounts() const;

    bool exec(QSqlQuery &query, const char *operation, OperationError *error = nullptr) const;
    bool exec(const QString &statement, const char *operation, OperationError *error = nullptr) const;

private:
    struct Migration {
        int version;
        const char *description;
        QStringList statements;
    };

    static QVector<Migration> migrations();
    bool applyPragmas(OperationError *error);
    bool runMigrations(OperationError *error);

    QString m_path;
    QString m_connectionName;
    bool m_open = false;
};

/**
 * @brief Scoped transaction: rolls back on destruction unless committed.
 */
class Transaction
{
public:
    explicit Transaction(const LibraryDatabase &database);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    bool isActive() const;
    bool commit(OperationError *error = nullptr);

private:
    QSqlDatabase m_database;
    bool m_active = false;
};
