#pragma once

#include <QMutex>
#include <QSet>
#include <QString>

#include "CoreTypes.h"

class RootScanRegistry;

/**
 * @brief Exclusive right to run a duplicate scan on one root. Released on destruction.
 */
class ScanToken
{
public:
    ScanToken() = default;
    ~ScanToken();

    ScanToken(ScanToken &&other) noexcept;
    ScanToken &operator=(ScanToken &&other) noexcept;
    ScanToken(const ScanToken &) = delete;
    ScanToken &operator=(const ScanToken &) = delete;

    bool isValid() const;
    QString root() const;
    void release();

private:
    friend class RootScanRegistry;
    ScanToken(RootScanRegistry *registry, const QString &root);

    RootScanRegistry *m_registry = nullptr;
    QString m_root;
};

/**
 * @brief Tracks which roots currently have a duplicate scan in flight.
 *
 * Roots are compared after normalization. Nested roots are not exclusive of
 * each other; only the same root is.
 */
class RootScanRegistry
{
public:
    RootScanRegistry() = default;

    ScanToken tryAcquire(const QString &root, OperationError *error = nullptr);
    bool isBusy(const QString &root) const;
    int activeCount() const;

private:
    friend class ScanToken;
    void release(const QString &root);

    mutable QMutex m_mutex;
    QSet<QString> m_active;
};
