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

#include "ScanLock.h"

#include <QMutexLocker>

#include <utility>

#include "LoggingUtils.h"
#include "PathUtils.h"

ScanToken::ScanToken(RootScanRegistry *registry, const QString &root)
    : m_registry(registry)
    , m_root(root)
{
}

ScanToken::~ScanToken()
{
    release();
}

ScanToken::ScanToken(ScanToken &&other) noexcept
    : m_registry(other.m_registry)
    , m_root(std::move(other.m_root))
{
    other.m_registry = nullptr;
    other.m_root.clear();
}

ScanToken &ScanToken::operator=(ScanToken &&other) noexcept
{
    if (this != &other) {
        release();
        m_registry = other.m_registry;
        m_root = std::move(other.m_root);
        other.m_registry = nullptr;
        other.m_root.clear();
    }
    return *this;
}

bool ScanToken::isValid() const
{
    return m_registry != nullptr;
}

QString ScanToken::root() const
{
    return m_root;
}

void ScanToken::release()
{
    if (!m_registry) {
        return;
    }
    m_registry->release(m_root);
    m_registry = nullptr;
    m_root.clear();
}

/**
 * @brief Claims a root for one duplicate scan.
 * @param root Root directory of the scan.
 * @param error Optional error output; Busy when the root is already claimed.
 * @return A valid token on success, an invalid one otherwise.
 */
ScanToken RootScanRegistry::tryAcquire(const QString &root, OperationError *error)
{
    const QString key = PathUtils::normalizePath(root);
    if (key.isEmpty()) {
        setError(error, ErrorCode::InvalidArgument, QStringLiteral("Scan root is empty"));
        return ScanToken();
    }

    QMutexLocker locker(&m_mutex);
    if (m_active.contains(key)) {
        setError(error, ErrorCode::Busy, QStringLiteral("A duplicate scan is already running for %1").arg(key));
        qCInfo(lcHasher) << "Duplicate scan refused, root busy:" << key;
        return ScanToken();
    }
    m_active.insert(key);
    return ScanToken(this, key);
}

bool RootScanRegistry::isBusy(const QString &root) const
{
    const QString key = PathUtils::normalizePath(root);
    QMutexLocker locker(&m_mutex);
    return m_active.contains(key);
}

int RootScanRegistry::activeCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_active.size();
}

void RootScanRegistry::release(const QString &root)
{
    QMutexLocker locker(&m_mutex);
    m_active.remove(root);
}
