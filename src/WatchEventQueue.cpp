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

#include "WatchEventQueue.h"

#include <QMutexLocker>

namespace {
struct WatchEventQueueConstants {
    static constexpr int defaultCapacity = 1024;
    static constexpr int minimumCapacity = 1;
};
} // namespace

QString watchEventTypeName(WatchEventType type)
{
    switch (type) {
    case WatchEventType::FileAdded:
        return QStringLiteral("fileAdded");
    case WatchEventType::FileRemoved:
        return QStringLiteral("fileRemoved");
    case WatchEventType::FileChanged:
        return QStringLiteral("fileChanged");
    case WatchEventType::DirectoryAdded:
        return QStringLiteral("directoryAdded");
    case WatchEventType::DirectoryRemoved:
        return QStringLiteral("directoryRemoved");
    case WatchEventType::WatcherError:
        return QStringLiteral("watcherError");
    }
    return QString();
}

WatchEventQueue::WatchEventQueue(int capacity)
    : m_capacity(qMax(WatchEventQueueConstants::minimumCapacity, capacity))
{
}

int WatchEventQueue::defaultCapacity()
{
    return WatchEventQueueConstants::defaultCapacity;
}

/**
 * @brief Appends an event unless the queue is full.
 * @param event Event to append.
 * @param wasEmpty Optional output, true when the queue was empty before this push.
 * @return False when the event was dropped.
 */
bool WatchEventQueue::push(const WatchEvent &event, bool *wasEmpty)
{
    QMutexLocker locker(&m_mutex);
    if (wasEmpty) {
        *wasEmpty = m_events.isEmpty();
    }
    if (m_events.size() >= m_capacity) {
        m_dropped += 1;
        return false;
    }
    m_events.enqueue(event);
    return true;
}

bool WatchEventQueue::tryPop(WatchEvent *event)
{
    QMutexLocker locker(&m_mutex);
    if (m_events.isEmpty()) {
        return false;
    }
    const WatchEvent front = m_events.dequeue();
    if (event) {
        *event = front;
    }
    return true;
}

/**
 * @brief Removes and returns queued events in arrival order.
 * @param maxEvents Maximum number of events to take, or a negative value for all.
 */
QVector<WatchEvent> WatchEventQueue::drain(int maxEvents)
{
    QMutexLocker locker(&m_mutex);
    const int count = maxEvents < 0 ? m_events.size() : qMin(maxEvents, static_cast<int>(m_events.size()));
    QVector<WatchEvent> events;
    events.reserve(count);
    for (int i = 0; i < count; ++i) {
        events.append(m_events.dequeue());
    }
    return events;
}

int WatchEventQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_events.size();
}

bool WatchEventQueue::isEmpty() const
{
    QMutexLocker locker(&m_mutex);
    return m_events.isEmpty();
}

int WatchEventQueue::capacity() const
{
    return m_capacity;
}

quint64 WatchEventQueue::droppedCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_dropped;
}

/**
 * @brief Clears the dropped counter.
 * @return The count before the reset.
 */
quint64 WatchEventQueue::resetDropped()
{
    QMutexLocker locker(&m_mutex);
    const quint64 dropped = m_dropped;
    m_dropped = 0;
    return dropped;
}

void WatchEventQueue::clear()
{
    QMutexLocker locker(&m_mutex);
    m_events.clear();
    m_dropped = 0;
}
