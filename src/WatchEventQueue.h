#pragma once

#include <QMutex>
#include <QQueue>
#include <QString>
#include <QVector>
#include <QtGlobal>

enum class WatchEventType {
    FileAdded,
    FileRemoved,
    FileChanged,
    DirectoryAdded,
    DirectoryRemoved,
    WatcherError
};

QString watchEventTypeName(WatchEventType type);

struct WatchEvent {
    WatchEventType type = WatchEventType::FileChanged;
    QString path;
    QString message;
};

/**
 * @brief Bounded, thread-safe FIFO of watch events.
 *
 * When the queue is full new events are dropped and counted. A non-zero
 * droppedCount() means the consumer missed changes and should rescan.
 */
class WatchEventQueue
{
public:
    explicit WatchEventQueue(int capacity = defaultCapacity());

    static int defaultCapacity();

    bool push(const WatchEvent &event, bool *wasEmpty = nullptr);
    bool tryPop(WatchEvent *event);
    QVector<WatchEvent> drain(int maxEvents = -1);

    int size() const;
    bool isEmpty() const;
    int capacity() const;

    quint64 droppedCount() const;
    quint64 resetDropped();
    void clear();

private:
    mutable QMutex m_mutex;
    QQueue<WatchEvent> m_events;
    int m_capacity = 0;
    quint64 m_dropped = 0;
};
