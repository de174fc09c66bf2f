/**
 * @file test_watcheventqueue.cpp
 * @brief Unit tests for the bounded watch event queue
 */

#include <gtest/gtest.h>

#include "TestUtils.h"
#include "WatchEventQueue.h"

namespace {

WatchEvent makeEvent(WatchEventType type, const QString &path)
{
    WatchEvent event;
    event.type = type;
    event.path = path;
    return event;
}

} // namespace

TEST(WatchEventQueueTest, DefaultCapacity)
{
    WatchEventQueue queue;
    EXPECT_EQ(queue.capacity(), 1024);
    EXPECT_EQ(WatchEventQueue::defaultCapacity(), 1024);
    EXPECT_TRUE(queue.isEmpty());
}

/**
 * @test KeepsArrivalOrder
 * @brief Events come out in the order they were pushed.
 */
TEST(WatchEventQueueTest, KeepsArrivalOrder)
{
    WatchEventQueue queue(8);
    bool wasEmpty = false;
    ASSERT_TRUE(queue.push(makeEvent(WatchEventType::FileAdded, "/r/a.jpg"), &wasEmpty));
    EXPECT_TRUE(wasEmpty);
    ASSERT_TRUE(queue.push(makeEvent(WatchEventType::FileChanged, "/r/b.jpg"), &wasEmpty));
    EXPECT_FALSE(wasEmpty);
    ASSERT_TRUE(queue.push(makeEvent(WatchEventType::FileRemoved, "/r/c.jpg")));

    WatchEvent event;
    ASSERT_TRUE(queue.tryPop(&event));
    EXPECT_EQ(event.path, "/r/a.jpg");
    EXPECT_EQ(event.type, WatchEventType::FileAdded);

    const QVector<WatchEvent> rest = queue.drain();
    ASSERT_EQ(rest.size(), 2);
    EXPECT_EQ(rest.at(0).path, "/r/b.jpg");
    EXPECT_EQ(rest.at(1).path, "/r/c.jpg");
    EXPECT_FALSE(queue.tryPop(&event));
}

/**
 * @test DropsWhenFull
 * @brief A full queue rejects new events and counts them; queued events are untouched.
 */
TEST(WatchEventQueueTest, DropsWhenFull)
{
    WatchEventQueue queue(2);
    EXPECT_TRUE(queue.push(makeEvent(WatchEventType::FileAdded, "1")));
    EXPECT_TRUE(queue.push(makeEvent(WatchEventType::FileAdded, "2")));
    EXPECT_FALSE(queue.push(makeEvent(WatchEventType::FileAdded, "3")));
    EXPECT_FALSE(queue.push(makeEvent(WatchEventType::FileAdded, "4")));

    EXPECT_EQ(queue.size(), 2);
    EXPECT_EQ(queue.droppedCount(), 2u);

    const QVector<WatchEvent> events = queue.drain();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events.at(0).path, "1");
    EXPECT_EQ(events.at(1).path, "2");

    EXPECT_EQ(queue.resetDropped(), 2u);
    EXPECT_EQ(queue.droppedCount(), 0u);
    EXPECT_TRUE(queue.push(makeEvent(WatchEventType::FileAdded, "5")));
}

TEST(WatchEventQueueTest, DrainRespectsLimit)
{
    WatchEventQueue queue(10);
    for (int i = 0; i < 5; ++i) {
        queue.push(makeEvent(WatchEventType::FileChanged, QString::number(i)));
    }
    EXPECT_EQ(queue.drain(3).size(), 3);
    EXPECT_EQ(queue.size(), 2);
    EXPECT_EQ(queue.drain(0).size(), 0);
    EXPECT_EQ(queue.drain().size(), 2);
}

TEST(WatchEventQueueTest, ClearResetsDropped)
{
    WatchEventQueue queue(1);
    queue.push(makeEvent(WatchEventType::FileAdded, "a"));
    queue.push(makeEvent(WatchEventType::FileAdded, "b"));
    ASSERT_EQ(queue.droppedCount(), 1u);

    queue.clear();
    EXPECT_TRUE(queue.isEmpty());
    EXPECT_EQ(queue.droppedCount(), 0u);
}

TEST(WatchEventQueueTest, EventTypeNames)
{
    EXPECT_EQ(watchEventTypeName(WatchEventType::FileAdded), "fileAdded");
    EXPECT_EQ(watchEventTypeName(WatchEventType::DirectoryRemoved), "directoryRemoved");
    EXPECT_EQ(watchEventTypeName(WatchEventType::WatcherError), "watcherError");
}
