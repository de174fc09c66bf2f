/**
 * @file test_scanlock.cpp
 * @brief Unit tests for the per-root scan registry
 */

#include <gtest/gtest.h>

#include <utility>

#include "ScanLock.h"
#include "TestUtils.h"

/**
 * @test SecondScanOfSameRootIsBusy
 * @brief While a token is held, the same root (in any spelling) is refused with Busy.
 */
TEST(ScanLockTest, SecondScanOfSameRootIsBusy)
{
    RootScanRegistry registry;
    ScanToken first = registry.tryAcquire("/photos");
    ASSERT_TRUE(first.isValid());
    EXPECT_EQ(first.root(), "/photos");
    EXPECT_TRUE(registry.isBusy("/photos/"));

    OperationError error;
    ScanToken second = registry.tryAcquire("/photos/./", &error);
    EXPECT_FALSE(second.isValid());
    EXPECT_EQ(error.code, ErrorCode::Busy);
    EXPECT_EQ(registry.activeCount(), 1);
}

TEST(ScanLockTest, DifferentRootsAreIndependent)
{
    RootScanRegistry registry;
    ScanToken photos = registry.tryAcquire("/photos");
    ScanToken nested = registry.tryAcquire("/photos/2024");
    ScanToken other = registry.tryAcquire("/archive");
    EXPECT_TRUE(photos.isValid());
    EXPECT_TRUE(nested.isValid());
    EXPECT_TRUE(other.isValid());
    EXPECT_EQ(registry.activeCount(), 3);
}

/**
 * @test TokenReleasesOnScopeExit
 * @brief Destroying or releasing a token frees the root.
 */
TEST(ScanLockTest, TokenReleasesOnScopeExit)
{
    RootScanRegistry registry;
    {
        ScanToken token = registry.tryAcquire("/photos");
        ASSERT_TRUE(token.isValid());
    }
    EXPECT_FALSE(registry.isBusy("/photos"));

    ScanToken token = registry.tryAcquire("/photos");
    ASSERT_TRUE(token.isValid());
    token.release();
    EXPECT_FALSE(token.isValid());
    EXPECT_FALSE(registry.isBusy("/photos"));
    token.release();
    EXPECT_EQ(registry.activeCount(), 0);
}

TEST(ScanLockTest, MovedTokenKeepsTheRoot)
{
    RootScanRegistry registry;
    ScanToken original = registry.tryAcquire("/photos");
    ScanToken moved(std::move(original));
    EXPECT_FALSE(original.isValid());
    EXPECT_TRUE(moved.isValid());
    EXPECT_TRUE(registry.isBusy("/photos"));

    ScanToken assigned;
    assigned = std::move(moved);
    EXPECT_TRUE(assigned.isValid());
    EXPECT_TRUE(registry.isBusy("/photos"));

    assigned = ScanToken();
    EXPECT_FALSE(registry.isBusy("/photos"));
}

TEST(ScanLockTest, EmptyRootIsRejected)
{
    RootScanRegistry registry;
    OperationError error;
    ScanToken token = registry.tryAcquire("", &error);
    EXPECT_FALSE(token.isValid());
    EXPECT_EQ(error.code, ErrorCode::InvalidArgument);
}
