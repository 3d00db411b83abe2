#include "cache/file_lock_manager.hpp"

#include <gtest/gtest.h>

using TierFS::Cache::FileLockManager;

TEST(FileLockManagerTest, SameKeySharesOneMutex)
{
    FileLockManager locks;
    auto first  = locks.GetFileLock("/nas/movie.mkv");
    auto second = locks.GetFileLock("/nas/movie.mkv");
    auto other  = locks.GetFileLock("/s3/movie.mkv");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_NE(first.get(), other.get());
    EXPECT_EQ(locks.ActiveLocks(), 2u);
}

TEST(FileLockManagerTest, ReleasedMutexesAreSwept)
{
    FileLockManager locks;
    {
        auto held = locks.GetFileLock("/a");
        EXPECT_EQ(locks.ActiveLocks(), 1u);
    }
    EXPECT_EQ(locks.ActiveLocks(), 0u);
}
