#include "async_io_manager.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

using namespace TierFS;

TEST(AsyncIoManagerTest, ZeroThreadsStillRunsWork)
{
    AsyncIoManager io(0);
    EXPECT_EQ(io.ThreadCount(), 1u);
    EXPECT_EQ(io.Submit([]() { return 42; }).get(), 42);
}

TEST(AsyncIoManagerTest, RunsEveryQueuedTask)
{
    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    {
        AsyncIoManager io(4);
        for (int i = 0; i < 100; ++i) {
            futures.push_back(io.Submit([&done]() { ++done; }));
        }
    }
    // Destruction drains the queue.
    EXPECT_EQ(done.load(), 100);
    for (auto &future : futures) {
        EXPECT_NO_THROW(future.get());
    }
}

TEST(AsyncIoManagerTest, ExceptionsReachTheFuture)
{
    AsyncIoManager io(1);
    auto future = io.Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(io.Submit([]() { return 7; }).get(), 7);
}
