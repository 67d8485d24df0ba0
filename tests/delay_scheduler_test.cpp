#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include "core/completion_latch.hpp"
#include "core/delay_scheduler.hpp"

using namespace std::chrono_literals;

TEST(DelaySchedulerTest, RunsCallbacksInDueOrder)
{
    DelayScheduler scheduler;
    std::mutex mutex;
    std::vector<int> order;
    CompletionLatch latch(3);

    auto record = [&](int value)
    {
        return [&, value]()
        {
            {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(value);
            }
            latch.countDown();
        };
    };
    scheduler.schedule(60ms, record(3));
    scheduler.schedule(10ms, record(1));
    scheduler.schedule(30ms, record(2));

    ASSERT_TRUE(latch.waitFor(2000ms));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(DelaySchedulerTest, DoesNotRunEarly)
{
    DelayScheduler scheduler;
    std::atomic<bool> ran{false};
    scheduler.schedule(500ms, [&ran]()
                       { ran.store(true); });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(ran.load());
    EXPECT_EQ(scheduler.pending(), 1u);
}

TEST(DelaySchedulerTest, FlushRunsPendingImmediately)
{
    DelayScheduler scheduler;
    CompletionLatch latch(2);
    scheduler.schedule(10s, [&latch]()
                       { latch.countDown(); });
    scheduler.schedule(20s, [&latch]()
                       { latch.countDown(); });

    auto started = std::chrono::steady_clock::now();
    scheduler.flush();
    ASSERT_TRUE(latch.waitFor(2000ms));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST(DelaySchedulerTest, StopRunsRemainingCallbacks)
{
    std::atomic<int> runs{0};
    {
        DelayScheduler scheduler;
        scheduler.schedule(30s, [&runs]()
                           { ++runs; });
        scheduler.stop();
        scheduler.stop();
    }
    EXPECT_EQ(runs.load(), 1);
}

TEST(DelaySchedulerTest, ThrowingCallbackDoesNotStopTimer)
{
    DelayScheduler scheduler;
    CompletionLatch latch(1);
    scheduler.schedule(1ms, []()
                       { throw std::runtime_error("boom"); });
    scheduler.schedule(20ms, [&latch]()
                       { latch.countDown(); });

    EXPECT_TRUE(latch.waitFor(2000ms));
}

TEST(CompletionLatchTest, ReleasesWhenCountReachesZero)
{
    CompletionLatch latch(2);
    EXPECT_FALSE(latch.waitFor(10ms));
    latch.countDown();
    EXPECT_EQ(latch.remaining(), 1u);
    std::thread worker([&latch]()
                       { latch.countDown(); });
    EXPECT_TRUE(latch.waitFor(2000ms));
    worker.join();
    latch.countDown();
    EXPECT_EQ(latch.remaining(), 0u);
}
