// test_event_loop.cpp — Тесты цикла событий

#include <gtest/gtest.h>
#include "twinpane/Rpc/EventLoop.h"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace TwinPane;
using namespace std::chrono_literals;

TEST(EventLoopTest, RunsTasksInPostOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&] { order.push_back(1); });
    loop.post([&] { order.push_back(2); });
    loop.post([&] { order.push_back(3); });

    EXPECT_EQ(loop.pendingCount(), 3u);
    EXPECT_EQ(loop.runPending(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop.pendingCount(), 0u);
}

TEST(EventLoopTest, TasksPostedDuringRunWaitForNextPass) {
    EventLoop loop;
    int runs = 0;
    loop.post([&] {
        ++runs;
        loop.post([&] { ++runs; });
    });

    EXPECT_EQ(loop.runPending(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(loop.runPending(), 1u);
    EXPECT_EQ(runs, 2);
}

TEST(EventLoopTest, DelayedTaskFiresAfterDelay) {
    EventLoop loop;
    bool fired = false;
    auto start = std::chrono::steady_clock::now();
    loop.postDelayed(30ms, [&] { fired = true; });

    loop.runPending();
    EXPECT_FALSE(fired);

    EXPECT_TRUE(loop.runUntil([&] { return fired; }, 2000ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
}

TEST(EventLoopTest, CancelledTimerNeverFires) {
    EventLoop loop;
    bool fired = false;
    auto id = loop.postDelayed(10ms, [&] { fired = true; });

    EXPECT_TRUE(loop.cancelTimer(id));
    EXPECT_FALSE(loop.cancelTimer(id));

    loop.runFor(50ms);
    EXPECT_FALSE(fired);
}

TEST(EventLoopTest, RunUntilTimesOut) {
    EventLoop loop;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(loop.runUntil([] { return false; }, 30ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
}

TEST(EventLoopTest, ThrowingTaskDoesNotStopLoop) {
    EventLoop loop;
    bool after = false;
    loop.post([] { throw std::runtime_error("boom"); });
    loop.post([&] { after = true; });

    EXPECT_NO_THROW(loop.runPending());
    EXPECT_TRUE(after);
}

TEST(EventLoopTest, NonStandardThrowDoesNotStopLoop) {
    EventLoop loop;
    bool after = false;
    loop.post([] { throw 42; });
    loop.post([&] { after = true; });

    EXPECT_NO_THROW(loop.runPending());
    EXPECT_TRUE(after);
}

TEST(EventLoopTest, PostFromOtherThreadWakesRun) {
    EventLoop loop;
    std::atomic<bool> handled{false};

    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        loop.post([&] {
            handled = true;
            loop.stop();
        });
    });

    loop.run();
    producer.join();
    EXPECT_TRUE(handled);
}
