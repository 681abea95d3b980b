#include <gtest/gtest.h>
#include <core/scheduler.hpp>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <vector>

namespace {

struct Latch {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<int> order;

    void hit(int v) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(v);
        }
        cv.notify_all();
    }

    bool wait_for(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&] { return order.size() >= n; });
    }
};

} // namespace

TEST(TimerScheduler, RunsAfterDelay) {
    TimerScheduler s;
    Latch latch;
    auto start = std::chrono::steady_clock::now();
    s.schedule(std::chrono::milliseconds(30), [&] { latch.hit(1); });
    ASSERT_TRUE(latch.wait_for(1));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(30));
}

TEST(TimerScheduler, DeadlineOrder) {
    TimerScheduler s;
    Latch latch;
    s.schedule(std::chrono::milliseconds(60), [&] { latch.hit(2); });
    s.schedule(std::chrono::milliseconds(10), [&] { latch.hit(1); });
    ASSERT_TRUE(latch.wait_for(2));
    EXPECT_EQ(latch.order, (std::vector<int>{1, 2}));
}

TEST(TimerScheduler, CancelPreventsRun) {
    TimerScheduler s;
    Latch latch;
    auto id = s.schedule(std::chrono::milliseconds(50), [&] { latch.hit(1); });
    EXPECT_TRUE(s.cancel(id));
    EXPECT_FALSE(s.cancel(id));
    s.schedule(std::chrono::milliseconds(100), [&] { latch.hit(2); });
    ASSERT_TRUE(latch.wait_for(1));
    EXPECT_EQ(latch.order, (std::vector<int>{2}));
}

TEST(TimerScheduler, ShutdownDropsPending) {
    std::atomic<int> ran{0};
    {
        TimerScheduler s;
        s.schedule(std::chrono::seconds(10), [&] { ran++; });
        s.shutdown();
    }
    EXPECT_EQ(ran.load(), 0);
}

TEST(TimerScheduler, TaskMayScheduleAnother) {
    TimerScheduler s;
    Latch latch;
    s.schedule(std::chrono::milliseconds(5), [&] {
        latch.hit(1);
        s.schedule(std::chrono::milliseconds(5), [&] { latch.hit(2); });
    });
    ASSERT_TRUE(latch.wait_for(2));
}
