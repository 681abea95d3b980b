#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <cstdint>

// Delayed task execution.  The registry schedules reconnect attempts through
// this so tests can substitute virtual time.
class Scheduler {
public:
    using TaskId = uint64_t;
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual TaskId schedule(std::chrono::milliseconds delay, Task task) = 0;

    // True if the task was still pending.  A task that already started runs to completion.
    virtual bool cancel(TaskId id) = 0;
};

// One worker thread draining a deadline-ordered queue.
class TimerScheduler : public Scheduler {
public:
    TimerScheduler();
    ~TimerScheduler() override;

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    TaskId schedule(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TaskId id) override;

    // Drop pending tasks and join the worker
    void shutdown();

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        TaskId id;
        Task task;
    };

    std::mutex mutex_;
    std::condition_variable cv_;
    std::multimap<Clock::time_point, Entry> queue_;
    TaskId next_id_ = 0;
    bool stop_ = false;
    std::thread worker_;

    void run();
};
