#include "scheduler.hpp"
#include "log.hpp"

TimerScheduler::TimerScheduler() {
    worker_ = std::thread([this] { run(); });
}

TimerScheduler::~TimerScheduler() {
    shutdown();
}

Scheduler::TaskId TimerScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = ++next_id_;
        queue_.emplace(Clock::now() + delay, Entry{id, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

bool TimerScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->second.id == id) {
            queue_.erase(it);
            return true;
        }
    }
    return false;
}

void TimerScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        queue_.clear();
    }
    cv_.notify_all();
    if (!worker_.joinable()) return;
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

void TimerScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            continue;
        }

        auto due = queue_.begin()->first;
        if (Clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        Task task = std::move(queue_.begin()->second.task);
        queue_.erase(queue_.begin());

        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            sshlite_log(fmt::format("Scheduler: task threw: {}", e.what()));
        }
        lock.lock();
    }
}
