#pragma once

#include <map>
#include <mutex>
#include <chrono>
#include <core/scheduler.hpp>

// Virtual-time scheduler: nothing runs until the test calls advance().
class ManualScheduler : public Scheduler {
public:
    TaskId schedule(std::chrono::milliseconds delay, Task task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        TaskId id = ++next_id_;
        tasks_[id] = Pending{now_ + delay, std::move(task)};
        return id;
    }

    bool cancel(TaskId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.erase(id) > 0;
    }

    // Move the clock forward, running every task that falls due, in deadline
    // order.  Tasks scheduled while running only fire if they are also due.
    void advance(std::chrono::milliseconds by) {
        std::chrono::milliseconds until;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            until = now_ + by;
        }
        while (true) {
            Task task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto next = tasks_.end();
                for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
                    if (it->second.due > until) continue;
                    if (next == tasks_.end() || it->second.due < next->second.due) next = it;
                }
                if (next == tasks_.end()) {
                    now_ = until;
                    return;
                }
                now_ = next->second.due;
                task = std::move(next->second.task);
                tasks_.erase(next);
            }
            task();
        }
    }

    size_t pending() {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

private:
    struct Pending {
        std::chrono::milliseconds due{0};
        Task task;
    };

    std::mutex mutex_;
    std::map<TaskId, Pending> tasks_;
    std::chrono::milliseconds now_{0};
    TaskId next_id_ = 0;
};
