#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <deque>
#include <vector>
#include <condition_variable>
#include <thread>
#include <cstdint>

// Broadcast channel for caller-facing events.
//
// Handlers run outside the channel lock, in subscription order.  An emit()
// issued from inside a handler on the dispatching thread is queued and
// delivered once the current dispatch finishes, so handlers never re-enter.
template <typename Event>
class EventChannel {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = ++next_id_;
        handlers_[id] = std::move(handler);
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(id);
    }

    void emit(const Event& event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (dispatching_ && dispatcher_ == std::this_thread::get_id()) {
                pending_.push_back(event);
                return;
            }
        }

        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return !dispatching_; });
        dispatching_ = true;
        dispatcher_ = std::this_thread::get_id();
        pending_.push_back(event);

        while (!pending_.empty()) {
            Event next = std::move(pending_.front());
            pending_.pop_front();
            std::vector<Handler> snapshot;
            for (const auto& [id, h] : handlers_) snapshot.push_back(h);

            lock.unlock();
            for (auto& h : snapshot) h(next);
            lock.lock();
        }

        dispatching_ = false;
        dispatcher_ = std::thread::id();
        lock.unlock();
        idle_.notify_all();
    }

    size_t subscriber_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

private:
    std::mutex mutex_;
    std::condition_variable idle_;
    std::map<SubscriptionId, Handler> handlers_;
    std::deque<Event> pending_;
    SubscriptionId next_id_ = 0;
    bool dispatching_ = false;
    std::thread::id dispatcher_;
};
