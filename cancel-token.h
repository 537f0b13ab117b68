#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Cooperative cancellation flag: one writer trips it, any number of readers poll it.
class CancelToken {
public:
    // True only for the call that actually tripped the flag
    bool cancel() {
        bool was_cancelled = cancelled_.exchange(true);
        if (!was_cancelled) {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        }
        return !was_cancelled;
    }

    bool is_cancelled() const { return cancelled_.load(); }

    // Sleeps for the given time unless cancelled first; returns true when cancelled
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
