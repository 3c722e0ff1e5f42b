#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace fetchy::detail {

// Cooperative cancellation shared by a task's workers.
class StopSignal {
public:
    void request() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        requested_.store(false, std::memory_order_release);
    }

    [[nodiscard]] bool requested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }

    // Sleeps up to timeout; true when stop was requested meanwhile.
    template<typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return requested(); });
    }

private:
    std::atomic<bool> requested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace fetchy::detail
