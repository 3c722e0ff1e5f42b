#pragma once

#include "detail/stop_signal.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace fetchy {

// Counting semaphore bounding in-flight connections across every task.
class ConnectionLimiter {
public:
    // 0 disables the cap.
    explicit ConnectionLimiter(std::size_t max_connections = 0);

    // Blocks for a slot; false when stop was requested first.
    [[nodiscard]] bool acquire(const detail::StopSignal& stop);
    void release();

    [[nodiscard]] std::size_t inFlight() const;
    [[nodiscard]] std::size_t peakInFlight() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t in_flight_{0};
    std::size_t peak_{0};
};

class ConnectionPermit {
public:
    ConnectionPermit(ConnectionLimiter& limiter, const detail::StopSignal& stop)
        : limiter_(limiter), acquired_(limiter.acquire(stop)) {}
    ~ConnectionPermit() {
        if (acquired_) {
            limiter_.release();
        }
    }

    ConnectionPermit(const ConnectionPermit&) = delete;
    ConnectionPermit& operator=(const ConnectionPermit&) = delete;

    [[nodiscard]] bool acquired() const noexcept { return acquired_; }

private:
    ConnectionLimiter& limiter_;
    bool acquired_;
};

} // namespace fetchy
