#include "fetchy/connection_limiter.hpp"

#include <algorithm>
#include <chrono>

namespace fetchy {

namespace {

// Stop requests arrive on another condition variable; poll at this cadence.
constexpr std::chrono::milliseconds kStopPollInterval{50};

} // namespace

ConnectionLimiter::ConnectionLimiter(std::size_t max_connections)
    : capacity_(max_connections) {}

bool ConnectionLimiter::acquire(const detail::StopSignal& stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (capacity_ != 0 && in_flight_ >= capacity_) {
        if (stop.requested()) {
            return false;
        }
        cv_.wait_for(lock, kStopPollInterval);
    }
    if (stop.requested()) {
        return false;
    }
    ++in_flight_;
    peak_ = std::max(peak_, in_flight_);
    return true;
}

void ConnectionLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    cv_.notify_one();
}

std::size_t ConnectionLimiter::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t ConnectionLimiter::peakInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

} // namespace fetchy
