#pragma once

#include "config.hpp"

#include <algorithm>
#include <chrono>

namespace fetchy {

struct RetryPolicy {
    // Transient failures tolerated is max_retries - 1; the max_retries-th is fatal.
    int max_retries{3};
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{8000};

    static RetryPolicy fromConfig(const EngineConfig& config) {
        return RetryPolicy{config.max_retries, config.backoff_base, config.backoff_cap};
    }

    [[nodiscard]] bool exhausted(int failures) const noexcept { return failures >= max_retries; }

    // base, 2*base, 4*base, ... capped at max_delay.
    [[nodiscard]] std::chrono::milliseconds delayFor(int failures) const noexcept {
        if (failures <= 0) {
            return std::chrono::milliseconds{0};
        }
        const int shift = std::min(failures - 1, 30);
        if (base_delay.count() > (max_delay.count() >> shift)) {
            return max_delay;
        }
        return std::min<std::chrono::milliseconds>(base_delay * (1LL << shift), max_delay);
    }
};

} // namespace fetchy
