#pragma once

#include "config.hpp"
#include "download_task.hpp"
#include "progress.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fetchy {

// Merges per-chunk byte deltas into rate/ETA/percent and pushes snapshots to
// subscribers from its own thread. Workers only touch atomics, so a slow
// subscriber never stalls a transfer.
class ProgressAggregator {
public:
    using Subscriber = std::function<void(const ProgressSnapshot&)>;
    using SubscriptionId = std::size_t;

    ProgressAggregator(std::string task_id, std::string filename,
                       std::chrono::milliseconds interval, double smoothing = 0.3);
    ~ProgressAggregator();

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // Reloads counters from chunk state. Call only while no worker is running.
    void reset(std::optional<std::uint64_t> total_bytes, const std::vector<ChunkState>& chunks);
    void setStatus(TaskStatus status, std::string error_message = {});

    void add(std::size_t chunk_index, std::uint64_t delta) noexcept;
    // Drops a chunk's count back to zero, e.g. when a range-less stream restarts.
    void rewind(std::size_t chunk_index) noexcept;
    [[nodiscard]] std::uint64_t chunkBytes(std::size_t chunk_index) const noexcept;
    [[nodiscard]] std::uint64_t downloaded() const noexcept;

    SubscriptionId subscribe(Subscriber subscriber);
    void unsubscribe(SubscriptionId id);

    void start();
    // Joins the emitter and publishes one final snapshot.
    void stop();

    [[nodiscard]] ProgressSnapshot snapshot() const;
    // Folds the bytes seen since the previous tick into the smoothed rate.
    ProgressSnapshot tick(std::chrono::steady_clock::time_point now);

private:
    void run();
    void publish(const ProgressSnapshot& snapshot);
    [[nodiscard]] ProgressSnapshot buildSnapshot() const;

    const std::string task_id_;
    const std::string filename_;
    const std::chrono::milliseconds interval_;
    const double smoothing_;

    std::array<std::atomic<std::uint64_t>, kMaxThreads> chunk_bytes_{};

    mutable std::mutex state_mutex_;
    std::optional<std::uint64_t> total_bytes_;
    TaskStatus status_{TaskStatus::Queued};
    std::string error_message_;
    double rate_{0.0};
    bool has_rate_{false};
    std::uint64_t last_bytes_{0};
    std::optional<std::chrono::steady_clock::time_point> last_tick_;

    std::mutex subscribers_mutex_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId next_subscription_{1};

    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool running_{false};
    std::thread emitter_;
};

} // namespace fetchy
