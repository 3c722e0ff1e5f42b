#include "fetchy/progress_aggregator.hpp"

#include "fetchy/logging.hpp"

#include <exception>
#include <utility>

namespace fetchy {

ProgressAggregator::ProgressAggregator(std::string task_id, std::string filename,
                                       std::chrono::milliseconds interval, double smoothing)
    : task_id_(std::move(task_id)),
      filename_(std::move(filename)),
      interval_(interval),
      smoothing_(smoothing) {
    for (auto& bytes : chunk_bytes_) {
        bytes.store(0, std::memory_order_relaxed);
    }
}

ProgressAggregator::~ProgressAggregator() {
    stop();
}

void ProgressAggregator::reset(std::optional<std::uint64_t> total_bytes,
                               const std::vector<ChunkState>& chunks) {
    for (std::size_t i = 0; i < chunk_bytes_.size(); ++i) {
        const std::uint64_t value = i < chunks.size() ? chunks[i].bytes_downloaded : 0;
        chunk_bytes_[i].store(value, std::memory_order_relaxed);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    total_bytes_ = total_bytes;
    rate_ = 0.0;
    has_rate_ = false;
    last_bytes_ = downloaded();
    last_tick_.reset();
}

void ProgressAggregator::setStatus(TaskStatus status, std::string error_message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    status_ = status;
    error_message_ = std::move(error_message);
}

void ProgressAggregator::add(std::size_t chunk_index, std::uint64_t delta) noexcept {
    if (chunk_index < chunk_bytes_.size()) {
        chunk_bytes_[chunk_index].fetch_add(delta, std::memory_order_relaxed);
    }
}

void ProgressAggregator::rewind(std::size_t chunk_index) noexcept {
    if (chunk_index < chunk_bytes_.size()) {
        chunk_bytes_[chunk_index].store(0, std::memory_order_relaxed);
    }
}

std::uint64_t ProgressAggregator::chunkBytes(std::size_t chunk_index) const noexcept {
    return chunk_index < chunk_bytes_.size() ? chunk_bytes_[chunk_index].load(std::memory_order_relaxed) : 0;
}

std::uint64_t ProgressAggregator::downloaded() const noexcept {
    std::uint64_t sum = 0;
    for (const auto& bytes : chunk_bytes_) {
        sum += bytes.load(std::memory_order_relaxed);
    }
    return sum;
}

ProgressAggregator::SubscriptionId ProgressAggregator::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    const SubscriptionId id = next_subscription_++;
    subscribers_.emplace(id, std::move(subscriber));
    return id;
}

void ProgressAggregator::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(id);
}

void ProgressAggregator::start() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    emitter_ = std::thread([this] { run(); });
}

void ProgressAggregator::stop() {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    run_cv_.notify_all();
    if (emitter_.joinable()) {
        emitter_.join();
    }
    publish(tick(std::chrono::steady_clock::now()));
}

ProgressSnapshot ProgressAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return buildSnapshot();
}

ProgressSnapshot ProgressAggregator::tick(std::chrono::steady_clock::time_point now) {
    const std::uint64_t bytes = downloaded();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (last_tick_ && bytes >= last_bytes_) {
        const double seconds = std::chrono::duration<double>(now - *last_tick_).count();
        if (seconds > 0.0) {
            const double instant = static_cast<double>(bytes - last_bytes_) / seconds;
            rate_ = has_rate_ ? smoothing_ * instant + (1.0 - smoothing_) * rate_ : instant;
            has_rate_ = true;
        }
    }
    last_bytes_ = bytes;
    last_tick_ = now;
    return buildSnapshot();
}

void ProgressAggregator::run() {
    std::unique_lock<std::mutex> lock(run_mutex_);
    while (running_) {
        if (run_cv_.wait_for(lock, interval_, [this] { return !running_; })) {
            break;
        }
        lock.unlock();
        publish(tick(std::chrono::steady_clock::now()));
        lock.lock();
    }
}

void ProgressAggregator::publish(const ProgressSnapshot& snapshot) {
    std::vector<Subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        targets.reserve(subscribers_.size());
        for (const auto& entry : subscribers_) {
            targets.push_back(entry.second);
        }
    }
    for (const auto& subscriber : targets) {
        try {
            subscriber(snapshot);
        } catch (const std::exception& ex) {
            FETCHY_WARN("Progress subscriber for task {} threw: {}", task_id_, ex.what());
        }
    }
}

ProgressSnapshot ProgressAggregator::buildSnapshot() const {
    ProgressSnapshot snapshot;
    snapshot.task_id = task_id_;
    snapshot.filename = filename_;
    snapshot.status = status_;
    snapshot.total_bytes = total_bytes_;
    snapshot.downloaded_bytes = downloaded();
    snapshot.bytes_per_second = rate_;
    snapshot.error_message = error_message_;

    if (total_bytes_ && *total_bytes_ > 0) {
        snapshot.percent = 100.0 * static_cast<double>(snapshot.downloaded_bytes) /
                           static_cast<double>(*total_bytes_);
    } else if (total_bytes_) {
        snapshot.percent = status_ == TaskStatus::Completed ? 100.0 : 0.0;
    }
    if (total_bytes_ && rate_ > 0.0) {
        const std::uint64_t remaining =
            *total_bytes_ > snapshot.downloaded_bytes ? *total_bytes_ - snapshot.downloaded_bytes : 0;
        snapshot.eta_seconds = static_cast<double>(remaining) / rate_;
    }
    return snapshot;
}

} // namespace fetchy
