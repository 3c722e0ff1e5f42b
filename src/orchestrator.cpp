#include "fetchy/orchestrator.hpp"

#include "fetchy/chunk_planner.hpp"
#include "fetchy/detail/channel.hpp"
#include "fetchy/detail/partial_file.hpp"
#include "fetchy/detail/stop_signal.hpp"
#include "fetchy/error.hpp"
#include "fetchy/logging.hpp"
#include "fetchy/prober.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace fetchy {

namespace fs = std::filesystem;

namespace {

std::string displayName(const std::string& destination) {
    const auto name = fs::path(destination).filename().string();
    return name.empty() ? destination : name;
}

FetchMode fetchModeFor(const DownloadTask& task) {
    if (task.accepts_ranges && task.total_size && *task.total_size > 0) {
        return FetchMode::Ranged;
    }
    return task.total_size ? FetchMode::Stream : FetchMode::OpenStream;
}

std::string describeFailure(const ChunkResult& result) {
    if (result.http_status != 0) {
        return fmt::format("chunk {} (HTTP {}): {}", result.chunk.index, result.http_status, result.error_message);
    }
    return fmt::format("chunk {}: {}", result.chunk.index, result.error_message);
}

// Joins whatever is still running when a round unwinds early.
struct WorkerGroup {
    detail::StopSignal& stop;
    std::vector<std::thread> threads;

    ~WorkerGroup() {
        if (std::any_of(threads.begin(), threads.end(), [](const std::thread& t) { return t.joinable(); })) {
            stop.request();
        }
        join();
    }

    void join() {
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads.clear();
    }
};

} // namespace

class Orchestrator::Impl {
public:
    Impl(DownloadTask task, EngineContext context, StatusListener listener)
        : task_(std::move(task)),
          context_(std::move(context)),
          listener_(std::move(listener)),
          retry_(RetryPolicy::fromConfig(context_.config)),
          progress_(task_.id, displayName(task_.destination), context_.config.progress_interval) {
        progress_.reset(task_.total_size, task_.chunks);
        progress_.setStatus(task_.status, task_.last_error);
    }

    TaskStatus run(bool resuming) {
        {
            std::lock_guard<std::mutex> lock(control_mutex_);
            if (running_) {
                FETCHY_WARN("Task {} is already running", task_.id);
                return TaskStatus::Downloading;
            }
            if (task_.status == TaskStatus::Completed) {
                FETCHY_INFO("Task {} is already complete", task_.id);
                return TaskStatus::Completed;
            }
            running_ = true;
        }

        FETCHY_INFO("{} {} -> {}", resuming ? "Resuming" : "Starting", task_.url, task_.destination);
        TaskStatus outcome = TaskStatus::Failed;
        try {
            outcome = execute();
        } catch (const DownloadError& ex) {
            outcome = fail(ex.what());
        } catch (const std::exception& ex) {
            outcome = fail(std::string{"unexpected error: "} + ex.what());
        }
        progress_.stop();

        std::lock_guard<std::mutex> lock(control_mutex_);
        running_ = false;
        pause_requested_ = false;
        cancel_requested_ = false;
        stop_.reset();
        return outcome;
    }

    void pause() {
        std::lock_guard<std::mutex> lock(control_mutex_);
        pause_requested_ = true;
        stop_.request();
    }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(control_mutex_);
            if (running_) {
                cancel_requested_ = true;
                stop_.request();
                return;
            }
        }
        if (snapshot().status == TaskStatus::Completed) {
            FETCHY_INFO("Task {} is complete, nothing to cancel", task_.id);
            return;
        }
        discardPartial();
        transition(TaskStatus::Cancelled);
    }

    [[nodiscard]] bool isRunning() const {
        std::lock_guard<std::mutex> lock(control_mutex_);
        return running_;
    }

    [[nodiscard]] DownloadTask snapshot() const {
        std::lock_guard<std::mutex> lock(task_mutex_);
        return task_;
    }

    [[nodiscard]] ProgressAggregator& progress() { return progress_; }

private:
    struct Round {
        TaskStatus status{TaskStatus::Failed};
        bool range_unsupported{false};
        std::string message;
    };

    TaskStatus execute() {
        {
            std::lock_guard<std::mutex> lock(task_mutex_);
            task_.last_error.clear();
        }
        transition(TaskStatus::Probing);
        if (auto stopped = honourStopRequest()) {
            return *stopped;
        }

        Prober prober(context_.http, retry_);
        auto first = probeUnlessStopped(prober);
        if (auto stopped = honourStopRequest()) {
            return *stopped;
        }
        ProbeResult probe = std::move(*first);

        bool allow_ranges = true;
        for (int round = 0;; ++round) {
            const Round result = downloadRound(probe, allow_ranges);
            if (!result.range_unsupported) {
                return result.status;
            }
            if (round > 0) {
                return fail(result.message);
            }

            FETCHY_WARN("Task {}: {}, probing again", task_.id, result.message);
            if (!rearmAfterAbortedRound()) {
                return *honourStopRequest();
            }
            auto again = probeUnlessStopped(prober);
            if (auto stopped = honourStopRequest()) {
                return *stopped;
            }

            const bool same_size = again->total_size == task_.total_size;
            const bool same_resource = same_size && again->validator && task_.validator &&
                                       task_.validator->matches(*again->validator);
            if (again->accepts_ranges && !same_resource) {
                FETCHY_WARN("Task {}: remote resource changed, restarting from scratch", task_.id);
            } else {
                FETCHY_WARN("Task {}: server does not honour ranges, falling back to a single stream", task_.id);
                allow_ranges = false;
            }
            context_.resume_store.remove(task_.id);
            probe = std::move(*again);
        }
    }

    // Empty when a pause or cancel interrupted the probe's backoff.
    std::optional<ProbeResult> probeUnlessStopped(Prober& prober) {
        try {
            return prober.probe(task_.url, &stop_);
        } catch (const DownloadError&) {
            if (pause_requested_ || cancel_requested_) {
                return std::nullopt;
            }
            throw;
        }
    }

    // Clears the stop raised to abort the previous round's workers unless a
    // pause or cancel arrived meanwhile.
    bool rearmAfterAbortedRound() {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (pause_requested_ || cancel_requested_) {
            return false;
        }
        stop_.reset();
        return true;
    }

    Round downloadRound(const ProbeResult& probe, bool allow_ranges) {
        {
            std::lock_guard<std::mutex> lock(task_mutex_);
            task_.total_size = probe.total_size;
            task_.accepts_ranges = probe.accepts_ranges && allow_ranges;
            task_.validator = probe.validator;
        }
        const FetchMode mode = fetchModeFor(task_);
        const bool reuse = restoreOrPlan(mode);

        ensureParentDirectory();
        detail::PartialFile file(task_.partialPath(), !reuse);
        if (mode == FetchMode::Ranged) {
            file.preallocate(*task_.total_size);
        }

        progress_.reset(task_.total_size, task_.chunks);
        transition(TaskStatus::Downloading);
        {
            std::lock_guard<std::mutex> lock(task_mutex_);
            for (auto& chunk : task_.chunks) {
                if (chunk.status != ChunkStatus::Done) {
                    chunk.status = ChunkStatus::Active;
                }
            }
        }
        saveRecord();
        progress_.start();

        ChunkFetcher fetcher(context_.http, context_.limiter, retry_, context_.tuning);
        detail::Channel<ChunkResult> results;
        WorkerGroup workers{stop_, {}};
        const std::string url = task_.url;
        for (const auto& chunk : task_.chunks) {
            if (chunk.status == ChunkStatus::Done) {
                continue;
            }
            workers.threads.emplace_back([this, &fetcher, &results, &file, url, chunk, mode] {
                results.push(runWorker(fetcher, url, chunk, mode, file));
            });
        }

        std::size_t outstanding = workers.threads.size();
        std::optional<ChunkResult> failure;
        while (outstanding > 0) {
            auto result = results.popFor(context_.config.snapshot_interval);
            if (!result) {
                checkpoint(file);
                continue;
            }
            --outstanding;
            {
                std::lock_guard<std::mutex> lock(task_mutex_);
                task_.chunks[result->chunk.index] = result->chunk;
            }
            const bool broken =
                result->outcome == ChunkOutcome::Failed || result->outcome == ChunkOutcome::RangeUnsupported;
            if (broken && !failure) {
                failure = std::move(*result);
                stop_.request();
            }
        }
        workers.join();

        if (cancel_requested_) {
            file.close();
            discardPartial();
            transition(TaskStatus::Cancelled);
            return Round{TaskStatus::Cancelled};
        }
        if (pause_requested_) {
            file.sync();
            saveRecord();
            FETCHY_INFO("Task {} paused at {} bytes", task_.id, task_.downloadedBytes());
            transition(TaskStatus::Paused);
            return Round{TaskStatus::Paused};
        }
        if (failure) {
            const std::string message = describeFailure(*failure);
            if (failure->outcome == ChunkOutcome::RangeUnsupported) {
                return Round{TaskStatus::Failed, true, message};
            }
            file.sync();
            saveRecord();
            return Round{fail(message)};
        }
        return Round{finalize(file, mode)};
    }

    void ensureParentDirectory() const {
        const auto parent = fs::path(task_.destination).parent_path();
        if (parent.empty()) {
            return;
        }
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw DownloadError(ErrorKind::DiskError,
                                fmt::format("Cannot create directory '{}': {}", parent.string(), ec.message()));
        }
    }

    // Adopts the stored chunk plan when it still describes the remote
    // resource; plans afresh otherwise. True when partial data is reused.
    bool restoreOrPlan(FetchMode mode) {
        if (auto record = context_.resume_store.load(task_.id)) {
            const std::string blocker = reuseBlocker(*record, mode);
            if (blocker.empty()) {
                for (auto& chunk : record->chunks) {
                    if (chunk.status != ChunkStatus::Done) {
                        chunk.status = ChunkStatus::Pending;
                    }
                }
                std::lock_guard<std::mutex> lock(task_mutex_);
                task_.chunks = std::move(record->chunks);
                task_.thread_count = record->thread_count;
                FETCHY_INFO("Task {} continues from byte count {} of {}", task_.id, task_.downloadedBytes(),
                            *task_.total_size);
                return true;
            }
            FETCHY_WARN("Discarding resume record for {}: {}", task_.id, blocker);
            context_.resume_store.remove(task_.id);
        }

        std::vector<ChunkState> chunks;
        if (mode == FetchMode::Ranged) {
            chunks = makeChunkStates(planChunks(*task_.total_size, task_.thread_count));
        } else {
            chunks = makeChunkStates(planSingleStream(task_.total_size.value_or(0)));
        }

        std::lock_guard<std::mutex> lock(task_mutex_);
        task_.chunks = std::move(chunks);
        if (mode != FetchMode::Ranged) {
            task_.thread_count = 1;
        }
        return false;
    }

    [[nodiscard]] std::string reuseBlocker(const ResumeRecord& record, FetchMode mode) const {
        if (mode != FetchMode::Ranged) {
            return "the transfer is range-less and restarts from byte 0";
        }
        if (record.total_size != task_.total_size) {
            return fmt::format("{}: size changed", toString(ErrorKind::ValidatorMismatch));
        }
        if (!record.validator || !task_.validator || !record.validator->matches(*task_.validator)) {
            return fmt::format("{}: remote resource changed", toString(ErrorKind::ValidatorMismatch));
        }
        if (record.chunks.size() > static_cast<std::size_t>(kMaxThreads)) {
            return fmt::format("{} chunks exceed the worker limit", record.chunks.size());
        }

        std::error_code ec;
        const auto on_disk = fs::file_size(record.partialPath(), ec);
        if (ec) {
            return "partial file is missing";
        }
        std::uint64_t needed = 0;
        for (const auto& chunk : record.chunks) {
            if (chunk.bytes_downloaded > 0) {
                needed = std::max(needed, chunk.nextOffset());
            }
        }
        if (on_disk < needed) {
            return fmt::format("partial file holds {} bytes, record claims {}", on_disk, needed);
        }
        return {};
    }

    ChunkResult runWorker(ChunkFetcher& fetcher, const std::string& url, const ChunkState& chunk, FetchMode mode,
                          detail::PartialFile& file) {
        try {
            return fetcher.fetch(url, chunk, mode, file, progress_, stop_);
        } catch (const std::exception& ex) {
            FETCHY_ERROR("Worker for chunk {} of {} stopped: {}", chunk.index, task_.id, ex.what());
            ChunkResult result;
            result.chunk = chunk;
            result.chunk.status = ChunkStatus::Failed;
            result.outcome = ChunkOutcome::Failed;
            result.error_message = ex.what();
            return result;
        }
    }

    // Persists the byte counts workers have reported so far. Counters only
    // move after a write returns, so syncing after reading them makes every
    // claimed byte durable.
    void checkpoint(detail::PartialFile& file) {
        {
            std::lock_guard<std::mutex> lock(task_mutex_);
            for (auto& chunk : task_.chunks) {
                if (chunk.status == ChunkStatus::Active) {
                    chunk.bytes_downloaded = progress_.chunkBytes(chunk.index);
                    if (!task_.total_size) {
                        // Unknown-size streams grow their single chunk as they go.
                        chunk.range.end = chunk.nextOffset();
                    }
                }
            }
        }
        file.sync();
        saveRecord();
        FETCHY_DEBUG("Task {} checkpoint at {} bytes", task_.id, task_.downloadedBytes());
    }

    TaskStatus finalize(detail::PartialFile& file, FetchMode mode) {
        if (mode == FetchMode::OpenStream) {
            std::lock_guard<std::mutex> lock(task_mutex_);
            task_.total_size = task_.chunks.front().range.end;
        }
        if (!task_.allChunksDone()) {
            return fail(fmt::format("transfer ended with {} of {} bytes", task_.downloadedBytes(),
                                    task_.total_size.value_or(0)));
        }

        const std::uint64_t on_disk = file.size();
        if (on_disk != *task_.total_size) {
            return fail(fmt::format("{}: partial file holds {} bytes, expected {}", toString(ErrorKind::DiskError),
                                    on_disk, *task_.total_size));
        }

        file.sync();
        file.close();
        detail::commitFile(task_.partialPath(), task_.destination);
        context_.resume_store.remove(task_.id);
        if (mode == FetchMode::OpenStream) {
            progress_.reset(task_.total_size, task_.chunks);
        }

        FETCHY_INFO("Finished {} ({} bytes)", task_.destination, *task_.total_size);
        transition(TaskStatus::Completed);
        return TaskStatus::Completed;
    }

    // Pause or cancel requested before any worker was spawned.
    std::optional<TaskStatus> honourStopRequest() {
        if (cancel_requested_) {
            discardPartial();
            transition(TaskStatus::Cancelled);
            return TaskStatus::Cancelled;
        }
        if (pause_requested_) {
            transition(TaskStatus::Paused);
            return TaskStatus::Paused;
        }
        return std::nullopt;
    }

    TaskStatus fail(const std::string& message) {
        FETCHY_ERROR("Task {} failed: {}", task_.id, message);
        transition(TaskStatus::Failed, message);
        return TaskStatus::Failed;
    }

    void discardPartial() {
        std::error_code ec;
        fs::remove(task_.partialPath(), ec);
        if (ec) {
            FETCHY_WARN("Cannot remove {}: {}", task_.partialPath(), ec.message());
        }
        context_.resume_store.remove(task_.id);

        std::lock_guard<std::mutex> lock(task_mutex_);
        task_.chunks.clear();
    }

    void saveRecord() {
        ResumeRecord record;
        {
            std::lock_guard<std::mutex> lock(task_mutex_);
            task_.updated_at = nowMillis();
            record = ResumeRecord::fromTask(task_);
        }
        context_.resume_store.save(record);
    }

    void transition(TaskStatus status, const std::string& error = {}) {
        DownloadTask copy;
        {
            std::lock_guard<std::mutex> lock(task_mutex_);
            task_.status = status;
            task_.updated_at = nowMillis();
            if (status == TaskStatus::Failed) {
                task_.last_error = error;
            }
            copy = task_;
        }
        progress_.setStatus(status, error);
        FETCHY_DEBUG("Task {} -> {}", copy.id, toString(status));

        if (!listener_) {
            return;
        }
        try {
            listener_(copy);
        } catch (const std::exception& ex) {
            FETCHY_ERROR("Status listener for task {} failed: {}", copy.id, ex.what());
        }
    }

    // Written only by the orchestrating thread; task_mutex_ guards it
    // against snapshot() readers.
    DownloadTask task_;
    EngineContext context_;
    StatusListener listener_;
    RetryPolicy retry_;
    ProgressAggregator progress_;

    detail::StopSignal stop_;
    mutable std::mutex control_mutex_;
    bool running_{false};
    std::atomic<bool> pause_requested_{false};
    std::atomic<bool> cancel_requested_{false};

    mutable std::mutex task_mutex_;
};

Orchestrator::Orchestrator(DownloadTask task, EngineContext context, StatusListener listener)
    : impl_(std::make_unique<Impl>(std::move(task), std::move(context), std::move(listener))) {}

Orchestrator::~Orchestrator() = default;

TaskStatus Orchestrator::start() { return impl_->run(false); }

TaskStatus Orchestrator::resume() { return impl_->run(true); }

void Orchestrator::pause() { impl_->pause(); }

void Orchestrator::cancel() { impl_->cancel(); }

bool Orchestrator::isRunning() const { return impl_->isRunning(); }

DownloadTask Orchestrator::snapshot() const { return impl_->snapshot(); }

ProgressAggregator& Orchestrator::progress() { return impl_->progress(); }

} // namespace fetchy
