#include "fetchy/queue_manager.hpp"

#include "fetchy/error.hpp"
#include "fetchy/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <utility>

namespace fetchy {

namespace fs = std::filesystem;

QueueManager::QueueManager(QueueStore& store,
                           ResumeStore& resume_store,
                           HttpClient& http,
                           ConnectionLimiter& limiter,
                           EngineConfig config,
                           FetchTuning tuning)
    : store_(store),
      resume_store_(resume_store),
      http_(http),
      limiter_(limiter),
      config_(std::move(config)),
      tuning_(tuning) {
    normalizeAfterLoad();
}

void QueueManager::normalizeAfterLoad() {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_ = store_.load();

    const std::size_t pruned = resume_store_.pruneOrphans();
    if (pruned > 0) {
        FETCHY_INFO("Pruned {} orphaned resume record(s)", pruned);
    }

    bool changed = false;
    for (auto& task : tasks_) {
        if (task.status != TaskStatus::Probing && task.status != TaskStatus::Downloading) {
            continue;
        }
        const TaskStatus interrupted = task.status;
        task.status = resume_store_.load(task.id) ? TaskStatus::Paused : TaskStatus::Queued;
        task.updated_at = nowMillis();
        FETCHY_WARN("{} was interrupted while {}, marking it {}", task.destination, toString(interrupted),
                    toString(task.status));
        changed = true;
    }

    // Interrupted downloads started outside the queue become resumable entries.
    for (auto& record : resume_store_.loadAll()) {
        const bool known =
            std::any_of(tasks_.begin(), tasks_.end(), [&](const DownloadTask& t) { return t.id == record.id; });
        if (known) {
            continue;
        }
        DownloadTask task = makeTask(record.url, record.destination, record.thread_count);
        if (task.id != record.id) {
            FETCHY_WARN("Resume record {} does not match its url and destination, ignoring it", record.id);
            continue;
        }
        task.status = TaskStatus::Paused;
        task.total_size = record.total_size;
        task.validator = record.validator;
        task.chunks = std::move(record.chunks);
        FETCHY_INFO("Found interrupted download of {}, queued as paused", task.destination);
        tasks_.push_back(std::move(task));
        changed = true;
    }
    if (changed) {
        persistLocked();
    }
    FETCHY_DEBUG("Loaded {} queue entries from {}", tasks_.size(), store_.path().string());
}

DownloadTask QueueManager::add(const std::string& url, const AddOptions& options) {
    if (url.empty()) {
        throw std::invalid_argument("URL must not be empty");
    }
    const std::string destination = destinationFor(url, options);
    const int threads = clampThreads(options.threads.value_or(config_.default_threads));

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = makeTaskId(url, destination);
    auto existing = std::find_if(tasks_.begin(), tasks_.end(), [&](const DownloadTask& t) { return t.id == id; });
    if (existing != tasks_.end()) {
        FETCHY_INFO("{} is already queued as {}", url, id);
        return *existing;
    }

    DownloadTask task = makeTask(url, destination, threads);
    task.total_size = options.size_hint;
    tasks_.push_back(task);
    try {
        persistLocked();
    } catch (const DownloadError&) {
        tasks_.pop_back();
        throw;
    }
    FETCHY_INFO("Queued {} -> {}", url, destination);
    return task;
}

bool QueueManager::remove(const std::string& url_or_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locate(url_or_id);
    if (it == tasks_.end()) {
        return false;
    }
    if (active_.count(it->id) > 0) {
        FETCHY_WARN("{} is active and cannot be dropped", it->destination);
        return false;
    }
    if (it->status != TaskStatus::Completed) {
        discardPartialLocked(*it);
    }
    FETCHY_INFO("Dropped {}", it->url);
    tasks_.erase(it);
    persistLocked();
    return true;
}

std::vector<DownloadTask> QueueManager::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_;
}

std::optional<DownloadTask> QueueManager::find(const std::string& url_or_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = locate(url_or_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::size_t QueueManager::process() {
    pausing_ = false;
    const std::size_t parallel = std::max<std::size_t>(1, config_.max_concurrent_tasks);

    std::set<std::string> attempted;
    std::atomic<std::size_t> ran{0};
    auto drain = [&] {
        while (!pausing_) {
            const auto claim = claimNext(attempted);
            if (!claim) {
                break;
            }
            runClaimed(*claim);
            ++ran;
        }
    };

    if (parallel == 1) {
        drain();
    } else {
        std::vector<std::thread> runners;
        runners.reserve(parallel);
        for (std::size_t i = 0; i < parallel; ++i) {
            runners.emplace_back(drain);
        }
        for (auto& runner : runners) {
            if (runner.joinable()) {
                runner.join();
            }
        }
    }
    return ran.load();
}

std::optional<QueueManager::Claim> QueueManager::claimNext(std::set<std::string>& attempted) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pausing_) {
        return std::nullopt;
    }
    for (const auto& task : tasks_) {
        if (task.status != TaskStatus::Queued && task.status != TaskStatus::Paused) {
            continue;
        }
        if (attempted.count(task.id) > 0 || active_.count(task.id) > 0) {
            continue;
        }
        attempted.insert(task.id);
        auto orchestrator = makeOrchestrator(task);
        active_.emplace(task.id, orchestrator);
        return Claim{orchestrator, task.status == TaskStatus::Paused};
    }
    return std::nullopt;
}

void QueueManager::runClaimed(const Claim& claim) {
    const TaskStatus status = claim.resume ? claim.orchestrator->resume() : claim.orchestrator->start();
    const DownloadTask task = claim.orchestrator->snapshot();
    if (status == TaskStatus::Failed) {
        FETCHY_ERROR("{} failed: {}", task.destination, task.last_error);
    } else {
        FETCHY_INFO("{} is {}", task.destination, toString(status));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(task.id);
}

std::size_t QueueManager::clear(bool force) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadTask> kept;
    kept.reserve(tasks_.size());
    std::size_t removed = 0;
    for (auto& task : tasks_) {
        const bool idle = active_.count(task.id) == 0;
        if (!idle || (!force && !isTerminal(task.status))) {
            kept.push_back(std::move(task));
            continue;
        }
        if (task.status != TaskStatus::Completed) {
            discardPartialLocked(task);
        }
        ++removed;
    }
    tasks_ = std::move(kept);
    if (removed > 0) {
        persistLocked();
        FETCHY_INFO("Cleared {} queue entries", removed);
    }
    return removed;
}

ProbeResult QueueManager::info(const std::string& url) {
    Prober prober(http_, RetryPolicy::fromConfig(config_));
    return prober.probe(url);
}

bool QueueManager::pause(const std::string& url_or_id) {
    const auto orchestrator = activeFor(url_or_id);
    if (!orchestrator) {
        return false;
    }
    orchestrator->pause();
    return true;
}

bool QueueManager::cancel(const std::string& url_or_id) {
    std::shared_ptr<Orchestrator> target;
    std::string idle_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = locate(url_or_id);
        if (it == tasks_.end()) {
            return false;
        }
        if (auto active = active_.find(it->id); active != active_.end()) {
            target = active->second;
        } else if (it->status == TaskStatus::Completed) {
            FETCHY_WARN("{} is already complete", it->destination);
            return false;
        } else {
            // Held in active_ so process() cannot start it underneath us.
            target = makeOrchestrator(*it);
            idle_id = it->id;
            active_.emplace(idle_id, target);
        }
    }

    target->cancel();

    if (!idle_id.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(idle_id);
    }
    return true;
}

void QueueManager::pauseAll() {
    std::vector<std::shared_ptr<Orchestrator>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pausing_ = true;
        for (const auto& entry : active_) {
            running.push_back(entry.second);
        }
    }
    for (const auto& orchestrator : running) {
        orchestrator->pause();
    }
}

bool QueueManager::requeue(const std::string& url_or_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locate(url_or_id);
    if (it == tasks_.end() || active_.count(it->id) > 0) {
        return false;
    }
    if (it->status != TaskStatus::Failed && it->status != TaskStatus::Cancelled) {
        return false;
    }
    it->status = TaskStatus::Queued;
    it->last_error.clear();
    it->updated_at = nowMillis();
    persistLocked();
    return true;
}

void QueueManager::setProgressSubscriber(ProgressAggregator::Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriber_ = std::move(subscriber);
}

void QueueManager::onTransition(const DownloadTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const DownloadTask& t) { return t.id == task.id; });
    if (it == tasks_.end()) {
        FETCHY_DEBUG("Status change for {} after it left the queue", task.id);
        return;
    }
    *it = task;
    persistLocked();
}

std::string QueueManager::destinationFor(const std::string& url, const AddOptions& options) const {
    if (options.destination && !options.destination->empty()) {
        return *options.destination;
    }
    std::string name;
    if (options.filename_hint) {
        name = fs::path(*options.filename_hint).filename().string();
    }
    if (name.empty() || name == "." || name == "..") {
        name = filenameFromUrl(url);
    }
    return (config_.download_dir / name).string();
}

std::vector<DownloadTask>::iterator QueueManager::locate(const std::string& url_or_id) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [&](const DownloadTask& t) { return t.id == url_or_id; });
    if (it != tasks_.end()) {
        return it;
    }
    return std::find_if(tasks_.begin(), tasks_.end(), [&](const DownloadTask& t) { return t.url == url_or_id; });
}

std::vector<DownloadTask>::const_iterator QueueManager::locate(const std::string& url_or_id) const {
    auto it = std::find_if(tasks_.cbegin(), tasks_.cend(), [&](const DownloadTask& t) { return t.id == url_or_id; });
    if (it != tasks_.cend()) {
        return it;
    }
    return std::find_if(tasks_.cbegin(), tasks_.cend(), [&](const DownloadTask& t) { return t.url == url_or_id; });
}

std::shared_ptr<Orchestrator> QueueManager::activeFor(const std::string& url_or_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = locate(url_or_id);
    if (it == tasks_.end()) {
        return nullptr;
    }
    const auto active = active_.find(it->id);
    return active == active_.end() ? nullptr : active->second;
}

std::shared_ptr<Orchestrator> QueueManager::makeOrchestrator(const DownloadTask& task) {
    EngineContext context{http_, resume_store_, limiter_, config_, tuning_};
    auto orchestrator = std::make_shared<Orchestrator>(task, context,
                                                       [this](const DownloadTask& changed) { onTransition(changed); });
    if (subscriber_) {
        orchestrator->progress().subscribe(subscriber_);
    }
    return orchestrator;
}

void QueueManager::discardPartialLocked(const DownloadTask& task) {
    std::error_code ec;
    fs::remove(task.partialPath(), ec);
    if (ec) {
        FETCHY_WARN("Cannot remove {}: {}", task.partialPath(), ec.message());
    }
    resume_store_.remove(task.id);
}

void QueueManager::persistLocked() {
    store_.save(tasks_);
}

} // namespace fetchy
