#pragma once

#include "chunk_fetcher.hpp"
#include "config.hpp"
#include "connection_limiter.hpp"
#include "download_task.hpp"
#include "http_client.hpp"
#include "orchestrator.hpp"
#include "prober.hpp"
#include "progress_aggregator.hpp"
#include "queue_store.hpp"
#include "resume_store.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fetchy {

struct AddOptions {
    // Used as given; otherwise the file name lands in the download directory.
    std::optional<std::string> destination;
    std::optional<int> threads;
    std::optional<std::string> filename_hint;
    std::optional<std::uint64_t> size_hint;
};

// Ordered, persisted list of tasks. Every status change is written through
// to the queue file before the next one can happen.
class QueueManager {
public:
    QueueManager(QueueStore& store,
                 ResumeStore& resume_store,
                 HttpClient& http,
                 ConnectionLimiter& limiter,
                 EngineConfig config,
                 FetchTuning tuning = {});

    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;

    // Appends a Queued task; an identical url/destination returns the existing entry.
    DownloadTask add(const std::string& url, const AddOptions& options = {});
    // Drops an idle entry with its partial data. False when unknown or active.
    bool remove(const std::string& url_or_id);

    [[nodiscard]] std::vector<DownloadTask> list() const;
    [[nodiscard]] std::optional<DownloadTask> find(const std::string& url_or_id) const;

    // Runs every Queued (start) and Paused (resume) entry once, up to
    // max_concurrent_tasks at a time. Blocks until they settle; returns how
    // many were run.
    std::size_t process();

    // Removes terminal entries, or every idle entry when forced.
    std::size_t clear(bool force = false);

    [[nodiscard]] ProbeResult info(const std::string& url);

    bool pause(const std::string& url_or_id);
    bool cancel(const std::string& url_or_id);
    // Pauses active entries and stops process() from launching new ones.
    void pauseAll();
    // Failed or Cancelled back to Queued.
    bool requeue(const std::string& url_or_id);

    void setProgressSubscriber(ProgressAggregator::Subscriber subscriber);

private:
    struct Claim {
        std::shared_ptr<Orchestrator> orchestrator;
        bool resume{false};
    };

    [[nodiscard]] std::optional<Claim> claimNext(std::set<std::string>& attempted);
    void runClaimed(const Claim& claim);
    void onTransition(const DownloadTask& task);
    void normalizeAfterLoad();
    [[nodiscard]] std::string destinationFor(const std::string& url, const AddOptions& options) const;
    [[nodiscard]] std::vector<DownloadTask>::iterator locate(const std::string& url_or_id);
    [[nodiscard]] std::vector<DownloadTask>::const_iterator locate(const std::string& url_or_id) const;
    [[nodiscard]] std::shared_ptr<Orchestrator> activeFor(const std::string& url_or_id) const;
    [[nodiscard]] std::shared_ptr<Orchestrator> makeOrchestrator(const DownloadTask& task);
    void discardPartialLocked(const DownloadTask& task);
    void persistLocked();

    QueueStore& store_;
    ResumeStore& resume_store_;
    HttpClient& http_;
    ConnectionLimiter& limiter_;
    const EngineConfig config_;
    const FetchTuning tuning_;

    mutable std::mutex mutex_;
    std::vector<DownloadTask> tasks_;
    std::map<std::string, std::shared_ptr<Orchestrator>> active_;
    ProgressAggregator::Subscriber subscriber_;
    std::atomic<bool> pausing_{false};
};

} // namespace fetchy
