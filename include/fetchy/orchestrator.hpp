#pragma once

#include "chunk_fetcher.hpp"
#include "config.hpp"
#include "connection_limiter.hpp"
#include "download_task.hpp"
#include "http_client.hpp"
#include "progress_aggregator.hpp"
#include "resume_store.hpp"

#include <functional>
#include <memory>

namespace fetchy {

// Collaborators shared by every task of one engine.
struct EngineContext {
    HttpClient& http;
    ResumeStore& resume_store;
    ConnectionLimiter& limiter;
    EngineConfig config;
    FetchTuning tuning{};
};

// Owns one task's lifecycle: probe, plan, supervise chunk workers, finalize.
// start() and resume() block the calling thread until the task leaves
// Downloading; pause() and cancel() may be called from any other thread.
class Orchestrator final {
public:
    // Called on the orchestrating thread after every status change.
    using StatusListener = std::function<void(const DownloadTask&)>;

    Orchestrator(DownloadTask task, EngineContext context, StatusListener listener = {});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    TaskStatus start();
    // Continues from the stored resume record when the remote is unchanged,
    // from scratch otherwise.
    TaskStatus resume();

    // Before start() it makes the next run stop as soon as it begins.
    void pause();
    // On an idle task the partial file and resume record are discarded at once.
    void cancel();

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] DownloadTask snapshot() const;
    [[nodiscard]] ProgressAggregator& progress();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fetchy
