#include "fetchy/orchestrator.hpp"

#include "support/fake_http_client.hpp"
#include "support/test_env.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <numeric>
#include <set>
#include <thread>
#include <vector>

namespace fetchy {
namespace {

namespace fs = std::filesystem;
using test::Fault;
using test::FakeHttpClient;
using test::FakeResource;

class OrchestratorTest : public testing::Test {
protected:
    static constexpr std::size_t kSize = 1000000;

    OrchestratorTest()
        : payload_(test::makePayload(kSize)),
          http_(resourceOf(payload_)),
          resume_store_(dir_ / "resume"),
          config_(test::fastConfig(dir_.path())) {}

    static FakeResource resourceOf(std::string body, std::string etag = "\"v1\"") {
        FakeResource resource{std::move(body)};
        resource.etag = std::move(etag);
        return resource;
    }

    std::unique_ptr<Orchestrator> makeOrchestrator(int threads = 4) {
        DownloadTask task = makeTask("http://host/file.bin", destination().string(), threads);
        return std::make_unique<Orchestrator>(
            task, EngineContext{http_, resume_store_, limiter_, config_},
            [this](const DownloadTask& changed) {
                std::lock_guard<std::mutex> lock(mutex_);
                transitions_.push_back(changed);
            });
    }

    fs::path destination() const { return dir_ / "file.bin"; }
    fs::path partial() const { return dir_ / "file.bin.part"; }

    std::vector<TaskStatus> statuses() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TaskStatus> seen;
        for (const auto& task : transitions_) {
            seen.push_back(task.status);
        }
        return seen;
    }

    std::vector<DownloadTask> transitions() {
        std::lock_guard<std::mutex> lock(mutex_);
        return transitions_;
    }

    std::vector<HttpRequest> rangedGets(std::size_t from = 0) {
        std::vector<HttpRequest> gets;
        const auto all = http_.requests();
        for (std::size_t i = from; i < all.size(); ++i) {
            if (!all[i].head_only && all[i].range) {
                gets.push_back(all[i]);
            }
        }
        return gets;
    }

    test::TempDir dir_;
    std::string payload_;
    FakeHttpClient http_;
    ConnectionLimiter limiter_;
    ResumeStore resume_store_;
    EngineConfig config_;

    std::mutex mutex_;
    std::vector<DownloadTask> transitions_;
};

TEST_F(OrchestratorTest, DownloadsWithFourEqualChunks) {
    auto orchestrator = makeOrchestrator(4);

    EXPECT_EQ(orchestrator->start(), TaskStatus::Completed);

    EXPECT_EQ(test::readFile(destination()), payload_);
    EXPECT_FALSE(fs::exists(partial()));
    EXPECT_FALSE(resume_store_.load(orchestrator->snapshot().id));

    const auto task = orchestrator->snapshot();
    ASSERT_EQ(task.chunks.size(), 4u);
    for (const auto& chunk : task.chunks) {
        EXPECT_EQ(chunk.range.size(), 250000u);
        EXPECT_EQ(chunk.status, ChunkStatus::Done);
    }
    EXPECT_EQ(statuses(),
              (std::vector<TaskStatus>{TaskStatus::Probing, TaskStatus::Downloading, TaskStatus::Completed}));
    EXPECT_EQ(rangedGets().size(), 4u);
}

TEST_F(OrchestratorTest, FinalProgressSnapshotIsComplete) {
    auto orchestrator = makeOrchestrator(4);
    std::mutex mutex;
    std::optional<ProgressSnapshot> last;
    orchestrator->progress().subscribe([&](const ProgressSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex);
        last = snapshot;
    });

    ASSERT_EQ(orchestrator->start(), TaskStatus::Completed);

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_TRUE(last);
    EXPECT_EQ(last->status, TaskStatus::Completed);
    EXPECT_EQ(last->downloaded_bytes, kSize);
    ASSERT_TRUE(last->percent);
    EXPECT_DOUBLE_EQ(*last->percent, 100.0);
    EXPECT_EQ(last->filename, "file.bin");
}

TEST_F(OrchestratorTest, PausedTaskResumesFromRecordedOffsets) {
    auto orchestrator = makeOrchestrator(4);
    Orchestrator* target = orchestrator.get();
    http_.setPieceHook([target](const HttpRequest& request, std::uint64_t offset) {
        if (request.range && offset >= request.range->start + 100000) {
            target->pause();
        }
    });

    ASSERT_EQ(orchestrator->start(), TaskStatus::Paused);
    const DownloadTask paused = orchestrator->snapshot();
    EXPECT_TRUE(fs::exists(partial()));
    EXPECT_FALSE(fs::exists(destination()));
    EXPECT_LT(paused.downloadedBytes(), kSize);

    const auto record = resume_store_.load(paused.id);
    ASSERT_TRUE(record);
    ASSERT_EQ(record->chunks.size(), 4u);

    std::set<std::uint64_t> expected_starts;
    for (const auto& chunk : record->chunks) {
        if (chunk.status != ChunkStatus::Done) {
            expected_starts.insert(chunk.nextOffset());
        }
    }

    http_.setPieceHook({});
    const std::size_t before_resume = http_.requests().size();
    ASSERT_EQ(orchestrator->resume(), TaskStatus::Completed);

    std::set<std::uint64_t> resumed_starts;
    for (const auto& request : rangedGets(before_resume)) {
        resumed_starts.insert(request.range->start);
    }
    EXPECT_EQ(resumed_starts, expected_starts);
    EXPECT_EQ(test::readFile(destination()), payload_);
    EXPECT_FALSE(resume_store_.load(paused.id));
}

TEST_F(OrchestratorTest, ResumeAfterRestartUsesStoredRecord) {
    {
        auto orchestrator = makeOrchestrator(4);
        Orchestrator* target = orchestrator.get();
        http_.setPieceHook([target](const HttpRequest&, std::uint64_t offset) {
            if (offset >= 50000) {
                target->pause();
            }
        });
        ASSERT_EQ(orchestrator->start(), TaskStatus::Paused);
    }
    http_.setPieceHook({});

    auto fresh = makeOrchestrator(4);
    const auto record = resume_store_.load(fresh->snapshot().id);
    ASSERT_TRUE(record);
    const std::uint64_t kept = std::accumulate(
        record->chunks.begin(), record->chunks.end(), std::uint64_t{0},
        [](std::uint64_t sum, const ChunkState& chunk) { return sum + chunk.bytes_downloaded; });
    ASSERT_GT(kept, 0u);

    const std::size_t before_resume = http_.requests().size();
    EXPECT_EQ(fresh->resume(), TaskStatus::Completed);
    EXPECT_EQ(test::readFile(destination()), payload_);

    std::uint64_t fetched = 0;
    for (const auto& request : rangedGets(before_resume)) {
        fetched += request.range->size();
    }
    EXPECT_EQ(fetched, kSize - kept);
}

TEST_F(OrchestratorTest, ChangedRemoteRestartsFromScratch) {
    auto orchestrator = makeOrchestrator(4);
    Orchestrator* target = orchestrator.get();
    http_.setPieceHook([target](const HttpRequest&, std::uint64_t offset) {
        if (offset >= 100000) {
            target->pause();
        }
    });
    ASSERT_EQ(orchestrator->start(), TaskStatus::Paused);
    ASSERT_GT(orchestrator->snapshot().downloadedBytes(), 0u);

    const std::string updated = test::makePayload(kSize, 99);
    http_.setPieceHook({});
    http_.setResource(resourceOf(updated, "\"v2\""));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transitions_.clear();
    }

    ASSERT_EQ(orchestrator->resume(), TaskStatus::Completed);

    bool saw_downloading = false;
    for (const auto& task : transitions()) {
        if (task.status == TaskStatus::Downloading) {
            saw_downloading = true;
            EXPECT_EQ(task.downloadedBytes(), 0u);
        }
    }
    EXPECT_TRUE(saw_downloading);
    EXPECT_EQ(test::readFile(destination()), updated);
}

TEST_F(OrchestratorTest, TransientChunkFailuresAreAbsorbed) {
    http_.failWithin(ByteRange{0, 1}, Fault{Fault::Kind::NetworkError}, 2);
    auto orchestrator = makeOrchestrator(4);

    EXPECT_EQ(orchestrator->start(), TaskStatus::Completed);
    EXPECT_EQ(orchestrator->snapshot().chunks[0].retry_count, 2);
    EXPECT_EQ(test::readFile(destination()), payload_);
}

TEST_F(OrchestratorTest, ExhaustedChunkFailsTaskAndHaltsOthers) {
    http_.failWithin(ByteRange{0, 1}, Fault{Fault::Kind::NetworkError}, 3);
    http_.setPieceDelay(std::chrono::milliseconds(5));
    auto orchestrator = makeOrchestrator(4);

    EXPECT_EQ(orchestrator->start(), TaskStatus::Failed);

    const auto task = orchestrator->snapshot();
    EXPECT_EQ(task.status, TaskStatus::Failed);
    EXPECT_NE(task.last_error.find("chunk 0"), std::string::npos);
    EXPECT_LT(task.downloadedBytes(), kSize);
    EXPECT_EQ(task.chunks[0].status, ChunkStatus::Failed);
    EXPECT_TRUE(fs::exists(partial()));
    EXPECT_FALSE(fs::exists(destination()));
    EXPECT_TRUE(resume_store_.load(task.id));
    EXPECT_EQ(statuses().back(), TaskStatus::Failed);
}

TEST_F(OrchestratorTest, ServerWithoutRangesGetsOneStream) {
    FakeResource resource = resourceOf(payload_);
    resource.accepts_ranges = false;
    http_.setResource(resource);
    auto orchestrator = makeOrchestrator(8);

    EXPECT_EQ(orchestrator->start(), TaskStatus::Completed);

    const auto task = orchestrator->snapshot();
    EXPECT_EQ(task.thread_count, 1);
    ASSERT_EQ(task.chunks.size(), 1u);
    EXPECT_TRUE(rangedGets().empty());
    EXPECT_EQ(http_.getCount(), 1u);
    EXPECT_EQ(test::readFile(destination()), payload_);
}

TEST_F(OrchestratorTest, UnknownSizeStreamsToEnd) {
    FakeResource resource = resourceOf(payload_);
    resource.accepts_ranges = false;
    resource.send_content_length = false;
    http_.setResource(resource);
    auto orchestrator = makeOrchestrator(4);

    EXPECT_EQ(orchestrator->start(), TaskStatus::Completed);

    const auto task = orchestrator->snapshot();
    ASSERT_TRUE(task.total_size);
    EXPECT_EQ(*task.total_size, kSize);
    EXPECT_EQ(test::readFile(destination()), payload_);
    EXPECT_EQ(orchestrator->progress().snapshot().percent, 100.0);
}

TEST_F(OrchestratorTest, IgnoredRangesFallBackToSingleStream) {
    FakeResource resource = resourceOf(payload_);
    resource.honour_ranges = false;
    http_.setResource(resource);
    auto orchestrator = makeOrchestrator(4);

    EXPECT_EQ(orchestrator->start(), TaskStatus::Completed);

    const auto task = orchestrator->snapshot();
    EXPECT_FALSE(task.accepts_ranges);
    EXPECT_EQ(task.thread_count, 1);
    EXPECT_EQ(task.chunks.size(), 1u);
    EXPECT_EQ(http_.headCount(), 2u);
    EXPECT_EQ(test::readFile(destination()), payload_);

    const auto requests = http_.requests();
    const auto streams = std::count_if(requests.begin(), requests.end(),
                                       [](const HttpRequest& r) { return !r.head_only && !r.range; });
    EXPECT_EQ(streams, 1);
    EXPECT_EQ(statuses().back(), TaskStatus::Completed);
}

TEST_F(OrchestratorTest, PausedUnknownSizeStreamSavesConsistentRecord) {
    FakeResource resource = resourceOf(payload_);
    resource.accepts_ranges = false;
    resource.send_content_length = false;
    http_.setResource(resource);
    auto orchestrator = makeOrchestrator(4);
    Orchestrator* target = orchestrator.get();
    http_.setPieceHook([target](const HttpRequest& request, std::uint64_t offset) {
        if (!request.head_only && offset >= 100000) {
            target->pause();
        }
    });

    ASSERT_EQ(orchestrator->start(), TaskStatus::Paused);

    const auto record = resume_store_.load(orchestrator->snapshot().id);
    ASSERT_TRUE(record);
    EXPECT_FALSE(record->total_size);
    ASSERT_EQ(record->chunks.size(), 1u);
    const auto& chunk = record->chunks.front();
    EXPECT_GE(chunk.bytes_downloaded, 100000u);
    EXPECT_EQ(chunk.range.end, chunk.bytes_downloaded);

    http_.setPieceHook({});
    EXPECT_EQ(orchestrator->resume(), TaskStatus::Completed);
    EXPECT_EQ(test::readFile(destination()), payload_);
}

TEST_F(OrchestratorTest, CreatesMissingDestinationDirectory) {
    const auto nested = dir_ / "sub" / "deeper" / "file.bin";
    Orchestrator orchestrator(makeTask("http://host/file.bin", nested.string(), 4),
                              EngineContext{http_, resume_store_, limiter_, config_});

    EXPECT_EQ(orchestrator.start(), TaskStatus::Completed);
    EXPECT_EQ(test::readFile(nested), payload_);
}

TEST_F(OrchestratorTest, PauseDuringProbeBackoffIsHonoured) {
    config_.backoff_base = std::chrono::milliseconds(2000);
    config_.backoff_cap = std::chrono::milliseconds(2000);
    Fault down{Fault::Kind::NetworkError};
    down.head = true;
    http_.failWithin(ByteRange{0, 1}, down, 1);
    auto orchestrator = makeOrchestrator(4);

    std::thread pauser([&orchestrator, this] {
        while (http_.headCount() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        orchestrator->pause();
    });
    const auto started = std::chrono::steady_clock::now();
    const TaskStatus status = orchestrator->start();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    pauser.join();

    EXPECT_EQ(status, TaskStatus::Paused);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
    EXPECT_EQ(http_.getCount(), 0u);
}

TEST_F(OrchestratorTest, CancelDiscardsPartialData) {
    auto orchestrator = makeOrchestrator(4);
    Orchestrator* target = orchestrator.get();
    http_.setPieceHook([target](const HttpRequest&, std::uint64_t offset) {
        if (offset >= 40000) {
            target->cancel();
        }
    });

    EXPECT_EQ(orchestrator->start(), TaskStatus::Cancelled);

    EXPECT_FALSE(fs::exists(partial()));
    EXPECT_FALSE(fs::exists(destination()));
    EXPECT_FALSE(resume_store_.load(orchestrator->snapshot().id));
    EXPECT_EQ(statuses().back(), TaskStatus::Cancelled);
}

TEST_F(OrchestratorTest, PauseBeforeStartStopsImmediately) {
    auto orchestrator = makeOrchestrator(4);
    orchestrator->pause();

    EXPECT_EQ(orchestrator->start(), TaskStatus::Paused);
    EXPECT_EQ(http_.getCount(), 0u);
    EXPECT_FALSE(orchestrator->isRunning());

    EXPECT_EQ(orchestrator->resume(), TaskStatus::Completed);
}

TEST_F(OrchestratorTest, IdleCancelDiscardsAtOnce) {
    auto orchestrator = makeOrchestrator(4);
    test::writeFile(partial(), "stale");

    orchestrator->cancel();

    EXPECT_EQ(orchestrator->snapshot().status, TaskStatus::Cancelled);
    EXPECT_FALSE(fs::exists(partial()));
}

TEST_F(OrchestratorTest, CancelAfterCompletionKeepsResult) {
    auto orchestrator = makeOrchestrator(2);
    ASSERT_EQ(orchestrator->start(), TaskStatus::Completed);

    orchestrator->cancel();

    EXPECT_EQ(orchestrator->snapshot().status, TaskStatus::Completed);
    EXPECT_EQ(test::readFile(destination()), payload_);
}

TEST_F(OrchestratorTest, SharedLimiterBoundsConnections) {
    ConnectionLimiter limiter(2);
    http_.setPieceDelay(std::chrono::milliseconds(1));
    Orchestrator orchestrator(makeTask("http://host/file.bin", destination().string(), 8),
                              EngineContext{http_, resume_store_, limiter, config_});

    EXPECT_EQ(orchestrator.start(), TaskStatus::Completed);
    EXPECT_LE(http_.peakConcurrency(), 2u);
    EXPECT_LE(limiter.peakInFlight(), 2u);
    EXPECT_EQ(test::readFile(destination()), payload_);
}

TEST_F(OrchestratorTest, EmptyResourceProducesEmptyFile) {
    http_.setResource(resourceOf(""));
    auto orchestrator = makeOrchestrator(4);

    EXPECT_EQ(orchestrator->start(), TaskStatus::Completed);
    ASSERT_TRUE(fs::exists(destination()));
    EXPECT_EQ(fs::file_size(destination()), 0u);
    EXPECT_EQ(http_.getCount(), 0u);
}

TEST_F(OrchestratorTest, ProbeFailureFailsTask) {
    Fault missing{Fault::Kind::Status};
    missing.status = 404;
    missing.head = true;
    http_.failWithin(ByteRange{0, 1}, missing, 2);
    auto orchestrator = makeOrchestrator(4);

    EXPECT_EQ(orchestrator->start(), TaskStatus::Failed);
    EXPECT_NE(orchestrator->snapshot().last_error.find("404"), std::string::npos);
    EXPECT_EQ(statuses(), (std::vector<TaskStatus>{TaskStatus::Probing, TaskStatus::Failed}));
}

TEST_F(OrchestratorTest, CompletedTaskIsNotDownloadedAgain) {
    auto orchestrator = makeOrchestrator(2);
    ASSERT_EQ(orchestrator->start(), TaskStatus::Completed);
    const auto gets = http_.getCount();

    EXPECT_EQ(orchestrator->start(), TaskStatus::Completed);
    EXPECT_EQ(http_.getCount(), gets);
}

} // namespace
} // namespace fetchy
