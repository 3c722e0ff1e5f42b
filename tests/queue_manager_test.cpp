#include "fetchy/queue_manager.hpp"

#include "fetchy/serialization.hpp"
#include "support/fake_http_client.hpp"
#include "support/test_env.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace fetchy {
namespace {

namespace fs = std::filesystem;
using test::Fault;
using test::FakeHttpClient;
using test::FakeResource;

class QueueManagerTest : public testing::Test {
protected:
    static constexpr std::size_t kSize = 200000;

    QueueManagerTest()
        : payload_(test::makePayload(kSize)),
          http_(resourceOf(payload_)),
          config_(test::fastConfig(dir_.path())),
          queue_store_(config_.queueFile()),
          resume_store_(config_.resumeDir()) {}

    static FakeResource resourceOf(std::string body) {
        FakeResource resource{std::move(body)};
        resource.etag = "\"q1\"";
        return resource;
    }

    std::unique_ptr<QueueManager> makeManager() {
        return std::make_unique<QueueManager>(queue_store_, resume_store_, http_, limiter_, config_);
    }

    test::TempDir dir_;
    std::string payload_;
    FakeHttpClient http_;
    ConnectionLimiter limiter_;
    EngineConfig config_;
    QueueStore queue_store_;
    ResumeStore resume_store_;
};

TEST_F(QueueManagerTest, AddQueuesWithoutStarting) {
    auto manager = makeManager();
    const auto task = manager->add("http://host/files/a.bin");

    EXPECT_EQ(task.status, TaskStatus::Queued);
    EXPECT_EQ(task.destination, (dir_ / "a.bin").string());
    EXPECT_EQ(task.thread_count, config_.default_threads);
    EXPECT_TRUE(http_.requests().empty());
    EXPECT_TRUE(fs::exists(config_.queueFile()));
}

TEST_F(QueueManagerTest, EntriesSurviveRestartInOrder) {
    std::vector<DownloadTask> added;
    {
        auto manager = makeManager();
        added.push_back(manager->add("http://host/c.bin"));
        added.push_back(manager->add("http://host/a.bin", AddOptions{std::nullopt, 2, std::nullopt, 1234}));
        added.push_back(manager->add("http://host/b.bin"));
    }

    auto reloaded = makeManager();
    const auto tasks = reloaded->list();
    ASSERT_EQ(tasks.size(), 3u);
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        EXPECT_EQ(tasks[i].id, added[i].id);
        EXPECT_EQ(tasks[i].status, TaskStatus::Queued);
    }
    EXPECT_EQ(tasks[1].thread_count, 2);
    EXPECT_EQ(tasks[1].total_size, 1234u);
}

TEST_F(QueueManagerTest, DuplicateAddReturnsExistingEntry) {
    auto manager = makeManager();
    const auto first = manager->add("http://host/a.bin");
    const auto second = manager->add("http://host/a.bin");

    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(manager->list().size(), 1u);
}

TEST_F(QueueManagerTest, DestinationOptions) {
    auto manager = makeManager();

    const auto hinted = manager->add("http://host/download?id=3", AddOptions{std::nullopt, std::nullopt,
                                                                             std::string{"../report.pdf"}});
    EXPECT_EQ(hinted.destination, (dir_ / "report.pdf").string());

    const auto explicit_path = (dir_ / "custom" / "out.iso").string();
    const auto placed = manager->add("http://host/x.iso", AddOptions{explicit_path});
    EXPECT_EQ(placed.destination, explicit_path);

    EXPECT_THROW(manager->add(""), std::invalid_argument);
}

TEST_F(QueueManagerTest, ProcessRunsEveryQueuedEntry) {
    auto manager = makeManager();
    manager->add("http://host/a.bin");
    manager->add("http://host/b.bin");

    EXPECT_EQ(manager->process(), 2u);

    for (const auto& task : manager->list()) {
        EXPECT_EQ(task.status, TaskStatus::Completed);
        EXPECT_EQ(test::readFile(task.destination), payload_);
    }
    auto reloaded = makeManager();
    for (const auto& task : reloaded->list()) {
        EXPECT_EQ(task.status, TaskStatus::Completed);
    }
    EXPECT_EQ(manager->process(), 0u);
}

TEST_F(QueueManagerTest, FailedEntryIsRunOncePerProcess) {
    Fault missing{Fault::Kind::Status};
    missing.status = 404;
    missing.head = true;
    http_.failWithin(ByteRange{0, 1}, missing, 2);

    auto manager = makeManager();
    manager->add("http://host/a.bin");
    EXPECT_EQ(manager->process(), 1u);

    const auto task = manager->list().front();
    EXPECT_EQ(task.status, TaskStatus::Failed);
    EXPECT_NE(task.last_error.find("404"), std::string::npos);

    EXPECT_TRUE(manager->requeue(task.id));
    EXPECT_EQ(manager->find(task.id)->status, TaskStatus::Queued);
    EXPECT_TRUE(manager->find(task.id)->last_error.empty());
    EXPECT_EQ(manager->process(), 1u);
    EXPECT_EQ(manager->find(task.id)->status, TaskStatus::Completed);
}

TEST_F(QueueManagerTest, ClearRemovesTerminalEntries) {
    auto manager = makeManager();
    const auto done = manager->add("http://host/done.bin");
    const auto dropped = manager->add("http://host/dropped.bin");
    ASSERT_TRUE(manager->cancel(dropped.id));
    EXPECT_EQ(manager->process(), 1u);
    const auto waiting = manager->add("http://host/waiting.bin");

    EXPECT_EQ(manager->clear(), 2u);

    const auto remaining = manager->list();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].id, waiting.id);
    EXPECT_TRUE(fs::exists(done.destination));
}

TEST_F(QueueManagerTest, ForcedClearDropsIdleEntriesWithPartialData) {
    auto manager = makeManager();
    const auto task = manager->add("http://host/a.bin");
    test::writeFile(task.partialPath(), "partial");

    EXPECT_EQ(manager->clear(), 0u);
    EXPECT_EQ(manager->clear(true), 1u);
    EXPECT_TRUE(manager->list().empty());
    EXPECT_FALSE(fs::exists(task.partialPath()));
}

TEST_F(QueueManagerTest, RemoveDropsEntryByUrlOrId) {
    auto manager = makeManager();
    const auto a = manager->add("http://host/a.bin");
    manager->add("http://host/b.bin");

    EXPECT_TRUE(manager->remove("http://host/b.bin"));
    EXPECT_TRUE(manager->remove(a.id));
    EXPECT_FALSE(manager->remove("http://host/none.bin"));
    EXPECT_TRUE(manager->list().empty());
}

TEST_F(QueueManagerTest, IdleCancelAndRequeue) {
    auto manager = makeManager();
    const auto task = manager->add("http://host/a.bin");
    test::writeFile(task.partialPath(), "partial");

    EXPECT_TRUE(manager->cancel(task.id));
    EXPECT_EQ(manager->find(task.id)->status, TaskStatus::Cancelled);
    EXPECT_FALSE(fs::exists(task.partialPath()));
    EXPECT_EQ(manager->process(), 0u);

    EXPECT_TRUE(manager->requeue(task.id));
    EXPECT_FALSE(manager->requeue(task.id));
    EXPECT_EQ(manager->process(), 1u);
    EXPECT_EQ(manager->find(task.id)->status, TaskStatus::Completed);
    EXPECT_FALSE(manager->cancel(task.id));
}

TEST_F(QueueManagerTest, InfoProbesWithoutQueueing) {
    auto manager = makeManager();
    const auto probe = manager->info("http://host/files/a.bin");

    EXPECT_EQ(probe.total_size, kSize);
    EXPECT_TRUE(probe.accepts_ranges);
    EXPECT_EQ(probe.suggested_filename, "a.bin");
    EXPECT_TRUE(manager->list().empty());
    EXPECT_EQ(http_.getCount(), 0u);
}

TEST_F(QueueManagerTest, InterruptedEntriesAreNormalizedOnLoad) {
    DownloadTask with_record = makeTask("http://host/a.bin", (dir_ / "a.bin").string(), 2);
    with_record.status = TaskStatus::Downloading;
    with_record.total_size = 100;
    with_record.chunks = {ChunkState{0, {0, 50}, 10, ChunkStatus::Active, 0},
                          ChunkState{1, {50, 100}, 0, ChunkStatus::Active, 0}};
    resume_store_.save(ResumeRecord::fromTask(with_record));
    test::writeFile(with_record.partialPath(), std::string(100, 'x'));

    DownloadTask without_record = makeTask("http://host/b.bin", (dir_ / "b.bin").string(), 2);
    without_record.status = TaskStatus::Probing;

    DownloadTask orphaned = makeTask("http://host/c.bin", (dir_ / "c.bin").string(), 2);
    orphaned.status = TaskStatus::Downloading;
    orphaned.total_size = 100;
    orphaned.chunks = {ChunkState{0, {0, 100}, 10, ChunkStatus::Active, 0}};
    resume_store_.save(ResumeRecord::fromTask(orphaned));

    queue_store_.save({with_record, without_record, orphaned});

    auto manager = makeManager();
    EXPECT_EQ(manager->find(with_record.id)->status, TaskStatus::Paused);
    EXPECT_EQ(manager->find(without_record.id)->status, TaskStatus::Queued);
    EXPECT_EQ(manager->find(orphaned.id)->status, TaskStatus::Queued);
    EXPECT_FALSE(resume_store_.load(orphaned.id));

    const auto persisted = queue_store_.load();
    ASSERT_EQ(persisted.size(), 3u);
    EXPECT_EQ(persisted[0].status, TaskStatus::Paused);
}

TEST_F(QueueManagerTest, AdoptsInterruptedDownloadsFromResumeStore) {
    DownloadTask interrupted = makeTask("http://host/direct.bin", (dir_ / "direct.bin").string(), 2);
    interrupted.total_size = kSize;
    interrupted.validator = Validator{std::string{"\"q1\""}, std::nullopt, kSize};
    interrupted.chunks = {ChunkState{0, {0, kSize / 2}, 1000, ChunkStatus::Pending, 0},
                          ChunkState{1, {kSize / 2, kSize}, 0, ChunkStatus::Pending, 0}};
    test::writeFile(interrupted.partialPath(), payload_.substr(0, 1000) + std::string(kSize - 1000, '\0'));
    resume_store_.save(ResumeRecord::fromTask(interrupted));

    auto manager = makeManager();
    const auto adopted = manager->find(interrupted.id);
    ASSERT_TRUE(adopted);
    EXPECT_EQ(adopted->status, TaskStatus::Paused);
    EXPECT_EQ(adopted->downloadedBytes(), 1000u);
    EXPECT_EQ(queue_store_.load().size(), 1u);

    EXPECT_EQ(manager->process(), 1u);
    EXPECT_EQ(manager->find(interrupted.id)->status, TaskStatus::Completed);
    EXPECT_EQ(test::readFile(interrupted.destination), payload_);
}

TEST_F(QueueManagerTest, PauseAllStopsProcessingAndResumesLater) {
    auto manager = makeManager();
    QueueManager* target = manager.get();
    const auto first = manager->add("http://host/a.bin");
    const auto second = manager->add("http://host/b.bin");
    http_.setPieceHook([target](const HttpRequest&, std::uint64_t offset) {
        if (offset >= 60000) {
            target->pauseAll();
        }
    });

    EXPECT_EQ(manager->process(), 1u);
    EXPECT_EQ(manager->find(first.id)->status, TaskStatus::Paused);
    EXPECT_EQ(manager->find(second.id)->status, TaskStatus::Queued);
    EXPECT_TRUE(resume_store_.load(first.id));

    http_.setPieceHook({});
    EXPECT_EQ(manager->process(), 2u);
    EXPECT_EQ(manager->find(first.id)->status, TaskStatus::Completed);
    EXPECT_EQ(manager->find(second.id)->status, TaskStatus::Completed);
    EXPECT_EQ(test::readFile(first.destination), payload_);
}

TEST_F(QueueManagerTest, RunsUpToMaxConcurrentTasks) {
    config_.max_concurrent_tasks = 2;
    http_.setPieceDelay(std::chrono::milliseconds(1));
    auto manager = makeManager();
    for (const char* name : {"a.bin", "b.bin", "c.bin"}) {
        manager->add(std::string{"http://host/"} + name, AddOptions{std::nullopt, 1});
    }

    EXPECT_EQ(manager->process(), 3u);
    EXPECT_LE(http_.peakConcurrency(), 2u);
    for (const auto& task : manager->list()) {
        EXPECT_EQ(task.status, TaskStatus::Completed);
    }
}

TEST_F(QueueManagerTest, ForwardsProgressToSubscriber) {
    auto manager = makeManager();
    std::mutex mutex;
    std::vector<ProgressSnapshot> seen;
    manager->setProgressSubscriber([&](const ProgressSnapshot& snapshot) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(snapshot);
    });
    const auto task = manager->add("http://host/a.bin");

    manager->process();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back().task_id, task.id);
    EXPECT_EQ(seen.back().status, TaskStatus::Completed);
}

} // namespace
} // namespace fetchy
