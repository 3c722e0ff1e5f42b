#include "fetchy/config.hpp"

#include "fetchy/error.hpp"
#include "fetchy/logging.hpp"
#include "support/test_env.hpp"

#include <gtest/gtest.h>

namespace fetchy {
namespace {

TEST(ConfigTest, MissingFileGivesDefaults) {
    test::TempDir dir;
    const auto config = loadConfig(dir / "absent.json");

    EXPECT_EQ(config.max_retries, 3);
    EXPECT_EQ(config.backoff_base.count(), 500);
    EXPECT_EQ(config.default_threads, 4);
    EXPECT_EQ(config.max_concurrent_tasks, 1u);
    EXPECT_EQ(config.data_dir.filename(), ".fetchy");
    EXPECT_EQ(config.queueFile(), config.data_dir / "queue.json");
    EXPECT_EQ(config.resumeDir(), config.data_dir / "resume");
}

TEST(ConfigTest, ReadsOverrides) {
    test::TempDir dir;
    test::writeFile(dir / "config.json", R"({
        "max_retries": 5,
        "backoff_base_ms": 100,
        "backoff_cap_ms": 1000,
        "max_connections": 8,
        "max_concurrent_tasks": 2,
        "default_threads": 40,
        "user_agent": "fetchy-test/1.0",
        "log_level": "debug",
        "data_dir": "/var/lib/fetchy"
    })");

    const auto config = loadConfig(dir / "config.json");
    EXPECT_EQ(config.max_retries, 5);
    EXPECT_EQ(config.backoff_base.count(), 100);
    EXPECT_EQ(config.backoff_cap.count(), 1000);
    EXPECT_EQ(config.max_connections, 8u);
    EXPECT_EQ(config.max_concurrent_tasks, 2u);
    EXPECT_EQ(config.default_threads, kMaxThreads);
    EXPECT_EQ(config.user_agent, "fetchy-test/1.0");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.data_dir, "/var/lib/fetchy");
}

TEST(ConfigTest, RejectsBadValues) {
    test::TempDir dir;
    const auto path = dir / "config.json";
    auto expectConfigError = [&](const std::string& content) {
        test::writeFile(path, content);
        try {
            (void)loadConfig(path);
            ADD_FAILURE() << "accepted: " << content;
        } catch (const DownloadError& ex) {
            EXPECT_EQ(ex.kind(), ErrorKind::ConfigError) << content;
        }
    };

    expectConfigError("{ not json");
    expectConfigError("[1, 2]");
    expectConfigError(R"({"max_retries": 0})");
    expectConfigError(R"({"max_retries": "three"})");
    expectConfigError(R"({"user_agent": 42})");
    expectConfigError(R"({"log_level": "chatty"})");
    expectConfigError(R"({"backoff_base_ms": 1000, "backoff_cap_ms": 10})");
    expectConfigError(R"({"max_retries": 5000000000})");
    expectConfigError(R"({"backoff_cap_ms": 18446744073709551615})");
    expectConfigError(R"({"stall_timeout_s": 9999999999})");
}

TEST(ConfigTest, ClampsThreads) {
    EXPECT_EQ(clampThreads(0), 1);
    EXPECT_EQ(clampThreads(8), 8);
    EXPECT_EQ(clampThreads(17), 16);
}

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("bogus"), spdlog::level::off);
}

} // namespace
} // namespace fetchy
