#include "fetchy/config.hpp"

#include "fetchy/error.hpp"
#include "fetchy/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <limits>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace fetchy {

namespace {

using json = nlohmann::json;

// One day.
constexpr long long kMaxDelayMs = 24LL * 60 * 60 * 1000;
constexpr long long kMaxTimeoutS = 24LL * 60 * 60;

template<typename T>
T readNumber(const json& j, const char* key, T fallback, T min_value,
             T max_value = std::numeric_limits<T>::max()) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw DownloadError(ErrorKind::ConfigError, fmt::format("'{}' must be an integer", key));
    }
    if (value.is_number_unsigned() &&
        value.get<unsigned long long>() > static_cast<unsigned long long>(max_value)) {
        throw DownloadError(ErrorKind::ConfigError, fmt::format("'{}' must be at most {}", key, max_value));
    }
    const auto number = value.get<long long>();
    if (number < static_cast<long long>(min_value)) {
        throw DownloadError(ErrorKind::ConfigError,
                            fmt::format("'{}' must be at least {}", key, min_value));
    }
    if (static_cast<unsigned long long>(number) > static_cast<unsigned long long>(max_value)) {
        throw DownloadError(ErrorKind::ConfigError, fmt::format("'{}' must be at most {}", key, max_value));
    }
    return static_cast<T>(number);
}

std::string readString(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_string()) {
        throw DownloadError(ErrorKind::ConfigError, fmt::format("'{}' must be a string", key));
    }
    return value.get<std::string>();
}

} // namespace

int clampThreads(int thread_count) noexcept {
    return std::clamp(thread_count, kMinThreads, kMaxThreads);
}

EngineConfig defaultConfig() {
    EngineConfig config;
    const char* home = std::getenv("HOME");
    config.data_dir = std::filesystem::path{home ? home : "."} / ".fetchy";

    std::error_code ec;
    config.download_dir = std::filesystem::current_path(ec);
    if (ec) {
        config.download_dir = ".";
    }
    return config;
}

EngineConfig loadConfig(const std::filesystem::path& path) {
    EngineConfig config = defaultConfig();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        FETCHY_DEBUG("No config at {}, using defaults", path.string());
        return config;
    }

    std::ifstream in(path);
    if (!in) {
        throw DownloadError(ErrorKind::ConfigError, "Cannot open config file: " + path.string());
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& ex) {
        throw DownloadError(ErrorKind::ConfigError,
                            fmt::format("Malformed config {}: {}", path.string(), ex.what()));
    }
    if (!j.is_object()) {
        throw DownloadError(ErrorKind::ConfigError, "Config root must be a JSON object");
    }

    config.max_retries = readNumber<int>(j, "max_retries", config.max_retries, 1, 100);
    config.backoff_base = std::chrono::milliseconds{
        readNumber<long long>(j, "backoff_base_ms", config.backoff_base.count(), 0, kMaxDelayMs)};
    config.backoff_cap = std::chrono::milliseconds{
        readNumber<long long>(j, "backoff_cap_ms", config.backoff_cap.count(), 0, kMaxDelayMs)};
    config.progress_interval = std::chrono::milliseconds{
        readNumber<long long>(j, "progress_interval_ms", config.progress_interval.count(), 1, kMaxDelayMs)};
    config.snapshot_interval = std::chrono::milliseconds{
        readNumber<long long>(j, "snapshot_interval_ms", config.snapshot_interval.count(), 1, kMaxDelayMs)};
    config.max_connections = readNumber<std::size_t>(j, "max_connections", config.max_connections, 0);
    config.max_concurrent_tasks =
        readNumber<std::size_t>(j, "max_concurrent_tasks", config.max_concurrent_tasks, 1);
    config.default_threads = clampThreads(readNumber<int>(j, "default_threads", config.default_threads, 1));
    config.connect_timeout = std::chrono::seconds{
        readNumber<long long>(j, "connect_timeout_s", config.connect_timeout.count(), 1, kMaxTimeoutS)};
    config.stall_timeout = std::chrono::seconds{
        readNumber<long long>(j, "stall_timeout_s", config.stall_timeout.count(), 1, kMaxTimeoutS)};
    config.user_agent = readString(j, "user_agent", config.user_agent);
    config.log_file = readString(j, "log_file", config.log_file);

    config.log_level = readString(j, "log_level", config.log_level);
    if (config.log_level != "off" && parseLogLevel(config.log_level) == spdlog::level::off) {
        throw DownloadError(ErrorKind::ConfigError, "Unknown log_level: " + config.log_level);
    }

    const auto data_dir = readString(j, "data_dir", {});
    if (!data_dir.empty()) {
        config.data_dir = data_dir;
    }
    const auto download_dir = readString(j, "download_dir", {});
    if (!download_dir.empty()) {
        config.download_dir = download_dir;
    }

    if (config.backoff_cap < config.backoff_base) {
        throw DownloadError(ErrorKind::ConfigError, "backoff_cap_ms must not be below backoff_base_ms");
    }

    return config;
}

} // namespace fetchy
