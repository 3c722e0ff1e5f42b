#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace fetchy {

inline constexpr int kMinThreads = 1;
inline constexpr int kMaxThreads = 16;

struct EngineConfig {
    int max_retries{3};
    std::chrono::milliseconds backoff_base{500};
    std::chrono::milliseconds backoff_cap{8000};

    std::chrono::milliseconds progress_interval{250};
    std::chrono::milliseconds snapshot_interval{2000};

    // 0 means no engine-wide cap on in-flight connections.
    std::size_t max_connections{0};
    std::size_t max_concurrent_tasks{1};
    int default_threads{4};

    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds stall_timeout{30};
    std::string user_agent{
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/91.0.4472.124 Safari/537.36"};

    std::filesystem::path data_dir;
    std::filesystem::path download_dir;

    std::string log_level{"info"};
    std::string log_file;

    [[nodiscard]] std::filesystem::path queueFile() const { return data_dir / "queue.json"; }
    [[nodiscard]] std::filesystem::path resumeDir() const { return data_dir / "resume"; }
};

[[nodiscard]] int clampThreads(int thread_count) noexcept;

// Defaults with data_dir under $HOME/.fetchy and download_dir at the working directory.
[[nodiscard]] EngineConfig defaultConfig();

// A missing file yields defaults; malformed or out-of-range values throw DownloadError.
[[nodiscard]] EngineConfig loadConfig(const std::filesystem::path& path);

} // namespace fetchy
