#pragma once

#include "download_task.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

namespace fetchy {

// Owns queue.json. Single writer: saves are serialized and atomic.
class QueueStore {
public:
    explicit QueueStore(std::filesystem::path path);

    // Unreadable entries are dropped with a warning; an unparsable file is
    // moved aside to <path>.corrupt and an empty queue is returned.
    [[nodiscard]] std::vector<DownloadTask> load();
    void save(const std::vector<DownloadTask>& tasks);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void quarantine(const std::string& reason);

    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace fetchy
