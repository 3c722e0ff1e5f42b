#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fetchy {

enum class TaskStatus { Queued, Probing, Downloading, Paused, Completed, Failed, Cancelled };

enum class ChunkStatus { Pending, Active, Done, Failed };

[[nodiscard]] const char* toString(TaskStatus status) noexcept;
[[nodiscard]] const char* toString(ChunkStatus status) noexcept;
[[nodiscard]] std::optional<TaskStatus> taskStatusFromString(const std::string& text);
[[nodiscard]] std::optional<ChunkStatus> chunkStatusFromString(const std::string& text);

[[nodiscard]] bool isTerminal(TaskStatus status) noexcept;

// Half-open byte range [start, end).
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start; }

    friend bool operator==(const ByteRange& lhs, const ByteRange& rhs) noexcept {
        return lhs.start == rhs.start && lhs.end == rhs.end;
    }
    friend bool operator!=(const ByteRange& lhs, const ByteRange& rhs) noexcept { return !(lhs == rhs); }
};

struct ChunkState {
    std::size_t index{0};
    ByteRange range;
    std::uint64_t bytes_downloaded{0};
    ChunkStatus status{ChunkStatus::Pending};
    int retry_count{0};

    [[nodiscard]] std::uint64_t remaining() const noexcept {
        return bytes_downloaded >= range.size() ? 0 : range.size() - bytes_downloaded;
    }
    [[nodiscard]] std::uint64_t nextOffset() const noexcept { return range.start + bytes_downloaded; }
};

// Identifies one version of a remote resource.
struct Validator {
    std::optional<std::string> etag;
    std::optional<std::string> last_modified;
    std::optional<std::uint64_t> content_length;

    [[nodiscard]] bool empty() const noexcept {
        return !etag && !last_modified && !content_length;
    }

    // ETag, then Last-Modified, then Content-Length. Lengths known on both
    // sides must agree. Nothing comparable counts as a mismatch.
    [[nodiscard]] bool matches(const Validator& current) const noexcept;

    friend bool operator==(const Validator& lhs, const Validator& rhs) noexcept {
        return lhs.etag == rhs.etag && lhs.last_modified == rhs.last_modified &&
               lhs.content_length == rhs.content_length;
    }
};

struct DownloadTask {
    std::string id;
    std::string url;
    std::string destination;
    std::optional<std::uint64_t> total_size;
    bool accepts_ranges{false};
    std::optional<Validator> validator;
    int thread_count{4};
    TaskStatus status{TaskStatus::Queued};
    std::int64_t created_at{0};
    std::int64_t updated_at{0};
    std::vector<ChunkState> chunks;
    std::string last_error;

    [[nodiscard]] std::uint64_t downloadedBytes() const noexcept;
    // Completed iff every chunk is Done and the byte sum equals total_size.
    [[nodiscard]] bool allChunksDone() const noexcept;
    [[nodiscard]] std::string partialPath() const { return destination + ".part"; }
};

// Durable projection of a task, enough to continue after a restart.
struct ResumeRecord {
    std::string id;
    std::string url;
    std::string destination;
    std::optional<std::uint64_t> total_size;
    std::optional<Validator> validator;
    int thread_count{4};
    std::vector<ChunkState> chunks;
    std::int64_t updated_at{0};

    [[nodiscard]] static ResumeRecord fromTask(const DownloadTask& task);
    [[nodiscard]] std::string partialPath() const { return destination + ".part"; }
};

// 16 hex digits of FNV-1a over url and destination.
[[nodiscard]] std::string makeTaskId(const std::string& url, const std::string& destination);

[[nodiscard]] DownloadTask makeTask(const std::string& url, const std::string& destination, int thread_count);

// Unix epoch milliseconds.
[[nodiscard]] std::int64_t nowMillis();

} // namespace fetchy
