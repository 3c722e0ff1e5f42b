#include "fetchy/download_task.hpp"

#include "fetchy/config.hpp"

#include <chrono>
#include <numeric>

#include <fmt/format.h>

namespace fetchy {

const char* toString(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Queued:      return "queued";
        case TaskStatus::Probing:     return "probing";
        case TaskStatus::Downloading: return "downloading";
        case TaskStatus::Paused:      return "paused";
        case TaskStatus::Completed:   return "completed";
        case TaskStatus::Failed:      return "failed";
        case TaskStatus::Cancelled:   return "cancelled";
    }
    return "unknown";
}

const char* toString(ChunkStatus status) noexcept {
    switch (status) {
        case ChunkStatus::Pending: return "pending";
        case ChunkStatus::Active:  return "active";
        case ChunkStatus::Done:    return "done";
        case ChunkStatus::Failed:  return "failed";
    }
    return "unknown";
}

std::optional<TaskStatus> taskStatusFromString(const std::string& text) {
    if (text == "queued")      return TaskStatus::Queued;
    if (text == "probing")     return TaskStatus::Probing;
    if (text == "downloading") return TaskStatus::Downloading;
    if (text == "paused")      return TaskStatus::Paused;
    if (text == "completed")   return TaskStatus::Completed;
    if (text == "failed")      return TaskStatus::Failed;
    if (text == "cancelled")   return TaskStatus::Cancelled;
    return std::nullopt;
}

std::optional<ChunkStatus> chunkStatusFromString(const std::string& text) {
    if (text == "pending") return ChunkStatus::Pending;
    if (text == "active")  return ChunkStatus::Active;
    if (text == "done")    return ChunkStatus::Done;
    if (text == "failed")  return ChunkStatus::Failed;
    return std::nullopt;
}

bool isTerminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

bool Validator::matches(const Validator& current) const noexcept {
    if (content_length && current.content_length && *content_length != *current.content_length) {
        return false;
    }
    if (etag && current.etag) {
        return *etag == *current.etag;
    }
    if (last_modified && current.last_modified) {
        return *last_modified == *current.last_modified;
    }
    if (content_length && current.content_length) {
        return true;
    }
    return false;
}

std::uint64_t DownloadTask::downloadedBytes() const noexcept {
    return std::accumulate(chunks.begin(), chunks.end(), std::uint64_t{0},
                           [](std::uint64_t sum, const ChunkState& chunk) {
                               return sum + chunk.bytes_downloaded;
                           });
}

bool DownloadTask::allChunksDone() const noexcept {
    if (chunks.empty()) {
        return false;
    }
    for (const auto& chunk : chunks) {
        if (chunk.status != ChunkStatus::Done) {
            return false;
        }
    }
    return !total_size || downloadedBytes() == *total_size;
}

ResumeRecord ResumeRecord::fromTask(const DownloadTask& task) {
    ResumeRecord record;
    record.id = task.id;
    record.url = task.url;
    record.destination = task.destination;
    record.total_size = task.total_size;
    record.validator = task.validator;
    record.thread_count = task.thread_count;
    record.chunks = task.chunks;
    record.updated_at = nowMillis();
    return record;
}

std::string makeTaskId(const std::string& url, const std::string& destination) {
    constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
    constexpr std::uint64_t kPrime = 1099511628211ULL;

    std::uint64_t hash = kOffsetBasis;
    auto mix = [&hash](const std::string& text) {
        for (const unsigned char c : text) {
            hash ^= c;
            hash *= kPrime;
        }
    };
    mix(url);
    mix("\n");
    mix(destination);
    return fmt::format("{:016x}", hash);
}

DownloadTask makeTask(const std::string& url, const std::string& destination, int thread_count) {
    DownloadTask task;
    task.id = makeTaskId(url, destination);
    task.url = url;
    task.destination = destination;
    task.thread_count = clampThreads(thread_count);
    task.status = TaskStatus::Queued;
    task.created_at = nowMillis();
    task.updated_at = task.created_at;
    return task;
}

std::int64_t nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace fetchy
