#include "fetchy/serialization.hpp"

#include "fetchy/config.hpp"
#include "fetchy/error.hpp"

#include <fmt/format.h>

namespace fetchy {

namespace {

using json = nlohmann::json;

template<typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template<typename T>
std::optional<T> getOptional(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

[[noreturn]] void corrupt(const std::string& message) {
    throw DownloadError(ErrorKind::QueueCorruption, message);
}

} // namespace

void to_json(json& j, const Validator& validator) {
    j = json::object();
    putOptional(j, "etag", validator.etag);
    putOptional(j, "last_modified", validator.last_modified);
    putOptional(j, "content_length", validator.content_length);
}

void from_json(const json& j, Validator& validator) {
    validator.etag = getOptional<std::string>(j, "etag");
    validator.last_modified = getOptional<std::string>(j, "last_modified");
    validator.content_length = getOptional<std::uint64_t>(j, "content_length");
}

void to_json(json& j, const ChunkState& chunk) {
    j = json{{"index", chunk.index},
             {"start", chunk.range.start},
             {"end", chunk.range.end},
             {"bytes_downloaded", chunk.bytes_downloaded},
             {"status", toString(chunk.status)},
             {"retry_count", chunk.retry_count}};
}

void from_json(const json& j, ChunkState& chunk) {
    chunk.index = j.at("index").get<std::size_t>();
    chunk.range.start = j.at("start").get<std::uint64_t>();
    chunk.range.end = j.at("end").get<std::uint64_t>();
    chunk.bytes_downloaded = j.at("bytes_downloaded").get<std::uint64_t>();
    chunk.retry_count = j.value("retry_count", 0);

    const auto status_text = j.at("status").get<std::string>();
    const auto status = chunkStatusFromString(status_text);
    if (!status) {
        corrupt("unknown chunk status '" + status_text + "'");
    }
    chunk.status = *status;
}

void to_json(json& j, const DownloadTask& task) {
    j = json::object();
    j["id"] = task.id;
    j["url"] = task.url;
    j["destination"] = task.destination;
    j["status"] = toString(task.status);
    putOptional(j, "total_size", task.total_size);
    j["accepts_ranges"] = task.accepts_ranges;
    putOptional(j, "validator", task.validator);
    j["thread_count"] = task.thread_count;
    j["chunks"] = task.chunks;
    j["created_at"] = task.created_at;
    j["updated_at"] = task.updated_at;
    j["last_error"] = task.last_error;
}

void from_json(const json& j, DownloadTask& task) {
    task.id = j.at("id").get<std::string>();
    task.url = j.at("url").get<std::string>();
    task.destination = j.at("destination").get<std::string>();
    if (task.url.empty() || task.destination.empty()) {
        corrupt("entry without url or destination");
    }

    const auto status_text = j.at("status").get<std::string>();
    const auto status = taskStatusFromString(status_text);
    if (!status) {
        corrupt("unknown task status '" + status_text + "'");
    }
    task.status = *status;

    task.total_size = getOptional<std::uint64_t>(j, "total_size");
    task.accepts_ranges = j.value("accepts_ranges", false);
    task.validator = getOptional<Validator>(j, "validator");
    task.thread_count = clampThreads(j.value("thread_count", 4));
    task.chunks = j.value("chunks", std::vector<ChunkState>{});
    task.created_at = j.value("created_at", std::int64_t{0});
    task.updated_at = j.value("updated_at", std::int64_t{0});
    task.last_error = j.value("last_error", std::string{});

    validateChunks(task.chunks, task.total_size);
}

void to_json(json& j, const ResumeRecord& record) {
    j = json::object();
    j["id"] = record.id;
    j["url"] = record.url;
    j["destination"] = record.destination;
    putOptional(j, "total_size", record.total_size);
    putOptional(j, "validator", record.validator);
    j["thread_count"] = record.thread_count;
    j["chunks"] = record.chunks;
    j["updated_at"] = record.updated_at;
}

void from_json(const json& j, ResumeRecord& record) {
    record.id = j.at("id").get<std::string>();
    record.url = j.at("url").get<std::string>();
    record.destination = j.at("destination").get<std::string>();
    record.total_size = getOptional<std::uint64_t>(j, "total_size");
    record.validator = getOptional<Validator>(j, "validator");
    record.thread_count = clampThreads(j.value("thread_count", 4));
    record.chunks = j.at("chunks").get<std::vector<ChunkState>>();
    record.updated_at = j.value("updated_at", std::int64_t{0});

    if (record.chunks.empty()) {
        corrupt("resume record without chunks");
    }
    validateChunks(record.chunks, record.total_size);
}

void validateChunks(const std::vector<ChunkState>& chunks, std::optional<std::uint64_t> total_size) {
    std::uint64_t expected_start = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.index != i) {
            corrupt(fmt::format("chunk {} stored at position {}", chunk.index, i));
        }
        if (chunk.range.start != expected_start || chunk.range.end < chunk.range.start) {
            corrupt(fmt::format("chunk {} range [{}, {}) breaks the partition", i, chunk.range.start,
                                chunk.range.end));
        }
        if (chunk.bytes_downloaded > chunk.range.size()) {
            corrupt(fmt::format("chunk {} claims {} bytes of {}", i, chunk.bytes_downloaded, chunk.range.size()));
        }
        expected_start = chunk.range.end;
    }
    if (total_size && !chunks.empty() && expected_start != *total_size) {
        corrupt(fmt::format("chunks cover {} of {} bytes", expected_start, *total_size));
    }
}

} // namespace fetchy
