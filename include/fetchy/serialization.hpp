#pragma once

#include "download_task.hpp"

#include <nlohmann/json.hpp>

namespace fetchy {

// JSON form shared by the queue file and resume records. Readers throw
// nlohmann::json::exception or DownloadError(QueueCorruption) on bad input.
void to_json(nlohmann::json& j, const Validator& validator);
void from_json(const nlohmann::json& j, Validator& validator);

void to_json(nlohmann::json& j, const ChunkState& chunk);
void from_json(const nlohmann::json& j, ChunkState& chunk);

void to_json(nlohmann::json& j, const DownloadTask& task);
void from_json(const nlohmann::json& j, DownloadTask& task);

void to_json(nlohmann::json& j, const ResumeRecord& record);
void from_json(const nlohmann::json& j, ResumeRecord& record);

// Chunks must be ordered, contiguous from 0 and within their ranges.
void validateChunks(const std::vector<ChunkState>& chunks, std::optional<std::uint64_t> total_size);

} // namespace fetchy
