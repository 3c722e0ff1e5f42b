#pragma once

#include "download_task.hpp"

#include <cstdint>
#include <vector>

namespace fetchy {

// Splits [0, total_size) into at most thread_count contiguous ranges of
// ceil(total_size / thread_count) bytes, the last one ending at total_size.
// thread_count is clamped to [1, 16]. An empty resource yields one empty
// range. Deterministic: resume relies on identical plans.
[[nodiscard]] std::vector<ByteRange> planChunks(std::uint64_t total_size, int thread_count);

// Single chunk covering the whole stream; end is 0 when the size is unknown.
[[nodiscard]] std::vector<ByteRange> planSingleStream(std::uint64_t total_size);

[[nodiscard]] std::vector<ChunkState> makeChunkStates(const std::vector<ByteRange>& ranges);

} // namespace fetchy
