#include "fetchy/chunk_planner.hpp"

#include "fetchy/config.hpp"

#include <algorithm>

namespace fetchy {

std::vector<ByteRange> planChunks(std::uint64_t total_size, int thread_count) {
    if (total_size == 0) {
        return planSingleStream(0);
    }

    const auto parts = std::min<std::uint64_t>(static_cast<std::uint64_t>(clampThreads(thread_count)), total_size);
    const std::uint64_t part_size = (total_size + parts - 1) / parts;

    // Ceil-sized chunks; a start is pulled back only when the chunks after it
    // would otherwise be left without a byte each.
    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<std::size_t>(parts));
    for (std::uint64_t i = 0; i < parts; ++i) {
        const std::uint64_t start = std::min(i * part_size, total_size - (parts - i));
        if (!ranges.empty()) {
            ranges.back().end = start;
        }
        ranges.push_back({start, total_size});
    }
    return ranges;
}

std::vector<ByteRange> planSingleStream(std::uint64_t total_size) {
    return {ByteRange{0, total_size}};
}

std::vector<ChunkState> makeChunkStates(const std::vector<ByteRange>& ranges) {
    std::vector<ChunkState> chunks;
    chunks.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        ChunkState chunk;
        chunk.index = i;
        chunk.range = ranges[i];
        chunks.push_back(chunk);
    }
    return chunks;
}

} // namespace fetchy
