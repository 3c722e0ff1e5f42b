#pragma once

#include "connection_limiter.hpp"
#include "detail/partial_file.hpp"
#include "detail/stop_signal.hpp"
#include "download_task.hpp"
#include "error.hpp"
#include "http_client.hpp"
#include "progress_aggregator.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace fetchy {

enum class FetchMode {
    // Range request for the chunk's remaining bytes.
    Ranged,
    // Plain GET of the whole resource with a known length.
    Stream,
    // Plain GET of unknown length; the chunk's end grows with the data.
    OpenStream
};

enum class ChunkOutcome { Done, Interrupted, Failed, RangeUnsupported };

struct ChunkResult {
    ChunkState chunk;
    ChunkOutcome outcome{ChunkOutcome::Done};
    std::optional<ErrorKind> error_kind;
    long http_status{0};
    std::string error_message;
};

struct FetchTuning {
    std::uint64_t flush_bytes{256 * 1024};
    std::chrono::milliseconds flush_interval{100};
};

// Fetches one chunk into the partial file at its own offsets, retrying
// transient failures from the last written byte.
class ChunkFetcher {
public:
    ChunkFetcher(HttpClient& http, ConnectionLimiter& limiter, RetryPolicy retry, FetchTuning tuning = {});

    [[nodiscard]] ChunkResult fetch(const std::string& url,
                                    ChunkState chunk,
                                    FetchMode mode,
                                    detail::PartialFile& file,
                                    ProgressAggregator& progress,
                                    detail::StopSignal& stop);

private:
    struct Attempt;

    [[nodiscard]] Attempt attemptOnce(const std::string& url,
                                      ChunkState& chunk,
                                      FetchMode mode,
                                      detail::PartialFile& file,
                                      ProgressAggregator& progress,
                                      detail::StopSignal& stop);

    HttpClient& http_;
    ConnectionLimiter& limiter_;
    RetryPolicy retry_;
    FetchTuning tuning_;
};

} // namespace fetchy
