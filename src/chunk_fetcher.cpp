#include "fetchy/chunk_fetcher.hpp"

#include "fetchy/logging.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace fetchy {

namespace {

// Batches byte counts so the aggregator sees a few updates per second
// instead of one per network read.
class ProgressReporter {
public:
    ProgressReporter(ProgressAggregator& progress, std::size_t chunk_index, const FetchTuning& tuning)
        : progress_(progress),
          chunk_index_(chunk_index),
          tuning_(tuning),
          last_flush_(std::chrono::steady_clock::now()) {}

    ~ProgressReporter() { flush(); }

    void add(std::uint64_t bytes) {
        pending_ += bytes;
        if (pending_ >= tuning_.flush_bytes ||
            std::chrono::steady_clock::now() - last_flush_ >= tuning_.flush_interval) {
            flush();
        }
    }

    void flush() {
        if (pending_ > 0) {
            progress_.add(chunk_index_, pending_);
            pending_ = 0;
        }
        last_flush_ = std::chrono::steady_clock::now();
    }

private:
    ProgressAggregator& progress_;
    std::size_t chunk_index_;
    const FetchTuning& tuning_;
    std::uint64_t pending_{0};
    std::chrono::steady_clock::time_point last_flush_;
};

std::optional<std::uint64_t> parseContentRangeStart(const std::string& header) {
    const auto space = header.find(' ');
    const auto dash = header.find('-');
    if (space == std::string::npos || dash == std::string::npos || dash <= space) {
        return std::nullopt;
    }
    try {
        return std::stoull(header.substr(space + 1, dash - space - 1));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

struct ChunkFetcher::Attempt {
    enum class Kind { Complete, Stopped, Transient, Fatal, RangeUnsupported };

    Kind kind{Kind::Complete};
    ErrorKind error{ErrorKind::NetworkError};
    long http_status{0};
    std::string message;

    static Attempt of(Kind kind) { return Attempt{kind, ErrorKind::NetworkError, 0, {}}; }
    static Attempt failure(Kind kind, ErrorKind error, std::string message, long status = 0) {
        return Attempt{kind, error, status, std::move(message)};
    }
};

ChunkFetcher::ChunkFetcher(HttpClient& http, ConnectionLimiter& limiter, RetryPolicy retry, FetchTuning tuning)
    : http_(http), limiter_(limiter), retry_(std::move(retry)), tuning_(tuning) {}

ChunkResult ChunkFetcher::fetch(const std::string& url,
                                ChunkState chunk,
                                FetchMode mode,
                                detail::PartialFile& file,
                                ProgressAggregator& progress,
                                detail::StopSignal& stop) {
    ChunkResult result;
    int failures = 0;
    chunk.status = ChunkStatus::Active;

    auto finish = [&](ChunkOutcome outcome, ChunkStatus status) {
        chunk.status = status;
        result.chunk = chunk;
        result.outcome = outcome;
        return result;
    };

    while (true) {
        if (mode != FetchMode::OpenStream && chunk.remaining() == 0) {
            return finish(ChunkOutcome::Done, ChunkStatus::Done);
        }
        if (stop.requested()) {
            return finish(ChunkOutcome::Interrupted, ChunkStatus::Pending);
        }

        // Without ranges a broken stream can only start over.
        if (mode != FetchMode::Ranged && chunk.bytes_downloaded > 0) {
            FETCHY_DEBUG("Restarting range-less stream for {} from byte 0", url);
            progress.rewind(chunk.index);
            chunk.bytes_downloaded = 0;
            if (mode == FetchMode::OpenStream) {
                chunk.range.end = 0;
            }
            try {
                file.truncate(0);
            } catch (const DownloadError& ex) {
                result.error_kind = ex.kind();
                result.error_message = ex.what();
                return finish(ChunkOutcome::Failed, ChunkStatus::Failed);
            }
        }

        const Attempt attempt = attemptOnce(url, chunk, mode, file, progress, stop);
        switch (attempt.kind) {
            case Attempt::Kind::Complete:
                return finish(ChunkOutcome::Done, ChunkStatus::Done);

            case Attempt::Kind::Stopped:
                return finish(ChunkOutcome::Interrupted, ChunkStatus::Pending);

            case Attempt::Kind::RangeUnsupported:
                result.error_kind = ErrorKind::RangeUnsupported;
                result.http_status = attempt.http_status;
                result.error_message = attempt.message;
                return finish(ChunkOutcome::RangeUnsupported, ChunkStatus::Failed);

            case Attempt::Kind::Fatal:
                FETCHY_ERROR("Chunk {} of {} failed: {}", chunk.index, url, attempt.message);
                result.error_kind = attempt.error;
                result.http_status = attempt.http_status;
                result.error_message = attempt.message;
                return finish(ChunkOutcome::Failed, ChunkStatus::Failed);

            case Attempt::Kind::Transient:
                break;
        }

        ++failures;
        ++chunk.retry_count;
        if (retry_.exhausted(failures)) {
            FETCHY_ERROR("Chunk {} of {} gave up after {} failures: {}", chunk.index, url, failures,
                         attempt.message);
            result.error_kind = attempt.error;
            result.http_status = attempt.http_status;
            result.error_message = attempt.message;
            return finish(ChunkOutcome::Failed, ChunkStatus::Failed);
        }

        const auto delay = retry_.delayFor(failures);
        FETCHY_WARN("Chunk {} of {} failed at byte {} ({}), retry {}/{} in {} ms", chunk.index, url,
                    chunk.nextOffset(), attempt.message, failures, retry_.max_retries - 1, delay.count());
        if (stop.waitFor(delay)) {
            return finish(ChunkOutcome::Interrupted, ChunkStatus::Pending);
        }
    }
}

ChunkFetcher::Attempt ChunkFetcher::attemptOnce(const std::string& url,
                                                ChunkState& chunk,
                                                FetchMode mode,
                                                detail::PartialFile& file,
                                                ProgressAggregator& progress,
                                                detail::StopSignal& stop) {
    ConnectionPermit permit(limiter_, stop);
    if (!permit.acquired()) {
        return Attempt::of(Attempt::Kind::Stopped);
    }

    HttpRequest request;
    request.url = url;
    if (mode == FetchMode::Ranged) {
        request.range = ByteRange{chunk.nextOffset(), chunk.range.end};
    }

    std::optional<Attempt> verdict;
    ProgressReporter reporter(progress, chunk.index, tuning_);

    auto on_response = [&](const HttpResponse& response) {
        if (mode == FetchMode::Ranged) {
            if (response.status == 206) {
                const auto content_range = response.header("content-range");
                const auto start = content_range ? parseContentRangeStart(*content_range) : std::nullopt;
                if (content_range && start != chunk.nextOffset()) {
                    verdict = Attempt::failure(Attempt::Kind::RangeUnsupported, ErrorKind::RangeUnsupported,
                                               "server answered a different range: " + *content_range,
                                               response.status);
                    return false;
                }
                return true;
            }
            if (response.status == 200 || response.status == 416) {
                verdict = Attempt::failure(Attempt::Kind::RangeUnsupported, ErrorKind::RangeUnsupported,
                                           "range request not honoured", response.status);
                return false;
            }
        } else if (response.status >= 200 && response.status < 300) {
            return true;
        }

        const Attempt::Kind kind =
            isRetryableStatus(response.status) ? Attempt::Kind::Transient : Attempt::Kind::Fatal;
        verdict = Attempt::failure(kind, ErrorKind::RemoteError, "server rejected chunk request",
                                   response.status);
        return false;
    };

    auto on_body = [&](const char* data, std::size_t size) {
        std::size_t usable = size;
        if (mode != FetchMode::OpenStream) {
            usable = static_cast<std::size_t>(std::min<std::uint64_t>(size, chunk.remaining()));
        }
        try {
            file.writeAt(data, usable, chunk.nextOffset());
        } catch (const DownloadError& ex) {
            verdict = Attempt::failure(Attempt::Kind::Fatal, ex.kind(), ex.what());
            return false;
        }
        chunk.bytes_downloaded += usable;
        if (mode == FetchMode::OpenStream) {
            chunk.range.end = chunk.nextOffset();
        }
        reporter.add(usable);

        if (usable < size) {
            // Anything past the chunk end belongs to a neighbour.
            return false;
        }
        // The buffer is fully written; stop is honoured between reads only.
        return !stop.requested();
    };

    HttpResponse response;
    try {
        response = http_.perform(request, on_response, on_body);
    } catch (const DownloadError& ex) {
        reporter.flush();
        if (verdict) {
            return *verdict;
        }
        const Attempt::Kind kind = ex.retryable() ? Attempt::Kind::Transient : Attempt::Kind::Fatal;
        return Attempt::failure(kind, ex.kind(), ex.what(), ex.httpStatus());
    }
    reporter.flush();

    if (verdict) {
        return *verdict;
    }
    if (mode != FetchMode::OpenStream) {
        if (chunk.remaining() == 0) {
            return Attempt::of(Attempt::Kind::Complete);
        }
        if (response.aborted && stop.requested()) {
            return Attempt::of(Attempt::Kind::Stopped);
        }
        return Attempt::failure(Attempt::Kind::Transient, ErrorKind::NetworkError,
                                "stream ended before the chunk was complete");
    }
    if (response.aborted && stop.requested()) {
        return Attempt::of(Attempt::Kind::Stopped);
    }
    return Attempt::of(Attempt::Kind::Complete);
}

} // namespace fetchy
