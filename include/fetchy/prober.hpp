#pragma once

#include "detail/stop_signal.hpp"
#include "download_task.hpp"
#include "http_client.hpp"
#include "retry_policy.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fetchy {

struct ProbeResult {
    std::optional<std::uint64_t> total_size;
    bool accepts_ranges{false};
    std::optional<Validator> validator;
    std::optional<std::string> suggested_filename;
    std::optional<std::string> content_type;
};

// Establishes size, range support and validators before chunks are planned.
class Prober {
public:
    Prober(HttpClient& http, RetryPolicy retry);

    // HEAD, then a one-byte ranged GET when HEAD is refused or lacks a size.
    // Throws DownloadError (NetworkError or RemoteError) once retries run out,
    // or with the last error when stop is raised during a backoff.
    [[nodiscard]] ProbeResult probe(const std::string& url, detail::StopSignal* stop = nullptr);

private:
    [[nodiscard]] ProbeResult probeOnce(const std::string& url);
    [[nodiscard]] ProbeResult probeWithRangedGet(const std::string& url);

    HttpClient& http_;
    RetryPolicy retry_;
};

// filename*=charset'lang'value wins over filename="value".
[[nodiscard]] std::optional<std::string> parseContentDisposition(const std::string& header);

// Last path segment without query or fragment, percent-decoded; "download_file" otherwise.
[[nodiscard]] std::string filenameFromUrl(const std::string& url);

[[nodiscard]] std::string percentDecode(const std::string& text);

// Total length from "bytes a-b/N"; nullopt for "*" or malformed values.
[[nodiscard]] std::optional<std::uint64_t> parseContentRangeTotal(const std::string& header);

[[nodiscard]] std::optional<Validator> validatorFromHeaders(const HttpResponse& response,
                                                            std::optional<std::uint64_t> total_size);

} // namespace fetchy
