#include "fetchy/prober.hpp"

#include "fetchy/error.hpp"
#include "fetchy/logging.hpp"

#include <cctype>
#include <charconv>
#include <thread>
#include <utility>

namespace fetchy {

namespace {

std::string trimQuotes(std::string value) {
    const auto first = value.find_first_not_of(" \t");
    const auto last = value.find_last_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    value = value.substr(first, last - first + 1);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

std::optional<std::uint64_t> parseUnsigned(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = text.find_last_not_of(" \t");
    std::uint64_t value = 0;
    const char* begin = text.data() + first;
    const char* end = text.data() + last + 1;
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> sanitizeFilename(const std::string& name) {
    const auto slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
    if (base.empty() || base == "." || base == "..") {
        return std::nullopt;
    }
    return base;
}

bool is2xx(long status) {
    return status >= 200 && status < 300;
}

} // namespace

Prober::Prober(HttpClient& http, RetryPolicy retry) : http_(http), retry_(std::move(retry)) {}

ProbeResult Prober::probe(const std::string& url, detail::StopSignal* stop) {
    int failures = 0;
    while (true) {
        try {
            return probeOnce(url);
        } catch (const DownloadError& ex) {
            if (!ex.retryable()) {
                throw;
            }
            ++failures;
            if (retry_.exhausted(failures)) {
                FETCHY_ERROR("Probe of {} failed after {} attempts: {}", url, failures, ex.what());
                throw;
            }
            const auto delay = retry_.delayFor(failures);
            FETCHY_WARN("Probe of {} failed ({}), retrying in {} ms", url, ex.what(), delay.count());
            if (!stop) {
                std::this_thread::sleep_for(delay);
            } else if (stop->waitFor(delay)) {
                FETCHY_DEBUG("Probe of {} stopped during backoff", url);
                throw;
            }
        }
    }
}

ProbeResult Prober::probeOnce(const std::string& url) {
    HttpRequest request;
    request.url = url;
    request.head_only = true;

    const HttpResponse head = http_.perform(request, {}, {});
    if (!is2xx(head.status)) {
        if (isRetryableStatus(head.status)) {
            throw DownloadError(ErrorKind::RemoteError, "probe rejected by server", head.status);
        }
        // Some servers refuse HEAD but serve GET.
        FETCHY_DEBUG("HEAD {} answered {}, trying a ranged GET", url, head.status);
        return probeWithRangedGet(url);
    }

    ProbeResult result;
    if (const auto length = head.header("content-length")) {
        result.total_size = parseUnsigned(*length);
    }
    if (const auto ranges = head.header("accept-ranges")) {
        result.accepts_ranges = toLower(*ranges).find("bytes") != std::string::npos;
    }
    if (const auto disposition = head.header("content-disposition")) {
        result.suggested_filename = parseContentDisposition(*disposition);
    }
    if (!result.suggested_filename) {
        result.suggested_filename = filenameFromUrl(url);
    }
    result.content_type = head.header("content-type");
    result.validator = validatorFromHeaders(head, result.total_size);

    if (!result.total_size) {
        const ProbeResult ranged = probeWithRangedGet(url);
        result.total_size = ranged.total_size;
        result.accepts_ranges = ranged.accepts_ranges;

        Validator merged = result.validator.value_or(Validator{});
        if (ranged.validator) {
            if (!merged.etag) {
                merged.etag = ranged.validator->etag;
            }
            if (!merged.last_modified) {
                merged.last_modified = ranged.validator->last_modified;
            }
        }
        merged.content_length = result.total_size;
        result.validator = merged.empty() ? std::nullopt : std::optional<Validator>{merged};
    }

    FETCHY_DEBUG("Probed {}: size={} ranges={}", url,
                 result.total_size ? std::to_string(*result.total_size) : "unknown",
                 result.accepts_ranges);
    return result;
}

ProbeResult Prober::probeWithRangedGet(const std::string& url) {
    HttpRequest request;
    request.url = url;
    request.range = ByteRange{0, 1};

    // Only the headers matter; stop before the body.
    const HttpResponse response = http_.perform(request, [](const HttpResponse&) { return false; }, {});

    ProbeResult result;
    if (response.status == 206) {
        if (const auto content_range = response.header("content-range")) {
            result.total_size = parseContentRangeTotal(*content_range);
        }
        result.accepts_ranges = result.total_size.has_value();
    } else if (response.status == 416) {
        if (const auto content_range = response.header("content-range")) {
            result.total_size = parseContentRangeTotal(*content_range);
        }
        result.accepts_ranges = result.total_size.has_value();
    } else if (is2xx(response.status)) {
        if (const auto length = response.header("content-length")) {
            result.total_size = parseUnsigned(*length);
        }
        result.accepts_ranges = false;
    } else {
        throw DownloadError(ErrorKind::RemoteError, "ranged probe rejected by server", response.status);
    }

    if (const auto disposition = response.header("content-disposition")) {
        result.suggested_filename = parseContentDisposition(*disposition);
    }
    if (!result.suggested_filename) {
        result.suggested_filename = filenameFromUrl(url);
    }
    result.content_type = response.header("content-type");
    result.validator = validatorFromHeaders(response, result.total_size);
    return result;
}

std::optional<std::string> parseContentDisposition(const std::string& header) {
    const std::string lower = toLower(header);

    const auto extended = lower.find("filename*=");
    if (extended != std::string::npos) {
        const auto value_start = extended + 10;
        const auto value_end = header.find(';', value_start);
        const std::string value = trimQuotes(header.substr(value_start, value_end - value_start));
        const auto first_quote = value.find('\'');
        const auto second_quote = first_quote == std::string::npos ? std::string::npos
                                                                    : value.find('\'', first_quote + 1);
        if (second_quote != std::string::npos) {
            if (auto name = sanitizeFilename(percentDecode(value.substr(second_quote + 1)))) {
                return name;
            }
        }
    }

    std::size_t search_from = 0;
    while (true) {
        const auto plain = lower.find("filename=", search_from);
        if (plain == std::string::npos) {
            break;
        }
        const auto value_start = plain + 9;
        std::string value;
        if (value_start < header.size() && header[value_start] == '"') {
            const auto closing = header.find('"', value_start + 1);
            value = header.substr(value_start + 1, closing == std::string::npos
                                                        ? std::string::npos
                                                        : closing - value_start - 1);
        } else {
            const auto value_end = header.find(';', value_start);
            value = trimQuotes(header.substr(value_start, value_end - value_start));
        }
        if (auto name = sanitizeFilename(value)) {
            return name;
        }
        search_from = value_start;
    }
    return std::nullopt;
}

std::string filenameFromUrl(const std::string& url) {
    std::string path = url;
    const auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        const auto path_start = path.find('/', scheme + 3);
        path = path_start == std::string::npos ? std::string{} : path.substr(path_start);
    }
    const auto query = path.find_first_of("?#");
    if (query != std::string::npos) {
        path = path.substr(0, query);
    }
    const auto slash = path.find_last_of('/');
    const std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);

    if (auto name = sanitizeFilename(percentDecode(segment))) {
        return *name;
    }
    return "download_file";
}

std::string percentDecode(const std::string& text) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int high = hex(text[i + 1]);
            const int low = hex(text[i + 2]);
            if (high >= 0 && low >= 0) {
                out.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        out.push_back(text[i]);
    }
    return out;
}

std::optional<std::uint64_t> parseContentRangeTotal(const std::string& header) {
    const auto slash = header.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    const std::string total = header.substr(slash + 1);
    if (total.find('*') != std::string::npos) {
        return std::nullopt;
    }
    return parseUnsigned(total);
}

std::optional<Validator> validatorFromHeaders(const HttpResponse& response,
                                              std::optional<std::uint64_t> total_size) {
    Validator validator;
    validator.etag = response.header("etag");
    validator.last_modified = response.header("last-modified");
    validator.content_length = total_size;
    if (validator.empty()) {
        return std::nullopt;
    }
    return validator;
}

} // namespace fetchy
