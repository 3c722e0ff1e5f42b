#include "fetchy/error.hpp"

#include <fmt/format.h>

namespace fetchy {

namespace {

std::string decorate(ErrorKind kind, const std::string& message, long http_status) {
    if (kind == ErrorKind::RemoteError && http_status != 0) {
        return fmt::format("HTTP {}: {}", http_status, message);
    }
    return message;
}

} // namespace

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NetworkError:      return "NetworkError";
        case ErrorKind::RemoteError:       return "RemoteError";
        case ErrorKind::RangeUnsupported:  return "RangeUnsupported";
        case ErrorKind::ValidatorMismatch: return "ValidatorMismatch";
        case ErrorKind::DiskError:         return "DiskError";
        case ErrorKind::QueueCorruption:   return "QueueCorruption";
        case ErrorKind::ConfigError:       return "ConfigError";
    }
    return "UnknownError";
}

DownloadError::DownloadError(ErrorKind kind, const std::string& message, long http_status)
    : std::runtime_error(decorate(kind, message, http_status)),
      kind_(kind),
      http_status_(http_status) {}

bool DownloadError::retryable() const noexcept {
    switch (kind_) {
        case ErrorKind::NetworkError:
            return true;
        case ErrorKind::RemoteError:
            return isRetryableStatus(http_status_);
        default:
            return false;
    }
}

bool isRetryableStatus(long http_status) noexcept {
    return http_status == 429 || http_status == 503 || (http_status >= 500 && http_status < 600);
}

} // namespace fetchy
