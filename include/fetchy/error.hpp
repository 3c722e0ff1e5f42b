#pragma once

#include <stdexcept>
#include <string>

namespace fetchy {

enum class ErrorKind {
    NetworkError,
    RemoteError,
    RangeUnsupported,
    ValidatorMismatch,
    DiskError,
    QueueCorruption,
    ConfigError
};

[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& message, long http_status = 0);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] long httpStatus() const noexcept { return http_status_; }

    // Network errors and 429/503/5xx responses are worth another attempt.
    [[nodiscard]] bool retryable() const noexcept;

private:
    ErrorKind kind_;
    long http_status_;
};

[[nodiscard]] bool isRetryableStatus(long http_status) noexcept;

} // namespace fetchy
