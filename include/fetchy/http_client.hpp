#pragma once

#include "download_task.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace fetchy {

struct HttpRequest {
    std::string url;
    bool head_only{false};
    // Sent as "Range: bytes=<start>-<end - 1>".
    std::optional<ByteRange> range;
};

struct HttpResponse {
    long status{0};
    // Lowercase header names of the final response.
    std::map<std::string, std::string> headers;
    // A handler returned false and the transfer was stopped on purpose.
    bool aborted{false};

    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
};

class HttpClient {
public:
    // Called once before the first body byte; false stops the transfer.
    using ResponseHandler = std::function<bool(const HttpResponse&)>;
    // Called for every received block; false stops the transfer.
    using BodyHandler = std::function<bool(const char* data, std::size_t size)>;

    virtual ~HttpClient() = default;

    // Throws DownloadError(NetworkError) when the transport fails.
    virtual HttpResponse perform(const HttpRequest& request,
                                 const ResponseHandler& on_response,
                                 const BodyHandler& on_body) = 0;
};

struct CurlOptions {
    std::string user_agent;
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds stall_timeout{30};
    std::size_t buffer_size{64 * 1024};
};

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(CurlOptions options = {});
    ~CurlHttpClient() override;

    HttpResponse perform(const HttpRequest& request,
                         const ResponseHandler& on_response,
                         const BodyHandler& on_body) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

[[nodiscard]] std::string toLower(std::string text);

} // namespace fetchy
