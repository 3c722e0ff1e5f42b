#include "fetchy/http_client.hpp"

#include "fetchy/detail/curl_utils.hpp"
#include "fetchy/error.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace fetchy {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    const auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

class CurlHttpClient::Impl {
public:
    explicit Impl(CurlOptions options) : options_(std::move(options)) {
        detail::ensureCurlInitialized();
    }

    HttpResponse perform(const HttpRequest& request,
                         const ResponseHandler& on_response,
                         const BodyHandler& on_body) {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw DownloadError(ErrorKind::NetworkError, "Failed to allocate curl handle");
        }

        TransferContext ctx{curl.get(), &on_response, &on_body};
        char error_buffer[CURL_ERROR_SIZE] = {0};
        std::string range;

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(options_.buffer_size));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
        // Abort when the transfer stays below 1 byte/s for stall_timeout.
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout.count()));
        if (!options_.user_agent.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        }
        if (request.head_only) {
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        }
        if (request.range) {
            range = fmt::format("{}-{}", request.range->start, request.range->end - 1);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }

        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());

        if (ctx.failure) {
            std::rethrow_exception(ctx.failure);
        }
        if (ctx.response.aborted) {
            return std::move(ctx.response);
        }
        if (res != CURLE_OK) {
            const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
            throw DownloadError(ErrorKind::NetworkError, fmt::format("curl error: {}", detail));
        }

        if (!ctx.notified) {
            notifyResponse(ctx);
            if (ctx.failure) {
                std::rethrow_exception(ctx.failure);
            }
        }
        return std::move(ctx.response);
    }

private:
    struct TransferContext {
        CURL* handle{nullptr};
        const ResponseHandler* on_response{nullptr};
        const BodyHandler* on_body{nullptr};
        HttpResponse response;
        bool notified{false};
        std::exception_ptr failure;
    };

    static size_t headerCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        const size_t total = size * nmemb;
        const std::string line(ptr, total);

        // Each response in a redirect chain starts with a status line.
        if (line.rfind("HTTP/", 0) == 0) {
            ctx->response.headers.clear();
            return total;
        }

        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            ctx->response.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        const size_t total = size * nmemb;

        if (!ctx->notified) {
            if (!notifyResponse(*ctx)) {
                return 0;
            }
        }

        try {
            if (*ctx->on_body && !(*ctx->on_body)(ptr, total)) {
                ctx->response.aborted = true;
                return 0;
            }
        } catch (...) {
            ctx->failure = std::current_exception();
            return 0;
        }
        return total;
    }

    static bool notifyResponse(TransferContext& ctx) {
        ctx.notified = true;
        curl_easy_getinfo(ctx.handle, CURLINFO_RESPONSE_CODE, &ctx.response.status);
        try {
            if (*ctx.on_response && !(*ctx.on_response)(ctx.response)) {
                ctx.response.aborted = true;
                return false;
            }
        } catch (...) {
            ctx.failure = std::current_exception();
            return false;
        }
        return true;
    }

    CurlOptions options_;
};

CurlHttpClient::CurlHttpClient(CurlOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::perform(const HttpRequest& request,
                                     const ResponseHandler& on_response,
                                     const BodyHandler& on_body) {
    return impl_->perform(request, on_response, on_body);
}

} // namespace fetchy
