#include "fetchy/detail/curl_utils.hpp"

#include "fetchy/error.hpp"
#include "fetchy/logging.hpp"

#include <cstdlib>
#include <mutex>

#include <curl/curl.h>
#include <fmt/format.h>

namespace fetchy::detail {

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw DownloadError(ErrorKind::NetworkError,
                                fmt::format("curl_global_init failed: {}", curl_easy_strerror(code)));
        }
        std::atexit(&curl_global_cleanup);

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (info && (info->features & CURL_VERSION_ASYNCHDNS) == 0) {
            // With CURLOPT_NOSIGNAL a blocking resolver ignores the connect timeout.
            FETCHY_WARN("libcurl {} has no asynchronous resolver; DNS lookups may outlast connect_timeout",
                        info->version);
        }
    });
}

std::string curlVersion() {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if (!info) {
        return "libcurl (unknown version)";
    }
    return fmt::format("libcurl {} ({})", info->version, info->ssl_version ? info->ssl_version : "no TLS");
}

} // namespace fetchy::detail
