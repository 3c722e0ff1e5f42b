#pragma once

#include <string>

namespace fetchy::detail {

// curl_global_init once per process, cleaned up at exit.
void ensureCurlInitialized();

// "libcurl <version> (<tls backend>)" for diagnostics.
[[nodiscard]] std::string curlVersion();

} // namespace fetchy::detail
