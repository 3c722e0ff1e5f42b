#include "fetchy/http_client.hpp"

#include "fetchy/detail/curl_utils.hpp"
#include "fetchy/error.hpp"
#include "fetchy/orchestrator.hpp"
#include "fetchy/prober.hpp"
#include "support/fake_http_client.hpp"
#include "support/local_http_server.hpp"
#include "support/test_env.hpp"

#include <gtest/gtest.h>

namespace fetchy {
namespace {

using test::LocalHttpServer;

CurlOptions testOptions() {
    CurlOptions options;
    options.user_agent = "fetchy-test";
    options.connect_timeout = std::chrono::seconds(2);
    options.stall_timeout = std::chrono::seconds(5);
    return options;
}

TEST(CurlHttpClientTest, ReportsLibraryVersion) {
    detail::ensureCurlInitialized();
    EXPECT_EQ(detail::curlVersion().rfind("libcurl ", 0), 0u);
}

TEST(CurlHttpClientTest, HeadReturnsHeadersWithoutBody) {
    LocalHttpServer server({test::makePayload(3000), std::string{"\"tag\""}});
    CurlHttpClient http(testOptions());

    HttpRequest request;
    request.url = server.url();
    request.head_only = true;
    std::size_t body_bytes = 0;
    const auto response = http.perform(request, {}, [&](const char*, std::size_t size) {
        body_bytes += size;
        return true;
    });

    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.header("Content-Length"), "3000");
    EXPECT_EQ(response.header("etag"), "\"tag\"");
    EXPECT_EQ(response.header("accept-ranges"), "bytes");
    EXPECT_EQ(body_bytes, 0u);
}

TEST(CurlHttpClientTest, RangedGetDeliversRequestedBytes) {
    const std::string payload = test::makePayload(10000);
    LocalHttpServer server({payload});
    CurlHttpClient http(testOptions());

    HttpRequest request;
    request.url = server.url();
    request.range = ByteRange{1000, 3000};
    long seen_status = 0;
    std::string body;
    const auto response = http.perform(
        request,
        [&](const HttpResponse& r) {
            seen_status = r.status;
            return true;
        },
        [&](const char* data, std::size_t size) {
            body.append(data, size);
            return true;
        });

    EXPECT_EQ(response.status, 206);
    EXPECT_EQ(seen_status, 206);
    EXPECT_EQ(response.header("content-range"), "bytes 1000-2999/10000");
    EXPECT_EQ(body, payload.substr(1000, 2000));
    EXPECT_EQ(server.rangedRequests(), 1u);
}

TEST(CurlHttpClientTest, ResponseHandlerCanStopTransfer) {
    LocalHttpServer server({test::makePayload(200000)});
    CurlHttpClient http(testOptions());

    HttpRequest request;
    request.url = server.url();
    std::size_t body_bytes = 0;
    const auto response = http.perform(
        request, [](const HttpResponse&) { return false; },
        [&](const char*, std::size_t size) {
            body_bytes += size;
            return true;
        });

    EXPECT_TRUE(response.aborted);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(body_bytes, 0u);
}

TEST(CurlHttpClientTest, HandlerExceptionPropagates) {
    LocalHttpServer server({test::makePayload(1000)});
    CurlHttpClient http(testOptions());

    HttpRequest request;
    request.url = server.url();
    EXPECT_THROW(http.perform(request, {},
                              [](const char*, std::size_t) -> bool {
                                  throw DownloadError(ErrorKind::DiskError, "disk full");
                              }),
                 DownloadError);
}

TEST(CurlHttpClientTest, RefusedConnectionIsNetworkError) {
    std::string url;
    {
        LocalHttpServer server({"gone"});
        url = server.url();
    }
    CurlHttpClient http(testOptions());

    HttpRequest request;
    request.url = url;
    try {
        (void)http.perform(request, {}, {});
        FAIL() << "request to a closed port succeeded";
    } catch (const DownloadError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::NetworkError);
        EXPECT_TRUE(ex.retryable());
    }
}

TEST(CurlHttpClientTest, ProbesLocalServer) {
    LocalHttpServer server({test::makePayload(4321), std::string{"\"p\""}, true,
                            "attachment; filename=\"served.bin\""});
    CurlHttpClient http(testOptions());

    const auto probe = Prober(http, RetryPolicy{}).probe(server.url("/ignored/name.bin"));

    EXPECT_EQ(probe.total_size, 4321u);
    EXPECT_TRUE(probe.accepts_ranges);
    EXPECT_EQ(probe.suggested_filename, "served.bin");
}

TEST(CurlHttpClientTest, DownloadsFromLocalServerInChunks) {
    const std::string payload = test::makePayload(300000);
    LocalHttpServer server({payload, std::string{"\"d\""}});
    CurlHttpClient http(testOptions());
    test::TempDir dir;
    ResumeStore resume_store(dir / "resume");
    ConnectionLimiter limiter;
    const auto destination = (dir / "download.bin").string();

    Orchestrator orchestrator(makeTask(server.url(), destination, 4),
                              EngineContext{http, resume_store, limiter, test::fastConfig(dir.path())});

    EXPECT_EQ(orchestrator.start(), TaskStatus::Completed);
    EXPECT_EQ(test::readFile(destination), payload);
    EXPECT_EQ(server.rangedRequests(), 4u);
}

TEST(CurlHttpClientTest, DownloadsWithoutRangeSupport) {
    const std::string payload = test::makePayload(50000);
    LocalHttpServer server({payload, std::nullopt, false});
    CurlHttpClient http(testOptions());
    test::TempDir dir;
    ResumeStore resume_store(dir / "resume");
    ConnectionLimiter limiter;
    const auto destination = (dir / "plain.bin").string();

    Orchestrator orchestrator(makeTask(server.url(), destination, 4),
                              EngineContext{http, resume_store, limiter, test::fastConfig(dir.path())});

    EXPECT_EQ(orchestrator.start(), TaskStatus::Completed);
    EXPECT_EQ(test::readFile(destination), payload);
    EXPECT_EQ(orchestrator.snapshot().thread_count, 1);
}

} // namespace
} // namespace fetchy
