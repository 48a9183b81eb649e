#include "cancellation.hpp"
#include "http_client.hpp"
#include "test_support.hpp"

#include <memory>
#include <thread>

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace
{

class HttpClientTest : public ::testing::Test
{
protected:
    HttpClientTest()
    {
        options_.connectTimeoutMs = 5000;
        options_.readTimeoutMs = 5000;
    }

    AttemptResult fetch(const std::string &path)
    {
        return client_.fetch(server_.url(path), staging(), options_, token_);
    }

    std::filesystem::path staging() const { return dir_ / "download.part"; }

    TempDir dir_;
    TestHttpServer server_;
    HttpClient client_;
    RequestOptions options_;
    CancellationToken token_;
};

} // namespace

TEST_F(HttpClientTest, StreamsBodyIntoStagingFile)
{
    std::string body(200 * 1024, 'x');
    server_.addFile("/data.bin", body);
    server_.setEtag("/data.bin", "\"v1\"");
    server_.setLastModified("/data.bin", 784111777);

    AttemptResult result = fetch("/data.bin");

    ASSERT_TRUE(result.ok()) << result.cause;
    EXPECT_EQ(result.httpStatus, 200);
    EXPECT_EQ(result.bytes, static_cast<std::int64_t>(body.size()));
    EXPECT_EQ(readFile(staging()), body);
    EXPECT_EQ(result.etag.value_or(""), "\"v1\"");
    ASSERT_TRUE(result.lastModified.has_value());
    EXPECT_EQ(*result.lastModified, 784111777);
}

TEST_F(HttpClientTest, TruncatesLeftoversOfEarlierAttempts)
{
    writeFile(staging(), std::string(1000, 'z'));
    server_.addFile("/small.txt", "hello");

    ASSERT_TRUE(fetch("/small.txt").ok());
    EXPECT_EQ(readFile(staging()), "hello");
}

TEST_F(HttpClientTest, NotFoundIsFatal)
{
    AttemptResult result = fetch("/missing.txt");

    EXPECT_EQ(result.status, AttemptStatus::FatalFailure);
    EXPECT_EQ(result.kind, ErrorKind::Network);
    EXPECT_EQ(result.httpStatus, 404);
    EXPECT_EQ(result.cause, "HTTP 404: Not Found");
}

TEST_F(HttpClientTest, ServerErrorsAndThrottlingAreRetryable)
{
    server_.addFile("/flaky.txt", "ok");
    server_.failWith("/flaky.txt", {503, 429, 408});

    for (long expected : {503L, 429L, 408L})
    {
        AttemptResult result = fetch("/flaky.txt");
        EXPECT_EQ(result.status, AttemptStatus::RetryableFailure);
        EXPECT_EQ(result.httpStatus, expected);
    }

    EXPECT_TRUE(fetch("/flaky.txt").ok());
}

TEST_F(HttpClientTest, TruncatedBodyIsRetryable)
{
    server_.addFile("/cut.bin", std::string(10000, 'c'));
    server_.truncateBody("/cut.bin", 1);

    AttemptResult result = fetch("/cut.bin");
    EXPECT_EQ(result.status, AttemptStatus::RetryableFailure);
    EXPECT_EQ(result.kind, ErrorKind::Network);
}

TEST_F(HttpClientTest, ConnectionRefusedIsRetryable)
{
    std::string url;
    {
        TestHttpServer gone;
        url = gone.url("/file.txt");
    }

    AttemptResult result = client_.fetch(url, staging(), options_, token_);
    EXPECT_EQ(result.status, AttemptStatus::RetryableFailure);
    EXPECT_EQ(result.kind, ErrorKind::Network);
}

TEST_F(HttpClientTest, FollowsRedirects)
{
    server_.addFile("/real.txt", "payload");
    server_.redirect("/alias.txt", "/real.txt");

    AttemptResult result = fetch("/alias.txt");
    ASSERT_TRUE(result.ok()) << result.cause;
    EXPECT_EQ(readFile(staging()), "payload");
    EXPECT_EQ(server_.getCount("/real.txt"), 1);
}

TEST_F(HttpClientTest, RedirectLoopIsFatal)
{
    server_.redirect("/a", "/b");
    server_.redirect("/b", "/a");
    options_.maxRedirects = 3;

    AttemptResult result = fetch("/a");
    EXPECT_EQ(result.status, AttemptStatus::FatalFailure);
}

TEST_F(HttpClientTest, UnsupportedSchemeIsFatalConfigurationError)
{
    AttemptResult result = client_.fetch("ftp://127.0.0.1/file.txt", staging(), options_, token_);

    EXPECT_EQ(result.status, AttemptStatus::FatalFailure);
    EXPECT_EQ(result.kind, ErrorKind::Configuration);
    EXPECT_FALSE(std::filesystem::exists(staging()));
}

TEST_F(HttpClientTest, SendsCustomHeadersAndBasicAuth)
{
    server_.addFile("/private.txt", "secret stuff");
    server_.requireAuthorization("Basic YWxpY2U6c2VjcmV0");

    options_.headers = {"X-Build-Id: 42"};
    AttemptResult denied = fetch("/private.txt");
    EXPECT_EQ(denied.status, AttemptStatus::FatalFailure);
    EXPECT_EQ(denied.httpStatus, 401);

    options_.username = "alice";
    options_.password = "secret";
    AttemptResult result = fetch("/private.txt");

    ASSERT_TRUE(result.ok()) << result.cause;
    EXPECT_EQ(readFile(staging()), "secret stuff");
    EXPECT_EQ(server_.lastHeader("/private.txt", "x-build-id").value_or(""), "42");
}

TEST_F(HttpClientTest, ToleratesNonAsciiHeaderNames)
{
    server_.addFile("/odd.txt", "body");
    server_.setEtag("/odd.txt", "\"v7\"");
    server_.addRawHeader("/odd.txt", "X-\xC3\x9Cml\xE4ut: \xFF");

    AttemptResult result = fetch("/odd.txt");

    ASSERT_TRUE(result.ok()) << result.cause;
    EXPECT_EQ(readFile(staging()), "body");
    EXPECT_EQ(result.etag.value_or(""), "\"v7\"");
}

TEST_F(HttpClientTest, ProbeHonorsConditionalHeaders)
{
    server_.addFile("/doc.txt", "v1");
    server_.setEtag("/doc.txt", "\"v1\"");
    server_.setLastModified("/doc.txt", 784111777);

    ProbeConditions sameEtag;
    sameEtag.ifNoneMatch = "\"v1\"";
    ProbeResult notModified = client_.probe(server_.url("/doc.txt"), sameEtag, options_, token_);
    EXPECT_EQ(notModified.status, ProbeStatus::NotModified);
    EXPECT_EQ(notModified.httpStatus, 304);

    ProbeConditions oldEtag;
    oldEtag.ifNoneMatch = "\"v0\"";
    EXPECT_EQ(client_.probe(server_.url("/doc.txt"), oldEtag, options_, token_).status,
              ProbeStatus::Modified);

    ProbeConditions sameTime;
    sameTime.ifModifiedSince = 784111777;
    EXPECT_EQ(client_.probe(server_.url("/doc.txt"), sameTime, options_, token_).status,
              ProbeStatus::NotModified);
    EXPECT_EQ(server_.lastHeader("/doc.txt", "if-modified-since").value_or(""),
              "Sun, 06 Nov 1994 08:49:37 GMT");

    ProbeConditions olderTime;
    olderTime.ifModifiedSince = 784111777 - 3600;
    EXPECT_EQ(client_.probe(server_.url("/doc.txt"), olderTime, options_, token_).status,
              ProbeStatus::Modified);

    // Probes never transfer the body
    EXPECT_EQ(server_.getCount("/doc.txt"), 0);
}

TEST_F(HttpClientTest, ProbeReportsErrors)
{
    ProbeResult result = client_.probe(server_.url("/nothing"), ProbeConditions{}, options_, token_);
    EXPECT_EQ(result.status, ProbeStatus::Failed);
    EXPECT_EQ(result.httpStatus, 404);
    EXPECT_FALSE(result.cause.empty());
}

TEST_F(HttpClientTest, CancelAbortsRunningTransfer)
{
    server_.addFile("/slow.bin", std::string(64 * 1024, 's'));
    server_.setSlowBody("/slow.bin", 64, 100ms);

    std::thread canceller([this]()
                          {
        std::this_thread::sleep_for(300ms);
        token_.cancel(); });

    auto start = std::chrono::steady_clock::now();
    AttemptResult result = fetch("/slow.bin");
    canceller.join();

    EXPECT_EQ(result.status, AttemptStatus::FatalFailure);
    EXPECT_EQ(result.kind, ErrorKind::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(HttpClientStaticTest, ClassifiesErrors)
{
    EXPECT_EQ(HttpClient::classifyError(CURLE_OPERATION_TIMEDOUT, 0), AttemptStatus::RetryableFailure);
    EXPECT_EQ(HttpClient::classifyError(CURLE_COULDNT_CONNECT, 0), AttemptStatus::RetryableFailure);
    EXPECT_EQ(HttpClient::classifyError(CURLE_OK, 500), AttemptStatus::RetryableFailure);
    EXPECT_EQ(HttpClient::classifyError(CURLE_OK, 429), AttemptStatus::RetryableFailure);

    EXPECT_EQ(HttpClient::classifyError(CURLE_OK, 404), AttemptStatus::FatalFailure);
    EXPECT_EQ(HttpClient::classifyError(CURLE_OK, 403), AttemptStatus::FatalFailure);
    EXPECT_EQ(HttpClient::classifyError(CURLE_UNSUPPORTED_PROTOCOL, 0), AttemptStatus::FatalFailure);
    EXPECT_EQ(HttpClient::classifyError(CURLE_PEER_FAILED_VERIFICATION, 0), AttemptStatus::FatalFailure);
    EXPECT_EQ(HttpClient::classifyError(CURLE_TOO_MANY_REDIRECTS, 0), AttemptStatus::FatalFailure);
}

TEST(HttpClientStaticTest, FormatsHttpDates)
{
    EXPECT_EQ(HttpClient::formatHttpDate(784111777), "Sun, 06 Nov 1994 08:49:37 GMT");
    EXPECT_EQ(HttpClient::formatHttpDate(0), "Thu, 01 Jan 1970 00:00:00 GMT");
}
