#include "download_task.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace
{

class DownloadTaskTest : public ::testing::Test
{
protected:
    DownloadConfig config(const std::vector<std::string> &paths, const std::filesystem::path &destination)
    {
        DownloadConfig cfg;
        for (const auto &path : paths)
        {
            cfg.sources.push_back(server_.url(path));
        }
        cfg.destination = destination.string();
        cfg.quiet = true;
        cfg.retryBackoffBaseMs = 1;
        cfg.retryBackoffMaxMs = 5;
        return cfg;
    }

    TempDir dir_;
    TestHttpServer server_;
    CancellationToken token_;
};

} // namespace

TEST_F(DownloadTaskTest, DownloadsEndToEnd)
{
    server_.addFile("/one.txt", "1");
    server_.addFile("/two.txt", "22");

    InvocationResult result = runDownload(config({"/one.txt", "/two.txt"}, dir_ / "out"), token_);

    ASSERT_TRUE(result.succeeded()) << result.describeFailures();
    EXPECT_EQ(readFile(dir_ / "out" / "one.txt"), "1");
    EXPECT_EQ(readFile(dir_ / "out" / "two.txt"), "22");
}

TEST_F(DownloadTaskTest, VerifiesChecksumOfSingleFile)
{
    server_.addFile("/hello.txt", "hello world");

    DownloadConfig cfg = config({"/hello.txt"}, dir_ / "hello.txt");
    cfg.expectedChecksum = "sha256:b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9";

    InvocationResult result = runDownload(cfg, token_);
    ASSERT_TRUE(result.succeeded()) << result.describeFailures();
    EXPECT_EQ(readFile(dir_ / "hello.txt"), "hello world");
}

TEST_F(DownloadTaskTest, InvalidConfigurationFailsBeforeAnyRequest)
{
    server_.addFile("/a.txt", "a");

    auto expectRejected = [this](DownloadConfig cfg)
    {
        EXPECT_THROW(runDownload(cfg, token_), ConfigurationError);
    };

    DownloadConfig noRetries = config({"/a.txt"}, dir_ / "a.txt");
    noRetries.maxRetries = 0;
    expectRejected(noRetries);

    DownloadConfig noWorkers = config({"/a.txt"}, dir_ / "a.txt");
    noWorkers.maxParallel = 0;
    expectRejected(noWorkers);

    DownloadConfig badBackoff = config({"/a.txt"}, dir_ / "a.txt");
    badBackoff.retryBackoffBaseMs = 100;
    badBackoff.retryBackoffMaxMs = 10;
    expectRejected(badBackoff);

    DownloadConfig badHeader = config({"/a.txt"}, dir_ / "a.txt");
    badHeader.headers = {"no colon here"};
    expectRejected(badHeader);

    DownloadConfig badChecksum = config({"/a.txt"}, dir_ / "a.txt");
    badChecksum.expectedChecksum = "sha512:abcd";
    expectRejected(badChecksum);

    DownloadConfig checksumForMany = config({"/a.txt", "/b.txt"}, dir_ / "many");
    checksumForMany.expectedChecksum = "md5:5eb63bbbe01eeed093cb22bb8f5acdc3";
    expectRejected(checksumForMany);

    DownloadConfig noSources = config({}, dir_ / "a.txt");
    expectRejected(noSources);

    DownloadConfig noDestination = config({"/a.txt"}, "");
    expectRejected(noDestination);

    DownloadConfig wrongScheme = config({"/a.txt"}, dir_ / "a.txt");
    wrongScheme.sources = {"ftp://127.0.0.1/a.txt"};
    expectRejected(wrongScheme);

    writeFile(dir_ / "plain.txt", "x");
    DownloadConfig manyIntoFile = config({"/a.txt", "/b.txt"}, dir_ / "plain.txt");
    expectRejected(manyIntoFile);

    EXPECT_EQ(server_.requestCount("/a.txt"), 0);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "a.txt"));
}

TEST_F(DownloadTaskTest, RequestOptionsCarryConfiguration)
{
    DownloadConfig cfg = config({"/a.txt"}, dir_ / "a.txt");
    cfg.headers = {"Accept: text/plain"};
    cfg.username = "alice";
    cfg.password = "secret";
    cfg.proxy = "http://proxy.local:3128";
    cfg.connectTimeoutMs = 1234;
    cfg.readTimeoutMs = 5678;
    cfg.maxRedirects = 2;
    cfg.compress = false;
    cfg.acceptAnyCertificate = true;

    RequestOptions options = makeRequestOptions(cfg);
    EXPECT_EQ(options.headers, cfg.headers);
    EXPECT_EQ(options.username, "alice");
    EXPECT_EQ(options.password, "secret");
    EXPECT_EQ(options.proxy, "http://proxy.local:3128");
    EXPECT_EQ(options.connectTimeoutMs, 1234);
    EXPECT_EQ(options.readTimeoutMs, 5678);
    EXPECT_EQ(options.maxRedirects, 2);
    EXPECT_FALSE(options.compress);
    EXPECT_TRUE(options.acceptAnyCertificate);

    cfg.overwrite = false;
    cfg.onlyIfModified = true;
    cfg.maxRetries = 7;
    cfg.maxParallel = 2;
    ExecutorOptions executorOptions = makeExecutorOptions(cfg);
    EXPECT_FALSE(executorOptions.freshness.overwrite);
    EXPECT_TRUE(executorOptions.freshness.onlyIfModified);
    EXPECT_EQ(executorOptions.maxRetries, 7);
    EXPECT_EQ(executorOptions.maxParallel, 2);
    EXPECT_EQ(executorOptions.backoffBase.count(), 1);
    EXPECT_TRUE(executorOptions.quiet);
}

TEST_F(DownloadTaskTest, ExpiredTimeoutCancelsRemainingWork)
{
    server_.addFile("/slow.bin", std::string(32 * 1024, 's'));
    server_.setSlowBody("/slow.bin", 32, std::chrono::milliseconds(100));

    DownloadConfig cfg = config({"/slow.bin"}, dir_ / "slow.bin");
    cfg.timeoutSeconds = 1;

    InvocationResult result = runDownload(cfg, token_);

    ASSERT_FALSE(result.succeeded());
    EXPECT_EQ(result.units[0].kind, ErrorKind::Cancelled);
    EXPECT_FALSE(std::filesystem::exists(dir_ / "slow.bin"));
    EXPECT_TRUE(listFiles(dir_.path()).empty());
}
