#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <curl/curl.h>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include "checksum.hpp"
#include "config.hpp"
#include "download_task.hpp"
#include "errors.hpp"
#include "format_utils.hpp"

namespace
{

// Set from the signal handler, polled through the cancellation token
std::atomic<bool> g_interrupted{false};

extern "C" void onInterrupt(int)
{
    g_interrupted.store(true);
}

int runVerify(const std::string &file, const std::string &checksum)
{
    try
    {
        if (ChecksumVerifier::verify(file, checksum))
        {
            fmt::print("✓ Checksum verification passed: {}\n", file);
            return 0;
        }

        fmt::print(stderr, "✗ Checksum verification FAILED: {}\n", file);
        fmt::print(stderr, "  Expected: {}\n", checksum);
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Checksum verification error: {}\n", e.what());
        return 1;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("Download Task v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libcurl {}: HTTP/HTTPS support\n", curl_version_info(CURLVERSION_NOW)->version);
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            fmt::print("  - OpenSSL: Checksum verification\n");
            return 0;
        }
    }

    CLI::App app{"Download Task v1.0 - Fetch files over HTTP(S) only when needed"};
    app.require_subcommand(0, 1);

    DownloadConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    auto httpUrl = [](const std::string &url) -> std::string
    {
        if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0)
        {
            return ""; // Empty string = valid
        }
        return "URL must start with http:// or https://";
    };

    app.add_option("URL", config.sources, "One or more HTTP/HTTPS URLs to download")
        ->check(httpUrl);

    app.add_option("-o,--output", config.destination,
                   "Destination file, or directory when downloading several URLs");

    app.add_flag("-d,--directory", config.destinationIsDirectory,
                 "Treat the destination as a directory even if it doesn't exist");

    auto overwriteOption = app.add_flag("--overwrite,!--no-overwrite", config.overwrite,
                                        "Download even if the destination already exists (default)");

    app.add_flag("-m,--only-if-modified", config.onlyIfModified,
                 "Download only if the server has a newer version (implies --no-overwrite)");

    app.add_flag("-q,--quiet", config.quiet, "Don't print progress or status messages");

    app.add_option("-r,--retry-count,--max-retries", config.maxRetries,
                   "Maximum attempts per file for transient errors")
        ->check(CLI::Range(1, 20))
        ->default_val(3);

    app.add_option("--retry-backoff-ms", config.retryBackoffBaseMs,
                   "Delay before the first retry, doubled for each further one")
        ->check(CLI::NonNegativeNumber)
        ->default_val(500);

    app.add_option("--retry-backoff-max-ms", config.retryBackoffMaxMs,
                   "Upper bound for the delay between retries")
        ->check(CLI::NonNegativeNumber)
        ->default_val(30000);

    app.add_option("--connect-timeout-ms", config.connectTimeoutMs,
                   "Timeout for establishing a connection")
        ->check(CLI::PositiveNumber)
        ->default_val(30000);

    app.add_option("--read-timeout-ms", config.readTimeoutMs,
                   "Abort a transfer when no data arrives for this long")
        ->check(CLI::PositiveNumber)
        ->default_val(30000);

    app.add_option("-t,--timeout", config.timeoutSeconds,
                   "Overall timeout in seconds for all downloads (0 = none)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(0);

    app.add_option("--proxy", config.proxy, "Proxy URL, e.g. http://proxy:3128");
    app.add_option("--proxy-user", config.proxyUser, "Proxy user name");
    app.add_option("--proxy-password", config.proxyPassword, "Proxy password");

    app.add_option("-H,--header", config.headers, "Extra request header 'Name: value' (repeatable)")
        ->check([](const std::string &header) -> std::string
                {
            auto colonPos = header.find(':');
            if (colonPos == std::string::npos || colonPos == 0) {
                return "Header must look like 'Name: value'";
            }
            return ""; });

    app.add_option("-u,--username", config.username, "User name for basic authentication");
    app.add_option("-p,--password", config.password, "Password for basic authentication");

    bool noCompress = false;
    app.add_flag("--no-compress", noCompress, "Don't request compressed transfers");

    app.add_flag("-k,--insecure,--accept-any-certificate", config.acceptAnyCertificate,
                 "Accept any TLS certificate (insecure)");

    app.add_option("--max-redirects", config.maxRedirects, "Maximum number of redirects to follow")
        ->check(CLI::Range(0, 50))
        ->default_val(10);

    app.add_option("-j,--parallel", config.maxParallel, "Number of files downloaded at the same time")
        ->check(CLI::Range(1, 64))
        ->default_val(4);

    app.add_option("-c,--checksum", config.expectedChecksum,
                   "Expected checksum in format 'algorithm:hexhash' (e.g., sha256:abc123...)")
        ->check([](const std::string &cs) -> std::string
                {
            if (cs.empty()) return "";
            try {
                ChecksumVerifier::parseChecksum(cs);
                return ""; // Valid
            } catch (const std::exception &e) {
                return std::string("Invalid checksum format: ") + e.what();
            } });

    // Listed for --help; handled by the pre-scan above
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    // verify FILE CHECKSUM: standalone integrity check
    std::string verifyFile;
    std::string verifyChecksum;
    CLI::App *verify = app.add_subcommand("verify", "Verify the checksum of a local file");
    verify->add_option("FILE", verifyFile, "File to verify")
        ->required()
        ->check(CLI::ExistingFile);
    verify->add_option("CHECKSUM", verifyChecksum, "Expected checksum 'algorithm:hexhash'")
        ->required();

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    if (verify->parsed())
    {
        return runVerify(verifyFile, verifyChecksum);
    }

    if (config.sources.empty() || config.destination.empty())
    {
        fmt::print(stderr, "At least one URL and a destination (-o) are required.\n\n{}", app.help());
        return 1;
    }

    config.compress = !noCompress;

    // A conditional download makes no sense if we overwrite anyway
    if (config.onlyIfModified && overwriteOption->count() == 0)
    {
        config.overwrite = false;
    }

    // ====================================================================
    // DISPLAY CONFIGURATION
    // ====================================================================

    if (!config.quiet)
    {
        fmt::print("Download Task v1.0\n");
        fmt::print("====================================\n\n");

        fmt::print("Configuration:\n");
        for (const auto &source : config.sources)
        {
            fmt::print("  URL:         {}\n", source);
        }
        fmt::print("  Destination: {}\n", config.destination);
        fmt::print("  Overwrite:   {}\n", config.overwrite ? "yes" : "no");
        fmt::print("  Only if modified: {}\n", config.onlyIfModified ? "yes" : "no");
        fmt::print("  Max Retries: {}\n", config.maxRetries);
        fmt::print("  Parallel:    {}\n", config.maxParallel);
        if (config.timeoutSeconds > 0)
        {
            fmt::print("  Timeout:     {}s\n", config.timeoutSeconds);
        }
        if (config.expectedChecksum)
        {
            fmt::print("  Checksum:    {}\n", config.expectedChecksum.value());
        }
        fmt::print("\n");
    }

    // ====================================================================
    // PERFORM DOWNLOAD
    // ====================================================================

    CancellationToken cancellation;
    cancellation.watch(&g_interrupted);
    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);

    try
    {
        InvocationResult result = runDownload(config, cancellation);

        std::size_t skipped = 0;
        std::int64_t bytes = 0;
        for (const auto &unit : result.units)
        {
            if (unit.state == UnitState::Skipped)
            {
                ++skipped;
            }
            bytes += unit.bytes;
        }

        if (result.succeeded())
        {
            if (!config.quiet)
            {
                fmt::print("\n✓ {} file(s) processed, {} up to date, {} downloaded\n",
                           result.units.size(), skipped, formatBytes(bytes));
            }
            return 0;
        }

        // Always reported, even with --quiet
        auto failures = result.failures();
        fmt::print(stderr, "\n✗ {} of {} download(s) failed:\n{}",
                   failures.size(), result.units.size(), result.describeFailures());
        return 1;
    }
    catch (const ConfigurationError &e)
    {
        fmt::print(stderr, "✗ Configuration error: {}\n", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
