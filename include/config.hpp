#pragma once

#include <string>
#include <vector>
#include <optional> // C++17 feature for optional values

/**
 * Configuration for one download invocation.
 * Populated by CLI11 argument parser from command-line arguments,
 * or built directly by any caller of runDownload().
 */
struct DownloadConfig
{
    // Required parameters
    std::vector<std::string> sources;
    std::string destination;

    // Treat destination as a directory even if it doesn't exist yet
    bool destinationIsDirectory = false;

    // Freshness policy
    bool overwrite = true;       // Always fetch, never look at the existing file
    bool onlyIfModified = false; // Conditional probe before fetching

    bool quiet = false;

    // Retry policy
    int maxRetries = 3; // Total attempts per file, not additional ones
    int retryBackoffBaseMs = 500;
    int retryBackoffMaxMs = 30000;

    // Timeouts
    int connectTimeoutMs = 30000;
    int readTimeoutMs = 30000; // Abort when no data arrives for this long
    int timeoutSeconds = 0;    // Whole invocation, 0 = no deadline

    // Proxy settings
    std::string proxy;
    std::string proxyUser;
    std::string proxyPassword;

    // Request customization
    std::vector<std::string> headers; // "Name: value"
    std::string username;
    std::string password;
    bool compress = true;
    bool acceptAnyCertificate = false;
    int maxRedirects = 10;

    // Number of files downloaded at the same time
    int maxParallel = 4;

    // Checksum verification (optional)
    std::optional<std::string> expectedChecksum; // Format: "sha256:abc123..."

    // Flags
    bool showVersion = false; // Display version and exit
};
