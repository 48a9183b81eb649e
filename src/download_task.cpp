#include "download_task.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "mapping_resolver.hpp"

#include <chrono>
#include <exception>
#include <memory>

#include <fmt/core.h>

namespace
{

void validateConfig(const DownloadConfig &config)
{
    if (config.maxRetries < 1)
    {
        throw ConfigurationError(fmt::format("maxRetries must be at least 1, got {}", config.maxRetries));
    }

    if (config.maxParallel < 1)
    {
        throw ConfigurationError(fmt::format("maxParallel must be at least 1, got {}", config.maxParallel));
    }

    if (config.retryBackoffBaseMs < 0 || config.retryBackoffMaxMs < config.retryBackoffBaseMs)
    {
        throw ConfigurationError(fmt::format("Invalid retry backoff: base {} ms, max {} ms",
                                             config.retryBackoffBaseMs, config.retryBackoffMaxMs));
    }

    if (config.connectTimeoutMs < 0 || config.readTimeoutMs < 0 || config.timeoutSeconds < 0)
    {
        throw ConfigurationError("Timeouts must not be negative");
    }

    if (config.maxRedirects < 0)
    {
        throw ConfigurationError("maxRedirects must not be negative");
    }

    for (const auto &header : config.headers)
    {
        auto colonPos = header.find(':');
        if (colonPos == std::string::npos || colonPos == 0)
        {
            throw ConfigurationError(fmt::format("Invalid header '{}', expected 'Name: value'", header));
        }
    }

    if (config.expectedChecksum)
    {
        try
        {
            ChecksumVerifier::parseChecksum(*config.expectedChecksum);
        }
        catch (const std::exception &e)
        {
            throw ConfigurationError(fmt::format("Invalid checksum: {}", e.what()));
        }
    }
}

} // namespace

RequestOptions makeRequestOptions(const DownloadConfig &config)
{
    RequestOptions options;
    options.headers = config.headers;
    options.username = config.username;
    options.password = config.password;
    options.proxy = config.proxy;
    options.proxyUser = config.proxyUser;
    options.proxyPassword = config.proxyPassword;
    options.connectTimeoutMs = config.connectTimeoutMs;
    options.readTimeoutMs = config.readTimeoutMs;
    options.maxRedirects = config.maxRedirects;
    options.compress = config.compress;
    options.acceptAnyCertificate = config.acceptAnyCertificate;
    return options;
}

ExecutorOptions makeExecutorOptions(const DownloadConfig &config)
{
    ExecutorOptions options;
    options.freshness.overwrite = config.overwrite;
    options.freshness.onlyIfModified = config.onlyIfModified;
    options.request = makeRequestOptions(config);
    options.maxRetries = config.maxRetries;
    options.backoffBase = std::chrono::milliseconds(config.retryBackoffBaseMs);
    options.backoffMax = std::chrono::milliseconds(config.retryBackoffMaxMs);
    options.maxParallel = config.maxParallel;
    options.expectedChecksum = config.expectedChecksum;
    options.quiet = config.quiet;
    return options;
}

TransportFactory httpTransportFactory()
{
    return [](ProgressReporter *progress) -> std::unique_ptr<Transport>
    {
        return std::make_unique<HttpClient>(progress);
    };
}

InvocationResult runDownload(const DownloadConfig &config,
                             CancellationToken &cancellation,
                             const TransportFactory &transportFactory)
{
    validateConfig(config);

    DestinationSpec destination;
    destination.path = config.destination;
    destination.isDirectory = config.destinationIsDirectory;

    std::vector<TransferUnit> units = MappingResolver::resolve(config.sources, destination);

    // One expected checksum can't describe several different files
    if (config.expectedChecksum && units.size() > 1)
    {
        throw ConfigurationError("A checksum can only be verified when downloading a single file");
    }

    if (config.timeoutSeconds > 0)
    {
        cancellation.setDeadline(std::chrono::steady_clock::now() +
                                 std::chrono::seconds(config.timeoutSeconds));
    }

    TransferExecutor executor(makeExecutorOptions(config), transportFactory, cancellation);
    return executor.run(units);
}
