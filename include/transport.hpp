#pragma once

#include "attempt_result.hpp"

#include <ctime>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class CancellationToken;
class ProgressReporter;

/**
 * Per-request settings shared by every request of one invocation.
 */
struct RequestOptions
{
    std::vector<std::string> headers; // "Name: value"

    // Basic authentication (sent preemptively when username is set)
    std::string username;
    std::string password;

    std::string proxy; // e.g. "http://proxy.local:3128"
    std::string proxyUser;
    std::string proxyPassword;

    long connectTimeoutMs = 30000;
    long readTimeoutMs = 30000;
    long maxRedirects = 10;

    bool compress = true;
    bool acceptAnyCertificate = false;
};

/**
 * Validators sent with a conditional probe.
 */
struct ProbeConditions
{
    std::optional<std::time_t> ifModifiedSince;
    std::optional<std::string> ifNoneMatch;
};

enum class ProbeStatus
{
    NotModified, // Server answered 304
    Modified,    // Server answered 2xx
    Failed       // No usable answer
};

struct ProbeResult
{
    ProbeStatus status = ProbeStatus::Failed;
    long httpStatus = 0;
    std::string cause;
};

/**
 * Moves bytes from a URL into a local staging file.
 *
 * Implementations are used by one thread at a time; the executor
 * creates one instance per worker through a TransportFactory.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    /**
     * Download `url` into `stagingPath`, truncating any previous content.
     * Never touches anything but the staging file.
     */
    virtual AttemptResult fetch(const std::string &url,
                                const std::filesystem::path &stagingPath,
                                const RequestOptions &options,
                                const CancellationToken &cancellation) = 0;

    /**
     * Lightweight conditional request (no body) used for freshness checks.
     */
    virtual ProbeResult probe(const std::string &url,
                              const ProbeConditions &conditions,
                              const RequestOptions &options,
                              const CancellationToken &cancellation) = 0;
};

/**
 * Creates one Transport per worker. `progress` may be null.
 */
using TransportFactory = std::function<std::unique_ptr<Transport>(ProgressReporter *progress)>;
