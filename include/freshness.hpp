#pragma once

#include "mapping_resolver.hpp"
#include "transport.hpp"

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

class CancellationToken;

enum class FreshnessDecision
{
    Stale,   // Download needed
    UpToDate // Keep the existing destination, no request for the body
};

struct FreshnessPolicy
{
    bool overwrite = true;
    bool onlyIfModified = false;
};

/**
 * Decides before any body transfer whether a destination needs refreshing.
 *
 * With onlyIfModified the server is asked with a conditional HEAD request
 * built from the destination's modification time and its cached ETag.
 * Any doubt (probe failure, unexpected answer) means Stale.
 */
class FreshnessEvaluator
{
public:
    FreshnessEvaluator(FreshnessPolicy policy, RequestOptions options, bool quiet = false);

    FreshnessDecision evaluate(const TransferUnit &unit,
                               Transport &transport,
                               const CancellationToken &cancellation) const;

    /**
     * Sidecar file holding the ETag of a destination: "<destination>.etag"
     */
    static std::filesystem::path etagPath(const std::filesystem::path &destination);

    static std::optional<std::string> readCachedEtag(const std::filesystem::path &destination);

    /**
     * Remember the ETag of a freshly promoted destination.
     * An empty optional removes a stale sidecar.
     *
     * @return false if the sidecar couldn't be written or removed
     */
    static bool storeEtag(const std::filesystem::path &destination,
                          const std::optional<std::string> &etag);

    /**
     * Modification time of a file in seconds since the epoch.
     */
    static std::optional<std::time_t> modificationTime(const std::filesystem::path &path);

    /**
     * Set a file's modification time (access time follows along).
     * @return false on failure
     */
    static bool setModificationTime(const std::filesystem::path &path, std::time_t time);

private:
    FreshnessPolicy policy_;
    RequestOptions options_;
    bool quiet_;
};
