#pragma once

#include "transport.hpp"

#include <array>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <curl/curl.h>

/**
 * HTTP client for downloading files using libcurl.
 * Uses RAII to manage CURL handle lifecycle.
 * One instance owns one easy handle and must not be shared between threads.
 */
class HttpClient : public Transport
{
public:
    /**
     * @param progress Optional aggregate progress sink fed from the write callback
     * @throws std::runtime_error if libcurl cannot create a handle
     */
    explicit HttpClient(ProgressReporter *progress = nullptr);
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    // Move operations (allow transferring ownership)
    HttpClient(HttpClient &&) noexcept = default;
    HttpClient &operator=(HttpClient &&) noexcept = default;

    AttemptResult fetch(const std::string &url,
                        const std::filesystem::path &stagingPath,
                        const RequestOptions &options,
                        const CancellationToken &cancellation) override;

    ProbeResult probe(const std::string &url,
                      const ProbeConditions &conditions,
                      const RequestOptions &options,
                      const CancellationToken &cancellation) override;

    /**
     * Initialize libcurl once per process.
     * curl_global_init() is not thread-safe, so this runs before any worker starts.
     */
    static void globalInit();

    /**
     * Classify a failed transfer.
     *
     * @param code CURL error code from the transfer
     * @param httpCode HTTP status code (0 if no HTTP response received)
     * @return RetryableFailure for transient problems, FatalFailure otherwise
     */
    static AttemptStatus classifyError(CURLcode code, long httpCode);

    /**
     * Format a timestamp as an HTTP date (RFC 7231 IMF-fixdate).
     * Example: 784111777 → "Sun, 06 Nov 1994 08:49:37 GMT"
     */
    static std::string formatHttpDate(std::time_t time);

private:
    using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    /**
     * State shared with the libcurl callbacks during one request.
     */
    struct TransferContext
    {
        std::ofstream *outFile = nullptr;
        std::int64_t bytes = 0;
        bool writeFailed = false;
        bool contentEncoded = false;
        std::optional<std::string> etag;
        const CancellationToken *cancellation = nullptr;
        ProgressReporter *progress = nullptr;
    };

    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    ProgressReporter *progress_ = nullptr;

    // libcurl writes its detailed error message here
    std::array<char, CURL_ERROR_SIZE> errorBuffer_{};

    static CURL *createHandle();

    /**
     * Reset the handle and apply URL, security, timeout, proxy and auth settings.
     *
     * @return Header list that must stay alive until the request completes
     */
    HeaderList prepareRequest(const std::string &url,
                              const RequestOptions &options,
                              const std::vector<std::string> &extraHeaders);

    /**
     * Build a readable message for a failed transfer.
     */
    std::string describeError(CURLcode code, long httpCode) const;

    /**
     * Static callback: libcurl calls this with chunks of downloaded data.
     * @return Number of bytes written (size * nmemb on success)
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Static callback: libcurl calls this once per response header line.
     * Captures ETag and Content-Encoding of the final response.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * Static progress callback for libcurl, used to abort on cancellation.
     * @return 0 to continue, non-zero to abort
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);
};
