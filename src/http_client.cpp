#include "http_client.hpp"
#include "cancellation.hpp"
#include "format_utils.hpp"
#include "mapping_resolver.hpp"
#include "progress.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>

namespace
{

std::string trim(const std::string &text)
{
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

} // namespace

HttpClient::HttpClient(ProgressReporter *progress)
    : curl_(createHandle(), curl_easy_cleanup), progress_(progress)
{
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

CURL *HttpClient::createHandle()
{
    globalInit();
    return curl_easy_init();
}

void HttpClient::globalInit()
{
    static std::once_flag initialized;
    std::call_once(initialized, []()
    {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });
}

size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    // Calculate total bytes in this chunk
    size_t totalSize = size * nmemb;

    auto *context = static_cast<TransferContext *>(userdata);

    // Write chunk to the staging file
    context->outFile->write(ptr, static_cast<std::streamsize>(totalSize));
    if (!context->outFile->good())
    {
        context->writeFailed = true;
        return 0; // Abort transfer if write fails
    }

    context->bytes += static_cast<std::int64_t>(totalSize);
    if (context->progress != nullptr)
    {
        context->progress->addBytes(static_cast<std::int64_t>(totalSize));
    }

    // If we return 0 or a different value, libcurl aborts the transfer
    return totalSize;
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *context = static_cast<TransferContext *>(userdata);

    std::string line(buffer, totalSize);

    // A new status line starts the headers of the next response in a
    // redirect chain; only the final response counts
    if (line.rfind("HTTP/", 0) == 0)
    {
        context->etag.reset();
        context->contentEncoded = false;
        return totalSize;
    }

    auto colonPos = line.find(':');
    if (colonPos == std::string::npos)
    {
        return totalSize;
    }

    std::string name = trim(line.substr(0, colonPos));
    std::string value = trim(line.substr(colonPos + 1));
    // Header names are raw bytes from the server
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });

    if (name == "etag" && !value.empty())
    {
        context->etag = value;
    }
    else if (name == "content-encoding" && !value.empty() && value != "identity")
    {
        context->contentEncoded = true;
    }

    return totalSize;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    // Suppress unused parameter warnings
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *context = static_cast<TransferContext *>(clientp);

    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    if (context->cancellation != nullptr && context->cancellation->isCancelled())
    {
        return 1;
    }
    return 0;
}

HttpClient::HeaderList HttpClient::prepareRequest(const std::string &url,
                                                  const RequestOptions &options,
                                                  const std::vector<std::string> &extraHeaders)
{
    CURL *curl = curl_.get();

    // Start from a clean handle; connections and DNS cache are kept
    curl_easy_reset(curl);
    errorBuffer_[0] = '\0';

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer_.data());

    // Set a user-agent (some servers block requests without one)
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "DownloadTask/1.0");

    // Signals can't be used for timeouts in multi-threaded programs
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // HTTPS settings
    if (options.acceptAnyCertificate)
    {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    else
    {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L); // Verify server certificate
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L); // Verify hostname matches cert
    }

    // Follow HTTP redirects up to a limit
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options.maxRedirects);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options.connectTimeoutMs);

    // Read timeout: abort when less than 1 byte/s arrives for that long
    if (options.readTimeoutMs > 0)
    {
        long stallSeconds = std::max(1L, (options.readTimeoutMs + 999) / 1000);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stallSeconds);
    }

    if (options.compress)
    {
        // Empty string: offer every encoding libcurl can decode
        curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    }

    if (!options.username.empty())
    {
        curl_easy_setopt(curl, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(curl, CURLOPT_USERNAME, options.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, options.password.c_str());
    }

    if (!options.proxy.empty())
    {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy.c_str());
        if (!options.proxyUser.empty())
        {
            curl_easy_setopt(curl, CURLOPT_PROXYUSERNAME, options.proxyUser.c_str());
            curl_easy_setopt(curl, CURLOPT_PROXYPASSWORD, options.proxyPassword.c_str());
        }
    }

    // Progress callback only watches for cancellation
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);

    HeaderList headerList(nullptr, curl_slist_free_all);
    auto appendHeader = [&headerList](const std::string &header)
    {
        curl_slist *head = curl_slist_append(headerList.get(), header.c_str());
        if (head == nullptr)
        {
            throw std::runtime_error("Out of memory while building request headers");
        }
        headerList.release();
        headerList.reset(head);
    };

    for (const auto &header : options.headers)
    {
        appendHeader(header);
    }
    for (const auto &header : extraHeaders)
    {
        appendHeader(header);
    }

    if (headerList)
    {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.get());
    }

    return headerList;
}

AttemptResult HttpClient::fetch(const std::string &url,
                                const std::filesystem::path &stagingPath,
                                const RequestOptions &options,
                                const CancellationToken &cancellation)
{
    // Malformed URL or unsupported scheme: no point in ever retrying
    try
    {
        MappingResolver::validateUrl(url);
    }
    catch (const ConfigurationError &e)
    {
        return AttemptResult::fatal(ErrorKind::Configuration, e.what());
    }

    // Every attempt starts from an empty staging file
    std::ofstream outFile(stagingPath, std::ios::binary | std::ios::trunc);
    if (!outFile)
    {
        return AttemptResult::fatal(ErrorKind::Filesystem,
                                    fmt::format("Cannot open file for writing: {}", stagingPath.string()));
    }

    TransferContext context;
    context.outFile = &outFile;
    context.cancellation = &cancellation;
    context.progress = progress_;

    HeaderList headers = prepareRequest(url, options, {});

    CURL *curl = curl_.get();
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &context);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);

    // Ask for the remote modification time (Last-Modified)
    curl_easy_setopt(curl, CURLOPT_FILETIME, 1L);

    CURLcode res = curl_easy_perform(curl);

    // Close file (ensures data is flushed)
    outFile.close();

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    if (context.writeFailed || outFile.fail())
    {
        return AttemptResult::fatal(ErrorKind::Filesystem,
                                    fmt::format("Cannot write to file: {}", stagingPath.string()));
    }

    if (res != CURLE_OK && cancellation.isCancelled())
    {
        return AttemptResult::fatal(ErrorKind::Cancelled, "Download cancelled");
    }

    if (res != CURLE_OK || httpCode >= 400)
    {
        std::string message = describeError(res, httpCode);
        AttemptResult result = classifyError(res, httpCode) == AttemptStatus::RetryableFailure
                                   ? AttemptResult::retryable(ErrorKind::Network, message)
                                   : AttemptResult::fatal(ErrorKind::Network, message);
        result.httpStatus = httpCode;
        return result;
    }

    if (httpCode < 200 || httpCode >= 300)
    {
        // e.g. a 3xx without a Location header
        AttemptResult result = AttemptResult::fatal(
            ErrorKind::Network,
            fmt::format("Unexpected HTTP {} response ({})", httpCode, httpStatusText(httpCode)));
        result.httpStatus = httpCode;
        return result;
    }

    // Verify file size when the server told us what to expect.
    // With a content encoding, Content-Length counts the encoded bytes.
    curl_off_t expectedSize = -1;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &expectedSize);
    if (!context.contentEncoded && expectedSize >= 0 && expectedSize != context.bytes)
    {
        AttemptResult result = AttemptResult::retryable(
            ErrorKind::Network,
            fmt::format("File size mismatch: expected {} but got {}",
                        formatBytes(expectedSize), formatBytes(context.bytes)));
        result.httpStatus = httpCode;
        return result;
    }

    AttemptResult result = AttemptResult::success(context.bytes);
    result.httpStatus = httpCode;
    result.etag = context.etag;

    curl_off_t fileTime = -1;
    curl_easy_getinfo(curl, CURLINFO_FILETIME_T, &fileTime);
    if (fileTime >= 0)
    {
        result.lastModified = static_cast<std::time_t>(fileTime);
    }

    return result;
}

ProbeResult HttpClient::probe(const std::string &url,
                              const ProbeConditions &conditions,
                              const RequestOptions &options,
                              const CancellationToken &cancellation)
{
    ProbeResult result;

    try
    {
        MappingResolver::validateUrl(url);
    }
    catch (const ConfigurationError &e)
    {
        result.cause = e.what();
        return result;
    }

    std::vector<std::string> conditionalHeaders;
    if (conditions.ifModifiedSince)
    {
        conditionalHeaders.push_back("If-Modified-Since: " + formatHttpDate(*conditions.ifModifiedSince));
    }
    if (conditions.ifNoneMatch)
    {
        conditionalHeaders.push_back("If-None-Match: " + *conditions.ifNoneMatch);
    }

    TransferContext context;
    context.cancellation = &cancellation;

    HeaderList headers = prepareRequest(url, options, conditionalHeaders);

    CURL *curl = curl_.get();
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L); // HEAD request
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &context);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);

    CURLcode res = curl_easy_perform(curl);

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    result.httpStatus = httpCode;

    if (res != CURLE_OK)
    {
        result.cause = describeError(res, httpCode);
        return result;
    }

    if (httpCode == 304)
    {
        result.status = ProbeStatus::NotModified;
    }
    else if (httpCode >= 200 && httpCode < 300)
    {
        result.status = ProbeStatus::Modified;
    }
    else
    {
        result.cause = fmt::format("HTTP {}: {}", httpCode, httpStatusText(httpCode));
    }

    return result;
}

std::string HttpClient::describeError(CURLcode code, long httpCode) const
{
    if (code == CURLE_OK)
    {
        return fmt::format("HTTP {}: {}", httpCode, httpStatusText(httpCode));
    }

    // The error buffer usually has more detail than the generic text
    if (errorBuffer_[0] != '\0')
    {
        return fmt::format("{} ({})", curl_easy_strerror(code), errorBuffer_.data());
    }
    return curl_easy_strerror(code);
}

AttemptStatus HttpClient::classifyError(CURLcode code, long httpCode)
{
    // First, check CURL-level errors (network, DNS, etc.)
    switch (code)
    {
    // Transient network errors - worth retrying
    case CURLE_OPERATION_TIMEDOUT:    // Server didn't respond in time
    case CURLE_COULDNT_RESOLVE_HOST:  // DNS lookup failed (might be temporary)
    case CURLE_COULDNT_RESOLVE_PROXY: // Same for the proxy
    case CURLE_COULDNT_CONNECT:       // Connection refused (server might be restarting)
    case CURLE_PARTIAL_FILE:          // Transfer ended early (network interruption)
    case CURLE_RECV_ERROR:            // Error receiving data (network glitch)
    case CURLE_SEND_ERROR:            // Error sending data (network glitch)
    case CURLE_GOT_NOTHING:           // Server sent no data (might be overloaded)
        return AttemptStatus::RetryableFailure;

    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:             // Invalid URL syntax
    case CURLE_UNSUPPORTED_PROTOCOL:      // Protocol not supported
    case CURLE_FILE_COULDNT_READ_FILE:    // Can't read local file
    case CURLE_OUT_OF_MEMORY:             // System resource exhaustion
    case CURLE_SSL_CERTPROBLEM:           // SSL certificate invalid
    case CURLE_SSL_CIPHER:                // SSL cipher negotiation failed
    case CURLE_PEER_FAILED_VERIFICATION:  // Server certificate didn't verify
    case CURLE_SSL_CACERT_BADFILE:        // CA bundle unusable
    case CURLE_TOO_MANY_REDIRECTS:        // Redirect loop or chain too long
    case CURLE_LOGIN_DENIED:              // Credentials rejected
    case CURLE_WRITE_ERROR:               // Local write failed
    case CURLE_ABORTED_BY_CALLBACK:       // We asked to stop
        return AttemptStatus::FatalFailure;

    // No CURL error - check HTTP status code
    case CURLE_OK:
        if (httpCode == 408 || httpCode == 429)
        {
            // Request Timeout / Too Many Requests - the server asks us to come back later
            return AttemptStatus::RetryableFailure;
        }
        else if (httpCode >= 400 && httpCode < 500)
        {
            // 4xx Client Errors - permanent
            // 404 Not Found, 403 Forbidden, 401 Unauthorized
            return AttemptStatus::FatalFailure;
        }
        // 5xx Server Errors - usually transient (server overload, temporary issues)
        return AttemptStatus::RetryableFailure;

    // Unknown CURL error - be conservative and retry
    default:
        return AttemptStatus::RetryableFailure;
    }
}

std::string HttpClient::formatHttpDate(std::time_t time)
{
    // Names are fixed by the HTTP grammar, so don't let the locale near them
    static const char *const DAYS[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char *const MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::tm utc{};
    gmtime_r(&time, &utc);

    return fmt::format("{}, {:02d} {} {:04d} {:02d}:{:02d}:{:02d} GMT",
                       DAYS[utc.tm_wday],
                       utc.tm_mday,
                       MONTHS[utc.tm_mon],
                       utc.tm_year + 1900,
                       utc.tm_hour,
                       utc.tm_min,
                       utc.tm_sec);
}
