#include "mapping_resolver.hpp"
#include "errors.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <random>
#include <stdexcept>
#include <system_error>

#include <curl/curl.h>
#include <fmt/core.h>

namespace
{

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

UrlHandle parseUrl(const std::string &url)
{
    UrlHandle handle(curl_url(), curl_url_cleanup);
    if (!handle)
    {
        throw std::runtime_error("Failed to allocate URL handle");
    }

    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
    {
        throw ConfigurationError(fmt::format("Malformed URL: '{}'", url));
    }
    return handle;
}

// Fetch one URL component; libcurl allocates the string, we must curl_free() it
std::string urlPart(CURLU *handle, CURLUPart part)
{
    char *value = nullptr;
    if (curl_url_get(handle, part, &value, 0) != CURLUE_OK || value == nullptr)
    {
        return {};
    }
    std::string result(value);
    curl_free(value);
    return result;
}

int hexValue(char ch)
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}

} // namespace

std::vector<TransferUnit> MappingResolver::resolve(const std::vector<std::string> &sources,
                                                   const DestinationSpec &destination)
{
    if (sources.empty())
    {
        throw ConfigurationError("No source URL given");
    }

    if (destination.path.empty())
    {
        throw ConfigurationError("No destination given");
    }

    for (const auto &source : sources)
    {
        validateUrl(source);
    }

    bool directory = denotesDirectory(destination);

    // "file.txt/" names the same entry as "file.txt"
    std::filesystem::path existing = destination.path.has_filename() ? destination.path
                                                                     : destination.path.parent_path();
    std::error_code ec;
    bool existingFile = std::filesystem::exists(existing, ec) &&
                        !std::filesystem::is_directory(existing, ec);

    if (sources.size() > 1)
    {
        // Several sources can only go into a directory. A path that doesn't
        // exist yet is created as one; an existing file is a mistake.
        if (existingFile)
        {
            throw ConfigurationError(fmt::format(
                "If multiple sources are given, the destination has to be a directory: {}",
                destination.path.string()));
        }
        directory = true;
    }
    else if (directory && existingFile)
    {
        throw ConfigurationError(fmt::format("Destination is not a directory: {}",
                                             destination.path.string()));
    }

    std::vector<TransferUnit> units;
    units.reserve(sources.size());

    for (const auto &source : sources)
    {
        TransferUnit unit;
        unit.source = source;
        unit.destination = directory ? destination.path / filenameFromUrl(source)
                                     : destination.path;
        unit.staging = makeStagingPath(unit.destination);
        units.push_back(std::move(unit));
    }

    return units;
}

void MappingResolver::validateUrl(const std::string &url)
{
    UrlHandle handle = parseUrl(url);

    // libcurl normalizes the scheme to lowercase
    std::string scheme = urlPart(handle.get(), CURLUPART_SCHEME);
    if (scheme != "http" && scheme != "https")
    {
        throw ConfigurationError(fmt::format(
            "Unsupported URL scheme '{}' in '{}': only http and https are allowed", scheme, url));
    }

    if (urlPart(handle.get(), CURLUPART_HOST).empty())
    {
        throw ConfigurationError(fmt::format("URL has no host: '{}'", url));
    }
}

std::string MappingResolver::filenameFromUrl(const std::string &url)
{
    UrlHandle handle = parseUrl(url);

    // Raw (still escaped) path, so an encoded "/" can't split a segment
    std::string path = urlPart(handle.get(), CURLUPART_PATH);

    while (!path.empty() && path.back() == '/')
    {
        path.pop_back();
    }

    std::string segment = path.substr(path.find_last_of('/') + 1);
    std::string filename = percentDecode(segment);

    if (filename.empty() || filename == "." || filename == ".." ||
        filename.find('/') != std::string::npos || filename.find('\0') != std::string::npos)
    {
        throw ConfigurationError(fmt::format("Cannot derive a file name from URL '{}'", url));
    }

    return filename;
}

std::filesystem::path MappingResolver::makeStagingPath(const std::filesystem::path &destination)
{
    // Random per-process salt plus a counter: unique across units and
    // unlikely to collide with leftovers of earlier processes
    static const std::uint32_t salt = std::random_device{}();
    static std::atomic<std::uint32_t> counter{0};

    std::filesystem::path stagingPath = destination;
    stagingPath += fmt::format(".{:08x}{:04x}.part", salt, counter.fetch_add(1));
    return stagingPath;
}

bool MappingResolver::denotesDirectory(const DestinationSpec &destination)
{
    if (destination.isDirectory)
    {
        return true;
    }

    // "downloads/" means a directory even if it doesn't exist yet
    if (!destination.path.has_filename())
    {
        return true;
    }

    std::error_code ec;
    return std::filesystem::is_directory(destination.path, ec);
}

std::string MappingResolver::percentDecode(const std::string &text)
{
    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '%' && i + 2 < text.size())
        {
            int high = hexValue(text[i + 1]);
            int low = hexValue(text[i + 2]);
            if (high >= 0 && low >= 0)
            {
                result += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        result += text[i];
    }

    return result;
}
