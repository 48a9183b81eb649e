#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * Where downloaded files should go.
 * A directory when `isDirectory` is set, when the path already is a
 * directory, or when it ends with a path separator.
 */
struct DestinationSpec
{
    std::filesystem::path path;
    bool isDirectory = false;
};

/**
 * One file to download: a source URL, its final destination, and
 * the staging file the body is streamed into before promotion.
 */
struct TransferUnit
{
    std::string source;
    std::filesystem::path destination;
    std::filesystem::path staging;
};

/**
 * Expands source URLs and a destination into concrete transfer units.
 * Performs no filesystem writes; directories are created later by the executor.
 */
class MappingResolver
{
public:
    /**
     * Pair every source with a destination file.
     *
     * @param sources One or more http/https URLs
     * @param destination File path (single source) or directory
     * @return One TransferUnit per source, in source order
     * @throws ConfigurationError if sources are empty, a URL is invalid,
     *         several sources target a regular file, or no filename can
     *         be derived from a URL
     */
    static std::vector<TransferUnit> resolve(const std::vector<std::string> &sources,
                                             const DestinationSpec &destination);

    /**
     * Check that a URL parses and uses the http or https scheme.
     * @throws ConfigurationError otherwise
     */
    static void validateUrl(const std::string &url);

    /**
     * Derive a local filename from the last segment of the URL path.
     * Query and fragment are ignored, trailing slashes stripped,
     * percent-escapes decoded.
     * Example: "http://host/dir/my%20file.txt/?v=2" → "my file.txt"
     *
     * @throws ConfigurationError if the URL has no usable last segment
     */
    static std::string filenameFromUrl(const std::string &url);

    /**
     * Generate a staging filename next to the destination.
     * Unique within the process, so two units writing the same
     * destination never share a staging file.
     */
    static std::filesystem::path makeStagingPath(const std::filesystem::path &destination);

private:
    static bool denotesDirectory(const DestinationSpec &destination);

    /**
     * Decode %XX escapes.
     * Example: "a%20b" → "a b"
     */
    static std::string percentDecode(const std::string &text);
};
