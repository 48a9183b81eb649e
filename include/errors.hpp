#pragma once

#include <stdexcept>
#include <string>

/**
 * Broad category of a failed download, reported per file.
 */
enum class ErrorKind
{
    None,
    Configuration, // Bad URL, bad source/destination combination
    Network,       // Anything the remote side or the connection caused
    Filesystem,    // Cannot create directory, write staging file, rename
    Integrity,     // Checksum mismatch
    Cancelled,     // Invocation was cancelled or hit its deadline
    Internal       // Unexpected exception while processing a file
};

std::string toString(ErrorKind kind);

/**
 * Thrown when sources and destination cannot be turned into downloads.
 * Always raised before any network request is made.
 */
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};
