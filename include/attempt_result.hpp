#pragma once

#include "errors.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

/**
 * Outcome class of a single transfer attempt.
 * Transient failures are worth retrying, fatal ones are not.
 */
enum class AttemptStatus
{
    Success,
    RetryableFailure,
    FatalFailure
};

/**
 * Result of one Transport::fetch() call.
 */
struct AttemptResult
{
    AttemptStatus status = AttemptStatus::Success;
    ErrorKind kind = ErrorKind::None;
    std::string cause;

    long httpStatus = 0;    // 0 if no HTTP response was received
    std::int64_t bytes = 0; // Bytes written to the staging file

    // Metadata of the final response (after redirects)
    std::optional<std::string> etag;
    std::optional<std::time_t> lastModified;

    bool ok() const { return status == AttemptStatus::Success; }

    static AttemptResult success(std::int64_t bytes);
    static AttemptResult retryable(ErrorKind kind, std::string cause);
    static AttemptResult fatal(ErrorKind kind, std::string cause);
};
