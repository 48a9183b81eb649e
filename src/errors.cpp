#include "errors.hpp"
#include "attempt_result.hpp"

#include <utility>

std::string toString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Configuration:
        return "configuration error";
    case ErrorKind::Network:
        return "network error";
    case ErrorKind::Filesystem:
        return "filesystem error";
    case ErrorKind::Integrity:
        return "integrity error";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Internal:
        return "internal error";
    }
    return "unknown";
}

AttemptResult AttemptResult::success(std::int64_t bytes)
{
    AttemptResult result;
    result.bytes = bytes;
    return result;
}

AttemptResult AttemptResult::retryable(ErrorKind kind, std::string cause)
{
    AttemptResult result;
    result.status = AttemptStatus::RetryableFailure;
    result.kind = kind;
    result.cause = std::move(cause);
    return result;
}

AttemptResult AttemptResult::fatal(ErrorKind kind, std::string cause)
{
    AttemptResult result;
    result.status = AttemptStatus::FatalFailure;
    result.kind = kind;
    result.cause = std::move(cause);
    return result;
}
