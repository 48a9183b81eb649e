#include "retry.hpp"
#include "cancellation.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

ExponentialBackoff::ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds cap)
    : base_(base), cap_(cap)
{
}

std::chrono::milliseconds ExponentialBackoff::operator()(int attemptNumber) const
{
    // base * 2^(attempt-1); stop doubling once past the cap to avoid overflow
    std::chrono::milliseconds delay = base_;
    for (int i = 1; i < attemptNumber && delay < cap_; ++i)
    {
        delay *= 2;
    }
    return std::min(delay, cap_);
}

RetryController::RetryController(Sleeper sleeper, const CancellationToken &cancellation, bool quiet)
    : sleeper_(std::move(sleeper)), cancellation_(cancellation), quiet_(quiet)
{
}

AttemptResult RetryController::execute(const TransferUnit &unit,
                                       const std::function<AttemptResult()> &attemptFn,
                                       int maxAttempts,
                                       const BackoffPolicy &backoff,
                                       RetryState *state) const
{
    RetryState localState;
    RetryState &retry = (state != nullptr) ? *state : localState;
    retry = RetryState{};
    retry.maxAttempts = std::max(1, maxAttempts);

    AttemptResult result;

    for (;;)
    {
        if (cancellation_.isCancelled())
        {
            return AttemptResult::fatal(ErrorKind::Cancelled, "Download cancelled");
        }

        result = attemptFn();
        retry.attemptsMade++;

        // Success or permanent error: nothing to retry
        if (result.status != AttemptStatus::RetryableFailure)
        {
            return result;
        }

        if (retry.attemptsMade >= retry.maxAttempts)
        {
            break;
        }

        retry.nextBackoff = backoff(retry.attemptsMade);

        if (!quiet_)
        {
            fmt::print(stderr,
                       "Download of {} failed (attempt {}/{}): {}\n"
                       "Retrying in {} ms...\n",
                       unit.source,
                       retry.attemptsMade, retry.maxAttempts,
                       result.cause,
                       retry.nextBackoff.count());
        }

        if (!sleeper_(retry.nextBackoff))
        {
            return AttemptResult::fatal(ErrorKind::Cancelled, "Download cancelled while waiting to retry");
        }
    }

    if (retry.attemptsMade > 1)
    {
        result.cause = fmt::format("{} (after {} attempts)", result.cause, retry.attemptsMade);
    }
    return result;
}

Sleeper RetryController::cancellableSleeper(const CancellationToken &cancellation)
{
    return [&cancellation](std::chrono::milliseconds delay)
    {
        return cancellation.waitFor(delay);
    };
}
