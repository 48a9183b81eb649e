#pragma once

#include "attempt_result.hpp"
#include "mapping_resolver.hpp"

#include <chrono>
#include <functional>

class CancellationToken;

/**
 * Delay before the next attempt, given the number of attempts made so far (1-based).
 */
using BackoffPolicy = std::function<std::chrono::milliseconds(int attemptNumber)>;

/**
 * Waits for a backoff delay.
 * @return false if the wait was interrupted and no further attempt should be made
 */
using Sleeper = std::function<bool(std::chrono::milliseconds delay)>;

/**
 * Exponential backoff without jitter: base, 2*base, 4*base, ... capped at `cap`.
 */
class ExponentialBackoff
{
public:
    ExponentialBackoff(std::chrono::milliseconds base, std::chrono::milliseconds cap);

    std::chrono::milliseconds operator()(int attemptNumber) const;

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds cap_;
};

/**
 * Bookkeeping of one execute() call.
 */
struct RetryState
{
    int attemptsMade = 0;
    int maxAttempts = 1;
    std::chrono::milliseconds nextBackoff{0};
};

/**
 * Runs a transfer attempt until it succeeds, fails fatally, or the
 * attempt budget is spent. Only retryable failures are retried.
 */
class RetryController
{
public:
    RetryController(Sleeper sleeper, const CancellationToken &cancellation, bool quiet = false);

    /**
     * @param unit Unit being transferred (for messages)
     * @param attemptFn One transfer attempt
     * @param maxAttempts Total attempts including the first; values below 1 mean 1
     * @param backoff Delay policy between attempts
     * @param state Optional out-parameter receiving attempt counts
     * @return Success, the fatal failure, or the last retryable failure
     */
    AttemptResult execute(const TransferUnit &unit,
                          const std::function<AttemptResult()> &attemptFn,
                          int maxAttempts,
                          const BackoffPolicy &backoff,
                          RetryState *state = nullptr) const;

    /**
     * Default sleeper: waits on the token so a cancel interrupts the wait.
     */
    static Sleeper cancellableSleeper(const CancellationToken &cancellation);

private:
    Sleeper sleeper_;
    const CancellationToken &cancellation_;
    bool quiet_;
};
