#pragma once

#include "attempt_result.hpp"
#include "freshness.hpp"
#include "mapping_resolver.hpp"
#include "retry.hpp"
#include "transport.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class CancellationToken;
class ProgressReporter;

/**
 * Lifecycle of one transfer unit.
 * Skipped, Done and Failed are terminal.
 */
enum class UnitState
{
    Pending,
    CheckingFreshness,
    Skipped,
    Downloading,
    Promoting,
    Done,
    Failed
};

std::string toString(UnitState state);

/**
 * Terminal outcome of one transfer unit.
 */
struct UnitReport
{
    TransferUnit unit;
    UnitState state = UnitState::Pending;
    ErrorKind kind = ErrorKind::None;
    std::string cause;
    int attempts = 0;
    std::int64_t bytes = 0;

    bool succeeded() const { return state == UnitState::Done || state == UnitState::Skipped; }
};

/**
 * Outcome of a whole invocation, one report per unit in input order.
 */
struct InvocationResult
{
    std::vector<UnitReport> units;

    bool succeeded() const;

    std::vector<UnitReport> failures() const;

    /**
     * One line per failed unit: source, destination, kind and cause.
     */
    std::string describeFailures() const;
};

struct ExecutorOptions
{
    FreshnessPolicy freshness;
    RequestOptions request;

    int maxRetries = 3; // Total attempts per unit
    std::chrono::milliseconds backoffBase{500};
    std::chrono::milliseconds backoffMax{30000};

    int maxParallel = 4;

    // Staging files are checked against this before promotion
    std::optional<std::string> expectedChecksum;

    bool quiet = false;
};

/**
 * Runs transfer units to completion on a bounded pool of worker threads.
 *
 * Each unit checks freshness, downloads into its own staging file with
 * retries, and is renamed onto its destination only after a complete,
 * verified transfer. Units sharing a destination run one after another.
 * A failing unit never stops its siblings.
 */
class TransferExecutor
{
public:
    TransferExecutor(ExecutorOptions options,
                     TransportFactory transportFactory,
                     const CancellationToken &cancellation);

    /**
     * Replace the backoff sleeper (tests use one that doesn't wait).
     */
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    /**
     * Process all units and wait until every one of them is terminal.
     *
     * @throws std::runtime_error if a transport cannot be created
     */
    InvocationResult run(const std::vector<TransferUnit> &units);

private:
    UnitReport process(const TransferUnit &unit, Transport &transport, std::mutex &destinationLock) const;

    /**
     * Apply server metadata (Last-Modified, ETag) to a promoted destination.
     */
    void recordMetadata(const TransferUnit &unit, const AttemptResult &result) const;

    void removeStaging(const TransferUnit &unit) const;

    ExecutorOptions options_;
    TransportFactory transportFactory_;
    const CancellationToken &cancellation_;
    Sleeper sleeper_;
    FreshnessEvaluator freshness_;
};
