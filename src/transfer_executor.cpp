#include "transfer_executor.hpp"
#include "cancellation.hpp"
#include "checksum.hpp"
#include "format_utils.hpp"
#include "progress.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/core.h>

std::string toString(UnitState state)
{
    switch (state)
    {
    case UnitState::Pending:
        return "pending";
    case UnitState::CheckingFreshness:
        return "checking freshness";
    case UnitState::Skipped:
        return "skipped";
    case UnitState::Downloading:
        return "downloading";
    case UnitState::Promoting:
        return "promoting";
    case UnitState::Done:
        return "done";
    case UnitState::Failed:
        return "failed";
    }
    return "unknown";
}

bool InvocationResult::succeeded() const
{
    return std::all_of(units.begin(), units.end(),
                       [](const UnitReport &report)
                       { return report.succeeded(); });
}

std::vector<UnitReport> InvocationResult::failures() const
{
    std::vector<UnitReport> failed;
    std::copy_if(units.begin(), units.end(), std::back_inserter(failed),
                 [](const UnitReport &report)
                 { return !report.succeeded(); });
    return failed;
}

std::string InvocationResult::describeFailures() const
{
    std::string description;
    for (const auto &report : failures())
    {
        description += fmt::format("  {} -> {}: {} ({})\n",
                                   report.unit.source,
                                   report.unit.destination.string(),
                                   report.cause,
                                   toString(report.kind));
    }
    return description;
}

TransferExecutor::TransferExecutor(ExecutorOptions options,
                                   TransportFactory transportFactory,
                                   const CancellationToken &cancellation)
    : options_(std::move(options)),
      transportFactory_(std::move(transportFactory)),
      cancellation_(cancellation),
      sleeper_(RetryController::cancellableSleeper(cancellation)),
      freshness_(options_.freshness, options_.request, options_.quiet)
{
}

InvocationResult TransferExecutor::run(const std::vector<TransferUnit> &units)
{
    InvocationResult invocation;
    invocation.units.resize(units.size());

    if (units.empty())
    {
        return invocation;
    }

    ProgressReporter progress(units.size(), options_.quiet);

    // One mutex per distinct destination, built before any worker starts
    std::map<std::filesystem::path, std::unique_ptr<std::mutex>> destinationLocks;
    std::vector<std::mutex *> unitLocks;
    unitLocks.reserve(units.size());

    for (const auto &unit : units)
    {
        std::error_code ec;
        std::filesystem::path key = std::filesystem::absolute(unit.destination, ec);
        if (ec)
        {
            key = unit.destination;
        }

        auto &lock = destinationLocks[key.lexically_normal()];
        if (!lock)
        {
            lock = std::make_unique<std::mutex>();
        }
        unitLocks.push_back(lock.get());
    }

    std::size_t workerCount = std::min(static_cast<std::size_t>(std::max(1, options_.maxParallel)),
                                       units.size());

    // Create transports up front so a failure surfaces here, not inside a thread
    std::vector<std::unique_ptr<Transport>> transports;
    for (std::size_t i = 0; i < workerCount; ++i)
    {
        transports.push_back(transportFactory_(&progress));
    }

    std::atomic<std::size_t> nextUnit{0};

    auto worker = [&](Transport &transport)
    {
        for (;;)
        {
            std::size_t index = nextUnit.fetch_add(1);
            if (index >= units.size())
            {
                return;
            }

            const TransferUnit &unit = units[index];
            UnitReport report;

            try
            {
                report = process(unit, transport, *unitLocks[index]);
            }
            catch (const std::exception &e)
            {
                removeStaging(unit);
                report.unit = unit;
                report.state = UnitState::Failed;
                report.kind = ErrorKind::Internal;
                report.cause = e.what();
            }

            if (!report.succeeded() && !options_.quiet)
            {
                fmt::print(stderr, "✗ Download of {} failed: {}\n", unit.source, report.cause);
            }

            // Each index is written by exactly one worker
            invocation.units[index] = std::move(report);
            progress.unitFinished();
        }
    };

    std::vector<std::thread> threads;
    for (std::size_t i = 1; i < workerCount; ++i)
    {
        threads.emplace_back(worker, std::ref(*transports[i]));
    }

    // The calling thread is the first worker
    worker(*transports[0]);

    for (auto &thread : threads)
    {
        thread.join();
    }

    progress.finish();
    return invocation;
}

UnitReport TransferExecutor::process(const TransferUnit &unit,
                                     Transport &transport,
                                     std::mutex &destinationLock) const
{
    UnitReport report;
    report.unit = unit;

    auto fail = [&report](ErrorKind kind, std::string cause)
    {
        report.state = UnitState::Failed;
        report.kind = kind;
        report.cause = std::move(cause);
        return report;
    };

    if (cancellation_.isCancelled())
    {
        return fail(ErrorKind::Cancelled, "Download cancelled before it started");
    }

    // Units targeting the same destination must not interleave
    std::lock_guard<std::mutex> lock(destinationLock);

    report.state = UnitState::CheckingFreshness;

    if (freshness_.evaluate(unit, transport, cancellation_) == FreshnessDecision::UpToDate)
    {
        report.state = UnitState::Skipped;
        if (!options_.quiet)
        {
            fmt::print("Skipping {}: {} is up to date\n", unit.source, unit.destination.string());
        }
        return report;
    }

    report.state = UnitState::Downloading;

    // Ensure destination and staging directories exist
    for (const auto &directory : {unit.destination.parent_path(), unit.staging.parent_path()})
    {
        if (directory.empty())
        {
            continue;
        }

        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            return fail(ErrorKind::Filesystem,
                        fmt::format("Failed to create directory {}: {}", directory.string(), ec.message()));
        }
    }

    if (!options_.quiet)
    {
        fmt::print("Downloading {} to {}\n", unit.source, unit.destination.string());
    }

    RetryController retry(sleeper_, cancellation_, options_.quiet);
    RetryState retryState;

    AttemptResult result = retry.execute(
        unit,
        [&]()
        { return transport.fetch(unit.source, unit.staging, options_.request, cancellation_); },
        options_.maxRetries,
        ExponentialBackoff(options_.backoffBase, options_.backoffMax),
        &retryState);

    report.attempts = retryState.attemptsMade;

    if (!result.ok())
    {
        removeStaging(unit);
        return fail(result.kind, result.cause);
    }

    // Verify checksum before the file becomes visible
    if (options_.expectedChecksum)
    {
        bool matches = false;
        try
        {
            matches = ChecksumVerifier::verify(unit.staging, *options_.expectedChecksum);
        }
        catch (const std::exception &e)
        {
            removeStaging(unit);
            return fail(ErrorKind::Integrity, fmt::format("Checksum verification error: {}", e.what()));
        }

        if (!matches)
        {
            removeStaging(unit);
            return fail(ErrorKind::Integrity,
                        fmt::format("Checksum verification failed, expected {}", *options_.expectedChecksum));
        }
    }

    // Once the rename has started it runs to completion; it must not start after a cancel
    if (cancellation_.isCancelled())
    {
        removeStaging(unit);
        return fail(ErrorKind::Cancelled, "Download cancelled before the file was moved into place");
    }

    report.state = UnitState::Promoting;

    // Atomic on the same filesystem: readers see the old file or the new one, never a mix
    std::error_code ec;
    std::filesystem::rename(unit.staging, unit.destination, ec);
    if (ec)
    {
        removeStaging(unit);
        return fail(ErrorKind::Filesystem,
                    fmt::format("Download succeeded but failed to rename {} to {}: {}",
                                unit.staging.string(), unit.destination.string(), ec.message()));
    }

    report.state = UnitState::Done;
    report.bytes = result.bytes;

    // The file is in place; nothing after this point may turn the unit into a failure
    try
    {
        recordMetadata(unit, result);

        if (!options_.quiet)
        {
            fmt::print("✓ Downloaded {} ({})\n", unit.destination.string(), formatBytes(result.bytes));
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: {} was downloaded but its metadata could not be recorded: {}\n",
                   unit.destination.string(), e.what());
    }

    return report;
}

void TransferExecutor::recordMetadata(const TransferUnit &unit, const AttemptResult &result) const
{
    // Only conditional downloads read this back. A sidecar left from an
    // earlier conditional run would describe the previous content.
    std::optional<std::string> etag;
    if (options_.freshness.onlyIfModified)
    {
        etag = result.etag;
    }

    if (!FreshnessEvaluator::storeEtag(unit.destination, etag))
    {
        fmt::print(stderr, "Warning: Could not update ETag cache {}\n",
                   FreshnessEvaluator::etagPath(unit.destination).string());
    }

    // Stamp the server's time so the next If-Modified-Since compares like with like
    if (options_.freshness.onlyIfModified && result.lastModified &&
        !FreshnessEvaluator::setModificationTime(unit.destination, *result.lastModified))
    {
        fmt::print(stderr, "Warning: Could not set modification time of {}\n", unit.destination.string());
    }
}

void TransferExecutor::removeStaging(const TransferUnit &unit) const
{
    std::error_code ec;
    std::filesystem::remove(unit.staging, ec);
    if (ec)
    {
        fmt::print(stderr, "Warning: Could not remove {}: {}\n", unit.staging.string(), ec.message());
    }
}
