#include "progress.hpp"
#include "format_utils.hpp"

#include <cstdio>
#include <unistd.h>

#include <fmt/core.h>

ProgressReporter::ProgressReporter(std::size_t totalUnits, bool quiet)
    : totalUnits_(totalUnits),
      quiet_(quiet),
      isTerminalOutput_(::isatty(fileno(stdout))),
      startTime_(std::chrono::steady_clock::now()),
      lastPrintedTime_(startTime_)
{
}

void ProgressReporter::addBytes(std::int64_t bytes)
{
    bytes_.fetch_add(bytes);
    maybePrint(false);
}

void ProgressReporter::unitFinished()
{
    finishedUnits_.fetch_add(1);
    maybePrint(false);
}

void ProgressReporter::finish()
{
    maybePrint(true);

    std::lock_guard<std::mutex> lock(printMutex_);
    if (printedLine_ && isTerminalOutput_)
    {
        fmt::print("\n");
    }
}

long ProgressReporter::elapsedSeconds() const
{
    auto elapsed = std::chrono::steady_clock::now() - startTime_;
    return static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
}

void ProgressReporter::maybePrint(bool force)
{
    if (quiet_)
    {
        return;
    }

    std::unique_lock<std::mutex> lock(printMutex_, std::defer_lock);
    if (force)
    {
        lock.lock();
    }
    else if (!lock.try_lock())
    {
        return; // Someone else is printing right now
    }

    auto now = std::chrono::steady_clock::now();
    auto timeSinceStart = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_).count();
    auto timeSinceLastPrint = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastPrintedTime_).count();

    if (!force)
    {
        if (isTerminalOutput_)
        {
            // Don't show progress in the first 500ms (prevents flashing for instant downloads)
            // and update at most 5 times per second
            if (timeSinceStart < 500 || timeSinceLastPrint < 200)
            {
                return;
            }
        }
        else if (timeSinceLastPrint < 1000)
        {
            return;
        }
    }
    else if (!printedLine_ && timeSinceStart < 500)
    {
        // Nothing was shown and it was quick: the summary line is enough
        return;
    }

    std::int64_t bytes = bytes_.load();
    long elapsed = static_cast<long>(timeSinceStart / 1000);
    double speed = (timeSinceStart > 0) ? static_cast<double>(bytes) * 1000.0 / timeSinceStart : 0.0;

    std::string line = fmt::format("[{}/{} files] {} | {}/s | Elapsed: {}",
                                   finishedUnits_.load(),
                                   totalUnits_,
                                   formatBytes(bytes),
                                   formatBytes(static_cast<std::int64_t>(speed)),
                                   formatDuration(elapsed));

    if (isTerminalOutput_)
    {
        fmt::print("\r{}\033[K", line);
        std::fflush(stdout);
    }
    else
    {
        fmt::print("{}\n", line);
    }

    lastPrintedTime_ = now;
    printedLine_ = true;
}
