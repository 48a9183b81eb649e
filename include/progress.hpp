#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>

/**
 * Aggregate progress of one invocation, shared by all worker threads.
 *
 * Counters are lock-free; printing is throttled and never blocks a worker
 * (a thread that finds another one printing just skips its update).
 */
class ProgressReporter
{
public:
    ProgressReporter(std::size_t totalUnits, bool quiet);

    ProgressReporter(const ProgressReporter &) = delete;
    ProgressReporter &operator=(const ProgressReporter &) = delete;

    /**
     * Called from transfer callbacks with every chunk written.
     */
    void addBytes(std::int64_t bytes);

    /**
     * Called once per unit when it reaches a terminal state.
     */
    void unitFinished();

    /**
     * Print the final progress line and terminate it.
     */
    void finish();

    std::int64_t totalBytes() const { return bytes_.load(); }
    std::size_t finishedUnits() const { return finishedUnits_.load(); }

    /**
     * Seconds since the reporter was created.
     */
    long elapsedSeconds() const;

private:
    void maybePrint(bool force);

    std::atomic<std::int64_t> bytes_{0};
    std::atomic<std::size_t> finishedUnits_{0};
    std::size_t totalUnits_;
    bool quiet_;
    bool isTerminalOutput_;

    std::chrono::steady_clock::time_point startTime_;

    // Guarded by printMutex_
    std::mutex printMutex_;
    std::chrono::steady_clock::time_point lastPrintedTime_;
    bool printedLine_ = false;
};
