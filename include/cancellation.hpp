#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * Invocation-wide cancellation flag with an optional deadline.
 *
 * Shared by all worker threads of one invocation. A token counts as
 * cancelled once cancel() was called, once a watched external flag
 * (e.g. set from a signal handler) turns true, or once the deadline passed.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel();

    bool isCancelled() const;

    /**
     * Cancel automatically once `deadline` has passed.
     */
    void setDeadline(std::chrono::steady_clock::time_point deadline);

    /**
     * Also treat the token as cancelled when `flag` becomes true.
     * The flag must outlive the token. Intended for signal handlers,
     * which may only store to a lock-free atomic.
     */
    void watch(const std::atomic<bool> *flag) { external_ = flag; }

    /**
     * Sleep for `duration` unless cancelled first.
     *
     * @return true if the full duration elapsed, false if cancelled
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> hasDeadline_{false};
    std::atomic<std::chrono::steady_clock::rep> deadline_{0};
    const std::atomic<bool> *external_ = nullptr;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
