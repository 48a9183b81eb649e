#include "cancellation.hpp"

#include <algorithm>

void CancellationToken::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::isCancelled() const
{
    if (cancelled_.load())
    {
        return true;
    }

    if (external_ != nullptr && external_->load())
    {
        return true;
    }

    if (hasDeadline_.load())
    {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        if (now >= deadline_.load())
        {
            return true;
        }
    }

    return false;
}

void CancellationToken::setDeadline(std::chrono::steady_clock::time_point deadline)
{
    deadline_.store(deadline.time_since_epoch().count());
    hasDeadline_.store(true);
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const
{
    // Wake up periodically: the external flag and the deadline don't notify
    constexpr std::chrono::milliseconds POLL_INTERVAL{50};

    auto until = std::chrono::steady_clock::now() + duration;
    std::unique_lock<std::mutex> lock(mutex_);

    while (!isCancelled())
    {
        auto now = std::chrono::steady_clock::now();
        if (now >= until)
        {
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
        cv_.wait_for(lock, std::min(remaining, POLL_INTERVAL));
    }

    return false;
}
