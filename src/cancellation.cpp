#include "cancellation.hpp"
#include "errors.hpp"

void CancellationToken::cancel()
{
    {
        // Store under the lock so a waiter cannot miss the notification
        // between checking the predicate and blocking.
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this]
                        { return cancelled_.load(std::memory_order_acquire); });
}

void CancellationToken::throwIfCancelled() const
{
    if (isCancelled())
    {
        throw XgetError(ErrorKind::Cancelled, "download cancelled");
    }
}
