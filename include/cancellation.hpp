#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * Cooperative cancellation signal shared by every pipeline of a run.
 *
 * Fired once (usually on the first SIGINT/SIGTERM) and observed at every
 * suspension point: chunk boundaries, retry delays and pre-attempt checks.
 * Safe for concurrent use from any number of threads.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    /**
     * Fire the token and wake every thread blocked in waitFor().
     * Calling it more than once has no further effect.
     */
    void cancel();

    bool isCancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * Sleep for the given duration or until the token fires.
     *
     * @param duration Maximum time to wait
     * @return true if the token fired (before or during the wait)
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    /**
     * @throws XgetError (ErrorKind::Cancelled) if the token has fired
     */
    void throwIfCancelled() const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
