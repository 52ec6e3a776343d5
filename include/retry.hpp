#pragma once

#include <chrono>

#include "config.hpp"

class CancellationToken;
class TransferEngine;

/**
 * How many attempts a task gets and how long to wait between them.
 */
struct RetryPolicy
{
    int maxAttempts = DEFAULT_RETRIES;
    std::chrono::milliseconds delay = DEFAULT_RETRY_DELAY;
    BackoffMode mode = BackoffMode::Fixed;

    /**
     * Delay before the given attempt (2 = first retry).
     * Fixed: always `delay`. Exponential: delay * 2^(attempt-2), capped.
     */
    std::chrono::milliseconds delayBefore(int attempt) const;

    static RetryPolicy fromSettings(const Settings &settings);
};

/**
 * Runs the transfer engine until it succeeds, attempts run out,
 * the failure is not retryable, or the token fires.
 *
 * Attempts share one TransferState, so every retry resumes from the
 * staging file left behind by the previous one.
 */
class RetryController
{
public:
    static constexpr std::chrono::milliseconds MAX_BACKOFF{300000};

    RetryController(RetryPolicy policy, TransferEngine &engine);

    /**
     * @return Number of attempts used
     * @throws XgetError Cancelled if the token fires (attempts are not
     *         consumed), the original error for non-retryable failures,
     *         otherwise the last error as "all N attempts failed: ..."
     */
    int run(const FileTask &task, const CancellationToken &token);

    const RetryPolicy &policy() const { return policy_; }

private:
    RetryPolicy policy_;
    TransferEngine &engine_;
};
