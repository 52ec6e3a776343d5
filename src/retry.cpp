#include "retry.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "transfer_engine.hpp"

#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

std::chrono::milliseconds RetryPolicy::delayBefore(int attempt) const
{
    if (attempt <= 1 || mode == BackoffMode::Fixed)
    {
        return attempt <= 1 ? std::chrono::milliseconds(0) : delay;
    }

    // Exponential backoff: delay, 2*delay, 4*delay, ... up to the cap
    auto value = delay;
    for (int i = 2; i < attempt && value < RetryController::MAX_BACKOFF; ++i)
    {
        value *= 2;
    }
    return std::min(value, RetryController::MAX_BACKOFF);
}

RetryPolicy RetryPolicy::fromSettings(const Settings &settings)
{
    RetryPolicy policy;
    policy.maxAttempts = std::max(1, settings.retries);
    policy.delay = settings.retryDelay;
    policy.mode = settings.retryBackoff.value_or(BackoffMode::Fixed);
    return policy;
}

RetryController::RetryController(RetryPolicy policy, TransferEngine &engine)
    : policy_(std::move(policy)), engine_(engine)
{
}

int RetryController::run(const FileTask &task, const CancellationToken &token)
{
    TransferState state = TransferEngine::makeState(task);

    for (int attempt = 1;; ++attempt)
    {
        if (attempt > 1)
        {
            auto wait = policy_.delayBefore(attempt);
            spdlog::info("Retrying {} in {} ms (attempt {}/{})", task.destination, wait.count(),
                         attempt, policy_.maxAttempts);
            if (token.waitFor(wait))
            {
                throw XgetError(ErrorKind::Cancelled, "download cancelled");
            }
        }

        try
        {
            engine_.transfer(task, state, token);
            return attempt;
        }
        catch (const XgetError &e)
        {
            // A cancelled attempt is not a failure
            if (e.isCancelled() || token.isCancelled())
            {
                throw XgetError(ErrorKind::Cancelled, "download cancelled");
            }

            if (!e.isRetryable())
            {
                throw;
            }

            if (attempt >= policy_.maxAttempts)
            {
                throw XgetError(e.kind(), fmt::format("all {} attempts failed: {}", attempt, e.what()));
            }

            spdlog::warn("Download of {} failed (attempt {}/{}): {}", task.destination, attempt,
                         policy_.maxAttempts, e.what());
        }
    }
}
