#pragma once

#include <stdexcept>
#include <string>

/**
 * Failure categories used across the download pipeline.
 * The category decides whether the retry controller tries again.
 */
enum class ErrorKind
{
    Config,    // Unknown alias, bad scheme, malformed locator - never retried
    Transport, // Network errors, timeouts, unexpected HTTP status, S3 API errors
    Integrity, // Digest mismatch after a completed transfer or cache fetch
    Io,        // Local filesystem failures
    Cancelled  // Cancellation token fired - not a failure
};

/**
 * Human-readable name of an error category ("config", "transport", ...).
 */
const char *toString(ErrorKind kind);

/**
 * Exception type thrown by every xget component.
 * Carries an ErrorKind so callers can classify without parsing messages.
 */
class XgetError : public std::runtime_error
{
public:
    XgetError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const noexcept { return kind_; }

    /**
     * Whether another attempt might succeed.
     * Configuration errors and cancellation are final.
     */
    bool isRetryable() const noexcept
    {
        return kind_ != ErrorKind::Config && kind_ != ErrorKind::Cancelled;
    }

    bool isCancelled() const noexcept { return kind_ == ErrorKind::Cancelled; }

private:
    ErrorKind kind_;
};

/**
 * A resume offset lies beyond the end of the remote object (HTTP 416 with
 * no matching total). The staged bytes are not a prefix of the object.
 */
class RangeNotSatisfiableError : public XgetError
{
public:
    explicit RangeNotSatisfiableError(const std::string &message)
        : XgetError(ErrorKind::Transport, message)
    {
    }
};
