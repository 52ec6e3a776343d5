#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

/**
 * Optional byte-counting observer attached to each transfer's write path.
 * Called from worker threads; implementations must be thread-safe.
 * The pipeline behaves identically with or without one.
 */
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;

    /**
     * A transfer begins (or restarts).
     *
     * @param label Destination path of the transfer
     * @param totalSize Size of the whole object, -1 if unknown
     * @param alreadyStaged Bytes already on disk from an earlier attempt
     */
    virtual void start(const std::string &label, std::int64_t totalSize, std::int64_t alreadyStaged) = 0;

    virtual void advance(const std::string &label, std::size_t bytes) = 0;

    virtual void finish(const std::string &label, bool success) = 0;
};

/**
 * Console progress for many concurrent transfers.
 *
 * Prints one throttled status line per transfer (at most once per
 * interval), with a bar when stdout is a terminal.
 */
class ConsoleProgress : public ProgressSink
{
public:
    explicit ConsoleProgress(std::chrono::milliseconds interval = std::chrono::milliseconds(1000));

    void start(const std::string &label, std::int64_t totalSize, std::int64_t alreadyStaged) override;
    void advance(const std::string &label, std::size_t bytes) override;
    void finish(const std::string &label, bool success) override;

private:
    struct Transfer
    {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point lastPrinted;
        std::int64_t totalSize = -1;
        std::int64_t resumeOffset = 0;
        std::int64_t downloaded = 0; // This session only
    };

    void printLine(const std::string &label, const Transfer &transfer,
                   std::chrono::steady_clock::time_point now);

    std::mutex mutex_;
    std::map<std::string, Transfer> transfers_;
    std::chrono::milliseconds interval_;
    bool isTerminalOutput_ = true;
};

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 */
std::string formatBytes(std::int64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s")
 */
std::string formatDuration(long seconds);

/**
 * Render a progress bar like "[=====>    ]".
 *
 * @param percentage 0-100
 * @param width Number of cells between the brackets
 */
std::string renderBar(double percentage, int width = 30);
