#include "progress.hpp"

#include <cstdio>
#include <unistd.h>

#include <fmt/core.h>

ConsoleProgress::ConsoleProgress(std::chrono::milliseconds interval)
    : interval_(interval)
{
    // Detect if stdout is a terminal to decide how we render the progress
    isTerminalOutput_ = ::isatty(fileno(stdout));
}

void ConsoleProgress::start(const std::string &label, std::int64_t totalSize, std::int64_t alreadyStaged)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    Transfer &transfer = transfers_[label];
    transfer.startTime = now;
    transfer.lastPrinted = now;
    transfer.totalSize = totalSize;
    transfer.resumeOffset = alreadyStaged;
    transfer.downloaded = 0;

    if (alreadyStaged > 0)
    {
        fmt::print("{}: resuming at {}\n", label, formatBytes(alreadyStaged));
    }
}

void ConsoleProgress::advance(const std::string &label, std::size_t bytes)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = transfers_.find(label);
    if (it == transfers_.end())
    {
        return;
    }

    Transfer &transfer = it->second;
    transfer.downloaded += static_cast<std::int64_t>(bytes);

    // Throttle: at most one line per interval and transfer
    auto now = std::chrono::steady_clock::now();
    if (now - transfer.lastPrinted < interval_)
    {
        return;
    }

    printLine(label, transfer, now);
    transfer.lastPrinted = now;
}

void ConsoleProgress::finish(const std::string &label, bool success)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = transfers_.find(label);
    if (it == transfers_.end())
    {
        return;
    }

    if (success)
    {
        printLine(label, it->second, std::chrono::steady_clock::now());
    }
    transfers_.erase(it);
}

void ConsoleProgress::printLine(const std::string &label, const Transfer &transfer,
                                std::chrono::steady_clock::time_point now)
{
    // For resumed downloads add the resume offset to show actual total progress
    std::int64_t totalDownloaded = transfer.downloaded + transfer.resumeOffset;

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - transfer.startTime).count();

    // Speed of the current session only
    double speed = (elapsed > 0) ? static_cast<double>(transfer.downloaded) / elapsed : 0.0;

    std::string speedStr;
    if (speed >= 1024 * 1024)
    {
        speedStr = fmt::format("{:.2f} MB/s", speed / (1024.0 * 1024.0));
    }
    else if (speed >= 1024)
    {
        speedStr = fmt::format("{:.2f} KB/s", speed / 1024.0);
    }
    else
    {
        speedStr = fmt::format("{:.0f} B/s", speed);
    }

    // If we don't know the total size, show basic progress
    if (transfer.totalSize <= 0)
    {
        fmt::print("{}: {} | {} | Elapsed: {}\n", label, formatBytes(totalDownloaded), speedStr,
                   formatDuration(static_cast<long>(elapsed)));
        std::fflush(stdout);
        return;
    }

    double percentage = (static_cast<double>(totalDownloaded) / transfer.totalSize) * 100.0;
    long eta = (speed > 0) ? static_cast<long>((transfer.totalSize - totalDownloaded) / speed) : 0;

    if (isTerminalOutput_)
    {
        fmt::print("{} {:5.1f}% | {} / {} | {} | ETA: {} | {}\n",
                   renderBar(percentage),
                   percentage,
                   formatBytes(totalDownloaded),
                   formatBytes(transfer.totalSize),
                   speedStr,
                   formatDuration(eta),
                   label);
    }
    else
    {
        fmt::print("{}: {:.1f}% | {} / {} | {}\n",
                   label,
                   percentage,
                   formatBytes(totalDownloaded),
                   formatBytes(transfer.totalSize),
                   speedStr);
    }
    std::fflush(stdout);
}

std::string formatBytes(std::int64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes >= GB)
    {
        return fmt::format("{:.2f} GB", bytes / GB);
    }
    else if (bytes >= MB)
    {
        return fmt::format("{:.2f} MB", bytes / MB);
    }
    else if (bytes >= KB)
    {
        return fmt::format("{:.2f} KB", bytes / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

std::string formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        long minutes = seconds / 60;
        long secs = seconds % 60;
        return fmt::format("{}m {}s", minutes, secs);
    }
    else
    {
        long hours = seconds / 3600;
        long minutes = (seconds % 3600) / 60;
        return fmt::format("{}h {}m", hours, minutes);
    }
}

std::string renderBar(double percentage, int width)
{
    if (percentage < 0.0)
    {
        percentage = 0.0;
    }
    if (percentage > 100.0)
    {
        percentage = 100.0;
    }

    int filled = static_cast<int>((percentage / 100.0) * width);
    std::string bar = "[";
    for (int i = 0; i < width; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";
    return bar;
}
