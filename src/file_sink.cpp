#include "file_sink.hpp"
#include "cancellation.hpp"
#include "errors.hpp"
#include "progress.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

FileSink::FileSink(std::filesystem::path path, std::int64_t existingBytes,
                   const CancellationToken &token,
                   ProgressSink *progress, std::string label)
    : path_(std::move(path)), token_(token), progress_(progress), label_(std::move(label))
{
    // Append mode: write at end of file. Truncate mode: start from scratch.
    if (existingBytes > 0)
    {
        open(std::ios::binary | std::ios::app);
        size_ = existingBytes;
    }
    else
    {
        open(std::ios::binary | std::ios::trunc);
        size_ = 0;
    }
}

void FileSink::open(std::ios::openmode mode)
{
    out_.open(path_, mode);
    if (!out_)
    {
        throw XgetError(ErrorKind::Io,
                        fmt::format("Cannot open file for writing: {}", path_.string()));
    }
}

void FileSink::begin(std::int64_t startOffset, std::int64_t totalSize)
{
    // The remote side sends the whole object although we asked for a suffix:
    // the kept prefix must go, or the object would be duplicated on disk
    if (startOffset != size_)
    {
        if (startOffset != 0)
        {
            throw XgetError(ErrorKind::Transport,
                            fmt::format("stream for {} starts at byte {}, expected {}",
                                        path_.string(), startOffset, size_));
        }
        out_.close();
        open(std::ios::binary | std::ios::trunc);
        size_ = 0;
    }

    if (totalSize > 0)
    {
        checkDiskSpace(path_, totalSize - size_);
    }

    if (progress_)
    {
        progress_->start(label_, totalSize, size_);
    }
}

void FileSink::write(const char *data, std::size_t length)
{
    token_.throwIfCancelled();

    out_.write(data, static_cast<std::streamsize>(length));
    if (!out_.good())
    {
        throw XgetError(ErrorKind::Io, fmt::format("Write failed: {}", path_.string()));
    }
    size_ += static_cast<std::int64_t>(length);

    if (progress_)
    {
        progress_->advance(label_, length);
    }
}

void FileSink::close()
{
    if (!out_.is_open())
    {
        return;
    }
    out_.close();
    if (out_.fail())
    {
        throw XgetError(ErrorKind::Io, fmt::format("Cannot close {}", path_.string()));
    }
}

void checkDiskSpace(const std::filesystem::path &filePath, std::int64_t requiredBytes)
{
    // If size is unknown (0 or negative), skip the check
    if (requiredBytes <= 0)
    {
        return;
    }

    // Get the directory where file will be saved
    auto directory = filePath.parent_path();
    if (directory.empty())
    {
        directory = "."; // Current directory
    }

    std::error_code ec;
    auto spaceInfo = std::filesystem::space(directory, ec);
    if (ec)
    {
        // Some filesystems don't support space queries
        spdlog::warn("Unable to check disk space in {}: {}", directory.string(), ec.message());
        return;
    }

    // Add 10% buffer to be safe (some filesystems reserve space)
    std::int64_t requiredWithBuffer = requiredBytes + (requiredBytes / 10);

    if (spaceInfo.available < static_cast<std::uintmax_t>(requiredWithBuffer))
    {
        throw XgetError(ErrorKind::Io,
                        fmt::format("Insufficient disk space: need {} (+ 10% buffer) but only {} available",
                                    formatBytes(requiredBytes),
                                    formatBytes(static_cast<std::int64_t>(spaceInfo.available))));
    }
}
