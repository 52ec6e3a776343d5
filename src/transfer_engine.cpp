#include "transfer_engine.hpp"
#include "cancellation.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "file_sink.hpp"
#include "progress.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

TransferEngine::TransferEngine(SourceOpener opener, ProgressSink *progress)
    : opener_(std::move(opener)), progress_(progress)
{
}

TransferState TransferEngine::makeState(const FileTask &task)
{
    TransferState state;
    state.stagingPath = makeStagingPath(task.destination);
    return state;
}

void TransferEngine::transfer(const FileTask &task, TransferState &state, const CancellationToken &token)
{
    const std::filesystem::path finalPath(task.destination);
    if (state.stagingPath.empty())
    {
        state.stagingPath = makeStagingPath(finalPath);
    }
    ++state.attempt;

    token.throwIfCancelled();

    // 1. Ensure destination directory exists
    ensureDirectoryExists(finalPath);

    // 2. Check if the staging file holds bytes from a previous attempt or run
    std::error_code ec;
    state.stagedBytes = 0;
    if (std::filesystem::is_regular_file(state.stagingPath, ec))
    {
        auto size = std::filesystem::file_size(state.stagingPath, ec);
        if (!ec && size > 0)
        {
            state.stagedBytes = static_cast<std::int64_t>(size);
            spdlog::info("Resuming {} at byte {}", task.destination, state.stagedBytes);
        }
    }

    // 3. Resolve the source; configuration problems surface here
    std::unique_ptr<Source> source = opener_(task.url);

    // 4. A staging file longer than the object cannot be a prefix of it
    if (state.stagedBytes > 0)
    {
        std::int64_t remoteSize = remoteSizeOf(*source, token);
        if (remoteSize >= 0 && remoteSize < state.stagedBytes)
        {
            spdlog::warn("{} holds {} bytes but {} has only {}, restarting from byte 0",
                         state.stagingPath.string(), state.stagedBytes, source->describe(), remoteSize);
            discardStaging(state);
        }
    }

    // 5. Stream into the staging file (append only, single writer)
    std::int64_t totalSize = -1;
    std::int64_t received = 0;
    for (;;)
    {
        FileSink sink(state.stagingPath, state.stagedBytes, token, progress_, task.destination);
        try
        {
            totalSize = source->open(state.stagedBytes, sink, token);
            sink.close();
            received = sink.size();
            break;
        }
        catch (const RangeNotSatisfiableError &e)
        {
            // Staged bytes beyond the end of the object: start over once
            if (state.stagedBytes == 0)
            {
                reportFailure(task);
                throw;
            }
            spdlog::warn("{}, discarding {}", e.what(), state.stagingPath.string());
            discardStaging(state);
        }
        catch (const XgetError &)
        {
            // Staged bytes stay on disk: the next attempt resumes from them
            reportFailure(task);
            throw;
        }
    }

    // 6. The stream ended early: keep what we have and let a retry resume
    if (totalSize >= 0 && received < totalSize)
    {
        reportFailure(task);
        throw XgetError(ErrorKind::Transport,
                        fmt::format("transfer of {} ended early: {} of {} bytes",
                                    source->describe(), received, totalSize));
    }

    // 7. Verify the entire staging file, not just the newly transferred tail
    std::string actual = ChecksumVerifier::computeSHA256(state.stagingPath);
    if (actual != task.sha256)
    {
        discardStaging(state);
        reportFailure(task);
        throw XgetError(ErrorKind::Integrity,
                        fmt::format("checksum mismatch for {}: expected {}, got {}",
                                    task.destination, task.sha256, actual));
    }

    // 8. Success! Rename staging file to final filename (atomic operation)
    std::filesystem::rename(state.stagingPath, finalPath, ec);
    if (ec)
    {
        reportFailure(task);
        throw XgetError(ErrorKind::Io,
                        fmt::format("Download succeeded but failed to rename {} to {}: {}",
                                    state.stagingPath.string(), finalPath.string(), ec.message()));
    }

    if (progress_)
    {
        progress_->finish(task.destination, true);
    }
}

void TransferEngine::reportFailure(const FileTask &task)
{
    if (progress_)
    {
        progress_->finish(task.destination, false);
    }
}

std::int64_t TransferEngine::remoteSizeOf(Source &source, const CancellationToken &token)
{
    try
    {
        return source.size(token);
    }
    catch (const XgetError &e)
    {
        if (e.isCancelled())
        {
            throw;
        }
        // Not every server answers HEAD; the ranged GET still catches a short object
        spdlog::debug("Size of {} unavailable: {}", source.describe(), e.what());
        return -1;
    }
}

void TransferEngine::discardStaging(TransferState &state)
{
    removeStaging(state.stagingPath);
    state.stagedBytes = 0;
}

void TransferEngine::removeStaging(const std::filesystem::path &stagingPath)
{
    std::error_code ec;
    std::filesystem::remove(stagingPath, ec);
    if (ec)
    {
        spdlog::warn("Could not remove {}: {}", stagingPath.string(), ec.message());
    }
}

std::filesystem::path TransferEngine::makeStagingPath(const std::filesystem::path &destination)
{
    // Simply append the suffix to the filename
    std::filesystem::path stagingPath = destination;
    stagingPath += STAGING_SUFFIX;
    return stagingPath;
}

bool TransferEngine::destinationMatches(const FileTask &task)
{
    std::error_code ec;
    auto status = std::filesystem::status(task.destination, ec);
    if (ec || !std::filesystem::exists(status))
    {
        return false;
    }

    if (std::filesystem::is_directory(status))
    {
        throw XgetError(ErrorKind::Config,
                        fmt::format("destination {} is a directory", task.destination));
    }

    return ChecksumVerifier::computeSHA256(task.destination) == task.sha256;
}

void TransferEngine::ensureDirectoryExists(const std::filesystem::path &filePath)
{
    // Get the parent directory of the file
    auto directory = filePath.parent_path();

    // If parent directory is empty (file in current dir), nothing to create
    if (directory.empty())
    {
        return;
    }

    // Create all parent directories (like mkdir -p)
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        throw XgetError(ErrorKind::Io,
                        fmt::format("Failed to create directory for {}: {}",
                                    filePath.string(), ec.message()));
    }
}
