#pragma once

#include <cstdint>
#include <filesystem>

#include "config.hpp"
#include "source.hpp"

class CancellationToken;
class ProgressSink;

/**
 * Ephemeral per-task transfer bookkeeping.
 * Owned by one pipeline, never shared between tasks or threads.
 */
struct TransferState
{
    std::filesystem::path stagingPath;
    std::int64_t stagedBytes = 0; // Bytes found in the staging file at the start of an attempt
    int attempt = 0;
};

/**
 * Performs one resumable, verified download of one file.
 *
 * Per attempt: staged(partial) → verified → published, or failed.
 *   1. Resume from "<dest>.partial" if it holds bytes, else start empty.
 *      Staged bytes beyond the end of the object (size check or 416) are
 *      discarded and the stream restarts at 0
 *   2. Open the source at that offset and append every chunk
 *   3. SHA-256 the whole staging file
 *   4. Mismatch: delete the staging file (the bad byte position is unknown)
 *      Match: rename onto the destination, the only publish point
 * A cancelled or interrupted attempt keeps the staging file for resume.
 */
class TransferEngine
{
public:
    static constexpr const char *STAGING_SUFFIX = ".partial";

    /**
     * @param opener Creates the Source for a task's locator
     * @param progress Optional observer, may be nullptr
     */
    explicit TransferEngine(SourceOpener opener, ProgressSink *progress = nullptr);

    /**
     * Run one attempt.
     *
     * @throws XgetError Integrity on digest mismatch, Transport/Io on
     *         transfer failures, Config for unusable locators, Cancelled
     */
    void transfer(const FileTask &task, TransferState &state, const CancellationToken &token);

    /**
     * Fresh bookkeeping for a task.
     */
    static TransferState makeState(const FileTask &task);

    /**
     * Generate the staging filename for a destination path.
     *
     * @param destination Final destination path
     * @return Path with ".partial" appended
     */
    static std::filesystem::path makeStagingPath(const std::filesystem::path &destination);

    /**
     * Whether the destination already holds the expected content.
     *
     * @throws XgetError (ErrorKind::Config) if the destination is a directory
     */
    static bool destinationMatches(const FileTask &task);

    /**
     * Ensure the directory for a file path exists, creating it if needed.
     *
     * @throws XgetError (ErrorKind::Io) if it cannot be created
     */
    static void ensureDirectoryExists(const std::filesystem::path &filePath);

    /**
     * Delete a staging file if present. Failures are logged only.
     */
    static void removeStaging(const std::filesystem::path &stagingPath);

private:
    void reportFailure(const FileTask &task);
    static std::int64_t remoteSizeOf(Source &source, const CancellationToken &token);
    static void discardStaging(TransferState &state);

    SourceOpener opener_;
    ProgressSink *progress_;
};
