#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "source.hpp"

class CancellationToken;
class ProgressSink;

/**
 * ByteSink writing into a local file with append-only semantics.
 *
 * Opened in append mode when resuming (existing bytes are never touched),
 * truncated otherwise. If the remote side restarts the stream at byte 0 the
 * file is truncated before the first chunk. Checks the cancellation token
 * at every chunk boundary.
 */
class FileSink : public ByteSink
{
public:
    /**
     * @param path File to write
     * @param existingBytes Bytes already in the file to keep (0 = start fresh)
     * @param token Cancellation observed on every chunk
     * @param progress Optional observer
     * @param label Progress label (usually the destination path)
     * @throws XgetError (ErrorKind::Io) if the file cannot be opened
     */
    FileSink(std::filesystem::path path, std::int64_t existingBytes,
             const CancellationToken &token,
             ProgressSink *progress = nullptr, std::string label = {});

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void begin(std::int64_t startOffset, std::int64_t totalSize) override;
    void write(const char *data, std::size_t length) override;

    /**
     * Flush and close the file.
     * @throws XgetError (ErrorKind::Io) if buffered data cannot be written
     */
    void close();

    /**
     * Size of the file: kept bytes plus everything written since.
     */
    std::int64_t size() const { return size_; }

private:
    void open(std::ios::openmode mode);

    std::filesystem::path path_;
    std::ofstream out_;
    std::int64_t size_ = 0;
    const CancellationToken &token_;
    ProgressSink *progress_;
    std::string label_;
};

/**
 * Check if there's enough disk space for a download.
 * Skips the check when the size is unknown or the filesystem cannot be queried.
 *
 * @param filePath Path where file will be saved
 * @param requiredBytes Number of bytes still to be written
 * @throws XgetError (ErrorKind::Io) if the space is insufficient
 */
void checkDiskSpace(const std::filesystem::path &filePath, std::int64_t requiredBytes);
