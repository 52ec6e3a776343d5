#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "retry.hpp"
#include "transfer_engine.hpp"

class AsyncCacheWriter;
class CancellationToken;
class ContentCache;
class ProgressSink;
class SourceResolver;

struct DownloadFailure
{
    ErrorKind kind;
    std::string message;
};

/**
 * Outcome of one task. Exactly one per task, in input order.
 */
struct DownloadResult
{
    FileTask task;
    std::optional<DownloadFailure> failure;

    bool ok() const { return !failure.has_value(); }
    bool cancelled() const { return failure && failure->kind == ErrorKind::Cancelled; }
};

/**
 * The full path of one task:
 *   1. Destination already matches → skip, no network I/O
 *   2. Cache hit → published from the cache
 *   3. Retry controller → transfer engine → source
 *   4. Source success → best-effort background cache store
 * Never throws: every failure lands in the result.
 */
class DownloadPipeline
{
public:
    /**
     * @param engine Transfer engine shared by all tasks (stateless per call)
     * @param policy Retry policy
     * @param cache Optional cache, nullptr disables it
     * @param cacheWriter Optional store queue, nullptr disables stores
     */
    DownloadPipeline(TransferEngine &engine, RetryPolicy policy,
                     ContentCache *cache = nullptr, AsyncCacheWriter *cacheWriter = nullptr);

    DownloadResult run(const FileTask &task, const CancellationToken &token);

private:
    bool tryCache(const FileTask &task, const CancellationToken &token);

    TransferEngine &engine_;
    RetryPolicy policy_;
    ContentCache *cache_;
    AsyncCacheWriter *cacheWriter_;
};

/**
 * Runs tasks with bounded concurrency.
 *
 * A fixed pool of min(parallel, N) workers claims task indices from an
 * atomic counter; each worker writes only the result slot it claimed.
 * Tasks claimed after the token fires get a cancellation result without
 * running their pipeline.
 */
class Scheduler
{
public:
    using TaskRunner = std::function<DownloadResult(const FileTask &, const CancellationToken &)>;

    explicit Scheduler(int parallel = DEFAULT_PARALLEL);

    std::vector<DownloadResult> run(const std::vector<FileTask> &tasks,
                                    const CancellationToken &token,
                                    const TaskRunner &runner) const;

    int parallel() const { return parallel_; }

private:
    int parallel_;
};

/**
 * Wires the whole engine together from a validated configuration.
 */
class Downloader
{
public:
    /**
     * @param config Validated configuration
     * @param progress Optional progress observer
     * @throws XgetError (ErrorKind::Config) if the cache alias is unusable
     */
    explicit Downloader(const DownloadConfig &config, ProgressSink *progress = nullptr);
    ~Downloader();

    Downloader(const Downloader &) = delete;
    Downloader &operator=(const Downloader &) = delete;

    /**
     * Download every file of the configuration.
     * Returns after all transfers finished and all cache stores drained.
     */
    std::vector<DownloadResult> run(const CancellationToken &token);

private:
    DownloadConfig config_;
    ProgressSink *progress_;
    std::unique_ptr<SourceResolver> resolver_;
    std::unique_ptr<ContentCache> cache_;
};

/**
 * True if no result carries an error (cancellation counts as an error).
 */
bool allSucceeded(const std::vector<DownloadResult> &results);
