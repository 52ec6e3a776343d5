#include "downloader.hpp"
#include "cache.hpp"
#include "cancellation.hpp"
#include "s3_client.hpp"
#include "source.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

#include <spdlog/spdlog.h>

DownloadPipeline::DownloadPipeline(TransferEngine &engine, RetryPolicy policy,
                                   ContentCache *cache, AsyncCacheWriter *cacheWriter)
    : engine_(engine), policy_(std::move(policy)), cache_(cache), cacheWriter_(cacheWriter)
{
}

DownloadResult DownloadPipeline::run(const FileTask &task, const CancellationToken &token)
{
    DownloadResult result{task, std::nullopt};

    try
    {
        token.throwIfCancelled();

        // 1. Nothing to do if the destination already holds the content
        if (TransferEngine::destinationMatches(task))
        {
            spdlog::info("{} is up to date, skipping", task.destination);
            TransferEngine::removeStaging(TransferEngine::makeStagingPath(task.destination));
            return result;
        }

        // 2. Content-addressable cache
        if (cache_ && tryCache(task, token))
        {
            spdlog::info("{} restored from cache", task.destination);
            TransferEngine::removeStaging(TransferEngine::makeStagingPath(task.destination));
            return result;
        }

        // 3. Source, with retries
        RetryController controller(policy_, engine_);
        int attempts = controller.run(task, token);
        spdlog::info("{} downloaded ({} {})", task.destination, attempts,
                     attempts == 1 ? "attempt" : "attempts");

        // 4. Populate the cache for the next run
        if (cacheWriter_)
        {
            cacheWriter_->schedule(task.sha256, task.destination);
        }
    }
    catch (const XgetError &e)
    {
        result.failure = DownloadFailure{e.kind(), e.what()};
    }
    catch (const std::exception &e)
    {
        result.failure = DownloadFailure{ErrorKind::Io, e.what()};
    }

    return result;
}

bool DownloadPipeline::tryCache(const FileTask &task, const CancellationToken &token)
{
    try
    {
        return cache_->fetch(task.sha256, task.destination, token);
    }
    catch (const XgetError &e)
    {
        if (e.isCancelled())
        {
            throw;
        }
        // Cache problems degrade to a miss
        spdlog::warn("Cache lookup for {} failed, using source: {}", task.destination, e.what());
        return false;
    }
}

Scheduler::Scheduler(int parallel)
    : parallel_(std::max(1, parallel))
{
}

std::vector<DownloadResult> Scheduler::run(const std::vector<FileTask> &tasks,
                                           const CancellationToken &token,
                                           const TaskRunner &runner) const
{
    std::vector<DownloadResult> results(tasks.size());
    if (tasks.empty())
    {
        return results;
    }

    std::atomic<std::size_t> next{0};

    auto worker = [&]()
    {
        for (;;)
        {
            std::size_t index = next.fetch_add(1);
            if (index >= tasks.size())
            {
                return;
            }

            const FileTask &task = tasks[index];
            if (token.isCancelled())
            {
                results[index] = DownloadResult{task, DownloadFailure{ErrorKind::Cancelled, "download cancelled"}};
                continue;
            }

            try
            {
                results[index] = runner(task, token);
            }
            catch (const std::exception &e)
            {
                // An escaping exception must not take down the other workers
                results[index] = DownloadResult{task, DownloadFailure{ErrorKind::Io, e.what()}};
            }
        }
    };

    std::size_t workerCount = std::min(tasks.size(), static_cast<std::size_t>(parallel_));
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i)
    {
        workers.emplace_back(worker);
    }
    for (auto &thread : workers)
    {
        thread.join();
    }

    return results;
}

Downloader::Downloader(const DownloadConfig &config, ProgressSink *progress)
    : config_(config), progress_(progress)
{
    resolver_ = std::make_unique<SourceResolver>(config_.aliases, config_.settings.timeout);

    if (config_.cache.enabled)
    {
        cache_ = std::make_unique<ObjectStoreCache>(resolver_->client(config_.cache.alias));
    }
}

Downloader::~Downloader() = default;

std::vector<DownloadResult> Downloader::run(const CancellationToken &token)
{
    TransferEngine engine(resolver_->opener(), progress_);
    RetryPolicy policy = RetryPolicy::fromSettings(config_.settings);

    std::unique_ptr<AsyncCacheWriter> writer;
    if (cache_)
    {
        // Uploads share the transfer concurrency bound
        writer = std::make_unique<AsyncCacheWriter>(*cache_, token,
                                                    static_cast<std::size_t>(std::max(1, config_.settings.parallel)));
    }

    DownloadPipeline pipeline(engine, policy, cache_.get(), writer.get());
    Scheduler scheduler(config_.settings.parallel);

    spdlog::debug("Downloading {} files with {} workers", config_.files.size(), scheduler.parallel());

    auto results = scheduler.run(config_.files, token,
                                 [&pipeline](const FileTask &task, const CancellationToken &t)
                                 { return pipeline.run(task, t); });

    if (writer)
    {
        int failed = writer->drain();
        if (failed > 0)
        {
            spdlog::warn("{} cache {} failed", failed, failed == 1 ? "store" : "stores");
        }
    }

    return results;
}

bool allSucceeded(const std::vector<DownloadResult> &results)
{
    return std::all_of(results.begin(), results.end(),
                       [](const DownloadResult &result)
                       { return result.ok(); });
}
