#include "cache.hpp"
#include "cancellation.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "file_sink.hpp"
#include "object_store.hpp"
#include "transfer_engine.hpp"

#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

static void removeQuietly(const std::filesystem::path &path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
    {
        spdlog::warn("Could not remove {}: {}", path.string(), ec.message());
    }
}

ObjectStoreCache::ObjectStoreCache(std::shared_ptr<const ObjectStore> store)
    : store_(std::move(store))
{
}

bool ObjectStoreCache::fetch(const std::string &digest, const std::filesystem::path &destination,
                             const CancellationToken &token)
{
    if (!store_->exists(digest, token))
    {
        return false;
    }

    TransferEngine::ensureDirectoryExists(destination);

    std::filesystem::path tempPath = destination;
    tempPath += TEMP_SUFFIX;

    try
    {
        FileSink sink(tempPath, 0, token);
        store_->get(digest, 0, sink, token);
        sink.close();
    }
    catch (const XgetError &)
    {
        removeQuietly(tempPath);
        throw;
    }

    std::string actual = ChecksumVerifier::computeSHA256(tempPath);
    if (actual != digest)
    {
        removeQuietly(tempPath);
        throw XgetError(ErrorKind::Integrity,
                        fmt::format("cache object {} is corrupt: got {}", digest, actual));
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, destination, ec);
    if (ec)
    {
        removeQuietly(tempPath);
        throw XgetError(ErrorKind::Io, fmt::format("Failed to rename {} to {}: {}", tempPath.string(),
                                                   destination.string(), ec.message()));
    }
    return true;
}

void ObjectStoreCache::store(const std::string &digest, const std::filesystem::path &file,
                             const CancellationToken &token)
{
    if (store_->exists(digest, token))
    {
        spdlog::debug("Cache already holds {}", digest);
        return;
    }

    store_->put(digest, file, token);
    spdlog::debug("Stored {} in cache", digest);
}

AsyncCacheWriter::AsyncCacheWriter(ContentCache &cache, const CancellationToken &token,
                                   std::size_t workers)
    : cache_(cache), token_(token), maxWorkers_(std::max<std::size_t>(1, workers))
{
}

AsyncCacheWriter::~AsyncCacheWriter()
{
    drain();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_.notify_all();
    for (auto &worker : workers_)
    {
        worker.join();
    }
}

void AsyncCacheWriter::schedule(const std::string &digest, const std::filesystem::path &file)
{
    std::unique_lock<std::mutex> lock(mutex_);
    try
    {
        queue_.push_back({digest, file});
        if (workers_.size() < maxWorkers_)
        {
            workers_.emplace_back(&AsyncCacheWriter::workerLoop, this);
        }
    }
    catch (const std::exception &e)
    {
        // Without any worker nothing would ever take the job
        if (workers_.empty() && !queue_.empty())
        {
            queue_.pop_back();
            spdlog::warn("Cache store of {} skipped: {}", digest, e.what());
            return;
        }
        spdlog::warn("Could not start another cache worker: {}", e.what());
    }
    lock.unlock();
    work_.notify_one();
}

void AsyncCacheWriter::workerLoop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;)
    {
        work_.wait(lock, [this]
                   { return stopping_ || !queue_.empty(); });
        if (queue_.empty())
        {
            return;
        }

        PendingStore store = std::move(queue_.front());
        queue_.pop_front();
        ++active_;
        lock.unlock();

        bool failed = false;
        try
        {
            cache_.store(store.digest, store.file, token_);
        }
        catch (const std::exception &e)
        {
            // Best effort: the download itself already succeeded
            spdlog::warn("Cache store of {} failed: {}", store.digest, e.what());
            failed = true;
        }

        lock.lock();
        --active_;
        if (failed)
        {
            ++failures_;
        }
        if (queue_.empty() && active_ == 0)
        {
            idle_.notify_all();
        }
    }
}

int AsyncCacheWriter::drain()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]
               { return queue_.empty() && active_ == 0; });

    int failures = failures_;
    failures_ = 0;
    return failures;
}
