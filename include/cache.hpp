#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class CancellationToken;
class ObjectStore;

/**
 * Content-addressable store keyed by SHA-256 digest.
 * Optional: every failure is a cache miss for the caller.
 */
class ContentCache
{
public:
    virtual ~ContentCache() = default;

    /**
     * Fetch the object stored under `digest` into `destination`.
     * The bytes are verified before anything appears at the destination.
     *
     * @return false if the cache does not hold the digest
     * @throws XgetError Integrity if the cached bytes do not match,
     *         Transport/Io for other failures, Cancelled
     */
    virtual bool fetch(const std::string &digest, const std::filesystem::path &destination,
                       const CancellationToken &token) = 0;

    /**
     * Upload `file` under `digest` unless the cache already holds it.
     */
    virtual void store(const std::string &digest, const std::filesystem::path &file,
                       const CancellationToken &token) = 0;
};

/**
 * Cache living in an object store (an S3-compatible bucket), one object
 * per digest. The alias prefix applies.
 *
 * fetch(): HEAD, GET into "<dest>.cache", verify, rename onto the destination.
 * store(): HEAD, PUT only if the digest is not stored yet.
 */
class ObjectStoreCache : public ContentCache
{
public:
    static constexpr const char *TEMP_SUFFIX = ".cache";

    explicit ObjectStoreCache(std::shared_ptr<const ObjectStore> store);

    bool fetch(const std::string &digest, const std::filesystem::path &destination,
               const CancellationToken &token) override;
    void store(const std::string &digest, const std::filesystem::path &file,
               const CancellationToken &token) override;

private:
    std::shared_ptr<const ObjectStore> store_;
};

/**
 * Runs cache stores in the background on at most `workers` threads.
 * Workers start on demand. Failures are logged and counted, never thrown;
 * drain() waits until the queue is empty and every store has finished.
 */
class AsyncCacheWriter
{
public:
    AsyncCacheWriter(ContentCache &cache, const CancellationToken &token, std::size_t workers = 1);
    ~AsyncCacheWriter();

    AsyncCacheWriter(const AsyncCacheWriter &) = delete;
    AsyncCacheWriter &operator=(const AsyncCacheWriter &) = delete;

    /**
     * Queue a store. Never throws: a store that cannot be queued is
     * logged and dropped.
     */
    void schedule(const std::string &digest, const std::filesystem::path &file);

    /**
     * Wait for every scheduled store.
     * @return Number of stores that failed since the previous drain()
     */
    int drain();

    std::size_t maxWorkers() const { return maxWorkers_; }

private:
    struct PendingStore
    {
        std::string digest;
        std::filesystem::path file;
    };

    void workerLoop();

    ContentCache &cache_;
    const CancellationToken &token_;
    std::size_t maxWorkers_;

    std::mutex mutex_;
    std::condition_variable work_;
    std::condition_variable idle_;
    std::deque<PendingStore> queue_;
    std::vector<std::thread> workers_;
    std::size_t active_ = 0;
    int failures_ = 0;
    bool stopping_ = false;
};
