#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

class ByteSink;
class CancellationToken;

/**
 * Flat key/value blob store, as offered by an S3 bucket.
 * Implementations are immutable and shared between threads.
 */
class ObjectStore
{
public:
    virtual ~ObjectStore() = default;

    /**
     * @return false if no object is stored under `key`
     * @throws XgetError (ErrorKind::Transport) if the store cannot tell
     */
    virtual bool exists(const std::string &key, const CancellationToken &token) const = 0;

    /**
     * Stream the object from `offset` to its end into `sink`.
     * @return Total object size, -1 if unknown
     */
    virtual std::int64_t get(const std::string &key, std::int64_t offset,
                             ByteSink &sink, const CancellationToken &token) const = 0;

    /**
     * Upload a local file as the object body.
     */
    virtual void put(const std::string &key, const std::filesystem::path &file,
                     const CancellationToken &token) const = 0;
};
