#pragma once

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "config.hpp"

class CancellationToken;
class S3Client;
struct HttpResponse;

/**
 * Receiver of a source's byte stream.
 * Chunks arrive strictly in order from a single thread.
 */
class ByteSink
{
public:
    virtual ~ByteSink() = default;

    /**
     * Called once, before the first chunk.
     *
     * @param startOffset Position of the first byte that will be written.
     *                    Equal to the requested offset, or 0 when the remote
     *                    side ignored the range and sends the whole object.
     * @param totalSize Size of the whole object, or -1 if unknown
     */
    virtual void begin(std::int64_t startOffset, std::int64_t totalSize) = 0;

    /**
     * Consume one chunk. Throwing aborts the transfer.
     */
    virtual void write(const char *data, std::size_t length) = 0;
};

/**
 * A remote object that can be streamed from an arbitrary offset.
 * Implemented for HTTP(S) URLs and S3-compatible object stores.
 */
class Source
{
public:
    virtual ~Source() = default;

    /**
     * Stream the object from `offset` to its end into `sink`.
     * Observes the token at every chunk and while waiting on the network.
     *
     * @return Total size of the object, or -1 if the remote side did not say
     * @throws XgetError on transport, status, or cancellation failures
     */
    virtual std::int64_t open(std::int64_t offset, ByteSink &sink, const CancellationToken &token) = 0;

    /**
     * Size of the object without transferring its body.
     * @throws XgetError if the size cannot be determined
     */
    virtual std::int64_t size(const CancellationToken &token) = 0;

    /**
     * Locator of the object, for logs and error messages.
     */
    virtual std::string describe() const = 0;
};

/**
 * Factory turning a source locator into a Source.
 */
using SourceOpener = std::function<std::unique_ptr<Source>(const std::string &url)>;

/**
 * Resolves source locators against the alias table.
 *
 * Owns one S3 client per alias, all created up front. Everything is
 * read-only after construction and safe to share between pipelines.
 */
class SourceResolver
{
public:
    /**
     * @param aliases Source endpoint table
     * @param timeout Per-request timeout, 0 = none
     */
    SourceResolver(const AliasTable &aliases, std::chrono::milliseconds timeout);

    /**
     * Create the Source for a locator.
     *
     * @param url http://, https:// or s3://alias/key
     * @throws XgetError (ErrorKind::Config) for unknown aliases, malformed
     *         locators, or unsupported schemes
     */
    std::unique_ptr<Source> resolve(const std::string &url) const;

    /**
     * @throws XgetError (ErrorKind::Config) if the alias is not configured
     */
    std::shared_ptr<const S3Client> client(const std::string &alias) const;

    /**
     * Bind resolve() into a SourceOpener. The resolver must outlive it.
     */
    SourceOpener opener() const;

private:
    std::map<std::string, std::shared_ptr<const S3Client>> clients_;
    std::chrono::milliseconds timeout_;
};

/**
 * How a GET response should be consumed.
 */
struct StreamStart
{
    std::int64_t totalSize = -1;
    bool acceptBody = true;
};

/**
 * Validate a (possibly ranged) GET response and announce the stream to the sink.
 *
 * - 206: total from Content-Range, else offset + Content-Length
 * - 200: whole object; if a range was requested the server ignored it and
 *        the sink is told the stream restarts at 0
 * - 416 for a range starting exactly at the end of the object: nothing left
 *        to send, the body is an error document and must be discarded
 *
 * @throws RangeNotSatisfiableError for any other 416 on a resumed request
 * @throws XgetError (ErrorKind::Transport) for any other status
 */
StreamStart beginStream(const HttpResponse &response, std::int64_t offset,
                        ByteSink &sink, const std::string &what);
