#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "config.hpp"
#include "http_client.hpp"
#include "object_store.hpp"
#include "source.hpp"

/**
 * Parsed "s3://alias/key" locator.
 */
struct S3Locator
{
    std::string alias;
    std::string key;
};

/**
 * Split an s3:// locator into alias and key.
 * @throws XgetError (ErrorKind::Config) if the locator has no alias or key
 */
S3Locator parseS3Locator(const std::string &url);

/**
 * Percent-encode an object key for use in a URL path ('/' is kept).
 */
std::string encodeObjectKey(const std::string &key);

/**
 * Minimal S3 REST client for one alias: GET (ranged), HEAD and PUT.
 *
 * Addressing:
 *   - endpoint override → path style, <endpoint>/<bucket>/<key>
 *   - no endpoint       → AWS virtual-hosted style
 * Authentication, in order of precedence:
 *   - no_sign_request   → anonymous, unsigned
 *   - access/secret key → Signature V4 with static credentials
 *   - AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY (+ AWS_SESSION_TOKEN)
 *   - otherwise unsigned
 *
 * Immutable after construction; every call uses its own HttpClient, so one
 * instance is shared by all pipelines.
 */
class S3Client : public ObjectStore
{
public:
    S3Client(AliasConfig alias, std::chrono::milliseconds timeout);

    const AliasConfig &alias() const { return alias_; }
    const std::string &region() const { return region_; }
    bool isSigned() const { return !accessKey_.empty(); }

    /**
     * Alias prefix + key.
     */
    std::string objectKey(const std::string &key) const;

    /**
     * Full request URL of an object (prefix applied, key encoded).
     */
    std::string objectUrl(const std::string &key) const;

    /**
     * HEAD the object.
     * @return false on 404, true on 200
     * @throws XgetError (ErrorKind::Transport) for any other outcome
     */
    bool exists(const std::string &key, const CancellationToken &token) const override;

    /**
     * HEAD the object and return its Content-Length.
     */
    std::int64_t size(const std::string &key, const CancellationToken &token) const;

    /**
     * GET the object from `offset` to its end ("Range: bytes=<offset>-").
     * @return Total object size, -1 if unknown
     */
    std::int64_t get(const std::string &key, std::int64_t offset,
                     ByteSink &sink, const CancellationToken &token) const override;

    /**
     * PUT a local file as the object body.
     */
    void put(const std::string &key, const std::filesystem::path &file,
             const CancellationToken &token) const override;

private:
    HttpRequest makeRequest(HttpRequest::Method method, const std::string &key) const;

    AliasConfig alias_;
    std::chrono::milliseconds timeout_;
    std::string region_;
    std::string baseUrl_; // Scheme + host, plus "/bucket" for path style
    std::string accessKey_;
    std::string secretKey_;
    std::string sessionToken_;
};

/**
 * One object of an S3-compatible store, reached through its alias client.
 */
class S3Source : public Source
{
public:
    S3Source(std::shared_ptr<const S3Client> client, std::string key);

    std::int64_t open(std::int64_t offset, ByteSink &sink, const CancellationToken &token) override;
    std::int64_t size(const CancellationToken &token) override;
    std::string describe() const override;

private:
    std::shared_ptr<const S3Client> client_;
    std::string key_;
};
