#include "s3_client.hpp"
#include "cancellation.hpp"
#include "errors.hpp"

#include <cctype>
#include <cstdlib>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{
    constexpr const char *S3_SCHEME = "s3://";
    constexpr const char *DEFAULT_REGION = "us-east-1";

    std::string envOrEmpty(const char *name)
    {
        const char *value = std::getenv(name);
        return value ? std::string(value) : std::string();
    }

    std::string statusError(const char *method, const std::string &url, long status)
    {
        return fmt::format("{} {}: unexpected status code: {} {}", method, url, status,
                           HttpClient::getHttpStatusText(status));
    }
} // namespace

S3Locator parseS3Locator(const std::string &url)
{
    if (url.rfind(S3_SCHEME, 0) != 0)
    {
        throw XgetError(ErrorKind::Config, fmt::format("not an s3 locator: {}", url));
    }

    std::string withoutScheme = url.substr(std::char_traits<char>::length(S3_SCHEME));
    auto slashPos = withoutScheme.find('/');
    if (slashPos == std::string::npos || slashPos == 0 || slashPos + 1 >= withoutScheme.size())
    {
        throw XgetError(ErrorKind::Config,
                        fmt::format("invalid s3 URL format: {} (expected s3://alias/path)", url));
    }

    return S3Locator{withoutScheme.substr(0, slashPos), withoutScheme.substr(slashPos + 1)};
}

std::string encodeObjectKey(const std::string &key)
{
    static const char *hexDigits = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(key.size());
    for (char ch : key)
    {
        auto uch = static_cast<unsigned char>(ch);
        if (std::isalnum(uch) || ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == '/')
        {
            encoded += ch;
        }
        else
        {
            encoded += '%';
            encoded += hexDigits[uch >> 4];
            encoded += hexDigits[uch & 0x0F];
        }
    }
    return encoded;
}

S3Client::S3Client(AliasConfig alias, std::chrono::milliseconds timeout)
    : alias_(std::move(alias)), timeout_(timeout)
{
    // 1. Region: alias, then the usual AWS environment variables
    region_ = alias_.region;
    if (region_.empty())
    {
        region_ = envOrEmpty("AWS_REGION");
    }
    if (region_.empty())
    {
        region_ = envOrEmpty("AWS_DEFAULT_REGION");
    }
    if (region_.empty())
    {
        region_ = DEFAULT_REGION;
    }

    // 2. Addressing: an endpoint override always means path style
    if (!alias_.endpoint.empty())
    {
        std::string endpoint = alias_.endpoint;
        if (endpoint.find("://") == std::string::npos)
        {
            endpoint = "https://" + endpoint;
        }
        while (!endpoint.empty() && endpoint.back() == '/')
        {
            endpoint.pop_back();
        }
        baseUrl_ = endpoint + "/" + alias_.bucket;
    }
    else
    {
        baseUrl_ = fmt::format("https://{}.s3.{}.amazonaws.com", alias_.bucket, region_);
    }

    // 3. Credentials
    if (alias_.noSignRequest)
    {
        return;
    }
    if (alias_.hasStaticCredentials())
    {
        accessKey_ = alias_.accessKey;
        secretKey_ = alias_.secretKey;
        return;
    }

    accessKey_ = envOrEmpty("AWS_ACCESS_KEY_ID");
    secretKey_ = envOrEmpty("AWS_SECRET_ACCESS_KEY");
    sessionToken_ = envOrEmpty("AWS_SESSION_TOKEN");
    if (accessKey_.empty() || secretKey_.empty())
    {
        accessKey_.clear();
        secretKey_.clear();
        sessionToken_.clear();
        spdlog::debug("No credentials for bucket {}, sending unsigned requests", alias_.bucket);
    }
}

std::string S3Client::objectKey(const std::string &key) const
{
    return alias_.prefix + key;
}

std::string S3Client::objectUrl(const std::string &key) const
{
    return baseUrl_ + "/" + encodeObjectKey(objectKey(key));
}

HttpRequest S3Client::makeRequest(HttpRequest::Method method, const std::string &key) const
{
    HttpRequest request;
    request.method = method;
    request.url = objectUrl(key);
    request.timeoutMs = static_cast<long>(timeout_.count());

    if (isSigned())
    {
        request.awsSigV4 = fmt::format("aws:amz:{}:s3", region_);
        request.username = accessKey_;
        request.password = secretKey_;

        // S3 requires the payload hash header on signed requests
        request.headers.push_back("x-amz-content-sha256: UNSIGNED-PAYLOAD");
        if (!sessionToken_.empty())
        {
            request.headers.push_back("x-amz-security-token: " + sessionToken_);
        }
    }

    return request;
}

bool S3Client::exists(const std::string &key, const CancellationToken &token) const
{
    HttpRequest request = makeRequest(HttpRequest::Method::Head, key);

    HttpClient client;
    HttpResponse response = client.perform(request, token);

    if (response.status == 200)
    {
        return true;
    }
    if (response.status == 404)
    {
        return false;
    }
    throw XgetError(ErrorKind::Transport, statusError("HEAD", request.url, response.status));
}

std::int64_t S3Client::size(const std::string &key, const CancellationToken &token) const
{
    HttpRequest request = makeRequest(HttpRequest::Method::Head, key);

    HttpClient client;
    HttpResponse response = client.perform(request, token);

    if (response.status != 200)
    {
        throw XgetError(ErrorKind::Transport, statusError("HEAD", request.url, response.status));
    }

    std::int64_t length = response.contentLength();
    if (length < 0)
    {
        throw XgetError(ErrorKind::Transport,
                        fmt::format("HEAD {}: content length not available", request.url));
    }
    return length;
}

std::int64_t S3Client::get(const std::string &key, std::int64_t offset,
                           ByteSink &sink, const CancellationToken &token) const
{
    HttpRequest request = makeRequest(HttpRequest::Method::Get, key);

    // Open-ended range: from offset to the end of the object
    request.rangeFrom = offset;

    StreamStart start;

    HttpClient client;
    client.perform(
        request, token,
        [&](const HttpResponse &response)
        { start = beginStream(response, offset, sink, request.url); },
        [&](const char *data, std::size_t length)
        {
            if (start.acceptBody)
            {
                sink.write(data, length);
            }
        });

    return start.totalSize;
}

void S3Client::put(const std::string &key, const std::filesystem::path &file,
                   const CancellationToken &token) const
{
    HttpRequest request = makeRequest(HttpRequest::Method::Put, key);
    request.uploadFile = file;

    HttpClient client;
    HttpResponse response = client.perform(request, token);

    if (response.status != 200 && response.status != 201 && response.status != 204)
    {
        throw XgetError(ErrorKind::Transport, statusError("PUT", request.url, response.status));
    }
}

S3Source::S3Source(std::shared_ptr<const S3Client> client, std::string key)
    : client_(std::move(client)), key_(std::move(key))
{
}

std::int64_t S3Source::open(std::int64_t offset, ByteSink &sink, const CancellationToken &token)
{
    return client_->get(key_, offset, sink, token);
}

std::int64_t S3Source::size(const CancellationToken &token)
{
    return client_->size(key_, token);
}

std::string S3Source::describe() const
{
    return client_->objectUrl(key_);
}
