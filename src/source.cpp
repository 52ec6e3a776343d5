#include "source.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "http_source.hpp"
#include "s3_client.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

SourceResolver::SourceResolver(const AliasTable &aliases, std::chrono::milliseconds timeout)
    : timeout_(timeout)
{
    for (const auto &[name, alias] : aliases)
    {
        clients_.emplace(name, std::make_shared<const S3Client>(alias, timeout));
    }
}

std::unique_ptr<Source> SourceResolver::resolve(const std::string &url) const
{
    if (url.rfind("s3://", 0) == 0)
    {
        S3Locator locator = parseS3Locator(url);
        return std::make_unique<S3Source>(client(locator.alias), locator.key);
    }

    if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0)
    {
        return std::make_unique<HttpSource>(url, timeout_);
    }

    throw XgetError(ErrorKind::Config, fmt::format("unsupported URL scheme: {}", url));
}

std::shared_ptr<const S3Client> SourceResolver::client(const std::string &alias) const
{
    auto it = clients_.find(alias);
    if (it == clients_.end())
    {
        throw XgetError(ErrorKind::Config, fmt::format("alias \"{}\" not found", alias));
    }
    return it->second;
}

SourceOpener SourceResolver::opener() const
{
    return [this](const std::string &url)
    { return resolve(url); };
}

StreamStart beginStream(const HttpResponse &response, std::int64_t offset,
                        ByteSink &sink, const std::string &what)
{
    StreamStart start;

    switch (response.status)
    {
    case 206:
    {
        // Partial content: total size from "Content-Range: bytes a-b/total"
        auto contentRange = response.header("content-range");
        auto total = contentRange ? parseContentRangeTotal(*contentRange) : std::nullopt;
        if (total)
        {
            start.totalSize = *total;
        }
        else
        {
            std::int64_t length = response.contentLength();
            start.totalSize = length >= 0 ? offset + length : -1;
        }
        sink.begin(offset, start.totalSize);
        return start;
    }

    case 200:
        // Full content. With offset > 0 the server ignored our range request.
        if (offset > 0)
        {
            spdlog::warn("{} ignored the range request, restarting from byte 0", what);
        }
        start.totalSize = response.contentLength();
        sink.begin(0, start.totalSize);
        return start;

    case 416:
    {
        // The staged prefix may already be the whole object
        auto contentRange = response.header("content-range");
        auto total = contentRange ? parseContentRangeTotal(*contentRange) : std::nullopt;
        if (offset > 0 && total && *total == offset)
        {
            start.totalSize = offset;
            start.acceptBody = false;
            sink.begin(offset, offset);
            return start;
        }
        if (offset > 0)
        {
            throw RangeNotSatisfiableError(
                fmt::format("{}: range starting at byte {} not satisfiable (object size {})", what, offset,
                            total ? std::to_string(*total) : std::string("unknown")));
        }
        break;
    }

    default:
        break;
    }

    throw XgetError(ErrorKind::Transport,
                    fmt::format("{}: unexpected status code: {} {}", what, response.status,
                                HttpClient::getHttpStatusText(response.status)));
}
