#include "http_source.hpp"
#include "errors.hpp"
#include "http_client.hpp"

#include <fmt/core.h>

HttpSource::HttpSource(std::string url, std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout)
{
}

std::int64_t HttpSource::open(std::int64_t offset, ByteSink &sink, const CancellationToken &token)
{
    HttpRequest request;
    request.method = HttpRequest::Method::Get;
    request.url = url_;
    request.rangeFrom = offset;
    request.timeoutMs = static_cast<long>(timeout_.count());

    StreamStart start;

    HttpClient client;
    client.perform(
        request, token,
        [&](const HttpResponse &response)
        { start = beginStream(response, offset, sink, url_); },
        [&](const char *data, std::size_t length)
        {
            if (start.acceptBody)
            {
                sink.write(data, length);
            }
        });

    return start.totalSize;
}

std::int64_t HttpSource::size(const CancellationToken &token)
{
    HttpRequest request;
    request.method = HttpRequest::Method::Head;
    request.url = url_;
    request.timeoutMs = static_cast<long>(timeout_.count());

    HttpClient client;
    HttpResponse response = client.perform(request, token);

    if (response.status != 200)
    {
        throw XgetError(ErrorKind::Transport,
                        fmt::format("HEAD {}: unexpected status code: {} {}", url_,
                                    response.status, HttpClient::getHttpStatusText(response.status)));
    }

    std::int64_t length = response.contentLength();
    if (length < 0)
    {
        throw XgetError(ErrorKind::Transport,
                        fmt::format("HEAD {}: content-length header not present", url_));
    }
    return length;
}
