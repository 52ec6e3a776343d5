#include "http_client.hpp"
#include "cancellation.hpp"
#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{
    const char *methodName(HttpRequest::Method method)
    {
        switch (method)
        {
        case HttpRequest::Method::Get:
            return "GET";
        case HttpRequest::Method::Head:
            return "HEAD";
        case HttpRequest::Method::Put:
            return "PUT";
        }
        return "?";
    }

    std::string trim(const std::string &text)
    {
        auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    std::string toLower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }
} // namespace

std::int64_t HttpResponse::contentLength() const
{
    auto value = header("content-length");
    if (!value)
    {
        return -1;
    }
    try
    {
        return std::stoll(*value);
    }
    catch (const std::exception &)
    {
        return -1;
    }
}

std::optional<std::string> HttpResponse::header(const std::string &name) const
{
    auto it = headers.find(toLower(name));
    if (it == headers.end())
    {
        return std::nullopt;
    }
    return it->second;
}

HttpClient::HttpClient() : curl_(curl_easy_init(), curl_easy_cleanup)
{
    if (!curl_)
    {
        throw XgetError(ErrorKind::Transport, "Failed to initialize CURL (out of memory or library error)");
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

void HttpClient::globalInit()
{
    static std::once_flag once;
    std::call_once(once, []
                   {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw XgetError(ErrorKind::Io, "curl_global_init failed");
        } });
}

HttpResponse HttpClient::perform(const HttpRequest &request,
                                 const CancellationToken &token,
                                 const ResponseHandler &onResponse,
                                 const BodyHandler &onBody)
{
    token.throwIfCancelled();

    CURL *curl = curl_.get();
    curl_easy_reset(curl);

    TransferContext context;
    context.token = &token;
    context.onResponse = onResponse ? &onResponse : nullptr;
    context.onBody = onBody ? &onBody : nullptr;
    context.curl = curl;

    char errorBuffer[CURL_ERROR_SIZE] = {0};

    // 1. Set URL and identify ourselves (some servers block requests without one)
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, XGET_USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);

    // Worker threads must not get SIGALRM from DNS timeouts
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // 2. Body and header callbacks
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &context);

    // 3. HTTPS settings (CRITICAL for security)
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L); // Verify server certificate
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L); // Verify hostname matches cert

    // 4. Follow HTTP redirects (e.g., http://example.com -> https://example.com)
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L); // Limit redirect chain

    // 5. Timeouts
    if (request.timeoutMs > 0)
    {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeoutMs);
    }
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L); // 30s to establish connection

    // 6. Progress callback observes the cancellation token even while idle
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);

    // 7. Method
    std::ifstream uploadStream;
    switch (request.method)
    {
    case HttpRequest::Method::Head:
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        break;
    case HttpRequest::Method::Get:
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        break;
    case HttpRequest::Method::Put:
    {
        uploadStream.open(request.uploadFile, std::ios::binary);
        if (!uploadStream)
        {
            throw XgetError(ErrorKind::Io,
                            fmt::format("Cannot open file for upload: {}", request.uploadFile.string()));
        }
        std::error_code ec;
        auto size = std::filesystem::file_size(request.uploadFile, ec);
        if (ec)
        {
            throw XgetError(ErrorKind::Io,
                            fmt::format("Cannot stat {}: {}", request.uploadFile.string(), ec.message()));
        }
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
        curl_easy_setopt(curl, CURLOPT_READDATA, &uploadStream);
        curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        break;
    }
    }

    // 8. Resume: CURLOPT_RANGE rather than CURLOPT_RESUME_FROM_LARGE, so a
    // server that ignores the range (200 instead of 206) is reported to the
    // caller instead of failing inside libcurl
    std::string range;
    if (request.rangeFrom > 0)
    {
        range = fmt::format("{}-", request.rangeFrom);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }

    // 9. Extra headers
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList(nullptr, curl_slist_free_all);
    for (const auto &header : request.headers)
    {
        curl_slist *appended = curl_slist_append(headerList.get(), header.c_str());
        if (!appended)
        {
            throw XgetError(ErrorKind::Transport, "curl_slist_append failed");
        }
        // Appending to an existing list returns the same head
        if (!headerList)
        {
            headerList.reset(appended);
        }
    }
    if (headerList)
    {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.get());
    }

    // 10. AWS Signature V4 (S3 requests with credentials)
    if (!request.awsSigV4.empty())
    {
        curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, request.awsSigV4.c_str());
        curl_easy_setopt(curl, CURLOPT_USERNAME, request.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, request.password.c_str());
    }

    spdlog::debug("{} {}{}", methodName(request.method), request.url,
                  range.empty() ? std::string() : fmt::format(" (Range: bytes={})", range));

    CURLcode res = curl_easy_perform(curl);

    // A handler failure (checksum sink, unexpected status, ...) wins over
    // the generic write error libcurl reports for it
    if (context.failure)
    {
        std::rethrow_exception(context.failure);
    }

    if (res != CURLE_OK)
    {
        if (token.isCancelled())
        {
            throw XgetError(ErrorKind::Cancelled, "download cancelled");
        }
        std::string detail = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(res);
        throw XgetError(classifyError(res),
                        fmt::format("{} {}: {}", methodName(request.method), request.url, detail));
    }

    // Empty bodies never reach writeCallback
    if (!context.responseDispatched)
    {
        dispatchResponse(context);
    }

    return context.response;
}

void HttpClient::dispatchResponse(TransferContext &context)
{
    long status = 0;
    curl_easy_getinfo(context.curl, CURLINFO_RESPONSE_CODE, &status);
    context.response.status = status;
    context.responseDispatched = true;

    if (context.onResponse)
    {
        (*context.onResponse)(context.response);
    }
}

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    // Calculate total bytes in this chunk
    size_t totalSize = size * nmemb;

    auto *context = static_cast<TransferContext *>(userdata);

    // Exceptions must not unwind through libcurl: park them for perform()
    try
    {
        context->token->throwIfCancelled();

        if (!context->responseDispatched)
        {
            dispatchResponse(*context);
        }

        if (context->onBody)
        {
            (*context->onBody)(ptr, totalSize);
        }
    }
    catch (...)
    {
        context->failure = std::current_exception();
        return 0; // Abort transfer
    }

    // If we return 0 or a different value, libcurl aborts the transfer
    return totalSize;
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *context = static_cast<TransferContext *>(userdata);

    std::string line(buffer, totalSize);

    // New status line: a redirect or "100 Continue" precedes the real response
    if (line.rfind("HTTP/", 0) == 0)
    {
        context->response.headers.clear();
        return totalSize;
    }

    auto colonPos = line.find(':');
    if (colonPos != std::string::npos)
    {
        std::string name = toLower(trim(line.substr(0, colonPos)));
        context->response.headers[name] = trim(line.substr(colonPos + 1));
    }

    return totalSize;
}

size_t HttpClient::readCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    auto *input = static_cast<std::ifstream *>(userdata);
    input->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (input->bad())
    {
        return CURL_READFUNC_ABORT;
    }
    return static_cast<size_t>(input->gcount());
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    // Suppress unused parameter warnings
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *context = static_cast<TransferContext *>(clientp);

    // Non-zero aborts with CURLE_ABORTED_BY_CALLBACK
    return context->token->isCancelled() ? 1 : 0;
}

// Helper: Get human-readable HTTP status text
std::string HttpClient::getHttpStatusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 416:
        return "Range Not Satisfiable";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown Status";
    }
}

// Classify error for retry logic
ErrorKind HttpClient::classifyError(CURLcode code)
{
    switch (code)
    {
    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:        // Invalid URL syntax
    case CURLE_UNSUPPORTED_PROTOCOL: // Protocol not supported
        return ErrorKind::Config;

    // Local side failed to consume or produce data
    case CURLE_WRITE_ERROR:
    case CURLE_READ_ERROR:
        return ErrorKind::Io;

    // Timeouts, DNS, refused connections, resets, TLS hiccups...
    default:
        return ErrorKind::Transport;
    }
}

std::optional<std::int64_t> parseContentRangeTotal(const std::string &contentRange)
{
    // Format: "bytes start-end/total" or "bytes */total"
    auto slashPos = contentRange.rfind('/');
    if (slashPos == std::string::npos || slashPos + 1 >= contentRange.size())
    {
        return std::nullopt;
    }

    std::string total = trim(contentRange.substr(slashPos + 1));
    if (total.empty() || total == "*" ||
        !std::all_of(total.begin(), total.end(), [](unsigned char c)
                     { return std::isdigit(c); }))
    {
        return std::nullopt;
    }

    try
    {
        return std::stoll(total);
    }
    catch (const std::exception &)
    {
        return std::nullopt;
    }
}
