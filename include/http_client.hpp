#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <curl/curl.h>

#include "errors.hpp"

class CancellationToken;

/**
 * One HTTP request as issued by the sources and the cache.
 */
struct HttpRequest
{
    enum class Method
    {
        Get,
        Head,
        Put
    };

    Method method = Method::Get;
    std::string url;

    // Extra request headers, "Name: value"
    std::vector<std::string> headers;

    // When > 0 the request carries "Range: bytes=<rangeFrom>-"
    std::int64_t rangeFrom = 0;

    // Whole-request timeout in milliseconds, 0 = no limit
    long timeoutMs = 0;

    // AWS Signature V4 provider string ("aws:amz:<region>:s3"), empty = unsigned
    std::string awsSigV4;
    std::string username;
    std::string password;

    // Request body for PUT
    std::filesystem::path uploadFile;
};

/**
 * Status line and headers of the final response (after redirects).
 */
struct HttpResponse
{
    long status = 0;

    // Header names are lowercased
    std::map<std::string, std::string> headers;

    /**
     * Value of the Content-Length header, or -1 if absent.
     */
    std::int64_t contentLength() const;

    std::optional<std::string> header(const std::string &name) const;
};

/**
 * HTTP client for a single transfer at a time, built on libcurl.
 * Uses RAII to manage CURL handle lifecycle. Not thread-safe: every
 * pipeline creates its own client.
 */
class HttpClient
{
public:
    /**
     * Called once with the response status and headers, before the first
     * body byte (or after the transfer if the body is empty). May throw to
     * abort the transfer; the exception is rethrown from perform().
     */
    using ResponseHandler = std::function<void(const HttpResponse &)>;

    /**
     * Called for every body chunk. May throw to abort the transfer.
     */
    using BodyHandler = std::function<void(const char *data, std::size_t length)>;

    HttpClient();
    ~HttpClient();

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    // Move operations (allow transferring ownership)
    HttpClient(HttpClient &&) noexcept = default;
    HttpClient &operator=(HttpClient &&) noexcept = default;

    /**
     * Run libcurl's global initialization exactly once per process.
     * Must happen before worker threads create clients.
     */
    static void globalInit();

    /**
     * Perform one request.
     *
     * @param request What to send
     * @param token Aborts the transfer promptly when fired
     * @param onResponse Status/header handler (optional)
     * @param onBody Body chunk handler (optional, body is discarded if absent)
     * @return Final response status and headers
     * @throws XgetError Transport for network failures, Config for malformed
     *         URLs or unsupported protocols, Cancelled if the token fired,
     *         or whatever a handler threw
     */
    HttpResponse perform(const HttpRequest &request,
                         const CancellationToken &token,
                         const ResponseHandler &onResponse = nullptr,
                         const BodyHandler &onBody = nullptr);

    /**
     * Get human-readable HTTP status text for a status code.
     *
     * @param code HTTP status code (e.g., 200, 404, 500)
     * @return Descriptive text for the status code
     */
    static std::string getHttpStatusText(long code);

    /**
     * Map a libcurl failure onto the xget error taxonomy.
     * Malformed URLs and unsupported protocols are configuration errors,
     * everything else is a (retryable) transport error.
     */
    static ErrorKind classifyError(CURLcode code);

private:
    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    /**
     * Per-perform() state handed to the libcurl callbacks.
     */
    struct TransferContext
    {
        const CancellationToken *token = nullptr;
        const ResponseHandler *onResponse = nullptr;
        const BodyHandler *onBody = nullptr;
        CURL *curl = nullptr;
        HttpResponse response;
        bool responseDispatched = false;
        std::exception_ptr failure;
    };

    /**
     * Static callback for libcurl to write downloaded data.
     * libcurl is C library, so callbacks must be static or free functions.
     *
     * @return Number of bytes consumed (size * nmemb on success, 0 aborts)
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Collects response headers; a new status line resets them so only the
     * final response of a redirect chain is kept.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * Feeds the PUT body from the upload file.
     */
    static size_t readCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * Progress callback, used only to observe cancellation while the
     * connection is idle.
     *
     * @return 0 to continue, non-zero to abort
     */
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);

    static void dispatchResponse(TransferContext &context);
};

/**
 * Extract the total object size from a Content-Range header value.
 * Handles both "bytes 0-99/100" and the unsatisfied-range form with an
 * asterisk in place of the range.
 *
 * @return Total size, or std::nullopt if absent, unknown or unparseable
 */
std::optional<std::int64_t> parseContentRangeTotal(const std::string &contentRange);
