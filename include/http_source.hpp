#pragma once

#include <chrono>
#include <string>

#include "source.hpp"

/**
 * Plain HTTP(S) object.
 * Resumes with "Range: bytes=<offset>-"; only 200 and 206 are accepted.
 */
class HttpSource : public Source
{
public:
    HttpSource(std::string url, std::chrono::milliseconds timeout);

    std::int64_t open(std::int64_t offset, ByteSink &sink, const CancellationToken &token) override;

    /**
     * HEAD request, requires 200 and a Content-Length header.
     */
    std::int64_t size(const CancellationToken &token) override;

    std::string describe() const override { return url_; }

private:
    std::string url_;
    std::chrono::milliseconds timeout_;
};
