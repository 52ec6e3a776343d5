#include "logging.hpp"

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

void initLogging(bool verbose, bool quiet)
{
    // Progress goes to stdout, so every log line goes to stderr
    auto logger = spdlog::stderr_color_mt("xget");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    if (quiet)
    {
        spdlog::set_level(spdlog::level::err);
    }
    else if (verbose)
    {
        spdlog::set_level(spdlog::level::debug);
    }
    else
    {
        spdlog::set_level(spdlog::level::info);
    }
}
