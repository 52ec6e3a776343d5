#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <thread>

#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include <spdlog/spdlog.h>

#include "cancellation.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "errors.hpp"
#include "generate.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "progress.hpp"
#include "version.hpp"

// Exit status of a run stopped by SIGINT/SIGTERM (128 + SIGINT)
constexpr int EXIT_INTERRUPTED = 130;

// Set from the signal handler, turned into token.cancel() by a watcher thread
static std::atomic<bool> g_interrupted{false};

static void signalHandler(int sig)
{
    if (sig == SIGINT || sig == SIGTERM)
    {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

/**
 * Command line values. Unset values (0 / empty) keep the config's value.
 */
struct CliOptions
{
    std::vector<std::string> configs;
    int parallel = 0;
    int retries = 0;
    std::string retryDelay;
    std::string timeout;
    bool noCache = false;
    bool noProgress = false;
    bool quiet = false;
    bool verbose = false;

    std::string generateDir;
    std::string generateOutput;
};

static void applyOverrides(const CliOptions &options, DownloadConfig &config)
{
    if (options.parallel > 0)
    {
        config.settings.parallel = options.parallel;
    }
    if (options.retries > 0)
    {
        config.settings.retries = options.retries;
    }
    if (!options.retryDelay.empty())
    {
        config.settings.retryDelay = parseDuration(options.retryDelay);
    }
    if (!options.timeout.empty())
    {
        config.settings.timeout = parseDuration(options.timeout);
    }
    if (options.noCache)
    {
        config.cache.enabled = false;
    }
}

static int runGenerate(const CliOptions &options)
{
    std::string manifest = generateManifest(options.generateDir);

    if (options.generateOutput.empty())
    {
        fmt::print("{}", manifest);
        return 0;
    }

    std::ofstream out(options.generateOutput, std::ios::binary | std::ios::trunc);
    out << manifest;
    out.close();
    if (!out)
    {
        throw XgetError(ErrorKind::Io, fmt::format("cannot write {}", options.generateOutput));
    }
    spdlog::info("Wrote manifest to {}", options.generateOutput);
    return 0;
}

/**
 * Print one line per failed or cancelled task and a summary.
 *
 * @return Number of results carrying an error
 */
static std::size_t reportResults(const std::vector<DownloadResult> &results)
{
    std::size_t failed = 0;
    for (const auto &result : results)
    {
        if (result.ok())
        {
            continue;
        }
        ++failed;
        if (result.cancelled())
        {
            fmt::print(stderr, "cancelled {}\n", result.task.url);
        }
        else
        {
            fmt::print(stderr, "error downloading {} ({}): {}\n", result.task.url,
                       toString(result.failure->kind), result.failure->message);
        }
    }

    if (failed > 0)
    {
        fmt::print(stderr, "\n{}/{} downloads failed\n", failed, results.size());
    }
    else
    {
        fmt::print("\nAll {} downloads completed successfully\n", results.size());
    }
    return failed;
}

static int runDownloads(const CliOptions &options)
{
    std::vector<std::filesystem::path> paths(options.configs.begin(), options.configs.end());
    DownloadConfig config = loadConfigs(paths);
    applyOverrides(options, config);

    spdlog::info("Loaded config with {} files to download", config.files.size());
    if (config.cache.enabled)
    {
        spdlog::info("Cache enabled (alias \"{}\")", config.cache.alias);
    }

    HttpClient::globalInit();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    CancellationToken token;
    std::atomic<bool> finished{false};

    // Bridge between the async-signal-safe flag and the token
    std::thread watcher([&]()
                        {
        while (!finished.load())
        {
            if (g_interrupted.load(std::memory_order_relaxed))
            {
                spdlog::warn("Interrupted, cancelling downloads...");
                token.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        } });

    std::unique_ptr<ConsoleProgress> progress;
    if (!options.noProgress && !options.quiet)
    {
        progress = std::make_unique<ConsoleProgress>();
    }

    std::vector<DownloadResult> results;
    try
    {
        Downloader downloader(config, progress.get());
        results = downloader.run(token);
    }
    catch (const std::exception &)
    {
        finished.store(true);
        watcher.join();
        throw;
    }

    finished.store(true);
    watcher.join();

    std::size_t failed = reportResults(results);
    if (token.isCancelled())
    {
        return EXIT_INTERRUPTED;
    }
    return failed > 0 ? 1 : 0;
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version")
        {
            fmt::print("xget v{}\n", XGET_VERSION);
            fmt::print("Built with:\n");
            fmt::print("  - libcurl: HTTP/HTTPS and S3 (SigV4) transfers\n");
            fmt::print("  - OpenSSL: SHA-256\n");
            fmt::print("  - yaml-cpp: configuration\n");
            fmt::print("  - CLI11, fmt, spdlog\n");
            return 0;
        }
    }

    // Create CLI11 app
    CLI::App app{"xget - fetch declared files from HTTP(S) and S3 with SHA-256 verification"};

    CliOptions options;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("CONFIG", options.configs, "YAML configuration file(s), merged in order")
        ->check(CLI::ExistingFile);

    app.add_option("-p,--parallel", options.parallel, "Maximum concurrent downloads")
        ->check(CLI::PositiveNumber);

    app.add_option("-r,--retries", options.retries, "Attempts per file")
        ->check(CLI::Range(1, 100));

    app.add_option("--retry-delay", options.retryDelay, "Delay between attempts (e.g. 500ms, 5s, 1m)");

    app.add_option("--timeout", options.timeout, "Per-request timeout (e.g. 30s, 0 = none)");

    app.add_flag("--no-cache", options.noCache, "Ignore the configured cache");
    app.add_flag("--no-progress", options.noProgress, "Do not print progress lines");
    app.add_flag("-q,--quiet", options.quiet, "Only log errors");
    app.add_flag("--verbose", options.verbose, "Log request details");

    // Flag for help display only, actual handling is done above
    bool showVersion = false;
    app.add_flag("--version", showVersion, "Display version information");

    auto *generate = app.add_subcommand("generate", "Emit a files: manifest for an existing directory tree");
    generate->add_option("DIR", options.generateDir, "Directory to scan")
        ->required()
        ->check(CLI::ExistingDirectory);
    generate->add_option("-o,--output", options.generateOutput, "Write the manifest to FILE instead of stdout");

    app.require_subcommand(0, 1);

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    initLogging(options.verbose, options.quiet);

    // ====================================================================
    // RUN
    // ====================================================================

    try
    {
        if (*generate)
        {
            return runGenerate(options);
        }

        if (options.configs.empty())
        {
            fmt::print(stderr, "{}", app.help());
            return 1;
        }

        return runDownloads(options);
    }
    catch (const XgetError &e)
    {
        spdlog::error("{} error: {}", toString(e.kind()), e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
