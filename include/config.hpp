#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * One file to fetch: where it comes from, where it goes, what it must hash to.
 * Immutable once loaded.
 */
struct FileTask
{
    std::string url;         // http(s)://... or s3://alias/key
    std::string destination; // local path
    std::string sha256;      // 64 lowercase hex characters
};

/**
 * Named S3-compatible storage backend (a "source endpoint").
 * Read-only for the whole run.
 */
struct AliasConfig
{
    std::string endpoint; // Optional endpoint override, forces path-style addressing
    std::string region;
    std::string bucket;
    std::string prefix; // Prepended verbatim to every object key
    std::string accessKey;
    std::string secretKey;
    bool noSignRequest = false; // Anonymous, unsigned access

    bool hasStaticCredentials() const { return !accessKey.empty() && !secretKey.empty(); }
};

using AliasTable = std::map<std::string, AliasConfig>;

struct CacheConfig
{
    bool enabled = false;
    std::string alias;
};

enum class BackoffMode
{
    Fixed,
    Exponential
};

/**
 * Run-wide download settings.
 * Zero values mean "not set" until applyDefaults() runs.
 */
struct Settings
{
    int parallel = 0;
    int retries = 0;
    std::chrono::milliseconds retryDelay{0};
    std::optional<BackoffMode> retryBackoff;
    std::chrono::milliseconds timeout{0}; // Per request, 0 = no limit
};

/**
 * Fully resolved configuration of one run.
 */
struct DownloadConfig
{
    AliasTable aliases;
    CacheConfig cache;
    Settings settings;
    std::vector<FileTask> files;

    /**
     * Alias used for the content-addressable cache, if caching is enabled.
     */
    std::optional<AliasConfig> cacheAlias() const;
};

constexpr int DEFAULT_PARALLEL = 4;
constexpr int DEFAULT_RETRIES = 3;
constexpr std::chrono::milliseconds DEFAULT_RETRY_DELAY{5000};

/**
 * Load, merge, default and validate one or more YAML configuration files.
 * Later files override aliases by name and non-empty cache/settings values;
 * file lists accumulate in order.
 *
 * @param paths Configuration files, at least one
 * @return Validated configuration
 * @throws XgetError (ErrorKind::Config) on unreadable, malformed or invalid input
 */
DownloadConfig loadConfigs(const std::vector<std::filesystem::path> &paths);

/**
 * Parse one YAML document without defaults or validation.
 * Environment references in alias fields are already expanded.
 *
 * @param yamlText YAML document
 * @param origin Name used in error messages
 */
DownloadConfig parseConfig(const std::string &yamlText, const std::string &origin = "<string>");

void mergeConfig(DownloadConfig &base, const DownloadConfig &override);

void applyDefaults(DownloadConfig &config);

/**
 * @throws XgetError (ErrorKind::Config) describing the first problem found
 */
void validateConfig(DownloadConfig &config);

/**
 * Replace ${VAR} references with environment values.
 * References to unset variables are left verbatim.
 */
std::string expandEnvVars(const std::string &text);

/**
 * Parse a Go-style duration ("500ms", "5s", "1m30s", "2h").
 * A bare integer is taken as seconds.
 *
 * @throws XgetError (ErrorKind::Config) if the text is not a duration
 */
std::chrono::milliseconds parseDuration(const std::string &text);
