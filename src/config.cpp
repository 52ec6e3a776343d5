#include "config.hpp"
#include "checksum.hpp"
#include "errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace
{
    // Longest accepted duration: one year
    constexpr double MAX_DURATION_MS = 365.0 * 24 * 3600 * 1000;

    std::string readString(const YAML::Node &node, const char *key)
    {
        if (!node[key] || node[key].IsNull())
        {
            return {};
        }
        return node[key].as<std::string>();
    }

    std::chrono::milliseconds readDuration(const YAML::Node &node, const char *key)
    {
        if (!node[key] || node[key].IsNull())
        {
            return std::chrono::milliseconds{0};
        }
        return parseDuration(node[key].as<std::string>());
    }

    AliasConfig parseAlias(const YAML::Node &node)
    {
        AliasConfig alias;
        alias.endpoint = expandEnvVars(readString(node, "endpoint"));
        alias.region = expandEnvVars(readString(node, "region"));
        alias.bucket = expandEnvVars(readString(node, "bucket"));
        alias.prefix = expandEnvVars(readString(node, "prefix"));
        alias.accessKey = expandEnvVars(readString(node, "access_key"));
        alias.secretKey = expandEnvVars(readString(node, "secret_key"));
        if (node["no_sign_request"])
        {
            alias.noSignRequest = node["no_sign_request"].as<bool>();
        }
        return alias;
    }

    BackoffMode parseBackoff(const std::string &text)
    {
        if (text == "fixed")
        {
            return BackoffMode::Fixed;
        }
        if (text == "exponential")
        {
            return BackoffMode::Exponential;
        }
        throw XgetError(ErrorKind::Config,
                        fmt::format("retry_backoff must be 'fixed' or 'exponential', got '{}'", text));
    }

    std::string readFile(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            throw XgetError(ErrorKind::Config,
                            fmt::format("reading config file {}: cannot open", path.string()));
        }
        std::ostringstream content;
        content << file.rdbuf();
        return content.str();
    }
} // namespace

std::optional<AliasConfig> DownloadConfig::cacheAlias() const
{
    if (!cache.enabled)
    {
        return std::nullopt;
    }
    auto it = aliases.find(cache.alias);
    if (it == aliases.end())
    {
        return std::nullopt;
    }
    return it->second;
}

DownloadConfig parseConfig(const std::string &yamlText, const std::string &origin)
{
    DownloadConfig config;

    try
    {
        YAML::Node root = YAML::Load(yamlText);
        if (!root || root.IsNull())
        {
            return config; // Empty document
        }

        if (const YAML::Node aliases = root["aliases"])
        {
            for (const auto &entry : aliases)
            {
                config.aliases[entry.first.as<std::string>()] = parseAlias(entry.second);
            }
        }

        if (const YAML::Node cache = root["cache"])
        {
            config.cache.alias = readString(cache, "alias");
            if (cache["enabled"])
            {
                config.cache.enabled = cache["enabled"].as<bool>();
            }
        }

        if (const YAML::Node settings = root["settings"])
        {
            if (settings["parallel"])
            {
                config.settings.parallel = settings["parallel"].as<int>();
            }
            if (settings["retries"])
            {
                config.settings.retries = settings["retries"].as<int>();
            }
            config.settings.retryDelay = readDuration(settings, "retry_delay");
            config.settings.timeout = readDuration(settings, "timeout");
            if (settings["retry_backoff"])
            {
                config.settings.retryBackoff = parseBackoff(settings["retry_backoff"].as<std::string>());
            }
        }

        if (const YAML::Node files = root["files"])
        {
            for (const auto &node : files)
            {
                FileTask task;
                task.url = readString(node, "url");
                task.destination = readString(node, "dest");
                task.sha256 = readString(node, "sha256");
                config.files.push_back(std::move(task));
            }
        }
    }
    catch (const YAML::Exception &e)
    {
        throw XgetError(ErrorKind::Config,
                        fmt::format("parsing config file {}: {}", origin, e.what()));
    }

    return config;
}

void mergeConfig(DownloadConfig &base, const DownloadConfig &override)
{
    // Aliases: add new or replace existing by name
    for (const auto &[name, alias] : override.aliases)
    {
        base.aliases[name] = alias;
    }

    if (!override.cache.alias.empty())
    {
        base.cache.alias = override.cache.alias;
    }
    if (override.cache.enabled)
    {
        base.cache.enabled = true;
    }

    // Settings: only values that were actually set override
    if (override.settings.parallel > 0)
    {
        base.settings.parallel = override.settings.parallel;
    }
    if (override.settings.retries > 0)
    {
        base.settings.retries = override.settings.retries;
    }
    if (override.settings.retryDelay.count() > 0)
    {
        base.settings.retryDelay = override.settings.retryDelay;
    }
    if (override.settings.timeout.count() > 0)
    {
        base.settings.timeout = override.settings.timeout;
    }
    if (override.settings.retryBackoff)
    {
        base.settings.retryBackoff = override.settings.retryBackoff;
    }

    // Files accumulate
    base.files.insert(base.files.end(), override.files.begin(), override.files.end());
}

void applyDefaults(DownloadConfig &config)
{
    if (config.settings.parallel <= 0)
    {
        config.settings.parallel = DEFAULT_PARALLEL;
    }
    if (config.settings.retries <= 0)
    {
        config.settings.retries = DEFAULT_RETRIES;
    }
    if (config.settings.retryDelay.count() <= 0)
    {
        config.settings.retryDelay = DEFAULT_RETRY_DELAY;
    }
    if (!config.settings.retryBackoff)
    {
        config.settings.retryBackoff = BackoffMode::Fixed;
    }
}

void validateConfig(DownloadConfig &config)
{
    if (config.cache.enabled)
    {
        if (config.cache.alias.empty())
        {
            throw XgetError(ErrorKind::Config, "cache enabled but no alias specified");
        }
        if (config.aliases.find(config.cache.alias) == config.aliases.end())
        {
            throw XgetError(ErrorKind::Config,
                            fmt::format("cache alias \"{}\" not found in aliases", config.cache.alias));
        }
    }

    for (std::size_t i = 0; i < config.files.size(); ++i)
    {
        FileTask &file = config.files[i];
        if (file.url.empty())
        {
            throw XgetError(ErrorKind::Config, fmt::format("file {}: url is required", i));
        }
        if (file.destination.empty())
        {
            throw XgetError(ErrorKind::Config, fmt::format("file {}: dest is required", i));
        }
        if (file.sha256.empty())
        {
            throw XgetError(ErrorKind::Config, fmt::format("file {}: sha256 is required", i));
        }

        try
        {
            file.sha256 = ChecksumVerifier::normalizeDigest(file.sha256);
        }
        catch (const XgetError &e)
        {
            throw XgetError(ErrorKind::Config, fmt::format("file {}: {}", i, e.what()));
        }
    }
}

DownloadConfig loadConfigs(const std::vector<std::filesystem::path> &paths)
{
    if (paths.empty())
    {
        throw XgetError(ErrorKind::Config, "no config files specified");
    }

    DownloadConfig merged;
    for (const auto &path : paths)
    {
        DownloadConfig config = parseConfig(readFile(path), path.string());
        spdlog::debug("Loaded {} ({} files, {} aliases)", path.string(),
                      config.files.size(), config.aliases.size());
        mergeConfig(merged, config);
    }

    applyDefaults(merged);
    validateConfig(merged);
    return merged;
}

std::string expandEnvVars(const std::string &text)
{
    static const std::regex pattern(R"(\$\{([^}]+)\})");

    std::string result;
    auto begin = std::sregex_iterator(text.begin(), text.end(), pattern);
    auto end = std::sregex_iterator();

    std::size_t last = 0;
    for (auto it = begin; it != end; ++it)
    {
        const std::smatch &match = *it;
        result.append(text, last, static_cast<std::size_t>(match.position(0)) - last);

        const char *value = std::getenv(match[1].str().c_str());
        result += value ? std::string(value) : match[0].str();

        last = static_cast<std::size_t>(match.position(0) + match.length(0));
    }
    result.append(text, last, std::string::npos);
    return result;
}

std::chrono::milliseconds parseDuration(const std::string &text)
{
    if (text.empty())
    {
        throw XgetError(ErrorKind::Config, "empty duration");
    }

    // Bare number: seconds
    bool allDigits = true;
    for (char ch : text)
    {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
        {
            allDigits = false;
            break;
        }
    }
    if (allDigits)
    {
        long long seconds = 0;
        try
        {
            seconds = std::stoll(text);
        }
        catch (const std::out_of_range &)
        {
            throw XgetError(ErrorKind::Config, fmt::format("duration out of range: '{}'", text));
        }
        if (seconds * 1000.0 > MAX_DURATION_MS)
        {
            throw XgetError(ErrorKind::Config, fmt::format("duration out of range: '{}'", text));
        }
        return std::chrono::seconds(seconds);
    }

    double totalMs = 0.0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t numberStart = pos;
        while (pos < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.'))
        {
            ++pos;
        }
        std::size_t unitStart = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }

        std::string number = text.substr(numberStart, unitStart - numberStart);
        std::string unit = text.substr(unitStart, pos - unitStart);
        if (number.empty() || unit.empty())
        {
            throw XgetError(ErrorKind::Config, fmt::format("invalid duration: '{}'", text));
        }

        double value = std::strtod(number.c_str(), nullptr);
        if (unit == "ns")
        {
            totalMs += value / 1e6;
        }
        else if (unit == "us")
        {
            totalMs += value / 1e3;
        }
        else if (unit == "ms")
        {
            totalMs += value;
        }
        else if (unit == "s")
        {
            totalMs += value * 1000.0;
        }
        else if (unit == "m")
        {
            totalMs += value * 60.0 * 1000.0;
        }
        else if (unit == "h")
        {
            totalMs += value * 3600.0 * 1000.0;
        }
        else
        {
            throw XgetError(ErrorKind::Config,
                            fmt::format("invalid duration unit '{}' in '{}'", unit, text));
        }
    }

    if (!(totalMs <= MAX_DURATION_MS))
    {
        throw XgetError(ErrorKind::Config, fmt::format("duration out of range: '{}'", text));
    }

    return std::chrono::milliseconds(static_cast<long long>(std::llround(totalMs)));
}
