#include "generate.hpp"
#include "checksum.hpp"
#include "errors.hpp"

#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

std::vector<FileTask> scanDirectory(const std::filesystem::path &directory)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec))
    {
        throw XgetError(ErrorKind::Config,
                        fmt::format("path is not a directory: {}", directory.string()));
    }

    std::vector<FileTask> entries;

    std::filesystem::recursive_directory_iterator it(
        directory, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        throw XgetError(ErrorKind::Io,
                        fmt::format("cannot read directory {}: {}", directory.string(), ec.message()));
    }

    const std::filesystem::recursive_directory_iterator end;
    while (it != end)
    {
        // Symlinks, sockets, devices and directories are not part of the manifest
        std::error_code statusError;
        auto status = it->symlink_status(statusError);
        if (!statusError && std::filesystem::is_regular_file(status))
        {
            const auto &path = it->path();
            try
            {
                FileTask entry;
                entry.destination = path.lexically_relative(directory).generic_string();
                entry.sha256 = ChecksumVerifier::computeSHA256(path);
                entries.push_back(std::move(entry));
            }
            catch (const XgetError &e)
            {
                spdlog::warn("cannot compute hash for {}: {}", path.string(), e.what());
            }
        }
        else if (statusError)
        {
            spdlog::warn("cannot access {}: {}", it->path().string(), statusError.message());
        }

        it.increment(ec);
        if (ec)
        {
            spdlog::warn("cannot walk {}: {}", directory.string(), ec.message());
            break;
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const FileTask &a, const FileTask &b)
              { return a.destination < b.destination; });
    return entries;
}

std::string renderManifest(const std::vector<FileTask> &entries)
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
    for (const auto &entry : entries)
    {
        out << YAML::BeginMap;
        out << YAML::Key << "url" << YAML::Value << YAML::DoubleQuoted << entry.url;
        out << YAML::Key << "dest" << YAML::Value << entry.destination;
        out << YAML::Key << "sha256" << YAML::Value << entry.sha256;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return std::string(out.c_str()) + "\n";
}

std::string generateManifest(const std::filesystem::path &directory)
{
    auto entries = scanDirectory(directory);
    if (entries.empty())
    {
        throw XgetError(ErrorKind::Config,
                        fmt::format("no files found in directory: {}", directory.string()));
    }
    return renderManifest(entries);
}
