#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"

/**
 * Hash every regular file below a directory.
 *
 * Entries carry an empty url, the path relative to `directory` (with '/'
 * separators) as destination, and the file's SHA-256. Sorted by destination.
 * Unreadable entries are logged as warnings and skipped.
 *
 * @throws XgetError (ErrorKind::Config) if `directory` is not a directory
 */
std::vector<FileTask> scanDirectory(const std::filesystem::path &directory);

/**
 * Render entries as a YAML "files:" document that a config can include.
 */
std::string renderManifest(const std::vector<FileTask> &entries);

/**
 * scanDirectory() followed by renderManifest().
 *
 * @throws XgetError (ErrorKind::Config) if the tree holds no regular files
 */
std::string generateManifest(const std::filesystem::path &directory);
