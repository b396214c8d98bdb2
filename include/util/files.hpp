// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tyr {
namespace util {

/**
 * Crash-safe file persistence
 *
 * Writes go to "<path>.tmp.<rand>", are fsync'd, the parent directory is
 * fsync'd, then the temp file is renamed over the target. Readers see either
 * the old contents or the new contents, never a torn file.
 */

// Default mode 0644
bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data);
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data);

/**
 * Write data atomically with explicit permissions
 * @param mode e.g. 0600 for config, keys and backups
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::vector<uint8_t> &data,
                       int mode);
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data,
                       int mode);

/**
 * Read a whole file (capped at 100 MB)
 * Returns std::nullopt if the file is missing, unreadable or too large.
 * An existing empty file yields an empty vector.
 */
std::optional<std::vector<uint8_t>> try_read_file(const std::filesystem::path &path);

// Returns empty vector on failure
std::vector<uint8_t> read_file(const std::filesystem::path &path);

// Returns empty string on failure
std::string read_file_string(const std::filesystem::path &path);

// Recursive; true if the directory exists afterwards
bool ensure_directory(const std::filesystem::path &dir);

// ~/.tyr, or ./.tyr when HOME is unset
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace tyr
