// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "core/status.hpp"
#include <cstdint>
#include <filesystem>

namespace tyr {
namespace service {

// Message bodies live beside the database in <storage dir>/filestore/
constexpr const char *FILESTORE_DIRNAME = "filestore";

struct StorageStats {
  uint64_t database_bytes{0};
  uint64_t files_bytes{0};
  uint64_t total_bytes{0};
};

/**
 * Disk usage of the mail storage
 *
 * A database or filestore that does not exist yet counts as zero bytes.
 * Reads sizes only, so it is safe while the engine holds the storage.
 */
core::Result<StorageStats> GetStorageStats(const std::filesystem::path &storage_path);

} // namespace service
} // namespace tyr
