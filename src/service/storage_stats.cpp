// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "service/storage_stats.hpp"
#include "util/logging.hpp"
#include <system_error>

namespace tyr {
namespace service {

using core::ErrorCode;
using core::Status;

namespace fs = std::filesystem;

core::Result<StorageStats> GetStorageStats(const fs::path &storage_path) {
  StorageStats stats;
  std::error_code ec;

  if (fs::exists(storage_path, ec)) {
    stats.database_bytes = fs::file_size(storage_path, ec);
  }
  if (ec) {
    return Status::Error(ErrorCode::IoError,
                         "cannot stat database " + storage_path.string() + ": " + ec.message());
  }

  const fs::path filestore = storage_path.parent_path() / FILESTORE_DIRNAME;
  if (fs::exists(filestore, ec) && fs::is_directory(filestore, ec)) {
    fs::recursive_directory_iterator it(filestore, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (it->is_regular_file(ec)) {
        const uintmax_t size = it->file_size(ec);
        if (!ec) stats.files_bytes += size;
      }
      if (ec) break;
    }
  }
  if (ec) {
    return Status::Error(ErrorCode::IoError,
                         "cannot measure " + filestore.string() + ": " + ec.message());
  }

  stats.total_bytes = stats.database_bytes + stats.files_bytes;
  LOG_SVC_DEBUG("Storage usage: database {} bytes, files {} bytes", stats.database_bytes,
                stats.files_bytes);
  return stats;
}

} // namespace service
} // namespace tyr
