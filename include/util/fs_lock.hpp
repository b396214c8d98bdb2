// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace tyr {
namespace util {

namespace fs = std::filesystem;

/**
 * Exclusive advisory lock on a file
 *
 * Uses flock(), which binds the lock to the open file description. Two
 * FileLock objects on the same path conflict even inside one process, so
 * the lock can guard a resource shared between components of the daemon.
 * The lock is released when the object is destroyed.
 */
class FileLock {
public:
  FileLock() = delete;
  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  explicit FileLock(const fs::path &file);
  ~FileLock();

  // Non-blocking; false if another holder owns the lock
  bool TryLock();

  bool IsOpen() const { return fd_ != -1; }
  bool IsLocked() const { return locked_; }
  const std::string &GetReason() const { return reason_; }

private:
  std::string reason_;
  int fd_{-1};
  bool locked_{false};
};

enum class LockResult {
  Success,    // Lock acquired
  ErrorWrite, // Could not create lock file
  ErrorLock,  // Lock already held elsewhere
};

/**
 * Lock a directory against concurrent use by another daemon
 *
 * Creates <directory>/<lockfile_name> and holds an exclusive lock on it
 * until UnlockDirectory() or ReleaseAllDirectoryLocks().
 *
 * @param probe_only Only test whether the lock could be taken
 */
LockResult LockDirectory(const fs::path &directory,
                         const std::string &lockfile_name = ".lock",
                         bool probe_only = false);

void UnlockDirectory(const fs::path &directory,
                     const std::string &lockfile_name = ".lock");

void ReleaseAllDirectoryLocks();

} // namespace util
} // namespace tyr
