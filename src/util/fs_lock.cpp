// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <memory>
#include <mutex>
#include <sys/file.h>
#include <unistd.h>

namespace tyr {
namespace util {

// Held directory locks, keyed by full lock file path
static std::mutex g_dir_locks_mutex;
static std::map<std::string, std::unique_ptr<FileLock>> g_dir_locks;

FileLock::FileLock(const fs::path &file) {
  // O_CLOEXEC: the lock must not be inherited by child processes
  fd_ = open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = std::strerror(errno);
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }
  if (locked_) {
    return true;
  }
  if (flock(fd_, LOCK_EX | LOCK_NB) == -1) {
    reason_ = std::strerror(errno);
    return false;
  }
  locked_ = true;
  return true;
}

LockResult LockDirectory(const fs::path &directory,
                         const std::string &lockfile_name, bool probe_only) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  fs::path lockfile_path = directory / lockfile_name;
  std::string lockfile_str = lockfile_path.string();

  if (g_dir_locks.find(lockfile_str) != g_dir_locks.end()) {
    return LockResult::Success;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile_path);
  if (!file_lock->IsOpen()) {
    if (!probe_only) {
      LOG_ERROR("Failed to open lock file {}: {}", lockfile_str,
                file_lock->GetReason());
    }
    return LockResult::ErrorWrite;
  }

  if (!file_lock->TryLock()) {
    if (!probe_only) {
      LOG_ERROR("Failed to lock directory {}: {}", directory.string(),
                file_lock->GetReason());
    }
    return LockResult::ErrorLock;
  }

  // Probe: the lock is dropped again when file_lock goes out of scope
  if (probe_only) {
    return LockResult::Success;
  }

  g_dir_locks.emplace(lockfile_str, std::move(file_lock));
  LOG_TRACE("Acquired directory lock: {}", directory.string());
  return LockResult::Success;
}

void UnlockDirectory(const fs::path &directory,
                     const std::string &lockfile_name) {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);

  auto it = g_dir_locks.find((directory / lockfile_name).string());
  if (it != g_dir_locks.end()) {
    LOG_TRACE("Released directory lock: {}", directory.string());
    g_dir_locks.erase(it);
  }
}

void ReleaseAllDirectoryLocks() {
  std::lock_guard<std::mutex> lock(g_dir_locks_mutex);
  g_dir_locks.clear();
}

} // namespace util
} // namespace tyr
