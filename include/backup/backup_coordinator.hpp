// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "backup/backup_crypto.hpp"
#include "config/config_store.hpp"
#include "core/status.hpp"
#include "service/service_host.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace tyr {
namespace backup {

constexpr const char *BACKUP_FORMAT_VERSION = "1.0";
constexpr const char *BACKUP_FILE_EXTENSION = ".tb";
constexpr size_t MIN_BACKUP_PASSWORD_LENGTH = 8;

struct BackupOptions {
  int stop_poll_attempts{50};
  std::chrono::milliseconds stop_poll_interval{200};
  int kdf_iterations{DEFAULT_KDF_ITERATIONS};
};

enum class BackupStage {
  PausingService,
  ReadingData,
  Encrypting,
  WritingFile,
  Decrypting,
  RestoringConfig,
  RestoringDatabase,
  ResumingService,
  Done,
};

const char *BackupStageName(BackupStage stage);

using BackupProgressCallback = std::function<void(BackupStage stage)>;

struct CreateBackupRequest {
  std::filesystem::path path;
  bool include_database{true};
  std::string password;
};

struct RestoreBackupRequest {
  std::filesystem::path path;
  std::string password;
};

struct BackupResult {
  std::filesystem::path path;
  bool includes_database{false};
  size_t size_bytes{0};
  // Non-fatal problems, e.g. the service did not come back after the backup
  std::vector<std::string> warnings;
};

struct RestoreResult {
  bool restored_database{false};
  bool service_restarted{false};
  std::string backup_timestamp;
  std::vector<std::string> warnings;
};

struct BackupInfo {
  std::string version;
  std::string timestamp;
  bool includes_database{false};
};

/**
 * BackupCoordinator - encrypted backup and restore around a live service
 *
 * Both operations pause the service (SoftStop, Stop fallback), wait for a
 * full stop within a bounded poll, and Close() it so the storage file can be
 * read or replaced directly. The storage lock file is taken for the raw file
 * access as a second check that no engine still holds it.
 *
 * Restore never touches disk until the backup has been decrypted and parsed:
 * a wrong password leaves configuration and storage unchanged and resumes
 * the old service. If the configuration was replaced but the storage write
 * then failed, PartialRestore is returned.
 *
 * Calls are expected from one thread at a time (the application's lifecycle
 * executor).
 */
class BackupCoordinator {
public:
  BackupCoordinator(service::ServiceHost &host, config::ConfigStore &config,
                    BackupOptions options = {});

  // Runs before the service is paused (the application cancels discovery here)
  void SetBeforePauseHook(std::function<void()> hook) { before_pause_ = std::move(hook); }

  core::Result<BackupResult> CreateBackup(const CreateBackupRequest &request,
                                          const BackupProgressCallback &on_progress = {});

  core::Result<RestoreResult> RestoreBackup(const RestoreBackupRequest &request,
                                            const BackupProgressCallback &on_progress = {});

  // Ok when the password opens the backup
  core::Status VerifyBackupPassword(const std::filesystem::path &path,
                                    const std::string &password) const;

  core::Result<BackupInfo> GetBackupInfo(const std::filesystem::path &path,
                                         const std::string &password) const;

private:
  struct PauseOutcome {
    bool was_running{false};
  };

  core::Result<PauseOutcome> PauseService(bool stop_engine);
  void ResumeService(bool rebuild, std::vector<std::string> &warnings, bool &restarted);
  core::Result<std::vector<uint8_t>> ReadContainer(const std::filesystem::path &path) const;

  service::ServiceHost &host_;
  config::ConfigStore &config_;
  BackupOptions options_;
  std::function<void()> before_pause_;
};

// "tbackup-dd-mm-yy.tb" for the current local date
std::string GenerateBackupFilename();

} // namespace backup
} // namespace tyr
