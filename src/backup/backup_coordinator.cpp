// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "backup/backup_coordinator.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>

namespace tyr {
namespace backup {

using core::ErrorCode;
using core::Status;
using json = nlohmann::json;
using service::ServiceState;

const char *BackupStageName(BackupStage stage) {
  switch (stage) {
  case BackupStage::PausingService:
    return "pausing service";
  case BackupStage::ReadingData:
    return "reading data";
  case BackupStage::Encrypting:
    return "encrypting";
  case BackupStage::WritingFile:
    return "writing file";
  case BackupStage::Decrypting:
    return "decrypting";
  case BackupStage::RestoringConfig:
    return "restoring configuration";
  case BackupStage::RestoringDatabase:
    return "restoring database";
  case BackupStage::ResumingService:
    return "resuming service";
  case BackupStage::Done:
    return "done";
  }
  return "unknown";
}

std::string GenerateBackupFilename() {
  return "tbackup-" + util::FormatShortDate(util::GetTime()) + BACKUP_FILE_EXTENSION;
}

namespace {

struct Payload {
  std::string version;
  std::string timestamp;
  config::Config config;
  bool includes_database{false};
  std::vector<uint8_t> database;
};

json BuildPayload(const config::Config &cfg, const std::vector<uint8_t> *database) {
  json peers = json::array();
  for (const auto &p : cfg.peers) {
    peers.push_back(p);
  }
  json doc;
  doc["version"] = BACKUP_FORMAT_VERSION;
  doc["timestamp"] = util::FormatRFC3339(util::GetTime());
  doc["config"] = {{"onboarding_complete", cfg.onboarding_complete},
                   {"smtp_address", cfg.service.smtp_address},
                   {"imap_address", cfg.service.imap_address},
                   {"database_path", cfg.service.storage_path},
                   {"peers", std::move(peers)},
                   {"theme", cfg.ui.theme},
                   {"language", cfg.ui.language},
                   {"auto_start", cfg.ui.auto_start}};
  doc["includes_database"] = database != nullptr;
  if (database) {
    doc["database"] = Base64Encode(*database);
  }
  return doc;
}

// full: reject incompatible versions and decode the database
core::Result<Payload> ParsePayload(const std::vector<uint8_t> &plain, bool full) {
  Payload out;
  try {
    json doc = json::parse(plain.begin(), plain.end());
    out.version = doc.at("version").get<std::string>();
    out.timestamp = doc.value("timestamp", std::string{});
    out.includes_database = doc.value("includes_database", false);

    if (full && out.version != BACKUP_FORMAT_VERSION) {
      return Status::Error(ErrorCode::CorruptBackup,
                           "incompatible backup version " + out.version + " (expected " +
                               BACKUP_FORMAT_VERSION + ")");
    }

    const json &c = doc.at("config");
    out.config.onboarding_complete = c.value("onboarding_complete", false);
    out.config.service.smtp_address = c.value("smtp_address", std::string{});
    out.config.service.imap_address = c.value("imap_address", std::string{});
    out.config.service.storage_path = c.value("database_path", std::string{});
    out.config.ui.theme = c.value("theme", std::string{});
    out.config.ui.language = c.value("language", std::string{});
    out.config.ui.auto_start = c.value("auto_start", false);
    if (c.contains("peers") && c["peers"].is_array()) {
      for (const auto &p : c["peers"]) {
        out.config.peers.push_back(p.get<config::PeerConfig>());
      }
    }

    if (full && out.includes_database) {
      auto db = Base64Decode(doc.value("database", std::string{}));
      if (!db.IsOk()) return db.GetStatus();
      out.database = std::move(db).Value();
    }
  } catch (const json::exception &e) {
    return Status::Error(ErrorCode::CorruptBackup,
                         std::string("backup payload is malformed: ") + e.what());
  }
  return out;
}

void Report(const BackupProgressCallback &cb, BackupStage stage) {
  LOG_BACKUP_DEBUG("Backup stage: {}", BackupStageName(stage));
  if (cb) cb(stage);
}

std::filesystem::path StorageLockPath(const std::string &storage_path) {
  return storage_path + ".lock";
}

} // namespace

BackupCoordinator::BackupCoordinator(service::ServiceHost &host, config::ConfigStore &config,
                                     BackupOptions options)
    : host_(host), config_(config), options_(options) {}

// ---------------------------------------------------------------------------
// Service pause / resume
// ---------------------------------------------------------------------------

core::Result<BackupCoordinator::PauseOutcome> BackupCoordinator::PauseService(bool stop_engine) {
  PauseOutcome outcome;
  if (!stop_engine) return outcome;

  if (before_pause_) before_pause_();

  auto mgr = host_.Current();
  const ServiceState state = mgr->GetStatus();
  outcome.was_running = state == ServiceState::Running || state == ServiceState::Starting;

  if (outcome.was_running) {
    LOG_BACKUP_INFO("Pausing service");
    Status st = mgr->SoftStop();
    if (!st.IsOk() && !st.Is(ErrorCode::NotRunning)) {
      LOG_BACKUP_WARN("Soft stop failed ({}), forcing stop", st.ToString());
      st = mgr->Stop();
      if (!st.IsOk() && !st.Is(ErrorCode::NotRunning)) {
        LOG_BACKUP_WARN("Forced stop failed: {}", st.ToString());
      }
    }
  }

  // Another caller may be mid-stop; wait for it to settle
  int attempts = 0;
  for (;;) {
    const ServiceState s = mgr->GetStatus();
    if (s == ServiceState::Stopped || s == ServiceState::Error) break;
    if (++attempts > options_.stop_poll_attempts) {
      return Status::Error(ErrorCode::OperationTimedOut,
                           "service did not stop within " +
                               std::to_string(options_.stop_poll_attempts *
                                              options_.stop_poll_interval.count()) +
                               " ms");
    }
    std::this_thread::sleep_for(options_.stop_poll_interval);
  }

  Status st = mgr->Close();
  if (!st.IsOk()) {
    if (st.Is(ErrorCode::ResourceBusy)) return st;
    return Status::Error(ErrorCode::ResourceBusy, "cannot release storage: " + st.GetMessage());
  }
  if (mgr->IsStorageHeld()) {
    return Status::Error(ErrorCode::ResourceBusy, "storage is still held by the service");
  }
  return outcome;
}

void BackupCoordinator::ResumeService(bool rebuild, std::vector<std::string> &warnings,
                                      bool &restarted) {
  restarted = false;
  auto mgr = rebuild ? host_.Rebuild() : host_.Current();

  Status st = mgr->Initialize();
  if (st.IsOk() || st.Is(ErrorCode::AlreadyInitialized)) {
    st = mgr->Start();
  }
  if (st.IsOk()) {
    restarted = true;
    LOG_BACKUP_INFO("Service resumed");
    return;
  }
  LOG_BACKUP_WARN("Service did not restart: {}", st.ToString());
  warnings.push_back("service restart failed: " + st.ToString());
}

core::Result<std::vector<uint8_t>>
BackupCoordinator::ReadContainer(const std::filesystem::path &path) const {
  auto data = util::try_read_file(path);
  if (!data) {
    return Status::Error(ErrorCode::IoError, "cannot read backup file " + path.string());
  }
  if (data->empty()) {
    return Status::Error(ErrorCode::CorruptBackup, "backup file is empty");
  }
  return std::move(*data);
}

// ---------------------------------------------------------------------------
// Create
// ---------------------------------------------------------------------------

core::Result<BackupResult> BackupCoordinator::CreateBackup(const CreateBackupRequest &request,
                                                           const BackupProgressCallback &on_progress) {
  if (request.path.empty()) {
    return Status::Error(ErrorCode::InvalidArgument, "backup path is empty");
  }
  if (request.password.size() < MIN_BACKUP_PASSWORD_LENGTH) {
    return Status::Error(ErrorCode::InvalidArgument,
                         "backup password must be at least " +
                             std::to_string(MIN_BACKUP_PASSWORD_LENGTH) + " characters");
  }

  BackupResult result;
  result.path = request.path;

  Report(on_progress, BackupStage::PausingService);
  auto paused = PauseService(request.include_database);
  if (!paused.IsOk()) {
    LOG_BACKUP_ERROR("Backup aborted: {}", paused.GetStatus().ToString());
    return paused.GetStatus();
  }
  const bool was_running = paused.Value().was_running;

  // From here on the service must be resumed whatever happens
  auto finish = [&](core::Result<BackupResult> r) -> core::Result<BackupResult> {
    if (was_running) {
      Report(on_progress, BackupStage::ResumingService);
      bool restarted = false;
      std::vector<std::string> warnings;
      ResumeService(false, warnings, restarted);
      if (r.IsOk()) {
        auto &w = r.Value().warnings;
        w.insert(w.end(), warnings.begin(), warnings.end());
      }
    }
    return r;
  };

  Report(on_progress, BackupStage::ReadingData);
  const config::Config cfg = config_.Get();
  std::vector<uint8_t> database;
  bool have_database = false;

  if (request.include_database) {
    util::FileLock lock(StorageLockPath(cfg.service.storage_path));
    if (!lock.IsOpen() || !lock.TryLock()) {
      return finish(Status::Error(ErrorCode::ResourceBusy,
                                  "storage is in use: " + lock.GetReason()));
    }
    auto db = util::try_read_file(cfg.service.storage_path);
    if (db) {
      database = std::move(*db);
      have_database = true;
    } else {
      LOG_BACKUP_WARN("Storage {} not readable, backing up configuration only",
                      cfg.service.storage_path);
      result.warnings.push_back("database not found; backup contains configuration only");
    }
  }

  Report(on_progress, BackupStage::Encrypting);
  const std::string payload = BuildPayload(cfg, have_database ? &database : nullptr).dump();
  auto sealed = EncryptBackup(std::vector<uint8_t>(payload.begin(), payload.end()),
                              request.password, options_.kdf_iterations);
  if (!sealed.IsOk()) {
    return finish(sealed.GetStatus());
  }

  Report(on_progress, BackupStage::WritingFile);
  if (!util::atomic_write_file(request.path, sealed.Value(), 0600)) {
    return finish(Status::Error(ErrorCode::IoError, "cannot write " + request.path.string()));
  }

  result.includes_database = have_database;
  result.size_bytes = sealed.Value().size();
  LOG_BACKUP_INFO("Backup written to {} ({} bytes, database {})", request.path.string(),
                  result.size_bytes, have_database ? "included" : "not included");

  auto out = finish(std::move(result));
  Report(on_progress, BackupStage::Done);
  return out;
}

// ---------------------------------------------------------------------------
// Restore
// ---------------------------------------------------------------------------

core::Result<RestoreResult> BackupCoordinator::RestoreBackup(const RestoreBackupRequest &request,
                                                             const BackupProgressCallback &on_progress) {
  if (request.password.size() < MIN_BACKUP_PASSWORD_LENGTH) {
    return Status::Error(ErrorCode::InvalidArgument,
                         "backup password must be at least " +
                             std::to_string(MIN_BACKUP_PASSWORD_LENGTH) + " characters");
  }
  auto container = ReadContainer(request.path);
  if (!container.IsOk()) return container.GetStatus();

  Report(on_progress, BackupStage::PausingService);
  auto paused = PauseService(true);
  if (!paused.IsOk()) {
    LOG_BACKUP_ERROR("Restore aborted: {}", paused.GetStatus().ToString());
    return paused.GetStatus();
  }
  const bool was_running = paused.Value().was_running;

  // Nothing on disk has changed yet; bring the old service back
  auto fail = [&](const Status &st) -> core::Result<RestoreResult> {
    LOG_BACKUP_ERROR("Restore failed: {}", st.ToString());
    if (was_running) {
      std::vector<std::string> ignored;
      bool restarted = false;
      ResumeService(false, ignored, restarted);
    }
    return st;
  };

  Report(on_progress, BackupStage::Decrypting);
  auto plain = DecryptBackup(container.Value(), request.password, options_.kdf_iterations);
  if (!plain.IsOk()) return fail(plain.GetStatus());

  auto payload = ParsePayload(plain.Value(), true);
  if (!payload.IsOk()) return fail(payload.GetStatus());
  Payload &restored = payload.Value();

  const config::Config previous = config_.Get();
  config::Config next = restored.config;
  // Machine-local settings stay; the database goes to the current path
  next.service.storage_path = previous.service.storage_path;
  next.service.listen_port = previous.service.listen_port;
  next.service.max_message_size_mb = previous.service.max_message_size_mb;
  next.service.password_initialized = false;
  next.ui.window = previous.ui.window;
  next.onboarding_complete = true;

  // Released before any engine is reopened
  auto lock = std::make_unique<util::FileLock>(StorageLockPath(previous.service.storage_path));
  if (!lock->IsOpen() || !lock->TryLock()) {
    const std::string reason = lock->GetReason();
    lock.reset();
    return fail(Status::Error(ErrorCode::ResourceBusy, "storage is in use: " + reason));
  }

  Report(on_progress, BackupStage::RestoringConfig);
  config_.Replace(next);
  Status st = config_.Save();
  if (!st.IsOk()) {
    config_.Replace(previous);
    lock.reset();
    return fail(Status::Error(ErrorCode::IoError, "cannot write configuration: " + st.GetMessage()));
  }

  RestoreResult result;
  result.backup_timestamp = restored.timestamp;

  if (restored.includes_database) {
    Report(on_progress, BackupStage::RestoringDatabase);
    if (!util::atomic_write_file(previous.service.storage_path, restored.database, 0600)) {
      LOG_BACKUP_ERROR("Configuration restored but storage write to {} failed",
                       previous.service.storage_path);
      return Status::Error(ErrorCode::PartialRestore,
                           "configuration restored but database could not be written to " +
                               previous.service.storage_path);
    }
    result.restored_database = true;
  }
  lock.reset();

  LOG_BACKUP_INFO("Restored backup from {} (taken {}, database {})", request.path.string(),
                  restored.timestamp, result.restored_database ? "restored" : "not included");

  if (was_running) {
    Report(on_progress, BackupStage::ResumingService);
    ResumeService(true, result.warnings, result.service_restarted);
  }
  Report(on_progress, BackupStage::Done);
  return result;
}

// ---------------------------------------------------------------------------
// Inspection
// ---------------------------------------------------------------------------

core::Status BackupCoordinator::VerifyBackupPassword(const std::filesystem::path &path,
                                                     const std::string &password) const {
  auto container = ReadContainer(path);
  if (!container.IsOk()) return container.GetStatus();
  auto plain = DecryptBackup(container.Value(), password, options_.kdf_iterations);
  return plain.IsOk() ? Status::Ok() : plain.GetStatus();
}

core::Result<BackupInfo> BackupCoordinator::GetBackupInfo(const std::filesystem::path &path,
                                                          const std::string &password) const {
  auto container = ReadContainer(path);
  if (!container.IsOk()) return container.GetStatus();
  auto plain = DecryptBackup(container.Value(), password, options_.kdf_iterations);
  if (!plain.IsOk()) return plain.GetStatus();
  auto payload = ParsePayload(plain.Value(), false);
  if (!payload.IsOk()) return payload.GetStatus();

  BackupInfo info;
  info.version = payload.Value().version;
  info.timestamp = payload.Value().timestamp;
  info.includes_database = payload.Value().includes_database;
  return info;
}

} // namespace backup
} // namespace tyr
