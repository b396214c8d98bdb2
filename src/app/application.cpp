// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"
#include "discovery/peer_probe.hpp"
#include "discovery/seed_directory.hpp"
#include "service/link_engine.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <chrono>
#include <csignal>
#include <thread>
#include <unistd.h>  // write(), STDOUT_FILENO (async-signal-safe)

namespace tyr {
namespace app {

using core::ErrorCode;
using core::Status;

// Static instance for signal handling
std::atomic<Application *> Application::instance_{nullptr};

namespace {

constexpr uint64_t BYTES_PER_MB = 1024 * 1024;

} // namespace

Application::Application(AppConfig config, AppDependencies deps)
    : app_config_(std::move(config)) {
  if (app_config_.seeds_path.empty()) {
    app_config_.seeds_path = app_config_.datadir / SEEDS_FILENAME;
  }

  auto seeds = deps.seeds;
  if (!seeds) {
    seeds = std::make_shared<discovery::JsonSeedDirectory>(app_config_.seeds_path);
  }
  auto probe = deps.probe;
  if (!probe) {
    probe = std::make_shared<discovery::AsioPeerProbe>();
  }
  auto factory = deps.engine_factory;
  if (!factory) {
    factory = service::LinkEngine::Factory();
  }

  config_ = std::make_unique<config::ConfigStore>(app_config_.datadir);
  discovery_ = std::make_unique<discovery::DiscoveryCoordinator>(
      std::move(seeds), std::move(probe), app_config_.probe_concurrency);
  cache_ = std::make_unique<discovery::DiscoveryCache>(app_config_.datadir /
                                                       discovery::DISCOVERY_CACHE_FILENAME);
  host_ = std::make_unique<service::ServiceHost>(*config_, std::move(factory),
                                                 std::move(deps.password_provider));
  backup_ = std::make_unique<backup::BackupCoordinator>(*host_, *config_,
                                                        app_config_.backup_options);
  // A scan in flight would otherwise report against a service being paused
  backup_->SetBeforePauseHook([this] { discovery_->Cancel(); });

  scan_pool_ = std::make_unique<util::ThreadPool>(1, 0, "scan");
  lifecycle_pool_ = std::make_unique<util::ThreadPool>(1, 0, "lifecycle");
}

Application::~Application() {
  Shutdown();
  Application *self = this;
  instance_.compare_exchange_strong(self, nullptr);
}

Status Application::Initialize() {
  if (initialized_) {
    return Status::Error(ErrorCode::AlreadyInitialized, "application already initialized");
  }

  LOG_APP_INFO("Data directory: {}", app_config_.datadir.string());
  if (!util::ensure_directory(app_config_.datadir)) {
    return Status::Error(ErrorCode::IoError,
                         "cannot create data directory " + app_config_.datadir.string());
  }

  if (app_config_.lock_datadir) {
    switch (util::LockDirectory(app_config_.datadir)) {
    case util::LockResult::Success:
      datadir_locked_ = true;
      break;
    case util::LockResult::ErrorWrite:
      return Status::Error(ErrorCode::IoError,
                           "cannot write lock file in " + app_config_.datadir.string());
    case util::LockResult::ErrorLock:
      return Status::Error(ErrorCode::ResourceBusy,
                           "data directory " + app_config_.datadir.string() +
                               " is in use by another instance");
    }
  }

  Status status = config_->Load();
  if (!status.IsOk()) {
    LOG_APP_ERROR("Failed to load configuration: {}", status.ToString());
    if (datadir_locked_.exchange(false)) {
      util::UnlockDirectory(app_config_.datadir);
    }
    return status;
  }

  initialized_ = true;
  LOG_APP_INFO("Configuration loaded ({} peers, {} enabled)", config_->GetPeers().size(),
               config_->GetEnabledPeers().size());
  return Status::Ok();
}

void Application::Shutdown() {
  if (!scan_pool_ || scan_pool_->is_stopped()) {
    return;
  }
  LOG_APP_INFO("Shutting down...");

  discovery_->Cancel();
  scan_pool_->shutdown();
  scan_pool_->wait_for_completion();
  lifecycle_pool_->shutdown();
  lifecycle_pool_->wait_for_completion();

  Status status = host_->Current()->Shutdown();
  if (!status.IsOk()) {
    LOG_APP_WARN("Service shutdown: {}", status.ToString());
  }

  if (datadir_locked_.exchange(false)) {
    util::UnlockDirectory(app_config_.datadir);
  }
  initialized_ = false;
  LOG_APP_INFO("Shutdown complete");
}

template <typename F> auto Application::RunOnLifecycle(F &&f) -> std::future<decltype(f())> {
  using R = decltype(f());
  try {
    return lifecycle_pool_->enqueue(std::forward<F>(f));
  } catch (const std::runtime_error &e) {
    std::promise<R> rejected;
    rejected.set_value(R(Status::Error(ErrorCode::ResourceBusy, e.what())));
    return rejected.get_future();
  }
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

core::Result<discovery::DiscoveryResult>
Application::FindAvailablePeers(const discovery::DiscoveryRequest &request,
                                discovery::ProgressCallback on_progress) {
  auto result = discovery_->FindAvailablePeers(request, std::move(on_progress));
  if (!result.IsOk()) {
    return result;
  }

  const auto &scan = result.Value();
  if (scan.cancelled) {
    // Partial results are returned but never replace the cache
    LOG_DISC_INFO("Scan cancelled after {} ms; cache left unchanged", scan.elapsed_ms);
    return result;
  }
  if (!cache_->Save(scan.peers, util::GetTime())) {
    LOG_DISC_WARN("Failed to update discovery cache {}", cache_->path().string());
  }
  return result;
}

std::future<core::Result<discovery::DiscoveryResult>>
Application::FindAvailablePeersAsync(const discovery::DiscoveryRequest &request,
                                     discovery::ProgressCallback on_progress) {
  // A queued scan would otherwise wait for the running one to finish
  discovery_->Cancel();
  try {
    return scan_pool_->enqueue([this, request, cb = std::move(on_progress)]() mutable {
      return FindAvailablePeers(request, std::move(cb));
    });
  } catch (const std::runtime_error &e) {
    std::promise<core::Result<discovery::DiscoveryResult>> rejected;
    rejected.set_value(Status::Error(ErrorCode::Cancelled, e.what()));
    return rejected.get_future();
  }
}

CachedPeersView Application::GetCachedDiscoveredPeers() {
  CachedPeersView view;
  auto cached = cache_->Load();
  if (!cached) {
    return view;
  }
  view.fresh = cached->IsFresh(util::GetTime());
  view.timestamp = cached->timestamp;
  view.peers = std::move(cached->peers);
  return view;
}

Status Application::ClearCachedDiscoveredPeers() {
  if (!cache_->Clear()) {
    return Status::Error(ErrorCode::IoError,
                         "cannot remove discovery cache " + cache_->path().string());
  }
  return Status::Ok();
}

void Application::CancelPeerDiscovery() { discovery_->Cancel(); }

discovery::DiscoveryProgress Application::GetDiscoveryProgress() const {
  return discovery_->GetProgress();
}

core::Result<std::vector<std::string>> Application::GetAvailableRegions() {
  return discovery_->GetAvailableRegions();
}

core::Result<std::vector<discovery::DiscoveredPeer>>
Application::CheckCustomPeers(const std::vector<std::string> &uris) {
  return discovery_->CheckCustomPeers(uris);
}

core::Result<size_t>
Application::AddDiscoveredPeers(const std::vector<discovery::DiscoveredPeer> &peers) {
  size_t added = 0;
  for (const auto &peer : peers) {
    Status status = config_->AddPeer(peer.address);
    if (!status.IsOk()) {
      LOG_APP_WARN("Skipping discovered peer {}: {}", peer.address, status.GetMessage());
      continue;
    }
    ++added;
  }
  if (added == 0) {
    return size_t{0};
  }

  Status status = config_->Save();
  if (!status.IsOk()) {
    return status;
  }
  LOG_APP_INFO("Added {} discovered peer(s) to configuration", added);
  return added;
}

// ---------------------------------------------------------------------------
// Service lifecycle
// ---------------------------------------------------------------------------

Status Application::StartService() { return RunOnLifecycle([this] { return DoStartService(); }).get(); }

Status Application::StopService() { return RunOnLifecycle([this] { return DoStopService(); }).get(); }

Status Application::SoftStopService() {
  return RunOnLifecycle([this] { return DoSoftStopService(); }).get();
}

Status Application::RestartService() {
  return RunOnLifecycle([this] { return DoRestartService(); }).get();
}

std::future<Status> Application::StartServiceAsync() {
  return RunOnLifecycle([this] { return DoStartService(); });
}

std::future<Status> Application::StopServiceAsync() {
  return RunOnLifecycle([this] { return DoSoftStopService(); });
}

std::future<Status> Application::RestartServiceAsync() {
  return RunOnLifecycle([this] { return DoRestartService(); });
}

Status Application::DoStartService() {
  if (!initialized_) {
    return Status::Error(ErrorCode::NotInitialized, "application not initialized");
  }
  auto manager = host_->Current();
  if (!manager->IsInitialized() || manager->GetStatus() == service::ServiceState::Error) {
    Status status = manager->Initialize();
    if (!status.IsOk() && !status.Is(ErrorCode::AlreadyInitialized)) {
      return status;
    }
  }
  return manager->Start();
}

Status Application::DoStopService() { return host_->Current()->Stop(); }

Status Application::DoSoftStopService() { return host_->Current()->SoftStop(); }

Status Application::DoRestartService() {
  if (!initialized_) {
    return Status::Error(ErrorCode::NotInitialized, "application not initialized");
  }
  return host_->Current()->Restart();
}

Status Application::HotReloadPeers() {
  return host_->Current()->HotReloadPeers(config_->GetEnabledPeers());
}

Status Application::HotReloadMaxMessageSize(int64_t size_mb) {
  Status status = config_->SetMaxMessageSizeMb(size_mb);
  if (!status.IsOk()) {
    return status;
  }
  status = config_->Save();
  if (!status.IsOk()) {
    return status;
  }

  // A closed service picks the new value up at its next Initialize()
  auto manager = host_->Current();
  if (!manager->IsInitialized()) {
    return Status::Ok();
  }
  return manager->HotReloadMaxMessageSize(static_cast<uint64_t>(size_mb) * BYTES_PER_MB);
}

Status Application::UpdatePassword(const std::string &password) {
  if (!initialized_) {
    return Status::Error(ErrorCode::NotInitialized, "application not initialized");
  }
  return host_->Current()->UpdatePassword(password);
}

core::Result<service::StorageStats> Application::GetStorageStats() const {
  return service::GetStorageStats(config_->Get().service.storage_path);
}

service::ServiceState Application::GetServiceStatus() const {
  return host_->Current()->GetStatus();
}

std::vector<service::PeerRuntimeStats> Application::GetPeerStats() const {
  return host_->Current()->GetPeerStats();
}

service::StatusBroadcaster::Subscription Application::SubscribeStatus() {
  return host_->broadcaster()->Subscribe();
}

// ---------------------------------------------------------------------------
// Backup
// ---------------------------------------------------------------------------

core::Result<backup::BackupResult>
Application::CreateBackup(const backup::CreateBackupRequest &request,
                          backup::BackupProgressCallback on_progress) {
  return CreateBackupAsync(request, std::move(on_progress)).get();
}

core::Result<backup::RestoreResult>
Application::RestoreBackup(const backup::RestoreBackupRequest &request,
                           backup::BackupProgressCallback on_progress) {
  return RestoreBackupAsync(request, std::move(on_progress)).get();
}

std::future<core::Result<backup::BackupResult>>
Application::CreateBackupAsync(const backup::CreateBackupRequest &request,
                               backup::BackupProgressCallback on_progress) {
  return RunOnLifecycle([this, request, cb = std::move(on_progress)]() mutable {
    return backup_->CreateBackup(request, cb);
  });
}

std::future<core::Result<backup::RestoreResult>>
Application::RestoreBackupAsync(const backup::RestoreBackupRequest &request,
                                backup::BackupProgressCallback on_progress) {
  return RunOnLifecycle([this, request, cb = std::move(on_progress)]() mutable {
    return backup_->RestoreBackup(request, cb);
  });
}

Status Application::VerifyBackupPassword(const std::filesystem::path &path,
                                         const std::string &password) {
  return backup_->VerifyBackupPassword(path, password);
}

core::Result<backup::BackupInfo> Application::GetBackupInfo(const std::filesystem::path &path,
                                                            const std::string &password) {
  return backup_->GetBackupInfo(path, password);
}

// ---------------------------------------------------------------------------
// Daemon support
// ---------------------------------------------------------------------------

void Application::InstallSignalHandlers() {
  instance_ = this;
  std::signal(SIGINT, Application::SignalHandler);
  std::signal(SIGTERM, Application::SignalHandler);
}

void Application::SignalHandler(int /*signal*/) {
  Application *app = instance_.load();
  if (app) {
    // write() is async-signal-safe, iostreams are not
    const char msg[] = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
    app->shutdown_requested_ = true;
  }
}

void Application::WaitForShutdown() {
  while (!shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

} // namespace app
} // namespace tyr
