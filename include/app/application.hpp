// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "backup/backup_coordinator.hpp"
#include "config/config_store.hpp"
#include "core/status.hpp"
#include "discovery/discovery_cache.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "service/service_host.hpp"
#include "service/storage_stats.hpp"
#include "util/files.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace tyr {
namespace app {

constexpr const char *SEEDS_FILENAME = "public_peers.json";

// Application configuration
struct AppConfig {
  std::filesystem::path datadir;
  // Seed document; empty = <datadir>/public_peers.json
  std::filesystem::path seeds_path;
  size_t probe_concurrency = discovery::DEFAULT_PROBE_CONCURRENCY;
  backup::BackupOptions backup_options;
  // Hold <datadir>/.lock for the application's lifetime
  bool lock_datadir = true;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Collaborators; any left empty gets the production implementation
struct AppDependencies {
  std::shared_ptr<discovery::SeedDirectory> seeds;
  std::shared_ptr<discovery::PeerProbe> probe;
  service::EngineFactory engine_factory;
  service::PasswordProvider password_provider;
};

// Cached discovery result as shown to the user
struct CachedPeersView {
  std::vector<discovery::DiscoveredPeer> peers;
  int64_t timestamp{0};
  bool from_cache{true};
  bool fresh{false};  // younger than the 24h advisory TTL
};

/**
 * Application - the connectivity core behind every front end
 *
 * Owns configuration, discovery, the service host and backups, wired
 * together explicitly so tests can build isolated instances. Lifecycle and
 * backup work always runs on one "lifecycle" thread (strict FIFO): the *Async
 * variants return its future, the plain calls wait on it. A start issued
 * while a backup has the service paused therefore runs after the backup.
 * Scans use a separate "scan" thread so a long scan never delays a stop.
 */
class Application {
public:
  explicit Application(AppConfig config = AppConfig{}, AppDependencies deps = {});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lock the data directory and load (or create) the configuration
  core::Status Initialize();
  void Shutdown();

  // Discovery
  core::Result<discovery::DiscoveryResult>
  FindAvailablePeers(const discovery::DiscoveryRequest &request,
                     discovery::ProgressCallback on_progress = {});
  std::future<core::Result<discovery::DiscoveryResult>>
  FindAvailablePeersAsync(const discovery::DiscoveryRequest &request,
                          discovery::ProgressCallback on_progress = {});
  CachedPeersView GetCachedDiscoveredPeers();
  core::Status ClearCachedDiscoveredPeers();
  void CancelPeerDiscovery();
  discovery::DiscoveryProgress GetDiscoveryProgress() const;
  core::Result<std::vector<std::string>> GetAvailableRegions();
  core::Result<std::vector<discovery::DiscoveredPeer>>
  CheckCustomPeers(const std::vector<std::string> &uris);

  // Add to configuration (enabling ones already present) and save;
  // returns how many were accepted
  core::Result<size_t> AddDiscoveredPeers(const std::vector<discovery::DiscoveredPeer> &peers);

  // Service lifecycle
  core::Status StartService();
  core::Status StopService();
  core::Status SoftStopService();
  core::Status RestartService();
  std::future<core::Status> StartServiceAsync();
  std::future<core::Status> StopServiceAsync();
  std::future<core::Status> RestartServiceAsync();

  // Push the configured enabled peers to the running service
  core::Status HotReloadPeers();
  // Persist the new limit and apply it to the running service
  core::Status HotReloadMaxMessageSize(int64_t size_mb);

  // Apply a new account password to the open storage
  core::Status UpdatePassword(const std::string &password);
  // Disk usage of the configured storage
  core::Result<service::StorageStats> GetStorageStats() const;

  service::ServiceState GetServiceStatus() const;
  std::vector<service::PeerRuntimeStats> GetPeerStats() const;
  [[nodiscard]] service::StatusBroadcaster::Subscription SubscribeStatus();

  // Backup
  core::Result<backup::BackupResult> CreateBackup(const backup::CreateBackupRequest &request,
                                                  backup::BackupProgressCallback on_progress = {});
  core::Result<backup::RestoreResult> RestoreBackup(const backup::RestoreBackupRequest &request,
                                                    backup::BackupProgressCallback on_progress = {});
  std::future<core::Result<backup::BackupResult>>
  CreateBackupAsync(const backup::CreateBackupRequest &request,
                    backup::BackupProgressCallback on_progress = {});
  std::future<core::Result<backup::RestoreResult>>
  RestoreBackupAsync(const backup::RestoreBackupRequest &request,
                     backup::BackupProgressCallback on_progress = {});
  core::Status VerifyBackupPassword(const std::filesystem::path &path, const std::string &password);
  core::Result<backup::BackupInfo> GetBackupInfo(const std::filesystem::path &path,
                                                 const std::string &password);

  // Component access
  config::ConfigStore &config() { return *config_; }
  service::ServiceHost &service_host() { return *host_; }
  discovery::DiscoveryCoordinator &discovery() { return *discovery_; }
  const AppConfig &app_config() const { return app_config_; }

  // Daemon support
  void RequestShutdown() { shutdown_requested_ = true; }
  bool ShutdownRequested() const { return shutdown_requested_; }
  // Blocks until RequestShutdown() or SIGINT / SIGTERM
  void WaitForShutdown();
  void InstallSignalHandlers();

private:
  template <typename F> auto RunOnLifecycle(F &&f) -> std::future<decltype(f())>;

  // Lifecycle thread only
  core::Status DoStartService();
  core::Status DoStopService();
  core::Status DoSoftStopService();
  core::Status DoRestartService();

  static void SignalHandler(int signal);
  static std::atomic<Application *> instance_;

  AppConfig app_config_;
  std::atomic<bool> initialized_{false};
  std::atomic<bool> datadir_locked_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (destroyed in reverse order)
  std::unique_ptr<config::ConfigStore> config_;
  std::unique_ptr<discovery::DiscoveryCoordinator> discovery_;
  std::unique_ptr<discovery::DiscoveryCache> cache_;
  std::unique_ptr<service::ServiceHost> host_;
  std::unique_ptr<backup::BackupCoordinator> backup_;

  // Executors reference the components above; declared last so they are
  // joined first
  std::unique_ptr<util::ThreadPool> scan_pool_;
  std::unique_ptr<util::ThreadPool> lifecycle_pool_;
};

} // namespace app
} // namespace tyr
