// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "config/config_store.hpp"
#include "core/status.hpp"
#include "service/mail_engine.hpp"
#include "service/service_state.hpp"
#include "service/status_broadcaster.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tyr {
namespace service {

/**
 * ServiceManager - owns the single embedded engine instance
 *
 *   Stopped -(Initialize, Start)-> Starting -> Running
 *   Running -(SoftStop | Stop)-> Stopping -> Stopped
 *   Starting | Running | Stopping -> Error   (cleared only by Initialize)
 *
 * Lifecycle calls and hot reloads are serialized by one mutex, so two hot
 * reloads never interleave and a reload never races a stop. Status reads
 * (GetStatus, GetPeerStats) do not take that mutex and stay responsive while
 * a slow stop is in progress.
 *
 * Hot reload of peers is all-or-nothing: additions are applied first, then
 * removals; if any engine call fails, every change already applied is
 * reverted and the previous peer set stays active.
 */
class ServiceManager {
public:
  ServiceManager(config::ConfigStore &config, EngineFactory factory, PasswordProvider password,
                 std::shared_ptr<StatusBroadcaster> broadcaster);
  ~ServiceManager();

  ServiceManager(const ServiceManager &) = delete;
  ServiceManager &operator=(const ServiceManager &) = delete;

  core::Status Initialize();
  core::Status Start();
  core::Status SoftStop();
  core::Status Stop();
  core::Status Close();
  core::Status Restart();

  // SoftStop (Stop fallback) + Close; safe to call repeatedly
  core::Status Shutdown();

  core::Status HotReloadPeers(const std::vector<std::string> &peers);
  core::Status HotReloadMaxMessageSize(uint64_t bytes);

  // Re-apply the account password to the open storage and mark it applied
  core::Status UpdatePassword(const std::string &password);

  ServiceState GetStatus() const;
  std::string GetLastError() const;
  bool IsInitialized() const;

  [[nodiscard]] StatusBroadcaster::Subscription
  Subscribe(size_t capacity = DEFAULT_SUBSCRIBER_CAPACITY);

  // Every configured peer (enabled or not) with live metrics where known
  std::vector<PeerRuntimeStats> GetPeerStats() const;

  bool IsStorageHeld() const;
  std::string GetMailAddress() const;

  // Peers the running engine has been told about
  std::vector<std::string> GetActivePeers() const;

private:
  core::Status InitializeLocked();
  core::Status StartLocked();
  core::Status SoftStopLocked();
  core::Status StopLocked();
  core::Status CloseLocked();

  // Apply a transition and publish it
  void Transition(ServiceState state, const std::string &error = {});
  std::shared_ptr<MailEngine> engine() const;

  config::ConfigStore &config_;
  EngineFactory factory_;
  PasswordProvider password_;
  std::shared_ptr<StatusBroadcaster> broadcaster_;

  // Serializes lifecycle operations and hot reloads; taken before state_mutex_
  std::mutex lifecycle_mutex_;

  // Written with both mutexes held, read under either
  mutable std::mutex state_mutex_;
  ServiceState state_{ServiceState::Stopped};
  std::string last_error_;
  std::shared_ptr<MailEngine> engine_;
  std::vector<std::string> active_peers_;
};

} // namespace service
} // namespace tyr
