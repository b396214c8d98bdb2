// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "service/service_manager.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace tyr {
namespace service {

using core::ErrorCode;
using core::Status;

namespace {

constexpr uint64_t BYTES_PER_MB = 1024 * 1024;

// Trim, drop empties and duplicates, keep first-seen order
std::vector<std::string> NormalizePeerList(const std::vector<std::string> &peers) {
  std::vector<std::string> out;
  std::set<std::string> seen;
  for (const auto &raw : peers) {
    std::string p = util::Trim(raw);
    if (p.empty() || !seen.insert(p).second) continue;
    out.push_back(std::move(p));
  }
  return out;
}

bool IsActive(ServiceState s) {
  return s == ServiceState::Starting || s == ServiceState::Running || s == ServiceState::Stopping;
}

} // namespace

ServiceManager::ServiceManager(config::ConfigStore &config, EngineFactory factory,
                               PasswordProvider password,
                               std::shared_ptr<StatusBroadcaster> broadcaster)
    : config_(config),
      factory_(std::move(factory)),
      password_(std::move(password)),
      broadcaster_(broadcaster ? std::move(broadcaster) : std::make_shared<StatusBroadcaster>()) {}

ServiceManager::~ServiceManager() {
  Status st = Shutdown();
  if (!st.IsOk()) {
    LOG_SVC_WARN("Service shutdown on destruction: {}", st.ToString());
  }
}

void ServiceManager::Transition(ServiceState state, const std::string &error) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (state_ == state && error.empty()) return;
  state_ = state;
  if (state == ServiceState::Error) {
    last_error_ = error;
    LOG_SVC_ERROR("Service error: {}", error);
  } else {
    LOG_SVC_DEBUG("Service state -> {}", ServiceStateName(state));
  }
  // Published under state_mutex_ so subscribers see transitions in order
  broadcaster_->Publish(StatusEvent{state, error, util::GetTime(), 0});
}

std::shared_ptr<MailEngine> ServiceManager::engine() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return engine_;
}

ServiceState ServiceManager::GetStatus() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::string ServiceManager::GetLastError() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_error_;
}

bool ServiceManager::IsInitialized() const { return engine() != nullptr; }

StatusBroadcaster::Subscription ServiceManager::Subscribe(size_t capacity) {
  return broadcaster_->Subscribe(capacity);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

core::Status ServiceManager::Initialize() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return InitializeLocked();
}

core::Status ServiceManager::InitializeLocked() {
  const ServiceState current = GetStatus();
  auto old = engine();

  if (old && current != ServiceState::Error) {
    return Status::Error(ErrorCode::AlreadyInitialized, "service is already initialized");
  }
  if (old) {
    // Recovering from Error: tear down the failed engine first
    LOG_SVC_INFO("Reinitializing service after error");
    Status st = old->Stop();
    if (!st.IsOk()) LOG_SVC_WARN("Stopping failed engine: {}", st.ToString());
    st = old->Close();
    if (!st.IsOk()) LOG_SVC_WARN("Closing failed engine: {}", st.ToString());
    std::lock_guard<std::mutex> slock(state_mutex_);
    engine_.reset();
  }

  const config::Config cfg = config_.Get();
  EngineSettings settings;
  settings.storage_path = cfg.service.storage_path;
  settings.smtp_address = cfg.service.smtp_address;
  settings.imap_address = cfg.service.imap_address;
  settings.listen_port = cfg.service.listen_port;
  settings.max_message_size_bytes = static_cast<uint64_t>(cfg.service.max_message_size_mb) * BYTES_PER_MB;
  settings.peers = NormalizePeerList(cfg.EnabledPeers());

  if (!factory_) {
    return Status::Error(ErrorCode::EngineFailure, "no engine factory configured");
  }
  std::unique_ptr<MailEngine> created = factory_(settings);
  if (!created) {
    return Status::Error(ErrorCode::EngineFailure, "engine factory returned no engine");
  }

  Status st = created->Open();
  if (!st.IsOk()) {
    LOG_SVC_ERROR("Failed to open engine storage {}: {}", settings.storage_path.string(),
                  st.ToString());
    return st;
  }

  if (!cfg.service.password_initialized) {
    std::optional<std::string> password = password_ ? password_() : std::nullopt;
    if (password) {
      st = created->SetPassword(*password);
      if (!st.IsOk()) {
        Status close_st = created->Close();
        if (!close_st.IsOk()) LOG_SVC_WARN("Closing engine: {}", close_st.ToString());
        return st;
      }
      config_.SetPasswordInitialized(true);
      Status save_st = config_.Save();
      if (!save_st.IsOk()) {
        LOG_SVC_WARN("Password applied but config not saved: {}", save_st.ToString());
      }
      LOG_SVC_INFO("Account password applied to storage");
    } else {
      LOG_SVC_WARN("No account password available; it will be applied on a later start");
    }
  }

  {
    std::lock_guard<std::mutex> slock(state_mutex_);
    engine_ = std::shared_ptr<MailEngine>(std::move(created));
    active_peers_ = settings.peers;
  }
  if (current == ServiceState::Error) {
    Transition(ServiceState::Stopped);
  }
  LOG_SVC_INFO("Service initialized ({} peers, storage {})", settings.peers.size(),
               settings.storage_path.string());
  return Status::Ok();
}

core::Status ServiceManager::Start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return StartLocked();
}

core::Status ServiceManager::StartLocked() {
  const ServiceState current = GetStatus();
  if (current == ServiceState::Running || current == ServiceState::Starting) {
    return Status::Error(ErrorCode::AlreadyRunning, "service is already running");
  }
  auto eng = engine();
  if (!eng || current == ServiceState::Error) {
    return Status::Error(ErrorCode::NotInitialized, "service must be initialized before start");
  }

  if (active_peers_.empty()) {
    LOG_SVC_INFO("Starting without peers (local-only mode)");
  }

  Transition(ServiceState::Starting);
  Status st = eng->Start();
  if (!st.IsOk()) {
    Transition(ServiceState::Error, st.GetMessage());
    return st;
  }
  Transition(ServiceState::Running);
  LOG_SVC_INFO("Service running, mail address {}", eng->GetMailAddress());
  return Status::Ok();
}

core::Status ServiceManager::SoftStop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return SoftStopLocked();
}

core::Status ServiceManager::SoftStopLocked() {
  const ServiceState current = GetStatus();
  auto eng = engine();
  if (!eng || (current != ServiceState::Running && current != ServiceState::Starting)) {
    return Status::Error(ErrorCode::NotRunning, "service is not running");
  }

  Transition(ServiceState::Stopping);
  Status st = eng->SoftStop();
  if (!st.IsOk()) {
    LOG_SVC_WARN("Graceful stop failed ({}), forcing stop", st.ToString());
    st = eng->Stop();
    if (!st.IsOk()) {
      Transition(ServiceState::Error, st.GetMessage());
      return st;
    }
  }
  Transition(ServiceState::Stopped);
  LOG_SVC_INFO("Service stopped");
  return Status::Ok();
}

core::Status ServiceManager::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return StopLocked();
}

core::Status ServiceManager::StopLocked() {
  const ServiceState current = GetStatus();
  auto eng = engine();
  if (!eng || (current != ServiceState::Running && current != ServiceState::Starting)) {
    return Status::Error(ErrorCode::NotRunning, "service is not running");
  }

  Transition(ServiceState::Stopping);
  Status st = eng->Stop();
  if (!st.IsOk()) {
    Transition(ServiceState::Error, st.GetMessage());
    return st;
  }
  Transition(ServiceState::Stopped);
  LOG_SVC_INFO("Service stopped (hard)");
  return Status::Ok();
}

core::Status ServiceManager::Close() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return CloseLocked();
}

core::Status ServiceManager::CloseLocked() {
  const ServiceState current = GetStatus();
  auto eng = engine();
  if (!eng) {
    return Status::Ok();
  }
  if (IsActive(current)) {
    return Status::Error(ErrorCode::ResourceBusy, "service must be stopped before close");
  }
  if (current == ServiceState::Error) {
    Status st = eng->Stop();
    if (!st.IsOk()) LOG_SVC_WARN("Stopping failed engine before close: {}", st.ToString());
  }

  Status st = eng->Close();
  if (!st.IsOk()) {
    LOG_SVC_ERROR("Failed to release storage: {}", st.ToString());
    return st;
  }
  {
    std::lock_guard<std::mutex> slock(state_mutex_);
    engine_.reset();
    active_peers_.clear();
  }
  LOG_SVC_DEBUG("Service closed, storage released");
  return Status::Ok();
}

core::Status ServiceManager::Restart() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  const ServiceState current = GetStatus();
  if (current == ServiceState::Running || current == ServiceState::Starting) {
    Status st = SoftStopLocked();
    if (!st.IsOk()) return st;
  }
  Status st = CloseLocked();
  if (!st.IsOk()) return st;
  st = InitializeLocked();
  if (!st.IsOk()) return st;
  return StartLocked();
}

core::Status ServiceManager::Shutdown() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  const ServiceState current = GetStatus();
  Status result;
  if (current == ServiceState::Running || current == ServiceState::Starting) {
    result = SoftStopLocked();
  }
  Status st = CloseLocked();
  if (result.IsOk()) result = st;
  return result;
}

// ---------------------------------------------------------------------------
// Hot reload
// ---------------------------------------------------------------------------

core::Status ServiceManager::HotReloadPeers(const std::vector<std::string> &peers) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  const std::vector<std::string> wanted = NormalizePeerList(peers);
  if (wanted.empty()) {
    return Status::Error(ErrorCode::NoPeersEnabled, "at least one peer must be enabled");
  }
  auto eng = engine();
  if (!eng || GetStatus() != ServiceState::Running) {
    return Status::Error(ErrorCode::NotRunning, "hot reload requires a running service");
  }

  const std::set<std::string> before(active_peers_.begin(), active_peers_.end());
  const std::set<std::string> after(wanted.begin(), wanted.end());

  std::vector<std::string> to_add;
  for (const auto &p : wanted) {
    if (!before.count(p)) to_add.push_back(p);
  }
  std::vector<std::string> to_remove;
  for (const auto &p : active_peers_) {
    if (!after.count(p)) to_remove.push_back(p);
  }

  if (to_add.empty() && to_remove.empty()) {
    LOG_SVC_DEBUG("Hot reload: peer set unchanged");
    return Status::Ok();
  }

  std::vector<std::string> added;
  std::vector<std::string> removed;

  auto rollback = [&]() {
    for (auto it = removed.rbegin(); it != removed.rend(); ++it) {
      Status st = eng->AddPeer(*it);
      if (!st.IsOk()) LOG_SVC_ERROR("Rollback: re-adding {} failed: {}", *it, st.ToString());
    }
    for (auto it = added.rbegin(); it != added.rend(); ++it) {
      Status st = eng->RemovePeer(*it);
      if (!st.IsOk()) LOG_SVC_ERROR("Rollback: removing {} failed: {}", *it, st.ToString());
    }
  };

  for (const auto &p : to_add) {
    Status st = eng->AddPeer(p);
    if (!st.IsOk()) {
      LOG_SVC_WARN("Hot reload: adding {} failed ({}), rolling back", p, st.ToString());
      rollback();
      return Status::Error(st.GetCode(), "hot reload aborted: " + st.GetMessage());
    }
    added.push_back(p);
  }
  for (const auto &p : to_remove) {
    Status st = eng->RemovePeer(p);
    if (!st.IsOk()) {
      LOG_SVC_WARN("Hot reload: removing {} failed ({}), rolling back", p, st.ToString());
      rollback();
      return Status::Error(st.GetCode(), "hot reload aborted: " + st.GetMessage());
    }
    removed.push_back(p);
  }

  {
    std::lock_guard<std::mutex> slock(state_mutex_);
    active_peers_ = wanted;
  }
  LOG_SVC_INFO("Hot reload applied: +{} -{} peers ({} active)", added.size(), removed.size(),
               active_peers_.size());
  return Status::Ok();
}

core::Status ServiceManager::HotReloadMaxMessageSize(uint64_t bytes) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (bytes == 0) {
    return Status::Error(ErrorCode::InvalidArgument, "message size limit must be positive");
  }
  auto eng = engine();
  if (!eng) {
    return Status::Error(ErrorCode::NotInitialized, "service is not initialized");
  }
  Status st = eng->SetMaxMessageSize(bytes);
  if (st.IsOk()) {
    LOG_SVC_INFO("Max message size set to {} bytes", bytes);
  }
  return st;
}

core::Status ServiceManager::UpdatePassword(const std::string &password) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (password.empty()) {
    return Status::Error(ErrorCode::InvalidArgument, "password must not be empty");
  }
  auto eng = engine();
  if (!eng) {
    return Status::Error(ErrorCode::NotInitialized, "service is not initialized");
  }
  Status st = eng->SetPassword(password);
  if (!st.IsOk()) {
    LOG_SVC_ERROR("Failed to update account password: {}", st.ToString());
    return st;
  }
  if (!config_.Get().service.password_initialized) {
    config_.SetPasswordInitialized(true);
    Status save_st = config_.Save();
    if (!save_st.IsOk()) {
      LOG_SVC_WARN("Password updated but config not saved: {}", save_st.ToString());
    }
  }
  LOG_SVC_INFO("Account password updated");
  return Status::Ok();
}

// ---------------------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------------------

std::vector<PeerRuntimeStats> ServiceManager::GetPeerStats() const {
  std::map<std::string, PeerRuntimeStats> live;
  if (auto eng = engine()) {
    for (auto &s : eng->GetPeerStats()) {
      live[s.address] = std::move(s);
    }
  }

  std::vector<PeerRuntimeStats> out;
  for (const auto &peer : config_.GetPeers()) {
    PeerRuntimeStats stats;
    auto it = live.find(peer.address);
    if (it != live.end()) {
      stats = it->second;
    } else {
      stats.address = peer.address;
    }
    stats.enabled = peer.enabled;
    out.push_back(std::move(stats));
  }
  return out;
}

bool ServiceManager::IsStorageHeld() const {
  auto eng = engine();
  return eng && eng->IsStorageHeld();
}

std::string ServiceManager::GetMailAddress() const {
  auto eng = engine();
  return eng ? eng->GetMailAddress() : std::string{};
}

std::vector<std::string> ServiceManager::GetActivePeers() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return active_peers_;
}

} // namespace service
} // namespace tyr
