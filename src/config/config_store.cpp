// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "config/config_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <mutex>

namespace tyr {
namespace config {

using json = nlohmann::json;
using core::ErrorCode;
using core::Status;

void to_json(json &j, const PeerConfig &peer) {
  j = json{{"address", peer.address}, {"enabled", peer.enabled}};
}

void from_json(const json &j, PeerConfig &peer) {
  peer.address = j.at("address").get<std::string>();
  peer.enabled = j.value("enabled", true);
}

json ConfigToJson(const Config &config) {
  json root;
  root["version"] = 1;
  root["onboarding_complete"] = config.onboarding_complete;
  root["service_settings"] = {
      {"smtp_address", config.service.smtp_address},
      {"imap_address", config.service.imap_address},
      {"storage_path", config.service.storage_path},
      {"listen_port", config.service.listen_port},
      {"max_message_size_mb", config.service.max_message_size_mb},
      {"password_initialized", config.service.password_initialized},
  };
  root["network_peers"] = config.peers;
  root["ui_preferences"] = {
      {"theme", config.ui.theme},
      {"language", config.ui.language},
      {"auto_start", config.ui.auto_start},
      {"window_state",
       {{"width", config.ui.window.width},
        {"height", config.ui.window.height},
        {"x", config.ui.window.x},
        {"y", config.ui.window.y}}},
  };
  return root;
}

Config ConfigFromJson(const json &j) {
  Config config;
  config.onboarding_complete = j.value("onboarding_complete", false);

  if (j.contains("service_settings")) {
    const auto &s = j.at("service_settings");
    auto &svc = config.service;
    svc.smtp_address = s.value("smtp_address", svc.smtp_address);
    svc.imap_address = s.value("imap_address", svc.imap_address);
    svc.storage_path = s.value("storage_path", svc.storage_path);
    svc.listen_port = s.value("listen_port", svc.listen_port);
    svc.max_message_size_mb = s.value("max_message_size_mb", svc.max_message_size_mb);
    svc.password_initialized = s.value("password_initialized", false);
  }

  if (j.contains("network_peers") && j.at("network_peers").is_array()) {
    for (const auto &entry : j.at("network_peers")) {
      if (!entry.is_object() || !entry.contains("address") || !entry["address"].is_string()) {
        LOG_WARN("Skipping malformed peer entry in configuration");
        continue;
      }
      config.peers.push_back(entry.get<PeerConfig>());
    }
  }

  if (j.contains("ui_preferences")) {
    const auto &u = j.at("ui_preferences");
    config.ui.theme = u.value("theme", config.ui.theme);
    config.ui.language = u.value("language", config.ui.language);
    config.ui.auto_start = u.value("auto_start", false);
    if (u.contains("window_state")) {
      const auto &w = u.at("window_state");
      config.ui.window.width = w.value("width", config.ui.window.width);
      config.ui.window.height = w.value("height", config.ui.window.height);
      config.ui.window.x = w.value("x", config.ui.window.x);
      config.ui.window.y = w.value("y", config.ui.window.y);
    }
  }
  return config;
}

ConfigStore::ConfigStore(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)), config_(MakeDefaultConfig(data_dir_)) {}

Status ConfigStore::Load() {
  const auto file = path();

  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    LOG_INFO("No configuration at {}, writing defaults", file.string());
    {
      std::unique_lock lock(mutex_);
      config_ = MakeDefaultConfig(data_dir_);
    }
    return Save();
  }

  auto data = util::try_read_file(file);
  if (!data) {
    return Status::Error(ErrorCode::IoError, "cannot read " + file.string());
  }

  Config loaded;
  try {
    loaded = ConfigFromJson(json::parse(data->begin(), data->end()));
  } catch (const json::exception &e) {
    LOG_ERROR("Failed to parse configuration {}: {}", file.string(), e.what());
    return Status::Error(ErrorCode::InvalidArgument,
                         "malformed configuration: " + std::string(e.what()));
  }
  ApplyDefaults(loaded, data_dir_);

  std::unique_lock lock(mutex_);
  config_ = std::move(loaded);
  LOG_DEBUG("Loaded configuration from {} ({} peers)", file.string(), config_.peers.size());
  return Status::Ok();
}

Status ConfigStore::Save() const {
  std::string data;
  {
    std::shared_lock lock(mutex_);
    data = ConfigToJson(config_).dump(2);
  }
  if (!util::atomic_write_file(path(), data, 0600)) {
    LOG_ERROR("Failed to save configuration to {}", path().string());
    return Status::Error(ErrorCode::IoError, "cannot write " + path().string());
  }
  LOG_DEBUG("Configuration saved to {}", path().string());
  return Status::Ok();
}

Config ConfigStore::Get() const {
  std::shared_lock lock(mutex_);
  return config_;
}

void ConfigStore::Replace(Config config) {
  ApplyDefaults(config, data_dir_);
  std::unique_lock lock(mutex_);
  config_ = std::move(config);
}

void ConfigStore::Update(const std::function<void(Config &)> &mutator) {
  std::unique_lock lock(mutex_);
  mutator(config_);
}

Status ConfigStore::AddPeer(const std::string &address) {
  if (!IsValidPeerAddress(address)) {
    return Status::Error(ErrorCode::InvalidArgument,
                         "invalid peer address format. Supported: tcp://, tls://, "
                         "quic://, socks://, sockstls://, unix://, ws://, wss://");
  }

  std::unique_lock lock(mutex_);
  for (auto &peer : config_.peers) {
    if (peer.address == address) {
      if (!peer.enabled) {
        peer.enabled = true;
        LOG_INFO("Peer already configured, enabled it: {}", address);
      }
      return Status::Ok();
    }
  }
  config_.peers.push_back(PeerConfig{address, true});
  return Status::Ok();
}

Status ConfigStore::RemovePeer(const std::string &address) {
  std::unique_lock lock(mutex_);
  auto it = std::find_if(config_.peers.begin(), config_.peers.end(),
                         [&](const PeerConfig &p) { return p.address == address; });
  if (it == config_.peers.end()) {
    return Status::Error(ErrorCode::InvalidArgument, "peer not found: " + address);
  }
  config_.peers.erase(it);
  return Status::Ok();
}

Status ConfigStore::EnablePeer(const std::string &address) {
  return SetPeerEnabled(address, true);
}

Status ConfigStore::DisablePeer(const std::string &address) {
  return SetPeerEnabled(address, false);
}

Status ConfigStore::SetPeerEnabled(const std::string &address, bool enabled) {
  std::unique_lock lock(mutex_);
  for (auto &peer : config_.peers) {
    if (peer.address == address) {
      peer.enabled = enabled;
      return Status::Ok();
    }
  }
  return Status::Error(ErrorCode::InvalidArgument, "peer not found: " + address);
}

std::vector<std::string> ConfigStore::GetEnabledPeers() const {
  std::shared_lock lock(mutex_);
  return config_.EnabledPeers();
}

std::vector<PeerConfig> ConfigStore::GetPeers() const {
  std::shared_lock lock(mutex_);
  return config_.peers;
}

void ConfigStore::SetPasswordInitialized(bool value) {
  std::unique_lock lock(mutex_);
  config_.service.password_initialized = value;
}

void ConfigStore::SetOnboardingComplete(bool value) {
  std::unique_lock lock(mutex_);
  config_.onboarding_complete = value;
}

Status ConfigStore::SetTheme(const std::string &theme) {
  if (theme != "light" && theme != "dark" && theme != "system") {
    return Status::Error(ErrorCode::InvalidArgument, "unknown theme: " + theme);
  }
  std::unique_lock lock(mutex_);
  config_.ui.theme = theme;
  return Status::Ok();
}

Status ConfigStore::SetLanguage(const std::string &language) {
  if (language.empty()) {
    return Status::Error(ErrorCode::InvalidArgument, "language must not be empty");
  }
  std::unique_lock lock(mutex_);
  config_.ui.language = language;
  return Status::Ok();
}

void ConfigStore::SetAutoStart(bool value) {
  std::unique_lock lock(mutex_);
  config_.ui.auto_start = value;
}

Status ConfigStore::SetMaxMessageSizeMb(int64_t size_mb) {
  if (size_mb <= 0 || size_mb > MAX_MESSAGE_SIZE_MB_LIMIT) {
    return Status::Error(ErrorCode::InvalidArgument,
                         "max message size must be between 1 and " +
                             std::to_string(MAX_MESSAGE_SIZE_MB_LIMIT) + " MB");
  }
  std::unique_lock lock(mutex_);
  config_.service.max_message_size_mb = size_mb;
  return Status::Ok();
}

void ConfigStore::SetWindowState(const WindowState &state) {
  std::unique_lock lock(mutex_);
  config_.ui.window = state;
  ClampWindowState(config_.ui.window);
}

} // namespace config
} // namespace tyr
