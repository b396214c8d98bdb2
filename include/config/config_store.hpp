// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "config/config.hpp"
#include "core/status.hpp"
#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <vector>

namespace tyr {
namespace config {

/**
 * ConfigStore - thread-safe owner of the on-disk configuration
 *
 * Many readers, one writer: getters take a shared lock, mutators take an
 * exclusive lock. Mutators change memory only; Save() persists the current
 * snapshot to <data_dir>/config.json (atomic write, mode 0600).
 */
class ConfigStore {
public:
  explicit ConfigStore(std::filesystem::path data_dir);

  ConfigStore(const ConfigStore &) = delete;
  ConfigStore &operator=(const ConfigStore &) = delete;

  /**
   * Load config.json, creating it with defaults when missing
   * @return IoError if the file cannot be read or created,
   *         InvalidArgument if it is not valid JSON
   */
  core::Status Load();

  core::Status Save() const;

  Config Get() const;

  // Replace the whole configuration (defaults are re-applied)
  void Replace(Config config);

  // Apply a mutation under the write lock
  void Update(const std::function<void(Config &)> &mutator);

  /**
   * Add a peer, or enable it if it is already configured
   * @return InvalidArgument for an unsupported address
   */
  core::Status AddPeer(const std::string &address);
  core::Status RemovePeer(const std::string &address);
  core::Status EnablePeer(const std::string &address);
  core::Status DisablePeer(const std::string &address);

  std::vector<std::string> GetEnabledPeers() const;
  std::vector<PeerConfig> GetPeers() const;

  void SetPasswordInitialized(bool value);
  void SetOnboardingComplete(bool value);
  core::Status SetTheme(const std::string &theme);
  core::Status SetLanguage(const std::string &language);
  void SetAutoStart(bool value);
  core::Status SetMaxMessageSizeMb(int64_t size_mb);
  void SetWindowState(const WindowState &state);

  const std::filesystem::path &data_dir() const { return data_dir_; }
  std::filesystem::path path() const { return data_dir_ / CONFIG_FILENAME; }

private:
  core::Status SetPeerEnabled(const std::string &address, bool enabled);

  const std::filesystem::path data_dir_;
  mutable std::shared_mutex mutex_;
  Config config_;
};

// JSON mapping (also used by the backup payload)
void to_json(nlohmann::json &j, const PeerConfig &peer);
void from_json(const nlohmann::json &j, PeerConfig &peer);
nlohmann::json ConfigToJson(const Config &config);

/**
 * Parse a configuration document
 * Missing keys keep their default values; wrong types throw
 * nlohmann::json::exception.
 */
Config ConfigFromJson(const nlohmann::json &j);

} // namespace config
} // namespace tyr
