// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tyr {
namespace config {

// Defaults for a fresh installation
inline constexpr const char *DEFAULT_SMTP_ADDRESS = "127.0.0.1:1025";
inline constexpr const char *DEFAULT_IMAP_ADDRESS = "127.0.0.1:1143";
inline constexpr const char *DEFAULT_THEME = "system";
inline constexpr const char *DEFAULT_LANGUAGE = "en";
inline constexpr const char *DEFAULT_PEER = "tcp://bra.zbin.eu:7743";
inline constexpr const char *CONFIG_FILENAME = "config.json";
inline constexpr const char *STORAGE_FILENAME = "tyr.db";
inline constexpr uint16_t DEFAULT_LISTEN_PORT = 0;  // 0 = no inbound listener
inline constexpr int64_t DEFAULT_MAX_MESSAGE_SIZE_MB = 10;
inline constexpr int64_t MAX_MESSAGE_SIZE_MB_LIMIT = 1024;

// Window geometry bounds; -1 position means "center on screen"
inline constexpr int DEFAULT_WINDOW_WIDTH = 1080;
inline constexpr int DEFAULT_WINDOW_HEIGHT = 800;
inline constexpr int MIN_WINDOW_WIDTH = 1080;
inline constexpr int MIN_WINDOW_HEIGHT = 800;
inline constexpr int MAX_WINDOW_WIDTH = 4096;
inline constexpr int MAX_WINDOW_HEIGHT = 2160;

struct PeerConfig {
  std::string address;
  bool enabled{true};

  bool operator==(const PeerConfig &other) const = default;
};

struct ServiceSettings {
  std::string smtp_address{DEFAULT_SMTP_ADDRESS};
  std::string imap_address{DEFAULT_IMAP_ADDRESS};
  std::string storage_path;
  uint16_t listen_port{DEFAULT_LISTEN_PORT};
  int64_t max_message_size_mb{DEFAULT_MAX_MESSAGE_SIZE_MB};
  // Set once the account password has been applied to the storage
  bool password_initialized{false};

  bool operator==(const ServiceSettings &other) const = default;
};

struct WindowState {
  int width{DEFAULT_WINDOW_WIDTH};
  int height{DEFAULT_WINDOW_HEIGHT};
  int x{-1};
  int y{-1};

  bool operator==(const WindowState &other) const = default;
};

struct UIPreferences {
  std::string theme{DEFAULT_THEME};
  std::string language{DEFAULT_LANGUAGE};
  bool auto_start{false};
  WindowState window;

  bool operator==(const UIPreferences &other) const = default;
};

struct Config {
  bool onboarding_complete{false};
  ServiceSettings service;
  std::vector<PeerConfig> peers;
  UIPreferences ui;

  bool operator==(const Config &other) const = default;

  std::vector<std::string> EnabledPeers() const;
};

/**
 * Check a peer URI against the supported overlay link grammar
 *
 *   tcp|tls|quic://host:port
 *   socks|sockstls://proxy:port/host:port
 *   unix:///path
 *   ws|wss://host:port[/path]
 */
bool IsValidPeerAddress(const std::string &address);

// Undersized or off-screen geometry falls back to defaults
void ClampWindowState(WindowState &ws);

// Fresh configuration; the storage file lives in data_dir
Config MakeDefaultConfig(const std::filesystem::path &data_dir);

/**
 * Fill in missing values and clamp out-of-range ones
 *
 * Empty addresses, theme or language get defaults, an empty storage path
 * points into data_dir, window geometry is clamped, an empty peer list is
 * replaced by the default peer, and an unknown theme becomes "system".
 */
void ApplyDefaults(Config &config, const std::filesystem::path &data_dir);

} // namespace config
} // namespace tyr
