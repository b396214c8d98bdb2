// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "config/config.hpp"
#include <algorithm>
#include <regex>

namespace tyr {
namespace config {

namespace {

const std::regex &PeerAddressRegex() {
  static const std::regex re(
      R"(^(tcp|tls|quic)://[a-zA-Z0-9.-]+:[0-9]+$)"
      R"(|^(socks|sockstls)://[a-zA-Z0-9.-]+:[0-9]+/[a-zA-Z0-9.-]+:[0-9]+$)"
      R"(|^unix:///[^\s]+$)"
      R"(|^(ws|wss)://[a-zA-Z0-9.-]+:[0-9]+(/[^\s]*)?$)");
  return re;
}

} // namespace

std::vector<std::string> Config::EnabledPeers() const {
  std::vector<std::string> out;
  out.reserve(peers.size());
  for (const auto &peer : peers) {
    if (peer.enabled) {
      out.push_back(peer.address);
    }
  }
  return out;
}

void ClampWindowState(WindowState &ws) {
  if (ws.width < MIN_WINDOW_WIDTH) ws.width = DEFAULT_WINDOW_WIDTH;
  if (ws.width > MAX_WINDOW_WIDTH) ws.width = MAX_WINDOW_WIDTH;
  if (ws.height < MIN_WINDOW_HEIGHT) ws.height = DEFAULT_WINDOW_HEIGHT;
  if (ws.height > MAX_WINDOW_HEIGHT) ws.height = MAX_WINDOW_HEIGHT;
  if (ws.x < -1 || ws.x > MAX_WINDOW_WIDTH) ws.x = -1;
  if (ws.y < -1 || ws.y > MAX_WINDOW_HEIGHT) ws.y = -1;
}

bool IsValidPeerAddress(const std::string &address) {
  return std::regex_match(address, PeerAddressRegex());
}

Config MakeDefaultConfig(const std::filesystem::path &data_dir) {
  Config config;
  config.service.storage_path = (data_dir / STORAGE_FILENAME).string();
  config.peers.push_back(PeerConfig{DEFAULT_PEER, true});
  return config;
}

void ApplyDefaults(Config &config, const std::filesystem::path &data_dir) {
  auto &svc = config.service;
  if (svc.smtp_address.empty()) svc.smtp_address = DEFAULT_SMTP_ADDRESS;
  if (svc.imap_address.empty()) svc.imap_address = DEFAULT_IMAP_ADDRESS;
  if (svc.storage_path.empty()) {
    svc.storage_path = (data_dir / STORAGE_FILENAME).string();
  }
  if (svc.max_message_size_mb <= 0 || svc.max_message_size_mb > MAX_MESSAGE_SIZE_MB_LIMIT) {
    svc.max_message_size_mb = DEFAULT_MAX_MESSAGE_SIZE_MB;
  }

  auto &ui = config.ui;
  if (ui.theme != "light" && ui.theme != "dark" && ui.theme != "system") {
    ui.theme = DEFAULT_THEME;
  }
  if (ui.language.empty()) ui.language = DEFAULT_LANGUAGE;
  ClampWindowState(ui.window);

  // Drop duplicates, keeping the first occurrence
  std::vector<PeerConfig> unique;
  for (const auto &peer : config.peers) {
    if (peer.address.empty()) continue;
    bool seen = std::any_of(unique.begin(), unique.end(), [&](const PeerConfig &p) {
      return p.address == peer.address;
    });
    if (!seen) unique.push_back(peer);
  }
  config.peers = std::move(unique);

  if (config.peers.empty()) {
    config.peers.push_back(PeerConfig{DEFAULT_PEER, true});
  }
}

} // namespace config
} // namespace tyr
