// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tyr {
namespace discovery {

// Overlay link protocols that can be probed
enum class Protocol { TCP, TLS, QUIC, WS, WSS };

const std::vector<Protocol> &AllProtocols();

// "tcp", "tls", "quic", "ws", "wss"
std::string ProtocolName(Protocol protocol);

// Case-insensitive; nullopt for socks, unix and unknown schemes
std::optional<Protocol> ParseProtocol(const std::string &name);

/**
 * Parse a comma-separated protocol list ("tcp, tls")
 * An empty string means every protocol. Unknown names make the whole list
 * invalid.
 */
std::optional<std::vector<Protocol>> ParseProtocolList(const std::string &list);

struct PeerUri {
  Protocol protocol{Protocol::TCP};
  std::string host;   // IPv6 literals without brackets
  uint16_t port{0};
  std::string path;   // ws/wss only, "/" when absent

  bool is_ipv6_literal() const { return host.find(':') != std::string::npos; }
};

/**
 * Parse "<scheme>://<host>:<port>[/path]"
 *
 * Accepts bracketed IPv6 hosts ("tls://[2001:db8::1]:443") and an optional
 * query string ("?key=...") which is ignored. A path is only accepted for
 * ws and wss.
 */
std::optional<PeerUri> ParsePeerUri(const std::string &uri);

} // namespace discovery
} // namespace tyr
