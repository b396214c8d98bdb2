// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/peer_uri.hpp"
#include "util/string_parsing.hpp"

namespace tyr {
namespace discovery {

const std::vector<Protocol> &AllProtocols() {
  static const std::vector<Protocol> all = {Protocol::TCP, Protocol::TLS, Protocol::QUIC,
                                            Protocol::WS, Protocol::WSS};
  return all;
}

std::string ProtocolName(Protocol protocol) {
  switch (protocol) {
  case Protocol::TCP:
    return "tcp";
  case Protocol::TLS:
    return "tls";
  case Protocol::QUIC:
    return "quic";
  case Protocol::WS:
    return "ws";
  case Protocol::WSS:
    return "wss";
  }
  return "unknown";
}

std::optional<Protocol> ParseProtocol(const std::string &name) {
  const std::string lower = util::ToLower(util::Trim(name));
  for (Protocol p : AllProtocols()) {
    if (ProtocolName(p) == lower) {
      return p;
    }
  }
  return std::nullopt;
}

std::optional<std::vector<Protocol>> ParseProtocolList(const std::string &list) {
  std::vector<Protocol> out;
  for (const auto &item : util::SplitList(list, ',')) {
    auto p = ParseProtocol(item);
    if (!p) {
      return std::nullopt;
    }
    bool dup = false;
    for (Protocol existing : out) dup = dup || existing == *p;
    if (!dup) out.push_back(*p);
  }
  return out;
}

std::optional<PeerUri> ParsePeerUri(const std::string &uri) {
  const auto scheme_end = uri.find("://");
  if (scheme_end == std::string::npos) {
    return std::nullopt;
  }
  auto protocol = ParseProtocol(uri.substr(0, scheme_end));
  if (!protocol) {
    return std::nullopt;
  }

  std::string rest = uri.substr(scheme_end + 3);
  if (auto q = rest.find('?'); q != std::string::npos) {
    rest.resize(q);
  }

  PeerUri out;
  out.protocol = *protocol;
  out.path = "/";

  if (auto slash = rest.find('/'); slash != std::string::npos) {
    if (out.protocol != Protocol::WS && out.protocol != Protocol::WSS) {
      return std::nullopt;
    }
    out.path = rest.substr(slash);
    rest.resize(slash);
  }

  std::string port_str;
  if (!rest.empty() && rest.front() == '[') {
    auto close = rest.find(']');
    if (close == std::string::npos || close + 1 >= rest.size() || rest[close + 1] != ':') {
      return std::nullopt;
    }
    out.host = rest.substr(1, close - 1);
    port_str = rest.substr(close + 2);
  } else {
    auto colon = rest.rfind(':');
    if (colon == std::string::npos || rest.find(':') != colon) {
      return std::nullopt;
    }
    out.host = rest.substr(0, colon);
    port_str = rest.substr(colon + 1);
  }

  if (out.host.empty()) {
    return std::nullopt;
  }
  auto port = util::SafeParsePort(port_str);
  if (!port) {
    return std::nullopt;
  }
  out.port = *port;
  return out;
}

} // namespace discovery
} // namespace tyr
