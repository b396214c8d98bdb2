// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/peer_uri.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tyr {
namespace discovery {

// One probe target produced by the seed directory
struct CandidatePeer {
  std::string uri;
  Protocol protocol{Protocol::TCP};
  std::string region;      // empty when unknown
  int64_t response_ms{0};  // latency reported by the seed feed, informational
};

struct DiscoveredPeer {
  std::string address;
  Protocol protocol{Protocol::TCP};
  std::string region;
  int64_t rtt_ms{0};
  int64_t response_ms{0};
  int64_t discovered_at{0};  // unix seconds
  bool available{true};      // false only in custom-peer checks
};

// Snapshot delivered after every completed probe
struct DiscoveryProgress {
  size_t current{0};
  size_t total{0};
  size_t available_count{0};
};

using ProgressCallback = std::function<void(const DiscoveryProgress &)>;

struct DiscoveryRequest {
  std::vector<Protocol> protocols;  // empty = all
  std::string region;               // empty = all
  int64_t max_rtt_ms{0};            // 0 = no limit (probe timeout defaults to 5 s)
};

struct DiscoveryResult {
  std::vector<DiscoveredPeer> peers;  // ascending rtt_ms
  size_t total{0};
  size_t available{0};
  bool cancelled{false};
  int64_t elapsed_ms{0};
};

} // namespace discovery
} // namespace tyr
