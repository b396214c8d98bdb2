// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/types.hpp"
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace tyr {
namespace discovery {

constexpr const char *DISCOVERY_CACHE_FILENAME = "discovered_peers.json";
constexpr int64_t DISCOVERY_CACHE_TTL_SECONDS = 24 * 60 * 60;

struct CachedDiscoveryResult {
  std::vector<DiscoveredPeer> peers;
  int64_t timestamp{0};  // unix seconds of the scan

  // Advisory; the cache never expires entries on its own
  bool IsFresh(int64_t now) const {
    return now >= timestamp && now - timestamp < DISCOVERY_CACHE_TTL_SECONDS;
  }
};

/**
 * DiscoveryCache - single-slot durable store of the last completed scan
 *
 * File layout (discovered_peers.json):
 *   { "version": 1, "discovered_at": <unix>,
 *     "peers": [ { "address", "protocol", "region", "rtt", "response_ms" } ] }
 *
 * A corrupt or wrong-version file is deleted on Load() and treated as absent.
 */
class DiscoveryCache {
public:
  explicit DiscoveryCache(std::filesystem::path path);

  bool Save(const std::vector<DiscoveredPeer> &peers, int64_t timestamp);
  std::optional<CachedDiscoveryResult> Load();
  bool Clear();

  const std::filesystem::path &path() const { return path_; }

private:
  const std::filesystem::path path_;
  std::mutex mutex_;
};

} // namespace discovery
} // namespace tyr
