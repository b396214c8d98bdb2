// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/discovery_cache.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>
#include <system_error>

namespace tyr {
namespace discovery {

namespace {

constexpr int CACHE_FORMAT_VERSION = 1;

void DiscardCacheFile(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    LOG_DISC_WARN("Failed to remove discovery cache {}: {}", path.string(), ec.message());
  }
}

} // namespace

DiscoveryCache::DiscoveryCache(std::filesystem::path path) : path_(std::move(path)) {}

bool DiscoveryCache::Save(const std::vector<DiscoveredPeer> &peers, int64_t timestamp) {
  using json = nlohmann::json;
  std::lock_guard<std::mutex> lock(mutex_);

  json root;
  root["version"] = CACHE_FORMAT_VERSION;
  root["discovered_at"] = timestamp;
  json arr = json::array();
  for (const auto &p : peers) {
    arr.push_back({{"address", p.address},
                   {"protocol", ProtocolName(p.protocol)},
                   {"region", p.region},
                   {"rtt", p.rtt_ms},
                   {"response_ms", p.response_ms}});
  }
  root["peers"] = std::move(arr);

  if (!util::atomic_write_file(path_, root.dump(2), 0600)) {
    LOG_DISC_ERROR("Failed to save discovery cache to {}", path_.string());
    return false;
  }
  LOG_DISC_DEBUG("Saved {} discovered peers to {}", peers.size(), path_.string());
  return true;
}

std::optional<CachedDiscoveryResult> DiscoveryCache::Load() {
  using json = nlohmann::json;
  std::lock_guard<std::mutex> lock(mutex_);

  auto data = util::try_read_file(path_);
  if (!data) {
    LOG_DISC_DEBUG("No discovery cache at {}", path_.string());
    return std::nullopt;
  }

  json root;
  try {
    root = json::parse(data->begin(), data->end());
  } catch (const json::parse_error &e) {
    LOG_DISC_WARN("Failed to parse discovery cache {}: {}", path_.string(), e.what());
    DiscardCacheFile(path_);
    return std::nullopt;
  }

  if (!root.is_object() || !root.contains("version") || !root["version"].is_number_integer() ||
      root["version"].get<int>() != CACHE_FORMAT_VERSION ||
      !root.contains("peers") || !root["peers"].is_array()) {
    LOG_DISC_WARN("Invalid discovery cache format/version, deleting {}", path_.string());
    DiscardCacheFile(path_);
    return std::nullopt;
  }

  CachedDiscoveryResult result;
  if (root.contains("discovered_at") && root["discovered_at"].is_number_integer()) {
    result.timestamp = root["discovered_at"].get<int64_t>();
  }

  size_t skipped = 0;
  for (const auto &entry : root["peers"]) {
    if (!entry.is_object() || !entry.contains("address") || !entry["address"].is_string()) {
      ++skipped;
      continue;
    }
    auto protocol = entry.contains("protocol") && entry["protocol"].is_string()
                        ? ParseProtocol(entry["protocol"].get<std::string>())
                        : std::nullopt;
    if (!protocol) {
      ++skipped;
      continue;
    }
    DiscoveredPeer peer;
    try {
      peer.address = entry["address"].get<std::string>();
      peer.protocol = *protocol;
      peer.region = entry.value("region", std::string{});
      peer.rtt_ms = entry.value("rtt", int64_t{0});
      peer.response_ms = entry.value("response_ms", int64_t{0});
    } catch (const json::type_error &) {
      ++skipped;
      continue;
    }
    peer.discovered_at = result.timestamp;
    result.peers.push_back(std::move(peer));
  }
  if (skipped > 0) {
    LOG_DISC_WARN("Skipped {} malformed entries in discovery cache", skipped);
  }
  return result;
}

bool DiscoveryCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    LOG_DISC_ERROR("Failed to clear discovery cache {}: {}", path_.string(), ec.message());
    return false;
  }
  LOG_DISC_INFO("Cleared discovery cache");
  return true;
}

} // namespace discovery
} // namespace tyr
