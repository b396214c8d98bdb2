// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/seed_directory.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

namespace tyr {
namespace discovery {

using json = nlohmann::json;

std::vector<CandidatePeer> ParseSeedDocument(const json &doc) {
  std::vector<CandidatePeer> out;
  if (!doc.is_object()) {
    return out;
  }

  size_t skipped = 0;
  for (const auto &[region_key, entries] : doc.items()) {
    if (!entries.is_object()) {
      continue;
    }
    std::string region = region_key;
    if (region.size() > 3 && region.compare(region.size() - 3, 3, ".md") == 0) {
      region.resize(region.size() - 3);
    }

    for (const auto &[uri, info] : entries.items()) {
      if (!info.is_object() || !info.value("up", false)) {
        continue;
      }
      auto parsed = ParsePeerUri(uri);
      if (!parsed) {
        ++skipped;
        continue;
      }
      CandidatePeer peer;
      peer.uri = uri;
      peer.protocol = parsed->protocol;
      peer.region = region;
      if (info.contains("response_ms") && info["response_ms"].is_number()) {
        peer.response_ms = info["response_ms"].get<int64_t>();
      }
      out.push_back(std::move(peer));
    }
  }

  if (skipped > 0) {
    LOG_DISC_DEBUG("Seed list: skipped {} entries with unsupported URIs", skipped);
  }
  return out;
}

JsonSeedDirectory::JsonSeedDirectory(std::filesystem::path path) : path_(std::move(path)) {}

core::Result<std::vector<CandidatePeer>> JsonSeedDirectory::LoadCandidates() {
  auto data = util::try_read_file(path_);
  if (!data) {
    return core::Status::Error(core::ErrorCode::IoError,
                               "cannot read seed list " + path_.string());
  }
  try {
    auto peers = ParseSeedDocument(json::parse(data->begin(), data->end()));
    LOG_DISC_DEBUG("Loaded {} candidate peers from {}", peers.size(), path_.string());
    return peers;
  } catch (const json::exception &e) {
    LOG_DISC_WARN("Failed to parse seed list {}: {}", path_.string(), e.what());
    return core::Status::Error(core::ErrorCode::InvalidArgument,
                               "malformed seed list: " + std::string(e.what()));
  }
}

} // namespace discovery
} // namespace tyr
