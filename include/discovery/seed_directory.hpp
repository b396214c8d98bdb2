// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "core/status.hpp"
#include "discovery/types.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <vector>

namespace tyr {
namespace discovery {

/**
 * Source of candidate peers
 *
 * Implementations return only peers the feed currently reports as up.
 * How the feed is refreshed is up to the implementation.
 */
class SeedDirectory {
public:
  virtual ~SeedDirectory() = default;

  virtual core::Result<std::vector<CandidatePeer>> LoadCandidates() = 0;
};

/**
 * Parse a public peer list document
 *
 * Layout: { "<region>.md": { "<uri>": { "up": bool, "response_ms": int } } }
 * The ".md" suffix is stripped from region names. Entries that are down,
 * malformed, or use a protocol that cannot be probed are skipped.
 */
std::vector<CandidatePeer> ParseSeedDocument(const nlohmann::json &doc);

/**
 * JsonSeedDirectory - seed list read from a JSON file on disk
 *
 * The file is re-read on every LoadCandidates() call so an external updater
 * may replace it at any time.
 */
class JsonSeedDirectory : public SeedDirectory {
public:
  explicit JsonSeedDirectory(std::filesystem::path path);

  core::Result<std::vector<CandidatePeer>> LoadCandidates() override;

  const std::filesystem::path &path() const { return path_; }

private:
  const std::filesystem::path path_;
};

} // namespace discovery
} // namespace tyr
