// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/discovery_coordinator.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <future>
#include <numeric>
#include <set>

namespace tyr {
namespace discovery {

using core::ErrorCode;
using core::Status;

namespace {

bool MatchesRequest(const CandidatePeer &c, const std::vector<Protocol> &protocols,
                    const std::string &region_lower) {
  if (!protocols.empty() &&
      std::find(protocols.begin(), protocols.end(), c.protocol) == protocols.end()) {
    return false;
  }
  if (!region_lower.empty() && util::ToLower(c.region) != region_lower) {
    return false;
  }
  return true;
}

// Keep first occurrence of each (uri, protocol) key
std::vector<CandidatePeer> FilterCandidates(std::vector<CandidatePeer> all,
                                            const DiscoveryRequest &request) {
  const std::string region = util::ToLower(util::Trim(request.region));
  std::set<std::pair<std::string, Protocol>> seen;
  std::vector<CandidatePeer> out;
  out.reserve(all.size());
  for (auto &c : all) {
    if (!MatchesRequest(c, request.protocols, region)) continue;
    if (!seen.emplace(c.uri, c.protocol).second) continue;
    out.push_back(std::move(c));
  }
  return out;
}

int64_t ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

} // namespace

DiscoveryCoordinator::DiscoveryCoordinator(std::shared_ptr<SeedDirectory> seeds,
                                           std::shared_ptr<PeerProbe> probe,
                                           size_t concurrency)
    : seeds_(std::move(seeds)),
      probe_(std::move(probe)),
      concurrency_(concurrency == 0 ? DEFAULT_PROBE_CONCURRENCY : concurrency),
      pool_(concurrency_, 0, "probe") {}

DiscoveryCoordinator::~DiscoveryCoordinator() {
  Cancel();
  pool_.shutdown();
  pool_.wait_for_completion();
}

DiscoveryCoordinator::ScanTokenPtr DiscoveryCoordinator::BeginScan() {
  auto token = std::make_shared<ScanToken>();
  std::lock_guard<std::recursive_mutex> lock(scan_mutex_);
  if (current_) {
    LOG_DISC_INFO("Cancelling previous discovery scan");
    current_->cancelled.store(true, std::memory_order_release);
  }
  current_ = token;
  progress_ = DiscoveryProgress{};
  return token;
}

void DiscoveryCoordinator::EndScan(const ScanTokenPtr &token) {
  std::lock_guard<std::recursive_mutex> lock(scan_mutex_);
  if (current_ == token) {
    current_.reset();
  }
}

void DiscoveryCoordinator::Cancel() {
  std::lock_guard<std::recursive_mutex> lock(scan_mutex_);
  if (current_ && !current_->cancelled.exchange(true, std::memory_order_acq_rel)) {
    LOG_DISC_INFO("Discovery scan cancelled");
  }
}

bool DiscoveryCoordinator::IsScanning() const {
  std::lock_guard<std::recursive_mutex> lock(scan_mutex_);
  return current_ && !current_->cancelled.load(std::memory_order_acquire);
}

DiscoveryProgress DiscoveryCoordinator::GetProgress() const {
  std::lock_guard<std::recursive_mutex> lock(scan_mutex_);
  return progress_;
}

void DiscoveryCoordinator::Publish(const ScanTokenPtr &token, const DiscoveryProgress &progress,
                                   const ProgressCallback &on_progress) {
  std::lock_guard<std::recursive_mutex> lock(scan_mutex_);
  if (token->cancelled.load(std::memory_order_acquire)) return;
  progress_ = progress;
  if (on_progress) {
    on_progress(progress);
  }
}

std::optional<std::vector<DiscoveryCoordinator::ProbeOutcome>>
DiscoveryCoordinator::RunProbes(const std::vector<CandidatePeer> &candidates,
                                std::chrono::milliseconds timeout, int64_t max_rtt_ms,
                                const ScanTokenPtr &token, const ProgressCallback &on_progress) {
  const size_t total = candidates.size();
  std::vector<ProbeOutcome> outcomes(total);
  std::atomic<size_t> cursor{0};

  std::mutex counter_mutex;
  size_t current = 0;
  size_t available = 0;

  auto worker = [&]() {
    while (!token->cancelled.load(std::memory_order_acquire)) {
      const size_t i = cursor.fetch_add(1, std::memory_order_relaxed);
      if (i >= total) break;

      ProbeResult r;
      try {
        r = probe_->Probe(candidates[i], timeout);
      } catch (const std::exception &e) {
        LOG_DISC_DEBUG("Probe of {} threw: {}", candidates[i].uri, e.what());
        r.success = false;
      }

      const bool ok = r.success && (max_rtt_ms == 0 || r.rtt_ms <= max_rtt_ms);
      outcomes[i].success = ok;
      outcomes[i].rtt_ms = r.rtt_ms;

      // Publishing under the counter lock keeps snapshots in increasing order
      std::lock_guard<std::mutex> lock(counter_mutex);
      ++current;
      if (ok) ++available;
      Publish(token, DiscoveryProgress{current, total, available}, on_progress);
    }
  };

  const size_t workers = std::min(concurrency_, total);
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  bool refused = false;
  for (size_t w = 0; w < workers; ++w) {
    try {
      futures.push_back(pool_.enqueue(worker));
    } catch (const std::runtime_error &e) {
      LOG_DISC_WARN("Probe pool refused work: {}", e.what());
      token->cancelled.store(true, std::memory_order_release);
      refused = true;
      break;
    }
  }

  // worker captures locals by reference; every task must finish before return
  for (auto &f : futures) {
    f.wait();
  }

  if (refused && futures.empty()) {
    return std::nullopt;
  }
  return outcomes;
}

core::Result<DiscoveryResult>
DiscoveryCoordinator::FindAvailablePeers(const DiscoveryRequest &request,
                                         ProgressCallback on_progress) {
  if (request.max_rtt_ms < 0) {
    return Status::Error(ErrorCode::InvalidArgument, "max rtt must not be negative");
  }

  const auto started = std::chrono::steady_clock::now();
  auto token = BeginScan();

  auto loaded = seeds_->LoadCandidates();
  if (!loaded.IsOk()) {
    LOG_DISC_ERROR("Failed to load seed directory: {}", loaded.GetStatus().ToString());
    EndScan(token);
    return loaded.GetStatus();
  }

  auto candidates = FilterCandidates(std::move(loaded).Value(), request);
  const size_t total = candidates.size();

  DiscoveryResult result;
  result.total = total;
  if (total == 0) {
    LOG_DISC_INFO("No candidates match the discovery filter");
    result.cancelled = token->cancelled.load(std::memory_order_acquire);
    EndScan(token);
    return result;
  }

  const auto timeout = request.max_rtt_ms > 0 ? std::chrono::milliseconds(request.max_rtt_ms)
                                              : DEFAULT_PROBE_TIMEOUT;
  LOG_DISC_INFO("Starting discovery: {} candidates, {} workers, timeout {} ms", total,
                std::min(concurrency_, total), timeout.count());

  Publish(token, DiscoveryProgress{0, total, 0}, on_progress);

  auto outcomes = RunProbes(candidates, timeout, request.max_rtt_ms, token, on_progress);
  if (!outcomes) {
    EndScan(token);
    return Status::Error(ErrorCode::Cancelled, "discovery is shutting down");
  }

  std::vector<size_t> order(total);
  std::iota(order.begin(), order.end(), 0);
  // Stable: equal RTTs keep candidate order
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return (*outcomes)[a].rtt_ms < (*outcomes)[b].rtt_ms;
  });

  const int64_t now = util::GetTime();
  for (size_t i : order) {
    const auto &o = (*outcomes)[i];
    if (!o.success) continue;
    const auto &c = candidates[i];
    DiscoveredPeer peer;
    peer.address = c.uri;
    peer.protocol = c.protocol;
    peer.region = c.region;
    peer.rtt_ms = o.rtt_ms;
    peer.response_ms = c.response_ms;
    peer.discovered_at = now;
    result.peers.push_back(std::move(peer));
  }
  result.available = result.peers.size();
  result.cancelled = token->cancelled.load(std::memory_order_acquire);
  result.elapsed_ms = ElapsedMs(started);
  EndScan(token);

  LOG_DISC_INFO("Discovery {}: {}/{} peers available in {} ms",
                result.cancelled ? "cancelled" : "complete", result.available, result.total,
                result.elapsed_ms);
  return result;
}

core::Result<std::vector<DiscoveredPeer>>
DiscoveryCoordinator::CheckCustomPeers(const std::vector<std::string> &uris,
                                       std::chrono::milliseconds timeout,
                                       ProgressCallback on_progress) {
  std::vector<CandidatePeer> candidates;
  for (const auto &raw : uris) {
    const std::string uri = util::Trim(raw);
    auto parsed = ParsePeerUri(uri);
    if (!parsed) {
      LOG_DISC_WARN("Skipping invalid peer uri '{}'", uri);
      continue;
    }
    CandidatePeer c;
    c.uri = uri;
    c.protocol = parsed->protocol;
    candidates.push_back(std::move(c));
  }
  if (candidates.empty()) {
    return Status::Error(ErrorCode::InvalidArgument, "no valid peer uris");
  }
  if (timeout.count() <= 0) {
    timeout = DEFAULT_PROBE_TIMEOUT;
  }

  auto token = BeginScan();
  Publish(token, DiscoveryProgress{0, candidates.size(), 0}, on_progress);
  auto outcomes = RunProbes(candidates, timeout, 0, token, on_progress);
  const bool cancelled = token->cancelled.load(std::memory_order_acquire);
  EndScan(token);

  if (!outcomes || cancelled) {
    return Status::Error(ErrorCode::Cancelled, "peer check cancelled");
  }

  const int64_t now = util::GetTime();
  std::vector<DiscoveredPeer> out;
  out.reserve(candidates.size());
  for (size_t i = 0; i < candidates.size(); ++i) {
    DiscoveredPeer peer;
    peer.address = candidates[i].uri;
    peer.protocol = candidates[i].protocol;
    peer.available = (*outcomes)[i].success;
    peer.rtt_ms = peer.available ? (*outcomes)[i].rtt_ms : 0;
    peer.discovered_at = now;
    out.push_back(std::move(peer));
  }
  return out;
}

core::Result<std::vector<std::string>> DiscoveryCoordinator::GetAvailableRegions() {
  auto loaded = seeds_->LoadCandidates();
  if (!loaded.IsOk()) {
    return loaded.GetStatus();
  }
  std::set<std::string> regions;
  for (const auto &c : loaded.Value()) {
    if (!c.region.empty()) regions.insert(c.region);
  }
  return std::vector<std::string>(regions.begin(), regions.end());
}

} // namespace discovery
} // namespace tyr
