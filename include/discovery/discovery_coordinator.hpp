// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "core/status.hpp"
#include "discovery/peer_probe.hpp"
#include "discovery/seed_directory.hpp"
#include "discovery/types.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tyr {
namespace discovery {

constexpr size_t DEFAULT_PROBE_CONCURRENCY = 20;
constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{5000};

/**
 * DiscoveryCoordinator - bounded-concurrency reachability scans
 *
 * A scan loads candidates from the seed directory, filters them, and lets a
 * fixed number of pool workers pull candidates off a shared cursor until the
 * list is exhausted or the scan is cancelled. Probe failures are counted but
 * never reported individually.
 *
 * At most one scan is current. Starting another scan, or calling Cancel(),
 * cancels the current one: workers stop taking new candidates, probes already
 * running finish, and the partial result is returned with cancelled = true.
 * Progress callbacks are delivered under the same lock Cancel() takes, so
 * none arrive after Cancel() returns.
 *
 * FindAvailablePeers() blocks the calling thread until the scan ends; the
 * application facade runs it off the UI thread.
 */
class DiscoveryCoordinator {
public:
  DiscoveryCoordinator(std::shared_ptr<SeedDirectory> seeds, std::shared_ptr<PeerProbe> probe,
                       size_t concurrency = DEFAULT_PROBE_CONCURRENCY);
  ~DiscoveryCoordinator();

  DiscoveryCoordinator(const DiscoveryCoordinator &) = delete;
  DiscoveryCoordinator &operator=(const DiscoveryCoordinator &) = delete;

  core::Result<DiscoveryResult> FindAvailablePeers(const DiscoveryRequest &request,
                                                   ProgressCallback on_progress = {});

  // Probe user-supplied URIs; every parseable URI is returned with its
  // availability. Input order is kept.
  core::Result<std::vector<DiscoveredPeer>>
  CheckCustomPeers(const std::vector<std::string> &uris,
                   std::chrono::milliseconds timeout = DEFAULT_PROBE_TIMEOUT,
                   ProgressCallback on_progress = {});

  // Distinct non-empty regions in the seed directory, sorted
  core::Result<std::vector<std::string>> GetAvailableRegions();

  void Cancel();
  bool IsScanning() const;

  // Snapshot of the current (or last) scan
  DiscoveryProgress GetProgress() const;

  size_t concurrency() const { return concurrency_; }

private:
  struct ScanToken {
    std::atomic<bool> cancelled{false};
  };
  using ScanTokenPtr = std::shared_ptr<ScanToken>;

  struct ProbeOutcome {
    bool success{false};
    int64_t rtt_ms{0};
  };

  ScanTokenPtr BeginScan();
  void EndScan(const ScanTokenPtr &token);

  /**
   * Probe every candidate with at most concurrency_ workers
   * @return outcomes indexed like candidates; entries never probed (after
   *         cancellation) stay unsuccessful. nullopt if the pool refused work.
   */
  std::optional<std::vector<ProbeOutcome>> RunProbes(const std::vector<CandidatePeer> &candidates,
                                                     std::chrono::milliseconds timeout,
                                                     int64_t max_rtt_ms,
                                                     const ScanTokenPtr &token,
                                                     const ProgressCallback &on_progress);

  void Publish(const ScanTokenPtr &token, const DiscoveryProgress &progress,
               const ProgressCallback &on_progress);

  std::shared_ptr<SeedDirectory> seeds_;
  std::shared_ptr<PeerProbe> probe_;
  const size_t concurrency_;

  // Guards current_ and progress_; recursive so a progress callback may call Cancel()
  mutable std::recursive_mutex scan_mutex_;
  ScanTokenPtr current_;
  DiscoveryProgress progress_;

  util::ThreadPool pool_;
};

} // namespace discovery
} // namespace tyr
