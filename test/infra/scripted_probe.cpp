// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "infra/scripted_probe.hpp"
#include <thread>

namespace tyr {
namespace test {

using core::ErrorCode;

void ScriptedProbe::Script(const std::string &uri, int64_t rtt_ms, bool success) {
  std::lock_guard<std::mutex> lock(mutex_);
  answers_[uri] = Answer{rtt_ms, success};
}

std::vector<std::string> ScriptedProbe::probed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return probed_;
}

discovery::ProbeResult ScriptedProbe::Probe(const discovery::CandidatePeer &peer,
                                            std::chrono::milliseconds timeout) {
  ++calls_;
  const size_t now_in_flight = ++in_flight_;
  size_t seen = max_in_flight_.load();
  while (now_in_flight > seen && !max_in_flight_.compare_exchange_weak(seen, now_in_flight)) {
  }

  std::optional<Answer> answer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    probed_.push_back(peer.uri);
    auto it = answers_.find(peer.uri);
    if (it != answers_.end()) answer = it->second;
  }

  discovery::ProbeResult result;
  if (!answer) {
    result.error = ErrorCode::NetworkUnreachable;
    result.detail = "connection refused";
  } else if (answer->rtt_ms > timeout.count()) {
    std::this_thread::sleep_for(timeout);
    result.error = ErrorCode::Timeout;
    result.detail = "timed out";
  } else {
    std::this_thread::sleep_for(std::chrono::milliseconds(answer->rtt_ms));
    result.success = answer->success;
    result.rtt_ms = answer->rtt_ms;
    if (!answer->success) result.error = ErrorCode::NetworkUnreachable;
  }

  --in_flight_;
  return result;
}

void StaticSeedDirectory::Add(const std::string &uri, const std::string &region) {
  discovery::CandidatePeer candidate;
  candidate.uri = uri;
  auto parsed = discovery::ParsePeerUri(uri);
  if (parsed) candidate.protocol = parsed->protocol;
  candidate.region = region;
  candidates_.push_back(std::move(candidate));
}

core::Result<std::vector<discovery::CandidatePeer>> StaticSeedDirectory::LoadCandidates() {
  if (failure_) return *failure_;
  return candidates_;
}

} // namespace test
} // namespace tyr
