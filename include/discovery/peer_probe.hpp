// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "core/status.hpp"
#include "discovery/types.hpp"
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace tyr {
namespace discovery {

struct ProbeResult {
  bool success{false};
  int64_t rtt_ms{0};
  core::ErrorCode error{core::ErrorCode::OK};  // Timeout or NetworkUnreachable
  std::string detail;
};

/**
 * One reachability check against one candidate
 *
 * Only the protocol handshake is performed; no overlay payload is exchanged.
 * Implementations must be callable concurrently from several threads and
 * must return within roughly `timeout`.
 */
class PeerProbe {
public:
  virtual ~PeerProbe() = default;

  virtual ProbeResult Probe(const CandidatePeer &peer, std::chrono::milliseconds timeout) = 0;
};

/**
 * AsioPeerProbe - handshake probes over Boost.Asio
 *
 *   tcp   TCP connect
 *   tls   TCP connect + TLS client handshake (certificate not verified)
 *   ws    TCP connect + HTTP/1.1 Upgrade answered with 101
 *   wss   TLS handshake + Upgrade answered with 101
 *   quic  Initial-sized datagram with a reserved version, answered with a
 *         Version Negotiation packet
 *
 * RTT is measured from the start of the connect to handshake completion;
 * name resolution is excluded.
 */
class AsioPeerProbe : public PeerProbe {
public:
  AsioPeerProbe();
  ~AsioPeerProbe() override;

  ProbeResult Probe(const CandidatePeer &peer, std::chrono::milliseconds timeout) override;

private:
  std::unique_ptr<boost::asio::ssl::context> tls_context_;
};

} // namespace discovery
} // namespace tyr
