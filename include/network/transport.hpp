// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tyr {
namespace network {

// Overlay link abstraction used by the link engine
// - AsioLinkTransport: TCP / TLS sockets via boost::asio
// - tests may inject in-memory implementations

class Link;
using LinkPtr = std::shared_ptr<Link>;

using ConnectCallback = std::function<void(bool success, const std::string &error)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void(const std::string &reason)>;

struct LinkTarget {
  std::string host;
  uint16_t port{0};
  bool tls{false};
};

// Link - one established (or establishing) overlay connection
class Link {
public:
  virtual ~Link() = default;

  // Begin reading; callbacks fire on data or disconnect
  virtual void start() = 0;

  // Returns false only if the link is already closed or closing. A true
  // return is fire-and-forget; overflow or write errors surface through the
  // disconnect callback.
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  // Immediate close; pending writes are dropped
  virtual void close() = 0;

  // Orderly close: TLS close_notify or TCP FIN, then wait for the remote side
  // to close (bounded). Peers see a clean disconnect rather than a timeout.
  virtual void close_gracefully() = 0;

  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual bool is_tls() const = 0;
  virtual uint64_t link_id() const = 0;

  virtual uint64_t rx_bytes() const = 0;
  virtual uint64_t tx_bytes() const = 0;
  // Time from connect start to established link (TCP + TLS handshake)
  virtual std::chrono::milliseconds handshake_time() const = 0;
  virtual std::chrono::steady_clock::time_point connected_at() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

// LinkTransport - factory for outbound links and inbound acceptance
class LinkTransport {
public:
  virtual ~LinkTransport() = default;

  virtual LinkPtr connect(const LinkTarget &target, ConnectCallback callback) = 0;

  // Start accepting plain TCP links (port 0 = ephemeral)
  virtual bool listen(uint16_t port, std::function<void(LinkPtr)> accept_callback) = 0;
  virtual void stop_listening() = 0;
  virtual uint16_t listening_port() const = 0;

  // Start the event loop threads; idempotent
  virtual void run() = 0;
  // Stop listening and the event loop; idempotent, restartable
  virtual void stop() = 0;
  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace tyr
