// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/real_transport.hpp"
#include "service/mail_engine.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tyr {
namespace service {

constexpr std::chrono::seconds LINK_RECONNECT_DELAY{15};
constexpr std::chrono::milliseconds SOFT_STOP_TIMEOUT{3000};
constexpr int STORAGE_FORMAT_VERSION = 1;

/**
 * LinkEngine - overlay link maintenance behind the MailEngine interface
 *
 * Keeps one outbound link per configured peer (tcp:// and tls:// peers;
 * other transports are recorded with an error and never dialed), redials
 * dropped links, and optionally accepts inbound links on listen_port.
 * Every link opens with a hello line "TYR/1 <mail address>\n"; inbound
 * data is only accounted and checked against the message size limit.
 *
 * Storage (<storage_path>) is a JSON document holding the node key and
 * the password verifier; it is locked through <storage_path>.lock from
 * Open() until Close().
 */
class LinkEngine : public MailEngine {
public:
  explicit LinkEngine(EngineSettings settings);
  ~LinkEngine() override;

  core::Status Open() override;
  core::Status SetPassword(const std::string &password) override;
  core::Status Start() override;
  core::Status SoftStop() override;
  core::Status Stop() override;
  core::Status Close() override;

  core::Status AddPeer(const std::string &address) override;
  core::Status RemovePeer(const std::string &address) override;
  core::Status SetMaxMessageSize(uint64_t bytes) override;

  std::vector<PeerRuntimeStats> GetPeerStats() const override;
  bool IsStorageHeld() const override;
  std::string GetMailAddress() const override;

  // Bound inbound port, 0 when not listening
  uint16_t listening_port() const;

  static EngineFactory Factory();

private:
  struct PeerLink {
    std::string address;
    network::LinkTarget target;
    bool dialable{false};
    network::LinkPtr link;
    std::shared_ptr<boost::asio::steady_timer> retry_timer;
    uint64_t attempt{0};  // ignores callbacks from superseded dials
    std::string last_error;
    // Rate sampling
    uint64_t sample_rx{0};
    uint64_t sample_tx{0};
    std::chrono::steady_clock::time_point sample_time{};
    double rx_rate{0};
    double tx_rate{0};
  };

  core::Status LoadOrCreateStorage();
  bool WriteStorage() const;

  // Require mutex_ held
  void DialLocked(PeerLink &peer);
  void ScheduleRedialLocked(PeerLink &peer);
  network::ReceiveCallback MakeReceiveCallback(const std::string &label,
                                               std::weak_ptr<network::Link> link);
  void OnInbound(network::LinkPtr link);

  std::vector<network::LinkPtr> CollectLinksLocked() const;
  void ResetTimersLocked();

  EngineSettings settings_;
  std::unique_ptr<network::AsioLinkTransport> transport_;
  std::unique_ptr<util::FileLock> storage_lock_;
  // Mirrors storage_lock_ for IsStorageHeld() from other threads
  std::atomic<bool> storage_held_{false};

  mutable std::mutex mutex_;
  mutable std::map<std::string, PeerLink> peers_;  // mutable: rate samples
  std::vector<network::LinkPtr> inbound_;
  std::vector<uint8_t> node_key_;
  std::string password_hash_;
  std::string mail_address_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> max_message_size_;
};

} // namespace service
} // namespace tyr
