// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "core/status.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tyr {
namespace service {

// Everything an engine needs from configuration, captured at Initialize()
struct EngineSettings {
  std::filesystem::path storage_path;
  std::string smtp_address;
  std::string imap_address;
  uint16_t listen_port{0};  // 0 = no inbound links
  uint64_t max_message_size_bytes{0};
  std::vector<std::string> peers;  // enabled peers only
};

// Live view of one peer; ServiceManager merges these with the configured list
struct PeerRuntimeStats {
  std::string address;
  bool enabled{false};
  bool connected{false};
  int64_t latency_ms{0};
  uint64_t rx_bytes{0};
  uint64_t tx_bytes{0};
  double rx_rate{0};  // bytes per second
  double tx_rate{0};
  int64_t uptime_sec{0};
  std::string last_error;
};

/**
 * MailEngine - the embedded mail / overlay engine as seen by ServiceManager
 *
 * Call order: Open -> [SetPassword] -> Start -> SoftStop|Stop -> Close.
 * Start may follow a stop again without reopening. Implementations are
 * driven by one thread at a time (ServiceManager serializes calls) except
 * the const accessors, which must be safe concurrently.
 */
class MailEngine {
public:
  virtual ~MailEngine() = default;

  // Acquire the storage handle and load or create identity material
  virtual core::Status Open() = 0;
  virtual core::Status SetPassword(const std::string &password) = 0;

  virtual core::Status Start() = 0;
  // Notify peers, then close; an error means the caller should Stop()
  virtual core::Status SoftStop() = 0;
  virtual core::Status Stop() = 0;
  // Release the storage handle
  virtual core::Status Close() = 0;

  virtual core::Status AddPeer(const std::string &address) = 0;
  virtual core::Status RemovePeer(const std::string &address) = 0;
  virtual core::Status SetMaxMessageSize(uint64_t bytes) = 0;

  // Peers the engine currently knows about (enabled flag unset)
  virtual std::vector<PeerRuntimeStats> GetPeerStats() const = 0;
  virtual bool IsStorageHeld() const = 0;
  virtual std::string GetMailAddress() const = 0;
};

using EngineFactory = std::function<std::unique_ptr<MailEngine>(const EngineSettings &)>;

// Source of the account password; nullopt when none is available yet
using PasswordProvider = std::function<std::optional<std::string>()>;

} // namespace service
} // namespace tyr
