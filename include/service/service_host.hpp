// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "config/config_store.hpp"
#include "service/mail_engine.hpp"
#include "service/service_manager.hpp"
#include "service/status_broadcaster.hpp"
#include <memory>
#include <mutex>

namespace tyr {
namespace service {

/**
 * ServiceHost - holds the process's current ServiceManager
 *
 * Restore replaces the manager with a new one bound to the restored
 * configuration. Callers fetch Current() per operation instead of caching
 * the pointer; a caller still holding the old manager keeps a valid (closed)
 * object. The status broadcaster is shared by every generation.
 */
class ServiceHost {
public:
  ServiceHost(config::ConfigStore &config, EngineFactory factory, PasswordProvider password,
              std::shared_ptr<StatusBroadcaster> broadcaster = nullptr);

  std::shared_ptr<ServiceManager> Current() const;

  /**
   * Replace the current manager with a fresh, uninitialized one
   * The old manager is shut down first (idempotent if already closed).
   */
  std::shared_ptr<ServiceManager> Rebuild();

  const std::shared_ptr<StatusBroadcaster> &broadcaster() const { return broadcaster_; }
  uint64_t generation() const;

private:
  config::ConfigStore &config_;
  EngineFactory factory_;
  PasswordProvider password_;
  std::shared_ptr<StatusBroadcaster> broadcaster_;

  mutable std::mutex mutex_;
  std::shared_ptr<ServiceManager> current_;
  uint64_t generation_{1};
};

} // namespace service
} // namespace tyr
