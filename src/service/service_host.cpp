// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "service/service_host.hpp"
#include "util/logging.hpp"

namespace tyr {
namespace service {

ServiceHost::ServiceHost(config::ConfigStore &config, EngineFactory factory,
                         PasswordProvider password,
                         std::shared_ptr<StatusBroadcaster> broadcaster)
    : config_(config),
      factory_(std::move(factory)),
      password_(std::move(password)),
      broadcaster_(broadcaster ? std::move(broadcaster) : std::make_shared<StatusBroadcaster>()),
      current_(std::make_shared<ServiceManager>(config_, factory_, password_, broadcaster_)) {}

std::shared_ptr<ServiceManager> ServiceHost::Current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

uint64_t ServiceHost::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

std::shared_ptr<ServiceManager> ServiceHost::Rebuild() {
  auto fresh = std::make_shared<ServiceManager>(config_, factory_, password_, broadcaster_);
  std::shared_ptr<ServiceManager> old;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    old = std::move(current_);
    current_ = fresh;
    ++generation_;
  }
  if (old) {
    core::Status st = old->Shutdown();
    if (!st.IsOk()) {
      LOG_SVC_WARN("Shutting down replaced service manager: {}", st.ToString());
    }
  }
  LOG_SVC_INFO("Service manager rebuilt from current configuration");
  return fresh;
}

} // namespace service
} // namespace tyr
