// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace tyr {
namespace service {

enum class ServiceState {
  Stopped,
  Starting,
  Running,
  Stopping,
  Error,
};

const char *ServiceStateName(ServiceState state);

// One transition, as delivered to status subscribers
struct StatusEvent {
  ServiceState state{ServiceState::Stopped};
  std::string error;    // set when state == Error
  int64_t timestamp{0}; // unix seconds
  uint64_t sequence{0}; // strictly increasing per broadcaster
};

} // namespace service
} // namespace tyr
