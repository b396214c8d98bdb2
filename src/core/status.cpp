// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "core/status.hpp"

namespace tyr {
namespace core {

const char *ErrorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::OK:
    return "OK";
  case ErrorCode::NetworkUnreachable:
    return "NetworkUnreachable";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::AlreadyRunning:
    return "AlreadyRunning";
  case ErrorCode::NotRunning:
    return "NotRunning";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::NoPeersEnabled:
    return "NoPeersEnabled";
  case ErrorCode::ResourceBusy:
    return "ResourceBusy";
  case ErrorCode::AuthenticationFailed:
    return "AuthenticationFailed";
  case ErrorCode::PartialRestore:
    return "PartialRestore";
  case ErrorCode::OperationTimedOut:
    return "OperationTimedOut";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::IoError:
    return "IoError";
  case ErrorCode::CorruptBackup:
    return "CorruptBackup";
  case ErrorCode::EngineFailure:
    return "EngineFailure";
  }
  return "Unknown";
}

std::string Status::ToString() const {
  if (IsOk()) {
    return "OK";
  }
  if (message_.empty()) {
    return ErrorCodeName(code_);
  }
  return std::string(ErrorCodeName(code_)) + ": " + message_;
}

} // namespace core
} // namespace tyr
