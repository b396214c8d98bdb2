// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tyr {
namespace core {

/**
 * Failure categories surfaced by lifecycle, discovery and backup operations
 *
 * Probe-level codes (NetworkUnreachable, Timeout) never leave the discovery
 * coordinator; they exist so probes can classify their own failures.
 */
enum class ErrorCode {
  OK,
  NetworkUnreachable,
  Timeout,
  AlreadyInitialized,
  AlreadyRunning,
  NotRunning,
  NotInitialized,
  NoPeersEnabled,
  ResourceBusy,
  AuthenticationFailed,
  PartialRestore,
  OperationTimedOut,
  Cancelled,
  InvalidArgument,
  IoError,
  CorruptBackup,
  EngineFailure,
};

const char *ErrorCodeName(ErrorCode code);

/**
 * Outcome of an operation: a code plus a human-readable message
 *
 * Modeled on ValidationState: cheap to copy, OK by default.
 */
class Status {
public:
  Status() = default;
  Status(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  static Status Ok() { return Status(); }
  static Status Error(ErrorCode code, std::string message) {
    return Status(code, std::move(message));
  }

  bool IsOk() const { return code_ == ErrorCode::OK; }
  bool Is(ErrorCode code) const { return code_ == code; }
  ErrorCode GetCode() const { return code_; }
  const std::string &GetMessage() const { return message_; }

  // Busy and stop-timeout conditions clear up on their own; retry later
  bool IsRetryable() const {
    return code_ == ErrorCode::ResourceBusy || code_ == ErrorCode::OperationTimedOut;
  }

  // Deliberate cancellation is reported but never alerted on
  bool IsAlertWorthy() const { return !IsOk() && code_ != ErrorCode::Cancelled; }

  // "ResourceBusy: storage is still held"
  std::string ToString() const;

private:
  ErrorCode code_{ErrorCode::OK};
  std::string message_;
};

/**
 * Value-or-Status return type
 *
 * Accessing Value() on a failed result throws std::logic_error; callers
 * check IsOk() first.
 */
template <typename T> class Result {
public:
  Result(T value) : value_(std::move(value)) {}
  Result(Status status) : status_(std::move(status)) {
    if (status_.IsOk()) {
      status_ = Status::Error(ErrorCode::InvalidArgument, "empty result");
    }
  }

  bool IsOk() const { return value_.has_value(); }
  const Status &GetStatus() const { return status_; }

  const T &Value() const & {
    if (!value_) {
      throw std::logic_error("Result::Value on error: " + status_.ToString());
    }
    return *value_;
  }
  T &Value() & {
    if (!value_) {
      throw std::logic_error("Result::Value on error: " + status_.ToString());
    }
    return *value_;
  }
  T &&Value() && {
    if (!value_) {
      throw std::logic_error("Result::Value on error: " + status_.ToString());
    }
    return std::move(*value_);
  }

private:
  std::optional<T> value_;
  Status status_;
};

} // namespace core
} // namespace tyr
