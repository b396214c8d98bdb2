// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tyr {
namespace util {

/**
 * Mockable wall clock
 *
 * Production code calls GetTime() instead of system_clock directly; tests
 * pin the clock with SetMockTime() or MockTimeScope. A mock value of 0
 * means real time.
 */

// Unix time in seconds
int64_t GetTime();

void SetMockTime(int64_t time);
int64_t GetMockTime();

// "2025-10-25 14:33:09 UTC"
std::string FormatTime(int64_t unix_time);

// RFC 3339 / ISO 8601 in UTC: "2025-10-25T14:33:09Z"
std::string FormatRFC3339(int64_t unix_time);

/**
 * Parse an RFC 3339 timestamp
 * Accepts a "Z" suffix or a "+hh:mm" / "-hh:mm" offset; fractional seconds
 * are ignored.
 */
std::optional<int64_t> ParseRFC3339(const std::string &text);

// Day-month-year with two-digit year in local time: "25-10-25"
std::string FormatShortDate(int64_t unix_time);

class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }
  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace tyr
