// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tyr {
namespace util {

static std::atomic<int64_t> g_mock_time{0};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void SetMockTime(int64_t time) { g_mock_time.store(time, std::memory_order_relaxed); }

int64_t GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

static std::string FormatUTC(int64_t unix_time, const char *fmt) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_utc;
  if (!gmtime_r(&t, &tm_utc)) {
    return "invalid";
  }
  std::ostringstream oss;
  oss << std::put_time(&tm_utc, fmt);
  return oss.str();
}

std::string FormatTime(int64_t unix_time) {
  return FormatUTC(unix_time, "%Y-%m-%d %H:%M:%S UTC");
}

std::string FormatRFC3339(int64_t unix_time) {
  return FormatUTC(unix_time, "%Y-%m-%dT%H:%M:%SZ");
}

std::optional<int64_t> ParseRFC3339(const std::string &text) {
  int year, month, day, hour, minute, second;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day,
                  &hour, &minute, &second, &consumed) != 6) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 60) {
    return std::nullopt;
  }

  size_t pos = static_cast<size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      ++pos;
    }
  }

  int64_t offset = 0;
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int oh = 0, om = 0;
    if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
      return std::nullopt;
    }
    offset = (oh * 3600 + om * 60) * (text[pos] == '+' ? 1 : -1);
    pos += 6;
  } else {
    return std::nullopt;
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  return static_cast<int64_t>(timegm(&tm)) - offset;
}

std::string FormatShortDate(int64_t unix_time) {
  std::time_t t = static_cast<std::time_t>(unix_time);
  std::tm tm_local;
  if (!localtime_r(&t, &tm_local)) {
    return "00-00-00";
  }
  std::ostringstream oss;
  oss << std::put_time(&tm_local, "%d-%m-%y");
  return oss.str();
}

} // namespace util
} // namespace tyr
