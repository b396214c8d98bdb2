// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace tyr {
namespace util {

namespace {

template <typename T>
std::optional<T> ParseIntegral(const std::string &str, T min, T max) {
  // from_chars accepts neither leading whitespace nor '+', matching the
  // strictness wanted for config and command-line input
  if (str.empty()) {
    return std::nullopt;
  }
  T value{};
  const char *begin = str.data();
  const char *end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return value;
}

} // namespace

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  return ParseIntegral<int>(str, min, max);
}

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  auto value = ParseIntegral<int>(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min, int64_t max) {
  return ParseIntegral<int64_t>(str, min, max);
}

std::string Trim(const std::string &str) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto first = std::find_if(str.begin(), str.end(), not_space);
  auto last = std::find_if(str.rbegin(), str.rend(), not_space).base();
  if (first >= last) {
    return {};
  }
  return std::string(first, last);
}

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return str;
}

std::vector<std::string> SplitList(const std::string &str, char delimiter) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= str.size()) {
    size_t end = str.find(delimiter, start);
    if (end == std::string::npos) {
      end = str.size();
    }
    std::string item = Trim(str.substr(start, end - start));
    if (!item.empty()) {
      out.push_back(std::move(item));
    }
    start = end + 1;
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t> &data) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

} // namespace util
} // namespace tyr
