// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of untrusted strings (command line, config files, seed lists).
 Every parser requires the whole input to be consumed and returns
 std::nullopt on any error; none of them throw.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tyr {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

// Port in [1, 65535]
std::optional<uint16_t> SafeParsePort(const std::string &str);

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min, int64_t max);

// Strip leading and trailing ASCII whitespace
std::string Trim(const std::string &str);

std::string ToLower(std::string str);

/**
 * Split on a delimiter, trimming each element and dropping empty ones
 *
 *   SplitList("tcp, tls,,quic", ',') -> {"tcp", "tls", "quic"}
 */
std::vector<std::string> SplitList(const std::string &str, char delimiter = ',');

// Lowercase hex encoding
std::string HexStr(const std::vector<uint8_t> &data);

} // namespace util
} // namespace tyr
