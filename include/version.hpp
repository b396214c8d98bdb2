// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace tyr {

constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Sent in the WebSocket upgrade request of discovery probes
inline std::string GetUserAgent() { return "tyr/" + GetVersionString(); }

inline std::string GetFullVersionString() {
  return "Tyr version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

inline std::string GetStartupBanner() {
  std::string banner;
  banner += "\n";
  banner += "+-------------------------------------------------+\n";
  banner += "|  Tyr mesh mail daemon                           |\n";
  banner += "|  Version: " + GetVersionString();
  banner += std::string(38 - GetVersionString().size(), ' ') + "|\n";
  banner += "|  " + GetCopyrightString();
  banner += std::string(47 - GetCopyrightString().size(), ' ') + "|\n";
  banner += "+-------------------------------------------------+\n\n";
  return banner;
}

} // namespace tyr
