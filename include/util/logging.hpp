// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace tyr {
namespace util {

/**
 * Process-wide logging wrapper around spdlog
 *
 * One named logger per component ("default", "discovery", "service",
 * "backup", "network", "app"), all sharing the same sinks. Either a
 * rotating file sink or a colored console sink is installed.
 *
 * Thread-safety: All methods are thread-safe. Initialization runs once
 * via std::call_once; logger lookups are guarded by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging
   * @param log_level Minimum level (trace, debug, info, warn, error, critical, off)
   * @param log_to_file Log to a rotating file instead of the console
   * @param log_file_path File path when log_to_file is set
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  // Flush and drop all loggers
  static void Shutdown();

  // Logger for a component; unknown names resolve to "default"
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for one component
   * @return false if the component is unknown or logging is not initialized
   */
  static bool SetComponentLevel(const std::string &component, const std::string &level);

  // Names of all component loggers
  static std::vector<std::string> Components();
};

} // namespace util
} // namespace tyr

#define LOG_TRACE(...)                                                         \
  tyr::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  tyr::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  tyr::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  tyr::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  tyr::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  tyr::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  tyr::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  tyr::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  tyr::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  tyr::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_DISC_TRACE(...)                                                    \
  tyr::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  tyr::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...)                                                     \
  tyr::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  tyr::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...)                                                    \
  tyr::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_SVC_DEBUG(...)                                                     \
  tyr::util::LogManager::GetLogger("service")->debug(__VA_ARGS__)
#define LOG_SVC_INFO(...)                                                      \
  tyr::util::LogManager::GetLogger("service")->info(__VA_ARGS__)
#define LOG_SVC_WARN(...)                                                      \
  tyr::util::LogManager::GetLogger("service")->warn(__VA_ARGS__)
#define LOG_SVC_ERROR(...)                                                     \
  tyr::util::LogManager::GetLogger("service")->error(__VA_ARGS__)

#define LOG_BACKUP_DEBUG(...)                                                  \
  tyr::util::LogManager::GetLogger("backup")->debug(__VA_ARGS__)
#define LOG_BACKUP_INFO(...)                                                   \
  tyr::util::LogManager::GetLogger("backup")->info(__VA_ARGS__)
#define LOG_BACKUP_WARN(...)                                                   \
  tyr::util::LogManager::GetLogger("backup")->warn(__VA_ARGS__)
#define LOG_BACKUP_ERROR(...)                                                  \
  tyr::util::LogManager::GetLogger("backup")->error(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  tyr::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  tyr::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  tyr::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
