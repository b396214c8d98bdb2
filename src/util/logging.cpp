// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tyr {
namespace util {

namespace {

constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
constexpr size_t kMaxLogFileSize = 10 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

const std::vector<std::string> kComponents = {"default", "discovery", "service",
                                              "backup",  "network",   "app"};

std::once_flag s_init_flag;

// Guards s_loggers (all reads and writes)
std::mutex s_loggers_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

spdlog::sink_ptr MakeConsoleSink() {
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  sink->set_pattern(kPattern);
  return sink;
}

spdlog::sink_ptr MakeFileSink(const std::string &log_file_path) {
  namespace fs = std::filesystem;
  fs::path p = log_file_path.empty() ? fs::path("debug.log") : fs::path(log_file_path);
  if (p.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
  }
  auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      p.string(), kMaxLogFileSize, kMaxLogFiles);
  sink->set_pattern(kPattern);
  return sink;
}

void InitializeInternal(const std::string &log_level, bool log_to_file,
                        const std::string &log_file_path) {
  try {
    spdlog::sink_ptr sink;
    if (log_to_file) {
      try {
        sink = MakeFileSink(log_file_path);
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to open log file (" << ex.what()
                  << "), logging to console\n";
        log_to_file = false;
      }
    }
    if (!sink) {
      sink = MakeConsoleSink();
    }

    const auto level = spdlog::level::from_str(log_level);

    std::lock_guard<std::mutex> lock(s_loggers_mutex);
    for (const auto &component : kComponents) {
      auto logger = std::make_shared<spdlog::logger>(component, sink);
      logger->set_level(level);
      logger->flush_on(spdlog::level::trace);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }
    spdlog::set_default_logger(s_loggers["default"]);

    if (log_to_file && level != spdlog::level::off) {
      s_loggers["default"]->info("");
      s_loggers["default"]->info("");
    }
    if (level != spdlog::level::off) {
      s_loggers["default"]->info("Logging system initialized (level: {})", log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  spdlog::shutdown();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Initialization failed or Shutdown() ran: install a silent console logger
  // so the LOG_* macros never dereference null.
  if (s_loggers.empty()) {
    auto logger = spdlog::get("default");
    if (!logger) {
      logger = std::make_shared<spdlog::logger>("default", MakeConsoleSink());
      logger->set_level(spdlog::level::off);
      spdlog::register_logger(logger);
    }
    s_loggers["default"] = logger;
    spdlog::set_default_logger(logger);
    return logger;
  }

  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  if (s_loggers.empty()) {
    return;
  }

  const auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }

  // Direct access; GetLogger() would deadlock on s_loggers_mutex
  if (log_level != spdlog::level::off) {
    s_loggers["default"]->info("Log level changed to: {}", level);
  }
}

bool LogManager::SetComponentLevel(const std::string &component, const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  if (s_loggers.empty()) {
    return false;
  }

  auto it = s_loggers.find(component);
  if (it == s_loggers.end()) {
    s_loggers["default"]->warn("Unknown log component: {}", component);
    return false;
  }

  const auto log_level = spdlog::level::from_str(level);
  it->second->set_level(log_level);
  if (log_level != spdlog::level::off) {
    s_loggers["default"]->info("Component '{}' log level set to: {}", component, level);
  }
  return true;
}

std::vector<std::string> LogManager::Components() { return kComponents; }

} // namespace util
} // namespace tyr
