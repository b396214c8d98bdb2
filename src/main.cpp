// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <iostream> // Keep for CLI output and early errors before logger initialized

namespace {

constexpr const char *PASSWORD_ENV = "TYR_PASSWORD";

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.tyr)\n"
      << "  --seeds=<file>       Public peer list (default: <datadir>/public_peers.json)\n"
      << "  --probes=<n>         Concurrent discovery probes (default: 20)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: discovery, service, backup, network, app, all\n"
      << "                       Can be comma-separated: --debug=service,network\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << "\n"
      << "The account password is read from $" << PASSWORD_ENV
      << " the first time the storage is initialized.\n"
      << std::endl;
}

std::optional<std::string> password_from_env() {
  const char *value = std::getenv(PASSWORD_ENV);
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    tyr::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << tyr::GetFullVersionString() << std::endl;
        std::cout << tyr::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--seeds=") == 0) {
        config.seeds_path = arg.substr(8);
      } else if (arg.find("--probes=") == 0) {
        auto probes = tyr::util::SafeParseInt(arg.substr(9), 1, 256);
        if (!probes) {
          std::cerr << "Error: Invalid probe count: " << arg.substr(9) << std::endl;
          std::cerr << "Probe count must be a number between 1 and 256" << std::endl;
          return 1;
        }
        config.probe_concurrency = static_cast<size_t>(*probes);
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=service,network
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    if (!tyr::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory " << config.datadir << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    tyr::util::LogManager::Initialize(log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        tyr::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        tyr::util::LogManager::SetComponentLevel("network", "trace");
      } else if (!tyr::util::LogManager::SetComponentLevel(component, "trace")) {
        std::cerr << "WARNING: unknown debug component '" << component << "'" << std::endl;
      }
    }

    std::cout << tyr::GetStartupBanner() << std::flush;

    int exit_code = 0;
    // Nested scope: the application (and its io threads) must be gone
    // before the logger is shut down
    {
      tyr::app::AppDependencies deps;
      deps.password_provider = password_from_env;
      tyr::app::Application app(config, std::move(deps));

      tyr::core::Status status = app.Initialize();
      if (!status.IsOk()) {
        LOG_ERROR("Failed to initialize: {}", status.ToString());
        std::cerr << "Error: " << status.GetMessage() << std::endl;
        exit_code = 1;
      } else {
        app.InstallSignalHandlers();

        status = app.StartService();
        if (!status.IsOk()) {
          LOG_ERROR("Failed to start service: {}", status.ToString());
          std::cerr << "Error: " << status.GetMessage() << std::endl;
          exit_code = 1;
        } else {
          LOG_INFO("Running until SIGINT or SIGTERM");
          app.WaitForShutdown();

          status = app.SoftStopService();
          if (!status.IsOk()) {
            LOG_WARN("Soft stop: {}", status.ToString());
          }
        }
      }
      app.Shutdown();
    }

    tyr::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    tyr::util::LogManager::Shutdown();
    return 1;
  }
}
