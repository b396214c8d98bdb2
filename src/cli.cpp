// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <termios.h>
#include <unistd.h>
#include <vector>

namespace {

constexpr const char *BACKUP_PASSWORD_ENV = "TYR_BACKUP_PASSWORD";

void PrintUsage(const char *program_name) {
  std::cout
      << "Tyr CLI - peer discovery and backups\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.tyr)\n"
      << "  --seeds=<file>       Public peer list (default: <datadir>/public_peers.json)\n"
      << "  --verbose            Log discovery and service activity to stderr\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n\n"
      << "Commands:\n"
      << "\n"
      << "Discovery:\n"
      << "  discover [--protocols=tcp,tls] [--region=<name>] [--max-rtt=<ms>] [--add]\n"
      << "                       Probe public peers; --add stores the results in config\n"
      << "  cached               Show the last discovery result\n"
      << "  clear-cache          Delete the discovery cache\n"
      << "  regions              List regions in the public peer list\n"
      << "  check <uri>...       Probe the given peer URIs once\n"
      << "\n"
      << "Backup:\n"
      << "  backup <file> [--no-database]   Write an encrypted backup\n"
      << "  restore <file>                  Restore configuration and storage\n"
      << "  verify-backup <file>            Check the password and show backup details\n"
      << "\n"
      << "Storage:\n"
      << "  storage              Show disk usage of the mail storage\n"
      << "\n"
      << "The backup password is read from $" << BACKUP_PASSWORD_ENV
      << " or prompted for.\n"
      << std::endl;
}

std::string ReadPassword() {
  const char *env = std::getenv(BACKUP_PASSWORD_ENV);
  if (env && *env != '\0') {
    return env;
  }

  std::cerr << "Backup password: " << std::flush;
  termios saved{};
  bool restore_echo = false;
  if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0) {
    termios silent = saved;
    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    restore_echo = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
  }
  std::string password;
  std::getline(std::cin, password);
  if (restore_echo) {
    tcsetattr(STDIN_FILENO, TCSANOW, &saved);
  }
  std::cerr << std::endl;
  return password;
}

int Fail(const tyr::core::Status &status) {
  std::cerr << "Error: " << status.ToString() << std::endl;
  return 1;
}

void PrintPeers(const std::vector<tyr::discovery::DiscoveredPeer> &peers, bool show_availability) {
  for (const auto &peer : peers) {
    std::cout << std::left << std::setw(48) << peer.address << " "
              << std::setw(5) << tyr::discovery::ProtocolName(peer.protocol) << " "
              << std::setw(16) << (peer.region.empty() ? "-" : peer.region) << " ";
    if (show_availability && !peer.available) {
      std::cout << "unreachable";
    } else {
      std::cout << peer.rtt_ms << " ms";
    }
    std::cout << "\n";
  }
}

int CmdDiscover(tyr::app::Application &app, const std::vector<std::string> &params) {
  tyr::discovery::DiscoveryRequest request;
  bool add = false;
  for (const auto &param : params) {
    if (param.find("--protocols=") == 0) {
      auto protocols = tyr::discovery::ParseProtocolList(param.substr(12));
      if (!protocols) {
        std::cerr << "Error: Invalid protocol list: " << param.substr(12) << std::endl;
        return 1;
      }
      request.protocols = *protocols;
    } else if (param.find("--region=") == 0) {
      request.region = param.substr(9);
    } else if (param.find("--max-rtt=") == 0) {
      auto max_rtt = tyr::util::SafeParseInt64(param.substr(10), 0, 60000);
      if (!max_rtt) {
        std::cerr << "Error: Invalid --max-rtt (0-60000 ms): " << param.substr(10) << std::endl;
        return 1;
      }
      request.max_rtt_ms = *max_rtt;
    } else if (param == "--add") {
      add = true;
    } else {
      std::cerr << "Error: Unknown discover option: " << param << std::endl;
      return 1;
    }
  }

  auto result = app.FindAvailablePeers(request, [](const tyr::discovery::DiscoveryProgress &p) {
    std::cerr << "\rProbed " << p.current << "/" << p.total << ", " << p.available_count
              << " available" << std::flush;
  });
  std::cerr << std::endl;
  if (!result.IsOk()) {
    return Fail(result.GetStatus());
  }

  const auto &scan = result.Value();
  PrintPeers(scan.peers, false);
  std::cout << scan.available << " of " << scan.total << " peers available ("
            << scan.elapsed_ms << " ms)" << std::endl;

  if (add && !scan.peers.empty()) {
    auto added = app.AddDiscoveredPeers(scan.peers);
    if (!added.IsOk()) {
      return Fail(added.GetStatus());
    }
    std::cout << "Added " << added.Value() << " peer(s) to configuration" << std::endl;
  }
  return 0;
}

int CmdCached(tyr::app::Application &app) {
  auto view = app.GetCachedDiscoveredPeers();
  if (view.timestamp == 0) {
    std::cout << "No cached discovery result" << std::endl;
    return 0;
  }
  PrintPeers(view.peers, false);
  std::cout << view.peers.size() << " peer(s), discovered at " << view.timestamp
            << (view.fresh ? "" : " (stale, older than 24h)") << std::endl;
  return 0;
}

int CmdRegions(tyr::app::Application &app) {
  auto regions = app.GetAvailableRegions();
  if (!regions.IsOk()) {
    return Fail(regions.GetStatus());
  }
  for (const auto &region : regions.Value()) {
    std::cout << region << "\n";
  }
  std::cout << std::flush;
  return 0;
}

int CmdCheck(tyr::app::Application &app, const std::vector<std::string> &params) {
  if (params.empty()) {
    std::cerr << "Error: check requires at least one peer URI" << std::endl;
    return 1;
  }
  auto result = app.CheckCustomPeers(params);
  if (!result.IsOk()) {
    return Fail(result.GetStatus());
  }
  PrintPeers(result.Value(), true);
  return 0;
}

int CmdBackup(tyr::app::Application &app, const std::vector<std::string> &params) {
  tyr::backup::CreateBackupRequest request;
  for (const auto &param : params) {
    if (param == "--no-database") {
      request.include_database = false;
    } else if (request.path.empty()) {
      request.path = param;
    } else {
      std::cerr << "Error: Unexpected argument: " << param << std::endl;
      return 1;
    }
  }
  if (request.path.empty()) {
    request.path = tyr::backup::GenerateBackupFilename();
  }
  request.password = ReadPassword();

  auto result = app.CreateBackup(request, [](tyr::backup::BackupStage stage) {
    std::cerr << tyr::backup::BackupStageName(stage) << "..." << std::endl;
  });
  if (!result.IsOk()) {
    return Fail(result.GetStatus());
  }
  const auto &backup = result.Value();
  for (const auto &warning : backup.warnings) {
    std::cerr << "Warning: " << warning << std::endl;
  }
  std::cout << "Backup written to " << backup.path.string() << " (" << backup.size_bytes
            << " bytes" << (backup.includes_database ? ", with storage" : "") << ")"
            << std::endl;
  return 0;
}

int CmdRestore(tyr::app::Application &app, const std::vector<std::string> &params) {
  if (params.size() != 1) {
    std::cerr << "Error: restore requires exactly one backup file" << std::endl;
    return 1;
  }
  tyr::backup::RestoreBackupRequest request;
  request.path = params[0];
  request.password = ReadPassword();

  auto result = app.RestoreBackup(request, [](tyr::backup::BackupStage stage) {
    std::cerr << tyr::backup::BackupStageName(stage) << "..." << std::endl;
  });
  if (!result.IsOk()) {
    return Fail(result.GetStatus());
  }
  const auto &restore = result.Value();
  for (const auto &warning : restore.warnings) {
    std::cerr << "Warning: " << warning << std::endl;
  }
  std::cout << "Restored backup from " << restore.backup_timestamp
            << (restore.restored_database ? " including storage" : "") << std::endl;
  return 0;
}

int CmdVerifyBackup(tyr::app::Application &app, const std::vector<std::string> &params) {
  if (params.size() != 1) {
    std::cerr << "Error: verify-backup requires exactly one backup file" << std::endl;
    return 1;
  }
  auto info = app.GetBackupInfo(params[0], ReadPassword());
  if (!info.IsOk()) {
    return Fail(info.GetStatus());
  }
  std::cout << "Password OK\n"
            << "Version:   " << info.Value().version << "\n"
            << "Created:   " << info.Value().timestamp << "\n"
            << "Storage:   " << (info.Value().includes_database ? "included" : "not included")
            << std::endl;
  return 0;
}

int CmdStorage(tyr::app::Application &app) {
  auto stats = app.GetStorageStats();
  if (!stats.IsOk()) {
    return Fail(stats.GetStatus());
  }
  std::cout << "Database:  " << stats.Value().database_bytes << " bytes\n"
            << "Files:     " << stats.Value().files_bytes << " bytes\n"
            << "Total:     " << stats.Value().total_bytes << " bytes" << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    // Parse options
    tyr::app::AppConfig config;
    bool verbose = false;
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (command.empty() && (arg == "--help" || arg == "-h")) {
        PrintUsage(argv[0]);
        return 0;
      } else if (command.empty() && (arg == "--version" || arg == "-v")) {
        std::cout << tyr::GetFullVersionString() << std::endl;
        std::cout << tyr::GetCopyrightString() << std::endl;
        return 0;
      } else if (command.empty() && arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (command.empty() && arg.find("--seeds=") == 0) {
        config.seeds_path = arg.substr(8);
      } else if (command.empty() && arg == "--verbose") {
        verbose = true;
      } else if (command.empty()) {
        command = arg;
      } else {
        params.push_back(arg);
      }
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    tyr::util::LogManager::Initialize(verbose ? "debug" : "warn", false);

    // Backup and restore touch the storage directly; refuse while a daemon
    // owns the data directory. Discovery commands may run alongside it.
    config.lock_datadir = command == "backup" || command == "restore";

    int exit_code = 1;
    {
      tyr::app::Application app(config);
      tyr::core::Status status = app.Initialize();
      if (!status.IsOk()) {
        exit_code = Fail(status);
      } else if (command == "discover") {
        exit_code = CmdDiscover(app, params);
      } else if (command == "cached") {
        exit_code = CmdCached(app);
      } else if (command == "clear-cache") {
        status = app.ClearCachedDiscoveredPeers();
        exit_code = status.IsOk() ? 0 : Fail(status);
      } else if (command == "regions") {
        exit_code = CmdRegions(app);
      } else if (command == "check") {
        exit_code = CmdCheck(app, params);
      } else if (command == "backup") {
        exit_code = CmdBackup(app, params);
      } else if (command == "restore") {
        exit_code = CmdRestore(app, params);
      } else if (command == "verify-backup") {
        exit_code = CmdVerifyBackup(app, params);
      } else if (command == "storage") {
        exit_code = CmdStorage(app);
      } else {
        std::cerr << "Error: Unknown command: " << command << std::endl;
        PrintUsage(argv[0]);
      }
      app.Shutdown();
    }

    tyr::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    tyr::util::LogManager::Shutdown();
    return 1;
  }
}
