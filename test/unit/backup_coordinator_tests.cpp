// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "backup/backup_coordinator.hpp"
#include "infra/mock_engine.hpp"
#include "infra/signal.hpp"
#include "infra/temp_dir.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <nlohmann/json.hpp>
#include <thread>

using namespace tyr::backup;
using tyr::config::ConfigStore;
using tyr::config::PeerConfig;
using tyr::core::ErrorCode;
using tyr::core::Status;
using tyr::service::ServiceHost;
using tyr::service::ServiceState;
using tyr::test::MockEngine;
using tyr::test::MockEngineState;
using tyr::test::Signal;
using tyr::test::TempDir;

namespace {

const std::string PASSWORD = "backup-password";

BackupOptions FastOptions() {
    BackupOptions options;
    options.stop_poll_attempts = 5;
    options.stop_poll_interval = std::chrono::milliseconds(10);
    options.kdf_iterations = 1000;
    return options;
}

struct BackupFixture {
    TempDir dir{"backup"};
    ConfigStore config{dir.path()};
    std::shared_ptr<MockEngineState> engine = std::make_shared<MockEngineState>();
    std::unique_ptr<ServiceHost> host;
    std::unique_ptr<BackupCoordinator> backups;

    BackupFixture() {
        REQUIRE(config.Load().IsOk());
        config.Update([](tyr::config::Config& cfg) {
            cfg.peers = {{"tcp://a.example:7743", true}, {"tls://b.example:443", false}};
            cfg.ui.theme = "dark";
            cfg.ui.language = "de";
        });
        REQUIRE(config.Save().IsOk());
        host = std::make_unique<ServiceHost>(config, MockEngine::Factory(engine), nullptr);
        backups = std::make_unique<BackupCoordinator>(*host, config, FastOptions());
    }

    std::filesystem::path storage() const { return config.Get().service.storage_path; }

    std::string ReadStorage() const {
        auto data = tyr::util::try_read_file(storage());
        REQUIRE(data.has_value());
        return std::string(data->begin(), data->end());
    }

    void WriteStorage(const std::string& contents) {
        REQUIRE(tyr::util::atomic_write_file(storage(), contents, 0600));
    }

    void StartService() {
        auto mgr = host->Current();
        REQUIRE(mgr->Initialize().IsOk());
        REQUIRE(mgr->Start().IsOk());
    }

    // Change everything a restore is expected to put back
    void Diverge() {
        config.Update([](tyr::config::Config& cfg) {
            cfg.peers = {{"quic://c.example:7743", true}};
            cfg.ui.theme = "light";
            cfg.ui.language = "fr";
        });
        REQUIRE(config.Save().IsOk());
        WriteStorage("diverged-db");
    }

    std::filesystem::path WriteRawBackup(const std::string& payload) const {
        auto sealed = EncryptBackup(std::vector<uint8_t>(payload.begin(), payload.end()), PASSWORD,
                                    FastOptions().kdf_iterations);
        REQUIRE(sealed.IsOk());
        const auto path = dir / "raw.tb";
        REQUIRE(tyr::util::atomic_write_file(path, sealed.Value(), 0600));
        return path;
    }
};

} // namespace

TEST_CASE("Backup and restore round trip around a running service", "[backup]") {
    BackupFixture f;
    f.StartService();
    f.WriteStorage("original-db");

    std::vector<BackupStage> stages;
    const auto file = f.dir / "snapshot.tb";
    auto created = f.backups->CreateBackup({file, true, PASSWORD},
                                           [&](BackupStage s) { stages.push_back(s); });
    REQUIRE(created.IsOk());
    REQUIRE(created.Value().includes_database);
    REQUIRE(created.Value().warnings.empty());
    REQUIRE(created.Value().size_bytes == std::filesystem::file_size(file));
    REQUIRE(stages == std::vector<BackupStage>{BackupStage::PausingService, BackupStage::ReadingData,
                                               BackupStage::Encrypting, BackupStage::WritingFile,
                                               BackupStage::ResumingService, BackupStage::Done});

    // The service was paused for the read and came back
    REQUIRE(f.host->Current()->GetStatus() == ServiceState::Running);
    REQUIRE(f.engine->soft_stops == 1);
    REQUIRE(f.engine->running == 1);

    f.Diverge();

    auto restored = f.backups->RestoreBackup({file, PASSWORD});
    REQUIRE(restored.IsOk());
    REQUIRE(restored.Value().restored_database);
    REQUIRE(restored.Value().service_restarted);
    REQUIRE_FALSE(restored.Value().backup_timestamp.empty());

    const auto cfg = f.config.Get();
    REQUIRE(cfg.peers == std::vector<PeerConfig>{{"tcp://a.example:7743", true},
                                                 {"tls://b.example:443", false}});
    REQUIRE(cfg.ui.theme == "dark");
    REQUIRE(cfg.ui.language == "de");
    REQUIRE(cfg.onboarding_complete);
    REQUIRE(cfg.service.storage_path == f.storage().string());
    REQUIRE(f.ReadStorage() == "original-db");

    // The restored configuration is on disk as well
    ConfigStore reread(f.dir.path());
    REQUIRE(reread.Load().IsOk());
    REQUIRE(reread.Get().ui.theme == "dark");

    // A new manager generation serves the restored config
    REQUIRE(f.host->generation() == 2);
    REQUIRE(f.host->Current()->GetStatus() == ServiceState::Running);
    REQUIRE(f.engine->running == 1);
}

TEST_CASE("An empty database survives a round trip", "[backup]") {
    BackupFixture f;
    f.WriteStorage("");

    const auto file = f.dir / "empty-db.tb";
    auto created = f.backups->CreateBackup({file, true, PASSWORD});
    REQUIRE(created.IsOk());
    REQUIRE(created.Value().includes_database);

    f.WriteStorage("diverged");
    auto restored = f.backups->RestoreBackup({file, PASSWORD});
    REQUIRE(restored.IsOk());
    REQUIRE(restored.Value().restored_database);
    REQUIRE(std::filesystem::file_size(f.storage()) == 0);
}

TEST_CASE("Restore that cannot write the database is a partial restore", "[backup]") {
    BackupFixture f;
    f.StartService();
    f.WriteStorage("original-db");

    const auto file = f.dir / "partial.tb";
    REQUIRE(f.backups->CreateBackup({file, true, PASSWORD}).IsOk());
    REQUIRE(f.host->Current()->GetStatus() == ServiceState::Running);

    f.config.Update([](tyr::config::Config& cfg) { cfg.ui.theme = "light"; });
    REQUIRE(f.config.Save().IsOk());

    // A non-empty directory where the database file should go
    std::filesystem::remove(f.storage());
    std::filesystem::create_directories(f.storage() / "blocker");

    auto restored = f.backups->RestoreBackup({file, PASSWORD});
    REQUIRE_FALSE(restored.IsOk());
    REQUIRE(restored.GetStatus().Is(ErrorCode::PartialRestore));
    REQUIRE_FALSE(restored.GetStatus().IsRetryable());

    // Configuration was replaced, the service stays down
    REQUIRE(f.config.Get().ui.theme == "dark");
    ConfigStore reread(f.dir.path());
    REQUIRE(reread.Load().IsOk());
    REQUIRE(reread.Get().ui.theme == "dark");
    REQUIRE(f.host->Current()->GetStatus() == ServiceState::Stopped);
    REQUIRE(f.engine->running == 0);
    REQUIRE(std::filesystem::is_directory(f.storage()));
}

TEST_CASE("Backup gives up on a service that does not finish stopping", "[backup]") {
    BackupFixture f;
    f.StartService();

    Signal entered;
    Signal release;
    bool in_soft_stop = false;
    bool released = false;
    f.engine->on_soft_stop = [&] {
        entered.Notify([&] { in_soft_stop = true; });
        release.WaitFor([&] { return released; }, std::chrono::seconds(5));
    };

    auto mgr = f.host->Current();
    Status stop_status;
    std::thread stopper([&] { stop_status = mgr->SoftStop(); });
    REQUIRE(entered.WaitFor([&] { return in_soft_stop; }));
    REQUIRE(mgr->GetStatus() == ServiceState::Stopping);

    BackupOptions options = FastOptions();
    options.stop_poll_attempts = 2;
    BackupCoordinator impatient(*f.host, f.config, options);

    const auto file = f.dir / "timeout.tb";
    auto created = impatient.CreateBackup({file, true, PASSWORD});
    REQUIRE_FALSE(created.IsOk());
    REQUIRE(created.GetStatus().Is(ErrorCode::OperationTimedOut));
    REQUIRE(created.GetStatus().IsRetryable());
    REQUIRE_FALSE(std::filesystem::exists(file));

    release.Notify([&] { released = true; });
    stopper.join();
    f.engine->on_soft_stop = nullptr;
    REQUIRE(stop_status.IsOk());
    REQUIRE(mgr->GetStatus() == ServiceState::Stopped);
}

TEST_CASE("Restore with a wrong password changes nothing", "[backup]") {
    BackupFixture f;
    f.StartService();
    f.WriteStorage("original-db");
    const auto file = f.dir / "snapshot.tb";
    REQUIRE(f.backups->CreateBackup({file, true, PASSWORD}).IsOk());

    f.Diverge();
    const auto before = f.config.Get();
    auto config_bytes = tyr::util::try_read_file(f.config.path());
    REQUIRE(config_bytes.has_value());

    auto restored = f.backups->RestoreBackup({file, "not-the-password"});
    REQUIRE(restored.GetStatus().Is(ErrorCode::AuthenticationFailed));

    REQUIRE(f.config.Get() == before);
    REQUIRE(tyr::util::try_read_file(f.config.path()) == config_bytes);
    REQUIRE(f.ReadStorage() == "diverged-db");
    REQUIRE(f.host->generation() == 1);
    REQUIRE(f.host->Current()->GetStatus() == ServiceState::Running);
}

TEST_CASE("Backup rejects short passwords without pausing", "[backup]") {
    BackupFixture f;
    f.StartService();

    auto created = f.backups->CreateBackup({f.dir / "x.tb", true, "short"});
    REQUIRE(created.GetStatus().Is(ErrorCode::InvalidArgument));
    auto restored = f.backups->RestoreBackup({f.dir / "x.tb", "1234567"});
    REQUIRE(restored.GetStatus().Is(ErrorCode::InvalidArgument));
    auto no_path = f.backups->CreateBackup({"", true, PASSWORD});
    REQUIRE(no_path.GetStatus().Is(ErrorCode::InvalidArgument));

    REQUIRE(f.engine->soft_stops == 0);
    REQUIRE(f.host->Current()->GetStatus() == ServiceState::Running);
    REQUIRE_FALSE(std::filesystem::exists(f.dir / "x.tb"));
}

TEST_CASE("Configuration-only backup leaves the service alone", "[backup]") {
    BackupFixture f;
    f.StartService();
    bool hook_called = false;
    f.backups->SetBeforePauseHook([&] { hook_called = true; });

    const auto file = f.dir / "config-only.tb";
    auto created = f.backups->CreateBackup({file, false, PASSWORD});
    REQUIRE(created.IsOk());
    REQUIRE_FALSE(created.Value().includes_database);
    REQUIRE_FALSE(hook_called);
    REQUIRE(f.engine->soft_stops == 0);
    REQUIRE(f.host->Current()->GetStatus() == ServiceState::Running);

    auto info = f.backups->GetBackupInfo(file, PASSWORD);
    REQUIRE(info.IsOk());
    REQUIRE(info.Value().version == BACKUP_FORMAT_VERSION);
    REQUIRE_FALSE(info.Value().includes_database);
    REQUIRE_FALSE(info.Value().timestamp.empty());

    // Restoring it keeps the current storage
    f.Diverge();
    auto restored = f.backups->RestoreBackup({file, PASSWORD});
    REQUIRE(restored.IsOk());
    REQUIRE_FALSE(restored.Value().restored_database);
    REQUIRE(f.ReadStorage() == "diverged-db");
    REQUIRE(f.config.Get().ui.theme == "dark");
}

TEST_CASE("Backup of a missing database is configuration only", "[backup]") {
    BackupFixture f;
    REQUIRE_FALSE(std::filesystem::exists(f.storage()));

    bool hook_called = false;
    f.backups->SetBeforePauseHook([&] { hook_called = true; });
    auto created = f.backups->CreateBackup({f.dir / "b.tb", true, PASSWORD});
    REQUIRE(created.IsOk());
    REQUIRE(hook_called);
    REQUIRE_FALSE(created.Value().includes_database);
    REQUIRE(created.Value().warnings.size() == 1);
    // Nothing was running, so nothing is started
    REQUIRE(f.engine->starts == 0);
}

TEST_CASE("Backup reports a failed service restart as a warning", "[backup]") {
    BackupFixture f;
    f.StartService();
    f.engine->start_result = Status::Error(ErrorCode::EngineFailure, "port in use");

    auto created = f.backups->CreateBackup({f.dir / "w.tb", true, PASSWORD});
    REQUIRE(created.IsOk());
    REQUIRE(created.Value().includes_database);
    REQUIRE(created.Value().warnings.size() == 1);
    REQUIRE(f.host->Current()->GetStatus() == ServiceState::Error);
    REQUIRE(std::filesystem::exists(f.dir / "w.tb"));
}

TEST_CASE("Restore refuses storage held by another process", "[backup]") {
    BackupFixture f;
    f.WriteStorage("original-db");
    const auto file = f.dir / "snapshot.tb";
    REQUIRE(f.backups->CreateBackup({file, true, PASSWORD}).IsOk());
    f.Diverge();

    tyr::util::FileLock holder(f.storage().string() + ".lock");
    REQUIRE(holder.TryLock());

    auto restored = f.backups->RestoreBackup({file, PASSWORD});
    REQUIRE(restored.GetStatus().Is(ErrorCode::ResourceBusy));
    REQUIRE(f.config.Get().ui.theme == "light");
    REQUIRE(f.ReadStorage() == "diverged-db");
}

TEST_CASE("Restore rejects malformed and incompatible payloads", "[backup]") {
    BackupFixture f;
    const auto before = f.config.Get();

    SECTION("not json") {
        auto file = f.WriteRawBackup("definitely not json");
        REQUIRE(f.backups->RestoreBackup({file, PASSWORD}).GetStatus().Is(ErrorCode::CorruptBackup));
        REQUIRE(f.backups->GetBackupInfo(file, PASSWORD).GetStatus().Is(ErrorCode::CorruptBackup));
        // Decryption itself succeeds
        REQUIRE(f.backups->VerifyBackupPassword(file, PASSWORD).IsOk());
    }

    SECTION("future version") {
        nlohmann::json doc;
        doc["version"] = "2.0";
        doc["timestamp"] = "2030-01-01T00:00:00Z";
        doc["config"] = nlohmann::json::object();
        doc["includes_database"] = false;
        auto file = f.WriteRawBackup(doc.dump());

        REQUIRE(f.backups->RestoreBackup({file, PASSWORD}).GetStatus().Is(ErrorCode::CorruptBackup));
        auto info = f.backups->GetBackupInfo(file, PASSWORD);
        REQUIRE(info.IsOk());
        REQUIRE(info.Value().version == "2.0");
    }

    SECTION("corrupt database encoding") {
        nlohmann::json doc;
        doc["version"] = BACKUP_FORMAT_VERSION;
        doc["config"] = {{"theme", "light"}};
        doc["includes_database"] = true;
        doc["database"] = "***";
        auto file = f.WriteRawBackup(doc.dump());
        REQUIRE(f.backups->RestoreBackup({file, PASSWORD}).GetStatus().Is(ErrorCode::CorruptBackup));
    }

    REQUIRE(f.config.Get() == before);
}

TEST_CASE("Backup password verification", "[backup]") {
    BackupFixture f;
    const auto file = f.dir / "v.tb";
    REQUIRE(f.backups->CreateBackup({file, false, PASSWORD}).IsOk());

    REQUIRE(f.backups->VerifyBackupPassword(file, PASSWORD).IsOk());
    REQUIRE(f.backups->VerifyBackupPassword(file, "wrong-password").Is(ErrorCode::AuthenticationFailed));
    REQUIRE(f.backups->GetBackupInfo(file, "wrong-password").GetStatus().Is(ErrorCode::AuthenticationFailed));
    REQUIRE(f.backups->VerifyBackupPassword(f.dir / "missing.tb", PASSWORD).Is(ErrorCode::IoError));

    REQUIRE(tyr::util::atomic_write_file(f.dir / "empty.tb", std::string{}, 0600));
    REQUIRE(f.backups->VerifyBackupPassword(f.dir / "empty.tb", PASSWORD).Is(ErrorCode::CorruptBackup));

    REQUIRE(tyr::util::atomic_write_file(f.dir / "tiny.tb", std::string("tb"), 0600));
    REQUIRE(f.backups->VerifyBackupPassword(f.dir / "tiny.tb", PASSWORD).Is(ErrorCode::CorruptBackup));
}

TEST_CASE("Backup filename carries the date", "[backup]") {
    const std::string name = GenerateBackupFilename();
    REQUIRE(name.rfind("tbackup-", 0) == 0);
    REQUIRE(name.size() == std::string("tbackup-dd-mm-yy.tb").size());
    REQUIRE(name.substr(name.size() - 3) == ".tb");
}
