// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/application.hpp"
#include "infra/mock_engine.hpp"
#include "infra/scripted_probe.hpp"
#include "infra/signal.hpp"
#include "infra/temp_dir.hpp"
#include "util/fs_lock.hpp"
#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

using namespace tyr::app;
using tyr::core::ErrorCode;
using tyr::core::Status;
using tyr::discovery::DiscoveredPeer;
using tyr::discovery::DiscoveryRequest;
using tyr::service::ServiceState;
using tyr::test::MockEngine;
using tyr::test::MockEngineState;
using tyr::test::ScriptedProbe;
using tyr::test::Signal;
using tyr::test::StaticSeedDirectory;
using tyr::test::TempDir;

namespace {

// Application wired to in-process doubles
struct AppFixture {
    TempDir dir{"app"};
    std::shared_ptr<StaticSeedDirectory> seeds = std::make_shared<StaticSeedDirectory>();
    std::shared_ptr<ScriptedProbe> probe = std::make_shared<ScriptedProbe>();
    std::shared_ptr<MockEngineState> engine = std::make_shared<MockEngineState>();
    std::unique_ptr<Application> app;

    AppFixture() {
        seeds->Add("tcp://fast.example:7743", "germany");
        seeds->Add("tls://slow.example:443", "japan");
        seeds->Add("tcp://down.example:7743", "japan");
        probe->Script("tcp://fast.example:7743", 10);
        probe->Script("tls://slow.example:443", 60);
        app = Make();
    }

    std::unique_ptr<Application> Make() {
        AppConfig config;
        config.datadir = dir.path();
        config.probe_concurrency = 4;
        config.backup_options.kdf_iterations = 1000;
        config.backup_options.stop_poll_interval = std::chrono::milliseconds(10);

        AppDependencies deps;
        deps.seeds = seeds;
        deps.probe = probe;
        deps.engine_factory = MockEngine::Factory(engine);
        return std::make_unique<Application>(config, deps);
    }
};

DiscoveredPeer Peer(const std::string& address) {
    DiscoveredPeer p;
    p.address = address;
    return p;
}

} // namespace

TEST_CASE("Application: initialization", "[app]") {
    AppFixture f;

    REQUIRE(f.app->StartService().Is(ErrorCode::NotInitialized));
    REQUIRE(f.app->Initialize().IsOk());
    REQUIRE(std::filesystem::exists(f.dir / "config.json"));
    REQUIRE(f.app->Initialize().Is(ErrorCode::AlreadyInitialized));
    REQUIRE(f.app->app_config().seeds_path == f.dir / SEEDS_FILENAME);
}

TEST_CASE("Application: data directory is single-instance", "[app]") {
    AppFixture f;
    tyr::util::FileLock other_instance((f.dir / ".lock").string());
    REQUIRE(other_instance.TryLock());

    Status st = f.app->Initialize();
    REQUIRE(st.Is(ErrorCode::ResourceBusy));
    REQUIRE(f.app->StartService().Is(ErrorCode::NotInitialized));
}

TEST_CASE("Application: service lifecycle", "[app]") {
    AppFixture f;
    REQUIRE(f.app->Initialize().IsOk());
    auto sub = f.app->SubscribeStatus();

    REQUIRE(f.app->StartService().IsOk());
    REQUIRE(f.app->GetServiceStatus() == ServiceState::Running);
    REQUIRE(f.app->StartService().Is(ErrorCode::AlreadyRunning));
    REQUIRE(f.engine->created == 1);

    REQUIRE(f.app->SoftStopService().IsOk());
    REQUIRE(f.app->GetServiceStatus() == ServiceState::Stopped);
    REQUIRE(f.app->StopService().Is(ErrorCode::NotRunning));

    // Start after a stop reuses the open engine
    REQUIRE(f.app->StartService().IsOk());
    REQUIRE(f.engine->created == 1);
    REQUIRE(f.app->RestartService().IsOk());
    REQUIRE(f.engine->created == 2);
    REQUIRE(f.engine->running == 1);

    auto first = sub.TryNext();
    REQUIRE(first.has_value());
    REQUIRE(first->state == ServiceState::Starting);

    f.app->Shutdown();
    REQUIRE(f.engine->running == 0);
    REQUIRE(f.engine->closes == 2);
    // Idempotent
    f.app->Shutdown();
    REQUIRE(f.engine->closes == 2);
}

TEST_CASE("Application: async lifecycle runs in order", "[app]") {
    AppFixture f;
    REQUIRE(f.app->Initialize().IsOk());

    auto start = f.app->StartServiceAsync();
    auto stop = f.app->StopServiceAsync();
    auto restart = f.app->RestartServiceAsync();

    REQUIRE(start.get().IsOk());
    REQUIRE(stop.get().IsOk());
    REQUIRE(restart.get().IsOk());
    REQUIRE(f.app->GetServiceStatus() == ServiceState::Running);

    f.app->Shutdown();
    auto rejected = f.app->StartServiceAsync();
    REQUIRE(rejected.get().Is(ErrorCode::ResourceBusy));
}

TEST_CASE("Application: discovery results are cached", "[app]") {
    AppFixture f;
    REQUIRE(f.app->Initialize().IsOk());

    auto empty = f.app->GetCachedDiscoveredPeers();
    REQUIRE(empty.peers.empty());
    REQUIRE(empty.timestamp == 0);
    REQUIRE_FALSE(empty.fresh);

    auto result = f.app->FindAvailablePeers(DiscoveryRequest{});
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().total == 3);
    REQUIRE(result.Value().available == 2);

    auto cached = f.app->GetCachedDiscoveredPeers();
    REQUIRE(cached.from_cache);
    REQUIRE(cached.fresh);
    REQUIRE(cached.timestamp > 0);
    REQUIRE(cached.peers.size() == 2);
    REQUIRE(cached.peers[0].address == "tcp://fast.example:7743");
    REQUIRE(cached.peers[1].address == "tls://slow.example:443");

    // A narrower scan replaces the cached set
    DiscoveryRequest japan;
    japan.region = "japan";
    REQUIRE(f.app->FindAvailablePeers(japan).IsOk());
    cached = f.app->GetCachedDiscoveredPeers();
    REQUIRE(cached.peers.size() == 1);
    REQUIRE(cached.peers[0].region == "japan");

    REQUIRE(f.app->ClearCachedDiscoveredPeers().IsOk());
    REQUIRE(f.app->GetCachedDiscoveredPeers().peers.empty());
    REQUIRE(f.app->ClearCachedDiscoveredPeers().IsOk());
}

TEST_CASE("Application: cached peers go stale after a day", "[app]") {
    AppFixture f;
    REQUIRE(f.app->Initialize().IsOk());
    REQUIRE(f.app->FindAvailablePeers(DiscoveryRequest{}).IsOk());

    const int64_t now = tyr::util::GetTime();
    tyr::util::SetMockTime(now + tyr::discovery::DISCOVERY_CACHE_TTL_SECONDS + 1);
    auto cached = f.app->GetCachedDiscoveredPeers();
    tyr::util::SetMockTime(0);

    REQUIRE_FALSE(cached.fresh);
    // Stale entries are still returned
    REQUIRE(cached.peers.size() == 2);
}

TEST_CASE("Application: cancelled scans do not replace the cache", "[app]") {
    AppFixture f;
    for (int i = 0; i < 12; ++i) {
        const std::string uri = "tcp://bulk" + std::to_string(i) + ".example:7743";
        f.seeds->Add(uri);
        f.probe->Script(uri, 100);
    }
    REQUIRE(f.app->Initialize().IsOk());

    std::atomic<int> notifications{0};
    auto pending = f.app->FindAvailablePeersAsync(DiscoveryRequest{}, [&](const auto&) {
        if (++notifications == 2) f.app->CancelPeerDiscovery();
    });
    auto result = pending.get();
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().cancelled);
    REQUIRE(f.app->GetCachedDiscoveredPeers().peers.empty());
}

TEST_CASE("Application: async scan supersedes a running one", "[app]") {
    AppFixture f;
    for (int i = 0; i < 12; ++i) {
        const std::string uri = "tcp://bulk" + std::to_string(i) + ".example:7743";
        f.seeds->Add(uri);
        f.probe->Script(uri, 100);
    }
    REQUIRE(f.app->Initialize().IsOk());

    auto first = f.app->FindAvailablePeersAsync(DiscoveryRequest{});
    // Let the first scan get going
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (f.app->GetDiscoveryProgress().total == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    auto second = f.app->FindAvailablePeersAsync(DiscoveryRequest{});

    auto a = first.get();
    auto b = second.get();
    REQUIRE(a.IsOk());
    REQUIRE(a.Value().cancelled);
    REQUIRE(b.IsOk());
    REQUIRE_FALSE(b.Value().cancelled);
    REQUIRE(b.Value().available == 14);
    REQUIRE(f.app->GetCachedDiscoveredPeers().peers.size() == 14);
}

TEST_CASE("Application: regions and custom peers", "[app]") {
    AppFixture f;
    auto regions = f.app->GetAvailableRegions();
    REQUIRE(regions.IsOk());
    REQUIRE(regions.Value() == std::vector<std::string>{"germany", "japan"});

    auto checked = f.app->CheckCustomPeers({"tcp://fast.example:7743", "bogus"});
    REQUIRE(checked.IsOk());
    REQUIRE(checked.Value().size() == 1);
    REQUIRE(checked.Value()[0].available);
}

TEST_CASE("Application: adding discovered peers", "[app]") {
    AppFixture f;
    REQUIRE(f.app->Initialize().IsOk());
    const size_t before = f.app->config().GetPeers().size();

    auto added = f.app->AddDiscoveredPeers(
        {Peer("tcp://fast.example:7743"), Peer("not a peer"), Peer("tls://slow.example:443")});
    REQUIRE(added.IsOk());
    REQUIRE(added.Value() == 2);
    REQUIRE(f.app->config().GetPeers().size() == before + 2);

    // Persisted
    tyr::config::ConfigStore reread(f.dir.path());
    REQUIRE(reread.Load().IsOk());
    REQUIRE(reread.GetPeers().size() == before + 2);

    auto none = f.app->AddDiscoveredPeers({Peer("garbage")});
    REQUIRE(none.IsOk());
    REQUIRE(none.Value() == 0);
}

TEST_CASE("Application: hot reloads", "[app]") {
    AppFixture f;
    REQUIRE(f.app->Initialize().IsOk());

    SECTION("message size is persisted before the service starts") {
        REQUIRE(f.app->HotReloadMaxMessageSize(0).Is(ErrorCode::InvalidArgument));
        REQUIRE(f.app->HotReloadMaxMessageSize(32).IsOk());
        REQUIRE(f.app->config().Get().service.max_message_size_mb == 32);
        REQUIRE(f.app->StartService().IsOk());
        REQUIRE(f.engine->max_message_size == 32u * 1024 * 1024);
    }

    SECTION("message size reaches the running engine") {
        REQUIRE(f.app->StartService().IsOk());
        REQUIRE(f.app->HotReloadMaxMessageSize(64).IsOk());
        REQUIRE(f.engine->max_message_size == 64u * 1024 * 1024);
    }

    SECTION("peers follow the configuration") {
        REQUIRE(f.app->StartService().IsOk());
        REQUIRE(f.app->config().AddPeer("tcp://fast.example:7743").IsOk());
        REQUIRE(f.app->HotReloadPeers().IsOk());
        REQUIRE(f.engine->add_calls == std::vector<std::string>{"tcp://fast.example:7743"});

        for (const auto& peer : f.app->config().GetPeers()) {
            REQUIRE(f.app->config().DisablePeer(peer.address).IsOk());
        }
        REQUIRE(f.app->HotReloadPeers().Is(ErrorCode::NoPeersEnabled));
        REQUIRE(f.engine->remove_calls.empty());

        auto stats = f.app->GetPeerStats();
        REQUIRE(stats.size() == 2);
        for (const auto& s : stats) {
            REQUIRE_FALSE(s.enabled);
            REQUIRE(s.connected);
        }
    }
}

TEST_CASE("Application: password and storage usage", "[app]") {
    AppFixture f;
    REQUIRE(f.app->UpdatePassword("hunter2").Is(ErrorCode::NotInitialized));
    REQUIRE(f.app->Initialize().IsOk());

    REQUIRE(f.app->StartService().IsOk());
    REQUIRE(f.app->UpdatePassword("hunter2").IsOk());
    REQUIRE(f.engine->passwords.back() == "hunter2");

    auto stats = f.app->GetStorageStats();
    REQUIRE(stats.IsOk());
    const std::filesystem::path storage = f.app->config().Get().service.storage_path;
    REQUIRE(stats.Value().database_bytes == std::filesystem::file_size(storage));
    REQUIRE(stats.Value().files_bytes == 0);
    REQUIRE(stats.Value().total_bytes == stats.Value().database_bytes);
}

TEST_CASE("Application: backups run on the lifecycle thread", "[app]") {
    AppFixture f;
    REQUIRE(f.app->Initialize().IsOk());
    REQUIRE(f.app->StartService().IsOk());

    const auto file = f.dir / "app.tb";
    auto created = f.app->CreateBackupAsync({file, true, "long enough password"}).get();
    REQUIRE(created.IsOk());
    REQUIRE(f.app->GetServiceStatus() == ServiceState::Running);

    REQUIRE(f.app->VerifyBackupPassword(file, "long enough password").IsOk());
    auto info = f.app->GetBackupInfo(file, "long enough password");
    REQUIRE(info.IsOk());
    REQUIRE(info.Value().includes_database);

    REQUIRE(f.app->config().SetTheme("light").IsOk());
    auto restored = f.app->RestoreBackupAsync({file, "long enough password"}).get();
    REQUIRE(restored.IsOk());
    REQUIRE(restored.Value().service_restarted);
    REQUIRE(f.app->config().Get().ui.theme == "system");
    REQUIRE(f.app->GetServiceStatus() == ServiceState::Running);
    REQUIRE(f.app->service_host().generation() == 2);
}

TEST_CASE("Application: a start waits for a backup that paused the service", "[app]") {
    AppFixture f;
    REQUIRE(f.app->Initialize().IsOk());
    REQUIRE(f.app->StartService().IsOk());

    Signal paused;
    Signal release;
    bool is_paused = false;
    bool released = false;
    auto backup = f.app->CreateBackupAsync(
        {f.dir / "held.tb", true, "long enough password"}, [&](tyr::backup::BackupStage stage) {
            if (stage != tyr::backup::BackupStage::ReadingData) return;
            paused.Notify([&] { is_paused = true; });
            release.WaitFor([&] { return released; }, std::chrono::seconds(5));
        });
    REQUIRE(paused.WaitFor([&] { return is_paused; }));
    REQUIRE(f.app->GetServiceStatus() == ServiceState::Stopped);

    std::atomic<bool> start_returned{false};
    Status start_status;
    std::thread starter([&] {
        start_status = f.app->StartService();
        start_returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE_FALSE(start_returned.load());
    REQUIRE(f.app->GetServiceStatus() == ServiceState::Stopped);

    release.Notify([&] { released = true; });
    auto created = backup.get();
    starter.join();

    REQUIRE(created.IsOk());
    REQUIRE(created.Value().includes_database);
    // The backup resumed the service, so the queued start finds it running
    REQUIRE(start_status.Is(ErrorCode::AlreadyRunning));
    REQUIRE(f.app->GetServiceStatus() == ServiceState::Running);
    REQUIRE(f.engine->running == 1);
}

TEST_CASE("Application: shutdown request", "[app]") {
    AppFixture f;
    REQUIRE_FALSE(f.app->ShutdownRequested());
    std::thread requester([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        f.app->RequestShutdown();
    });
    f.app->WaitForShutdown();
    requester.join();
    REQUIRE(f.app->ShutdownRequested());
}
