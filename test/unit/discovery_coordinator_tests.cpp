// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/discovery_coordinator.hpp"
#include "infra/scripted_probe.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

using namespace tyr::discovery;
using tyr::core::ErrorCode;
using tyr::test::ScriptedProbe;
using tyr::test::StaticSeedDirectory;

namespace {

// Thread-safe record of progress snapshots
class ProgressLog {
public:
    ProgressCallback Callback() {
        return [this](const DiscoveryProgress& p) {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshots_.push_back(p);
        };
    }
    std::vector<DiscoveryProgress> Snapshots() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_;
    }
    size_t Count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<DiscoveryProgress> snapshots_;
};

bool WaitFor(const std::function<bool()>& pred, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

void RequireMonotonic(const std::vector<DiscoveryProgress>& snaps) {
    for (size_t i = 1; i < snaps.size(); ++i) {
        REQUIRE(snaps[i].current == snaps[i - 1].current + 1);
        REQUIRE(snaps[i].available_count >= snaps[i - 1].available_count);
        REQUIRE(snaps[i].total == snaps[0].total);
    }
}

} // namespace

TEST_CASE("Discovery: 2 of 5 candidates answer in time", "[discovery][coordinator]") {
    auto seeds = std::make_shared<StaticSeedDirectory>();
    auto probe = std::make_shared<ScriptedProbe>();
    seeds->Add("tcp://slow1.example:7743", "germany");
    seeds->Add("tls://fast2.example:443", "germany");
    seeds->Add("tcp://slow2.example:7743", "japan");
    seeds->Add("tcp://fast1.example:7743", "japan");
    seeds->Add("tls://slow3.example:443", "usa");
    probe->Script("tls://fast2.example:443", 120);
    probe->Script("tcp://fast1.example:7743", 40);
    probe->Script("tcp://slow1.example:7743", 5000);
    probe->Script("tcp://slow2.example:7743", 5000);
    probe->Script("tls://slow3.example:443", 5000);

    DiscoveryCoordinator coordinator(seeds, probe);
    ProgressLog log;
    DiscoveryRequest request;
    request.max_rtt_ms = 2000;

    auto result = coordinator.FindAvailablePeers(request, log.Callback());
    REQUIRE(result.IsOk());
    const DiscoveryResult& r = result.Value();
    REQUIRE(r.total == 5);
    REQUIRE(r.available == 2);
    REQUIRE_FALSE(r.cancelled);
    REQUIRE(r.peers.size() == 2);
    REQUIRE(r.peers[0].address == "tcp://fast1.example:7743");
    REQUIRE(r.peers[0].rtt_ms == 40);
    REQUIRE(r.peers[0].region == "japan");
    REQUIRE(r.peers[1].address == "tls://fast2.example:443");
    REQUIRE(r.peers[1].protocol == Protocol::TLS);
    // All probes ran in parallel: one timeout, not three
    REQUIRE(r.elapsed_ms < 5000);

    auto snaps = log.Snapshots();
    REQUIRE(snaps.size() == 6);
    REQUIRE(snaps.front().current == 0);
    REQUIRE(snaps.front().total == 5);
    REQUIRE(snaps.front().available_count == 0);
    REQUIRE(snaps.back().current == 5);
    REQUIRE(snaps.back().available_count == 2);
    RequireMonotonic(snaps);

    REQUIRE_FALSE(coordinator.IsScanning());
    REQUIRE(coordinator.GetProgress().current == 5);
}

TEST_CASE("Discovery: filters by protocol and region, deduplicates", "[discovery][coordinator]") {
    auto seeds = std::make_shared<StaticSeedDirectory>();
    auto probe = std::make_shared<ScriptedProbe>();
    seeds->Add("tcp://a.example:1", "Germany");
    seeds->Add("tls://b.example:2", "germany");
    seeds->Add("quic://c.example:3", "germany");
    seeds->Add("tcp://d.example:4", "japan");
    seeds->Add("tcp://a.example:1", "germany");
    for (const char* uri : {"tcp://a.example:1", "tls://b.example:2", "quic://c.example:3",
                            "tcp://d.example:4"}) {
        probe->Script(uri, 5);
    }

    DiscoveryCoordinator coordinator(seeds, probe, 4);

    SECTION("protocol filter") {
        DiscoveryRequest request;
        request.protocols = {Protocol::TCP, Protocol::TLS};
        auto r = coordinator.FindAvailablePeers(request);
        REQUIRE(r.IsOk());
        REQUIRE(r.Value().total == 3);
        for (const auto& p : r.Value().peers) {
            REQUIRE(p.protocol != Protocol::QUIC);
        }
    }

    SECTION("region filter is case-insensitive") {
        DiscoveryRequest request;
        request.region = "GERMANY";
        auto r = coordinator.FindAvailablePeers(request);
        REQUIRE(r.IsOk());
        REQUIRE(r.Value().total == 3);
        REQUIRE(r.Value().available == 3);
    }

    SECTION("no filter probes each uri once") {
        auto r = coordinator.FindAvailablePeers(DiscoveryRequest{});
        REQUIRE(r.IsOk());
        REQUIRE(r.Value().total == 4);
        REQUIRE(probe->calls() == 4);
    }

    SECTION("no match returns an empty result immediately") {
        DiscoveryRequest request;
        request.region = "antarctica";
        ProgressLog log;
        auto r = coordinator.FindAvailablePeers(request, log.Callback());
        REQUIRE(r.IsOk());
        REQUIRE(r.Value().total == 0);
        REQUIRE(r.Value().available == 0);
        REQUIRE(r.Value().peers.empty());
        REQUIRE(probe->calls() == 0);
    }
}

TEST_CASE("Discovery: invalid requests and seed failures", "[discovery][coordinator]") {
    auto seeds = std::make_shared<StaticSeedDirectory>();
    auto probe = std::make_shared<ScriptedProbe>();
    DiscoveryCoordinator coordinator(seeds, probe, 2);

    SECTION("negative max rtt") {
        DiscoveryRequest request;
        request.max_rtt_ms = -1;
        auto r = coordinator.FindAvailablePeers(request);
        REQUIRE(r.GetStatus().Is(ErrorCode::InvalidArgument));
    }

    SECTION("seed directory error is propagated") {
        seeds->Fail(tyr::core::Status::Error(ErrorCode::IoError, "no seed list"));
        auto r = coordinator.FindAvailablePeers(DiscoveryRequest{});
        REQUIRE(r.GetStatus().Is(ErrorCode::IoError));
        REQUIRE_FALSE(coordinator.IsScanning());

        auto regions = coordinator.GetAvailableRegions();
        REQUIRE(regions.GetStatus().Is(ErrorCode::IoError));
    }

    SECTION("unreachable peers are counted, never reported") {
        seeds->Add("tcp://down.example:1");
        auto r = coordinator.FindAvailablePeers(DiscoveryRequest{});
        REQUIRE(r.IsOk());
        REQUIRE(r.Value().total == 1);
        REQUIRE(r.Value().available == 0);
        REQUIRE(r.Value().peers.empty());
    }
}

TEST_CASE("Discovery: concurrency is bounded", "[discovery][coordinator]") {
    auto seeds = std::make_shared<StaticSeedDirectory>();
    auto probe = std::make_shared<ScriptedProbe>();
    for (int i = 0; i < 24; ++i) {
        const std::string uri = "tcp://peer" + std::to_string(i) + ".example:7743";
        seeds->Add(uri);
        probe->Script(uri, 20);
    }

    DiscoveryCoordinator coordinator(seeds, probe, 4);
    REQUIRE(coordinator.concurrency() == 4);
    auto r = coordinator.FindAvailablePeers(DiscoveryRequest{});
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().available == 24);
    REQUIRE(probe->max_in_flight() <= 4);
    REQUIRE(probe->max_in_flight() >= 2);
}

TEST_CASE("Discovery: cancel stops progress notifications", "[discovery][coordinator]") {
    auto seeds = std::make_shared<StaticSeedDirectory>();
    auto probe = std::make_shared<ScriptedProbe>();
    for (int i = 0; i < 10; ++i) {
        const std::string uri = "tcp://peer" + std::to_string(i) + ".example:7743";
        seeds->Add(uri);
        probe->Script(uri, 200);
    }

    DiscoveryCoordinator coordinator(seeds, probe, 2);
    ProgressLog log;
    tyr::core::Result<DiscoveryResult> result = tyr::core::Status::Error(ErrorCode::Cancelled, "not run");

    std::thread scan([&] { result = coordinator.FindAvailablePeers(DiscoveryRequest{}, log.Callback()); });

    REQUIRE(WaitFor([&] { return log.Count() >= 2; }, std::chrono::seconds(5)));
    REQUIRE(coordinator.IsScanning());
    coordinator.Cancel();
    const size_t at_cancel = log.Count();
    REQUIRE_FALSE(coordinator.IsScanning());

    scan.join();
    REQUIRE(log.Count() == at_cancel);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().cancelled);
    REQUIRE(result.Value().total == 10);
    // Workers stop picking up candidates once cancelled
    REQUIRE(probe->calls() < 10);
    RequireMonotonic(log.Snapshots());
}

TEST_CASE("Discovery: a second scan supersedes the first", "[discovery][coordinator]") {
    auto seeds = std::make_shared<StaticSeedDirectory>();
    auto probe = std::make_shared<ScriptedProbe>();
    for (int i = 0; i < 8; ++i) {
        const std::string uri = "tcp://peer" + std::to_string(i) + ".example:7743";
        seeds->Add(uri);
        probe->Script(uri, 150);
    }

    DiscoveryCoordinator coordinator(seeds, probe, 2);
    ProgressLog first_log;
    tyr::core::Result<DiscoveryResult> first = tyr::core::Status::Error(ErrorCode::Cancelled, "not run");
    std::thread scan([&] { first = coordinator.FindAvailablePeers(DiscoveryRequest{}, first_log.Callback()); });

    REQUIRE(WaitFor([&] { return first_log.Count() >= 2; }, std::chrono::seconds(5)));

    // The second scan's first notification is delivered after the first scan
    // has been cancelled; nothing from the first scan may follow it
    std::optional<size_t> first_count_when_second_began;
    ProgressLog second_log;
    auto second = coordinator.FindAvailablePeers(DiscoveryRequest{}, [&](const DiscoveryProgress& p) {
        if (!first_count_when_second_began) first_count_when_second_began = first_log.Count();
        second_log.Callback()(p);
    });
    scan.join();

    REQUIRE(first.IsOk());
    REQUIRE(first.Value().cancelled);
    REQUIRE(first_count_when_second_began.has_value());
    REQUIRE(first_log.Count() == *first_count_when_second_began);

    REQUIRE(second.IsOk());
    REQUIRE_FALSE(second.Value().cancelled);
    REQUIRE(second.Value().available == 8);
    REQUIRE(second_log.Snapshots().back().current == 8);
}

TEST_CASE("Discovery: custom peer check", "[discovery][coordinator]") {
    auto seeds = std::make_shared<StaticSeedDirectory>();
    auto probe = std::make_shared<ScriptedProbe>();
    probe->Script("tcp://up.example:7743", 30);
    probe->Script("tls://slow.example:443", 5000);
    DiscoveryCoordinator coordinator(seeds, probe, 4);

    SECTION("every valid uri is reported in input order") {
        auto r = coordinator.CheckCustomPeers(
            {"tls://slow.example:443", "not a uri", " tcp://up.example:7743 ", "tcp://down.example:1"},
            std::chrono::milliseconds(300));
        REQUIRE(r.IsOk());
        const auto& peers = r.Value();
        REQUIRE(peers.size() == 3);
        REQUIRE(peers[0].address == "tls://slow.example:443");
        REQUIRE_FALSE(peers[0].available);
        REQUIRE(peers[1].address == "tcp://up.example:7743");
        REQUIRE(peers[1].available);
        REQUIRE(peers[1].rtt_ms == 30);
        REQUIRE(peers[2].address == "tcp://down.example:1");
        REQUIRE_FALSE(peers[2].available);
        REQUIRE(peers[2].rtt_ms == 0);
    }

    SECTION("no valid uri") {
        auto r = coordinator.CheckCustomPeers({"", "socks://p:1/h:2"});
        REQUIRE(r.GetStatus().Is(ErrorCode::InvalidArgument));
        REQUIRE(probe->calls() == 0);
    }
}

TEST_CASE("Discovery: available regions", "[discovery][coordinator]") {
    auto seeds = std::make_shared<StaticSeedDirectory>();
    seeds->Add("tcp://a.example:1", "japan");
    seeds->Add("tcp://b.example:1", "germany");
    seeds->Add("tcp://c.example:1", "japan");
    seeds->Add("tcp://d.example:1");
    DiscoveryCoordinator coordinator(seeds, std::make_shared<ScriptedProbe>(), 2);

    auto regions = coordinator.GetAvailableRegions();
    REQUIRE(regions.IsOk());
    REQUIRE(regions.Value() == std::vector<std::string>{"germany", "japan"});
}
