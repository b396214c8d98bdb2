// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/seed_directory.hpp"
#include "infra/temp_dir.hpp"
#include "util/files.hpp"
#include <algorithm>

using namespace tyr::discovery;
using tyr::core::ErrorCode;
using tyr::test::TempDir;
using json = nlohmann::json;

namespace {

json SampleDocument() {
    return json::parse(R"({
        "germany.md": {
            "tcp://de1.example.net:7743": {"up": true, "response_ms": 35},
            "tls://de2.example.net:443":  {"up": true},
            "tcp://de3.example.net:7743": {"up": false, "response_ms": 12}
        },
        "japan.md": {
            "quic://jp1.example.net:9001":     {"up": true, "response_ms": 210},
            "socks://proxy.jp:1080/x.jp:7743": {"up": true},
            "wss://jp2.example.net:443/ygg":   {"up": true}
        },
        "notes": "not a region"
    })");
}

const CandidatePeer* Find(const std::vector<CandidatePeer>& peers, const std::string& uri) {
    auto it = std::find_if(peers.begin(), peers.end(),
                           [&](const CandidatePeer& c) { return c.uri == uri; });
    return it == peers.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("ParseSeedDocument keeps reachable, probeable peers", "[discovery][seeds]") {
    auto peers = ParseSeedDocument(SampleDocument());

    // de3 is down, the socks entry cannot be probed, "notes" is not a region
    REQUIRE(peers.size() == 4);

    const CandidatePeer* de1 = Find(peers, "tcp://de1.example.net:7743");
    REQUIRE(de1 != nullptr);
    REQUIRE(de1->protocol == Protocol::TCP);
    REQUIRE(de1->region == "germany");
    REQUIRE(de1->response_ms == 35);

    const CandidatePeer* de2 = Find(peers, "tls://de2.example.net:443");
    REQUIRE(de2 != nullptr);
    REQUIRE(de2->response_ms == 0);

    const CandidatePeer* jp2 = Find(peers, "wss://jp2.example.net:443/ygg");
    REQUIRE(jp2 != nullptr);
    REQUIRE(jp2->protocol == Protocol::WSS);
    REQUIRE(jp2->region == "japan");

    REQUIRE(Find(peers, "tcp://de3.example.net:7743") == nullptr);
}

TEST_CASE("ParseSeedDocument tolerates unexpected shapes", "[discovery][seeds]") {
    REQUIRE(ParseSeedDocument(json::array()).empty());
    REQUIRE(ParseSeedDocument(json("text")).empty());
    REQUIRE(ParseSeedDocument(json::parse(R"({"x.md": {"tcp://a:1": "up"}})")).empty());
}

TEST_CASE("JsonSeedDirectory reads the document from disk", "[discovery][seeds]") {
    TempDir dir("seeds");
    const auto path = dir / "public_peers.json";

    SECTION("missing file is an IoError") {
        JsonSeedDirectory seeds(path);
        auto r = seeds.LoadCandidates();
        REQUIRE_FALSE(r.IsOk());
        REQUIRE(r.GetStatus().Is(ErrorCode::IoError));
    }

    SECTION("malformed file is an InvalidArgument") {
        REQUIRE(tyr::util::atomic_write_file(path, std::string("{\"germany.md\": ")));
        JsonSeedDirectory seeds(path);
        auto r = seeds.LoadCandidates();
        REQUIRE(r.GetStatus().Is(ErrorCode::InvalidArgument));
    }

    SECTION("re-read on every call") {
        REQUIRE(tyr::util::atomic_write_file(path, SampleDocument().dump()));
        JsonSeedDirectory seeds(path);
        auto first = seeds.LoadCandidates();
        REQUIRE(first.IsOk());
        REQUIRE(first.Value().size() == 4);

        REQUIRE(tyr::util::atomic_write_file(
            path, std::string(R"({"a.md": {"tcp://only.example:1": {"up": true}}})")));
        auto second = seeds.LoadCandidates();
        REQUIRE(second.IsOk());
        REQUIRE(second.Value().size() == 1);
        REQUIRE(second.Value()[0].region == "a");
    }
}
