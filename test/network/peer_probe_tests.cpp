// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/peer_probe.hpp"
#include "discovery/peer_uri.hpp"
#include <boost/asio.hpp>
#include <array>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

using namespace tyr::discovery;
using tyr::core::ErrorCode;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using udp = asio::ip::udp;

namespace {

// Blocking loopback TCP server that hands its first connection to a handler
class OneShotTcpServer {
public:
    explicit OneShotTcpServer(std::function<void(tcp::socket&)> handler)
        : acceptor_(io_, tcp::endpoint(asio::ip::address_v4::loopback(), 0)) {
        thread_ = std::thread([this, handler = std::move(handler)] {
            boost::system::error_code ec;
            tcp::socket socket(io_);
            acceptor_.accept(socket, ec);
            if (!ec) handler(socket);
        });
    }

    ~OneShotTcpServer() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (thread_.joinable()) thread_.join();
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

private:
    asio::io_context io_;
    tcp::acceptor acceptor_;
    std::thread thread_;
};

// Read an HTTP request head and answer with the given status line
std::function<void(tcp::socket&)> UpgradeResponder(const std::string& status_line) {
    return [status_line](tcp::socket& socket) {
        boost::system::error_code ec;
        asio::streambuf buf;
        asio::read_until(socket, buf, "\r\n\r\n", ec);
        if (ec) return;
        const std::string response = status_line + "\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n\r\n";
        asio::write(socket, asio::buffer(response), ec);
        // Hold the connection until the prober hangs up
        char c;
        socket.read_some(asio::buffer(&c, 1), ec);
    };
}

CandidatePeer Candidate(const std::string& uri) {
    CandidatePeer c;
    c.uri = uri;
    auto parsed = ParsePeerUri(uri);
    if (parsed) c.protocol = parsed->protocol;
    return c;
}

} // namespace

TEST_CASE("AsioPeerProbe: tcp handshake", "[discovery][probe]") {
    AsioPeerProbe probe;

    SECTION("listening peer") {
        OneShotTcpServer server([](tcp::socket& socket) {
            boost::system::error_code ec;
            char c;
            socket.read_some(asio::buffer(&c, 1), ec);
        });
        auto r = probe.Probe(Candidate("tcp://127.0.0.1:" + std::to_string(server.port())),
                             std::chrono::milliseconds(2000));
        CHECK(r.success);
        CHECK(r.error == ErrorCode::OK);
        CHECK(r.rtt_ms >= 0);
        CHECK(r.rtt_ms < 2000);
    }

    SECTION("closed port") {
        uint16_t port = 0;
        {
            asio::io_context io;
            tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::address_v4::loopback(), 0));
            port = acceptor.local_endpoint().port();
        }
        auto r = probe.Probe(Candidate("tcp://127.0.0.1:" + std::to_string(port)),
                             std::chrono::milliseconds(2000));
        CHECK_FALSE(r.success);
        CHECK(r.error == ErrorCode::NetworkUnreachable);
        CHECK(r.detail.rfind("connect failed", 0) == 0);
    }

    SECTION("unparseable uri") {
        auto r = probe.Probe(Candidate("not a peer uri"), std::chrono::milliseconds(100));
        CHECK_FALSE(r.success);
        CHECK(r.error == ErrorCode::NetworkUnreachable);
    }
}

TEST_CASE("AsioPeerProbe: stalled tls handshake times out", "[discovery][probe]") {
    AsioPeerProbe probe;
    // Accepts, then never speaks TLS
    OneShotTcpServer server([](tcp::socket& socket) {
        boost::system::error_code ec;
        std::array<char, 512> buf;
        while (!ec) socket.read_some(asio::buffer(buf), ec);
    });

    const auto start = std::chrono::steady_clock::now();
    auto r = probe.Probe(Candidate("tls://127.0.0.1:" + std::to_string(server.port())),
                         std::chrono::milliseconds(300));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK_FALSE(r.success);
    CHECK(r.error == ErrorCode::Timeout);
    CHECK(elapsed < std::chrono::seconds(2));
}

TEST_CASE("AsioPeerProbe: websocket upgrade", "[discovery][probe]") {
    AsioPeerProbe probe;

    SECTION("101 is reachable") {
        OneShotTcpServer server(UpgradeResponder("HTTP/1.1 101 Switching Protocols"));
        auto r = probe.Probe(Candidate("ws://127.0.0.1:" + std::to_string(server.port()) + "/overlay"),
                             std::chrono::milliseconds(2000));
        CHECK(r.success);
    }

    SECTION("anything else is not") {
        OneShotTcpServer server(UpgradeResponder("HTTP/1.1 404 Not Found"));
        auto r = probe.Probe(Candidate("ws://127.0.0.1:" + std::to_string(server.port())),
                             std::chrono::milliseconds(2000));
        CHECK_FALSE(r.success);
        CHECK(r.detail == "upgrade rejected with status 404");
    }
}

TEST_CASE("AsioPeerProbe: quic version negotiation", "[discovery][probe]") {
    AsioPeerProbe probe;
    asio::io_context io;
    udp::socket server(io, udp::endpoint(asio::ip::address_v4::loopback(), 0));
    const uint16_t port = server.local_endpoint().port();

    SECTION("answered") {
        std::thread responder([&] {
            std::array<uint8_t, 1500> buf;
            udp::endpoint from;
            boost::system::error_code ec;
            const size_t n = server.receive_from(asio::buffer(buf), from, 0, ec);
            if (ec || n < 7) return;
            // Long header, version 0, echo of the connection ids
            std::vector<uint8_t> vn = {0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01};
            server.send_to(asio::buffer(vn), from, 0, ec);
        });
        auto r = probe.Probe(Candidate("quic://127.0.0.1:" + std::to_string(port)),
                             std::chrono::milliseconds(2000));
        responder.join();
        CHECK(r.success);
    }

    SECTION("silent") {
        auto r = probe.Probe(Candidate("quic://127.0.0.1:" + std::to_string(port)),
                             std::chrono::milliseconds(200));
        CHECK_FALSE(r.success);
        CHECK(r.error == ErrorCode::Timeout);
    }
}
