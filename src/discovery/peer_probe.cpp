// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/peer_probe.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <array>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace tyr {
namespace discovery {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;
using udp = boost::asio::ip::udp;
using core::ErrorCode;

namespace {

// RFC 9000 section 14.1: Initial datagrams are padded to at least 1200 bytes
constexpr size_t QUIC_INITIAL_SIZE = 1200;
// Reserved versions follow the 0x?a?a?a?a pattern and force negotiation
constexpr uint32_t QUIC_RESERVED_VERSION = 0x1a2a3a4a;
constexpr size_t MAX_UPGRADE_RESPONSE = 8192;

std::vector<uint8_t> RandomBytes(size_t n) {
  std::vector<uint8_t> out(n);
  if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
    // Probe identifiers need no cryptographic strength
    for (size_t i = 0; i < n; ++i) out[i] = static_cast<uint8_t>(i * 131 + 7);
  }
  return out;
}

std::string WebSocketKey() {
  auto raw = RandomBytes(16);
  std::array<unsigned char, 32> encoded{};
  int len = EVP_EncodeBlock(encoded.data(), raw.data(), static_cast<int>(raw.size()));
  return std::string(reinterpret_cast<const char *>(encoded.data()), static_cast<size_t>(len));
}

std::vector<uint8_t> BuildQuicProbe() {
  std::vector<uint8_t> pkt;
  pkt.reserve(QUIC_INITIAL_SIZE);
  pkt.push_back(0xC0);  // long header, fixed bit, type Initial
  pkt.push_back(static_cast<uint8_t>(QUIC_RESERVED_VERSION >> 24));
  pkt.push_back(static_cast<uint8_t>(QUIC_RESERVED_VERSION >> 16));
  pkt.push_back(static_cast<uint8_t>(QUIC_RESERVED_VERSION >> 8));
  pkt.push_back(static_cast<uint8_t>(QUIC_RESERVED_VERSION));
  auto dcid = RandomBytes(8);
  pkt.push_back(static_cast<uint8_t>(dcid.size()));
  pkt.insert(pkt.end(), dcid.begin(), dcid.end());
  auto scid = RandomBytes(8);
  pkt.push_back(static_cast<uint8_t>(scid.size()));
  pkt.insert(pkt.end(), scid.begin(), scid.end());
  pkt.resize(QUIC_INITIAL_SIZE, 0);
  return pkt;
}

// Version Negotiation: long header bit set, version field zero
bool IsVersionNegotiation(const uint8_t *data, size_t len) {
  return len >= 7 && (data[0] & 0x80) != 0 && data[1] == 0 && data[2] == 0 &&
         data[3] == 0 && data[4] == 0;
}

/**
 * One probe, driven to completion on a private io_context by the calling
 * thread. Every completion handler checks done_ first; Finish() cancels
 * all outstanding operations so io_.run() drains promptly.
 */
class ProbeSession {
public:
  ProbeSession(const PeerUri &uri, std::chrono::milliseconds timeout, ssl::context &tls_context)
      : uri_(uri), timeout_(timeout), deadline_(io_), resolver_(io_), udp_resolver_(io_),
        tls_stream_(io_, tls_context), udp_(io_) {}

  ProbeResult Run() {
    deadline_.expires_after(timeout_);
    deadline_.async_wait([this](const boost::system::error_code &ec) {
      if (!ec) {
        Finish(false, ErrorCode::Timeout, "no handshake within " +
                                              std::to_string(timeout_.count()) + " ms");
      }
    });

    if (uri_.protocol == Protocol::QUIC) {
      udp_resolver_.async_resolve(
          uri_.host, std::to_string(uri_.port),
          [this](const boost::system::error_code &ec, udp::resolver::results_type results) {
            if (done_) return;
            if (ec || results.empty()) {
              Finish(false, ErrorCode::NetworkUnreachable, "resolve failed: " + ec.message());
              return;
            }
            StartQuic(results.begin()->endpoint());
          });
    } else {
      resolver_.async_resolve(
          uri_.host, std::to_string(uri_.port),
          [this](const boost::system::error_code &ec, tcp::resolver::results_type results) {
            if (done_) return;
            if (ec) {
              Finish(false, ErrorCode::NetworkUnreachable, "resolve failed: " + ec.message());
              return;
            }
            StartConnect(results);
          });
    }

    io_.run();
    return result_;
  }

private:
  void StartConnect(const tcp::resolver::results_type &results) {
    start_ = std::chrono::steady_clock::now();
    asio::async_connect(tls_stream_.lowest_layer(), results,
                        [this](const boost::system::error_code &ec, const tcp::endpoint &) {
                          if (done_) return;
                          if (ec) {
                            Finish(false, ErrorCode::NetworkUnreachable,
                                   "connect failed: " + ec.message());
                            return;
                          }
                          OnConnected();
                        });
  }

  void OnConnected() {
    switch (uri_.protocol) {
    case Protocol::TCP:
      Finish(true, ErrorCode::OK, {});
      return;
    case Protocol::WS:
      SendUpgrade(tls_stream_.next_layer());
      return;
    case Protocol::TLS:
    case Protocol::WSS:
      StartTlsHandshake();
      return;
    case Protocol::QUIC:
      break;
    }
    Finish(false, ErrorCode::NetworkUnreachable, "unexpected protocol");
  }

  void StartTlsHandshake() {
    if (!uri_.is_ipv6_literal()) {
      // SNI; overlay peers commonly sit behind virtual hosts
      SSL_set_tlsext_host_name(tls_stream_.native_handle(), uri_.host.c_str());
    }
    tls_stream_.async_handshake(ssl::stream_base::client,
                                [this](const boost::system::error_code &ec) {
                                  if (done_) return;
                                  if (ec) {
                                    Finish(false, ErrorCode::NetworkUnreachable,
                                           "tls handshake failed: " + ec.message());
                                    return;
                                  }
                                  if (uri_.protocol == Protocol::WSS) {
                                    SendUpgrade(tls_stream_);
                                  } else {
                                    Finish(true, ErrorCode::OK, {});
                                  }
                                });
  }

  template <typename Stream> void SendUpgrade(Stream &stream) {
    std::string host = uri_.is_ipv6_literal() ? "[" + uri_.host + "]" : uri_.host;
    request_ = "GET " + uri_.path + " HTTP/1.1\r\n"
               "Host: " + host + ":" + std::to_string(uri_.port) + "\r\n"
               "Upgrade: websocket\r\n"
               "Connection: Upgrade\r\n"
               "Sec-WebSocket-Key: " + WebSocketKey() + "\r\n"
               "Sec-WebSocket-Version: 13\r\n"
               "User-Agent: " + GetUserAgent() + "\r\n\r\n";

    asio::async_write(stream, asio::buffer(request_),
                      [this, &stream](const boost::system::error_code &ec, size_t) {
                        if (done_) return;
                        if (ec) {
                          Finish(false, ErrorCode::NetworkUnreachable,
                                 "upgrade write failed: " + ec.message());
                          return;
                        }
                        asio::async_read_until(
                            stream, response_, "\r\n\r\n",
                            [this](const boost::system::error_code &ec2, size_t) {
                              if (done_) return;
                              if (ec2) {
                                Finish(false, ErrorCode::NetworkUnreachable,
                                       "upgrade read failed: " + ec2.message());
                                return;
                              }
                              CheckUpgradeResponse();
                            });
                      });
  }

  void CheckUpgradeResponse() {
    std::istream in(&response_);
    std::string version;
    int status = 0;
    in >> version >> status;
    if (version.rfind("HTTP/1.", 0) == 0 && status == 101) {
      Finish(true, ErrorCode::OK, {});
    } else {
      Finish(false, ErrorCode::NetworkUnreachable,
             "upgrade rejected with status " + std::to_string(status));
    }
  }

  void StartQuic(const udp::endpoint &endpoint) {
    boost::system::error_code ec;
    udp_.open(endpoint.protocol(), ec);
    if (ec) {
      Finish(false, ErrorCode::NetworkUnreachable, "udp open failed: " + ec.message());
      return;
    }
    quic_packet_ = BuildQuicProbe();
    start_ = std::chrono::steady_clock::now();
    udp_.async_send_to(asio::buffer(quic_packet_), endpoint,
                       [this](const boost::system::error_code &ec2, size_t) {
                         if (done_) return;
                         if (ec2) {
                           Finish(false, ErrorCode::NetworkUnreachable,
                                  "udp send failed: " + ec2.message());
                           return;
                         }
                         ReceiveQuic();
                       });
  }

  void ReceiveQuic() {
    udp_.async_receive_from(
        asio::buffer(datagram_), sender_,
        [this](const boost::system::error_code &ec, size_t len) {
          if (done_) return;
          if (ec) {
            Finish(false, ErrorCode::NetworkUnreachable, "udp receive failed: " + ec.message());
            return;
          }
          if (IsVersionNegotiation(datagram_.data(), len)) {
            Finish(true, ErrorCode::OK, {});
          } else {
            ReceiveQuic();  // stray datagram; keep waiting until the deadline
          }
        });
  }

  void Finish(bool success, ErrorCode error, std::string detail) {
    if (done_) return;
    done_ = true;
    result_.success = success;
    result_.error = error;
    result_.detail = std::move(detail);
    if (success) {
      result_.rtt_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start_)
                           .count();
    }

    boost::system::error_code ignored;
    deadline_.cancel();
    resolver_.cancel();
    udp_resolver_.cancel();
    tls_stream_.lowest_layer().cancel(ignored);
    tls_stream_.lowest_layer().close(ignored);
    udp_.cancel(ignored);
    udp_.close(ignored);
  }

  const PeerUri uri_;
  const std::chrono::milliseconds timeout_;

  asio::io_context io_;
  asio::steady_timer deadline_;
  tcp::resolver resolver_;
  udp::resolver udp_resolver_;
  ssl::stream<tcp::socket> tls_stream_;  // plain tcp/ws use its next_layer()
  udp::socket udp_;

  std::string request_;
  asio::streambuf response_{MAX_UPGRADE_RESPONSE};
  std::vector<uint8_t> quic_packet_;
  std::array<uint8_t, 1500> datagram_{};
  udp::endpoint sender_;

  std::chrono::steady_clock::time_point start_{std::chrono::steady_clock::now()};
  bool done_{false};
  ProbeResult result_;
};

} // namespace

AsioPeerProbe::AsioPeerProbe()
    : tls_context_(std::make_unique<ssl::context>(ssl::context::tls_client)) {
  // Overlay peers authenticate each other above TLS; certificates are
  // self-signed, so only the handshake itself is checked here
  tls_context_->set_verify_mode(ssl::verify_none);
}

AsioPeerProbe::~AsioPeerProbe() = default;

ProbeResult AsioPeerProbe::Probe(const CandidatePeer &peer, std::chrono::milliseconds timeout) {
  auto uri = ParsePeerUri(peer.uri);
  if (!uri) {
    ProbeResult result;
    result.error = ErrorCode::NetworkUnreachable;
    result.detail = "unparseable uri";
    return result;
  }

  try {
    ProbeSession session(*uri, timeout, *tls_context_);
    auto result = session.Run();
    LOG_DISC_TRACE("probe {} -> {} ({} ms) {}", peer.uri, result.success ? "ok" : "fail",
                   result.rtt_ms, result.detail);
    return result;
  } catch (const boost::system::system_error &e) {
    ProbeResult result;
    result.error = ErrorCode::NetworkUnreachable;
    result.detail = e.what();
    return result;
  }
}

} // namespace discovery
} // namespace tyr
