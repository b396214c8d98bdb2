// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility> // std::exchange, needed by Boost 1.74 asio/awaitable.hpp
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <memory>
#include <queue>
#include <thread>
#include <vector>

namespace tyr {
namespace network {

constexpr size_t DEFAULT_SEND_QUEUE_BYTES = 5 * 1000 * 1000;
constexpr std::chrono::milliseconds DEFAULT_CONNECT_TIMEOUT{std::chrono::seconds(10)};
constexpr std::chrono::milliseconds DEFAULT_GRACEFUL_CLOSE_TIMEOUT{std::chrono::seconds(2)};

/**
 * AsioLink - TCP or TLS-over-TCP implementation of Link
 *
 * The stream is always an ssl::stream; plain links do all I/O on its
 * next_layer(). Every member past construction is touched only on strand_.
 */
class AsioLink : public Link, public std::enable_shared_from_this<AsioLink> {
public:
  using Stream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

  static std::shared_ptr<AsioLink> create_outbound(boost::asio::io_context &io_context,
                                                   boost::asio::ssl::context &tls_context,
                                                   const LinkTarget &target,
                                                   std::chrono::milliseconds connect_timeout,
                                                   ConnectCallback callback);

  static std::shared_ptr<AsioLink> create_inbound(boost::asio::io_context &io_context,
                                                  boost::asio::ssl::context &tls_context,
                                                  boost::asio::ip::tcp::socket socket);

  ~AsioLink() override = default;

  AsioLink(const AsioLink &) = delete;
  AsioLink &operator=(const AsioLink &) = delete;

  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  void close_gracefully() override;
  bool is_open() const override { return open_; }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  bool is_inbound() const override { return is_inbound_; }
  bool is_tls() const override { return tls_; }
  uint64_t link_id() const override { return id_; }
  uint64_t rx_bytes() const override { return rx_bytes_.load(std::memory_order_relaxed); }
  uint64_t tx_bytes() const override { return tx_bytes_.load(std::memory_order_relaxed); }
  std::chrono::milliseconds handshake_time() const override {
    return std::chrono::milliseconds(handshake_ms_.load(std::memory_order_relaxed));
  }
  std::chrono::steady_clock::time_point connected_at() const override;
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

  void set_send_queue_limit(size_t bytes) { send_queue_limit_ = bytes; }

private:
  AsioLink(boost::asio::io_context &io_context, boost::asio::ssl::context &tls_context,
           bool is_inbound, bool tls);

  void do_connect(const LinkTarget &target, std::chrono::milliseconds timeout,
                  ConnectCallback callback);
  void on_tcp_connected(const ConnectCallback &callback);
  void finish_connect(bool success, const std::string &error, const ConnectCallback &callback);

  // Strand-only internals
  void start_read_impl();
  void do_write_impl();
  void close_impl();
  void deliver_disconnect_once(const std::string &reason);

  template <typename Buffers, typename Handler> void async_read_some(const Buffers &b, Handler h) {
    if (tls_)
      stream_.async_read_some(b, std::move(h));
    else
      stream_.next_layer().async_read_some(b, std::move(h));
  }

  template <typename Buffers, typename Handler> void async_write_all(const Buffers &b, Handler h) {
    if (tls_)
      boost::asio::async_write(stream_, b, std::move(h));
    else
      boost::asio::async_write(stream_.next_layer(), b, std::move(h));
  }

  boost::asio::io_context &io_context_;
  Stream stream_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  const bool is_inbound_;
  const bool tls_;
  const uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_{0};
  size_t send_queue_limit_{DEFAULT_SEND_QUEUE_BYTES};
  bool writing_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 64 * 1024;

  // Timers are destroyed in close_impl() while the io_context is still alive
  std::unique_ptr<boost::asio::steady_timer> connect_timer_;
  std::unique_ptr<boost::asio::steady_timer> close_timer_;
  std::shared_ptr<boost::asio::ip::tcp::resolver> resolver_;
  bool connect_done_{false};
  std::chrono::steady_clock::time_point connect_started_;

  std::atomic<bool> open_{false};
  std::atomic<bool> closing_{false};
  std::atomic<uint64_t> rx_bytes_{0};
  std::atomic<uint64_t> tx_bytes_{0};
  std::atomic<int64_t> handshake_ms_{0};
  std::atomic<int64_t> connected_at_ns_{0};
  std::string remote_addr_;
  uint16_t remote_port_{0};
};

/**
 * AsioLinkTransport - boost::asio implementation of LinkTransport
 *
 * Owns the io_context, its worker threads, the inbound acceptor and the
 * client TLS context shared by all outbound TLS links.
 */
class AsioLinkTransport : public LinkTransport {
public:
  explicit AsioLinkTransport(size_t io_threads = 1,
                             std::chrono::milliseconds connect_timeout = DEFAULT_CONNECT_TIMEOUT);
  ~AsioLinkTransport() override;

  LinkPtr connect(const LinkTarget &target, ConnectCallback callback) override;
  bool listen(uint16_t port, std::function<void(LinkPtr)> accept_callback) override;
  void stop_listening() override;
  uint16_t listening_port() const override { return last_listen_port_; }
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  // For timers owned by the engine
  boost::asio::io_context &io_context() { return *io_context_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket);

  // Outlives every link; destroyed only with the transport
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};
  const size_t desired_io_threads_;
  const std::chrono::milliseconds connect_timeout_;

  boost::asio::ssl::context tls_context_;

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::function<void(LinkPtr)> accept_callback_;
  uint16_t last_listen_port_{0};
};

} // namespace network
} // namespace tyr
