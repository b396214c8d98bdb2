// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/real_transport.hpp"
#include "util/logging.hpp"

namespace tyr {
namespace network {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

// ============================================================================
// AsioLink
// ============================================================================

std::atomic<uint64_t> AsioLink::next_id_{1};

namespace {

void apply_socket_options(tcp::socket &socket) {
  boost::system::error_code ec;
  socket.set_option(tcp::no_delay(true), ec);
  socket.set_option(asio::socket_base::keep_alive(true), ec);
}

bool is_ip_literal(const std::string &host) {
  boost::system::error_code ec;
  asio::ip::make_address(host, ec);
  return !ec;
}

} // namespace

AsioLink::AsioLink(asio::io_context &io_context, ssl::context &tls_context, bool is_inbound,
                   bool tls)
    : io_context_(io_context),
      stream_(io_context, tls_context),
      strand_(io_context.get_executor()),
      is_inbound_(is_inbound),
      tls_(tls),
      id_(next_id_++),
      connect_timer_(std::make_unique<asio::steady_timer>(io_context)),
      close_timer_(std::make_unique<asio::steady_timer>(io_context)) {}

std::shared_ptr<AsioLink> AsioLink::create_outbound(asio::io_context &io_context,
                                                    ssl::context &tls_context,
                                                    const LinkTarget &target,
                                                    std::chrono::milliseconds connect_timeout,
                                                    ConnectCallback callback) {
  auto link = std::shared_ptr<AsioLink>(new AsioLink(io_context, tls_context, false, target.tls));
  // Defer onto the strand so shared_from_this() is valid
  asio::post(link->strand_, [link, target, connect_timeout, callback]() mutable {
    link->do_connect(target, connect_timeout, std::move(callback));
  });
  return link;
}

std::shared_ptr<AsioLink> AsioLink::create_inbound(asio::io_context &io_context,
                                                   ssl::context &tls_context,
                                                   tcp::socket socket) {
  auto link = std::shared_ptr<AsioLink>(new AsioLink(io_context, tls_context, true, false));
  link->stream_.next_layer() = std::move(socket);
  link->open_ = true;
  link->connected_at_ns_ = std::chrono::steady_clock::now().time_since_epoch().count();

  boost::system::error_code ec;
  auto ep = link->stream_.next_layer().remote_endpoint(ec);
  if (!ec) {
    link->remote_addr_ = ep.address().to_string();
    link->remote_port_ = ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }
  return link;
}

std::chrono::steady_clock::time_point AsioLink::connected_at() const {
  return std::chrono::steady_clock::time_point(
      std::chrono::steady_clock::duration(connected_at_ns_.load(std::memory_order_relaxed)));
}

void AsioLink::finish_connect(bool success, const std::string &error,
                              const ConnectCallback &callback) {
  connect_done_ = true;
  if (connect_timer_) connect_timer_->cancel();
  if (!success) {
    boost::system::error_code ignored;
    stream_.next_layer().close(ignored);
  }
  if (!callback) return;
  try {
    callback(success, error);
  } catch (const std::exception &e) {
    LOG_NET_TRACE("exception in connect callback for {}: {}", remote_addr_, e.what());
  }
}

void AsioLink::do_connect(const LinkTarget &target, std::chrono::milliseconds timeout,
                          ConnectCallback callback) {
  remote_addr_ = target.host;
  remote_port_ = target.port;
  connect_started_ = std::chrono::steady_clock::now();

  if (timeout.count() > 0 && connect_timer_) {
    connect_timer_->expires_after(timeout);
    connect_timer_->async_wait(asio::bind_executor(
        strand_, [this, self = shared_from_this(), callback,
                  timeout](const boost::system::error_code &ec) {
          if (ec == asio::error::operation_aborted || connect_done_) return;
          LOG_NET_DEBUG("connect timeout to {}:{} after {} ms", remote_addr_, remote_port_,
                        timeout.count());
          if (resolver_) resolver_->cancel();
          boost::system::error_code ignored;
          stream_.next_layer().cancel(ignored);
          finish_connect(false, "connect timeout", callback);
        }));
  }

  resolver_ = std::make_shared<tcp::resolver>(io_context_);
  resolver_->async_resolve(
      target.host, std::to_string(target.port),
      asio::bind_executor(
          strand_, [this, self = shared_from_this(), callback](
                       const boost::system::error_code &ec, tcp::resolver::results_type results) {
            if (connect_done_) return;
            if (ec) {
              LOG_NET_TRACE("failed to resolve {}: {}", remote_addr_, ec.message());
              finish_connect(false, "resolve failed: " + ec.message(), callback);
              return;
            }
            asio::async_connect(
                stream_.next_layer(), results,
                asio::bind_executor(strand_, [this, self, callback](
                                                 const boost::system::error_code &ec2,
                                                 const tcp::endpoint &ep) {
                  if (connect_done_) return;
                  if (ec2) {
                    LOG_NET_TRACE("failed to connect to {}:{}: {}", remote_addr_, remote_port_,
                                  ec2.message());
                    finish_connect(false, "connect failed: " + ec2.message(), callback);
                    return;
                  }
                  remote_addr_ = ep.address().to_string();
                  remote_port_ = ep.port();
                  apply_socket_options(stream_.next_layer());
                  on_tcp_connected(callback);
                }));
          }));
}

void AsioLink::on_tcp_connected(const ConnectCallback &callback) {
  auto established = [this, callback]() {
    auto now = std::chrono::steady_clock::now();
    handshake_ms_ =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - connect_started_).count();
    connected_at_ns_ = now.time_since_epoch().count();
    open_ = true;
    LOG_NET_TRACE("link {} established to {}:{} ({}, {} ms)", id_, remote_addr_, remote_port_,
                  tls_ ? "tls" : "tcp", handshake_ms_.load());
    finish_connect(true, {}, callback);
  };

  if (!tls_) {
    established();
    return;
  }

  const std::string &host = remote_addr_;
  if (!is_ip_literal(host)) {
    SSL_set_tlsext_host_name(stream_.native_handle(), host.c_str());
  }
  stream_.async_handshake(
      ssl::stream_base::client,
      asio::bind_executor(strand_, [this, self = shared_from_this(), callback,
                                    established](const boost::system::error_code &ec) {
        if (connect_done_) return;
        if (ec) {
          LOG_NET_TRACE("tls handshake with {}:{} failed: {}", remote_addr_, remote_port_,
                        ec.message());
          finish_connect(false, "tls handshake failed: " + ec.message(), callback);
          return;
        }
        established();
      }));
}

void AsioLink::start() {
  asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_) return;
    self->start_read_impl();
  });
}

void AsioLink::start_read_impl() {
  if (!open_) return;

  auto buf = std::make_shared<std::vector<uint8_t>>(RECV_BUFFER_SIZE);
  async_read_some(
      asio::buffer(*buf),
      asio::bind_executor(strand_, [this, self = shared_from_this(),
                                    buf](const boost::system::error_code &ec, size_t n) {
        if (!open_) return;

        if (ec) {
          // A TLS close_notify in progress cancels the pending read first
          if (ec == asio::error::operation_aborted && closing_) return;
          const bool clean = ec == asio::error::eof || ec == ssl::error::stream_truncated;
          if (!clean && ec != asio::error::operation_aborted) {
            LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_, remote_port_,
                          ec.message());
          }
          deliver_disconnect_once(clean ? "remote closed" : ec.message());
          close_impl();
          return;
        }

        if (n > 0) {
          rx_bytes_.fetch_add(n, std::memory_order_relaxed);
          if (receive_callback_) {
            std::vector<uint8_t> data(buf->begin(), buf->begin() + static_cast<std::ptrdiff_t>(n));
            try {
              receive_callback_(data);
            } catch (const std::exception &e) {
              LOG_NET_TRACE("exception in receive callback from {}:{}: {}", remote_addr_,
                            remote_port_, e.what());
            }
          }
          if (!open_) return;
        }
        start_read_impl();
      }));
}

bool AsioLink::send(const std::vector<uint8_t> &data) {
  if (!open_ || closing_) return false;
  auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
  asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_ || closing_) return;
    if (send_queue_bytes_ + payload->size() > send_queue_limit_) {
      LOG_NET_WARN("send queue overflow ({} + {} > {} bytes), dropping link to {}:{}",
                   send_queue_bytes_, payload->size(), send_queue_limit_, remote_addr_,
                   remote_port_);
      deliver_disconnect_once("send queue overflow");
      close_impl();
      return;
    }
    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();
    if (!writing_) {
      writing_ = true;
      do_write_impl();
    }
  });
  return true;
}

void AsioLink::do_write_impl() {
  if (!open_) return;
  if (send_queue_.empty()) {
    writing_ = false;
    return;
  }

  auto data = send_queue_.front();
  async_write_all(
      asio::buffer(*data),
      asio::bind_executor(strand_, [this, self = shared_from_this(),
                                    data](const boost::system::error_code &ec, size_t n) {
        if (!open_) return;
        if (ec) {
          LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_, ec.message());
          deliver_disconnect_once(ec.message());
          close_impl();
          return;
        }
        tx_bytes_.fetch_add(n, std::memory_order_relaxed);
        send_queue_.pop();
        send_queue_bytes_ -= data->size();
        do_write_impl();
      }));
}

void AsioLink::deliver_disconnect_once(const std::string &reason) {
  if (disconnect_delivered_) return;
  disconnect_delivered_ = true;

  DisconnectCallback cb = std::move(disconnect_callback_);
  disconnect_callback_ = {};
  if (!cb) return;
  // Posted off the strand so the callback may call back into this link
  asio::post(io_context_, [cb = std::move(cb), reason, id = id_]() {
    try {
      cb(reason);
    } catch (const std::exception &e) {
      LOG_NET_TRACE("exception in disconnect callback for link {}: {}", id, e.what());
    }
  });
}

void AsioLink::close() {
  asio::dispatch(strand_, [this, self = shared_from_this()]() { close_impl(); });
}

void AsioLink::close_gracefully() {
  asio::dispatch(strand_, [this, self = shared_from_this()]() {
    if (!open_ || closing_.exchange(true)) return;
    LOG_NET_TRACE("closing link {} to {}:{} gracefully", id_, remote_addr_, remote_port_);

    if (close_timer_) {
      close_timer_->expires_after(DEFAULT_GRACEFUL_CLOSE_TIMEOUT);
      close_timer_->async_wait(asio::bind_executor(
          strand_, [this, self](const boost::system::error_code &ec) {
            if (ec == asio::error::operation_aborted || !open_) return;
            LOG_NET_TRACE("graceful close of link {} timed out", id_);
            deliver_disconnect_once("local shutdown");
            close_impl();
          }));
    }

    boost::system::error_code ec;
    if (tls_) {
      // Pending read is aborted; async_shutdown sends close_notify and waits
      // for the peer's reply
      stream_.next_layer().cancel(ec);
      stream_.async_shutdown(
          asio::bind_executor(strand_, [this, self](const boost::system::error_code &) {
            deliver_disconnect_once("local shutdown");
            close_impl();
          }));
      return;
    }

    // FIN; the read loop observes the peer's EOF and closes
    stream_.next_layer().shutdown(tcp::socket::shutdown_send, ec);
    if (ec) {
      deliver_disconnect_once("local shutdown");
      close_impl();
    }
  });
}

void AsioLink::close_impl() {
  if (!open_.exchange(false)) {
    // Never connected, but a connect may still be pending
    if (!connect_done_) {
      connect_done_ = true;
      if (resolver_) resolver_->cancel();
      boost::system::error_code ignored;
      stream_.next_layer().cancel(ignored);
      stream_.next_layer().close(ignored);
    }
    return;
  }

  boost::system::error_code ignored;
  stream_.next_layer().cancel(ignored);
  stream_.next_layer().close(ignored);

  receive_callback_ = {};
  disconnect_callback_ = {};

  // Destroy timers now, while the io_context is alive
  {
    auto t = std::move(connect_timer_);
    if (t) t->cancel();
  }
  {
    auto t = std::move(close_timer_);
    if (t) t->cancel();
  }
  resolver_.reset();

  std::queue<std::shared_ptr<std::vector<uint8_t>>> drained;
  std::swap(send_queue_, drained);
  send_queue_bytes_ = 0;
  writing_ = false;
}

void AsioLink::set_receive_callback(ReceiveCallback callback) {
  asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void AsioLink::set_disconnect_callback(DisconnectCallback callback) {
  asio::dispatch(strand_, [this, self = shared_from_this(), cb = std::move(callback)]() mutable {
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// AsioLinkTransport
// ============================================================================

AsioLinkTransport::AsioLinkTransport(size_t io_threads, std::chrono::milliseconds connect_timeout)
    : io_context_(std::make_unique<asio::io_context>()),
      desired_io_threads_(io_threads == 0 ? 1 : io_threads),
      connect_timeout_(connect_timeout),
      tls_context_(ssl::context::tls_client) {
  // Overlay identities are authenticated above TLS; certificates are self-signed
  tls_context_.set_verify_mode(ssl::verify_none);
}

AsioLinkTransport::~AsioLinkTransport() { stop(); }

LinkPtr AsioLinkTransport::connect(const LinkTarget &target, ConnectCallback callback) {
  return AsioLink::create_outbound(*io_context_, tls_context_, target, connect_timeout_,
                                   std::move(callback));
}

bool AsioLinkTransport::listen(uint16_t port, std::function<void(LinkPtr)> accept_callback) {
  if (acceptor_) {
    LOG_NET_TRACE("already listening");
    return false;
  }
  accept_callback_ = std::move(accept_callback);

  acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);
  boost::system::error_code ec;

  // Dual-stack first, IPv4-only fallback
  auto try_bind = [&](const tcp &proto, bool v6) {
    ec.clear();
    acceptor_->open(proto, ec);
    if (!ec && v6) acceptor_->set_option(asio::ip::v6_only(false), ec);
    if (!ec) acceptor_->set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_->bind(tcp::endpoint(proto, port), ec);
    if (!ec) acceptor_->listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
      boost::system::error_code ignored;
      acceptor_->close(ignored);
    }
    return !ec;
  };

  if (!try_bind(tcp::v6(), true) && !try_bind(tcp::v4(), false)) {
    LOG_NET_ERROR("failed to listen on port {}: {}", port, ec.message());
    acceptor_.reset();
    accept_callback_ = {};
    return false;
  }

  auto ep = acceptor_->local_endpoint(ec);
  last_listen_port_ = ec ? 0 : ep.port();
  LOG_NET_INFO("listening on port {}", last_listen_port_);
  start_accept();
  return true;
}

void AsioLinkTransport::start_accept() {
  if (!acceptor_) return;
  acceptor_->async_accept([this](const boost::system::error_code &ec, tcp::socket socket) {
    handle_accept(ec, std::move(socket));
  });
}

void AsioLinkTransport::handle_accept(const boost::system::error_code &ec, tcp::socket socket) {
  if (ec) {
    if (ec != asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  apply_socket_options(socket);
  auto link = AsioLink::create_inbound(*io_context_, tls_context_, std::move(socket));
  LOG_NET_DEBUG("link from {}:{} accepted", link->remote_address(), link->remote_port());

  if (accept_callback_) {
    try {
      accept_callback_(link);
    } catch (const std::exception &e) {
      LOG_NET_TRACE("exception in accept callback: {}", e.what());
    }
  }
  start_accept();
}

void AsioLinkTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;
  accept_callback_ = {};
}

void AsioLinkTransport::run() {
  if (running_.exchange(true)) return;
  io_context_->restart();
  work_guard_ = std::make_unique<
      asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < desired_io_threads_; ++i) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

void AsioLinkTransport::stop() {
  running_.store(false);
  // No logging: also runs from the destructor during shutdown
  stop_listening();
  work_guard_.reset();
  io_context_->stop();
  for (auto &t : io_threads_) {
    if (t.joinable()) t.join();
  }
  io_threads_.clear();
  // io_context_ stays alive until the destructor so links can still be released
}

} // namespace network
} // namespace tyr
