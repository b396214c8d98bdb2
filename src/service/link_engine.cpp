// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "service/link_engine.hpp"
#include "discovery/peer_uri.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <thread>

namespace tyr {
namespace service {

using core::ErrorCode;
using core::Status;

namespace {

constexpr size_t NODE_KEY_SIZE = 32;
constexpr int PASSWORD_HASH_ITERATIONS = 10000;
constexpr const char *HELLO_PREFIX = "TYR/1 ";

std::optional<std::vector<uint8_t>> ParseHex(const std::string &hex) {
  if (hex.size() % 2 != 0) return std::nullopt;
  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string DeriveMailAddress(const std::vector<uint8_t> &node_key) {
  std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (EVP_Digest(node_key.data(), node_key.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
    return {};
  }
  digest.resize(20);
  return util::HexStr(digest) + "@tyr";
}

double Rate(uint64_t now_bytes, uint64_t then_bytes, double seconds) {
  if (seconds <= 0 || now_bytes < then_bytes) return 0;
  return static_cast<double>(now_bytes - then_bytes) / seconds;
}

} // namespace

LinkEngine::LinkEngine(EngineSettings settings)
    : settings_(std::move(settings)),
      transport_(std::make_unique<network::AsioLinkTransport>(1)),
      max_message_size_(settings_.max_message_size_bytes) {
  for (const auto &address : settings_.peers) {
    PeerLink peer;
    peer.address = address;
    auto uri = discovery::ParsePeerUri(address);
    if (!uri) {
      peer.last_error = "invalid peer address";
    } else if (uri->protocol == discovery::Protocol::TCP ||
               uri->protocol == discovery::Protocol::TLS) {
      peer.dialable = true;
      peer.target = network::LinkTarget{uri->host, uri->port,
                                        uri->protocol == discovery::Protocol::TLS};
    } else {
      peer.last_error = discovery::ProtocolName(uri->protocol) + " links are not supported";
    }
    peers_.emplace(address, std::move(peer));
  }
}

LinkEngine::~LinkEngine() {
  Status st = Stop();
  if (!st.IsOk()) LOG_NET_WARN("Link engine stop on destruction: {}", st.ToString());
  st = Close();
  if (!st.IsOk()) LOG_NET_WARN("Link engine close on destruction: {}", st.ToString());
}

EngineFactory LinkEngine::Factory() {
  return [](const EngineSettings &settings) -> std::unique_ptr<MailEngine> {
    return std::make_unique<LinkEngine>(settings);
  };
}

// ---------------------------------------------------------------------------
// Storage
// ---------------------------------------------------------------------------

core::Status LinkEngine::Open() {
  if (storage_lock_) {
    return Status::Error(ErrorCode::AlreadyInitialized, "storage already open");
  }
  const auto &path = settings_.storage_path;
  if (path.empty()) {
    return Status::Error(ErrorCode::InvalidArgument, "no storage path configured");
  }
  if (path.has_parent_path() && !util::ensure_directory(path.parent_path())) {
    return Status::Error(ErrorCode::IoError, "cannot create " + path.parent_path().string());
  }

  auto lock = std::make_unique<util::FileLock>(path.string() + ".lock");
  if (!lock->IsOpen() || !lock->TryLock()) {
    return Status::Error(ErrorCode::ResourceBusy,
                         "storage is locked: " + lock->GetReason());
  }
  storage_lock_ = std::move(lock);

  Status st = LoadOrCreateStorage();
  if (!st.IsOk()) {
    storage_lock_.reset();
    return st;
  }
  storage_held_ = true;
  LOG_NET_DEBUG("Storage {} opened, node address {}", path.string(), mail_address_);
  return Status::Ok();
}

core::Status LinkEngine::LoadOrCreateStorage() {
  using json = nlohmann::json;
  const auto &path = settings_.storage_path;
  auto data = util::try_read_file(path);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!data || data->empty()) {
    node_key_.assign(NODE_KEY_SIZE, 0);
    if (RAND_bytes(node_key_.data(), static_cast<int>(node_key_.size())) != 1) {
      return Status::Error(ErrorCode::EngineFailure, "random generator failure");
    }
    password_hash_.clear();
    mail_address_ = DeriveMailAddress(node_key_);
    if (!WriteStorage()) {
      return Status::Error(ErrorCode::IoError, "cannot write " + path.string());
    }
    LOG_NET_INFO("Created new node identity in {}", path.string());
    return Status::Ok();
  }

  try {
    json doc = json::parse(data->begin(), data->end());
    if (doc.value("version", 0) != STORAGE_FORMAT_VERSION) {
      return Status::Error(ErrorCode::EngineFailure, "unsupported storage version");
    }
    auto key = ParseHex(doc.at("node_key").get<std::string>());
    if (!key || key->size() != NODE_KEY_SIZE) {
      return Status::Error(ErrorCode::EngineFailure, "storage holds a malformed node key");
    }
    node_key_ = std::move(*key);
    password_hash_ = doc.value("password_hash", std::string{});
  } catch (const json::exception &e) {
    return Status::Error(ErrorCode::EngineFailure, std::string("corrupt storage: ") + e.what());
  }
  mail_address_ = DeriveMailAddress(node_key_);
  return Status::Ok();
}

bool LinkEngine::WriteStorage() const {
  nlohmann::json doc;
  doc["version"] = STORAGE_FORMAT_VERSION;
  doc["node_key"] = util::HexStr(node_key_);
  doc["password_hash"] = password_hash_;
  return util::atomic_write_file(settings_.storage_path, doc.dump(2), 0600);
}

core::Status LinkEngine::SetPassword(const std::string &password) {
  if (!storage_lock_) {
    return Status::Error(ErrorCode::NotInitialized, "storage is not open");
  }
  if (password.empty()) {
    return Status::Error(ErrorCode::InvalidArgument, "password must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint8_t> hash(32);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), node_key_.data(),
                        static_cast<int>(node_key_.size()), PASSWORD_HASH_ITERATIONS,
                        EVP_sha256(), static_cast<int>(hash.size()), hash.data()) != 1) {
    return Status::Error(ErrorCode::EngineFailure, "password derivation failed");
  }
  password_hash_ = util::HexStr(hash);
  if (!WriteStorage()) {
    return Status::Error(ErrorCode::IoError, "cannot persist password verifier");
  }
  return Status::Ok();
}

bool LinkEngine::IsStorageHeld() const { return storage_held_; }

std::string LinkEngine::GetMailAddress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mail_address_;
}

// ---------------------------------------------------------------------------
// Links
// ---------------------------------------------------------------------------

network::ReceiveCallback LinkEngine::MakeReceiveCallback(const std::string &label,
                                                         std::weak_ptr<network::Link> weak) {
  // Bytes since the last newline form the message being received
  auto pending = std::make_shared<uint64_t>(0);
  return [this, label, weak, pending](const std::vector<uint8_t> &data) {
    for (uint8_t b : data) {
      *pending = b == '\n' ? 0 : *pending + 1;
    }
    const uint64_t limit = max_message_size_.load(std::memory_order_relaxed);
    if (limit > 0 && *pending > limit) {
      LOG_NET_WARN("Message from {} exceeds {} bytes, dropping link", label, limit);
      if (auto link = weak.lock()) link->close();
    }
  };
}

void LinkEngine::DialLocked(PeerLink &peer) {
  if (!peer.dialable || !running_) return;

  const uint64_t attempt = ++peer.attempt;
  const std::string address = peer.address;
  LOG_NET_DEBUG("Dialing {}", address);

  peer.link = transport_->connect(peer.target, [this, address, attempt](bool ok,
                                                                       const std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(address);
    if (it == peers_.end() || it->second.attempt != attempt || !running_) return;
    PeerLink &p = it->second;

    if (!ok) {
      LOG_NET_DEBUG("Link to {} failed: {}", address, error);
      p.last_error = error;
      p.link.reset();
      ScheduleRedialLocked(p);
      return;
    }

    p.last_error.clear();
    p.sample_rx = 0;
    p.sample_tx = 0;
    p.sample_time = std::chrono::steady_clock::now();
    p.rx_rate = p.tx_rate = 0;

    network::LinkPtr link = p.link;
    link->set_receive_callback(MakeReceiveCallback(address, link));
    link->set_disconnect_callback([this, address, attempt](const std::string &reason) {
      std::lock_guard<std::mutex> lock2(mutex_);
      auto it2 = peers_.find(address);
      if (it2 == peers_.end() || it2->second.attempt != attempt) return;
      LOG_NET_INFO("Link to {} closed: {}", address, reason);
      it2->second.last_error = reason;
      it2->second.link.reset();
      ScheduleRedialLocked(it2->second);
    });
    link->start();
    const std::string hello = std::string(HELLO_PREFIX) + mail_address_ + "\n";
    link->send(std::vector<uint8_t>(hello.begin(), hello.end()));
    LOG_NET_INFO("Link to {} established ({} ms)", address, link->handshake_time().count());
  });
}

void LinkEngine::ScheduleRedialLocked(PeerLink &peer) {
  if (!running_ || !peer.dialable) return;
  if (!peer.retry_timer) {
    peer.retry_timer = std::make_shared<boost::asio::steady_timer>(transport_->io_context());
  }
  const std::string address = peer.address;
  const uint64_t attempt = peer.attempt;
  peer.retry_timer->expires_after(LINK_RECONNECT_DELAY);
  peer.retry_timer->async_wait([this, address, attempt](const boost::system::error_code &ec) {
    if (ec || !running_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(address);
    if (it == peers_.end() || it->second.attempt != attempt || it->second.link) return;
    DialLocked(it->second);
  });
}

void LinkEngine::OnInbound(network::LinkPtr link) {
  if (!running_) {
    link->close();
    return;
  }
  const std::string label = link->remote_address() + ":" + std::to_string(link->remote_port());
  link->set_receive_callback(MakeReceiveCallback(label, link));
  link->start();
  std::lock_guard<std::mutex> lock(mutex_);
  // Forget links that already went away
  std::erase_if(inbound_, [](const network::LinkPtr &l) { return !l->is_open(); });
  const std::string hello = std::string(HELLO_PREFIX) + mail_address_ + "\n";
  link->send(std::vector<uint8_t>(hello.begin(), hello.end()));
  inbound_.push_back(std::move(link));
}

std::vector<network::LinkPtr> LinkEngine::CollectLinksLocked() const {
  std::vector<network::LinkPtr> links;
  for (const auto &[address, peer] : peers_) {
    if (peer.link) links.push_back(peer.link);
  }
  for (const auto &l : inbound_) links.push_back(l);
  return links;
}

void LinkEngine::ResetTimersLocked() {
  for (auto &[address, peer] : peers_) {
    peer.retry_timer.reset();
    peer.link.reset();
    ++peer.attempt;
  }
  inbound_.clear();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

core::Status LinkEngine::Start() {
  if (!storage_lock_) {
    return Status::Error(ErrorCode::NotInitialized, "storage is not open");
  }
  if (running_.exchange(true)) {
    return Status::Error(ErrorCode::AlreadyRunning, "link engine already running");
  }

  transport_->run();
  if (settings_.listen_port != 0) {
    if (!transport_->listen(settings_.listen_port,
                            [this](network::LinkPtr link) { OnInbound(std::move(link)); })) {
      running_ = false;
      transport_->stop();
      return Status::Error(ErrorCode::EngineFailure,
                           "cannot listen on port " + std::to_string(settings_.listen_port));
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  size_t dialed = 0;
  for (auto &[address, peer] : peers_) {
    if (peer.dialable) {
      DialLocked(peer);
      ++dialed;
    } else {
      LOG_NET_WARN("Not dialing {}: {}", address, peer.last_error);
    }
  }
  LOG_NET_INFO("Link engine started, dialing {} of {} peers", dialed, peers_.size());
  return Status::Ok();
}

core::Status LinkEngine::SoftStop() {
  if (!running_.exchange(false)) {
    return Status::Ok();
  }
  transport_->stop_listening();

  std::vector<network::LinkPtr> links;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    links = CollectLinksLocked();
  }
  for (auto &l : links) l->close_gracefully();

  const auto deadline = std::chrono::steady_clock::now() + SOFT_STOP_TIMEOUT;
  auto all_closed = [&links]() {
    for (const auto &l : links) {
      if (l->is_open()) return false;
    }
    return true;
  };
  while (!all_closed() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  if (!all_closed()) {
    return Status::Error(ErrorCode::OperationTimedOut, "peers did not complete graceful close");
  }

  transport_->stop();
  std::lock_guard<std::mutex> lock(mutex_);
  ResetTimersLocked();
  LOG_NET_INFO("Link engine stopped gracefully ({} links)", links.size());
  return Status::Ok();
}

core::Status LinkEngine::Stop() {
  running_ = false;
  transport_->stop_listening();

  std::vector<network::LinkPtr> links;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    links = CollectLinksLocked();
  }
  for (auto &l : links) l->close();

  transport_->stop();
  std::lock_guard<std::mutex> lock(mutex_);
  ResetTimersLocked();
  return Status::Ok();
}

core::Status LinkEngine::Close() {
  if (running_) {
    return Status::Error(ErrorCode::ResourceBusy, "link engine is running");
  }
  storage_held_ = false;
  storage_lock_.reset();
  return Status::Ok();
}

uint16_t LinkEngine::listening_port() const { return transport_->listening_port(); }

// ---------------------------------------------------------------------------
// Peers
// ---------------------------------------------------------------------------

core::Status LinkEngine::AddPeer(const std::string &address) {
  auto uri = discovery::ParsePeerUri(address);
  if (!uri) {
    return Status::Error(ErrorCode::InvalidArgument, "invalid peer address " + address);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (peers_.count(address)) return Status::Ok();

  PeerLink peer;
  peer.address = address;
  if (uri->protocol == discovery::Protocol::TCP || uri->protocol == discovery::Protocol::TLS) {
    peer.dialable = true;
    peer.target = network::LinkTarget{uri->host, uri->port,
                                      uri->protocol == discovery::Protocol::TLS};
  } else {
    peer.last_error = discovery::ProtocolName(uri->protocol) + " links are not supported";
  }
  auto [it, inserted] = peers_.emplace(address, std::move(peer));
  if (running_) DialLocked(it->second);
  return Status::Ok();
}

core::Status LinkEngine::RemovePeer(const std::string &address) {
  network::LinkPtr link;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(address);
    if (it == peers_.end()) {
      return Status::Error(ErrorCode::InvalidArgument, "unknown peer " + address);
    }
    link = std::move(it->second.link);
    if (it->second.retry_timer) {
      auto timer = it->second.retry_timer;
      boost::asio::post(transport_->io_context(), [timer]() { timer->cancel(); });
    }
    peers_.erase(it);
  }
  if (link) link->close_gracefully();
  return Status::Ok();
}

core::Status LinkEngine::SetMaxMessageSize(uint64_t bytes) {
  if (bytes == 0) {
    return Status::Error(ErrorCode::InvalidArgument, "message size limit must be positive");
  }
  max_message_size_ = bytes;
  return Status::Ok();
}

std::vector<PeerRuntimeStats> LinkEngine::GetPeerStats() const {
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerRuntimeStats> out;
  out.reserve(peers_.size());
  for (auto &[address, peer] : peers_) {
    PeerRuntimeStats s;
    s.address = address;
    s.last_error = peer.last_error;
    if (peer.link && peer.link->is_open()) {
      const auto &link = peer.link;
      s.connected = true;
      s.latency_ms = link->handshake_time().count();
      s.rx_bytes = link->rx_bytes();
      s.tx_bytes = link->tx_bytes();
      s.uptime_sec =
          std::chrono::duration_cast<std::chrono::seconds>(now - link->connected_at()).count();

      const double elapsed = std::chrono::duration<double>(now - peer.sample_time).count();
      if (elapsed >= 1.0) {
        peer.rx_rate = Rate(s.rx_bytes, peer.sample_rx, elapsed);
        peer.tx_rate = Rate(s.tx_bytes, peer.sample_tx, elapsed);
        peer.sample_rx = s.rx_bytes;
        peer.sample_tx = s.tx_bytes;
        peer.sample_time = now;
      }
      s.rx_rate = peer.rx_rate;
      s.tx_rate = peer.tx_rate;
    }
    out.push_back(std::move(s));
  }
  return out;
}

} // namespace service
} // namespace tyr
