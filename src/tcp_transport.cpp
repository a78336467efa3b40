// ============================================================================
// tcp_transport.cpp — implementation for transport/tcp_transport.hpp
// Clear-text identity, TLS with the KDE role rule, identity again over TLS.
// ============================================================================

#include "kdc/transport/tcp_transport.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

namespace kdc::transport {

static constexpr int ACCEPT_POLL_MS = 200;
static constexpr std::size_t IDENTITY_MAX_BYTES = 64 * 1024;

// ============================================================================
// TlsConnection
// ============================================================================

TlsConnection::TlsConnection(std::unique_ptr<TlsStream> stream, HandshakeInfo info, int io_timeout_ms)
: Connection(TCP_CAPABILITIES, std::move(info)), stream_(std::move(stream)), io_timeout_ms_(io_timeout_ms) {}

TlsConnection::~TlsConnection() {
  close();
}

void TlsConnection::close() {
  stream_->shutdown();
}

bool TlsConnection::is_open() const {
  return stream_->is_open();
}

Status TlsConnection::write_bytes(const std::string& bytes) {
  return stream_->write_all(bytes.data(), bytes.size(), io_timeout_ms_);
}

RxResult TlsConnection::read_some(char* buf, std::size_t cap, int timeout_ms,
                                  std::size_t& n, Status& err) {
  return stream_->read_some(buf, cap, timeout_ms, n, err);
}

// ============================================================================
// TcpTransport
// ============================================================================

TcpTransport::TcpTransport(TcpTransportConfig cfg, DeviceIdentity self, const TlsIdentity& tls)
: cfg_(std::move(cfg)), self_(std::move(self)), tls_(tls) {}

TcpTransport::~TcpTransport() {
  stop();
}

DeviceIdentity TcpTransport::self_identity() const {
  DeviceIdentity me = self_;
  uint16_t port = bound_port_.load();
  if (port != 0) me.tcp_port = port;
  return me;
}

Status TcpTransport::start() {
  if (running_.load()) return Status();
  if (!tls_.valid()) return Status(ErrorKind::Internal, "tcp transport needs a tls identity");

  stop_token_ = CancelToken();
  if (cfg_.listen) {
    uint16_t bound = 0;
    Status st = tcp_listen(cfg_.port_first, cfg_.port_last, listen_fd_, bound);
    if (!st) return st;
    bound_port_.store(bound);
    spdlog::info("tcp: listening port={}", bound);
  }
  running_.store(true);
  if (cfg_.listen) accept_thread_ = std::thread(&TcpTransport::accept_loop, this);
  return Status();
}

void TcpTransport::stop() {
  if (!running_.exchange(false)) return;
  stop_token_.cancel();
  if (accept_thread_.joinable()) accept_thread_.join();
  reap_handshakers(/*join_all*/true);
  listen_fd_.reset();
  bound_port_.store(0);

  std::lock_guard<std::mutex> lk(pending_mu_);
  pending_.clear();
}

// ---------------------------------------------------------------------------
// accept_loop()
// -------------
// Poll the listener in ACCEPT_POLL_MS steps; hand each socket to a handshaker
// thread. Finished handshakers are joined on the next lap.
// ---------------------------------------------------------------------------
void TcpTransport::accept_loop() {
  while (running_.load()) {
    reap_handshakers(false);

    int w = wait_fd(listen_fd_.get(), false, ACCEPT_POLL_MS);
    if (w <= 0) continue;

    UniqueFd fd;
    std::string peer_ip;
    while (tcp_accept(listen_fd_.get(), fd, peer_ip)) start_handshake(std::move(fd), peer_ip);
  }
}

// A socket that is not handed to a thread is closed when @p fd goes out of scope.
void TcpTransport::start_handshake(UniqueFd fd, const std::string& peer_ip) {
  std::lock_guard<std::mutex> lk(hs_mu_);
  std::size_t running = 0, from_ip = 0;
  for (const auto& h : handshakers_) {
    if (h.done->load()) continue;
    ++running;
    if (h.peer_ip == peer_ip) ++from_ip;
  }
  if (running >= cfg_.max_handshaking) {
    spdlog::warn("tcp: {} handshakes in flight, refusing {}", running, peer_ip);
    return;
  }
  if (from_ip >= cfg_.max_handshaking_per_ip) {
    spdlog::warn("tcp: {} handshakes in flight from {}, refusing another", from_ip, peer_ip);
    return;
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  auto shared_fd = std::make_shared<UniqueFd>(std::move(fd));
  std::thread t;
  try {
    t = std::thread([this, shared_fd, peer_ip, done]() {
      std::unique_ptr<Connection> conn;
      Status st = handshake_incoming(std::move(*shared_fd), peer_ip, conn);
      if (!st) {
        spdlog::warn("tcp: inbound handshake from {} failed: {}", peer_ip, st.to_string());
      } else {
        std::lock_guard<std::mutex> plk(pending_mu_);
        if (pending_.size() >= cfg_.max_pending) {
          spdlog::warn("tcp: inbound queue full, dropping session from {}", peer_ip);
        } else {
          pending_.push_back(std::move(conn));
        }
      }
      done->store(true);
    });
  } catch (const std::system_error& e) {
    spdlog::error("tcp: no thread for inbound handshake from {}: {}", peer_ip, e.what());
    return;
  }
  handshakers_.push_back(Handshaker{std::move(t), done, peer_ip});
}

std::size_t TcpTransport::handshakes_in_flight() const {
  std::lock_guard<std::mutex> lk(hs_mu_);
  std::size_t n = 0;
  for (const auto& h : handshakers_) n += h.done->load() ? 0 : 1;
  return n;
}

void TcpTransport::reap_handshakers(bool join_all) {
  std::list<Handshaker> finished;
  {
    std::lock_guard<std::mutex> lk(hs_mu_);
    for (auto it = handshakers_.begin(); it != handshakers_.end();) {
      if (join_all || it->done->load()) {
        finished.splice(finished.end(), handshakers_, it++);
      } else {
        ++it;
      }
    }
  }
  for (auto& h : finished) {
    if (h.thread.joinable()) h.thread.join();
  }
}

Status TcpTransport::exchange_identity_over_tls(TlsStream& s, const CancelToken& cancel,
                                                DeviceIdentity& peer) {
  std::string mine = encode(make_identity_packet(self_identity()));
  Status st = s.write_all(mine.data(), mine.size(), cfg_.handshake_timeout_ms);
  if (!st) return st;

  std::string line;
  st = s.read_line(line, IDENTITY_MAX_BYTES, cfg_.handshake_timeout_ms, cancel);
  if (!st) return st;

  Packet p;
  CodecError ce = decode(line, p);
  if (ce != CodecError::None)
    return Status(ErrorKind::MalformedPacket, std::string("identity over tls: ") + to_string(ce));
  st = parse_identity_packet(p, peer);
  if (!st) return st;

  if (s.peer_common_name() != peer.device_id)
    return Status(ErrorKind::CertificateMismatch,
                  "certificate CN " + s.peer_common_name() + " does not match device id " + peer.device_id);
  return Status();
}

// ---------------------------------------------------------------------------
// connect()
// ---------
// We opened the socket, so we speak first in clear text and then take the TLS
// server role.
// ---------------------------------------------------------------------------
Status TcpTransport::connect(const TransportAddress& addr, const CancelToken& cancel,
                             std::unique_ptr<Connection>& out) {
  const TcpAddress* tcp = std::get_if<TcpAddress>(&addr);
  if (!tcp) return Status(ErrorKind::Unsupported, "tcp transport cannot dial " + to_string(addr));

  UniqueFd fd;
  Status st = tcp_connect(tcp->ip, tcp->port, cfg_.connect_timeout_ms, cancel, fd);
  if (!st) return st;

  std::string hello = encode(make_identity_packet(self_identity()));
  st = transport::write_all(fd.get(), hello.data(), hello.size(), cfg_.handshake_timeout_ms);
  if (!st) return st;

  auto stream = std::make_unique<TlsStream>(std::move(fd));
  st = stream->handshake(tls_, /*server*/true, cfg_.handshake_timeout_ms, cancel);
  if (!st) return st;

  HandshakeInfo info;
  st = exchange_identity_over_tls(*stream, cancel, info.peer);
  if (!st) return st;
  info.peer_fingerprint = stream->peer_fingerprint();
  info.address          = *tcp;
  info.incoming         = false;
  info.encrypted        = true;

  spdlog::debug("tcp: connected to {} ({}) fp={}", info.peer.device_id, to_string(addr), info.peer_fingerprint);
  out = std::make_unique<TlsConnection>(std::move(stream), std::move(info), cfg_.handshake_timeout_ms);
  return Status();
}

Status TcpTransport::handshake_incoming(UniqueFd fd, const std::string& peer_ip,
                                        std::unique_ptr<Connection>& out) {
  std::string line;
  Status st = read_line(fd.get(), line, IDENTITY_MAX_BYTES, cfg_.handshake_timeout_ms, stop_token_);
  if (!st) return st;

  Packet p;
  CodecError ce = decode(line, p);
  if (ce != CodecError::None)
    return Status(ErrorKind::MalformedPacket, std::string("clear-text identity: ") + to_string(ce));
  DeviceIdentity announced;
  st = parse_identity_packet(p, announced);
  if (!st) return st;

  auto stream = std::make_unique<TlsStream>(std::move(fd));
  st = stream->handshake(tls_, /*server*/false, cfg_.handshake_timeout_ms, stop_token_);
  if (!st) return st;

  HandshakeInfo info;
  st = exchange_identity_over_tls(*stream, stop_token_, info.peer);
  if (!st) return st;
  if (info.peer.device_id != announced.device_id)
    return Status(ErrorKind::CertificateMismatch,
                  "clear-text id " + announced.device_id + " differs from tls id " + info.peer.device_id);

  info.peer_fingerprint = stream->peer_fingerprint();
  info.address          = TcpAddress{peer_ip, info.peer.tcp_port.value_or(0)};
  info.incoming         = true;
  info.encrypted        = true;

  spdlog::debug("tcp: accepted {} from {} fp={}", info.peer.device_id, peer_ip, info.peer_fingerprint);
  out = std::make_unique<TlsConnection>(std::move(stream), std::move(info), cfg_.handshake_timeout_ms);
  return Status();
}

bool TcpTransport::accept(std::unique_ptr<Connection>& out) {
  std::lock_guard<std::mutex> lk(pending_mu_);
  if (pending_.empty()) return false;
  out = std::move(pending_.front());
  pending_.pop_front();
  return true;
}

} // namespace kdc::transport
