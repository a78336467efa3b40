// ============================================================================
// bluetooth_transport.cpp — implementation for transport/bluetooth_transport.hpp
// ============================================================================

#include "kdc/transport/bluetooth_transport.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <vector>

#include <spdlog/spdlog.h>

#include "kdc/line_framing.hpp"

namespace kdc::transport {

Status ble_write_chunked(IBleLink& link, const std::string& data, std::size_t mtu, int timeout_ms) {
  if (mtu == 0) return Status(ErrorKind::Internal, "ble mtu is zero");
  for (std::size_t off = 0; off < data.size(); off += mtu) {
    Status st = link.write(data.substr(off, mtu), timeout_ms);
    if (!st) return st;
  }
  return Status();
}

// ============================================================================
// BleConnection
// ============================================================================

BleConnection::BleConnection(std::unique_ptr<IBleLink> link, HandshakeInfo info, std::string leftover,
                             int io_timeout_ms)
: Connection(BLUETOOTH_CAPABILITIES, std::move(info)),
  link_(std::move(link)), carry_(std::move(leftover)), io_timeout_ms_(io_timeout_ms) {}

BleConnection::~BleConnection() {
  close();
}

void BleConnection::close() {
  link_->close();
}

bool BleConnection::is_open() const {
  return link_->is_open();
}

Status BleConnection::write_bytes(const std::string& bytes) {
  // Connection::send() already held the line to the packet cap; one write carries it
  return link_->write(bytes, io_timeout_ms_);
}

RxResult BleConnection::read_some(char* buf, std::size_t cap, int timeout_ms,
                                  std::size_t& n, Status& err) {
  n = 0;
  if (carry_.empty()) {
    RxResult r = link_->read(carry_, timeout_ms, err);
    if (r != RxResult::Ok) return r;
    if (carry_.empty()) return RxResult::None;
  }
  n = std::min(cap, carry_.size());
  std::memcpy(buf, carry_.data(), n);
  carry_.erase(0, n);
  return RxResult::Ok;
}

// ============================================================================
// BluetoothTransport
// ============================================================================

BluetoothTransport::BluetoothTransport(BluetoothTransportConfig cfg, DeviceIdentity self,
                                       std::shared_ptr<IBleAdapter> adapter)
: cfg_(cfg), self_(std::move(self)), adapter_(std::move(adapter)) {}

Status BluetoothTransport::start() {
  if (!adapter_) return Status(ErrorKind::Unsupported, "no bluetooth adapter backend");
  stop_token_ = CancelToken();
  running_ = true;
  return Status();
}

void BluetoothTransport::stop() {
  stop_token_.cancel();
  running_ = false;
}

// ---------------------------------------------------------------------------
// handshake()
// -----------
// Identity out (chunked), identity in (framed with the larger handshake cap).
// Whatever arrived after the identity line is handed to the connection so no
// packet the peer sent right after its identity is lost.
// ---------------------------------------------------------------------------
Status BluetoothTransport::handshake(std::unique_ptr<IBleLink> link, const BluetoothAddress& addr,
                                     bool incoming, const CancelToken& cancel,
                                     std::unique_ptr<Connection>& out) {
  std::string mine = encode(make_identity_packet(self_));
  Status st = ble_write_chunked(*link, mine, cfg_.mtu, cfg_.timeout_ms);
  if (!st) { link->close(); return st; }

  LineDecoder framer(cfg_.identity_max_bytes);
  std::vector<std::string> lines;
  std::string leftover;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg_.timeout_ms);

  while (lines.empty()) {
    if (cancel.cancelled() || stop_token_.cancelled()) {
      link->close();
      return Status(ErrorKind::Cancelled, "ble handshake cancelled");
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) { link->close(); return Status(ErrorKind::Timeout, "ble identity exchange timed out"); }

    std::string chunk;
    Status err;
    RxResult r = link->read(chunk, static_cast<int>(std::min<long long>(left, 100)), err);
    if (r == RxResult::None) continue;
    if (r == RxResult::Closed) { link->close(); return Status(ErrorKind::Io, "ble peer closed during handshake"); }
    if (r == RxResult::Error)  { link->close(); return err; }

    std::size_t nl = chunk.find('\n');
    if (nl != std::string::npos) {
      leftover = chunk.substr(nl + 1);
      chunk.resize(nl + 1);
    }
    if (framer.feed(chunk.data(), chunk.size(), lines) > 0) {
      link->close();
      return Status(ErrorKind::MalformedPacket, "ble identity line too long");
    }
  }

  Packet p;
  CodecError ce = decode(lines.front(), p);
  if (ce != CodecError::None) {
    link->close();
    return Status(ErrorKind::MalformedPacket, std::string("ble identity: ") + to_string(ce));
  }

  HandshakeInfo info;
  st = parse_identity_packet(p, info.peer);
  if (!st) { link->close(); return st; }
  info.address   = addr;
  info.incoming  = incoming;
  info.encrypted = link->encrypted();

  spdlog::debug("ble: handshake with {} at {} encrypted={}", info.peer.device_id, addr.device_address, info.encrypted);
  out = std::make_unique<BleConnection>(std::move(link), std::move(info), std::move(leftover), cfg_.timeout_ms);
  return Status();
}

Status BluetoothTransport::connect(const TransportAddress& addr, const CancelToken& cancel,
                                   std::unique_ptr<Connection>& out) {
  const BluetoothAddress* bt = std::get_if<BluetoothAddress>(&addr);
  if (!bt) return Status(ErrorKind::Unsupported, "bluetooth transport cannot dial " + to_string(addr));
  if (!running_) return Status(ErrorKind::NotConnected, "bluetooth transport not started");

  std::unique_ptr<IBleLink> link;
  Status st = adapter_->connect(*bt, cfg_.timeout_ms, cancel, link);
  if (!st) return st;
  return handshake(std::move(link), *bt, false, cancel, out);
}

bool BluetoothTransport::accept(std::unique_ptr<Connection>& out) {
  if (!running_) return false;
  std::unique_ptr<IBleLink> link;
  if (!adapter_->accept(link)) return false;

  BluetoothAddress addr{link->peer_address(), ble::SERVICE_UUID};
  Status st = handshake(std::move(link), addr, true, stop_token_, out);
  if (!st) {
    spdlog::warn("ble: inbound handshake from {} failed: {}", addr.device_address, st.to_string());
    return false;
  }
  return true;
}

} // namespace kdc::transport
