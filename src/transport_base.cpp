// ============================================================================
// transport_base.cpp — shared Connection logic (size gate, line framing, decode)
// For the contract see transport/transport_base.hpp.
// ============================================================================

#include "kdc/transport/transport_base.hpp"

namespace kdc::transport {

Connection::Connection(const TransportCapabilities& caps, HandshakeInfo info)
: caps_(caps), info_(std::move(info)), decoder_(caps.max_packet_size) {}

Status Connection::send(const Packet& p) {
  std::string line = encode(p);
  // capability gate: fail fast, never truncate
  if (line.size() > caps_.max_packet_size) {
    return Status(ErrorKind::PacketTooLarge,
                  p.type + " is " + std::to_string(line.size()) + " bytes, " +
                  to_string(type()) + " carries " + std::to_string(caps_.max_packet_size));
  }

  std::lock_guard<std::mutex> lk(send_mu_);
  if (!is_open()) return Status(ErrorKind::NotConnected, "connection closed");
  return write_bytes(line);
}

RxResult Connection::receive(Packet& out, int timeout_ms, Status& err) {
  std::lock_guard<std::mutex> lk(recv_mu_);

  char buf[4096];
  while (lines_.empty()) {
    std::size_t n = 0;
    RxResult r = read_some(buf, sizeof(buf), timeout_ms, n, err);
    if (r != RxResult::Ok) return r;

    std::vector<std::string> got;
    if (decoder_.feed(buf, n, got) > 0) {
      err = Status(ErrorKind::MalformedPacket, "line exceeds " + std::to_string(caps_.max_packet_size) + " bytes");
      return RxResult::Error;
    }
    for (auto& l : got) lines_.push_back(std::move(l));
  }

  std::string line = std::move(lines_.front());
  lines_.pop_front();

  CodecLimits limits;
  limits.max_packet_bytes = caps_.max_packet_size;
  CodecError ce = decode(line, out, limits);
  if (ce != CodecError::None) {
    err = Status(ErrorKind::MalformedPacket, std::string("decode: ") + to_string(ce));
    return RxResult::Error;
  }
  return RxResult::Ok;
}

} // namespace kdc::transport
