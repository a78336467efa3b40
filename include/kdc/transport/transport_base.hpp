#pragma once
/**
 * @file transport_base.hpp
 * @brief Core-agnostic transport interface: one `ITransport` per link kind, one
 *        `Connection` per live, authenticated session.
 *
 * Contract:
 *  - start() opens listeners (if the transport accepts inbound sessions).
 *  - connect(addr) runs link connect + identity exchange + TLS (or BLE) handshake
 *    and yields a Connection whose handshake() carries the peer identity and
 *    certificate fingerprint. It polls the CancelToken and gives up cleanly.
 *  - accept(out) hands over inbound sessions that completed the same handshake.
 *    Never blocks.
 *  - Connection::send() enforces capabilities().max_packet_size BEFORE any I/O
 *    and preserves per-connection send order.
 *  - Connection::receive() yields one decoded packet, Closed, or Error.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "kdc/identity.hpp"
#include "kdc/line_framing.hpp"
#include "kdc/packet.hpp"
#include "kdc/status.hpp"
#include "kdc/transport/transport_types.hpp"

namespace kdc::transport {

enum class RxResult : uint8_t { None = 0, Ok = 1, Closed = 2, Error = 3 };

/// Shared cancel flag. Copies observe the same flag.
class CancelToken {
public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
  void cancel() const { flag_->store(true); }
  bool cancelled() const { return flag_->load(); }
private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

/// What the handshake established about the peer.
struct HandshakeInfo {
  DeviceIdentity   peer;
  std::string      peer_fingerprint;   ///< SHA-256 of the peer certificate (DER), "AB:CD:..."
  TransportAddress address;
  bool             incoming{false};
  bool             encrypted{false};   ///< TLS session, or an encrypted (bonded) BLE link
};

class Connection {
public:
  Connection(const TransportCapabilities& caps, HandshakeInfo info);
  virtual ~Connection() = default;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /**
   * @brief Encode and write one packet.
   * @retval PacketTooLarge  encoded size exceeds max_packet_size; nothing was written
   * @retval NotConnected    link already closed
   * @retval Io/Timeout/Tls  from the underlying write
   */
  Status send(const Packet& p);

  /**
   * @brief Wait up to @p timeout_ms for the next packet.
   * @return Ok (out filled), None (timeout), Closed (peer closed), Error (err filled;
   *         malformed input is reported as MalformedPacket).
   */
  RxResult receive(Packet& out, int timeout_ms, Status& err);

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  const TransportCapabilities& capabilities() const { return caps_; }
  const HandshakeInfo& handshake() const { return info_; }
  TransportType type() const { return type_of(info_.address); }

protected:
  /// Write all bytes or fail.
  virtual Status write_bytes(const std::string& bytes) = 0;
  /// Read what is available within the timeout. n == 0 with Ok is not allowed.
  virtual RxResult read_some(char* buf, std::size_t cap, int timeout_ms,
                             std::size_t& n, Status& err) = 0;

private:
  TransportCapabilities   caps_;
  HandshakeInfo           info_;
  std::mutex              send_mu_;   ///< one writer at a time keeps send order
  std::mutex              recv_mu_;
  LineDecoder             decoder_;
  std::deque<std::string> lines_;
};

class ITransport {
public:
  virtual ~ITransport() = default;

  virtual TransportType type() const = 0;
  virtual const TransportCapabilities& capabilities() const = 0;
  virtual const char* name() const = 0;

  virtual Status start() = 0;
  virtual void   stop() = 0;

  virtual Status connect(const TransportAddress& addr, const CancelToken& cancel,
                         std::unique_ptr<Connection>& out) = 0;

  virtual bool accept(std::unique_ptr<Connection>& out) = 0;
};

} // namespace kdc::transport
