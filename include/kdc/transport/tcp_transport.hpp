#pragma once
/**
 * @file tcp_transport.hpp
 * @brief KDE Connect control channel over TCP + TLS.
 *
 * @details
 * PURPOSE
 * -------
 * Implements `ITransport` for `TransportType::Tcp`. A connection is only handed
 * out after the full KDE handshake has succeeded:
 *
 * ```
 *  initiator (connect)                       acceptor (listener)
 *  ──────────────────                        ───────────────────
 *  TCP connect ─────────────────────────────► accept
 *  identity line (clear text) ──────────────► read identity line
 *  TLS *server* ◄═══════ handshake ═════════► TLS *client*
 *  identity line (TLS) ◄════════════════════► identity line (TLS)
 * ```
 *
 * The identity received over TLS is authoritative. Its device id must match the
 * peer certificate CN; anything else is `CertificateMismatch`. Fingerprint
 * pinning against the trust store is not done here: the transport reports the
 * fingerprint in `HandshakeInfo` and `PairingManager::verify_handshake()` decides.
 *
 * LISTENER
 * --------
 * `start()` binds the first free port in [port_first, port_last] and runs an
 * accept thread. Each accepted socket is handshaken on its own short-lived
 * thread so one slow peer cannot hold the listener for the whole handshake
 * timeout. At most `max_handshaking` handshakes run at once, and at most
 * `max_handshaking_per_ip` from one address; a socket over either limit is
 * closed as soon as it is accepted. Finished sessions wait in a queue until
 * `accept()` collects them.
 */

#include <atomic>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "kdc/identity.hpp"
#include "kdc/tls_identity.hpp"
#include "kdc/transport/socket_io.hpp"
#include "kdc/transport/tls_stream.hpp"
#include "kdc/transport/transport_base.hpp"

namespace kdc::transport {

struct TcpTransportConfig {
  uint16_t port_first{1714};
  uint16_t port_last{1764};
  int      connect_timeout_ms{10000};
  int      handshake_timeout_ms{10000};
  bool     listen{true};
  std::size_t max_pending{16};     ///< handshaken inbound sessions not yet collected
  std::size_t max_handshaking{32};        ///< inbound handshakes in flight
  std::size_t max_handshaking_per_ip{4};  ///< of those, from one peer address
};

/// Control-channel connection: packets as JSON lines inside a TLS session.
class TlsConnection : public Connection {
public:
  TlsConnection(std::unique_ptr<TlsStream> stream, HandshakeInfo info, int io_timeout_ms);
  ~TlsConnection() override;

  void close() override;
  bool is_open() const override;

protected:
  Status write_bytes(const std::string& bytes) override;
  RxResult read_some(char* buf, std::size_t cap, int timeout_ms,
                     std::size_t& n, Status& err) override;

private:
  std::unique_ptr<TlsStream> stream_;
  int io_timeout_ms_;
};

class TcpTransport : public ITransport {
public:
  /**
   * @param cfg       ports and timeouts
   * @param self      identity we announce; its tcp_port is replaced by the bound port
   * @param tls       our certificate; must outlive the transport
   */
  TcpTransport(TcpTransportConfig cfg, DeviceIdentity self, const TlsIdentity& tls);
  ~TcpTransport() override;

  TransportType type() const override { return TransportType::Tcp; }
  const TransportCapabilities& capabilities() const override { return TCP_CAPABILITIES; }
  const char* name() const override { return "tcp"; }

  Status start() override;
  void   stop() override;

  Status connect(const TransportAddress& addr, const CancelToken& cancel,
                 std::unique_ptr<Connection>& out) override;

  bool accept(std::unique_ptr<Connection>& out) override;

  /// Port the listener is bound to (0 before start()).
  uint16_t bound_port() const { return bound_port_.load(); }

  /// Inbound handshakes currently running.
  std::size_t handshakes_in_flight() const;

private:
  struct Handshaker {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
    std::string                        peer_ip;
  };

  void accept_loop();
  void start_handshake(UniqueFd fd, const std::string& peer_ip);
  void reap_handshakers(bool join_all);
  Status handshake_incoming(UniqueFd fd, const std::string& peer_ip, std::unique_ptr<Connection>& out);
  Status exchange_identity_over_tls(TlsStream& s, const CancelToken& cancel, DeviceIdentity& peer);
  DeviceIdentity self_identity() const;

  TcpTransportConfig    cfg_;
  DeviceIdentity        self_;
  const TlsIdentity&    tls_;

  UniqueFd              listen_fd_;
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<bool>     running_{false};
  CancelToken           stop_token_;
  std::thread           accept_thread_;

  mutable std::mutex                       hs_mu_;
  std::list<Handshaker>                    handshakers_;

  std::mutex                               pending_mu_;
  std::deque<std::unique_ptr<Connection>>  pending_;
};

} // namespace kdc::transport
