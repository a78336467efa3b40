#pragma once
/**
 * @file tls_stream.hpp
 * @brief TLS session over a non-blocking socket: handshake, bounded reads and writes.
 *
 * @details
 * PURPOSE
 * -------
 * Both the control channel (`TcpTransport`) and the payload side channel
 * (`PayloadServer` / `PayloadReceiver`) run TLS on top of a plain TCP fd. This
 * class owns the fd, the SSL_CTX and the SSL object for one such session and
 * hides the WANT_READ / WANT_WRITE dance behind calls bounded by a timeout.
 *
 * THREADING
 * ---------
 * An SSL object must not be entered by two threads at once. Every SSL_* call
 * is made under `ssl_mu_`; the poll(2) waits between calls happen outside the
 * lock, so a reader blocked waiting for data never stalls a writer.
 *
 * ROLES
 * -----
 * `handshake(server, ...)` takes the TLS role explicitly. For the KDE control
 * channel the TCP initiator is the TLS server; for payloads the sender is.
 */

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>

#include "kdc/status.hpp"
#include "kdc/tls_identity.hpp"
#include "kdc/transport/socket_io.hpp"
#include "kdc/transport/transport_base.hpp"

namespace kdc::transport {

class TlsStream {
public:
  explicit TlsStream(UniqueFd fd) : fd_(std::move(fd)) {}
  ~TlsStream();

  TlsStream(const TlsStream&) = delete;
  TlsStream& operator=(const TlsStream&) = delete;

  /**
   * @brief Run the TLS handshake within @p timeout_ms.
   * @param identity  our certificate and key
   * @param server    true: SSL_accept, false: SSL_connect
   * @retval Tls        handshake failed (alert, no peer certificate, ...)
   * @retval Timeout    deadline hit
   * @retval Cancelled  @p cancel fired
   */
  Status handshake(const TlsIdentity& identity, bool server, int timeout_ms,
                   const CancelToken& cancel);

  /// Peer certificate SHA-256 fingerprint and subject CN (valid after handshake()).
  const std::string& peer_fingerprint() const { return peer_fingerprint_; }
  const std::string& peer_common_name() const { return peer_cn_; }

  /// Write all bytes, waiting at most @p timeout_ms for each stall.
  Status write_all(const char* data, std::size_t n, int timeout_ms);

  /**
   * @brief Read up to @p cap bytes.
   * @return Ok (n > 0), None (timeout), Closed (close_notify or EOF), Error (err set).
   */
  RxResult read_some(char* buf, std::size_t cap, int timeout_ms, std::size_t& n, Status& err);

  /// One '\n'-terminated line, decrypted byte by byte so nothing after it is consumed.
  Status read_line(std::string& line, std::size_t max_len, int timeout_ms, const CancelToken& cancel);

  /// Send close_notify (best effort) and shut the socket down in both directions.
  void shutdown();

  bool is_open() const { return open_.load(); }

private:
  UniqueFd           fd_;
  SslCtxPtr          ctx_;
  SslPtr             ssl_;
  std::mutex         ssl_mu_;
  std::atomic<bool>  open_{false};
  std::string        peer_fingerprint_;
  std::string        peer_cn_;
};

} // namespace kdc::transport
