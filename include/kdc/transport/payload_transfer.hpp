#pragma once
/**
 * @file payload_transfer.hpp
 * @brief Bulk side channel for packet payloads (file transfer).
 *
 * @details
 * PURPOSE
 * -------
 * Payloads never travel on the control channel: a 512-byte BLE link could not
 * carry them and a 1 MiB TCP line should not. The sender opens a one-shot TLS
 * listener, advertises its port in `payloadTransferInfo.port` together with
 * `payloadSize`, and streams the bytes to whoever connects first with the
 * expected certificate.
 *
 * ```
 *   sender                                   receiver
 *   ──────                                   ────────
 *   PayloadServer::open()  → port
 *   packet{payloadSize, payloadTransferInfo{port}} ───control channel───►
 *   PayloadServer::serve() ◄──────── TCP connect ──── PayloadReceiver::receive()
 *   TLS server            ◄════════ handshake ═════► TLS client
 *   stream payloadSize bytes ═══════════════════════► write + checkpoint per chunk
 * ```
 *
 * FAILURE POLICY
 * --------------
 * A receive that does not reach exactly `payloadSize` bytes aborts the
 * `TransferStore` record and deletes the partial file before returning the
 * error. A certificate other than the one pinned for the device is
 * `CertificateMismatch`, on both ends.
 */

#include <cstdint>
#include <functional>
#include <istream>
#include <string>

#include "kdc/status.hpp"
#include "kdc/tls_identity.hpp"
#include "kdc/transfer_store.hpp"
#include "kdc/transport/socket_io.hpp"
#include "kdc/transport/transport_base.hpp"

namespace kdc::transport {

struct PayloadConfig {
  uint16_t    port_first{1739};
  uint16_t    port_last{1764};
  int         timeout_ms{10000};       ///< accept / connect / handshake / per-chunk stall
  std::size_t chunk_bytes{64 * 1024};
};

/// Sender side. One instance serves one payload.
class PayloadServer {
public:
  PayloadServer(const TlsIdentity& tls, PayloadConfig cfg) : tls_(tls), cfg_(cfg) {}

  /// Bind the listener; @p port receives the port to advertise.
  Status open(uint16_t& port);

  /**
   * @brief Wait for the receiver, run TLS as server, stream @p size bytes from @p src.
   * @param expected_fingerprint pinned fingerprint of the receiver; empty accepts any
   */
  Status serve(std::istream& src, uint64_t size, const std::string& expected_fingerprint,
               const CancelToken& cancel);

private:
  const TlsIdentity& tls_;
  PayloadConfig      cfg_;
  UniqueFd           listen_fd_;
};

/// Receiver side.
class PayloadReceiver {
public:
  /// Called after every checkpointed chunk with (bytes_received, total).
  using Progress = std::function<void(uint64_t, uint64_t)>;

  PayloadReceiver(const TlsIdentity& tls, PayloadConfig cfg, TransferStore& store)
  : tls_(tls), cfg_(cfg), store_(store) {}

  /**
   * @brief Download into @p state.destination, checkpointing each chunk.
   * @param state  transfer record; begin() is called here
   * @retval ok    file complete, record removed, file kept
   * @retval error record aborted and partial file deleted
   */
  Status receive(const std::string& ip, uint16_t port, const std::string& expected_fingerprint,
                 TransferState state, const CancelToken& cancel, const Progress& progress = {});

private:
  Status download(const std::string& ip, uint16_t port, const std::string& expected_fingerprint,
                  const TransferState& state, const CancelToken& cancel, const Progress& progress);

  const TlsIdentity& tls_;
  PayloadConfig      cfg_;
  TransferStore&     store_;
};

} // namespace kdc::transport
