// ============================================================================
// payload_transfer.cpp — implementation for transport/payload_transfer.hpp
// ============================================================================

#include "kdc/transport/payload_transfer.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "kdc/clock.hpp"
#include "kdc/transport/tls_stream.hpp"

namespace kdc::transport {

static constexpr int SLICE_MS = 100;

static Status check_fingerprint(const TlsStream& s, const std::string& expected) {
  if (expected.empty() || s.peer_fingerprint() == expected) return Status();
  return Status(ErrorKind::CertificateMismatch,
                "payload peer fingerprint " + s.peer_fingerprint() + " is not the paired one");
}

// ============================================================================
// PayloadServer
// ============================================================================

Status PayloadServer::open(uint16_t& port) {
  return tcp_listen(cfg_.port_first, cfg_.port_last, listen_fd_, port);
}

Status PayloadServer::serve(std::istream& src, uint64_t size, const std::string& expected_fingerprint,
                            const CancelToken& cancel) {
  if (!listen_fd_.valid()) return Status(ErrorKind::Internal, "payload server not open");

  UniqueFd fd;
  std::string peer_ip;
  int waited = 0;
  while (!tcp_accept(listen_fd_.get(), fd, peer_ip)) {
    if (cancel.cancelled()) return Status(ErrorKind::Cancelled, "payload serve cancelled");
    if (waited >= cfg_.timeout_ms) return Status(ErrorKind::Timeout, "no receiver connected for payload");
    int w = wait_fd(listen_fd_.get(), false, SLICE_MS);
    if (w < 0) return errno_status(errno, "payload accept");
    if (w == 0) waited += SLICE_MS;
  }
  listen_fd_.reset();   // one receiver per payload

  TlsStream stream(std::move(fd));
  Status st = stream.handshake(tls_, /*server*/true, cfg_.timeout_ms, cancel);
  if (!st) return st;
  st = check_fingerprint(stream, expected_fingerprint);
  if (!st) return st;

  std::vector<char> buf(cfg_.chunk_bytes);
  uint64_t sent = 0;
  while (sent < size) {
    if (cancel.cancelled()) return Status(ErrorKind::Cancelled, "payload send cancelled");
    std::size_t want = static_cast<std::size_t>(std::min<uint64_t>(buf.size(), size - sent));
    src.read(buf.data(), static_cast<std::streamsize>(want));
    std::size_t got = static_cast<std::size_t>(src.gcount());
    if (got == 0) return Status(ErrorKind::Io, "payload source ended at " + std::to_string(sent) + " bytes");
    st = stream.write_all(buf.data(), got, cfg_.timeout_ms);
    if (!st) return st;
    sent += got;
  }
  spdlog::debug("payload: sent {} bytes to {}", sent, peer_ip);
  return Status();
}

// ============================================================================
// PayloadReceiver
// ============================================================================

Status PayloadReceiver::receive(const std::string& ip, uint16_t port, const std::string& expected_fingerprint,
                                TransferState state, const CancelToken& cancel, const Progress& progress) {
  state.bytes_received = 0;
  Status st = store_.begin(state);
  if (!st) return st;

  st = download(ip, port, expected_fingerprint, state, cancel, progress);
  if (!st) {
    Status ab = store_.abort(state.transfer_id, /*remove_partial*/true);
    if (!ab) spdlog::warn("payload: abort {}: {}", state.transfer_id, ab.to_string());
    return st;
  }
  return store_.complete(state.transfer_id);
}

// ---------------------------------------------------------------------------
// download()
// ----------
// Connect, TLS as client, then read until exactly total_size bytes are on
// disk. Every chunk is flushed before its checkpoint is written, so a record
// never claims more bytes than the file holds.
// ---------------------------------------------------------------------------
Status PayloadReceiver::download(const std::string& ip, uint16_t port, const std::string& expected_fingerprint,
                                 const TransferState& state, const CancelToken& cancel,
                                 const Progress& progress) {
  UniqueFd fd;
  Status st = tcp_connect(ip, port, cfg_.timeout_ms, cancel, fd);
  if (!st) return st;

  TlsStream stream(std::move(fd));
  st = stream.handshake(tls_, /*server*/false, cfg_.timeout_ms, cancel);
  if (!st) return st;
  st = check_fingerprint(stream, expected_fingerprint);
  if (!st) return st;

  std::ofstream out(state.destination, std::ios::binary | std::ios::trunc);
  if (!out) return Status(ErrorKind::PermissionDenied, "cannot create " + state.destination);

  std::vector<char> buf(cfg_.chunk_bytes);
  uint64_t received = 0;
  int idle = 0;
  while (received < state.total_size) {
    if (cancel.cancelled()) return Status(ErrorKind::Cancelled, "payload receive cancelled");

    std::size_t want = static_cast<std::size_t>(std::min<uint64_t>(buf.size(), state.total_size - received));
    std::size_t n = 0;
    Status err;
    RxResult r = stream.read_some(buf.data(), want, SLICE_MS, n, err);
    if (r == RxResult::None) {
      idle += SLICE_MS;
      if (idle >= cfg_.timeout_ms) return Status(ErrorKind::Timeout, "payload stalled");
      continue;
    }
    if (r == RxResult::Closed)
      return Status(ErrorKind::Io, "payload ended at " + std::to_string(received) + " of " +
                                   std::to_string(state.total_size) + " bytes");
    if (r == RxResult::Error) return err;
    idle = 0;

    out.write(buf.data(), static_cast<std::streamsize>(n));
    out.flush();
    if (!out) return Status(ErrorKind::Io, "write " + state.destination + " failed");
    received += n;

    st = store_.checkpoint(state.transfer_id, received, wall_ms());
    if (!st) return st;
    if (progress) progress(received, state.total_size);
  }
  spdlog::info("payload: received {} ({} bytes) from {}", state.filename, received, state.device_id);
  return Status();
}

} // namespace kdc::transport
