// ============================================================================
// tls_stream.cpp — implementation for transport/tls_stream.hpp
// Non-blocking OpenSSL session: every SSL_* call under ssl_mu_, waits outside it.
// ============================================================================

#include "kdc/transport/tls_stream.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>

#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace kdc::transport {

static constexpr int SLICE_MS = 100;

namespace {

std::string ssl_error_text() {
  unsigned long e = ERR_get_error();
  if (e == 0) return "no openssl detail";
  char buf[256];
  ERR_error_string_n(e, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

} // namespace

TlsStream::~TlsStream() {
  shutdown();
}

// ---------------------------------------------------------------------------
// handshake()
// -----------
// Loop SSL_accept/SSL_connect until it completes. WANT_READ/WANT_WRITE become
// poll(2) waits in SLICE_MS steps so cancel and the deadline are both honoured.
// On success the peer certificate is read once and its fingerprint cached.
// ---------------------------------------------------------------------------
Status TlsStream::handshake(const TlsIdentity& identity, bool server, int timeout_ms,
                            const CancelToken& cancel) {
  Status st = identity.make_context(server, ctx_);
  if (!st) return st;

  ssl_.reset(SSL_new(ctx_.get()));
  if (!ssl_) return Status(ErrorKind::Tls, "SSL_new: " + ssl_error_text());
  if (SSL_set_fd(ssl_.get(), fd_.get()) != 1) return Status(ErrorKind::Tls, "SSL_set_fd: " + ssl_error_text());
  set_nonblocking(fd_.get(), true);
  if (server) SSL_set_accept_state(ssl_.get());
  else        SSL_set_connect_state(ssl_.get());

  int waited = 0;
  while (true) {
    if (cancel.cancelled()) return Status(ErrorKind::Cancelled, "tls handshake cancelled");

    int rc, err;
    {
      std::lock_guard<std::mutex> lk(ssl_mu_);
      rc  = SSL_do_handshake(ssl_.get());
      err = rc == 1 ? SSL_ERROR_NONE : SSL_get_error(ssl_.get(), rc);
    }
    if (rc == 1) break;

    bool want_write = false;
    if (err == SSL_ERROR_WANT_READ)       want_write = false;
    else if (err == SSL_ERROR_WANT_WRITE) want_write = true;
    else if (err == SSL_ERROR_SYSCALL && errno != 0 && errno != EAGAIN)
      return errno_status(errno, "tls handshake");
    else
      return Status(ErrorKind::Tls, "tls handshake: " + ssl_error_text());

    if (waited >= timeout_ms) return Status(ErrorKind::Timeout, "tls handshake timed out");
    int slice = std::min(SLICE_MS, timeout_ms - waited);
    int w = wait_fd(fd_.get(), want_write, slice);
    if (w < 0) return errno_status(errno, "tls handshake");
    if (w == 0) waited += slice;
  }

  X509Ptr peer(SSL_get1_peer_certificate(ssl_.get()));
  if (!peer) return Status(ErrorKind::Tls, "peer presented no certificate");
  peer_fingerprint_ = certificate_fingerprint(peer.get());
  peer_cn_          = certificate_common_name(peer.get());
  open_.store(true);
  return Status();
}

Status TlsStream::write_all(const char* data, std::size_t n, int timeout_ms) {
  std::size_t off = 0;
  while (off < n) {
    if (!open_.load()) return Status(ErrorKind::NotConnected, "tls stream closed");

    int rc, err;
    {
      std::lock_guard<std::mutex> lk(ssl_mu_);
      ERR_clear_error();
      rc  = SSL_write(ssl_.get(), data + off, static_cast<int>(std::min<std::size_t>(n - off, 1 << 20)));
      err = rc > 0 ? SSL_ERROR_NONE : SSL_get_error(ssl_.get(), rc);
    }
    if (rc > 0) { off += static_cast<std::size_t>(rc); continue; }

    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) {
      int w = wait_fd(fd_.get(), err == SSL_ERROR_WANT_WRITE, timeout_ms);
      if (w == 0) return Status(ErrorKind::Timeout, "tls write timed out");
      if (w < 0) return errno_status(errno, "tls write");
      continue;
    }
    if (err == SSL_ERROR_SYSCALL && errno != 0) return errno_status(errno, "tls write");
    if (err == SSL_ERROR_ZERO_RETURN) return Status(ErrorKind::NotConnected, "peer closed tls session");
    return Status(ErrorKind::Tls, "tls write: " + ssl_error_text());
  }
  return Status();
}

RxResult TlsStream::read_some(char* buf, std::size_t cap, int timeout_ms, std::size_t& n, Status& err) {
  n = 0;
  bool waited_once = false;
  while (true) {
    if (!open_.load()) return RxResult::Closed;

    int rc, e;
    {
      std::lock_guard<std::mutex> lk(ssl_mu_);
      ERR_clear_error();
      rc = SSL_read(ssl_.get(), buf, static_cast<int>(std::min<std::size_t>(cap, 1 << 20)));
      e  = rc > 0 ? SSL_ERROR_NONE : SSL_get_error(ssl_.get(), rc);
    }
    if (rc > 0) { n = static_cast<std::size_t>(rc); return RxResult::Ok; }

    switch (e) {
      case SSL_ERROR_ZERO_RETURN:
        return RxResult::Closed;
      case SSL_ERROR_WANT_READ:
      case SSL_ERROR_WANT_WRITE: {
        if (waited_once) return RxResult::None;
        int w = wait_fd(fd_.get(), e == SSL_ERROR_WANT_WRITE, timeout_ms);
        if (w == 0) return RxResult::None;
        if (w < 0) { err = errno_status(errno, "tls read"); return RxResult::Error; }
        waited_once = true;
        break;
      }
      case SSL_ERROR_SYSCALL:
        if (errno == 0 || errno == ECONNRESET || errno == EPIPE) return RxResult::Closed;   // EOF without close_notify
        err = errno_status(errno, "tls read");
        return RxResult::Error;
      default:
        err = Status(ErrorKind::Tls, "tls read: " + ssl_error_text());
        return RxResult::Error;
    }
  }
}

Status TlsStream::read_line(std::string& line, std::size_t max_len, int timeout_ms,
                            const CancelToken& cancel) {
  line.clear();
  int waited = 0;
  while (true) {
    if (cancel.cancelled()) return Status(ErrorKind::Cancelled, "tls line read cancelled");
    if (waited >= timeout_ms) return Status(ErrorKind::Timeout, "tls line read timed out");

    char c = 0;
    std::size_t n = 0;
    Status err;
    int slice = std::min(SLICE_MS, timeout_ms - waited);
    RxResult r = read_some(&c, 1, slice, n, err);
    switch (r) {
      case RxResult::Ok:
        if (c == '\n') return Status();
        if (line.size() >= max_len) return Status(ErrorKind::MalformedPacket, "tls line too long");
        line.push_back(c);
        break;
      case RxResult::None:
        waited += slice;
        break;
      case RxResult::Closed:
        return Status(ErrorKind::Io, "peer closed during identity exchange");
      case RxResult::Error:
        return err;
    }
  }
}

void TlsStream::shutdown() {
  if (!fd_.valid()) return;
  if (open_.exchange(false) && ssl_) {
    std::lock_guard<std::mutex> lk(ssl_mu_);
    // close_notify is courtesy; the peer copes with a bare FIN
    if (SSL_shutdown(ssl_.get()) < 0) ERR_clear_error();
  }
  ::shutdown(fd_.get(), SHUT_RDWR);   // wakes a reader parked in poll()
}

} // namespace kdc::transport
