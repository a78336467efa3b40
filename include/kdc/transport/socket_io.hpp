/**
 * @file socket_io.hpp
 * @brief Thin POSIX socket helpers used by the TCP transport, discovery and payload transfer.
 *
 * @details
 * PURPOSE
 * -------
 * Keep the raw fd work in one place: non-blocking connect bounded by a timeout
 * and a cancel flag, listening on the first free port of a range, UDP sockets
 * for broadcast/multicast, poll(2)-bounded reads and writes.
 *
 * ERROR CLASSIFICATION
 * --------------------
 * `errno` is mapped to an `ErrorKind` here and nowhere else
 * (`errno_kind()`): ECONNREFUSED → ConnectionRefused, ENETUNREACH/EHOSTUNREACH
 * → NetworkUnreachable, ETIMEDOUT → Timeout, EACCES/EPERM → PermissionDenied,
 * anything else → Io.
 *
 * OWNERSHIP
 * ---------
 * `UniqueFd` closes on destruction. Every helper that creates a socket hands
 * it back as a `UniqueFd`, so an early return or a cancelled connect never
 * leaks the descriptor.
 */
#ifndef KDC_TRANSPORT_SOCKET_IO_HPP
#define KDC_TRANSPORT_SOCKET_IO_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include <netinet/in.h>

#include "kdc/status.hpp"
#include "kdc/transport/transport_base.hpp"

namespace kdc::transport {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(UniqueFd&& o) noexcept : fd_(o.release()) {}
  UniqueFd& operator=(UniqueFd&& o) noexcept {
    if (this != &o) reset(o.release());
    return *this;
  }
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int  get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int  release() { int f = fd_; fd_ = -1; return f; }
  void reset(int fd = -1);

private:
  int fd_{-1};
};

/// errno → ErrorKind. The single classification point for socket failures.
ErrorKind errno_kind(int err);

/// Status carrying errno_kind(err) and "<what>: strerror(err)".
Status errno_status(int err, const std::string& what);

/**
 * @brief Connect to ip:port within @p timeout_ms.
 *
 * Polls in short slices so @p cancel is honoured promptly; the socket is closed
 * on every failure path.
 */
Status tcp_connect(const std::string& ip, uint16_t port, int timeout_ms,
                   const CancelToken& cancel, UniqueFd& out);

/// Listen on the first free port in [first, last]. @p bound receives the port.
Status tcp_listen(uint16_t first, uint16_t last, UniqueFd& out, uint16_t& bound);

/// Non-blocking accept. Returns false when nothing is pending.
bool tcp_accept(int listen_fd, UniqueFd& out, std::string& peer_ip);

/// UDP socket bound to @p port (0 = ephemeral), SO_BROADCAST and SO_REUSEADDR set.
Status udp_open(uint16_t port, UniqueFd& out);

/// Join an IPv4 multicast group on all interfaces.
Status udp_join_multicast(int fd, const char* group);

/// Send a datagram to ip:port.
Status udp_send(int fd, const std::string& ip, uint16_t port, const std::string& data);

/**
 * @brief Receive one datagram within @p timeout_ms.
 * @return Ok with data/peer filled, None on timeout, Error on failure.
 */
RxResult udp_recv(int fd, std::string& data, std::string& peer_ip, uint16_t& peer_port,
                  int timeout_ms, std::size_t max_size);

/// Write everything (blocking fd or non-blocking with poll), bounded by @p timeout_ms per wait.
Status write_all(int fd, const char* data, std::size_t n, int timeout_ms);

/**
 * @brief Read one '\n'-terminated line, one byte at a time.
 *
 * Used for the clear-text identity exchange that precedes TLS: reading byte by
 * byte guarantees no TLS record bytes are consumed. Lines longer than
 * @p max_len fail with MalformedPacket.
 */
Status read_line(int fd, std::string& line, std::size_t max_len, int timeout_ms,
                 const CancelToken& cancel);

/// Wait for readability/writability. 1 ready, 0 timeout, -1 error (errno set).
int wait_fd(int fd, bool for_write, int timeout_ms);

void set_nonblocking(int fd, bool on);

} // namespace kdc::transport

#endif // KDC_TRANSPORT_SOCKET_IO_HPP
