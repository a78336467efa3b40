// ============================================================================
// socket_io.cpp — implementation for transport/socket_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "kdc/transport/socket_io.hpp"

#include <arpa/inet.h>     // inet_pton / inet_ntop
#include <fcntl.h>         // fcntl O_NONBLOCK
#include <netinet/tcp.h>   // TCP_NODELAY, keepalive knobs
#include <poll.h>          // poll(2) for every bounded wait
#include <sys/socket.h>
#include <unistd.h>        // ::close, ::read, ::write

#include <algorithm>
#include <cerrno>
#include <cstring>         // strerror

namespace kdc::transport {

static constexpr int CANCEL_SLICE_MS = 100;   // how often a blocking wait re-checks cancel

void UniqueFd::reset(int fd) {
  if (fd_ >= 0) ::close(fd_);
  fd_ = fd;
}

ErrorKind errno_kind(int err) {
  switch (err) {
    case ECONNREFUSED: return ErrorKind::ConnectionRefused;
    case ENETUNREACH:
    case EHOSTUNREACH:
    case ENETDOWN:     return ErrorKind::NetworkUnreachable;
    case ETIMEDOUT:    return ErrorKind::Timeout;
    case EACCES:
    case EPERM:        return ErrorKind::PermissionDenied;
    default:           return ErrorKind::Io;
  }
}

Status errno_status(int err, const std::string& what) {
  return Status(errno_kind(err), what + ": " + std::strerror(err));
}

void set_nonblocking(int fd, bool on) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return;
  ::fcntl(fd, F_SETFL, on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK));
}

int wait_fd(int fd, bool for_write, int timeout_ms) {
  pollfd pfd{fd, static_cast<short>(for_write ? POLLOUT : POLLIN), 0};
  while (true) {
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr < 0 && errno == EINTR) continue;
    if (pr <= 0) return pr;
    if (pfd.revents & (POLLERR | POLLNVAL)) { errno = EIO; return -1; }
    return 1;    // POLLHUP still lets read() report EOF
  }
}

static bool make_sockaddr(const std::string& ip, uint16_t port, sockaddr_in& sa) {
  std::memset(&sa, 0, sizeof(sa));
  sa.sin_family = AF_INET;
  sa.sin_port   = htons(port);
  return ::inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) == 1;
}

static void tune_tcp(int fd) {
  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
  int idle = 10, intvl = 5, cnt = 3;    // dead peer noticed in ~25s
  ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
  ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
  ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
}

// ---------------------------------------------------------------------------
// tcp_connect()
// -------------
// Non-blocking connect, then poll for writability in CANCEL_SLICE_MS steps so
// an unpair/shutdown can abort a 10s connect almost immediately. The fd lives
// in a UniqueFd from the first line, so every return path closes it.
// ---------------------------------------------------------------------------
Status tcp_connect(const std::string& ip, uint16_t port, int timeout_ms,
                   const CancelToken& cancel, UniqueFd& out) {
  sockaddr_in sa{};
  if (!make_sockaddr(ip, port, sa)) return Status(ErrorKind::Config, "bad ipv4 address " + ip);

  UniqueFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd.valid()) return errno_status(errno, "socket");
  set_nonblocking(fd.get(), true);

  int rc = ::connect(fd.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa));
  if (rc != 0 && errno != EINPROGRESS) return errno_status(errno, "connect " + ip);

  if (rc != 0) {
    int waited = 0;
    while (true) {
      if (cancel.cancelled()) return Status(ErrorKind::Cancelled, "connect " + ip + " cancelled");
      if (waited >= timeout_ms) return Status(ErrorKind::Timeout, "connect " + ip + " timed out");
      int slice = std::min(CANCEL_SLICE_MS, timeout_ms - waited);
      int w = wait_fd(fd.get(), /*for_write*/true, slice);
      if (w < 0) return errno_status(errno, "connect " + ip);
      if (w > 0) break;
      waited += slice;
    }
    int soerr = 0;
    socklen_t len = sizeof(soerr);
    ::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &soerr, &len);
    if (soerr != 0) return errno_status(soerr, "connect " + ip + ":" + std::to_string(port));
  }

  tune_tcp(fd.get());
  out = std::move(fd);
  return Status();
}

Status tcp_listen(uint16_t first, uint16_t last, UniqueFd& out, uint16_t& bound) {
  int last_err = EADDRINUSE;
  for (uint32_t port = first; port <= last; ++port) {
    UniqueFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd.valid()) return errno_status(errno, "socket");
    int one = 1;
    ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in sa{};
    sa.sin_family      = AF_INET;
    sa.sin_addr.s_addr = htonl(INADDR_ANY);
    sa.sin_port        = htons(static_cast<uint16_t>(port));
    if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
      last_err = errno;
      continue;                                  // taken: try the next port
    }
    if (::listen(fd.get(), 16) != 0) return errno_status(errno, "listen");

    if (port == 0) {                             // ephemeral request: read back the kernel's choice
      socklen_t len = sizeof(sa);
      ::getsockname(fd.get(), reinterpret_cast<sockaddr*>(&sa), &len);
      bound = ntohs(sa.sin_port);
    } else {
      bound = static_cast<uint16_t>(port);
    }
    set_nonblocking(fd.get(), true);
    out = std::move(fd);
    return Status();
  }
  return errno_status(last_err, "no free port in " + std::to_string(first) + "-" + std::to_string(last));
}

bool tcp_accept(int listen_fd, UniqueFd& out, std::string& peer_ip) {
  sockaddr_in sa{};
  socklen_t len = sizeof(sa);
  int fd = ::accept4(listen_fd, reinterpret_cast<sockaddr*>(&sa), &len, SOCK_CLOEXEC);
  if (fd < 0) return false;

  char text[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &sa.sin_addr, text, sizeof(text));
  peer_ip = text;
  tune_tcp(fd);
  out.reset(fd);
  return true;
}

Status udp_open(uint16_t port, UniqueFd& out) {
  UniqueFd fd(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (!fd.valid()) return errno_status(errno, "udp socket");
  int one = 1;
  ::setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  ::setsockopt(fd.get(), SOL_SOCKET, SO_BROADCAST, &one, sizeof(one));

  sockaddr_in sa{};
  sa.sin_family      = AF_INET;
  sa.sin_addr.s_addr = htonl(INADDR_ANY);
  sa.sin_port        = htons(port);
  if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0)
    return errno_status(errno, "udp bind " + std::to_string(port));
  out = std::move(fd);
  return Status();
}

Status udp_join_multicast(int fd, const char* group) {
  ip_mreq mreq{};
  if (::inet_pton(AF_INET, group, &mreq.imr_multiaddr) != 1)
    return Status(ErrorKind::Config, std::string("bad multicast group ") + group);
  mreq.imr_interface.s_addr = htonl(INADDR_ANY);
  if (::setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) != 0)
    return errno_status(errno, "IP_ADD_MEMBERSHIP");
  unsigned char loop = 1;
  ::setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));
  return Status();
}

Status udp_send(int fd, const std::string& ip, uint16_t port, const std::string& data) {
  sockaddr_in sa{};
  if (!make_sockaddr(ip, port, sa)) return Status(ErrorKind::Config, "bad ipv4 address " + ip);
  ssize_t n = ::sendto(fd, data.data(), data.size(), 0, reinterpret_cast<sockaddr*>(&sa), sizeof(sa));
  if (n < 0) return errno_status(errno, "sendto " + ip);
  return Status();
}

RxResult udp_recv(int fd, std::string& data, std::string& peer_ip, uint16_t& peer_port,
                  int timeout_ms, std::size_t max_size) {
  int w = wait_fd(fd, false, timeout_ms);
  if (w == 0) return RxResult::None;
  if (w < 0) return RxResult::Error;

  data.resize(max_size);
  sockaddr_in sa{};
  socklen_t len = sizeof(sa);
  ssize_t n = ::recvfrom(fd, &data[0], data.size(), MSG_DONTWAIT,
                         reinterpret_cast<sockaddr*>(&sa), &len);
  if (n < 0) {
    data.clear();
    return (errno == EAGAIN || errno == EWOULDBLOCK) ? RxResult::None : RxResult::Error;
  }
  data.resize(static_cast<std::size_t>(n));

  char text[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &sa.sin_addr, text, sizeof(text));
  peer_ip   = text;
  peer_port = ntohs(sa.sin_port);
  return RxResult::Ok;
}

Status write_all(int fd, const char* data, std::size_t n, int timeout_ms) {
  std::size_t off = 0;
  while (off < n) {
    ssize_t w = ::send(fd, data + off, n - off, MSG_NOSIGNAL);
    if (w > 0) { off += static_cast<std::size_t>(w); continue; }
    if (w < 0 && errno == EINTR) continue;
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      int r = wait_fd(fd, true, timeout_ms);
      if (r == 0) return Status(ErrorKind::Timeout, "write timed out");
      if (r < 0) return errno_status(errno, "write");
      continue;
    }
    return errno_status(errno, "write");
  }
  return Status();
}

// ---------------------------------------------------------------------------
// read_line()
// -----------
// Byte-at-a-time read of the clear-text identity line. Slow, but it never
// swallows the first bytes of the TLS ClientHello that follows on the same fd.
// ---------------------------------------------------------------------------
Status read_line(int fd, std::string& line, std::size_t max_len, int timeout_ms,
                 const CancelToken& cancel) {
  line.clear();
  int waited = 0;
  char c = 0;
  while (true) {
    if (cancel.cancelled()) return Status(ErrorKind::Cancelled, "identity read cancelled");
    int slice = std::min(CANCEL_SLICE_MS, timeout_ms - waited);
    if (slice <= 0) return Status(ErrorKind::Timeout, "identity read timed out");

    int w = wait_fd(fd, false, slice);
    if (w < 0) return errno_status(errno, "identity read");
    if (w == 0) { waited += slice; continue; }

    ssize_t n = ::recv(fd, &c, 1, MSG_DONTWAIT);
    if (n == 0) return Status(ErrorKind::Io, "peer closed during identity exchange");
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      return errno_status(errno, "identity read");
    }
    if (c == '\n') return Status();
    if (line.size() >= max_len) return Status(ErrorKind::MalformedPacket, "identity line too long");
    line.push_back(c);
  }
}

} // namespace kdc::transport
