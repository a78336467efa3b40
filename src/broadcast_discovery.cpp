// ============================================================================
// broadcast_discovery.cpp — UDP identity broadcast + mDNS producer
// ============================================================================

#include "kdc/discovery.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>

#include <spdlog/spdlog.h>

#include "kdc/mdns.hpp"
#include "kdc/packet.hpp"

namespace kdc {

using transport::RxResult;

static constexpr std::size_t MAX_DATAGRAM = 64 * 1024;

BroadcastDiscovery::BroadcastDiscovery(BroadcastDiscoveryConfig cfg, DeviceIdentity self)
: cfg_(std::move(cfg)), self_(std::move(self)), tracker_(cfg_.lost_timeout_ms) {}

Status BroadcastDiscovery::start() {
  if (udp_fd_.valid()) return Status();
  Status st = transport::udp_open(cfg_.udp_port, udp_fd_);
  if (!st) return st;

  sockaddr_in sa{};
  socklen_t len = sizeof(sa);
  if (::getsockname(udp_fd_.get(), reinterpret_cast<sockaddr*>(&sa), &len) == 0)
    bound_port_ = ntohs(sa.sin_port);
  else
    bound_port_ = cfg_.udp_port;

  if (cfg_.enable_mdns) {
    Status ms = transport::udp_open(mdns::PORT, mdns_fd_);
    if (ms) ms = transport::udp_join_multicast(mdns_fd_.get(), mdns::MULTICAST_ADDR);
    if (!ms) {
      spdlog::warn("discovery: mdns unavailable, broadcast only: {}", ms.to_string());
      mdns_fd_.reset();
    }
  }
  next_announce_ms_ = 0;
  spdlog::info("discovery: broadcast on udp port={} mdns={}", bound_port_, mdns_fd_.valid());
  return Status();
}

void BroadcastDiscovery::stop() {
  udp_fd_.reset();
  mdns_fd_.reset();
}

// ---------------------------------------------------------------------------
// announce()
// ----------
// Identity packet to every broadcast target, then an mDNS query and our own
// announcement. Send failures are expected on hosts without a route and are
// not fatal.
// ---------------------------------------------------------------------------
void BroadcastDiscovery::announce(int64_t now_ms) {
  next_announce_ms_ = now_ms + cfg_.broadcast_interval_ms;

  const std::string line = encode(make_identity_packet(self_));
  for (const auto& target : cfg_.broadcast_targets) {
    Status st = transport::udp_send(udp_fd_.get(), target, cfg_.udp_port, line);
    if (!st) spdlog::debug("discovery: broadcast to {}: {}", target, st.to_string());
  }

  if (!mdns_fd_.valid()) return;
  Status q = transport::udp_send(mdns_fd_.get(), mdns::MULTICAST_ADDR, mdns::PORT, mdns::build_query());
  if (!q) spdlog::debug("discovery: mdns query: {}", q.to_string());
  if (self_.tcp_port) {
    Status a = transport::udp_send(mdns_fd_.get(), mdns::MULTICAST_ADDR, mdns::PORT,
                                   mdns::build_announcement(self_, cfg_.mdns_ipv4, *self_.tcp_port));
    if (!a) spdlog::debug("discovery: mdns announce: {}", a.to_string());
  }
}

void BroadcastDiscovery::on_udp_datagram(const std::string& data, const std::string& peer_ip,
                                         int64_t now_ms, std::vector<DiscoveryEvent>& out) {
  Packet p;
  CodecError ce = decode(data, p);
  if (ce != CodecError::None) {
    spdlog::debug("discovery: ignoring datagram from {}: {}", peer_ip, to_string(ce));
    return;
  }
  DiscoveryEvent ev;
  Status st = parse_identity_packet(p, ev.identity);
  if (!st) {
    spdlog::debug("discovery: bad identity from {}: {}", peer_ip, st.to_string());
    return;
  }
  if (ev.identity.device_id == self_.device_id) return;
  if (!ev.identity.tcp_port) {
    spdlog::debug("discovery: identity from {} has no tcpPort", peer_ip);
    return;
  }
  ev.address = transport::TcpAddress{peer_ip, *ev.identity.tcp_port};
  ev.source  = "broadcast";
  if (tracker_.seen(ev, now_ms)) out.push_back(std::move(ev));
}

void BroadcastDiscovery::on_mdns_datagram(const std::string& data, const std::string& peer_ip,
                                          int64_t now_ms, std::vector<DiscoveryEvent>& out) {
  if (mdns::is_service_query(data)) {
    if (mdns_fd_.valid() && self_.tcp_port) {
      Status a = transport::udp_send(mdns_fd_.get(), mdns::MULTICAST_ADDR, mdns::PORT,
                                     mdns::build_announcement(self_, cfg_.mdns_ipv4, *self_.tcp_port));
      if (!a) spdlog::debug("discovery: mdns answer: {}", a.to_string());
    }
    return;
  }

  std::vector<mdns::MdnsService> services;
  if (!mdns::parse_response(data, services)) {
    spdlog::debug("discovery: malformed mdns datagram from {}", peer_ip);
    return;
  }
  for (const auto& svc : services) {
    DiscoveryEvent ev;
    if (!mdns::identity_from_txt(svc, ev.identity)) continue;
    if (ev.identity.device_id == self_.device_id) continue;
    if (svc.port == 0) continue;
    ev.address = transport::TcpAddress{svc.ipv4.empty() ? peer_ip : svc.ipv4, svc.port};
    ev.source  = "mdns";
    if (tracker_.seen(ev, now_ms)) out.push_back(std::move(ev));
  }
}

Status BroadcastDiscovery::poll(int64_t now_ms, const transport::CancelToken& cancel,
                                std::vector<DiscoveryEvent>& out) {
  if (!udp_fd_.valid()) return Status(ErrorKind::NotConnected, "broadcast discovery not started");
  if (now_ms >= next_announce_ms_) announce(now_ms);

  pollfd fds[2] = {{udp_fd_.get(), POLLIN, 0}, {mdns_fd_.get(), POLLIN, 0}};
  const nfds_t n = mdns_fd_.valid() ? 2 : 1;
  int r = ::poll(fds, n, cancel.cancelled() ? 0 : cfg_.receive_slice_ms);
  if (r < 0 && errno != EINTR) return transport::errno_status(errno, "discovery poll");

  // Drain everything queued so one busy peer cannot starve the expiry check.
  std::string data, peer_ip;
  uint16_t peer_port = 0;
  if (r > 0 && (fds[0].revents & POLLIN)) {
    while (transport::udp_recv(udp_fd_.get(), data, peer_ip, peer_port, 0, MAX_DATAGRAM) == RxResult::Ok)
      on_udp_datagram(data, peer_ip, now_ms, out);
  }
  if (r > 0 && n == 2 && (fds[1].revents & POLLIN)) {
    while (transport::udp_recv(mdns_fd_.get(), data, peer_ip, peer_port, 0, MAX_DATAGRAM) == RxResult::Ok)
      on_mdns_datagram(data, peer_ip, now_ms, out);
  }

  tracker_.expire(now_ms, out);
  return Status();
}

} // namespace kdc
