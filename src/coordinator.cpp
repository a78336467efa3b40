// ============================================================================
// coordinator.cpp — implementation for coordinator.hpp
// ============================================================================

#include "kdc/coordinator.hpp"

#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "kdc/clock.hpp"

namespace kdc {

using transport::TcpAddress;
using transport::TransportAddress;

const char* to_string(CoreEventKind k) {
  switch (k) {
    case CoreEventKind::Discovered:       return "discovered";
    case CoreEventKind::Lost:             return "lost";
    case CoreEventKind::Connected:        return "connected";
    case CoreEventKind::Disconnected:     return "disconnected";
    case CoreEventKind::PairingRequested: return "pairing-requested";
    case CoreEventKind::PairingResult:    return "pairing-result";
    case CoreEventKind::PacketReceived:   return "packet";
    case CoreEventKind::DeliveryFailed:   return "delivery-failed";
    case CoreEventKind::Error:            return "error";
  }
  return "?";
}

// ============================================================================
// AsyncConnector
// ============================================================================

AsyncConnector::AsyncConnector(TransportManager& transports, RecoveryManager& recovery)
: transports_(transports), recovery_(recovery) {}

AsyncConnector::~AsyncConnector() {
  stop();
}

void AsyncConnector::start_reconnect(const std::string& device_id) {
  launch(device_id, true);
}

void AsyncConnector::start_connect(const std::string& device_id) {
  if (busy(device_id)) return;
  launch(device_id, false);
}

void AsyncConnector::launch(const std::string& device_id, bool report) {
  reap(false);
  std::lock_guard<std::mutex> lk(mu_);
  if (stopped_) {
    if (report) recovery_.on_reconnect_result(device_id, Status(ErrorKind::Cancelled, "shutting down"), steady_ms());
    return;
  }
  Worker w;
  w.device_id = device_id;
  w.done      = std::make_shared<std::atomic<bool>>(false);
  auto done   = w.done;
  w.thread = std::thread([this, device_id, report, done] {
    Status st = transports_.connect(device_id);
    if (report) {
      recovery_.on_reconnect_result(device_id, st, steady_ms());
    } else if (!st) {
      spdlog::debug("coordinator: connect {}: {}", device_id, st.to_string());
    }
    done->store(true);
  });
  workers_.push_back(std::move(w));
}

// Join finished workers, or every worker when @p all.
void AsyncConnector::reap(bool all) {
  std::list<Worker> dead;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (all || it->done->load()) {
        dead.splice(dead.end(), workers_, it++);
      } else {
        ++it;
      }
    }
  }
  for (auto& w : dead)
    if (w.thread.joinable()) w.thread.join();
}

void AsyncConnector::stop() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopped_ = true;
    for (const auto& w : workers_) ids.push_back(w.device_id);
  }
  for (const auto& id : ids) transports_.cancel_connect(id);
  reap(true);
}

bool AsyncConnector::busy(const std::string& device_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& w : workers_)
    if (w.device_id == device_id && !w.done->load()) return true;
  return false;
}

std::size_t AsyncConnector::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& w : workers_)
    if (!w.done->load()) ++n;
  return n;
}

// ============================================================================
// RecoveryCoordinator
// ============================================================================

RecoveryCoordinator::RecoveryCoordinator(DeviceIdentity self, DiscoveryService& discovery,
                                         TransportManager& transports, PairingManager& pairing,
                                         RecoveryManager& recovery, ResourceManager& resources,
                                         TransferStore& transfers, AsyncConnector* connector,
                                         DeviceRegistry* registry)
: self_(std::move(self)), discovery_(discovery), transports_(transports), pairing_(pairing),
  recovery_(recovery), resources_(resources), transfers_(transfers), connector_(connector),
  registry_(registry) {}

void RecoveryCoordinator::emit(CoreEvent ev) {
  std::lock_guard<std::mutex> lk(ev_mu_);
  if (events_.full()) {
    ++dropped_;
    spdlog::error("coordinator: event queue full, dropped {} for {}", to_string(ev.kind), ev.device_id);
    return;
  }
  events_.push_back(std::move(ev));
}

bool RecoveryCoordinator::poll_event(CoreEvent& out) {
  std::lock_guard<std::mutex> lk(ev_mu_);
  if (events_.empty()) return false;
  out = std::move(events_.front());
  events_.pop_front();
  return true;
}

std::size_t RecoveryCoordinator::dropped_events() const {
  std::lock_guard<std::mutex> lk(ev_mu_);
  return dropped_;
}

// ---------------------------------------------------------------------------
// tick()
// ------
// Fixed order: discovery, inbound sessions, transport events, pairing,
// recovery. Each queue is drained completely so nothing waits a full tick.
// ---------------------------------------------------------------------------
void RecoveryCoordinator::tick(int64_t now_ms, int64_t wall_ms) {
  DiscoveryEvent dev;
  while (discovery_.poll_event(dev)) on_discovery(dev, wall_ms);

  transports_.accept_incoming();

  TransportManagerEvent tev;
  while (transports_.poll_event(tev)) on_transport(tev, now_ms, wall_ms);

  pairing_.tick(now_ms);
  PairingEvent pev;
  while (pairing_.poll_event(pev)) on_pairing(pev);

  recovery_.tick(now_ms);
  RecoveryEvent rev;
  while (recovery_.poll_event(rev)) on_recovery(rev);
}

void RecoveryCoordinator::on_discovery(const DiscoveryEvent& ev, int64_t wall_ms) {
  const std::string& id = ev.identity.device_id;
  CoreEvent out;
  out.device_id = id;
  out.identity  = ev.identity;
  out.address   = ev.address;
  out.transport = transport::type_of(ev.address);

  if (ev.kind == DiscoveryEventKind::DeviceLost) {
    out.kind = CoreEventKind::Lost;
    emit(std::move(out));
    return;
  }

  transports_.add_address(id, ev.address);
  if (registry_) registry_->remember(ev.identity, ev.address, wall_ms);
  out.kind = CoreEventKind::Discovered;
  emit(std::move(out));

  if (!connector_ || transports_.has_connection(id)) return;
  auto st = transports_.state(id);
  if (st && (is_terminal(*st) || *st == ConnectionState::Reconnecting)) return;
  if (recovery_.reconnect_scheduled(id)) return;
  connector_->start_connect(id);
}

void RecoveryCoordinator::on_transport(TransportManagerEvent& ev, int64_t now_ms, int64_t wall_ms) {
  CoreEvent out;
  out.device_id = ev.device_id;
  out.transport = ev.transport;

  switch (ev.kind) {
    case TransportEventKind::Connected: {
      const bool trusted = pairing_.is_trusted(ev.device_id);
      transports_.set_paired(ev.device_id, trusted);
      recovery_.on_connected(ev.device_id, now_ms);
      if (registry_) registry_->remember(ev.info.peer, ev.info.address, wall_ms);
      out.kind     = CoreEventKind::Connected;
      out.identity = ev.info.peer;
      out.address  = ev.info.address;
      out.paired   = trusted;
      emit(std::move(out));
      return;
    }
    case TransportEventKind::Disconnected:
      recovery_.on_disconnected(ev.device_id, ev.unsolicited, ev.paired, now_ms);
      out.kind   = CoreEventKind::Disconnected;
      out.paired = ev.paired;
      out.error  = ev.error;
      emit(std::move(out));
      return;
    case TransportEventKind::PacketReceived:
      on_packet(ev, now_ms);
      return;
    case TransportEventKind::Error:
      // Recoverable link errors are handled by reconnection; the rest is surfaced.
      if (ev.error.recoverable()) return;
      out.kind  = CoreEventKind::Error;
      out.error = ev.error;
      emit(std::move(out));
      return;
  }
}

void RecoveryCoordinator::on_packet(TransportManagerEvent& ev, int64_t now_ms) {
  const std::string& id = ev.device_id;
  const Packet& p = ev.packet;

  if (p.type == packet_type::PAIR) {
    std::optional<Packet> reply;
    Status st = pairing_.handle_pair_packet(id, p, now_ms, reply);
    if (!st) spdlog::warn("coordinator: pair packet from {}: {}", id, st.to_string());
    if (reply) {
      Status sent = transports_.send_packet(id, *reply);
      if (!sent) spdlog::warn("coordinator: pair reply to {}: {}", id, sent.to_string());
    }
    return;
  }
  if (p.type == packet_type::IDENTITY) {
    spdlog::debug("coordinator: ignoring identity from {} inside a session", id);
    return;
  }
  if (!pairing_.is_trusted(id)) {
    spdlog::warn("coordinator: dropping {} from unpaired {}", p.type, id);
    return;
  }

  auto info = transports_.connection_info(id);
  if (info && !self_.incoming.empty() && !info->peer.outgoing.empty()) {
    const CapabilitySet allowed = receivable_types(self_, info->peer);
    if (!allowed.count(p.type)) {
      spdlog::debug("coordinator: dropping {} from {}: not a shared capability", p.type, id);
      return;
    }
  }

  CoreEvent out;
  out.kind      = CoreEventKind::PacketReceived;
  out.device_id = id;
  out.transport = ev.transport;
  out.packet    = std::move(ev.packet);
  emit(std::move(out));
}

void RecoveryCoordinator::on_pairing(const PairingEvent& ev) {
  CoreEvent out;
  out.device_id   = ev.device_id;
  out.fingerprint = ev.fingerprint;

  if (ev.kind == PairingEventKind::PairingRequested) {
    out.kind = CoreEventKind::PairingRequested;
    emit(std::move(out));
    return;
  }

  transports_.set_paired(ev.device_id, ev.accepted);
  out.kind     = CoreEventKind::PairingResult;
  out.accepted = ev.accepted;
  out.reason   = ev.reason;
  emit(std::move(out));

  // Trust erased: the next session starts from first contact.
  if (!ev.accepted && !pairing_.has_record(ev.device_id)) {
    recovery_.cancel(ev.device_id);
    transports_.disconnect(ev.device_id);
  }
}

void RecoveryCoordinator::on_recovery(const RecoveryEvent& ev) {
  CoreEvent out;
  out.device_id = ev.device_id;
  switch (ev.kind) {
    case RecoveryEventKind::ReconnectScheduled: {
      Status st = transports_.mark_reconnecting(ev.device_id);
      if (!st) spdlog::debug("coordinator: {}: {}", ev.device_id, st.to_string());
      return;
    }
    case RecoveryEventKind::ReconnectAbandoned: {
      Status st = transports_.mark_abandoned(ev.device_id);
      if (!st) spdlog::warn("coordinator: {}: {}", ev.device_id, st.to_string());
      out.kind  = CoreEventKind::Error;
      out.error = ev.error.ok() ? Status(ErrorKind::NotConnected, "reconnection abandoned") : ev.error;
      emit(std::move(out));
      return;
    }
    case RecoveryEventKind::DeliveryFailed:
      out.kind      = CoreEventKind::DeliveryFailed;
      out.packet_id = ev.packet_id;
      out.reason    = ev.packet_type;
      out.error     = ev.error;
      emit(std::move(out));
      return;
  }
}

void RecoveryCoordinator::maintenance(int64_t now_ms, int64_t wall_ms) {
  for (const auto& id : resources_.stale_connections(now_ms)) {
    spdlog::info("coordinator: closing idle connection to {}", id);
    transports_.disconnect(id);
  }
  std::size_t gc = transfers_.cleanup_stale(wall_ms);
  if (gc) spdlog::info("coordinator: removed {} stale transfer record(s)", gc);
  if (registry_) {
    Status st = registry_->save();
    if (!st) spdlog::warn("coordinator: saving device registry: {}", st.to_string());
  }
}

// ============================================================================
// Plugin-facing operations
// ============================================================================

Status RecoveryCoordinator::send(const std::string& device_id, const Packet& p, int64_t now_ms) {
  const bool control = p.type == packet_type::PAIR || p.type == packet_type::IDENTITY;
  if (!control && !pairing_.is_trusted(device_id))
    return Status(ErrorKind::NotPaired, device_id + " is not paired");

  auto info = transports_.connection_info(device_id);
  if (!control && info && !self_.outgoing.empty() && !info->peer.incoming.empty()) {
    if (!sendable_types(self_, info->peer).count(p.type))
      return Status(ErrorKind::Unsupported, device_id + " does not accept " + p.type);
  }
  return recovery_.send(device_id, p, now_ms);
}

Status RecoveryCoordinator::pair(const std::string& device_id, int64_t now_ms) {
  if (!transports_.has_connection(device_id))
    return Status(ErrorKind::NotConnected, device_id + " is not connected");
  Packet out;
  Status st = pairing_.request_pair(device_id, now_ms, out);
  if (!st) return st;
  return transports_.send_packet(device_id, out);
}

Status RecoveryCoordinator::accept_pairing(const std::string& device_id) {
  Packet out;
  Status st = pairing_.accept(device_id, out);
  if (!st) return st;
  transports_.set_paired(device_id, true);
  return transports_.send_packet(device_id, out);
}

Status RecoveryCoordinator::reject_pairing(const std::string& device_id) {
  Packet out;
  Status st = pairing_.reject(device_id, out);
  if (!st) return st;
  Status sent = transports_.send_packet(device_id, out);
  if (!sent) spdlog::debug("coordinator: reject to {} not delivered: {}", device_id, sent.to_string());
  return Status();
}

Status RecoveryCoordinator::unpair(const std::string& device_id) {
  Packet out;
  Status st = pairing_.unpair(device_id, out);
  if (st) {
    Status sent = transports_.send_packet(device_id, out);
    if (!sent) spdlog::debug("coordinator: unpair to {} not delivered: {}", device_id, sent.to_string());
  } else {
    spdlog::warn("coordinator: unpair {}: {}", device_id, st.to_string());
  }
  recovery_.cancel(device_id);
  transports_.cancel_connect(device_id);
  transports_.set_paired(device_id, false);
  transports_.disconnect(device_id);
  return st;
}

Status RecoveryCoordinator::receive_payload(const std::string& device_id, const Packet& p,
                                            const std::string& destination,
                                            transport::PayloadReceiver& receiver,
                                            const transport::CancelToken& cancel,
                                            const transport::PayloadReceiver::Progress& progress) {
  if (!p.has_payload()) return Status(ErrorKind::Unsupported, p.type + " carries no payload");
  if (!pairing_.is_trusted(device_id)) return Status(ErrorKind::NotPaired, device_id + " is not paired");
  auto info = transports_.connection_info(device_id);
  if (!info) return Status(ErrorKind::NotConnected, device_id + " is not connected");
  const TcpAddress* tcp = std::get_if<TcpAddress>(&info->address);
  if (!tcp) return Status(ErrorKind::Unsupported, "payloads need a TCP session");

  const uint64_t size = *p.payload_size;
  Status st = resources_.can_start_transfer(device_id, size);
  if (!st) return st;

  TransferState t;
  t.transfer_id = device_id + "-" + std::to_string(p.id);
  t.device_id   = device_id;
  auto fn = p.body.find("filename");
  if (fn != p.body.end() && fn->is_string()) t.filename = fn->get<std::string>();
  t.destination = destination;
  t.total_size  = size;
  t.started_ms  = wall_ms();
  t.updated_ms  = t.started_ms;

  spdlog::info("coordinator: receiving {} bytes from {} into {}", size, device_id, destination);
  st = receiver.receive(tcp->ip, p.payload_transfer_info->port, info->peer_fingerprint, t, cancel, progress);
  resources_.finish_transfer(device_id, size);
  if (!st) spdlog::warn("coordinator: transfer {} failed: {}", t.transfer_id, st.to_string());
  return st;
}

Status RecoveryCoordinator::send_payload(const std::string& device_id, Packet p, std::istream& src,
                                         uint64_t size, transport::PayloadServer& server,
                                         const transport::CancelToken& cancel) {
  if (!pairing_.is_trusted(device_id)) return Status(ErrorKind::NotPaired, device_id + " is not paired");
  auto info = transports_.connection_info(device_id);
  if (!info) return Status(ErrorKind::NotConnected, device_id + " is not connected");
  if (!std::holds_alternative<TcpAddress>(info->address))
    return Status(ErrorKind::Unsupported, "payloads need a TCP session");

  Status st = resources_.can_start_transfer(device_id, size);
  if (!st) return st;

  uint16_t port = 0;
  st = server.open(port);
  if (st) {
    p.payload_size          = size;
    p.payload_transfer_info = PayloadTransferInfo{port};
    st = transports_.send_packet(device_id, p);
  }
  if (st) st = server.serve(src, size, info->peer_fingerprint, cancel);
  resources_.finish_transfer(device_id, size);
  if (!st) spdlog::warn("coordinator: sending payload to {}: {}", device_id, st.to_string());
  return st;
}

void RecoveryCoordinator::shutdown() {
  if (connector_) connector_->stop();
  discovery_.stop();
  transports_.shutdown();
  if (registry_) {
    Status st = registry_->save();
    if (!st) spdlog::warn("coordinator: saving device registry: {}", st.to_string());
  }
}

} // namespace kdc
