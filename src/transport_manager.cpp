// ============================================================================
// transport_manager.cpp — implementation for transport_manager.hpp
// ============================================================================

#include "kdc/transport_manager.hpp"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

#include "kdc/clock.hpp"

namespace kdc {

using transport::CancelToken;
using transport::Connection;
using transport::HandshakeInfo;
using transport::RxResult;
using transport::TransportAddress;
using transport::TransportType;

static constexpr int BACKPRESSURE_WAIT_MS = 20;

const char* to_string(TransportPreference p) {
  switch (p) {
    case TransportPreference::PreferTcp:       return "prefer-tcp";
    case TransportPreference::PreferBluetooth: return "prefer-bluetooth";
    case TransportPreference::TcpFirst:        return "tcp-first";
    case TransportPreference::BluetoothFirst:  return "bluetooth-first";
    case TransportPreference::TcpOnly:         return "tcp-only";
    case TransportPreference::BluetoothOnly:   return "bluetooth-only";
  }
  return "?";
}

bool transport_preference_from_string(const std::string& s, TransportPreference& out) {
  static const TransportPreference all[] = {
      TransportPreference::PreferTcp, TransportPreference::PreferBluetooth, TransportPreference::TcpFirst,
      TransportPreference::BluetoothFirst, TransportPreference::TcpOnly, TransportPreference::BluetoothOnly};
  for (TransportPreference p : all) {
    if (s == to_string(p)) { out = p; return true; }
  }
  return false;
}

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Discovered:   return "discovered";
    case ConnectionState::Handshaking:  return "handshaking";
    case ConnectionState::Paired:       return "paired";
    case ConnectionState::Rejected:     return "rejected";
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Reconnecting: return "reconnecting";
    case ConnectionState::Abandoned:    return "abandoned";
  }
  return "?";
}

bool is_terminal(ConnectionState s) {
  return s == ConnectionState::Rejected || s == ConnectionState::Abandoned;
}

bool valid_transition(ConnectionState from, ConnectionState to) {
  using S = ConnectionState;
  switch (from) {
    case S::Discovered:   return to == S::Handshaking;
    case S::Handshaking:  return to == S::Paired || to == S::Rejected || to == S::Disconnected;
    case S::Paired:       return to == S::Connected || to == S::Disconnected;
    case S::Connected:    return to == S::Disconnected;
    case S::Disconnected: return to == S::Handshaking || to == S::Reconnecting;
    case S::Reconnecting: return to == S::Handshaking || to == S::Abandoned || to == S::Disconnected;
    case S::Rejected:
    case S::Abandoned:    return false;
  }
  return false;
}

const char* to_string(TransportEventKind k) {
  switch (k) {
    case TransportEventKind::Connected:      return "connected";
    case TransportEventKind::Disconnected:   return "disconnected";
    case TransportEventKind::PacketReceived: return "packet";
    case TransportEventKind::Error:          return "error";
  }
  return "?";
}

std::vector<TransportType> transport_order(TransportPreference pref, bool auto_fallback,
                                           bool has_tcp, bool has_bt) {
  std::vector<TransportType> out;
  auto add = [&out](bool have, TransportType t) { if (have) out.push_back(t); };
  switch (pref) {
    case TransportPreference::TcpOnly:
      add(has_tcp, TransportType::Tcp);
      break;
    case TransportPreference::BluetoothOnly:
      add(has_bt, TransportType::Bluetooth);
      break;
    case TransportPreference::TcpFirst:
      add(has_tcp, TransportType::Tcp);
      add(has_bt, TransportType::Bluetooth);
      break;
    case TransportPreference::BluetoothFirst:
      add(has_bt, TransportType::Bluetooth);
      add(has_tcp, TransportType::Tcp);
      break;
    case TransportPreference::PreferTcp:
      add(has_tcp, TransportType::Tcp);
      add(has_bt && (auto_fallback || !has_tcp), TransportType::Bluetooth);
      break;
    case TransportPreference::PreferBluetooth:
      add(has_bt, TransportType::Bluetooth);
      add(has_tcp && (auto_fallback || !has_bt), TransportType::Tcp);
      break;
  }
  return out;
}

Status aggregate_errors(const std::vector<std::pair<TransportAddress, Status>>& failures) {
  if (failures.empty()) return Status(ErrorKind::NotConnected, "no usable address");
  ErrorKind kind = failures.back().second.kind();
  for (const auto& f : failures) {
    if (!f.second.recoverable()) { kind = f.second.kind(); break; }
  }
  std::string detail;
  for (const auto& f : failures) {
    if (!detail.empty()) detail += "; ";
    detail += transport::to_string(f.first) + ": " + f.second.to_string();
  }
  return Status(kind, detail);
}

// ============================================================================
// Lifecycle
// ============================================================================

TransportManager::TransportManager(TransportManagerConfig cfg, PairingManager& pairing, ResourceManager* resources)
: cfg_(std::move(cfg)), pairing_(pairing), resources_(resources) {}

TransportManager::~TransportManager() {
  shutdown();
}

void TransportManager::add_transport(std::shared_ptr<transport::ITransport> t) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  transports_.push_back(std::move(t));
}

Status TransportManager::start() {
  shutting_down_.store(false);
  std::vector<std::shared_ptr<transport::ITransport>> ts;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    ts = transports_;
  }
  std::vector<std::shared_ptr<transport::ITransport>> started;
  for (auto& t : ts) {
    Status st = t->start();
    if (st) {
      started.push_back(t);
      continue;
    }
    if (t->type() == TransportType::Bluetooth) {
      spdlog::warn("transport: {} disabled: {}", t->name(), st.to_string());
      continue;
    }
    for (auto& s : started) s->stop();
    return st;
  }
  std::unique_lock<std::shared_mutex> lk(mu_);
  transports_.swap(started);
  return Status();
}

void TransportManager::shutdown() {
  shutting_down_.store(true);
  std::vector<std::shared_ptr<Link>> links;
  std::vector<std::shared_ptr<transport::ITransport>> ts;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    for (auto& kv : connecting_) kv.second.cancel();
    for (auto& kv : links_) {
      kv.second->closing.store(true);
      links.push_back(kv.second);
    }
    links_.clear();
    ts = transports_;
  }
  for (auto& l : links) stop_link(l, true);
  for (auto& t : ts) t->stop();
  reap();
}

bool TransportManager::has_transport(TransportType t) const {
  return transport_for(t) != nullptr;
}

std::shared_ptr<transport::ITransport> TransportManager::transport_for(TransportType t) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  for (const auto& tr : transports_)
    if (tr->type() == t) return tr;
  return nullptr;
}

// ============================================================================
// Device table
// ============================================================================

void TransportManager::add_address(const std::string& device_id, const TransportAddress& addr) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  DeviceEntry& e = devices_[device_id];
  auto& v = e.addresses;
  v.erase(std::remove(v.begin(), v.end(), addr), v.end());
  v.insert(v.begin(), addr);
}

std::vector<TransportAddress> TransportManager::addresses(const std::string& device_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(device_id);
  return it == devices_.end() ? std::vector<TransportAddress>() : it->second.addresses;
}

std::optional<ConnectionState> TransportManager::state(const std::string& device_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) return std::nullopt;
  return it->second.state;
}

// Caller holds mu_ exclusively.
void TransportManager::transition_locked(DeviceEntry& e, const std::string& device_id, ConnectionState to) {
  if (e.state == to) return;
  if (!valid_transition(e.state, to)) {
    spdlog::error("transport: invalid transition {} {} -> {}", device_id, to_string(e.state), to_string(to));
    return;
  }
  spdlog::debug("transport: {} {} -> {}", device_id, to_string(e.state), to_string(to));
  e.state = to;
}

Status TransportManager::transition(const std::string& device_id, ConnectionState to) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  DeviceEntry& e = devices_[device_id];
  if (e.state != to && !valid_transition(e.state, to))
    return Status(ErrorKind::Internal, std::string("invalid transition ") + to_string(e.state) + " -> " + to_string(to));
  transition_locked(e, device_id, to);
  return Status();
}

void TransportManager::set_paired(const std::string& device_id, bool paired) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  devices_[device_id].paired = paired;
}

bool TransportManager::is_paired(const std::string& device_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(device_id);
  return it != devices_.end() && it->second.paired;
}

Status TransportManager::mark_reconnecting(const std::string& device_id) {
  return transition(device_id, ConnectionState::Reconnecting);
}

// A failed reconnect attempt leaves the device Disconnected; giving up passes
// through Reconnecting so the Reconnecting -> Abandoned edge is the only way in.
Status TransportManager::mark_abandoned(const std::string& device_id) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) return Status(ErrorKind::NotConnected, device_id + " is unknown");
  DeviceEntry& e = it->second;
  if (e.state == ConnectionState::Abandoned) return Status();
  if (e.state == ConnectionState::Disconnected) transition_locked(e, device_id, ConnectionState::Reconnecting);
  if (!valid_transition(e.state, ConnectionState::Abandoned))
    return Status(ErrorKind::Internal, std::string("invalid transition ") + to_string(e.state) + " -> abandoned");
  transition_locked(e, device_id, ConnectionState::Abandoned);
  return Status();
}

void TransportManager::forget(const std::string& device_id) {
  cancel_connect(device_id);
  disconnect(device_id);
  std::unique_lock<std::shared_mutex> lk(mu_);
  devices_.erase(device_id);
}

// ============================================================================
// connect()
// ============================================================================

void TransportManager::cancel_connect(const std::string& device_id) {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = connecting_.find(device_id);
  if (it != connecting_.end()) it->second.cancel();
}

// ---------------------------------------------------------------------------
// connect()
// ---------
// One attempt per candidate address in preference order. A verification
// failure that is a security decision (pin mismatch, revoked) ends the
// attempt and marks the device Rejected; anything else moves on to the next
// candidate.
// ---------------------------------------------------------------------------
Status TransportManager::connect(const std::string& device_id, bool* installed) {
  if (installed) *installed = false;
  reap();
  if (shutting_down_.load()) return Status(ErrorKind::Cancelled, "shutting down");

  CancelToken token;
  std::vector<TransportAddress> addrs;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (links_.count(device_id)) return Status();
    if (connecting_.count(device_id))
      return Status(ErrorKind::NotConnected, "connect to " + device_id + " already in progress");
    DeviceEntry& e = devices_[device_id];
    if (e.state == ConnectionState::Rejected)
      return Status(ErrorKind::PermissionDenied, device_id + " was rejected");
    if (e.state == ConnectionState::Abandoned) e.state = ConnectionState::Disconnected;
    addrs = e.addresses;
    connecting_.emplace(device_id, token);
  }

  auto finish = [this, &device_id](const Status& st, ConnectionState to) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    connecting_.erase(device_id);
    auto it = devices_.find(device_id);
    if (it != devices_.end() && !st && it->second.state == ConnectionState::Handshaking)
      transition_locked(it->second, device_id, to);
    return st;
  };

  bool has_tcp = false, has_bt = false;
  for (const auto& a : addrs) {
    if (type_of(a) == TransportType::Tcp) has_tcp = true;
    else has_bt = true;
  }
  has_tcp = has_tcp && has_transport(TransportType::Tcp);
  has_bt  = has_bt && has_transport(TransportType::Bluetooth);
  const auto order = transport_order(cfg_.preference, cfg_.auto_fallback, has_tcp, has_bt);
  if (order.empty())
    return finish(Status(ErrorKind::NotConnected, "no usable address for " + device_id), ConnectionState::Disconnected);

  {
    Status st = admit(device_id);
    if (!st) return finish(st, ConnectionState::Disconnected);
    st = transition(device_id, ConnectionState::Handshaking);
    if (!st) {
      if (resources_) resources_->release_connection(device_id);
      return finish(st, ConnectionState::Disconnected);
    }
  }
  // The admitted slot goes to the installed link, or back to the pool.
  auto give_back = [this, &device_id](const Status& st) {
    if (resources_) resources_->release_connection(device_id);
    return st;
  };

  std::vector<std::pair<TransportAddress, Status>> failures;
  for (TransportType type : order) {
    auto tr = transport_for(type);
    for (const auto& addr : addrs) {
      if (type_of(addr) != type || !tr) continue;
      if (token.cancelled())
        return finish(give_back(Status(ErrorKind::Cancelled, "connect to " + device_id + " cancelled")),
                      ConnectionState::Disconnected);

      std::unique_ptr<Connection> conn;
      Status st = tr->connect(addr, token, conn);
      if (st && conn->handshake().peer.device_id != device_id)
        st = Status(ErrorKind::Io, transport::to_string(addr) + " is now " + conn->handshake().peer.device_id);
      if (st) st = pairing_.verify_handshake(conn->handshake());
      if (!st) {
        if (conn) conn->close();
        spdlog::log(st.critical() ? spdlog::level::err : spdlog::level::warn, "transport: connect {} via {}: {}",
                    device_id, transport::to_string(addr), st.to_string());
        if (st.is_security_violation() || st.kind() == ErrorKind::PermissionDenied)
          return finish(give_back(st), ConnectionState::Rejected);
        if (st.kind() == ErrorKind::Cancelled || token.cancelled())
          return finish(give_back(Status(ErrorKind::Cancelled, "connect to " + device_id + " cancelled")),
                        ConnectionState::Disconnected);
        failures.emplace_back(addr, st);
        continue;
      }

      Status inst = install(std::move(conn), resources_ != nullptr);
      if (inst && installed) *installed = true;
      return finish(inst, ConnectionState::Disconnected);
    }
  }
  return finish(give_back(aggregate_errors(failures)), ConnectionState::Disconnected);
}

// ---------------------------------------------------------------------------
// install()
// ---------
// Put a verified session in the table. A session that raced an existing one
// for the same device replaces it; the old one gets its own Disconnected.
// ---------------------------------------------------------------------------
Status TransportManager::admit(const std::string& device_id) {
  if (!resources_) return Status();
  return resources_->can_accept_connection(device_id, steady_ms());
}

void TransportManager::release(const Link& link) {
  if (link.admitted && resources_) resources_->release_connection(link.device_id);
}

// On failure the connection is closed and an admitted slot released.
Status TransportManager::install(std::unique_ptr<Connection> conn, bool admitted) {
  auto link = std::make_shared<Link>();
  link->device_id = conn->handshake().peer.device_id;
  link->conn      = std::shared_ptr<Connection>(std::move(conn));
  link->admitted  = admitted;
  const std::string& id = link->device_id;

  std::shared_ptr<Link> old;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = links_.find(id);
    if (it != links_.end()) {
      old = it->second;
      old->closing.store(true);
      links_.erase(it);
    }
  }
  if (old) {
    spdlog::info("transport: {} new session replaces the old one", id);
    stop_link(old, true);
  }

  TransportManagerEvent ev;
  ev.kind      = TransportEventKind::Connected;
  ev.device_id = id;
  ev.transport = link->conn->type();
  ev.info      = link->conn->handshake();
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (shutting_down_.load()) {
      link->conn->close();
      release(*link);
      return Status(ErrorKind::Cancelled, "shutting down");
    }
    DeviceEntry& e = devices_[id];
    if (is_terminal(e.state) || e.state == ConnectionState::Connected) e.state = ConnectionState::Disconnected;
    if (e.state != ConnectionState::Handshaking) transition_locked(e, id, ConnectionState::Handshaking);
    transition_locked(e, id, ConnectionState::Paired);
    transition_locked(e, id, ConnectionState::Connected);
    auto& v = e.addresses;
    v.erase(std::remove(v.begin(), v.end(), ev.info.address), v.end());
    v.insert(v.begin(), ev.info.address);
    e.paired  = pairing_.is_trusted(id);
    ev.paired = e.paired;
    links_[id] = link;
    push_event(std::move(ev));
  }
  spdlog::info("transport: {} connected via {} ({})", id, transport::to_string(link->conn->handshake().address),
               link->conn->handshake().incoming ? "incoming" : "outgoing");
  link->reader = std::thread(&TransportManager::reader_loop, this, link);
  return Status();
}

std::size_t TransportManager::accept_incoming() {
  reap();
  std::vector<std::shared_ptr<transport::ITransport>> ts;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    ts = transports_;
  }
  std::size_t n = 0;
  for (auto& t : ts) {
    std::unique_ptr<Connection> conn;
    while (t->accept(conn)) {
      const HandshakeInfo& info = conn->handshake();
      Status st = pairing_.verify_handshake(info);
      if (st) st = admit(info.peer.device_id);
      if (!st) {
        spdlog::log(st.critical() ? spdlog::level::err : spdlog::level::warn, "transport: refusing {} from {}: {}",
                    info.peer.device_id, transport::to_string(info.address), st.to_string());
        conn->close();
        if (st.is_security_violation() || st.kind() == ErrorKind::PermissionDenied) {
          std::unique_lock<std::shared_mutex> lk(mu_);
          DeviceEntry& e = devices_[info.peer.device_id];
          if (e.state == ConnectionState::Discovered || e.state == ConnectionState::Disconnected ||
              e.state == ConnectionState::Reconnecting) {
            transition_locked(e, info.peer.device_id, ConnectionState::Handshaking);
            transition_locked(e, info.peer.device_id, ConnectionState::Rejected);
          }
        }
        conn.reset();
        continue;
      }
      Status inst = install(std::move(conn), resources_ != nullptr);
      if (inst) ++n;
    }
  }
  return n;
}

// ============================================================================
// Data path
// ============================================================================

Status TransportManager::send_packet(const std::string& device_id, const Packet& p) {
  std::shared_ptr<Link> link;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = links_.find(device_id);
    if (it != links_.end()) link = it->second;
  }
  if (!link || link->ended.load()) return Status(ErrorKind::NotConnected, device_id + " is not connected");

  Status st = link->conn->send(p);
  if (!st && st.kind() != ErrorKind::PacketTooLarge) {
    // The link is broken; closing it lets the reader report the disconnect.
    spdlog::warn("transport: send {} to {}: {}", p.type, device_id, st.to_string());
    link->conn->close();
  }
  return st;
}

bool TransportManager::has_connection(const std::string& device_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = links_.find(device_id);
  return it != links_.end() && !it->second->ended.load();
}

std::optional<HandshakeInfo> TransportManager::connection_info(const std::string& device_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = links_.find(device_id);
  if (it == links_.end()) return std::nullopt;
  return it->second->conn->handshake();
}

std::vector<std::string> TransportManager::connected_devices() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& kv : links_) out.push_back(kv.first);
  return out;
}

void TransportManager::disconnect(const std::string& device_id) {
  std::shared_ptr<Link> link;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = links_.find(device_id);
    if (it == links_.end()) return;
    link = it->second;
    link->closing.store(true);
    links_.erase(it);
  }
  stop_link(link, true);
  reap();
}

// Close, join, and report (once) a link that is no longer in links_.
void TransportManager::stop_link(const std::shared_ptr<Link>& link, bool emit_event) {
  link->conn->close();
  if (link->reader.joinable() && link->reader.get_id() != std::this_thread::get_id()) link->reader.join();
  if (link->ended.exchange(true)) return;
  release(*link);
  if (!emit_event) return;

  TransportManagerEvent ev;
  ev.kind        = TransportEventKind::Disconnected;
  ev.device_id   = link->device_id;
  ev.transport   = link->conn->type();
  ev.unsolicited = false;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = devices_.find(link->device_id);
    if (it != devices_.end()) {
      ev.paired = it->second.paired;
      if (it->second.state == ConnectionState::Connected)
        transition_locked(it->second, link->device_id, ConnectionState::Disconnected);
    }
  }
  push_event(std::move(ev));
}

void TransportManager::reader_loop(std::shared_ptr<Link> link) {
  Status err;
  while (!link->ended.load()) {
    Packet p;
    RxResult r = link->conn->receive(p, cfg_.receive_slice_ms, err);
    if (r == RxResult::None) continue;
    if (r == RxResult::Ok) {
      if (resources_) resources_->touch(link->device_id, steady_ms());
      TransportManagerEvent ev;
      ev.kind      = TransportEventKind::PacketReceived;
      ev.device_id = link->device_id;
      ev.transport = link->conn->type();
      ev.packet    = std::move(p);
      while (!push_packet(ev)) {
        if (link->ended.load()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(BACKPRESSURE_WAIT_MS));
      }
      continue;
    }
    if (r == RxResult::Error) {
      if (err.critical())
        spdlog::error("transport: {} receive: {}, closing", link->device_id, err.to_string());
      else
        spdlog::warn("transport: {} receive: {}", link->device_id, err.to_string());
      link->conn->close();
    }
    link_ended(link, true, r == RxResult::Error ? err : Status());
    return;
  }
}

// Reader-side end of a link: the peer closed or the link failed.
void TransportManager::link_ended(const std::shared_ptr<Link>& link, bool unsolicited, const Status& cause) {
  if (link->ended.exchange(true)) return;
  release(*link);
  unsolicited = unsolicited && !link->closing.load();

  if (!cause.ok()) {
    TransportManagerEvent err;
    err.kind      = TransportEventKind::Error;
    err.device_id = link->device_id;
    err.transport = link->conn->type();
    err.error     = cause;
    push_event(std::move(err));
  }

  TransportManagerEvent ev;
  ev.kind        = TransportEventKind::Disconnected;
  ev.device_id   = link->device_id;
  ev.transport   = link->conn->type();
  ev.error       = cause;
  ev.unsolicited = unsolicited;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = links_.find(link->device_id);
    if (it != links_.end() && it->second == link) {
      links_.erase(it);
      graveyard_.push_back(link);
    }
    auto d = devices_.find(link->device_id);
    if (d != devices_.end()) {
      ev.paired = d->second.paired;
      if (d->second.state == ConnectionState::Connected)
        transition_locked(d->second, link->device_id, ConnectionState::Disconnected);
    }
  }
  spdlog::info("transport: {} disconnected{}", link->device_id, unsolicited ? " by peer" : "");
  push_event(std::move(ev));
}

// Join reader threads of links that ended on their own.
void TransportManager::reap() {
  std::vector<std::shared_ptr<Link>> dead;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    dead.swap(graveyard_);
  }
  for (auto& l : dead) {
    if (l->reader.joinable() && l->reader.get_id() != std::this_thread::get_id()) l->reader.join();
  }
}

// ============================================================================
// Events
// ============================================================================

void TransportManager::push_event(TransportManagerEvent ev) {
  std::lock_guard<std::mutex> lk(ev_mu_);
  if (events_.full()) {
    ++dropped_;
    spdlog::error("transport: event queue full, dropped {} for {}", to_string(ev.kind), ev.device_id);
    return;
  }
  events_.push_back(std::move(ev));
}

bool TransportManager::push_packet(TransportManagerEvent& ev) {
  std::lock_guard<std::mutex> lk(ev_mu_);
  if (events_.size() + LIFECYCLE_RESERVE >= EVENT_CAPACITY) return false;
  events_.push_back(std::move(ev));
  return true;
}

bool TransportManager::poll_event(TransportManagerEvent& out) {
  reap();
  std::lock_guard<std::mutex> lk(ev_mu_);
  if (events_.empty()) return false;
  out = std::move(events_.front());
  events_.pop_front();
  return true;
}

std::size_t TransportManager::dropped_events() const {
  std::lock_guard<std::mutex> lk(ev_mu_);
  return dropped_;
}

} // namespace kdc
