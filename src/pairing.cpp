// ============================================================================
// pairing.cpp — implementation for pairing.hpp
// ============================================================================

#include "kdc/pairing.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

#include "kdc/clock.hpp"

namespace kdc {

const char* to_string(PairingPolicy p) {
  switch (p) {
    case PairingPolicy::TrustOnFirstUse: return "tofu";
    case PairingPolicy::Explicit:        return "explicit";
  }
  return "?";
}

bool pairing_policy_from_string(const std::string& s, PairingPolicy& out) {
  if (s == "tofu")     { out = PairingPolicy::TrustOnFirstUse; return true; }
  if (s == "explicit") { out = PairingPolicy::Explicit; return true; }
  return false;
}

Packet make_pair_packet(bool pair) {
  nlohmann::json body = {{"pair", pair}};
  if (pair) body["timestamp"] = wall_ms() / 1000;
  return make_packet(packet_type::PAIR, std::move(body));
}

PairingManager::PairingManager(TrustStore& store, PairingPolicy policy)
: store_(store), policy_(policy) {}

void PairingManager::emit(PairingEvent ev) {
  if (events_.full()) {
    spdlog::warn("pairing: event queue full, dropping event for {}", ev.device_id);
    return;
  }
  events_.push_back(std::move(ev));
}

bool PairingManager::poll_event(PairingEvent& out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (events_.empty()) return false;
  out = std::move(events_.front());
  events_.pop_front();
  return true;
}

TrustState PairingManager::state(const std::string& device_id) const {
  auto rec = store_.get(device_id);
  return rec ? rec->state : TrustState::Untrusted;
}

bool PairingManager::pending(const std::string& device_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return pending_.count(device_id) != 0;
}

// ---------------------------------------------------------------------------
// verify_handshake()
// ------------------
// The fingerprint check is the pin. A mismatch is a security violation: it is
// logged at error level and the record is left exactly as it was.
// ---------------------------------------------------------------------------
Status PairingManager::verify_handshake(const transport::HandshakeInfo& info) {
  const std::string& id = info.peer.device_id;
  auto rec = store_.get(id);

  if (info.peer_fingerprint.empty()) {
    if (!rec || rec->state != TrustState::Trusted)
      return Status(ErrorKind::NotPaired, "ble session from untrusted device " + id);
    if (!info.encrypted)
      return Status(ErrorKind::NotPaired, "ble link to " + id + " is not encrypted");
    return Status();
  }

  if (!rec) {
    TrustRecord fresh;
    fresh.device_id   = id;
    fresh.fingerprint = info.peer_fingerprint;
    fresh.state       = TrustState::Untrusted;
    Status st = store_.put(fresh);
    if (!st) spdlog::warn("pairing: could not persist first contact {}: {}", id, st.to_string());
    spdlog::info("pairing: first contact {} fp={}", id, info.peer_fingerprint);
    return Status();
  }

  switch (rec->state) {
    case TrustState::Trusted:
      if (rec->fingerprint != info.peer_fingerprint) {
        spdlog::error("pairing: certificate mismatch for {} pinned={} presented={}", id,
                      rec->fingerprint, info.peer_fingerprint);
        return Status(ErrorKind::CertificateMismatch, "certificate of " + id + " changed");
      }
      return Status();
    case TrustState::Revoked:
      return Status(ErrorKind::PermissionDenied, id + " is revoked");
    case TrustState::Untrusted:
    case TrustState::PendingPairing:
      if (rec->fingerprint != info.peer_fingerprint) {
        TrustRecord upd = *rec;
        upd.fingerprint = info.peer_fingerprint;
        return store_.put(upd);
      }
      return Status();
  }
  return Status(ErrorKind::Internal, "bad trust state");
}

Status PairingManager::set_state(const std::string& device_id, TrustState s) {
  auto rec = store_.get(device_id);
  if (!rec) return Status(ErrorKind::NotPaired, "no handshake seen from " + device_id);
  rec->state = s;
  if (s == TrustState::Trusted) rec->paired_ms = wall_ms();
  return store_.put(*rec);
}

// Caller holds mu_.
Status PairingManager::trust(const std::string& device_id, const std::string& reason) {
  pending_.erase(device_id);
  Status st = set_state(device_id, TrustState::Trusted);
  if (!st) return st;
  auto rec = store_.get(device_id);
  spdlog::info("pairing: {} trusted ({})", device_id, reason);
  emit(PairingEvent{PairingEventKind::PairingResult, device_id, rec ? rec->fingerprint : std::string(), true, reason});
  return Status();
}

Status PairingManager::request_pair(const std::string& device_id, int64_t now_ms, Packet& out) {
  std::lock_guard<std::mutex> lk(mu_);
  auto rec = store_.get(device_id);
  if (!rec) return Status(ErrorKind::NotConnected, "no session with " + device_id);
  if (rec->state == TrustState::Trusted) return Status();
  if (rec->state == TrustState::Revoked) return Status(ErrorKind::PermissionDenied, device_id + " is revoked");

  Status st = set_state(device_id, TrustState::PendingPairing);
  if (!st) return st;
  pending_[device_id] = Pending{true, now_ms};
  out = make_pair_packet(true);
  spdlog::info("pairing: requested {}", device_id);
  return Status();
}

Status PairingManager::handle_pair_packet(const std::string& device_id, const Packet& p, int64_t now_ms,
                                          std::optional<Packet>& reply) {
  reply.reset();
  auto flag = p.body.find("pair");
  if (p.type != packet_type::PAIR || flag == p.body.end() || !flag->is_boolean())
    return Status(ErrorKind::MalformedPacket, "pair packet without boolean 'pair'");
  const bool want = flag->get<bool>();

  std::lock_guard<std::mutex> lk(mu_);
  auto rec = store_.get(device_id);
  if (!rec) return Status(ErrorKind::NotConnected, "pair packet from unknown session " + device_id);
  auto pend = pending_.find(device_id);

  if (!want) {
    if (pend != pending_.end()) {
      pending_.erase(pend);
      Status st = set_state(device_id, TrustState::Untrusted);
      emit(PairingEvent{PairingEventKind::PairingResult, device_id, rec->fingerprint, false, "rejected by peer"});
      return st;
    }
    if (rec->state == TrustState::Trusted) {
      Status st = store_.erase(device_id);
      spdlog::info("pairing: {} unpaired by peer", device_id);
      emit(PairingEvent{PairingEventKind::PairingResult, device_id, rec->fingerprint, false, "unpaired by peer"});
      return st;
    }
    return Status();
  }

  if (rec->state == TrustState::Revoked) {
    reply = make_pair_packet(false);
    return Status(ErrorKind::PermissionDenied, device_id + " is revoked");
  }

  // Our own request answered.
  if (pend != pending_.end() && pend->second.local) return trust(device_id, "accepted by peer");

  // Peer lost its record while we kept ours: confirm again.
  if (rec->state == TrustState::Trusted) {
    reply = make_pair_packet(true);
    return Status();
  }

  auto ts = p.body.find("timestamp");
  if (ts != p.body.end() && ts->is_number_integer()) {
    const int64_t skew = std::llabs(ts->get<int64_t>() - wall_ms() / 1000);
    if (skew > PAIR_TIMESTAMP_TOLERANCE_S) {
      spdlog::warn("pairing: ignoring request from {} with clock skew {} s", device_id, skew);
      reply = make_pair_packet(false);
      return Status();
    }
  }

  if (policy_ == PairingPolicy::TrustOnFirstUse) {
    reply = make_pair_packet(true);
    return trust(device_id, "trust on first use");
  }

  if (pend == pending_.end()) {
    Status st = set_state(device_id, TrustState::PendingPairing);
    if (!st) return st;
    pending_[device_id] = Pending{false, now_ms};
    spdlog::info("pairing: {} asks to pair fp={}", device_id, rec->fingerprint);
    emit(PairingEvent{PairingEventKind::PairingRequested, device_id, rec->fingerprint, false, std::string()});
  }
  return Status();
}

Status PairingManager::accept(const std::string& device_id, Packet& out) {
  std::lock_guard<std::mutex> lk(mu_);
  auto pend = pending_.find(device_id);
  if (pend == pending_.end() || pend->second.local)
    return Status(ErrorKind::NotPaired, "no pairing request from " + device_id);
  Status st = trust(device_id, "accepted");
  if (!st) return st;
  out = make_pair_packet(true);
  return Status();
}

Status PairingManager::reject(const std::string& device_id, Packet& out) {
  std::lock_guard<std::mutex> lk(mu_);
  auto pend = pending_.find(device_id);
  if (pend == pending_.end()) return Status(ErrorKind::NotPaired, "no pairing request for " + device_id);
  pending_.erase(pend);
  Status st = set_state(device_id, TrustState::Untrusted);
  auto rec = store_.get(device_id);
  emit(PairingEvent{PairingEventKind::PairingResult, device_id, rec ? rec->fingerprint : std::string(), false, "rejected"});
  out = make_pair_packet(false);
  return st;
}

Status PairingManager::unpair(const std::string& device_id, Packet& out) {
  std::lock_guard<std::mutex> lk(mu_);
  pending_.erase(device_id);
  auto rec = store_.get(device_id);
  Status st = store_.erase(device_id);
  spdlog::info("pairing: unpaired {}", device_id);
  emit(PairingEvent{PairingEventKind::PairingResult, device_id, rec ? rec->fingerprint : std::string(), false, "unpaired"});
  out = make_pair_packet(false);
  return st;
}

void PairingManager::tick(int64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (now_ms - it->second.started_ms < PAIRING_TIMEOUT_MS) {
      ++it;
      continue;
    }
    const std::string id = it->first;
    it = pending_.erase(it);
    Status st = set_state(id, TrustState::Untrusted);
    if (!st) spdlog::warn("pairing: reset {} after timeout: {}", id, st.to_string());
    spdlog::info("pairing: request for {} timed out", id);
    auto rec = store_.get(id);
    emit(PairingEvent{PairingEventKind::PairingResult, id, rec ? rec->fingerprint : std::string(), false, "timed out"});
  }
}

} // namespace kdc
