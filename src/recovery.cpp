// ============================================================================
// recovery.cpp — implementation for recovery.hpp
// Lock order: a device's io lock, then mu_, then ev_mu_. Sends happen with
// only the io lock held.
// ============================================================================

#include "kdc/recovery.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "kdc/resource_manager.hpp"

namespace kdc {

const char* to_string(RecoveryEventKind k) {
  switch (k) {
    case RecoveryEventKind::ReconnectScheduled: return "reconnect-scheduled";
    case RecoveryEventKind::ReconnectAbandoned: return "reconnect-abandoned";
    case RecoveryEventKind::DeliveryFailed:     return "delivery-failed";
  }
  return "?";
}

int64_t ReconnectionStrategy::next_delay_ms() const {
  int64_t d = policy_.initial_delay_ms;
  for (uint32_t i = 0; i < failures_ && d < policy_.max_delay_ms; ++i) d *= 2;
  return std::min(d, policy_.max_delay_ms);
}

RecoveryManager::RecoveryManager(PacketSink& sink, ResourceManager* resources,
                                 ReconnectPolicy reconnect, RetryPolicy retry)
: sink_(sink), resources_(resources), reconnect_(reconnect), retry_(retry) {}

// Caller holds mu_.
RecoveryManager::DeviceRecovery& RecoveryManager::entry(const std::string& device_id) {
  auto it = devices_.find(device_id);
  if (it == devices_.end())
    it = devices_.emplace(device_id, DeviceRecovery{ReconnectionStrategy(reconnect_), false, false, 0, {}}).first;
  return it->second;
}

std::shared_ptr<std::mutex> RecoveryManager::device_lock(const std::string& device_id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto& m = io_locks_[device_id];
  if (!m) m = std::make_shared<std::mutex>();
  return m;
}

void RecoveryManager::emit(RecoveryEvent ev) {
  std::lock_guard<std::mutex> lk(ev_mu_);
  if (events_.full()) {
    spdlog::error("recovery: event queue full, dropped {} for {}", to_string(ev.kind), ev.device_id);
    return;
  }
  events_.push_back(std::move(ev));
}

bool RecoveryManager::poll_event(RecoveryEvent& out) {
  std::lock_guard<std::mutex> lk(ev_mu_);
  if (events_.empty()) return false;
  out = std::move(events_.front());
  events_.pop_front();
  return true;
}

void RecoveryManager::release(const std::string& device_id, uint64_t bytes) {
  if (resources_) resources_->dequeue_packet(device_id, bytes);
}

void RecoveryManager::drop(const std::string& device_id, const QueuedPacket& q, const Status& why) {
  release(device_id, q.bytes);
  spdlog::warn("recovery: dropping {} for {} after {} retries: {}", q.packet.type, device_id, q.attempts,
               why.to_string());
  RecoveryEvent ev;
  ev.kind        = RecoveryEventKind::DeliveryFailed;
  ev.device_id   = device_id;
  ev.packet_id   = q.packet.id;
  ev.packet_type = q.packet.type;
  ev.error       = why;
  emit(std::move(ev));
}

// ============================================================================
// Packet retry
// ============================================================================

Status RecoveryManager::send(const std::string& device_id, const Packet& p, int64_t now_ms) {
  auto io = device_lock(device_id);
  std::lock_guard<std::mutex> order(*io);

  bool behind = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = devices_.find(device_id);
    behind = it != devices_.end() && !it->second.queue.empty();
  }

  QueuedPacket q;
  q.packet = p;
  q.bytes  = encoded_size(p);
  if (!behind) {
    Status st = sink_.send_packet(device_id, p);
    if (st || !st.recoverable()) return st;
    spdlog::debug("recovery: send {} to {} failed ({}), queued for retry", p.type, device_id, st.to_string());
    q.due_ms = now_ms + retry_.retry_delay_ms;
  } else {
    q.due_ms = now_ms;
  }

  if (resources_) {
    Status gate = resources_->try_enqueue_packet(device_id, q.bytes);
    if (!gate) return gate;
  }
  std::lock_guard<std::mutex> lk(mu_);
  entry(device_id).queue.push_back(std::move(q));
  return Status();
}

// ---------------------------------------------------------------------------
// process_retries()
// -----------------
// Per device, only the head of the queue is tried; a failing head blocks the
// packets behind it until it is delivered or dropped.
// ---------------------------------------------------------------------------
void RecoveryManager::process_retries(int64_t now_ms) {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : devices_)
      if (!kv.second.queue.empty()) ids.push_back(kv.first);
  }

  for (const auto& id : ids) {
    auto io = device_lock(id);
    std::lock_guard<std::mutex> order(*io);
    while (true) {
      Packet head;
      {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = devices_.find(id);
        if (it == devices_.end() || it->second.queue.empty() || it->second.queue.front().due_ms > now_ms) break;
        head = it->second.queue.front().packet;
      }

      Status st = sink_.send_packet(id, head);

      QueuedPacket done;
      bool dropped = false;
      {
        std::lock_guard<std::mutex> lk(mu_);
        DeviceRecovery& d = entry(id);
        QueuedPacket& q = d.queue.front();
        if (st) {
          done = std::move(q);
          d.queue.pop_front();
        } else {
          ++q.attempts;
          if (q.attempts >= retry_.max_attempts || !st.recoverable()) {
            done = std::move(q);
            d.queue.pop_front();
            dropped = true;
          } else {
            q.due_ms = now_ms + retry_.retry_delay_ms;
          }
        }
      }
      if (st) {
        release(id, done.bytes);
        spdlog::debug("recovery: retried {} to {} delivered", done.packet.type, id);
        continue;
      }
      if (dropped) {
        drop(id, done, st);
        continue;
      }
      break;
    }
  }
}

// ============================================================================
// Connection lifecycle
// ============================================================================

void RecoveryManager::on_connected(const std::string& device_id, int64_t /*now_ms*/) {
  auto io = device_lock(device_id);
  std::lock_guard<std::mutex> order(*io);

  std::deque<QueuedPacket> pending;
  {
    std::lock_guard<std::mutex> lk(mu_);
    DeviceRecovery& d = entry(device_id);
    if (d.strategy.attempts() > 0) spdlog::info("recovery: {} back, backoff reset", device_id);
    d.strategy.reset();
    d.scheduled = false;
    d.in_flight = false;
    pending.swap(d.queue);
  }

  Status failed;
  for (auto& q : pending) {
    if (failed.ok()) {
      Status st = sink_.send_packet(device_id, q.packet);
      if (st) {
        release(device_id, q.bytes);
        continue;
      }
      failed = st;
    }
    drop(device_id, q, failed);
  }
  if (!pending.empty())
    spdlog::info("recovery: flushed {} queued packet(s) to {}", pending.size(), device_id);
}

// Caller holds mu_.
void RecoveryManager::schedule(const std::string& device_id, DeviceRecovery& d, int64_t now_ms) {
  const int64_t delay = d.strategy.next_delay_ms();
  d.scheduled = true;
  d.due_ms    = now_ms + delay;
  spdlog::info("recovery: reconnect {} in {} ms (attempt {}/{})", device_id, delay,
               d.strategy.attempts() + 1, reconnect_.max_attempts);
  RecoveryEvent ev;
  ev.kind      = RecoveryEventKind::ReconnectScheduled;
  ev.device_id = device_id;
  ev.delay_ms  = delay;
  ev.attempt   = d.strategy.attempts() + 1;
  emit(std::move(ev));
}

void RecoveryManager::on_disconnected(const std::string& device_id, bool unsolicited, bool paired, int64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  DeviceRecovery& d = entry(device_id);
  if (!unsolicited || !paired) {
    d.scheduled = false;
    spdlog::debug("recovery: {} not recovered ({})", device_id, !paired ? "not paired" : "local disconnect");
    return;
  }
  if (d.scheduled || d.in_flight) return;
  schedule(device_id, d, now_ms);
}

std::vector<std::string> RecoveryManager::take_due_reconnects(int64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> due;
  for (auto& kv : devices_) {
    DeviceRecovery& d = kv.second;
    if (!d.scheduled || d.in_flight || d.due_ms > now_ms) continue;
    d.scheduled = false;
    d.in_flight = true;
    due.push_back(kv.first);
  }
  return due;
}

void RecoveryManager::on_reconnect_result(const std::string& device_id, const Status& result, int64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) return;   // cancelled meanwhile
  DeviceRecovery& d = it->second;
  d.in_flight = false;
  if (result) {
    d.strategy.reset();
    return;
  }

  d.strategy.record_failure();
  if (d.strategy.exhausted() || !result.recoverable()) {
    spdlog::warn("recovery: giving up on {} after {} attempt(s): {}", device_id, d.strategy.attempts(),
                 result.to_string());
    RecoveryEvent ev;
    ev.kind      = RecoveryEventKind::ReconnectAbandoned;
    ev.device_id = device_id;
    ev.attempt   = d.strategy.attempts();
    ev.error     = result;
    emit(std::move(ev));
    return;
  }
  spdlog::warn("recovery: reconnect {} failed: {}", device_id, result.to_string());
  schedule(device_id, d, now_ms);
}

void RecoveryManager::cancel(const std::string& device_id) {
  auto io = device_lock(device_id);
  std::lock_guard<std::mutex> order(*io);
  std::deque<QueuedPacket> pending;
  {
    std::lock_guard<std::mutex> lk(mu_);
    io_locks_.erase(device_id);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) return;
    pending.swap(it->second.queue);
    devices_.erase(it);
  }
  spdlog::debug("recovery: cancelled {}", device_id);
  const Status why(ErrorKind::Cancelled, "recovery cancelled");
  for (const auto& q : pending) drop(device_id, q, why);
}

void RecoveryManager::tick(int64_t now_ms) {
  process_retries(now_ms);
  if (!link_) return;
  for (const auto& id : take_due_reconnects(now_ms)) link_->start_reconnect(id);
}

// ============================================================================
// Inspection
// ============================================================================

uint32_t RecoveryManager::reconnect_attempts(const std::string& device_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = devices_.find(device_id);
  return it == devices_.end() ? 0 : it->second.strategy.attempts();
}

bool RecoveryManager::reconnect_scheduled(const std::string& device_id, int64_t* due_ms) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = devices_.find(device_id);
  if (it == devices_.end() || !it->second.scheduled) return false;
  if (due_ms) *due_ms = it->second.due_ms;
  return true;
}

std::size_t RecoveryManager::io_lock_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return io_locks_.size();
}

std::size_t RecoveryManager::queued(const std::string& device_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = devices_.find(device_id);
  return it == devices_.end() ? 0 : it->second.queue.size();
}

} // namespace kdc
