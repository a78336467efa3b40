// ============================================================================
// discovery.cpp — DiscoveryTracker and the unified DiscoveryService
// ============================================================================

#include "kdc/discovery.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

#include "kdc/clock.hpp"

namespace kdc {

const char* to_string(DiscoveryEventKind k) {
  switch (k) {
    case DiscoveryEventKind::DeviceDiscovered: return "discovered";
    case DiscoveryEventKind::DeviceLost:       return "lost";
  }
  return "?";
}

// ============================================================================
// DiscoveryTracker
// ============================================================================

bool DiscoveryTracker::seen(const DiscoveryEvent& ev, int64_t now_ms) {
  auto it = entries_.find(ev.identity.device_id);
  if (it == entries_.end()) {
    entries_.emplace(ev.identity.device_id, Entry{ev, now_ms});
    return true;
  }
  Entry& e = it->second;
  e.last_seen_ms = now_ms;
  if (e.event.address == ev.address && e.event.identity == ev.identity) return false;
  e.event = ev;
  return true;
}

void DiscoveryTracker::expire(int64_t now_ms, std::vector<DiscoveryEvent>& lost) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (now_ms - it->second.last_seen_ms >= lost_timeout_ms_) {
      DiscoveryEvent ev = it->second.event;
      ev.kind = DiscoveryEventKind::DeviceLost;
      lost.push_back(std::move(ev));
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
}

// ============================================================================
// DiscoveryService
// ============================================================================

void DiscoveryService::add_producer(std::unique_ptr<IDiscoveryProducer> p) {
  producers_.push_back(std::move(p));
  started_.push_back(false);
}

Status DiscoveryService::start(TaskSupervisor* supervisor) {
  std::size_t ok = 0;
  Status last;
  for (std::size_t i = 0; i < producers_.size(); ++i) {
    IDiscoveryProducer* p = producers_[i].get();
    Status st = p->start();
    if (!st) {
      spdlog::warn("discovery: producer {} not started: {}", p->name(), st.to_string());
      last = st;
      continue;
    }
    started_[i] = true;
    ++ok;
    spdlog::info("discovery: producer {} started", p->name());

    if (supervisor == nullptr) continue;

    // A restart after a failed poll reopens the producer before polling again.
    auto restarted = std::make_shared<bool>(false);
    supervisor->spawn(std::string("discovery/") + p->name(),
                      [this, p, restarted](const transport::CancelToken& cancel) {
      if (*restarted) {
        p->stop();
        Status again = p->start();
        if (!again) throw std::runtime_error(again.to_string());
      }
      *restarted = true;
      std::vector<DiscoveryEvent> evs;
      while (!cancel.cancelled()) {
        evs.clear();
        Status st = p->poll(steady_ms(), cancel, evs);
        push(evs);
        if (!st && st.critical()) throw std::runtime_error(st.to_string());
        if (!st) {
          spdlog::warn("discovery: {} poll: {}", p->name(), st.to_string());
          std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
      }
    });
  }
  if (ok == 0 && !producers_.empty()) return last;
  return Status();
}

void DiscoveryService::stop() {
  pump_token_.cancel();
  for (std::size_t i = 0; i < producers_.size(); ++i) {
    if (started_[i]) producers_[i]->stop();
    started_[i] = false;
  }
}

void DiscoveryService::pump(int64_t now_ms) {
  std::vector<DiscoveryEvent> evs;
  for (std::size_t i = 0; i < producers_.size(); ++i) {
    if (!started_[i]) continue;
    evs.clear();
    Status st = producers_[i]->poll(now_ms, pump_token_, evs);
    if (!st) spdlog::warn("discovery: {} poll: {}", producers_[i]->name(), st.to_string());
    push(evs);
  }
}

void DiscoveryService::push(std::vector<DiscoveryEvent>& evs) {
  if (evs.empty()) return;
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& ev : evs) {
    if (queue_.full()) {
      ++dropped_;
      spdlog::warn("discovery: event queue full, dropping {} {}", to_string(ev.kind), ev.identity.device_id);
      continue;
    }
    spdlog::debug("discovery: {} {} via {} at {}", to_string(ev.kind), ev.identity.device_id, ev.source,
                  transport::to_string(ev.address));
    queue_.push_back(std::move(ev));
  }
}

bool DiscoveryService::poll_event(DiscoveryEvent& out) {
  std::lock_guard<std::mutex> lk(mu_);
  if (queue_.empty()) return false;
  out = std::move(queue_.front());
  queue_.pop_front();
  return true;
}

std::size_t DiscoveryService::dropped() const {
  std::lock_guard<std::mutex> lk(mu_);
  return dropped_;
}

} // namespace kdc
