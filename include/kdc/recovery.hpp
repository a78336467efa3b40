#pragma once
/**
 * @file recovery.hpp
 * @brief Reconnection with backoff and the per-device packet retry queue.
 *
 * @details
 * ## Field Brief
 * Two independent jobs, both driven by `tick(now_ms)`:
 *
 * ### Reconnection
 * Only an *unsolicited* disconnect of a *paired* device schedules anything. A
 * device the user unpaired, rejected or disconnected is never recovered.
 * ```
 *   attempt:  1    2    3    4    5    (give up)
 *   delay:    2s   4s   8s   16s  32s  (capped at 60s)
 * ```
 * At most one attempt per device is in flight (`take_due_reconnects()` marks it,
 * `on_reconnect_result()` clears it). Any successful connection resets the
 * strategy to zero attempts.
 *
 * ### Packet retry
 * A packet whose send fails with a recoverable error is queued (after the
 * resource gate admits it) and retried every 500 ms, at most 3 times. The third
 * failure drops it and emits `DeliveryFailed` once. While a device has queued
 * packets, new packets queue behind them so send order is kept.
 *
 * When a connection becomes live the queue is flushed in order, once, and then
 * cleared; anything that fails during the flush is reported as DeliveryFailed
 * instead of being kept for a later, out-of-order retry.
 *
 * ### Seams
 * `PacketSink` is where packets go (the transport manager in production).
 * `LinkControl` starts a reconnect attempt without blocking the tick; the
 * result comes back through `on_reconnect_result()`.
 */

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "etl/deque.h"

#include "kdc/packet.hpp"
#include "kdc/status.hpp"

namespace kdc {

class ResourceManager;

struct ReconnectPolicy {
  int64_t  initial_delay_ms{2000};
  int64_t  max_delay_ms{60000};
  uint32_t max_attempts{5};
};

struct RetryPolicy {
  uint32_t max_attempts{3};
  int64_t  retry_delay_ms{500};
};

/// Per-device backoff state.
class ReconnectionStrategy {
public:
  explicit ReconnectionStrategy(ReconnectPolicy p = ReconnectPolicy{}) : policy_(p) {}

  /// Delay before the next attempt: initial × 2^failures, capped.
  int64_t next_delay_ms() const;
  void    record_failure() { ++failures_; }
  void    reset() { failures_ = 0; }
  bool    exhausted() const { return failures_ >= policy_.max_attempts; }
  uint32_t attempts() const { return failures_; }

private:
  ReconnectPolicy policy_;
  uint32_t        failures_{0};
};

class PacketSink {
public:
  virtual ~PacketSink() = default;
  virtual Status send_packet(const std::string& device_id, const Packet& p) = 0;
};

class LinkControl {
public:
  virtual ~LinkControl() = default;
  /// Begin reconnecting @p device_id. Must not block; report via on_reconnect_result().
  virtual void start_reconnect(const std::string& device_id) = 0;
};

enum class RecoveryEventKind : uint8_t { ReconnectScheduled = 0, ReconnectAbandoned, DeliveryFailed };

const char* to_string(RecoveryEventKind k);

struct RecoveryEvent {
  RecoveryEventKind kind{RecoveryEventKind::ReconnectScheduled};
  std::string       device_id;
  int64_t           delay_ms{0};       ///< ReconnectScheduled
  uint32_t          attempt{0};        ///< ReconnectScheduled: 1-based attempt number
  uint64_t          packet_id{0};      ///< DeliveryFailed
  std::string       packet_type;       ///< DeliveryFailed
  Status            error;             ///< last failure
};

class RecoveryManager {
public:
  static constexpr std::size_t EVENT_CAPACITY = 256;

  RecoveryManager(PacketSink& sink, ResourceManager* resources,
                  ReconnectPolicy reconnect = ReconnectPolicy{}, RetryPolicy retry = RetryPolicy{});

  void set_link_control(LinkControl* link) { link_ = link; }

  /**
   * @brief Send now, or queue for retry.
   * @retval ok                  sent, or queued for retry
   * @retval ResourceExhausted   the queue gate refused it (nothing queued)
   * @retval (send error)        non-recoverable failure, e.g. PacketTooLarge
   */
  Status send(const std::string& device_id, const Packet& p, int64_t now_ms);

  /// A session for @p device_id became live: reset backoff, flush then clear the queue.
  void on_connected(const std::string& device_id, int64_t now_ms);
  /// A session ended. Schedules a reconnect only when @p unsolicited and @p paired.
  void on_disconnected(const std::string& device_id, bool unsolicited, bool paired, int64_t now_ms);

  /// Devices whose reconnect is due; each is marked in flight.
  std::vector<std::string> take_due_reconnects(int64_t now_ms);
  void on_reconnect_result(const std::string& device_id, const Status& result, int64_t now_ms);

  /// Retry every due queued packet.
  void process_retries(int64_t now_ms);

  /// Stop recovering @p device_id: no reconnect, queue dropped (DeliveryFailed per packet).
  void cancel(const std::string& device_id);

  /// process_retries + start due reconnects through LinkControl.
  void tick(int64_t now_ms);

  bool poll_event(RecoveryEvent& out);

  // Inspection
  uint32_t reconnect_attempts(const std::string& device_id) const;
  bool     reconnect_scheduled(const std::string& device_id, int64_t* due_ms = nullptr) const;
  std::size_t queued(const std::string& device_id) const;
  std::size_t io_lock_count() const;

private:
  struct QueuedPacket {
    Packet   packet;
    uint64_t bytes{0};
    uint32_t attempts{0};    ///< failed retries so far
    int64_t  due_ms{0};
  };

  struct DeviceRecovery {
    ReconnectionStrategy     strategy;
    bool                     scheduled{false};
    bool                     in_flight{false};
    int64_t                  due_ms{0};
    std::deque<QueuedPacket> queue;
  };

  DeviceRecovery& entry(const std::string& device_id);
  std::shared_ptr<std::mutex> device_lock(const std::string& device_id);
  void schedule(const std::string& device_id, DeviceRecovery& d, int64_t now_ms);
  void drop(const std::string& device_id, const QueuedPacket& q, const Status& why);
  void emit(RecoveryEvent ev);
  void release(const std::string& device_id, uint64_t bytes);

  PacketSink&                                          sink_;
  ResourceManager*                                     resources_;
  LinkControl*                                         link_{nullptr};
  ReconnectPolicy                                      reconnect_;
  RetryPolicy                                          retry_;

  mutable std::mutex                                   mu_;       ///< devices_ and io_locks_
  std::map<std::string, DeviceRecovery>                devices_;
  std::map<std::string, std::shared_ptr<std::mutex>>   io_locks_; ///< per-device send order

  mutable std::mutex                                   ev_mu_;
  etl::deque<RecoveryEvent, EVENT_CAPACITY>            events_;
};

} // namespace kdc
