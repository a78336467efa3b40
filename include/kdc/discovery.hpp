#pragma once
/**
 * @file discovery.hpp
 * @brief Device discovery: independent producers fanned into one event stream.
 *
 * @details
 * ## Field Brief
 * Two kinds of producer find peers:
 *  - `BroadcastDiscovery` announces our identity packet over UDP broadcast
 *    (port 1716) and, when enabled, over mDNS (`_kdeconnect._udp.local`), and
 *    turns every identity packet or service record it hears into
 *    `DeviceDiscovered{identity, TcpAddress}`.
 *  - `BleDiscovery` scans for the KDE Connect GATT service UUID every
 *    `scan_interval_ms` and emits the same event shape with a `BluetoothAddress`.
 *
 * Each producer keeps its own `DiscoveryTracker`: a device not re-seen within
 * `lost_timeout_ms` gives a `DeviceLost`.
 *
 * `DiscoveryService` owns the producers and one bounded, ordered queue. In
 * the daemon every producer runs on its own supervised task; a producer that
 * fails or blocks never delays another. Tests drive `pump(now_ms)` instead,
 * which polls each producer once in registration order.
 *
 * @par Operational Model
 * ```
 *  [BroadcastDiscovery task] ──┐
 *                               ├── push ──► queue (bounded) ──► poll_event()
 *  [BleDiscovery task] ─────────┘
 * ```
 *
 * Disabling Bluetooth means not registering `BleDiscovery`; nothing else
 * changes, and the broadcast producer's events are identical either way.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "etl/deque.h"

#include "kdc/identity.hpp"
#include "kdc/status.hpp"
#include "kdc/task_supervisor.hpp"
#include "kdc/transport/bluetooth_transport.hpp"
#include "kdc/transport/socket_io.hpp"
#include "kdc/transport/transport_types.hpp"

namespace kdc {

enum class DiscoveryEventKind : uint8_t { DeviceDiscovered = 0, DeviceLost };

struct DiscoveryEvent {
  DiscoveryEventKind          kind{DiscoveryEventKind::DeviceDiscovered};
  DeviceIdentity              identity;
  transport::TransportAddress address;
  std::string                 source;   ///< producer name ("broadcast", "mdns", "ble")
};

const char* to_string(DiscoveryEventKind k);

/**
 * @brief Seen / lost bookkeeping for one producer.
 *
 * Keyed by device id. `seen()` returns true when the device is new or its
 * identity or address changed (emit Discovered), false on a plain refresh.
 */
class DiscoveryTracker {
public:
  explicit DiscoveryTracker(int64_t lost_timeout_ms) : lost_timeout_ms_(lost_timeout_ms) {}

  bool seen(const DiscoveryEvent& ev, int64_t now_ms);

  /// Move every entry older than the timeout into @p lost (as DeviceLost events).
  void expire(int64_t now_ms, std::vector<DiscoveryEvent>& lost);

  std::size_t size() const { return entries_.size(); }

private:
  struct Entry {
    DiscoveryEvent event;
    int64_t        last_seen_ms{0};
  };

  int64_t                      lost_timeout_ms_;
  std::map<std::string, Entry> entries_;
};

/// One source of discovery events. Owned by DiscoveryService.
class IDiscoveryProducer {
public:
  virtual ~IDiscoveryProducer() = default;

  virtual const char* name() const = 0;
  virtual Status start() = 0;
  virtual void   stop() = 0;

  /**
   * @brief One step of work bounded to a few hundred milliseconds.
   *
   * Announce/scan when due, drain what arrived, expire lost devices, append
   * the resulting events to @p out.
   */
  virtual Status poll(int64_t now_ms, const transport::CancelToken& cancel,
                      std::vector<DiscoveryEvent>& out) = 0;
};

// ============================================================================
// Broadcast + mDNS
// ============================================================================

struct BroadcastDiscoveryConfig {
  uint16_t                 udp_port{1716};
  std::vector<std::string> broadcast_targets{"255.255.255.255"};
  int64_t                  broadcast_interval_ms{5000};
  int64_t                  lost_timeout_ms{60000};
  int                      receive_slice_ms{200};
  bool                     enable_mdns{true};
  std::string              mdns_ipv4;        ///< address to put in our A record; empty = omit
};

class BroadcastDiscovery : public IDiscoveryProducer {
public:
  /// @param self identity to announce; tcp_port must be the control listener port
  BroadcastDiscovery(BroadcastDiscoveryConfig cfg, DeviceIdentity self);

  const char* name() const override { return "broadcast"; }
  Status start() override;
  void   stop() override;
  Status poll(int64_t now_ms, const transport::CancelToken& cancel,
              std::vector<DiscoveryEvent>& out) override;

  /// Port the UDP socket actually bound (differs from config when it asked for 0).
  uint16_t bound_port() const { return bound_port_; }

  /// Handle one datagram received on the UDP port (exposed for tests).
  void on_udp_datagram(const std::string& data, const std::string& peer_ip, int64_t now_ms,
                       std::vector<DiscoveryEvent>& out);
  /// Handle one mDNS datagram.
  void on_mdns_datagram(const std::string& data, const std::string& peer_ip, int64_t now_ms,
                        std::vector<DiscoveryEvent>& out);

private:
  void announce(int64_t now_ms);

  BroadcastDiscoveryConfig cfg_;
  DeviceIdentity           self_;
  transport::UniqueFd      udp_fd_;
  transport::UniqueFd      mdns_fd_;
  uint16_t                 bound_port_{0};
  int64_t                  next_announce_ms_{0};
  DiscoveryTracker         tracker_;
};

// ============================================================================
// BLE
// ============================================================================

struct BleDiscoveryConfig {
  int64_t               scan_interval_ms{10000};
  int                   scan_duration_ms{3000};
  int64_t               lost_timeout_ms{60000};
  int                   idle_slice_ms{200};  ///< how long poll() waits when no scan is due
  std::set<std::string> allow_list;          ///< upper-case addresses; empty allows all
};

class BleDiscovery : public IDiscoveryProducer {
public:
  BleDiscovery(BleDiscoveryConfig cfg, std::shared_ptr<transport::IBleAdapter> adapter);

  const char* name() const override { return "ble"; }
  Status start() override;
  void   stop() override {}
  Status poll(int64_t now_ms, const transport::CancelToken& cancel,
              std::vector<DiscoveryEvent>& out) override;

  /// True when @p address passes the allow-list.
  bool allowed(const std::string& address) const;

private:
  BleDiscoveryConfig                      cfg_;
  std::shared_ptr<transport::IBleAdapter> adapter_;
  int64_t                                 next_scan_ms_{0};
  DiscoveryTracker                        tracker_;
};

// ============================================================================
// Unified stream
// ============================================================================

class DiscoveryService {
public:
  static constexpr std::size_t QUEUE_CAPACITY = 256;

  void add_producer(std::unique_ptr<IDiscoveryProducer> p);

  /**
   * @brief Start every producer and, with a supervisor, give each its own task.
   *
   * A producer whose start() fails is logged and left out; the others run.
   * @return ok when at least one producer started (or none were registered)
   */
  Status start(TaskSupervisor* supervisor);
  void   stop();

  /// Poll every producer once (deterministic; used when no supervisor runs them).
  void pump(int64_t now_ms);

  bool poll_event(DiscoveryEvent& out);

  std::size_t producer_count() const { return producers_.size(); }
  std::size_t dropped() const;

private:
  void push(std::vector<DiscoveryEvent>& evs);

  std::vector<std::unique_ptr<IDiscoveryProducer>> producers_;
  std::vector<bool>                                started_;
  transport::CancelToken                           pump_token_;
  mutable std::mutex                               mu_;
  etl::deque<DiscoveryEvent, QUEUE_CAPACITY>       queue_;
  std::size_t                                      dropped_{0};
};

} // namespace kdc
