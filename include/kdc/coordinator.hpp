#pragma once
/**
 * @file coordinator.hpp
 * @brief RecoveryCoordinator: the one event stream plugins consume.
 *
 * @details
 * ## Field Brief
 * Every component below this one emits events into its own bounded queue and
 * never calls back up. The coordinator is the only reader of those queues. On
 * each `tick(now_ms)` it drains them in a fixed order, forwards each event to
 * whichever component must react, and republishes a normalized `CoreEvent` for
 * plugins.
 *
 * It keeps no state of its own beyond the outgoing event queue: connection
 * state lives in the transport manager, trust in the pairing manager, budgets in
 * the resource manager, backoff and retry queues in the recovery manager.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  DiscoveryService ──► Discovered/Lost ──► tm.add_address, registry, connect ─┐
 *  TransportManager ──► Connected ──► recovery.on_connected (flush queue)       │
 *                   ──► Disconnected ──► recovery.on_disconnected (backoff)     ├─► CoreEvent queue
 *                   ──► PacketReceived ──► pairing | capability filter          │      (plugins)
 *  PairingManager ───► PairingRequested/Result ──► tm.set_paired                │
 *  RecoveryManager ──► ReconnectScheduled/Abandoned/DeliveryFailed ────────────┘
 * ```
 *
 * @par Gates
 * - Connections are admitted by the resource manager inside the transport
 *   manager (outbound before the attempt, inbound after verification).
 * - Payload transfers are admitted here, before any socket is opened.
 * - Packets from a device that is not Trusted reach plugins only if they are
 *   identity or pair packets; everything else is dropped.
 * - Packets reach plugins only if the type is in our incoming set and the
 *   peer's outgoing set (when both sets are declared).
 *
 * @par Threading
 * `tick()` and `maintenance()` are meant for one driver thread. `send()`,
 * `pair()` and the payload calls may come from any thread.
 */

#include <atomic>
#include <cstdint>
#include <istream>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "etl/deque.h"

#include "kdc/device_registry.hpp"
#include "kdc/discovery.hpp"
#include "kdc/identity.hpp"
#include "kdc/packet.hpp"
#include "kdc/pairing.hpp"
#include "kdc/recovery.hpp"
#include "kdc/resource_manager.hpp"
#include "kdc/status.hpp"
#include "kdc/transfer_store.hpp"
#include "kdc/transport/payload_transfer.hpp"
#include "kdc/transport_manager.hpp"

namespace kdc {

/// Runs connects off the tick thread: reconnects for the recovery manager,
/// and first connects to freshly discovered devices.
class AsyncConnector : public LinkControl {
public:
  AsyncConnector(TransportManager& transports, RecoveryManager& recovery);
  ~AsyncConnector() override;

  AsyncConnector(const AsyncConnector&) = delete;
  AsyncConnector& operator=(const AsyncConnector&) = delete;

  /// Result goes to RecoveryManager::on_reconnect_result().
  void start_reconnect(const std::string& device_id) override;
  /// Fire and forget; skipped while another attempt for the device runs.
  void start_connect(const std::string& device_id);

  /// Cancel running attempts and join them. Later starts are refused.
  void stop();

  bool busy(const std::string& device_id) const;
  std::size_t running() const;

private:
  struct Worker {
    std::string                        device_id;
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void launch(const std::string& device_id, bool report);
  void reap(bool all);

  TransportManager&  transports_;
  RecoveryManager&   recovery_;
  mutable std::mutex mu_;
  std::list<Worker>  workers_;
  bool               stopped_{false};
};

enum class CoreEventKind : uint8_t {
  Discovered = 0,
  Lost,
  Connected,
  Disconnected,
  PairingRequested,
  PairingResult,
  PacketReceived,
  DeliveryFailed,
  Error,            ///< user-action-required or critical condition worth surfacing
};

const char* to_string(CoreEventKind k);

struct CoreEvent {
  CoreEventKind               kind{CoreEventKind::Discovered};
  std::string                 device_id;
  DeviceIdentity              identity;      ///< Discovered, Connected
  transport::TransportAddress address;       ///< Discovered, Connected
  transport::TransportType    transport{transport::TransportType::Tcp};
  Packet                      packet;        ///< PacketReceived
  bool                        paired{false}; ///< Connected, Disconnected
  bool                        accepted{false};   ///< PairingResult
  std::string                 fingerprint;   ///< PairingRequested
  std::string                 reason;        ///< PairingResult, DeliveryFailed (packet type)
  uint64_t                    packet_id{0};  ///< DeliveryFailed
  Status                      error;         ///< Error, DeliveryFailed, Disconnected cause
};

class RecoveryCoordinator {
public:
  static constexpr std::size_t EVENT_CAPACITY = 256;

  RecoveryCoordinator(DeviceIdentity self,
                      DiscoveryService& discovery,
                      TransportManager& transports,
                      PairingManager& pairing,
                      RecoveryManager& recovery,
                      ResourceManager& resources,
                      TransferStore& transfers,
                      AsyncConnector* connector = nullptr,
                      DeviceRegistry* registry = nullptr);

  /**
   * @brief Drain every component queue once, then run pairing and recovery timers.
   * @param now_ms   steady clock
   * @param wall_ms  wall clock, for persisted timestamps
   */
  void tick(int64_t now_ms, int64_t wall_ms);

  /// Idle connection reclaim, stale transfer GC, registry flush.
  void maintenance(int64_t now_ms, int64_t wall_ms);

  bool poll_event(CoreEvent& out);
  std::size_t dropped_events() const;

  /**
   * @brief Plugin send. Delivered now, or queued for retry by the recovery manager.
   * @retval NotPaired    device not trusted (identity/pair packets excepted)
   * @retval Unsupported  the peer does not accept this packet type
   */
  Status send(const std::string& device_id, const Packet& p, int64_t now_ms);

  Status pair(const std::string& device_id, int64_t now_ms);
  Status accept_pairing(const std::string& device_id);
  Status reject_pairing(const std::string& device_id);
  /// Erase trust, drop queued packets and pending reconnects, close the session.
  Status unpair(const std::string& device_id);

  /**
   * @brief Download the payload announced by @p p into @p destination.
   * @retval ResourceExhausted  refused by admission control (nothing opened)
   * @retval Unsupported        no payload, or the session has no TCP side-channel
   */
  Status receive_payload(const std::string& device_id, const Packet& p, const std::string& destination,
                         transport::PayloadReceiver& receiver, const transport::CancelToken& cancel,
                         const transport::PayloadReceiver::Progress& progress = {});

  /// Announce @p p with a payload of @p size bytes from @p src and serve it.
  Status send_payload(const std::string& device_id, Packet p, std::istream& src, uint64_t size,
                      transport::PayloadServer& server, const transport::CancelToken& cancel);

  /// Stop connectors, discovery and every transport. Supervised discovery
  /// tasks must already be stopped.
  void shutdown();

private:
  void on_discovery(const DiscoveryEvent& ev, int64_t wall_ms);
  void on_transport(TransportManagerEvent& ev, int64_t now_ms, int64_t wall_ms);
  void on_packet(TransportManagerEvent& ev, int64_t now_ms);
  void on_pairing(const PairingEvent& ev);
  void on_recovery(const RecoveryEvent& ev);
  void emit(CoreEvent ev);

  DeviceIdentity      self_;
  DiscoveryService&   discovery_;
  TransportManager&   transports_;
  PairingManager&     pairing_;
  RecoveryManager&    recovery_;
  ResourceManager&    resources_;
  TransferStore&      transfers_;
  AsyncConnector*     connector_;
  DeviceRegistry*     registry_;

  mutable std::mutex                    ev_mu_;
  etl::deque<CoreEvent, EVENT_CAPACITY> events_;
  std::size_t                           dropped_{0};
};

/// Adapts the transport manager to the recovery manager's packet seam.
class TransportPacketSink : public PacketSink {
public:
  explicit TransportPacketSink(TransportManager& tm) : tm_(tm) {}
  Status send_packet(const std::string& device_id, const Packet& p) override { return tm_.send_packet(device_id, p); }

private:
  TransportManager& tm_;
};

} // namespace kdc
