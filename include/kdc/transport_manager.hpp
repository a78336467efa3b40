#pragma once
/**
 * @file transport_manager.hpp
 * @brief One API over every registered transport: connect by device, send by
 *        device, one normalized event stream.
 *
 * @details
 * ## Field Brief
 * The manager owns the per-device `ConnectionState` machine and the live
 * connections. Callers never see a transport:
 *
 *  - `add_address()` records where a device can be reached (from discovery or
 *    the device registry).
 *  - `connect()` orders the device's addresses by `TransportPreference`, tries
 *    them one by one, verifies each handshake against the pinned fingerprint
 *    and installs the first session that passes. When everything fails the
 *    result is one aggregated `Status`.
 *  - `accept_incoming()` pulls sessions the transports accepted, runs the same
 *    verification and installs them.
 *  - Every session is admitted by the `ResourceManager` before it is installed
 *    and released exactly once when it ends, whichever way it ends.
 *  - Every live connection has a reader thread that turns bytes into
 *    `TransportManagerEvent::PacketReceived`, and a close or error into
 *    exactly one `Disconnected`.
 *
 * ## Connection state machine
 * ```
 *  Discovered → Handshaking → Paired | Rejected
 *  Paired → Connected → Disconnected → Reconnecting → Handshaking … | Abandoned
 * ```
 * `Rejected` and `Abandoned` are terminal for automatic transitions. An
 * inbound session from an `Abandoned` device revives it; `Rejected` stays until
 * `forget()`.
 *
 * Bluetooth is purely additive: with no Bluetooth transport registered every
 * Bluetooth address is skipped and TCP behaves exactly the same.
 *
 * Threading: public methods are safe from any thread. Locks are never held
 * across a transport connect, a send or a join.
 */

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "etl/deque.h"

#include "kdc/packet.hpp"
#include "kdc/pairing.hpp"
#include "kdc/resource_manager.hpp"
#include "kdc/status.hpp"
#include "kdc/transport/transport_base.hpp"
#include "kdc/transport/transport_types.hpp"

namespace kdc {

enum class TransportPreference : uint8_t {
  PreferTcp = 0,      ///< TCP when the device has a TCP address; BLE only with auto-fallback
  PreferBluetooth,
  TcpFirst,           ///< TCP then BLE, always falling back on failure
  BluetoothFirst,
  TcpOnly,
  BluetoothOnly,
};

const char* to_string(TransportPreference p);
bool transport_preference_from_string(const std::string& s, TransportPreference& out);

enum class ConnectionState : uint8_t {
  Discovered = 0,
  Handshaking,
  Paired,
  Rejected,
  Connected,
  Disconnected,
  Reconnecting,
  Abandoned,
};

const char* to_string(ConnectionState s);
bool is_terminal(ConnectionState s);
/// Edges of the connection state machine.
bool valid_transition(ConnectionState from, ConnectionState to);

enum class TransportEventKind : uint8_t { Connected = 0, Disconnected, PacketReceived, Error };

const char* to_string(TransportEventKind k);

struct TransportManagerEvent {
  TransportEventKind       kind{TransportEventKind::Connected};
  std::string              device_id;
  transport::TransportType transport{transport::TransportType::Tcp};
  transport::HandshakeInfo info;          ///< Connected
  Packet                   packet;        ///< PacketReceived
  Status                   error;         ///< Error, or the cause of a Disconnected
  bool                     unsolicited{false};   ///< Disconnected not requested locally
  bool                     paired{false};        ///< device trusted at the time of the event
};

/**
 * @brief Ordered list of transport types to try for a device.
 * @param has_tcp / has_bt whether the device has an address of that type
 */
std::vector<transport::TransportType> transport_order(TransportPreference pref, bool auto_fallback,
                                                      bool has_tcp, bool has_bt);

/// One Status out of several failed attempts: the first non-recoverable kind wins.
Status aggregate_errors(const std::vector<std::pair<transport::TransportAddress, Status>>& failures);

struct TransportManagerConfig {
  TransportPreference preference{TransportPreference::TcpFirst};
  bool                auto_fallback{true};
  int                 receive_slice_ms{200};
};

class TransportManager {
public:
  static constexpr std::size_t EVENT_CAPACITY = 256;
  /// Slots kept free for lifecycle events; packets wait instead of using them.
  static constexpr std::size_t LIFECYCLE_RESERVE = 32;

  /// @param resources connection admission; null admits everything
  TransportManager(TransportManagerConfig cfg, PairingManager& pairing, ResourceManager* resources = nullptr);
  ~TransportManager();

  TransportManager(const TransportManager&) = delete;
  TransportManager& operator=(const TransportManager&) = delete;

  void add_transport(std::shared_ptr<transport::ITransport> t);
  /// Start every transport. A failing Bluetooth transport is dropped with a warning.
  Status start();
  /// Close every connection, cancel pending connects, stop the transports.
  void shutdown();

  bool has_transport(transport::TransportType t) const;

  void add_address(const std::string& device_id, const transport::TransportAddress& addr);
  std::vector<transport::TransportAddress> addresses(const std::string& device_id) const;

  std::optional<ConnectionState> state(const std::string& device_id) const;

  /**
   * @brief Connect to @p device_id over the preferred transport.
   * @param installed set to true only when this call installed a new session
   * @retval ok                  already connected or a session was installed
   * @retval NotConnected        no usable address / transport, or a connect is already running
   * @retval PermissionDenied    device is Rejected
   * @retval ResourceExhausted   connection refused by admission control
   * @retval Cancelled           cancel_connect() or shutdown() interrupted it
   * @retval (aggregated)        every candidate failed
   */
  Status connect(const std::string& device_id, bool* installed = nullptr);
  /// Interrupt a running connect() for @p device_id.
  void cancel_connect(const std::string& device_id);

  Status send_packet(const std::string& device_id, const Packet& p);
  /// Locally requested close. Emits Disconnected (not unsolicited) when a session existed.
  void disconnect(const std::string& device_id);
  bool has_connection(const std::string& device_id) const;
  std::optional<transport::HandshakeInfo> connection_info(const std::string& device_id) const;
  std::vector<std::string> connected_devices() const;

  /// Install every session the transports accepted. @return number installed
  std::size_t accept_incoming();

  /// Trust changed (pairing result); carried on later events.
  void set_paired(const std::string& device_id, bool paired);
  bool is_paired(const std::string& device_id) const;

  /// Recovery bookkeeping, driven by the coordinator.
  Status mark_reconnecting(const std::string& device_id);
  Status mark_abandoned(const std::string& device_id);

  /// Disconnect and drop every record of @p device_id.
  void forget(const std::string& device_id);

  bool poll_event(TransportManagerEvent& out);
  std::size_t dropped_events() const;

private:
  struct Link {
    std::string                            device_id;
    std::shared_ptr<transport::Connection> conn;
    std::thread                            reader;
    std::atomic<bool>                      ended{false};
    std::atomic<bool>                      closing{false};   ///< close requested locally
    bool                                   admitted{false};  ///< holds a ResourceManager slot
  };

  struct DeviceEntry {
    ConnectionState                          state{ConnectionState::Discovered};
    std::vector<transport::TransportAddress> addresses;
    bool                                     paired{false};
  };

  std::shared_ptr<transport::ITransport> transport_for(transport::TransportType t) const;
  Status transition(const std::string& device_id, ConnectionState to);
  void   transition_locked(DeviceEntry& e, const std::string& device_id, ConnectionState to);
  Status admit(const std::string& device_id);
  void   release(const Link& link);
  Status install(std::unique_ptr<transport::Connection> conn, bool admitted);
  void   reader_loop(std::shared_ptr<Link> link);
  void   link_ended(const std::shared_ptr<Link>& link, bool unsolicited, const Status& cause);
  void   stop_link(const std::shared_ptr<Link>& link, bool emit_event);
  void   reap();
  void   push_event(TransportManagerEvent ev);
  bool   push_packet(TransportManagerEvent& ev);

  TransportManagerConfig                              cfg_;
  PairingManager&                                     pairing_;
  ResourceManager*                                    resources_;
  std::vector<std::shared_ptr<transport::ITransport>> transports_;

  mutable std::shared_mutex                           mu_;
  std::map<std::string, DeviceEntry>                  devices_;
  std::map<std::string, std::shared_ptr<Link>>        links_;
  std::map<std::string, transport::CancelToken>       connecting_;
  std::vector<std::shared_ptr<Link>>                  graveyard_;   ///< ended links awaiting join
  std::atomic<bool>                                   shutting_down_{false};

  mutable std::mutex                                  ev_mu_;
  etl::deque<TransportManagerEvent, EVENT_CAPACITY>   events_;
  std::size_t                                         dropped_{0};
};

} // namespace kdc
