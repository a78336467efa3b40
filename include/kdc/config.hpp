#pragma once
/**
 * @file config.hpp
 * @brief Everything the core reads from configuration, with defaults.
 *
 * @details
 * `CoreConfig` starts out fully usable; a JSON file only overrides what it
 * names. Keys are grouped in sections:
 * ```json
 * {
 *   "device":    { "id": "...", "name": "...", "type": "laptop",
 *                  "incoming_capabilities": [...], "outgoing_capabilities": [...] },
 *   "state_dir": "/home/me/.local/state/kdc",
 *   "log_level": "info",
 *   "discovery": { "udp_port": 1716, "broadcast_interval_ms": 5000, "lost_timeout_ms": 60000,
 *                  "mdns": true, "broadcast_targets": ["255.255.255.255"] },
 *   "tcp":       { "enabled": true, "port_first": 1714, "port_last": 1764,
 *                  "connect_timeout_ms": 10000, "handshake_timeout_ms": 10000 },
 *   "bluetooth": { "enabled": false, "adapter": "hci0", "timeout_ms": 15000,
 *                  "scan_interval_ms": 10000, "scan_duration_ms": 3000,
 *                  "lost_timeout_ms": 60000, "allow_list": ["AA:BB:CC:DD:EE:FF"] },
 *   "transport": { "preference": "tcp-first", "auto_fallback": true },
 *   "payload":   { "port_first": 1739, "port_last": 1764, "timeout_ms": 10000 },
 *   "pairing":   { "policy": "explicit" },
 *   "resources": { "per_device_connections": 3, "global_connections": 50, ... },
 *   "recovery":  { "initial_delay_ms": 2000, "max_delay_ms": 60000, "max_attempts": 5,
 *                  "retry_attempts": 3, "retry_delay_ms": 500 }
 * }
 * ```
 * Unknown keys are ignored. A known key with the wrong type or an out of range
 * value is a `Config` error naming the key; nothing is half applied.
 */

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "kdc/discovery.hpp"
#include "kdc/identity.hpp"
#include "kdc/pairing.hpp"
#include "kdc/recovery.hpp"
#include "kdc/resource_manager.hpp"
#include "kdc/status.hpp"
#include "kdc/transport/bluetooth_transport.hpp"
#include "kdc/transport/payload_transfer.hpp"
#include "kdc/transport/tcp_transport.hpp"
#include "kdc/transport_manager.hpp"

namespace kdc {

struct CoreConfig {
  // Identity
  std::string   device_id;       ///< empty: taken from the state dir, generated on first start
  std::string   device_name;     ///< empty: host name
  DeviceType    device_type{DeviceType::Desktop};
  CapabilitySet incoming;
  CapabilitySet outgoing;

  std::string state_dir;         ///< empty: default_state_dir()
  std::string log_level{"info"};

  BroadcastDiscoveryConfig discovery;

  bool                          enable_tcp{true};
  transport::TcpTransportConfig tcp;

  bool                                enable_bluetooth{false};
  std::string                         bluetooth_adapter{"hci0"};
  transport::BluetoothTransportConfig bluetooth;
  BleDiscoveryConfig                  ble_discovery;

  TransportManagerConfig  manager;
  transport::PayloadConfig payload;
  PairingPolicy           pairing_policy{PairingPolicy::Explicit};
  ResourceLimits          limits;
  ReconnectPolicy         reconnect;
  RetryPolicy             retry;

  int64_t tick_interval_ms{250};
  int64_t maintenance_interval_ms{5000};
};

/// Overlay @p doc on @p cfg. On error @p cfg is left unchanged.
Status apply_config(const nlohmann::json& doc, CoreConfig& cfg);

/// Read @p path and apply it. A missing file is not an error.
Status load_config(const std::string& path, CoreConfig& cfg);

/**
 * @brief Settle the device id: configured, else remembered in the state dir,
 *        else freshly generated and remembered.
 */
Status ensure_device_id(CoreConfig& cfg);

} // namespace kdc
