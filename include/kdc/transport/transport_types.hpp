#pragma once
/**
 * @file transport_types.hpp
 * @brief Closed set of transport kinds, their addresses and their fixed capabilities.
 *
 * The transport set is known at compile time: `TransportType` is a closed enum
 * and `TransportAddress` a closed variant. Every switch over them is exhaustive,
 * so adding a third transport is a compile error at each dispatch point until
 * it is handled.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace kdc::transport {

enum class TransportType : uint8_t { Tcp = 0, Bluetooth = 1 };

enum class LatencyClass : uint8_t { Low = 0, Medium, High };

const char* to_string(TransportType t);

struct TcpAddress {
  std::string ip;
  uint16_t    port{0};

  bool operator==(const TcpAddress& o) const { return ip == o.ip && port == o.port; }
  bool operator<(const TcpAddress& o) const { return ip < o.ip || (ip == o.ip && port < o.port); }
};

struct BluetoothAddress {
  std::string device_address;   ///< "AA:BB:CC:DD:EE:FF"
  std::string service_id;       ///< GATT service UUID

  bool operator==(const BluetoothAddress& o) const {
    return device_address == o.device_address && service_id == o.service_id;
  }
  bool operator<(const BluetoothAddress& o) const {
    return device_address < o.device_address ||
           (device_address == o.device_address && service_id < o.service_id);
  }
};

/// Connection key. Two addresses of one device stay distinct keys unless merged by identity.
using TransportAddress = std::variant<TcpAddress, BluetoothAddress>;

TransportType type_of(const TransportAddress& a);

/// Stable text form, e.g. "tcp://192.168.1.7:1716" or "bt://AA:BB:CC:DD:EE:FF/185f...".
std::string to_string(const TransportAddress& a);

/**
 * @brief What a transport can carry. Fixed per transport type, never mutated.
 *
 * Senders compare `encoded_size(packet)` with `max_packet_size` before any I/O.
 */
struct TransportCapabilities {
  std::size_t  max_packet_size{0};
  bool         reliable{true};
  bool         connection_oriented{true};
  LatencyClass latency_class{LatencyClass::Low};
};

static constexpr std::size_t TCP_MAX_PACKET_SIZE       = 1024 * 1024;
static constexpr std::size_t BLUETOOTH_MAX_PACKET_SIZE = 512;

static constexpr TransportCapabilities TCP_CAPABILITIES{
    TCP_MAX_PACKET_SIZE, true, true, LatencyClass::Low};
static constexpr TransportCapabilities BLUETOOTH_CAPABILITIES{
    BLUETOOTH_MAX_PACKET_SIZE, true, true, LatencyClass::Medium};

const TransportCapabilities& capabilities_for(TransportType t);

} // namespace kdc::transport
