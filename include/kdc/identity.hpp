/**
 * @file identity.hpp
 * @brief Device identity model and the `kdeconnect.identity` packet mapping.
 *
 * @details
 * A `DeviceIdentity` is built from the identity packet a peer sends during
 * discovery (UDP broadcast, mDNS TXT + TCP hello, or BLE identity exchange).
 * Its capability sets are fixed for the session: the intersection between our
 * incoming set and the peer's outgoing set decides which packet types reach
 * plugins, and vice versa for sending.
 *
 * Body fields on the wire:
 * `deviceId, deviceName, deviceType, protocolVersion, incomingCapabilities,
 *  outgoingCapabilities, tcpPort`.
 */
#ifndef KDC_IDENTITY_HPP
#define KDC_IDENTITY_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "kdc/packet.hpp"
#include "kdc/status.hpp"

namespace kdc {

/// Protocol version this core speaks.
static constexpr uint32_t PROTOCOL_VERSION     = 8;
/// Oldest peer protocol version accepted.
static constexpr uint32_t MIN_PROTOCOL_VERSION = 7;

enum class DeviceType : uint8_t { Desktop = 0, Laptop, Phone, Tablet, Tv };

const char* to_string(DeviceType t);
/// Unknown strings map to Desktop (what KDE peers do as well).
DeviceType device_type_from_string(const std::string& s);

using CapabilitySet = std::set<std::string>;

struct DeviceIdentity {
  std::string   device_id;
  std::string   name;
  DeviceType    type{DeviceType::Desktop};
  uint32_t      protocol_version{PROTOCOL_VERSION};
  CapabilitySet incoming;
  CapabilitySet outgoing;
  std::optional<uint16_t> tcp_port;

  bool operator==(const DeviceIdentity& o) const {
    return device_id == o.device_id && name == o.name && type == o.type &&
           protocol_version == o.protocol_version && incoming == o.incoming &&
           outgoing == o.outgoing && tcp_port == o.tcp_port;
  }
};

/// 32..38 characters from [A-Za-z0-9_-].
bool is_valid_device_id(const std::string& id);

/// Fresh random id (UUID v4 layout with '_' separators, 36 chars).
std::string generate_device_id();

/// Build our identity packet. `tcp_port` is omitted from the body when unset.
Packet make_identity_packet(const DeviceIdentity& self);

/**
 * @brief Parse a peer identity packet.
 * @retval ok                 on success, @p out filled
 * @retval MalformedPacket    wrong type, missing/invalid id or name
 * @retval ProtocolVersion    peer older than MIN_PROTOCOL_VERSION
 */
Status parse_identity_packet(const Packet& p, DeviceIdentity& out);

/// Packet types we accept from @p remote: our incoming ∩ their outgoing.
CapabilitySet receivable_types(const DeviceIdentity& self, const DeviceIdentity& remote);

/// Packet types we may send to @p remote: our outgoing ∩ their incoming.
CapabilitySet sendable_types(const DeviceIdentity& self, const DeviceIdentity& remote);

} // namespace kdc

#endif // KDC_IDENTITY_HPP
