#pragma once
/**
 * @file mdns.hpp
 * @brief Minimal mDNS (RFC 6762) codec for the `_kdeconnect._udp.local` service.
 *
 * @details
 * Only what discovery needs:
 *  - a PTR query for the service type,
 *  - our announcement (PTR + SRV + TXT + A) for a given identity,
 *  - parsing announcements from peers into `MdnsService`.
 *
 * Parsing is bounded: name compression pointers are followed at most
 * `MAX_POINTER_HOPS` times and every read is range-checked, so a hostile
 * datagram yields `false`, never an overread.
 */

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "kdc/identity.hpp"

namespace kdc::mdns {

static constexpr const char* SERVICE_TYPE   = "_kdeconnect._udp.local";
static constexpr const char* MULTICAST_ADDR = "224.0.0.251";
static constexpr uint16_t    PORT           = 5353;

/// One peer announcement.
struct MdnsService {
  std::string                        instance;   ///< "<id>._kdeconnect._udp.local"
  std::string                        ipv4;       ///< from the A record, empty if absent
  uint16_t                           port{0};    ///< from SRV
  std::map<std::string, std::string> txt;        ///< id, name, type, protocol
};

/// PTR query for SERVICE_TYPE.
std::string build_query();

/// Announcement for @p self, reachable at @p ipv4 : @p tcp_port.
std::string build_announcement(const DeviceIdentity& self, const std::string& ipv4, uint16_t tcp_port);

/// True when @p datagram is a query asking for SERVICE_TYPE.
bool is_service_query(const std::string& datagram);

/**
 * @brief Extract every kdeconnect service in a response.
 * @return false when the datagram is malformed (out untouched)
 */
bool parse_response(const std::string& datagram, std::vector<MdnsService>& out);

/// Identity implied by the TXT record. False when id is missing/invalid.
bool identity_from_txt(const MdnsService& svc, DeviceIdentity& out);

} // namespace kdc::mdns
