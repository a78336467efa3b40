// ============================================================================
// identity.cpp — implementation for identity.hpp
// ============================================================================

#include "kdc/identity.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <random>

using nlohmann::json;

namespace kdc {

namespace {

CapabilitySet read_caps(const json& body, const char* key) {
  CapabilitySet out;
  auto it = body.find(key);
  if (it == body.end() || !it->is_array()) return out;
  for (const auto& v : *it) {
    if (v.is_string() && !v.get_ref<const std::string&>().empty()) out.insert(v.get<std::string>());
  }
  return out;
}

CapabilitySet intersect(const CapabilitySet& a, const CapabilitySet& b) {
  CapabilitySet out;
  std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                        std::inserter(out, out.begin()));
  return out;
}

} // namespace

const char* to_string(DeviceType t) {
  switch (t) {
    case DeviceType::Desktop: return "desktop";
    case DeviceType::Laptop:  return "laptop";
    case DeviceType::Phone:   return "phone";
    case DeviceType::Tablet:  return "tablet";
    case DeviceType::Tv:      return "tv";
  }
  return "desktop";
}

DeviceType device_type_from_string(const std::string& s) {
  if (s == "laptop")                   return DeviceType::Laptop;
  if (s == "phone" || s == "smartphone") return DeviceType::Phone;
  if (s == "tablet")                   return DeviceType::Tablet;
  if (s == "tv")                       return DeviceType::Tv;
  return DeviceType::Desktop;
}

bool is_valid_device_id(const std::string& id) {
  if (id.size() < 32 || id.size() > 38) return false;
  return std::all_of(id.begin(), id.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-';
  });
}

std::string generate_device_id() {
  static const char* HEX = "0123456789abcdef";
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<int> nib(0, 15);

  std::string id;
  id.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) id.push_back('_');
    int v = nib(gen);
    if (i == 12) v = 4;                      // version nibble
    if (i == 16) v = 8 | (v & 0x3);          // variant bits
    id.push_back(HEX[v]);
  }
  return id;
}

Packet make_identity_packet(const DeviceIdentity& self) {
  json body;
  body["deviceId"]             = self.device_id;
  body["deviceName"]           = self.name;
  body["deviceType"]           = to_string(self.type);
  body["protocolVersion"]      = self.protocol_version;
  body["incomingCapabilities"] = json(self.incoming);
  body["outgoingCapabilities"] = json(self.outgoing);
  if (self.tcp_port) body["tcpPort"] = *self.tcp_port;
  return make_packet(packet_type::IDENTITY, std::move(body));
}

Status parse_identity_packet(const Packet& p, DeviceIdentity& out) {
  if (p.type != packet_type::IDENTITY)
    return Status(ErrorKind::MalformedPacket, "not an identity packet: " + p.type);

  const json& b = p.body;
  auto id = b.find("deviceId");
  if (id == b.end() || !id->is_string() || !is_valid_device_id(id->get<std::string>()))
    return Status(ErrorKind::MalformedPacket, "identity: invalid deviceId");

  auto name = b.find("deviceName");
  if (name == b.end() || !name->is_string() || name->get_ref<const std::string&>().empty())
    return Status(ErrorKind::MalformedPacket, "identity: missing deviceName");

  uint32_t version = 0;
  auto pv = b.find("protocolVersion");
  if (pv != b.end() && pv->is_number_unsigned()) version = pv->get<uint32_t>();
  if (version < MIN_PROTOCOL_VERSION)
    return Status(ErrorKind::ProtocolVersion,
                  "identity: protocolVersion " + std::to_string(version) + " unsupported");

  DeviceIdentity d;
  d.device_id        = id->get<std::string>();
  d.name             = name->get<std::string>().substr(0, 64);
  d.protocol_version = version;
  d.incoming         = read_caps(b, "incomingCapabilities");
  d.outgoing         = read_caps(b, "outgoingCapabilities");

  auto type = b.find("deviceType");
  if (type != b.end() && type->is_string()) d.type = device_type_from_string(type->get<std::string>());

  auto port = b.find("tcpPort");
  if (port != b.end() && port->is_number_unsigned()) {
    auto v = port->get<uint32_t>();
    if (v > 0 && v <= 65535) d.tcp_port = static_cast<uint16_t>(v);
  }

  out = std::move(d);
  return Status();
}

CapabilitySet receivable_types(const DeviceIdentity& self, const DeviceIdentity& remote) {
  return intersect(self.incoming, remote.outgoing);
}

CapabilitySet sendable_types(const DeviceIdentity& self, const DeviceIdentity& remote) {
  return intersect(self.outgoing, remote.incoming);
}

} // namespace kdc
