// ============================================================================
// transport_types.cpp — implementation for transport/transport_types.hpp
// ============================================================================

#include "kdc/transport/transport_types.hpp"

namespace kdc::transport {

namespace {

struct AddressText {
  std::string operator()(const TcpAddress& a) const {
    return "tcp://" + a.ip + ":" + std::to_string(a.port);
  }
  std::string operator()(const BluetoothAddress& a) const {
    return "bt://" + a.device_address + "/" + a.service_id;
  }
};

struct AddressType {
  TransportType operator()(const TcpAddress&) const { return TransportType::Tcp; }
  TransportType operator()(const BluetoothAddress&) const { return TransportType::Bluetooth; }
};

} // namespace

const char* to_string(TransportType t) {
  switch (t) {
    case TransportType::Tcp:       return "tcp";
    case TransportType::Bluetooth: return "bluetooth";
  }
  return "unknown";
}

TransportType type_of(const TransportAddress& a) {
  return std::visit(AddressType{}, a);
}

std::string to_string(const TransportAddress& a) {
  return std::visit(AddressText{}, a);
}

const TransportCapabilities& capabilities_for(TransportType t) {
  switch (t) {
    case TransportType::Tcp:       return TCP_CAPABILITIES;
    case TransportType::Bluetooth: return BLUETOOTH_CAPABILITIES;
  }
  return TCP_CAPABILITIES;
}

} // namespace kdc::transport
