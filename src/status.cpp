// ============================================================================
// status.cpp — implementation for status.hpp
// For the taxonomy table see the matching .hpp.
// ============================================================================

#include "kdc/status.hpp"

namespace kdc {

ErrorClass classify(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return ErrorClass::None;

    case ErrorKind::Timeout:
    case ErrorKind::Io:
    case ErrorKind::NetworkUnreachable:
    case ErrorKind::ConnectionRefused:
    case ErrorKind::NotConnected:
      return ErrorClass::Recoverable;

    case ErrorKind::NotPaired:
    case ErrorKind::PermissionDenied:
    case ErrorKind::Config:
    case ErrorKind::ProtocolVersion:
    case ErrorKind::ResourceExhausted:
    case ErrorKind::Cancelled:
    case ErrorKind::Unsupported:
      return ErrorClass::UserActionRequired;

    case ErrorKind::CertificateMismatch:
    case ErrorKind::MalformedPacket:
    case ErrorKind::PacketTooLarge:
    case ErrorKind::Tls:
    case ErrorKind::Internal:
      return ErrorClass::Critical;
  }
  return ErrorClass::Critical;  // unreachable with a valid enum value
}

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:                return "ok";
    case ErrorKind::Timeout:             return "timeout";
    case ErrorKind::Io:                  return "io";
    case ErrorKind::NetworkUnreachable:  return "network_unreachable";
    case ErrorKind::ConnectionRefused:   return "connection_refused";
    case ErrorKind::NotConnected:        return "not_connected";
    case ErrorKind::NotPaired:           return "not_paired";
    case ErrorKind::PermissionDenied:    return "permission_denied";
    case ErrorKind::CertificateMismatch: return "certificate_mismatch";
    case ErrorKind::Config:              return "config";
    case ErrorKind::ProtocolVersion:     return "protocol_version";
    case ErrorKind::ResourceExhausted:   return "resource_exhausted";
    case ErrorKind::Cancelled:           return "cancelled";
    case ErrorKind::Unsupported:         return "unsupported";
    case ErrorKind::MalformedPacket:     return "malformed_packet";
    case ErrorKind::PacketTooLarge:      return "packet_too_large";
    case ErrorKind::Tls:                 return "tls";
    case ErrorKind::Internal:            return "internal";
  }
  return "unknown";
}

const char* to_string(ErrorClass cls) {
  switch (cls) {
    case ErrorClass::None:               return "none";
    case ErrorClass::Recoverable:        return "recoverable";
    case ErrorClass::UserActionRequired: return "user_action_required";
    case ErrorClass::Critical:           return "critical";
  }
  return "unknown";
}

std::string Status::to_string() const {
  if (ok()) return "ok";
  std::string s = kdc::to_string(kind_);
  if (!detail_.empty()) {
    s += ": ";
    s += detail_;
  }
  return s;
}

} // namespace kdc
