/**
 * @file status.hpp
 * @brief Error taxonomy and the Status value every core operation returns.
 *
 * @details
 * ## Field Brief
 * Errors are classified exactly once, at the lowest layer that sees them. The
 * classification (`ErrorClass`) is a pure function of the `ErrorKind`, so it
 * travels unchanged from a socket call up through the transport manager, the
 * recovery manager and the coordinator. Upper layers decide retry vs. surface
 * by looking at `Status::error_class()` alone; they never re-classify.
 *
 * | Class               | Kinds                                                      | Handling                  |
 * |---------------------|------------------------------------------------------------|---------------------------|
 * | Recoverable         | Timeout, Io, NetworkUnreachable, ConnectionRefused, NotConnected | retried, logged at warn |
 * | UserActionRequired  | NotPaired, PermissionDenied, Config, ProtocolVersion, ResourceExhausted, Cancelled, Unsupported | surfaced, not retried |
 * | Critical            | CertificateMismatch, MalformedPacket, PacketTooLarge, Tls, Internal | logged at error, link torn down |
 *
 * A certificate fingerprint mismatch is reported as `CertificateMismatch`
 * (critical) and additionally flagged `is_security_violation()`; callers must
 * tear the connection down, surface it to the user and never re-trust silently.
 *
 * No exceptions cross component boundaries: third-party exceptions are caught
 * where they are raised and converted into a `Status`.
 */
#ifndef KDC_STATUS_HPP
#define KDC_STATUS_HPP

#include <cstdint>
#include <string>

namespace kdc {

enum class ErrorKind : uint8_t {
  None = 0,
  // recoverable
  Timeout,
  Io,
  NetworkUnreachable,
  ConnectionRefused,
  NotConnected,
  // user action required
  NotPaired,
  PermissionDenied,
  Config,
  ProtocolVersion,
  ResourceExhausted,
  Cancelled,
  Unsupported,
  // critical
  CertificateMismatch,
  MalformedPacket,
  PacketTooLarge,
  Tls,
  Internal,
};

enum class ErrorClass : uint8_t { None = 0, Recoverable, UserActionRequired, Critical };

/// Fixed mapping kind -> class. The only place classification happens.
ErrorClass classify(ErrorKind kind);

const char* to_string(ErrorKind kind);
const char* to_string(ErrorClass cls);

/**
 * @brief Result of a core operation: ok, or an error kind plus a short detail.
 *
 * Cheap to copy. `detail` is free text for logs (e.g. "connect 10.0.0.4:1716: refused").
 */
class Status {
public:
  Status() = default;
  Status(ErrorKind kind, std::string detail)
  : kind_(kind), detail_(std::move(detail)) {}

  static Status ok_status() { return Status(); }

  bool ok() const { return kind_ == ErrorKind::None; }
  explicit operator bool() const { return ok(); }

  ErrorKind kind() const { return kind_; }
  ErrorClass error_class() const { return classify(kind_); }
  const std::string& detail() const { return detail_; }

  bool recoverable() const { return error_class() == ErrorClass::Recoverable; }
  bool critical() const { return error_class() == ErrorClass::Critical; }

  /// Pinned-certificate violations. Always tear down, never re-trust.
  bool is_security_violation() const { return kind_ == ErrorKind::CertificateMismatch; }

  /// "kind: detail" for log lines.
  std::string to_string() const;

private:
  ErrorKind   kind_{ErrorKind::None};
  std::string detail_;
};

} // namespace kdc

#endif // KDC_STATUS_HPP
