#pragma once
/**
 * @file pairing.hpp
 * @brief Pairing state machine and certificate pinning.
 *
 * @details
 * ## Field Brief
 * Per device:
 * ```
 *   Unpaired ──request_pair()/pair{true} in──► PairRequested ──accept──► Trusted
 *                                                    │ reject / 30 s timeout
 *                                                    └──────────────────► Unpaired
 *   Trusted ──unpair()/pair{false} in──► record erased (next contact is first contact)
 * ```
 *
 * Acceptance of a peer's request is an external decision: under
 * `PairingPolicy::Explicit` a `PairingRequested` event carrying the peer
 * fingerprint is queued and nothing happens until `accept()` or `reject()`.
 * `TrustOnFirstUse` accepts automatically.
 *
 * ## Pinning
 * `verify_handshake()` runs for every new session before it is handed out:
 *  - TLS, Trusted id, different fingerprint → `CertificateMismatch`. Never re-trusted.
 *  - TLS, Revoked id → `PermissionDenied`.
 *  - TLS, unknown id → an Untrusted record is created with the fingerprint.
 *  - BLE (no fingerprint) → only a Trusted id on an encrypted link; else `NotPaired`.
 *
 * Outgoing pair packets are returned to the caller, which sends them on the
 * device's connection; the manager itself does no I/O besides the trust store.
 */

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "etl/deque.h"

#include "kdc/packet.hpp"
#include "kdc/status.hpp"
#include "kdc/transport/transport_base.hpp"
#include "kdc/trust_store.hpp"

namespace kdc {

enum class PairingPolicy : uint8_t { TrustOnFirstUse = 0, Explicit };

const char* to_string(PairingPolicy p);
bool pairing_policy_from_string(const std::string& s, PairingPolicy& out);

/// Pairing request lifetime.
static constexpr int64_t PAIRING_TIMEOUT_MS = 30000;
/// Pair requests whose timestamp is further than this from our clock are ignored.
static constexpr int64_t PAIR_TIMESTAMP_TOLERANCE_S = 1800;

enum class PairingEventKind : uint8_t { PairingRequested = 0, PairingResult };

struct PairingEvent {
  PairingEventKind kind{PairingEventKind::PairingRequested};
  std::string      device_id;
  std::string      fingerprint;
  bool             accepted{false};    ///< PairingResult only
  std::string      reason;             ///< PairingResult only: "accepted", "rejected", "timed out", ...
};

/// `kdeconnect.pair` packet.
Packet make_pair_packet(bool pair);

class PairingManager {
public:
  static constexpr std::size_t EVENT_CAPACITY = 64;

  PairingManager(TrustStore& store, PairingPolicy policy);

  PairingPolicy policy() const { return policy_; }

  /**
   * @brief Check a freshly handshaken session against the pinned fingerprint.
   * @retval ok                   session may proceed (trusted or first contact)
   * @retval CertificateMismatch  Trusted id presented a different certificate
   * @retval PermissionDenied     id is Revoked
   * @retval NotPaired            BLE session for an untrusted id or unencrypted link
   */
  Status verify_handshake(const transport::HandshakeInfo& info);

  /// Ask @p device_id to pair. @p out is the packet to send.
  Status request_pair(const std::string& device_id, int64_t now_ms, Packet& out);

  /**
   * @brief Feed a received `kdeconnect.pair` packet.
   * @param reply set when the protocol requires an answer on the same connection
   */
  Status handle_pair_packet(const std::string& device_id, const Packet& p, int64_t now_ms,
                            std::optional<Packet>& reply);

  /// Accept a pending request from the peer.
  Status accept(const std::string& device_id, Packet& out);
  /// Decline a pending request (ours or theirs).
  Status reject(const std::string& device_id, Packet& out);
  /// Forget the device: trust record erased, pending request dropped.
  Status unpair(const std::string& device_id, Packet& out);

  /// Expire requests older than PAIRING_TIMEOUT_MS.
  void tick(int64_t now_ms);

  bool poll_event(PairingEvent& out);

  bool is_trusted(const std::string& device_id) const { return store_.is_trusted(device_id); }
  TrustState state(const std::string& device_id) const;
  bool pending(const std::string& device_id) const;
  /// A trust record exists (any state). False after unpair until the next handshake.
  bool has_record(const std::string& device_id) const { return store_.get(device_id).has_value(); }

private:
  struct Pending {
    bool    local{true};          ///< we sent the request
    int64_t started_ms{0};
  };

  Status trust(const std::string& device_id, const std::string& reason);
  Status set_state(const std::string& device_id, TrustState s);
  void   emit(PairingEvent ev);

  TrustStore&                                       store_;
  PairingPolicy                                     policy_;
  mutable std::mutex                                mu_;
  std::map<std::string, Pending>                    pending_;
  etl::deque<PairingEvent, EVENT_CAPACITY>          events_;
};

} // namespace kdc
