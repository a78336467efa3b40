#pragma once
/**
 * @file trust_store.hpp
 * @brief Persisted device id → pinned certificate fingerprint + trust state.
 *
 * @details
 * The store is the only owner of trust records. The pairing manager mutates it;
 * everyone else reads. Reads take a shared lock, mutations an exclusive one.
 *
 * Only `trusted` and `revoked` records are written through to
 * `<state_dir>/trust.json` (0600). First-contact records (`untrusted`,
 * `pending`) live in memory, at most `max_transient` of them; past that the
 * least recently touched one is dropped, untrusted before pending. A peer that
 * keeps inventing device ids therefore costs neither disk writes nor memory.
 *
 * On disk:
 * @code
 * {"version":1,"devices":{"<id>":{"fingerprint":"AB:..","pairedMs":1718000000000,"state":"trusted"}}}
 * @endcode
 *
 * Untrusted and pending entries found in an older file are skipped on load: a
 * pairing request never survives a restart.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "kdc/status.hpp"

namespace kdc {

enum class TrustState : uint8_t { Untrusted = 0, PendingPairing, Trusted, Revoked };

const char* to_string(TrustState s);
bool trust_state_from_string(const std::string& s, TrustState& out);

struct TrustRecord {
  std::string device_id;
  std::string fingerprint;      ///< "AB:CD:..", SHA-256 of the peer certificate
  int64_t     paired_ms{0};     ///< wall clock, 0 until Trusted
  TrustState  state{TrustState::Untrusted};
};

class TrustStore {
public:
  static constexpr std::size_t DEFAULT_MAX_TRANSIENT = 64;

  /// @param path JSON file; empty keeps the store in memory only (tests)
  explicit TrustStore(std::string path = std::string(), std::size_t max_transient = DEFAULT_MAX_TRANSIENT);

  /// Replace the in-memory records with the file. A missing file is an empty store.
  Status load();
  Status save() const;

  std::optional<TrustRecord> get(const std::string& device_id) const;
  std::vector<TrustRecord> all() const;
  bool is_trusted(const std::string& device_id) const;

  /// Insert or replace. Persists when the set of trusted/revoked records changed.
  Status put(const TrustRecord& rec);
  /// Remove the record entirely (unpair). Missing ids are not an error.
  Status erase(const std::string& device_id);
  /// Keep the record but mark it Revoked: sessions from it are refused until erased.
  Status revoke(const std::string& device_id);

  /// Number of in-memory first-contact records.
  std::size_t transient_count() const;

private:
  static bool persistent(TrustState s) { return s == TrustState::Trusted || s == TrustState::Revoked; }
  void evict_transient_locked();

  std::string                        path_;
  std::size_t                        max_transient_;
  mutable std::shared_mutex          mu_;
  mutable std::mutex                 save_mu_;   ///< serialises file writes, taken before mu_
  std::map<std::string, TrustRecord> records_;
  std::map<std::string, uint64_t>    transient_; ///< id -> last touch sequence
  uint64_t                           touch_seq_{0};
};

} // namespace kdc
