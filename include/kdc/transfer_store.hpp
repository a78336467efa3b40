#pragma once
/**
 * @file transfer_store.hpp
 * @brief Crash-safe checkpoints of in-flight payload transfers.
 *
 * @details
 * PURPOSE
 * -------
 * A daemon crash in the middle of a file transfer must leave enough behind to
 * either resume or cleanly abort on restart. Every transfer gets one small JSON
 * record under `<state_dir>/transfers/<transfer_id>.json`, rewritten (tmp +
 * rename) on each checkpoint.
 *
 * LIFECYCLE
 * ---------
 * ```
 *   begin() ──► checkpoint()* ──► complete()          record removed, file kept
 *                            └──► abort()             record removed, partial file removed
 *   load_all() after restart ──► cleanup_stale(>24h)  record + partial file removed
 * ```
 *
 * Timestamps are wall-clock milliseconds (they outlive the process).
 * Reads are concurrent, writes exclusive (`std::shared_mutex`).
 */

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kdc/status.hpp"

namespace kdc {

struct TransferState {
  std::string transfer_id;
  std::string device_id;
  std::string filename;
  std::string destination;          ///< full path of the file being written
  uint64_t    total_size{0};
  uint64_t    bytes_received{0};
  int64_t     started_ms{0};
  int64_t     updated_ms{0};

  bool complete() const { return bytes_received >= total_size; }
};

nlohmann::json to_json(const TransferState& t);
bool from_json(const nlohmann::json& j, TransferState& out);

/// Transfers older than this (by last update) are garbage.
static constexpr int64_t TRANSFER_STALE_MS = 24LL * 3600 * 1000;

class TransferStore {
public:
  /// @param state_dir records live in `<state_dir>/transfers/`
  explicit TransferStore(std::string state_dir);

  Status begin(const TransferState& t);
  Status checkpoint(const std::string& transfer_id, uint64_t bytes_received, int64_t wall_now_ms);
  Status complete(const std::string& transfer_id);
  /// Drop the record; delete the partial destination file when @p remove_partial.
  Status abort(const std::string& transfer_id, bool remove_partial = true);

  /// Read every record from disk into memory (restart path). Corrupt records are removed.
  Status load_all(std::vector<TransferState>& out);

  /**
   * @brief Remove records not updated for @p max_age_ms, with their partial files.
   * @return number of transfers removed
   */
  std::size_t cleanup_stale(int64_t wall_now_ms, int64_t max_age_ms = TRANSFER_STALE_MS);

  std::optional<TransferState> get(const std::string& transfer_id) const;
  std::size_t active_count() const;

private:
  std::string record_path(const std::string& transfer_id) const;
  Status persist(const TransferState& t) const;
  void   remove_files(const TransferState& t, bool remove_partial) const;

  std::string                          dir_;
  mutable std::shared_mutex            mu_;
  std::map<std::string, TransferState> active_;
};

} // namespace kdc
