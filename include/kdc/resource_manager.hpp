#pragma once
/**
 * @file resource_manager.hpp
 * @brief Admission control: the single source of truth for connection, transfer
 *        and queue budgets.
 *
 * @details
 * ## Field Brief
 * Every connection, payload transfer and queued packet is admitted here before
 * it exists and released here after it ends. Admission and release are the only
 * mutation points, always paired:
 *
 * | admit                     | release             |
 * |---------------------------|---------------------|
 * | `can_accept_connection()` | `release_connection()` |
 * | `can_start_transfer()`    | `finish_transfer()` |
 * | `try_enqueue_packet()`    | `dequeue_packet()`  |
 *
 * A refused admission leaves every counter untouched and returns
 * `ResourceExhausted` naming the ceiling that was hit.
 *
 * ## Invariants
 *  - No counter is ever negative; an unmatched release is logged and ignored.
 *  - For each counter, the global value equals the sum of the per-device values.
 *  - Per-device and global connection counts never exceed their limits.
 *
 * ## Memory estimate
 * `queued bytes + min(Σ transfer sizes, 16 MiB × transfers) + 64 KiB × connections`.
 * Transfers stream to disk, so only their buffers count, not their size.
 */

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "kdc/status.hpp"

namespace kdc {

struct ResourceLimits {
  uint32_t per_device_connections{3};
  uint32_t global_connections{50};
  uint32_t per_device_transfers{3};
  uint32_t global_transfers{10};
  uint64_t max_transfer_size{100ull * 1024 * 1024};
  uint64_t max_total_transfer_size{1024ull * 1024 * 1024};
  uint32_t packet_queue_depth{100};
  uint64_t memory_threshold{500ull * 1024 * 1024};
  int64_t  idle_timeout_ms{5 * 60 * 1000};
};

/// Buffer charged per active transfer, at most.
static constexpr uint64_t TRANSFER_BUFFER_ESTIMATE   = 16ull * 1024 * 1024;
/// Charged per open connection.
static constexpr uint64_t CONNECTION_MEMORY_ESTIMATE = 64ull * 1024;

struct ResourceCounters {
  uint32_t connections{0};
  uint32_t transfers{0};
  uint64_t transfer_bytes{0};    ///< sum of sizes of active transfers
  uint32_t queued_packets{0};
  uint64_t queued_bytes{0};

  uint64_t memory_estimate() const;
  bool operator==(const ResourceCounters& o) const {
    return connections == o.connections && transfers == o.transfers && transfer_bytes == o.transfer_bytes &&
           queued_packets == o.queued_packets && queued_bytes == o.queued_bytes;
  }
};

struct ResourceSnapshot {
  ResourceCounters                        global;
  std::map<std::string, ResourceCounters> per_device;

  /// Global equals the per-device sum for every counter.
  bool consistent() const;
};

class ResourceManager {
public:
  explicit ResourceManager(ResourceLimits limits = ResourceLimits{});

  const ResourceLimits& limits() const { return limits_; }

  /// Admit one connection for @p device_id (counts it and marks it active at @p now_ms).
  Status can_accept_connection(const std::string& device_id, int64_t now_ms);
  void   release_connection(const std::string& device_id);

  /// Admit one transfer of @p size bytes.
  Status can_start_transfer(const std::string& device_id, uint64_t size);
  void   finish_transfer(const std::string& device_id, uint64_t size);

  /// Admit one queued packet of @p bytes.
  Status try_enqueue_packet(const std::string& device_id, uint64_t bytes);
  void   dequeue_packet(const std::string& device_id, uint64_t bytes);

  /// Record activity on @p device_id's connections.
  void touch(const std::string& device_id, int64_t now_ms);
  /// Devices with open connections and no activity for idle_timeout_ms.
  std::vector<std::string> stale_connections(int64_t now_ms) const;

  ResourceSnapshot snapshot() const;

private:
  Status exhausted(const std::string& what) const;
  void   prune(const std::string& device_id);

  ResourceLimits                          limits_;
  mutable std::shared_mutex               mu_;
  ResourceCounters                        global_;
  std::map<std::string, ResourceCounters> devices_;
  std::map<std::string, int64_t>          last_activity_;
};

} // namespace kdc
