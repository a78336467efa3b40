// ============================================================================
// resource_manager.cpp — implementation for resource_manager.hpp
// ============================================================================

#include "kdc/resource_manager.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

namespace kdc {

uint64_t ResourceCounters::memory_estimate() const {
  // transfer_bytes is a total, so the per-transfer cap is applied as an upper bound.
  const uint64_t transfer_buffers = std::min<uint64_t>(transfer_bytes, uint64_t(transfers) * TRANSFER_BUFFER_ESTIMATE);
  return queued_bytes + transfer_buffers + uint64_t(connections) * CONNECTION_MEMORY_ESTIMATE;
}

bool ResourceSnapshot::consistent() const {
  ResourceCounters sum;
  for (const auto& kv : per_device) {
    sum.connections    += kv.second.connections;
    sum.transfers      += kv.second.transfers;
    sum.transfer_bytes += kv.second.transfer_bytes;
    sum.queued_packets += kv.second.queued_packets;
    sum.queued_bytes   += kv.second.queued_bytes;
  }
  return sum == global;
}

ResourceManager::ResourceManager(ResourceLimits limits) : limits_(limits) {}

Status ResourceManager::exhausted(const std::string& what) const {
  spdlog::warn("resource: refused, {}", what);
  return Status(ErrorKind::ResourceExhausted, what);
}

// Caller holds mu_. Drops all-zero device entries.
void ResourceManager::prune(const std::string& device_id) {
  auto it = devices_.find(device_id);
  if (it != devices_.end() && it->second == ResourceCounters{}) {
    devices_.erase(it);
    last_activity_.erase(device_id);
  }
}

// ============================================================================
// Connections
// ============================================================================

Status ResourceManager::can_accept_connection(const std::string& device_id, int64_t now_ms) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  ResourceCounters& d = devices_[device_id];
  if (d.connections >= limits_.per_device_connections) {
    prune(device_id);
    return exhausted("per-device connection limit " + std::to_string(limits_.per_device_connections) +
                     " reached for " + device_id);
  }
  if (global_.connections >= limits_.global_connections) {
    prune(device_id);
    return exhausted("global connection limit " + std::to_string(limits_.global_connections) + " reached");
  }
  if (global_.memory_estimate() + CONNECTION_MEMORY_ESTIMATE > limits_.memory_threshold) {
    prune(device_id);
    return exhausted("memory pressure");
  }
  ++d.connections;
  ++global_.connections;
  last_activity_[device_id] = now_ms;
  return Status();
}

void ResourceManager::release_connection(const std::string& device_id) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(device_id);
  if (it == devices_.end() || it->second.connections == 0) {
    spdlog::error("resource: unmatched connection release for {}", device_id);
    return;
  }
  --it->second.connections;
  --global_.connections;
  prune(device_id);
}

// ============================================================================
// Transfers
// ============================================================================

Status ResourceManager::can_start_transfer(const std::string& device_id, uint64_t size) {
  if (size > limits_.max_transfer_size)
    return exhausted("transfer of " + std::to_string(size) + " bytes exceeds the " +
                     std::to_string(limits_.max_transfer_size) + " byte file limit");

  std::unique_lock<std::shared_mutex> lk(mu_);
  ResourceCounters& d = devices_[device_id];
  Status refused;
  if (d.transfers >= limits_.per_device_transfers)
    refused = exhausted("per-device transfer limit reached for " + device_id);
  else if (global_.transfers >= limits_.global_transfers)
    refused = exhausted("global transfer limit reached");
  else if (global_.transfer_bytes + size > limits_.max_total_transfer_size)
    refused = exhausted("aggregate transfer size limit reached");
  else if (global_.memory_estimate() + std::min(size, TRANSFER_BUFFER_ESTIMATE) > limits_.memory_threshold)
    refused = exhausted("memory pressure");
  if (!refused.ok()) {
    prune(device_id);
    return refused;
  }
  ++d.transfers;
  ++global_.transfers;
  d.transfer_bytes       += size;
  global_.transfer_bytes += size;
  return Status();
}

void ResourceManager::finish_transfer(const std::string& device_id, uint64_t size) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(device_id);
  if (it == devices_.end() || it->second.transfers == 0 || it->second.transfer_bytes < size) {
    spdlog::error("resource: unmatched transfer release for {}", device_id);
    return;
  }
  --it->second.transfers;
  --global_.transfers;
  it->second.transfer_bytes -= size;
  global_.transfer_bytes    -= size;
  prune(device_id);
}

// ============================================================================
// Packet queue
// ============================================================================

Status ResourceManager::try_enqueue_packet(const std::string& device_id, uint64_t bytes) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  ResourceCounters& d = devices_[device_id];
  Status refused;
  if (d.queued_packets >= limits_.packet_queue_depth)
    refused = exhausted("packet queue for " + device_id + " is full");
  else if (global_.memory_estimate() + bytes > limits_.memory_threshold)
    refused = exhausted("memory pressure");
  if (!refused.ok()) {
    prune(device_id);
    return refused;
  }
  ++d.queued_packets;
  ++global_.queued_packets;
  d.queued_bytes       += bytes;
  global_.queued_bytes += bytes;
  return Status();
}

void ResourceManager::dequeue_packet(const std::string& device_id, uint64_t bytes) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(device_id);
  if (it == devices_.end() || it->second.queued_packets == 0 || it->second.queued_bytes < bytes) {
    spdlog::error("resource: unmatched dequeue for {}", device_id);
    return;
  }
  --it->second.queued_packets;
  --global_.queued_packets;
  it->second.queued_bytes -= bytes;
  global_.queued_bytes    -= bytes;
  prune(device_id);
}

// ============================================================================
// Idle tracking
// ============================================================================

void ResourceManager::touch(const std::string& device_id, int64_t now_ms) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(device_id);
  if (it != devices_.end() && it->second.connections > 0) last_activity_[device_id] = now_ms;
}

std::vector<std::string> ResourceManager::stale_connections(int64_t now_ms) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& kv : devices_) {
    if (kv.second.connections == 0) continue;
    auto t = last_activity_.find(kv.first);
    if (t != last_activity_.end() && now_ms - t->second > limits_.idle_timeout_ms) out.push_back(kv.first);
  }
  return out;
}

ResourceSnapshot ResourceManager::snapshot() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  ResourceSnapshot s;
  s.global     = global_;
  s.per_device = devices_;
  return s;
}

} // namespace kdc
