// ============================================================================
// transfer_store.cpp — implementation for transfer_store.hpp
// ============================================================================

#include "kdc/transfer_store.hpp"

#include <filesystem>
#include <mutex>
#include <system_error>

#include <spdlog/spdlog.h>

#include "kdc/json_file.hpp"

namespace fs = std::filesystem;

namespace kdc {

nlohmann::json to_json(const TransferState& t) {
  return nlohmann::json{
      {"transferId", t.transfer_id},
      {"deviceId", t.device_id},
      {"filename", t.filename},
      {"destination", t.destination},
      {"totalSize", t.total_size},
      {"bytesReceived", t.bytes_received},
      {"startedMs", t.started_ms},
      {"updatedMs", t.updated_ms},
  };
}

bool from_json(const nlohmann::json& j, TransferState& out) {
  if (!j.is_object()) return false;
  auto str = [&](const char* k, std::string& v) {
    auto it = j.find(k);
    if (it == j.end() || !it->is_string()) return false;
    v = it->get<std::string>();
    return true;
  };
  auto u64 = [&](const char* k, uint64_t& v) {
    auto it = j.find(k);
    if (it == j.end() || !it->is_number_unsigned()) return false;
    v = it->get<uint64_t>();
    return true;
  };
  auto i64 = [&](const char* k, int64_t& v) {
    auto it = j.find(k);
    if (it == j.end() || !it->is_number_integer()) return false;
    v = it->get<int64_t>();
    return true;
  };
  TransferState t;
  if (!str("transferId", t.transfer_id) || !str("deviceId", t.device_id) ||
      !str("filename", t.filename) || !str("destination", t.destination) ||
      !u64("totalSize", t.total_size) || !u64("bytesReceived", t.bytes_received) ||
      !i64("startedMs", t.started_ms) || !i64("updatedMs", t.updated_ms))
    return false;
  if (t.transfer_id.empty()) return false;
  out = std::move(t);
  return true;
}

TransferStore::TransferStore(std::string state_dir)
: dir_((fs::path(state_dir) / "transfers").string()) {}

std::string TransferStore::record_path(const std::string& transfer_id) const {
  return (fs::path(dir_) / (transfer_id + ".json")).string();
}

Status TransferStore::persist(const TransferState& t) const {
  return write_json_file(record_path(t.transfer_id), to_json(t));
}

void TransferStore::remove_files(const TransferState& t, bool remove_partial) const {
  std::error_code ec;
  fs::remove(record_path(t.transfer_id), ec);
  if (ec) spdlog::warn("transfer: remove record {}: {}", t.transfer_id, ec.message());
  if (remove_partial && !t.destination.empty()) {
    fs::remove(t.destination, ec);
    if (ec) spdlog::warn("transfer: remove partial {}: {}", t.destination, ec.message());
  }
}

Status TransferStore::begin(const TransferState& t) {
  if (t.transfer_id.empty() || t.transfer_id.find('/') != std::string::npos)
    return Status(ErrorKind::Internal, "bad transfer id '" + t.transfer_id + "'");
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (active_.count(t.transfer_id)) return Status(ErrorKind::Internal, "transfer " + t.transfer_id + " already active");
  Status st = persist(t);
  if (!st) return st;
  active_[t.transfer_id] = t;
  return Status();
}

Status TransferStore::checkpoint(const std::string& transfer_id, uint64_t bytes_received, int64_t wall_now_ms) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = active_.find(transfer_id);
  if (it == active_.end()) return Status(ErrorKind::Internal, "unknown transfer " + transfer_id);
  it->second.bytes_received = bytes_received;
  it->second.updated_ms     = wall_now_ms;
  return persist(it->second);
}

Status TransferStore::complete(const std::string& transfer_id) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = active_.find(transfer_id);
  if (it == active_.end()) return Status(ErrorKind::Internal, "unknown transfer " + transfer_id);
  remove_files(it->second, /*remove_partial*/false);
  active_.erase(it);
  return Status();
}

Status TransferStore::abort(const std::string& transfer_id, bool remove_partial) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = active_.find(transfer_id);
  if (it == active_.end()) return Status(ErrorKind::Internal, "unknown transfer " + transfer_id);
  remove_files(it->second, remove_partial);
  active_.erase(it);
  return Status();
}

Status TransferStore::load_all(std::vector<TransferState>& out) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  std::error_code ec;
  if (!fs::exists(dir_, ec)) return Status();

  for (const auto& e : fs::directory_iterator(dir_, ec)) {
    if (e.path().extension() != ".json") continue;
    nlohmann::json doc;
    Status err;
    TransferState t;
    if (read_json_file(e.path().string(), doc, err) != JsonReadResult::Ok || !from_json(doc, t)) {
      spdlog::warn("transfer: dropping unreadable checkpoint {}", e.path().string());
      std::error_code rm;
      fs::remove(e.path(), rm);
      continue;
    }
    active_[t.transfer_id] = t;
    out.push_back(std::move(t));
  }
  if (ec) return Status(ErrorKind::Io, "scan " + dir_ + ": " + ec.message());
  return Status();
}

std::size_t TransferStore::cleanup_stale(int64_t wall_now_ms, int64_t max_age_ms) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  std::size_t removed = 0;
  for (auto it = active_.begin(); it != active_.end();) {
    if (wall_now_ms - it->second.updated_ms > max_age_ms) {
      spdlog::info("transfer: gc stale {} ({} of {} bytes)", it->first,
                   it->second.bytes_received, it->second.total_size);
      remove_files(it->second, /*remove_partial*/true);
      it = active_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::optional<TransferState> TransferStore::get(const std::string& transfer_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = active_.find(transfer_id);
  if (it == active_.end()) return std::nullopt;
  return it->second;
}

std::size_t TransferStore::active_count() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return active_.size();
}

} // namespace kdc
