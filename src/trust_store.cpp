// ============================================================================
// trust_store.cpp — implementation for trust_store.hpp
// ============================================================================

#include "kdc/trust_store.hpp"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include "kdc/json_file.hpp"

namespace kdc {

static constexpr int TRUST_FILE_VERSION = 1;

const char* to_string(TrustState s) {
  switch (s) {
    case TrustState::Untrusted:      return "untrusted";
    case TrustState::PendingPairing: return "pending";
    case TrustState::Trusted:        return "trusted";
    case TrustState::Revoked:        return "revoked";
  }
  return "?";
}

bool trust_state_from_string(const std::string& s, TrustState& out) {
  if (s == "untrusted") { out = TrustState::Untrusted; return true; }
  if (s == "pending")   { out = TrustState::PendingPairing; return true; }
  if (s == "trusted")   { out = TrustState::Trusted; return true; }
  if (s == "revoked")   { out = TrustState::Revoked; return true; }
  return false;
}

TrustStore::TrustStore(std::string path, std::size_t max_transient)
: path_(std::move(path)), max_transient_(max_transient) {}

// ---------------------------------------------------------------------------
// load()
// ------
// Entries with a bad shape are skipped with a warning; a file that is not
// JSON at all is an error and the store is left untouched, so the next save
// cannot overwrite pairings we failed to read. First-contact entries written
// by older versions are dropped.
// ---------------------------------------------------------------------------
Status TrustStore::load() {
  if (path_.empty()) return Status();
  nlohmann::json doc;
  Status err;
  JsonReadResult r = read_json_file(path_, doc, err);
  if (r == JsonReadResult::Missing) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    records_.clear();
    transient_.clear();
    return Status();
  }
  if (r == JsonReadResult::Error) return err;

  auto devs = doc.find("devices");
  if (!doc.is_object() || devs == doc.end() || !devs->is_object())
    return Status(ErrorKind::Config, path_ + ": no devices object");

  std::map<std::string, TrustRecord> loaded;
  for (auto it = devs->begin(); it != devs->end(); ++it) {
    const nlohmann::json& j = it.value();
    TrustRecord rec;
    rec.device_id = it.key();
    auto fp = j.find("fingerprint");
    auto st = j.find("state");
    auto pm = j.find("pairedMs");
    if (!j.is_object() || fp == j.end() || !fp->is_string() || st == j.end() || !st->is_string() ||
        !trust_state_from_string(st->get<std::string>(), rec.state)) {
      spdlog::warn("trust: skipping malformed record {}", rec.device_id);
      continue;
    }
    rec.fingerprint = fp->get<std::string>();
    if (pm != j.end() && pm->is_number_integer()) rec.paired_ms = pm->get<int64_t>();
    if (!persistent(rec.state)) continue;
    loaded.emplace(rec.device_id, std::move(rec));
  }

  std::unique_lock<std::shared_mutex> lk(mu_);
  records_.swap(loaded);
  transient_.clear();
  spdlog::info("trust: loaded {} record(s) from {}", records_.size(), path_);
  return Status();
}

Status TrustStore::save() const {
  if (path_.empty()) return Status();
  std::lock_guard<std::mutex> save_lk(save_mu_);
  nlohmann::json devs = nlohmann::json::object();
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    for (const auto& kv : records_) {
      const TrustRecord& r = kv.second;
      if (!persistent(r.state)) continue;
      devs[r.device_id] = {{"fingerprint", r.fingerprint}, {"pairedMs", r.paired_ms}, {"state", to_string(r.state)}};
    }
  }
  nlohmann::json doc = {{"version", TRUST_FILE_VERSION}, {"devices", std::move(devs)}};
  return write_json_file(path_, doc, true);
}

std::optional<TrustRecord> TrustStore::get(const std::string& device_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = records_.find(device_id);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

std::vector<TrustRecord> TrustStore::all() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<TrustRecord> out;
  out.reserve(records_.size());
  for (const auto& kv : records_) out.push_back(kv.second);
  return out;
}

bool TrustStore::is_trusted(const std::string& device_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = records_.find(device_id);
  return it != records_.end() && it->second.state == TrustState::Trusted;
}

// Caller holds mu_ exclusively.
void TrustStore::evict_transient_locked() {
  while (transient_.size() > max_transient_) {
    auto victim = transient_.end();
    bool victim_pending = true;
    for (auto it = transient_.begin(); it != transient_.end(); ++it) {
      auto rec = records_.find(it->first);
      const bool pending = rec != records_.end() && rec->second.state == TrustState::PendingPairing;
      if (victim == transient_.end() || (victim_pending && !pending) ||
          (victim_pending == pending && it->second < victim->second)) {
        victim         = it;
        victim_pending = pending;
      }
    }
    spdlog::debug("trust: forgetting first contact {}", victim->first);
    records_.erase(victim->first);
    transient_.erase(victim);
  }
}

Status TrustStore::put(const TrustRecord& rec) {
  if (rec.device_id.empty()) return Status(ErrorKind::Internal, "trust record without device id");
  bool dirty = persistent(rec.state);
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = records_.find(rec.device_id);
    if (it != records_.end() && persistent(it->second.state)) dirty = true;
    records_[rec.device_id] = rec;
    if (persistent(rec.state)) {
      transient_.erase(rec.device_id);
    } else {
      transient_[rec.device_id] = ++touch_seq_;
      evict_transient_locked();
    }
  }
  return dirty ? save() : Status();
}

Status TrustStore::erase(const std::string& device_id) {
  bool dirty = false;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = records_.find(device_id);
    if (it == records_.end()) return Status();
    dirty = persistent(it->second.state);
    records_.erase(it);
    transient_.erase(device_id);
  }
  spdlog::info("trust: erased {}", device_id);
  return dirty ? save() : Status();
}

Status TrustStore::revoke(const std::string& device_id) {
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    auto it = records_.find(device_id);
    if (it == records_.end()) return Status(ErrorKind::NotPaired, "no trust record for " + device_id);
    it->second.state = TrustState::Revoked;
    transient_.erase(device_id);
  }
  spdlog::warn("trust: revoked {}", device_id);
  return save();
}

std::size_t TrustStore::transient_count() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return transient_.size();
}

} // namespace kdc
