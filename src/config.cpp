// ============================================================================
// config.cpp — implementation for config.hpp
// ============================================================================

#include "kdc/config.hpp"

#include <cctype>
#include <limits>
#include <vector>

#include <spdlog/spdlog.h>

#include "kdc/json_file.hpp"
#include "kdc/log.hpp"

namespace kdc {

using nlohmann::json;

namespace {

constexpr int64_t MAX_MS   = 24LL * 3600 * 1000;
constexpr int64_t MAX_I64  = std::numeric_limits<int64_t>::max();

Status bad(const std::string& key, const std::string& what) {
  return Status(ErrorKind::Config, key + ": " + what);
}

// Typed reads from one JSON object. The first failure sticks in err and
// every later read becomes a no-op.
class Fields {
public:
  Fields(const json& root, const char* section, Status& err) : err_(err), prefix_(std::string(section) + ".") {
    auto it = root.find(section);
    if (it == root.end()) return;
    if (!it->is_object()) {
      err_ = bad(section, "expected an object");
      return;
    }
    obj_ = &*it;
  }

  template <typename T>
  void integer(const char* key, T& out, int64_t lo, int64_t hi) {
    const json* v = find(key);
    if (!v) return;
    if (!v->is_number_integer()) {
      err_ = bad(prefix_ + key, "expected an integer");
      return;
    }
    if (v->is_number_unsigned() && v->get<uint64_t>() > static_cast<uint64_t>(MAX_I64)) {
      err_ = bad(prefix_ + key, "out of range");
      return;
    }
    const int64_t x = v->get<int64_t>();
    if (x < lo || x > hi) {
      err_ = bad(prefix_ + key, std::to_string(x) + " out of range [" + std::to_string(lo) + ", " +
                                    std::to_string(hi) + "]");
      return;
    }
    out = static_cast<T>(x);
  }

  void boolean(const char* key, bool& out) {
    const json* v = find(key);
    if (!v) return;
    if (!v->is_boolean()) {
      err_ = bad(prefix_ + key, "expected true or false");
      return;
    }
    out = v->get<bool>();
  }

  void text(const char* key, std::string& out) {
    const json* v = find(key);
    if (!v) return;
    if (!v->is_string()) {
      err_ = bad(prefix_ + key, "expected a string");
      return;
    }
    out = v->get<std::string>();
  }

  bool texts(const char* key, std::vector<std::string>& out) {
    const json* v = find(key);
    if (!v) return false;
    if (!v->is_array()) {
      err_ = bad(prefix_ + key, "expected an array of strings");
      return false;
    }
    std::vector<std::string> items;
    for (const auto& e : *v) {
      if (!e.is_string()) {
        err_ = bad(prefix_ + key, "expected an array of strings");
        return false;
      }
      items.push_back(e.get<std::string>());
    }
    out.swap(items);
    return true;
  }

  void set(const char* key, std::set<std::string>& out) {
    std::vector<std::string> items;
    if (texts(key, items)) out = std::set<std::string>(items.begin(), items.end());
  }

private:
  const json* find(const char* key) const {
    if (!obj_ || !err_.ok()) return nullptr;
    auto it = obj_->find(key);
    return it == obj_->end() ? nullptr : &*it;
  }

  Status&     err_;
  std::string prefix_;
  const json* obj_{nullptr};
};

std::string upper(std::string s) {
  for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

void apply_device(const json& doc, CoreConfig& c, Status& err) {
  Fields f(doc, "device", err);
  f.text("id", c.device_id);
  f.text("name", c.device_name);
  std::string type;
  f.text("type", type);
  if (!type.empty()) c.device_type = device_type_from_string(type);
  f.set("incoming_capabilities", c.incoming);
  f.set("outgoing_capabilities", c.outgoing);
  if (err.ok() && !c.device_id.empty() && !is_valid_device_id(c.device_id))
    err = bad("device.id", "must be 32 to 38 characters of [A-Za-z0-9_-]");
}

void apply_discovery(const json& doc, CoreConfig& c, Status& err) {
  Fields f(doc, "discovery", err);
  f.integer("udp_port", c.discovery.udp_port, 1, 65535);
  f.integer("broadcast_interval_ms", c.discovery.broadcast_interval_ms, 100, MAX_MS);
  f.integer("lost_timeout_ms", c.discovery.lost_timeout_ms, 1000, MAX_MS);
  f.boolean("mdns", c.discovery.enable_mdns);
  f.texts("broadcast_targets", c.discovery.broadcast_targets);
}

void apply_tcp(const json& doc, CoreConfig& c, Status& err) {
  Fields f(doc, "tcp", err);
  f.boolean("enabled", c.enable_tcp);
  f.integer("port_first", c.tcp.port_first, 1, 65535);
  f.integer("port_last", c.tcp.port_last, 1, 65535);
  f.integer("connect_timeout_ms", c.tcp.connect_timeout_ms, 100, 600000);
  f.integer("handshake_timeout_ms", c.tcp.handshake_timeout_ms, 100, 600000);
  f.integer("max_handshaking", c.tcp.max_handshaking, 1, 4096);
  f.integer("max_handshaking_per_ip", c.tcp.max_handshaking_per_ip, 1, 4096);
  if (err.ok() && c.tcp.port_first > c.tcp.port_last) err = bad("tcp.port_first", "greater than tcp.port_last");
}

void apply_bluetooth(const json& doc, CoreConfig& c, Status& err) {
  Fields f(doc, "bluetooth", err);
  f.boolean("enabled", c.enable_bluetooth);
  f.text("adapter", c.bluetooth_adapter);
  f.integer("timeout_ms", c.bluetooth.timeout_ms, 100, 600000);
  f.integer("scan_interval_ms", c.ble_discovery.scan_interval_ms, 1000, MAX_MS);
  f.integer("scan_duration_ms", c.ble_discovery.scan_duration_ms, 100, 600000);
  f.integer("lost_timeout_ms", c.ble_discovery.lost_timeout_ms, 1000, MAX_MS);
  std::vector<std::string> allow;
  if (f.texts("allow_list", allow)) {
    c.ble_discovery.allow_list.clear();
    for (const auto& a : allow) c.ble_discovery.allow_list.insert(upper(a));
  }
}

void apply_transport(const json& doc, CoreConfig& c, Status& err) {
  Fields f(doc, "transport", err);
  std::string pref;
  f.text("preference", pref);
  if (err.ok() && !pref.empty() && !transport_preference_from_string(pref, c.manager.preference))
    err = bad("transport.preference", "unknown preference '" + pref + "'");
  f.boolean("auto_fallback", c.manager.auto_fallback);
}

void apply_payload(const json& doc, CoreConfig& c, Status& err) {
  Fields f(doc, "payload", err);
  f.integer("port_first", c.payload.port_first, 1, 65535);
  f.integer("port_last", c.payload.port_last, 1, 65535);
  f.integer("timeout_ms", c.payload.timeout_ms, 100, 600000);
  if (err.ok() && c.payload.port_first > c.payload.port_last)
    err = bad("payload.port_first", "greater than payload.port_last");
}

void apply_pairing(const json& doc, CoreConfig& c, Status& err) {
  Fields f(doc, "pairing", err);
  std::string policy;
  f.text("policy", policy);
  if (err.ok() && !policy.empty() && !pairing_policy_from_string(policy, c.pairing_policy))
    err = bad("pairing.policy", "expected \"tofu\" or \"explicit\"");
}

void apply_resources(const json& doc, CoreConfig& c, Status& err) {
  Fields f(doc, "resources", err);
  ResourceLimits& l = c.limits;
  f.integer("per_device_connections", l.per_device_connections, 1, 1000);
  f.integer("global_connections", l.global_connections, 1, 100000);
  f.integer("per_device_transfers", l.per_device_transfers, 1, 1000);
  f.integer("global_transfers", l.global_transfers, 1, 100000);
  f.integer("max_transfer_size", l.max_transfer_size, 1, MAX_I64);
  f.integer("max_total_transfer_size", l.max_total_transfer_size, 1, MAX_I64);
  f.integer("packet_queue_depth", l.packet_queue_depth, 1, 1000000);
  f.integer("memory_threshold", l.memory_threshold, 1, MAX_I64);
  f.integer("idle_timeout_ms", l.idle_timeout_ms, 1000, MAX_MS);
}

void apply_recovery(const json& doc, CoreConfig& c, Status& err) {
  Fields f(doc, "recovery", err);
  f.integer("initial_delay_ms", c.reconnect.initial_delay_ms, 1, MAX_MS);
  f.integer("max_delay_ms", c.reconnect.max_delay_ms, 1, MAX_MS);
  f.integer("max_attempts", c.reconnect.max_attempts, 1, 1000);
  f.integer("retry_attempts", c.retry.max_attempts, 1, 1000);
  f.integer("retry_delay_ms", c.retry.retry_delay_ms, 1, MAX_MS);
}

void apply_top(const json& doc, CoreConfig& c, Status& err) {
  auto text = [&](const char* key, std::string& out) {
    auto it = doc.find(key);
    if (!err.ok() || it == doc.end()) return;
    if (!it->is_string()) err = bad(key, "expected a string");
    else out = it->get<std::string>();
  };
  auto number = [&](const char* key, int64_t& out, int64_t lo, int64_t hi) {
    auto it = doc.find(key);
    if (!err.ok() || it == doc.end()) return;
    if (!it->is_number_integer()) err = bad(key, "expected an integer");
    else if (it->get<int64_t>() < lo || it->get<int64_t>() > hi) err = bad(key, "out of range");
    else out = it->get<int64_t>();
  };
  text("state_dir", c.state_dir);
  text("log_level", c.log_level);
  number("tick_interval_ms", c.tick_interval_ms, 10, 60000);
  number("maintenance_interval_ms", c.maintenance_interval_ms, 100, MAX_MS);
  spdlog::level::level_enum lvl;
  if (err.ok() && !parse_log_level(c.log_level, lvl)) err = bad("log_level", "unknown level '" + c.log_level + "'");
}

} // namespace

Status apply_config(const json& doc, CoreConfig& cfg) {
  if (!doc.is_object()) return Status(ErrorKind::Config, "configuration must be a JSON object");
  CoreConfig next = cfg;
  Status err;
  apply_top(doc, next, err);
  apply_device(doc, next, err);
  apply_discovery(doc, next, err);
  apply_tcp(doc, next, err);
  apply_bluetooth(doc, next, err);
  apply_transport(doc, next, err);
  apply_payload(doc, next, err);
  apply_pairing(doc, next, err);
  apply_resources(doc, next, err);
  apply_recovery(doc, next, err);
  if (!err.ok()) return err;
  cfg = std::move(next);
  return Status();
}

Status load_config(const std::string& path, CoreConfig& cfg) {
  json doc;
  Status err;
  switch (read_json_file(path, doc, err)) {
    case JsonReadResult::Missing:
      spdlog::info("config: {} not found, using defaults", path);
      return Status();
    case JsonReadResult::Error:
      return Status(ErrorKind::Config, err.detail());
    case JsonReadResult::Ok:
      break;
  }
  Status st = apply_config(doc, cfg);
  if (!st) return Status(ErrorKind::Config, path + ": " + st.detail());
  return Status();
}

Status ensure_device_id(CoreConfig& cfg) {
  if (cfg.state_dir.empty()) cfg.state_dir = default_state_dir();
  if (!cfg.device_id.empty()) return Status();

  const std::string path = cfg.state_dir + "/device.json";
  json doc;
  Status err;
  switch (read_json_file(path, doc, err)) {
    case JsonReadResult::Error:
      return err;
    case JsonReadResult::Ok: {
      auto it = doc.find("deviceId");
      if (it != doc.end() && it->is_string() && is_valid_device_id(it->get<std::string>())) {
        cfg.device_id = it->get<std::string>();
        return Status();
      }
      spdlog::warn("config: {} holds no valid deviceId, generating a new one", path);
      break;
    }
    case JsonReadResult::Missing:
      break;
  }

  cfg.device_id = generate_device_id();
  spdlog::info("config: new device id {}", cfg.device_id);
  return write_json_file(path, json{{"deviceId", cfg.device_id}});
}

} // namespace kdc
