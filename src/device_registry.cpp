// ============================================================================
// device_registry.cpp — implementation for device_registry.hpp
// ============================================================================

#include "kdc/device_registry.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include "kdc/json_file.hpp"
#include "kdc/transport/bluetooth_transport.hpp"

namespace kdc {

using transport::BluetoothAddress;
using transport::TcpAddress;
using transport::TransportAddress;
using transport::TransportType;

DeviceRegistry::DeviceRegistry(std::string path) : path_(std::move(path)) {}

void DeviceRegistry::remember(const DeviceIdentity& id, const TransportAddress& addr, int64_t wall_now_ms) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  KnownDevice& d = devices_[id.device_id];
  d.device_id = id.device_id;
  if (!id.name.empty()) d.name = id.name;
  d.type = id.type;
  d.last_seen_ms = wall_now_ms;

  auto& v = d.addresses;
  v.erase(std::remove(v.begin(), v.end(), addr), v.end());
  v.insert(v.begin(), addr);

  // Cap per transport type, dropping the oldest.
  std::size_t tcp = 0, bt = 0;
  v.erase(std::remove_if(v.begin(), v.end(), [&](const TransportAddress& a) {
            std::size_t& n = type_of(a) == TransportType::Tcp ? tcp : bt;
            return ++n > MAX_ADDRESSES;
          }), v.end());
}

void DeviceRegistry::forget(const std::string& device_id) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  devices_.erase(device_id);
}

std::optional<KnownDevice> DeviceRegistry::get(const std::string& device_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(device_id);
  if (it == devices_.end()) return std::nullopt;
  return it->second;
}

std::vector<KnownDevice> DeviceRegistry::all() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<KnownDevice> out;
  for (const auto& kv : devices_) out.push_back(kv.second);
  return out;
}

Status DeviceRegistry::save() const {
  if (path_.empty()) return Status();
  nlohmann::json devs = nlohmann::json::object();
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    for (const auto& kv : devices_) {
      const KnownDevice& d = kv.second;
      nlohmann::json tcp = nlohmann::json::array();
      nlohmann::json bt  = nlohmann::json::array();
      for (const auto& a : d.addresses) {
        if (const auto* t = std::get_if<TcpAddress>(&a)) tcp.push_back({{"ip", t->ip}, {"port", t->port}});
        else if (const auto* b = std::get_if<BluetoothAddress>(&a)) bt.push_back(b->device_address);
      }
      devs[d.device_id] = {{"name", d.name}, {"type", to_string(d.type)}, {"tcp", tcp},
                           {"bluetooth", bt}, {"lastSeenMs", d.last_seen_ms}};
    }
  }
  nlohmann::json doc = {{"version", 1}, {"devices", std::move(devs)}};
  return write_json_file(path_, doc);
}

Status DeviceRegistry::load() {
  if (path_.empty()) return Status();
  nlohmann::json doc;
  Status err;
  JsonReadResult r = read_json_file(path_, doc, err);
  if (r == JsonReadResult::Missing) return Status();
  if (r == JsonReadResult::Error) return err;

  auto devs = doc.find("devices");
  if (!doc.is_object() || devs == doc.end() || !devs->is_object())
    return Status(ErrorKind::Config, path_ + ": no devices object");

  std::map<std::string, KnownDevice> loaded;
  for (auto it = devs->begin(); it != devs->end(); ++it) {
    const nlohmann::json& j = it.value();
    if (!j.is_object() || !is_valid_device_id(it.key())) {
      spdlog::warn("registry: skipping malformed entry {}", it.key());
      continue;
    }
    KnownDevice d;
    d.device_id = it.key();
    try {
      d.name         = j.value("name", std::string());
      d.type         = device_type_from_string(j.value("type", std::string()));
      d.last_seen_ms = j.value("lastSeenMs", int64_t{0});
    } catch (const nlohmann::json::exception& e) {
      spdlog::warn("registry: skipping entry {}: {}", it.key(), e.what());
      continue;
    }
    auto tcp = j.find("tcp");
    if (tcp != j.end() && tcp->is_array()) {
      for (const auto& a : *tcp) {
        if (!a.is_object() || !a.contains("ip") || !a["ip"].is_string() || !a.contains("port") ||
            !a["port"].is_number_unsigned() || a["port"].get<uint64_t>() > 65535)
          continue;
        d.addresses.push_back(TcpAddress{a["ip"].get<std::string>(), a["port"].get<uint16_t>()});
      }
    }
    auto bt = j.find("bluetooth");
    if (bt != j.end() && bt->is_array()) {
      for (const auto& a : *bt)
        if (a.is_string()) d.addresses.push_back(BluetoothAddress{a.get<std::string>(), transport::ble::SERVICE_UUID});
    }
    loaded.emplace(d.device_id, std::move(d));
  }

  std::unique_lock<std::shared_mutex> lk(mu_);
  devices_.swap(loaded);
  return Status();
}

} // namespace kdc
