// ============================================================================
// ble_discovery.cpp — periodic BLE scan producer
// ============================================================================

#include "kdc/discovery.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

namespace kdc {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool advertises_service(const transport::BleAdvertisement& ad) {
  const std::string want = upper(transport::ble::SERVICE_UUID);
  return std::any_of(ad.service_uuids.begin(), ad.service_uuids.end(),
                     [&want](const std::string& u) { return upper(u) == want; });
}

} // namespace

BleDiscovery::BleDiscovery(BleDiscoveryConfig cfg, std::shared_ptr<transport::IBleAdapter> adapter)
: cfg_(std::move(cfg)), adapter_(std::move(adapter)), tracker_(cfg_.lost_timeout_ms) {
  std::set<std::string> normalised;
  for (const auto& a : cfg_.allow_list) normalised.insert(upper(a));
  cfg_.allow_list.swap(normalised);
}

Status BleDiscovery::start() {
  if (!adapter_) return Status(ErrorKind::Unsupported, "no bluetooth adapter");
  next_scan_ms_ = 0;
  return Status();
}

bool BleDiscovery::allowed(const std::string& address) const {
  return cfg_.allow_list.empty() || cfg_.allow_list.count(upper(address)) != 0;
}

Status BleDiscovery::poll(int64_t now_ms, const transport::CancelToken& cancel,
                          std::vector<DiscoveryEvent>& out) {
  if (!adapter_) return Status(ErrorKind::Unsupported, "no bluetooth adapter");

  if (now_ms < next_scan_ms_) {
    int64_t wait = std::min<int64_t>(cfg_.idle_slice_ms, next_scan_ms_ - now_ms);
    if (wait > 0 && !cancel.cancelled()) std::this_thread::sleep_for(std::chrono::milliseconds(wait));
    tracker_.expire(now_ms, out);
    return Status();
  }
  next_scan_ms_ = now_ms + cfg_.scan_interval_ms;

  std::vector<transport::BleAdvertisement> ads;
  Status st = adapter_->scan(cfg_.scan_duration_ms, cancel, ads);
  if (!st) {
    tracker_.expire(now_ms, out);
    return st;
  }

  for (const auto& ad : ads) {
    if (!advertises_service(ad)) continue;
    if (!allowed(ad.address)) {
      spdlog::debug("discovery: ble {} not in allow-list", ad.address);
      continue;
    }
    if (!is_valid_device_id(ad.device_id)) {
      spdlog::debug("discovery: ble {} publishes no device id, skipped", ad.address);
      continue;
    }
    DiscoveryEvent ev;
    ev.identity.device_id = ad.device_id;
    ev.identity.name      = ad.name;
    ev.address = transport::BluetoothAddress{upper(ad.address), transport::ble::SERVICE_UUID};
    ev.source  = "ble";
    if (tracker_.seen(ev, now_ms)) out.push_back(std::move(ev));
  }
  tracker_.expire(now_ms, out);
  return Status();
}

} // namespace kdc
