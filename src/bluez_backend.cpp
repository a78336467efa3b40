// ============================================================================
// bluez_backend.cpp — implementation for transport/bluez_backend.hpp
//
//  scan()                               BlueZ (system bus)
//  ──────                               ──────────────────
//   StartDiscovery ───────────────────► Adapter1
//   wait duration (cancel aware)
//   GetManagedObjects ────────────────► ObjectManager  → Device1 {Address, Name, RSSI, UUIDs, ServiceData}
//   StopDiscovery ────────────────────► Adapter1
//
//  connect()
//  ─────────
//   Connect ──────────────────────────► Device1
//   poll ServicesResolved ────────────► Device1 (property)
//   GetManagedObjects ────────────────► find read / write GattCharacteristic1 under the device
//   AddMatch PropertiesChanged ───────► path_namespace = device
//   StartNotify ──────────────────────► read characteristic
//
//  link I/O
//  ────────
//   write(): WriteValue(ay, {type: request}) on the write characteristic
//   read():  sd_bus_process() drains PropertiesChanged(Value) into rx_
// ============================================================================

#include "kdc/transport/bluez_backend.hpp"

#if KDC_HAVE_SDBUS

#include <poll.h>
#include <systemd/sd-bus.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace kdc::transport {

namespace {

constexpr const char* BLUEZ       = "org.bluez";
constexpr const char* IF_ADAPTER  = "org.bluez.Adapter1";
constexpr const char* IF_DEVICE   = "org.bluez.Device1";
constexpr const char* IF_GATTCHAR = "org.bluez.GattCharacteristic1";
constexpr int         SLICE_MS    = 100;

struct BusDeleter { void operator()(sd_bus* b) const { sd_bus_flush_close_unref(b); } };
using BusPtr = std::unique_ptr<sd_bus, BusDeleter>;

struct MsgDeleter { void operator()(sd_bus_message* m) const { sd_bus_message_unref(m); } };
using MsgPtr = std::unique_ptr<sd_bus_message, MsgDeleter>;

/// sd_bus_error that always frees.
struct BusError {
  sd_bus_error e = SD_BUS_ERROR_NULL;
  ~BusError() { sd_bus_error_free(&e); }
  std::string text(int r) const { return e.message ? e.message : std::strerror(-r); }
};

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Properties we care about from one managed object, keyed "<Interface>.<Prop>".
struct ManagedObject {
  std::string                                     path;
  std::set<std::string>                           interfaces;
  std::map<std::string, std::string>              text;
  std::map<std::string, bool>                     flag;
  std::map<std::string, int>                      number;
  std::map<std::string, std::vector<std::string>> list;
  std::map<std::string, std::string>              service_data;   // uuid -> raw bytes
};

int read_service_data(sd_bus_message* m, ManagedObject& obj) {
  int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
  if (r < 0) return r;
  while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
    const char* uuid = nullptr;
    if ((r = sd_bus_message_read(m, "s", &uuid)) < 0) return r;
    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay")) < 0) return r;
    const void* data = nullptr;
    size_t size = 0;
    if ((r = sd_bus_message_read_array(m, 'y', &data, &size)) < 0) return r;
    obj.service_data[lower(uuid)] = std::string(static_cast<const char*>(data), size);
    if ((r = sd_bus_message_exit_container(m)) < 0) return r;   // variant
    if ((r = sd_bus_message_exit_container(m)) < 0) return r;   // dict entry
  }
  if (r < 0) return r;
  return sd_bus_message_exit_container(m);
}

// a{sv} of one interface. Unknown property types are skipped.
int read_props(sd_bus_message* m, const std::string& iface, ManagedObject& obj) {
  const std::string short_if = iface.substr(iface.rfind('.') + 1);
  int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
  if (r < 0) return r;

  while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
    const char* key = nullptr;
    if ((r = sd_bus_message_read(m, "s", &key)) < 0) return r;
    const std::string name = short_if + "." + key;

    char type = 0;
    const char* contents = nullptr;
    if ((r = sd_bus_message_peek_type(m, &type, &contents)) < 0) return r;
    const std::string sig = contents ? contents : "";

    if (name == "Device1.ServiceData" && sig == "a{sv}") {
      if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "a{sv}")) < 0) return r;
      if ((r = read_service_data(m, obj)) < 0) return r;
      if ((r = sd_bus_message_exit_container(m)) < 0) return r;
    } else if (sig == "s" || sig == "o") {
      const char* v = nullptr;
      if ((r = sd_bus_message_read(m, "v", sig.c_str(), &v)) < 0) return r;
      obj.text[name] = v ? v : "";
    } else if (sig == "b") {
      int v = 0;
      if ((r = sd_bus_message_read(m, "v", "b", &v)) < 0) return r;
      obj.flag[name] = v != 0;
    } else if (sig == "n") {
      int16_t v = 0;
      if ((r = sd_bus_message_read(m, "v", "n", &v)) < 0) return r;
      obj.number[name] = v;
    } else if (sig == "as") {
      if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as")) < 0) return r;
      char** strv = nullptr;
      if ((r = sd_bus_message_read_strv(m, &strv)) < 0) return r;
      std::vector<std::string>& out = obj.list[name];
      for (char** p = strv; p && *p; ++p) { out.push_back(lower(*p)); std::free(*p); }
      std::free(strv);
      if ((r = sd_bus_message_exit_container(m)) < 0) return r;
    } else {
      if ((r = sd_bus_message_skip(m, "v")) < 0) return r;
    }
    if ((r = sd_bus_message_exit_container(m)) < 0) return r;   // dict entry
  }
  if (r < 0) return r;
  return sd_bus_message_exit_container(m);
}

Status get_managed_objects(sd_bus* bus, std::vector<ManagedObject>& out) {
  BusError err;
  sd_bus_message* raw = nullptr;
  int r = sd_bus_call_method(bus, BLUEZ, "/", "org.freedesktop.DBus.ObjectManager",
                             "GetManagedObjects", &err.e, &raw, "");
  MsgPtr reply(raw);
  if (r < 0) return Status(ErrorKind::Io, "GetManagedObjects: " + err.text(r));

  auto bad = [&](int rc) { return Status(ErrorKind::Io, std::string("GetManagedObjects parse: ") + std::strerror(-rc)); };
  if ((r = sd_bus_message_enter_container(reply.get(), SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}")) < 0) return bad(r);
  while ((r = sd_bus_message_enter_container(reply.get(), SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0) {
    ManagedObject obj;
    const char* path = nullptr;
    if ((r = sd_bus_message_read(reply.get(), "o", &path)) < 0) return bad(r);
    obj.path = path;

    if ((r = sd_bus_message_enter_container(reply.get(), SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0) return bad(r);
    while ((r = sd_bus_message_enter_container(reply.get(), SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0) {
      const char* iface = nullptr;
      if ((r = sd_bus_message_read(reply.get(), "s", &iface)) < 0) return bad(r);
      obj.interfaces.insert(iface);
      if ((r = read_props(reply.get(), iface, obj)) < 0) return bad(r);
      if ((r = sd_bus_message_exit_container(reply.get())) < 0) return bad(r);
    }
    if (r < 0) return bad(r);
    if ((r = sd_bus_message_exit_container(reply.get())) < 0) return bad(r);   // a{sa{sv}}
    if ((r = sd_bus_message_exit_container(reply.get())) < 0) return bad(r);   // dict entry
    out.push_back(std::move(obj));
  }
  if (r < 0) return bad(r);
  return Status();
}

std::string device_path(const std::string& adapter_path, std::string address) {
  std::replace(address.begin(), address.end(), ':', '_');
  std::transform(address.begin(), address.end(), address.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return adapter_path + "/dev_" + address;
}

Status open_system_bus(BusPtr& out) {
  sd_bus* raw = nullptr;
  int r = sd_bus_open_system(&raw);
  if (r < 0) return Status(ErrorKind::PermissionDenied, std::string("system bus: ") + std::strerror(-r));
  out.reset(raw);
  return Status();
}

// ============================================================================
// BluezLink
// ============================================================================

class BluezLink : public IBleLink {
public:
  BluezLink(BusPtr bus, std::string dev_path, std::string address)
  : bus_(std::move(bus)), dev_path_(std::move(dev_path)), address_(std::move(address)) {}

  ~BluezLink() override {
    close();
    if (match_) sd_bus_slot_unref(match_);
  }

  Status open(int timeout_ms, const CancelToken& cancel);

  Status write(const std::string& bytes, int timeout_ms) override;
  RxResult read(std::string& bytes, int timeout_ms, Status& err) override;

  void close() override;
  bool is_open() const override { return open_.load(); }
  bool encrypted() const override { return encrypted_; }
  std::string peer_address() const override { return address_; }

private:
  static int on_properties_changed(sd_bus_message* m, void* userdata, sd_bus_error* ret_error);

  BusPtr                  bus_;
  std::string             dev_path_;
  std::string             address_;
  std::string             read_path_;
  std::string             write_path_;
  sd_bus_slot*            match_{nullptr};
  std::mutex              mu_;            ///< guards bus_ calls and rx_
  std::deque<std::string> rx_;
  std::atomic<bool>       open_{false};
  bool                    encrypted_{false};
};

int BluezLink::on_properties_changed(sd_bus_message* m, void* userdata, sd_bus_error*) {
  auto* self = static_cast<BluezLink*>(userdata);
  const char* path = sd_bus_message_get_path(m);
  const char* iface = nullptr;
  if (sd_bus_message_read(m, "s", &iface) < 0) return 0;
  const bool is_read_char = path && self->read_path_ == path && std::strcmp(iface, IF_GATTCHAR) == 0;
  const bool is_device    = path && self->dev_path_ == path && std::strcmp(iface, IF_DEVICE) == 0;
  if (!is_read_char && !is_device) return 0;

  if (sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}") < 0) return 0;
  while (sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv") > 0) {
    const char* key = nullptr;
    if (sd_bus_message_read(m, "s", &key) < 0) return 0;
    if (is_read_char && std::strcmp(key, "Value") == 0) {
      if (sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay") < 0) return 0;
      const void* data = nullptr;
      size_t size = 0;
      if (sd_bus_message_read_array(m, 'y', &data, &size) < 0) return 0;
      self->rx_.emplace_back(static_cast<const char*>(data), size);   // mu_ held by read()
      sd_bus_message_exit_container(m);
    } else if (is_device && std::strcmp(key, "Connected") == 0) {
      int connected = 1;
      if (sd_bus_message_read(m, "v", "b", &connected) < 0) return 0;
      if (!connected) {
        spdlog::info("bluez: {} disconnected", self->address_);
        self->open_.store(false);
      }
    } else {
      if (sd_bus_message_skip(m, "v") < 0) return 0;
    }
    sd_bus_message_exit_container(m);
  }
  return 0;
}

Status BluezLink::open(int timeout_ms, const CancelToken& cancel) {
  std::lock_guard<std::mutex> lk(mu_);
  sd_bus* bus = bus_.get();

  {
    BusError err;
    sd_bus_message* raw = nullptr;
    int r = sd_bus_message_new_method_call(bus, &raw, BLUEZ, dev_path_.c_str(), IF_DEVICE, "Connect");
    MsgPtr call(raw);
    if (r < 0) return Status(ErrorKind::Internal, std::string("Device1.Connect: ") + std::strerror(-r));
    sd_bus_message* rep = nullptr;
    r = sd_bus_call(bus, call.get(), static_cast<uint64_t>(timeout_ms) * 1000, &err.e, &rep);
    MsgPtr reply(rep);
    if (r < 0) {
      if (-r == ETIMEDOUT) return Status(ErrorKind::Timeout, "Device1.Connect timed out");
      return Status(ErrorKind::ConnectionRefused, "Device1.Connect " + address_ + ": " + err.text(r));
    }
  }

  // GATT objects appear only after service resolution
  int waited = 0;
  while (true) {
    if (cancel.cancelled()) return Status(ErrorKind::Cancelled, "ble connect cancelled");
    BusError err;
    int resolved = 0;
    int r = sd_bus_get_property_trivial(bus, BLUEZ, dev_path_.c_str(), IF_DEVICE,
                                        "ServicesResolved", &err.e, 'b', &resolved);
    if (r < 0) return Status(ErrorKind::Io, "ServicesResolved: " + err.text(r));
    if (resolved) break;
    if (waited >= timeout_ms) return Status(ErrorKind::Timeout, "ble services not resolved");
    std::this_thread::sleep_for(std::chrono::milliseconds(SLICE_MS));
    waited += SLICE_MS;
  }

  std::vector<ManagedObject> objects;
  Status st = get_managed_objects(bus, objects);
  if (!st) return st;
  for (const auto& o : objects) {
    if (o.path == dev_path_) {
      auto it = o.flag.find("Device1.Paired");
      encrypted_ = it != o.flag.end() && it->second;
    }
    if (!o.interfaces.count(IF_GATTCHAR) || o.path.rfind(dev_path_ + "/", 0) != 0) continue;
    auto uuid = o.text.find("GattCharacteristic1.UUID");
    if (uuid == o.text.end()) continue;
    if (lower(uuid->second) == ble::READ_CHAR_UUID)  read_path_  = o.path;
    if (lower(uuid->second) == ble::WRITE_CHAR_UUID) write_path_ = o.path;
  }
  if (read_path_.empty() || write_path_.empty())
    return Status(ErrorKind::Unsupported, address_ + " does not expose the kdeconnect gatt service");

  const std::string rule =
      "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.Properties',"
      "member='PropertiesChanged',path_namespace='" + dev_path_ + "'";
  int r = sd_bus_add_match(bus, &match_, rule.c_str(), &BluezLink::on_properties_changed, this);
  if (r < 0) return Status(ErrorKind::Io, std::string("AddMatch: ") + std::strerror(-r));

  BusError err;
  sd_bus_message* rep = nullptr;
  r = sd_bus_call_method(bus, BLUEZ, read_path_.c_str(), IF_GATTCHAR, "StartNotify", &err.e, &rep, "");
  MsgPtr reply(rep);
  if (r < 0) return Status(ErrorKind::Io, "StartNotify: " + err.text(r));

  open_.store(true);
  spdlog::info("bluez: link up {} paired={}", address_, encrypted_);
  return Status();
}

Status BluezLink::write(const std::string& bytes, int timeout_ms) {
  if (!open_.load()) return Status(ErrorKind::NotConnected, "ble link closed");
  std::lock_guard<std::mutex> lk(mu_);

  sd_bus_message* raw = nullptr;
  int r = sd_bus_message_new_method_call(bus_.get(), &raw, BLUEZ, write_path_.c_str(), IF_GATTCHAR, "WriteValue");
  MsgPtr call(raw);
  if (r >= 0) r = sd_bus_message_append_array(call.get(), 'y', bytes.data(), bytes.size());
  if (r >= 0) r = sd_bus_message_append(call.get(), "a{sv}", 1, "type", "s", "request");
  if (r < 0) return Status(ErrorKind::Internal, std::string("WriteValue build: ") + std::strerror(-r));

  BusError err;
  sd_bus_message* rep = nullptr;
  r = sd_bus_call(bus_.get(), call.get(), static_cast<uint64_t>(timeout_ms) * 1000, &err.e, &rep);
  MsgPtr reply(rep);
  if (r < 0) {
    if (-r == ETIMEDOUT) return Status(ErrorKind::Timeout, "WriteValue timed out");
    return Status(ErrorKind::Io, "WriteValue: " + err.text(r));
  }
  return Status();
}

RxResult BluezLink::read(std::string& bytes, int timeout_ms, Status& err) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (true) {
    pollfd pfd{};
    {
      std::lock_guard<std::mutex> lk(mu_);
      int r;
      while ((r = sd_bus_process(bus_.get(), nullptr)) > 0) {}
      if (r < 0) {
        err = Status(ErrorKind::Io, std::string("sd_bus_process: ") + std::strerror(-r));
        return RxResult::Error;
      }
      if (!rx_.empty()) {
        bytes = std::move(rx_.front());
        rx_.pop_front();
        return RxResult::Ok;
      }
      if (!open_.load()) return RxResult::Closed;
      pfd.fd     = sd_bus_get_fd(bus_.get());
      pfd.events = static_cast<short>(sd_bus_get_events(bus_.get()));
    }

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) return RxResult::None;
    ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left, SLICE_MS)));
  }
}

void BluezLink::close() {
  if (!open_.exchange(false)) return;
  std::lock_guard<std::mutex> lk(mu_);
  BusError err;
  sd_bus_message* rep = nullptr;
  int r = sd_bus_call_method(bus_.get(), BLUEZ, dev_path_.c_str(), IF_DEVICE, "Disconnect", &err.e, &rep, "");
  MsgPtr reply(rep);
  if (r < 0) spdlog::debug("bluez: Disconnect {}: {}", address_, err.text(r));
}

// ============================================================================
// BluezAdapter
// ============================================================================

class BluezAdapter : public IBleAdapter {
public:
  explicit BluezAdapter(const std::string& hci) : adapter_path_("/org/bluez/" + hci) {}

  Status scan(int duration_ms, const CancelToken& cancel, std::vector<BleAdvertisement>& out) override;
  Status connect(const BluetoothAddress& addr, int timeout_ms, const CancelToken& cancel,
                 std::unique_ptr<IBleLink>& out) override;
  bool accept(std::unique_ptr<IBleLink>&) override { return false; }   // central role only

private:
  std::string adapter_path_;
  std::mutex  scan_mu_;
  BusPtr      scan_bus_;
};

Status BluezAdapter::scan(int duration_ms, const CancelToken& cancel, std::vector<BleAdvertisement>& out) {
  std::lock_guard<std::mutex> lk(scan_mu_);
  if (!scan_bus_) {
    Status st = open_system_bus(scan_bus_);
    if (!st) return st;
  }
  sd_bus* bus = scan_bus_.get();

  {
    BusError err;
    sd_bus_message* rep = nullptr;
    int r = sd_bus_call_method(bus, BLUEZ, adapter_path_.c_str(), IF_ADAPTER, "StartDiscovery", &err.e, &rep, "");
    MsgPtr reply(rep);
    if (r < 0 && !(err.e.name && std::strcmp(err.e.name, "org.bluez.Error.InProgress") == 0))
      return Status(ErrorKind::Io, "StartDiscovery: " + err.text(r));
  }

  for (int waited = 0; waited < duration_ms && !cancel.cancelled(); waited += SLICE_MS)
    std::this_thread::sleep_for(std::chrono::milliseconds(SLICE_MS));

  std::vector<ManagedObject> objects;
  Status st = get_managed_objects(bus, objects);

  {
    BusError err;
    sd_bus_message* rep = nullptr;
    int r = sd_bus_call_method(bus, BLUEZ, adapter_path_.c_str(), IF_ADAPTER, "StopDiscovery", &err.e, &rep, "");
    MsgPtr reply(rep);
    if (r < 0) spdlog::debug("bluez: StopDiscovery: {}", err.text(r));
  }
  if (!st) return st;

  for (const auto& o : objects) {
    if (!o.interfaces.count(IF_DEVICE) || o.path.rfind(adapter_path_ + "/", 0) != 0) continue;
    auto uuids = o.list.find("Device1.UUIDs");
    if (uuids == o.list.end()) continue;
    if (std::find(uuids->second.begin(), uuids->second.end(), ble::SERVICE_UUID) == uuids->second.end()) continue;

    BleAdvertisement ad;
    ad.service_uuids = uuids->second;
    if (auto it = o.text.find("Device1.Address"); it != o.text.end()) ad.address = it->second;
    if (auto it = o.text.find("Device1.Name"); it != o.text.end()) ad.name = it->second;
    if (auto it = o.number.find("Device1.RSSI"); it != o.number.end()) ad.rssi = static_cast<int16_t>(it->second);
    if (auto it = o.service_data.find(ble::SERVICE_UUID); it != o.service_data.end()) ad.device_id = it->second;
    if (!ad.address.empty()) out.push_back(std::move(ad));
  }
  return Status();
}

Status BluezAdapter::connect(const BluetoothAddress& addr, int timeout_ms, const CancelToken& cancel,
                             std::unique_ptr<IBleLink>& out) {
  BusPtr bus;
  Status st = open_system_bus(bus);
  if (!st) return st;

  auto link = std::make_unique<BluezLink>(std::move(bus), device_path(adapter_path_, addr.device_address),
                                          addr.device_address);
  st = link->open(timeout_ms, cancel);
  if (!st) return st;
  out = std::move(link);
  return Status();
}

} // namespace

bool bluez_backend_available() { return true; }

std::shared_ptr<IBleAdapter> make_bluez_adapter(const std::string& hci) {
  return std::make_shared<BluezAdapter>(hci);
}

} // namespace kdc::transport

#else // !KDC_HAVE_SDBUS

namespace kdc::transport {

bool bluez_backend_available() { return false; }

std::shared_ptr<IBleAdapter> make_bluez_adapter(const std::string&) { return nullptr; }

} // namespace kdc::transport

#endif
