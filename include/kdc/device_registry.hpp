#pragma once
/**
 * @file device_registry.hpp
 * @brief Known devices and their last reachable addresses, persisted so reconnect
 *        targets survive a restart.
 *
 * Stored as `<state_dir>/devices.json`:
 * @code
 * {"version":1,"devices":{"<id>":{"name":"Phone","type":"phone","tcp":[{"ip":"10.0.0.7","port":1716}],"bluetooth":["AA:BB:.."],"lastSeenMs":...}}}
 * @endcode
 */

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "kdc/identity.hpp"
#include "kdc/status.hpp"
#include "kdc/transport/transport_types.hpp"

namespace kdc {

struct KnownDevice {
  std::string                                 device_id;
  std::string                                 name;
  DeviceType                                  type{DeviceType::Desktop};
  std::vector<transport::TransportAddress>    addresses;   ///< most recent first
  int64_t                                     last_seen_ms{0};
};

class DeviceRegistry {
public:
  /// Addresses kept per device per transport.
  static constexpr std::size_t MAX_ADDRESSES = 4;

  /// @param path JSON file; empty keeps the registry in memory only
  explicit DeviceRegistry(std::string path = std::string());

  Status load();
  Status save() const;

  /// Record (or refresh) a device and move @p addr to the front of its list.
  void remember(const DeviceIdentity& id, const transport::TransportAddress& addr, int64_t wall_now_ms);
  void forget(const std::string& device_id);

  std::optional<KnownDevice> get(const std::string& device_id) const;
  std::vector<KnownDevice> all() const;

private:
  std::string                        path_;
  mutable std::shared_mutex          mu_;
  std::map<std::string, KnownDevice> devices_;
};

} // namespace kdc
