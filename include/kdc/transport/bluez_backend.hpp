#pragma once
/**
 * @file bluez_backend.hpp
 * @brief BlueZ (org.bluez over the system D-Bus) implementation of IBleAdapter.
 *
 * @details
 * Central role only: scan through Adapter1.StartDiscovery + ObjectManager,
 * connect through Device1.Connect, talk GATT through GattCharacteristic1
 * WriteValue / StartNotify. Every link owns its own sd-bus connection, so a
 * link's notification pump never competes with another link or with a scan.
 *
 * The backend is compiled only when libsystemd (sd-bus) is found at configure
 * time (`KDC_HAVE_SDBUS`). Without it `make_bluez_adapter()` returns nullptr and
 * the Bluetooth transport reports `Unsupported` on start; TCP is unaffected.
 */

#include <memory>
#include <string>

#include "kdc/transport/bluetooth_transport.hpp"

namespace kdc::transport {

/// True when this build carries the sd-bus backend.
bool bluez_backend_available();

/// Adapter bound to /org/bluez/<hci>. nullptr when the backend is not built in.
std::shared_ptr<IBleAdapter> make_bluez_adapter(const std::string& hci = "hci0");

} // namespace kdc::transport
