#pragma once
/**
 * @file bluetooth_transport.hpp
 * @brief Bluetooth LE control channel: radio seam (`IBleAdapter`/`IBleLink`) and the
 *        `ITransport` built on it.
 *
 * @details
 * PURPOSE
 * -------
 * BLE is an optional, additive transport. The core never talks to BlueZ
 * directly; it talks to `IBleAdapter` (scan, connect, accept) and `IBleLink`
 * (one GATT session: write to the peer's write characteristic, receive
 * notifications from its read characteristic). The sd-bus backend in
 * `bluez_backend.hpp` is one implementation; tests use in-memory fakes.
 *
 * FIXED UUIDS
 * -----------
 * The service and characteristic UUIDs are constants shared by every platform
 * implementation. Changing them breaks interoperability.
 *
 * HANDSHAKE
 * ---------
 * Both sides write their identity packet (split into MTU-sized writes) and
 * read the peer's. Identity lines may exceed the 512-byte packet cap, so the
 * handshake uses its own larger line limit; once the `BleConnection` exists
 * every packet is held to `BLUETOOTH_MAX_PACKET_SIZE` before any write.
 *
 * There is no TLS over GATT. `HandshakeInfo::peer_fingerprint` stays empty and
 * `HandshakeInfo::encrypted` reports whether the radio link is bonded. Pairing
 * policy accepts BLE sessions only for devices already Trusted over TLS and only
 * on encrypted links.
 *
 * TIMEOUTS
 * --------
 * Radio operations use `BluetoothTransportConfig::timeout_ms` (15 s default).
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "kdc/identity.hpp"
#include "kdc/transport/transport_base.hpp"

namespace kdc::transport {

namespace ble {
static constexpr const char* SERVICE_UUID    = "185f3df4-3268-4e3f-9fca-d4d5059915bd";
static constexpr const char* READ_CHAR_UUID  = "8667556c-9a37-4c91-84ed-54ee27d90049";   ///< peer -> us (notify)
static constexpr const char* WRITE_CHAR_UUID = "d0e8434d-cd29-0996-af41-6c90f4e0eb2a";   ///< us -> peer (write)
} // namespace ble

/// One advertisement seen during a scan.
struct BleAdvertisement {
  std::string              address;        ///< "AA:BB:CC:DD:EE:FF"
  std::string              name;           ///< advertised local name, may be empty
  int16_t                  rssi{0};
  std::vector<std::string> service_uuids;
  std::string              device_id;      ///< from service data when the peer publishes it
};

/// One GATT session with a peer.
class IBleLink {
public:
  virtual ~IBleLink() = default;

  /// Write @p bytes (at most one MTU) to the peer's write characteristic.
  virtual Status write(const std::string& bytes, int timeout_ms) = 0;
  /// Next notification chunk. Ok / None (timeout) / Closed / Error.
  virtual RxResult read(std::string& bytes, int timeout_ms, Status& err) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;
  /// Link is bonded and encrypted at the radio layer.
  virtual bool encrypted() const = 0;
  virtual std::string peer_address() const = 0;
};

class IBleAdapter {
public:
  virtual ~IBleAdapter() = default;

  /// Scan for @p duration_ms and report every device advertising ble::SERVICE_UUID.
  virtual Status scan(int duration_ms, const CancelToken& cancel,
                      std::vector<BleAdvertisement>& out) = 0;

  virtual Status connect(const BluetoothAddress& addr, int timeout_ms, const CancelToken& cancel,
                         std::unique_ptr<IBleLink>& out) = 0;

  /// Inbound GATT sessions (peripheral role). Never blocks.
  virtual bool accept(std::unique_ptr<IBleLink>& out) = 0;
};

struct BluetoothTransportConfig {
  int         timeout_ms{15000};
  std::size_t mtu{BLUETOOTH_MAX_PACKET_SIZE};    ///< largest single write
  std::size_t identity_max_bytes{64 * 1024};
};

/// Control-channel connection over one IBleLink.
class BleConnection : public Connection {
public:
  BleConnection(std::unique_ptr<IBleLink> link, HandshakeInfo info, std::string leftover,
                int io_timeout_ms);
  ~BleConnection() override;

  void close() override;
  bool is_open() const override;

protected:
  Status write_bytes(const std::string& bytes) override;
  RxResult read_some(char* buf, std::size_t cap, int timeout_ms,
                     std::size_t& n, Status& err) override;

private:
  std::unique_ptr<IBleLink> link_;
  std::string               carry_;     ///< bytes read but not yet handed to the framer
  int                       io_timeout_ms_;
};

class BluetoothTransport : public ITransport {
public:
  BluetoothTransport(BluetoothTransportConfig cfg, DeviceIdentity self,
                     std::shared_ptr<IBleAdapter> adapter);

  TransportType type() const override { return TransportType::Bluetooth; }
  const TransportCapabilities& capabilities() const override { return BLUETOOTH_CAPABILITIES; }
  const char* name() const override { return "bluetooth"; }

  Status start() override;
  void   stop() override;

  Status connect(const TransportAddress& addr, const CancelToken& cancel,
                 std::unique_ptr<Connection>& out) override;

  bool accept(std::unique_ptr<Connection>& out) override;

private:
  Status handshake(std::unique_ptr<IBleLink> link, const BluetoothAddress& addr, bool incoming,
                   const CancelToken& cancel, std::unique_ptr<Connection>& out);

  BluetoothTransportConfig     cfg_;
  DeviceIdentity               self_;
  std::shared_ptr<IBleAdapter> adapter_;
  std::atomic<bool>            running_{false};
  CancelToken                  stop_token_;
};

/**
 * @brief Write @p data to @p link in chunks of at most @p mtu bytes.
 *
 * Used for the identity exchange, where a line can be larger than one write.
 */
Status ble_write_chunked(IBleLink& link, const std::string& data, std::size_t mtu, int timeout_ms);

} // namespace kdc::transport
