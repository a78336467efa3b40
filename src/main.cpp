#include <csignal>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>         // gethostname
#include <CLI/CLI.hpp>

#include <spdlog/spdlog.h>

#include "kdc/clock.hpp"
#include "kdc/config.hpp"
#include "kdc/coordinator.hpp"
#include "kdc/device_registry.hpp"
#include "kdc/json_file.hpp"
#include "kdc/log.hpp"
#include "kdc/task_supervisor.hpp"
#include "kdc/tls_identity.hpp"
#include "kdc/trust_store.hpp"
#include "kdc/transport/bluez_backend.hpp"

using namespace kdc;

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

static std::string host_name() {
  char buf[256] = {0};
  if (gethostname(buf, sizeof(buf) - 1) != 0 || !buf[0]) return "kdc-device";
  return buf;
}

// One line per plugin-facing event. The daemon has no plugins of its own.
static void log_event(const CoreEvent& ev, PairingPolicy policy) {
  switch (ev.kind) {
    case CoreEventKind::Discovered:
      spdlog::info("kdcd: discovered {} ({}) at {}", ev.identity.name, ev.device_id, transport::to_string(ev.address));
      break;
    case CoreEventKind::Connected:
      spdlog::info("kdcd: connected {} ({}) paired={}", ev.identity.name, ev.device_id, ev.paired);
      break;
    case CoreEventKind::PairingRequested:
      if (policy == PairingPolicy::Explicit)
        spdlog::warn("kdcd: {} wants to pair, fingerprint {}", ev.device_id, ev.fingerprint);
      break;
    case CoreEventKind::PairingResult:
      spdlog::info("kdcd: pairing with {}: {}", ev.device_id, ev.reason);
      break;
    case CoreEventKind::Error:
      spdlog::warn("kdcd: {}: {}", ev.device_id, ev.error.to_string());
      break;
    case CoreEventKind::PacketReceived:
      spdlog::debug("kdcd: {} from {}", ev.packet.type, ev.device_id);
      break;
    default:
      spdlog::debug("kdcd: {} {}", to_string(ev.kind), ev.device_id);
      break;
  }
}

int main(int argc, char** argv) {
  CLI::App app{"kdcd - KDE Connect compatible connectivity daemon"};

  std::string config_path, name, prefer, log_level, state_dir, policy;
  bool bluetooth = false, no_bluetooth = false;

  app.add_option("--config", config_path, "JSON configuration file (default <state-dir>/config.json)");
  app.add_option("--name", name, "Device name announced to peers");
  app.add_flag("--bluetooth", bluetooth, "Enable the Bluetooth LE transport and discovery");
  app.add_flag("--no-bluetooth", no_bluetooth, "Disable Bluetooth LE entirely");
  app.add_option("--prefer", prefer,
    "Transport preference: prefer-tcp|prefer-bluetooth|tcp-first|bluetooth-first|tcp-only|bluetooth-only");
  app.add_option("--pairing", policy, "Pairing policy: tofu|explicit");
  app.add_option("--log-level", log_level, "trace|debug|info|warn|error");
  app.add_option("--state-dir", state_dir, "Directory for identity, trust store and transfer records");

  CLI11_PARSE(app, argc, argv);

  Status st = init_logging(log_level.empty() ? "info" : log_level);
  if (!st) {
    spdlog::critical("kdcd: {}", st.to_string());
    return 2;
  }

  // -------- configuration: defaults < file < flags --------
  CoreConfig cfg;
  if (!state_dir.empty()) cfg.state_dir = state_dir;
  if (config_path.empty()) config_path = (cfg.state_dir.empty() ? default_state_dir() : cfg.state_dir) + "/config.json";
  st = load_config(config_path, cfg);
  if (!st) {
    spdlog::critical("kdcd: {}", st.to_string());
    return 2;
  }
  if (!state_dir.empty()) cfg.state_dir = state_dir;
  if (!name.empty()) cfg.device_name = name;
  if (bluetooth) cfg.enable_bluetooth = true;
  if (no_bluetooth) cfg.enable_bluetooth = false;
  if (!log_level.empty()) cfg.log_level = log_level;
  if (!prefer.empty() && !transport_preference_from_string(prefer, cfg.manager.preference)) {
    spdlog::critical("kdcd: unknown --prefer '{}'", prefer);
    return 2;
  }
  if (!policy.empty() && !pairing_policy_from_string(policy, cfg.pairing_policy)) {
    spdlog::critical("kdcd: unknown --pairing '{}'", policy);
    return 2;
  }
  st = init_logging(cfg.log_level);
  if (!st) {
    spdlog::critical("kdcd: {}", st.to_string());
    return 2;
  }
  if (cfg.device_name.empty()) cfg.device_name = host_name();

  st = ensure_device_id(cfg);
  if (!st) {
    spdlog::critical("kdcd: device id: {}", st.to_string());
    return 3;
  }

  TlsIdentity tls;
  st = TlsIdentity::load_or_create(cfg.state_dir, cfg.device_id, tls);
  if (!st) {
    spdlog::critical("kdcd: tls identity: {}", st.to_string());
    return 3;
  }
  spdlog::info("kdcd: {} ({}) fingerprint {}", cfg.device_name, cfg.device_id, tls.fingerprint());

  DeviceIdentity self;
  self.device_id = cfg.device_id;
  self.name      = cfg.device_name;
  self.type      = cfg.device_type;
  self.incoming  = cfg.incoming;
  self.outgoing  = cfg.outgoing;

  // -------- persisted state --------
  TrustStore trust(cfg.state_dir + "/trusted_devices.json");
  st = trust.load();
  if (!st) spdlog::warn("kdcd: trust store: {}", st.to_string());

  DeviceRegistry registry(cfg.state_dir + "/devices.json");
  st = registry.load();
  if (!st) spdlog::warn("kdcd: device registry: {}", st.to_string());

  // Transfers interrupted by a crash cannot be resumed: the sender's port is gone.
  TransferStore transfers(cfg.state_dir);
  std::vector<TransferState> interrupted;
  st = transfers.load_all(interrupted);
  if (!st) spdlog::warn("kdcd: transfer records: {}", st.to_string());
  for (const auto& t : interrupted) {
    spdlog::warn("kdcd: aborting interrupted transfer {} ({} of {} bytes)", t.transfer_id, t.bytes_received,
                 t.total_size);
    Status ab = transfers.abort(t.transfer_id, true);
    if (!ab) spdlog::warn("kdcd: abort {}: {}", t.transfer_id, ab.to_string());
  }

  // -------- transports --------
  PairingManager  pairing(trust, cfg.pairing_policy);
  ResourceManager resources(cfg.limits);
  TransportManager tm(cfg.manager, pairing, &resources);

  std::shared_ptr<transport::TcpTransport> tcp;
  if (cfg.enable_tcp) {
    tcp = std::make_shared<transport::TcpTransport>(cfg.tcp, self, tls);
    tm.add_transport(tcp);
  }
  std::shared_ptr<transport::IBleAdapter> adapter;
  if (cfg.enable_bluetooth) {
    adapter = transport::make_bluez_adapter(cfg.bluetooth_adapter);
    if (!adapter) spdlog::warn("kdcd: bluetooth requested but this build has no BlueZ backend");
    tm.add_transport(std::make_shared<transport::BluetoothTransport>(cfg.bluetooth, self, adapter));
  }
  st = tm.start();
  if (!st) {
    spdlog::critical("kdcd: transports: {}", st.to_string());
    return 4;
  }
  if (tcp) self.tcp_port = tcp->bound_port();

  for (const auto& known : registry.all())
    for (const auto& addr : known.addresses) tm.add_address(known.device_id, addr);

  // -------- recovery + discovery + coordinator --------
  TransportPacketSink sink(tm);
  RecoveryManager recovery(sink, &resources, cfg.reconnect, cfg.retry);
  AsyncConnector connector(tm, recovery);
  recovery.set_link_control(&connector);

  DiscoveryService discovery;
  if (cfg.enable_tcp) discovery.add_producer(std::make_unique<BroadcastDiscovery>(cfg.discovery, self));
  if (cfg.enable_bluetooth && adapter) discovery.add_producer(std::make_unique<BleDiscovery>(cfg.ble_discovery, adapter));

  TaskSupervisor supervisor;
  st = discovery.start(&supervisor);
  if (!st) {
    spdlog::critical("kdcd: discovery: {}", st.to_string());
    tm.shutdown();
    return 4;
  }

  RecoveryCoordinator coord(self, discovery, tm, pairing, recovery, resources, transfers, &connector, &registry);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);

  spdlog::info("kdcd: running (tcp port {}, bluetooth {})", self.tcp_port ? *self.tcp_port : 0,
               tm.has_transport(transport::TransportType::Bluetooth) ? "on" : "off");

  // -------- main loop --------
  int64_t next_maintenance = steady_ms() + cfg.maintenance_interval_ms;
  while (!g_stop) {
    const int64_t now = steady_ms();
    coord.tick(now, wall_ms());
    if (now >= next_maintenance) {
      coord.maintenance(now, wall_ms());
      next_maintenance = now + cfg.maintenance_interval_ms;
    }
    CoreEvent ev;
    while (coord.poll_event(ev)) log_event(ev, cfg.pairing_policy);
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg.tick_interval_ms));
  }

  spdlog::info("kdcd: shutting down");
  supervisor.stop();
  coord.shutdown();
  st = trust.save();
  if (!st) spdlog::warn("kdcd: trust store: {}", st.to_string());
  return 0;
}
