#include <doctest/doctest.h>
#include "fakes.hpp"

#include "kdc/pairing.hpp"
#include "kdc/resource_manager.hpp"
#include "kdc/transport_manager.hpp"
#include "kdc/trust_store.hpp"

using namespace kdc_test;

static void trust(TrustStore& store, const std::string& id, const std::string& fp) {
    TrustRecord rec;
    rec.device_id   = id;
    rec.fingerprint = fp;
    rec.paired_ms   = 1;
    rec.state       = TrustState::Trusted;
    REQUIRE(store.put(rec).ok());
}

static std::vector<TransportManagerEvent> drain(TransportManager& tm) {
    std::vector<TransportManagerEvent> out;
    TransportManagerEvent ev;
    while (tm.poll_event(ev)) out.push_back(ev);
    return out;
}

// Collect events until one of @p kind shows up.
static bool wait_for_event(TransportManager& tm, TransportEventKind kind, TransportManagerEvent& out,
                           std::vector<TransportManagerEvent>* seen = nullptr) {
    return wait_until([&] {
        TransportManagerEvent ev;
        while (tm.poll_event(ev)) {
            if (seen) seen->push_back(ev);
            if (ev.kind == kind) {
                out = ev;
                return true;
            }
        }
        return false;
    });
}

struct Rig {
    TrustStore                     store;
    PairingManager                 pairing{store, PairingPolicy::Explicit};
    ResourceManager                resources;
    std::shared_ptr<FakeTransport> tcp = std::make_shared<FakeTransport>(TransportType::Tcp);
    std::shared_ptr<FakeTransport> bt  = std::make_shared<FakeTransport>(TransportType::Bluetooth);
    TransportManager               tm;

    explicit Rig(TransportManagerConfig cfg = fast(), ResourceLimits limits = ResourceLimits{}, bool with_bt = true)
    : resources(limits), tm(cfg, pairing, &resources) {
        tm.add_transport(tcp);
        if (with_bt) tm.add_transport(bt);
        REQUIRE(tm.start().ok());
    }

    static TransportManagerConfig fast(TransportPreference pref = TransportPreference::TcpFirst) {
        TransportManagerConfig cfg;
        cfg.preference       = pref;
        cfg.receive_slice_ms = 20;
        return cfg;
    }
};

TEST_CASE("Transport order follows the preference") {
    using T = TransportType;
    using P = TransportPreference;
    CHECK(transport_order(P::TcpFirst, true, true, true) == std::vector<T>{T::Tcp, T::Bluetooth});
    CHECK(transport_order(P::BluetoothFirst, true, true, true) == std::vector<T>{T::Bluetooth, T::Tcp});
    CHECK(transport_order(P::TcpOnly, true, true, true) == std::vector<T>{T::Tcp});
    CHECK(transport_order(P::BluetoothOnly, true, true, true) == std::vector<T>{T::Bluetooth});
    CHECK(transport_order(P::PreferTcp, false, true, true) == std::vector<T>{T::Tcp});
    CHECK(transport_order(P::PreferTcp, true, true, true) == std::vector<T>{T::Tcp, T::Bluetooth});
    CHECK(transport_order(P::PreferTcp, false, false, true) == std::vector<T>{T::Bluetooth});
    CHECK(transport_order(P::PreferBluetooth, false, true, true) == std::vector<T>{T::Bluetooth});
    CHECK(transport_order(P::TcpOnly, true, false, true).empty());

    TransportPreference parsed;
    CHECK(transport_preference_from_string("bluetooth-first", parsed));
    CHECK(parsed == P::BluetoothFirst);
    CHECK_FALSE(transport_preference_from_string("carrier-pigeon", parsed));
}

TEST_CASE("Aggregated errors keep every address and the first non-recoverable kind") {
    std::vector<std::pair<TransportAddress, Status>> failures;
    CHECK(aggregate_errors(failures).kind() == ErrorKind::NotConnected);

    failures.emplace_back(tcp_addr(1), Status(ErrorKind::ConnectionRefused, "refused"));
    failures.emplace_back(bt_addr(1), Status(ErrorKind::Timeout, "slow"));
    Status all_recoverable = aggregate_errors(failures);
    CHECK(all_recoverable.kind() == ErrorKind::Timeout);
    CHECK(all_recoverable.detail().find("tcp://192.168.1.1:1716") != std::string::npos);
    CHECK(all_recoverable.detail().find("AA:BB:CC:DD:EE:01") != std::string::npos);

    failures.emplace_back(tcp_addr(2), Status(ErrorKind::Tls, "bad record"));
    CHECK(aggregate_errors(failures).kind() == ErrorKind::Tls);
}

TEST_CASE("Connection state machine only allows its edges") {
    using S = ConnectionState;
    CHECK(valid_transition(S::Discovered, S::Handshaking));
    CHECK(valid_transition(S::Handshaking, S::Paired));
    CHECK(valid_transition(S::Handshaking, S::Rejected));
    CHECK(valid_transition(S::Paired, S::Connected));
    CHECK(valid_transition(S::Connected, S::Disconnected));
    CHECK(valid_transition(S::Disconnected, S::Reconnecting));
    CHECK(valid_transition(S::Reconnecting, S::Handshaking));
    CHECK(valid_transition(S::Reconnecting, S::Abandoned));
    CHECK_FALSE(valid_transition(S::Disconnected, S::Abandoned));

    CHECK_FALSE(valid_transition(S::Discovered, S::Connected));
    CHECK_FALSE(valid_transition(S::Connected, S::Paired));
    CHECK_FALSE(valid_transition(S::Rejected, S::Handshaking));
    CHECK_FALSE(valid_transition(S::Abandoned, S::Reconnecting));
    CHECK(is_terminal(S::Rejected));
    CHECK(is_terminal(S::Abandoned));
    CHECK_FALSE(is_terminal(S::Disconnected));
}

TEST_CASE("Connect uses the preferred transport and reports one Connected event") {
    Rig rig;
    DeviceIdentity phone = peer_identity(1);
    rig.tcp->reachable(tcp_addr(1), phone, "FP1");
    rig.bt->reachable(bt_addr(1), phone, "");
    rig.tm.add_address(phone.device_id, bt_addr(1));
    rig.tm.add_address(phone.device_id, tcp_addr(1));

    bool installed = false;
    REQUIRE(rig.tm.connect(phone.device_id, &installed).ok());
    CHECK(installed);
    CHECK(rig.tcp->attempts() == 1);
    CHECK(rig.bt->attempts() == 0);
    CHECK(rig.tm.state(phone.device_id) == ConnectionState::Connected);
    CHECK(rig.tm.has_connection(phone.device_id));
    CHECK(rig.resources.snapshot().global.connections == 1);

    auto events = drain(rig.tm);
    REQUIRE(events.size() == 1);
    CHECK(events[0].kind == TransportEventKind::Connected);
    CHECK(events[0].transport == TransportType::Tcp);
    CHECK(events[0].info.peer.device_id == phone.device_id);
    CHECK_FALSE(events[0].paired);

    // A second connect is a no-op.
    installed = true;
    CHECK(rig.tm.connect(phone.device_id, &installed).ok());
    CHECK_FALSE(installed);
    CHECK(rig.tcp->attempts() == 1);
    CHECK(rig.resources.snapshot().global.connections == 1);
}

TEST_CASE("Connect falls back to Bluetooth when TCP fails") {
    Rig rig;
    DeviceIdentity phone = peer_identity(2);
    trust(rig.store, phone.device_id, "FP2");
    rig.tcp->unreachable(tcp_addr(2), Status(ErrorKind::ConnectionRefused, "refused"));
    rig.bt->reachable(bt_addr(2), phone, "");
    rig.tm.add_address(phone.device_id, tcp_addr(2));
    rig.tm.add_address(phone.device_id, bt_addr(2));

    REQUIRE(rig.tm.connect(phone.device_id).ok());
    CHECK(rig.tcp->attempts() == 1);
    CHECK(rig.bt->attempts() == 1);

    auto events = drain(rig.tm);
    REQUIRE(events.size() == 1);
    CHECK(events[0].transport == TransportType::Bluetooth);
    CHECK(events[0].paired);
}

TEST_CASE("Bluetooth sessions require an existing trusted record") {
    Rig rig(Rig::fast(TransportPreference::BluetoothOnly));
    DeviceIdentity phone = peer_identity(3);
    rig.bt->reachable(bt_addr(3), phone, "");
    rig.tm.add_address(phone.device_id, bt_addr(3));

    Status st = rig.tm.connect(phone.device_id);
    CHECK(st.kind() == ErrorKind::NotPaired);
    CHECK_FALSE(rig.tm.has_connection(phone.device_id));
    CHECK(rig.resources.snapshot().global.connections == 0);
}

TEST_CASE("When every candidate fails the result aggregates all of them") {
    Rig rig;
    DeviceIdentity phone = peer_identity(4);
    rig.tcp->unreachable(tcp_addr(4), Status(ErrorKind::ConnectionRefused, "refused"));
    rig.bt->unreachable(bt_addr(4), Status(ErrorKind::Timeout, "no answer"));
    rig.tm.add_address(phone.device_id, tcp_addr(4));
    rig.tm.add_address(phone.device_id, bt_addr(4));

    Status st = rig.tm.connect(phone.device_id);
    CHECK(st.kind() == ErrorKind::Timeout);
    CHECK(st.detail().find("refused") != std::string::npos);
    CHECK(st.detail().find("no answer") != std::string::npos);
    CHECK(rig.tm.state(phone.device_id) == ConnectionState::Disconnected);
    CHECK(rig.resources.snapshot().global.connections == 0);
    CHECK(drain(rig.tm).empty());
}

TEST_CASE("TCP only never touches Bluetooth and Bluetooth-only devices stay unreachable") {
    Rig rig(Rig::fast(TransportPreference::TcpOnly));
    DeviceIdentity phone = peer_identity(5);
    rig.bt->reachable(bt_addr(5), phone, "");
    rig.tm.add_address(phone.device_id, bt_addr(5));

    CHECK(rig.tm.connect(phone.device_id).kind() == ErrorKind::NotConnected);
    CHECK(rig.bt->attempts() == 0);
}

TEST_CASE("Without a Bluetooth transport Bluetooth addresses are skipped and TCP behaves the same") {
    Rig rig(Rig::fast(TransportPreference::BluetoothFirst), ResourceLimits{}, /*with_bt*/ false);
    CHECK_FALSE(rig.tm.has_transport(TransportType::Bluetooth));

    DeviceIdentity phone = peer_identity(6);
    rig.tcp->reachable(tcp_addr(6), phone, "FP6");
    rig.tm.add_address(phone.device_id, tcp_addr(6));
    rig.tm.add_address(phone.device_id, bt_addr(6));

    REQUIRE(rig.tm.connect(phone.device_id).ok());
    CHECK(rig.tcp->attempts() == 1);
    CHECK(rig.bt->attempts() == 0);

    DeviceIdentity watch = peer_identity(7);
    rig.tm.add_address(watch.device_id, bt_addr(7));
    CHECK(rig.tm.connect(watch.device_id).kind() == ErrorKind::NotConnected);
}

TEST_CASE("A failing Bluetooth transport is dropped at start, a failing TCP transport is fatal") {
    TrustStore store;
    PairingManager pairing(store, PairingPolicy::Explicit);

    auto tcp = std::make_shared<FakeTransport>(TransportType::Tcp);
    auto bt  = std::make_shared<FakeTransport>(TransportType::Bluetooth);
    bt->set_start_result(Status(ErrorKind::Unsupported, "no adapter"));
    TransportManager tm(Rig::fast(), pairing);
    tm.add_transport(tcp);
    tm.add_transport(bt);
    CHECK(tm.start().ok());
    CHECK(tm.has_transport(TransportType::Tcp));
    CHECK_FALSE(tm.has_transport(TransportType::Bluetooth));

    auto broken = std::make_shared<FakeTransport>(TransportType::Tcp);
    broken->set_start_result(Status(ErrorKind::PermissionDenied, "port in use"));
    TransportManager tm2(Rig::fast(), pairing);
    tm2.add_transport(broken);
    CHECK(tm2.start().kind() == ErrorKind::PermissionDenied);
}

TEST_CASE("A changed certificate rejects the device and keeps the pin") {
    Rig rig;
    DeviceIdentity phone = peer_identity(8);
    trust(rig.store, phone.device_id, "PINNED");
    rig.tcp->reachable(tcp_addr(8), phone, "IMPOSTOR");
    rig.tm.add_address(phone.device_id, tcp_addr(8));

    CHECK(rig.tm.connect(phone.device_id).kind() == ErrorKind::CertificateMismatch);
    CHECK(rig.tm.state(phone.device_id) == ConnectionState::Rejected);
    CHECK(rig.store.get(phone.device_id)->fingerprint == "PINNED");
    CHECK(rig.resources.snapshot().global.connections == 0);

    CHECK(rig.tm.connect(phone.device_id).kind() == ErrorKind::PermissionDenied);
    CHECK(rig.tcp->attempts() == 1);
}

TEST_CASE("A peer that answers with another identity is not installed") {
    Rig rig(Rig::fast(TransportPreference::TcpOnly));
    DeviceIdentity expected = peer_identity(9);
    DeviceIdentity other = peer_identity(10);
    rig.tcp->reachable(tcp_addr(9), other, "FP10");
    rig.tm.add_address(expected.device_id, tcp_addr(9));

    CHECK_FALSE(rig.tm.connect(expected.device_id).ok());
    CHECK_FALSE(rig.tm.has_connection(other.device_id));
    CHECK_FALSE(rig.tm.has_connection(expected.device_id));
}

TEST_CASE("Received packets become PacketReceived events") {
    Rig rig;
    DeviceIdentity phone = peer_identity(11);
    rig.tcp->reachable(tcp_addr(11), phone, "FP11");
    rig.tm.add_address(phone.device_id, tcp_addr(11));
    REQUIRE(rig.tm.connect(phone.device_id).ok());

    Packet ping = make_packet("kdeconnect.ping");
    rig.tcp->wire(phone.device_id)->inject(ping);

    TransportManagerEvent ev;
    REQUIRE(wait_for_event(rig.tm, TransportEventKind::PacketReceived, ev));
    CHECK(ev.device_id == phone.device_id);
    CHECK(ev.packet == ping);

    Packet reply = make_packet("kdeconnect.ping");
    CHECK(rig.tm.send_packet(phone.device_id, reply).ok());
    CHECK(rig.tcp->wire(phone.device_id)->sent_types() == std::vector<std::string>{"kdeconnect.ping"});
    CHECK(rig.tm.send_packet(peer_identity(99).device_id, reply).kind() == ErrorKind::NotConnected);
}

TEST_CASE("A peer closing the link yields one unsolicited Disconnected and frees the slot") {
    Rig rig;
    DeviceIdentity phone = peer_identity(12);
    trust(rig.store, phone.device_id, "FP12");
    rig.tcp->reachable(tcp_addr(12), phone, "FP12");
    rig.tm.add_address(phone.device_id, tcp_addr(12));
    REQUIRE(rig.tm.connect(phone.device_id).ok());

    rig.tcp->wire(phone.device_id)->peer_close();

    std::vector<TransportManagerEvent> seen;
    TransportManagerEvent ev;
    REQUIRE(wait_for_event(rig.tm, TransportEventKind::Disconnected, ev, &seen));
    CHECK(ev.unsolicited);
    CHECK(ev.paired);
    CHECK(rig.tm.state(phone.device_id) == ConnectionState::Disconnected);
    CHECK(rig.resources.snapshot().global.connections == 0);
    CHECK(rig.resources.snapshot().consistent());

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    for (const auto& e : drain(rig.tm)) CHECK(e.kind != TransportEventKind::Disconnected);
}

TEST_CASE("A local disconnect is reported as requested, exactly once") {
    Rig rig;
    DeviceIdentity phone = peer_identity(13);
    rig.tcp->reachable(tcp_addr(13), phone, "FP13");
    rig.tm.add_address(phone.device_id, tcp_addr(13));
    REQUIRE(rig.tm.connect(phone.device_id).ok());
    drain(rig.tm);

    rig.tm.disconnect(phone.device_id);
    rig.tm.disconnect(phone.device_id);
    CHECK_FALSE(rig.tm.has_connection(phone.device_id));
    CHECK(rig.resources.snapshot().global.connections == 0);

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    auto events = drain(rig.tm);
    REQUIRE(events.size() == 1);
    CHECK(events[0].kind == TransportEventKind::Disconnected);
    CHECK_FALSE(events[0].unsolicited);
}

TEST_CASE("Inbound sessions are verified, admitted and installed") {
    Rig rig;
    DeviceIdentity phone = peer_identity(14);
    rig.tcp->push_incoming(phone, tcp_addr(14), "FP14");

    CHECK(rig.tm.accept_incoming() == 1);
    CHECK(rig.tm.has_connection(phone.device_id));
    CHECK(rig.tm.connection_info(phone.device_id)->incoming);
    CHECK(rig.tm.addresses(phone.device_id).front() == TransportAddress(tcp_addr(14)));
    CHECK(rig.resources.snapshot().global.connections == 1);

    DeviceIdentity liar = peer_identity(15);
    trust(rig.store, liar.device_id, "GOOD");
    auto wire = rig.tcp->push_incoming(liar, tcp_addr(15), "BAD");
    CHECK(rig.tm.accept_incoming() == 0);
    CHECK_FALSE(wire->is_open());
    CHECK(rig.tm.state(liar.device_id) == ConnectionState::Rejected);
    CHECK(rig.resources.snapshot().global.connections == 1);
}

TEST_CASE("A second session for the same device replaces the first") {
    Rig rig;
    DeviceIdentity phone = peer_identity(16);
    rig.tcp->reachable(tcp_addr(16), phone, "FP16");
    rig.tm.add_address(phone.device_id, tcp_addr(16));
    REQUIRE(rig.tm.connect(phone.device_id).ok());
    auto first = rig.tcp->wire(phone.device_id);

    rig.tcp->push_incoming(phone, tcp_addr(17), "FP16");
    CHECK(rig.tm.accept_incoming() == 1);
    CHECK_FALSE(first->is_open());
    CHECK(rig.tm.has_connection(phone.device_id));
    CHECK(rig.resources.snapshot().per_device[phone.device_id].connections == 1);

    auto events = drain(rig.tm);
    REQUIRE(events.size() == 3);
    CHECK(events[0].kind == TransportEventKind::Connected);
    CHECK(events[1].kind == TransportEventKind::Disconnected);
    CHECK(events[2].kind == TransportEventKind::Connected);
}

TEST_CASE("Admission control refuses connections beyond the global limit before dialing") {
    ResourceLimits limits;
    limits.global_connections = 1;
    Rig rig(Rig::fast(), limits);

    DeviceIdentity a = peer_identity(18);
    DeviceIdentity b = peer_identity(19);
    rig.tcp->reachable(tcp_addr(18), a, "FP18");
    rig.tcp->reachable(tcp_addr(19), b, "FP19");
    rig.tm.add_address(a.device_id, tcp_addr(18));
    rig.tm.add_address(b.device_id, tcp_addr(19));

    REQUIRE(rig.tm.connect(a.device_id).ok());
    CHECK(rig.tm.connect(b.device_id).kind() == ErrorKind::ResourceExhausted);
    CHECK(rig.tcp->attempts() == 1);

    rig.tm.disconnect(a.device_id);
    CHECK(rig.tm.connect(b.device_id).ok());
    CHECK(rig.resources.snapshot().global.connections == 1);
}

TEST_CASE("Giving up after a failed reconnect attempt ends in Abandoned") {
    Rig rig;
    DeviceIdentity phone = peer_identity(21);
    rig.tcp->reachable(tcp_addr(21), phone, "FP21");
    rig.tm.add_address(phone.device_id, tcp_addr(21));
    REQUIRE(rig.tm.connect(phone.device_id).ok());
    rig.tm.disconnect(phone.device_id);

    rig.tcp->unreachable(tcp_addr(21), Status(ErrorKind::ConnectionRefused, "refused"));
    REQUIRE(rig.tm.mark_reconnecting(phone.device_id).ok());
    CHECK_FALSE(rig.tm.connect(phone.device_id).ok());
    CHECK(rig.tm.state(phone.device_id) == ConnectionState::Disconnected);

    CHECK(rig.tm.mark_abandoned(phone.device_id).ok());
    CHECK(rig.tm.state(phone.device_id) == ConnectionState::Abandoned);
    CHECK(rig.tm.mark_abandoned(phone.device_id).ok());
    CHECK(rig.tm.mark_abandoned(device_id(99)).kind() == ErrorKind::NotConnected);
}

TEST_CASE("Recovery bookkeeping moves a disconnected device through Reconnecting to Abandoned") {
    Rig rig;
    DeviceIdentity phone = peer_identity(20);
    rig.tcp->reachable(tcp_addr(20), phone, "FP20");
    rig.tm.add_address(phone.device_id, tcp_addr(20));
    REQUIRE(rig.tm.connect(phone.device_id).ok());

    CHECK_FALSE(rig.tm.mark_abandoned(phone.device_id).ok());
    rig.tm.disconnect(phone.device_id);
    CHECK(rig.tm.mark_reconnecting(phone.device_id).ok());
    CHECK(rig.tm.state(phone.device_id) == ConnectionState::Reconnecting);
    CHECK(rig.tm.mark_abandoned(phone.device_id).ok());
    CHECK(rig.tm.state(phone.device_id) == ConnectionState::Abandoned);

    // An explicit connect revives an abandoned device.
    CHECK(rig.tm.connect(phone.device_id).ok());
    CHECK(rig.tm.state(phone.device_id) == ConnectionState::Connected);
}

TEST_CASE("Shutdown closes every session and refuses new connects") {
    Rig rig;
    DeviceIdentity phone = peer_identity(21);
    rig.tcp->reachable(tcp_addr(21), phone, "FP21");
    rig.tm.add_address(phone.device_id, tcp_addr(21));
    REQUIRE(rig.tm.connect(phone.device_id).ok());
    auto wire = rig.tcp->wire(phone.device_id);

    rig.tm.shutdown();
    CHECK_FALSE(wire->is_open());
    CHECK_FALSE(rig.tcp->started());
    CHECK(rig.resources.snapshot().global.connections == 0);
    CHECK(rig.tm.connect(phone.device_id).kind() == ErrorKind::Cancelled);
}
