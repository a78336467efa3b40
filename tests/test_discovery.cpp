#include <doctest/doctest.h>
#include "fakes.hpp"

#include "kdc/discovery.hpp"
#include "kdc/mdns.hpp"

using namespace kdc_test;

namespace {

// Emits a fixed script of events keyed by the pump time.
class ScriptedProducer : public IDiscoveryProducer {
public:
    ScriptedProducer(std::map<int64_t, std::vector<DiscoveryEvent>> script, Status start_result = Status())
    : script_(std::move(script)), start_result_(std::move(start_result)) {}

    const char* name() const override { return "scripted"; }
    Status start() override { return start_result_; }
    void   stop() override { ++stops; }
    Status poll(int64_t now_ms, const CancelToken&, std::vector<DiscoveryEvent>& out) override {
        auto it = script_.find(now_ms);
        if (it != script_.end()) out.insert(out.end(), it->second.begin(), it->second.end());
        return Status();
    }

    int stops = 0;

private:
    std::map<int64_t, std::vector<DiscoveryEvent>> script_;
    Status                                         start_result_;
};

} // namespace

static DiscoveryEvent found(int n) {
    DiscoveryEvent ev;
    ev.identity = peer_identity(n);
    ev.address  = tcp_addr(n);
    ev.source   = "broadcast";
    return ev;
}

static std::vector<std::string> drain(DiscoveryService& svc) {
    std::vector<std::string> out;
    DiscoveryEvent ev;
    while (svc.poll_event(ev))
        out.push_back(std::string(to_string(ev.kind)) + " " + ev.identity.device_id + " " + to_string(ev.address));
    return out;
}

static BleAdvertisement ad(const std::string& address, int n, bool kde_service = true) {
    BleAdvertisement a;
    a.address   = address;
    a.name      = "phone-" + std::to_string(n);
    a.device_id = device_id(n);
    if (kde_service) a.service_uuids.push_back(ble::SERVICE_UUID);
    a.service_uuids.push_back("0000180f-0000-1000-8000-00805f9b34fb");
    return a;
}

TEST_CASE("The tracker reports new and changed devices and expires silent ones") {
    DiscoveryTracker t(1000);
    DiscoveryEvent a = found(1);

    CHECK(t.seen(a, 0));
    CHECK_FALSE(t.seen(a, 500));

    DiscoveryEvent moved = a;
    moved.address = TcpAddress{"192.168.1.200", 1716};
    CHECK(t.seen(moved, 600));

    std::vector<DiscoveryEvent> lost;
    t.expire(1599, lost);
    CHECK(lost.empty());
    t.expire(1600, lost);
    REQUIRE(lost.size() == 1);
    CHECK(lost[0].kind == DiscoveryEventKind::DeviceLost);
    CHECK(lost[0].address == TransportAddress(moved.address));
    CHECK(t.size() == 0);
}

TEST_CASE("Broadcast identities become TCP discoveries at the sender's address") {
    DeviceIdentity self = peer_identity(99);
    BroadcastDiscovery bd(BroadcastDiscoveryConfig{}, self);
    std::vector<DiscoveryEvent> out;

    DeviceIdentity peer = peer_identity(1);
    peer.tcp_port = 1739;
    bd.on_udp_datagram(encode(make_identity_packet(peer)), "10.0.0.5", 0, out);
    REQUIRE(out.size() == 1);
    CHECK(out[0].kind == DiscoveryEventKind::DeviceDiscovered);
    CHECK(out[0].identity.device_id == device_id(1));
    CHECK(out[0].address == TransportAddress(TcpAddress{"10.0.0.5", 1739}));
    CHECK(out[0].source == "broadcast");

    // Repeats are refreshes; a rename is news.
    bd.on_udp_datagram(encode(make_identity_packet(peer)), "10.0.0.5", 100, out);
    CHECK(out.size() == 1);
    peer.name = "renamed";
    bd.on_udp_datagram(encode(make_identity_packet(peer)), "10.0.0.5", 200, out);
    CHECK(out.size() == 2);
}

TEST_CASE("Broadcast discovery ignores itself, port-less identities and junk") {
    DeviceIdentity self = peer_identity(99);
    BroadcastDiscovery bd(BroadcastDiscoveryConfig{}, self);
    std::vector<DiscoveryEvent> out;

    bd.on_udp_datagram(encode(make_identity_packet(self)), "10.0.0.1", 0, out);

    DeviceIdentity no_port = peer_identity(2);
    no_port.tcp_port.reset();
    bd.on_udp_datagram(encode(make_identity_packet(no_port)), "10.0.0.2", 0, out);

    bd.on_udp_datagram("not json at all", "10.0.0.3", 0, out);
    bd.on_udp_datagram(encode(make_packet("kdeconnect.ping")), "10.0.0.4", 0, out);
    CHECK(out.empty());
}

TEST_CASE("mDNS announcements are discoveries too") {
    BroadcastDiscovery bd(BroadcastDiscoveryConfig{}, peer_identity(99));
    std::vector<DiscoveryEvent> out;

    bd.on_mdns_datagram(mdns::build_announcement(peer_identity(3), "10.0.0.9", 1740), "10.0.0.50", 0, out);
    REQUIRE(out.size() == 1);
    CHECK(out[0].source == "mdns");
    CHECK(out[0].address == TransportAddress(TcpAddress{"10.0.0.9", 1740}));

    // Without an A record the datagram's source address is used.
    bd.on_mdns_datagram(mdns::build_announcement(peer_identity(4), "", 1716), "10.0.0.51", 0, out);
    REQUIRE(out.size() == 2);
    CHECK(out[1].address == TransportAddress(TcpAddress{"10.0.0.51", 1716}));

    bd.on_mdns_datagram(mdns::build_announcement(peer_identity(99), "10.0.0.99", 1716), "10.0.0.99", 0, out);
    bd.on_mdns_datagram(mdns::build_query(), "10.0.0.52", 0, out);
    bd.on_mdns_datagram("\x01\x02", "10.0.0.53", 0, out);
    CHECK(out.size() == 2);
}

TEST_CASE("BLE discovery reports KDE Connect peers that pass the allow-list") {
    auto adapter = std::make_shared<FakeBleAdapter>();
    adapter->advertisements = {
        ad("aa:bb:cc:dd:ee:01", 1),
        ad("AA:BB:CC:DD:EE:02", 2, false),
        ad("AA:BB:CC:DD:EE:03", 3),
    };
    adapter->advertisements[2].address = "AA:BB:CC:DD:EE:09";   // not allowed
    BleAdvertisement anonymous = ad("AA:BB:CC:DD:EE:01", 4);
    anonymous.address   = "AA:BB:CC:DD:EE:0A";
    anonymous.device_id = "";
    adapter->advertisements.push_back(anonymous);

    BleDiscoveryConfig cfg;
    cfg.allow_list       = {"aa:bb:cc:dd:ee:01", "AA:BB:CC:DD:EE:02", "AA:BB:CC:DD:EE:0A"};
    cfg.scan_interval_ms = 1000;
    cfg.lost_timeout_ms  = 5000;
    cfg.idle_slice_ms    = 0;
    BleDiscovery bd(cfg, adapter);
    REQUIRE(bd.start().ok());
    CHECK(bd.allowed("AA:BB:CC:DD:EE:01"));
    CHECK_FALSE(bd.allowed("AA:BB:CC:DD:EE:09"));

    CancelToken cancel;
    std::vector<DiscoveryEvent> out;
    REQUIRE(bd.poll(0, cancel, out).ok());
    REQUIRE(out.size() == 1);
    CHECK(out[0].identity.device_id == device_id(1));
    CHECK(out[0].identity.name == "phone-1");
    CHECK(out[0].source == "ble");
    CHECK(out[0].address == TransportAddress(bt_addr(1)));

    // Between scans nothing is scanned.
    REQUIRE(bd.poll(500, cancel, out).ok());
    CHECK(adapter->scans == 1);

    REQUIRE(bd.poll(1000, cancel, out).ok());
    CHECK(adapter->scans == 2);
    CHECK(out.size() == 1);

    adapter->advertisements.clear();
    for (int64_t t = 2000; t < 6000; t += 1000) REQUIRE(bd.poll(t, cancel, out).ok());
    CHECK(out.size() == 1);
    REQUIRE(bd.poll(6000, cancel, out).ok());
    REQUIRE(out.size() == 2);
    CHECK(out[1].kind == DiscoveryEventKind::DeviceLost);
}

TEST_CASE("BLE discovery needs an adapter and surfaces scan errors") {
    BleDiscovery none(BleDiscoveryConfig{}, nullptr);
    CHECK(none.start().kind() == ErrorKind::Unsupported);

    auto adapter = std::make_shared<FakeBleAdapter>();
    adapter->scan_error = Status(ErrorKind::Io, "adapter powered off");
    BleDiscoveryConfig cfg;
    cfg.idle_slice_ms = 0;
    BleDiscovery bd(cfg, adapter);
    REQUIRE(bd.start().ok());
    CancelToken cancel;
    std::vector<DiscoveryEvent> out;
    CHECK(bd.poll(0, cancel, out).kind() == ErrorKind::Io);
    CHECK(out.empty());
}

TEST_CASE("Adding the BLE producer does not change what the other producers report") {
    const std::map<int64_t, std::vector<DiscoveryEvent>> script = {
        {0, {found(1)}},
        {10, {found(2)}},
        {20, {found(1), found(3)}},
    };

    DiscoveryService plain;
    plain.add_producer(std::make_unique<ScriptedProducer>(script));
    REQUIRE(plain.start(nullptr).ok());

    auto adapter = std::make_shared<FakeBleAdapter>();
    BleDiscoveryConfig cfg;
    cfg.idle_slice_ms = 0;
    DiscoveryService with_ble;
    with_ble.add_producer(std::make_unique<ScriptedProducer>(script));
    with_ble.add_producer(std::make_unique<BleDiscovery>(cfg, adapter));
    REQUIRE(with_ble.start(nullptr).ok());
    CHECK(with_ble.producer_count() == 2);

    std::vector<std::string> a, b;
    for (int64_t t = 0; t <= 30; t += 10) {
        plain.pump(t);
        with_ble.pump(t);
        auto ea = drain(plain);
        auto eb = drain(with_ble);
        a.insert(a.end(), ea.begin(), ea.end());
        b.insert(b.end(), eb.begin(), eb.end());
    }
    CHECK(a.size() == 4);
    CHECK(a == b);
    CHECK(adapter->scans >= 1);

    plain.stop();
    with_ble.stop();
}

TEST_CASE("A producer that fails to start is left out") {
    auto failing = std::make_unique<ScriptedProducer>(std::map<int64_t, std::vector<DiscoveryEvent>>{{0, {found(1)}}},
                                                      Status(ErrorKind::Io, "bind failed"));
    auto working = std::make_unique<ScriptedProducer>(std::map<int64_t, std::vector<DiscoveryEvent>>{{0, {found(2)}}});
    ScriptedProducer* failing_raw = failing.get();

    DiscoveryService svc;
    svc.add_producer(std::move(failing));
    svc.add_producer(std::move(working));
    REQUIRE(svc.start(nullptr).ok());
    svc.pump(0);
    auto events = drain(svc);
    REQUIRE(events.size() == 1);
    CHECK(events[0].find(device_id(2)) != std::string::npos);

    svc.stop();
    CHECK(failing_raw->stops == 0);

    DiscoveryService broken;
    broken.add_producer(std::make_unique<ScriptedProducer>(std::map<int64_t, std::vector<DiscoveryEvent>>{},
                                                           Status(ErrorKind::Io, "bind failed")));
    CHECK(broken.start(nullptr).kind() == ErrorKind::Io);
}
