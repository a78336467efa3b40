#include <doctest/doctest.h>
#include "fakes.hpp"

#include "kdc/transport/bluetooth_transport.hpp"

using namespace kdc_test;

static Packet packet_of_size(std::size_t body_chars) {
    return make_packet("kdeconnect.clipboard", {{"content", std::string(body_chars, 'x')}});
}

TEST_CASE("A packet larger than the Bluetooth limit fails before any byte is written") {
    auto wire = std::make_shared<Wire>();
    FakeConnection conn(BLUETOOTH_CAPABILITIES, handshake_for(peer_identity(1), bt_addr(1), ""), wire);

    Packet big = packet_of_size(600);
    REQUIRE(encoded_size(big) > BLUETOOTH_MAX_PACKET_SIZE);
    Status st = conn.send(big);
    CHECK(st.kind() == ErrorKind::PacketTooLarge);
    CHECK(wire->calls() == 0);
    CHECK(conn.is_open());

    Packet small = packet_of_size(100);
    CHECK(conn.send(small).ok());
    REQUIRE(wire->sent().size() == 1);
    CHECK(wire->sent()[0] == small);
}

TEST_CASE("The same packet fits over TCP") {
    auto wire = std::make_shared<Wire>();
    FakeConnection conn(TCP_CAPABILITIES, handshake_for(peer_identity(1), tcp_addr(1), "FP"), wire);
    CHECK(conn.send(packet_of_size(600)).ok());
    CHECK(wire->calls() == 1);
}

TEST_CASE("Connection reassembles packets split across reads") {
    auto wire = std::make_shared<Wire>();
    FakeConnection conn(TCP_CAPABILITIES, handshake_for(peer_identity(1), tcp_addr(1), "FP"), wire);

    Packet a = make_packet("kdeconnect.ping");
    Packet b = make_packet("kdeconnect.battery", {{"currentCharge", 80}});
    std::string bytes = encode(a) + encode(b);
    wire->inject(bytes.substr(0, 5));
    wire->inject(bytes.substr(5));

    Packet got;
    Status err;
    REQUIRE(conn.receive(got, 100, err) == RxResult::Ok);
    CHECK(got == a);
    REQUIRE(conn.receive(got, 100, err) == RxResult::Ok);
    CHECK(got == b);
    CHECK(conn.receive(got, 10, err) == RxResult::None);

    wire->peer_close();
    CHECK(conn.receive(got, 10, err) == RxResult::Closed);
}

TEST_CASE("Malformed or oversized input on a link is reported as MalformedPacket") {
    auto wire = std::make_shared<Wire>();
    FakeConnection conn(BLUETOOTH_CAPABILITIES, handshake_for(peer_identity(1), bt_addr(1), ""), wire);

    Packet got;
    Status err;
    wire->inject("{broken\n");
    REQUIRE(conn.receive(got, 100, err) == RxResult::Error);
    CHECK(err.kind() == ErrorKind::MalformedPacket);

    wire->inject(std::string(700, 'y') + "\n");
    REQUIRE(conn.receive(got, 100, err) == RxResult::Error);
    CHECK(err.kind() == ErrorKind::MalformedPacket);
}

TEST_CASE("Writes are split into MTU-sized chunks") {
    FakeBleLink link("AA:BB:CC:DD:EE:01");
    std::string data(1100, 'z');
    REQUIRE(ble_write_chunked(link, data, 512, 100).ok());
    REQUIRE(link.writes.size() == 3);
    CHECK(link.writes[0].size() == 512);
    CHECK(link.writes[1].size() == 512);
    CHECK(link.writes[2].size() == 76);
    CHECK(link.writes[0] + link.writes[1] + link.writes[2] == data);
    CHECK(ble_write_chunked(link, data, 0, 100).kind() == ErrorKind::Internal);
}

TEST_CASE("Bluetooth handshake exchanges identities and keeps what followed the peer identity") {
    DeviceIdentity me = peer_identity(1);
    DeviceIdentity phone = peer_identity(2);
    auto adapter = std::make_shared<FakeBleAdapter>();

    auto link = std::make_unique<FakeBleLink>(bt_addr(2).device_address, true);
    FakeBleLink* raw = link.get();
    Packet ping = make_packet("kdeconnect.ping");
    std::string theirs = encode(make_identity_packet(phone));
    raw->notify(theirs.substr(0, 20));
    raw->notify(theirs.substr(20) + encode(ping));
    adapter->links[bt_addr(2).device_address] = std::move(link);

    BluetoothTransportConfig cfg;
    cfg.timeout_ms = 500;
    BluetoothTransport bt(cfg, me, adapter);
    REQUIRE(bt.start().ok());

    std::unique_ptr<Connection> conn;
    CancelToken cancel;
    REQUIRE(bt.connect(bt_addr(2), cancel, conn).ok());
    CHECK(conn->handshake().peer.device_id == phone.device_id);
    CHECK(conn->handshake().peer_fingerprint.empty());
    CHECK(conn->handshake().encrypted);
    CHECK(conn->type() == TransportType::Bluetooth);

    std::string mine;
    for (const auto& w : raw->writes) mine += w;
    Packet sent;
    REQUIRE(decode(mine, sent) == CodecError::None);
    CHECK(sent.type == packet_type::IDENTITY);

    Packet got;
    Status err;
    REQUIRE(conn->receive(got, 100, err) == RxResult::Ok);
    CHECK(got == ping);
}

TEST_CASE("Bluetooth transport refuses to start without an adapter and times out silent peers") {
    BluetoothTransport none(BluetoothTransportConfig{}, peer_identity(1), nullptr);
    CHECK(none.start().kind() == ErrorKind::Unsupported);

    auto adapter = std::make_shared<FakeBleAdapter>();
    adapter->links[bt_addr(3).device_address] = std::make_unique<FakeBleLink>(bt_addr(3).device_address);
    BluetoothTransportConfig cfg;
    cfg.timeout_ms = 100;
    BluetoothTransport bt(cfg, peer_identity(1), adapter);
    REQUIRE(bt.start().ok());

    std::unique_ptr<Connection> conn;
    CHECK(bt.connect(bt_addr(3), CancelToken(), conn).kind() == ErrorKind::Timeout);
    CHECK(bt.connect(tcp_addr(3), CancelToken(), conn).kind() == ErrorKind::Unsupported);
    CHECK(bt.connect(bt_addr(4), CancelToken(), conn).kind() == ErrorKind::ConnectionRefused);
}
