#include <doctest/doctest.h>
#include "kdc/identity.hpp"
#include "kdc/transport/transport_types.hpp"

using namespace kdc;

static DeviceIdentity laptop() {
    DeviceIdentity d;
    d.device_id = "0123456789abcdef0123456789abcdef";
    d.name      = "laptop";
    d.type      = DeviceType::Laptop;
    d.incoming  = {"kdeconnect.ping", "kdeconnect.share.request"};
    d.outgoing  = {"kdeconnect.ping", "kdeconnect.battery"};
    d.tcp_port  = 1716;
    return d;
}

TEST_CASE("Device ids are 32 to 38 safe characters") {
    CHECK(is_valid_device_id(std::string(32, 'a')));
    CHECK(is_valid_device_id(std::string(38, 'Z')));
    CHECK(is_valid_device_id("abcd_efgh-ijkl_mnop-qrst_uvwx-yz01"));
    CHECK_FALSE(is_valid_device_id(std::string(31, 'a')));
    CHECK_FALSE(is_valid_device_id(std::string(39, 'a')));
    CHECK_FALSE(is_valid_device_id(std::string(31, 'a') + "!"));
    CHECK_FALSE(is_valid_device_id(std::string(31, 'a') + " "));

    std::string fresh = generate_device_id();
    CHECK(fresh.size() == 36);
    CHECK(is_valid_device_id(fresh));
    CHECK(generate_device_id() != fresh);
}

TEST_CASE("Identity packet carries what a peer needs and parses back") {
    DeviceIdentity me = laptop();
    Packet p = make_identity_packet(me);
    CHECK(p.type == packet_type::IDENTITY);
    CHECK(p.body["deviceType"] == "laptop");
    CHECK(p.body["tcpPort"] == 1716);
    CHECK(p.body["protocolVersion"] == PROTOCOL_VERSION);

    DeviceIdentity back;
    REQUIRE(parse_identity_packet(p, back).ok());
    CHECK(back == me);

    me.tcp_port.reset();
    Packet no_port = make_identity_packet(me);
    CHECK(no_port.body.find("tcpPort") == no_port.body.end());
}

TEST_CASE("Identity parsing rejects bad ids, missing names and old protocols") {
    Packet p = make_identity_packet(laptop());
    DeviceIdentity out;

    Packet bad_id = p;
    bad_id.body["deviceId"] = "short";
    CHECK(parse_identity_packet(bad_id, out).kind() == ErrorKind::MalformedPacket);

    Packet no_name = p;
    no_name.body.erase("deviceName");
    CHECK(parse_identity_packet(no_name, out).kind() == ErrorKind::MalformedPacket);

    Packet old = p;
    old.body["protocolVersion"] = MIN_PROTOCOL_VERSION - 1;
    CHECK(parse_identity_packet(old, out).kind() == ErrorKind::ProtocolVersion);

    Packet other = make_packet("kdeconnect.ping");
    CHECK(parse_identity_packet(other, out).kind() == ErrorKind::MalformedPacket);
}

TEST_CASE("Identity parsing tolerates unknown device types and bad capability entries") {
    Packet p = make_identity_packet(laptop());
    p.body["deviceType"] = "fridge";
    p.body["incomingCapabilities"] = nlohmann::json::array({"kdeconnect.ping", 7, ""});
    p.body["tcpPort"] = 0;

    DeviceIdentity out;
    REQUIRE(parse_identity_packet(p, out).ok());
    CHECK(out.type == DeviceType::Desktop);
    CHECK(out.incoming == CapabilitySet{"kdeconnect.ping"});
    CHECK_FALSE(out.tcp_port.has_value());
}

TEST_CASE("Capability negotiation intersects our side with the peer's opposite side") {
    DeviceIdentity me = laptop();
    DeviceIdentity phone;
    phone.incoming = {"kdeconnect.battery", "kdeconnect.mpris"};
    phone.outgoing = {"kdeconnect.ping", "kdeconnect.telephony"};

    CHECK(receivable_types(me, phone) == CapabilitySet{"kdeconnect.ping"});
    CHECK(sendable_types(me, phone) == CapabilitySet{"kdeconnect.battery"});
}

TEST_CASE("Transport addresses have a stable text form and type") {
    using namespace kdc::transport;
    TransportAddress tcp = TcpAddress{"192.168.1.7", 1716};
    TransportAddress bt  = BluetoothAddress{"AA:BB:CC:DD:EE:FF", "svc"};
    CHECK(type_of(tcp) == TransportType::Tcp);
    CHECK(type_of(bt) == TransportType::Bluetooth);
    CHECK(to_string(tcp) == "tcp://192.168.1.7:1716");
    CHECK(to_string(bt).find("AA:BB:CC:DD:EE:FF") != std::string::npos);
    CHECK(capabilities_for(TransportType::Bluetooth).max_packet_size == BLUETOOTH_MAX_PACKET_SIZE);
    CHECK(capabilities_for(TransportType::Tcp).max_packet_size == TCP_MAX_PACKET_SIZE);
}
