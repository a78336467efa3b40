#include <doctest/doctest.h>
#include "fakes.hpp"

#include <fstream>

#include "kdc/device_registry.hpp"

using namespace kdc_test;

TEST_CASE("The most recent address comes first and each transport keeps four") {
    DeviceRegistry reg;
    DeviceIdentity peer = peer_identity(1);

    for (int i = 1; i <= 6; ++i) reg.remember(peer, TcpAddress{"10.0.0." + std::to_string(i), 1716}, i);
    reg.remember(peer, bt_addr(1), 7);
    reg.remember(peer, TcpAddress{"10.0.0.4", 1716}, 8);

    auto d = reg.get(device_id(1));
    REQUIRE(d.has_value());
    CHECK(d->last_seen_ms == 8);
    REQUIRE(d->addresses.size() == 5);
    CHECK(d->addresses[0] == TransportAddress(TcpAddress{"10.0.0.4", 1716}));
    CHECK(d->addresses[1] == TransportAddress(bt_addr(1)));
    CHECK(d->addresses[2] == TransportAddress(TcpAddress{"10.0.0.6", 1716}));
    CHECK(d->addresses[4] == TransportAddress(TcpAddress{"10.0.0.3", 1716}));

    reg.forget(device_id(1));
    CHECK_FALSE(reg.get(device_id(1)).has_value());
}

TEST_CASE("Known devices are reloaded from disk") {
    TempDir dir;
    {
        DeviceRegistry reg(dir.file("devices.json"));
        CHECK(reg.load().ok());
        reg.remember(peer_identity(1), tcp_addr(1), 100);
        reg.remember(peer_identity(1), bt_addr(1), 200);
        reg.remember(peer_identity(2), tcp_addr(2), 300);
        REQUIRE(reg.save().ok());
    }

    DeviceRegistry again(dir.file("devices.json"));
    REQUIRE(again.load().ok());
    CHECK(again.all().size() == 2);
    auto d = again.get(device_id(1));
    REQUIRE(d.has_value());
    CHECK(d->name == "peer-1");
    CHECK(d->type == DeviceType::Phone);
    CHECK(d->last_seen_ms == 200);
    REQUIRE(d->addresses.size() == 2);
    CHECK(d->addresses[0] == TransportAddress(tcp_addr(1)));
    CHECK(d->addresses[1] == TransportAddress(bt_addr(1)));
}

TEST_CASE("Malformed registry entries are skipped") {
    TempDir dir;
    std::ofstream(dir.file("devices.json"))
        << R"({"version":1,"devices":{"bad id":{},")" << device_id(3)
        << R"(":{"name":"ok","tcp":[{"ip":"10.0.0.3","port":99999},{"ip":"10.0.0.3","port":1716}],"bluetooth":[7]}}})";
    DeviceRegistry reg(dir.file("devices.json"));
    REQUIRE(reg.load().ok());
    REQUIRE(reg.all().size() == 1);
    auto d = reg.get(device_id(3));
    REQUIRE(d.has_value());
    REQUIRE(d->addresses.size() == 1);
    CHECK(d->addresses[0] == TransportAddress(TcpAddress{"10.0.0.3", 1716}));

    std::ofstream(dir.file("other.json")) << R"({"devices":[]})";
    DeviceRegistry wrong(dir.file("other.json"));
    CHECK(wrong.load().kind() == ErrorKind::Config);
}
