#include <doctest/doctest.h>
#include "fakes.hpp"

#include "kdc/clock.hpp"
#include "kdc/pairing.hpp"
#include "kdc/trust_store.hpp"

using namespace kdc_test;

static HandshakeInfo tls_session(int n, const std::string& fp) {
    return handshake_for(peer_identity(n), tcp_addr(n), fp);
}

static std::vector<PairingEvent> drain(PairingManager& pm) {
    std::vector<PairingEvent> out;
    PairingEvent ev;
    while (pm.poll_event(ev)) out.push_back(ev);
    return out;
}

static Packet pair_request(int64_t timestamp_s) {
    return make_packet(packet_type::PAIR, {{"pair", true}, {"timestamp", timestamp_s}});
}

TEST_CASE("First contact records the fingerprint without trusting it") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::Explicit);
    const std::string id = device_id(1);

    REQUIRE(pm.verify_handshake(tls_session(1, "FP-A")).ok());
    REQUIRE(store.get(id).has_value());
    CHECK(store.get(id)->fingerprint == "FP-A");
    CHECK(pm.state(id) == TrustState::Untrusted);
    CHECK_FALSE(pm.is_trusted(id));
}

TEST_CASE("A stream of new device ids does not grow the trust file") {
    TempDir dir;
    const std::string path = dir.file("trust.json");
    TrustStore store(path, 8);
    PairingManager pm(store, PairingPolicy::Explicit);

    for (int n = 1; n <= 200; ++n) REQUIRE(pm.verify_handshake(tls_session(n, "FP-" + std::to_string(n))).ok());
    CHECK(store.transient_count() == 8);
    CHECK(store.all().size() == 8);
    CHECK_FALSE(std::filesystem::exists(path));
    CHECK(pm.state(device_id(200)) == TrustState::Untrusted);
    CHECK_FALSE(store.get(device_id(1)).has_value());
}

TEST_CASE("Explicit policy: a peer request waits for the user and accept trusts it") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::Explicit);
    const std::string id = device_id(2);
    REQUIRE(pm.verify_handshake(tls_session(2, "FP-B")).ok());

    std::optional<Packet> reply;
    REQUIRE(pm.handle_pair_packet(id, pair_request(wall_ms() / 1000), 1000, reply).ok());
    CHECK_FALSE(reply.has_value());
    CHECK(pm.pending(id));
    CHECK(pm.state(id) == TrustState::PendingPairing);

    auto events = drain(pm);
    REQUIRE(events.size() == 1);
    CHECK(events[0].kind == PairingEventKind::PairingRequested);
    CHECK(events[0].fingerprint == "FP-B");

    Packet answer;
    REQUIRE(pm.accept(id, answer).ok());
    CHECK(answer.type == packet_type::PAIR);
    CHECK(answer.body["pair"] == true);
    CHECK(pm.is_trusted(id));
    CHECK(store.get(id)->paired_ms > 0);
    CHECK_FALSE(pm.pending(id));

    events = drain(pm);
    REQUIRE(events.size() == 1);
    CHECK(events[0].kind == PairingEventKind::PairingResult);
    CHECK(events[0].accepted);
}

TEST_CASE("Trust on first use answers and trusts immediately") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::TrustOnFirstUse);
    const std::string id = device_id(3);
    REQUIRE(pm.verify_handshake(tls_session(3, "FP-C")).ok());

    std::optional<Packet> reply;
    REQUIRE(pm.handle_pair_packet(id, pair_request(wall_ms() / 1000), 0, reply).ok());
    REQUIRE(reply.has_value());
    CHECK(reply->body["pair"] == true);
    CHECK(pm.is_trusted(id));

    auto events = drain(pm);
    REQUIRE(events.size() == 1);
    CHECK(events[0].accepted);
}

TEST_CASE("Our own request is trusted when the peer agrees") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::Explicit);
    const std::string id = device_id(4);
    REQUIRE(pm.verify_handshake(tls_session(4, "FP-D")).ok());

    Packet request;
    REQUIRE(pm.request_pair(id, 0, request).ok());
    CHECK(request.body["pair"] == true);
    CHECK(request.body.contains("timestamp"));
    CHECK(pm.state(id) == TrustState::PendingPairing);

    std::optional<Packet> reply;
    REQUIRE(pm.handle_pair_packet(id, make_pair_packet(true), 500, reply).ok());
    CHECK_FALSE(reply.has_value());
    CHECK(pm.is_trusted(id));
}

TEST_CASE("A pairing request expires after thirty seconds") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::Explicit);
    const std::string id = device_id(5);
    REQUIRE(pm.verify_handshake(tls_session(5, "FP-E")).ok());

    Packet request;
    REQUIRE(pm.request_pair(id, 10000, request).ok());
    pm.tick(10000 + PAIRING_TIMEOUT_MS - 1);
    CHECK(pm.pending(id));
    CHECK(drain(pm).empty());

    pm.tick(10000 + PAIRING_TIMEOUT_MS);
    CHECK_FALSE(pm.pending(id));
    CHECK(pm.state(id) == TrustState::Untrusted);
    auto events = drain(pm);
    REQUIRE(events.size() == 1);
    CHECK_FALSE(events[0].accepted);
    CHECK(events[0].reason == "timed out");
}

TEST_CASE("Rejection by either side leaves the device untrusted") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::Explicit);
    const std::string a = device_id(6);
    const std::string b = device_id(7);
    REQUIRE(pm.verify_handshake(tls_session(6, "FP-F")).ok());
    REQUIRE(pm.verify_handshake(tls_session(7, "FP-G")).ok());

    Packet request;
    REQUIRE(pm.request_pair(a, 0, request).ok());
    std::optional<Packet> reply;
    REQUIRE(pm.handle_pair_packet(a, make_pair_packet(false), 100, reply).ok());
    CHECK(pm.state(a) == TrustState::Untrusted);

    REQUIRE(pm.handle_pair_packet(b, pair_request(wall_ms() / 1000), 0, reply).ok());
    Packet no;
    REQUIRE(pm.reject(b, no).ok());
    CHECK(no.body["pair"] == false);
    CHECK(pm.state(b) == TrustState::Untrusted);
    CHECK(pm.accept(b, no).kind() == ErrorKind::NotPaired);

    auto events = drain(pm);
    REQUIRE(events.size() == 3);
    CHECK(events[0].reason == "rejected by peer");
    CHECK(events[1].kind == PairingEventKind::PairingRequested);
    CHECK(events[2].reason == "rejected");
}

TEST_CASE("A changed certificate for a trusted device is a security violation") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::TrustOnFirstUse);
    const std::string id = device_id(8);
    REQUIRE(pm.verify_handshake(tls_session(8, "GOOD")).ok());
    std::optional<Packet> reply;
    REQUIRE(pm.handle_pair_packet(id, pair_request(wall_ms() / 1000), 0, reply).ok());
    REQUIRE(pm.is_trusted(id));

    Status st = pm.verify_handshake(tls_session(8, "EVIL"));
    CHECK(st.kind() == ErrorKind::CertificateMismatch);
    CHECK(st.is_security_violation());
    CHECK(st.critical());
    CHECK(store.get(id)->fingerprint == "GOOD");
    CHECK(pm.is_trusted(id));
    CHECK(pm.verify_handshake(tls_session(8, "GOOD")).ok());
}

TEST_CASE("After unpair the next handshake is first contact again") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::TrustOnFirstUse);
    const std::string id = device_id(9);
    REQUIRE(pm.verify_handshake(tls_session(9, "OLD")).ok());
    std::optional<Packet> reply;
    REQUIRE(pm.handle_pair_packet(id, pair_request(wall_ms() / 1000), 0, reply).ok());
    REQUIRE(pm.is_trusted(id));

    Packet bye;
    REQUIRE(pm.unpair(id, bye).ok());
    CHECK(bye.body["pair"] == false);
    CHECK_FALSE(pm.has_record(id));

    // A reinstalled peer comes back with a new certificate.
    CHECK(pm.verify_handshake(tls_session(9, "NEW")).ok());
    CHECK(store.get(id)->fingerprint == "NEW");
    CHECK_FALSE(pm.is_trusted(id));
}

TEST_CASE("A peer unpairing us erases the record") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::TrustOnFirstUse);
    const std::string id = device_id(10);
    REQUIRE(pm.verify_handshake(tls_session(10, "FP")).ok());
    std::optional<Packet> reply;
    REQUIRE(pm.handle_pair_packet(id, pair_request(wall_ms() / 1000), 0, reply).ok());
    drain(pm);

    REQUIRE(pm.handle_pair_packet(id, make_pair_packet(false), 0, reply).ok());
    CHECK_FALSE(pm.has_record(id));
    auto events = drain(pm);
    REQUIRE(events.size() == 1);
    CHECK(events[0].reason == "unpaired by peer");
}

TEST_CASE("Requests with a skewed clock or from revoked devices are refused") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::TrustOnFirstUse);
    const std::string id = device_id(11);
    REQUIRE(pm.verify_handshake(tls_session(11, "FP")).ok());

    std::optional<Packet> reply;
    const int64_t skewed = wall_ms() / 1000 - PAIR_TIMESTAMP_TOLERANCE_S - 60;
    REQUIRE(pm.handle_pair_packet(id, pair_request(skewed), 0, reply).ok());
    REQUIRE(reply.has_value());
    CHECK(reply->body["pair"] == false);
    CHECK_FALSE(pm.is_trusted(id));

    REQUIRE(store.revoke(id).ok());
    CHECK(pm.handle_pair_packet(id, pair_request(wall_ms() / 1000), 0, reply).kind() == ErrorKind::PermissionDenied);
    CHECK(pm.verify_handshake(tls_session(11, "FP")).kind() == ErrorKind::PermissionDenied);

    Packet junk = make_packet(packet_type::PAIR, {{"pair", "yes"}});
    CHECK(pm.handle_pair_packet(id, junk, 0, reply).kind() == ErrorKind::MalformedPacket);
}

TEST_CASE("Bluetooth sessions carry no certificate and need an encrypted link to a trusted device") {
    TrustStore store;
    PairingManager pm(store, PairingPolicy::Explicit);
    const std::string id = device_id(12);

    HandshakeInfo ble = handshake_for(peer_identity(12), bt_addr(12), "");
    CHECK(pm.verify_handshake(ble).kind() == ErrorKind::NotPaired);

    TrustRecord rec;
    rec.device_id   = id;
    rec.fingerprint = "FP";
    rec.state       = TrustState::Trusted;
    REQUIRE(store.put(rec).ok());
    CHECK(pm.verify_handshake(ble).ok());

    ble.encrypted = false;
    CHECK(pm.verify_handshake(ble).kind() == ErrorKind::NotPaired);
}
