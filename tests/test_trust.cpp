#include <doctest/doctest.h>
#include "fakes.hpp"

#include <fstream>
#include <sys/stat.h>

#include "kdc/trust_store.hpp"

using namespace kdc_test;

static TrustRecord record(int n, TrustState state, const std::string& fp = "AA:BB") {
    TrustRecord r;
    r.device_id   = device_id(n);
    r.fingerprint = fp;
    r.paired_ms   = state == TrustState::Trusted ? 1718000000000 : 0;
    r.state       = state;
    return r;
}

TEST_CASE("Trusted and revoked records survive a restart, first contacts do not") {
    TempDir dir;
    const std::string path = dir.file("trusted_devices.json");
    {
        TrustStore store(path);
        REQUIRE(store.load().ok());
        REQUIRE(store.put(record(1, TrustState::Trusted, "11:22")).ok());
        REQUIRE(store.put(record(2, TrustState::PendingPairing)).ok());
        REQUIRE(store.put(record(3, TrustState::Revoked)).ok());
    }

    struct stat st{};
    REQUIRE(::stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);

    TrustStore again(path);
    REQUIRE(again.load().ok());
    CHECK(again.all().size() == 2);
    CHECK(again.is_trusted(device_id(1)));
    CHECK(again.get(device_id(1))->fingerprint == "11:22");
    CHECK(again.get(device_id(1))->paired_ms == 1718000000000);
    CHECK_FALSE(again.get(device_id(2)).has_value());
    CHECK(again.get(device_id(3))->state == TrustState::Revoked);
    CHECK(again.transient_count() == 0);
}

TEST_CASE("Erase and revoke are persisted") {
    TempDir dir;
    const std::string path = dir.file("trust.json");
    TrustStore store(path);
    REQUIRE(store.put(record(1, TrustState::Trusted)).ok());
    REQUIRE(store.put(record(2, TrustState::Trusted)).ok());
    REQUIRE(store.erase(device_id(1)).ok());
    REQUIRE(store.revoke(device_id(2)).ok());
    CHECK(store.erase(device_id(42)).ok());

    TrustStore again(path);
    REQUIRE(again.load().ok());
    CHECK_FALSE(again.get(device_id(1)).has_value());
    CHECK(again.get(device_id(2))->state == TrustState::Revoked);
    CHECK_FALSE(again.is_trusted(device_id(2)));
}

TEST_CASE("A corrupt trust file is an error and leaves the store as it was") {
    TempDir dir;
    const std::string path = dir.file("trust.json");
    TrustStore store(path);
    REQUIRE(store.put(record(1, TrustState::Trusted)).ok());

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ this is not json";
    }
    CHECK_FALSE(store.load().ok());
    CHECK(store.is_trusted(device_id(1)));
}

TEST_CASE("Malformed entries are skipped, the rest loads") {
    TempDir dir;
    const std::string path = dir.file("trust.json");
    {
        std::ofstream out(path);
        out << "{\"version\":1,\"devices\":{"
            << "\"" << device_id(1) << "\":{\"fingerprint\":\"AB\",\"state\":\"trusted\",\"pairedMs\":5},"
            << "\"" << device_id(2) << "\":{\"fingerprint\":7,\"state\":\"trusted\"},"
            << "\"" << device_id(3) << "\":{\"fingerprint\":\"CD\",\"state\":\"sideways\"}}}";
    }
    TrustStore store(path);
    REQUIRE(store.load().ok());
    CHECK(store.all().size() == 1);
    CHECK(store.is_trusted(device_id(1)));

    TrustState s;
    CHECK(trust_state_from_string("pending", s));
    CHECK(s == TrustState::PendingPairing);
    CHECK(std::string(to_string(TrustState::Revoked)) == "revoked");
}

TEST_CASE("First contacts stay in memory and are capped") {
    TempDir dir;
    const std::string path = dir.file("trust.json");
    TrustStore store(path, 4);

    REQUIRE(store.put(record(1, TrustState::PendingPairing)).ok());
    for (int n = 2; n <= 40; ++n) REQUIRE(store.put(record(n, TrustState::Untrusted)).ok());

    // Nothing worth keeping yet, so nothing was written.
    CHECK_FALSE(std::filesystem::exists(path));
    CHECK(store.transient_count() == 4);
    CHECK(store.all().size() == 4);
    CHECK(store.get(device_id(1)).has_value());     // pending outlives untrusted
    CHECK(store.get(device_id(40)).has_value());
    CHECK(store.get(device_id(38)).has_value());
    CHECK_FALSE(store.get(device_id(2)).has_value());
    CHECK_FALSE(store.get(device_id(36)).has_value());

    // Touching an entry again makes it the newest.
    REQUIRE(store.put(record(38, TrustState::Untrusted, "NEW")).ok());
    REQUIRE(store.put(record(41, TrustState::Untrusted)).ok());
    CHECK(store.get(device_id(38))->fingerprint == "NEW");
    CHECK_FALSE(store.get(device_id(39)).has_value());

    // Promotion leaves the transient set and reaches the disk.
    REQUIRE(store.put(record(40, TrustState::Trusted)).ok());
    CHECK(store.transient_count() == 3);
    CHECK(std::filesystem::exists(path));
    for (int n = 100; n < 110; ++n) REQUIRE(store.put(record(n, TrustState::Untrusted)).ok());
    CHECK(store.is_trusted(device_id(40)));
    CHECK(store.transient_count() == 4);

    TrustStore again(path);
    REQUIRE(again.load().ok());
    CHECK(again.all().size() == 1);
    CHECK(again.is_trusted(device_id(40)));
}
