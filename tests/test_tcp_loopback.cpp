#include <doctest/doctest.h>
#include "fakes.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <sys/socket.h>

#include "kdc/pairing.hpp"
#include "kdc/tls_identity.hpp"
#include "kdc/transfer_store.hpp"
#include "kdc/transport/payload_transfer.hpp"
#include "kdc/transport/socket_io.hpp"
#include "kdc/transport/tcp_transport.hpp"
#include "kdc/transport/tls_stream.hpp"
#include "kdc/transport_manager.hpp"
#include "kdc/trust_store.hpp"

using namespace kdc_test;
namespace fs = std::filesystem;

// Everything here runs over 127.0.0.1 on ports well away from the KDE range.
static constexpr uint16_t TCP_FIRST     = 27100;
static constexpr uint16_t TCP_LAST      = 27199;
static constexpr uint16_t PAYLOAD_FIRST = 27200;
static constexpr uint16_t PAYLOAD_LAST  = 27299;

static TlsIdentity make_tls(int n) {
    TlsIdentity id;
    REQUIRE(TlsIdentity::generate(device_id(n), id).ok());
    return id;
}

static TcpTransportConfig tcp_config(bool listen) {
    TcpTransportConfig cfg;
    cfg.port_first           = TCP_FIRST;
    cfg.port_last            = TCP_LAST;
    cfg.connect_timeout_ms   = 2000;
    cfg.handshake_timeout_ms = 5000;
    cfg.listen               = listen;
    return cfg;
}

static TcpAddress loopback(uint16_t port) { return TcpAddress{"127.0.0.1", port}; }

// The far end closed the socket and nothing is left to read.
static bool closed_by_peer(int fd) {
    char c;
    return wait_fd(fd, false, 0) == 1 && ::recv(fd, &c, 1, MSG_PEEK) == 0;
}

static std::size_t count_closed(const std::vector<UniqueFd>& fds) {
    std::size_t n = 0;
    for (const auto& fd : fds) n += closed_by_peer(fd.get()) ? 1 : 0;
    return n;
}

static std::vector<UniqueFd> open_idle(uint16_t port, int count) {
    std::vector<UniqueFd> fds;
    CancelToken never;
    for (int i = 0; i < count; ++i) {
        UniqueFd fd;
        REQUIRE(tcp_connect("127.0.0.1", port, 2000, never, fd).ok());
        fds.push_back(std::move(fd));
    }
    return fds;
}

TEST_CASE("Two transports complete the KDE handshake over loopback") {
    TlsIdentity tls_a = make_tls(1);
    TlsIdentity tls_b = make_tls(2);
    TcpTransport a(tcp_config(false), peer_identity(1), tls_a);
    TcpTransport b(tcp_config(true), peer_identity(2), tls_b);
    REQUIRE(a.start().ok());
    REQUIRE(b.start().ok());
    REQUIRE(b.bound_port() >= TCP_FIRST);

    std::unique_ptr<Connection> out;
    Status st = a.connect(loopback(b.bound_port()), CancelToken(), out);
    REQUIRE(st.ok());
    REQUIRE(out);
    CHECK(out->handshake().peer.device_id == device_id(2));
    CHECK(out->handshake().peer_fingerprint == tls_b.fingerprint());
    CHECK(out->handshake().encrypted);
    CHECK_FALSE(out->handshake().incoming);
    CHECK(out->type() == TransportType::Tcp);

    std::unique_ptr<Connection> in;
    REQUIRE(wait_until([&] { return b.accept(in); }));
    CHECK(in->handshake().peer.device_id == device_id(1));
    CHECK(in->handshake().peer_fingerprint == tls_a.fingerprint());
    CHECK(in->handshake().incoming);

    SUBCASE("packets flow both ways") {
        REQUIRE(out->send(make_packet("kdeconnect.ping", {{"message", "hello"}})).ok());
        Packet p;
        Status err;
        REQUIRE(in->receive(p, 2000, err) == RxResult::Ok);
        CHECK(p.type == "kdeconnect.ping");
        CHECK(p.body["message"] == "hello");

        REQUIRE(in->send(make_packet("kdeconnect.battery", {{"currentCharge", 42}})).ok());
        REQUIRE(out->receive(p, 2000, err) == RxResult::Ok);
        CHECK(p.type == "kdeconnect.battery");
        CHECK(p.body["currentCharge"] == 42);
    }

    SUBCASE("closing one end is seen by the other") {
        out->close();
        Packet p;
        Status err;
        RxResult r = RxResult::None;
        REQUIRE(wait_until([&] {
            r = in->receive(p, 50, err);
            return r != RxResult::None;
        }));
        CHECK(r == RxResult::Closed);
    }

    b.stop();
    a.stop();
    CHECK(b.bound_port() == 0);
}

TEST_CASE("The dialling side speaks first in clear text and then serves TLS") {
    TlsIdentity tls_a = make_tls(3);
    TlsIdentity tls_b = make_tls(4);
    TcpTransport b(tcp_config(true), peer_identity(4), tls_b);
    REQUIRE(b.start().ok());

    CancelToken never;
    UniqueFd fd;
    REQUIRE(tcp_connect("127.0.0.1", b.bound_port(), 2000, never, fd).ok());
    const std::string hello = encode(make_identity_packet(peer_identity(3)));
    REQUIRE(write_all(fd.get(), hello.data(), hello.size(), 2000).ok());

    TlsStream stream(std::move(fd));
    REQUIRE(stream.handshake(tls_a, /*server*/true, 5000, never).ok());
    CHECK(stream.peer_fingerprint() == tls_b.fingerprint());
    CHECK(stream.peer_common_name() == device_id(4));

    std::string line;
    REQUIRE(stream.read_line(line, 8192, 2000, never).ok());
    Packet p;
    REQUIRE(decode(line, p) == CodecError::None);
    DeviceIdentity theirs;
    REQUIRE(parse_identity_packet(p, theirs).ok());
    CHECK(theirs.device_id == device_id(4));
    CHECK(theirs.tcp_port == b.bound_port());

    REQUIRE(stream.write_all(hello.data(), hello.size(), 2000).ok());
    std::unique_ptr<Connection> in;
    REQUIRE(wait_until([&] { return b.accept(in); }));
    CHECK(in->handshake().peer.device_id == device_id(3));
    CHECK(in->handshake().address == TransportAddress(TcpAddress{"127.0.0.1", 1716}));

    b.stop();
}

TEST_CASE("A certificate issued to another id is never accepted") {
    TlsIdentity tls_b     = make_tls(5);
    TlsIdentity other_cert = make_tls(99);
    TcpTransport b(tcp_config(true), peer_identity(5), tls_b);
    TcpTransport liar(tcp_config(false), peer_identity(6), other_cert);
    REQUIRE(b.start().ok());
    REQUIRE(liar.start().ok());

    std::unique_ptr<Connection> out;
    CHECK(liar.connect(loopback(b.bound_port()), CancelToken(), out).ok());

    REQUIRE(wait_until([&] { return b.handshakes_in_flight() == 0; }));
    std::unique_ptr<Connection> in;
    CHECK_FALSE(b.accept(in));

    liar.stop();
    b.stop();
}

TEST_CASE("Inbound handshakes are capped per address and in total") {
    TlsIdentity tls_b = make_tls(7);

    SUBCASE("one address") {
        TcpTransportConfig cfg = tcp_config(true);
        cfg.max_handshaking        = 8;
        cfg.max_handshaking_per_ip = 3;
        TcpTransport b(cfg, peer_identity(7), tls_b);
        REQUIRE(b.start().ok());

        std::vector<UniqueFd> idle = open_idle(b.bound_port(), 10);
        CHECK(wait_until([&] { return count_closed(idle) == 7; }));
        CHECK(b.handshakes_in_flight() == 3);
        b.stop();
        CHECK(b.handshakes_in_flight() == 0);
    }

    SUBCASE("all addresses") {
        TcpTransportConfig cfg = tcp_config(true);
        cfg.max_handshaking        = 2;
        cfg.max_handshaking_per_ip = 100;
        TcpTransport b(cfg, peer_identity(7), tls_b);
        REQUIRE(b.start().ok());

        std::vector<UniqueFd> idle = open_idle(b.bound_port(), 5);
        CHECK(wait_until([&] { return count_closed(idle) == 3; }));
        CHECK(b.handshakes_in_flight() == 2);

        // Once the stalled ones are gone a real peer gets through again.
        idle.clear();
        REQUIRE(wait_until([&] { return b.handshakes_in_flight() == 0; }, 4000));
        TlsIdentity tls_a = make_tls(8);
        TcpTransport a(tcp_config(false), peer_identity(8), tls_a);
        REQUIRE(a.start().ok());
        std::unique_ptr<Connection> out;
        CHECK(a.connect(loopback(b.bound_port()), CancelToken(), out).ok());
        std::unique_ptr<Connection> in;
        CHECK(wait_until([&] { return b.accept(in); }));
        a.stop();
        b.stop();
    }
}

TEST_CASE("The identity certificate is created once and then reused") {
    TempDir dir;
    TlsIdentity first;
    REQUIRE(TlsIdentity::load_or_create(dir.path(), device_id(10), first).ok());
    CHECK(first.valid());
    CHECK(first.device_id() == device_id(10));
    CHECK(fs::exists(dir.file("certificate.pem")));
    CHECK(fs::exists(dir.file("privateKey.pem")));
    CHECK((fs::status(dir.file("privateKey.pem")).permissions() & fs::perms::group_read) == fs::perms::none);

    TlsIdentity again;
    REQUIRE(TlsIdentity::load_or_create(dir.path(), device_id(10), again).ok());
    CHECK(again.fingerprint() == first.fingerprint());
    CHECK(again.device_id() == device_id(10));

    std::ofstream(dir.file("certificate.pem"), std::ios::trunc) << "not a certificate\n";
    TlsIdentity broken;
    CHECK(TlsIdentity::load_or_create(dir.path(), device_id(10), broken).kind() == ErrorKind::Tls);
}

// ---------------------------------------------------------------------------
// Payload side channel
// ---------------------------------------------------------------------------

static PayloadConfig payload_config() {
    PayloadConfig cfg;
    cfg.port_first  = PAYLOAD_FIRST;
    cfg.port_last   = PAYLOAD_LAST;
    cfg.timeout_ms  = 3000;
    cfg.chunk_bytes = 16 * 1024;
    return cfg;
}

static TransferState incoming_file(const TempDir& dir, const std::string& id, uint64_t size) {
    TransferState t;
    t.transfer_id = id;
    t.device_id   = device_id(11);
    t.filename    = id + ".bin";
    t.destination = dir.file(id + ".bin");
    t.total_size  = size;
    t.started_ms  = 1000;
    t.updated_ms  = 1000;
    return t;
}

static std::string pattern(std::size_t n) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i) s[i] = static_cast<char>((i * 31 + 7) & 0xff);
    return s;
}

TEST_CASE("A payload arrives whole with a checkpoint per chunk") {
    TempDir dir;
    TlsIdentity sender_tls   = make_tls(11);
    TlsIdentity receiver_tls = make_tls(12);
    TransferStore store(dir.path());

    const std::string data = pattern(200 * 1024 + 123);
    std::istringstream src(data);

    PayloadServer server(sender_tls, payload_config());
    uint16_t port = 0;
    REQUIRE(server.open(port).ok());
    REQUIRE(port >= PAYLOAD_FIRST);

    Status served;
    std::thread t([&] { served = server.serve(src, data.size(), receiver_tls.fingerprint(), CancelToken()); });

    std::size_t calls = 0;
    bool checkpoints_match = true;
    PayloadReceiver receiver(receiver_tls, payload_config(), store);
    Status st = receiver.receive("127.0.0.1", port, sender_tls.fingerprint(),
                                 incoming_file(dir, "photo", data.size()), CancelToken(),
                                 [&](uint64_t received, uint64_t total) {
                                     ++calls;
                                     auto rec = store.get("photo");
                                     if (!rec || rec->bytes_received != received || total != data.size())
                                         checkpoints_match = false;
                                 });
    t.join();

    REQUIRE(st.ok());
    CHECK(served.ok());
    CHECK(calls >= data.size() / (16 * 1024));
    CHECK(checkpoints_match);
    CHECK(store.active_count() == 0);
    CHECK_FALSE(fs::exists(dir.file("transfers/photo.json")));

    std::ifstream in(dir.file("photo.bin"), std::ios::binary);
    std::string got((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(got.size() == data.size());
    CHECK(got == data);
}

TEST_CASE("A download that is cut off leaves nothing behind") {
    TempDir dir;
    TlsIdentity sender_tls   = make_tls(13);
    TlsIdentity receiver_tls = make_tls(14);
    TransferStore store(dir.path());

    // The sender announces more than it has.
    const std::string data = pattern(40 * 1024);
    std::istringstream src(data);
    const uint64_t announced = 100 * 1024;

    PayloadServer server(sender_tls, payload_config());
    uint16_t port = 0;
    REQUIRE(server.open(port).ok());

    Status served;
    std::thread t([&] { served = server.serve(src, announced, std::string(), CancelToken()); });

    uint64_t last = 0;
    PayloadReceiver receiver(receiver_tls, payload_config(), store);
    Status st = receiver.receive("127.0.0.1", port, sender_tls.fingerprint(),
                                 incoming_file(dir, "movie", announced), CancelToken(),
                                 [&](uint64_t received, uint64_t) { last = received; });
    t.join();

    CHECK(served.kind() == ErrorKind::Io);
    REQUIRE_FALSE(st.ok());
    CHECK(st.kind() == ErrorKind::Io);
    CHECK(last == data.size());
    CHECK_FALSE(fs::exists(dir.file("movie.bin")));
    CHECK_FALSE(fs::exists(dir.file("transfers/movie.json")));
    CHECK(store.active_count() == 0);
}

TEST_CASE("A payload from the wrong certificate is refused") {
    TempDir dir;
    TlsIdentity sender_tls   = make_tls(15);
    TlsIdentity receiver_tls = make_tls(16);
    TlsIdentity paired_tls   = make_tls(17);
    TransferStore store(dir.path());

    const std::string data = pattern(1024);
    std::istringstream src(data);
    PayloadServer server(sender_tls, payload_config());
    uint16_t port = 0;
    REQUIRE(server.open(port).ok());

    Status served;
    std::thread t([&] { served = server.serve(src, data.size(), std::string(), CancelToken()); });

    PayloadReceiver receiver(receiver_tls, payload_config(), store);
    Status st = receiver.receive("127.0.0.1", port, paired_tls.fingerprint(),
                                 incoming_file(dir, "doc", data.size()), CancelToken());
    t.join();

    CHECK(st.kind() == ErrorKind::CertificateMismatch);
    CHECK_FALSE(fs::exists(dir.file("doc.bin")));
    CHECK(store.active_count() == 0);
}

// ---------------------------------------------------------------------------
// Cancellation while the peer sits on a half-open handshake
// ---------------------------------------------------------------------------

TEST_CASE("Cancelling a connect stuck in the handshake returns promptly") {
    // Listens but never accepts: the kernel completes the TCP connect and the
    // TLS handshake then waits for a ClientHello that never comes.
    UniqueFd silent;
    uint16_t port = 0;
    REQUIRE(tcp_listen(TCP_FIRST, TCP_LAST, silent, port).ok());

    TlsIdentity tls_a = make_tls(20);
    TcpTransportConfig cfg = tcp_config(false);
    cfg.handshake_timeout_ms = 10000;

    SUBCASE("through the transport") {
        TcpTransport a(cfg, peer_identity(20), tls_a);
        REQUIRE(a.start().ok());

        CancelToken token;
        Status st;
        const auto begin = std::chrono::steady_clock::now();
        std::thread t([&] {
            std::unique_ptr<Connection> out;
            st = a.connect(loopback(port), token, out);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        token.cancel();
        t.join();
        const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - begin).count();

        CHECK(st.kind() == ErrorKind::Cancelled);
        CHECK(took < 2000);
        a.stop();
    }

    SUBCASE("through the transport manager") {
        TrustStore store;
        PairingManager pairing(store, PairingPolicy::Explicit);
        TransportManagerConfig tm_cfg;
        tm_cfg.receive_slice_ms = 20;
        TransportManager tm(tm_cfg, pairing);
        tm.add_transport(std::make_shared<TcpTransport>(cfg, peer_identity(20), tls_a));
        REQUIRE(tm.start().ok());

        const std::string id = device_id(21);
        tm.add_address(id, loopback(port));

        Status st;
        const auto begin = std::chrono::steady_clock::now();
        std::thread t([&] { st = tm.connect(id); });
        REQUIRE(wait_until([&] { return tm.state(id) == ConnectionState::Handshaking; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        tm.cancel_connect(id);
        t.join();
        const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - begin).count();

        CHECK(st.kind() == ErrorKind::Cancelled);
        CHECK(took < 2000);
        CHECK(tm.state(id) == ConnectionState::Disconnected);
        CHECK_FALSE(tm.has_connection(id));
        tm.shutdown();
    }
}
