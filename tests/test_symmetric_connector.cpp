#include <doctest/doctest.h>
#include "handover/symmetric_connector.hpp"
#include "handover/handover_detector.hpp"
#include "handover/transport/tcp_socket.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

using namespace handover;
using transport::DuplexSocket;

namespace {

constexpr const char* SCHEME = "pairtest";

struct App : ConnectionListener {
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<Role> before;
    std::vector<Role> roles;
    std::unique_ptr<DuplexSocket> socket;

    void before_connect(Role role) override {
        std::lock_guard<std::mutex> lk(mtx);
        before.push_back(role);
    }
    void on_connected(std::unique_ptr<DuplexSocket> s, Role role) override {
        std::lock_guard<std::mutex> lk(mtx);
        roles.push_back(role);
        socket = std::move(s);
        cv.notify_all();
    }
    bool wait_connected() {
        std::unique_lock<std::mutex> lk(mtx);
        return cv.wait_for(lk, std::chrono::seconds(5), [this] { return socket != nullptr; });
    }
};

SymmetricConnector::Dialer tcp_dialer() {
    return [](const Uri& u) -> std::unique_ptr<DuplexSocket> {
        auto port = u.port();
        if (!port) return nullptr;
        return std::make_unique<transport::TcpDuplexSocket>(u.host(), *port);
    };
}

std::unique_ptr<SymmetricConnector> make_peer(App& app, Nonce nonce, bool always_client = false) {
    auto listener = std::make_unique<transport::TcpListener>("127.0.0.1", 0);
    const std::string uri = std::string(SCHEME) + "://127.0.0.1:" + std::to_string(listener->port());
    SymmetricConnector::Options opts;
    opts.nonce = nonce;
    opts.always_client = always_client;
    return std::make_unique<SymmetricConnector>(SCHEME, std::move(listener), uri, tcp_dialer(), app, opts);
}

} // namespace

TEST_CASE("Two peers exchanging requests end up with one server and one client") {
    App app_a, app_b;
    auto a = make_peer(app_a, Nonce{0x00, 0x10});
    auto b = make_peer(app_b, Nonce{0x00, 0x20});
    REQUIRE(a->start());
    REQUIRE(b->start());

    const NdefMessage req_a = a->handover_request();
    const NdefMessage req_b = b->handover_request();
    REQUIRE(req_a.size() == 3);
    CHECK(find_collision_nonce(req_a) == std::optional<Nonce>(Nonce{0x00, 0x10}));

    // a has the lower nonce: it waits; b dials
    CHECK(a->attempt(req_b, 2, std::nullopt) == TransportStatus::Ok);
    CHECK(b->attempt(req_a, 2, std::nullopt) == TransportStatus::Ok);

    REQUIRE(app_a.wait_connected());
    REQUIRE(app_b.wait_connected());
    CHECK(app_a.roles == std::vector<Role>{Role::Server});
    CHECK(app_b.roles == std::vector<Role>{Role::Client});
    CHECK(app_a.before == std::vector<Role>{Role::Server});
    CHECK(app_b.before == std::vector<Role>{Role::Client});
    CHECK(a->connected());
    CHECK(b->connected());

    // the handed-over sockets are the two ends of one connection
    const uint8_t ping = 0x5A;
    REQUIRE(app_b.socket->write_all(&ping, 1) == TransportStatus::Ok);
    uint8_t got = 0;
    size_t n = 0;
    REQUIRE(app_a.socket->read_some(&got, 1, n) == TransportStatus::Ok);
    CHECK(n == 1);
    CHECK(got == ping);

    a->stop();
    b->stop();
}

TEST_CASE("Equal nonces are a draw and nothing connects") {
    App app_a, app_b;
    auto a = make_peer(app_a, Nonce{0x42, 0x42});
    auto b = make_peer(app_b, Nonce{0x42, 0x42});

    CHECK(a->attempt(b->handover_request(), 2, std::nullopt) == TransportStatus::CollisionDraw);
    CHECK(b->attempt(a->handover_request(), 2, std::nullopt) == TransportStatus::CollisionDraw);
    CHECK(app_a.before.empty());
    CHECK(app_b.before.empty());
    CHECK_FALSE(a->connected());
}

TEST_CASE("always_client dials even when its nonce would make it the server") {
    App app_a, app_b;
    auto a = make_peer(app_a, Nonce{0x00, 0x01}, /*always_client=*/true);
    auto b = make_peer(app_b, Nonce{0xFF, 0xFF});
    REQUIRE(a->start());
    REQUIRE(b->start());

    CHECK(a->attempt(b->handover_request(), 2, std::nullopt) == TransportStatus::Ok);
    REQUIRE(app_a.wait_connected());
    REQUIRE(app_b.wait_connected());
    CHECK(app_a.roles == std::vector<Role>{Role::Client});
    CHECK(app_b.roles == std::vector<Role>{Role::Server});

    // a second request after the handoff neither dials nor notifies again
    CHECK(a->attempt(b->handover_request(), 2, std::nullopt) == TransportStatus::Ok);
    CHECK(app_a.before.size() == 1);
}

TEST_CASE("always_client still stops on a nonce draw") {
    App app_a, app_b;
    auto a = make_peer(app_a, Nonce{0x42, 0x42}, /*always_client=*/true);
    auto b = make_peer(app_b, Nonce{0x42, 0x42});
    REQUIRE(b->start());

    CHECK(a->attempt(b->handover_request(), 2, std::nullopt) == TransportStatus::CollisionDraw);
    CHECK(app_a.before.empty());
    CHECK(app_b.before.empty());
    CHECK_FALSE(a->connected());
    CHECK_FALSE(b->connected());
    b->stop();
}

TEST_CASE("Requests without a usable nonce or candidate are rejected") {
    App app;
    auto a = make_peer(app, Nonce{0x01, 0x00});

    NdefMessage no_cr(std::vector<NdefRecord>{
        NdefRecord(Tnf::WellKnown, rtd::HANDOVER_REQUEST, Bytes{}, Bytes{HANDOVER_REQUEST_VERSION}),
        make_absolute_uri_record("pairtest://127.0.0.1:1")});
    CHECK(a->attempt(no_cr, 1, std::nullopt) == TransportStatus::BadRequest);

    NdefMessage other = make_handover_request(Nonce{0x02, 0x00}, {"ndef+tcp://127.0.0.1:1"});
    CHECK_FALSE(a->supports(other[2]));
    CHECK(a->attempt(other, 2, std::nullopt) == TransportStatus::NotSupported);

    // client role, but the dialer cannot use a URI without a port
    NdefMessage portless = make_handover_request(Nonce{0x00, 0x01}, {"pairtest://127.0.0.1"});
    CHECK(a->attempt(portless, 2, std::nullopt) == TransportStatus::BadAddress);
    CHECK(app.before.empty());
}

TEST_CASE("Client whose dial is refused reports ConnectFailed") {
    uint16_t dead_port = 0;
    {
        transport::TcpListener scratch("127.0.0.1", 0);
        REQUIRE(scratch.ok());
        dead_port = scratch.port();
    }
    App app;
    auto a = make_peer(app, Nonce{0x80, 0x00});
    NdefMessage req = make_handover_request(
        Nonce{0x00, 0x01}, {std::string(SCHEME) + "://127.0.0.1:" + std::to_string(dead_port)});
    CHECK(a->attempt(req, 2, std::nullopt) == TransportStatus::ConnectFailed);
    CHECK_FALSE(a->connected());
}
