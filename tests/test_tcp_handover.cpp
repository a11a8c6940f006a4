#include <doctest/doctest.h>
#include "handover/handover_detector.hpp"
#include "handover/handover_manager.hpp"
#include "handover/tcp_handover.hpp"
#include "handover/transport/tcp_socket.hpp"

#include <mutex>
#include <thread>
#include <vector>

using namespace handover;

namespace {

struct RecordingContract : ExchangeContract {
    std::optional<NdefMessage> outbound;
    std::mutex mtx;
    std::vector<NdefMessage> inbound;

    void handle_inbound(const NdefMessage& msg) override {
        std::lock_guard<std::mutex> lk(mtx);
        inbound.push_back(msg);
    }
    std::optional<NdefMessage> foreground_message() const override { return outbound; }
};

NdefMessage text_message(const std::string& s) {
    return NdefMessage(NdefRecord(Tnf::MimeMedia, to_bytes("text/plain"), Bytes{}, to_bytes(s)));
}

// Accepts one connection and runs the peer side of the exchange.
std::thread serve_once(transport::TcpListener& listener, RecordingContract& peer) {
    return std::thread([&listener, &peer] {
        auto sock = listener.accept();
        if (!sock) return;
        ExchangeSession session(std::move(sock), peer);
        session.run();
    });
}

} // namespace

TEST_CASE("ndef+tcp candidate connects and both sides exchange their messages") {
    transport::TcpListener listener("127.0.0.1", 0);
    REQUIRE(listener.ok());
    REQUIRE(listener.port() != 0);

    RecordingContract peer;
    peer.outbound = text_message("peer-reply");
    std::thread server = serve_once(listener, peer);

    RecordingContract local;
    TcpHandover tcp(local);
    const std::string uri = "ndef+tcp://127.0.0.1:" + std::to_string(listener.port());
    NdefMessage req = make_handover_request(Nonce{0, 1}, {uri});

    CHECK(tcp.supports(req[2]));
    CHECK(tcp.attempt(req, 2, text_message("hello")) == TransportStatus::Ok);
    server.join();

    REQUIRE(local.inbound.size() == 1);
    CHECK(local.inbound[0] == text_message("peer-reply"));
    REQUIRE(peer.inbound.size() == 1);
    CHECK(peer.inbound[0] == text_message("hello"));
}

TEST_CASE("Manager consumes a request whose tcp candidate is reachable") {
    transport::TcpListener listener("127.0.0.1", 0);
    REQUIRE(listener.ok());
    RecordingContract peer;
    std::thread server = serve_once(listener, peer);

    RecordingContract local;
    HandoverManager m;
    m.add_initiator(std::make_shared<TcpHandover>(local));

    NdefMessage req = make_handover_request(
        Nonce{0, 1}, {"ndef+tcp://127.0.0.1:" + std::to_string(listener.port())});
    CHECK(m.attempt_handover(req, text_message("hi")) == HandlerResult::Consume);
    server.join();
    REQUIRE(peer.inbound.size() == 1);
}

TEST_CASE("Refused connection reports ConnectFailed") {
    uint16_t dead_port = 0;
    {
        transport::TcpListener scratch("127.0.0.1", 0);
        REQUIRE(scratch.ok());
        dead_port = scratch.port();
    }
    RecordingContract local;
    TcpHandover tcp(local);
    NdefMessage req = make_handover_request(
        Nonce{0, 1}, {"ndef+tcp://127.0.0.1:" + std::to_string(dead_port)});
    CHECK(tcp.attempt(req, 2, std::nullopt) == TransportStatus::ConnectFailed);
}

TEST_CASE("Default port applies when the URI names none, other schemes are unsupported") {
    std::vector<std::pair<std::string, uint16_t>> dialed;
    RecordingContract local;
    TcpHandover tcp(local, 9100, [&](const std::string& host, uint16_t port) {
        dialed.emplace_back(host, port);
        return std::unique_ptr<transport::DuplexSocket>(std::make_unique<transport::FdDuplexSocket>(-1));
    });

    NdefMessage req = make_handover_request(Nonce{0, 1}, {"ndef+tcp://peer.local", "http://x", "ndef+tcp://:80"});
    CHECK(tcp.attempt(req, 2, std::nullopt) == TransportStatus::Closed);
    REQUIRE(dialed.size() == 1);
    CHECK(dialed[0].first == "peer.local");
    CHECK(dialed[0].second == 9100);

    CHECK_FALSE(tcp.supports(req[3]));
    CHECK(tcp.attempt(req, 3, std::nullopt) == TransportStatus::NotSupported);
    CHECK(tcp.attempt(req, 4, std::nullopt) == TransportStatus::BadAddress);
    CHECK(tcp.attempt(req, 9, std::nullopt) == TransportStatus::NotSupported);
}
