#include <doctest/doctest.h>
#include "handover/exchange.hpp"
#include "handover/frame.hpp"
#include "handover/transport/fd_socket.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace handover;
using handover::transport::DuplexSocket;

namespace {

struct RecordingContract : ExchangeContract {
    std::optional<NdefMessage> outbound;
    mutable std::mutex mtx;
    std::vector<NdefMessage> inbound;

    void handle_inbound(const NdefMessage& msg) override {
        std::lock_guard<std::mutex> lk(mtx);
        inbound.push_back(msg);
    }
    std::optional<NdefMessage> foreground_message() const override { return outbound; }
};

// Forwards to a real socket and counts close() calls.
struct CountingSocket : DuplexSocket {
    std::unique_ptr<DuplexSocket> inner;
    std::atomic<int>* closes;

    CountingSocket(std::unique_ptr<DuplexSocket> s, std::atomic<int>* c) : inner(std::move(s)), closes(c) {}

    TransportStatus connect() override { return inner->connect(); }
    TransportStatus read_some(uint8_t* out, std::size_t cap, std::size_t& n) override {
        return inner->read_some(out, cap, n);
    }
    TransportStatus write_all(const uint8_t* d, std::size_t len) override { return inner->write_all(d, len); }
    void close() override { ++*closes; inner->close(); }
    std::string name() const override { return "counting"; }
};

NdefMessage text_message(const std::string& s) {
    return NdefMessage(NdefRecord(Tnf::MimeMedia, to_bytes("text/plain"), Bytes{}, to_bytes(s)));
}

} // namespace

TEST_CASE("Both peers send one message and each receives the other's") {
    std::unique_ptr<DuplexSocket> a, b;
    REQUIRE(transport::make_socket_pair(a, b));

    RecordingContract ca, cb;
    ca.outbound = text_message("from-a");
    cb.outbound = text_message("from-b");

    std::atomic<int> closes_a{0};
    ExchangeSession sa(std::make_unique<CountingSocket>(std::move(a), &closes_a), ca);
    ExchangeSession sb(std::move(b), cb);
    REQUIRE(sa.connected());
    REQUIRE(sb.connected());

    std::thread peer([&] { sb.run(); });
    sa.run();
    peer.join();

    REQUIRE(ca.inbound.size() == 1);
    REQUIRE(cb.inbound.size() == 1);
    CHECK(ca.inbound[0] == text_message("from-b"));
    CHECK(cb.inbound[0] == text_message("from-a"));

    CHECK(sa.state() == ExchangeSession::State::BothDone);
    CHECK(sa.read_status() == TransportStatus::Ok);
    CHECK(sa.write_status() == TransportStatus::Ok);
    CHECK(closes_a.load() == 1);
    REQUIRE(sa.received());
    CHECK(*sa.received() == text_message("from-b"));
}

TEST_CASE("Without a foreground message a zero-length frame is sent and nothing is delivered") {
    std::unique_ptr<DuplexSocket> a, b;
    REQUIRE(transport::make_socket_pair(a, b));

    RecordingContract ca, cb;
    ca.outbound = text_message("only-a");

    ExchangeSession sa(std::move(a), ca);
    ExchangeSession sb(std::move(b), cb);

    std::thread peer([&] { sb.run(); });
    sa.run();
    peer.join();

    CHECK(ca.inbound.empty());
    CHECK_FALSE(sa.received());
    CHECK(sa.read_status() == TransportStatus::Ok);
    REQUIRE(cb.inbound.size() == 1);
}

TEST_CASE("Explicit outbound overrides the contract's message") {
    std::unique_ptr<DuplexSocket> a, b;
    REQUIRE(transport::make_socket_pair(a, b));

    RecordingContract ca, cb;
    ca.outbound = text_message("contract");

    ExchangeSession sa(std::move(a), ca, text_message("explicit"));
    ExchangeSession sb(std::move(b), cb);

    std::thread peer([&] { sb.run(); });
    sa.run();
    peer.join();

    REQUIRE(cb.inbound.size() == 1);
    CHECK(cb.inbound[0] == text_message("explicit"));
}

TEST_CASE("Frame with the wrong version byte fails the read as a protocol error") {
    std::unique_ptr<DuplexSocket> a, b;
    REQUIRE(transport::make_socket_pair(a, b));

    const uint8_t bad[] = {0x18, 0x00, 0x00, 0x00, 0x00};
    REQUIRE(b->write_all(bad, sizeof(bad)) == TransportStatus::Ok);

    RecordingContract ca;
    ExchangeSession sa(std::move(a), ca);
    sa.run();

    CHECK(sa.read_status() == TransportStatus::ProtocolVersion);
    CHECK(sa.state() == ExchangeSession::State::BothDone);
    CHECK(ca.inbound.empty());
}

TEST_CASE("Negative frame length fails the read as a protocol error") {
    std::unique_ptr<DuplexSocket> a, b;
    REQUIRE(transport::make_socket_pair(a, b));

    const uint8_t bad[] = {EXCHANGE_VERSION, 0xFF, 0xFF, 0xFF, 0xF0};
    REQUIRE(b->write_all(bad, sizeof(bad)) == TransportStatus::Ok);

    RecordingContract ca;
    ExchangeSession sa(std::move(a), ca);
    sa.run();
    CHECK(sa.read_status() == TransportStatus::ProtocolVersion);
}

TEST_CASE("Unparsable payload is an I/O error and is not delivered") {
    std::unique_ptr<DuplexSocket> a, b;
    REQUIRE(transport::make_socket_pair(a, b));

    const auto frame = encode_frame(std::vector<uint8_t>{0x00, 0x01});
    REQUIRE(b->write_all(frame.data(), frame.size()) == TransportStatus::Ok);

    RecordingContract ca;
    ExchangeSession sa(std::move(a), ca);
    sa.run();
    CHECK(sa.read_status() == TransportStatus::IoError);
    CHECK(ca.inbound.empty());
}

TEST_CASE("Peer hanging up before a frame ends the read as closed") {
    std::unique_ptr<DuplexSocket> a, b;
    REQUIRE(transport::make_socket_pair(a, b));
    b->close();

    RecordingContract ca;
    ca.outbound = text_message("x");
    ExchangeSession sa(std::move(a), ca);
    sa.run();
    CHECK(sa.read_status() == TransportStatus::Closed);
    CHECK(sa.state() == ExchangeSession::State::BothDone);
}

TEST_CASE("Socket that cannot connect never runs") {
    RecordingContract ca;
    ExchangeSession sa(std::make_unique<transport::FdDuplexSocket>(-1), ca);
    CHECK_FALSE(sa.connected());
    CHECK(sa.connect_status() == TransportStatus::Closed);
    sa.run();
    CHECK(sa.state() == ExchangeSession::State::Idle);

    CHECK(run_exchange(std::make_unique<transport::FdDuplexSocket>(-1), ca, std::nullopt) == TransportStatus::Closed);
}

TEST_CASE("Outbound message the wire cannot carry fails the write and the peer sees a close") {
    std::unique_ptr<DuplexSocket> a, b;
    REQUIRE(transport::make_socket_pair(a, b));

    RecordingContract ca, cb;
    ca.outbound = NdefMessage(NdefRecord(Tnf::MimeMedia, to_bytes("text/plain"), Bytes(300, 'i'), to_bytes("x")));
    cb.outbound = text_message("from-b");

    ExchangeSession sa(std::move(a), ca);
    ExchangeSession sb(std::move(b), cb);

    std::thread peer([&] { sb.run(); });
    sa.run();
    peer.join();

    CHECK(sa.write_status() == TransportStatus::BadRequest);
    CHECK(sb.read_status() == TransportStatus::Closed);
    CHECK(cb.inbound.empty());
}
