#include <doctest/doctest.h>
#include "handover/core.hpp"
#include "handover/handover_detector.hpp"
#include "handover/tcp_handover.hpp"
#include "handover/transport/tcp_socket.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace handover;

namespace {

NdefMessage text_message(const std::string& s) {
    return NdefMessage(NdefRecord(Tnf::MimeMedia, to_bytes("text/plain"), Bytes{}, to_bytes(s)));
}

struct Recorder {
    std::mutex mtx;
    std::vector<std::string> calls;

    std::shared_ptr<CallbackHandler> make(const std::string& name, HandlerResult r = HandlerResult::Propagate) {
        return std::make_shared<CallbackHandler>(name, [this, name, r](const NdefMessage&) {
            std::lock_guard<std::mutex> lk(mtx);
            calls.push_back(name);
            return r;
        });
    }
};

struct PreferredHandler : NdefHandler {
    std::atomic<int> hits{0};
    HandlerResult handle(const NdefMessage&) override { ++hits; return HandlerResult::Consume; }
    std::optional<int> priority() const override { return 7; }
};

Core::Options no_initiators() {
    Core::Options o;
    o.default_initiators = false;
    return o;
}

} // namespace

TEST_CASE("Default core has the handover manager and empty-message handler wired in") {
    Core core;
    CHECK(core.handover_enabled());
    CHECK(core.manager().initiator_count() == 2);
    CHECK(core.dispatch_sync(NdefMessage::empty()) == HandlerResult::Consume);
    CHECK(core.dispatch_sync(text_message("x")) == HandlerResult::Propagate);
}

TEST_CASE("Asynchronous dispatch completes on a worker and wait_idle joins it") {
    Core core(Config{}, no_initiators());
    Recorder r;
    REQUIRE(core.register_handler(20, r.make("reader", HandlerResult::Consume)));

    std::atomic<int> completions{0};
    HandlerResult seen = HandlerResult::Propagate;
    REQUIRE(core.dispatch(text_message("a"), [&](const NdefMessage& m, HandlerResult res) {
        if (m == text_message("a")) seen = res;
        ++completions;
    }));
    for (int i = 0; i < 5; ++i) core.dispatch(text_message("more"));
    core.wait_idle();

    CHECK(completions.load() == 1);
    CHECK(seen == HandlerResult::Consume);
    CHECK(r.calls.size() == 6);
}

TEST_CASE("Worker survives a handler and a completion that throw non-standard types") {
    Core core(Config{}, no_initiators());
    core.register_handler(10, std::make_shared<CallbackHandler>("odd", [](const NdefMessage&) -> HandlerResult {
        throw 1;
    }));
    Recorder r;
    core.register_handler(20, r.make("after"));

    REQUIRE(core.dispatch(text_message("a"), [](const NdefMessage&, HandlerResult) { throw 2; }));
    core.wait_idle();
    CHECK(r.calls == std::vector<std::string>{"after"});
    CHECK(core.dispatch_sync(text_message("b")) == HandlerResult::Propagate);
}

TEST_CASE("Handler without a priority gets the configured default, its own one otherwise") {
    Config cfg;
    cfg.default_priority = 60;
    Core core(cfg, no_initiators());
    Recorder r;

    core.register_handler(r.make("plain"));                  // 60
    core.register_handler(55, r.make("fifty-five"));
    core.register_handler(65, r.make("sixty-five", HandlerResult::Consume));

    core.dispatch_sync(text_message("x"));
    CHECK(r.calls == std::vector<std::string>{"fifty-five", "plain", "sixty-five"});

    auto pref = std::make_shared<PreferredHandler>();
    REQUIRE(core.register_handler(pref));                    // 7, ahead of all the above
    CHECK(core.dispatch_sync(text_message("y")) == HandlerResult::Consume);
    CHECK(pref->hits.load() == 1);

    CHECK(core.remove_handler(pref.get()) == 1);
    CHECK_FALSE(core.register_handler(nullptr));
}

TEST_CASE("unregister_all removes the built-in handlers too") {
    Core core(Config{}, no_initiators());
    core.unregister_all();
    CHECK(core.dispatch_sync(NdefMessage::empty()) == HandlerResult::Propagate);
}

TEST_CASE("Handover requests reach the manager ahead of content handlers") {
    Core core(Config{}, no_initiators());
    Recorder r;
    core.register_handler(r.make("content"));

    struct Always : SchemeHandover {
        Always() : SchemeHandover("ndef+tcp") {}
        TransportStatus attempt(const NdefMessage&, size_t, const std::optional<NdefMessage>&) override {
            return TransportStatus::Ok;
        }
    };
    core.manager().add_initiator(std::make_shared<Always>());

    const NdefMessage req = make_handover_request(Nonce{1, 2}, {"ndef+tcp://10.1.1.1"});
    CHECK(core.dispatch_sync(req) == HandlerResult::Consume);
    CHECK(r.calls.empty());

    core.set_handover_enabled(false);
    CHECK(core.dispatch_sync(req) == HandlerResult::Propagate);
    CHECK(r.calls == std::vector<std::string>{"content"});
}

TEST_CASE("Config switches handover off at construction") {
    Config cfg;
    cfg.handover_enabled = false;
    Core core(cfg, no_initiators());
    CHECK_FALSE(core.handover_enabled());
}

TEST_CASE("Foreground message is sent to the peer and the peer's reply is dispatched") {
    transport::TcpListener listener("127.0.0.1", 0);
    REQUIRE(listener.ok());

    struct Peer : ExchangeContract {
        std::optional<NdefMessage> got;
        void handle_inbound(const NdefMessage& m) override { got = m; }
        std::optional<NdefMessage> foreground_message() const override { return text_message("reply"); }
    } peer;
    std::thread server([&] {
        auto sock = listener.accept();
        if (!sock) return;
        ExchangeSession(std::move(sock), peer).run();
    });

    Config cfg;
    Core core(cfg);
    Recorder r;
    core.register_handler(r.make("content", HandlerResult::Consume));
    core.set_foreground_message(text_message("mine"));
    CHECK(core.foreground_message() == std::optional<NdefMessage>(text_message("mine")));

    const NdefMessage req = make_handover_request(
        Nonce{1, 2}, {"ndef+tcp://127.0.0.1:" + std::to_string(listener.port())});
    CHECK(core.dispatch_sync(req) == HandlerResult::Consume);
    server.join();
    core.wait_idle();

    REQUIRE(peer.got);
    CHECK(*peer.got == text_message("mine"));
    CHECK(r.calls == std::vector<std::string>{"content"});   // the reply went through the chain

    core.clear_foreground_message();
    CHECK_FALSE(core.foreground_message());
}
