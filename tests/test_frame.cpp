#include <doctest/doctest.h>
#include "handover/frame.hpp"

using namespace handover;

static FrameStatus feed_all(FrameDecoder& dec, const std::vector<uint8_t>& bytes, std::vector<uint8_t>& out) {
    FrameStatus st = FrameStatus::NeedMore;
    for (uint8_t b : bytes) {
        st = dec.feed(b, out);
        if (st != FrameStatus::NeedMore) break;
    }
    return st;
}

TEST_CASE("Frame header layout") {
    auto f = encode_frame(std::vector<uint8_t>{0xAA, 0xBB, 0xCC});
    REQUIRE(f.size() == 8);
    CHECK(f[0] == EXCHANGE_VERSION);
    CHECK(f[1] == 0x00);
    CHECK(f[2] == 0x00);
    CHECK(f[3] == 0x00);
    CHECK(f[4] == 0x03);
    CHECK(f[5] == 0xAA);
}

TEST_CASE("Frames of several lengths decode to the same payload") {
    for (size_t len : {size_t(0), size_t(1), size_t(255), size_t(256), size_t(70000)}) {
        std::vector<uint8_t> payload(len);
        for (size_t i = 0; i < len; ++i) payload[i] = static_cast<uint8_t>(i * 7);

        FrameDecoder dec;
        std::vector<uint8_t> out{0x01};
        CHECK(feed_all(dec, encode_frame(payload), out) == FrameStatus::Complete);
        CHECK(out == payload);
    }
}

TEST_CASE("Buffer feed reports consumed bytes and stops at the frame end") {
    auto f = encode_frame(std::vector<uint8_t>{1, 2, 3});
    f.push_back(0x99);   // next frame's first byte

    FrameDecoder dec;
    std::vector<uint8_t> out;
    size_t used = 0;
    CHECK(dec.feed(f.data(), 4, used, out) == FrameStatus::NeedMore);
    CHECK(used == 4);
    CHECK(dec.feed(f.data() + 4, f.size() - 4, used, out) == FrameStatus::Complete);
    CHECK(used == 4);
    CHECK(out == std::vector<uint8_t>{1, 2, 3});
}

TEST_CASE("Wrong version byte is rejected immediately") {
    auto f = encode_frame(std::vector<uint8_t>{1, 2, 3});
    f[0] = 0x18;
    FrameDecoder dec;
    std::vector<uint8_t> out;
    CHECK(dec.feed(f[0], out) == FrameStatus::BadVersion);
    CHECK(dec.feed(f[1], out) == FrameStatus::BadVersion);   // stays spent
    dec.reset();
    CHECK(dec.feed(EXCHANGE_VERSION, out) == FrameStatus::NeedMore);
}

TEST_CASE("Negative and oversized lengths are protocol errors") {
    std::vector<uint8_t> out;
    {
        FrameDecoder dec;
        CHECK(feed_all(dec, {EXCHANGE_VERSION, 0xFF, 0xFF, 0xFF, 0xFF}, out) == FrameStatus::BadLength);
    }
    {
        FrameDecoder dec;
        CHECK(feed_all(dec, {EXCHANGE_VERSION, 0x01, 0x00, 0x00, 0x01}, out) == FrameStatus::BadLength);
    }
    {
        FrameDecoder dec;
        CHECK(feed_all(dec, {EXCHANGE_VERSION, 0x01, 0x00, 0x00, 0x00}, out) == FrameStatus::NeedMore);
        CHECK(dec.remaining() == MAX_FRAME_PAYLOAD);
    }
}
