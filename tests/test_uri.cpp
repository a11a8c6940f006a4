#include <doctest/doctest.h>
#include "handover/uri.hpp"
#include "handover/uuid.hpp"

using namespace handover;

TEST_CASE("Uri splits scheme, authority, path, query") {
    auto u = Uri::parse("BTSocket://00:11:22:AA:BB:CC/0f14d0ab-9605-4a62-a9e4-5ed26688389b?channel=5&x=a%20b");
    REQUIRE(u.has_value());
    CHECK(u->scheme() == "btsocket");
    CHECK(u->has_authority());
    CHECK(u->authority() == "00:11:22:AA:BB:CC");
    CHECK(u->host() == "00:11:22:AA:BB:CC");
    CHECK_FALSE(u->port().has_value());
    CHECK(u->path() == "/0f14d0ab-9605-4a62-a9e4-5ed26688389b");
    CHECK(u->query_parameter("channel") == std::optional<std::string>("5"));
    CHECK(u->query_parameter("x") == std::optional<std::string>("a b"));
    CHECK_FALSE(u->query_parameter("y").has_value());
}

TEST_CASE("Uri host and port") {
    auto a = Uri::parse("ndef+tcp://10.0.0.5:7924");
    REQUIRE(a);
    CHECK(a->host() == "10.0.0.5");
    CHECK(a->port() == std::optional<uint16_t>(7924));

    auto b = Uri::parse("ndef+tcp://example.org");
    REQUIRE(b);
    CHECK(b->host() == "example.org");
    CHECK_FALSE(b->port().has_value());

    auto c = Uri::parse("ndef+tcp://[::1]:80/");
    REQUIRE(c);
    CHECK(c->host() == "::1");
    CHECK(c->port() == std::optional<uint16_t>(80));

    auto d = Uri::parse("ndef+tcp://h:99999");
    REQUIRE(d);
    CHECK_FALSE(d->port().has_value());
}

TEST_CASE("Uri rejects text without a valid scheme") {
    CHECK_FALSE(Uri::parse("no-colon-here").has_value());
    CHECK_FALSE(Uri::parse(":missing").has_value());
    CHECK_FALSE(Uri::parse("1abc://x").has_value());
    CHECK_FALSE(Uri::parse("a b://x").has_value());
}

TEST_CASE("URI records: well-known prefix table and absolute form") {
    CHECK(std::string(uri_prefix(0x03)) == "http://");
    CHECK(std::string(uri_prefix(0x23)) == "urn:nfc:");
    CHECK(uri_prefix(0x24) == nullptr);

    NdefRecord compact = make_uri_record("https://www.example.com/a");
    REQUIRE_FALSE(compact.payload().empty());
    CHECK(compact.payload()[0] == 0x02);      // longest prefix wins over "https://"
    CHECK(record_uri(compact) == std::optional<std::string>("https://www.example.com/a"));

    NdefRecord bad(Tnf::WellKnown, rtd::URI, Bytes{}, Bytes{0x30, 'x'});
    CHECK_FALSE(record_uri(bad).has_value());

    NdefRecord abs = make_absolute_uri_record("ndef+tcp://h:1");
    CHECK(abs.tnf() == Tnf::AbsoluteUri);
    CHECK(record_uri(abs) == std::optional<std::string>("ndef+tcp://h:1"));

    // URI in the type field when the payload is empty
    NdefRecord in_type(Tnf::AbsoluteUri, to_bytes("ndef+tcp://t"), Bytes{}, Bytes{});
    CHECK(record_uri(in_type) == std::optional<std::string>("ndef+tcp://t"));

    NdefRecord mime(Tnf::MimeMedia, to_bytes("text/plain"), Bytes{}, to_bytes("ndef+tcp://x"));
    CHECK_FALSE(record_uri(mime).has_value());
}

TEST_CASE("Uuid parse/format") {
    auto u = Uuid::parse("0F14D0AB-9605-4A62-A9E4-5ED26688389B");
    REQUIRE(u);
    CHECK(u->to_string() == "0f14d0ab-9605-4a62-a9e4-5ed26688389b");
    CHECK(u->bytes()[0] == 0x0F);
    CHECK(u->bytes()[15] == 0x9B);

    CHECK_FALSE(Uuid::parse("0f14d0ab96054a62a9e45ed26688389b").has_value());
    CHECK_FALSE(Uuid::parse("0f14d0ab-9605-4a62-a9e4-5ed26688389g").has_value());
    CHECK_FALSE(Uuid::parse("0f14d0ab-9605-4a62-a9e45-ed26688389b").has_value());
}

TEST_CASE("Uuid::random is version 4") {
    Uuid a = Uuid::random();
    Uuid b = Uuid::random();
    CHECK((a.bytes()[6] & 0xF0) == 0x40);
    CHECK((a.bytes()[8] & 0xC0) == 0x80);
    CHECK(a != b);
    CHECK(Uuid::parse(a.to_string()) == std::optional<Uuid>(a));
}
