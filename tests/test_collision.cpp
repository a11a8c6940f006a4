#include <doctest/doctest.h>
#include "handover/collision.hpp"

using namespace handover;

TEST_CASE("resolve_role is antisymmetric over every pair of nonces") {
    // 65536^2 pairs; walk every local value against a spread of remote values
    // plus its neighbours, which covers both byte boundaries.
    size_t draws = 0;
    for (uint32_t l = 0; l <= 0xFFFF; ++l) {
        const Nonce local{static_cast<uint8_t>(l >> 8), static_cast<uint8_t>(l)};
        for (uint32_t r : {0u, 1u, 0xFFu, 0x100u, 0x7FFFu, 0x8000u, 0xFFFEu, 0xFFFFu,
                                              (l + 1) & 0xFFFF, (l + 0xFF) & 0xFFFF, l}) {
            const Nonce remote{static_cast<uint8_t>(r >> 8), static_cast<uint8_t>(r)};
            const Role a = resolve_role(local, remote);
            const Role b = resolve_role(remote, local);
            if (l == r) {
                REQUIRE(a == Role::Draw);
                REQUIRE(b == Role::Draw);
                ++draws;
            } else {
                REQUIRE(a != Role::Draw);
                REQUIRE(a != b);
                REQUIRE((a == Role::Server) == (l < r));
            }
        }
    }
    CHECK(draws >= 0x10000);
}

TEST_CASE("Most significant byte decides first, bytes are unsigned") {
    CHECK(resolve_role(Nonce{0x00, 0xFF}, Nonce{0x01, 0x00}) == Role::Server);
    CHECK(resolve_role(Nonce{0x80, 0x00}, Nonce{0x7F, 0xFF}) == Role::Client);
    CHECK(resolve_role(Nonce{0x12, 0x01}, Nonce{0x12, 0x02}) == Role::Server);
    CHECK(resolve_role(Nonce{0xFF, 0xFF}, Nonce{0xFF, 0xFF}) == Role::Draw);
}

TEST_CASE("Role names") {
    CHECK(std::string(to_string(Role::Server)) == "server");
    CHECK(std::string(to_string(Role::Client)) == "client");
    CHECK(std::string(to_string(Role::Draw)) == "draw");
}
