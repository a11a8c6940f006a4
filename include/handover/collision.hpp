#pragma once
/**
 * @file collision.hpp
 * @brief Collision resolution: pick server/client between two symmetric peers.
 *
 * Each peer publishes a random 2-byte nonce in the "cr" record of its handover
 * request. On receipt, the local nonce is compared to the remote one, most
 * significant byte first, bytes compared as unsigned values:
 *
 *   local <  remote  → Server (keep listening, accept one connection)
 *   local >  remote  → Client (dial the address in the peer's candidate)
 *   local == remote  → Draw   (neither proceeds; both republish fresh nonces)
 *
 * For any two distinct nonces the two peers get opposite roles.
 */

#include <array>
#include <cstdint>

namespace handover {

using Nonce = std::array<uint8_t, 2>;

enum class Role : uint8_t { Server = 0, Client = 1, Draw = 2 };

const char* to_string(Role r);

/// Pure two-party election. See file header for the rule.
Role resolve_role(const Nonce& local, const Nonce& remote);

/// Fresh nonce from std::random_device.
Nonce random_nonce();

} // namespace handover
