#include "handover/collision.hpp"

#include <random>

namespace handover {

const char* to_string(Role r) {
  switch (r) {
    case Role::Server: return "server";
    case Role::Client: return "client";
    case Role::Draw:   return "draw";
  }
  return "unknown";
}

Role resolve_role(const Nonce& local, const Nonce& remote) {
  const uint16_t l = static_cast<uint16_t>((local[0] << 8) | local[1]);
  const uint16_t r = static_cast<uint16_t>((remote[0] << 8) | remote[1]);
  if (l == r) return Role::Draw;
  return l < r ? Role::Server : Role::Client;
}

Nonce random_nonce() {
  std::random_device rd;
  const unsigned v = rd();
  return Nonce{static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>((v >> 8) & 0xFF)};
}

} // namespace handover
