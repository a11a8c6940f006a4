#include "handover/uuid.hpp"

#include <random>

namespace handover {

namespace {

int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::optional<Uuid> Uuid::parse(const std::string& text) {
  // 36 chars, dashes at 8, 13, 18, 23
  if (text.size() != 36) return std::nullopt;
  Bytes16 b{};
  size_t bi = 0;
  for (size_t i = 0; i < text.size();) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (text[i] != '-') return std::nullopt;
      ++i;
      continue;
    }
    const int hi = hex_val(text[i]);
    const int lo = hex_val(text[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    b[bi++] = static_cast<uint8_t>((hi << 4) | lo);
    i += 2;
  }
  return Uuid(b);
}

Uuid Uuid::random() {
  std::random_device rd;
  Bytes16 b{};
  for (size_t i = 0; i < b.size(); i += 4) {
    const uint32_t v = rd();
    b[i]     = static_cast<uint8_t>(v);
    b[i + 1] = static_cast<uint8_t>(v >> 8);
    b[i + 2] = static_cast<uint8_t>(v >> 16);
    b[i + 3] = static_cast<uint8_t>(v >> 24);
  }
  b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
  b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant
  return Uuid(b);
}

std::string Uuid::to_string() const {
  static const char* HEX = "0123456789abcdef";
  std::string s;
  s.reserve(36);
  for (size_t i = 0; i < bytes_.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) s += '-';
    s += HEX[bytes_[i] >> 4];
    s += HEX[bytes_[i] & 0x0F];
  }
  return s;
}

} // namespace handover
