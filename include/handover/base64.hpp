#pragma once

/**
 * @file base64.hpp
 * @brief URL-safe base64 (RFC 4648 §5) for the userspace handover envelope.
 *
 * @details
 * The userspace envelope carries a whole NDEF message inside a URI path:
 *
 *   ndef://wkt:hr/<base64url(message bytes)>
 *
 * Alphabet: A-Z a-z 0-9 '-' '_' (instead of '+' '/').
 *
 * Encoding always pads with '=' to a multiple of four characters.
 * Decoding is lenient in the ways senders actually differ:
 *   - padding is optional,
 *   - ASCII whitespace (line wraps inserted by some encoders) is skipped.
 * Anything else outside the alphabet, or a dangling single character in the
 * last quantum, is an error.
 */

#include <vector>
#include <string>
#include <cstdint>

namespace handover {
namespace base64 {

static constexpr char URL_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

inline std::string encode_url(const uint8_t* data, std::size_t len) {
  std::string out;
  out.reserve(((len + 2) / 3) * 4);
  std::size_t i = 0;
  for (; i + 3 <= len; i += 3) {
    const uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
    out += URL_ALPHABET[(v >> 18) & 0x3F];
    out += URL_ALPHABET[(v >> 12) & 0x3F];
    out += URL_ALPHABET[(v >> 6)  & 0x3F];
    out += URL_ALPHABET[ v        & 0x3F];
  }
  const std::size_t rem = len - i;
  if (rem == 1) {
    const uint32_t v = uint32_t(data[i]) << 16;
    out += URL_ALPHABET[(v >> 18) & 0x3F];
    out += URL_ALPHABET[(v >> 12) & 0x3F];
    out += "==";
  } else if (rem == 2) {
    const uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
    out += URL_ALPHABET[(v >> 18) & 0x3F];
    out += URL_ALPHABET[(v >> 12) & 0x3F];
    out += URL_ALPHABET[(v >> 6)  & 0x3F];
    out += '=';
  }
  return out;
}

inline std::string encode_url(const std::vector<uint8_t>& data) {
  return encode_url(data.data(), data.size());
}

/// Sextet value for a URL-safe character, -1 if not in the alphabet.
inline int decode_char(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '-') return 62;
  if (c == '_') return 63;
  return -1;
}

/**
 * @brief Decode URL-safe base64 text.
 * @return true and fills @p out on success; false (out cleared) on bad input.
 */
inline bool decode_url(const std::string& text, std::vector<uint8_t>& out) {
  out.clear();
  uint32_t acc = 0;
  int bits = 0;
  int quantum = 0;      // characters in the current 4-char group
  bool padding = false;

  for (char c : text) {
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
    if (c == '=') { padding = true; continue; }
    if (padding) { out.clear(); return false; }   // data after padding

    const int v = decode_char(c);
    if (v < 0) { out.clear(); return false; }

    acc = (acc << 6) | static_cast<uint32_t>(v);
    bits += 6;
    quantum = (quantum + 1) % 4;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
    }
  }
  if (quantum == 1) { out.clear(); return false; }  // 6 dangling bits can't form a byte
  return true;
}

} // namespace base64
} // namespace handover
