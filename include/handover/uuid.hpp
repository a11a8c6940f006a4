/**
 * @file uuid.hpp
 * @brief 128-bit service identifiers in canonical 8-4-4-4-12 hex form.
 *
 * Used to name the Bluetooth service a peer listens on
 * (`ndef+bluetooth://<addr>/<uuid>`, `btsocket://<addr>/<uuid>`).
 * Parsing is case-insensitive; formatting is lower-case.
 */

#ifndef HANDOVER_UUID_HPP
#define HANDOVER_UUID_HPP

#include <stdint.h>
#include <array>
#include <optional>
#include <string>

namespace handover {

class Uuid {
public:
  using Bytes16 = std::array<uint8_t, 16>;

  Uuid() : bytes_{} {}
  explicit Uuid(const Bytes16& b) : bytes_(b) {}

  static std::optional<Uuid> parse(const std::string& text);

  /// Version-4 (random) UUID.
  static Uuid random();

  std::string to_string() const;
  const Bytes16& bytes() const { return bytes_; }

  bool operator==(const Uuid& o) const { return bytes_ == o.bytes_; }
  bool operator!=(const Uuid& o) const { return bytes_ != o.bytes_; }

private:
  Bytes16 bytes_;
};

} // namespace handover

#endif // HANDOVER_UUID_HPP
