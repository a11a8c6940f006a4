/**
 * @page ho-ndef-record Handover NDEF Record
 * @file ndef_record.hpp
 * @brief NdefRecord — one immutable typed chunk of an NDEF message.
 *
 * @details
 * A record carries four semantic fields:
 *
 * | Field   | Meaning                                                       |
 * |---------|---------------------------------------------------------------|
 * | tnf     | Type Name Format: how to interpret `type` (3 bits on the wire)|
 * | type    | Type identifier, e.g. "Hr" for a well-known handover request  |
 * | id      | Optional record identifier (often empty)                      |
 * | payload | Opaque bytes; meaning depends on tnf + type                   |
 *
 * Records are value types. Once built they are never mutated; every accessor
 * is const. Copying is cheap enough for the message sizes exchanged over a
 * proximity radio (a few hundred bytes).
 *
 * WELL-KNOWN TYPES
 * ----------------
 * The NFC Forum reserves short type names under TNF WellKnown. The ones this
 * library matches on are exposed in the `rtd` namespace below:
 *   - `Hr` handover request, `Hs` handover select,
 *   - `cr` collision resolution (2-byte random nonce),
 *   - `ac` alternative carrier,
 *   - `U`  URI record (first payload byte selects a scheme prefix),
 *   - `T`  text record.
 */

#ifndef HANDOVER_NDEF_RECORD_HPP
#define HANDOVER_NDEF_RECORD_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace handover {

using Bytes = std::vector<uint8_t>;

/// Type Name Format, the low 3 bits of an NDEF record header.
enum class Tnf : uint8_t {
  Empty       = 0x00,
  WellKnown   = 0x01,
  MimeMedia   = 0x02,
  AbsoluteUri = 0x03,
  External    = 0x04,
  Unknown     = 0x05,
  Unchanged   = 0x06,  ///< only valid inside chunked records (unsupported)
};

/// Short snake_case token for logs / JSON ("well_known", "absolute_uri", ...).
const char* to_string(Tnf tnf);

namespace rtd {
// Record Type Definitions (type field of TNF WellKnown records).
extern const Bytes HANDOVER_REQUEST;      ///< "Hr"
extern const Bytes HANDOVER_SELECT;       ///< "Hs"
extern const Bytes COLLISION_RESOLUTION;  ///< "cr"
extern const Bytes ALTERNATIVE_CARRIER;   ///< "ac"
extern const Bytes URI;                   ///< "U"
extern const Bytes TEXT;                  ///< "T"
} // namespace rtd

class NdefRecord {
public:
  /// Default: an Empty-TNF record with no type, id or payload.
  NdefRecord() = default;

  NdefRecord(Tnf tnf, Bytes type, Bytes id, Bytes payload)
  : tnf_(tnf), type_(std::move(type)), id_(std::move(id)), payload_(std::move(payload)) {}

  Tnf          tnf()     const { return tnf_; }
  const Bytes& type()    const { return type_; }
  const Bytes& id()      const { return id_; }
  const Bytes& payload() const { return payload_; }

  /// True when tnf is WellKnown and type equals `rtd` byte-for-byte.
  bool is_well_known(const Bytes& rtd_type) const {
    return tnf_ == Tnf::WellKnown && type_ == rtd_type;
  }

  /// Payload reinterpreted as text (no validation; NDEF text is UTF-8).
  std::string payload_text() const {
    return std::string(payload_.begin(), payload_.end());
  }

  bool operator==(const NdefRecord& o) const {
    return tnf_ == o.tnf_ && type_ == o.type_ && id_ == o.id_ && payload_ == o.payload_;
  }
  bool operator!=(const NdefRecord& o) const { return !(*this == o); }

private:
  Tnf   tnf_{Tnf::Empty};
  Bytes type_{};
  Bytes id_{};
  Bytes payload_{};
};

/// Bytes from a string literal / std::string (no terminator).
inline Bytes to_bytes(const std::string& s) { return Bytes(s.begin(), s.end()); }

} // namespace handover

#endif // HANDOVER_NDEF_RECORD_HPP
