/**
 * @file ndef_message.hpp
 * @brief NdefMessage — ordered, non-empty list of NdefRecords plus the NDEF binary codec.
 *
 * Record order is meaningful to the handover layer:
 *   - index 0: handover request framing ("Hr"),
 *   - index 1: collision resolution nonce ("cr"),
 *   - index 2..: candidate records, one alternative transport each.
 *
 * ### Wire format (NFC Forum NDEF 1.0)
 * Each record starts with a header byte:
 *
 * | Bit  | Name | Meaning                                          |
 * |------|------|--------------------------------------------------|
 * | 7    | MB   | message begin (first record only)                |
 * | 6    | ME   | message end (last record only)                   |
 * | 5    | CF   | chunk flag (rejected: chunking unsupported)      |
 * | 4    | SR   | short record: payload length is 1 byte, else 4   |
 * | 3    | IL   | id length byte present                           |
 * | 2..0 | TNF  | type name format                                 |
 *
 * followed by: type length (1), payload length (1 or 4, big endian),
 * [id length (1)], type, [id], payload.
 *
 * ### Validity
 * - `parse()` returns a detailed NdefStatus; `out` is only written on Ok.
 * - `to_bytes()` refuses what the wire cannot carry (type or id over 255
 *   bytes) instead of truncating the length byte.
 * - A default-constructed message has no records and is not valid.
 */

#ifndef HANDOVER_NDEF_MESSAGE_HPP
#define HANDOVER_NDEF_MESSAGE_HPP

#include "handover/ndef_record.hpp"
#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace handover {

/// Result codes for decoding an NDEF message.
enum class NdefStatus : uint8_t {
  Ok = 0,
  TooShort,            // not even a header byte
  Truncated,           // a declared length runs past the input
  BadFlags,            // MB/ME misplaced, or trailing bytes after ME
  ChunkedUnsupported,  // CF set or TNF Unchanged
  EmptyMessage,        // zero records
  BadEmptyRecord,      // TNF Empty with non-empty type/id/payload
  Overflow,            // field longer than the wire format can express
};

const char* to_string(NdefStatus s);

class NdefMessage {
public:
  /// Largest payload accepted from the wire (matches the exchange frame limit).
  static constexpr size_t MAX_PAYLOAD = 16u * 1024u * 1024u;
  /// Type and id lengths are one byte on the wire.
  static constexpr size_t MAX_FIELD = 255;

  NdefMessage() = default;
  explicit NdefMessage(std::vector<NdefRecord> records) : records_(std::move(records)) {}
  explicit NdefMessage(NdefRecord record) { records_.push_back(std::move(record)); }

  bool is_valid() const { return !records_.empty(); }

  size_t size() const { return records_.size(); }
  const NdefRecord& at(size_t i) const { return records_.at(i); }
  const NdefRecord& operator[](size_t i) const { return records_[i]; }
  const std::vector<NdefRecord>& records() const { return records_; }

  /**
   * @brief Serialize to NDEF bytes (SR used whenever the payload fits in one byte).
   * @param out  Receives the bytes on NdefStatus::Ok; untouched otherwise.
   * @return Overflow when a type or id is longer than MAX_FIELD or a payload
   *         longer than MAX_PAYLOAD; EmptyMessage for a message with no records.
   */
  NdefStatus to_bytes(Bytes& out) const;

  /**
   * @brief Decode NDEF bytes.
   * @param data  Raw bytes, exactly one message (no trailing data).
   * @param len   Byte count.
   * @param out   Receives the message on NdefStatus::Ok; untouched otherwise.
   */
  static NdefStatus parse(const uint8_t* data, size_t len, NdefMessage& out);
  static NdefStatus parse(const Bytes& data, NdefMessage& out) {
    return parse(data.data(), data.size(), out);
  }

  /// The sentinel "empty" message: one WellKnown record, zero-length type/id/payload.
  static NdefMessage empty();

  /// True if this equals empty().
  bool is_empty() const;

  bool operator==(const NdefMessage& o) const { return records_ == o.records_; }
  bool operator!=(const NdefMessage& o) const { return !(*this == o); }

private:
  std::vector<NdefRecord> records_{};
};

} // namespace handover

#endif // HANDOVER_NDEF_MESSAGE_HPP
