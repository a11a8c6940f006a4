// -----------------------------------------------------------------------------
// ndef_message.cpp — NDEF record constants and binary codec
//
// API & field descriptions:
//   see include/handover/ndef_record.hpp, include/handover/ndef_message.hpp
// -----------------------------------------------------------------------------
#include "handover/ndef_message.hpp"

namespace handover {

namespace rtd {
const Bytes HANDOVER_REQUEST     = {0x48, 0x72};  // "Hr"
const Bytes HANDOVER_SELECT      = {0x48, 0x73};  // "Hs"
const Bytes COLLISION_RESOLUTION = {0x63, 0x72};  // "cr"
const Bytes ALTERNATIVE_CARRIER  = {0x61, 0x63};  // "ac"
const Bytes URI                  = {0x55};        // "U"
const Bytes TEXT                 = {0x54};        // "T"
} // namespace rtd

// Header bits
static constexpr uint8_t FLAG_MB  = 0x80;
static constexpr uint8_t FLAG_ME  = 0x40;
static constexpr uint8_t FLAG_CF  = 0x20;
static constexpr uint8_t FLAG_SR  = 0x10;
static constexpr uint8_t FLAG_IL  = 0x08;
static constexpr uint8_t TNF_MASK = 0x07;

const char* to_string(Tnf tnf) {
  switch (tnf) {
    case Tnf::Empty:       return "empty";
    case Tnf::WellKnown:   return "well_known";
    case Tnf::MimeMedia:   return "mime_media";
    case Tnf::AbsoluteUri: return "absolute_uri";
    case Tnf::External:    return "external";
    case Tnf::Unknown:     return "unknown";
    case Tnf::Unchanged:   return "unchanged";
  }
  return "reserved";
}

const char* to_string(NdefStatus s) {
  switch (s) {
    case NdefStatus::Ok:                 return "ok";
    case NdefStatus::TooShort:           return "too_short";
    case NdefStatus::Truncated:          return "truncated";
    case NdefStatus::BadFlags:           return "bad_flags";
    case NdefStatus::ChunkedUnsupported: return "chunked_unsupported";
    case NdefStatus::EmptyMessage:       return "empty_message";
    case NdefStatus::BadEmptyRecord:     return "bad_empty_record";
    case NdefStatus::Overflow:           return "overflow";
  }
  return "unknown";
}

// ---------- encode ----------

NdefStatus NdefMessage::to_bytes(Bytes& out) const {
  if (records_.empty()) return NdefStatus::EmptyMessage;

  Bytes raw;
  for (size_t i = 0; i < records_.size(); ++i) {
    const NdefRecord& r = records_[i];
    const size_t plen = r.payload().size();
    if (r.type().size() > MAX_FIELD || r.id().size() > MAX_FIELD || plen > MAX_PAYLOAD)
      return NdefStatus::Overflow;

    const bool sr = plen < 256;
    const bool il = !r.id().empty();

    uint8_t hdr = static_cast<uint8_t>(static_cast<uint8_t>(r.tnf()) & TNF_MASK);
    if (i == 0)                   hdr |= FLAG_MB;
    if (i + 1 == records_.size()) hdr |= FLAG_ME;
    if (sr)                       hdr |= FLAG_SR;
    if (il)                       hdr |= FLAG_IL;

    raw.push_back(hdr);
    raw.push_back(static_cast<uint8_t>(r.type().size()));
    if (sr) {
      raw.push_back(static_cast<uint8_t>(plen));
    } else {
      raw.push_back(static_cast<uint8_t>((plen >> 24) & 0xFF));
      raw.push_back(static_cast<uint8_t>((plen >> 16) & 0xFF));
      raw.push_back(static_cast<uint8_t>((plen >> 8)  & 0xFF));
      raw.push_back(static_cast<uint8_t>( plen        & 0xFF));
    }
    if (il) raw.push_back(static_cast<uint8_t>(r.id().size()));

    raw.insert(raw.end(), r.type().begin(), r.type().end());
    raw.insert(raw.end(), r.id().begin(), r.id().end());
    raw.insert(raw.end(), r.payload().begin(), r.payload().end());
  }
  out = std::move(raw);
  return NdefStatus::Ok;
}

// ---------- decode ----------

NdefStatus NdefMessage::parse(const uint8_t* data, size_t len, NdefMessage& out) {
  if (!data || len == 0) return NdefStatus::TooShort;

  std::vector<NdefRecord> records;
  size_t pos = 0;
  bool   ended = false;

  while (pos < len) {
    if (ended) return NdefStatus::BadFlags;           // bytes after ME

    const uint8_t hdr = data[pos++];
    const bool first = records.empty();
    if (first != ((hdr & FLAG_MB) != 0)) return NdefStatus::BadFlags;
    if (hdr & FLAG_CF) return NdefStatus::ChunkedUnsupported;

    const Tnf tnf = static_cast<Tnf>(hdr & TNF_MASK);
    if (tnf == Tnf::Unchanged) return NdefStatus::ChunkedUnsupported;

    if (pos >= len) return NdefStatus::Truncated;
    const size_t type_len = data[pos++];

    size_t payload_len = 0;
    if (hdr & FLAG_SR) {
      if (pos >= len) return NdefStatus::Truncated;
      payload_len = data[pos++];
    } else {
      if (len - pos < 4) return NdefStatus::Truncated;
      payload_len = (static_cast<size_t>(data[pos])     << 24) |
                    (static_cast<size_t>(data[pos + 1]) << 16) |
                    (static_cast<size_t>(data[pos + 2]) << 8)  |
                     static_cast<size_t>(data[pos + 3]);
      pos += 4;
      if (payload_len > MAX_PAYLOAD) return NdefStatus::Overflow;
    }

    size_t id_len = 0;
    if (hdr & FLAG_IL) {
      if (pos >= len) return NdefStatus::Truncated;
      id_len = data[pos++];
    }

    if (len - pos < type_len + id_len + payload_len) return NdefStatus::Truncated;

    Bytes type(data + pos, data + pos + type_len);  pos += type_len;
    Bytes id(data + pos, data + pos + id_len);      pos += id_len;
    Bytes payload(data + pos, data + pos + payload_len); pos += payload_len;

    if (tnf == Tnf::Empty && (!type.empty() || !id.empty() || !payload.empty()))
      return NdefStatus::BadEmptyRecord;

    records.emplace_back(tnf, std::move(type), std::move(id), std::move(payload));
    ended = (hdr & FLAG_ME) != 0;
  }

  if (records.empty()) return NdefStatus::EmptyMessage;
  if (!ended) return NdefStatus::Truncated;            // no record carried ME

  out = NdefMessage(std::move(records));
  return NdefStatus::Ok;
}

// ---------- sentinel ----------

NdefMessage NdefMessage::empty() {
  return NdefMessage(NdefRecord(Tnf::WellKnown, Bytes{}, Bytes{}, Bytes{}));
}

bool NdefMessage::is_empty() const {
  return *this == empty();
}

} // namespace handover
