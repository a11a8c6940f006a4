// -----------------------------------------------------------------------------
// handover_detector.cpp — handover request detection and framing helpers
//
// API: include/handover/handover_detector.hpp
// -----------------------------------------------------------------------------
#include "handover/handover_detector.hpp"
#include "handover/base64.hpp"
#include "handover/uri.hpp"

namespace handover {

const char* const USERSPACE_HANDOVER_PREFIX = "ndef://wkt:hr/";

bool is_userspace_request(const NdefRecord& record) {
  auto text = record_uri(record);
  return text && text->rfind(USERSPACE_HANDOVER_PREFIX, 0) == 0;
}

std::optional<HandoverLocation> locate_handover_request(const NdefMessage& msg) {
  for (size_t i = 0; i < msg.size(); ++i) {
    if (msg[i].is_well_known(rtd::HANDOVER_REQUEST))
      return HandoverLocation{Framing::WellKnown, i};
  }
  for (size_t i = 0; i < msg.size(); ++i) {
    if (is_userspace_request(msg[i]))
      return HandoverLocation{Framing::Userspace, i};
  }
  return std::nullopt;
}

bool unwrap_userspace(const NdefRecord& record, NdefMessage& out) {
  auto uri = record_parsed_uri(record);
  if (!uri || uri->scheme() != "ndef") return false;

  // path is "/<base64>"
  const std::string& path = uri->path();
  if (path.size() < 2 || path[0] != '/') return false;

  Bytes raw;
  if (!base64::decode_url(path.substr(1), raw)) return false;
  return NdefMessage::parse(raw, out) == NdefStatus::Ok;
}

std::optional<std::string> to_userspace_uri(const NdefMessage& msg) {
  Bytes raw;
  if (msg.to_bytes(raw) != NdefStatus::Ok) return std::nullopt;
  return std::string(USERSPACE_HANDOVER_PREFIX) + base64::encode_url(raw);
}

std::optional<NdefMessage> make_userspace_request(const NdefMessage& msg) {
  auto uri = to_userspace_uri(msg);
  if (!uri) return std::nullopt;
  return NdefMessage(make_absolute_uri_record(*uri));
}

NdefMessage make_handover_request(const Nonce& nonce, const std::vector<std::string>& candidate_uris) {
  std::vector<NdefRecord> records;
  records.reserve(2 + candidate_uris.size());
  records.emplace_back(Tnf::WellKnown, rtd::HANDOVER_REQUEST, Bytes{}, Bytes{HANDOVER_REQUEST_VERSION});
  records.emplace_back(Tnf::WellKnown, rtd::COLLISION_RESOLUTION, Bytes{}, Bytes{nonce[0], nonce[1]});
  for (const auto& uri : candidate_uris)
    records.push_back(make_absolute_uri_record(uri));
  return NdefMessage(std::move(records));
}

std::optional<Nonce> find_collision_nonce(const NdefMessage& msg) {
  for (const auto& r : msg.records()) {
    if (!r.is_well_known(rtd::COLLISION_RESOLUTION)) continue;
    if (r.payload().size() != 2) return std::nullopt;
    return Nonce{r.payload()[0], r.payload()[1]};
  }
  return std::nullopt;
}

} // namespace handover
