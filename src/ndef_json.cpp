#include "handover/ndef_json.hpp"
#include "handover/uri.hpp"

#include <nlohmann/json.hpp>

namespace handover {
namespace json {

using Json = nlohmann::json;

namespace {

int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::optional<Tnf> tnf_from_string(const std::string& s) {
  for (uint8_t v = 0; v <= static_cast<uint8_t>(Tnf::Unchanged); ++v) {
    const Tnf t = static_cast<Tnf>(v);
    if (s == to_string(t)) return t;
  }
  return std::nullopt;
}

bool hex_field(const Json& rec, const char* key, Bytes& out) {
  out.clear();
  auto it = rec.find(key);
  if (it == rec.end()) return true;
  if (!it->is_string()) return false;
  return from_hex(it->get<std::string>(), out);
}

} // namespace

std::string to_hex(const Bytes& b) {
  static const char* HEX = "0123456789abcdef";
  std::string s;
  s.reserve(b.size() * 2);
  for (uint8_t v : b) {
    s += HEX[v >> 4];
    s += HEX[v & 0x0F];
  }
  return s;
}

bool from_hex(const std::string& text, Bytes& out) {
  out.clear();
  int hi = -1;
  for (char c : text) {
    if (c == ' ' || c == ':') continue;
    const int n = hex_nibble(c);
    if (n < 0) { out.clear(); return false; }
    if (hi < 0) { hi = n; continue; }
    out.push_back(static_cast<uint8_t>((hi << 4) | n));
    hi = -1;
  }
  if (hi >= 0) { out.clear(); return false; }
  return true;
}

std::string to_json(const NdefMessage& msg, int indent) {
  Json arr = Json::array();
  for (const auto& r : msg.records()) {
    Json j;
    j["tnf"]     = to_string(r.tnf());
    j["type"]    = to_hex(r.type());
    j["id"]      = to_hex(r.id());
    j["payload"] = to_hex(r.payload());
    if (auto uri = record_uri(r)) j["uri"] = *uri;
    arr.push_back(j);
  }
  Json root;
  root["records"] = arr;
  // invalid UTF-8 in a URI must not throw out of dump()
  return root.dump(indent, ' ', false, Json::error_handler_t::replace);
}

std::optional<NdefMessage> from_json(const std::string& text) {
  const Json root = Json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded() || !root.is_object()) return std::nullopt;
  auto recs = root.find("records");
  if (recs == root.end() || !recs->is_array() || recs->empty()) return std::nullopt;

  std::vector<NdefRecord> records;
  for (const auto& rec : *recs) {
    if (!rec.is_object()) return std::nullopt;
    auto tnf_it = rec.find("tnf");
    if (tnf_it == rec.end() || !tnf_it->is_string()) return std::nullopt;
    auto tnf = tnf_from_string(tnf_it->get<std::string>());
    if (!tnf) return std::nullopt;

    Bytes type, id, payload;
    if (!hex_field(rec, "type", type) || !hex_field(rec, "id", id) || !hex_field(rec, "payload", payload))
      return std::nullopt;
    if (type.size() > NdefMessage::MAX_FIELD || id.size() > NdefMessage::MAX_FIELD) return std::nullopt;
    records.emplace_back(*tnf, std::move(type), std::move(id), std::move(payload));
  }
  return NdefMessage(std::move(records));
}

} // namespace json
} // namespace handover
