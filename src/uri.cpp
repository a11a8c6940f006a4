// -----------------------------------------------------------------------------
// uri.cpp — URI splitting and NDEF URI record helpers
//
// API: include/handover/uri.hpp
// -----------------------------------------------------------------------------
#include "handover/uri.hpp"
#include "handover/ndef_message.hpp"

#include <cctype>
#include <cstring>

namespace handover {

// NFC Forum URI RTD, identifier codes 0x00..0x23.
static const char* const URI_PREFIXES[URI_PREFIX_COUNT] = {
  "",
  "http://www.",
  "https://www.",
  "http://",
  "https://",
  "tel:",
  "mailto:",
  "ftp://anonymous:anonymous@",
  "ftp://ftp.",
  "ftps://",
  "sftp://",
  "smb://",
  "nfs://",
  "ftp://",
  "dav://",
  "news:",
  "telnet://",
  "imap:",
  "rtsp://",
  "urn:",
  "pop:",
  "sip:",
  "sips:",
  "tftp:",
  "btspp://",
  "btl2cap://",
  "btgoep://",
  "tcpobex://",
  "irdaobex://",
  "file://",
  "urn:epc:id:",
  "urn:epc:tag:",
  "urn:epc:pat:",
  "urn:epc:raw:",
  "urn:epc:",
  "urn:nfc:",
};

const char* uri_prefix(uint8_t code) {
  return code < URI_PREFIX_COUNT ? URI_PREFIXES[code] : nullptr;
}

static bool is_scheme_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static std::string percent_decode(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hex_value(s[i + 1]), lo = hex_value(s[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    out += (s[i] == '+') ? ' ' : s[i];
  }
  return out;
}

// ---------- Uri ----------

std::optional<Uri> Uri::parse(const std::string& text) {
  const size_t colon = text.find(':');
  if (colon == std::string::npos || colon == 0) return std::nullopt;
  if (!std::isalpha(static_cast<unsigned char>(text[0]))) return std::nullopt;
  for (size_t i = 0; i < colon; ++i)
    if (!is_scheme_char(text[i])) return std::nullopt;

  Uri u;
  u.text_ = text;
  u.scheme_ = text.substr(0, colon);
  for (char& c : u.scheme_) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  std::string rest = text.substr(colon + 1);

  // fragment, then query, are peeled off the end first
  const size_t hash = rest.find('#');
  if (hash != std::string::npos) {
    u.fragment_ = rest.substr(hash + 1);
    rest.erase(hash);
  }
  const size_t q = rest.find('?');
  if (q != std::string::npos) {
    u.query_ = rest.substr(q + 1);
    rest.erase(q);
  }

  if (rest.compare(0, 2, "//") == 0) {
    u.has_authority_ = true;
    const size_t slash = rest.find('/', 2);
    if (slash == std::string::npos) {
      u.authority_ = rest.substr(2);
    } else {
      u.authority_ = rest.substr(2, slash - 2);
      u.path_ = rest.substr(slash);
    }
  } else {
    u.path_ = rest;
  }
  return u;
}

std::string Uri::host() const {
  std::string a = authority_;
  const size_t at = a.rfind('@');
  if (at != std::string::npos) a.erase(0, at + 1);

  if (!a.empty() && a[0] == '[') {
    const size_t close = a.find(']');
    return close == std::string::npos ? a.substr(1) : a.substr(1, close - 1);
  }
  // single colon → host:port ; several colons → bare address (e.g. Bluetooth MAC)
  const size_t first = a.find(':');
  if (first != std::string::npos && first == a.rfind(':')) return a.substr(0, first);
  return a;
}

std::optional<uint16_t> Uri::port() const {
  std::string a = authority_;
  const size_t at = a.rfind('@');
  if (at != std::string::npos) a.erase(0, at + 1);

  std::string digits;
  if (!a.empty() && a[0] == '[') {
    const size_t close = a.find(']');
    if (close == std::string::npos || close + 1 >= a.size() || a[close + 1] != ':')
      return std::nullopt;
    digits = a.substr(close + 2);
  } else {
    const size_t first = a.find(':');
    if (first == std::string::npos || first != a.rfind(':')) return std::nullopt;
    digits = a.substr(first + 1);
  }

  if (digits.empty() || digits.size() > 5) return std::nullopt;
  unsigned long v = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + static_cast<unsigned long>(c - '0');
  }
  if (v > 65535) return std::nullopt;
  return static_cast<uint16_t>(v);
}

std::optional<std::string> Uri::query_parameter(const std::string& name) const {
  size_t start = 0;
  while (start <= query_.size()) {
    size_t end = query_.find('&', start);
    if (end == std::string::npos) end = query_.size();
    const std::string pair = query_.substr(start, end - start);
    const size_t eq = pair.find('=');
    const std::string key = percent_decode(pair.substr(0, eq));
    if (key == name)
      return eq == std::string::npos ? std::string() : percent_decode(pair.substr(eq + 1));
    start = end + 1;
  }
  return std::nullopt;
}

// ---------- records ----------

std::optional<std::string> record_uri(const NdefRecord& record) {
  if (record.tnf() == Tnf::AbsoluteUri) {
    const Bytes& src = record.payload().empty() ? record.type() : record.payload();
    if (src.empty()) return std::nullopt;
    return std::string(src.begin(), src.end());
  }
  if (record.is_well_known(rtd::URI)) {
    const Bytes& p = record.payload();
    if (p.empty()) return std::nullopt;
    const char* prefix = uri_prefix(p[0]);
    if (!prefix) return std::nullopt;
    return std::string(prefix) + std::string(p.begin() + 1, p.end());
  }
  return std::nullopt;
}

std::optional<Uri> record_parsed_uri(const NdefRecord& record) {
  auto text = record_uri(record);
  if (!text) return std::nullopt;
  return Uri::parse(*text);
}

NdefRecord make_uri_record(const std::string& uri) {
  uint8_t code = 0;
  size_t  best = 0;
  for (uint8_t i = 1; i < URI_PREFIX_COUNT; ++i) {
    const size_t n = std::strlen(URI_PREFIXES[i]);
    if (n > best && uri.compare(0, n, URI_PREFIXES[i]) == 0) {
      best = n;
      code = i;
    }
  }
  Bytes payload;
  payload.reserve(uri.size() - best + 1);
  payload.push_back(code);
  payload.insert(payload.end(), uri.begin() + static_cast<std::ptrdiff_t>(best), uri.end());
  return NdefRecord(Tnf::WellKnown, rtd::URI, Bytes{}, std::move(payload));
}

NdefRecord make_absolute_uri_record(const std::string& uri) {
  return NdefRecord(Tnf::AbsoluteUri, Bytes{}, Bytes{}, to_bytes(uri));
}

} // namespace handover
