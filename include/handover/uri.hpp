/**
 * @file uri.hpp
 * @brief Minimal URI model for candidate addressing, plus NDEF URI record helpers.
 *
 * @details
 * Candidate records advertise a transport as text:
 *
 *   ndef+tcp://<host>[:<port>]
 *   ndef+bluetooth://<peer-address>/<service-uuid>
 *   btsocket://<peer-address>/<service-uuid>[?channel=<n>]
 *   ndef://wkt:hr/<base64url(message)>          (userspace envelope)
 *
 * `Uri::parse` splits `scheme ":" ["//" authority] path ["?" query] ["#" fragment]`
 * and nothing more: no normalisation, no percent-decoding of the path.
 *
 * Bluetooth addresses contain colons, so `port()` only reports a port when the
 * authority has a single colon (or a bracketed IPv6 host). `authority()` is the
 * raw text and is what the Bluetooth code uses.
 *
 * ### NDEF URI records
 * Two record shapes carry a URI:
 *   - WellKnown "U": payload[0] is an index into the NFC Forum prefix table,
 *     the rest is the URI suffix ("\x03" + "example.com" = "http://example.com").
 *   - AbsoluteUri: the URI text itself. This library writes it to the payload;
 *     when the payload is empty the type field is read instead.
 */

#ifndef HANDOVER_URI_HPP
#define HANDOVER_URI_HPP

#include "handover/ndef_record.hpp"
#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <string>

namespace handover {

class Uri {
public:
  /// Parse absolute URI text. Returns nullopt when there is no valid scheme.
  static std::optional<Uri> parse(const std::string& text);

  const std::string& scheme()    const { return scheme_; }     ///< lower-case
  const std::string& authority() const { return authority_; }  ///< raw, may be empty
  const std::string& path()      const { return path_; }
  const std::string& query()     const { return query_; }
  const std::string& fragment()  const { return fragment_; }
  bool has_authority() const { return has_authority_; }

  /// Host part of the authority (userinfo dropped, IPv6 brackets stripped).
  std::string host() const;

  /// Port from "host:port" / "[v6]:port"; nullopt when absent or out of range.
  std::optional<uint16_t> port() const;

  /// Value of `name` in the query string (percent-decoded), or nullopt.
  std::optional<std::string> query_parameter(const std::string& name) const;

  /// Original text as parsed.
  const std::string& to_string() const { return text_; }

private:
  std::string text_;
  std::string scheme_;
  std::string authority_;
  std::string path_;
  std::string query_;
  std::string fragment_;
  bool has_authority_{false};
};

/// Number of entries in the NFC Forum URI identifier code table (0x00..0x23).
static constexpr size_t URI_PREFIX_COUNT = 36;

/// Prefix for identifier code `code`, or nullptr if out of range.
const char* uri_prefix(uint8_t code);

/**
 * @brief URI text carried by a record, if it is a URI record.
 *
 * - WellKnown "U" → prefix table lookup + suffix. An unknown code or an empty
 *   payload is a decode error → nullopt.
 * - AbsoluteUri → payload text, or type text when the payload is empty.
 * - anything else → nullopt.
 */
std::optional<std::string> record_uri(const NdefRecord& record);

/// Same as record_uri() followed by Uri::parse().
std::optional<Uri> record_parsed_uri(const NdefRecord& record);

/// Compact WellKnown "U" record, using the longest matching table prefix.
NdefRecord make_uri_record(const std::string& uri);

/// AbsoluteUri record with the URI text in the payload.
NdefRecord make_absolute_uri_record(const std::string& uri);

} // namespace handover

#endif // HANDOVER_URI_HPP
