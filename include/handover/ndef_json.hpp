#pragma once

/**
 * @file ndef_json.hpp
 * @brief JSON view of NDEF messages (CLI output, fixtures), plus hex helpers.
 *
 * Shape:
 * @code
 *   {"records":[
 *     {"tnf":"well_known","type":"4872","id":"","payload":"12"},
 *     {"tnf":"absolute_uri","type":"","id":"","payload":"6e64...","uri":"ndef+tcp://10.0.0.5:7924"}
 *   ]}
 * @endcode
 * type/id/payload are lower-case hex. "uri" is written when the record decodes
 * as a URI and ignored on input.
 */

#include "handover/ndef_message.hpp"

#include <optional>
#include <string>

namespace handover {
namespace json {

/// Lower-case hex, no separators.
std::string to_hex(const Bytes& b);

/// Accepts upper/lower case and ignores spaces and ':' separators.
bool from_hex(const std::string& text, Bytes& out);

/// @param indent -1 for compact output, otherwise spaces per level.
std::string to_json(const NdefMessage& msg, int indent = -1);

/// nullopt on malformed JSON, an unknown tnf name, bad hex, a type or id over 255 bytes, or no records.
std::optional<NdefMessage> from_json(const std::string& text);

} // namespace json
} // namespace handover
