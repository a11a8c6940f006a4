/**
 * @file handover_detector.hpp
 * @brief Locate handover requests in a message; build and unwrap request framings.
 *
 * @details
 * Two framings announce a handover request:
 *
 * WELL-KNOWN
 * ----------
 *   [0] WellKnown "Hr"   payload: version byte (0x12 = 1.2)
 *   [1] WellKnown "cr"   payload: 2-byte collision nonce
 *   [2..] candidates     one transport address each (URI records)
 *
 * USERSPACE
 * ---------
 * A single AbsoluteUri record whose text starts with `ndef://wkt:hr/`. The rest
 * of the path is base64url of a serialized NdefMessage. After unwrapping, the
 * embedded message is walked positionally with candidates starting at index 0.
 *
 * `locate_handover_request` checks the well-known form first; only when no
 * record matches does it look for the userspace form.
 */

#ifndef HANDOVER_HANDOVER_DETECTOR_HPP
#define HANDOVER_HANDOVER_DETECTOR_HPP

#include "handover/ndef_message.hpp"
#include "handover/collision.hpp"
#include <stddef.h>
#include <optional>
#include <string>
#include <vector>

namespace handover {

/// Reserved URI prefix of the userspace envelope.
extern const char* const USERSPACE_HANDOVER_PREFIX;   // "ndef://wkt:hr/"

/// Version byte written into the "Hr" record payload.
static constexpr uint8_t HANDOVER_REQUEST_VERSION = 0x12;

enum class Framing : uint8_t { WellKnown = 0, Userspace = 1 };

struct HandoverLocation {
  Framing framing{Framing::WellKnown};
  size_t  index{0};   ///< index of the "Hr" record, or of the envelope record
};

/**
 * @brief Find the handover request framing in @p msg.
 * @return nullopt when the message is an ordinary (non-handover) message.
 */
std::optional<HandoverLocation> locate_handover_request(const NdefMessage& msg);

/// True if @p record is an AbsoluteUri/"U" record whose text starts with the userspace prefix.
bool is_userspace_request(const NdefRecord& record);

/**
 * @brief Decode the message embedded in a userspace envelope record.
 * @return false on a non-envelope record, bad base64, or an unparsable message.
 */
bool unwrap_userspace(const NdefRecord& record, NdefMessage& out);

/// "ndef://wkt:hr/" + base64url(msg bytes); nullopt when @p msg cannot be encoded.
std::optional<std::string> to_userspace_uri(const NdefMessage& msg);

/// One-record message carrying to_userspace_uri(msg) in an AbsoluteUri record.
std::optional<NdefMessage> make_userspace_request(const NdefMessage& msg);

/// Well-known framing: Hr, cr(nonce), then one AbsoluteUri record per candidate.
NdefMessage make_handover_request(const Nonce& nonce, const std::vector<std::string>& candidate_uris);

/// Nonce from the first "cr" record; nullopt when absent or not exactly 2 bytes.
std::optional<Nonce> find_collision_nonce(const NdefMessage& msg);

} // namespace handover

#endif // HANDOVER_HANDOVER_DETECTOR_HPP
