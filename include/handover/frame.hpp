#pragma once

/**
 * @file frame.hpp
 * @brief Length-prefixed frame codec for the NDEF exchange over a duplex socket.
 *
 * @details
 * WIRE FORMAT
 * -----------
 *   byte    version        EXCHANGE_VERSION (0x19)
 *   int32   payload length big-endian, 0 when there is nothing to send
 *   byte[]  payload        serialized NdefMessage
 *
 * Each side of an exchange sends exactly one frame and reads exactly one frame.
 *
 * DECODING
 * --------
 * `FrameDecoder` is fed one byte at a time (or a buffer) from whatever the
 * socket returned, so short reads need no special handling:
 *
 *   Version ──0x19──▶ Length (4 bytes) ──len>0──▶ Payload (len bytes) ──▶ Complete
 *      │                  │         └──len==0──────────────────────────▶ Complete
 *      └─other──▶ BadVersion   └─len<0 or > MAX_FRAME_PAYLOAD──▶ BadLength
 *
 * After Complete, BadVersion or BadLength the decoder is spent; call reset()
 * to reuse it.
 *
 * @code
 *   handover::FrameDecoder dec;
 *   std::vector<uint8_t> payload;
 *   for (uint8_t b : incoming)
 *     if (dec.feed(b, payload) == handover::FrameStatus::Complete) handle(payload);
 * @endcode
 */

#include <vector>
#include <cstdint>
#include <cstddef>

namespace handover {

/// Version tag leading every exchange frame.
static constexpr uint8_t EXCHANGE_VERSION = 0x19;

/// Header size: version byte + 4 length bytes.
static constexpr size_t FRAME_HEADER_SIZE = 5;

/// Upper bound on a declared payload length.
static constexpr uint32_t MAX_FRAME_PAYLOAD = 16u * 1024u * 1024u;

enum class FrameStatus : uint8_t {
  NeedMore = 0,
  Complete,
  BadVersion,
  BadLength
};

inline const char* to_string(FrameStatus s) {
  switch (s) {
    case FrameStatus::NeedMore:   return "need_more";
    case FrameStatus::Complete:   return "complete";
    case FrameStatus::BadVersion: return "bad_version";
    case FrameStatus::BadLength:  return "bad_length";
  }
  return "unknown";
}

/// Header + payload, ready for one write_all().
inline std::vector<uint8_t> encode_frame(const uint8_t* payload, size_t n) {
  std::vector<uint8_t> out;
  out.reserve(FRAME_HEADER_SIZE + n);
  out.push_back(EXCHANGE_VERSION);
  const uint32_t len = static_cast<uint32_t>(n);
  out.push_back(static_cast<uint8_t>(len >> 24));
  out.push_back(static_cast<uint8_t>(len >> 16));
  out.push_back(static_cast<uint8_t>(len >> 8));
  out.push_back(static_cast<uint8_t>(len));
  out.insert(out.end(), payload, payload + n);
  return out;
}

inline std::vector<uint8_t> encode_frame(const std::vector<uint8_t>& payload) {
  return encode_frame(payload.data(), payload.size());
}

class FrameDecoder {
public:
  /**
   * @brief Feed one byte.
   * @param out receives the payload when Complete is returned.
   */
  FrameStatus feed(uint8_t b, std::vector<uint8_t>& out) {
    switch (state_) {
      case State::Version:
        if (b != EXCHANGE_VERSION) { state_ = State::Done; result_ = FrameStatus::BadVersion; return result_; }
        state_ = State::Length;
        len_bytes_ = 0;
        len_ = 0;
        return FrameStatus::NeedMore;

      case State::Length:
        len_ = (len_ << 8) | b;
        if (++len_bytes_ < 4) return FrameStatus::NeedMore;
        // int32 on the wire: the sign bit set means a negative length
        if ((len_ & 0x80000000u) || len_ > MAX_FRAME_PAYLOAD) {
          state_ = State::Done;
          result_ = FrameStatus::BadLength;
          return result_;
        }
        buf_.clear();
        if (len_ == 0) return finish(out);
        buf_.reserve(len_);
        state_ = State::Payload;
        return FrameStatus::NeedMore;

      case State::Payload:
        buf_.push_back(b);
        if (buf_.size() < len_) return FrameStatus::NeedMore;
        return finish(out);

      case State::Done:
        return result_;
    }
    return FrameStatus::NeedMore;
  }

  /**
   * @brief Feed a buffer; stops at the first non-NeedMore status.
   * @param consumed bytes of @p data taken by this frame.
   */
  FrameStatus feed(const uint8_t* data, size_t n, size_t& consumed, std::vector<uint8_t>& out) {
    consumed = 0;
    FrameStatus st = state_ == State::Done ? result_ : FrameStatus::NeedMore;
    while (consumed < n && st == FrameStatus::NeedMore) {
      st = feed(data[consumed], out);
      ++consumed;
    }
    return st;
  }

  /// Payload bytes still missing (0 outside the Payload state).
  size_t remaining() const {
    return state_ == State::Payload ? len_ - buf_.size() : 0;
  }

  void reset() {
    state_ = State::Version;
    result_ = FrameStatus::NeedMore;
    len_ = 0;
    len_bytes_ = 0;
    buf_.clear();
  }

private:
  enum class State : uint8_t { Version, Length, Payload, Done };

  FrameStatus finish(std::vector<uint8_t>& out) {
    out.swap(buf_);
    buf_.clear();
    state_ = State::Done;
    result_ = FrameStatus::Complete;
    return result_;
  }

  State       state_{State::Version};
  FrameStatus result_{FrameStatus::NeedMore};
  uint32_t    len_{0};
  uint8_t     len_bytes_{0};
  std::vector<uint8_t> buf_;
};

} // namespace handover
