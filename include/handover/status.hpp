#pragma once
/**
 * @file status.hpp
 * @brief Result codes shared by sockets, initiators and the handler chain.
 *
 * Kept as plain scoped enums: nothing in the library throws across its API.
 */

#include <cstdint>

namespace handover {

enum class TransportStatus : uint8_t {
  Ok = 0,
  CollisionDraw,     ///< equal nonces; caller republishes with a fresh nonce
  NotSupported,      ///< record does not name this transport
  BadAddress,        ///< URI parsed but host/address/uuid unusable
  BadRequest,        ///< handover request lacks a required record
  ConnectFailed,
  IoError,
  ProtocolVersion,   ///< exchange frame carried the wrong version byte
  Closed             ///< peer closed (EOF) or socket closed locally
};

enum class HandlerResult : uint8_t { Propagate = 0, Consume = 1 };

inline const char* to_string(TransportStatus s) {
  switch (s) {
    case TransportStatus::Ok:              return "ok";
    case TransportStatus::CollisionDraw:   return "collision_draw";
    case TransportStatus::NotSupported:    return "not_supported";
    case TransportStatus::BadAddress:      return "bad_address";
    case TransportStatus::BadRequest:      return "bad_request";
    case TransportStatus::ConnectFailed:   return "connect_failed";
    case TransportStatus::IoError:         return "io_error";
    case TransportStatus::ProtocolVersion: return "protocol_version";
    case TransportStatus::Closed:          return "closed";
  }
  return "unknown";
}

inline const char* to_string(HandlerResult r) {
  return r == HandlerResult::Consume ? "consumed" : "propagated";
}

/// A draw is a no-op outcome, not a failure.
inline bool is_failure(TransportStatus s) {
  return s != TransportStatus::Ok && s != TransportStatus::CollisionDraw;
}

} // namespace handover
