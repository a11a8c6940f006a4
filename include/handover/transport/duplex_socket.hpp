#pragma once
/**
 * @file duplex_socket.hpp
 * @brief Transport-agnostic bidirectional byte stream used by the exchange engine.
 *
 * Contract:
 *  - connect() establishes the stream; blocking, no timeout.
 *  - read_some(buf,cap,n) blocks until at least one byte, EOF (Closed) or error.
 *  - write_all(buf,len) writes every byte or fails.
 *  - close() is idempotent and may be called from any thread; it unblocks a
 *    read/write pending on another thread, which then returns Closed or IoError.
 *  - name() is a short identifier for logs.
 *
 * SocketListener is the passive side: accept() blocks for one inbound stream
 * and returns nullptr once the listener is closed or fails.
 */

#include "handover/status.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace handover::transport {

class DuplexSocket {
public:
  virtual ~DuplexSocket() = default;
  virtual TransportStatus connect() = 0;
  virtual TransportStatus read_some(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual TransportStatus write_all(const uint8_t* data, std::size_t len) = 0;
  virtual void close() = 0;
  virtual std::string name() const = 0;
};

class SocketListener {
public:
  virtual ~SocketListener() = default;
  virtual std::unique_ptr<DuplexSocket> accept() = 0;
  virtual void close() = 0;
  virtual std::string name() const = 0;
};

} // namespace handover::transport
