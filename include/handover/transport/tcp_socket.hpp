#pragma once
/**
 * @file tcp_socket.hpp
 * @brief TCP transport: outbound DuplexSocket and a one-at-a-time listener.
 *
 * TcpDuplexSocket resolves with getaddrinfo() at connect() time and tries each
 * returned address in order. TcpListener binds at construction; port 0 asks the
 * kernel for an ephemeral port, which port() then reports.
 */

#include "handover/transport/fd_socket.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace handover::transport {

/// Default TCP port for the ndef+tcp scheme.
static constexpr uint16_t DEFAULT_TCP_PORT = 7924;

class TcpDuplexSocket : public FdDuplexSocket {
public:
  TcpDuplexSocket(std::string host, uint16_t port);

  TransportStatus connect() override;

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

private:
  std::string host_;
  uint16_t port_;
};

class TcpListener : public SocketListener {
public:
  TcpListener(const std::string& host, uint16_t port);
  ~TcpListener() override;

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  /// False if bind/listen failed at construction.
  bool ok() const { return fd_ >= 0; }
  uint16_t port() const { return port_; }

  std::unique_ptr<DuplexSocket> accept() override;
  void close() override;
  std::string name() const override;

private:
  int fd_{-1};
  std::string host_;
  uint16_t port_{0};
  bool closed_{false};
  std::mutex mtx_;
};

} // namespace handover::transport
