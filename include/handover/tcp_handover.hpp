#pragma once
/**
 * @file tcp_handover.hpp
 * @brief Initiator for `ndef+tcp://<host>[:<port>]` candidates.
 *
 * Connects to the advertised host (default port 7924) and runs one exchange,
 * sending the caller's outbound message and delivering the reply to the
 * ExchangeContract.
 */

#include "handover/connection_handover.hpp"
#include "handover/exchange.hpp"
#include "handover/transport/duplex_socket.hpp"
#include "handover/transport/tcp_socket.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace handover {

class TcpHandover : public SchemeHandover {
public:
  static constexpr const char* SCHEME = "ndef+tcp";

  /// Builds an unconnected socket for host:port. Tests substitute their own.
  using SocketFactory =
      std::function<std::unique_ptr<transport::DuplexSocket>(const std::string& host, uint16_t port)>;

  explicit TcpHandover(ExchangeContract& contract,
                       uint16_t default_port = transport::DEFAULT_TCP_PORT,
                       SocketFactory factory = {});

  TransportStatus attempt(const NdefMessage& request,
                          size_t candidate,
                          const std::optional<NdefMessage>& outbound) override;

  uint16_t default_port() const { return default_port_; }

private:
  ExchangeContract& contract_;
  uint16_t default_port_;
  SocketFactory factory_;
};

} // namespace handover
