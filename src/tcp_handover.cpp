// -----------------------------------------------------------------------------
// tcp_handover.cpp — ndef+tcp initiator
//
// API: include/handover/tcp_handover.hpp
// -----------------------------------------------------------------------------
#include "handover/tcp_handover.hpp"
#include "handover/log.hpp"

namespace handover {

TcpHandover::TcpHandover(ExchangeContract& contract, uint16_t default_port, SocketFactory factory)
: SchemeHandover(SCHEME), contract_(contract), default_port_(default_port), factory_(std::move(factory)) {
  if (!factory_) {
    factory_ = [](const std::string& host, uint16_t port) -> std::unique_ptr<transport::DuplexSocket> {
      return std::make_unique<transport::TcpDuplexSocket>(host, port);
    };
  }
}

TransportStatus TcpHandover::attempt(const NdefMessage& request,
                                     size_t candidate,
                                     const std::optional<NdefMessage>& outbound) {
  auto uri = candidate_uri(request, candidate);
  if (!uri) return TransportStatus::NotSupported;

  const std::string host = uri->host();
  if (host.empty()) return TransportStatus::BadAddress;
  const uint16_t port = uri->port().value_or(default_port_);
  if (port == 0) return TransportStatus::BadAddress;

  auto socket = factory_(host, port);
  if (!socket) return TransportStatus::BadAddress;

  log().debug("ndef+tcp: connecting to {}:{}", host, port);
  ExchangeSession session(std::move(socket), contract_, outbound);
  if (!session.connected()) return session.connect_status();

  log().info("ndef+tcp: connected to {}:{}", host, port);
  session.run();
  if (is_failure(session.read_status()) || is_failure(session.write_status())) {
    log().warn("ndef+tcp: exchange with {}:{} incomplete (read={}, write={})",
               host, port, to_string(session.read_status()), to_string(session.write_status()));
  }
  return TransportStatus::Ok;
}

} // namespace handover
