// -----------------------------------------------------------------------------
// bluetooth_handover.cpp — ndef+bluetooth initiator
//
// API: include/handover/bluetooth_handover.hpp
// -----------------------------------------------------------------------------
#include "handover/bluetooth_handover.hpp"
#include "handover/log.hpp"

namespace handover {

BluetoothHandover::BluetoothHandover(ExchangeContract& contract, SocketFactory factory)
: SchemeHandover(SCHEME), contract_(contract), factory_(std::move(factory)) {
  if (!factory_) {
    factory_ = [](const transport::BtAddrStr& peer, const Uuid& service)
        -> std::unique_ptr<transport::DuplexSocket> {
      return std::make_unique<transport::RfcommDuplexSocket>(peer, service);
    };
  }
}

TransportStatus BluetoothHandover::attempt(const NdefMessage& request,
                                           size_t candidate,
                                           const std::optional<NdefMessage>& outbound) {
  auto uri = candidate_uri(request, candidate);
  if (!uri) return TransportStatus::NotSupported;

  // authority = adapter address, path = "/<uuid>"
  auto peer = transport::parse_bluetooth_address(uri->authority());
  if (!peer) return TransportStatus::BadAddress;
  const std::string& path = uri->path();
  auto service = Uuid::parse(path.empty() ? path : path.substr(1));
  if (!service) return TransportStatus::BadAddress;

  auto socket = factory_(*peer, *service);
  if (!socket) return TransportStatus::BadAddress;

  log().debug("ndef+bluetooth: connecting to {} service {}", peer->c_str(), service->to_string());
  ExchangeSession session(std::move(socket), contract_, outbound);
  if (!session.connected()) return session.connect_status();

  log().info("ndef+bluetooth: connected to {}", peer->c_str());
  session.run();
  if (is_failure(session.read_status()) || is_failure(session.write_status())) {
    log().warn("ndef+bluetooth: exchange with {} incomplete (read={}, write={})",
               peer->c_str(), to_string(session.read_status()), to_string(session.write_status()));
  }
  return TransportStatus::Ok;
}

} // namespace handover
