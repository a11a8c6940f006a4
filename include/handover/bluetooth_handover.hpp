#pragma once
/**
 * @file bluetooth_handover.hpp
 * @brief Initiator for `ndef+bluetooth://<peer-address>/<service-uuid>` candidates.
 *
 * The peer is already listening on an RFCOMM service; the channel is found by
 * SDP lookup of the UUID, then one exchange runs over the RFCOMM stream.
 */

#include "handover/connection_handover.hpp"
#include "handover/exchange.hpp"
#include "handover/transport/rfcomm_socket.hpp"
#include "handover/uuid.hpp"

#include <functional>
#include <memory>

namespace handover {

class BluetoothHandover : public SchemeHandover {
public:
  static constexpr const char* SCHEME = "ndef+bluetooth";

  using SocketFactory = std::function<std::unique_ptr<transport::DuplexSocket>(
      const transport::BtAddrStr& peer, const Uuid& service)>;

  explicit BluetoothHandover(ExchangeContract& contract, SocketFactory factory = {});

  TransportStatus attempt(const NdefMessage& request,
                          size_t candidate,
                          const std::optional<NdefMessage>& outbound) override;

private:
  ExchangeContract& contract_;
  SocketFactory factory_;
};

} // namespace handover
