#pragma once
/**
 * @file rfcomm_socket.hpp
 * @brief Bluetooth RFCOMM transport (BlueZ, Linux).
 *
 * A peer is named by its adapter address ("00:11:22:AA:BB:CC") and either a
 * 128-bit service UUID or an RFCOMM channel number. With a UUID, connect()
 * first asks the peer's SDP server which channel the service listens on; with a
 * channel, SDP is skipped.
 *
 * RfcommListener binds the local adapter on a kernel-assigned channel and
 * reports it, so the channel can be advertised directly
 * (`btsocket://<addr>/<uuid>?channel=<n>`) without an SDP registration.
 */

#include "handover/transport/fd_socket.hpp"
#include "handover/uuid.hpp"

#include "etl/string.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace handover::transport {

/// "XX:XX:XX:XX:XX:XX"
using BtAddrStr = etl::string<17>;

/// Validate and upper-case a colon-separated adapter address.
std::optional<BtAddrStr> parse_bluetooth_address(const std::string& text);

/// Address of the default local adapter, nullopt when there is none.
std::optional<BtAddrStr> local_bluetooth_address();

/// SDP search on @p peer for @p service; returns its RFCOMM channel.
std::optional<uint8_t> sdp_lookup_channel(const BtAddrStr& peer, const Uuid& service);

class RfcommDuplexSocket : public FdDuplexSocket {
public:
  RfcommDuplexSocket(const BtAddrStr& peer, const Uuid& service);
  RfcommDuplexSocket(const BtAddrStr& peer, uint8_t channel);

  TransportStatus connect() override;

private:
  BtAddrStr peer_;
  Uuid service_;
  uint8_t channel_{0};    ///< 0 = resolve via SDP
};

class RfcommListener : public SocketListener {
public:
  RfcommListener();
  ~RfcommListener() override;

  RfcommListener(const RfcommListener&) = delete;
  RfcommListener& operator=(const RfcommListener&) = delete;

  bool ok() const { return fd_ >= 0; }
  uint8_t channel() const { return channel_; }

  std::unique_ptr<DuplexSocket> accept() override;
  void close() override;
  std::string name() const override;

private:
  int fd_{-1};
  uint8_t channel_{0};
  bool closed_{false};
  std::mutex mtx_;
};

} // namespace handover::transport
