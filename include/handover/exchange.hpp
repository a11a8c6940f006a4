/**
 * @file exchange.hpp
 * @brief One NDEF exchange over an established duplex socket.
 *
 * @details
 * PURPOSE
 * -------
 * After a transport initiator has opened a socket to the peer, both sides swap
 * exactly one frame (see frame.hpp): each writes its outbound message (or an
 * empty frame) and reads the peer's. A non-empty inbound payload is handed to
 * the ExchangeContract, which normally re-dispatches it through the handler
 * chain as if it had been read from a tag.
 *
 * CONCURRENCY
 * -----------
 * run() starts the write direction on a second thread and runs the read
 * direction on the calling thread. The two directions share the socket and a
 * small state machine guarded by one mutex:
 *
 *   Running ──write done──▶ ReadPending  ──read done──▶ BothDone
 *      └────read done────▶ WritePending ──write done─▶ BothDone
 *
 * The socket is closed exactly once, by whichever direction makes the
 * transition into BothDone. run() returns after both directions finished.
 *
 * ERRORS
 * ------
 * Nothing throws out of a session. Per-direction results are kept in
 * read_status() / write_status(); a wrong version byte is ProtocolVersion.
 */

#ifndef HANDOVER_EXCHANGE_HPP
#define HANDOVER_EXCHANGE_HPP

#include "handover/ndef_message.hpp"
#include "handover/status.hpp"
#include "handover/transport/duplex_socket.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace handover {

/// What a session needs from its owner.
class ExchangeContract {
public:
  virtual ~ExchangeContract() = default;

  /// Called from the read direction with each non-empty inbound message.
  virtual void handle_inbound(const NdefMessage& msg) = 0;

  /// Message to send to the peer; nullopt sends a zero-length frame.
  virtual std::optional<NdefMessage> foreground_message() const = 0;
};

class ExchangeSession {
public:
  enum class State : uint8_t { Idle, Running, ReadPending, WritePending, BothDone };

  /// Outbound taken from contract.foreground_message(). Connects immediately.
  ExchangeSession(std::unique_ptr<transport::DuplexSocket> socket, ExchangeContract& contract);

  /// Explicit outbound. Connects immediately.
  ExchangeSession(std::unique_ptr<transport::DuplexSocket> socket, ExchangeContract& contract,
                  std::optional<NdefMessage> outbound);

  ~ExchangeSession();

  ExchangeSession(const ExchangeSession&) = delete;
  ExchangeSession& operator=(const ExchangeSession&) = delete;

  bool connected() const { return connect_status_ == TransportStatus::Ok; }
  TransportStatus connect_status() const { return connect_status_; }

  /// Blocks until both directions complete. No-op when not connected or already run.
  void run();

  TransportStatus read_status() const;
  TransportStatus write_status() const;
  State state() const;

  /// Last message delivered to the contract, if any.
  std::optional<NdefMessage> received() const;

private:
  enum Direction : uint8_t { Read, Write };

  void read_direction();
  void write_direction();
  void finish(Direction d, TransportStatus st);

  std::unique_ptr<transport::DuplexSocket> socket_;
  ExchangeContract& contract_;
  std::optional<NdefMessage> outbound_;
  TransportStatus connect_status_{TransportStatus::Closed};

  mutable std::mutex mtx_;
  State state_{State::Idle};
  TransportStatus read_status_{TransportStatus::Ok};
  TransportStatus write_status_{TransportStatus::Ok};
  std::optional<NdefMessage> received_;
};

/// Convenience: connect + run in one call. Returns the connect status.
TransportStatus run_exchange(std::unique_ptr<transport::DuplexSocket> socket,
                             ExchangeContract& contract,
                             const std::optional<NdefMessage>& outbound);

} // namespace handover

#endif // HANDOVER_EXCHANGE_HPP
