/**
 * @file symmetric_connector.hpp
 * @brief Symmetric pairing: two identical peers agree who listens and who dials.
 *
 * @details
 * PURPOSE
 * -------
 * When neither device is a natural server, each one:
 *   1. opens a listening socket and picks a random 2-byte nonce,
 *   2. publishes handover_request() = [Hr, cr(nonce), <scheme>://<own address>],
 *   3. on receiving the peer's request, calls attempt() (normally through the
 *      handover manager), which runs resolve_role() on the two nonces:
 *        Server → keep listening; the accept thread takes one connection.
 *        Client → dial the peer's candidate URI.
 *        Draw   → return CollisionDraw; the caller republishes with a new
 *                 connector (fresh nonce).
 *
 * The application learns the outcome through ConnectionListener:
 *   - before_connect(role) fires exactly once per connector, from whichever of
 *     the accept path and the dial path gets there first;
 *   - on_connected(socket, role) receives the single surviving socket.
 * After the first connection, the listening socket is closed and a late
 * connection on the other path is dropped.
 *
 * ALWAYS-CLIENT
 * -------------
 * Options::always_client never acts as server: the accept thread is not
 * started and every attempt dials, whatever the nonces say.
 *
 * BLUETOOTH
 * ---------
 * make_bluetooth_connector() binds an RFCOMM listener and advertises
 * `btsocket://<adapter>/<uuid>?channel=<n>`. The dialer uses the channel when
 * present, otherwise an SDP lookup of the UUID.
 */

#ifndef HANDOVER_SYMMETRIC_CONNECTOR_HPP
#define HANDOVER_SYMMETRIC_CONNECTOR_HPP

#include "handover/collision.hpp"
#include "handover/config.hpp"
#include "handover/connection_handover.hpp"
#include "handover/transport/duplex_socket.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace handover {

class ConnectionListener {
public:
  virtual ~ConnectionListener() = default;
  virtual void before_connect(Role role) = 0;
  virtual void on_connected(std::unique_ptr<transport::DuplexSocket> socket, Role role) = 0;
};

class SymmetricConnector : public SchemeHandover {
public:
  /// Unconnected socket for the peer's candidate URI, nullptr if the URI is unusable.
  using Dialer = std::function<std::unique_ptr<transport::DuplexSocket>(const Uri& uri)>;

  struct Options {
    bool always_client{false};
    std::optional<Nonce> nonce;   ///< fixed nonce instead of a random one
  };

  SymmetricConnector(std::string scheme,
                     std::unique_ptr<transport::SocketListener> listener,
                     std::string advertised_uri,
                     Dialer dialer,
                     ConnectionListener& app,
                     Options opts);
  SymmetricConnector(std::string scheme,
                     std::unique_ptr<transport::SocketListener> listener,
                     std::string advertised_uri,
                     Dialer dialer,
                     ConnectionListener& app)
  : SymmetricConnector(std::move(scheme), std::move(listener), std::move(advertised_uri),
                       std::move(dialer), app, Options{}) {}
  ~SymmetricConnector() override;

  SymmetricConnector(const SymmetricConnector&) = delete;
  SymmetricConnector& operator=(const SymmetricConnector&) = delete;

  /// Start the accept thread. False when it could not be started.
  bool start();

  /// Close the listener and join the accept thread.
  void stop();

  /// [Hr, cr(nonce), advertised URI]
  NdefMessage handover_request() const;

  const Nonce& nonce() const { return nonce_; }
  const std::string& advertised_uri() const { return advertised_uri_; }

  /// True once a socket has been handed to the application.
  bool connected() const { return handed_off_.load(); }

  TransportStatus attempt(const NdefMessage& request,
                          size_t candidate,
                          const std::optional<NdefMessage>& outbound) override;

private:
  void accept_loop();
  void notify_before_connect(Role role);
  bool claim_handoff();

  std::unique_ptr<transport::SocketListener> listener_;
  std::string advertised_uri_;
  Dialer dialer_;
  ConnectionListener& app_;
  Options opts_;
  Nonce nonce_;

  std::atomic<bool> before_fired_{false};
  std::atomic<bool> handed_off_{false};
  std::mutex thread_mtx_;
  std::thread accept_thread_;
};

/**
 * @brief RFCOMM-backed connector for the `btsocket` scheme.
 * @return nullptr when there is no local adapter or the listener cannot bind.
 */
std::unique_ptr<SymmetricConnector> make_bluetooth_connector(ConnectionListener& app,
                                                             const Config& cfg,
                                                             SymmetricConnector::Options opts);

} // namespace handover

#endif // HANDOVER_SYMMETRIC_CONNECTOR_HPP
