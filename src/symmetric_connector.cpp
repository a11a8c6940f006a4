// -----------------------------------------------------------------------------
// symmetric_connector.cpp — nonce-elected server/client pairing
//
// API: include/handover/symmetric_connector.hpp
// -----------------------------------------------------------------------------
#include "handover/symmetric_connector.hpp"
#include "handover/handover_detector.hpp"
#include "handover/log.hpp"
#include "handover/transport/rfcomm_socket.hpp"
#include "handover/uuid.hpp"

#include <cstdlib>
#include <exception>
#include <system_error>

namespace handover {

SymmetricConnector::SymmetricConnector(std::string scheme,
                                       std::unique_ptr<transport::SocketListener> listener,
                                       std::string advertised_uri,
                                       Dialer dialer,
                                       ConnectionListener& app,
                                       Options opts)
: SchemeHandover(std::move(scheme)),
  listener_(std::move(listener)),
  advertised_uri_(std::move(advertised_uri)),
  dialer_(std::move(dialer)),
  app_(app),
  opts_(opts),
  nonce_(opts.nonce ? *opts.nonce : random_nonce()) {}

SymmetricConnector::~SymmetricConnector() {
  stop();
}

bool SymmetricConnector::start() {
  if (opts_.always_client || !listener_) return true;
  std::lock_guard<std::mutex> lk(thread_mtx_);
  if (accept_thread_.joinable()) return true;
  try {
    accept_thread_ = std::thread([this] { accept_loop(); });
  } catch (const std::system_error& e) {
    log().error("{}: cannot start accept thread: {}", scheme(), e.what());
    return false;
  }
  return true;
}

void SymmetricConnector::stop() {
  if (listener_) listener_->close();
  std::lock_guard<std::mutex> lk(thread_mtx_);
  if (accept_thread_.joinable()) accept_thread_.join();
}

NdefMessage SymmetricConnector::handover_request() const {
  return make_handover_request(nonce_, {advertised_uri_});
}

// ---------- guards ----------

void SymmetricConnector::notify_before_connect(Role role) {
  if (before_fired_.exchange(true)) return;
  log().info("{}: role {}", scheme(), to_string(role));
  try {
    app_.before_connect(role);
  } catch (const std::exception& e) {
    log().error("{}: before_connect threw: {}", scheme(), e.what());
  } catch (...) {
    log().error("{}: before_connect threw a non-standard exception", scheme());
  }
}

bool SymmetricConnector::claim_handoff() {
  return !handed_off_.exchange(true);
}

// ---------- server path ----------

void SymmetricConnector::accept_loop() {
  auto sock = listener_->accept();
  listener_->close();   // one connection per negotiation
  if (!sock) return;

  if (!claim_handoff()) {
    log().debug("{}: dropping late inbound connection {}", scheme(), sock->name());
    sock->close();
    return;
  }
  notify_before_connect(Role::Server);
  log().info("{}: accepted {}", scheme(), sock->name());
  app_.on_connected(std::move(sock), Role::Server);
}

// ---------- client path ----------

TransportStatus SymmetricConnector::attempt(const NdefMessage& request,
                                            size_t candidate,
                                            const std::optional<NdefMessage>& /*outbound*/) {
  auto uri = candidate_uri(request, candidate);
  if (!uri) return TransportStatus::NotSupported;

  auto remote = find_collision_nonce(request);
  if (!remote) return TransportStatus::BadRequest;

  Role role = resolve_role(nonce_, *remote);
  if (role == Role::Draw) {
    log().info("{}: nonce collision ({:02x}{:02x}), republish required", scheme(), nonce_[0], nonce_[1]);
    return TransportStatus::CollisionDraw;
  }
  if (opts_.always_client) role = Role::Client;
  if (role == Role::Server) {
    log().debug("{}: waiting for peer to connect", scheme());
    return TransportStatus::Ok;
  }

  if (handed_off_.load()) return TransportStatus::Ok;

  std::unique_ptr<transport::DuplexSocket> sock;
  if (dialer_) sock = dialer_(*uri);
  if (!sock) return TransportStatus::BadAddress;

  notify_before_connect(Role::Client);
  const TransportStatus st = sock->connect();
  if (st != TransportStatus::Ok) {
    log().warn("{}: connect to {} failed: {}", scheme(), uri->to_string(), to_string(st));
    return st;
  }

  if (listener_) listener_->close();
  if (!claim_handoff()) {
    sock->close();
    return TransportStatus::Ok;
  }
  log().info("{}: connected to {}", scheme(), uri->to_string());
  app_.on_connected(std::move(sock), Role::Client);
  return TransportStatus::Ok;
}

// ---------- bluetooth ----------

std::unique_ptr<SymmetricConnector> make_bluetooth_connector(ConnectionListener& app,
                                                             const Config& cfg,
                                                             SymmetricConnector::Options opts) {
  auto local = transport::local_bluetooth_address();
  if (!local) {
    log().warn("btsocket: no local bluetooth adapter");
    return nullptr;
  }
  auto listener = std::make_unique<transport::RfcommListener>();
  if (!listener->ok()) return nullptr;

  const Uuid service = Uuid::random();
  const std::string uri = std::string("btsocket://") + local->c_str() + "/" + service.to_string() +
                          "?channel=" + std::to_string(listener->channel());
  log().info("btsocket: {} listening on {}", cfg.bluetooth_service_name, uri);

  SymmetricConnector::Dialer dialer = [](const Uri& u) -> std::unique_ptr<transport::DuplexSocket> {
    auto peer = transport::parse_bluetooth_address(u.authority());
    if (!peer) return nullptr;
    if (auto ch = u.query_parameter("channel")) {
      char* end = nullptr;
      const long n = std::strtol(ch->c_str(), &end, 10);
      if (end && *end == '\0' && n >= 1 && n <= 30)
        return std::make_unique<transport::RfcommDuplexSocket>(*peer, static_cast<uint8_t>(n));
    }
    const std::string& path = u.path();
    auto svc = Uuid::parse(path.empty() ? path : path.substr(1));
    if (!svc) return nullptr;
    return std::make_unique<transport::RfcommDuplexSocket>(*peer, *svc);
  };

  return std::make_unique<SymmetricConnector>("btsocket", std::move(listener), uri,
                                              std::move(dialer), app, opts);
}

} // namespace handover
