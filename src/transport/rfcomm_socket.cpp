// ============================================================================
// rfcomm_socket.cpp — implementation for rfcomm_socket.hpp (BlueZ)
// ============================================================================

#include "handover/transport/rfcomm_socket.hpp"
#include "handover/log.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
#include <bluetooth/rfcomm.h>
#include <bluetooth/sdp.h>
#include <bluetooth/sdp_lib.h>

#include <sys/socket.h>
#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstring>

namespace handover::transport {

namespace {

// BDADDR_ANY is a pointer to a compound literal, which C++ rejects.
bdaddr_t any_address() {
  bdaddr_t a;
  std::memset(&a, 0, sizeof(a));
  return a;
}

void free_proto_seq(void* seq, void*) {
  sdp_list_free(static_cast<sdp_list_t*>(seq), nullptr);
}

} // namespace

// ---------- addresses ----------

std::optional<BtAddrStr> parse_bluetooth_address(const std::string& text) {
  if (text.size() != 17) return std::nullopt;
  BtAddrStr out;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (i % 3 == 2) {
      if (c != ':') return std::nullopt;
      out.push_back(':');
      continue;
    }
    if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

std::optional<BtAddrStr> local_bluetooth_address() {
  const int dev_id = ::hci_get_route(nullptr);
  if (dev_id < 0) return std::nullopt;
  bdaddr_t ba;
  if (::hci_devba(dev_id, &ba) < 0) return std::nullopt;
  char buf[19] = {0};
  ::ba2str(&ba, buf);
  return BtAddrStr(buf);
}

// ---------------------------------------------------------------------------
// sdp_lookup_channel()
// Service search + attribute request for the full attribute range, then the
// RFCOMM port from the first record's protocol descriptor list.
// ---------------------------------------------------------------------------
std::optional<uint8_t> sdp_lookup_channel(const BtAddrStr& peer, const Uuid& service) {
  bdaddr_t any = any_address();
  bdaddr_t target;
  if (::str2ba(peer.c_str(), &target) < 0) return std::nullopt;

  sdp_session_t* session = ::sdp_connect(&any, &target, SDP_RETRY_IF_BUSY);
  if (!session) {
    log().debug("rfcomm: sdp connect {} failed: {}", peer.c_str(), std::strerror(errno));
    return std::nullopt;
  }

  uuid_t svc;
  ::sdp_uuid128_create(&svc, service.bytes().data());
  sdp_list_t* search = ::sdp_list_append(nullptr, &svc);
  uint32_t range = 0x0000ffff;
  sdp_list_t* attrs = ::sdp_list_append(nullptr, &range);
  sdp_list_t* rsp = nullptr;

  const int err = ::sdp_service_search_attr_req(session, search, SDP_ATTR_REQ_RANGE, attrs, &rsp);
  ::sdp_list_free(search, nullptr);
  ::sdp_list_free(attrs, nullptr);

  std::optional<uint8_t> channel;
  if (err == 0) {
    for (sdp_list_t* r = rsp; r; r = r->next) {
      auto* rec = static_cast<sdp_record_t*>(r->data);
      sdp_list_t* protos = nullptr;
      if (!channel && ::sdp_get_access_protos(rec, &protos) == 0) {
        const int port = ::sdp_get_proto_port(protos, RFCOMM_UUID);
        if (port > 0 && port <= 30) channel = static_cast<uint8_t>(port);
        ::sdp_list_foreach(protos, free_proto_seq, nullptr);
        ::sdp_list_free(protos, nullptr);
      }
      ::sdp_record_free(rec);
    }
    ::sdp_list_free(rsp, nullptr);
  }
  ::sdp_close(session);

  if (!channel)
    log().debug("rfcomm: no channel for {} on {}", service.to_string(), peer.c_str());
  return channel;
}

// ---------- RfcommDuplexSocket ----------

RfcommDuplexSocket::RfcommDuplexSocket(const BtAddrStr& peer, const Uuid& service)
: FdDuplexSocket(-1, std::string("rfcomm:") + peer.c_str() + "/" + service.to_string()),
  peer_(peer), service_(service) {}

RfcommDuplexSocket::RfcommDuplexSocket(const BtAddrStr& peer, uint8_t channel)
: FdDuplexSocket(-1, std::string("rfcomm:") + peer.c_str() + "#" + std::to_string(channel)),
  peer_(peer), channel_(channel) {}

TransportStatus RfcommDuplexSocket::connect() {
  if (is_closed()) return TransportStatus::Closed;
  if (fd() >= 0) return TransportStatus::Ok;

  uint8_t ch = channel_;
  if (ch == 0) {
    auto found = sdp_lookup_channel(peer_, service_);
    if (!found) return TransportStatus::ConnectFailed;
    ch = *found;
  }

  sockaddr_rc addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.rc_family = AF_BLUETOOTH;
  addr.rc_channel = ch;
  if (::str2ba(peer_.c_str(), &addr.rc_bdaddr) < 0) return TransportStatus::BadAddress;

  int fd = ::socket(AF_BLUETOOTH, SOCK_STREAM | SOCK_CLOEXEC, BTPROTO_RFCOMM);
  if (fd < 0) return TransportStatus::IoError;
  int r;
  do { r = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)); } while (r != 0 && errno == EINTR);
  if (r != 0) {
    log().debug("rfcomm: connect {} ch {} failed: {}", peer_.c_str(), ch, std::strerror(errno));
    ::close(fd);
    return TransportStatus::ConnectFailed;
  }
  return adopt(fd);
}

// ---------- RfcommListener ----------

RfcommListener::RfcommListener() {
  int fd = ::socket(AF_BLUETOOTH, SOCK_STREAM | SOCK_CLOEXEC, BTPROTO_RFCOMM);
  if (fd < 0) {
    log().warn("rfcomm: socket failed: {}", std::strerror(errno));
    return;
  }
  sockaddr_rc addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.rc_family = AF_BLUETOOTH;
  addr.rc_bdaddr = any_address();
  addr.rc_channel = 0;   // kernel picks a free channel
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 1) != 0) {
    log().warn("rfcomm: bind/listen failed: {}", std::strerror(errno));
    ::close(fd);
    return;
  }
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    ::close(fd);
    return;
  }
  fd_ = fd;
  channel_ = addr.rc_channel;
}

RfcommListener::~RfcommListener() {
  close();
  if (fd_ >= 0) ::close(fd_);
}

std::unique_ptr<DuplexSocket> RfcommListener::accept() {
  if (fd_ < 0) return nullptr;
  for (;;) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) return nullptr;
    }
    sockaddr_rc remote;
    socklen_t len = sizeof(remote);
    int c = ::accept4(fd_, reinterpret_cast<sockaddr*>(&remote), &len, SOCK_CLOEXEC);
    if (c >= 0) {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) { ::close(c); return nullptr; }
      char buf[19] = {0};
      ::ba2str(&remote.rc_bdaddr, buf);
      return std::make_unique<FdDuplexSocket>(c, std::string("rfcomm-accepted:") + buf);
    }
    if (errno == EINTR || errno == ECONNABORTED) continue;
    return nullptr;
  }
}

void RfcommListener::close() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_) return;
  closed_ = true;
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

std::string RfcommListener::name() const {
  return "rfcomm-listen#" + std::to_string(channel_);
}

} // namespace handover::transport
