// ============================================================================
// tcp_socket.cpp — implementation for tcp_socket.hpp
// ============================================================================

#include "handover/transport/tcp_socket.hpp"
#include "handover/log.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace handover::transport {

// ---------- TcpDuplexSocket ----------

TcpDuplexSocket::TcpDuplexSocket(std::string host, uint16_t port)
: FdDuplexSocket(-1, "tcp:" + host + ":" + std::to_string(port)),
  host_(std::move(host)), port_(port) {}

TransportStatus TcpDuplexSocket::connect() {
  if (is_closed()) return TransportStatus::Closed;
  if (fd() >= 0) return TransportStatus::Ok;

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string service = std::to_string(port_);
  int rc = ::getaddrinfo(host_.c_str(), service.c_str(), &hints, &res);
  if (rc != 0) {
    log().debug("tcp: resolve {} failed: {}", host_, ::gai_strerror(rc));
    return TransportStatus::BadAddress;
  }

  int fd = -1;
  for (addrinfo* ai = res; ai; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) continue;
    int r;
    do { r = ::connect(fd, ai->ai_addr, ai->ai_addrlen); } while (r != 0 && errno == EINTR);
    if (r == 0) break;
    log().debug("tcp: connect {}:{} failed: {}", host_, port_, std::strerror(errno));
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);
  if (fd < 0) return TransportStatus::ConnectFailed;

  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return adopt(fd);
}

// ---------- TcpListener ----------

TcpListener::TcpListener(const std::string& host, uint16_t port) : host_(host) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  addrinfo* res = nullptr;
  const std::string service = std::to_string(port);
  int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0) {
    log().warn("tcp: listen address {} unusable: {}", host, ::gai_strerror(rc));
    return;
  }

  for (addrinfo* ai = res; ai; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) continue;
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, 4) == 0) {
      fd_ = fd;
      break;
    }
    ::close(fd);
  }
  ::freeaddrinfo(res);
  if (fd_ < 0) {
    log().warn("tcp: bind {}:{} failed: {}", host, port, std::strerror(errno));
    return;
  }

  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&ss), &len) == 0) {
    if (ss.ss_family == AF_INET)
      port_ = ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
    else if (ss.ss_family == AF_INET6)
      port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
  }
}

TcpListener::~TcpListener() {
  close();
  if (fd_ >= 0) ::close(fd_);
}

std::unique_ptr<DuplexSocket> TcpListener::accept() {
  if (fd_ < 0) return nullptr;
  for (;;) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) return nullptr;
    }
    int c = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (c >= 0) {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_) { ::close(c); return nullptr; }
      return std::make_unique<FdDuplexSocket>(c, "tcp-accepted:" + std::to_string(port_));
    }
    if (errno == EINTR || errno == ECONNABORTED) continue;
    return nullptr;
  }
}

// shutdown() on a listening socket makes a blocked accept() return EINVAL.
void TcpListener::close() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_) return;
  closed_ = true;
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

std::string TcpListener::name() const {
  return "tcp-listen:" + host_ + ":" + std::to_string(port_);
}

} // namespace handover::transport
