// ============================================================================
// fd_socket.cpp — implementation for fd_socket.hpp
// ============================================================================

#include "handover/transport/fd_socket.hpp"

#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>

namespace handover::transport {

FdDuplexSocket::~FdDuplexSocket() {
  close();
  if (fd_ >= 0) ::close(fd_);
}

TransportStatus FdDuplexSocket::connect() {
  if (closed_.load()) return TransportStatus::Closed;
  return fd_ >= 0 ? TransportStatus::Ok : TransportStatus::Closed;
}

TransportStatus FdDuplexSocket::adopt(int fd) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_.load()) {
    ::close(fd);
    return TransportStatus::Closed;
  }
  if (fd_ >= 0) ::close(fd_);
  fd_ = fd;
  return TransportStatus::Ok;
}

// ---------------------------------------------------------------------------
// read_some()
// Retries on EINTR. 0 bytes from the kernel is EOF → Closed. After a local
// close() any error is also reported as Closed.
// ---------------------------------------------------------------------------
TransportStatus FdDuplexSocket::read_some(uint8_t* out, std::size_t cap, std::size_t& out_len) {
  out_len = 0;
  if (fd_ < 0 || closed_.load()) return TransportStatus::Closed;
  if (cap == 0) return TransportStatus::Ok;
  for (;;) {
    ssize_t r = ::recv(fd_, out, cap, 0);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return TransportStatus::Ok; }
    if (r == 0) return TransportStatus::Closed;
    if (errno == EINTR) continue;
    return closed_.load() ? TransportStatus::Closed : TransportStatus::IoError;
  }
}

// ---------------------------------------------------------------------------
// write_all()
// Loops over short writes. MSG_NOSIGNAL keeps a vanished peer from raising
// SIGPIPE; the caller sees IoError instead.
// ---------------------------------------------------------------------------
TransportStatus FdDuplexSocket::write_all(const uint8_t* data, std::size_t len) {
  if (fd_ < 0 || closed_.load()) return TransportStatus::Closed;
  std::size_t off = 0;
  while (off < len) {
    ssize_t w = ::send(fd_, data + off, len - off, MSG_NOSIGNAL);
    if (w > 0) { off += static_cast<std::size_t>(w); continue; }
    if (w < 0 && errno == EINTR) continue;
    return closed_.load() ? TransportStatus::Closed : TransportStatus::IoError;
  }
  return TransportStatus::Ok;
}

void FdDuplexSocket::close() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (closed_.exchange(true)) return;
  if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

bool make_socket_pair(std::unique_ptr<DuplexSocket>& a, std::unique_ptr<DuplexSocket>& b) {
  int sv[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) != 0) {
    a.reset();
    b.reset();
    return false;
  }
  a = std::make_unique<FdDuplexSocket>(sv[0], "pair-a");
  b = std::make_unique<FdDuplexSocket>(sv[1], "pair-b");
  return true;
}

} // namespace handover::transport
