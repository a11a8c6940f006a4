#pragma once
/**
 * @file fd_socket.hpp
 * @brief DuplexSocket over one POSIX stream-socket descriptor (Linux).
 *
 * Serves three uses:
 *  - the connected side returned by TcpListener / RfcommListener::accept(),
 *  - one end of socketpair(2) (in-process stream pair),
 *  - the base of TcpDuplexSocket and RfcommDuplexSocket, which only add connect().
 *
 * close() shuts the descriptor down (SHUT_RDWR) so a read or write blocked in
 * another thread returns; the descriptor number itself is released by the
 * destructor, after every user of it has finished.
 */

#if !defined(__linux__)
#  error "fd_socket.hpp is Linux-only."
#endif

#include "handover/transport/duplex_socket.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <utility>

namespace handover::transport {

class FdDuplexSocket : public DuplexSocket {
public:
  /// Takes ownership of an already connected descriptor (or -1 for "not yet").
  explicit FdDuplexSocket(int fd = -1, std::string name = "fd")
  : fd_(fd), name_(std::move(name)) {}
  ~FdDuplexSocket() override;

  FdDuplexSocket(const FdDuplexSocket&) = delete;
  FdDuplexSocket& operator=(const FdDuplexSocket&) = delete;

  /// Already-connected descriptor: Ok; no descriptor: Closed.
  TransportStatus connect() override;
  TransportStatus read_some(uint8_t* out, std::size_t cap, std::size_t& out_len) override;
  TransportStatus write_all(const uint8_t* data, std::size_t len) override;
  void close() override;
  std::string name() const override { return name_; }

  bool is_closed() const { return closed_.load(); }

protected:
  /// Install a freshly connected descriptor. Closed if close() won the race.
  TransportStatus adopt(int fd);

  int fd() const { return fd_; }

private:
  int fd_{-1};
  std::string name_;
  std::atomic<bool> closed_{false};
  std::mutex mtx_;
};

/// Two connected in-process sockets (socketpair AF_UNIX/SOCK_STREAM).
/// Returns false and leaves both null on failure.
bool make_socket_pair(std::unique_ptr<DuplexSocket>& a, std::unique_ptr<DuplexSocket>& b);

} // namespace handover::transport
