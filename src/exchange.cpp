// -----------------------------------------------------------------------------
// exchange.cpp — one frame each way over a duplex socket
//
// API: include/handover/exchange.hpp
// -----------------------------------------------------------------------------
#include "handover/exchange.hpp"
#include "handover/frame.hpp"
#include "handover/log.hpp"

#include <exception>
#include <system_error>
#include <thread>

namespace handover {

ExchangeSession::ExchangeSession(std::unique_ptr<transport::DuplexSocket> socket,
                                 ExchangeContract& contract)
: ExchangeSession(std::move(socket), contract, contract.foreground_message()) {}

ExchangeSession::ExchangeSession(std::unique_ptr<transport::DuplexSocket> socket,
                                 ExchangeContract& contract,
                                 std::optional<NdefMessage> outbound)
: socket_(std::move(socket)), contract_(contract), outbound_(std::move(outbound)) {
  if (!socket_) return;
  connect_status_ = socket_->connect();
  if (connect_status_ != TransportStatus::Ok) {
    log().debug("exchange: connect {} failed: {}", socket_->name(), to_string(connect_status_));
    socket_->close();
  }
}

ExchangeSession::~ExchangeSession() {
  if (socket_) socket_->close();
}

void ExchangeSession::run() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!connected() || state_ != State::Idle) return;
    state_ = State::Running;
  }

  std::thread writer;
  try {
    writer = std::thread([this] { write_direction(); });
  } catch (const std::system_error& e) {
    log().error("exchange: cannot start writer: {}", e.what());
    write_direction();
  }
  read_direction();
  if (writer.joinable()) writer.join();
}

// ---------- directions ----------

void ExchangeSession::write_direction() {
  Bytes payload;
  if (outbound_) {
    const NdefStatus ns = outbound_->to_bytes(payload);
    if (ns != NdefStatus::Ok) {
      log().error("exchange: outbound message not encodable: {}", to_string(ns));
      finish(Write, TransportStatus::BadRequest);
      return;
    }
  }
  const Bytes frame = encode_frame(payload);
  const TransportStatus st = socket_->write_all(frame.data(), frame.size());
  if (st != TransportStatus::Ok)
    log().warn("exchange: write on {} failed: {}", socket_->name(), to_string(st));
  else
    log().debug("exchange: sent {} byte payload on {}", payload.size(), socket_->name());
  finish(Write, st);
}

void ExchangeSession::read_direction() {
  FrameDecoder dec;
  Bytes payload;
  uint8_t buf[4096];
  FrameStatus fs = FrameStatus::NeedMore;
  TransportStatus st = TransportStatus::Ok;

  while (fs == FrameStatus::NeedMore) {
    size_t n = 0;
    st = socket_->read_some(buf, sizeof(buf), n);
    if (st != TransportStatus::Ok) break;
    size_t used = 0;
    fs = dec.feed(buf, n, used, payload);
  }

  if (fs == FrameStatus::BadVersion) {
    log().error("exchange: bad frame version on {}", socket_->name());
    finish(Read, TransportStatus::ProtocolVersion);
    return;
  }
  if (fs == FrameStatus::BadLength) {
    log().error("exchange: bad frame length on {}", socket_->name());
    finish(Read, TransportStatus::ProtocolVersion);
    return;
  }
  if (fs != FrameStatus::Complete) {
    log().warn("exchange: read on {} ended: {}", socket_->name(), to_string(st));
    finish(Read, st == TransportStatus::Ok ? TransportStatus::Closed : st);
    return;
  }

  if (payload.empty()) {
    log().debug("exchange: peer sent an empty frame");
    finish(Read, TransportStatus::Ok);
    return;
  }

  NdefMessage msg;
  const NdefStatus ns = NdefMessage::parse(payload, msg);
  if (ns != NdefStatus::Ok) {
    log().error("exchange: inbound payload unparsable: {}", to_string(ns));
    finish(Read, TransportStatus::IoError);
    return;
  }

  {
    std::lock_guard<std::mutex> lk(mtx_);
    received_ = msg;
  }
  try {
    contract_.handle_inbound(msg);
  } catch (const std::exception& e) {
    log().error("exchange: inbound handler threw: {}", e.what());
  } catch (...) {
    log().error("exchange: inbound handler threw a non-standard exception");
  }
  finish(Read, TransportStatus::Ok);
}

// ---------------------------------------------------------------------------
// finish()
// Countdown over the two directions. The direction that moves the session
// into BothDone closes the socket; the other one never touches close().
// ---------------------------------------------------------------------------
void ExchangeSession::finish(Direction d, TransportStatus st) {
  bool close_now = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (d == Read) read_status_ = st;
    else           write_status_ = st;

    switch (state_) {
      case State::Running:
        state_ = (d == Read) ? State::WritePending : State::ReadPending;
        break;
      case State::ReadPending:
      case State::WritePending:
        state_ = State::BothDone;
        close_now = true;
        break;
      case State::Idle:
      case State::BothDone:
        break;
    }
  }
  if (close_now) socket_->close();
}

// ---------- observers ----------

TransportStatus ExchangeSession::read_status() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return read_status_;
}

TransportStatus ExchangeSession::write_status() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return write_status_;
}

ExchangeSession::State ExchangeSession::state() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_;
}

std::optional<NdefMessage> ExchangeSession::received() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return received_;
}

TransportStatus run_exchange(std::unique_ptr<transport::DuplexSocket> socket,
                             ExchangeContract& contract,
                             const std::optional<NdefMessage>& outbound) {
  ExchangeSession session(std::move(socket), contract, outbound);
  if (!session.connected()) return session.connect_status();
  session.run();
  return TransportStatus::Ok;
}

} // namespace handover
