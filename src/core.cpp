// -----------------------------------------------------------------------------
// core.cpp — Implementation of handover::Core
//
// API & usage: see include/handover/core.hpp
// Tests: tests/test_core.cpp
// -----------------------------------------------------------------------------
#include "handover/core.hpp"
#include "handover/bluetooth_handover.hpp"
#include "handover/log.hpp"
#include "handover/tcp_handover.hpp"

#include <exception>
#include <iterator>
#include <system_error>

namespace handover {

// ---------- public ----------

Core::Core(const Config& cfg, Options opts) : cfg_(cfg) {
  manager_ = std::make_shared<HandoverManager>([this] { return foreground_message(); });
  manager_->set_enabled(cfg_.handover_enabled);

  chain_.add(cfg_.handover_priority, manager_);
  chain_.add(HandlerChain::FALLBACK_PRIORITY, std::make_shared<EmptyMessageHandler>());

  if (opts.default_initiators) {
    manager_->add_initiator(std::make_shared<TcpHandover>(*this, cfg_.tcp_default_port));
    manager_->add_initiator(std::make_shared<BluetoothHandover>(*this));
  }
}

Core::~Core() {
  wait_idle();
}

bool Core::register_handler(int priority, std::shared_ptr<NdefHandler> handler) {
  return chain_.add(priority, std::move(handler));
}

bool Core::register_handler(std::shared_ptr<NdefHandler> handler) {
  if (!handler) return false;
  const int priority = handler->priority().value_or(cfg_.default_priority);
  return chain_.add(priority, std::move(handler));
}

size_t Core::remove_handler(const NdefHandler* handler) {
  return chain_.remove(handler);
}

void Core::unregister_all() {
  chain_.clear();
}

// ---------------------------------------------------------------------------
// dispatch()
// One worker per message. The done flag lets later calls join finished
// workers without blocking on live ones.
// ---------------------------------------------------------------------------
bool Core::dispatch(const NdefMessage& msg, Completion done) {
  reap_finished();

  auto flag = std::make_shared<std::atomic<bool>>(false);
  std::lock_guard<std::mutex> lk(workers_mtx_);
  try {
    std::thread t([this, msg, done = std::move(done), flag] {
      const HandlerResult r = chain_.dispatch(msg);
      if (done) {
        try {
          done(msg, r);
        } catch (const std::exception& e) {
          log().error("dispatch completion threw: {}", e.what());
        } catch (...) {
          log().error("dispatch completion threw a non-standard exception");
        }
      }
      flag->store(true);
    });
    workers_.push_back(Worker{std::move(t), flag});
  } catch (const std::system_error& e) {
    log().error("cannot start dispatch worker: {}", e.what());
    return false;
  }
  return true;
}

HandlerResult Core::dispatch_sync(const NdefMessage& msg) {
  return chain_.dispatch(msg);
}

void Core::wait_idle() {
  for (;;) {
    std::list<Worker> batch;
    {
      std::lock_guard<std::mutex> lk(workers_mtx_);
      batch.swap(workers_);
    }
    if (batch.empty()) return;
    for (auto& w : batch) {
      if (w.thread.joinable()) w.thread.join();
    }
  }
}

void Core::set_foreground_message(const NdefMessage& msg) {
  std::lock_guard<std::mutex> lk(fg_mtx_);
  foreground_ = msg;
}

void Core::clear_foreground_message() {
  std::lock_guard<std::mutex> lk(fg_mtx_);
  foreground_.reset();
}

std::optional<NdefMessage> Core::foreground_message() const {
  std::lock_guard<std::mutex> lk(fg_mtx_);
  return foreground_;
}

// A peer's reply re-enters the chain as if it had been read locally.
void Core::handle_inbound(const NdefMessage& msg) {
  log().debug("inbound message with {} record(s) from exchange", msg.size());
  dispatch(msg);
}

// ---------- private ----------

void Core::reap_finished() {
  std::list<Worker> finished;
  {
    std::lock_guard<std::mutex> lk(workers_mtx_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->done->load()) {
        auto next = std::next(it);
        finished.splice(finished.end(), workers_, it);
        it = next;
      } else {
        ++it;
      }
    }
  }
  for (auto& w : finished) {
    if (w.thread.joinable()) w.thread.join();
  }
}

} // namespace handover
