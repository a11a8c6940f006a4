/**
 * @file core.hpp
 * @brief handover::Core — the application-facing entry point of the stack.
 *
 * @details
 * ## What it is
 * Core ties the pieces together for a host application that reads NDEF
 * messages from somewhere (a tag reader, a test harness, the CLI):
 *
 *   - a HandlerChain of message consumers,
 *   - a HandoverManager registered in that chain (priority 5 by default),
 *   - an EmptyMessageHandler in the fallback bucket (priority 0),
 *   - the "foreground" message: what this device offers to a peer when a
 *     handover transport is established,
 *   - the worker threads that run each dispatch.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [host app]                     [Core]
 *      │  dispatch(msg) ──────────► worker thread ──► HandlerChain::dispatch
 *      │                                                  │
 *      │                                     HandoverManager (prio 5)
 *      │                                                  │ attempt()
 *      │                                        TcpHandover / BluetoothHandover
 *      │                                                  │ ExchangeSession
 *      │                                   peer's reply ──┘
 *      │                                          │ handle_inbound()
 *      │                                          ▼
 *      │                                   dispatch(reply) on a new worker
 * ```
 *
 * - Each dispatch() runs on its own worker so handlers may block on sockets.
 * - dispatch_sync() runs on the caller's thread (tests, CLI one-shots).
 * - wait_idle() joins every outstanding worker, including workers started by
 *   replies that arrived while waiting. The destructor calls it.
 *
 * ---
 *
 * @par Failure Model
 * Nothing throws out of Core. A worker that cannot be started is logged and
 * dispatch() returns false. Transport failures end up as log lines and a
 * Propagate result; see HandoverManager.
 *
 * @par Minimal Usage
 * @code
 *   handover::Core core;
 *   core.set_foreground_message(my_card);
 *   core.register_handler(std::make_shared<MyHandler>());
 *   core.dispatch(message_from_tag);
 *   ...
 *   core.wait_idle();
 * @endcode
 */

#ifndef HANDOVER_CORE_HPP
#define HANDOVER_CORE_HPP

#include "handover/config.hpp"
#include "handover/exchange.hpp"
#include "handover/handler_chain.hpp"
#include "handover/handover_manager.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace handover {

class Core : public ExchangeContract {
public:
  struct Options {
    /// Register TcpHandover and BluetoothHandover at construction.
    bool default_initiators{true};
  };

  using Completion = std::function<void(const NdefMessage&, HandlerResult)>;

  Core() : Core(Config{}, Options{}) {}
  explicit Core(const Config& cfg) : Core(cfg, Options{}) {}
  Core(const Config& cfg, Options opts);
  ~Core() override;

  Core(const Core&) = delete;
  Core& operator=(const Core&) = delete;

  // ---- handlers ----
  bool register_handler(int priority, std::shared_ptr<NdefHandler> handler);
  /// handler->priority() if it has one, else the configured default (50).
  bool register_handler(std::shared_ptr<NdefHandler> handler);
  size_t remove_handler(const NdefHandler* handler);
  /// Removes every registration, the built-in ones included.
  void unregister_all();

  // ---- dispatch ----
  /// Run the chain on a new worker thread. @p done is called from that worker.
  bool dispatch(const NdefMessage& msg, Completion done = {});
  HandlerResult dispatch_sync(const NdefMessage& msg);
  void wait_idle();

  // ---- outbound ----
  void set_foreground_message(const NdefMessage& msg);
  void clear_foreground_message();

  // ---- handover ----
  void set_handover_enabled(bool on) { manager_->set_enabled(on); }
  bool handover_enabled() const { return manager_->enabled(); }
  HandoverManager& manager() { return *manager_; }
  const Config& config() const { return cfg_; }

  // ---- ExchangeContract ----
  void handle_inbound(const NdefMessage& msg) override;
  std::optional<NdefMessage> foreground_message() const override;

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reap_finished();

  Config cfg_;
  HandlerChain chain_;
  std::shared_ptr<HandoverManager> manager_;

  mutable std::mutex fg_mtx_;
  std::optional<NdefMessage> foreground_;

  std::mutex workers_mtx_;
  std::list<Worker> workers_;
};

} // namespace handover

#endif // HANDOVER_CORE_HPP
