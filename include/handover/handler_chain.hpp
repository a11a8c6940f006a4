#pragma once
/**
 * @file handler_chain.hpp
 * @brief Priority-ordered registry of message consumers.
 *
 * @details
 * PURPOSE
 * -------
 * Every inbound NDEF message (read from a tag, or received over a handover
 * transport) is offered to the registered handlers in priority order until one
 * of them consumes it. The connection handover manager is one such handler.
 *
 * ORDER
 * -----
 * - Lower priority numbers run first: 1, 2, ..., 5, ..., 50, ...
 * - Priority 0 is the fallback bucket: it runs after every positive priority.
 *   The empty-message handler lives there.
 * - Within one priority, handlers run in registration order.
 * - A handler registered more than once is still invoked at most once per
 *   dispatch (at its first position).
 *
 * CONCURRENCY
 * -----------
 * add/remove/clear lock the registry. dispatch() copies the registry under the
 * lock and walks the copy without holding it, so handlers may block, and
 * registrations made meanwhile only affect later dispatches.
 *
 * CAPACITY
 * --------
 * Bounded at MAX_HANDLERS entries (ETL fixed-capacity vector); add() returns
 * false when full.
 */

#include "handover/ndef_message.hpp"
#include "handover/status.hpp"

#include "etl/vector.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace handover {

class NdefHandler {
public:
  virtual ~NdefHandler() = default;
  virtual HandlerResult handle(const NdefMessage& msg) = 0;
  virtual const char* name() const { return "handler"; }

  /// Preferred priority when registered without one; nullopt = registry default.
  virtual std::optional<int> priority() const { return std::nullopt; }
};

/// Swallows the empty sentinel message so it never reaches content handlers.
class EmptyMessageHandler : public NdefHandler {
public:
  HandlerResult handle(const NdefMessage& msg) override {
    return msg.is_empty() ? HandlerResult::Consume : HandlerResult::Propagate;
  }
  const char* name() const override { return "empty-message"; }
};

/// Adapts a callable to NdefHandler.
class CallbackHandler : public NdefHandler {
public:
  using Fn = std::function<HandlerResult(const NdefMessage&)>;
  CallbackHandler(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}
  HandlerResult handle(const NdefMessage& msg) override { return fn_ ? fn_(msg) : HandlerResult::Propagate; }
  const char* name() const override { return name_.c_str(); }

private:
  std::string name_;
  Fn fn_;
};

class HandlerChain {
public:
  static constexpr size_t MAX_HANDLERS      = 32;
  static constexpr int    FALLBACK_PRIORITY = 0;
  static constexpr int    DEFAULT_PRIORITY  = 50;

  /**
   * @brief Register @p handler at @p priority.
   * @return false on a null handler, negative priority, full registry, or when
   *         the same handler is already registered at that priority.
   */
  bool add(int priority, std::shared_ptr<NdefHandler> handler);

  /// Remove every registration of @p handler. Returns how many were removed.
  size_t remove(const NdefHandler* handler);

  void clear();
  size_t size() const;

  /// Offer @p msg to each handler in order; Consume at the first taker.
  HandlerResult dispatch(const NdefMessage& msg) const;

private:
  struct Entry {
    int priority;
    std::shared_ptr<NdefHandler> handler;
  };
  using Registry = etl::vector<Entry, MAX_HANDLERS>;

  static bool runs_before(int a, int b);

  mutable std::mutex mtx_;
  Registry entries_;
};

} // namespace handover
