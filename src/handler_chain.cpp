// -----------------------------------------------------------------------------
// handler_chain.cpp — priority dispatch over registered NdefHandlers
//
// API: include/handover/handler_chain.hpp
// -----------------------------------------------------------------------------
#include "handover/handler_chain.hpp"
#include "handover/log.hpp"

#include <algorithm>
#include <exception>

namespace handover {

// Fallback bucket (0) sorts after every positive priority.
bool HandlerChain::runs_before(int a, int b) {
  if (a == b) return false;
  if (a == FALLBACK_PRIORITY) return false;
  if (b == FALLBACK_PRIORITY) return true;
  return a < b;
}

bool HandlerChain::add(int priority, std::shared_ptr<NdefHandler> handler) {
  if (!handler || priority < 0) return false;

  std::lock_guard<std::mutex> lk(mtx_);
  if (entries_.full()) {
    log().warn("handler chain full ({}), dropping registration of {}", MAX_HANDLERS, handler->name());
    return false;
  }
  for (const auto& e : entries_) {
    if (e.priority == priority && e.handler == handler) return false;
  }

  // insert after every entry that does not run after us → ties keep insertion order
  auto pos = std::find_if(entries_.begin(), entries_.end(),
                          [priority](const Entry& e) { return runs_before(priority, e.priority); });
  entries_.insert(pos, Entry{priority, std::move(handler)});
  return true;
}

size_t HandlerChain::remove(const NdefHandler* handler) {
  std::lock_guard<std::mutex> lk(mtx_);
  const size_t before = entries_.size();
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [handler](const Entry& e) { return e.handler.get() == handler; }),
                 entries_.end());
  return before - entries_.size();
}

void HandlerChain::clear() {
  std::lock_guard<std::mutex> lk(mtx_);
  entries_.clear();
}

size_t HandlerChain::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return entries_.size();
}

HandlerResult HandlerChain::dispatch(const NdefMessage& msg) const {
  Registry snapshot;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    snapshot = entries_;
  }

  etl::vector<const NdefHandler*, MAX_HANDLERS> invoked;
  for (const auto& e : snapshot) {
    const NdefHandler* h = e.handler.get();
    if (std::find(invoked.begin(), invoked.end(), h) != invoked.end()) continue;
    invoked.push_back(h);

    HandlerResult r = HandlerResult::Propagate;
    try {
      r = e.handler->handle(msg);
    } catch (const std::exception& ex) {
      log().error("handler {} (priority {}) threw: {}", e.handler->name(), e.priority, ex.what());
      continue;
    } catch (...) {
      log().error("handler {} (priority {}) threw a non-standard exception", e.handler->name(), e.priority);
      continue;
    }
    if (r == HandlerResult::Consume) {
      log().debug("message consumed by {} (priority {})", e.handler->name(), e.priority);
      return HandlerResult::Consume;
    }
  }
  return HandlerResult::Propagate;
}

} // namespace handover
