// -----------------------------------------------------------------------------
// handover_manager.cpp — candidate × initiator search
//
// API: include/handover/handover_manager.hpp
// -----------------------------------------------------------------------------
#include "handover/handover_manager.hpp"
#include "handover/handover_detector.hpp"
#include "handover/log.hpp"

#include <algorithm>
#include <exception>

namespace handover {

// ---------- registry ----------

bool HandoverManager::add_initiator(std::shared_ptr<ConnectionHandover> initiator) {
  if (!initiator) return false;
  std::lock_guard<std::mutex> lk(mtx_);
  if (initiators_.full()) return false;
  if (std::find(initiators_.begin(), initiators_.end(), initiator) != initiators_.end()) return false;
  initiators_.push_back(std::move(initiator));
  return true;
}

bool HandoverManager::remove_initiator(const ConnectionHandover* initiator) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = std::find_if(initiators_.begin(), initiators_.end(),
                         [initiator](const std::shared_ptr<ConnectionHandover>& p) { return p.get() == initiator; });
  if (it == initiators_.end()) return false;
  initiators_.erase(it);
  return true;
}

void HandoverManager::clear_initiators() {
  std::lock_guard<std::mutex> lk(mtx_);
  initiators_.clear();
}

size_t HandoverManager::initiator_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return initiators_.size();
}

// ---------- negotiation ----------

HandlerResult HandoverManager::handle(const NdefMessage& msg) {
  std::optional<NdefMessage> outbound;
  if (outbound_) outbound = outbound_();
  return attempt_handover(msg, outbound);
}

HandlerResult HandoverManager::attempt_handover(const NdefMessage& msg,
                                                const std::optional<NdefMessage>& outbound) {
  if (!enabled()) return HandlerResult::Propagate;

  auto loc = locate_handover_request(msg);
  if (!loc) return HandlerResult::Propagate;

  NdefMessage working = msg;
  size_t first = 2;
  if (loc->framing == Framing::Userspace) {
    if (!unwrap_userspace(msg[loc->index], working)) {
      log().debug("handover: userspace envelope did not decode");
      return HandlerResult::Propagate;
    }
    first = 0;
  }

  Registry snapshot;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    snapshot = initiators_;
  }

  for (size_t i = first; i < working.size(); ++i) {
    const NdefRecord& candidate = working[i];
    for (const auto& initiator : snapshot) {
      if (!initiator->supports(candidate)) continue;

      log().debug("handover: trying {} on candidate {}", initiator->name(), i);
      TransportStatus st = TransportStatus::IoError;
      try {
        st = initiator->attempt(working, i, outbound);
      } catch (const std::exception& e) {
        log().error("handover: {} threw on candidate {}: {}", initiator->name(), i, e.what());
        continue;
      } catch (...) {
        log().error("handover: {} threw a non-standard exception on candidate {}", initiator->name(), i);
        continue;
      }

      if (st == TransportStatus::Ok) return HandlerResult::Consume;
      if (st == TransportStatus::CollisionDraw) {
        log().info("handover: collision draw via {}, caller must republish", initiator->name());
        return HandlerResult::Consume;
      }
      log().warn("handover: {} failed on candidate {}: {}", initiator->name(), i, to_string(st));
    }
  }

  log().warn("handover request found but not handled ({} candidate records)",
             working.size() > first ? working.size() - first : 0);
  return HandlerResult::Propagate;
}

} // namespace handover
