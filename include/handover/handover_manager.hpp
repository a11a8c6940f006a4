/**
 * @file handover_manager.hpp
 * @brief Negotiation core: walk candidate records, try matching initiators.
 *
 * @details
 * PURPOSE
 * -------
 * The manager is registered in the handler chain (priority 5 by default). For
 * each inbound message it decides whether the message is a handover request
 * and, if so, tries to establish one of the advertised transports.
 *
 * PROCESS FLOW
 * ------------
 * 1. Disabled → Propagate.
 * 2. locate_handover_request(); none → Propagate.
 * 3. Userspace framing → unwrap; candidates start at 0 of the unwrapped
 *    message. Well-known framing → candidates start at 2.
 * 4. For each candidate in order, for each initiator in registration order:
 *      supports()? → attempt()
 *        Ok / CollisionDraw → Consume, stop.
 *        failure            → log, next initiator, then next candidate.
 * 5. Exhausted → warn, Propagate.
 *
 * A failed (initiator, candidate) pair is never retried within one call.
 *
 * STATE
 * -----
 * - Initiator registry: ETL fixed-capacity vector, insertion order, guarded by
 *   one mutex; attempts run on a snapshot so a slow transport never blocks
 *   registration.
 * - Enabled flag: atomic; only gates calls that start after the change.
 * - Outbound message: an optional provider callback (the Core's foreground
 *   message) consulted by handle(); attempt_handover() takes it explicitly.
 */

#ifndef HANDOVER_HANDOVER_MANAGER_HPP
#define HANDOVER_HANDOVER_MANAGER_HPP

#include "handover/connection_handover.hpp"
#include "handover/handler_chain.hpp"

#include "etl/vector.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace handover {

class HandoverManager : public NdefHandler {
public:
  static constexpr size_t MAX_INITIATORS = 8;

  using OutboundProvider = std::function<std::optional<NdefMessage>()>;

  HandoverManager() = default;
  explicit HandoverManager(OutboundProvider outbound) : outbound_(std::move(outbound)) {}

  /// Appends; false when full, null, or already registered.
  bool add_initiator(std::shared_ptr<ConnectionHandover> initiator);
  bool remove_initiator(const ConnectionHandover* initiator);
  void clear_initiators();
  size_t initiator_count() const;

  void set_enabled(bool on) { enabled_.store(on); }
  bool enabled() const { return enabled_.load(); }

  /// Chain entry point: outbound comes from the provider given at construction.
  HandlerResult handle(const NdefMessage& msg) override;
  const char* name() const override { return "connection-handover"; }

  /// Full negotiation with an explicit outbound message.
  HandlerResult attempt_handover(const NdefMessage& msg, const std::optional<NdefMessage>& outbound);

private:
  using Registry = etl::vector<std::shared_ptr<ConnectionHandover>, MAX_INITIATORS>;

  OutboundProvider outbound_;
  std::atomic<bool> enabled_{true};
  mutable std::mutex mtx_;
  Registry initiators_;
};

} // namespace handover

#endif // HANDOVER_HANDOVER_MANAGER_HPP
