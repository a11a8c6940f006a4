/**
 * @file connection_handover.hpp
 * @brief The one interface every transport initiator implements.
 *
 * @details
 * An initiator answers two questions for the handover manager:
 *   - supports(record): does this candidate record name my transport?
 *   - attempt(request, index, outbound): connect to the candidate at
 *     request[index] and run the exchange.
 *
 * attempt() returns Ok once the transport connected (the exchange then runs to
 * completion before returning), a failure status when it could not connect,
 * and CollisionDraw when a symmetric initiator needs the caller to republish.
 *
 * SchemeHandover implements supports() for the common case: the record carries
 * a URI (absolute-URI or well-known "U") whose scheme equals a fixed string.
 */

#ifndef HANDOVER_CONNECTION_HANDOVER_HPP
#define HANDOVER_CONNECTION_HANDOVER_HPP

#include "handover/ndef_message.hpp"
#include "handover/status.hpp"
#include "handover/uri.hpp"

#include <stddef.h>
#include <optional>
#include <string>

namespace handover {

class ConnectionHandover {
public:
  virtual ~ConnectionHandover() = default;

  virtual bool supports(const NdefRecord& record) const = 0;

  virtual TransportStatus attempt(const NdefMessage& request,
                                  size_t candidate,
                                  const std::optional<NdefMessage>& outbound) = 0;

  virtual const char* name() const = 0;
};

class SchemeHandover : public ConnectionHandover {
public:
  explicit SchemeHandover(std::string scheme);

  bool supports(const NdefRecord& record) const override;
  const char* name() const override { return scheme_.c_str(); }

  const std::string& scheme() const { return scheme_; }

protected:
  /// Parsed URI of request[candidate] if it carries this scheme.
  std::optional<Uri> candidate_uri(const NdefMessage& request, size_t candidate) const;

private:
  std::string scheme_;
};

} // namespace handover

#endif // HANDOVER_CONNECTION_HANDOVER_HPP
