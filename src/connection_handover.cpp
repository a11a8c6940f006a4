#include "handover/connection_handover.hpp"

#include <algorithm>
#include <cctype>

namespace handover {

SchemeHandover::SchemeHandover(std::string scheme) : scheme_(std::move(scheme)) {
  std::transform(scheme_.begin(), scheme_.end(), scheme_.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

bool SchemeHandover::supports(const NdefRecord& record) const {
  auto uri = record_parsed_uri(record);
  return uri && uri->scheme() == scheme_;
}

std::optional<Uri> SchemeHandover::candidate_uri(const NdefMessage& request, size_t candidate) const {
  if (candidate >= request.size()) return std::nullopt;
  auto uri = record_parsed_uri(request[candidate]);
  if (!uri || uri->scheme() != scheme_) return std::nullopt;
  return uri;
}

} // namespace handover
