/**
 * @file commands.hpp
 * @brief Subcommand bodies of handover-cli, callable without CLI11.
 *
 * Each command writes its `status=ok ...` lines to @p out and its
 * `status=error reason=...` line to @p err, and returns the process exit
 * code: 0 on success, 1 on a runtime failure, 2 on bad input.
 */

#ifndef HANDOVER_CLI_COMMANDS_HPP
#define HANDOVER_CLI_COMMANDS_HPP

#include "handover/config.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace handover {
namespace cli {

/// Accept ndef+tcp peers on host:port (config values when empty / negative).
int run_listen(const Config& cfg, std::string host, int port, const std::string& payload_path, bool once,
               std::ostream& out, std::ostream& err);

/// Dispatch one message (hex, or a raw NDEF file) through a Core.
int run_request(const Config& cfg, const std::string& hex, const std::string& file,
                const std::string& payload_path, std::ostream& out, std::ostream& err);

/// Print a handover request for @p uris as `hex=` or, with @p userspace, `uri=`.
int run_encode(const std::vector<std::string>& uris, const std::string& nonce_hex, bool userspace,
               std::ostream& out, std::ostream& err);

/// Print the message in @p hex, or in the userspace envelope @p uri, as JSON.
int run_decode(const std::string& hex, const std::string& uri, std::ostream& out, std::ostream& err);

} // namespace cli
} // namespace handover

#endif // HANDOVER_CLI_COMMANDS_HPP
