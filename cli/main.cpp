/**
 * @file main.cpp
 * @brief handover-cli — Linux command-line front end for the handover stack.
 *
 * Responsibilities:
 *  - Parse options (CLI11), load the JSON config (XDG path or --config), apply
 *    the log level.
 *  - listen:  act as the peer a `ndef+tcp` candidate points at; accept, swap one
 *             frame each way, print what arrived.
 *  - request: feed one message into a handover::Core as if read from a tag and
 *             report whether the chain consumed it.
 *  - encode:  build a handover request (well-known framing or userspace URI).
 *  - decode:  print a message (hex or userspace URI) as JSON.
 *
 * The subcommand bodies live in commands.cpp; this file only parses options.
 *
 * Output is one `status=<ok|error> key=value ...` line per result on stdout
 * (errors on stderr), with JSON bodies on their own lines.
 */

#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "commands.hpp"
#include "handover/config.hpp"
#include "handover/log.hpp"

using namespace handover;

static int fail(const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return 2;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_log_level;

  CLI::App app{"NFC connection handover tool"};
  app.require_subcommand(1);
  app.add_option("--config", opt_config, "Config file (default: XDG config dir)");
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|critical|off");

  // listen
  std::string listen_host;
  int listen_port = -1;
  std::string listen_payload;
  bool listen_once = false;
  auto* listen = app.add_subcommand("listen", "Accept ndef+tcp handovers and exchange one message");
  listen->add_option("--host", listen_host, "Bind address (default from config)");
  listen->add_option("--port", listen_port, "TCP port, 0 = ephemeral (default from config)")
        ->check(CLI::Range(0, 65535));
  listen->add_option("--payload", listen_payload, "Raw NDEF file sent to each peer");
  listen->add_flag("--once", listen_once, "Exit after one exchange");

  // request
  std::string req_hex, req_file, req_payload;
  auto* request = app.add_subcommand("request", "Dispatch a message as if read from a tag");
  auto* req_hex_opt = request->add_option("--hex", req_hex, "Message bytes as hex");
  auto* req_file_opt = request->add_option("--file", req_file, "Raw NDEF file");
  req_hex_opt->excludes(req_file_opt);
  request->add_option("--payload", req_payload, "Raw NDEF file offered to the peer");

  // encode
  std::vector<std::string> enc_uris;
  std::string enc_nonce;
  bool enc_userspace = false;
  auto* encode = app.add_subcommand("encode", "Build a handover request");
  encode->add_option("--uri", enc_uris, "Candidate transport URI (repeatable)")->required();
  encode->add_option("--nonce", enc_nonce, "Collision nonce, 4 hex digits (default: random)");
  encode->add_flag("--userspace", enc_userspace, "Print the ndef://wkt:hr/ envelope instead of hex");

  // decode
  std::string dec_hex, dec_uri;
  auto* decode = app.add_subcommand("decode", "Print a message as JSON");
  auto* dec_hex_opt = decode->add_option("--hex", dec_hex, "Message bytes as hex");
  auto* dec_uri_opt = decode->add_option("--uri", dec_uri, "Userspace handover URI");
  dec_hex_opt->excludes(dec_uri_opt);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  Config cfg;
  std::string err;
  const std::string cfg_path = opt_config.empty() ? default_config_path() : opt_config;
  if (!load_config(cfg_path, cfg, err)) return fail("config:" + err);

  const std::string level = opt_log_level.empty() ? cfg.log_level : opt_log_level;
  if (!set_log_level(level)) return fail("bad_value:log-level");

  if (*listen)
    return cli::run_listen(cfg, listen_host, listen_port, listen_payload, listen_once, std::cout, std::cerr);
  if (*request) return cli::run_request(cfg, req_hex, req_file, req_payload, std::cout, std::cerr);
  if (*encode)  return cli::run_encode(enc_uris, enc_nonce, enc_userspace, std::cout, std::cerr);
  if (*decode)  return cli::run_decode(dec_hex, dec_uri, std::cout, std::cerr);
  return fail("unknown_subcommand");
}
