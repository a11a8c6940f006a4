// -----------------------------------------------------------------------------
// commands.cpp — handover-cli subcommands
//
// API: cli/commands.hpp
// -----------------------------------------------------------------------------
#include "commands.hpp"

#include <fstream>
#include <memory>
#include <iterator>
#include <optional>

#include "handover/core.hpp"
#include "handover/exchange.hpp"
#include "handover/handover_detector.hpp"
#include "handover/ndef_json.hpp"
#include "handover/transport/tcp_socket.hpp"
#include "handover/uri.hpp"

namespace handover {
namespace cli {

// ---------- small utilities ----------

static int fail(std::ostream& err, const std::string& reason, int code = 1) {
  err << "status=error reason=" << reason << "\n";
  return code;
}

static bool read_file(const std::string& path, Bytes& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

static bool load_message_file(const std::string& path, std::optional<NdefMessage>& out, std::string& reason) {
  if (path.empty()) return true;
  Bytes raw;
  if (!read_file(path, raw)) { reason = "io_error:" + path; return false; }
  NdefMessage msg;
  const NdefStatus st = NdefMessage::parse(raw, msg);
  if (st != NdefStatus::Ok) { reason = std::string("bad_ndef:") + to_string(st); return false; }
  out = std::move(msg);
  return true;
}

static bool parse_nonce(const std::string& hex, Nonce& out) {
  Bytes b;
  if (!json::from_hex(hex, b) || b.size() != 2) return false;
  out = Nonce{b[0], b[1]};
  return true;
}

// Prints every message that reaches it; never consumes.
class PrintingContract : public ExchangeContract {
public:
  PrintingContract(std::optional<NdefMessage> outbound, std::ostream& out)
  : outbound_(std::move(outbound)), out_(out) {}
  void handle_inbound(const NdefMessage& msg) override {
    out_ << "status=ok event=inbound records=" << msg.size() << "\n"
         << json::to_json(msg) << std::endl;
  }
  std::optional<NdefMessage> foreground_message() const override { return outbound_; }

private:
  std::optional<NdefMessage> outbound_;
  std::ostream& out_;
};

// ---------- subcommands ----------

int run_listen(const Config& cfg, std::string host, int port, const std::string& payload_path, bool once,
               std::ostream& out, std::ostream& err) {
  std::optional<NdefMessage> outbound;
  std::string reason;
  if (!load_message_file(payload_path, outbound, reason)) return fail(err, reason, 2);

  if (host.empty()) host = cfg.listen_host;
  if (port < 0) port = cfg.listen_port;
  transport::TcpListener listener(host, static_cast<uint16_t>(port));
  if (!listener.ok()) return fail(err, "bind_failed");

  out << "status=ok event=listening uri=ndef+tcp://" << host << ":" << listener.port() << std::endl;

  PrintingContract contract(outbound, out);
  do {
    auto sock = listener.accept();
    if (!sock) return fail(err, "accept_failed");
    ExchangeSession session(std::move(sock), contract);
    if (!session.connected()) continue;
    session.run();
    out << "status=" << (is_failure(session.read_status()) ? "error" : "ok")
        << " event=exchange read=" << to_string(session.read_status())
        << " write=" << to_string(session.write_status()) << std::endl;
  } while (!once);
  return 0;
}

int run_request(const Config& cfg, const std::string& hex, const std::string& file,
                const std::string& payload_path, std::ostream& out, std::ostream& err) {
  if (hex.empty() && file.empty()) return fail(err, "missing:--hex|--file", 2);
  Bytes raw;
  if (!hex.empty()) {
    if (!json::from_hex(hex, raw)) return fail(err, "bad_hex", 2);
  } else if (!read_file(file, raw)) {
    return fail(err, "io_error:" + file, 2);
  }
  NdefMessage msg;
  const NdefStatus st = NdefMessage::parse(raw, msg);
  if (st != NdefStatus::Ok) return fail(err, std::string("bad_ndef:") + to_string(st), 2);

  std::optional<NdefMessage> outbound;
  std::string reason;
  if (!load_message_file(payload_path, outbound, reason)) return fail(err, reason, 2);

  Core core(cfg);
  if (outbound) core.set_foreground_message(*outbound);

  // replies from the peer, and anything else nobody consumed, end up here
  core.register_handler(std::make_shared<CallbackHandler>("cli-print", [&out](const NdefMessage& m) {
    out << "status=ok event=message records=" << m.size() << "\n" << json::to_json(m) << std::endl;
    return HandlerResult::Consume;
  }));

  const bool is_request = locate_handover_request(msg).has_value();
  const HandlerResult r = core.dispatch_sync(msg);
  core.wait_idle();
  out << "status=ok handover_request=" << (is_request ? "yes" : "no")
      << " result=" << to_string(r) << std::endl;
  return 0;
}

int run_encode(const std::vector<std::string>& uris, const std::string& nonce_hex, bool userspace,
               std::ostream& out, std::ostream& err) {
  Nonce nonce = random_nonce();
  if (!nonce_hex.empty() && !parse_nonce(nonce_hex, nonce)) return fail(err, "bad_value:nonce", 2);
  for (const auto& u : uris) {
    if (!Uri::parse(u)) return fail(err, "bad_uri:" + u, 2);
  }

  const NdefMessage req = make_handover_request(nonce, uris);
  Bytes raw;
  const NdefStatus st = req.to_bytes(raw);
  if (st != NdefStatus::Ok) return fail(err, std::string("bad_ndef:") + to_string(st), 2);

  if (userspace) {
    auto uri = to_userspace_uri(req);
    if (!uri) return fail(err, "bad_ndef:overflow", 2);
    out << "status=ok uri=" << *uri << "\n";
  } else {
    out << "status=ok hex=" << json::to_hex(raw) << "\n";
  }
  return 0;
}

int run_decode(const std::string& hex, const std::string& uri, std::ostream& out, std::ostream& err) {
  if (hex.empty() && uri.empty()) return fail(err, "missing:--hex|--uri", 2);
  NdefMessage msg;
  if (!hex.empty()) {
    Bytes raw;
    if (!json::from_hex(hex, raw)) return fail(err, "bad_hex", 2);
    const NdefStatus st = NdefMessage::parse(raw, msg);
    if (st != NdefStatus::Ok) return fail(err, std::string("bad_ndef:") + to_string(st), 2);
  } else {
    const NdefRecord envelope = make_absolute_uri_record(uri);
    if (!is_userspace_request(envelope)) return fail(err, "not_userspace_uri", 2);
    if (!unwrap_userspace(envelope, msg)) return fail(err, "bad_envelope", 2);
  }
  out << "status=ok records=" << msg.size() << "\n" << json::to_json(msg, 2) << "\n";
  return 0;
}

} // namespace cli
} // namespace handover
