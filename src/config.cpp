// -----------------------------------------------------------------------------
// config.cpp — JSON settings file
//
// API: include/handover/config.hpp
// -----------------------------------------------------------------------------
#include "handover/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace handover {

namespace {

bool read_bool(const json& j, const char* key, bool& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_boolean()) { err = std::string("bad_type:") + key; return false; }
  out = it->get<bool>();
  return true;
}

bool read_int(const json& j, const char* key, long lo, long hi, long& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) { err = std::string("bad_type:") + key; return false; }
  const long v = it->get<long>();
  if (v < lo || v > hi) { err = std::string("bad_value:") + key; return false; }
  out = v;
  return true;
}

bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) { err = std::string("bad_type:") + key; return false; }
  out = it->get<std::string>();
  return true;
}

bool read_port(const json& j, const char* key, uint16_t& out, std::string& err) {
  long v = out;
  if (!read_int(j, key, 0, 65535, v, err)) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

bool read_priority(const json& j, const char* key, int& out, std::string& err) {
  long v = out;
  if (!read_int(j, key, 0, std::numeric_limits<int>::max(), v, err)) return false;
  out = static_cast<int>(v);
  return true;
}

} // namespace

// ---------- public ----------

std::string default_config_path() {
  const char* xdg  = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home ? home : ".") / ".config";
  return (base / "handover" / "config.json").string();
}

bool load_config(const std::string& path, Config& out, std::string& err) {
  err.clear();
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;

  std::ifstream in(path);
  if (!in) { err = "io_error"; return false; }

  json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) { err = "bad_json"; return false; }

  Config c = out;
  if (!read_bool(j, "handover_enabled", c.handover_enabled, err))             return false;
  if (!read_port(j, "tcp_default_port", c.tcp_default_port, err))             return false;
  if (!read_priority(j, "handover_priority", c.handover_priority, err))       return false;
  if (!read_priority(j, "default_priority", c.default_priority, err))         return false;
  if (!read_string(j, "log_level", c.log_level, err))                         return false;
  if (!read_string(j, "listen_host", c.listen_host, err))                     return false;
  if (!read_port(j, "listen_port", c.listen_port, err))                       return false;
  if (!read_string(j, "bluetooth_service_name", c.bluetooth_service_name, err)) return false;

  // port 0 as a default dial target makes no sense; listening on 0 is fine
  if (c.tcp_default_port == 0) { err = "bad_value:tcp_default_port"; return false; }

  out = c;
  return true;
}

bool save_config(const std::string& path, const Config& cfg, std::string& err) {
  err.clear();
  json j;
  j["handover_enabled"]       = cfg.handover_enabled;
  j["tcp_default_port"]       = cfg.tcp_default_port;
  j["handover_priority"]      = cfg.handover_priority;
  j["default_priority"]       = cfg.default_priority;
  j["log_level"]              = cfg.log_level;
  j["listen_host"]            = cfg.listen_host;
  j["listen_port"]            = cfg.listen_port;
  j["bluetooth_service_name"] = cfg.bluetooth_service_name;

  const fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
  if (ec) { err = "io_error"; return false; }

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream o(tmp, std::ios::trunc);
    if (!o) { err = "io_error"; return false; }
    o << j.dump(2) << '\n';
    o.flush();
    if (!o) { err = "io_error"; return false; }
  }
  fs::rename(tmp, p, ec);
  if (ec) {
    fs::remove(tmp, ec);
    err = "io_error";
    return false;
  }
  return true;
}

} // namespace handover
