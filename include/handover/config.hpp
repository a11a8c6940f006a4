/**
 * @file config.hpp
 * @brief Runtime settings for the handover stack, persisted as a small JSON file.
 *
 * @details
 * FILE FORMAT
 * -----------
 * A single JSON object. Every key is optional; a missing key keeps its default.
 *
 * @code
 *   {
 *     "handover_enabled": true,
 *     "tcp_default_port": 7924,
 *     "handover_priority": 5,
 *     "default_priority": 50,
 *     "log_level": "info",
 *     "listen_host": "0.0.0.0",
 *     "listen_port": 7924,
 *     "bluetooth_service_name": "NfcBtHandover"
 *   }
 * @endcode
 *
 * LOCATION
 * --------
 * `$XDG_CONFIG_HOME/handover/config.json`, else `$HOME/.config/handover/config.json`.
 *
 * ERRORS
 * ------
 * load_config/save_config return false and set a short token in @p err:
 *   - `bad_json`          file exists but is not a JSON object
 *   - `bad_type:<key>`    key present with the wrong JSON type
 *   - `bad_value:<key>`   right type, value out of range
 *   - `io_error`          could not read or write the file
 */

#ifndef HANDOVER_CONFIG_HPP
#define HANDOVER_CONFIG_HPP

#include <stdint.h>
#include <string>

namespace handover {

struct Config {
  bool        handover_enabled{true};
  uint16_t    tcp_default_port{7924};
  int         handover_priority{5};
  int         default_priority{50};
  std::string log_level{"info"};
  std::string listen_host{"0.0.0.0"};
  uint16_t    listen_port{7924};
  std::string bluetooth_service_name{"NfcBtHandover"};
};

std::string default_config_path();

/// Missing file is not an error: @p out is left at defaults and true is returned.
bool load_config(const std::string& path, Config& out, std::string& err);

/// Atomic write (tmp + rename). Creates parent directories.
bool save_config(const std::string& path, const Config& cfg, std::string& err);

} // namespace handover

#endif // HANDOVER_CONFIG_HPP
