#include "handover/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace handover {

spdlog::logger& log() {
  static std::shared_ptr<spdlog::logger> logger;
  static std::once_flag once;
  std::call_once(once, [] {
    logger = spdlog::get(LOGGER_NAME);
    if (!logger) logger = spdlog::stderr_color_mt(LOGGER_NAME);
  });
  return *logger;
}

bool set_log_level(const std::string& level) {
  // from_str maps unknown names to "off"; only accept "off" when asked for it
  const auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") return false;
  log().set_level(lvl);
  return true;
}

} // namespace handover
