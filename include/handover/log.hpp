#pragma once
/**
 * @file log.hpp
 * @brief The library's single named spdlog logger ("handover").
 *
 * Callers use it as `handover::log().info("...{}", x)`. The logger is created
 * on first use (stderr, colour, thread safe) unless the host application has
 * already registered a logger with the same name, in which case that one is used.
 */

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace handover {

static constexpr const char* LOGGER_NAME = "handover";

spdlog::logger& log();

/// spdlog level name ("trace".."off"); false and unchanged on an unknown name.
bool set_log_level(const std::string& level);

} // namespace handover
