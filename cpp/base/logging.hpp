#pragma once

/**
 * @file logging.hpp
 * @brief Process wide logging setup on top of spdlog.
 */

#include <spdlog/spdlog.h>

#include <string>

namespace base {

/**
 * @brief Converts a case-insensitive level name to the spdlog level.
 *
 * Accepts `debug`, `info`, `warn`/`warning` and `error`.
 *
 * @throws unknown_log_level for any other value.
 */
spdlog::level::level_enum str_to_log_level(const std::string& level);

/**
 * @brief Sets the level and the `level: message` pattern of the default logger.
 */
void configure_logging(const std::string& level);

} // namespace base
