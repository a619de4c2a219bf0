/**
 * @file Log.hpp
 * @brief Process-wide spdlog logger for ontodiff
 */

#ifndef ONTODIFF_LOG_HPP
#define ONTODIFF_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace ontodiff {

/**
 * @brief The "ontodiff" logger, created on first use
 *
 * Writes to stderr with a colour sink. Falls back to the spdlog default
 * logger if the named logger cannot be created.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level from its name
 *
 * Accepts the spdlog level names ("trace", "debug", "info", "warn",
 * "error", "critical", "off"). Unknown names leave the level unchanged and
 * return false.
 */
bool set_log_level(const std::string& level);

} // namespace ontodiff

#endif // ONTODIFF_LOG_HPP
