#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace brook {

/**
 * @brief Shared "brook" logger (stderr, colour)
 *
 * Created on first use. Applications that register their own logger
 * named "brook" before first use get theirs picked up instead.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level from a name ("trace", "debug", "info",
 * "warn", "error", "critical", "off"). Unknown names leave it unchanged.
 */
bool set_log_level(const std::string& level);

} // namespace brook
