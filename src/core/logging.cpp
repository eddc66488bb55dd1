/**
 * @file logging.cpp
 * @brief Shared spdlog logger
 */

#include "logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace brook {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("brook");
        if (existing) {
            return existing;
        }
        return spdlog::stderr_color_mt("brook");
    }();
    return instance;
}

bool set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace brook
