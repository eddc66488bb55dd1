/**
 * @file clock.cpp
 * @brief Shared system clock instance
 */

#include "clock.h"

namespace brook {

std::shared_ptr<Clock> system_clock() {
    static std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
    return instance;
}

} // namespace brook
