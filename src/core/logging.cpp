/**
 * @file logging.cpp
 * @brief Engine logger setup on top of spdlog
 */

#include "nightfall/core/logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace nightfall::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(LOGGER_NAME);
        if (existing) {
            return existing;
        }
        return spdlog::stdout_color_mt(LOGGER_NAME);
    }();
    return instance;
}

void configure(const LoggingConfig& config) {
    auto log = logger();
    log->set_level(spdlog::level::from_str(config.level));
    if (!config.pattern.empty()) {
        log->set_pattern(config.pattern);
    }
}

} // namespace nightfall::log
