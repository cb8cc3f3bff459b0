#pragma once
/**
 * @file logging.h
 * @brief Engine-wide logger
 *
 * All components log through one named spdlog logger ("nightfall").
 * State transitions go to info, anomalies (conflicts, rejections, timeouts)
 * to warn, fatal conditions to error and wire traffic to debug/trace.
 */

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace nightfall::log {

/**
 * @brief Logger settings, part of the engine XML configuration
 */
struct LoggingConfig {
    std::string level{"info"};   ///< trace, debug, info, warn, error, critical, off
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};

    static LoggingConfig default_config() { return LoggingConfig{}; }

    static LoggingConfig verbose() {
        LoggingConfig config;
        config.level = "trace";
        return config;
    }

    static LoggingConfig quiet() {
        LoggingConfig config;
        config.level = "warn";
        return config;
    }
};

/**
 * @brief Name of the engine logger in the spdlog registry
 */
constexpr const char* LOGGER_NAME = "nightfall";

/**
 * @brief Get the engine logger, creating it on first use
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Apply level and pattern to the engine logger
 */
void configure(const LoggingConfig& config);

} // namespace nightfall::log
