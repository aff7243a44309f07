/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Process logger bring-up and teardown

**************************************************/

#ifndef WRISTLINK_LOGGING_LOGGING_HPP
#define WRISTLINK_LOGGING_LOGGING_HPP

#include <string>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace wristlink::logging {

/**
 * @brief Map a level name ("debug", "warn", ...) to spdlog, info if unknown
 */
[[nodiscard]] auto parseLevel(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Console-only logger used before configuration is loaded
 */
void initDefaultLogging();

/**
 * @brief Replace the default logger with one built from @p config.
 *
 * Falls back to console only if the log file cannot be created.
 */
void initLogging(const config::LoggingConfig& config);

/**
 * @brief Flush and drop every logger
 */
void shutdownLogging();

}  // namespace wristlink::logging

#endif  // WRISTLINK_LOGGING_LOGGING_HPP
