/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Factory for the spdlog sinks used by the daemon

**************************************************/

#ifndef WRISTLINK_LOGGING_SINKS_SINK_FACTORY_HPP
#define WRISTLINK_LOGGING_SINKS_SINK_FACTORY_HPP

#include <cstddef>
#include <string>

#include <spdlog/spdlog.h>

namespace wristlink::logging {

/**
 * @brief Factory class for creating spdlog sinks
 *
 * Console output goes to stderr; stdout carries the broadcast bus.
 */
class SinkFactory {
public:
    /**
     * @brief Create a stderr console sink
     * @param level Log level for the sink
     * @param pattern Optional format pattern
     * @param color Use ANSI colours
     */
    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level = spdlog::level::info,
        const std::string& pattern = "", bool color = true)
        -> spdlog::sink_ptr;

    /**
     * @brief Create a rotating file sink
     * @param file_path Base path for log files
     * @param max_size Maximum file size before rotation
     * @param max_files Maximum number of rotated files to keep
     * @param level Log level
     * @param pattern Optional format pattern
     */
    [[nodiscard]] static auto createRotatingFileSink(
        const std::string& file_path, std::size_t max_size,
        std::size_t max_files,
        spdlog::level::level_enum level = spdlog::level::debug,
        const std::string& pattern = "") -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& file_path);
};

}  // namespace wristlink::logging

#endif  // WRISTLINK_LOGGING_SINKS_SINK_FACTORY_HPP
