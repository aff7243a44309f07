/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Logging configuration section

**************************************************/

#ifndef WRISTLINK_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define WRISTLINK_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wristlink::config {

using json = nlohmann::json;

/**
 * @brief Console and rotating-file logging
 *
 * @example
 * ```json
 * "logging": {
 *   "consoleLevel": "info",
 *   "enableFile": true,
 *   "logDir": "logs",
 *   "logFilename": "wristlink",
 *   "fileLevel": "debug",
 *   "maxFileSize": 5242880,
 *   "maxFiles": 3
 * }
 * ```
 */
struct LoggingConfig {
    static constexpr std::string_view PATH = "/logging";

    std::string consoleLevel{"info"};  ///< Console log level
    bool consoleColor{true};           ///< ANSI colours on the console

    bool enableFile{false};                ///< Enable file output
    std::string logDir{"logs"};            ///< Log directory path
    std::string logFilename{"wristlink"};  ///< Base filename (without extension)
    std::string fileLevel{"debug"};        ///< File log level

    std::size_t maxFileSize{5 * 1024 * 1024};  ///< Max file size before rotation
    std::size_t maxFiles{3};                   ///< Max number of rotated files

    /// Available placeholders: %Y %m %d %H %M %S %e (milliseconds)
    ///                        %l (level), %t (thread id), %v (message)
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};

    [[nodiscard]] json serialize() const {
        return {{"consoleLevel", consoleLevel},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", fileLevel},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }
};

}  // namespace wristlink::config

#endif  // WRISTLINK_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
