/*
 * relay_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Aggregate daemon configuration and its file loader

**************************************************/

#ifndef WRISTLINK_CONFIG_RELAY_CONFIG_HPP
#define WRISTLINK_CONFIG_RELAY_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sections/logging_config.hpp"
#include "sections/session_config.hpp"
#include "sections/worker_config.hpp"

namespace wristlink::config {

using json = nlohmann::json;

/**
 * @brief Every configuration section of the daemon.
 *
 * Absent sections and keys keep their defaults.
 */
struct RelayConfig {
    SessionConfig session;
    WorkerConfig worker;
    HistoryConfig history;
    ControlConfig control;
    LoggingConfig logging;
    SdkConfig sdk;

    [[nodiscard]] json serialize() const;
    [[nodiscard]] static RelayConfig deserialize(const json& j);
};

/**
 * @brief Values given on the command line. Unset or empty means keep the file value.
 */
struct CommandLineOverrides {
    std::optional<std::string> logLevel;
    std::optional<std::string> scriptPath;
};

void applyOverrides(RelayConfig& config, const CommandLineOverrides& overrides);

/**
 * @brief Problems that make a configuration unusable, empty if none
 */
[[nodiscard]] auto collectErrors(const RelayConfig& config)
    -> std::vector<std::string>;

/**
 * @brief Throw ConfigValidationException listing every problem
 */
void validate(const RelayConfig& config);

/**
 * @brief Parse and validate a JSON configuration file.
 *
 * @throw ConfigIOException if the file cannot be read or is not JSON
 * @throw ConfigValidationException if a value is unusable
 */
[[nodiscard]] auto loadConfigFile(const std::filesystem::path& path)
    -> RelayConfig;

}  // namespace wristlink::config

#endif  // WRISTLINK_CONFIG_RELAY_CONFIG_HPP
