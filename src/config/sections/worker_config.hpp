/*
 * worker_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Listener worker and control channel configuration sections

**************************************************/

#ifndef WRISTLINK_CONFIG_SECTIONS_WORKER_CONFIG_HPP
#define WRISTLINK_CONFIG_SECTIONS_WORKER_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace wristlink::config {

using json = nlohmann::json;

/**
 * @brief Listener worker timing and single-instance policy
 */
struct WorkerConfig {
    static constexpr std::string_view PATH = "/worker";

    std::string name{"wristlink_listener"};  ///< Logical session name
    int readyTimeoutMs{30000};               ///< SDK readiness bound
    int readyPollIntervalMs{500};
    int settleDelayMs{1500};                 ///< Before the first device snapshot
    /// What a start request does while a listener is active:
    /// "keep", "replace" or "reject"
    std::string existingWorkPolicy{"keep"};
    int stopCheckIntervalMs{100};
    int maxStopChecks{20};

    [[nodiscard]] json serialize() const {
        return {{"name", name},
                {"readyTimeoutMs", readyTimeoutMs},
                {"readyPollIntervalMs", readyPollIntervalMs},
                {"settleDelayMs", settleDelayMs},
                {"existingWorkPolicy", existingWorkPolicy},
                {"stopCheckIntervalMs", stopCheckIntervalMs},
                {"maxStopChecks", maxStopChecks}};
    }

    [[nodiscard]] static WorkerConfig deserialize(const json& j) {
        WorkerConfig cfg;
        cfg.name = j.value("name", cfg.name);
        cfg.readyTimeoutMs = j.value("readyTimeoutMs", cfg.readyTimeoutMs);
        cfg.readyPollIntervalMs =
            j.value("readyPollIntervalMs", cfg.readyPollIntervalMs);
        cfg.settleDelayMs = j.value("settleDelayMs", cfg.settleDelayMs);
        cfg.existingWorkPolicy =
            j.value("existingWorkPolicy", cfg.existingWorkPolicy);
        cfg.stopCheckIntervalMs =
            j.value("stopCheckIntervalMs", cfg.stopCheckIntervalMs);
        cfg.maxStopChecks = j.value("maxStopChecks", cfg.maxStopChecks);
        return cfg;
    }
};

/**
 * @brief Command channel access control
 */
struct ControlConfig {
    static constexpr std::string_view PATH = "/control";

    bool restricted{false};  ///< Only allowedSenders may issue commands
    std::vector<std::string> allowedSenders;
    std::vector<std::string> privilegedSenders{"internal"};  ///< May read history

    [[nodiscard]] json serialize() const {
        return {{"restricted", restricted},
                {"allowedSenders", allowedSenders},
                {"privilegedSenders", privilegedSenders}};
    }

    [[nodiscard]] static ControlConfig deserialize(const json& j) {
        ControlConfig cfg;
        cfg.restricted = j.value("restricted", cfg.restricted);
        cfg.allowedSenders = j.value("allowedSenders", cfg.allowedSenders);
        cfg.privilegedSenders =
            j.value("privilegedSenders", cfg.privilegedSenders);
        return cfg;
    }
};

}  // namespace wristlink::config

#endif  // WRISTLINK_CONFIG_SECTIONS_WORKER_CONFIG_HPP
