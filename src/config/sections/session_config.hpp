/*
 * session_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: SDK session, SDK backend and history configuration sections

**************************************************/

#ifndef WRISTLINK_CONFIG_SECTIONS_SESSION_CONFIG_HPP
#define WRISTLINK_CONFIG_SECTIONS_SESSION_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wristlink::config {

using json = nlohmann::json;

/**
 * @brief SDK session behaviour
 */
struct SessionConfig {
    static constexpr std::string_view PATH = "/session";

    std::string appId{"7b408c6e-fc9c-4080-bad4-97a3557fc995"};  ///< Watch app UUID
    std::int64_t simulatorDeviceId{12345};     ///< Id reserved for the simulator
    std::string simulatorNamePattern{"simulator"};
    int discoveryDelayMs{500};     ///< Wait before enumerating known devices
    int initWaitTimeoutMs{8000};   ///< How long late init() callers block
    int recoveryTimeoutMs{5000};   ///< Recovery guard release bound

    [[nodiscard]] json serialize() const {
        return {{"appId", appId},
                {"simulatorDeviceId", simulatorDeviceId},
                {"simulatorNamePattern", simulatorNamePattern},
                {"discoveryDelayMs", discoveryDelayMs},
                {"initWaitTimeoutMs", initWaitTimeoutMs},
                {"recoveryTimeoutMs", recoveryTimeoutMs}};
    }

    [[nodiscard]] static SessionConfig deserialize(const json& j) {
        SessionConfig cfg;
        cfg.appId = j.value("appId", cfg.appId);
        cfg.simulatorDeviceId =
            j.value("simulatorDeviceId", cfg.simulatorDeviceId);
        cfg.simulatorNamePattern =
            j.value("simulatorNamePattern", cfg.simulatorNamePattern);
        cfg.discoveryDelayMs = j.value("discoveryDelayMs", cfg.discoveryDelayMs);
        cfg.initWaitTimeoutMs =
            j.value("initWaitTimeoutMs", cfg.initWaitTimeoutMs);
        cfg.recoveryTimeoutMs =
            j.value("recoveryTimeoutMs", cfg.recoveryTimeoutMs);
        return cfg;
    }
};

/**
 * @brief Which SDK backend drives the session
 */
struct SdkConfig {
    static constexpr std::string_view PATH = "/sdk";

    std::string backend{"replay"};
    std::string scriptPath;  ///< Replay scenario file

    [[nodiscard]] json serialize() const {
        return {{"backend", backend}, {"scriptPath", scriptPath}};
    }

    [[nodiscard]] static SdkConfig deserialize(const json& j) {
        SdkConfig cfg;
        cfg.backend = j.value("backend", cfg.backend);
        cfg.scriptPath = j.value("scriptPath", cfg.scriptPath);
        return cfg;
    }
};

struct HistoryConfig {
    static constexpr std::string_view PATH = "/history";

    std::size_t capacity{100};

    [[nodiscard]] json serialize() const { return {{"capacity", capacity}}; }

    [[nodiscard]] static HistoryConfig deserialize(const json& j) {
        HistoryConfig cfg;
        cfg.capacity = j.value("capacity", cfg.capacity);
        return cfg;
    }
};

}  // namespace wristlink::config

#endif  // WRISTLINK_CONFIG_SECTIONS_SESSION_CONFIG_HPP
