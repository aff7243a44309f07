/*
 * relay_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "relay_config.hpp"

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

#include "core/exception.hpp"

namespace wristlink::config {

namespace {

auto section(const json& j, std::string_view path) -> json {
    // PATH constants are "/name"
    auto key = std::string(path.substr(1));
    if (j.contains(key) && j[key].is_object()) {
        return j[key];
    }
    return json::object();
}

auto isLogLevel(const std::string& level) -> bool {
    static const std::vector<std::string> kLevels = {
        "trace", "debug", "info", "warn", "warning",
        "error", "err",   "critical", "off"};
    return std::find(kLevels.begin(), kLevels.end(), level) != kLevels.end();
}

}  // namespace

json RelayConfig::serialize() const {
    return {{"session", session.serialize()},
            {"worker", worker.serialize()},
            {"history", history.serialize()},
            {"control", control.serialize()},
            {"logging", logging.serialize()},
            {"sdk", sdk.serialize()}};
}

RelayConfig RelayConfig::deserialize(const json& j) {
    RelayConfig cfg;
    cfg.session = SessionConfig::deserialize(section(j, SessionConfig::PATH));
    cfg.worker = WorkerConfig::deserialize(section(j, WorkerConfig::PATH));
    cfg.history = HistoryConfig::deserialize(section(j, HistoryConfig::PATH));
    cfg.control = ControlConfig::deserialize(section(j, ControlConfig::PATH));
    cfg.logging = LoggingConfig::deserialize(section(j, LoggingConfig::PATH));
    cfg.sdk = SdkConfig::deserialize(section(j, SdkConfig::PATH));
    return cfg;
}

auto collectErrors(const RelayConfig& config) -> std::vector<std::string> {
    std::vector<std::string> errors;

    if (config.session.appId.empty()) {
        errors.emplace_back("session.appId must not be empty");
    }
    if (config.session.discoveryDelayMs < 0) {
        errors.emplace_back("session.discoveryDelayMs must not be negative");
    }
    if (config.session.initWaitTimeoutMs <= 0) {
        errors.emplace_back("session.initWaitTimeoutMs must be positive");
    }
    if (config.session.recoveryTimeoutMs <= 0) {
        errors.emplace_back("session.recoveryTimeoutMs must be positive");
    }

    if (config.worker.name.empty()) {
        errors.emplace_back("worker.name must not be empty");
    }
    if (config.worker.readyTimeoutMs <= 0) {
        errors.emplace_back("worker.readyTimeoutMs must be positive");
    }
    if (config.worker.readyPollIntervalMs <= 0) {
        errors.emplace_back("worker.readyPollIntervalMs must be positive");
    }
    if (config.worker.settleDelayMs < 0) {
        errors.emplace_back("worker.settleDelayMs must not be negative");
    }
    const auto& policy = config.worker.existingWorkPolicy;
    if (policy != "keep" && policy != "replace" && policy != "reject") {
        errors.push_back("worker.existingWorkPolicy '" + policy +
                         "' is not one of keep, replace, reject");
    }
    if (config.worker.stopCheckIntervalMs <= 0) {
        errors.emplace_back("worker.stopCheckIntervalMs must be positive");
    }
    if (config.worker.maxStopChecks <= 0) {
        errors.emplace_back("worker.maxStopChecks must be positive");
    }

    if (config.history.capacity == 0) {
        errors.emplace_back("history.capacity must be positive");
    }

    if (config.control.restricted && config.control.allowedSenders.empty()) {
        errors.emplace_back(
            "control.allowedSenders must not be empty when restricted");
    }

    if (!isLogLevel(config.logging.consoleLevel)) {
        errors.push_back("logging.consoleLevel '" +
                         config.logging.consoleLevel + "' is unknown");
    }
    if (!isLogLevel(config.logging.fileLevel)) {
        errors.push_back("logging.fileLevel '" + config.logging.fileLevel +
                         "' is unknown");
    }
    if (config.logging.enableFile && config.logging.maxFiles == 0) {
        errors.emplace_back("logging.maxFiles must be positive");
    }

    if (config.sdk.backend != "replay") {
        errors.push_back("sdk.backend '" + config.sdk.backend +
                         "' is not supported");
    }
    return errors;
}

void validate(const RelayConfig& config) {
    auto errors = collectErrors(config);
    if (errors.empty()) {
        return;
    }
    std::string message;
    for (const auto& error : errors) {
        message += "\n  - " + error;
    }
    THROW_CONFIG_VALIDATION_EXCEPTION("invalid configuration:", message);
}

void applyOverrides(RelayConfig& config,
                    const CommandLineOverrides& overrides) {
    if (overrides.logLevel && !overrides.logLevel->empty()) {
        config.logging.consoleLevel = *overrides.logLevel;
    }
    if (overrides.scriptPath && !overrides.scriptPath->empty()) {
        config.sdk.scriptPath = *overrides.scriptPath;
    }
}

auto loadConfigFile(const std::filesystem::path& path) -> RelayConfig {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_CONFIG_IO_EXCEPTION("cannot open configuration file ",
                                  path.string());
    }

    json j;
    try {
        j = json::parse(file, nullptr, true, true);
    } catch (const json::exception& e) {
        THROW_CONFIG_IO_EXCEPTION("cannot parse ", path.string(), ": ",
                                  e.what());
    }
    if (!j.is_object()) {
        THROW_CONFIG_IO_EXCEPTION(path.string(), " is not a JSON object");
    }

    RelayConfig cfg;
    try {
        cfg = RelayConfig::deserialize(j);
    } catch (const json::exception& e) {
        THROW_CONFIG_VALIDATION_EXCEPTION("wrong value type in ",
                                          path.string(), ": ", e.what());
    }
    validate(cfg);
    spdlog::info("Loaded configuration from {}", path.string());
    return cfg;
}

}  // namespace wristlink::config
