/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>
#include <vector>

#include "sinks/sink_factory.hpp"

namespace wristlink::logging {

namespace {

constexpr const char* kLoggerName = "wristlink";

void installLogger(std::vector<spdlog::sink_ptr> sinks,
                   spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(),
                                                   sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::drop(kLoggerName);
    spdlog::set_default_logger(logger);
}

}  // namespace

auto parseLevel(const std::string& level) -> spdlog::level::level_enum {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error" || level == "err") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void initDefaultLogging() {
    installLogger({SinkFactory::createConsoleSink(spdlog::level::info)},
                  spdlog::level::info);
}

void initLogging(const config::LoggingConfig& config) {
    const auto consoleLevel = parseLevel(config.consoleLevel);
    std::vector<spdlog::sink_ptr> sinks{SinkFactory::createConsoleSink(
        consoleLevel, config.pattern, config.consoleColor)};
    auto loggerLevel = consoleLevel;

    if (config.enableFile) {
        const auto fileLevel = parseLevel(config.fileLevel);
        auto path = (std::filesystem::path(config.logDir) /
                     (config.logFilename + ".log"))
                        .string();
        try {
            sinks.push_back(SinkFactory::createRotatingFileSink(
                path, config.maxFileSize, config.maxFiles, fileLevel,
                config.pattern));
            loggerLevel = std::min(loggerLevel, fileLevel);
        } catch (const std::exception& e) {
            installLogger(sinks, consoleLevel);
            spdlog::error("Cannot open log file {}: {}", path, e.what());
            return;
        }
    }

    installLogger(std::move(sinks), loggerLevel);
    spdlog::debug("Logging initialized (console {}, file {})",
                  config.consoleLevel,
                  config.enableFile ? config.fileLevel : "off");
}

void shutdownLogging() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    spdlog::shutdown();
}

}  // namespace wristlink::logging
