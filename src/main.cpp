/*
 * main.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: wristlink daemon entry point

**************************************************/

#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "config/core/exception.hpp"
#include "config/relay_config.hpp"
#include "control/app_controller.hpp"
#include "control/command_reader.hpp"
#include "events/event_bus.hpp"
#include "events/event_dispatcher.hpp"
#include "events/notification.hpp"
#include "logging/logging.hpp"
#include "sdk/replay_sdk.hpp"
#include "sdk/sdk_exceptions.hpp"
#include "sdk/session_manager.hpp"
#include "worker/session_worker.hpp"
#include "worker/worker_manager.hpp"

using namespace std::string_literals;

namespace {

auto toSessionOptions(const wristlink::config::SessionConfig& config)
    -> wristlink::sdk::SessionOptions {
    wristlink::sdk::SessionOptions options;
    options.appId = config.appId;
    options.discoveryDelay = std::chrono::milliseconds(config.discoveryDelayMs);
    options.initWaitTimeout =
        std::chrono::milliseconds(config.initWaitTimeoutMs);
    options.recoveryTimeout =
        std::chrono::milliseconds(config.recoveryTimeoutMs);
    return options;
}

auto toWorkerOptions(const wristlink::config::WorkerConfig& config)
    -> wristlink::worker::WorkerOptions {
    wristlink::worker::WorkerOptions options;
    options.name = config.name;
    options.readyTimeout = std::chrono::milliseconds(config.readyTimeoutMs);
    options.readyPollInterval =
        std::chrono::milliseconds(config.readyPollIntervalMs);
    options.settleDelay = std::chrono::milliseconds(config.settleDelayMs);
    return options;
}

auto loadScenario(const std::string& path)
    -> std::shared_ptr<wristlink::sdk::ReplayScenario> {
    if (path.empty()) {
        spdlog::warn("No replay script configured, no devices will appear");
        return std::make_shared<wristlink::sdk::ReplayScenario>();
    }
    return wristlink::sdk::ReplayScenario::loadFile(path);
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace wristlink;

    // Step 1: Default logging until the config is known
    logging::initDefaultLogging();

    // Step 2: Command line, which overrides the config file
    atom::utils::ArgumentParser program("wristlink"s);
    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "config/wristlink.json"s,
                        "Path to the config file", {"c"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s,
                        "Console log level (trace/debug/info/warn/error), "
                        "overrides the config file",
                        {"l"});
    program.addArgument("script", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Replay scenario driving the SDK backend",
                        {"s"});
    program.addArgument("autostart",
                        atom::utils::ArgumentParser::ArgType::BOOLEAN, false,
                        false, "Start the listener without a start command",
                        {"a"});
    program.addDescription("Wearable companion session relay:");
    program.addEpilog("Commands are read from stdin, events go to stdout.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    // Step 3: Configuration file, defaults when absent
    config::RelayConfig cfg;
    auto configPath = program.get<std::string>("config").value_or(
        "config/wristlink.json");
    try {
        if (std::filesystem::exists(configPath)) {
            cfg = config::loadConfigFile(configPath);
        } else {
            spdlog::info("Config file {} not found, using defaults",
                         configPath);
        }
    } catch (const config::ConfigException& e) {
        spdlog::critical("Invalid configuration: {}", e.what());
        return 1;
    }

    // Step 4: Command line overrides
    config::applyOverrides(
        cfg, {program.get<std::string>("log-level"),
              program.get<std::string>("script")});
    bool autostart = program.get<bool>("autostart").value_or(false);

    // Step 5: Final logging setup
    logging::initLogging(cfg.logging);

    std::shared_ptr<sdk::ReplayScenario> scenario;
    try {
        scenario = loadScenario(cfg.sdk.scriptPath);
    } catch (const sdk::SdkOperationException& e) {
        spdlog::critical("Cannot load replay script: {}", e.what());
        logging::shutdownLogging();
        return 1;
    }

    device::RealDeviceFilter filter{cfg.session.simulatorDeviceId,
                                    cfg.session.simulatorNamePattern};
    sdk::SessionManager session(sdk::makeReplayFactory(scenario), filter,
                                toSessionOptions(cfg.session));

    events::BroadcastBus bus;
    std::mutex stdoutMutex;
    bus.subscribe([&stdoutMutex](const message::Event& event) {
        std::lock_guard lock(stdoutMutex);
        std::cout << event.toJson().dump() << std::endl;
    });

    auto notifications = std::make_shared<events::LogNotificationSink>();
    events::EventDispatcher dispatcher(bus, notifications,
                                       cfg.history.capacity);

    auto policy = worker::existingWorkPolicyFromString(
                      cfg.worker.existingWorkPolicy)
                      .value_or(worker::ExistingWorkPolicy::Keep);
    auto workerOptions = toWorkerOptions(cfg.worker);
    worker::WorkerManager workers(
        [&session, &dispatcher, workerOptions](const std::string& name) {
            auto options = workerOptions;
            options.name = name;
            return std::make_unique<worker::SessionWorker>(session, dispatcher,
                                                           options);
        },
        policy, std::chrono::milliseconds(cfg.worker.stopCheckIntervalMs),
        cfg.worker.maxStopChecks);

    control::ControllerOptions controllerOptions;
    controllerOptions.workerName = cfg.worker.name;
    controllerOptions.restricted = cfg.control.restricted;
    controllerOptions.allowedSenders = cfg.control.allowedSenders;
    controllerOptions.privilegedSenders = cfg.control.privilegedSenders;
    control::AppController controller(
        session, dispatcher, workers, controllerOptions,
        [] { spdlog::info("Exit requested"); });

    if (autostart) {
        controller.handle({control::CommandAction::Start, "internal", "", {}});
    }

    control::CommandReader reader(
        std::cin, controller, [](const std::string& history) {
            std::cerr << history << std::endl;
        });
    reader.run();

    workers.stopAll("shutdown");
    session.close();
    spdlog::info("wristlink stopped");
    logging::shutdownLogging();
    return 0;
}
