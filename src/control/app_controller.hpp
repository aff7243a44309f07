/*
 * app_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Executes control-channel commands against the listener

**************************************************/

#ifndef WRISTLINK_CONTROL_APP_CONTROLLER_HPP
#define WRISTLINK_CONTROL_APP_CONTROLLER_HPP

#include <atomic>
#include <functional>
#include <string>
#include <vector>

#include "command.hpp"
#include "events/event_dispatcher.hpp"
#include "sdk/session_manager.hpp"
#include "worker/worker_manager.hpp"

namespace wristlink::control {

struct ControllerOptions {
    std::string workerName{"wristlink_listener"};
    bool restricted{false};
    std::vector<std::string> allowedSenders;
    std::vector<std::string> privilegedSenders{"internal"};
};

/**
 * @brief Command handler.
 *
 * Start/Stop drive the worker manager, Ping publishes exactly one Pong,
 * RequestHistory answers on the requester's reply handler only, and
 * Terminate tears everything down and requests process exit.
 */
class AppController {
public:
    AppController(sdk::SessionManager& session,
                  events::EventDispatcher& dispatcher,
                  worker::WorkerManager& workers, ControllerOptions options,
                  std::function<void()> onExit = {});

    AppController(const AppController&) = delete;
    AppController& operator=(const AppController&) = delete;

    auto handle(const Command& command) -> CommandResult;

    [[nodiscard]] auto isListenerRunning() const -> bool;
    [[nodiscard]] auto exitRequested() const -> bool {
        return exitRequested_.load();
    }

private:
    auto handleStart(const Command& command) -> CommandResult;
    auto handleStop(const Command& command) -> CommandResult;
    auto handlePing(const Command& command) -> CommandResult;
    auto handleHistory(const Command& command) -> CommandResult;
    auto handleTerminate(const Command& command) -> CommandResult;

    [[nodiscard]] auto isAllowed(const std::string& sender) const -> bool;
    [[nodiscard]] auto isPrivileged(const std::string& sender) const -> bool;

    sdk::SessionManager& session_;
    events::EventDispatcher& dispatcher_;
    worker::WorkerManager& workers_;
    ControllerOptions options_;
    std::function<void()> onExit_;
    std::atomic<bool> exitRequested_{false};
};

}  // namespace wristlink::control

#endif  // WRISTLINK_CONTROL_APP_CONTROLLER_HPP
