/*
 * app_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "app_controller.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "message/events.hpp"

namespace wristlink::control {

namespace {

auto contains(const std::vector<std::string>& values, const std::string& value)
    -> bool {
    return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

AppController::AppController(sdk::SessionManager& session,
                             events::EventDispatcher& dispatcher,
                             worker::WorkerManager& workers,
                             ControllerOptions options,
                             std::function<void()> onExit)
    : session_(session),
      dispatcher_(dispatcher),
      workers_(workers),
      options_(std::move(options)),
      onExit_(std::move(onExit)) {}

auto AppController::isAllowed(const std::string& sender) const -> bool {
    if (!options_.restricted) {
        return true;
    }
    return contains(options_.allowedSenders, sender) || isPrivileged(sender);
}

auto AppController::isPrivileged(const std::string& sender) const -> bool {
    return contains(options_.privilegedSenders, sender);
}

auto AppController::handle(const Command& command) -> CommandResult {
    auto id = commandActionToId(command.action);
    if (!isAllowed(command.sender)) {
        spdlog::warn("[CONTROL] Rejected {} from unauthorized sender '{}'", id,
                     command.sender);
        return {CommandStatus::Unauthorized,
                "sender '" + command.sender + "' is not allowed"};
    }

    spdlog::debug("[CONTROL] {} from '{}'", id, command.sender);
    switch (command.action) {
        case CommandAction::Start:
            return handleStart(command);
        case CommandAction::Stop:
            return handleStop(command);
        case CommandAction::Ping:
            return handlePing(command);
        case CommandAction::RequestHistory:
            return handleHistory(command);
        case CommandAction::Terminate:
            return handleTerminate(command);
    }
    return {CommandStatus::Failed, "unhandled action"};
}

auto AppController::handleStart(const Command& /*command*/) -> CommandResult {
    if (exitRequested_.load()) {
        return {CommandStatus::Rejected, "terminating"};
    }
    auto outcome = workers_.start(options_.workerName);
    auto text = worker::startOutcomeToString(outcome);
    if (outcome == worker::StartOutcome::Rejected) {
        return {CommandStatus::Rejected, text};
    }
    return {CommandStatus::Accepted, text};
}

auto AppController::handleStop(const Command& command) -> CommandResult {
    auto reason = command.reason.empty()
                      ? "stopped by " + command.sender
                      : command.reason;
    auto outcome = workers_.stop(options_.workerName, reason);
    auto text = worker::stopOutcomeToString(outcome);
    if (outcome == worker::StopOutcome::TimedOut) {
        return {CommandStatus::Failed, text};
    }
    return {CommandStatus::Accepted, text};
}

auto AppController::handlePing(const Command& /*command*/) -> CommandResult {
    auto startTime = workers_.startTime(options_.workerName);
    dispatcher_.publish(message::PongEvent{startTime});
    return {CommandStatus::Accepted, "pong"};
}

auto AppController::handleHistory(const Command& command) -> CommandResult {
    if (!isPrivileged(command.sender)) {
        spdlog::warn("[CONTROL] History request from '{}' refused",
                     command.sender);
        return {CommandStatus::Unauthorized,
                "history is only available to privileged senders"};
    }
    if (!command.reply) {
        return {CommandStatus::Failed, "no reply handler"};
    }
    command.reply(dispatcher_.history());
    return {CommandStatus::Accepted, "history sent"};
}

auto AppController::handleTerminate(const Command& command) -> CommandResult {
    auto reason = command.reason.empty() ? std::string("terminated")
                                         : command.reason;
    spdlog::info("[CONTROL] Terminating: {}", reason);

    auto outcome = workers_.stop(options_.workerName, reason);
    session_.reset();
    dispatcher_.clearHistory();

    // a worker that was stopped already published its own Terminated
    if (outcome == worker::StopOutcome::NotRunning) {
        dispatcher_.publish(message::TerminatedEvent{reason});
    } else if (outcome == worker::StopOutcome::TimedOut) {
        spdlog::warn("[CONTROL] Listener did not stop in time");
    }
    dispatcher_.markStopped();

    exitRequested_.store(true);
    if (onExit_) {
        onExit_();
    }
    return {CommandStatus::Accepted, reason};
}

auto AppController::isListenerRunning() const -> bool {
    return workers_.isRunning(options_.workerName);
}

}  // namespace wristlink::control
