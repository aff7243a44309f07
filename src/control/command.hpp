/*
 * command.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Control-channel commands and their wire form

**************************************************/

#ifndef WRISTLINK_CONTROL_COMMAND_HPP
#define WRISTLINK_CONTROL_COMMAND_HPP

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace wristlink::control {

enum class CommandAction { Start, Stop, Ping, RequestHistory, Terminate };

/**
 * @brief Stable action identifiers
 */
namespace action_id {
inline constexpr std::string_view START = "wristlink.command.START";
inline constexpr std::string_view STOP = "wristlink.command.STOP";
inline constexpr std::string_view PING = "wristlink.command.PING";
inline constexpr std::string_view REQUEST_HISTORY =
    "wristlink.command.REQUEST_HISTORY";
inline constexpr std::string_view TERMINATE = "wristlink.command.TERMINATE";
}  // namespace action_id

[[nodiscard]] auto commandActionToId(CommandAction action) -> std::string;

/**
 * @brief Accepts the full action id or a short alias
 * (start, stop, ping, history, terminate), aliases case-insensitive
 */
[[nodiscard]] auto commandActionFromString(std::string_view value)
    -> std::optional<CommandAction>;

/**
 * @brief Private reply channel of the requesting component
 */
using ReplyHandler = std::function<void(const std::string&)>;

struct Command {
    CommandAction action{CommandAction::Ping};
    std::string sender{"external"};
    std::string reason;  ///< free text, used by stop/terminate
    ReplyHandler reply;
};

enum class CommandStatus { Accepted, Rejected, Unauthorized, Failed };

[[nodiscard]] auto commandStatusToString(CommandStatus status) -> std::string;

struct CommandResult {
    CommandStatus status{CommandStatus::Accepted};
    std::string message;

    [[nodiscard]] auto ok() const -> bool {
        return status == CommandStatus::Accepted;
    }
};

/**
 * @brief Parse `<action> [sender] [reason...]`
 * @return the command, or a description of what is wrong with the line
 */
[[nodiscard]] auto parseCommandLine(std::string_view line)
    -> std::expected<Command, std::string>;

}  // namespace wristlink::control

#endif  // WRISTLINK_CONTROL_COMMAND_HPP
