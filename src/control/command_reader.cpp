/*
 * command_reader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_reader.hpp"

#include <string>

#include <spdlog/spdlog.h>

namespace wristlink::control {

CommandReader::CommandReader(std::istream& input, AppController& controller,
                             ReplyHandler reply)
    : input_(input), controller_(controller), reply_(std::move(reply)) {}

auto CommandReader::processLine(std::string_view line)
    -> std::optional<CommandResult> {
    auto first = line.find_first_not_of(" \t\r");
    if (first == std::string_view::npos || line[first] == '#') {
        return std::nullopt;
    }

    auto parsed = parseCommandLine(line);
    if (!parsed) {
        spdlog::warn("[CONTROL] Ignoring line '{}': {}", line, parsed.error());
        return std::nullopt;
    }

    auto command = std::move(*parsed);
    command.reply = reply_;
    auto result = controller_.handle(command);
    if (result.ok()) {
        spdlog::info("[CONTROL] {} -> {}", commandActionToId(command.action),
                     result.message);
    } else {
        spdlog::warn("[CONTROL] {} -> {}: {}",
                     commandActionToId(command.action),
                     commandStatusToString(result.status), result.message);
    }
    return result;
}

auto CommandReader::run() -> std::size_t {
    std::size_t dispatched = 0;
    std::string line;
    while (!controller_.exitRequested() && std::getline(input_, line)) {
        if (processLine(line)) {
            ++dispatched;
        }
    }
    spdlog::debug("[CONTROL] Command reader finished after {} command(s)",
                  dispatched);
    return dispatched;
}

}  // namespace wristlink::control
