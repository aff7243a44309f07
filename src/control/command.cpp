/*
 * command.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <vector>

namespace wristlink::control {

namespace {

auto toLower(std::string_view value) -> std::string {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

auto tokenize(std::string_view line) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() &&
               std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        auto begin = pos;
        while (pos < line.size() &&
               !std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        if (pos > begin) {
            tokens.push_back(line.substr(begin, pos - begin));
        }
    }
    return tokens;
}

}  // namespace

auto commandActionToId(CommandAction action) -> std::string {
    switch (action) {
        case CommandAction::Start:
            return std::string(action_id::START);
        case CommandAction::Stop:
            return std::string(action_id::STOP);
        case CommandAction::Ping:
            return std::string(action_id::PING);
        case CommandAction::RequestHistory:
            return std::string(action_id::REQUEST_HISTORY);
        case CommandAction::Terminate:
            return std::string(action_id::TERMINATE);
    }
    return "";
}

auto commandActionFromString(std::string_view value)
    -> std::optional<CommandAction> {
    static const std::unordered_map<std::string_view, CommandAction> kIds = {
        {action_id::START, CommandAction::Start},
        {action_id::STOP, CommandAction::Stop},
        {action_id::PING, CommandAction::Ping},
        {action_id::REQUEST_HISTORY, CommandAction::RequestHistory},
        {action_id::TERMINATE, CommandAction::Terminate},
    };
    static const std::unordered_map<std::string, CommandAction> kAliases = {
        {"start", CommandAction::Start},
        {"stop", CommandAction::Stop},
        {"ping", CommandAction::Ping},
        {"history", CommandAction::RequestHistory},
        {"terminate", CommandAction::Terminate},
    };

    if (auto it = kIds.find(value); it != kIds.end()) {
        return it->second;
    }
    if (auto it = kAliases.find(toLower(value)); it != kAliases.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto commandStatusToString(CommandStatus status) -> std::string {
    switch (status) {
        case CommandStatus::Accepted:
            return "Accepted";
        case CommandStatus::Rejected:
            return "Rejected";
        case CommandStatus::Unauthorized:
            return "Unauthorized";
        case CommandStatus::Failed:
            return "Failed";
    }
    return "Unknown";
}

auto parseCommandLine(std::string_view line)
    -> std::expected<Command, std::string> {
    auto tokens = tokenize(line);
    if (tokens.empty()) {
        return std::unexpected(std::string("empty command"));
    }

    auto action = commandActionFromString(tokens[0]);
    if (!action) {
        return std::unexpected("unknown action '" + std::string(tokens[0]) +
                               "'");
    }

    Command command;
    command.action = *action;
    if (tokens.size() > 1) {
        command.sender = std::string(tokens[1]);
    }
    for (std::size_t i = 2; i < tokens.size(); ++i) {
        if (!command.reason.empty()) {
            command.reason += ' ';
        }
        command.reason += tokens[i];
    }
    return command;
}

}  // namespace wristlink::control
