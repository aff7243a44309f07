/*
 * command_reader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Line-oriented control channel over an input stream

**************************************************/

#ifndef WRISTLINK_CONTROL_COMMAND_READER_HPP
#define WRISTLINK_CONTROL_COMMAND_READER_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <string_view>

#include "app_controller.hpp"
#include "command.hpp"

namespace wristlink::control {

/**
 * @brief Reads one command per line and hands it to the controller.
 *
 * Blank lines and lines starting with '#' are skipped. Replies to
 * history requests go to @p reply, never to the broadcast bus.
 */
class CommandReader {
public:
    CommandReader(std::istream& input, AppController& controller,
                  ReplyHandler reply);

    /**
     * @brief Process lines until EOF or a terminate command
     * @return number of commands dispatched
     */
    auto run() -> std::size_t;

    /**
     * @brief Dispatch a single line
     * @return the controller's result, nullopt for skipped or invalid lines
     */
    auto processLine(std::string_view line) -> std::optional<CommandResult>;

private:
    std::istream& input_;
    AppController& controller_;
    ReplyHandler reply_;
};

}  // namespace wristlink::control

#endif  // WRISTLINK_CONTROL_COMMAND_READER_HPP
