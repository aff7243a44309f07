/*
 * message_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Parser for the watch app wire format
             `EVENT_CODE|watchTimeSeconds|activityType|durationSeconds`

**************************************************/

#ifndef WRISTLINK_MESSAGE_MESSAGE_PARSER_HPP
#define WRISTLINK_MESSAGE_MESSAGE_PARSER_HPP

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "events.hpp"

namespace wristlink::message {

/**
 * @brief Reasons a wire payload is rejected
 */
enum class ParseErrorCode {
    MalformedPayload,  ///< fewer than four `|` separated fields
    UnknownEventCode,
    InvalidField  ///< a numeric field did not parse
};

[[nodiscard]] inline auto parseErrorCodeToString(ParseErrorCode code)
    -> std::string {
    switch (code) {
        case ParseErrorCode::MalformedPayload:
            return "MalformedPayload";
        case ParseErrorCode::UnknownEventCode:
            return "UnknownEventCode";
        case ParseErrorCode::InvalidField:
            return "InvalidField";
    }
    return "Unknown";
}

struct ParseError {
    ParseErrorCode code;
    std::string detail;

    [[nodiscard]] auto toString() const -> std::string {
        return parseErrorCodeToString(code) + ": " + detail;
    }
};

template <typename T>
using ParseResult = std::expected<T, ParseError>;

/**
 * @brief Parse one wire payload into an activity payload.
 *
 * STARTED / ACTIVITY_STARTED yield ActivityStartedEvent, STOPPED /
 * ACTIVITY_STOPPED yield ActivityStoppedEvent. The device field is left
 * empty for the caller to fill in. Duration of a started activity is always
 * zero. Extra trailing fields are ignored.
 *
 * Pure and deterministic.
 */
[[nodiscard]] auto parseMessage(std::string_view raw)
    -> ParseResult<EventPayload>;

/**
 * @brief Join the message objects of one SDK delivery into a wire payload.
 */
[[nodiscard]] auto joinMessageParts(const std::vector<std::string>& parts)
    -> std::string;

}  // namespace wristlink::message

#endif  // WRISTLINK_MESSAGE_MESSAGE_PARSER_HPP
