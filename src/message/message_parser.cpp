/*
 * message_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "message_parser.hpp"

#include <charconv>
#include <cstdint>

namespace wristlink::message {

namespace {

constexpr char kSeparator = '|';
constexpr std::size_t kFieldCount = 4;

auto split(std::string_view raw) -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    std::size_t begin = 0;
    while (true) {
        auto pos = raw.find(kSeparator, begin);
        if (pos == std::string_view::npos) {
            fields.push_back(raw.substr(begin));
            break;
        }
        fields.push_back(raw.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return fields;
}

auto parseNonNegative(std::string_view field, std::string_view name)
    -> ParseResult<std::int64_t> {
    std::int64_t value = 0;
    const auto* first = field.data();
    const auto* last = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (field.empty() || ec != std::errc{} || ptr != last || value < 0) {
        return std::unexpected(ParseError{
            ParseErrorCode::InvalidField,
            std::string(name) + " '" + std::string(field) + "' is not a number"});
    }
    return value;
}

}  // namespace

auto parseMessage(std::string_view raw) -> ParseResult<EventPayload> {
    auto fields = split(raw);
    if (fields.size() < kFieldCount) {
        return std::unexpected(
            ParseError{ParseErrorCode::MalformedPayload,
                       "expected " + std::to_string(kFieldCount) +
                           " fields, got " + std::to_string(fields.size())});
    }

    const auto code = fields[0];
    const bool started = code == "STARTED" || code == "ACTIVITY_STARTED";
    const bool stopped = code == "STOPPED" || code == "ACTIVITY_STOPPED";
    if (!started && !stopped) {
        return std::unexpected(ParseError{
            ParseErrorCode::UnknownEventCode,
            "unknown event code '" + std::string(code) + "'"});
    }

    auto watchTime = parseNonNegative(fields[1], "watchTime");
    if (!watchTime) {
        return std::unexpected(watchTime.error());
    }
    std::string activity(fields[2]);

    if (started) {
        // duration is not meaningful until the activity stops
        return ActivityStartedEvent{{}, *watchTime, std::move(activity)};
    }

    auto duration = parseNonNegative(fields[3], "duration");
    if (!duration) {
        return std::unexpected(duration.error());
    }
    return ActivityStoppedEvent{{}, *watchTime, std::move(activity), *duration};
}

auto joinMessageParts(const std::vector<std::string>& parts) -> std::string {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += kSeparator;
        }
        joined += parts[i];
    }
    return joined;
}

}  // namespace wristlink::message
