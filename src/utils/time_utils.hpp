/*
 * time_utils.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Wall-clock helpers and cancellable sleeps

**************************************************/

#ifndef WRISTLINK_UTILS_TIME_UTILS_HPP
#define WRISTLINK_UTILS_TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>

namespace wristlink::utils {

/**
 * @brief Source of wall-clock milliseconds since epoch.
 *
 * Components take a Clock instead of calling the system clock directly so
 * tests can pin receive times.
 */
using Clock = std::function<std::int64_t()>;

/**
 * @brief Milliseconds since the Unix epoch.
 */
[[nodiscard]] inline auto nowMillis() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Seconds since the Unix epoch.
 */
[[nodiscard]] inline auto nowSeconds() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Format an epoch timestamp as local `HH:MM:SS.mmm`.
 */
[[nodiscard]] auto formatClockTime(std::int64_t epochMillis) -> std::string;

/**
 * @brief Sleep for the given duration unless a stop is requested first.
 *
 * @return true if the full duration elapsed, false if the token fired
 */
auto interruptibleSleep(std::stop_token token,
                        std::chrono::milliseconds duration) -> bool;

}  // namespace wristlink::utils

#endif  // WRISTLINK_UTILS_TIME_UTILS_HPP
