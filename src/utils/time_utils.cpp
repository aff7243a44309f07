/*
 * time_utils.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "time_utils.hpp"

#include <condition_variable>
#include <ctime>
#include <mutex>

#include <spdlog/fmt/fmt.h>

namespace wristlink::utils {

auto formatClockTime(std::int64_t epochMillis) -> std::string {
    std::time_t seconds = static_cast<std::time_t>(epochMillis / 1000);
    auto millis = static_cast<int>(epochMillis % 1000);
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }

    std::tm local{};
    localtime_r(&seconds, &local);
    return fmt::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min,
                       local.tm_sec, millis);
}

auto interruptibleSleep(std::stop_token token,
                        std::chrono::milliseconds duration) -> bool {
    if (duration.count() <= 0) {
        return !token.stop_requested();
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, token, duration, [] { return false; });
    return !token.stop_requested();
}

}  // namespace wristlink::utils
