/*
 * sdk_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: SDK lifecycle error codes and std::expected result types

**************************************************/

#ifndef WRISTLINK_SDK_SDK_ERROR_HPP
#define WRISTLINK_SDK_SDK_ERROR_HPP

#include <expected>
#include <string>

namespace wristlink::sdk {

/**
 * @brief SDK error codes
 */
enum class SdkErrorCode {
    NotInitialized,       // stale handle, the service binding was lost
    InitTimeout,          // bring-up exceeded its bound
    InitError,            // SDK reported an initialization error
    AlreadyInitializing,  // another init is in flight
    ShutDown,             // session was closed for good
    OperationFailed
};

[[nodiscard]] inline auto sdkErrorCodeToString(SdkErrorCode code)
    -> std::string {
    switch (code) {
        case SdkErrorCode::NotInitialized:
            return "NotInitialized";
        case SdkErrorCode::InitTimeout:
            return "InitTimeout";
        case SdkErrorCode::InitError:
            return "InitError";
        case SdkErrorCode::AlreadyInitializing:
            return "AlreadyInitializing";
        case SdkErrorCode::ShutDown:
            return "ShutDown";
        case SdkErrorCode::OperationFailed:
            return "OperationFailed";
    }
    return "Unknown";
}

/**
 * @brief Error carried through SdkResult
 */
struct SdkError {
    SdkErrorCode code{SdkErrorCode::OperationFailed};
    std::string message;

    SdkError() = default;
    SdkError(SdkErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] auto toString() const -> std::string {
        return "[" + sdkErrorCodeToString(code) + "] " + message;
    }
};

template <typename T>
using SdkResult = std::expected<T, SdkError>;

using SdkVoidResult = SdkResult<void>;

[[nodiscard]] inline auto sdkFailure(SdkErrorCode code, std::string message)
    -> std::unexpected<SdkError> {
    return std::unexpected(SdkError(code, std::move(message)));
}

}  // namespace wristlink::sdk

#endif  // WRISTLINK_SDK_SDK_ERROR_HPP
