/*
 * sdk_exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Exceptions raised by wearable SDK handles

**************************************************/

#ifndef WRISTLINK_SDK_SDK_EXCEPTIONS_HPP
#define WRISTLINK_SDK_SDK_EXCEPTIONS_HPP

#include "atom/error/exception.hpp"

namespace wristlink::sdk {

/**
 * @brief Raised by a device query on a handle whose service binding is gone.
 *
 * This is the only reliable signal that the SDK needs to be re-created.
 */
class SdkNotInitializedException : public atom::error::Exception {
    using Exception::Exception;
};

#define THROW_SDK_NOT_INITIALIZED(...)                                      \
    throw wristlink::sdk::SdkNotInitializedException(                       \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Raised when an SDK call fails for any other reason
 */
class SdkOperationException : public atom::error::Exception {
    using Exception::Exception;
};

#define THROW_SDK_OPERATION_ERROR(...)                                      \
    throw wristlink::sdk::SdkOperationException(                            \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace wristlink::sdk

#endif  // WRISTLINK_SDK_SDK_EXCEPTIONS_HPP
