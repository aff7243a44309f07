/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Configuration Exception Types

**************************************************/

#ifndef WRISTLINK_CONFIG_CORE_EXCEPTION_HPP
#define WRISTLINK_CONFIG_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace wristlink::config {

/**
 * @brief Base exception for configuration errors
 */
class ConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_CONFIG_EXCEPTION(...)                                        \
    throw wristlink::config::ConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                             ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Configuration file could not be read or parsed
 */
class ConfigIOException : public ConfigException {
    using ConfigException::ConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                       \
    throw wristlink::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                               ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Configuration parsed but holds an unusable value
 */
class ConfigValidationException : public ConfigException {
    using ConfigException::ConfigException;
};

#define THROW_CONFIG_VALIDATION_EXCEPTION(...)          \
    throw wristlink::config::ConfigValidationException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace wristlink::config

#endif  // WRISTLINK_CONFIG_CORE_EXCEPTION_HPP
