/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-01

Description: Errors raised while loading the curator configuration

**************************************************/

#ifndef CURATOR_CONFIG_CORE_EXCEPTION_HPP
#define CURATOR_CONFIG_CORE_EXCEPTION_HPP

#include "exception/exception.hpp"

namespace curator::config {

/**
 * @brief Common base of configuration errors
 *
 * The CLI catches this type to fail with a non-zero exit code.
 */
class BadConfigException : public curator::CuratorException {
    using curator::CuratorException::CuratorException;
};

/**
 * @brief Malformed document, wrongly typed value or a value outside the
 *        range declared by the section schema
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)        \
    throw curator::config::InvalidConfigException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Configuration file could not be opened
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                       \
    throw curator::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                             ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace curator::config

#endif  // CURATOR_CONFIG_CORE_EXCEPTION_HPP
