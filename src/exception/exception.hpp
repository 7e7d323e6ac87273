// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Curator - A music library recommendation core
 * Copyright (C) 2024 Max Qian
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef CURATOR_EXCEPTION_EXCEPTION_HPP
#define CURATOR_EXCEPTION_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace curator {

/**
 * @brief Root of every exception thrown by the recommendation core
 */
class CuratorException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_CURATOR_EXCEPTION(...)                                 \
    throw curator::CuratorException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief A required collaborator was not supplied at construction time
 */
class MissingDependencyException : public CuratorException {
    using CuratorException::CuratorException;
};

#define THROW_MISSING_DEPENDENCY(...)                  \
    throw curator::MissingDependencyException(         \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief The generative provider failed to return a usable batch
 */
class ProviderException : public CuratorException {
    using CuratorException::CuratorException;
};

#define THROW_PROVIDER_EXCEPTION(...)                                  \
    throw curator::ProviderException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                     ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief The caller's stop token was triggered while waiting
 */
class OperationCancelledException : public CuratorException {
    using CuratorException::CuratorException;
};

#define THROW_OPERATION_CANCELLED(...)                 \
    throw curator::OperationCancelledException(        \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief A durable document could not be written
 */
class PersistenceException : public CuratorException {
    using CuratorException::CuratorException;
};

#define THROW_PERSISTENCE_EXCEPTION(...)                                  \
    throw curator::PersistenceException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace curator

#endif  // CURATOR_EXCEPTION_EXCEPTION_HPP
