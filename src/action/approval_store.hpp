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

#ifndef CURATOR_ACTION_APPROVAL_STORE_HPP
#define CURATOR_ACTION_APPROVAL_STORE_HPP

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "utils/json_store.hpp"

namespace curator::action {

/**
 * @brief Selection keys ("Artist|Album") staged by the user for batch actions
 */
class IApprovalStore {
public:
    virtual ~IApprovalStore() = default;

    [[nodiscard]] virtual auto loadKeys() const -> std::vector<std::string> = 0;

    /// @return false when the selection could not be persisted
    virtual auto saveKeys(const std::vector<std::string>& keys) -> bool = 0;
};

class InMemoryApprovalStore : public IApprovalStore {
public:
    explicit InMemoryApprovalStore(std::vector<std::string> keys = {});

    [[nodiscard]] auto loadKeys() const -> std::vector<std::string> override;
    auto saveKeys(const std::vector<std::string>& keys) -> bool override;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> keys_;
};

/**
 * @brief Selection persisted as {"keys": [...]} in a JSON document
 */
class FileApprovalStore : public IApprovalStore {
public:
    explicit FileApprovalStore(std::filesystem::path path);

    [[nodiscard]] auto loadKeys() const -> std::vector<std::string> override;
    auto saveKeys(const std::vector<std::string>& keys) -> bool override;

private:
    utils::JsonDocumentStore store_;
};

}  // namespace curator::action

#endif  // CURATOR_ACTION_APPROVAL_STORE_HPP
