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

#ifndef CURATOR_UTILS_JSON_STORE_HPP
#define CURATOR_UTILS_JSON_STORE_HPP

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

namespace curator::utils {

/**
 * @brief A single JSON document persisted with soft durability
 *
 * load() and save() never throw. A missing or unreadable document loads as
 * std::nullopt; a failed save is logged and reported through the return
 * value so callers keep running on their in-memory state.
 */
class JsonDocumentStore {
public:
    explicit JsonDocumentStore(std::filesystem::path path);

    [[nodiscard]] auto load() const -> std::optional<nlohmann::json>;

    auto save(const nlohmann::json& document) const -> bool;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

private:
    std::filesystem::path path_;
};

}  // namespace curator::utils

#endif  // CURATOR_UTILS_JSON_STORE_HPP
