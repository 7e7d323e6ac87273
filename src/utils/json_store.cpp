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

#include "json_store.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

#include "atomic_file_writer.hpp"
#include "exception/exception.hpp"

namespace curator::utils {

JsonDocumentStore::JsonDocumentStore(std::filesystem::path path)
    : path_(std::move(path)) {}

auto JsonDocumentStore::load() const -> std::optional<nlohmann::json> {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::debug("No document at {}, starting empty", path_.string());
        return std::nullopt;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        spdlog::warn("Cannot open {}, starting empty", path_.string());
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("Failed to parse {}: {}. Starting empty",
                     path_.string(), e.what());
        return std::nullopt;
    }
}

auto JsonDocumentStore::save(const nlohmann::json& document) const -> bool {
    try {
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }
        AtomicFileWriter writer(path_);
        writer.write(document.dump(
            2, ' ', false, nlohmann::json::error_handler_t::replace));
        writer.commit();
        return true;
    } catch (const PersistenceException& e) {
        spdlog::error("Failed to save {}: {}", path_.string(), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to prepare {}: {}", path_.string(), e.what());
    }
    return false;
}

}  // namespace curator::utils
