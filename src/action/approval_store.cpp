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

#include "approval_store.hpp"

#include <spdlog/spdlog.h>

namespace curator::action {

InMemoryApprovalStore::InMemoryApprovalStore(std::vector<std::string> keys)
    : keys_(std::move(keys)) {}

auto InMemoryApprovalStore::loadKeys() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_;
}

auto InMemoryApprovalStore::saveKeys(const std::vector<std::string>& keys)
    -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_ = keys;
    return true;
}

FileApprovalStore::FileApprovalStore(std::filesystem::path path)
    : store_(std::move(path)) {}

auto FileApprovalStore::loadKeys() const -> std::vector<std::string> {
    auto document = store_.load();
    if (!document) {
        return {};
    }
    std::vector<std::string> keys;
    if (auto it = document->find("keys"); it != document->end() &&
                                          it->is_array()) {
        for (const auto& key : *it) {
            if (key.is_string()) {
                keys.push_back(key.get<std::string>());
            }
        }
    }
    return keys;
}

auto FileApprovalStore::saveKeys(const std::vector<std::string>& keys)
    -> bool {
    if (!store_.save({{"keys", keys}})) {
        spdlog::warn("Approval selection not persisted to {}",
                     store_.path().string());
        return false;
    }
    return true;
}

}  // namespace curator::action
