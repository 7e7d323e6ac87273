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

#include "cache_key_builder.hpp"

#include <algorithm>
#include <sstream>

#include "exception/exception.hpp"
#include "utils/string_utils.hpp"

namespace curator::cache {

CacheKeyBuilder::CacheKeyBuilder(
    std::shared_ptr<const IConfigVersionProvider> versionProvider)
    : versionProvider_(std::move(versionProvider)) {
    if (!versionProvider_) {
        THROW_MISSING_DEPENDENCY("CacheKeyBuilder requires a version provider");
    }
}

auto CacheKeyBuilder::canonicalForm(const CacheKeyInput& input) const
    -> std::string {
    std::vector<std::string> styles;
    styles.reserve(input.styleFilters.size());
    for (const auto& filter : input.styleFilters) {
        auto slug = utils::slugify(filter);
        if (!slug.empty()) {
            styles.push_back(std::move(slug));
        }
    }
    std::sort(styles.begin(), styles.end());
    styles.erase(std::unique(styles.begin(), styles.end()), styles.end());

    // Free-text fields are length-prefixed so no value can forge a separator.
    auto provider = utils::toLower(utils::trim(input.providerIdentity));
    auto version = versionProvider_->version();
    std::ostringstream oss;
    oss << "provider=" << provider.size() << ':' << provider
        << ";max=" << input.maxRecommendations
        << ";fp=" << input.libraryFingerprint.size() << ':'
        << input.libraryFingerprint << ";ver=" << version.size() << ':'
        << version << ";styles=";
    for (size_t i = 0; i < styles.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << styles[i];
    }
    oss << ";relax=" << (input.relaxStyleMatching ? 1 : 0)
        << ";mode=" << model::modeToString(input.mode);
    return oss.str();
}

auto CacheKeyBuilder::build(const CacheKeyInput& input) const -> std::string {
    return "rec:" + canonicalForm(input);
}

}  // namespace curator::cache
