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

#include "style_guard.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "utils/string_utils.hpp"

namespace curator::pipeline {

namespace {

auto toSlugs(const std::vector<std::string>& filters)
    -> std::vector<std::string> {
    std::vector<std::string> slugs;
    for (const auto& filter : filters) {
        auto slug = utils::slugify(filter);
        if (!slug.empty() &&
            std::find(slugs.begin(), slugs.end(), slug) == slugs.end()) {
            slugs.push_back(std::move(slug));
        }
    }
    return slugs;
}

}  // namespace

auto StyleGuard::matches(const Recommendation& item,
                         const std::vector<std::string>& slugs) -> bool {
    for (const auto& tag : utils::splitTags(item.genre)) {
        auto slug = utils::slugify(tag);
        if (std::find(slugs.begin(), slugs.end(), slug) != slugs.end()) {
            return true;
        }
    }
    return false;
}

auto StyleGuard::apply(const std::vector<Recommendation>& items,
                       const std::vector<std::string>& styleFilters,
                       bool relaxed) const -> StageResult {
    auto slugs = toSlugs(styleFilters);
    if (slugs.empty()) {
        return {items, {}};
    }

    StageResult result;
    std::vector<Recommendation> outOfStyle;
    for (const auto& item : items) {
        if (matches(item, slugs)) {
            result.kept.push_back(item);
        } else if (relaxed) {
            outOfStyle.push_back(item);
        } else {
            result.filtered.push_back(
                {item, PipelineStage::StyleGuard,
                 "style mismatch: " +
                     (item.genre.empty() ? std::string("no genre")
                                         : item.genre)});
        }
    }

    result.kept.insert(result.kept.end(), outOfStyle.begin(),
                       outOfStyle.end());
    if (!result.filtered.empty()) {
        spdlog::debug("Style guard removed {} of {} items",
                      result.filtered.size(), items.size());
    }
    return result;
}

}  // namespace curator::pipeline
