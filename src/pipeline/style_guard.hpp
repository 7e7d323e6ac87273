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

#ifndef CURATOR_PIPELINE_STYLE_GUARD_HPP
#define CURATOR_PIPELINE_STYLE_GUARD_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace curator::pipeline {

/**
 * @brief Restricts a batch to the configured styles
 *
 * Genres and filters are compared as slugs, so "Progressive Rock" matches
 * the filter "progressive-rock". A genre field may carry several tags
 * separated by ',', ';', '/' or '|'.
 *
 * With strict matching, items sharing no tag with the filters are removed.
 * With relaxed matching nothing is removed: matching items come first and
 * the others follow, each group in its original order.
 */
class StyleGuard {
public:
    [[nodiscard]] auto apply(const std::vector<Recommendation>& items,
                             const std::vector<std::string>& styleFilters,
                             bool relaxed) const -> StageResult;

    [[nodiscard]] static auto matches(const Recommendation& item,
                                      const std::vector<std::string>& slugs)
        -> bool;
};

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_STYLE_GUARD_HPP
