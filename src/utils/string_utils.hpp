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

#ifndef CURATOR_UTILS_STRING_UTILS_HPP
#define CURATOR_UTILS_STRING_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace curator::utils {

/**
 * @brief ASCII lower-case copy of a string
 */
[[nodiscard]] auto toLower(std::string_view text) -> std::string;

/**
 * @brief Copy with leading and trailing whitespace removed
 */
[[nodiscard]] auto trim(std::string_view text) -> std::string;

/**
 * @brief Normalize a style/genre label into a comparable slug
 *
 * Lower-cases the input and collapses every run of non-alphanumeric
 * characters into a single '-', so "Progressive Rock" and
 * "progressive-rock" produce the same slug.
 */
[[nodiscard]] auto slugify(std::string_view text) -> std::string;

/**
 * @brief Split a free-form genre field into individual tags
 *
 * Separators are ',', ';', '/' and '|'. Empty tags are skipped.
 */
[[nodiscard]] auto splitTags(std::string_view text)
    -> std::vector<std::string>;

/**
 * @brief Split a comma separated list, trimming every element
 */
[[nodiscard]] auto splitCsv(std::string_view text)
    -> std::vector<std::string>;

/**
 * @brief Canonical identity of an (artist, album) pair: "artist|album"
 *
 * Both components are trimmed and lower-cased.
 */
[[nodiscard]] auto makeItemKey(std::string_view artist, std::string_view album)
    -> std::string;

/**
 * @brief Case-insensitive less-than for sorting display names
 */
[[nodiscard]] auto lessCaseInsensitive(std::string_view lhs,
                                       std::string_view rhs) -> bool;

}  // namespace curator::utils

#endif  // CURATOR_UTILS_STRING_UTILS_HPP
