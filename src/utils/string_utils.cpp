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

#include "string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace curator::utils {

namespace {

auto isSpace(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto lowerChar(char c) -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

auto splitOn(std::string_view text, std::string_view separators)
    -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find_first_of(separators, start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        auto part = trim(text.substr(start, end - start));
        if (!part.empty()) {
            parts.push_back(std::move(part));
        }
        start = end + 1;
    }
    return parts;
}

}  // namespace

auto toLower(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), lowerChar);
    return result;
}

auto trim(std::string_view text) -> std::string {
    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

auto slugify(std::string_view text) -> std::string {
    std::string slug;
    slug.reserve(text.size());
    bool pendingDash = false;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
            if (pendingDash && !slug.empty()) {
                slug.push_back('-');
            }
            pendingDash = false;
            slug.push_back(lowerChar(c));
        } else {
            pendingDash = true;
        }
    }
    return slug;
}

auto splitTags(std::string_view text) -> std::vector<std::string> {
    return splitOn(text, ",;/|");
}

auto splitCsv(std::string_view text) -> std::vector<std::string> {
    return splitOn(text, ",");
}

auto makeItemKey(std::string_view artist, std::string_view album)
    -> std::string {
    return toLower(trim(artist)) + "|" + toLower(trim(album));
}

auto lessCaseInsensitive(std::string_view lhs, std::string_view rhs) -> bool {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](char a, char b) { return lowerChar(a) < lowerChar(b); });
}

}  // namespace curator::utils
