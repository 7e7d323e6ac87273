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

#include "sanitizer.hpp"

#include <spdlog/spdlog.h>

#include "utils/string_utils.hpp"

namespace curator::pipeline {

namespace {

constexpr auto ICASE = std::regex::ECMAScript | std::regex::icase;

auto stripAll(const std::string& input, const std::regex& pattern)
    -> std::string {
    return std::regex_replace(input, pattern, "");
}

}  // namespace

RecommendationSanitizer::RecommendationSanitizer()
    : sqlStatement_(
          R"(\b(?:drop|alter|truncate)\s+(?:table|database)\b|\bdelete\s+from\b|\binsert\s+into\b|\bunion\s+(?:all\s+)?select\b|\bselect\s+\*|\bupdate\s+\w+\s+set\b|\bexec(?:ute)?\s*\()",
          ICASE),
      sqlMeta_(R"(--|/\*|\*/|';)"),
      xss_(
          R"(<(script|iframe|object|embed|form|input|button)[^>]*>[\s\S]*?</\1>|<[^>]*(?:img|svg|on\w+\s*=)[^>]*>)",
          ICASE),
      pathTraversal_(R"(\.\./|\.\.\\|%2e%2e|%252e%252e)", ICASE),
      dangerousPath_(R"(etc/passwd|windows\\system32)", ICASE),
      nullByte_(R"(%00|\\0)"),
      htmlTag_(R"(<[^>]*>)"),
      controlChars_(R"([\x01-\x1F\x7F])") {}

auto RecommendationSanitizer::sanitizeString(std::string_view input) const
    -> std::string {
    if (input.empty()) {
        return {};
    }

    // std::regex cannot match a literal NUL inside a pattern portably.
    std::string sanitized;
    sanitized.reserve(input.size());
    for (char c : input) {
        if (c != '\0') {
            sanitized.push_back(c);
        }
    }

    sanitized = stripAll(sanitized, nullByte_);
    sanitized = stripAll(sanitized, xss_);
    sanitized = stripAll(sanitized, sqlStatement_);
    sanitized = stripAll(sanitized, sqlMeta_);
    sanitized = stripAll(sanitized, pathTraversal_);
    sanitized = stripAll(sanitized, dangerousPath_);
    sanitized = stripAll(sanitized, htmlTag_);
    sanitized = stripAll(sanitized, controlChars_);

    std::string result;
    result.reserve(sanitized.size());
    for (char c : sanitized) {
        if (c != '"') {
            result.push_back(c);
        }
    }
    return utils::trim(result);
}

auto RecommendationSanitizer::containsMaliciousPattern(
    std::string_view input) const -> bool {
    if (input.empty()) {
        return false;
    }
    if (input.find('\0') != std::string_view::npos) {
        return true;
    }
    std::string text(input);
    return std::regex_search(text, sqlStatement_) ||
           std::regex_search(text, sqlMeta_) ||
           std::regex_search(text, xss_) ||
           std::regex_search(text, pathTraversal_) ||
           std::regex_search(text, dangerousPath_) ||
           std::regex_search(text, nullByte_);
}

auto RecommendationSanitizer::isValidRecommendation(
    const Recommendation& item) const -> bool {
    if (utils::trim(item.artist).empty()) {
        return false;
    }
    if (containsMaliciousPattern(item.artist) ||
        containsMaliciousPattern(item.album) ||
        containsMaliciousPattern(item.genre) ||
        containsMaliciousPattern(item.reason)) {
        return false;
    }
    if (!(item.confidence >= 0.0 && item.confidence <= 1.0)) {
        spdlog::debug("Invalid confidence value: {}", item.confidence);
        return false;
    }
    if (item.artist.size() > model::MAX_NAME_LENGTH ||
        item.album.size() > model::MAX_NAME_LENGTH ||
        item.genre.size() > model::MAX_GENRE_LENGTH ||
        item.reason.size() > model::MAX_REASON_LENGTH) {
        spdlog::debug("Recommendation field exceeds maximum length");
        return false;
    }
    return true;
}

auto RecommendationSanitizer::sanitize(
    const std::vector<Recommendation>& items, RecommendationMode mode) const
    -> SanitizeResult {
    SanitizeResult result;
    result.kept.reserve(items.size());

    for (const auto& original : items) {
        if (original.artist.size() > model::MAX_NAME_LENGTH ||
            original.album.size() > model::MAX_NAME_LENGTH) {
            result.filtered.push_back(
                {original, PipelineStage::Sanitize, "field exceeds length limit"});
            continue;
        }

        Recommendation clean = original;
        clean.artist = sanitizeString(original.artist);
        clean.album = sanitizeString(original.album);
        clean.genre = sanitizeString(original.genre);
        clean.reason = sanitizeString(original.reason);

        result.modifiedFields += (clean.artist != original.artist) +
                                 (clean.album != original.album) +
                                 (clean.genre != original.genre) +
                                 (clean.reason != original.reason);

        if (clean.artist.empty()) {
            spdlog::warn("Filtered unsafe recommendation: {} - {}",
                         original.artist, original.album);
            result.filtered.push_back(
                {original, PipelineStage::Sanitize, "artist empty after sanitization"});
            continue;
        }
        if (mode == RecommendationMode::Albums && clean.album.empty()) {
            spdlog::warn("Filtered unsafe recommendation: {} - {}",
                         original.artist, original.album);
            result.filtered.push_back(
                {original, PipelineStage::Sanitize, "album empty after sanitization"});
            continue;
        }
        result.kept.push_back(std::move(clean));
    }
    return result;
}

}  // namespace curator::pipeline
