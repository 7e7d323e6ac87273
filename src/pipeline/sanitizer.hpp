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

#ifndef CURATOR_PIPELINE_SANITIZER_HPP
#define CURATOR_PIPELINE_SANITIZER_HPP

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace curator::pipeline {

struct SanitizeResult {
    std::vector<Recommendation> kept;
    std::vector<FilteredItem> filtered;
    size_t modifiedFields = 0;
};

/**
 * @brief First pipeline stage: strips hostile content from provider output
 *
 * Removes null bytes, script and markup, path traversal sequences, SQL
 * statement fragments and control characters from every text field. SQL
 * keywords are only stripped in statement context so that titles such as
 * "Drop" or "Select Cuts" survive.
 */
class RecommendationSanitizer {
public:
    RecommendationSanitizer();

    [[nodiscard]] auto sanitizeString(std::string_view input) const
        -> std::string;

    /**
     * @brief Sanitize a batch
     *
     * Items whose artist (or album, in album mode) is empty after
     * sanitization, or whose artist or album exceeds the name limit, are
     * moved to the filtered bucket. Confidence is left for schema
     * validation to clamp.
     */
    [[nodiscard]] auto sanitize(const std::vector<Recommendation>& items,
                                RecommendationMode mode) const
        -> SanitizeResult;

    [[nodiscard]] auto containsMaliciousPattern(std::string_view input) const
        -> bool;

    /**
     * @brief Strict check for a single ingested item
     *
     * Unlike the batch path, out-of-range confidence makes the item invalid.
     */
    [[nodiscard]] auto isValidRecommendation(const Recommendation& item) const
        -> bool;

private:
    std::regex sqlStatement_;
    std::regex sqlMeta_;
    std::regex xss_;
    std::regex pathTraversal_;
    std::regex dangerousPath_;
    std::regex nullByte_;
    std::regex htmlTag_;
    std::regex controlChars_;
};

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_SANITIZER_HPP
