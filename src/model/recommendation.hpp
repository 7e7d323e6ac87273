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

#ifndef CURATOR_MODEL_RECOMMENDATION_HPP
#define CURATOR_MODEL_RECOMMENDATION_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace curator::model {

using json = nlohmann::json;

/**
 * @brief What a batch of recommendations names: whole albums or artists
 */
enum class RecommendationMode { Albums, Artists };

[[nodiscard]] auto modeToString(RecommendationMode mode) -> std::string_view;
[[nodiscard]] auto modeFromString(std::string_view text) -> RecommendationMode;

/// Field limits applied by sanitization and validation
inline constexpr size_t MAX_NAME_LENGTH = 500;
inline constexpr size_t MAX_GENRE_LENGTH = 100;
inline constexpr size_t MAX_REASON_LENGTH = 1000;

/**
 * @brief A single candidate (artist, album) proposed for the library
 */
struct Recommendation {
    std::string artist;
    std::string album;
    std::string genre;
    std::string reason;
    double confidence{0.0};
    std::optional<int> year;

    /// Lower-cased "artist|album" identity
    [[nodiscard]] auto key() const -> std::string;

    auto operator==(const Recommendation&) const -> bool = default;
};

void to_json(json& j, const Recommendation& rec);
void from_json(const json& j, Recommendation& rec);

/**
 * @brief Outcome of validating one batch of candidates
 *
 * Reports of follow-up batches fetched during top-up are merged into the
 * report of the run that requested them.
 */
struct ValidationReport {
    size_t totalItems{0};
    size_t droppedItems{0};
    size_t clampedConfidences{0};
    size_t trimmedFields{0};
    std::vector<std::string> warnings;

    void merge(const ValidationReport& other);

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace curator::model

#endif  // CURATOR_MODEL_RECOMMENDATION_HPP
