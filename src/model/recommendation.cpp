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

#include "recommendation.hpp"

#include "utils/string_utils.hpp"

namespace curator::model {

auto modeToString(RecommendationMode mode) -> std::string_view {
    switch (mode) {
        case RecommendationMode::Albums:
            return "albums";
        case RecommendationMode::Artists:
            return "artists";
    }
    return "albums";
}

auto modeFromString(std::string_view text) -> RecommendationMode {
    auto lowered = utils::toLower(utils::trim(text));
    if (lowered == "artists" || lowered == "artist") {
        return RecommendationMode::Artists;
    }
    return RecommendationMode::Albums;
}

auto Recommendation::key() const -> std::string {
    return utils::makeItemKey(artist, album);
}

void to_json(json& j, const Recommendation& rec) {
    j = json{{"artist", rec.artist},
             {"album", rec.album},
             {"genre", rec.genre},
             {"reason", rec.reason},
             {"confidence", rec.confidence}};
    if (rec.year) {
        j["year"] = *rec.year;
    }
}

// Provider payloads are loosely typed: missing or mistyped fields fall back
// to empty values and are dealt with by validation.
void from_json(const json& j, Recommendation& rec) {
    auto text = [&j](const char* name) -> std::string {
        if (auto it = j.find(name); it != j.end() && it->is_string()) {
            return it->get<std::string>();
        }
        return {};
    };
    rec.artist = text("artist");
    rec.album = text("album");
    rec.genre = text("genre");
    rec.reason = text("reason");
    rec.confidence = 0.0;
    if (auto it = j.find("confidence"); it != j.end() && it->is_number()) {
        rec.confidence = it->get<double>();
    }
    rec.year.reset();
    if (auto it = j.find("year"); it != j.end() && it->is_number_integer()) {
        rec.year = it->get<int>();
    }
}

void ValidationReport::merge(const ValidationReport& other) {
    totalItems += other.totalItems;
    droppedItems += other.droppedItems;
    clampedConfidences += other.clampedConfidences;
    trimmedFields += other.trimmedFields;
    warnings.insert(warnings.end(), other.warnings.begin(),
                    other.warnings.end());
}

auto ValidationReport::toJson() const -> json {
    return {{"totalItems", totalItems},
            {"droppedItems", droppedItems},
            {"clampedConfidences", clampedConfidences},
            {"trimmedFields", trimmedFields},
            {"warnings", warnings}};
}

}  // namespace curator::model
