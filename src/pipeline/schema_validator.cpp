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

#include "schema_validator.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "utils/string_utils.hpp"

namespace curator::pipeline {

namespace {

// Returns true when the field changed.
auto normalizeField(std::string& field, size_t limit) -> bool {
    auto trimmed = utils::trim(field);
    if (trimmed.size() > limit) {
        trimmed.resize(limit);
        trimmed = utils::trim(trimmed);
    }
    if (trimmed == field) {
        return false;
    }
    field = std::move(trimmed);
    return true;
}

}  // namespace

auto RecommendationSchemaValidator::validate(
    const std::vector<Recommendation>& items, RecommendationMode mode) const
    -> ValidationOutcome {
    ValidationOutcome outcome;
    auto& report = outcome.report;
    report.totalItems = items.size();

    for (size_t index = 0; index < items.size(); ++index) {
        Recommendation item = items[index];

        report.trimmedFields += normalizeField(item.artist, model::MAX_NAME_LENGTH);
        report.trimmedFields += normalizeField(item.album, model::MAX_NAME_LENGTH);
        report.trimmedFields += normalizeField(item.genre, model::MAX_GENRE_LENGTH);
        report.trimmedFields += normalizeField(item.reason, model::MAX_REASON_LENGTH);

        if (item.artist.empty()) {
            ++report.droppedItems;
            report.warnings.push_back(
                fmt::format("item {} dropped: missing artist", index));
            outcome.stage.filtered.push_back(
                {items[index], PipelineStage::SchemaValidate, "missing artist"});
            continue;
        }
        if (mode == RecommendationMode::Albums && item.album.empty()) {
            ++report.droppedItems;
            report.warnings.push_back(fmt::format(
                "item {} ({}) dropped: missing album", index, item.artist));
            outcome.stage.filtered.push_back(
                {items[index], PipelineStage::SchemaValidate, "missing album"});
            continue;
        }

        if (std::isnan(item.confidence)) {
            item.confidence = 0.0;
            ++report.clampedConfidences;
            report.warnings.push_back(fmt::format(
                "item {} ({}): confidence was not a number", index,
                item.artist));
        } else if (item.confidence < 0.0 || item.confidence > 1.0) {
            report.warnings.push_back(fmt::format(
                "item {} ({}): confidence {} clamped", index, item.artist,
                item.confidence));
            item.confidence = std::clamp(item.confidence, 0.0, 1.0);
            ++report.clampedConfidences;
        }

        outcome.stage.kept.push_back(std::move(item));
    }

    if (report.droppedItems > 0 || report.clampedConfidences > 0) {
        spdlog::debug(
            "Schema validation: {} items, {} dropped, {} clamped, {} trimmed",
            report.totalItems, report.droppedItems, report.clampedConfidences,
            report.trimmedFields);
    }
    return outcome;
}

}  // namespace curator::pipeline
