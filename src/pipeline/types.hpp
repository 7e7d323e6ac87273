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

#ifndef CURATOR_PIPELINE_TYPES_HPP
#define CURATOR_PIPELINE_TYPES_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/recommendation.hpp"

namespace curator::pipeline {

using model::Recommendation;
using model::RecommendationMode;
using model::ValidationReport;

enum class PipelineStage {
    Sanitize,
    SchemaValidate,
    Deduplicate,
    StyleGuard,
    SafetyGate,
    Truncate
};

[[nodiscard]] auto stageToString(PipelineStage stage) -> std::string_view;

/**
 * @brief How hard the pipeline tries to refill a short batch
 */
enum class BackfillStrategy { Off, Standard, Aggressive };

[[nodiscard]] auto backfillToString(BackfillStrategy strategy)
    -> std::string_view;
[[nodiscard]] auto backfillFromString(std::string_view text)
    -> BackfillStrategy;

/**
 * @brief A candidate removed by a stage, with the reason it was removed
 */
struct FilteredItem {
    Recommendation item;
    PipelineStage stage{PipelineStage::Sanitize};
    std::string reason;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Survivors and rejects of a single filtering stage
 */
struct StageResult {
    std::vector<Recommendation> kept;
    std::vector<FilteredItem> filtered;
};

/**
 * @brief Per-run knobs of the recommendation pipeline
 */
struct RunSettings {
    int maxRecommendations = 10;
    RecommendationMode mode = RecommendationMode::Albums;
    std::vector<std::string> styleFilters;
    bool relaxStyleMatching = false;
    BackfillStrategy backfill = BackfillStrategy::Standard;
    int maxTopUpIterations = 3;

    /// Lifetime of the cached run result; nullopt uses the cache default
    std::optional<std::chrono::milliseconds> cacheTtl;
};

/**
 * @brief Iteration limits derived from a BackfillStrategy
 */
struct IterationProfile {
    bool enabled = true;
    int maxIterations = 3;

    /// Consecutive zero-gain top-up attempts that end the loop
    int zeroGainStop = 1;

    [[nodiscard]] static auto fromSettings(const RunSettings& settings)
        -> IterationProfile;
};

struct PipelineResult {
    std::vector<Recommendation> accepted;
    std::vector<FilteredItem> filtered;
    ValidationReport report;
    size_t released = 0;
    size_t topUpAttempts = 0;
    bool cancelled = false;
    bool fromCache = false;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_TYPES_HPP
