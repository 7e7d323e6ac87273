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

#include "types.hpp"

#include <algorithm>

#include "utils/string_utils.hpp"

namespace curator::pipeline {

auto stageToString(PipelineStage stage) -> std::string_view {
    switch (stage) {
        case PipelineStage::Sanitize:
            return "sanitize";
        case PipelineStage::SchemaValidate:
            return "schema";
        case PipelineStage::Deduplicate:
            return "dedup";
        case PipelineStage::StyleGuard:
            return "style";
        case PipelineStage::SafetyGate:
            return "safety";
        case PipelineStage::Truncate:
            return "truncate";
    }
    return "unknown";
}

auto backfillToString(BackfillStrategy strategy) -> std::string_view {
    switch (strategy) {
        case BackfillStrategy::Off:
            return "off";
        case BackfillStrategy::Standard:
            return "standard";
        case BackfillStrategy::Aggressive:
            return "aggressive";
    }
    return "standard";
}

auto backfillFromString(std::string_view text) -> BackfillStrategy {
    auto lowered = utils::toLower(utils::trim(text));
    if (lowered == "off" || lowered == "none") return BackfillStrategy::Off;
    if (lowered == "aggressive") return BackfillStrategy::Aggressive;
    return BackfillStrategy::Standard;
}

auto FilteredItem::toJson() const -> nlohmann::json {
    return {{"item", item},
            {"stage", std::string(stageToString(stage))},
            {"reason", reason}};
}

auto IterationProfile::fromSettings(const RunSettings& settings)
    -> IterationProfile {
    IterationProfile profile;
    profile.maxIterations = std::max(0, settings.maxTopUpIterations);
    switch (settings.backfill) {
        case BackfillStrategy::Off:
            profile.enabled = false;
            profile.maxIterations = 0;
            break;
        case BackfillStrategy::Standard:
            profile.zeroGainStop = 1;
            break;
        case BackfillStrategy::Aggressive:
            profile.zeroGainStop = 3;
            break;
    }
    return profile;
}

auto PipelineResult::toJson() const -> nlohmann::json {
    auto filteredJson = nlohmann::json::array();
    for (const auto& entry : filtered) {
        filteredJson.push_back(entry.toJson());
    }
    return {{"accepted", accepted},
            {"filtered", filteredJson},
            {"report", report.toJson()},
            {"released", released},
            {"topUpAttempts", topUpAttempts},
            {"cancelled", cancelled},
            {"fromCache", fromCache}};
}

}  // namespace curator::pipeline
