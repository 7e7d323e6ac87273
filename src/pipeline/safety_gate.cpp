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

#include "safety_gate.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace curator::pipeline {

MinimumConfidenceGate::MinimumConfidenceGate(double minimumConfidence)
    : minimumConfidence_(std::clamp(minimumConfidence, 0.0, 1.0)) {}

auto MinimumConfidenceGate::evaluate(const Recommendation& item,
                                     RecommendationMode /*mode*/) const
    -> SafetyVerdict {
    if (item.confidence < minimumConfidence_) {
        return SafetyVerdict::veto(
            fmt::format("confidence {:.2f} below minimum {:.2f}",
                        item.confidence, minimumConfidence_));
    }
    return SafetyVerdict::allow();
}

auto applySafetyGate(const ISafetyGate& gate,
                     const std::vector<Recommendation>& items,
                     RecommendationMode mode) -> StageResult {
    StageResult result;
    for (const auto& item : items) {
        auto verdict = gate.evaluate(item, mode);
        if (verdict.allowed) {
            result.kept.push_back(item);
        } else {
            result.filtered.push_back(
                {item, PipelineStage::SafetyGate,
                 verdict.reason.empty() ? "safety gate" : verdict.reason});
        }
    }
    if (!result.filtered.empty()) {
        spdlog::info("Safety gate held back {} item(s)",
                     result.filtered.size());
    }
    return result;
}

}  // namespace curator::pipeline
