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

#ifndef CURATOR_PIPELINE_SAFETY_GATE_HPP
#define CURATOR_PIPELINE_SAFETY_GATE_HPP

#include <memory>
#include <vector>

#include "interfaces.hpp"

namespace curator::pipeline {

/**
 * @brief Vetoes items whose confidence is below a floor
 */
class MinimumConfidenceGate : public ISafetyGate {
public:
    explicit MinimumConfidenceGate(double minimumConfidence);

    [[nodiscard]] auto evaluate(const Recommendation& item,
                                RecommendationMode mode) const
        -> SafetyVerdict override;

    [[nodiscard]] auto minimumConfidence() const -> double {
        return minimumConfidence_;
    }

private:
    double minimumConfidence_;
};

/**
 * @brief Run @p gate over a batch, splitting allowed and vetoed items
 */
[[nodiscard]] auto applySafetyGate(const ISafetyGate& gate,
                                   const std::vector<Recommendation>& items,
                                   RecommendationMode mode) -> StageResult;

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_SAFETY_GATE_HPP
