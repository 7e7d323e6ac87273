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

#ifndef CURATOR_PIPELINE_SCHEMA_VALIDATOR_HPP
#define CURATOR_PIPELINE_SCHEMA_VALIDATOR_HPP

#include <vector>

#include "types.hpp"

namespace curator::pipeline {

struct ValidationOutcome {
    StageResult stage;
    ValidationReport report;
};

/**
 * @brief Structural validation of sanitized candidates
 *
 * Never throws. Missing required names drop the item; stray whitespace is
 * trimmed, over-long genre and reason fields are cut to their limits and
 * confidence is clamped into [0, 1] (NaN becomes 0). Every adjustment is
 * counted in the returned report.
 */
class RecommendationSchemaValidator {
public:
    [[nodiscard]] auto validate(const std::vector<Recommendation>& items,
                                RecommendationMode mode) const
        -> ValidationOutcome;
};

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_SCHEMA_VALIDATOR_HPP
