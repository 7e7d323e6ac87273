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

#ifndef CURATOR_MODEL_REVIEW_ITEM_HPP
#define CURATOR_MODEL_REVIEW_ITEM_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "recommendation.hpp"

namespace curator::model {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Lifecycle of an item held for user review
 *
 * Pending items may move to any decision. Accepted and Rejected may be
 * revised into each other or into NeverAgain. NeverAgain is terminal and
 * nothing returns to Pending.
 */
enum class ReviewStatus { Pending, Accepted, Rejected, NeverAgain };

[[nodiscard]] auto reviewStatusToString(ReviewStatus status)
    -> std::string_view;
[[nodiscard]] auto reviewStatusFromString(std::string_view text)
    -> std::optional<ReviewStatus>;

/**
 * @brief Whether a review item may move from @p from to @p to
 *
 * Re-applying the current status is always allowed.
 */
[[nodiscard]] auto isAllowedTransition(ReviewStatus from, ReviewStatus to)
    -> bool;

struct ReviewItem {
    std::string key;
    std::string artist;
    std::string album;
    std::string genre;
    std::string reason;
    double confidence{0.0};
    ReviewStatus status{ReviewStatus::Pending};
    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<std::string> notes;

    [[nodiscard]] auto toRecommendation() const -> Recommendation;
};

void to_json(json& j, const ReviewItem& item);
void from_json(const json& j, ReviewItem& item);

/// Milliseconds since the Unix epoch, the on-disk timestamp format
[[nodiscard]] auto toEpochMillis(TimePoint tp) -> std::int64_t;
[[nodiscard]] auto fromEpochMillis(std::int64_t millis) -> TimePoint;

}  // namespace curator::model

#endif  // CURATOR_MODEL_REVIEW_ITEM_HPP
