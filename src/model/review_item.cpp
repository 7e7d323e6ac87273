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

#include "review_item.hpp"

#include "utils/string_utils.hpp"

namespace curator::model {

auto reviewStatusToString(ReviewStatus status) -> std::string_view {
    switch (status) {
        case ReviewStatus::Pending:
            return "pending";
        case ReviewStatus::Accepted:
            return "accepted";
        case ReviewStatus::Rejected:
            return "rejected";
        case ReviewStatus::NeverAgain:
            return "never";
    }
    return "pending";
}

auto reviewStatusFromString(std::string_view text)
    -> std::optional<ReviewStatus> {
    auto lowered = utils::toLower(utils::trim(text));
    if (lowered == "pending") return ReviewStatus::Pending;
    if (lowered == "accepted") return ReviewStatus::Accepted;
    if (lowered == "rejected") return ReviewStatus::Rejected;
    if (lowered == "never" || lowered == "neveragain")
        return ReviewStatus::NeverAgain;
    return std::nullopt;
}

auto isAllowedTransition(ReviewStatus from, ReviewStatus to) -> bool {
    if (from == to) {
        return true;
    }
    switch (from) {
        case ReviewStatus::Pending:
            return true;
        case ReviewStatus::Accepted:
        case ReviewStatus::Rejected:
            return to != ReviewStatus::Pending;
        case ReviewStatus::NeverAgain:
            return false;
    }
    return false;
}

auto ReviewItem::toRecommendation() const -> Recommendation {
    Recommendation rec;
    rec.artist = artist;
    rec.album = album;
    rec.genre = genre;
    rec.reason = reason;
    rec.confidence = confidence;
    return rec;
}

auto toEpochMillis(TimePoint tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

auto fromEpochMillis(std::int64_t millis) -> TimePoint {
    return TimePoint{std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(millis))};
}

void to_json(json& j, const ReviewItem& item) {
    j = json{{"key", item.key},
             {"artist", item.artist},
             {"album", item.album},
             {"genre", item.genre},
             {"reason", item.reason},
             {"confidence", item.confidence},
             {"status", std::string(reviewStatusToString(item.status))},
             {"createdAt", toEpochMillis(item.createdAt)},
             {"updatedAt", toEpochMillis(item.updatedAt)}};
    if (item.notes) {
        j["notes"] = *item.notes;
    }
}

void from_json(const json& j, ReviewItem& item) {
    item.artist = j.value("artist", std::string{});
    item.album = j.value("album", std::string{});
    item.key = j.value("key", utils::makeItemKey(item.artist, item.album));
    item.genre = j.value("genre", std::string{});
    item.reason = j.value("reason", std::string{});
    item.confidence = j.value("confidence", 0.0);
    item.status = reviewStatusFromString(j.value("status", std::string{}))
                      .value_or(ReviewStatus::Pending);
    item.createdAt = fromEpochMillis(j.value("createdAt", std::int64_t{0}));
    item.updatedAt =
        fromEpochMillis(j.value("updatedAt", toEpochMillis(item.createdAt)));
    item.notes.reset();
    if (auto it = j.find("notes"); it != j.end() && it->is_string()) {
        item.notes = it->get<std::string>();
    }
}

}  // namespace curator::model
