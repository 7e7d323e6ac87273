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

#ifndef CURATOR_PIPELINE_DEDUPLICATOR_HPP
#define CURATOR_PIPELINE_DEDUPLICATOR_HPP

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "history/suggestion_history.hpp"
#include "interfaces.hpp"
#include "review/review_queue.hpp"

namespace curator::pipeline {

/**
 * @brief Removes candidates the user already has or has turned down
 *
 * An item is dropped when the library already holds it, when history holds
 * a standing Rejected or Disliked outcome for it, when the review queue
 * marks it Rejected or NeverAgain, or when its key was already seen in
 * this run.
 */
class Deduplicator {
public:
    Deduplicator(std::shared_ptr<ILibraryOracle> library,
                 std::shared_ptr<history::ISuggestionHistory> history,
                 std::shared_ptr<review::IReviewQueue> reviewQueue);

    /**
     * @param seenKeys Keys already taken in this run; keys of kept items
     *                 are added to it
     */
    [[nodiscard]] auto filter(const std::vector<Recommendation>& items,
                              RecommendationMode mode,
                              std::unordered_set<std::string>& seenKeys) const
        -> StageResult;

private:
    std::shared_ptr<ILibraryOracle> library_;
    std::shared_ptr<history::ISuggestionHistory> history_;
    std::shared_ptr<review::IReviewQueue> reviewQueue_;
};

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_DEDUPLICATOR_HPP
