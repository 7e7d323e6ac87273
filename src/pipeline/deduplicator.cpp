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

#include "deduplicator.hpp"

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace curator::pipeline {

Deduplicator::Deduplicator(
    std::shared_ptr<ILibraryOracle> library,
    std::shared_ptr<history::ISuggestionHistory> history,
    std::shared_ptr<review::IReviewQueue> reviewQueue)
    : library_(std::move(library)),
      history_(std::move(history)),
      reviewQueue_(std::move(reviewQueue)) {
    if (!library_ || !history_ || !reviewQueue_) {
        THROW_MISSING_DEPENDENCY(
            "Deduplicator requires library, history and review queue");
    }
}

auto Deduplicator::filter(const std::vector<Recommendation>& items,
                          RecommendationMode mode,
                          std::unordered_set<std::string>& seenKeys) const
    -> StageResult {
    StageResult result;
    for (const auto& item : items) {
        auto key = item.key();
        auto drop = [&](std::string reason) {
            result.filtered.push_back(
                {item, PipelineStage::Deduplicate, std::move(reason)});
        };

        if (seenKeys.contains(key)) {
            drop("duplicate");
            continue;
        }

        bool inLibrary = mode == RecommendationMode::Artists
                             ? library_->containsArtist(item.artist)
                             : library_->containsAlbum(item.artist, item.album);
        if (inLibrary) {
            drop("already in library");
            continue;
        }
        if (history_->wasRejectedOrDisliked(item.artist, item.album)) {
            drop("previously rejected");
            continue;
        }
        auto status = reviewQueue_->statusOf(item.artist, item.album);
        if (status == review::ReviewStatus::NeverAgain) {
            drop("marked never again");
            continue;
        }
        if (status == review::ReviewStatus::Rejected) {
            drop("rejected in review");
            continue;
        }

        seenKeys.insert(key);
        result.kept.push_back(item);
    }

    if (!result.filtered.empty()) {
        spdlog::debug("Deduplicate: kept {}, removed {}", result.kept.size(),
                      result.filtered.size());
    }
    return result;
}

}  // namespace curator::pipeline
