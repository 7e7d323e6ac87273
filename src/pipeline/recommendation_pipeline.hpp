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

#ifndef CURATOR_PIPELINE_RECOMMENDATION_PIPELINE_HPP
#define CURATOR_PIPELINE_RECOMMENDATION_PIPELINE_HPP

#include <memory>
#include <stop_token>
#include <string>
#include <unordered_set>
#include <vector>

#include "cache/cache.hpp"
#include "cache/cache_key_builder.hpp"
#include "deduplicator.hpp"
#include "history/suggestion_history.hpp"
#include "interfaces.hpp"
#include "review/review_queue.hpp"
#include "sanitizer.hpp"
#include "schema_validator.hpp"
#include "style_guard.hpp"
#include "types.hpp"

namespace curator::pipeline {

using ResultCache = cache::ICache<std::string, PipelineResult>;

/**
 * @brief Collaborators of a RecommendationPipeline; all are required
 */
struct PipelineDependencies {
    std::shared_ptr<IRecommendationProvider> provider;
    std::shared_ptr<ILibraryOracle> library;
    std::shared_ptr<history::ISuggestionHistory> history;
    std::shared_ptr<review::IReviewQueue> reviewQueue;
    std::shared_ptr<ISafetyGate> safetyGate;
    std::shared_ptr<IPromptPlanner> planner;
    std::shared_ptr<ResultCache> cache;
    std::shared_ptr<const cache::IConfigVersionProvider> versionProvider;
};

/**
 * @brief Turns raw provider output into a deliverable batch
 *
 * Stages run in a fixed order: sanitize, schema validation, deduplication,
 * style guard, safety gate, then top-up and truncation. Items rejected by
 * deduplication, the style guard or the safety gate are queued for human
 * review with the rejection reason as notes; in-batch repeats are not.
 * Items the user accepted in review are released at the head of the batch,
 * at most maxRecommendations per run; the rest stay Accepted.
 *
 * run() caches the freshly fetched batch, keyed by provider, batch size,
 * library fingerprint, configuration version and style settings, so
 * concurrent identical runs call the provider once. Review releases are
 * merged after the cache and are delivered exactly once.
 */
class RecommendationPipeline {
public:
    /**
     * @throws curator::MissingDependencyException if any collaborator is null
     */
    explicit RecommendationPipeline(PipelineDependencies deps);

    /**
     * @brief Fetch, filter and cache one batch
     *
     * Provider failures propagate and leave the cache untouched. When
     * @p stop fires the items already accepted are returned with
     * cancelled set, nothing is cached and no review item is released.
     */
    auto run(const RunSettings& settings, std::stop_token stop = {})
        -> PipelineResult;

    /**
     * @brief Filter caller-supplied candidates without consulting the cache
     *
     * Top-up requests still go to the provider.
     */
    auto process(const std::vector<Recommendation>& candidates,
                 const RunSettings& settings, std::stop_token stop = {})
        -> PipelineResult;

    [[nodiscard]] auto cacheKey(const RunSettings& settings) const
        -> std::string;

    [[nodiscard]] auto sanitizer() const -> const RecommendationSanitizer& {
        return sanitizer_;
    }

private:
    /// Filter, top-up and truncate; touches neither history nor releases
    auto computeFresh(const std::vector<Recommendation>& candidates,
                      const RunSettings& settings, std::stop_token stop)
        -> PipelineResult;

    /// Prepends released review items and records delivered suggestions
    auto deliver(PipelineResult fresh, const RunSettings& settings,
                 bool releaseAccepted, bool recordFresh) -> PipelineResult;

    /// Runs one batch through the filter stages; returns survivors added
    auto filterBatch(const std::vector<Recommendation>& batch,
                     const RunSettings& settings,
                     std::unordered_set<std::string>& seenKeys,
                     PipelineResult& result) -> size_t;

    void topUp(const RunSettings& settings,
               std::unordered_set<std::string>& seenKeys,
               PipelineResult& result, std::stop_token stop);

    void routeToReview(const std::vector<FilteredItem>& rejected);

    [[nodiscard]] auto makePromptContext(const RunSettings& settings,
                                         int count, int iteration,
                                         const PipelineResult& result) const
        -> PromptContext;

    PipelineDependencies deps_;
    cache::CacheKeyBuilder keyBuilder_;
    RecommendationSanitizer sanitizer_;
    RecommendationSchemaValidator validator_;
    Deduplicator deduplicator_;
    StyleGuard styleGuard_;
};

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_RECOMMENDATION_PIPELINE_HPP
