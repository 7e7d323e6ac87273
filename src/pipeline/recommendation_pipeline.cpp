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

#include "recommendation_pipeline.hpp"

#include <algorithm>
#include <iterator>
#include <optional>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "safety_gate.hpp"

namespace curator::pipeline {

namespace {

auto validated(PipelineDependencies deps) -> PipelineDependencies {
    auto require = [](bool present, const char* name) {
        if (!present) {
            THROW_MISSING_DEPENDENCY(
                std::string("RecommendationPipeline requires ") + name);
        }
    };
    require(deps.provider != nullptr, "a provider");
    require(deps.library != nullptr, "a library oracle");
    require(deps.history != nullptr, "a suggestion history");
    require(deps.reviewQueue != nullptr, "a review queue");
    require(deps.safetyGate != nullptr, "a safety gate");
    require(deps.planner != nullptr, "a prompt planner");
    require(deps.cache != nullptr, "a result cache");
    require(deps.versionProvider != nullptr, "a config version provider");
    return deps;
}

auto displayName(const Recommendation& item) -> std::string {
    return item.album.empty() ? item.artist : item.artist + "|" + item.album;
}

}  // namespace

RecommendationPipeline::RecommendationPipeline(PipelineDependencies deps)
    : deps_(validated(std::move(deps))),
      keyBuilder_(deps_.versionProvider),
      deduplicator_(deps_.library, deps_.history, deps_.reviewQueue) {}

auto RecommendationPipeline::cacheKey(const RunSettings& settings) const
    -> std::string {
    cache::CacheKeyInput input;
    input.providerIdentity = deps_.provider->name();
    input.maxRecommendations = settings.maxRecommendations;
    input.libraryFingerprint = deps_.library->fingerprint();
    input.styleFilters = settings.styleFilters;
    input.relaxStyleMatching = settings.relaxStyleMatching;
    input.mode = settings.mode;
    return keyBuilder_.build(input);
}

auto RecommendationPipeline::run(const RunSettings& settings,
                                 std::stop_token stop) -> PipelineResult {
    auto key = cacheKey(settings);
    std::optional<PipelineResult> partial;
    bool computed = false;

    auto factory = [&](std::stop_token token) -> PipelineResult {
        computed = true;
        spdlog::info("Fetching {} recommendations from {}",
                     settings.maxRecommendations, deps_.provider->name());
        auto prompt = deps_.planner->buildPrompt(makePromptContext(
            settings, settings.maxRecommendations, 0, PipelineResult{}));
        auto candidates = deps_.provider->getRecommendations(prompt, token);
        auto fresh = computeFresh(candidates, settings, token);
        if (fresh.cancelled) {
            partial = std::move(fresh);
            THROW_OPERATION_CANCELLED("Recommendation run cancelled");
        }
        return fresh;
    };

    PipelineResult fresh;
    try {
        fresh =
            deps_.cache->getOrCompute(key, factory, settings.cacheTtl, stop);
    } catch (const OperationCancelledException&) {
        if (partial) {
            spdlog::info("Run cancelled with {} recommendation(s) ready",
                         partial->accepted.size());
            // Accepted review items stay queued for a complete run.
            return deliver(std::move(*partial), settings, false, true);
        }
        spdlog::info("Run cancelled before any recommendation was ready");
        PipelineResult cancelled;
        cancelled.cancelled = true;
        return cancelled;
    }

    bool fromCache = !computed;
    if (fromCache) {
        spdlog::debug("Served recommendations from cache ({})", key);
    }
    auto result = deliver(std::move(fresh), settings, true, !fromCache);
    result.fromCache = fromCache;
    return result;
}

auto RecommendationPipeline::process(
    const std::vector<Recommendation>& candidates, const RunSettings& settings,
    std::stop_token stop) -> PipelineResult {
    auto fresh = computeFresh(candidates, settings, stop);
    bool release = !fresh.cancelled;
    return deliver(std::move(fresh), settings, release, true);
}

auto RecommendationPipeline::computeFresh(
    const std::vector<Recommendation>& candidates, const RunSettings& settings,
    std::stop_token stop) -> PipelineResult {
    PipelineResult result;
    std::unordered_set<std::string> seenKeys;
    const auto max = static_cast<size_t>(std::max(0, settings.maxRecommendations));

    auto gained = filterBatch(candidates, settings, seenKeys, result);

    auto profile = IterationProfile::fromSettings(settings);
    if (stop.stop_requested()) {
        result.cancelled = true;
    } else if (profile.enabled && gained > 0 && result.accepted.size() < max) {
        topUp(settings, seenKeys, result, stop);
    }

    if (result.accepted.size() > max) {
        for (size_t i = max; i < result.accepted.size(); ++i) {
            result.filtered.push_back(
                {result.accepted[i], PipelineStage::Truncate, "over limit"});
        }
        result.accepted.resize(max);
    }
    return result;
}

auto RecommendationPipeline::deliver(PipelineResult fresh,
                                     const RunSettings& settings,
                                     bool releaseAccepted, bool recordFresh)
    -> PipelineResult {
    PipelineResult result = std::move(fresh);
    const auto max = static_cast<size_t>(std::max(0, settings.maxRecommendations));

    std::vector<Recommendation> delivered;
    std::unordered_set<std::string> releasedKeys;
    if (releaseAccepted) {
        for (auto& item : deps_.reviewQueue->dequeueAccepted(max)) {
            if (!sanitizer_.isValidRecommendation(item)) {
                spdlog::warn("Dropping invalid review item {}",
                             displayName(item));
                result.filtered.push_back(
                    {item, PipelineStage::Sanitize, "invalid review item"});
                continue;
            }
            if (!releasedKeys.insert(item.key()).second) {
                continue;
            }
            deps_.history->recordAccepted(item.artist, item.album);
            delivered.push_back(std::move(item));
        }
    }
    result.released = delivered.size();

    // Released items were suggested in an earlier run.
    std::vector<Recommendation> suggested;
    for (auto& item : result.accepted) {
        if (releasedKeys.contains(item.key())) {
            result.filtered.push_back(
                {item, PipelineStage::Deduplicate, "duplicate"});
        } else if (delivered.size() < max) {
            suggested.push_back(item);
            delivered.push_back(std::move(item));
        } else {
            result.filtered.push_back(
                {std::move(item), PipelineStage::Truncate, "over limit"});
        }
    }
    result.accepted = std::move(delivered);

    if (recordFresh) {
        deps_.history->recordSuggestions(suggested);
    }

    spdlog::info(
        "Pipeline produced {} recommendation(s) ({} released from review), "
        "filtered {}, top-up attempts {}{}",
        result.accepted.size(), result.released, result.filtered.size(),
        result.topUpAttempts, result.cancelled ? " (cancelled)" : "");
    return result;
}

auto RecommendationPipeline::filterBatch(
    const std::vector<Recommendation>& batch, const RunSettings& settings,
    std::unordered_set<std::string>& seenKeys, PipelineResult& result)
    -> size_t {
    auto append = [&result](std::vector<FilteredItem>& filtered) {
        result.filtered.insert(result.filtered.end(), filtered.begin(),
                               filtered.end());
    };

    auto sanitized = sanitizer_.sanitize(batch, settings.mode);
    append(sanitized.filtered);

    auto validation = validator_.validate(sanitized.kept, settings.mode);
    validation.report.totalItems += sanitized.filtered.size();
    validation.report.droppedItems += sanitized.filtered.size();
    validation.report.trimmedFields += sanitized.modifiedFields;
    for (const auto& dropped : sanitized.filtered) {
        validation.report.warnings.push_back(displayName(dropped.item) +
                                             " dropped: " + dropped.reason);
    }
    result.report.merge(validation.report);
    append(validation.stage.filtered);

    auto deduped =
        deduplicator_.filter(validation.stage.kept, settings.mode, seenKeys);
    append(deduped.filtered);
    std::vector<FilteredItem> reviewable;
    std::copy_if(deduped.filtered.begin(), deduped.filtered.end(),
                 std::back_inserter(reviewable), [](const FilteredItem& entry) {
                     return entry.reason != "duplicate";
                 });
    routeToReview(reviewable);

    auto styled = styleGuard_.apply(deduped.kept, settings.styleFilters,
                                    settings.relaxStyleMatching);
    append(styled.filtered);
    routeToReview(styled.filtered);

    auto gated = applySafetyGate(*deps_.safetyGate, styled.kept, settings.mode);
    append(gated.filtered);
    routeToReview(gated.filtered);

    result.accepted.insert(result.accepted.end(), gated.kept.begin(),
                           gated.kept.end());
    return gated.kept.size();
}

void RecommendationPipeline::topUp(const RunSettings& settings,
                                   std::unordered_set<std::string>& seenKeys,
                                   PipelineResult& result,
                                   std::stop_token stop) {
    auto profile = IterationProfile::fromSettings(settings);
    const auto max = static_cast<size_t>(settings.maxRecommendations);
    int zeroGainStreak = 0;

    while (result.accepted.size() < max &&
           static_cast<int>(result.topUpAttempts) < profile.maxIterations) {
        if (stop.stop_requested()) {
            result.cancelled = true;
            return;
        }
        auto deficit = static_cast<int>(max - result.accepted.size());
        ++result.topUpAttempts;
        spdlog::info("Top-up attempt {}: requesting {} more",
                     result.topUpAttempts, deficit);

        std::vector<Recommendation> batch;
        try {
            auto prompt = deps_.planner->buildPrompt(makePromptContext(
                settings, deficit, static_cast<int>(result.topUpAttempts),
                result));
            batch = deps_.provider->getRecommendations(prompt, stop);
        } catch (const OperationCancelledException&) {
            result.cancelled = true;
            return;
        } catch (const ProviderException& e) {
            spdlog::warn("Top-up stopped after provider failure: {}",
                         e.what());
            return;
        }

        auto gained = filterBatch(batch, settings, seenKeys, result);
        if (gained == 0) {
            if (++zeroGainStreak >= profile.zeroGainStop) {
                spdlog::debug("Top-up stopped after {} empty attempt(s)",
                              zeroGainStreak);
                return;
            }
        } else {
            zeroGainStreak = 0;
        }
    }
}

void RecommendationPipeline::routeToReview(
    const std::vector<FilteredItem>& rejected) {
    for (const auto& entry : rejected) {
        deps_.reviewQueue->enqueue({entry.item}, entry.reason);
    }
}

auto RecommendationPipeline::makePromptContext(
    const RunSettings& settings, int count, int iteration,
    const PipelineResult& result) const -> PromptContext {
    PromptContext context;
    context.mode = settings.mode;
    context.count = count;
    context.styleFilters = settings.styleFilters;
    context.exclusions = deps_.history->exclusions();
    context.iteration = iteration;
    for (const auto& item : result.accepted) {
        context.alreadySelected.push_back(displayName(item));
    }
    return context;
}

}  // namespace curator::pipeline
