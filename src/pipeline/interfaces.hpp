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

#ifndef CURATOR_PIPELINE_INTERFACES_HPP
#define CURATOR_PIPELINE_INTERFACES_HPP

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "history/suggestion_history.hpp"
#include "types.hpp"

namespace curator::pipeline {

/**
 * @brief Client of the generative service that proposes raw candidates
 *
 * Implementations should honor @p stop and throw
 * curator::OperationCancelledException when it fires, and throw
 * curator::ProviderException on transport or payload failures.
 */
class IRecommendationProvider {
public:
    virtual ~IRecommendationProvider() = default;

    /// Stable identity used in cache keys (e.g. "openai:gpt-4o-mini")
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    virtual auto getRecommendations(const std::string& prompt,
                                    std::stop_token stop)
        -> std::vector<Recommendation> = 0;

    virtual auto testConnection() -> bool = 0;
};

/**
 * @brief Read-only view of the user's current library
 */
class ILibraryOracle {
public:
    virtual ~ILibraryOracle() = default;

    [[nodiscard]] virtual auto containsArtist(std::string_view artist) const
        -> bool = 0;

    [[nodiscard]] virtual auto containsAlbum(std::string_view artist,
                                             std::string_view album) const
        -> bool = 0;

    /// Digest of library state; changes whenever the library changes
    [[nodiscard]] virtual auto fingerprint() const -> std::string = 0;
};

/**
 * @brief Verdict of a safety policy for one item
 */
struct SafetyVerdict {
    bool allowed = true;
    std::string reason;

    [[nodiscard]] static auto allow() -> SafetyVerdict { return {}; }
    [[nodiscard]] static auto veto(std::string why) -> SafetyVerdict {
        return {false, std::move(why)};
    }
};

class ISafetyGate {
public:
    virtual ~ISafetyGate() = default;

    [[nodiscard]] virtual auto evaluate(const Recommendation& item,
                                        RecommendationMode mode) const
        -> SafetyVerdict = 0;
};

/**
 * @brief Inputs for building one provider prompt
 */
struct PromptContext {
    RecommendationMode mode = RecommendationMode::Albums;
    int count = 0;
    std::vector<std::string> styleFilters;
    history::HistoryExclusions exclusions;

    /// Items already chosen in this run, "Artist|Album"
    std::vector<std::string> alreadySelected;

    /// 0 for the initial request, 1.. for top-up requests
    int iteration = 0;
};

class IPromptPlanner {
public:
    virtual ~IPromptPlanner() = default;

    [[nodiscard]] virtual auto buildPrompt(const PromptContext& context) const
        -> std::string = 0;
};

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_INTERFACES_HPP
