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

#ifndef CURATOR_HISTORY_SUGGESTION_HISTORY_HPP
#define CURATOR_HISTORY_SUGGESTION_HISTORY_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/recommendation.hpp"
#include "model/review_item.hpp"
#include "utils/json_store.hpp"

namespace curator::history {

using model::TimePoint;

enum class HistoryEvent { Suggested, Accepted, Rejected, Disliked };

[[nodiscard]] auto historyEventToString(HistoryEvent event)
    -> std::string_view;
[[nodiscard]] auto historyEventFromString(std::string_view text)
    -> std::optional<HistoryEvent>;

/**
 * @brief One immutable ledger entry
 */
struct HistoryRecord {
    std::string key;
    std::string artist;
    std::string album;
    HistoryEvent event{HistoryEvent::Suggested};
    TimePoint timestamp{};
    std::optional<std::string> reason;
};

void to_json(nlohmann::json& j, const HistoryRecord& record);
void from_json(const nlohmann::json& j, HistoryRecord& record);

struct HistoryOptions {
    /// Document location; empty keeps the ledger in memory only
    std::filesystem::path filePath;

    /// Outcomes closer than this to the item's last suggestion are ignored
    std::chrono::milliseconds minimumOutcomeDelay{std::chrono::seconds(1)};

    /// How long a Rejected outcome keeps an item out of new batches
    std::chrono::hours rejectionMemory{24 * 30};

    /// Suggestion count at which an item is considered over-suggested
    int overSuggestedThreshold = 3;

    size_t maxPromptArtists = 50;
    size_t maxPromptAvoid = 10;
};

/**
 * @brief Items that should not be proposed again, by category
 *
 * Entries are display names: "Artist|Album" for items, plain artist names
 * for libraryArtists.
 */
struct HistoryExclusions {
    std::vector<std::string> libraryArtists;
    std::vector<std::string> recentlyRejected;
    std::vector<std::string> disliked;
    std::vector<std::string> overSuggested;

    [[nodiscard]] auto empty() const -> bool {
        return libraryArtists.empty() && recentlyRejected.empty() &&
               disliked.empty() && overSuggested.empty();
    }
};

/**
 * @brief Compact prompt fragment listing items to exclude and avoid
 *
 * Produces up to two lines: "EXCLUDE:" followed by at most @p maxArtists
 * library artists, and "AVOID:" followed by the artists of at most
 * @p maxAvoid disliked or recently rejected items. Empty when nothing is
 * excluded.
 */
[[nodiscard]] auto formatExclusionPrompt(const HistoryExclusions& exclusions,
                                         size_t maxArtists = 50,
                                         size_t maxAvoid = 10) -> std::string;

struct HistoryStatistics {
    size_t totalRecords = 0;
    size_t totalSuggestions = 0;
    size_t uniqueSuggested = 0;
    size_t accepted = 0;
    size_t rejected = 0;
    size_t disliked = 0;
    double acceptanceRate = 0.0;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Read/write contract the pipeline and review workflow depend on
 */
class ISuggestionHistory {
public:
    virtual ~ISuggestionHistory() = default;

    virtual void recordSuggestions(
        const std::vector<model::Recommendation>& items) = 0;

    virtual auto recordAccepted(std::string_view artist,
                                std::string_view album) -> bool = 0;

    virtual auto recordRejected(std::string_view artist,
                                std::string_view album,
                                std::optional<std::string> reason =
                                    std::nullopt) -> bool = 0;

    virtual auto recordDisliked(std::string_view artist,
                                std::string_view album) -> bool = 0;

    [[nodiscard]] virtual auto wasRejectedOrDisliked(
        std::string_view artist, std::string_view album) const -> bool = 0;

    [[nodiscard]] virtual auto exclusions() const -> HistoryExclusions = 0;
};

/**
 * @brief Append-only ledger of suggestion outcomes
 *
 * Every write appends a HistoryRecord and rewrites the backing document.
 * Write failures are logged and the in-memory ledger stays authoritative.
 * Disliked outcomes exclude an item permanently; Rejected outcomes expire
 * after rejectionMemory, and a later Accepted outcome supersedes them.
 */
class SuggestionHistory : public ISuggestionHistory {
public:
    using ClockFn = std::function<TimePoint()>;

    explicit SuggestionHistory(HistoryOptions options = {},
                               ClockFn clock = model::Clock::now);

    void recordSuggestions(
        const std::vector<model::Recommendation>& items) override;

    auto recordAccepted(std::string_view artist, std::string_view album)
        -> bool override;

    /**
     * @return false when the outcome was ignored because the item was
     *         suggested less than minimumOutcomeDelay ago
     */
    auto recordRejected(std::string_view artist, std::string_view album,
                        std::optional<std::string> reason = std::nullopt)
        -> bool override;

    auto recordDisliked(std::string_view artist, std::string_view album)
        -> bool override;

    [[nodiscard]] auto wasRejectedOrDisliked(std::string_view artist,
                                             std::string_view album) const
        -> bool override;

    [[nodiscard]] auto exclusions() const -> HistoryExclusions override;

    /// formatExclusionPrompt() over exclusions() with configured limits
    [[nodiscard]] auto exclusionPrompt() const -> std::string;

    [[nodiscard]] auto statistics() const -> HistoryStatistics;

    /// Number of Suggested events recorded for the item
    [[nodiscard]] auto suggestionCount(std::string_view artist,
                                       std::string_view album) const
        -> size_t;

    [[nodiscard]] auto records() const -> std::vector<HistoryRecord>;

    /**
     * @brief Maintenance: drop records older than @p maxAge
     *
     * Disliked records are kept regardless of age.
     * @return Number of records removed
     */
    auto prune(std::chrono::hours maxAge) -> size_t;

private:
    auto appendOutcomeLocked(std::string_view artist, std::string_view album,
                             HistoryEvent event,
                             std::optional<std::string> reason) -> bool;
    [[nodiscard]] auto isExcludedLocked(const std::string& key,
                                        TimePoint now) const -> bool;
    void load();
    void persistLocked() const;

    HistoryOptions options_;
    ClockFn clock_;
    std::optional<utils::JsonDocumentStore> store_;

    mutable std::mutex mutex_;
    std::vector<HistoryRecord> records_;
};

}  // namespace curator::history

#endif  // CURATOR_HISTORY_SUGGESTION_HISTORY_HPP
