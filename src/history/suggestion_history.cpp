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

#include "suggestion_history.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "utils/string_utils.hpp"

namespace curator::history {

namespace {

constexpr int DOCUMENT_VERSION = 1;

struct KeySummary {
    std::string artist;
    std::string album;
    size_t suggestions = 0;
    bool disliked = false;
    std::optional<HistoryEvent> lastOutcome;
    TimePoint lastOutcomeAt{};
};

auto displayName(const std::string& artist, const std::string& album)
    -> std::string {
    return album.empty() ? artist : artist + "|" + album;
}

// Keys in first-seen order so exclusion lists are stable across calls.
auto summarize(const std::vector<HistoryRecord>& records)
    -> std::pair<std::vector<std::string>,
                 std::unordered_map<std::string, KeySummary>> {
    std::vector<std::string> order;
    std::unordered_map<std::string, KeySummary> summaries;
    for (const auto& record : records) {
        auto [it, inserted] = summaries.try_emplace(record.key);
        auto& summary = it->second;
        if (inserted) {
            order.push_back(record.key);
            summary.artist = record.artist;
            summary.album = record.album;
        }
        switch (record.event) {
            case HistoryEvent::Suggested:
                ++summary.suggestions;
                break;
            case HistoryEvent::Disliked:
                summary.disliked = true;
                [[fallthrough]];
            case HistoryEvent::Accepted:
            case HistoryEvent::Rejected:
                summary.lastOutcome = record.event;
                summary.lastOutcomeAt = record.timestamp;
                break;
        }
    }
    return {std::move(order), std::move(summaries)};
}

}  // namespace

auto historyEventToString(HistoryEvent event) -> std::string_view {
    switch (event) {
        case HistoryEvent::Suggested:
            return "Suggested";
        case HistoryEvent::Accepted:
            return "Accepted";
        case HistoryEvent::Rejected:
            return "Rejected";
        case HistoryEvent::Disliked:
            return "Disliked";
    }
    return "Suggested";
}

auto historyEventFromString(std::string_view text)
    -> std::optional<HistoryEvent> {
    auto lowered = utils::toLower(text);
    if (lowered == "suggested") return HistoryEvent::Suggested;
    if (lowered == "accepted") return HistoryEvent::Accepted;
    if (lowered == "rejected") return HistoryEvent::Rejected;
    if (lowered == "disliked") return HistoryEvent::Disliked;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const HistoryRecord& record) {
    j = nlohmann::json{
        {"key", record.key},
        {"artist", record.artist},
        {"album", record.album},
        {"status", std::string(historyEventToString(record.event))},
        {"timestamp", model::toEpochMillis(record.timestamp)}};
    if (record.reason) {
        j["reason"] = *record.reason;
    }
}

void from_json(const nlohmann::json& j, HistoryRecord& record) {
    record.artist = j.value("artist", std::string{});
    record.album = j.value("album", std::string{});
    record.key = j.value("key", utils::makeItemKey(record.artist, record.album));
    auto statusText = j.at("status").get<std::string>();
    auto status = historyEventFromString(statusText);
    if (!status) {
        throw std::invalid_argument("Unknown history status: " + statusText);
    }
    record.event = *status;
    record.timestamp =
        model::fromEpochMillis(j.value("timestamp", std::int64_t{0}));
    record.reason.reset();
    if (auto it = j.find("reason"); it != j.end() && it->is_string()) {
        record.reason = it->get<std::string>();
    }
}

auto formatExclusionPrompt(const HistoryExclusions& exclusions,
                           size_t maxArtists, size_t maxAvoid) -> std::string {
    if (exclusions.empty()) {
        return {};
    }

    auto artistOf = [](const std::string& name) {
        return name.substr(0, name.find('|'));
    };

    std::vector<std::string> lines;
    if (!exclusions.libraryArtists.empty() && maxArtists > 0) {
        std::string line = "EXCLUDE:";
        auto count = std::min(exclusions.libraryArtists.size(), maxArtists);
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) line += ",";
            line += exclusions.libraryArtists[i];
        }
        lines.push_back(std::move(line));
    }

    std::vector<std::string> avoid = exclusions.disliked;
    avoid.insert(avoid.end(), exclusions.recentlyRejected.begin(),
                 exclusions.recentlyRejected.end());
    if (!avoid.empty() && maxAvoid > 0) {
        std::string line = "AVOID:";
        auto count = std::min(avoid.size(), maxAvoid);
        for (size_t i = 0; i < count; ++i) {
            if (i > 0) line += ",";
            line += artistOf(avoid[i]);
        }
        lines.push_back(std::move(line));
    }

    std::string prompt;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) prompt += "\n";
        prompt += lines[i];
    }
    return prompt;
}

auto HistoryStatistics::toJson() const -> nlohmann::json {
    return {{"totalRecords", totalRecords},
            {"totalSuggestions", totalSuggestions},
            {"uniqueSuggested", uniqueSuggested},
            {"accepted", accepted},
            {"rejected", rejected},
            {"disliked", disliked},
            {"acceptanceRate", acceptanceRate}};
}

SuggestionHistory::SuggestionHistory(HistoryOptions options, ClockFn clock)
    : options_(std::move(options)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = model::Clock::now;
    }
    if (!options_.filePath.empty()) {
        store_.emplace(options_.filePath);
        load();
    }
}

void SuggestionHistory::load() {
    auto document = store_->load();
    if (!document) {
        return;
    }
    auto it = document->find("records");
    if (it == document->end() || !it->is_array()) {
        spdlog::warn("History document {} has no records array, ignoring",
                     store_->path().string());
        return;
    }
    size_t skipped = 0;
    for (const auto& entry : *it) {
        try {
            records_.push_back(entry.get<HistoryRecord>());
        } catch (const nlohmann::json::exception& e) {
            ++skipped;
            spdlog::debug("Skipping history record: {}", e.what());
        } catch (const std::invalid_argument& e) {
            ++skipped;
            spdlog::debug("Skipping history record: {}", e.what());
        }
    }
    spdlog::info("Loaded {} history records from {} ({} skipped)",
                 records_.size(), store_->path().string(), skipped);
}

void SuggestionHistory::persistLocked() const {
    if (!store_) {
        return;
    }
    nlohmann::json document;
    document["version"] = DOCUMENT_VERSION;
    document["records"] = records_;
    if (!store_->save(document)) {
        spdlog::warn("History kept in memory only until the next write");
    }
}

void SuggestionHistory::recordSuggestions(
    const std::vector<model::Recommendation>& items) {
    if (items.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    for (const auto& item : items) {
        HistoryRecord record;
        record.key = item.key();
        record.artist = item.artist;
        record.album = item.album;
        record.event = HistoryEvent::Suggested;
        record.timestamp = now;
        records_.push_back(std::move(record));
    }
    spdlog::debug("Recorded {} suggestions", items.size());
    persistLocked();
}

auto SuggestionHistory::recordAccepted(std::string_view artist,
                                       std::string_view album) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return appendOutcomeLocked(artist, album, HistoryEvent::Accepted,
                               std::nullopt);
}

auto SuggestionHistory::recordRejected(std::string_view artist,
                                       std::string_view album,
                                       std::optional<std::string> reason)
    -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return appendOutcomeLocked(artist, album, HistoryEvent::Rejected,
                               std::move(reason));
}

auto SuggestionHistory::recordDisliked(std::string_view artist,
                                       std::string_view album) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return appendOutcomeLocked(artist, album, HistoryEvent::Disliked,
                               std::nullopt);
}

auto SuggestionHistory::appendOutcomeLocked(std::string_view artist,
                                            std::string_view album,
                                            HistoryEvent event,
                                            std::optional<std::string> reason)
    -> bool {
    auto key = utils::makeItemKey(artist, album);
    auto now = clock_();

    if (event != HistoryEvent::Accepted) {
        auto lastSuggested = std::find_if(
            records_.rbegin(), records_.rend(), [&key](const auto& record) {
                return record.key == key &&
                       record.event == HistoryEvent::Suggested;
            });
        if (lastSuggested != records_.rend() &&
            now - lastSuggested->timestamp < options_.minimumOutcomeDelay) {
            spdlog::debug("Ignoring {} for {}: suggested too recently",
                          historyEventToString(event), key);
            return false;
        }
    }

    HistoryRecord record;
    record.key = std::move(key);
    record.artist = utils::trim(artist);
    record.album = utils::trim(album);
    record.event = event;
    record.timestamp = now;
    record.reason = std::move(reason);
    spdlog::info("History: {} {} - {}", historyEventToString(event),
                 record.artist, record.album);
    records_.push_back(std::move(record));
    persistLocked();
    return true;
}

auto SuggestionHistory::isExcludedLocked(const std::string& key,
                                         TimePoint now) const -> bool {
    std::optional<HistoryEvent> lastOutcome;
    TimePoint lastOutcomeAt{};
    for (const auto& record : records_) {
        if (record.key != key || record.event == HistoryEvent::Suggested) {
            continue;
        }
        if (record.event == HistoryEvent::Disliked) {
            return true;
        }
        lastOutcome = record.event;
        lastOutcomeAt = record.timestamp;
    }
    return lastOutcome == HistoryEvent::Rejected &&
           now - lastOutcomeAt < options_.rejectionMemory;
}

auto SuggestionHistory::wasRejectedOrDisliked(std::string_view artist,
                                              std::string_view album) const
    -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return isExcludedLocked(utils::makeItemKey(artist, album), clock_());
}

auto SuggestionHistory::exclusions() const -> HistoryExclusions {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    auto [order, summaries] = summarize(records_);

    HistoryExclusions result;
    std::unordered_set<std::string> seenArtists;
    for (const auto& key : order) {
        const auto& summary = summaries.at(key);
        auto name = displayName(summary.artist, summary.album);
        if (summary.disliked) {
            result.disliked.push_back(name);
        } else if (summary.lastOutcome == HistoryEvent::Rejected &&
                   now - summary.lastOutcomeAt < options_.rejectionMemory) {
            result.recentlyRejected.push_back(name);
        }
        if (summary.lastOutcome == HistoryEvent::Accepted) {
            if (seenArtists.insert(utils::toLower(summary.artist)).second) {
                result.libraryArtists.push_back(summary.artist);
            }
        } else if (static_cast<int>(summary.suggestions) >=
                   options_.overSuggestedThreshold) {
            result.overSuggested.push_back(name);
        }
    }
    spdlog::debug(
        "Exclusions: {} in library, {} rejected, {} disliked, {} "
        "over-suggested",
        result.libraryArtists.size(), result.recentlyRejected.size(),
        result.disliked.size(), result.overSuggested.size());
    return result;
}

auto SuggestionHistory::exclusionPrompt() const -> std::string {
    return formatExclusionPrompt(exclusions(), options_.maxPromptArtists,
                                 options_.maxPromptAvoid);
}

auto SuggestionHistory::statistics() const -> HistoryStatistics {
    std::lock_guard<std::mutex> lock(mutex_);
    HistoryStatistics stats;
    stats.totalRecords = records_.size();
    std::unordered_set<std::string> unique;
    for (const auto& record : records_) {
        switch (record.event) {
            case HistoryEvent::Suggested:
                ++stats.totalSuggestions;
                unique.insert(record.key);
                break;
            case HistoryEvent::Accepted:
                ++stats.accepted;
                break;
            case HistoryEvent::Rejected:
                ++stats.rejected;
                break;
            case HistoryEvent::Disliked:
                ++stats.disliked;
                break;
        }
    }
    stats.uniqueSuggested = unique.size();
    if (stats.uniqueSuggested > 0) {
        stats.acceptanceRate = static_cast<double>(stats.accepted) /
                               static_cast<double>(stats.uniqueSuggested);
    }
    return stats;
}

auto SuggestionHistory::suggestionCount(std::string_view artist,
                                        std::string_view album) const
    -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = utils::makeItemKey(artist, album);
    return static_cast<size_t>(
        std::count_if(records_.begin(), records_.end(), [&key](const auto& r) {
            return r.key == key && r.event == HistoryEvent::Suggested;
        }));
}

auto SuggestionHistory::records() const -> std::vector<HistoryRecord> {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

auto SuggestionHistory::prune(std::chrono::hours maxAge) -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = clock_() - maxAge;
    auto before = records_.size();
    std::erase_if(records_, [cutoff](const HistoryRecord& record) {
        return record.event != HistoryEvent::Disliked &&
               record.timestamp < cutoff;
    });
    auto removed = before - records_.size();
    if (removed > 0) {
        spdlog::info("Cleaned up {} old history entries", removed);
        persistLocked();
    }
    return removed;
}

}  // namespace curator::history
