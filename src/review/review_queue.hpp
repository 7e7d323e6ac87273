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

#ifndef CURATOR_REVIEW_REVIEW_QUEUE_HPP
#define CURATOR_REVIEW_REVIEW_QUEUE_HPP

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/recommendation.hpp"
#include "model/review_item.hpp"
#include "utils/json_store.hpp"

namespace curator::review {

using model::ReviewItem;
using model::ReviewStatus;

struct ReviewCounts {
    size_t pending = 0;
    size_t accepted = 0;
    size_t rejected = 0;
    size_t never = 0;

    [[nodiscard]] auto total() const -> size_t {
        return pending + accepted + rejected + never;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"pending", pending},
                {"accepted", accepted},
                {"rejected", rejected},
                {"never", never}};
    }
};

/**
 * @brief Contract of the human review queue
 */
class IReviewQueue {
public:
    virtual ~IReviewQueue() = default;

    /**
     * @brief Add items awaiting a decision
     *
     * Items whose key is already present are skipped, whatever their
     * current status.
     * @return Number of items actually added
     */
    virtual auto enqueue(const std::vector<model::Recommendation>& items,
                         std::string_view reason) -> size_t = 0;

    /**
     * @return false when the item is unknown or the transition is not
     *         allowed
     */
    virtual auto setStatus(std::string_view artist, std::string_view album,
                           ReviewStatus status,
                           std::optional<std::string> notes = std::nullopt)
        -> bool = 0;

    /**
     * @brief Remove and return Accepted items, oldest decision first
     *
     * Items beyond @p limit stay Accepted for a later call.
     */
    virtual auto dequeueAccepted(std::optional<size_t> limit = std::nullopt)
        -> std::vector<model::Recommendation> = 0;

    [[nodiscard]] virtual auto statusOf(std::string_view artist,
                                        std::string_view album) const
        -> std::optional<ReviewStatus> = 0;

    /// Pending items, newest first
    [[nodiscard]] virtual auto getPending() const
        -> std::vector<ReviewItem> = 0;

    [[nodiscard]] virtual auto getCounts() const -> ReviewCounts = 0;

    /**
     * @brief Remove the items named by @p keys ("artist|album")
     * @return Number of items removed
     */
    virtual auto clearSelection(const std::vector<std::string>& keys)
        -> size_t = 0;
};

/**
 * @brief Durable review queue backed by a JSON document
 *
 * Every mutation rewrites the whole document atomically. A failed write is
 * logged, the in-memory transition stands, and the next mutation rewrites
 * the document again.
 */
class ReviewQueue : public IReviewQueue {
public:
    using ClockFn = std::function<model::TimePoint()>;

    /**
     * @param filePath Document location; empty keeps the queue in memory
     */
    explicit ReviewQueue(std::filesystem::path filePath = {},
                         ClockFn clock = model::Clock::now);

    auto enqueue(const std::vector<model::Recommendation>& items,
                 std::string_view reason) -> size_t override;

    auto setStatus(std::string_view artist, std::string_view album,
                   ReviewStatus status,
                   std::optional<std::string> notes = std::nullopt)
        -> bool override;

    auto dequeueAccepted(std::optional<size_t> limit = std::nullopt)
        -> std::vector<model::Recommendation> override;

    [[nodiscard]] auto statusOf(std::string_view artist,
                                std::string_view album) const
        -> std::optional<ReviewStatus> override;

    [[nodiscard]] auto getPending() const -> std::vector<ReviewItem> override;

    [[nodiscard]] auto getCounts() const -> ReviewCounts override;

    auto clearSelection(const std::vector<std::string>& keys)
        -> size_t override;

    /// All items, newest first
    [[nodiscard]] auto getAll() const -> std::vector<ReviewItem>;

    /**
     * @brief Remove every item, or every item with @p status
     * @return Number of items removed
     */
    auto clear(std::optional<ReviewStatus> status = std::nullopt) -> size_t;

private:
    void load();
    void persistLocked() const;
    [[nodiscard]] auto sortedLocked(std::optional<ReviewStatus> filter) const
        -> std::vector<ReviewItem>;

    ClockFn clock_;
    std::optional<utils::JsonDocumentStore> store_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ReviewItem> items_;
};

/**
 * @brief Normalize a user-supplied "Artist|Album" selection key
 */
[[nodiscard]] auto normalizeSelectionKey(std::string_view key) -> std::string;

}  // namespace curator::review

#endif  // CURATOR_REVIEW_REVIEW_QUEUE_HPP
