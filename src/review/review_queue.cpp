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

#include "review_queue.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "utils/string_utils.hpp"

namespace curator::review {

namespace {
constexpr int DOCUMENT_VERSION = 1;
}  // namespace

auto normalizeSelectionKey(std::string_view key) -> std::string {
    auto separator = key.find('|');
    if (separator == std::string_view::npos) {
        return utils::makeItemKey(key, "");
    }
    return utils::makeItemKey(key.substr(0, separator),
                              key.substr(separator + 1));
}

ReviewQueue::ReviewQueue(std::filesystem::path filePath, ClockFn clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = model::Clock::now;
    }
    if (!filePath.empty()) {
        store_.emplace(std::move(filePath));
        load();
    }
}

void ReviewQueue::load() {
    auto document = store_->load();
    if (!document) {
        return;
    }
    auto it = document->find("items");
    if (it == document->end() || !it->is_array()) {
        spdlog::warn("Review queue document {} has no items array, ignoring",
                     store_->path().string());
        return;
    }
    for (const auto& entry : *it) {
        try {
            auto item = entry.get<ReviewItem>();
            if (item.artist.empty()) {
                continue;
            }
            item.key = utils::makeItemKey(item.artist, item.album);
            items_.try_emplace(item.key, std::move(item));
        } catch (const nlohmann::json::exception& e) {
            spdlog::debug("Skipping review item: {}", e.what());
        }
    }
    spdlog::info("Loaded {} review items from {}", items_.size(),
                 store_->path().string());
}

void ReviewQueue::persistLocked() const {
    if (!store_) {
        return;
    }
    nlohmann::json document;
    document["version"] = DOCUMENT_VERSION;
    document["items"] = sortedLocked(std::nullopt);
    if (!store_->save(document)) {
        spdlog::warn("Review queue kept in memory only until the next write");
    }
}

auto ReviewQueue::sortedLocked(std::optional<ReviewStatus> filter) const
    -> std::vector<ReviewItem> {
    std::vector<ReviewItem> result;
    result.reserve(items_.size());
    for (const auto& [key, item] : items_) {
        if (!filter || item.status == *filter) {
            result.push_back(item);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const ReviewItem& a, const ReviewItem& b) {
                  if (a.createdAt != b.createdAt) {
                      return a.createdAt > b.createdAt;
                  }
                  return a.key < b.key;
              });
    return result;
}

auto ReviewQueue::enqueue(const std::vector<model::Recommendation>& items,
                          std::string_view reason) -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    size_t added = 0;
    for (const auto& rec : items) {
        if (utils::trim(rec.artist).empty()) {
            continue;
        }
        ReviewItem item;
        item.key = rec.key();
        if (items_.contains(item.key)) {
            continue;
        }
        item.artist = rec.artist;
        item.album = rec.album;
        item.genre = rec.genre;
        item.reason = rec.reason;
        item.confidence = rec.confidence;
        item.status = ReviewStatus::Pending;
        item.createdAt = now;
        item.updatedAt = now;
        if (!reason.empty()) {
            item.notes = std::string(reason);
        }
        items_.emplace(item.key, std::move(item));
        ++added;
    }
    if (added > 0) {
        spdlog::info("Queued {} item(s) for review: {}", added, reason);
        persistLocked();
    }
    return added;
}

auto ReviewQueue::setStatus(std::string_view artist, std::string_view album,
                            ReviewStatus status,
                            std::optional<std::string> notes) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = utils::makeItemKey(artist, album);
    auto it = items_.find(key);
    if (it == items_.end()) {
        spdlog::debug("Review item not found: {}", key);
        return false;
    }
    auto& item = it->second;
    if (!model::isAllowedTransition(item.status, status)) {
        spdlog::warn("Rejected review transition {} -> {} for {}",
                     model::reviewStatusToString(item.status),
                     model::reviewStatusToString(status), key);
        return false;
    }
    item.status = status;
    item.updatedAt = clock_();
    if (notes) {
        item.notes = std::move(notes);
    }
    spdlog::info("Review item {} is now {}", key,
                 model::reviewStatusToString(status));
    persistLocked();
    return true;
}

auto ReviewQueue::dequeueAccepted(std::optional<size_t> limit)
    -> std::vector<model::Recommendation> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ReviewItem> accepted;
    for (const auto& [key, item] : items_) {
        if (item.status == ReviewStatus::Accepted) {
            accepted.push_back(item);
        }
    }
    if (accepted.empty() || (limit && *limit == 0)) {
        return {};
    }
    std::sort(accepted.begin(), accepted.end(),
              [](const ReviewItem& a, const ReviewItem& b) {
                  if (a.updatedAt != b.updatedAt) {
                      return a.updatedAt < b.updatedAt;
                  }
                  return a.key < b.key;
              });
    if (limit && accepted.size() > *limit) {
        accepted.resize(*limit);
    }

    std::vector<model::Recommendation> released;
    released.reserve(accepted.size());
    for (const auto& item : accepted) {
        items_.erase(item.key);
        released.push_back(item.toRecommendation());
    }
    spdlog::info("Released {} accepted review item(s)", released.size());
    persistLocked();
    return released;
}

auto ReviewQueue::statusOf(std::string_view artist,
                           std::string_view album) const
    -> std::optional<ReviewStatus> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(utils::makeItemKey(artist, album));
    if (it == items_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

auto ReviewQueue::getPending() const -> std::vector<ReviewItem> {
    std::lock_guard<std::mutex> lock(mutex_);
    return sortedLocked(ReviewStatus::Pending);
}

auto ReviewQueue::getAll() const -> std::vector<ReviewItem> {
    std::lock_guard<std::mutex> lock(mutex_);
    return sortedLocked(std::nullopt);
}

auto ReviewQueue::getCounts() const -> ReviewCounts {
    std::lock_guard<std::mutex> lock(mutex_);
    ReviewCounts counts;
    for (const auto& [key, item] : items_) {
        switch (item.status) {
            case ReviewStatus::Pending:
                ++counts.pending;
                break;
            case ReviewStatus::Accepted:
                ++counts.accepted;
                break;
            case ReviewStatus::Rejected:
                ++counts.rejected;
                break;
            case ReviewStatus::NeverAgain:
                ++counts.never;
                break;
        }
    }
    return counts;
}

auto ReviewQueue::clearSelection(const std::vector<std::string>& keys)
    -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t cleared = 0;
    for (const auto& raw : keys) {
        if (utils::trim(raw).empty()) {
            continue;
        }
        cleared += items_.erase(normalizeSelectionKey(raw));
    }
    if (cleared > 0) {
        spdlog::info("Cleared {} selected review item(s)", cleared);
        persistLocked();
    }
    return cleared;
}

auto ReviewQueue::clear(std::optional<ReviewStatus> status) -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto removed = std::erase_if(items_, [&status](const auto& entry) {
        return !status || entry.second.status == *status;
    });
    if (removed > 0) {
        spdlog::info("Cleared {} review item(s)", removed);
        persistLocked();
    }
    return removed;
}

}  // namespace curator::review
