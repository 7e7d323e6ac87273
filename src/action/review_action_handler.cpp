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


#include "review_action_handler.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <spdlog/spdlog.h>

#include "action_response.hpp"
#include "exception/exception.hpp"
#include "utils/string_utils.hpp"

namespace curator::action {

using model::ReviewStatus;

namespace {

constexpr std::array<std::pair<std::string_view, ReviewAction>, 10>
    ACTION_NAMES{{
        {"review/getqueue", ReviewAction::GetQueue},
        {"review/getsummary", ReviewAction::GetSummary},
        {"review/getoptions", ReviewAction::GetOptions},
        {"review/accept", ReviewAction::Accept},
        {"review/reject", ReviewAction::Reject},
        {"review/never", ReviewAction::Never},
        {"review/apply", ReviewAction::Apply},
        {"review/clear", ReviewAction::Clear},
        {"review/rejectselected", ReviewAction::RejectSelected},
        {"review/neverselected", ReviewAction::NeverSelected},
    }};

auto param(const ActionParams& params, const std::string& name)
    -> std::optional<std::string> {
    auto it = params.find(name);
    if (it == params.end()) {
        return std::nullopt;
    }
    auto value = utils::trim(it->second);
    if (value.empty()) {
        return std::nullopt;
    }
    return std::string(value);
}

/// "Artist|Album" -> {artist, album}; a key without '|' names an artist
auto splitSelectionKey(std::string_view key)
    -> std::pair<std::string, std::string> {
    auto pos = key.find('|');
    if (pos == std::string_view::npos) {
        return {std::string(utils::trim(key)), {}};
    }
    return {std::string(utils::trim(key.substr(0, pos))),
            std::string(utils::trim(key.substr(pos + 1)))};
}

}  // namespace

auto reviewActionFromString(std::string_view name)
    -> std::optional<ReviewAction> {
    auto lowered = utils::toLower(utils::trim(name));
    for (const auto& [text, action] : ACTION_NAMES) {
        if (text == lowered) {
            return action;
        }
    }
    return std::nullopt;
}

auto reviewActionToString(ReviewAction action) -> std::string_view {
    for (const auto& [text, value] : ACTION_NAMES) {
        if (value == action) {
            return text;
        }
    }
    return "review/unknown";
}

ReviewActionHandler::ReviewActionHandler(
    std::shared_ptr<review::IReviewQueue> queue,
    std::shared_ptr<history::ISuggestionHistory> history,
    std::shared_ptr<IApprovalStore> approvals, ReleaseSink onRelease)
    : queue_(std::move(queue)),
      history_(std::move(history)),
      approvals_(std::move(approvals)),
      onRelease_(std::move(onRelease)) {
    if (!queue_ || !history_ || !approvals_) {
        THROW_MISSING_DEPENDENCY(
            "ReviewActionHandler requires a queue, a history and an "
            "approval store");
    }
}

auto ReviewActionHandler::handle(std::string_view action,
                                 const ActionParams& params)
    -> nlohmann::json {
    auto kind = reviewActionFromString(action);
    if (!kind) {
        spdlog::warn("Unknown review action '{}'", action);
        return ActionResponse::unknownAction(action);
    }
    try {
        return dispatch(*kind, params);
    } catch (const std::exception& e) {
        spdlog::error("Review action {} failed: {}", action, e.what());
        return ActionResponse::operationFailed(std::string(action), e.what());
    }
}

auto ReviewActionHandler::dispatch(ReviewAction action,
                                   const ActionParams& params)
    -> nlohmann::json {
    switch (action) {
        case ReviewAction::GetQueue:
            return getQueue();
        case ReviewAction::GetSummary:
            return getSummary();
        case ReviewAction::GetOptions:
            return getOptions();
        case ReviewAction::Accept:
            return accept(params);
        case ReviewAction::Reject:
            return reject(params);
        case ReviewAction::Never:
            return never(params);
        case ReviewAction::Apply:
            return apply(params);
        case ReviewAction::Clear:
            return clear(params);
        case ReviewAction::RejectSelected:
            return updateSelected(params, ReviewStatus::Rejected);
        case ReviewAction::NeverSelected:
            return updateSelected(params, ReviewStatus::NeverAgain);
    }
    return ActionResponse::unknownAction(reviewActionToString(action));
}

auto ReviewActionHandler::getQueue() const -> nlohmann::json {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : queue_->getPending()) {
        items.push_back(item);
    }
    return ActionResponse::success({{"items", std::move(items)}});
}

auto ReviewActionHandler::getSummary() const -> nlohmann::json {
    auto counts = queue_->getCounts();
    nlohmann::json options = nlohmann::json::array();
    auto add = [&options](const char* value, const char* label, size_t n) {
        options.push_back({{"value", std::string(value) + ":" +
                                         std::to_string(n)},
                           {"name", std::string(label) + ": " +
                                        std::to_string(n)}});
    };
    add("pending", "Pending", counts.pending);
    add("accepted", "Accepted", counts.accepted);
    add("rejected", "Rejected", counts.rejected);
    add("never", "Never Again", counts.never);
    return ActionResponse::success(
        {{"options", std::move(options)}, {"counts", counts.toJson()}});
}

auto ReviewActionHandler::getOptions() const -> nlohmann::json {
    auto pending = queue_->getPending();
    std::stable_sort(pending.begin(), pending.end(),
                     [](const auto& lhs, const auto& rhs) {
                         return utils::lessCaseInsensitive(
                             lhs.artist + " - " + lhs.album,
                             rhs.artist + " - " + rhs.album);
                     });
    nlohmann::json options = nlohmann::json::array();
    for (const auto& item : pending) {
        auto name = item.album.empty() ? item.artist
                                       : item.artist + " - " + item.album;
        options.push_back(
            {{"value", item.artist + "|" + item.album}, {"name", name}});
    }
    return ActionResponse::success({{"options", std::move(options)}});
}

auto ReviewActionHandler::accept(const ActionParams& params)
    -> nlohmann::json {
    auto artist = param(params, "artist");
    if (!artist) {
        return ActionResponse::missingParameter("artist");
    }
    auto album = param(params, "album");
    if (!album) {
        return ActionResponse::missingParameter("album");
    }
    bool ok = queue_->setStatus(*artist, *album, ReviewStatus::Accepted,
                                param(params, "notes"));
    spdlog::info("Review accept {} - {}: {}", *artist, *album, ok);
    return {{"ok", ok}};
}

auto ReviewActionHandler::reject(const ActionParams& params)
    -> nlohmann::json {
    auto artist = param(params, "artist");
    if (!artist) {
        return ActionResponse::missingParameter("artist");
    }
    auto album = param(params, "album");
    if (!album) {
        return ActionResponse::missingParameter("album");
    }
    auto notes = param(params, "notes");
    bool ok =
        queue_->setStatus(*artist, *album, ReviewStatus::Rejected, notes);
    if (ok) {
        history_->recordRejected(*artist, *album, notes);
    }
    spdlog::info("Review reject {} - {}: {}", *artist, *album, ok);
    return {{"ok", ok}};
}

auto ReviewActionHandler::never(const ActionParams& params)
    -> nlohmann::json {
    auto artist = param(params, "artist");
    if (!artist) {
        return ActionResponse::missingParameter("artist");
    }
    auto album = param(params, "album").value_or("");
    bool ok = queue_->setStatus(*artist, album, ReviewStatus::NeverAgain,
                                param(params, "notes"));
    // The dislike stands even when the item is no longer queued.
    bool recorded = history_->recordDisliked(*artist, album);
    spdlog::info("Review never {} - {}: {}", *artist, album, ok);
    return {{"ok", ok}, {"recorded", recorded}};
}

auto ReviewActionHandler::apply(const ActionParams& params)
    -> nlohmann::json {
    auto keys = selectedKeys(params);
    size_t approved = 0;
    for (const auto& key : keys) {
        auto [artist, album] = splitSelectionKey(key);
        if (artist.empty()) {
            continue;
        }
        if (queue_->setStatus(artist, album, ReviewStatus::Accepted)) {
            ++approved;
        }
    }

    std::vector<model::Recommendation> released;
    if (onRelease_) {
        released = queue_->dequeueAccepted();
        for (const auto& item : released) {
            history_->recordAccepted(item.artist, item.album);
        }
        if (!released.empty()) {
            onRelease_(released);
        }
    }
    clearApprovals();

    spdlog::info("Applied review selection: {} approved, {} released",
                 approved, released.size());
    return ActionResponse::success(
        {{"approved", approved},
         {"released", released.size()},
         {"cleared", true},
         {"note", onRelease_
                      ? "Accepted items released"
                      : "Accepted items will be delivered with the next run"}});
}

auto ReviewActionHandler::clear(const ActionParams& params)
    -> nlohmann::json {
    size_t removed = 0;
    if (auto keys = param(params, "keys")) {
        removed = queue_->clearSelection(utils::splitCsv(*keys));
    }
    clearApprovals();
    return ActionResponse::success(
        {{"cleared", true},
         {"removed", removed},
         {"note", "Selection cleared"}});
}

auto ReviewActionHandler::updateSelected(const ActionParams& params,
                                         ReviewStatus status)
    -> nlohmann::json {
    auto keys = selectedKeys(params);
    size_t updated = 0;
    for (const auto& key : keys) {
        auto [artist, album] = splitSelectionKey(key);
        if (artist.empty()) {
            continue;
        }
        if (!queue_->setStatus(artist, album, status)) {
            continue;
        }
        ++updated;
        if (status == ReviewStatus::Rejected) {
            history_->recordRejected(artist, album, "Batch reject");
        } else {
            history_->recordDisliked(artist, album);
        }
    }
    clearApprovals();

    spdlog::info("Marked {} selected item(s) as {}", updated,
                 model::reviewStatusToString(status));
    return ActionResponse::success(
        {{"updated", updated},
         {"cleared", true},
         {"note", status == ReviewStatus::Rejected
                      ? "Selected items rejected"
                      : "Selected items will never be suggested again"}});
}

auto ReviewActionHandler::selectedKeys(const ActionParams& params) const
    -> std::vector<std::string> {
    if (auto keys = param(params, "keys")) {
        return utils::splitCsv(*keys);
    }
    return approvals_->loadKeys();
}

void ReviewActionHandler::clearApprovals() {
    if (!approvals_->saveKeys({})) {
        spdlog::warn("Approval selection could not be cleared");
    }
}

}  // namespace curator::action
