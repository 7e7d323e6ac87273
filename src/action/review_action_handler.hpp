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


#ifndef CURATOR_ACTION_REVIEW_ACTION_HANDLER_HPP
#define CURATOR_ACTION_REVIEW_ACTION_HANDLER_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "approval_store.hpp"
#include "history/suggestion_history.hpp"
#include "model/recommendation.hpp"
#include "review/review_queue.hpp"

namespace curator::action {

enum class ReviewAction {
    GetQueue,
    GetSummary,
    GetOptions,
    Accept,
    Reject,
    Never,
    Apply,
    Clear,
    RejectSelected,
    NeverSelected
};

/// Action names are matched case-insensitively ("review/accept")
[[nodiscard]] auto reviewActionFromString(std::string_view name)
    -> std::optional<ReviewAction>;
[[nodiscard]] auto reviewActionToString(ReviewAction action)
    -> std::string_view;

using ActionParams = std::map<std::string, std::string>;

/**
 * @brief Dispatches the review UI actions onto the queue and history
 *
 * Every handler returns a JSON object and never throws; failures come back
 * as {"ok": false, "error": {...}}. Batch actions take their keys from the
 * "keys" parameter (comma separated "Artist|Album") or, when absent, from
 * the approval store, and clear the store afterwards.
 */
class ReviewActionHandler {
public:
    using ReleaseSink =
        std::function<void(const std::vector<model::Recommendation>&)>;

    /**
     * Without @p onRelease, review/apply only marks items Accepted and the
     * next pipeline run releases them.
     *
     * @throws curator::MissingDependencyException if any collaborator is null
     */
    ReviewActionHandler(std::shared_ptr<review::IReviewQueue> queue,
                        std::shared_ptr<history::ISuggestionHistory> history,
                        std::shared_ptr<IApprovalStore> approvals,
                        ReleaseSink onRelease = {});

    auto handle(std::string_view action, const ActionParams& params)
        -> nlohmann::json;

private:
    auto dispatch(ReviewAction action, const ActionParams& params)
        -> nlohmann::json;

    auto getQueue() const -> nlohmann::json;
    auto getSummary() const -> nlohmann::json;
    auto getOptions() const -> nlohmann::json;
    auto accept(const ActionParams& params) -> nlohmann::json;
    auto reject(const ActionParams& params) -> nlohmann::json;
    auto never(const ActionParams& params) -> nlohmann::json;
    auto apply(const ActionParams& params) -> nlohmann::json;
    auto clear(const ActionParams& params) -> nlohmann::json;
    auto updateSelected(const ActionParams& params, model::ReviewStatus status)
        -> nlohmann::json;

    [[nodiscard]] auto selectedKeys(const ActionParams& params) const
        -> std::vector<std::string>;
    void clearApprovals();

    std::shared_ptr<review::IReviewQueue> queue_;
    std::shared_ptr<history::ISuggestionHistory> history_;
    std::shared_ptr<IApprovalStore> approvals_;
    ReleaseSink onRelease_;
};

}  // namespace curator::action

#endif  // CURATOR_ACTION_REVIEW_ACTION_HANDLER_HPP
