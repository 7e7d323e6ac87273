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

#include "prompt_planner.hpp"

#include <algorithm>
#include <sstream>

namespace curator::pipeline {

namespace {
// Top-up prompts list the items already chosen; cap the list.
constexpr size_t MAX_LISTED_SELECTIONS = 50;
}  // namespace

DefaultPromptPlanner::DefaultPromptPlanner(std::string libraryProfile)
    : libraryProfile_(std::move(libraryProfile)) {}

auto DefaultPromptPlanner::buildPrompt(const PromptContext& context) const
    -> std::string {
    const bool artists = context.mode == RecommendationMode::Artists;

    std::ostringstream oss;
    oss << "Recommend " << context.count << ' '
        << (artists ? "artists" : "albums")
        << " the listener does not own yet.\n";
    if (!libraryProfile_.empty()) {
        oss << "Library profile: " << libraryProfile_ << '\n';
    }
    if (!context.styleFilters.empty()) {
        oss << "Only use these styles: ";
        for (size_t i = 0; i < context.styleFilters.size(); ++i) {
            oss << (i > 0 ? ", " : "") << context.styleFilters[i];
        }
        oss << '\n';
    }

    auto exclusions = history::formatExclusionPrompt(context.exclusions);
    if (!exclusions.empty()) {
        oss << exclusions << '\n';
    }

    if (context.iteration > 0 && !context.alreadySelected.empty()) {
        oss << "Already selected, do not repeat: ";
        auto count =
            std::min(context.alreadySelected.size(), MAX_LISTED_SELECTIONS);
        for (size_t i = 0; i < count; ++i) {
            oss << (i > 0 ? "; " : "") << context.alreadySelected[i];
        }
        oss << '\n';
    }

    oss << "Respond with a JSON array of objects with fields artist, "
        << (artists ? "" : "album, ")
        << "genre, year, confidence (0-1) and reason.";
    return oss.str();
}

}  // namespace curator::pipeline
