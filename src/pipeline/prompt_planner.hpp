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

#ifndef CURATOR_PIPELINE_PROMPT_PLANNER_HPP
#define CURATOR_PIPELINE_PROMPT_PLANNER_HPP

#include <string>

#include "interfaces.hpp"

namespace curator::pipeline {

/**
 * @brief Plain-text prompt asking for a JSON array of recommendations
 */
class DefaultPromptPlanner : public IPromptPlanner {
public:
    explicit DefaultPromptPlanner(std::string libraryProfile = {});

    [[nodiscard]] auto buildPrompt(const PromptContext& context) const
        -> std::string override;

private:
    std::string libraryProfile_;
};

}  // namespace curator::pipeline

#endif  // CURATOR_PIPELINE_PROMPT_PLANNER_HPP
