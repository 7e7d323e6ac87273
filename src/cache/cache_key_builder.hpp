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

#ifndef CURATOR_CACHE_CACHE_KEY_BUILDER_HPP
#define CURATOR_CACHE_CACHE_KEY_BUILDER_HPP

#include <memory>
#include <string>
#include <vector>

#include "model/recommendation.hpp"

namespace curator::cache {

/**
 * @brief Source of the planner/configuration version mixed into cache keys
 *
 * Bumping the version invalidates every cached pipeline result without
 * touching the cache itself.
 */
class IConfigVersionProvider {
public:
    virtual ~IConfigVersionProvider() = default;
    [[nodiscard]] virtual auto version() const -> std::string = 0;
};

/**
 * @brief Fixed version string, typically read from configuration
 */
class StaticConfigVersionProvider : public IConfigVersionProvider {
public:
    explicit StaticConfigVersionProvider(std::string version)
        : version_(std::move(version)) {}

    [[nodiscard]] auto version() const -> std::string override {
        return version_;
    }

private:
    std::string version_;
};

/**
 * @brief Everything that identifies one pipeline result
 */
struct CacheKeyInput {
    std::string providerIdentity;
    int maxRecommendations = 0;
    std::string libraryFingerprint;
    std::vector<std::string> styleFilters;
    bool relaxStyleMatching = false;
    model::RecommendationMode mode = model::RecommendationMode::Albums;
};

/**
 * @brief Deterministic cache key for pipeline results
 *
 * The key is the canonical form itself rather than a digest of it, so
 * distinct inputs never share a key. Style filters are slugged,
 * de-duplicated and sorted first, so two requests that differ only in
 * filter order or spelling do.
 */
class CacheKeyBuilder {
public:
    explicit CacheKeyBuilder(
        std::shared_ptr<const IConfigVersionProvider> versionProvider);

    [[nodiscard]] auto build(const CacheKeyInput& input) const -> std::string;

    /// Canonical text that build() prefixes into the key
    [[nodiscard]] auto canonicalForm(const CacheKeyInput& input) const
        -> std::string;

private:
    std::shared_ptr<const IConfigVersionProvider> versionProvider_;
};

}  // namespace curator::cache

#endif  // CURATOR_CACHE_CACHE_KEY_BUILDER_HPP
