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

#ifndef CURATOR_CACHE_CACHE_HPP
#define CURATOR_CACHE_CACHE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>

#include <nlohmann/json.hpp>

namespace curator::cache {

using Ttl = std::optional<std::chrono::milliseconds>;

/**
 * @brief Cache statistics
 */
struct CacheStatistics {
    size_t size = 0;
    size_t maxSize = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
    std::uint64_t expirations = 0;
    double hitRate = 0.0;  ///< hits / (hits + misses), 0 when unused
    size_t approximateMemory = 0;

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return {{"size", size},
                {"maxSize", maxSize},
                {"hits", hits},
                {"misses", misses},
                {"evictions", evictions},
                {"expirations", expirations},
                {"hitRate", hitRate},
                {"approximateMemory", approximateMemory}};
    }
};

/**
 * @brief Contract of a bounded key/value cache with single-flight compute
 *
 * getOrCompute() runs @p factory at most once per missing key no matter how
 * many callers ask concurrently; every caller receives the same value or the
 * same exception. The factory receives the stop token of the caller that
 * runs it.
 */
template <typename Key, typename Value>
class ICache {
public:
    using Factory = std::function<Value(std::stop_token)>;

    virtual ~ICache() = default;

    [[nodiscard]] virtual auto get(const Key& key) -> std::optional<Value> = 0;

    virtual void set(const Key& key, Value value, Ttl ttl = std::nullopt) = 0;

    virtual auto getOrCompute(const Key& key, const Factory& factory,
                              Ttl ttl = std::nullopt,
                              std::stop_token stop = {}) -> Value = 0;

    virtual auto remove(const Key& key) -> bool = 0;

    virtual void clear() = 0;

    virtual auto purgeExpired() -> size_t = 0;

    [[nodiscard]] virtual auto statistics() const -> CacheStatistics = 0;
};

}  // namespace curator::cache

#endif  // CURATOR_CACHE_CACHE_HPP
