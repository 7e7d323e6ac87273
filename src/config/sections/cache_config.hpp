/*
 * cache_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Result cache configuration

**************************************************/

#ifndef CURATOR_CONFIG_SECTIONS_CACHE_CONFIG_HPP
#define CURATOR_CONFIG_SECTIONS_CACHE_CONFIG_HPP

#include <chrono>
#include <cstddef>

#include "../core/config_section.hpp"
#include "cache/bounded_cache.hpp"

namespace curator::config {

/**
 * @brief Sizing and expiry of the recommendation result cache
 *
 * @example
 * ```json
 * "cache": {
 *   "maxSize": 1000,
 *   "defaultTtlSeconds": 1800,
 *   "sweepIntervalSeconds": 60
 * }
 * ```
 */
struct CacheConfig : ConfigSection<CacheConfig> {
    static constexpr std::string_view PATH = "/curator/cache";

    size_t maxSize{1000};            ///< Entry capacity before LRU eviction
    int64_t defaultTtlSeconds{1800};  ///< 0 keeps entries until evicted
    int64_t sweepIntervalSeconds{60};  ///< 0 disables the sweeper thread
    size_t sweepBatchSize{256};

    [[nodiscard]] cache::BoundedCacheOptions toOptions() const {
        cache::BoundedCacheOptions options;
        options.maxSize = maxSize;
        options.defaultTtl =
            defaultTtlSeconds > 0
                ? cache::Ttl(std::chrono::seconds(defaultTtlSeconds))
                : std::nullopt;
        options.sweepInterval = std::chrono::seconds(sweepIntervalSeconds);
        options.sweepBatchSize = sweepBatchSize;
        return options;
    }

    [[nodiscard]] json serialize() const {
        return {{"maxSize", maxSize},
                {"defaultTtlSeconds", defaultTtlSeconds},
                {"sweepIntervalSeconds", sweepIntervalSeconds},
                {"sweepBatchSize", sweepBatchSize}};
    }

    [[nodiscard]] static CacheConfig deserialize(const json& j) {
        CacheConfig cfg;
        cfg.maxSize = j.value("maxSize", cfg.maxSize);
        cfg.defaultTtlSeconds =
            j.value("defaultTtlSeconds", cfg.defaultTtlSeconds);
        cfg.sweepIntervalSeconds =
            j.value("sweepIntervalSeconds", cfg.sweepIntervalSeconds);
        cfg.sweepBatchSize = j.value("sweepBatchSize", cfg.sweepBatchSize);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {
            {"type", "object"},
            {"properties",
             {{"maxSize", {{"type", "integer"}, {"default", 1000}}},
              {"defaultTtlSeconds", {{"type", "integer"}, {"default", 1800}}},
              {"sweepIntervalSeconds", {{"type", "integer"}, {"default", 60}}},
              {"sweepBatchSize", {{"type", "integer"}, {"default", 256}}}}}};
        addRange(schema, "maxSize", 1);
        addRange(schema, "defaultTtlSeconds", 0);
        addRange(schema, "sweepIntervalSeconds", 0);
        addRange(schema, "sweepBatchSize", 1);
        return schema;
    }
};

}  // namespace curator::config

#endif  // CURATOR_CONFIG_SECTIONS_CACHE_CONFIG_HPP
