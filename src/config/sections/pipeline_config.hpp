/*
 * pipeline_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Recommendation pipeline run settings

**************************************************/

#ifndef CURATOR_CONFIG_SECTIONS_PIPELINE_CONFIG_HPP
#define CURATOR_CONFIG_SECTIONS_PIPELINE_CONFIG_HPP

#include <string>
#include <vector>

#include "../core/config_section.hpp"
#include "pipeline/types.hpp"

namespace curator::config {

/**
 * @brief Settings of one recommendation run
 *
 * configVersion takes part in every cache key; bump it to invalidate cached
 * batches after changing prompts or providers.
 */
struct PipelineSettings : ConfigSection<PipelineSettings> {
    static constexpr std::string_view PATH = "/curator/pipeline";

    int maxRecommendations{10};
    std::string mode{"albums"};  ///< "albums" or "artists"
    std::vector<std::string> styleFilters;
    bool relaxStyleMatching{false};
    std::string backfill{"standard"};  ///< "off", "standard", "aggressive"
    int maxTopUpIterations{3};
    double minConfidence{0.0};  ///< Safety gate threshold
    int configVersion{1};

    [[nodiscard]] pipeline::RunSettings toRunSettings() const {
        pipeline::RunSettings settings;
        settings.maxRecommendations = maxRecommendations;
        settings.mode = model::modeFromString(mode);
        settings.styleFilters = styleFilters;
        settings.relaxStyleMatching = relaxStyleMatching;
        settings.backfill = pipeline::backfillFromString(backfill);
        settings.maxTopUpIterations = maxTopUpIterations;
        return settings;
    }

    [[nodiscard]] json serialize() const {
        return {{"maxRecommendations", maxRecommendations},
                {"mode", mode},
                {"styleFilters", styleFilters},
                {"relaxStyleMatching", relaxStyleMatching},
                {"backfill", backfill},
                {"maxTopUpIterations", maxTopUpIterations},
                {"minConfidence", minConfidence},
                {"configVersion", configVersion}};
    }

    [[nodiscard]] static PipelineSettings deserialize(const json& j) {
        PipelineSettings cfg;
        cfg.maxRecommendations =
            j.value("maxRecommendations", cfg.maxRecommendations);
        cfg.mode = j.value("mode", cfg.mode);
        cfg.styleFilters = j.value("styleFilters", cfg.styleFilters);
        cfg.relaxStyleMatching =
            j.value("relaxStyleMatching", cfg.relaxStyleMatching);
        cfg.backfill = j.value("backfill", cfg.backfill);
        cfg.maxTopUpIterations =
            j.value("maxTopUpIterations", cfg.maxTopUpIterations);
        cfg.minConfidence = j.value("minConfidence", cfg.minConfidence);
        cfg.configVersion = j.value("configVersion", cfg.configVersion);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {
            {"type", "object"},
            {"properties",
             {{"maxRecommendations", {{"type", "integer"}, {"default", 10}}},
              {"mode",
               {{"type", "string"},
                {"enum", {"albums", "artists"}},
                {"default", "albums"}}},
              {"styleFilters",
               {{"type", "array"}, {"items", {{"type", "string"}}}}},
              {"relaxStyleMatching", {{"type", "boolean"}, {"default", false}}},
              {"backfill",
               {{"type", "string"},
                {"enum", {"off", "standard", "aggressive"}},
                {"default", "standard"}}},
              {"maxTopUpIterations", {{"type", "integer"}, {"default", 3}}},
              {"minConfidence", {{"type", "number"}, {"default", 0.0}}},
              {"configVersion", {{"type", "integer"}, {"default", 1}}}}}};
        addRange(schema, "maxRecommendations", 1, 100);
        addRange(schema, "maxTopUpIterations", 0, 10);
        addRange(schema, "minConfidence", 0.0, 1.0);
        return schema;
    }
};

}  // namespace curator::config

#endif  // CURATOR_CONFIG_SECTIONS_PIPELINE_CONFIG_HPP
