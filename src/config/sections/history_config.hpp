/*
 * history_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Suggestion history configuration

**************************************************/

#ifndef CURATOR_CONFIG_SECTIONS_HISTORY_CONFIG_HPP
#define CURATOR_CONFIG_SECTIONS_HISTORY_CONFIG_HPP

#include <chrono>
#include <filesystem>

#include "../core/config_section.hpp"
#include "history/suggestion_history.hpp"

namespace curator::config {

struct HistoryConfig : ConfigSection<HistoryConfig> {
    static constexpr std::string_view PATH = "/curator/history";

    int64_t minimumOutcomeDelayMs{1000};
    int rejectionMemoryDays{30};
    int overSuggestedThreshold{3};
    size_t maxPromptArtists{50};
    size_t maxPromptAvoid{10};

    [[nodiscard]] history::HistoryOptions toOptions(
        std::filesystem::path filePath) const {
        history::HistoryOptions options;
        options.filePath = std::move(filePath);
        options.minimumOutcomeDelay =
            std::chrono::milliseconds(minimumOutcomeDelayMs);
        options.rejectionMemory = std::chrono::hours(24 * rejectionMemoryDays);
        options.overSuggestedThreshold = overSuggestedThreshold;
        options.maxPromptArtists = maxPromptArtists;
        options.maxPromptAvoid = maxPromptAvoid;
        return options;
    }

    [[nodiscard]] json serialize() const {
        return {{"minimumOutcomeDelayMs", minimumOutcomeDelayMs},
                {"rejectionMemoryDays", rejectionMemoryDays},
                {"overSuggestedThreshold", overSuggestedThreshold},
                {"maxPromptArtists", maxPromptArtists},
                {"maxPromptAvoid", maxPromptAvoid}};
    }

    [[nodiscard]] static HistoryConfig deserialize(const json& j) {
        HistoryConfig cfg;
        cfg.minimumOutcomeDelayMs =
            j.value("minimumOutcomeDelayMs", cfg.minimumOutcomeDelayMs);
        cfg.rejectionMemoryDays =
            j.value("rejectionMemoryDays", cfg.rejectionMemoryDays);
        cfg.overSuggestedThreshold =
            j.value("overSuggestedThreshold", cfg.overSuggestedThreshold);
        cfg.maxPromptArtists = j.value("maxPromptArtists", cfg.maxPromptArtists);
        cfg.maxPromptAvoid = j.value("maxPromptAvoid", cfg.maxPromptAvoid);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {
            {"type", "object"},
            {"properties",
             {{"minimumOutcomeDelayMs", {{"type", "integer"}, {"default", 1000}}},
              {"rejectionMemoryDays", {{"type", "integer"}, {"default", 30}}},
              {"overSuggestedThreshold", {{"type", "integer"}, {"default", 3}}},
              {"maxPromptArtists", {{"type", "integer"}, {"default", 50}}},
              {"maxPromptAvoid", {{"type", "integer"}, {"default", 10}}}}}};
        addRange(schema, "minimumOutcomeDelayMs", 0);
        addRange(schema, "rejectionMemoryDays", 0);
        addRange(schema, "overSuggestedThreshold", 1);
        return schema;
    }
};

}  // namespace curator::config

#endif  // CURATOR_CONFIG_SECTIONS_HISTORY_CONFIG_HPP
