/*
 * storage_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Locations of the durable review and history documents

**************************************************/

#ifndef CURATOR_CONFIG_SECTIONS_STORAGE_CONFIG_HPP
#define CURATOR_CONFIG_SECTIONS_STORAGE_CONFIG_HPP

#include <filesystem>
#include <string>

#include "../core/config_section.hpp"

namespace curator::config {

/**
 * @brief File names are resolved relative to dataDir
 */
struct StorageConfig : ConfigSection<StorageConfig> {
    static constexpr std::string_view PATH = "/curator/storage";

    std::string dataDir{"data"};
    std::string reviewQueueFile{"review_queue.json"};
    std::string historyFile{"recommendation_history.json"};
    std::string approvalsFile{"review_approvals.json"};

    [[nodiscard]] std::filesystem::path resolve(const std::string& file) const {
        return std::filesystem::path(dataDir) / file;
    }

    [[nodiscard]] json serialize() const {
        return {{"dataDir", dataDir},
                {"reviewQueueFile", reviewQueueFile},
                {"historyFile", historyFile},
                {"approvalsFile", approvalsFile}};
    }

    [[nodiscard]] static StorageConfig deserialize(const json& j) {
        StorageConfig cfg;
        cfg.dataDir = j.value("dataDir", cfg.dataDir);
        cfg.reviewQueueFile = j.value("reviewQueueFile", cfg.reviewQueueFile);
        cfg.historyFile = j.value("historyFile", cfg.historyFile);
        cfg.approvalsFile = j.value("approvalsFile", cfg.approvalsFile);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        return {{"type", "object"},
                {"properties",
                 {{"dataDir",
                   {{"type", "string"}, {"default", "data"}, {"minLength", 1}}},
                  {"reviewQueueFile",
                   {{"type", "string"}, {"default", "review_queue.json"}}},
                  {"historyFile",
                   {{"type", "string"},
                    {"default", "recommendation_history.json"}}},
                  {"approvalsFile",
                   {{"type", "string"},
                    {"default", "review_approvals.json"}}}}}};
    }
};

}  // namespace curator::config

#endif  // CURATOR_CONFIG_SECTIONS_STORAGE_CONFIG_HPP
