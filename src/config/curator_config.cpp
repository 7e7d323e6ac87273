/*
 * curator_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Top-level configuration document

**************************************************/

#include "curator_config.hpp"

#include <fstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace curator::config {

namespace {

template <typename Section>
auto readSection(const json& root) -> Section {
    auto key = std::string(Section::key());
    if (!root.contains(key)) {
        return Section::defaults();
    }
    const auto& node = root.at(key);
    if (!node.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION("Section '", std::string(Section::path()),
                                       "' must be an object");
    }
    auto section = Section::tryFromJson(node);
    if (!section) {
        THROW_INVALID_CONFIG_EXCEPTION("Section '", std::string(Section::path()),
                                       "' has a value of the wrong type");
    }
    return *section;
}

}  // namespace

CuratorConfig CuratorConfig::fromJson(const json& document) {
    if (!document.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION("Configuration root must be an object");
    }
    const auto& root = document.contains("curator") ? document.at("curator")
                                                    : document;
    if (!root.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION("'curator' must be an object");
    }

    CuratorConfig config;
    config.cache = readSection<CacheConfig>(root);
    config.pipeline = readSection<PipelineSettings>(root);
    config.history = readSection<HistoryConfig>(root);
    config.storage = readSection<StorageConfig>(root);
    config.logging = readSection<LoggingConfig>(root);
    config.validate();
    return config;
}

CuratorConfig CuratorConfig::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW_CONFIG_IO_EXCEPTION("Cannot open configuration file ",
                                  path.string());
    }
    auto document = json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        THROW_INVALID_CONFIG_EXCEPTION("Configuration file ", path.string(),
                                       " is not valid JSON");
    }
    auto config = fromJson(document);
    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

void CuratorConfig::validate() const {
    std::vector<std::string> problems;
    auto collect = [&problems](std::vector<std::string> found) {
        problems.insert(problems.end(), found.begin(), found.end());
    };
    collect(cache.violations());
    collect(pipeline.violations());
    collect(history.violations());
    collect(storage.violations());
    collect(logging.violations());

    for (const auto& problem : problems) {
        spdlog::error("Configuration error: {}", problem);
    }
    if (!problems.empty()) {
        THROW_INVALID_CONFIG_EXCEPTION("Invalid value for ", problems.front());
    }
}

json CuratorConfig::toJson() const {
    return {{"curator",
             {{std::string(CacheConfig::key()), cache.toJson()},
              {std::string(PipelineSettings::key()), pipeline.toJson()},
              {std::string(HistoryConfig::key()), history.toJson()},
              {std::string(StorageConfig::key()), storage.toJson()},
              {std::string(LoggingConfig::key()), logging.toJson()}}}};
}

}  // namespace curator::config
