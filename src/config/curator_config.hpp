/*
 * curator_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Top-level configuration document

**************************************************/

#ifndef CURATOR_CONFIG_CURATOR_CONFIG_HPP
#define CURATOR_CONFIG_CURATOR_CONFIG_HPP

#include <filesystem>

#include "core/exception.hpp"
#include "sections/sections.hpp"

namespace curator::config {

/**
 * @brief Every configuration section, read from one JSON document
 *
 * The document holds the sections under a "curator" object:
 * {"curator": {"cache": {...}, "pipeline": {...}, ...}}. Sections and keys
 * that are absent keep their defaults.
 */
struct CuratorConfig {
    CacheConfig cache;
    PipelineSettings pipeline;
    HistoryConfig history;
    StorageConfig storage;
    LoggingConfig logging;

    /**
     * @throws InvalidConfigException on wrongly typed or out-of-range values
     */
    [[nodiscard]] static CuratorConfig fromJson(const json& document);

    /**
     * @throws ConfigIOException if the file cannot be read
     * @throws InvalidConfigException if it is not valid JSON or fails
     *         validation
     */
    [[nodiscard]] static CuratorConfig loadFromFile(
        const std::filesystem::path& path);

    /**
     * @brief Check value ranges of every section
     * @throws InvalidConfigException naming the first offending key
     */
    void validate() const;

    [[nodiscard]] json toJson() const;
};

}  // namespace curator::config

#endif  // CURATOR_CONFIG_CURATOR_CONFIG_HPP
