/*
 * logging_setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Builds the default spdlog logger from LoggingConfig

**************************************************/

#ifndef CURATOR_LOGGING_LOGGING_SETUP_HPP
#define CURATOR_LOGGING_LOGGING_SETUP_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace curator::logging {

/**
 * @brief Factory for the sinks the default logger is assembled from
 */
class SinkFactory {
public:
    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level, bool color,
        const std::string& pattern = "") -> spdlog::sink_ptr;

    /**
     * @return Rotating file sink, or nullptr when the file cannot be opened
     */
    [[nodiscard]] static auto createRotatingFileSink(
        const std::string& file_path, size_t max_size, size_t max_files,
        spdlog::level::level_enum level, const std::string& pattern = "")
        -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& file_path);
};

[[nodiscard]] auto toSpdlogLevel(const std::string& name)
    -> spdlog::level::level_enum;

/**
 * @brief Install a logger named "curator" as the spdlog default
 *
 * A file sink that cannot be created is reported and skipped; console
 * logging still works.
 * @return The installed logger
 */
auto initialize(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace curator::logging

#endif  // CURATOR_LOGGING_LOGGING_SETUP_HPP
