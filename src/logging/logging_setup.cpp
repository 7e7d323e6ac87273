/*
 * logging_setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_setup.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace curator::logging {

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    bool color, const std::string& pattern)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createRotatingFileSink(const std::string& file_path,
                                         size_t max_size, size_t max_files,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    try {
        ensureDirectoryExists(file_path);
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_path, max_size, max_files);
        sink->set_level(level);
        if (!pattern.empty()) {
            sink->set_pattern(pattern);
        }
        return sink;
    } catch (const std::exception& e) {
        spdlog::error("Failed to create log file '{}': {}", file_path,
                      e.what());
        return nullptr;
    }
}

void SinkFactory::ensureDirectoryExists(const std::string& file_path) {
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

auto toSpdlogLevel(const std::string& name) -> spdlog::level::level_enum {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', using info", name);
        return spdlog::level::info;
    }
    return level;
}

auto initialize(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enableConsole) {
        sinks.push_back(SinkFactory::createConsoleSink(
            toSpdlogLevel(config.consoleLevel), config.consoleColor,
            config.pattern));
    }

    std::string filePath;
    if (config.enableFile) {
        filePath = (std::filesystem::path(config.logDir) /
                    (config.logFilename + ".log"))
                       .string();
        if (auto sink = SinkFactory::createRotatingFileSink(
                filePath, config.maxFileSize, config.maxFiles,
                toSpdlogLevel(config.fileLevel), config.pattern)) {
            sinks.push_back(std::move(sink));
        } else {
            filePath.clear();
        }
    }

    auto logger =
        std::make_shared<spdlog::logger>("curator", sinks.begin(), sinks.end());
    // The logger passes everything; each sink filters at its own level.
    auto lowest = spdlog::level::off;
    for (const auto& sink : sinks) {
        lowest = std::min(lowest, sink->level());
    }
    logger->set_level(lowest);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!filePath.empty()) {
        spdlog::debug("Logging to {}", filePath);
    }
    return logger;
}

}  // namespace curator::logging
