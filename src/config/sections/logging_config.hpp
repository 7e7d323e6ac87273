/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration for the console and rotating file sinks

**************************************************/

#ifndef CURATOR_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define CURATOR_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace curator::config {

/// Level names accepted by consoleLevel and fileLevel
inline const json LOG_LEVEL_NAMES = {"trace", "debug",    "info", "warn",
                                     "error", "critical", "off"};

/**
 * @brief Console and file logging settings
 *
 * @example
 * ```json
 * "logging": {
 *   "enableConsole": true,
 *   "consoleLevel": "info",
 *   "enableFile": true,
 *   "logDir": "logs",
 *   "logFilename": "curator",
 *   "fileLevel": "debug",
 *   "maxFileSize": 10485760,
 *   "maxFiles": 5
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "/curator/logging";

    bool enableConsole{true};          ///< Enable console output
    std::string consoleLevel{"info"};  ///< Console log level
    bool consoleColor{true};           ///< Enable ANSI color codes

    bool enableFile{false};              ///< Enable file output
    std::string logDir{"logs"};          ///< Log directory path
    std::string logFilename{"curator"};  ///< Base filename (without extension)
    std::string fileLevel{"debug"};      ///< File log level

    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation
    size_t maxFiles{5};                    ///< Max number of rotated files

    /// Available placeholders: %Y %m %d %H %M %S %e (milliseconds)
    ///                        %l (level), %n (logger name), %t (thread id)
    ///                        %v (message)
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};

    [[nodiscard]] json serialize() const {
        return {{"enableConsole", enableConsole},
                {"consoleLevel", consoleLevel},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", fileLevel},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;

        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);

        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);

        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);

        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {
            {"type", "object"},
            {"properties",
             {{"enableConsole", {{"type", "boolean"}, {"default", true}}},
              {"consoleLevel",
               {{"type", "string"},
                {"enum", LOG_LEVEL_NAMES},
                {"default", "info"}}},
              {"consoleColor", {{"type", "boolean"}, {"default", true}}},
              {"enableFile", {{"type", "boolean"}, {"default", false}}},
              {"logDir", {{"type", "string"}, {"default", "logs"}}},
              {"logFilename", {{"type", "string"}, {"default", "curator"}}},
              {"fileLevel",
               {{"type", "string"},
                {"enum", LOG_LEVEL_NAMES},
                {"default", "debug"}}},
              {"maxFileSize", {{"type", "integer"}, {"default", 10485760}}},
              {"maxFiles", {{"type", "integer"}, {"default", 5}}},
              {"pattern", {{"type", "string"}}}}}};
        addRange(schema, "maxFileSize", 1024, 1073741824);
        addRange(schema, "maxFiles", 1, 100);
        return schema;
    }
};

}  // namespace curator::config

#endif  // CURATOR_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
