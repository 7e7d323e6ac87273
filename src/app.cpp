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


#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "action/approval_store.hpp"
#include "action/review_action_handler.hpp"
#include "config/curator_config.hpp"
#include "history/suggestion_history.hpp"
#include "logging/logging_setup.hpp"
#include "review/review_queue.hpp"

namespace fs = std::filesystem;
using namespace std::string_literals;

namespace {

auto loadConfig(const fs::path& path) -> curator::config::CuratorConfig {
    if (!fs::exists(path)) {
        spdlog::warn("No configuration file at {}, using defaults",
                     path.string());
        return curator::config::CuratorConfig{};
    }
    return curator::config::CuratorConfig::loadFromFile(path);
}

}  // namespace

int main(int argc, char* argv[]) {
    atom::utils::ArgumentParser program("Curator"s);

    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "curator.json"s, "Path to the config file",
                        {"c"});
    program.addArgument("action", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "review/getsummary"s,
                        "Review action (review/getqueue, review/accept, ...)",
                        {"a"});
    program.addArgument("artist", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Artist of the reviewed item");
    program.addArgument("album", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Album of the reviewed item");
    program.addArgument("notes", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Reviewer notes");
    program.addArgument("keys", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s,
                        "Comma separated Artist|Album selection for batch "
                        "actions");
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Console log level (trace/debug/info/warn/error)",
                        {"l"});

    program.addDescription("Curator review queue command line:");
    program.addEpilog("End.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    curator::config::CuratorConfig config;
    try {
        config = loadConfig(program.get<std::string>("config").value_or(
            "curator.json"s));
    } catch (const curator::config::BadConfigException& e) {
        spdlog::error("Configuration rejected: {}", e.what());
        return 1;
    }

    if (auto level = program.get<std::string>("log-level");
        level && !level->empty()) {
        config.logging.consoleLevel = *level;
    }
    curator::logging::initialize(config.logging);

    const auto& storage = config.storage;
    auto queue = std::make_shared<curator::review::ReviewQueue>(
        storage.resolve(storage.reviewQueueFile));
    auto history = std::make_shared<curator::history::SuggestionHistory>(
        config.history.toOptions(storage.resolve(storage.historyFile)));
    auto approvals = std::make_shared<curator::action::FileApprovalStore>(
        storage.resolve(storage.approvalsFile));

    curator::action::ReviewActionHandler handler(queue, history, approvals);

    curator::action::ActionParams params;
    for (const auto* name : {"artist", "album", "notes", "keys"}) {
        if (auto value = program.get<std::string>(name);
            value && !value->empty()) {
            params[name] = *value;
        }
    }

    auto action =
        program.get<std::string>("action").value_or("review/getsummary"s);
    auto response = handler.handle(action, params);
    std::cout << response.dump(2) << std::endl;

    spdlog::shutdown();
    return response.value("ok", false) ? 0 : 1;
}
