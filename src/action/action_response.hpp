/*
 * action_response.hpp - Review Action Response Builder
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CURATOR_ACTION_ACTION_RESPONSE_HPP
#define CURATOR_ACTION_ACTION_RESPONSE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace curator::action {

/**
 * @brief Uniform result objects for the review action surface
 *
 * Successful results are flat objects carrying "ok": true next to their
 * payload fields. Failures carry "ok": false and an "error" object with a
 * machine readable code and a message.
 */
struct ActionResponse {
    /**
     * @brief Creates a success response
     *
     * @param fields Payload fields merged next to "ok"
     * @return JSON object with ok = true
     */
    static auto success(const nlohmann::json& fields = nlohmann::json::object())
        -> nlohmann::json {
        nlohmann::json response = {{"ok", true}};
        if (fields.is_object()) {
            response.update(fields);
        }
        return response;
    }

    /**
     * @brief Creates an error response with code, message, and optional details
     *
     * @param code Error code identifier (e.g., "missing_parameter")
     * @param message Human-readable error description
     * @param details Additional error context
     * @return JSON object with ok = false
     */
    static auto error(const std::string& code, const std::string& message,
                      const nlohmann::json& details = nlohmann::json::object())
        -> nlohmann::json {
        nlohmann::json err = {
            {"ok", false},
            {"error", {{"code", code}, {"message", message}}}};
        if (!details.empty()) {
            err["error"]["details"] = details;
        }
        return err;
    }

    static auto missingParameter(const std::string& param) -> nlohmann::json {
        return error("missing_parameter",
                     "Required parameter missing: " + param,
                     {{"param", param}});
    }

    static auto unknownAction(std::string_view action) -> nlohmann::json {
        return error("unknown_action",
                     "Unknown action: " + std::string(action),
                     {{"action", std::string(action)}});
    }

    static auto operationFailed(const std::string& operation,
                                const std::string& reason) -> nlohmann::json {
        return error("operation_failed", operation + " failed: " + reason,
                     {{"operation", operation}, {"reason", reason}});
    }
};

}  // namespace curator::action

#endif  // CURATOR_ACTION_ACTION_RESPONSE_HPP
