/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: CRTP base for curator configuration sections with
             schema-driven value checks

**************************************************/

#ifndef CURATOR_CONFIG_CORE_CONFIG_SECTION_HPP
#define CURATOR_CONFIG_CORE_CONFIG_SECTION_HPP

#include <algorithm>
#include <cmath>
#include <concepts>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace curator::config {

using json = nlohmann::json;

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member for the configuration path
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON,
 *    falling back to defaults for absent keys
 * 4. Implement static generateSchema() to return JSON Schema; its
 *    ranges and enums drive violations()
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Configuration path (e.g., "/curator/cache")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Name of the section inside the "curator" object
     */
    [[nodiscard]] static constexpr std::string_view key() noexcept {
        auto full = Derived::PATH;
        return full.substr(full.find_last_of('/') + 1);
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    /**
     * @brief Try to create a configuration from JSON
     * @return Configuration instance or nullopt when a value has the wrong
     *         type
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception&) {
            return std::nullopt;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Check the current values against the section schema
     *
     * Honors "minimum", "maximum", "enum" and "minLength" of every
     * property present in both the schema and serialize().
     * @return One message per offending key, prefixed with its full path
     */
    [[nodiscard]] std::vector<std::string> violations() const {
        std::vector<std::string> found;
        const auto values = toJson();
        const auto properties = schema().value("properties", json::object());
        for (const auto& [name, rules] : properties.items()) {
            auto it = values.find(name);
            if (it == values.end()) {
                continue;
            }
            if (auto problem = checkValue(*it, rules)) {
                found.push_back(std::string(path()) + "/" + name + " " +
                                *problem);
            }
        }
        return found;
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

protected:
    /**
     * @brief Helper to add a range constraint to a numeric property
     */
    static void addRange(json& schema, const std::string& name,
                         std::optional<double> minimum = std::nullopt,
                         std::optional<double> maximum = std::nullopt) {
        if (schema.contains("properties") &&
            schema["properties"].contains(name)) {
            auto& prop = schema["properties"][name];
            if (minimum) {
                prop["minimum"] = *minimum;
            }
            if (maximum) {
                prop["maximum"] = *maximum;
            }
        }
    }

private:
    [[nodiscard]] static std::optional<std::string> checkValue(
        const json& value, const json& rules) {
        if (value.is_number()) {
            const auto number = value.get<double>();
            if (std::isnan(number)) {
                return "must be a number";
            }
            if (rules.contains("minimum") &&
                number < rules["minimum"].get<double>()) {
                return "must be at least " + rules["minimum"].dump();
            }
            if (rules.contains("maximum") &&
                number > rules["maximum"].get<double>()) {
                return "must be at most " + rules["maximum"].dump();
            }
        }
        if (rules.contains("enum")) {
            const auto& allowed = rules["enum"];
            if (std::find(allowed.begin(), allowed.end(), value) ==
                allowed.end()) {
                return "must be one of " + allowed.dump();
            }
        }
        if (value.is_string() && rules.contains("minLength") &&
            value.get<std::string>().size() <
                rules["minLength"].get<size_t>()) {
            return "must not be empty";
        }
        return std::nullopt;
    }
};

}  // namespace curator::config

#endif  // CURATOR_CONFIG_CORE_CONFIG_SECTION_HPP
