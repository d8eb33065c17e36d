/**
 * @file engine_config.cpp
 * @brief Implementation of configuration validation and loading
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/engine/engine_config.hpp"
#include "pii/compat/format.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <utility>

namespace pii::engine {

namespace {

[[nodiscard]] auto in_unit_range(double value) -> bool {
    return value >= 0.0 && value <= 1.0;
}

[[nodiscard]] auto config_error(const std::string& name, const std::string& value)
    -> VoidResult {
    return pii_void_error(error_codes::invalid_configuration,
                          "Invalid configuration value",
                          compat::format("{}={}", name, value));
}

[[nodiscard]] auto parse_bool(std::string value) -> std::optional<bool> {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return std::nullopt;
}

/**
 * @brief Parse the whole string as a number; trailing garbage is an error
 */
template <typename T, typename Parser>
[[nodiscard]] auto parse_number(const std::string& value, Parser parser)
    -> std::optional<T> {
    try {
        std::size_t consumed = 0;
        auto parsed = parser(value, &consumed);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return static_cast<T>(parsed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

[[nodiscard]] auto parse_size(const std::string& value) -> std::optional<std::size_t> {
    if (value.empty() || value.front() == '-') {
        return std::nullopt;
    }
    return parse_number<std::size_t>(value, [](const std::string& s, std::size_t* pos) {
        return std::stoull(s, pos);
    });
}

[[nodiscard]] auto parse_double(const std::string& value) -> std::optional<double> {
    return parse_number<double>(value, [](const std::string& s, std::size_t* pos) {
        return std::stod(s, pos);
    });
}

} // namespace

auto validate(const engine_config& config) -> VoidResult {
    if (!in_unit_range(config.proximity_bonus)) {
        return config_error("proximity_bonus", compat::format("{}", config.proximity_bonus));
    }
    if (!in_unit_range(config.max_proximity_bonus)) {
        return config_error("max_proximity_bonus",
                            compat::format("{}", config.max_proximity_bonus));
    }
    if (!in_unit_range(config.contextual_min_score)) {
        return config_error("contextual_min_score",
                            compat::format("{}", config.contextual_min_score));
    }
    for (const auto& [category, threshold] : config.category_thresholds) {
        if (!in_unit_range(threshold)) {
            return config_error(
                compat::format("category_thresholds[{}]", core::to_string(category)),
                compat::format("{}", threshold));
        }
    }
    if (config.ner_timeout.count() <= 0) {
        return config_error("ner_timeout", compat::format("{}", config.ner_timeout.count()));
    }
    return ok();
}

auto load_engine_config_from_environment(const std::string& prefix)
    -> Result<engine_config> {
    auto get_env = [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    engine_config config;

    auto read_size = [&](const std::string& suffix, std::size_t& target) -> VoidResult {
        if (auto value = get_env(prefix + suffix)) {
            auto parsed = parse_size(*value);
            if (!parsed) {
                return config_error(prefix + suffix, *value);
            }
            target = *parsed;
        }
        return ok();
    };

    auto read_double = [&](const std::string& suffix, double& target) -> VoidResult {
        if (auto value = get_env(prefix + suffix)) {
            auto parsed = parse_double(*value);
            if (!parsed) {
                return config_error(prefix + suffix, *value);
            }
            target = *parsed;
        }
        return ok();
    };

    auto read_bool = [&](const std::string& suffix, bool& target) -> VoidResult {
        if (auto value = get_env(prefix + suffix)) {
            auto parsed = parse_bool(*value);
            if (!parsed) {
                return config_error(prefix + suffix, *value);
            }
            target = *parsed;
        }
        return ok();
    };

    std::size_t timeout_ms = static_cast<std::size_t>(config.ner_timeout.count());
    double min_confidence = -1.0;

    if (auto result = read_size("PROXIMITY_WINDOW", config.proximity_window); result.is_err()) {
        return Result<engine_config>(result.error());
    }
    if (auto result = read_size("KEYWORD_WINDOW", config.keyword_window); result.is_err()) {
        return Result<engine_config>(result.error());
    }
    if (auto result = read_size("NER_TIMEOUT_MS", timeout_ms); result.is_err()) {
        return Result<engine_config>(result.error());
    }
    if (auto result = read_double("PROXIMITY_BONUS", config.proximity_bonus); result.is_err()) {
        return Result<engine_config>(result.error());
    }
    if (auto result = read_double("MAX_PROXIMITY_BONUS", config.max_proximity_bonus); result.is_err()) {
        return Result<engine_config>(result.error());
    }
    if (auto result = read_double("CONTEXTUAL_MIN_SCORE", config.contextual_min_score); result.is_err()) {
        return Result<engine_config>(result.error());
    }
    if (auto result = read_double("MIN_CONFIDENCE", min_confidence); result.is_err()) {
        return Result<engine_config>(result.error());
    }
    if (auto result = read_bool("ENABLE_PROXIMITY", config.enable_proximity); result.is_err()) {
        return Result<engine_config>(result.error());
    }
    if (auto result = read_bool("ENABLE_GRAPH", config.enable_graph); result.is_err()) {
        return Result<engine_config>(result.error());
    }

    config.ner_timeout = std::chrono::milliseconds(timeout_ms);
    if (get_env(prefix + "MIN_CONFIDENCE")) {
        for (auto category : core::all_categories) {
            config.category_thresholds[category] = min_confidence;
        }
    }

    auto valid = validate(config);
    if (valid.is_err()) {
        return Result<engine_config>(valid.error());
    }
    return ok(std::move(config));
}

} // namespace pii::engine
