/**
 * @file engine_config.hpp
 * @brief Configuration of the sanitizer engine
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/core/result.hpp"
#include "pii/detection/proximity_analyzer.hpp"
#include "pii/redaction/redaction_policy.hpp"

#include <chrono>
#include <map>
#include <string>

namespace pii::engine {

/**
 * @brief Tunables of one sanitizer_engine
 *
 * All fields have working defaults; a default constructed engine_config
 * detects every category and accepts every resolved span.
 */
struct engine_config {
    /// Max bytes between co-located spans; 0 means "same line"
    std::size_t proximity_window{0};

    /// Bytes before a contextual match searched for keywords
    std::size_t keyword_window{50};

    /// Confidence added per co-located span of another category
    double proximity_bonus{0.1};

    /// Cap on the total proximity bonus of one span
    double max_proximity_bonus{0.3};

    /// Minimum keyword score for contextual candidates
    double contextual_min_score{0.5};

    /// Per-category minimum confidence after proximity; absent = 0.0
    std::map<core::pii_category, double> category_thresholds;

    /// Upper bound on waiting for the entity recognizer
    std::chrono::milliseconds ner_timeout{2000};

    /// Contextual rules and proximity bonuses
    bool enable_proximity{true};

    /// Entity clustering; when off every span is its own entity
    bool enable_graph{true};

    /// Redaction replacements per category
    redaction::redaction_template_table templates;

    /**
     * @brief Threshold of a category (0.0 when not configured)
     */
    [[nodiscard]] auto threshold_for(core::pii_category category) const -> double {
        auto it = category_thresholds.find(category);
        return it != category_thresholds.end() ? it->second : 0.0;
    }

    /**
     * @brief Proximity analyzer settings derived from this configuration
     */
    [[nodiscard]] auto proximity() const -> detection::proximity_options {
        return {
            .proximity_window = proximity_window,
            .keyword_window = keyword_window,
            .proximity_bonus = proximity_bonus,
            .max_proximity_bonus = max_proximity_bonus,
            .contextual_min_score = contextual_min_score
        };
    }
};

/**
 * @brief Check ranges of a configuration
 *
 * Confidences, bonuses and thresholds must lie in [0, 1] and the NER timeout
 * must be positive.
 *
 * @return invalid_configuration naming the first offending field
 */
[[nodiscard]] auto validate(const engine_config& config) -> VoidResult;

/**
 * @brief Build a configuration from environment variables
 *
 * Recognized variables (with the default prefix):
 * - PII_PROXIMITY_WINDOW, PII_KEYWORD_WINDOW (bytes)
 * - PII_PROXIMITY_BONUS, PII_MAX_PROXIMITY_BONUS, PII_CONTEXTUAL_MIN_SCORE
 * - PII_MIN_CONFIDENCE (threshold applied to every category)
 * - PII_NER_TIMEOUT_MS
 * - PII_ENABLE_PROXIMITY, PII_ENABLE_GRAPH (true/false/1/0/yes/no/on/off)
 *
 * Unset variables keep their defaults.
 *
 * @param prefix Variable name prefix
 * @return The validated configuration, or invalid_configuration when a value
 *         cannot be parsed or is out of range
 */
[[nodiscard]] auto load_engine_config_from_environment(
    const std::string& prefix = "PII_") -> Result<engine_config>;

} // namespace pii::engine
