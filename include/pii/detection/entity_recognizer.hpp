/**
 * @file entity_recognizer.hpp
 * @brief Abstract interface for named-entity recognition
 *
 * The sanitizer engine consumes entity recognition through this interface so
 * that a rule based recognizer, a model backed one, or a test double can be
 * plugged in without touching the pipeline.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/core/result.hpp"
#include "pii/core/span.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pii::detection {

/**
 * @brief Source of NAME, ADDRESS, DATE and ORGANIZATION spans
 *
 * Implementations report spans with source detection_source::ner and
 * confidences in [0, 1]. A recognizer that cannot answer returns an error
 * result (or throws); the engine treats both the same way and continues
 * without entity spans.
 *
 * Thread Safety: detect_entities() may be invoked from a worker thread while
 * other calls are in flight, so implementations must not mutate shared state.
 */
class entity_recognizer {
public:
    virtual ~entity_recognizer() = default;

    /**
     * @brief Detect named entities in the text
     *
     * @param text Text to scan
     * @return Detected spans, or detector_unavailable on failure
     */
    [[nodiscard]] virtual auto detect_entities(std::string_view text) const
        -> Result<std::vector<core::span>> = 0;

    /**
     * @brief Name used in logs and in the report's degraded detector list
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

protected:
    entity_recognizer() = default;
    entity_recognizer(const entity_recognizer&) = default;
    entity_recognizer& operator=(const entity_recognizer&) = default;
};

} // namespace pii::detection
