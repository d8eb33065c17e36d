/**
 * @file sanitizer_engine.hpp
 * @brief Facade running the full detection and redaction pipeline
 *
 * This file provides the sanitizer_engine class, the public entry point of the
 * library. One call runs:
 *
 *   pattern detection + entity recognition (on the thread pool, bounded by
 *   ner_timeout) + contextual rules
 *     -> span validation -> proximity annotation -> confidence thresholds
 *     -> span resolution -> entity graph -> duplicate annotation
 *     -> redaction
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/detection/entity_recognizer.hpp"
#include "pii/detection/pattern_detector.hpp"
#include "pii/detection/proximity_analyzer.hpp"
#include "pii/engine/engine_config.hpp"
#include "pii/engine/sanitization_report.hpp"
#include "pii/integration/thread_pool_interface.hpp"
#include "pii/redaction/redactor.hpp"
#include "pii/resolution/deduplicator.hpp"
#include "pii/resolution/entity_graph_builder.hpp"
#include "pii/resolution/span_resolver.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pii::engine {

/**
 * @brief Detects and redacts PII in free text
 *
 * The engine keeps no state between calls; all const member functions may be
 * called concurrently. The entity recognizer and the thread pool are shared
 * collaborators and may be injected, which is how tests replace them.
 *
 * Failure of the entity recognizer (error result, exception or timeout) never
 * fails the call: it is logged, recorded in the report's degraded detector
 * list, and the remaining detectors' results are used.
 *
 * @example
 * @code
 * sanitizer_engine engine;
 * auto result = engine.sanitize("Contact john@example.com",
 *                               redaction::redaction_policy::generic);
 * // result.value() == "Contact [REDACTED_EMAIL]"
 * @endcode
 */
class sanitizer_engine {
public:
    /**
     * @brief Engine with the default configuration and rule based recognizer
     */
    sanitizer_engine();

    /**
     * @throws std::invalid_argument if the configuration fails validate()
     */
    explicit sanitizer_engine(engine_config config);

    /**
     * @param config Engine configuration
     * @param recognizer Entity recognizer; nullptr disables entity recognition
     * @param pool Pool the recognizer runs on; nullptr creates a
     *        thread_pool_adapter
     * @throws std::invalid_argument if the configuration fails validate()
     */
    sanitizer_engine(engine_config config,
                     std::shared_ptr<detection::entity_recognizer> recognizer,
                     std::shared_ptr<integration::thread_pool_interface> pool = nullptr);

    ~sanitizer_engine();

    sanitizer_engine(const sanitizer_engine&) = delete;
    sanitizer_engine& operator=(const sanitizer_engine&) = delete;
    sanitizer_engine(sanitizer_engine&&) = default;
    sanitizer_engine& operator=(sanitizer_engine&&) = default;

    // =========================================================================
    // Operations
    // =========================================================================

    /**
     * @brief Resolved detections, ordered by start
     */
    [[nodiscard]] auto detect(std::string_view text) const
        -> Result<std::vector<pii_detection>>;

    /**
     * @brief Sanitized text under the given policy
     *
     * @return The text; unsupported_policy for a value outside the enum
     */
    [[nodiscard]] auto sanitize(std::string_view text,
                                redaction::redaction_policy policy) const
        -> Result<std::string>;

    /**
     * @brief Sanitized text under a policy given by name
     *
     * @param policy_name "generic", "mask" or "remove" (any case)
     * @return The text; unsupported_policy for any other name
     */
    [[nodiscard]] auto sanitize(std::string_view text,
                                std::string_view policy_name) const
        -> Result<std::string>;

    /**
     * @brief Full sanitization report
     */
    [[nodiscard]] auto report(std::string_view text,
                              redaction::redaction_policy policy) const
        -> Result<sanitization_report>;

    [[nodiscard]] auto report(std::string_view text,
                              std::string_view policy_name) const
        -> Result<sanitization_report>;

    /**
     * @brief Detection counts without redaction
     */
    [[nodiscard]] auto summarize(std::string_view text) const
        -> Result<detection_summary>;

    [[nodiscard]] auto config() const noexcept -> const engine_config& {
        return config_;
    }

private:
    /// Intermediate state of one call
    struct analysis {
        resolution::resolved_span_set spans;
        std::vector<resolution::entity> entities;
        std::vector<std::string> degraded_detectors;
        std::vector<dropped_span> dropped_spans;
    };

    [[nodiscard]] auto analyze(std::string_view text) const -> Result<analysis>;

    /**
     * @brief Validate detector output and refresh matched_text
     *
     * Invalid spans are logged and moved to dropped.
     */
    [[nodiscard]] auto admit(std::vector<core::span> spans,
                             std::string_view text,
                             std::vector<dropped_span>& dropped) const
        -> std::vector<core::span>;

    engine_config config_;
    std::shared_ptr<detection::entity_recognizer> recognizer_;
    std::shared_ptr<integration::thread_pool_interface> pool_;

    detection::pattern_detector pattern_detector_;
    detection::proximity_analyzer proximity_analyzer_;
    resolution::span_resolver resolver_;
    resolution::entity_graph_builder graph_builder_;
    resolution::deduplicator deduplicator_;
    redaction::redactor redactor_;
};

} // namespace pii::engine
