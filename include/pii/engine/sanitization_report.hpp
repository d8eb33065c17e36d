/**
 * @file sanitization_report.hpp
 * @brief Result records of the sanitizer engine
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/core/span.hpp"
#include "pii/redaction/redaction_policy.hpp"
#include "pii/resolution/entity.hpp"
#include "pii/resolution/resolved_span_set.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace pii::engine {

/**
 * @brief One resolved detection as returned by sanitizer_engine::detect()
 */
struct pii_detection {
    core::pii_category category{core::pii_category::email};
    std::string matched_text;
    std::size_t start{0};
    std::size_t end{0};
    double confidence{0.0};
};

/**
 * @brief A detector span rejected before resolution
 *
 * Carries positions only, never the text of the span.
 */
struct dropped_span {
    core::detection_source source{core::detection_source::pattern};
    core::pii_category category{core::pii_category::email};
    std::size_t start{0};
    std::size_t end{0};
    std::string reason;
};

/**
 * @brief Aggregate counts over a resolved span set
 */
struct detection_summary {
    /// Number of resolved spans
    std::size_t total_detections{0};

    /// Resolved spans per category (categories without spans are absent)
    std::map<core::pii_category, std::size_t> category_counts;

    /// Distinct (category, matched text) pairs
    std::size_t unique_pii_count{0};

    /**
     * @brief Category counts keyed by category name, for logging
     */
    [[nodiscard]] auto counts_by_name() const -> std::map<std::string, std::size_t>;
};

/**
 * @brief Summarize a resolved span set
 */
[[nodiscard]] auto summarize(const resolution::resolved_span_set& spans)
    -> detection_summary;

class sanitizer_engine;

/**
 * @brief Everything one sanitization call produced
 *
 * Built by sanitizer_engine::report() and read-only afterwards.
 */
class sanitization_report {
public:
    /// Report of an empty call
    sanitization_report() = default;

    [[nodiscard]] auto original_length() const noexcept -> std::size_t {
        return original_length_;
    }

    /// Resolved spans, ordered by start
    [[nodiscard]] auto spans_found() const noexcept -> const std::vector<core::span>& {
        return spans_found_;
    }

    [[nodiscard]] auto entities_found() const noexcept
        -> const std::vector<resolution::entity>& {
        return entities_found_;
    }

    [[nodiscard]] auto policy() const noexcept -> redaction::redaction_policy {
        return policy_;
    }

    [[nodiscard]] auto output_text() const noexcept -> const std::string& {
        return output_text_;
    }

    [[nodiscard]] auto summary() const noexcept -> const detection_summary& {
        return summary_;
    }

    /// Detectors that failed or timed out during the call
    [[nodiscard]] auto degraded_detectors() const noexcept
        -> const std::vector<std::string>& {
        return degraded_detectors_;
    }

    [[nodiscard]] auto dropped_spans() const noexcept
        -> const std::vector<dropped_span>& {
        return dropped_spans_;
    }

    /**
     * @brief True when every detector answered
     */
    [[nodiscard]] auto is_complete() const noexcept -> bool {
        return degraded_detectors_.empty();
    }

private:
    friend class sanitizer_engine;

    std::size_t original_length_{0};
    std::vector<core::span> spans_found_;
    std::vector<resolution::entity> entities_found_;
    redaction::redaction_policy policy_{redaction::redaction_policy::generic};
    std::string output_text_;
    detection_summary summary_;
    std::vector<std::string> degraded_detectors_;
    std::vector<dropped_span> dropped_spans_;
};

} // namespace pii::engine
