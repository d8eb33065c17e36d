/**
 * @file sanitization_report.cpp
 * @brief Implementation of detection summaries
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/engine/sanitization_report.hpp"

#include <set>
#include <utility>

namespace pii::engine {

auto detection_summary::counts_by_name() const -> std::map<std::string, std::size_t> {
    std::map<std::string, std::size_t> named;
    for (const auto& [category, count] : category_counts) {
        named.emplace(std::string(core::to_string(category)), count);
    }
    return named;
}

auto summarize(const resolution::resolved_span_set& spans) -> detection_summary {
    detection_summary summary;
    summary.total_detections = spans.size();

    std::set<std::pair<core::pii_category, std::string>> unique_values;
    for (const auto& s : spans) {
        ++summary.category_counts[s.category];
        unique_values.emplace(s.category, s.matched_text);
    }
    summary.unique_pii_count = unique_values.size();
    return summary;
}

} // namespace pii::engine
