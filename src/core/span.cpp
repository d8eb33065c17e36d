/**
 * @file span.cpp
 * @brief Implementation of span helpers and category parsing
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/core/span.hpp"
#include "pii/compat/format.hpp"

namespace pii::core {

auto category_from_string(std::string_view name) -> std::optional<pii_category> {
    for (auto category : all_categories) {
        if (to_string(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

auto make_span(std::string_view text,
               std::size_t start,
               std::size_t end,
               pii_category category,
               detection_source source,
               double confidence) -> span {
    return {
        .start = start,
        .end = end,
        .category = category,
        .source = source,
        .confidence = confidence,
        .matched_text = std::string(text.substr(start, end - start))
    };
}

auto validate_span(const span& s, std::size_t text_length) -> VoidResult {
    if (s.start >= s.end) {
        return pii_void_error(
            error_codes::invalid_span,
            "Zero-length span",
            compat::format("category={} source={} start={} end={}",
                           to_string(s.category), to_string(s.source),
                           s.start, s.end));
    }
    if (s.end > text_length) {
        return pii_void_error(
            error_codes::invalid_span,
            "Span exceeds text bounds",
            compat::format("category={} source={} end={} length={}",
                           to_string(s.category), to_string(s.source),
                           s.end, text_length));
    }
    if (!(s.confidence >= 0.0 && s.confidence <= 1.0)) {
        return pii_void_error(
            error_codes::invalid_span,
            "Span confidence outside [0, 1]",
            compat::format("category={} source={}",
                           to_string(s.category), to_string(s.source)));
    }
    return ok();
}

} // namespace pii::core
