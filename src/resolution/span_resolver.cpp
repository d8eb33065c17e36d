/**
 * @file span_resolver.cpp
 * @brief Implementation of span_resolver and resolved_span_set
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/resolution/span_resolver.hpp"
#include "pii/compat/format.hpp"

#include <algorithm>

namespace pii::resolution {

// =============================================================================
// resolved_span_set
// =============================================================================

auto resolved_span_set::from_sorted(std::vector<core::span> spans,
                                    std::size_t text_length)
    -> Result<resolved_span_set> {
    for (std::size_t i = 0; i < spans.size(); ++i) {
        const auto& s = spans[i];
        if (s.start >= s.end || s.end > text_length) {
            return pii_error<resolved_span_set>(
                error_codes::internal_inconsistency,
                "Span outside text bounds",
                compat::format("index={} start={} end={} length={}",
                               i, s.start, s.end, text_length));
        }
        if (i > 0 && spans[i - 1].end > s.start) {
            return pii_error<resolved_span_set>(
                error_codes::internal_inconsistency,
                "Spans overlap or are out of order",
                compat::format("index={} previous_end={} start={}",
                               i, spans[i - 1].end, s.start));
        }
    }
    return ok(resolved_span_set(std::move(spans)));
}

// =============================================================================
// span_resolver
// =============================================================================

auto span_resolver::outranks(const core::span& a, const core::span& b) noexcept
    -> bool {
    if (a.confidence != b.confidence) {
        return a.confidence > b.confidence;
    }
    if (a.source != b.source) {
        return a.source < b.source;
    }
    if (a.length() != b.length()) {
        return a.length() > b.length();
    }
    if (a.start != b.start) {
        return a.start < b.start;
    }
    return a.category < b.category;
}

auto span_resolver::resolve(std::vector<core::span> candidates,
                            std::size_t text_length) const
    -> Result<resolved_span_set> {
    for (const auto& candidate : candidates) {
        auto valid = core::validate_span(candidate, text_length);
        if (valid.is_err()) {
            return Result<resolved_span_set>(valid.error());
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(), &span_resolver::outranks);

    std::vector<core::span> accepted;
    accepted.reserve(candidates.size());
    for (auto& candidate : candidates) {
        auto conflict = std::any_of(accepted.begin(), accepted.end(),
                                    [&](const core::span& kept) {
                                        return kept.overlaps(candidate);
                                    });
        if (!conflict) {
            accepted.push_back(std::move(candidate));
        }
    }

    std::sort(accepted.begin(), accepted.end(),
              [](const core::span& a, const core::span& b) {
                  return a.start < b.start;
              });

    return ok(resolved_span_set(std::move(accepted)));
}

} // namespace pii::resolution
