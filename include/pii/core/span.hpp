/**
 * @file span.hpp
 * @brief Detected PII span and helpers
 *
 * A span is a half-open byte range [start, end) into the original text,
 * tagged with its category and provenance.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/core/pii_category.hpp"
#include "pii/core/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <tuple>

namespace pii::core {

/**
 * @brief A candidate or resolved PII region of the input text
 */
struct span {
    /// First byte of the region
    std::size_t start{0};

    /// One past the last byte of the region
    std::size_t end{0};

    /// Kind of PII
    pii_category category{pii_category::email};

    /// Which detector produced the span
    detection_source source{detection_source::pattern};

    /// Detector confidence in [0, 1]
    double confidence{1.0};

    /// Copy of text[start, end)
    std::string matched_text;

    [[nodiscard]] auto length() const noexcept -> std::size_t {
        return end > start ? end - start : 0;
    }

    [[nodiscard]] auto overlaps(const span& other) const noexcept -> bool {
        return start < other.end && other.start < end;
    }

    [[nodiscard]] auto operator==(const span& other) const noexcept -> bool {
        return start == other.start && end == other.end &&
               category == other.category && source == other.source &&
               confidence == other.confidence &&
               matched_text == other.matched_text;
    }
};

/**
 * @brief Identity of a span that survives confidence changes and resolution
 */
struct span_key {
    std::size_t start{0};
    std::size_t end{0};
    pii_category category{pii_category::email};

    [[nodiscard]] static auto of(const span& s) noexcept -> span_key {
        return {s.start, s.end, s.category};
    }

    [[nodiscard]] auto operator<(const span_key& other) const noexcept -> bool {
        return std::tie(start, end, category) <
               std::tie(other.start, other.end, other.category);
    }

    [[nodiscard]] auto operator==(const span_key& other) const noexcept -> bool {
        return start == other.start && end == other.end &&
               category == other.category;
    }
};

/**
 * @brief Build a span over text[start, end)
 *
 * The caller guarantees start < end <= text.size().
 */
[[nodiscard]] auto make_span(std::string_view text,
                             std::size_t start,
                             std::size_t end,
                             pii_category category,
                             detection_source source,
                             double confidence) -> span;

/**
 * @brief Check that a span is non-empty, lies inside the text and carries
 *        a confidence in [0, 1]
 *
 * @param s The span to check
 * @param text_length Length of the text the span refers to
 * @return Empty result on success, invalid_span error otherwise
 */
[[nodiscard]] auto validate_span(const span& s, std::size_t text_length)
    -> VoidResult;

} // namespace pii::core
