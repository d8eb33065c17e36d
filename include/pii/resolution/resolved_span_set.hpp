/**
 * @file resolved_span_set.hpp
 * @brief Ordered, non-overlapping set of PII spans
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/core/result.hpp"
#include "pii/core/span.hpp"

#include <cstddef>
#include <vector>

namespace pii::resolution {

/**
 * @brief The authoritative span set of one call
 *
 * Spans are sorted by start and pairwise disjoint: for i < j,
 * spans()[i].end <= spans()[j].start. Touching spans are allowed.
 *
 * Instances come from span_resolver::resolve() or from the checked factory
 * from_sorted(), so the invariant holds for every object that exists.
 */
class resolved_span_set {
public:
    /// Empty set
    resolved_span_set() = default;

    /**
     * @brief Build a set from spans that must already satisfy the invariant
     *
     * @param spans Spans sorted by start, non-overlapping, inside the text
     * @param text_length Length of the text the spans refer to
     * @return The set, or internal_inconsistency if the spans violate it
     */
    [[nodiscard]] static auto from_sorted(std::vector<core::span> spans,
                                          std::size_t text_length)
        -> Result<resolved_span_set>;

    [[nodiscard]] auto spans() const noexcept -> const std::vector<core::span>& {
        return spans_;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return spans_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return spans_.empty(); }

    [[nodiscard]] auto operator[](std::size_t index) const -> const core::span& {
        return spans_[index];
    }

    [[nodiscard]] auto begin() const noexcept { return spans_.begin(); }
    [[nodiscard]] auto end() const noexcept { return spans_.end(); }

private:
    friend class span_resolver;

    explicit resolved_span_set(std::vector<core::span> spans)
        : spans_(std::move(spans)) {}

    std::vector<core::span> spans_;
};

} // namespace pii::resolution
