/**
 * @file span_resolver.hpp
 * @brief Conflict resolution between overlapping candidate spans
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/resolution/resolved_span_set.hpp"

#include <vector>

namespace pii::resolution {

/**
 * @brief Select one non-overlapping span set from detector candidates
 *
 * Candidates are ranked by
 *   1. confidence (higher first)
 *   2. source (pattern, then ner, then proximity)
 *   3. length (longer first)
 *   4. start (earlier first)
 *   5. category (declaration order)
 * and accepted greedily when they overlap no span already accepted. The
 * ranking is a total order, so equal input always yields equal output.
 */
class span_resolver {
public:
    /**
     * @brief Resolve candidates into a resolved_span_set
     *
     * @param candidates Spans from any detectors, in any order
     * @param text_length Length of the text the spans refer to
     * @return The resolved set, or invalid_span if a candidate is empty or
     *         exceeds the text
     */
    [[nodiscard]] auto resolve(std::vector<core::span> candidates,
                               std::size_t text_length) const
        -> Result<resolved_span_set>;

    /**
     * @brief Ranking used by resolve(); true if a should be considered first
     */
    [[nodiscard]] static auto outranks(const core::span& a,
                                       const core::span& b) noexcept -> bool;
};

} // namespace pii::resolution
