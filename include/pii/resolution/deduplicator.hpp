/**
 * @file deduplicator.hpp
 * @brief Annotation of repeated PII values
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/resolution/entity.hpp"
#include "pii/resolution/resolved_span_set.hpp"

#include <vector>

namespace pii::resolution {

/**
 * @brief Marks spans whose (category, value) already appeared earlier
 *
 * The first occurrence of a value is its primary. Later occurrences get a
 * duplicate_link on their own entity; cross_entity is set when the primary
 * lives in a different entity. Entities are never merged and span indices
 * are left untouched, so redaction of duplicates is unaffected.
 */
class deduplicator {
public:
    [[nodiscard]] auto dedupe(std::vector<entity> entities,
                              const resolved_span_set& spans) const
        -> std::vector<entity>;
};

} // namespace pii::resolution
