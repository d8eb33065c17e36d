/**
 * @file entity.hpp
 * @brief Entities grouping resolved spans that describe one subject
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/core/pii_category.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <variant>
#include <vector>

namespace pii::resolution {

/**
 * @brief Entity made of one span
 */
struct singleton_entity {
    /// Index into the resolved span set
    std::size_t span_index{0};
};

/**
 * @brief Entity made of two or more linked spans
 */
struct cluster_entity {
    /// Indices into the resolved span set, ascending
    std::vector<std::size_t> span_indices;
};

using entity_shape = std::variant<singleton_entity, cluster_entity>;

/**
 * @brief Annotation left by the deduplicator on a repeated value
 */
struct duplicate_link {
    /// The repeated span
    std::size_t span_index{0};

    /// First span carrying the same category and value
    std::size_t primary_index{0};

    /// Entity owning the primary span
    std::uint32_t primary_entity_id{0};

    /// True when the primary belongs to another entity
    bool cross_entity{false};
};

/**
 * @brief A real-world subject inferred from co-located spans
 */
struct entity {
    /// 1-based, assigned in order of the entity's first span
    std::uint32_t id{0};

    entity_shape shape;

    std::set<core::pii_category> categories_present;

    /// Filled by the deduplicator
    std::vector<duplicate_link> duplicates;

    /**
     * @brief Span indices of the entity, ascending
     */
    [[nodiscard]] auto span_indices() const -> std::vector<std::size_t> {
        if (const auto* single = std::get_if<singleton_entity>(&shape)) {
            return {single->span_index};
        }
        return std::get<cluster_entity>(shape).span_indices;
    }

    [[nodiscard]] auto is_cluster() const noexcept -> bool {
        return std::holds_alternative<cluster_entity>(shape);
    }
};

} // namespace pii::resolution
