/**
 * @file entity_graph_builder.hpp
 * @brief Link resolved spans into entities
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/detection/proximity_analyzer.hpp"
#include "pii/resolution/entity.hpp"
#include "pii/resolution/resolved_span_set.hpp"

#include <string_view>
#include <vector>

namespace pii::resolution {

/**
 * @brief Clusters resolved spans into entities with union-find
 *
 * Two spans are linked when a proximity fact names both of them, or when
 * their categories complement each other (a NAME next to an EMAIL, a
 * CREDIT_CARD next to its CVV) and they share a proximity window. Each
 * connected component becomes one entity.
 */
class entity_graph_builder {
public:
    /**
     * @param proximity_window Window used for complementary categories
     *        (0 = same line)
     * @param enabled When false every span becomes a singleton
     */
    explicit entity_graph_builder(std::size_t proximity_window = 0,
                                  bool enabled = true);

    [[nodiscard]] auto build(const resolved_span_set& spans,
                             const std::vector<detection::proximity_fact>& facts,
                             std::string_view text) const -> std::vector<entity>;

    /**
     * @brief True if spans of these categories describe one subject when
     *        they appear together
     */
    [[nodiscard]] static auto complementary(core::pii_category a,
                                            core::pii_category b) noexcept -> bool;

private:
    std::size_t proximity_window_;
    bool enabled_;
};

} // namespace pii::resolution
