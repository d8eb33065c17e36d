/**
 * @file deduplicator.cpp
 * @brief Implementation of duplicate annotation
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/resolution/deduplicator.hpp"

#include <map>
#include <string>
#include <utility>

namespace pii::resolution {

auto deduplicator::dedupe(std::vector<entity> entities,
                          const resolved_span_set& spans) const
    -> std::vector<entity> {
    struct owner {
        std::size_t entity_position;
        std::size_t span_index;
    };

    std::map<std::size_t, std::size_t> entity_of_span;
    for (std::size_t e = 0; e < entities.size(); ++e) {
        entities[e].duplicates.clear();
        for (auto index : entities[e].span_indices()) {
            entity_of_span[index] = e;
        }
    }

    // Walk spans in text order so the primary is always the earliest one.
    std::map<std::pair<core::pii_category, std::string>, owner> primaries;
    for (std::size_t index = 0; index < spans.size(); ++index) {
        auto found = entity_of_span.find(index);
        if (found == entity_of_span.end()) {
            continue;
        }

        const auto& s = spans[index];
        auto key = std::make_pair(s.category, s.matched_text);
        auto [primary, inserted] =
            primaries.emplace(std::move(key), owner{found->second, index});
        if (inserted) {
            continue;
        }

        const auto& holder = entities[primary->second.entity_position];
        entities[found->second].duplicates.push_back({
            .span_index = index,
            .primary_index = primary->second.span_index,
            .primary_entity_id = holder.id,
            .cross_entity = primary->second.entity_position != found->second
        });
    }
    return entities;
}

} // namespace pii::resolution
