/**
 * @file entity_graph_builder.cpp
 * @brief Implementation of entity clustering
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/resolution/entity_graph_builder.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <numeric>
#include <utility>

namespace pii::resolution {

using core::pii_category;

namespace {

/**
 * @brief Disjoint-set forest with path halving and union by index
 */
class union_find {
public:
    explicit union_find(std::size_t size) : parent_(size) {
        std::iota(parent_.begin(), parent_.end(), std::size_t{0});
    }

    auto find(std::size_t node) -> std::size_t {
        while (parent_[node] != node) {
            parent_[node] = parent_[parent_[node]];
            node = parent_[node];
        }
        return node;
    }

    // The smaller index becomes the root so roots are each component's
    // first span.
    void unite(std::size_t a, std::size_t b) {
        auto root_a = find(a);
        auto root_b = find(b);
        if (root_a == root_b) {
            return;
        }
        if (root_b < root_a) {
            std::swap(root_a, root_b);
        }
        parent_[root_b] = root_a;
    }

private:
    std::vector<std::size_t> parent_;
};

[[nodiscard]] auto is_name_companion(pii_category category) noexcept -> bool {
    switch (category) {
        case pii_category::email:
        case pii_category::phone:
        case pii_category::address:
        case pii_category::ssn:
        case pii_category::date:
        case pii_category::credit_card:
        case pii_category::drivers_license:
        case pii_category::bank_account:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] auto is_card_companion(pii_category category) noexcept -> bool {
    return category == pii_category::cvv ||
           category == pii_category::expiration_date;
}

[[nodiscard]] auto is_name(pii_category category) noexcept -> bool {
    return category == pii_category::name;
}

[[nodiscard]] auto is_credit_card(pii_category category) noexcept -> bool {
    return category == pii_category::credit_card;
}

/**
 * @brief Unite each hub with its nearest co-located companion on either side,
 *        and each companion with its nearest co-located hub
 *
 * Resolved spans are sorted and disjoint, so a hub and a companion share a
 * window only if every hub/companion pair lying between them does too; the
 * nearest links therefore connect the same components as all pairs.
 */
void link_nearest(const resolved_span_set& spans,
                  const detection::window_index& windows,
                  bool (*is_hub)(pii_category) noexcept,
                  bool (*is_companion)(pii_category) noexcept,
                  union_find& components) {
    constexpr auto none = std::numeric_limits<std::size_t>::max();
    const auto count = spans.size();

    std::vector<std::size_t> next_hub(count + 1, none);
    std::vector<std::size_t> next_companion(count + 1, none);
    for (std::size_t i = count; i-- > 0;) {
        next_hub[i] = is_hub(spans[i].category) ? i : next_hub[i + 1];
        next_companion[i] = is_companion(spans[i].category) ? i : next_companion[i + 1];
    }

    std::vector<std::size_t> prev_hub(count, none);
    std::vector<std::size_t> prev_companion(count, none);
    for (std::size_t i = 0; i < count; ++i) {
        auto hub_before = i > 0 ? prev_hub[i - 1] : none;
        auto companion_before = i > 0 ? prev_companion[i - 1] : none;
        prev_hub[i] = is_hub(spans[i].category) ? i : hub_before;
        prev_companion[i] = is_companion(spans[i].category) ? i : companion_before;
    }

    for (std::size_t i = 0; i < count; ++i) {
        auto link = [&](std::size_t other) {
            if (other != none && windows.shares(spans[i], spans[other])) {
                components.unite(i, other);
            }
        };
        if (is_hub(spans[i].category)) {
            link(next_companion[i + 1]);
            link(i > 0 ? prev_companion[i - 1] : none);
        } else if (is_companion(spans[i].category)) {
            link(next_hub[i + 1]);
            link(i > 0 ? prev_hub[i - 1] : none);
        }
    }
}

} // namespace

entity_graph_builder::entity_graph_builder(std::size_t proximity_window, bool enabled)
    : proximity_window_(proximity_window), enabled_(enabled) {}

auto entity_graph_builder::complementary(pii_category a, pii_category b) noexcept
    -> bool {
    if (a == pii_category::name) {
        return is_name_companion(b);
    }
    if (b == pii_category::name) {
        return is_name_companion(a);
    }
    if (a == pii_category::credit_card) {
        return is_card_companion(b);
    }
    if (b == pii_category::credit_card) {
        return is_card_companion(a);
    }
    return false;
}

auto entity_graph_builder::build(const resolved_span_set& spans,
                                 const std::vector<detection::proximity_fact>& facts,
                                 std::string_view text) const
    -> std::vector<entity> {
    const auto count = spans.size();
    union_find components(count);

    if (enabled_) {
        std::map<core::span_key, std::size_t> index_of;
        for (std::size_t i = 0; i < count; ++i) {
            index_of.emplace(core::span_key::of(spans[i]), i);
        }

        // Facts may name candidates the resolver discarded; those are skipped.
        for (const auto& fact : facts) {
            auto first = index_of.find(fact.first);
            auto second = index_of.find(fact.second);
            if (first != index_of.end() && second != index_of.end()) {
                components.unite(first->second, second->second);
            }
        }

        const detection::window_index windows(text, proximity_window_);
        link_nearest(spans, windows, &is_name, &is_name_companion, components);
        link_nearest(spans, windows, &is_credit_card, &is_card_companion, components);
    }

    // Roots are the smallest index of each component, and spans are sorted
    // by start, so visiting roots in index order yields entities ordered by
    // their first span.
    std::map<std::size_t, std::vector<std::size_t>> members;
    for (std::size_t i = 0; i < count; ++i) {
        members[components.find(i)].push_back(i);
    }

    std::vector<entity> entities;
    entities.reserve(members.size());
    std::uint32_t next_id = 1;
    for (auto& [root, indices] : members) {
        entity e;
        e.id = next_id++;
        for (auto index : indices) {
            e.categories_present.insert(spans[index].category);
        }
        if (indices.size() == 1) {
            e.shape = singleton_entity{indices.front()};
        } else {
            e.shape = cluster_entity{std::move(indices)};
        }
        entities.push_back(std::move(e));
    }
    return entities;
}

} // namespace pii::resolution
