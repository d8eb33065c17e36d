/**
 * @file entity_graph_test.cpp
 * @brief Unit tests for entity clustering and duplicate annotation
 *
 * @copyright Copyright (c) 2025
 */

#include <catch2/catch_test_macros.hpp>

#include "pii/resolution/deduplicator.hpp"
#include "pii/resolution/entity_graph_builder.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

using namespace pii::core;
using namespace pii::resolution;

namespace {

auto resolved(std::string_view text, std::vector<span> spans) -> resolved_span_set {
    for (auto& s : spans) {
        s.matched_text = std::string(text.substr(s.start, s.end - s.start));
    }
    auto result = resolved_span_set::from_sorted(std::move(spans), text.size());
    REQUIRE(result.is_ok());
    return result.value();
}

auto at(std::size_t start, std::size_t end, pii_category category) -> span {
    return span{.start = start, .end = end, .category = category,
                .source = detection_source::pattern, .confidence = 1.0};
}

/// Entity id of every span, from the builder
auto entity_of(const std::vector<entity>& entities, std::size_t count)
    -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> ids(count, 0);
    for (const auto& e : entities) {
        for (auto index : e.span_indices()) {
            ids[index] = e.id;
        }
    }
    return ids;
}

/// Component root of every span, uniting all complementary co-located pairs
auto pairwise_components(const resolved_span_set& spans, std::string_view text,
                         std::size_t window) -> std::vector<std::size_t> {
    std::vector<std::size_t> parent(spans.size());
    std::iota(parent.begin(), parent.end(), std::size_t{0});
    auto root = [&](std::size_t node) {
        while (parent[node] != node) {
            node = parent[node];
        }
        return node;
    };
    for (std::size_t i = 0; i < spans.size(); ++i) {
        for (std::size_t j = i + 1; j < spans.size(); ++j) {
            if (entity_graph_builder::complementary(spans[i].category, spans[j].category) &&
                pii::detection::share_window(spans[i], spans[j], text, window)) {
                auto a = root(i);
                auto b = root(j);
                parent[std::max(a, b)] = std::min(a, b);
            }
        }
    }
    std::vector<std::size_t> roots;
    for (std::size_t i = 0; i < spans.size(); ++i) {
        roots.push_back(root(i));
    }
    return roots;
}

} // namespace

TEST_CASE("Complementary categories", "[resolution][graph]") {
    CHECK(entity_graph_builder::complementary(pii_category::name, pii_category::email));
    CHECK(entity_graph_builder::complementary(pii_category::phone, pii_category::name));
    CHECK(entity_graph_builder::complementary(pii_category::credit_card, pii_category::cvv));
    CHECK(entity_graph_builder::complementary(pii_category::expiration_date,
                                              pii_category::credit_card));
    CHECK_FALSE(entity_graph_builder::complementary(pii_category::email,
                                                    pii_category::phone));
    CHECK_FALSE(entity_graph_builder::complementary(pii_category::name,
                                                    pii_category::name));
    CHECK_FALSE(entity_graph_builder::complementary(pii_category::name,
                                                    pii_category::cvv));
}

TEST_CASE("Graph: complementary spans on one line form a cluster", "[resolution][graph]") {
    std::string text = "Jane Roe jane@example.com";
    auto spans = resolved(text, {at(0, 8, pii_category::name),
                                 at(9, 25, pii_category::email)});

    entity_graph_builder builder;
    auto entities = builder.build(spans, {}, text);

    REQUIRE(entities.size() == 1);
    CHECK(entities[0].id == 1);
    CHECK(entities[0].is_cluster());
    CHECK(entities[0].span_indices() == std::vector<std::size_t>{0, 1});
    CHECK(entities[0].categories_present.count(pii_category::name) == 1);
    CHECK(entities[0].categories_present.count(pii_category::email) == 1);
}

TEST_CASE("Graph: unrelated spans stay singletons", "[resolution][graph]") {
    std::string text = "a@b.com 555-123-4567";
    auto spans = resolved(text, {at(0, 7, pii_category::email),
                                 at(8, 20, pii_category::phone)});

    entity_graph_builder builder;
    auto entities = builder.build(spans, {}, text);

    REQUIRE(entities.size() == 2);
    CHECK(entities[0].id == 1);
    CHECK(entities[1].id == 2);
    CHECK_FALSE(entities[0].is_cluster());
    CHECK(entities[1].span_indices() == std::vector<std::size_t>{1});
}

TEST_CASE("Graph: proximity facts link spans", "[resolution][graph]") {
    std::string text = "a@b.com 555-123-4567";
    auto spans = resolved(text, {at(0, 7, pii_category::email),
                                 at(8, 20, pii_category::phone)});

    std::vector<pii::detection::proximity_fact> facts{
        {.first = span_key::of(spans[0]), .second = span_key::of(spans[1]),
         .distance = 1}};

    entity_graph_builder builder;
    auto entities = builder.build(spans, facts, text);
    REQUIRE(entities.size() == 1);
    CHECK(entities[0].is_cluster());
}

TEST_CASE("Graph: facts about discarded spans are ignored", "[resolution][graph]") {
    std::string text = "a@b.com 555-123-4567";
    auto spans = resolved(text, {at(0, 7, pii_category::email),
                                 at(8, 20, pii_category::phone)});

    std::vector<pii::detection::proximity_fact> facts{
        {.first = span_key{.start = 0, .end = 3, .category = pii_category::name},
         .second = span_key::of(spans[1]), .distance = 5}};

    entity_graph_builder builder;
    CHECK(builder.build(spans, facts, text).size() == 2);
}

TEST_CASE("Graph: line breaks separate entities", "[resolution][graph]") {
    std::string text = "Jane Roe\njane@example.com";
    auto spans = resolved(text, {at(0, 8, pii_category::name),
                                 at(9, 25, pii_category::email)});

    SECTION("Default same-line window") {
        entity_graph_builder builder;
        CHECK(builder.build(spans, {}, text).size() == 2);
    }

    SECTION("Byte window spans the line break") {
        entity_graph_builder builder(10);
        CHECK(builder.build(spans, {}, text).size() == 1);
    }
}

TEST_CASE("Graph: disabled builder yields singletons", "[resolution][graph]") {
    std::string text = "Jane Roe jane@example.com";
    auto spans = resolved(text, {at(0, 8, pii_category::name),
                                 at(9, 25, pii_category::email)});

    entity_graph_builder builder(0, false);
    auto entities = builder.build(spans, {}, text);
    REQUIRE(entities.size() == 2);
    CHECK_FALSE(entities[0].is_cluster());
    CHECK_FALSE(entities[1].is_cluster());
}

TEST_CASE("Graph: every span belongs to exactly one entity", "[resolution][graph]") {
    std::string text = "Jane Roe jane@x.io\n4111 1111 1111 1111 cvv 123\nplain";
    auto spans = resolved(text, {at(0, 8, pii_category::name),
                                 at(9, 18, pii_category::email),
                                 at(19, 38, pii_category::credit_card),
                                 at(43, 46, pii_category::cvv)});

    entity_graph_builder builder;
    auto entities = builder.build(spans, {}, text);

    std::vector<int> seen(spans.size(), 0);
    for (const auto& e : entities) {
        for (auto index : e.span_indices()) {
            ++seen[index];
        }
    }
    CHECK(seen == std::vector<int>{1, 1, 1, 1});
    CHECK(entities.size() == 2);
}

TEST_CASE("Deduplicator: repeated values", "[resolution][dedupe]") {
    SECTION("Within one entity") {
        std::string text = "Jane Roe a@b.com a@b.com";
        auto spans = resolved(text, {at(0, 8, pii_category::name),
                                     at(9, 16, pii_category::email),
                                     at(17, 24, pii_category::email)});

        entity_graph_builder builder;
        deduplicator dedupe;
        auto entities = dedupe.dedupe(builder.build(spans, {}, text), spans);

        REQUIRE(entities.size() == 1);
        REQUIRE(entities[0].duplicates.size() == 1);
        const auto& link = entities[0].duplicates[0];
        CHECK(link.span_index == 2);
        CHECK(link.primary_index == 1);
        CHECK(link.primary_entity_id == 1);
        CHECK_FALSE(link.cross_entity);
    }

    SECTION("Across entities") {
        std::string text = "a@b.com\na@b.com";
        auto spans = resolved(text, {at(0, 7, pii_category::email),
                                     at(8, 15, pii_category::email)});

        entity_graph_builder builder;
        deduplicator dedupe;
        auto entities = dedupe.dedupe(builder.build(spans, {}, text), spans);

        REQUIRE(entities.size() == 2);
        CHECK(entities[0].duplicates.empty());
        REQUIRE(entities[1].duplicates.size() == 1);
        CHECK(entities[1].duplicates[0].primary_entity_id == 1);
        CHECK(entities[1].duplicates[0].cross_entity);
    }

    SECTION("Same text in another category is not a duplicate") {
        std::string text = "12345678 12345678";
        auto spans = resolved(text, {at(0, 8, pii_category::bank_account),
                                     at(9, 17, pii_category::drivers_license)});

        entity_graph_builder builder;
        deduplicator dedupe;
        auto entities = dedupe.dedupe(builder.build(spans, {}, text), spans);
        for (const auto& e : entities) {
            CHECK(e.duplicates.empty());
        }
    }
}

TEST_CASE("Graph: neighbour links cluster like every pair", "[resolution][graph]") {
    const std::vector<pii_category> cycle{
        pii_category::email, pii_category::name, pii_category::cvv,
        pii_category::phone, pii_category::credit_card, pii_category::date,
        pii_category::expiration_date, pii_category::ip_address};

    std::string text;
    std::vector<span> layout;
    for (std::size_t i = 0; i < 300; ++i) {
        text += std::string((i * 7) % 11 + 1, i % 37 == 0 ? '\n' : ' ');
        layout.push_back(at(text.size(), text.size() + 3, cycle[(i * 5) % cycle.size()]));
        text += "xxx";
    }
    auto spans = resolved(text, layout);

    for (std::size_t window : {0, 4, 9, 20}) {
        entity_graph_builder builder(window);
        auto ids = entity_of(builder.build(spans, {}, text), spans.size());
        auto roots = pairwise_components(spans, text, window);

        bool same_partition = true;
        for (std::size_t i = 0; i < spans.size() && same_partition; ++i) {
            for (std::size_t j = i + 1; j < spans.size(); ++j) {
                if ((ids[i] == ids[j]) != (roots[i] == roots[j])) {
                    same_partition = false;
                    break;
                }
            }
        }
        CHECK(same_partition);
    }
}

TEST_CASE("Graph: a long line of alternating spans", "[resolution][graph][long]") {
    std::string text;
    std::vector<span> layout;
    for (std::size_t i = 0; i < 50000; ++i) {
        layout.push_back(at(text.size(), text.size() + 1,
                            i % 2 == 0 ? pii_category::name : pii_category::email));
        text += "x ";
    }
    auto spans = resolved(text, layout);

    SECTION("Same line") {
        entity_graph_builder builder;
        auto entities = builder.build(spans, {}, text);
        REQUIRE(entities.size() == 1);
        CHECK(entities[0].span_indices().size() == 50000);
    }

    SECTION("Byte window chains neighbours") {
        entity_graph_builder builder(1);
        CHECK(builder.build(spans, {}, text).size() == 1);
    }
}
