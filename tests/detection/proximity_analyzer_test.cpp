/**
 * @file proximity_analyzer_test.cpp
 * @brief Unit tests for contextual detection and proximity bonuses
 *
 * @copyright Copyright (c) 2025
 */

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "pii/detection/proximity_analyzer.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

using namespace pii::core;
using namespace pii::detection;
using Catch::Approx;

namespace {

auto find_category(const std::vector<span>& spans, pii_category category)
    -> const span* {
    auto it = std::find_if(spans.begin(), spans.end(),
                           [&](const span& s) { return s.category == category; });
    return it == spans.end() ? nullptr : &*it;
}

auto pattern_span(std::string_view text, std::size_t start, std::size_t end,
                  pii_category category, double confidence = 0.5) -> span {
    return make_span(text, start, end, category, detection_source::pattern,
                     confidence);
}

} // namespace

TEST_CASE("Contextual detection needs a keyword", "[detection][proximity]") {
    proximity_analyzer analyzer;

    SECTION("CVV after keyword") {
        auto spans = analyzer.detect_contextual("cvv 123");
        const auto* cvv = find_category(spans, pii_category::cvv);
        REQUIRE(cvv != nullptr);
        CHECK(cvv->start == 4);
        CHECK(cvv->end == 7);
        CHECK(cvv->source == detection_source::proximity);
        CHECK(cvv->confidence == Approx(0.7));
    }

    SECTION("Three digits without context") {
        CHECK(analyzer.detect_contextual("room 123").empty());
    }

    SECTION("Keyword match is case-insensitive") {
        auto spans = analyzer.detect_contextual("CVV: 4321");
        CHECK(find_category(spans, pii_category::cvv) != nullptr);
    }

    SECTION("Keyword must precede the match") {
        CHECK(find_category(analyzer.detect_contextual("123 is the cvv"),
                            pii_category::cvv) == nullptr);
    }
}

TEST_CASE("Contextual detection categories", "[detection][proximity]") {
    proximity_analyzer analyzer;

    SECTION("Card expiration") {
        auto spans = analyzer.detect_contextual("Card exp 09/27");
        const auto* exp = find_category(spans, pii_category::expiration_date);
        REQUIRE(exp != nullptr);
        CHECK(exp->start == 9);
        CHECK(exp->end == 14);
    }

    SECTION("Bank account") {
        auto spans = analyzer.detect_contextual("account number 12345678");
        const auto* account = find_category(spans, pii_category::bank_account);
        REQUIRE(account != nullptr);
        CHECK(account->matched_text == "12345678");
        CHECK(account->confidence == Approx(0.6));
    }

    SECTION("Driver's license") {
        auto spans = analyzer.detect_contextual("driver license D1234567");
        const auto* license = find_category(spans, pii_category::drivers_license);
        REQUIRE(license != nullptr);
        CHECK(license->matched_text == "D1234567");
    }

    SECTION("Local phone") {
        auto spans = analyzer.detect_contextual("phone 555-0199");
        const auto* phone = find_category(spans, pii_category::phone);
        REQUIRE(phone != nullptr);
        CHECK(phone->matched_text == "555-0199");
    }
}

TEST_CASE("Contextual minimum score", "[detection][proximity]") {
    proximity_options options;
    options.contextual_min_score = 0.9;
    proximity_analyzer strict(options);

    CHECK(find_category(strict.detect_contextual("cvv 123"), pii_category::cvv) ==
          nullptr);
}

TEST_CASE("Keyword window bounds the search", "[detection][proximity]") {
    proximity_options options;
    options.keyword_window = 5;
    proximity_analyzer analyzer(options);

    CHECK(find_category(
              analyzer.detect_contextual("cvv and a long gap before 123"),
              pii_category::cvv) == nullptr);
}

TEST_CASE("share_window", "[detection][proximity]") {
    std::string text = "a@b.co 555\nnext";
    span left{.start = 0, .end = 6};
    span same_line{.start = 7, .end = 10};
    span next_line{.start = 11, .end = 15};

    SECTION("Same line with window 0") {
        CHECK(share_window(left, same_line, text, 0));
        CHECK_FALSE(share_window(left, next_line, text, 0));
    }

    SECTION("Byte window") {
        CHECK(share_window(left, next_line, text, 5));
        CHECK_FALSE(share_window(left, next_line, text, 4));
    }

    SECTION("Overlapping spans always share") {
        span inner{.start = 2, .end = 4};
        CHECK(share_window(left, inner, text, 1));
    }
}

TEST_CASE("Proximity annotation", "[detection][proximity]") {
    std::string text = "john@example.com 555-123-4567";

    SECTION("Bonus for co-located categories") {
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(
            {pattern_span(text, 0, 16, pii_category::email),
             pattern_span(text, 17, 29, pii_category::phone)},
            text);

        REQUIRE(result.spans.size() == 2);
        CHECK(result.spans[0].confidence == Approx(0.6));
        CHECK(result.spans[1].confidence == Approx(0.6));

        REQUIRE(result.facts.size() == 1);
        CHECK(result.facts[0].first.start == 0);
        CHECK(result.facts[0].second.start == 17);
        CHECK(result.facts[0].distance == 1);
    }

    SECTION("Same category earns nothing") {
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(
            {pattern_span(text, 0, 16, pii_category::email),
             pattern_span(text, 17, 29, pii_category::email)},
            text);
        CHECK(result.facts.empty());
        CHECK(result.spans[0].confidence == Approx(0.5));
    }

    SECTION("Bonus is capped per span") {
        std::string dense = "a b c d e";
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(
            {pattern_span(dense, 0, 1, pii_category::name),
             pattern_span(dense, 2, 3, pii_category::email),
             pattern_span(dense, 4, 5, pii_category::phone),
             pattern_span(dense, 6, 7, pii_category::ssn),
             pattern_span(dense, 8, 9, pii_category::address)},
            dense);

        // Only neighbours are linked; every pair still counts for the bonus
        REQUIRE(result.facts.size() == 4);
        for (std::size_t i = 0; i < 4; ++i) {
            CHECK(result.facts[i].first.start == 2 * i);
            CHECK(result.facts[i].second.start == 2 * i + 2);
            CHECK(result.facts[i].distance == 1);
        }
        CHECK(result.spans[0].confidence == Approx(0.8));
        CHECK(result.spans[2].confidence == Approx(0.8));
    }

    SECTION("Overlapping readings earn nothing") {
        std::string card = "12/25/2024";
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(
            {pattern_span(card, 0, 10, pii_category::date),
             pattern_span(card, 0, 5, pii_category::expiration_date)},
            card);
        CHECK(result.facts.empty());
        CHECK(result.spans[0].confidence == Approx(0.5));
        CHECK(result.spans[1].confidence == Approx(0.5));
    }

    SECTION("Touching spans are neighbours") {
        std::string joined = "john@example.com555-123-4567";
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(
            {pattern_span(joined, 0, 16, pii_category::email),
             pattern_span(joined, 16, 28, pii_category::phone)},
            joined);
        REQUIRE(result.facts.size() == 1);
        CHECK(result.facts[0].distance == 0);
        CHECK(result.spans[0].confidence == Approx(0.6));
    }

    SECTION("Nearest partner skips the same category") {
        std::string row = "a b c d";
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(
            {pattern_span(row, 0, 1, pii_category::email),
             pattern_span(row, 2, 3, pii_category::email),
             pattern_span(row, 4, 5, pii_category::email),
             pattern_span(row, 6, 7, pii_category::phone)},
            row);

        REQUIRE(result.facts.size() == 3);
        CHECK(result.facts[0].first.start == 0);
        CHECK(result.facts[0].second.start == 6);
        CHECK(result.facts[2].first.start == 4);
        CHECK(result.facts[2].distance == 1);
        CHECK(result.spans[0].confidence == Approx(0.6));
        CHECK(result.spans[3].confidence == Approx(0.8));
    }

    SECTION("Confidence never exceeds 1") {
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(
            {pattern_span(text, 0, 16, pii_category::email, 1.0),
             pattern_span(text, 17, 29, pii_category::phone, 0.95)},
            text);
        CHECK(result.spans[0].confidence == Approx(1.0));
        CHECK(result.spans[1].confidence == Approx(1.0));
    }

    SECTION("Spans on different lines do not interact") {
        std::string lines = "john@example.com\n555-123-4567";
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(
            {pattern_span(lines, 0, 16, pii_category::email),
             pattern_span(lines, 17, 29, pii_category::phone)},
            lines);
        CHECK(result.facts.empty());
    }

    SECTION("Input order does not matter") {
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(
            {pattern_span(text, 17, 29, pii_category::phone),
             pattern_span(text, 0, 16, pii_category::email)},
            text);
        REQUIRE(result.facts.size() == 1);
        CHECK(result.facts[0].first.start == 0);
        CHECK(result.spans[0].start == 17);
        CHECK(result.spans[0].confidence == Approx(0.6));
    }
}

TEST_CASE("Proximity annotation of many spans", "[detection][proximity][long]") {
    constexpr std::size_t count = 20000;
    std::string line;
    std::vector<span> spans;
    for (std::size_t i = 0; i < count; ++i) {
        spans.push_back({.start = line.size(), .end = line.size() + 1,
                         .category = i % 2 == 0 ? pii_category::email
                                                : pii_category::phone,
                         .source = detection_source::pattern,
                         .confidence = 0.5});
        line += "x ";
    }

    SECTION("One line") {
        proximity_analyzer analyzer;
        auto result = analyzer.annotate(spans, line);

        CHECK(result.facts.size() == count - 1);
        CHECK(std::all_of(result.spans.begin(), result.spans.end(),
                          [](const span& s) { return s.confidence == Approx(0.8); }));
    }

    SECTION("Byte window") {
        proximity_options options;
        options.proximity_window = 2;
        proximity_analyzer analyzer(options);
        auto result = analyzer.annotate(spans, line);

        // Each span reaches only its immediate neighbours
        CHECK(result.facts.size() == count - 1);
        CHECK(result.spans.front().confidence == Approx(0.6));
        CHECK(result.spans[count / 2].confidence == Approx(0.7));
    }
}

TEST_CASE("window_index", "[detection][proximity]") {
    std::string text = "a@b.co 555\nnext\nlast";
    span left{.start = 0, .end = 6};
    span same_line{.start = 7, .end = 10};
    span next_line{.start = 11, .end = 15};

    SECTION("Line limits with window 0") {
        window_index windows(text, 0);
        CHECK(windows.forward_limit(6) == 10);
        CHECK(windows.backward_limit(11) == 11);
        CHECK(windows.backward_limit(7) == 0);
        CHECK(windows.backward_limit(17) == 16);
        CHECK(windows.forward_limit(17) == std::numeric_limits<std::size_t>::max());
        CHECK(windows.shares(left, same_line));
        CHECK_FALSE(windows.shares(left, next_line));
        CHECK_FALSE(windows.shares(next_line, left));
    }

    SECTION("Agrees with share_window") {
        for (std::size_t window : {0, 1, 4, 5}) {
            window_index windows(text, window);
            CHECK(windows.shares(left, next_line) ==
                  share_window(left, next_line, text, window));
            CHECK(windows.shares(same_line, next_line) ==
                  share_window(same_line, next_line, text, window));
        }
    }
}
