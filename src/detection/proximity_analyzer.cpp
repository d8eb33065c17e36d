/**
 * @file proximity_analyzer.cpp
 * @brief Implementation of contextual rules and proximity annotation
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/detection/proximity_analyzer.hpp"
#include "pii/detection/pattern_detector.hpp"
#include "pii/detection/regex_scan.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <map>
#include <numeric>
#include <set>
#include <tuple>

namespace pii::detection {

using core::pii_category;

namespace {

auto build_rule_table() -> std::vector<contextual_rule> {
    std::vector<contextual_rule> table;

    // SSN digits whose separators disagree, or that the strict grammar
    // rejected for position reasons
    table.push_back({
        .category = pii_category::ssn,
        .name = "bare_ssn",
        .expression = std::regex(R"(\b\d{3}[-. ]?\d{2}[-. ]?\d{4}\b)"),
        .base_score = 0.3,
        .keywords = {{"ssn", 0.5}, {"social security", 0.5}, {"social", 0.3},
                     {"tax id", 0.3}},
        .validator = &is_plausible_ssn
    });

    table.push_back({
        .category = pii_category::cvv,
        .name = "cvv",
        .expression = std::regex(R"(\b\d{3,4}\b)"),
        .base_score = 0.1,
        .keywords = {{"cvv", 0.6}, {"cvc", 0.6}, {"security code", 0.5},
                     {"csc", 0.5}},
        .validator = nullptr
    });

    table.push_back({
        .category = pii_category::expiration_date,
        .name = "card_expiration",
        .expression = std::regex(R"(\b(?:0[1-9]|1[0-2])/(?:\d{4}|\d{2})\b)"),
        .base_score = 0.3,
        .keywords = {{"exp", 0.4}, {"valid thru", 0.4}, {"good thru", 0.4}},
        .validator = nullptr
    });

    table.push_back({
        .category = pii_category::phone,
        .name = "local_phone",
        .expression = std::regex(R"(\b\d{3}[-. ]?\d{4}\b)"),
        .base_score = 0.3,
        .keywords = {{"phone", 0.4}, {"cell", 0.4}, {"mobile", 0.4},
                     {"tel", 0.3}, {"call", 0.3}, {"text", 0.2},
                     {"contact", 0.2}},
        .validator = nullptr
    });

    table.push_back({
        .category = pii_category::drivers_license,
        .name = "drivers_license",
        .expression = std::regex(R"(\b[A-Z]{0,2}\d{5,12}\b)"),
        .base_score = 0.2,
        .keywords = {{"driver", 0.5}, {"license", 0.4}, {"licence", 0.4}},
        .validator = nullptr
    });

    table.push_back({
        .category = pii_category::bank_account,
        .name = "bank_account",
        .expression = std::regex(R"(\b\d{8,17}\b)"),
        .base_score = 0.2,
        .keywords = {{"account", 0.4}, {"acct", 0.4}, {"iban", 0.4},
                     {"bank", 0.3}, {"routing", 0.3}},
        .validator = nullptr
    });

    return table;
}

[[nodiscard]] auto to_lower(std::string_view text) -> std::string {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

/// Number of values of a sorted vector in [low, high]
[[nodiscard]] auto in_range(const std::vector<std::size_t>& sorted,
                            std::size_t low,
                            std::size_t high) -> std::size_t {
    if (low > high) {
        return 0;
    }
    return static_cast<std::size_t>(
        std::upper_bound(sorted.begin(), sorted.end(), high) -
        std::lower_bound(sorted.begin(), sorted.end(), low));
}

} // namespace

auto share_window(const core::span& a,
                  const core::span& b,
                  std::string_view text,
                  std::size_t window) -> bool {
    auto gap_start = std::min(a.end, b.end);
    auto gap_end = std::max(a.start, b.start);
    if (gap_end <= gap_start) {
        return true;
    }

    if (window > 0) {
        return gap_end - gap_start <= window;
    }

    gap_end = std::min(gap_end, text.size());
    if (gap_start >= gap_end) {
        return true;
    }
    return text.substr(gap_start, gap_end - gap_start).find('\n') ==
           std::string_view::npos;
}

window_index::window_index(std::string_view text, std::size_t window)
    : window_(window) {
    if (window_ > 0) {
        return;
    }
    for (auto pos = text.find('\n'); pos != std::string_view::npos;
         pos = text.find('\n', pos + 1)) {
        line_breaks_.push_back(pos);
    }
}

auto window_index::forward_limit(std::size_t end) const -> std::size_t {
    constexpr auto unbounded = std::numeric_limits<std::size_t>::max();
    if (window_ > 0) {
        return window_ > unbounded - end ? unbounded : end + window_;
    }
    auto next = std::lower_bound(line_breaks_.begin(), line_breaks_.end(), end);
    return next == line_breaks_.end() ? unbounded : *next;
}

auto window_index::backward_limit(std::size_t start) const -> std::size_t {
    if (window_ > 0) {
        return start > window_ ? start - window_ : 0;
    }
    auto next = std::lower_bound(line_breaks_.begin(), line_breaks_.end(), start);
    return next == line_breaks_.begin() ? 0 : *std::prev(next) + 1;
}

auto window_index::shares(const core::span& a, const core::span& b) const -> bool {
    if (std::max(a.start, b.start) <= std::min(a.end, b.end)) {
        return true;
    }
    const auto& first = a.end <= b.start ? a : b;
    const auto& second = a.end <= b.start ? b : a;
    return second.start <= forward_limit(first.end);
}

proximity_analyzer::proximity_analyzer(proximity_options options)
    : options_(options) {}

auto proximity_analyzer::rules() -> const std::vector<contextual_rule>& {
    static const std::vector<contextual_rule> table = build_rule_table();
    return table;
}

auto proximity_analyzer::keyword_score(const contextual_rule& rule,
                                       std::string_view text,
                                       std::size_t match_start) const -> double {
    auto window_start = match_start > options_.keyword_window
                            ? match_start - options_.keyword_window
                            : 0;
    auto context = to_lower(text.substr(window_start, match_start - window_start));

    double strongest = 0.0;
    for (const auto& [keyword, weight] : rule.keywords) {
        if (context.find(keyword) != std::string::npos) {
            strongest = std::max(strongest, weight);
        }
    }
    return strongest;
}

auto proximity_analyzer::detect_contextual(std::string_view text) const
    -> std::vector<core::span> {
    std::vector<core::span> spans;
    for (const auto& rule : rules()) {
        scan_matches(text, rule.expression,
                     [&](const text_match& match, std::size_t offset) -> std::size_t {
            auto start = offset + static_cast<std::size_t>(match.position(0));
            auto end = start + static_cast<std::size_t>(match.length(0));
            if (end == start || !is_delimited(text, start, end, "-.")) {
                return end;
            }

            auto candidate = text.substr(start, end - start);
            if (rule.validator != nullptr && !rule.validator(candidate)) {
                return end;
            }

            auto keyword = keyword_score(rule, text, start);
            auto score = std::min(rule.base_score + keyword, 1.0);
            if (keyword > 0.0 && score >= options_.contextual_min_score) {
                spans.push_back(core::make_span(text, start, end, rule.category,
                                                core::detection_source::proximity,
                                                score));
            }
            return end;
        });
    }
    return spans;
}

auto proximity_analyzer::annotate(std::vector<core::span> spans,
                                  std::string_view text) const
    -> proximity_annotation {
    proximity_annotation result;
    const window_index windows(text, options_.proximity_window);
    const auto count = spans.size();

    std::vector<std::size_t> by_start(count);
    std::iota(by_start.begin(), by_start.end(), std::size_t{0});
    auto by_end = by_start;
    std::sort(by_start.begin(), by_start.end(), [&](std::size_t a, std::size_t b) {
        return std::tie(spans[a].start, spans[a].end, a) <
               std::tie(spans[b].start, spans[b].end, b);
    });
    std::sort(by_end.begin(), by_end.end(), [&](std::size_t a, std::size_t b) {
        return std::tie(spans[a].end, spans[a].start, a) <
               std::tie(spans[b].end, spans[b].start, b);
    });

    std::vector<std::size_t> starts;
    std::vector<std::size_t> ends;
    std::map<pii_category, std::vector<std::size_t>> category_starts;
    std::map<pii_category, std::vector<std::size_t>> category_ends;
    for (auto index : by_start) {
        starts.push_back(spans[index].start);
        category_starts[spans[index].category].push_back(spans[index].start);
    }
    for (auto index : by_end) {
        ends.push_back(spans[index].end);
        category_ends[spans[index].category].push_back(spans[index].end);
    }

    // Nearest position in each order holding a different category
    constexpr auto none = std::numeric_limits<std::size_t>::max();
    std::vector<std::size_t> next_other(count, none);
    for (std::size_t p = count; p-- > 1;) {
        next_other[p - 1] = spans[by_start[p]].category != spans[by_start[p - 1]].category
                                ? p
                                : next_other[p];
    }
    std::vector<std::size_t> prev_other(count, none);
    for (std::size_t p = 1; p < count; ++p) {
        prev_other[p] = spans[by_end[p - 1]].category != spans[by_end[p]].category
                            ? p - 1
                            : prev_other[p - 1];
    }

    std::set<std::pair<std::size_t, std::size_t>> linked;
    std::vector<double> confidences(count);

    for (std::size_t i = 0; i < count; ++i) {
        const auto& current = spans[i];
        const auto forward = windows.forward_limit(current.end);
        const auto backward = windows.backward_limit(current.start);
        const auto& same_starts = category_starts[current.category];
        const auto& same_ends = category_ends[current.category];

        // Spans wholly after or wholly before this one, inside its window
        auto partners = in_range(starts, current.end, forward) -
                        in_range(same_starts, current.end, forward) +
                        in_range(ends, backward, current.start) -
                        in_range(same_ends, backward, current.start);

        confidences[i] = current.confidence;
        if (partners > 0) {
            auto bonus = std::min(static_cast<double>(partners) * options_.proximity_bonus,
                                  options_.max_proximity_bonus);
            if (bonus > 0.0) {
                confidences[i] = std::min(current.confidence + bonus, 1.0);
            }
        }

        auto after = static_cast<std::size_t>(
            std::lower_bound(starts.begin(), starts.end(), current.end) - starts.begin());
        if (after < count) {
            auto p = spans[by_start[after]].category != current.category ? after
                                                                         : next_other[after];
            if (p != none && starts[p] <= forward) {
                linked.emplace(i, by_start[p]);
            }
        }

        auto before = static_cast<std::size_t>(
            std::upper_bound(ends.begin(), ends.end(), current.start) - ends.begin());
        if (before > 0) {
            auto p = spans[by_end[before - 1]].category != current.category
                         ? before - 1
                         : prev_other[before - 1];
            if (p != none && ends[p] >= backward) {
                linked.emplace(by_end[p], i);
            }
        }
    }

    for (const auto& [first, second] : linked) {
        result.facts.push_back({
            .first = core::span_key::of(spans[first]),
            .second = core::span_key::of(spans[second]),
            .distance = spans[second].start - spans[first].end
        });
    }
    std::sort(result.facts.begin(), result.facts.end(),
              [](const proximity_fact& a, const proximity_fact& b) {
                  return std::tie(a.first, a.second) < std::tie(b.first, b.second);
              });

    for (std::size_t i = 0; i < count; ++i) {
        spans[i].confidence = confidences[i];
    }
    result.spans = std::move(spans);
    return result;
}

} // namespace pii::detection
