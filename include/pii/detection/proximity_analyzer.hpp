/**
 * @file proximity_analyzer.hpp
 * @brief Context keyword scoring and co-location analysis
 *
 * The proximity analyzer has two jobs:
 * - detect_contextual(): weak patterns (a bare three digit number, eight to
 *   seventeen digits) that only count as PII when a context keyword such as
 *   "cvv" or "account" precedes them
 * - annotate(): raise the confidence of spans of different categories that
 *   appear close together, and record that adjacency as proximity facts for
 *   the entity graph
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/core/span.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pii::detection {

/**
 * @brief Tuning knobs for proximity analysis
 */
struct proximity_options {
    /// Max bytes between two spans in one window; 0 means "same line"
    std::size_t proximity_window{0};

    /// Bytes before a contextual match searched for keywords
    std::size_t keyword_window{50};

    /// Confidence added per co-located span of another category
    double proximity_bonus{0.1};

    /// Cap on the total bonus a single span can receive
    double max_proximity_bonus{0.3};

    /// Minimum score for a contextual candidate to be emitted
    double contextual_min_score{0.5};
};

/**
 * @brief Keyword-scored weak pattern
 */
struct contextual_rule {
    core::pii_category category{core::pii_category::cvv};
    std::string name;
    std::regex expression;

    /// Score of the bare pattern
    double base_score{0.0};

    /// Lower-case keywords and the score they add
    std::vector<std::pair<std::string, double>> keywords;

    /// Optional semantic check on the matched text
    bool (*validator)(std::string_view){nullptr};
};

/**
 * @brief Two non-overlapping spans of different categories found in one window
 *
 * first starts before second.
 */
struct proximity_fact {
    core::span_key first;
    core::span_key second;

    /// Bytes between the spans (0 when touching)
    std::size_t distance{0};
};

/**
 * @brief Output of proximity_analyzer::annotate()
 */
struct proximity_annotation {
    /// Input spans, in input order, with bonuses applied
    std::vector<core::span> spans;

    /// Each span linked to its nearest co-located span of another category
    /// on either side, ordered by (first, second). Over non-overlapping spans
    /// these links connect exactly the spans the full pairwise relation does.
    std::vector<proximity_fact> facts;
};

/**
 * @brief Check whether two spans share a proximity window
 *
 * With window == 0 the spans must sit on the same line (no '\n' between
 * them). Otherwise the gap between them must be at most window bytes.
 */
[[nodiscard]] auto share_window(const core::span& a,
                                const core::span& b,
                                std::string_view text,
                                std::size_t window) -> bool;

/**
 * @brief share_window() for many spans of one text in O(log n) per query
 *
 * A span starting at or after a.end shares a's window iff it starts no later
 * than forward_limit(a.end). A span ending at or before b.start shares b's
 * window iff it ends no earlier than backward_limit(b.start).
 */
class window_index {
public:
    window_index(std::string_view text, std::size_t window);

    [[nodiscard]] auto forward_limit(std::size_t end) const -> std::size_t;
    [[nodiscard]] auto backward_limit(std::size_t start) const -> std::size_t;
    [[nodiscard]] auto shares(const core::span& a, const core::span& b) const -> bool;

private:
    std::size_t window_;
    std::vector<std::size_t> line_breaks_;
};

class proximity_analyzer {
public:
    explicit proximity_analyzer(proximity_options options = {});

    /**
     * @brief Emit contextual candidates (source PROXIMITY)
     *
     * A candidate needs at least one keyword inside keyword_window bytes
     * before the match and a score of at least contextual_min_score.
     */
    [[nodiscard]] auto detect_contextual(std::string_view text) const
        -> std::vector<core::span>;

    /**
     * @brief Apply proximity bonuses and collect proximity facts
     *
     * Every non-overlapping span of another category in the same window adds
     * proximity_bonus, up to max_proximity_bonus per span. Overlapping spans
     * are competing readings of the same bytes and earn nothing.
     *
     * @param spans Candidate spans from all detectors
     * @param text Text the spans refer to
     */
    [[nodiscard]] auto annotate(std::vector<core::span> spans,
                                std::string_view text) const
        -> proximity_annotation;

    [[nodiscard]] auto options() const noexcept -> const proximity_options& {
        return options_;
    }

    [[nodiscard]] static auto rules() -> const std::vector<contextual_rule>&;

private:
    [[nodiscard]] auto keyword_score(const contextual_rule& rule,
                                     std::string_view text,
                                     std::size_t match_start) const -> double;

    proximity_options options_;
};

} // namespace pii::detection
