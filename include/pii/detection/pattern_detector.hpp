/**
 * @file pattern_detector.hpp
 * @brief Deterministic grammar based PII detection
 *
 * This file provides the pattern_detector class which matches fixed-grammar
 * PII types (email, phone, SSN, credit card, IPv4/IPv6) against free text.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/core/span.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace pii::detection {

/**
 * @brief One compiled grammar of the pattern table
 */
struct pattern_grammar {
    /// Category reported for matches
    core::pii_category category{core::pii_category::email};

    /// Short name used in logs ("nanp_phone", "ssn", ...)
    std::string name;

    /// Compiled expression (ECMAScript)
    std::regex expression;

    /// Separator bytes that must not continue the match into more alnum text
    std::string joiners;

    /// Optional semantic check on the matched text
    bool (*validator)(std::string_view){nullptr};
};

/**
 * @brief Matches the fixed grammar table against text
 *
 * The grammar table is compiled once per process on first use and is
 * read-only afterwards, so a pattern_detector may be shared between threads.
 *
 * Every match is anchored: the bytes around it must not be alphanumeric, and
 * a joiner byte (e.g. '-' for phone numbers) next to the match must not lead
 * into another alphanumeric run. Rules report confidence 1.0.
 *
 * @example
 * @code
 * pattern_detector detector;
 * auto spans = detector.detect_patterns("mail john@example.com");
 * // spans[0].category == pii_category::email, spans[0].start == 5
 * @endcode
 */
class pattern_detector {
public:
    /// Confidence assigned to every grammar match
    static constexpr double rule_confidence = 1.0;

    /**
     * @brief Detect all pattern PII in the text
     *
     * For each category, reports every non-overlapping match left-to-right.
     * Matches of different categories may overlap.
     *
     * @param text Text to scan
     * @return Spans ordered by category, then start
     */
    [[nodiscard]] auto detect_patterns(std::string_view text) const
        -> std::vector<core::span>;

    /**
     * @brief Detect matches of a single category
     */
    [[nodiscard]] auto detect_category(std::string_view text,
                                       core::pii_category category) const
        -> std::vector<core::span>;

    /**
     * @brief The compiled grammar table shared by all detectors
     */
    [[nodiscard]] static auto grammars() -> const std::vector<pattern_grammar>&;
};

// =============================================================================
// Validators
// =============================================================================

/**
 * @brief Luhn checksum over the digits of a card number
 *
 * Non-digit characters are ignored. Fewer than 13 digits never pass.
 */
[[nodiscard]] auto passes_luhn(std::string_view number) -> bool;

/**
 * @brief Reject SSNs the issuer never assigns
 *
 * Area 000, 666 and 900-999, group 00 and serial 0000 are invalid.
 */
[[nodiscard]] auto is_plausible_ssn(std::string_view ssn) -> bool;

/**
 * @brief Structural IPv6 check: at most 8 groups of 1-4 hex digits and at
 *        most one "::" compression, with at least two groups present
 */
[[nodiscard]] auto is_valid_ipv6(std::string_view address) -> bool;

/**
 * @brief Phone numbers carry between 10 and 15 digits
 */
[[nodiscard]] auto has_phone_digit_count(std::string_view phone) -> bool;

/**
 * @brief Check the anchoring of text[start, end)
 *
 * @param text Full text
 * @param start Match start
 * @param end Match end
 * @param joiners Separator bytes that may not bridge into alnum text
 * @return true if the match is delimited on both sides
 */
[[nodiscard]] auto is_delimited(std::string_view text,
                                std::size_t start,
                                std::size_t end,
                                std::string_view joiners) -> bool;

} // namespace pii::detection
