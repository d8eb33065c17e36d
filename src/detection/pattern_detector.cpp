/**
 * @file pattern_detector.cpp
 * @brief Implementation of the grammar table and pattern scanning
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/detection/pattern_detector.hpp"
#include "pii/detection/regex_scan.hpp"

#include <algorithm>
#include <cctype>

namespace pii::detection {

using core::pii_category;

namespace {

[[nodiscard]] auto is_alnum(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto digits_of(std::string_view text) -> std::string {
    std::string digits;
    digits.reserve(text.size());
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            digits.push_back(c);
        }
    }
    return digits;
}

[[nodiscard]] auto is_card_number(std::string_view number) -> bool {
    auto digits = digits_of(number);
    return (digits.size() == 15 || digits.size() == 16) && passes_luhn(digits);
}

[[nodiscard]] auto build_grammar_table() -> std::vector<pattern_grammar> {
    std::vector<pattern_grammar> table;

    // RFC 5321 limits: 64 byte local part, 63 byte labels
    table.push_back({
        .category = pii_category::email,
        .name = "email",
        .expression = std::regex(
            R"([A-Za-z0-9._%+-]{1,64}@(?:[A-Za-z0-9-]{1,63}\.){1,8}[A-Za-z]{2,24})"),
        .joiners = "",
        .validator = nullptr
    });

    // North American numbering plan, optional country code and area code
    // parentheses: 555-123-4567, (555) 123-4567, +1 555.123.4567, 5551234567
    table.push_back({
        .category = pii_category::phone,
        .name = "nanp_phone",
        .expression = std::regex(
            R"((?:\+?1[ .-]?)?(?:\(\d{3}\)[ .-]?|\d{3}[ .-]?)\d{3}[ .-]?\d{4})"),
        .joiners = "-.",
        .validator = &has_phone_digit_count
    });

    // International numbers with an explicit country code: +44 20 7946 0958
    table.push_back({
        .category = pii_category::phone,
        .name = "international_phone",
        .expression = std::regex(
            R"(\+[2-9]\d{0,2}[ .-]?\d{1,4}(?:[ .-]?\d{2,4}){2,4})"),
        .joiners = "-.",
        .validator = &has_phone_digit_count
    });

    // 123-45-6789, 123 45 6789, 123456789 (separators must agree)
    table.push_back({
        .category = pii_category::ssn,
        .name = "ssn",
        .expression = std::regex(R"(\d{3}([- ])\d{2}\1\d{4}|\d{9})"),
        .joiners = "-.",
        .validator = &is_plausible_ssn
    });

    // 16 digit cards in groups of four, 15 digit cards in 4-6-5 groups
    table.push_back({
        .category = pii_category::credit_card,
        .name = "credit_card",
        .expression = std::regex(
            R"(\d{4}([ -]?)\d{4}\1\d{4}\1\d{4}|\d{4}([ -]?)\d{6}\2\d{5})"),
        .joiners = "-.",
        .validator = &is_card_number
    });

    table.push_back({
        .category = pii_category::ip_address,
        .name = "ipv4",
        .expression = std::regex(
            R"((?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)(?:\.(?:25[0-5]|2[0-4]\d|1\d\d|[1-9]?\d)){3})"),
        .joiners = ".",
        .validator = nullptr
    });

    table.push_back({
        .category = pii_category::ip_address,
        .name = "ipv6",
        .expression = std::regex(
            R"((?:[0-9A-Fa-f]{1,4}:){7}[0-9A-Fa-f]{1,4})"
            R"(|(?:[0-9A-Fa-f]{1,4}:){1,7}:(?:[0-9A-Fa-f]{1,4}(?::[0-9A-Fa-f]{1,4}){0,6})?)"
            R"(|::[0-9A-Fa-f]{1,4}(?::[0-9A-Fa-f]{1,4}){0,6})"),
        .joiners = ":",
        .validator = &is_valid_ipv6
    });

    return table;
}

/**
 * @brief All accepted matches of one grammar, left-to-right
 *
 * A rejected match resumes the search one byte after its start so that a
 * valid match beginning inside it is still found.
 */
[[nodiscard]] auto scan_grammar(std::string_view text, const pattern_grammar& grammar)
    -> std::vector<core::span> {
    std::vector<core::span> found;

    scan_matches(text, grammar.expression,
                 [&](const text_match& match, std::size_t offset) -> std::size_t {
        auto start = offset + static_cast<std::size_t>(match.position(0));
        auto end = start + static_cast<std::size_t>(match.length(0));
        if (end == start) {
            return start + 1;
        }

        auto candidate = text.substr(start, end - start);
        if (!is_delimited(text, start, end, grammar.joiners) ||
            (grammar.validator != nullptr && !grammar.validator(candidate))) {
            return start + 1;
        }

        found.push_back(core::make_span(text, start, end, grammar.category,
                                        core::detection_source::pattern,
                                        pattern_detector::rule_confidence));
        return end;
    });

    return found;
}

} // namespace

// =============================================================================
// pattern_detector
// =============================================================================

auto pattern_detector::grammars() -> const std::vector<pattern_grammar>& {
    static const std::vector<pattern_grammar> table = build_grammar_table();
    return table;
}

auto pattern_detector::detect_category(std::string_view text,
                                       pii_category category) const
    -> std::vector<core::span> {
    std::vector<core::span> candidates;
    for (const auto& grammar : grammars()) {
        if (grammar.category != category) {
            continue;
        }
        auto matches = scan_grammar(text, grammar);
        candidates.insert(candidates.end(),
                          std::make_move_iterator(matches.begin()),
                          std::make_move_iterator(matches.end()));
    }

    // Several grammars may serve one category; keep the leftmost, longest
    // match and drop whatever overlaps it.
    std::sort(candidates.begin(), candidates.end(),
              [](const core::span& a, const core::span& b) {
                  if (a.start != b.start) {
                      return a.start < b.start;
                  }
                  return a.length() > b.length();
              });

    std::vector<core::span> result;
    for (auto& candidate : candidates) {
        if (!result.empty() && result.back().overlaps(candidate)) {
            continue;
        }
        result.push_back(std::move(candidate));
    }
    return result;
}

auto pattern_detector::detect_patterns(std::string_view text) const
    -> std::vector<core::span> {
    std::vector<core::span> spans;
    if (text.empty()) {
        return spans;
    }

    for (auto category : {pii_category::email, pii_category::phone,
                          pii_category::ssn, pii_category::credit_card,
                          pii_category::ip_address}) {
        auto found = detect_category(text, category);
        spans.insert(spans.end(),
                     std::make_move_iterator(found.begin()),
                     std::make_move_iterator(found.end()));
    }
    return spans;
}

// =============================================================================
// Validators
// =============================================================================

auto passes_luhn(std::string_view number) -> bool {
    auto digits = digits_of(number);
    if (digits.size() < 13) {
        return false;
    }

    int sum = 0;
    bool alternate = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int n = *it - '0';
        if (alternate) {
            n *= 2;
            if (n > 9) {
                n -= 9;
            }
        }
        sum += n;
        alternate = !alternate;
    }
    return sum % 10 == 0;
}

auto is_plausible_ssn(std::string_view ssn) -> bool {
    auto digits = digits_of(ssn);
    if (digits.size() != 9) {
        return false;
    }

    auto area = std::string_view(digits).substr(0, 3);
    auto group = std::string_view(digits).substr(3, 2);
    auto serial = std::string_view(digits).substr(5, 4);

    if (area == "000" || area == "666" || area[0] == '9') {
        return false;
    }
    return group != "00" && serial != "0000";
}

auto is_valid_ipv6(std::string_view address) -> bool {
    auto compression = address.find("::");
    if (compression != std::string_view::npos &&
        address.find("::", compression + 1) != std::string_view::npos) {
        return false;
    }

    std::size_t groups = 0;
    std::size_t run = 0;
    for (char c : address) {
        if (c == ':') {
            if (run > 0) {
                ++groups;
            }
            run = 0;
            continue;
        }
        if (std::isxdigit(static_cast<unsigned char>(c)) == 0 || ++run > 4) {
            return false;
        }
    }
    if (run > 0) {
        ++groups;
    }

    if (groups < 2 || groups > 8) {
        return false;
    }
    return compression != std::string_view::npos || groups == 8;
}

auto has_phone_digit_count(std::string_view phone) -> bool {
    auto count = digits_of(phone).size();
    return count >= 10 && count <= 15;
}

auto is_delimited(std::string_view text,
                  std::size_t start,
                  std::size_t end,
                  std::string_view joiners) -> bool {
    auto bridges = [](char joiner, char next) {
        auto c = static_cast<unsigned char>(next);
        return joiner == ':' ? std::isxdigit(c) != 0 : std::isdigit(c) != 0;
    };

    if (start > 0) {
        char before = text[start - 1];
        if (is_alnum(before)) {
            return false;
        }
        if (joiners.find(before) != std::string_view::npos && start > 1 &&
            bridges(before, text[start - 2])) {
            return false;
        }
    }

    if (end < text.size()) {
        char after = text[end];
        if (is_alnum(after)) {
            return false;
        }
        if (joiners.find(after) != std::string_view::npos && end + 1 < text.size() &&
            bridges(after, text[end + 1])) {
            return false;
        }
    }

    return true;
}

} // namespace pii::detection
