/**
 * @file rule_based_recognizer.cpp
 * @brief Implementation of the lexical entity rules
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/detection/rule_based_recognizer.hpp"
#include "pii/detection/regex_scan.hpp"

namespace pii::detection {

using core::pii_category;

namespace {

constexpr const char* month_names =
    "(?:January|February|March|April|May|June|July|August|September|October"
    "|November|December|Jan|Feb|Mar|Apr|Jun|Jul|Aug|Sept|Sep|Oct|Nov|Dec)";

// Quantifiers are bounded so a long token cannot deepen the regex recursion
constexpr const char* capitalised_words =
    "([A-Z][a-z]{1,30}(?: [A-Z][a-z]{1,30}){0,2})\\b";

auto build_rule_table() -> std::vector<recognizer_rule> {
    std::vector<recognizer_rule> table;

    table.push_back({
        .category = pii_category::name,
        .name = "honorific_name",
        .expression = std::regex(
            std::string(R"(\b(?:Mr|Mrs|Ms|Miss|Dr|Prof)\.? )") + capitalised_words),
        .capture_group = 1,
        .confidence = 0.85
    });

    table.push_back({
        .category = pii_category::name,
        .name = "labelled_name",
        .expression = std::regex(
            R"(\b(?:[Nn]ame|[Pp]atient|[Cc]ustomer|[Ee]mployee|[Cc]ontact)[ \t]{0,4}[:=][ \t]{0,4})"
            R"(([A-Z][a-z]{1,30}(?: [A-Z][a-z]{1,30}){1,2})\b)"),
        .capture_group = 1,
        .confidence = 0.8
    });

    table.push_back({
        .category = pii_category::name,
        .name = "introduced_name",
        .expression = std::regex(std::string(R"(\b[Mm]y name is )") + capitalised_words),
        .capture_group = 1,
        .confidence = 0.8
    });

    table.push_back({
        .category = pii_category::address,
        .name = "street_address",
        .expression = std::regex(
            R"(\b\d{1,5} (?:[A-Z][a-z]{1,30} ){1,3})"
            R"((?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Lane|Ln|Drive|Court|Ct|Way|Place|Pl)\b)"),
        .capture_group = 0,
        .confidence = 0.8
    });

    table.push_back({
        .category = pii_category::address,
        .name = "po_box",
        .expression = std::regex(R"(\bP\.? ?O\.? Box \d{1,6}\b)"),
        .capture_group = 0,
        .confidence = 0.85
    });

    table.push_back({
        .category = pii_category::date,
        .name = "iso_date",
        .expression = std::regex(R"(\b\d{4}-(?:0[1-9]|1[0-2])-(?:0[1-9]|[12]\d|3[01])\b)"),
        .capture_group = 0,
        .confidence = 0.75
    });

    table.push_back({
        .category = pii_category::date,
        .name = "us_date",
        .expression = std::regex(
            R"(\b(?:0?[1-9]|1[0-2])/(?:0?[1-9]|[12]\d|3[01])/(?:\d{4}|\d{2})\b)"),
        .capture_group = 0,
        .confidence = 0.75
    });

    table.push_back({
        .category = pii_category::date,
        .name = "month_day_year",
        .expression = std::regex(
            std::string(R"(\b)") + month_names +
            R"(\.? \d{1,2}(?:st|nd|rd|th)?,? \d{4}\b)"),
        .capture_group = 0,
        .confidence = 0.8
    });

    table.push_back({
        .category = pii_category::date,
        .name = "day_month_year",
        .expression = std::regex(
            std::string(R"(\b\d{1,2} )") + month_names + R"(\.? \d{4}\b)"),
        .capture_group = 0,
        .confidence = 0.8
    });

    table.push_back({
        .category = pii_category::organization,
        .name = "legal_suffix_organization",
        .expression = std::regex(
            R"(\b(?:[A-Z][A-Za-z&]{1,40} ){1,3}(?:Inc|LLC|Ltd|Corp|Corporation|GmbH)\b)"),
        .capture_group = 0,
        .confidence = 0.7
    });

    return table;
}

} // namespace

auto rule_based_recognizer::rules() -> const std::vector<recognizer_rule>& {
    static const std::vector<recognizer_rule> table = build_rule_table();
    return table;
}

auto rule_based_recognizer::detect_entities(std::string_view text) const
    -> Result<std::vector<core::span>> {
    std::vector<core::span> spans;
    for (const auto& rule : rules()) {
        const auto group = rule.capture_group;
        scan_matches(text, rule.expression,
                     [&](const text_match& match, std::size_t offset) -> std::size_t {
            auto match_end = offset + static_cast<std::size_t>(match.position(0) +
                                                               match.length(0));
            if (!match[group].matched || match.length(group) == 0) {
                return match_end;
            }

            auto start = offset + static_cast<std::size_t>(match.position(group));
            auto end = start + static_cast<std::size_t>(match.length(group));
            spans.push_back(core::make_span(text, start, end, rule.category,
                                            core::detection_source::ner,
                                            rule.confidence));
            return match_end;
        });
    }
    return ok(std::move(spans));
}

auto rule_based_recognizer::name() const -> std::string {
    return "rule_based_recognizer";
}

} // namespace pii::detection
