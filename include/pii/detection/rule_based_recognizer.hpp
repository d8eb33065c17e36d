/**
 * @file rule_based_recognizer.hpp
 * @brief Default entity_recognizer built from lexical rules
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/detection/entity_recognizer.hpp"

#include <regex>
#include <string>
#include <vector>

namespace pii::detection {

/**
 * @brief One lexical entity rule
 */
struct recognizer_rule {
    core::pii_category category{core::pii_category::name};
    std::string name;
    std::regex expression;

    /// Sub-match reported as the span (0 = whole match)
    std::size_t capture_group{0};

    double confidence{0.7};
};

/**
 * @brief Entity recognizer over capitalisation and keyword cues
 *
 * Recognizes:
 * - person names after an honorific ("Dr. Jane Roe") or a label
 *   ("Patient: Jane Roe", "my name is Jane Roe")
 * - street addresses ("221 Baker Street") and P.O. boxes
 * - ISO, US numeric and month-name dates
 * - organisations carrying a legal suffix ("Acme Widgets Inc")
 *
 * It never fails; it is the recognizer the engine uses when none is injected.
 */
class rule_based_recognizer final : public entity_recognizer {
public:
    rule_based_recognizer() = default;

    [[nodiscard]] auto detect_entities(std::string_view text) const
        -> Result<std::vector<core::span>> override;

    [[nodiscard]] auto name() const -> std::string override;

    /**
     * @brief The compiled rule table shared by all instances
     */
    [[nodiscard]] static auto rules() -> const std::vector<recognizer_rule>&;
};

} // namespace pii::detection
