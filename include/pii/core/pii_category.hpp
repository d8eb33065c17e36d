/**
 * @file pii_category.hpp
 * @brief Categories of personally identifiable information
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pii::core {

/**
 * @brief Kind of PII a span carries
 *
 * The first group is produced by deterministic grammars, the second by an
 * entity recognizer and the third by keyword-scored contextual rules.
 */
enum class pii_category : std::uint8_t {
    // Pattern grammars
    email = 0,
    phone = 1,
    ssn = 2,
    credit_card = 3,
    ip_address = 4,

    // Entity recognizer
    name = 5,
    address = 6,
    date = 7,
    organization = 8,

    // Contextual rules
    cvv = 9,
    expiration_date = 10,
    drivers_license = 11,
    bank_account = 12
};

/**
 * @brief Provenance of a detected span
 *
 * Declaration order is the resolver priority: pattern wins over ner,
 * ner wins over proximity.
 */
enum class detection_source : std::uint8_t {
    pattern = 0,
    ner = 1,
    proximity = 2
};

/**
 * @brief Upper-case name of a category, as used in redaction tags
 */
[[nodiscard]] constexpr auto to_string(pii_category category) noexcept
    -> std::string_view {
    switch (category) {
        case pii_category::email:
            return "EMAIL";
        case pii_category::phone:
            return "PHONE";
        case pii_category::ssn:
            return "SSN";
        case pii_category::credit_card:
            return "CREDIT_CARD";
        case pii_category::ip_address:
            return "IP";
        case pii_category::name:
            return "NAME";
        case pii_category::address:
            return "ADDRESS";
        case pii_category::date:
            return "DATE";
        case pii_category::organization:
            return "ORGANIZATION";
        case pii_category::cvv:
            return "CVV";
        case pii_category::expiration_date:
            return "EXPIRATION_DATE";
        case pii_category::drivers_license:
            return "DRIVERS_LICENSE";
        case pii_category::bank_account:
            return "BANK_ACCOUNT";
    }
    return "UNKNOWN";
}

/**
 * @brief Convert detection source to string representation
 */
[[nodiscard]] constexpr auto to_string(detection_source source) noexcept
    -> std::string_view {
    switch (source) {
        case detection_source::pattern:
            return "PATTERN";
        case detection_source::ner:
            return "NER";
        case detection_source::proximity:
            return "PROXIMITY";
    }
    return "UNKNOWN";
}

/**
 * @brief Parse a category from its upper-case name
 * @return The category, or nullopt if the name is unknown
 */
[[nodiscard]] auto category_from_string(std::string_view name)
    -> std::optional<pii_category>;

/**
 * @brief All categories, in declaration order
 */
inline constexpr pii_category all_categories[] = {
    pii_category::email,
    pii_category::phone,
    pii_category::ssn,
    pii_category::credit_card,
    pii_category::ip_address,
    pii_category::name,
    pii_category::address,
    pii_category::date,
    pii_category::organization,
    pii_category::cvv,
    pii_category::expiration_date,
    pii_category::drivers_license,
    pii_category::bank_account
};

} // namespace pii::core
