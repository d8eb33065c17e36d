/**
 * @file redaction_policy.hpp
 * @brief Redaction policies, mask rules and the per-category template table
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/core/pii_category.hpp"
#include "pii/core/result.hpp"

#include <map>
#include <string>
#include <string_view>

namespace pii::redaction {

/**
 * @brief How detected PII is rewritten
 */
enum class redaction_policy : std::uint8_t {
    generic = 0,  ///< Replace with a category tag, e.g. [REDACTED_EMAIL]
    mask = 1,     ///< Partially hide the value, keeping its shape
    remove = 2    ///< Delete the value and tidy the surrounding whitespace
};

/**
 * @brief Convert policy to string representation
 */
[[nodiscard]] constexpr auto to_string(redaction_policy policy) noexcept
    -> std::string_view {
    switch (policy) {
        case redaction_policy::generic:
            return "generic";
        case redaction_policy::mask:
            return "mask";
        case redaction_policy::remove:
            return "remove";
    }
    return "unknown";
}

/**
 * @brief Check that a policy value is one of the declared enumerators
 */
[[nodiscard]] constexpr auto is_supported(redaction_policy policy) noexcept -> bool {
    return policy == redaction_policy::generic ||
           policy == redaction_policy::mask ||
           policy == redaction_policy::remove;
}

/**
 * @brief Parse a policy name (case-insensitive)
 *
 * @return The policy, or unsupported_policy for any other name
 */
[[nodiscard]] auto parse_redaction_policy(std::string_view name)
    -> Result<redaction_policy>;

/**
 * @brief Shape-preserving transformations used by the MASK policy
 */
enum class mask_rule : std::uint8_t {
    /// First character of every '@' / '.' / ':' separated segment: j***@e***.c***
    segment_initials,

    /// Every digit except the last four becomes '*': ***-***-4567
    keep_last_four,

    /// Every alphanumeric becomes '*', separators stay: ***-**-****
    full,

    /// First and last four digits: 4111-****-****-1111
    card_edges,

    /// First character of every word: J*** R***
    word_initials,

    /// First character only: x***
    first_char
};

/**
 * @brief Apply a mask rule to a value
 */
[[nodiscard]] auto apply_mask(mask_rule rule, std::string_view value) -> std::string;

/**
 * @brief Replacement settings for one category
 */
struct redaction_template {
    /// Tag written by the GENERIC policy
    std::string generic_tag;

    /// Rule applied by the MASK policy
    mask_rule mask{mask_rule::first_char};
};

/**
 * @brief Category to redaction_template mapping
 *
 * Every category has a default entry; callers may override single entries.
 *
 * @example
 * @code
 * redaction_template_table templates;
 * templates.set(pii_category::email, {"<email>", mask_rule::full});
 * @endcode
 */
class redaction_template_table {
public:
    /// Table filled with the default template of every category
    redaction_template_table();

    [[nodiscard]] auto lookup(core::pii_category category) const
        -> const redaction_template&;

    void set(core::pii_category category, redaction_template entry);

    /**
     * @brief Default template of a category
     */
    [[nodiscard]] static auto default_template(core::pii_category category)
        -> redaction_template;

private:
    std::map<core::pii_category, redaction_template> entries_;
};

} // namespace pii::redaction
