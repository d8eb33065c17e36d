/**
 * @file redactor.hpp
 * @brief Rewrites text under a redaction policy
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/redaction/redaction_policy.hpp"
#include "pii/resolution/resolved_span_set.hpp"

#include <string>
#include <string_view>

namespace pii::redaction {

/**
 * @brief Produces the sanitized text from a resolved span set
 *
 * The output is assembled from the untouched segments of the original text
 * and the replacements, so every byte outside a span is preserved (except the
 * whitespace REMOVE tidies up).
 *
 * REMOVE tidying, applied at each removed span:
 * - a whitespace run before the span is dropped when the next kept byte is
 *   whitespace, closing punctuation or the end of the text
 * - a '-' or '/' left dangling between that whitespace and the span is
 *   dropped with it
 * - at the start of the output, the whitespace after the span is dropped
 *
 * @example
 * @code
 * redactor r;
 * auto out = r.redact("My SSN is 123-45-6789", spans, redaction_policy::remove,
 *                     redaction_template_table{});
 * // out.value() == "My SSN is"
 * @endcode
 */
class redactor {
public:
    /**
     * @brief Redact every span of the set
     *
     * @return Sanitized text; unsupported_policy for an unknown policy value,
     *         internal_inconsistency if a span overlaps its predecessor or
     *         lies outside the text
     */
    [[nodiscard]] auto redact(std::string_view text,
                              const resolution::resolved_span_set& spans,
                              redaction_policy policy,
                              const redaction_template_table& templates) const
        -> Result<std::string>;

    /**
     * @brief Replacement for a single span under GENERIC or MASK
     */
    [[nodiscard]] static auto replacement(const core::span& s,
                                          redaction_policy policy,
                                          const redaction_template_table& templates)
        -> std::string;
};

} // namespace pii::redaction
