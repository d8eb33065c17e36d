/**
 * @file redactor.cpp
 * @brief Implementation of the redactor
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/redaction/redactor.hpp"
#include "pii/compat/format.hpp"

#include <algorithm>
#include <cctype>

namespace pii::redaction {

namespace {

[[nodiscard]] auto is_space(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] auto is_closing_punctuation(char c) -> bool {
    switch (c) {
        case '.':
        case ',':
        case ';':
        case ':':
        case '!':
        case '?':
        case ')':
        case ']':
        case '}':
        case '"':
        case '\'':
            return true;
        default:
            return false;
    }
}

void trim_trailing_space(std::string& out) {
    while (!out.empty() && is_space(out.back())) {
        out.pop_back();
    }
}

[[nodiscard]] auto is_separator(char c) -> bool {
    return c == '-' || c == '/';
}

/**
 * @brief Tidy the output after a span at [start, end) was deleted
 *
 * @param out Output assembled so far (everything before the span)
 * @param text Original text
 * @param end End of the removed span
 * @param limit Start of the next span (or text size)
 * @return Position in text from which copying continues
 */
auto tidy_removal(std::string& out, std::string_view text, std::size_t end,
                  std::size_t limit) -> std::size_t {
    auto resume = end;

    // "555-123-4567- y" and "555-123-4567-ext" must not keep the dash
    if (resume < limit && is_separator(text[resume])) {
        ++resume;
    }

    const bool next_is_gap = resume >= text.size() || is_space(text[resume]) ||
                             is_closing_punctuation(text[resume]);
    if (next_is_gap) {
        trim_trailing_space(out);

        // "Phone - 555-123-4567" must not leave "Phone -" behind
        if (!out.empty() && is_separator(out.back()) &&
            (out.size() == 1 || is_space(out[out.size() - 2]))) {
            out.pop_back();
            trim_trailing_space(out);
        }
    }

    if (out.empty()) {
        while (resume < limit && is_space(text[resume])) {
            ++resume;
        }
    }
    return resume;
}

} // namespace

auto redactor::replacement(const core::span& s,
                           redaction_policy policy,
                           const redaction_template_table& templates) -> std::string {
    const auto& entry = templates.lookup(s.category);
    switch (policy) {
        case redaction_policy::generic:
            return entry.generic_tag;
        case redaction_policy::mask:
            return apply_mask(entry.mask, s.matched_text);
        case redaction_policy::remove:
            return {};
    }
    return entry.generic_tag;
}

auto redactor::redact(std::string_view text,
                      const resolution::resolved_span_set& spans,
                      redaction_policy policy,
                      const redaction_template_table& templates) const
    -> Result<std::string> {
    if (!is_supported(policy)) {
        return pii_error<std::string>(
            error_codes::unsupported_policy,
            "Unsupported redaction policy",
            compat::format("value={}", static_cast<int>(policy)));
    }

    std::string out;
    out.reserve(text.size());

    std::size_t cursor = 0;
    for (std::size_t i = 0; i < spans.size(); ++i) {
        const auto& s = spans[i];
        if (s.start < cursor || s.start >= s.end || s.end > text.size()) {
            return pii_error<std::string>(
                error_codes::internal_inconsistency,
                "Span overlaps its predecessor or exceeds the text",
                compat::format("index={} start={} end={} cursor={} length={}",
                               i, s.start, s.end, cursor, text.size()));
        }

        out.append(text.substr(cursor, s.start - cursor));

        if (policy == redaction_policy::remove) {
            auto limit = i + 1 < spans.size()
                             ? std::clamp(spans[i + 1].start, s.end, text.size())
                             : text.size();
            cursor = tidy_removal(out, text, s.end, limit);
        } else {
            out += replacement(s, policy, templates);
            cursor = s.end;
        }
    }
    if (cursor < text.size()) {
        out.append(text.substr(cursor));
    }

    return ok(std::move(out));
}

} // namespace pii::redaction
