/**
 * @file redaction_policy.cpp
 * @brief Implementation of policy parsing, mask rules and templates
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/redaction/redaction_policy.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace pii::redaction {

using core::pii_category;

namespace {

constexpr std::string_view mask_fill = "***";

[[nodiscard]] auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/**
 * @brief Byte length of the UTF-8 sequence starting at value[0]
 */
[[nodiscard]] auto leading_code_point_length(std::string_view value) -> std::size_t {
    if (value.empty()) {
        return 0;
    }
    auto lead = static_cast<unsigned char>(value[0]);
    std::size_t length = 1;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
    }
    return std::min(length, value.size());
}

[[nodiscard]] auto initial_of(std::string_view segment) -> std::string {
    if (segment.empty()) {
        return {};
    }
    std::string out(segment.substr(0, leading_code_point_length(segment)));
    out += mask_fill;
    return out;
}

[[nodiscard]] auto mask_segments(std::string_view value,
                                 std::string_view separators) -> std::string {
    std::string out;
    std::size_t pos = 0;
    while (pos < value.size()) {
        auto next = value.find_first_of(separators, pos);
        if (next == std::string_view::npos) {
            next = value.size();
        }
        out += initial_of(value.substr(pos, next - pos));
        if (next < value.size()) {
            out.push_back(value[next]);
        }
        pos = next + 1;
    }
    return out;
}

[[nodiscard]] auto mask_card(std::string_view value) -> std::string {
    std::string digits;
    for (char c : value) {
        if (is_digit(c)) {
            digits.push_back(c);
        }
    }
    if (digits.size() < 8) {
        return std::string(value.size(), '*');
    }
    return digits.substr(0, 4) + "-****-****-" + digits.substr(digits.size() - 4);
}

} // namespace

auto parse_redaction_policy(std::string_view name) -> Result<redaction_policy> {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto policy : {redaction_policy::generic, redaction_policy::mask,
                        redaction_policy::remove}) {
        if (to_string(policy) == lowered) {
            return ok(policy);
        }
    }
    return pii_error<redaction_policy>(
        error_codes::unsupported_policy,
        "Unsupported redaction policy",
        "name=" + std::string(name));
}

auto apply_mask(mask_rule rule, std::string_view value) -> std::string {
    switch (rule) {
        case mask_rule::segment_initials:
            return mask_segments(value, "@.:");

        case mask_rule::keep_last_four: {
            auto digits = static_cast<std::size_t>(
                std::count_if(value.begin(), value.end(), is_digit));
            auto hidden = digits > 4 ? digits - 4 : 0;
            std::string out(value);
            for (auto& c : out) {
                if (hidden == 0) {
                    break;
                }
                if (is_digit(c)) {
                    c = '*';
                    --hidden;
                }
            }
            return out;
        }

        case mask_rule::full: {
            std::string out(value);
            for (auto& c : out) {
                if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
                    c = '*';
                }
            }
            return out;
        }

        case mask_rule::card_edges:
            return mask_card(value);

        case mask_rule::word_initials: {
            std::string out;
            std::size_t pos = 0;
            while (pos < value.size()) {
                if (std::isspace(static_cast<unsigned char>(value[pos])) != 0) {
                    out.push_back(value[pos++]);
                    continue;
                }
                auto next = pos;
                while (next < value.size() &&
                       std::isspace(static_cast<unsigned char>(value[next])) == 0) {
                    ++next;
                }
                out += initial_of(value.substr(pos, next - pos));
                pos = next;
            }
            return out;
        }

        case mask_rule::first_char:
            return initial_of(value);
    }
    return initial_of(value);
}

// =============================================================================
// redaction_template_table
// =============================================================================

redaction_template_table::redaction_template_table() {
    for (auto category : core::all_categories) {
        entries_.emplace(category, default_template(category));
    }
}

auto redaction_template_table::default_template(pii_category category)
    -> redaction_template {
    redaction_template entry;
    entry.generic_tag = "[REDACTED_" + std::string(core::to_string(category)) + "]";

    switch (category) {
        case pii_category::email:
        case pii_category::ip_address:
            entry.mask = mask_rule::segment_initials;
            break;
        case pii_category::phone:
            entry.mask = mask_rule::keep_last_four;
            break;
        case pii_category::ssn:
            entry.mask = mask_rule::full;
            break;
        case pii_category::credit_card:
            entry.mask = mask_rule::card_edges;
            break;
        case pii_category::name:
        case pii_category::address:
            entry.mask = mask_rule::word_initials;
            break;
        default:
            entry.mask = mask_rule::first_char;
            break;
    }
    return entry;
}

auto redaction_template_table::lookup(pii_category category) const
    -> const redaction_template& {
    return entries_.at(category);
}

void redaction_template_table::set(pii_category category, redaction_template entry) {
    entries_[category] = std::move(entry);
}

} // namespace pii::redaction
