/**
 * @file regex_scan.hpp
 * @brief Windowed regex scanning for arbitrarily long input
 *
 * std::regex in libstdc++ matches by recursion, and a single search over a
 * multi-megabyte line is also needlessly slow. Every detector grammar has
 * bounded quantifiers, so a match never exceeds max_match_length bytes; the
 * text is searched scan_window bytes at a time with enough overlap that no
 * match is lost or truncated at a window edge.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <regex>
#include <string_view>

namespace pii::detection {

/// Bytes handed to one regex_search call
inline constexpr std::size_t scan_window = 8192;

/// Upper bound on the length of any detector match, with headroom for the
/// trailing assertion a grammar may inspect
inline constexpr std::size_t max_match_length = 1024;

using text_match = std::match_results<std::string_view::const_iterator>;

/**
 * @brief Visit successive matches of @p expression in @p text
 *
 * @param visit Called as visit(match, offset) where offset is the absolute
 *        position of the searched window, so match.position(n) + offset is
 *        the absolute start of group n. Returns the absolute position the
 *        next search starts from, which must be past the match start.
 */
template <typename Visitor>
void scan_matches(std::string_view text, const std::regex& expression, Visitor&& visit) {
    text_match match;
    std::size_t pos = 0;

    while (pos < text.size()) {
        const auto window_end = std::min(text.size(), pos + scan_window);
        const bool last_window = window_end == text.size();

        auto flags = std::regex_constants::match_default;
        if (pos > 0) {
            flags |= std::regex_constants::match_prev_avail;
        }

        const auto first = text.begin() + static_cast<std::ptrdiff_t>(pos);
        const auto last = text.begin() + static_cast<std::ptrdiff_t>(window_end);
        if (!std::regex_search(first, last, match, expression, flags)) {
            if (last_window) {
                return;
            }
            pos = window_end - max_match_length;
            continue;
        }

        const auto start = pos + static_cast<std::size_t>(match.position(0));

        // A match this close to the window edge may have been cut short;
        // search again from its start so it lies wholly inside the window.
        if (!last_window && start + max_match_length > window_end) {
            pos = start;
            continue;
        }

        pos = std::max(visit(match, pos), start + 1);
    }
}

}  // namespace pii::detection
