/**
 * @file log_guard.hpp
 * @brief Decides whether a log entry may be written
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "pii/engine/sanitizer_engine.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace pii::engine {

/**
 * @brief What to do with a log entry that contains PII
 */
enum class log_mode : std::uint8_t {
    block = 0,  ///< Refuse the entry
    mask = 1,   ///< Write the entry with PII replaced by category tags
    log = 2     ///< Write the entry unchanged and warn
};

[[nodiscard]] constexpr auto to_string(log_mode mode) noexcept -> std::string_view {
    switch (mode) {
        case log_mode::block:
            return "block";
        case log_mode::mask:
            return "mask";
        case log_mode::log:
            return "log";
    }
    return "unknown";
}

/**
 * @brief Parse a log mode name (case-insensitive)
 *
 * @return The mode, or invalid_configuration for any other name
 */
[[nodiscard]] auto parse_log_mode(std::string_view name) -> Result<log_mode>;

/**
 * @brief Verdict on one log entry
 */
struct log_decision {
    /// At least one PII span was found
    bool contains_pii{false};

    /// The entry may be written
    bool loggable{true};

    /// Text to write; empty when not loggable
    std::string text;

    /// Resolved spans found in the entry
    std::size_t pii_count{0};
};

/**
 * @brief Gatekeeper placed in front of a log sink
 *
 * @example
 * @code
 * auto engine = std::make_shared<sanitizer_engine>();
 * log_guard guard(engine, log_mode::mask);
 *
 * auto decision = guard.evaluate("login failed for john@example.com");
 * if (decision.is_ok() && decision.value().loggable) {
 *     sink.write(decision.value().text);  // "login failed for [REDACTED_EMAIL]"
 * }
 * @endcode
 */
class log_guard {
public:
    /**
     * @throws std::invalid_argument if engine is null
     */
    log_guard(std::shared_ptr<const sanitizer_engine> engine, log_mode mode);

    [[nodiscard]] auto evaluate(std::string_view entry) const -> Result<log_decision>;

    [[nodiscard]] auto mode() const noexcept -> log_mode { return mode_; }

private:
    std::shared_ptr<const sanitizer_engine> engine_;
    log_mode mode_;
};

} // namespace pii::engine
