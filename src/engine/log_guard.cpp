/**
 * @file log_guard.cpp
 * @brief Implementation of log entry gating
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/engine/log_guard.hpp"
#include "pii/integration/logger_adapter.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace pii::engine {

using integration::logger_adapter;

auto parse_log_mode(std::string_view name) -> Result<log_mode> {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto mode : {log_mode::block, log_mode::mask, log_mode::log}) {
        if (to_string(mode) == lowered) {
            return ok(mode);
        }
    }
    return pii_error<log_mode>(error_codes::invalid_configuration,
                               "Unknown log mode", "name=" + std::string(name));
}

log_guard::log_guard(std::shared_ptr<const sanitizer_engine> engine, log_mode mode)
    : engine_(std::move(engine)), mode_(mode) {
    if (!engine_) {
        throw std::invalid_argument("Sanitizer engine cannot be null");
    }
}

auto log_guard::evaluate(std::string_view entry) const -> Result<log_decision> {
    auto report = engine_->report(entry, redaction::redaction_policy::generic);
    if (report.is_err()) {
        return Result<log_decision>(report.error());
    }

    const auto& r = report.value();
    log_decision decision;
    decision.pii_count = r.spans_found().size();
    decision.contains_pii = decision.pii_count > 0;

    if (!decision.contains_pii) {
        decision.text.assign(entry);
        return ok(std::move(decision));
    }

    switch (mode_) {
        case log_mode::block:
            decision.loggable = false;
            logger_adapter::info("Log entry blocked: {} PII span(s)", decision.pii_count);
            break;
        case log_mode::mask:
            decision.text = r.output_text();
            break;
        case log_mode::log:
            decision.text.assign(entry);
            logger_adapter::warn("Log entry with {} PII span(s) written unredacted",
                                 decision.pii_count);
            break;
    }
    return ok(std::move(decision));
}

} // namespace pii::engine
