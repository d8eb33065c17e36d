/**
 * @file sanitizer_engine.cpp
 * @brief Implementation of the sanitizer pipeline
 *
 * @copyright Copyright (c) 2025
 */

#include "pii/engine/sanitizer_engine.hpp"
#include "pii/compat/format.hpp"
#include "pii/detection/rule_based_recognizer.hpp"
#include "pii/integration/logger_adapter.hpp"
#include "pii/integration/thread_pool_adapter.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <utility>

namespace pii::engine {

using integration::logger_adapter;

namespace {

constexpr const char* pattern_detector_name = "pattern_detector";
constexpr const char* contextual_detector_name = "contextual_detector";

/**
 * @brief State shared between the engine and an in-flight recognizer task
 *
 * The task owns a copy of the text, so a task abandoned after a timeout
 * never reads caller memory.
 */
struct recognizer_task_state {
    std::string text;
    std::vector<core::span> spans;
    std::string error;
};

[[nodiscard]] auto validated(engine_config config) -> engine_config {
    auto valid = validate(config);
    if (valid.is_err()) {
        throw std::invalid_argument(valid.error().message);
    }
    return config;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

sanitizer_engine::sanitizer_engine()
    : sanitizer_engine(engine_config{}) {}

sanitizer_engine::sanitizer_engine(engine_config config)
    : sanitizer_engine(std::move(config),
                       std::make_shared<detection::rule_based_recognizer>()) {}

sanitizer_engine::sanitizer_engine(
    engine_config config,
    std::shared_ptr<detection::entity_recognizer> recognizer,
    std::shared_ptr<integration::thread_pool_interface> pool)
    : config_(validated(std::move(config))),
      recognizer_(std::move(recognizer)),
      pool_(std::move(pool)),
      proximity_analyzer_(config_.proximity()),
      graph_builder_(config_.proximity_window, config_.enable_graph) {
    if (recognizer_ && !pool_) {
        pool_ = std::make_shared<integration::thread_pool_adapter>();
    }
}

sanitizer_engine::~sanitizer_engine() = default;

// =============================================================================
// Pipeline
// =============================================================================

auto sanitizer_engine::admit(std::vector<core::span> spans,
                             std::string_view text,
                             std::vector<dropped_span>& dropped) const
    -> std::vector<core::span> {
    std::vector<core::span> admitted;
    admitted.reserve(spans.size());

    for (auto& s : spans) {
        auto valid = core::validate_span(s, text.size());
        if (valid.is_err()) {
            const auto& err = valid.error();
            logger_adapter::log_span_dropped(core::to_string(s.source),
                                             core::to_string(s.category),
                                             s.start, s.end, err.message);
            dropped.push_back({
                .source = s.source,
                .category = s.category,
                .start = s.start,
                .end = s.end,
                .reason = err.message
            });
            continue;
        }

        s.matched_text.assign(text.substr(s.start, s.end - s.start));
        admitted.push_back(std::move(s));
    }
    return admitted;
}

auto sanitizer_engine::analyze(std::string_view text) const -> Result<analysis> {
    analysis result;
    if (text.empty()) {
        return ok(std::move(result));
    }

    // Start entity recognition first so it overlaps with pattern detection.
    std::shared_ptr<recognizer_task_state> task_state;
    std::future<void> recognizer_done;
    bool recognizer_submitted = false;

    auto degrade_detector = [&](const std::string& detector, const std::string& reason) {
        logger_adapter::log_detector_degraded(detector, reason);
        result.degraded_detectors.push_back(detector);
    };
    auto degrade = [&](const std::string& reason) {
        degrade_detector(recognizer_->name(), reason);
    };

    if (recognizer_) {
        task_state = std::make_shared<recognizer_task_state>();
        task_state->text.assign(text);
        try {
            recognizer_done = pool_->enqueue(
                integration::job_priority::high,
                [state = task_state, recognizer = recognizer_]() {
                    auto detected = recognizer->detect_entities(state->text);
                    if (detected.is_err()) {
                        state->error = detected.error().message;
                        return;
                    }
                    state->spans = detected.value();
                });
            recognizer_submitted = true;
        } catch (const std::exception& e) {
            degrade(std::string("submission failed: ") + e.what());
        }
    }

    // A regex failure (std::regex_error for stack or complexity limits)
    // costs that detector's spans only.
    std::vector<core::span> candidates;
    try {
        candidates = admit(pattern_detector_.detect_patterns(text), text,
                           result.dropped_spans);
    } catch (const std::exception& e) {
        degrade_detector(pattern_detector_name, std::string("exception: ") + e.what());
    }

    if (config_.enable_proximity) {
        try {
            auto contextual = admit(proximity_analyzer_.detect_contextual(text), text,
                                    result.dropped_spans);
            candidates.insert(candidates.end(),
                              std::make_move_iterator(contextual.begin()),
                              std::make_move_iterator(contextual.end()));
        } catch (const std::exception& e) {
            degrade_detector(contextual_detector_name,
                             std::string("exception: ") + e.what());
        }
    }

    if (recognizer_submitted) {
        auto status = recognizer_done.wait_for(config_.ner_timeout);
        if (status != std::future_status::ready) {
            degrade(compat::format("timeout after {} ms", config_.ner_timeout.count()));
        } else {
            try {
                recognizer_done.get();
                if (!task_state->error.empty()) {
                    degrade(task_state->error);
                } else {
                    auto entities = admit(std::move(task_state->spans), text,
                                          result.dropped_spans);
                    candidates.insert(candidates.end(),
                                      std::make_move_iterator(entities.begin()),
                                      std::make_move_iterator(entities.end()));
                }
            } catch (const std::exception& e) {
                degrade(std::string("exception: ") + e.what());
            } catch (...) {
                degrade("unknown exception");
            }
        }
    }

    std::vector<detection::proximity_fact> facts;
    if (config_.enable_proximity) {
        auto annotation = proximity_analyzer_.annotate(std::move(candidates), text);
        candidates = std::move(annotation.spans);
        facts = std::move(annotation.facts);
    }

    candidates.erase(
        std::remove_if(candidates.begin(), candidates.end(),
                       [this](const core::span& s) {
                           return s.confidence < config_.threshold_for(s.category);
                       }),
        candidates.end());

    auto resolved = resolver_.resolve(std::move(candidates), text.size());
    if (resolved.is_err()) {
        return Result<analysis>(resolved.error());
    }
    result.spans = std::move(resolved.value());

    result.entities = deduplicator_.dedupe(
        graph_builder_.build(result.spans, facts, text), result.spans);

    logger_adapter::log_detection_completed(text.size(), result.spans.size(),
                                            engine::summarize(result.spans).counts_by_name());
    return ok(std::move(result));
}

// =============================================================================
// Operations
// =============================================================================

auto sanitizer_engine::detect(std::string_view text) const
    -> Result<std::vector<pii_detection>> {
    auto analyzed = analyze(text);
    if (analyzed.is_err()) {
        return Result<std::vector<pii_detection>>(analyzed.error());
    }

    std::vector<pii_detection> detections;
    for (const auto& s : analyzed.value().spans) {
        detections.push_back({
            .category = s.category,
            .matched_text = s.matched_text,
            .start = s.start,
            .end = s.end,
            .confidence = s.confidence
        });
    }
    return ok(std::move(detections));
}

auto sanitizer_engine::report(std::string_view text,
                              redaction::redaction_policy policy) const
    -> Result<sanitization_report> {
    if (!redaction::is_supported(policy)) {
        return pii_error<sanitization_report>(
            error_codes::unsupported_policy,
            "Unsupported redaction policy",
            compat::format("value={}", static_cast<int>(policy)));
    }

    auto analyzed = analyze(text);
    if (analyzed.is_err()) {
        return Result<sanitization_report>(analyzed.error());
    }
    auto& state = analyzed.value();

    auto redacted = redactor_.redact(text, state.spans, policy, config_.templates);
    if (redacted.is_err()) {
        logger_adapter::error("Redaction failed: {}", redacted.error().message);
        return Result<sanitization_report>(redacted.error());
    }

    sanitization_report out;
    out.original_length_ = text.size();
    out.spans_found_ = state.spans.spans();
    out.entities_found_ = std::move(state.entities);
    out.policy_ = policy;
    out.output_text_ = std::move(redacted.value());
    out.summary_ = engine::summarize(state.spans);
    out.degraded_detectors_ = std::move(state.degraded_detectors);
    out.dropped_spans_ = std::move(state.dropped_spans);

    logger_adapter::log_sanitization_completed(redaction::to_string(policy),
                                               out.original_length_,
                                               out.output_text_.size(),
                                               out.spans_found_.size());
    return ok(std::move(out));
}

auto sanitizer_engine::report(std::string_view text,
                              std::string_view policy_name) const
    -> Result<sanitization_report> {
    auto policy = redaction::parse_redaction_policy(policy_name);
    if (policy.is_err()) {
        return Result<sanitization_report>(policy.error());
    }
    return report(text, policy.value());
}

auto sanitizer_engine::sanitize(std::string_view text,
                                redaction::redaction_policy policy) const
    -> Result<std::string> {
    auto result = report(text, policy);
    if (result.is_err()) {
        return Result<std::string>(result.error());
    }
    return ok(std::string(result.value().output_text()));
}

auto sanitizer_engine::sanitize(std::string_view text,
                                std::string_view policy_name) const
    -> Result<std::string> {
    auto policy = redaction::parse_redaction_policy(policy_name);
    if (policy.is_err()) {
        return Result<std::string>(policy.error());
    }
    return sanitize(text, policy.value());
}

auto sanitizer_engine::summarize(std::string_view text) const
    -> Result<detection_summary> {
    auto analyzed = analyze(text);
    if (analyzed.is_err()) {
        return Result<detection_summary>(analyzed.error());
    }
    return ok(engine::summarize(analyzed.value().spans));
}

} // namespace pii::engine
