/**
 * @file logger_adapter.hpp
 * @brief Operational log and audit trail for the sanitizer, on logger_system
 *
 * Two outputs are kept apart:
 *   pii_sanitizer.log  human readable messages (console and rotating file)
 *   audit.json         one JSON object per line for each engine event
 *
 * Nothing written here may contain matched text. Callers pass lengths,
 * offsets, counts and category names only.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <pii/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pii::integration {

enum class log_level { trace = 0, debug, info, warn, error, fatal, off };

struct logger_config {
    std::filesystem::path log_directory{"logs"};
    log_level min_level{log_level::info};

    bool enable_console{true};
    bool enable_file{true};
    bool enable_audit_log{true};

    // rotation of pii_sanitizer.log
    std::size_t max_file_size_mb{100};
    std::size_t max_files{10};

    bool async_mode{true};
    std::size_t buffer_size{8192};
};

/**
 * @brief One line of audit.json
 *
 * Field order is preserved. Values are escaped when the line is rendered.
 */
class audit_record {
public:
    audit_record(std::string event_type, bool success)
        : event_type_(std::move(event_type)), success_(success) {}

    auto add(std::string key, std::string value) -> audit_record& {
        fields_.emplace_back(std::move(key), std::move(value));
        return *this;
    }

    auto add(std::string key, std::size_t value) -> audit_record& {
        return add(std::move(key), std::to_string(value));
    }

    /// Renders the record as a single JSON object followed by '\n'.
    [[nodiscard]] auto to_json_line(std::string_view timestamp) const -> std::string;

private:
    std::string event_type_;
    bool success_;
    std::vector<std::pair<std::string, std::string>> fields_;
};

/**
 * @brief Process wide logging facade
 *
 * Every call is a no-op until initialize(), so embedding the library
 * without configuring logging costs nothing. All methods are thread-safe.
 */
class logger_adapter {
public:
    static void initialize(const logger_config& config);
    static void shutdown();
    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(pii::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, pii::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(pii::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, pii::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(pii::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, pii::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(pii::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, pii::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(pii::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, pii::compat::format(fmt, std::forward<Args>(args)...));
    }

    static void log(log_level level, const std::string& message);
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;
    static void flush();

    static void set_min_level(log_level level);
    [[nodiscard]] static auto get_min_level() noexcept -> log_level;
    [[nodiscard]] static auto get_config() -> const logger_config&;

    // Engine events. Each writes a log message and an audit record.

    /// DETECTION: resolved span totals, one "count.<CATEGORY>" field per category.
    static void log_detection_completed(
        std::size_t text_length,
        std::size_t span_count,
        const std::map<std::string, std::size_t>& category_counts);

    /// SANITIZATION: policy name plus input and output lengths.
    static void log_sanitization_completed(std::string_view policy,
                                           std::size_t text_length,
                                           std::size_t output_length,
                                           std::size_t span_count);

    /// DETECTOR_DEGRADED: a detector was skipped for this call.
    static void log_detector_degraded(std::string_view detector,
                                      std::string_view reason);

    /// SPAN_DROPPED: a candidate failed validation before resolution.
    static void log_span_dropped(std::string_view source,
                                 std::string_view category,
                                 std::size_t start,
                                 std::size_t end,
                                 std::string_view reason);

    static void write_audit(const audit_record& record);

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace pii::integration
