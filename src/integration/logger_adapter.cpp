/**
 * @file logger_adapter.cpp
 * @brief logger_system backed implementation of logger_adapter
 *
 * @copyright Copyright (c) 2025
 */

#include <pii/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace pii::integration {

namespace {

constexpr const char* log_file_name = "pii_sanitizer.log";
constexpr const char* audit_file_name = "audit.json";

auto to_backend(log_level level) -> kcenon::logger::log_level {
    using backend = kcenon::logger::log_level;
    switch (level) {
        case log_level::trace: return backend::trace;
        case log_level::debug: return backend::debug;
        case log_level::info:  return backend::info;
        case log_level::warn:  return backend::warn;
        case log_level::error: return backend::error;
        case log_level::fatal: return backend::fatal;
        case log_level::off:   break;
    }
    return backend::off;
}

auto utc_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    return pii::compat::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                               utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                               utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

void append_json_string(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += pii::compat::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

}  // namespace

auto audit_record::to_json_line(std::string_view timestamp) const -> std::string {
    std::string line = "{\"timestamp\":";
    append_json_string(line, timestamp);
    line += ",\"event_type\":";
    append_json_string(line, event_type_);
    line += ",\"outcome\":";
    append_json_string(line, success_ ? "success" : "failure");
    for (const auto& [key, value] : fields_) {
        line += ',';
        append_json_string(line, key);
        line += ':';
        append_json_string(line, value);
    }
    line += "}\n";
    return line;
}

class logger_adapter::impl {
public:
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_ = config.min_level;

        if (config.enable_file || config.enable_audit_log) {
            std::filesystem::create_directories(config.log_directory);
        }

        backend_ = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                            config.buffer_size);
        backend_->set_min_level(to_backend(config.min_level));
        if (config.enable_console) {
            backend_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config.enable_file) {
            backend_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config.log_directory / log_file_name).string(),
                config.max_file_size_mb * 1024 * 1024, config.max_files));
        }
        backend_->start();

        if (config.enable_audit_log) {
            std::lock_guard audit_lock(audit_mutex_);
            audit_.open(config.log_directory / audit_file_name, std::ios::app);
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            return;
        }
        initialized_ = false;

        if (backend_) {
            backend_->flush();
            backend_->stop();
            backend_.reset();
        }

        std::lock_guard audit_lock(audit_mutex_);
        if (audit_.is_open()) {
            audit_.close();
        }
    }

    [[nodiscard]] auto initialized() const noexcept -> bool { return initialized_; }

    void log(log_level level, const std::string& message) {
        if (initialized_ && backend_ && enabled(level)) {
            backend_->log(to_backend(level), message);
        }
    }

    [[nodiscard]] auto enabled(log_level level) const noexcept -> bool {
        return level >= min_level_.load();
    }

    void flush() {
        if (backend_) {
            backend_->flush();
        }
        std::lock_guard audit_lock(audit_mutex_);
        if (audit_.is_open()) {
            audit_.flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_ = level;
        if (backend_) {
            backend_->set_min_level(to_backend(level));
        }
    }

    [[nodiscard]] auto min_level() const noexcept -> log_level { return min_level_; }
    [[nodiscard]] auto config() const -> const logger_config& { return config_; }

    void write(const audit_record& record) {
        if (!initialized_) {
            return;
        }
        auto line = record.to_json_line(utc_timestamp());

        std::lock_guard audit_lock(audit_mutex_);
        if (audit_.is_open()) {
            audit_ << line;
            audit_.flush();
        }
    }

private:
    std::mutex mutex_;
    std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> backend_;
    std::ofstream audit_;
};

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

void logger_adapter::initialize(const logger_config& config) { pimpl_->initialize(config); }
void logger_adapter::shutdown() { pimpl_->shutdown(); }
auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->initialized(); }

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }
void logger_adapter::set_min_level(log_level level) { pimpl_->set_min_level(level); }
auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->min_level(); }
auto logger_adapter::get_config() -> const logger_config& { return pimpl_->config(); }
void logger_adapter::write_audit(const audit_record& record) { pimpl_->write(record); }

void logger_adapter::log_detection_completed(
    std::size_t text_length,
    std::size_t span_count,
    const std::map<std::string, std::size_t>& category_counts) {
    debug("detection: {} spans in {} bytes", span_count, text_length);

    audit_record record("DETECTION", true);
    record.add("text_length", text_length).add("span_count", span_count);
    for (const auto& [category, count] : category_counts) {
        record.add("count." + category, count);
    }
    write_audit(record);
}

void logger_adapter::log_sanitization_completed(std::string_view policy,
                                                std::size_t text_length,
                                                std::size_t output_length,
                                                std::size_t span_count) {
    info("sanitized {} spans with policy {} ({} -> {} bytes)",
         span_count, policy, text_length, output_length);

    write_audit(audit_record("SANITIZATION", true)
                    .add("policy", std::string(policy))
                    .add("text_length", text_length)
                    .add("output_length", output_length)
                    .add("span_count", span_count));
}

void logger_adapter::log_detector_degraded(std::string_view detector,
                                           std::string_view reason) {
    warn("detector {} skipped: {}", detector, reason);

    write_audit(audit_record("DETECTOR_DEGRADED", false)
                    .add("detector", std::string(detector))
                    .add("reason", std::string(reason)));
}

void logger_adapter::log_span_dropped(std::string_view source,
                                      std::string_view category,
                                      std::size_t start,
                                      std::size_t end,
                                      std::string_view reason) {
    warn("dropped {} span from {} at [{}, {}): {}", category, source, start, end, reason);

    write_audit(audit_record("SPAN_DROPPED", false)
                    .add("source", std::string(source))
                    .add("category", std::string(category))
                    .add("start", start)
                    .add("end", end)
                    .add("reason", std::string(reason)));
}

}  // namespace pii::integration
