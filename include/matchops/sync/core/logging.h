// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <matchops/sync/config/feature_flags.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#if MATCHOPS_SYNC_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace matchops::sync {

/**
 * @brief Log categories for the sync core
 */
struct log_category {
    static constexpr std::string_view lock = "matchops_sync.lock";
    static constexpr std::string_view checkpoint = "matchops_sync.checkpoint";
    static constexpr std::string_view progress = "matchops_sync.progress";
    static constexpr std::string_view engine = "matchops_sync.engine";
    static constexpr std::string_view control = "matchops_sync.control";
    static constexpr std::string_view storage = "matchops_sync.storage";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_log_string(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

/**
 * @brief Wall-clock time with millisecond precision
 * @param utc ISO-8601 in UTC when true, local "YYYY-MM-DD HH:MM:SS.mmm" otherwise
 */
inline auto format_timestamp(std::chrono::system_clock::time_point at, bool utc) -> std::string {
    auto seconds = std::chrono::system_clock::to_time_t(at);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        at.time_since_epoch()).count() % 1000;

    std::tm parts{};
#if defined(_WIN32)
    if (utc) gmtime_s(&parts, &seconds); else localtime_s(&parts, &seconds);
#else
    if (utc) gmtime_r(&seconds, &parts); else localtime_r(&seconds, &parts);
#endif

    std::ostringstream oss;
    oss << std::put_time(&parts, utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    if (utc) oss << 'Z';
    return oss.str();
}

}  // namespace detail

/**
 * @brief Structured log context for lock and migration operations
 */
struct migration_log_context {
    std::string session_id;
    std::string phase;
    std::string resource;
    std::optional<uint64_t> items_processed;
    std::optional<uint64_t> total_items;
    std::optional<double> progress_percent;
    std::optional<double> items_per_second;
    std::optional<uint64_t> duration_ms;
    std::optional<uint32_t> attempt;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, std::string_view value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_log_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!session_id.empty()) add_field("session_id", session_id);
        if (!phase.empty()) add_field("phase", phase);
        if (!resource.empty()) add_field("resource", resource);
        if (items_processed) add_uint("items_processed", *items_processed);
        if (total_items) add_uint("total_items", *total_items);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (items_per_second) add_double("items_per_second", *items_per_second);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (attempt) add_uint("attempt", *attempt);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<migration_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_log_string(message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\""
                << detail::escape_log_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

class sync_logger;

sync_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief Logger shared by the lock manager, checkpoint store and migration engine
 *
 * Records go to logger_system when it is linked in, otherwise to stderr.
 * Callbacks observe every record regardless of the sink.
 */
class sync_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const migration_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    sync_logger() = default;
    ~sync_logger() = default;

    sync_logger(const sync_logger&) = delete;
    sync_logger& operator=(const sync_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; later calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if MATCHOPS_SYNC_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if MATCHOPS_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if MATCHOPS_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Silence the default sink; callbacks still fire
     */
    void set_sink_enabled(bool enabled) { sink_enabled_.store(enabled); }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const migration_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (get_output_format() == log_output_format::json) {
            log_json(level, category, message, context, file, line, function);
        } else {
            log_text(level, category, message, context, file, line, function);
        }
    }

    void flush() {
#if MATCHOPS_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void log_json(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const migration_log_context* context,
                  const char* file,
                  int line,
                  const char* function) {
        structured_log_entry entry;
        entry.timestamp = detail::format_timestamp(std::chrono::system_clock::now(), true);
        entry.level = level;
        entry.category = std::string(category);
        entry.message = std::string(message);
        if (context) entry.context = *context;
        if (file) entry.source_file = file;
        if (line > 0) entry.source_line = line;
        if (function) entry.function_name = function;

        std::string json_str = entry.to_json();

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

        if (!sink_enabled_.load()) return;

#if MATCHOPS_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), json_str, file, line, function);
            } else {
                logger_->log(to_logger_level(level), json_str);
            }
            return;
        }
#endif
        output_to_stderr(json_str);
    }

    void log_text(log_level level,
                  std::string_view category,
                  std::string_view message,
                  const migration_log_context* context,
                  [[maybe_unused]] const char* file,
                  [[maybe_unused]] int line,
                  [[maybe_unused]] const char* function) {
        if (!sink_enabled_.load()) return;

#if MATCHOPS_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            std::ostringstream msg;
            msg << "[" << category << "] " << message;
            if (context) {
                msg << " " << context->to_json();
            }
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), msg.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), msg.str());
            }
            return;
        }
#endif
        std::ostringstream oss;
        oss << detail::format_timestamp(std::chrono::system_clock::now(), false)
            << " [" << log_level_to_string(level) << "] [" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        output_to_stderr(oss.str());
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if MATCHOPS_SYNC_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> sink_enabled_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

inline sync_logger& get_logger() {
    static sync_logger instance;
    return instance;
}

#define MS_LOG(level, category, message) \
    matchops::sync::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define MS_LOG_CTX(level, category, message, context) \
    matchops::sync::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define MS_LOG_TRACE(category, message) \
    MS_LOG(matchops::sync::log_level::trace, category, message)

#define MS_LOG_DEBUG(category, message) \
    MS_LOG(matchops::sync::log_level::debug, category, message)

#define MS_LOG_INFO(category, message) \
    MS_LOG(matchops::sync::log_level::info, category, message)

#define MS_LOG_WARN(category, message) \
    MS_LOG(matchops::sync::log_level::warn, category, message)

#define MS_LOG_ERROR(category, message) \
    MS_LOG(matchops::sync::log_level::error, category, message)

#define MS_LOG_FATAL(category, message) \
    MS_LOG(matchops::sync::log_level::fatal, category, message)

#define MS_LOG_DEBUG_CTX(category, message, ctx) \
    MS_LOG_CTX(matchops::sync::log_level::debug, category, message, ctx)

#define MS_LOG_INFO_CTX(category, message, ctx) \
    MS_LOG_CTX(matchops::sync::log_level::info, category, message, ctx)

#define MS_LOG_WARN_CTX(category, message, ctx) \
    MS_LOG_CTX(matchops::sync::log_level::warn, category, message, ctx)

#define MS_LOG_ERROR_CTX(category, message, ctx) \
    MS_LOG_CTX(matchops::sync::log_level::error, category, message, ctx)

} // namespace matchops::sync
