// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include "kcenon/delta_fetch/config/feature_flags.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#if DELTA_FETCH_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::delta_fetch {

/**
 * @brief Log categories for delta_fetch
 */
struct log_category {
    static constexpr std::string_view session = "delta_fetch.session";
    static constexpr std::string_view planner = "delta_fetch.planner";
    static constexpr std::string_view fetcher = "delta_fetch.fetcher";
    static constexpr std::string_view checkpoint = "delta_fetch.checkpoint";
    static constexpr std::string_view scheduler = "delta_fetch.scheduler";
    static constexpr std::string_view archiver = "delta_fetch.archiver";
    static constexpr std::string_view events = "delta_fetch.events";
    static constexpr std::string_view coordinator = "delta_fetch.coordinator";
};

/**
 * @brief Log levels for delta_fetch
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
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
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured fields attached to a fetch log record
 */
struct fetch_log_context {
    std::string remote_path;
    std::string destination;
    std::optional<uint64_t> chunk_offset;
    std::optional<uint64_t> chunk_length;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> delay_ms;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> total_chunks;
    std::optional<std::string> outcome;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_log_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!remote_path.empty()) add_field("remote_path", remote_path);
        if (!destination.empty()) add_field("destination", destination);
        if (chunk_offset) add_uint("chunk_offset", *chunk_offset);
        if (chunk_length) add_uint("chunk_length", *chunk_length);
        if (attempt) add_uint("attempt", *attempt);
        if (delay_ms) add_uint("delay_ms", *delay_ms);
        if (bytes) add_uint("bytes", *bytes);
        if (total_chunks) add_uint("total_chunks", *total_chunks);
        if (outcome) add_field("outcome", *outcome);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log record
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<fetch_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    /**
     * @brief Convert to a single-line JSON object
     */
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
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_log_string(*source_file) << "\"";
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

/**
 * @brief Builder class for creating structured log entries
 *
 * Example usage:
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::warn)
 *     .with_category(log_category::fetcher)
 *     .with_message("Chunk fetch failed, retry scheduled")
 *     .with_remote_path("/docs/report.pdf")
 *     .with_chunk(1048576, 1048576)
 *     .with_attempt(2)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_remote_path(std::string_view path) -> log_entry_builder& {
        ensure_context();
        entry_.context->remote_path = std::string(path);
        return *this;
    }

    auto with_destination(std::string_view path) -> log_entry_builder& {
        ensure_context();
        entry_.context->destination = std::string(path);
        return *this;
    }

    /**
     * @brief Set the chunk range the record refers to
     */
    auto with_chunk(uint64_t offset, uint64_t length) -> log_entry_builder& {
        ensure_context();
        entry_.context->chunk_offset = offset;
        entry_.context->chunk_length = length;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        ensure_context();
        entry_.context->attempt = attempt;
        return *this;
    }

    auto with_bytes(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes = bytes;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    /**
     * @brief Set the source file location
     */
    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const fetch_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = fetch_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< One JSON object per line
};

/**
 * @brief Logger handle passed to every delta_fetch component
 *
 * There is no process-wide instance: the host creates one and hands a
 * shared_ptr to the coordinator, which shares it with the components it owns.
 * Records go to the logger_system backend when built with it, otherwise to
 * stderr, and additionally to an optional log file and callbacks.
 */
class fetch_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const fetch_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    fetch_logger() = default;
    explicit fetch_logger(log_level min_level) : min_level_(min_level) {}

    ~fetch_logger() { shutdown(); }

    fetch_logger(const fetch_logger&) = delete;
    fetch_logger& operator=(const fetch_logger&) = delete;

    /**
     * @brief Start the logging backend
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if DELTA_FETCH_USE_LOGGER_SYSTEM
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

    /**
     * @brief Flush and stop the backend, close the log file
     */
    void shutdown() {
#if DELTA_FETCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (file_.is_open()) {
            file_.flush();
            file_.close();
        }
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if DELTA_FETCH_USE_LOGGER_SYSTEM
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

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    /**
     * @brief Suppress the console (stderr) sink
     *
     * Callbacks and the log file still receive records.
     */
    void set_console_output(bool enabled) { console_enabled_.store(enabled); }

    /**
     * @brief Append every record to a file as well
     * @return false if the file could not be opened
     */
    auto open_log_file(const std::filesystem::path& path) -> bool {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (file_.is_open()) {
            file_.close();
        }
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

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

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const fetch_log_context* context = nullptr,
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
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            log(builder.build());
            return;
        }

        std::string text = format_text(level, category, message, context);
        emit(level, text);
    }

    /**
     * @brief Log a structured entry directly
     */
    void log(const structured_log_entry& entry) {
        if (!is_enabled(entry.level)) return;

        std::string json_str = entry.to_json();

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

        emit(entry.level, json_str);
    }

    void flush() {
#if DELTA_FETCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (file_.is_open()) {
            file_.flush();
        }
    }

private:
    void emit([[maybe_unused]] log_level level, const std::string& line) {
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            if (file_.is_open()) {
                file_ << line << "\n";
            }
        }

        if (!console_enabled_.load()) {
            return;
        }

#if DELTA_FETCH_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), line);
            return;
        }
#endif
        std::lock_guard<std::mutex> lock(sink_mutex_);
        std::cerr << line << "\n";
    }

    static auto format_text(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const fetch_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
            << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

#if DELTA_FETCH_USE_LOGGER_SYSTEM
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

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_enabled_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;

    std::ofstream file_;
    std::mutex sink_mutex_;
};

/**
 * @brief Logger that discards console output, for components built without one
 */
inline auto make_quiet_logger() -> std::shared_ptr<fetch_logger> {
    auto logger = std::make_shared<fetch_logger>(log_level::warn);
    logger->set_console_output(false);
    return logger;
}

// Logging macros; the first argument is a fetch_logger reference
#define DF_LOG(logger, level, category, message) \
    (logger).log(level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define DF_LOG_CTX(logger, level, category, message, context) \
    (logger).log(level, category, message, &(context), __FILE__, __LINE__, __FUNCTION__)

#define DF_LOG_TRACE(logger, category, message) \
    DF_LOG(logger, kcenon::delta_fetch::log_level::trace, category, message)

#define DF_LOG_DEBUG(logger, category, message) \
    DF_LOG(logger, kcenon::delta_fetch::log_level::debug, category, message)

#define DF_LOG_INFO(logger, category, message) \
    DF_LOG(logger, kcenon::delta_fetch::log_level::info, category, message)

#define DF_LOG_WARN(logger, category, message) \
    DF_LOG(logger, kcenon::delta_fetch::log_level::warn, category, message)

#define DF_LOG_ERROR(logger, category, message) \
    DF_LOG(logger, kcenon::delta_fetch::log_level::error, category, message)

#define DF_LOG_FATAL(logger, category, message) \
    DF_LOG(logger, kcenon::delta_fetch::log_level::fatal, category, message)

#define DF_LOG_DEBUG_CTX(logger, category, message, ctx) \
    DF_LOG_CTX(logger, kcenon::delta_fetch::log_level::debug, category, message, ctx)

#define DF_LOG_INFO_CTX(logger, category, message, ctx) \
    DF_LOG_CTX(logger, kcenon::delta_fetch::log_level::info, category, message, ctx)

#define DF_LOG_WARN_CTX(logger, category, message, ctx) \
    DF_LOG_CTX(logger, kcenon::delta_fetch::log_level::warn, category, message, ctx)

#define DF_LOG_ERROR_CTX(logger, category, message, ctx) \
    DF_LOG_CTX(logger, kcenon::delta_fetch::log_level::error, category, message, ctx)

} // namespace kcenon::delta_fetch
