// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for deck_bridge
 *
 * Messages go to kcenon::logger when deck_bridge is built with logger_system
 * and common_system, otherwise to stderr. Both text and JSON output formats
 * are supported, and device addresses and filesystem paths can be masked.
 */

#pragma once

#include <algorithm>
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
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/deck_bridge/config/feature_flags.h"

#if DECK_BRIDGE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::deck_bridge {

/**
 * @brief Log categories, one per engine component
 */
struct log_category {
    static constexpr std::string_view discovery = "deck_bridge.discovery";
    static constexpr std::string_view connection = "deck_bridge.connection";
    static constexpr std::string_view transfer = "deck_bridge.transfer";
    static constexpr std::string_view channel = "deck_bridge.channel";
    static constexpr std::string_view config = "deck_bridge.config";
    static constexpr std::string_view events = "deck_bridge.events";
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

inline auto escape_json(std::string_view input) -> std::string {
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
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
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
 * @brief Which kinds of sensitive values are masked in log output
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_addresses = false;
    char mask_char = '*';

    static masking_config all_masked() { return {true, true, '*'}; }
    static masking_config none() { return {false, false, '*'}; }
};

/**
 * @brief Masks IPv4 addresses and absolute paths in log messages
 *
 * Addresses keep their last octet, so 192.168.1.42 becomes "*********.42".
 * Paths keep their final component, so /home/deck/game.iso is shown as ten
 * mask characters followed by "/game.iso".
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;
        if (config_.mask_addresses) {
            result = replace_all(result, address_pattern(),
                                 [this](const std::string& s) { return mask_address(s); });
        }
        if (config_.mask_paths) {
            result = replace_all(result, path_pattern(),
                                 [this](const std::string& s) { return mask_path(s); });
        }
        return result;
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of('/');
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char) + path.substr(last_sep);
    }

    [[nodiscard]] auto mask_address(const std::string& address) const -> std::string {
        if (!config_.mask_addresses || address.empty()) {
            return address;
        }
        auto last_dot = address.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(address.size(), config_.mask_char);
        }
        return std::string(last_dot, config_.mask_char) + address.substr(last_dot);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    static auto address_pattern() -> const std::regex& {
        static const std::regex pattern(R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
        return pattern;
    }

    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");
        return pattern;
    }

    template <typename Fn>
    static auto replace_all(const std::string& input, const std::regex& pattern, Fn fn)
        -> std::string {
        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += fn(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);
        return result;
    }

    masking_config config_;
};

/**
 * @brief Structured fields attached to a log message
 */
struct bridge_log_context {
    std::optional<uint64_t> job_id;
    std::string device_host;
    std::string device_address;
    std::string path;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> total_bytes;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> delay_ms;
    std::optional<double> rate_mbps;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (job_id) add_uint("job_id", *job_id);
        if (!device_host.empty()) add_field("host", device_host);
        if (!device_address.empty()) {
            add_field("address", masker ? masker->mask_address(device_address) : device_address);
        }
        if (!path.empty()) {
            add_field("path", masker ? masker->mask_path(path) : path);
        }
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (attempt) add_uint("attempt", *attempt);
        if (delay_ms) add_uint("delay_ms", *delay_ms);
        if (rate_mbps) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2) << "\"rate_mbps\":" << *rate_mbps;
            first = false;
        }
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

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
    std::optional<bridge_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string { return to_json_with_masking(nullptr); }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"message\":\"" << detail::escape_json(masker ? masker->mask(message) : message)
            << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
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
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::transfer)
 *     .with_message("Upload completed")
 *     .with_job_id(7)
 *     .with_path("/home/deck/roms/game.iso")
 *     .with_bytes_transferred(1048576)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() { entry_.timestamp = iso8601_timestamp(); }

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

    auto with_job_id(uint64_t id) -> log_entry_builder& {
        ensure_context().job_id = id;
        return *this;
    }

    auto with_device(std::string_view host, std::string_view address) -> log_entry_builder& {
        auto& ctx = ensure_context();
        ctx.device_host = std::string(host);
        ctx.device_address = std::string(address);
        return *this;
    }

    auto with_path(std::string_view path) -> log_entry_builder& {
        ensure_context().path = std::string(path);
        return *this;
    }

    auto with_bytes_transferred(uint64_t bytes) -> log_entry_builder& {
        ensure_context().bytes_transferred = bytes;
        return *this;
    }

    auto with_total_bytes(uint64_t bytes) -> log_entry_builder& {
        ensure_context().total_bytes = bytes;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        ensure_context().attempt = attempt;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context().error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const bridge_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry { return entry_; }

    [[nodiscard]] auto build_json() const -> std::string { return entry_.to_json(); }

private:
    auto ensure_context() -> bridge_log_context& {
        if (!entry_.context) {
            entry_.context = bridge_log_context{};
        }
        return *entry_.context;
    }

    [[nodiscard]] static auto iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

enum class log_output_format {
    text,   ///< Single line: timestamp [LEVEL] [category] message {context}
    json    ///< One JSON object per line
};

/**
 * @brief deck_bridge logging facade
 */
class deck_bridge_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const bridge_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    deck_bridge_logger() = default;
    ~deck_bridge_logger() = default;

    deck_bridge_logger(const deck_bridge_logger&) = delete;
    deck_bridge_logger& operator=(const deck_bridge_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops. The engine
     * components call this on construction.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if DECK_BRIDGE_USE_LOGGER_SYSTEM
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
#if DECK_BRIDGE_USE_LOGGER_SYSTEM
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
#if DECK_BRIDGE_USE_LOGGER_SYSTEM
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

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Install a callback that sees every enabled message
     *
     * Passing an empty function removes the callback.
     */
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
             const bridge_log_context* context = nullptr,
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

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
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
            write_entry(builder.build(), current_masker);
        } else {
            write_text(level, category, message, context, current_masker);
        }
    }

    void log(const structured_log_entry& entry) {
        if (!is_enabled(entry.level)) return;

        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            current_masker = masker_;
        }
        write_entry(entry, current_masker);
    }

    void flush() {
#if DECK_BRIDGE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write_entry(const structured_log_entry& entry, const sensitive_info_masker& masker) {
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

        emit(entry.level, json_str);
    }

    void write_text(log_level level,
                    std::string_view category,
                    std::string_view message,
                    const bridge_log_context* context,
                    const sensitive_info_masker& masker) {
        std::ostringstream oss;
#if !DECK_BRIDGE_USE_LOGGER_SYSTEM
        oss << local_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        emit(level, oss.str());
    }

    void emit([[maybe_unused]] log_level level, const std::string& line) {
#if DECK_BRIDGE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), line);
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << "\n";
    }

#if DECK_BRIDGE_USE_LOGGER_SYSTEM
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

    static auto local_timestamp() -> std::string {
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
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline deck_bridge_logger& get_logger() {
    static deck_bridge_logger instance;
    return instance;
}

#define DB_LOG(level, category, message) \
    kcenon::deck_bridge::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define DB_LOG_CTX(level, category, message, context) \
    kcenon::deck_bridge::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define DB_LOG_TRACE(category, message) \
    DB_LOG(kcenon::deck_bridge::log_level::trace, category, message)

#define DB_LOG_DEBUG(category, message) \
    DB_LOG(kcenon::deck_bridge::log_level::debug, category, message)

#define DB_LOG_INFO(category, message) \
    DB_LOG(kcenon::deck_bridge::log_level::info, category, message)

#define DB_LOG_WARN(category, message) \
    DB_LOG(kcenon::deck_bridge::log_level::warn, category, message)

#define DB_LOG_ERROR(category, message) \
    DB_LOG(kcenon::deck_bridge::log_level::error, category, message)

#define DB_LOG_DEBUG_CTX(category, message, ctx) \
    DB_LOG_CTX(kcenon::deck_bridge::log_level::debug, category, message, ctx)

#define DB_LOG_INFO_CTX(category, message, ctx) \
    DB_LOG_CTX(kcenon::deck_bridge::log_level::info, category, message, ctx)

#define DB_LOG_WARN_CTX(category, message, ctx) \
    DB_LOG_CTX(kcenon::deck_bridge::log_level::warn, category, message, ctx)

#define DB_LOG_ERROR_CTX(category, message, ctx) \
    DB_LOG_CTX(kcenon::deck_bridge::log_level::error, category, message, ctx)

}  // namespace kcenon::deck_bridge
