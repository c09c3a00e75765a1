// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/fastdrop/config/feature_flags.h>

#include <algorithm>
#include <atomic>
#include <chrono>
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

#if FASTDROP_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::fastdrop {

/**
 * @brief Log categories for fastdrop
 */
struct log_category {
    static constexpr std::string_view sender = "fastdrop.sender";
    static constexpr std::string_view receiver = "fastdrop.receiver";
    static constexpr std::string_view discovery = "fastdrop.discovery";
    static constexpr std::string_view ticket = "fastdrop.ticket";
    static constexpr std::string_view codec = "fastdrop.codec";
    static constexpr std::string_view transfer = "fastdrop.transfer";
    static constexpr std::string_view session = "fastdrop.session";
};

/**
 * @brief Log levels for fastdrop
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

/**
 * @brief Configuration for sensitive information masking
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_addresses = false;
    bool mask_filenames = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, false, '*', 4};
    }
};

/**
 * @brief Masks IP addresses, paths and file names in log output
 *
 * Addresses embedded in multiaddrs ("/ip4/10.0.0.7/udp/4001/quic-v1") keep
 * their structure; only the host octets before the last one are replaced.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths && !config_.mask_addresses) {
            return input;
        }

        std::string result = input;
        if (config_.mask_addresses) {
            result = replace_all(result, ip_pattern(),
                                 [this](const std::string& ip) { return mask_ip(ip); });
        }
        if (config_.mask_paths) {
            result = replace_all(result, path_pattern(),
                                 [this](const std::string& p) { return mask_path(p); });
        }
        return result;
    }

    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return mask_filename(path);
        }

        std::string filename = path.substr(last_sep + 1);
        if (config_.mask_filenames) {
            filename = mask_filename(filename);
        }
        return std::string(last_sep, config_.mask_char) + "/" + filename;
    }

    [[nodiscard]] auto mask_ip(const std::string& ip) const -> std::string {
        if (!config_.mask_addresses || ip.empty()) {
            return ip;
        }

        auto last_dot = ip.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(ip.size(), config_.mask_char);
        }
        return std::string(last_dot, config_.mask_char) + ip.substr(last_dot);
    }

    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (filename.size() <= config_.visible_chars) {
            return filename;
        }

        auto dot_pos = filename.find_last_of('.');
        std::string name = filename;
        std::string ext;
        if (dot_pos != std::string::npos && dot_pos > 0) {
            name = filename.substr(0, dot_pos);
            ext = filename.substr(dot_pos);
        }
        if (name.size() <= config_.visible_chars) {
            return filename;
        }
        return name.substr(0, config_.visible_chars) +
               std::string(name.size() - config_.visible_chars, config_.mask_char) + ext;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    static auto ip_pattern() -> const std::regex& {
        static const std::regex pattern(R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
        return pattern;
    }

    // Multiaddrs start with a protocol component and are left to mask_ip.
    static auto path_pattern() -> const std::regex& {
        static const std::regex pattern(
            R"((?:\/(?!ip4\/|ip6\/|udp\/|tcp\/|quic)[a-zA-Z0-9._-]+)+)");
        return pattern;
    }

    template <typename Fn>
    static auto replace_all(const std::string& input, const std::regex& pattern, Fn&& fn)
        -> std::string {
        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, static_cast<size_t>(it->position()) - last_pos);
            result += fn(it->str());
            last_pos = static_cast<size_t>(it->position() + it->length());
        }
        result += input.substr(last_pos);
        return result;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
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

inline auto format_timestamp(bool utc, const char* pattern) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    if (utc) gmtime_s(&tm_buf, &time_t_val); else localtime_s(&tm_buf, &time_t_val);
#else
    if (utc) gmtime_r(&time_t_val, &tm_buf); else localtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, pattern)
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    if (utc) oss << 'Z';
    return oss.str();
}

}  // namespace detail

/**
 * @brief Structured log context for a peer session
 */
struct transfer_log_context {
    std::string peer;
    std::string filename;
    std::optional<uint64_t> file_index;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> chunk_number;
    std::optional<uint64_t> total_chunks;
    std::optional<uint64_t> request_id;
    std::optional<double> progress_percent;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> transport;
    std::optional<std::string> address;
    std::optional<std::string> state;
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
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!peer.empty()) add_field("peer", peer);
        if (!filename.empty()) {
            add_field("filename", masker ? masker->mask_path(filename) : filename);
        }
        if (file_index) add_uint("file_index", *file_index);
        if (file_size) add_uint("size", *file_size);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (chunk_number) add_uint("chunk_number", *chunk_number);
        if (total_chunks) add_uint("total_chunks", *total_chunks);
        if (request_id) add_uint("request_id", *request_id);
        if (progress_percent) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2)
                << "\"progress_percent\":" << *progress_percent;
            first = false;
        }
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (transport) add_field("transport", *transport);
        if (address) add_field("address", masker ? masker->mask(*address) : *address);
        if (state) add_field("state", *state);
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
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
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
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON format for structured logging
};

/**
 * @brief fastdrop logging front end
 *
 * Forwards to logger_system when it is linked in, otherwise writes to stderr.
 */
class fastdrop_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    fastdrop_logger() = default;
    ~fastdrop_logger() = default;

    fastdrop_logger(const fastdrop_logger&) = delete;
    fastdrop_logger& operator=(const fastdrop_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called by the sender and receiver builders.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if FASTDROP_USE_LOGGER_SYSTEM
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
#if FASTDROP_USE_LOGGER_SYSTEM
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
#if FASTDROP_USE_LOGGER_SYSTEM
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
     * @brief Observe every record that passes the level filter
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
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
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string line_text;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = detail::format_timestamp(true, "%Y-%m-%dT%H:%M:%S");
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;
            line_text = entry.to_json_with_masking(&masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            line_text = oss.str();
        }

        emit(level, line_text, format == log_output_format::text, file, line, function);
    }

    void flush() {
#if FASTDROP_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(log_level level,
              const std::string& text,
              bool prefix_text,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#if FASTDROP_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), text);
            }
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        if (prefix_text) {
            std::cerr << detail::format_timestamp(false, "%Y-%m-%d %H:%M:%S")
                      << " [" << log_level_to_string(level) << "] ";
        }
        std::cerr << text << "\n";
    }

#if FASTDROP_USE_LOGGER_SYSTEM
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
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline fastdrop_logger& get_logger() {
    static fastdrop_logger instance;
    return instance;
}

#define FD_LOG(level, category, message) \
    kcenon::fastdrop::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FD_LOG_CTX(level, category, message, context) \
    kcenon::fastdrop::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define FD_LOG_TRACE(category, message) \
    FD_LOG(kcenon::fastdrop::log_level::trace, category, message)

#define FD_LOG_DEBUG(category, message) \
    FD_LOG(kcenon::fastdrop::log_level::debug, category, message)

#define FD_LOG_INFO(category, message) \
    FD_LOG(kcenon::fastdrop::log_level::info, category, message)

#define FD_LOG_WARN(category, message) \
    FD_LOG(kcenon::fastdrop::log_level::warn, category, message)

#define FD_LOG_ERROR(category, message) \
    FD_LOG(kcenon::fastdrop::log_level::error, category, message)

#define FD_LOG_FATAL(category, message) \
    FD_LOG(kcenon::fastdrop::log_level::fatal, category, message)

#define FD_LOG_DEBUG_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::fastdrop::log_level::debug, category, message, ctx)

#define FD_LOG_INFO_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::fastdrop::log_level::info, category, message, ctx)

#define FD_LOG_WARN_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::fastdrop::log_level::warn, category, message, ctx)

#define FD_LOG_ERROR_CTX(category, message, ctx) \
    FD_LOG_CTX(kcenon::fastdrop::log_level::error, category, message, ctx)

}  // namespace kcenon::fastdrop
