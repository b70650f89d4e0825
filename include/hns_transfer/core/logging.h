// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <optional>
#include <memory>
#include <functional>
#include <sstream>
#include <iomanip>
#include <atomic>
#include <mutex>
#include <iostream>
#include <regex>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define HNS_TRANSFER_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace hns_transfer {

/**
 * @brief Log categories for the sender
 */
struct log_category {
    static constexpr std::string_view sender = "hns_transfer.sender";
    static constexpr std::string_view prologue = "hns_transfer.prologue";
    static constexpr std::string_view cleanup = "hns_transfer.cleanup";
    static constexpr std::string_view resolver = "hns_transfer.resolver";
    static constexpr std::string_view planner = "hns_transfer.planner";
    static constexpr std::string_view tracker = "hns_transfer.tracker";
    static constexpr std::string_view source = "hns_transfer.source";
};

/**
 * @brief Log levels
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
    bool mask_sas_tokens = true;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    /**
     * @brief Create config with all masking enabled
     */
    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    /**
     * @brief Create config with no masking
     */
    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks local paths and SAS signatures in log messages
 *
 * Destination URLs may carry a SAS token in their query string; its
 * signature ("sig=") is a credential and is replaced with REDACTED.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Mask sensitive information in a string
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths && !config_.mask_sas_tokens) {
            return input;
        }

        std::string result = input;

        if (config_.mask_sas_tokens) {
            result = mask_sas_signatures(result);
        }

        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }

        return result;
    }

    /**
     * @brief Mask a file path, keeping a prefix of the file name visible
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return mask_filename(path);
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + "/" + mask_filename(path.substr(last_sep + 1));
    }

    /**
     * @brief Redact the signature of a SAS-bearing URL
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_sas_tokens || url.empty()) {
            return url;
        }
        return mask_sas_signatures(url);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (filename.size() <= config_.visible_chars) {
            return filename;
        }

        auto dot_pos = filename.find_last_of('.');
        if (dot_pos != std::string::npos && dot_pos > 0) {
            std::string name = filename.substr(0, dot_pos);
            std::string ext = filename.substr(dot_pos);

            if (name.size() <= config_.visible_chars) {
                return filename;
            }

            std::string visible = name.substr(0, config_.visible_chars);
            std::string masked(name.size() - config_.visible_chars, config_.mask_char[0]);
            return visible + masked + ext;
        }

        std::string visible = filename.substr(0, config_.visible_chars);
        std::string masked(filename.size() - config_.visible_chars, config_.mask_char[0]);
        return visible + masked;
    }

    [[nodiscard]] static auto mask_sas_signatures(const std::string& input) -> std::string {
        static const std::regex sig_pattern(R"(([?&][Ss][Ii][Gg]=)[^&\s"]+)");
        return std::regex_replace(input, sig_pattern, "$1REDACTED");
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
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
 * @brief Structured log context for a single transfer
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string source;
    std::string destination;
    std::optional<uint64_t> source_size;
    std::optional<uint32_t> chunk_size;
    std::optional<uint64_t> num_chunks;
    std::optional<std::string> stage;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    /**
     * @brief Convert context to JSON string with optional masking
     */
    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
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

        if (!transfer_id.empty()) add_field("transfer_id", transfer_id);
        if (!source.empty()) {
            add_field("source", masker ? masker->mask_path(source) : source);
        }
        if (!destination.empty()) {
            add_field("destination", masker ? masker->mask_url(destination) : destination);
        }
        if (source_size) add_uint("source_size", *source_size);
        if (chunk_size) add_uint("chunk_size", *chunk_size);
        if (num_chunks) add_uint("num_chunks", *num_chunks);
        if (stage) add_field("stage", *stage);
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

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
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
            oss << ",\"source_location\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
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
 * auto json = log_entry_builder()
 *     .with_level(log_level::error)
 *     .with_category(log_category::cleanup)
 *     .with_message("error deleting the (incomplete) file")
 *     .with_destination("https://acct.dfs.core.windows.net/fs/dir/file.bin?sig=...")
 *     .build_json_masked(masker);
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

    auto with_destination(std::string_view destination) -> log_entry_builder& {
        ensure_context();
        entry_.context->destination = std::string(destination);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

    [[nodiscard]] auto build_json_masked(const sensitive_info_masker& masker) const -> std::string {
        return entry_.to_json_with_masking(&masker);
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

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
    json    ///< JSON format for structured logging
};

/**
 * @brief Process-wide logger for senders and trackers
 */
class transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;

    transfer_logger() = default;
    ~transfer_logger() = default;

    transfer_logger(const transfer_logger&) = delete;
    transfer_logger& operator=(const transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef HNS_TRANSFER_USE_LOGGER_SYSTEM
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
#ifdef HNS_TRANSFER_USE_LOGGER_SYSTEM
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
#ifdef HNS_TRANSFER_USE_LOGGER_SYSTEM
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
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Set custom log callback (called before output, unmasked)
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
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
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string output;
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
            output = builder.build_json_masked(current_masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << current_masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            output = oss.str();
        }

        write(level, output, format == log_output_format::text);
    }

private:
    void write(log_level level, const std::string& output, [[maybe_unused]] bool text) {
#ifdef HNS_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), output);
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        if (text) {
            std::cerr << get_timestamp() << " [" << log_level_to_string(level) << "] ";
        }
        std::cerr << output << "\n";
    }

#ifdef HNS_TRANSFER_USE_LOGGER_SYSTEM
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
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_{masking_config{}};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline transfer_logger& get_logger() {
    static transfer_logger instance;
    return instance;
}

// Logging macros for convenience
#define HT_LOG(level, category, message) \
    hns_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define HT_LOG_CTX(level, category, message, context) \
    hns_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define HT_LOG_TRACE(category, message) \
    HT_LOG(hns_transfer::log_level::trace, category, message)

#define HT_LOG_DEBUG(category, message) \
    HT_LOG(hns_transfer::log_level::debug, category, message)

#define HT_LOG_INFO(category, message) \
    HT_LOG(hns_transfer::log_level::info, category, message)

#define HT_LOG_WARN(category, message) \
    HT_LOG(hns_transfer::log_level::warn, category, message)

#define HT_LOG_ERROR(category, message) \
    HT_LOG(hns_transfer::log_level::error, category, message)

#define HT_LOG_DEBUG_CTX(category, message, ctx) \
    HT_LOG_CTX(hns_transfer::log_level::debug, category, message, ctx)

#define HT_LOG_INFO_CTX(category, message, ctx) \
    HT_LOG_CTX(hns_transfer::log_level::info, category, message, ctx)

#define HT_LOG_WARN_CTX(category, message, ctx) \
    HT_LOG_CTX(hns_transfer::log_level::warn, category, message, ctx)

#define HT_LOG_ERROR_CTX(category, message, ctx) \
    HT_LOG_CTX(hns_transfer::log_level::error, category, message, ctx)

} // namespace hns_transfer
