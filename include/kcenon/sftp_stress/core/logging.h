// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
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

#include "kcenon/sftp_stress/config/feature_flags.h"

#if SFTP_STRESS_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::sftp_stress {

/**
 * @brief Log categories for the stress harness
 */
struct log_category {
    static constexpr std::string_view payload = "sftp_stress.payload";
    static constexpr std::string_view session = "sftp_stress.session";
    static constexpr std::string_view scheduler = "sftp_stress.scheduler";
    static constexpr std::string_view orchestrator = "sftp_stress.orchestrator";
    static constexpr std::string_view config = "sftp_stress.config";
    static constexpr std::string_view key = "sftp_stress.key";
    static constexpr std::string_view report = "sftp_stress.report";
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
 * @brief Parse a level name ("trace".."fatal", case-insensitive)
 */
inline std::optional<log_level> log_level_from_string(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace") return log_level::trace;
    if (lowered == "debug") return log_level::debug;
    if (lowered == "info") return log_level::info;
    if (lowered == "warn" || lowered == "warning") return log_level::warn;
    if (lowered == "error") return log_level::error;
    if (lowered == "fatal") return log_level::fatal;
    return std::nullopt;
}

/**
 * @brief Configuration for masking the target endpoint in log output
 */
struct masking_config {
    bool mask_hosts = false;
    bool mask_paths = false;
    char mask_char = '*';

    static masking_config all_masked() {
        return {true, true, '*'};
    }

    static masking_config none() {
        return {false, false, '*'};
    }
};

/**
 * @brief Masks host names/addresses and remote paths in log messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_hosts && !config_.mask_paths) {
            return input;
        }

        std::string result = input;
        if (config_.mask_hosts) {
            static const std::regex ip_pattern(
                R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
            result = replace_all(result, ip_pattern,
                                 [this](const std::string& m) { return mask_host(m); });
        }
        if (config_.mask_paths) {
            static const std::regex path_pattern(R"((?:\/[a-zA-Z0-9._-]+)+)");
            result = replace_all(result, path_pattern,
                                 [this](const std::string& m) { return mask_path(m); });
        }
        return result;
    }

    /**
     * @brief Keep only the last label of a host ("10.0.0.7" -> "******.7")
     */
    [[nodiscard]] auto mask_host(const std::string& host) const -> std::string {
        if (!config_.mask_hosts || host.empty()) {
            return host;
        }

        auto last_dot = host.find_last_of('.');
        if (last_dot == std::string::npos) {
            return std::string(host.size(), config_.mask_char);
        }
        return std::string(last_dot, config_.mask_char) + host.substr(last_dot);
    }

    /**
     * @brief Keep only the file name of a path
     */
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

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }

    void set_config(masking_config config) { config_ = config; }

private:
    template <typename Fn>
    static auto replace_all(const std::string& input, const std::regex& pattern, Fn&& fn)
        -> std::string {
        std::string output;
        std::sregex_iterator it(input.begin(), input.end(), pattern);
        std::sregex_iterator end;

        std::size_t last_pos = 0;
        for (; it != end; ++it) {
            output += input.substr(last_pos, static_cast<std::size_t>(it->position()) - last_pos);
            output += fn(it->str());
            last_pos = static_cast<std::size_t>(it->position() + it->length());
        }
        output += input.substr(last_pos);
        return output;
    }

    masking_config config_;
};

/**
 * @brief Structured context attached to a run log entry
 */
struct run_log_context {
    std::string artifact;
    std::optional<uint64_t> payload_bytes;
    std::optional<uint64_t> archive_bytes;
    std::optional<std::size_t> worker_slot;
    std::optional<double> connect_seconds;
    std::optional<double> transfer_seconds;
    std::optional<std::string> error_message;
    std::optional<std::string> host;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(3);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!artifact.empty()) add_field("artifact", artifact);
        if (payload_bytes) add_uint("payload_bytes", *payload_bytes);
        if (archive_bytes) add_uint("archive_bytes", *archive_bytes);
        if (worker_slot) add_uint("worker_slot", *worker_slot);
        if (connect_seconds) add_double("connect_s", *connect_seconds);
        if (transfer_seconds) add_double("transfer_s", *transfer_seconds);
        if (error_message) {
            add_field("error", masker ? masker->mask(*error_message) : *error_message);
        }
        if (host) {
            add_field("host", masker ? masker->mask_host(*host) : *host);
        }

        oss << "}";
        return oss.str();
    }

    static auto escape_json_string(const std::string& input) -> std::string {
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
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Timestamped single-line text
    json    ///< One JSON object per line
};

/**
 * @brief Logger for the stress harness
 *
 * Owned by the caller and handed to the engine through an event sink; there
 * is no process-wide instance.
 *
 * @code
 * auto logger = std::make_shared<stress_logger>();
 * logger->initialize();
 * logger->set_level(log_level::debug);
 * SS_LOG_INFO(*logger, log_category::orchestrator, "run started");
 * @endcode
 */
class stress_logger {
public:
    using log_callback =
        std::function<void(log_level, std::string_view, std::string_view, const run_log_context*)>;

    stress_logger() = default;
    ~stress_logger() { shutdown(); }

    stress_logger(const stress_logger&) = delete;
    stress_logger& operator=(const stress_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times - subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if SFTP_STRESS_USE_LOGGER_SYSTEM
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
#if SFTP_STRESS_USE_LOGGER_SYSTEM
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
#if SFTP_STRESS_USE_LOGGER_SYSTEM
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
     * @brief Observe every accepted entry (before formatting)
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
             const run_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
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

        std::string line_text = format == log_output_format::json
            ? format_json(level, category, message, context, masker)
            : format_text(category, message, context, masker);

#if SFTP_STRESS_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), line_text, file, line, function);
            } else {
                logger_->log(to_logger_level(level), line_text);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            line_text = get_timestamp() + " [" + std::string(log_level_to_string(level)) +
                        "] " + line_text;
        }
        output_to_stderr(line_text);
    }

    void flush() {
#if SFTP_STRESS_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
        std::cerr.flush();
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const run_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json(&masker);
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const run_log_context* context,
                            const sensitive_info_masker& masker) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_iso8601_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << run_log_context::escape_json_string(masker.mask(std::string(message))) << "\"";
        if (context) {
            std::string ctx_json = context->to_json(&masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

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

    static auto get_iso8601_timestamp() -> std::string {
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

#if SFTP_STRESS_USE_LOGGER_SYSTEM
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

// Logging macros; the logger instance is always passed explicitly
#define SS_LOG(logger, level, category, message) \
    (logger).log(level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define SS_LOG_CTX(logger, level, category, message, context) \
    (logger).log(level, category, message, &(context), __FILE__, __LINE__, __FUNCTION__)

#define SS_LOG_TRACE(logger, category, message) \
    SS_LOG(logger, kcenon::sftp_stress::log_level::trace, category, message)

#define SS_LOG_DEBUG(logger, category, message) \
    SS_LOG(logger, kcenon::sftp_stress::log_level::debug, category, message)

#define SS_LOG_INFO(logger, category, message) \
    SS_LOG(logger, kcenon::sftp_stress::log_level::info, category, message)

#define SS_LOG_WARN(logger, category, message) \
    SS_LOG(logger, kcenon::sftp_stress::log_level::warn, category, message)

#define SS_LOG_ERROR(logger, category, message) \
    SS_LOG(logger, kcenon::sftp_stress::log_level::error, category, message)

#define SS_LOG_INFO_CTX(logger, category, message, ctx) \
    SS_LOG_CTX(logger, kcenon::sftp_stress::log_level::info, category, message, ctx)

#define SS_LOG_ERROR_CTX(logger, category, message, ctx) \
    SS_LOG_CTX(logger, kcenon::sftp_stress::log_level::error, category, message, ctx)

} // namespace kcenon::sftp_stress
