// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "dx/transfer/config/feature_flags.h"

#if DX_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace dx::transfer {

/**
 * @brief Log categories for the transfer engine
 */
struct log_category {
    static constexpr std::string_view engine = "dx_transfer.engine";
    static constexpr std::string_view orchestrator = "dx_transfer.orchestrator";
    static constexpr std::string_view planner = "dx_transfer.planner";
    static constexpr std::string_view transport = "dx_transfer.transport";
    static constexpr std::string_view retry = "dx_transfer.retry";
    static constexpr std::string_view pool = "dx_transfer.pool";
    static constexpr std::string_view tracker = "dx_transfer.tracker";
    static constexpr std::string_view verifier = "dx_transfer.verifier";
    static constexpr std::string_view state = "dx_transfer.state";
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
[[nodiscard]] auto log_level_to_string(log_level level) -> std::string_view;

/**
 * @brief What the masker hides
 */
struct masking_config {
    bool mask_tokens = true;   ///< Session tokens and credentials
    bool mask_paths = false;   ///< Directories of local paths; file names stay
    char mask_char = '*';
    size_t visible_chars = 4;  ///< Token prefix kept, capped at half the token

    static auto all_masked() -> masking_config { return {true, true}; }
    static auto none() -> masking_config { return {false, false}; }
};

/**
 * @brief Masks session tokens and local paths in log output
 *
 * Tokens are recognised as the value following `token=` or `token:`
 * (any case, optional quotes).
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string;
    [[nodiscard]] auto mask_token(const std::string& token) const -> std::string;
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string;

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }
    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for one transfer job or chunk
 */
struct transfer_log_context {
    std::string job_id;
    std::string direction;
    std::string object_id;
    std::string local_path;
    std::optional<std::string> session_token;
    std::optional<uint64_t> total_size;
    std::optional<uint64_t> bytes_done;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<uint32_t> attempt;
    std::optional<std::string> error_kind;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

/**
 * @brief One rendered log record, as handed to the JSON callback
 */
struct structured_log_entry {
    std::string timestamp;  ///< UTC, millisecond precision, e.g. 2026-01-01T00:00:00.000Z
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    /**
     * @brief Entry stamped with the current time
     */
    [[nodiscard]] static auto stamped(log_level level, std::string_view category,
                                      std::string_view message) -> structured_log_entry;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Library logger
 *
 * Forwards to kcenon logger_system when built with it, and writes to
 * stderr otherwise. A user callback sees every message that passes the
 * level filter, regardless of the backend.
 */
class transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback =
        std::function<void(const structured_log_entry&, const std::string&)>;

    transfer_logger() = default;
    ~transfer_logger() = default;

    transfer_logger(const transfer_logger&) = delete;
    transfer_logger& operator=(const transfer_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times. Called by transfer_engine on construction.
     */
    void initialize();
    void shutdown();

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level);
    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format);
    [[nodiscard]] auto get_output_format() const -> log_output_format;

    void set_masking_config(masking_config config);
    [[nodiscard]] auto get_masking_config() const -> masking_config;

    /// Suppress the stderr fallback (callbacks still fire).
    void set_console_output(bool enabled) { console_output_.store(enabled); }

    void set_callback(log_callback callback);
    void set_json_callback(json_log_callback callback);

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr);

    void flush();

private:
    void emit(log_level level, const std::string& line,
              const char* file, int line_no, const char* function);

#if DX_TRANSFER_USE_LOGGER_SYSTEM
    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Process-wide logger used by the DXT_LOG macros
 */
auto get_logger() -> transfer_logger&;

// Messages below the logger's level are dropped before formatting
#define DXT_LOG(level, category, message) \
    ::dx::transfer::get_logger().log((level), (category), (message), nullptr, __FILE__, \
                                     __LINE__, __FUNCTION__)
#define DXT_LOG_CTX(level, category, message, context) \
    ::dx::transfer::get_logger().log((level), (category), (message), &(context), __FILE__, \
                                     __LINE__, __FUNCTION__)

#define DXT_LOG_TRACE(cat, msg) DXT_LOG(::dx::transfer::log_level::trace, cat, msg)
#define DXT_LOG_DEBUG(cat, msg) DXT_LOG(::dx::transfer::log_level::debug, cat, msg)
#define DXT_LOG_INFO(cat, msg) DXT_LOG(::dx::transfer::log_level::info, cat, msg)
#define DXT_LOG_WARN(cat, msg) DXT_LOG(::dx::transfer::log_level::warn, cat, msg)
#define DXT_LOG_ERROR(cat, msg) DXT_LOG(::dx::transfer::log_level::error, cat, msg)
#define DXT_LOG_FATAL(cat, msg) DXT_LOG(::dx::transfer::log_level::fatal, cat, msg)

#define DXT_LOG_DEBUG_CTX(cat, msg, ctx) DXT_LOG_CTX(::dx::transfer::log_level::debug, cat, msg, ctx)
#define DXT_LOG_INFO_CTX(cat, msg, ctx) DXT_LOG_CTX(::dx::transfer::log_level::info, cat, msg, ctx)
#define DXT_LOG_WARN_CTX(cat, msg, ctx) DXT_LOG_CTX(::dx::transfer::log_level::warn, cat, msg, ctx)
#define DXT_LOG_ERROR_CTX(cat, msg, ctx) DXT_LOG_CTX(::dx::transfer::log_level::error, cat, msg, ctx)

}  // namespace dx::transfer
