// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#include "dx/transfer/core/logging.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <regex>

namespace dx::transfer {

namespace {

void append_escaped(std::string& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
}

/**
 * Flat JSON object writer; members appear in the order they are added.
 */
class json_members {
public:
    void text(const char* name, std::string_view value) {
        key(name);
        out_ += '"';
        append_escaped(out_, value);
        out_ += '"';
    }

    void number(const char* name, uint64_t value) {
        key(name);
        out_ += std::to_string(value);
    }

    void fixed2(const char* name, double value) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", value);
        key(name);
        out_ += buf;
    }

    void raw(const char* name, const std::string& json) {
        key(name);
        out_ += json;
    }

    // Members of another flat object, spliced in
    void splice(const std::string& object_json) {
        if (object_json.size() <= 2) {
            return;
        }
        if (!out_.empty()) {
            out_ += ',';
        }
        out_.append(object_json, 1, object_json.size() - 2);
    }

    [[nodiscard]] auto object() const -> std::string { return "{" + out_ + "}"; }

private:
    void key(const char* name) {
        if (!out_.empty()) {
            out_ += ',';
        }
        out_ += '"';
        out_ += name;
        out_ += "\":";
    }

    std::string out_;
};

/**
 * Rewrites every match of pattern with rewrite(match).
 */
template <typename Rewrite>
auto replace_matches(const std::string& input, const std::regex& pattern, Rewrite rewrite)
    -> std::string {
    std::string out;
    std::size_t copied = 0;
    for (std::sregex_iterator it(input.begin(), input.end(), pattern), end; it != end; ++it) {
        auto at = static_cast<std::size_t>(it->position());
        out.append(input, copied, at - copied);
        out += rewrite(*it);
        copied = at + static_cast<std::size_t>(it->length());
    }
    out.append(input, copied, std::string::npos);
    return out;
}

auto format_timestamp(bool utc) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

    std::tm parts{};
    if (utc) {
        gmtime_r(&secs, &parts);
    } else {
        localtime_r(&secs, &parts);
    }

    char date[32];
    std::strftime(date, sizeof(date), utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S", &parts);
    char full[48];
    std::snprintf(full, sizeof(full), "%s.%03d%s", date, static_cast<int>(millis),
                  utc ? "Z" : "");
    return full;
}

#if DX_TRANSFER_USE_LOGGER_SYSTEM
auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warning;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::critical;
    }
    return kcenon::logger::log_level::info;
}
#endif

}  // namespace

auto log_level_to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
    }
    return "UNKNOWN";
}

// ----------------------------------------------------------------------------
// Masking
// ----------------------------------------------------------------------------

auto sensitive_info_masker::mask(const std::string& input) const -> std::string {
    static const std::regex token_assignment(
        R"((token["']?\s*[=:]\s*["']?)([A-Za-z0-9._~+/=-]+))", std::regex::icase);
    static const std::regex absolute_path(R"((?:/[A-Za-z0-9._-]+){2,})");

    std::string out = input;
    if (config_.mask_tokens) {
        out = replace_matches(out, token_assignment, [this](const std::smatch& m) {
            return m[1].str() + mask_token(m[2].str());
        });
    }
    if (config_.mask_paths) {
        out = replace_matches(out, absolute_path,
                              [this](const std::smatch& m) { return mask_path(m.str()); });
    }
    return out;
}

auto sensitive_info_masker::mask_token(const std::string& token) const -> std::string {
    if (!config_.mask_tokens || token.empty()) {
        return token;
    }
    auto keep = std::min(config_.visible_chars, token.size() / 2);
    std::string masked = token;
    std::fill(masked.begin() + static_cast<std::ptrdiff_t>(keep), masked.end(),
              config_.mask_char);
    return masked;
}

auto sensitive_info_masker::mask_path(const std::string& path) const -> std::string {
    if (!config_.mask_paths) {
        return path;
    }
    auto name_at = path.rfind('/');
    if (name_at == std::string::npos || name_at == 0) {
        return path;
    }
    return std::string(name_at, config_.mask_char) + path.substr(name_at);
}

// ----------------------------------------------------------------------------
// Structured records
// ----------------------------------------------------------------------------

auto transfer_log_context::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    auto hide_token = [masker](const std::string& v) {
        return masker ? masker->mask_token(v) : v;
    };
    auto hide_path = [masker](const std::string& v) { return masker ? masker->mask_path(v) : v; };
    auto hide_text = [masker](const std::string& v) { return masker ? masker->mask(v) : v; };

    json_members m;
    if (!job_id.empty()) m.text("job_id", job_id);
    if (!direction.empty()) m.text("direction", direction);
    if (!object_id.empty()) m.text("object_id", object_id);
    if (!local_path.empty()) m.text("local_path", hide_path(local_path));
    if (session_token) m.text("session_token", hide_token(*session_token));
    if (total_size) m.number("total_size", *total_size);
    if (bytes_done) m.number("bytes_done", *bytes_done);
    if (chunk_index) m.number("chunk_index", *chunk_index);
    if (total_chunks) m.number("total_chunks", *total_chunks);
    if (attempt) m.number("attempt", *attempt);
    if (error_kind) m.text("error_kind", *error_kind);
    if (rate_mbps) m.fixed2("rate_mbps", *rate_mbps);
    if (duration_ms) m.number("duration_ms", *duration_ms);
    if (error_message) m.text("error_message", hide_text(*error_message));
    return m.object();
}

auto structured_log_entry::stamped(log_level level, std::string_view category,
                                   std::string_view message) -> structured_log_entry {
    structured_log_entry entry;
    entry.timestamp = format_timestamp(true);
    entry.level = level;
    entry.category = std::string(category);
    entry.message = std::string(message);
    return entry;
}

auto structured_log_entry::to_json_with_masking(const sensitive_info_masker* masker) const
    -> std::string {
    json_members m;
    m.text("timestamp", timestamp);
    m.text("level", log_level_to_string(level));
    m.text("category", category);
    m.text("message", masker ? masker->mask(message) : message);

    if (context) {
        m.splice(context->to_json_with_masking(masker));
    }

    if (source_file) {
        json_members src;
        src.text("file", *source_file);
        if (source_line) src.number("line", static_cast<uint64_t>(*source_line));
        if (function_name) src.text("function", *function_name);
        m.raw("source", src.object());
    }
    return m.object();
}

// ----------------------------------------------------------------------------
// transfer_logger
// ----------------------------------------------------------------------------

void transfer_logger::initialize() {
    if (initialized_.exchange(true)) {
        return;
    }

#if DX_TRANSFER_USE_LOGGER_SYSTEM
    auto built = kcenon::logger::logger_builder()
                     .with_async(true)
                     .with_min_level(to_logger_level(min_level_.load()))
                     .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
                     .build();
    if (built) {
        logger_ = std::move(built.value());
    } else {
        std::cerr << "dx_transfer: logger_system unavailable, logging to stderr\n";
    }
#endif
}

void transfer_logger::shutdown() {
#if DX_TRANSFER_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->flush();
        logger_->stop();
        logger_.reset();
    }
#endif
    initialized_ = false;
}

void transfer_logger::set_level(log_level level) {
    min_level_.store(level);
#if DX_TRANSFER_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->set_min_level(to_logger_level(level));
    }
#endif
}

void transfer_logger::set_output_format(log_output_format format) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    output_format_ = format;
}

auto transfer_logger::get_output_format() const -> log_output_format {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return output_format_;
}

void transfer_logger::set_masking_config(masking_config config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    masker_.set_config(config);
}

auto transfer_logger::get_masking_config() const -> masking_config {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return masker_.get_config();
}

void transfer_logger::set_callback(log_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void transfer_logger::set_json_callback(json_log_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    json_callback_ = std::move(callback);
}

void transfer_logger::log(log_level level,
                          std::string_view category,
                          std::string_view message,
                          const transfer_log_context* context,
                          const char* file,
                          int line,
                          const char* function) {
    if (!is_enabled(level)) {
        return;
    }

    log_callback plain;
    json_log_callback structured;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        plain = callback_;
        structured = json_callback_;
    }
    if (plain) {
        plain(level, category, message, context);
    }

    log_output_format format;
    sensitive_info_masker masker;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        format = output_format_;
        masker = masker_;
    }

    std::string rendered;
    if (format == log_output_format::json) {
        auto entry = structured_log_entry::stamped(level, category, message);
        if (context) entry.context = *context;
        if (file) entry.source_file = file;
        if (line > 0) entry.source_line = line;
        if (function) entry.function_name = function;

        rendered = entry.to_json_with_masking(&masker);
        if (structured) {
            structured(entry, rendered);
        }
    } else {
#if !DX_TRANSFER_USE_LOGGER_SYSTEM
        rendered = format_timestamp(false) + " [" + std::string(log_level_to_string(level)) + "] ";
#endif
        rendered += "[" + std::string(category) + "] " + masker.mask(std::string(message));
        if (context) {
            rendered += " " + context->to_json_with_masking(&masker);
        }
    }
    emit(level, rendered, file, line, function);
}

void transfer_logger::flush() {
#if DX_TRANSFER_USE_LOGGER_SYSTEM
    if (logger_) {
        logger_->flush();
    }
#endif
    std::cerr.flush();
}

void transfer_logger::emit([[maybe_unused]] log_level level, const std::string& text,
                           [[maybe_unused]] const char* file,
                           [[maybe_unused]] int line_no,
                           [[maybe_unused]] const char* function) {
#if DX_TRANSFER_USE_LOGGER_SYSTEM
    if (logger_) {
        if (file && line_no > 0 && function) {
            logger_->log(to_logger_level(level), text, file, line_no, function);
        } else {
            logger_->log(to_logger_level(level), text);
        }
        return;
    }
#endif
    if (!console_output_.load()) {
        return;
    }
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << text << '\n';
}

auto get_logger() -> transfer_logger& {
    static transfer_logger instance;
    return instance;
}

}  // namespace dx::transfer
