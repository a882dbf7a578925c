/**
 * @file transfer_config.cpp
 * @brief transfer_config validation, environment overlay and builder
 */

#include "dx/transfer/engine/transfer_config.h"

#include "dx/transfer/core/logging.h"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

namespace dx::transfer {

namespace {

auto invalid(const std::string& msg) -> unexpected {
    return unexpected(error(error_code::invalid_configuration, msg));
}

auto parse_unsigned(std::string_view text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

auto env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

auto parse_byte_size(std::string_view text) -> std::optional<uint64_t> {
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t multiplier = 1;
    switch (text.back()) {
        case 'k': case 'K': multiplier = 1024ULL; break;
        case 'm': case 'M': multiplier = 1024ULL * 1024ULL; break;
        case 'g': case 'G': multiplier = 1024ULL * 1024ULL * 1024ULL; break;
        default: break;
    }
    if (multiplier != 1) {
        text.remove_suffix(1);
    }
    auto value = parse_unsigned(text);
    if (!value || *value > UINT64_MAX / multiplier) {
        return std::nullopt;
    }
    return *value * multiplier;
}

transfer_config::transfer_config()
    : state_directory(std::filesystem::temp_directory_path() / "dx_transfer_state") {}

auto transfer_config::validate() const -> result<void> {
    if (chunk_size && *chunk_size == 0) {
        return unexpected(error(error_code::invalid_chunk_size, "chunk size must be positive"));
    }
    if (max_retries == 0) {
        return invalid("max_retries must be at least 1");
    }
    if (timeout.count() <= 0) {
        return invalid("timeout must be positive");
    }
    if (backoff_base.count() < 0 || backoff_cap < backoff_base) {
        return invalid("backoff cap must not be below the base delay");
    }
    if (checkpoint_interval == 0) {
        return invalid("checkpoint_interval must be at least 1");
    }
    if (state_directory.empty()) {
        return invalid("state_directory must be set");
    }
    return make_chunk_policy().validate();
}

auto transfer_config::effective_parallelism() const -> std::size_t {
    if (parallelism > 0) {
        return parallelism;
    }
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

auto transfer_config::make_retry_policy() const -> retry_policy {
    retry_policy p;
    p.max_attempts = max_retries;
    p.initial_delay = backoff_base;
    p.max_delay = backoff_cap;
    p.use_jitter = backoff_jitter;
    return p;
}

auto transfer_config::make_chunk_policy() const -> chunk_policy {
    auto p = policy;
    if (chunk_size) {
        p.chunk_size = chunk_size;
    }
    return p;
}

auto transfer_config::from_environment(transfer_config base) -> result<transfer_config> {
    if (auto v = env("DX_TRANSFER_CHUNK_SIZE")) {
        auto size = parse_byte_size(*v);
        if (!size || *size == 0) {
            return invalid("DX_TRANSFER_CHUNK_SIZE: invalid size '" + *v + "'");
        }
        base.chunk_size = *size;
    }
    if (auto v = env("DX_TRANSFER_PARALLELISM")) {
        auto n = parse_unsigned(*v);
        if (!n) {
            return invalid("DX_TRANSFER_PARALLELISM: invalid count '" + *v + "'");
        }
        base.parallelism = static_cast<std::size_t>(*n);
    }
    if (auto v = env("DX_TRANSFER_MAX_RETRIES")) {
        auto n = parse_unsigned(*v);
        if (!n || *n == 0 || *n > UINT32_MAX) {
            return invalid("DX_TRANSFER_MAX_RETRIES: invalid count '" + *v + "'");
        }
        base.max_retries = static_cast<uint32_t>(*n);
    }
    if (auto v = env("DX_TRANSFER_TIMEOUT_MS")) {
        auto ms = parse_unsigned(*v);
        if (!ms || *ms == 0 || *ms > static_cast<uint64_t>(INT64_MAX)) {
            return invalid("DX_TRANSFER_TIMEOUT_MS: invalid timeout '" + *v + "'");
        }
        base.timeout = std::chrono::milliseconds(static_cast<int64_t>(*ms));
    }
    if (auto v = env("DX_TRANSFER_STATE_DIR")) {
        if (v->empty()) {
            return invalid("DX_TRANSFER_STATE_DIR is empty");
        }
        base.state_directory = *v;
    }
    if (auto v = env("DX_TRANSFER_CHECKSUM")) {
        auto alg = parse_checksum_algorithm(*v);
        if (!alg) {
            return invalid("DX_TRANSFER_CHECKSUM: unknown algorithm '" + *v + "'");
        }
        base.checksum = *alg;
    }

    auto valid = base.validate();
    if (!valid) {
        return unexpected(valid.error());
    }
    DXT_LOG_DEBUG(log_category::engine, "configuration loaded from environment");
    return base;
}

// ============================================================================
// builder
// ============================================================================

auto transfer_config::builder::with_chunk_size(uint64_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto transfer_config::builder::with_parallelism(std::size_t workers) -> builder& {
    config_.parallelism = workers;
    return *this;
}

auto transfer_config::builder::with_max_retries(uint32_t attempts) -> builder& {
    config_.max_retries = attempts;
    return *this;
}

auto transfer_config::builder::with_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.timeout = timeout;
    return *this;
}

auto transfer_config::builder::with_backoff(std::chrono::milliseconds base,
                                            std::chrono::milliseconds cap,
                                            bool jitter) -> builder& {
    config_.backoff_base = base;
    config_.backoff_cap = cap;
    config_.backoff_jitter = jitter;
    return *this;
}

auto transfer_config::builder::with_checksum(checksum_algorithm alg) -> builder& {
    config_.checksum = alg;
    return *this;
}

auto transfer_config::builder::with_whole_object_verification(bool enable) -> builder& {
    config_.verify_whole_object = enable;
    return *this;
}

auto transfer_config::builder::with_cleanup_on_abort(bool enable) -> builder& {
    config_.cleanup_on_abort = enable;
    return *this;
}

auto transfer_config::builder::with_state_directory(std::filesystem::path dir) -> builder& {
    config_.state_directory = std::move(dir);
    return *this;
}

auto transfer_config::builder::with_checkpoint_interval(uint32_t completions) -> builder& {
    config_.checkpoint_interval = completions;
    return *this;
}

auto transfer_config::builder::with_job_id(const job_id& id) -> builder& {
    config_.id = id;
    return *this;
}

auto transfer_config::builder::with_policy(chunk_policy policy) -> builder& {
    config_.policy = std::move(policy);
    return *this;
}

auto transfer_config::builder::build() const -> result<transfer_config> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected(valid.error());
    }
    return config_;
}

}  // namespace dx::transfer
