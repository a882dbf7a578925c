/**
 * @file state_store.cpp
 * @brief Implementation of state_store for transfer state persistence
 */

#include "dx/transfer/core/state_store.h"

#include "dx/transfer/core/checksum.h"
#include "dx/transfer/core/logging.h"

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sstream>

namespace dx::transfer {

// ============================================================================
// state_store_config implementation
// ============================================================================

state_store_config::state_store_config()
    : directory(std::filesystem::temp_directory_path() / "dx_transfer_state") {}

state_store_config::state_store_config(std::filesystem::path dir)
    : directory(std::move(dir)) {}

// ============================================================================
// JSON serialization helpers (simple implementation without external library)
// ============================================================================

namespace {

constexpr int record_format = 1;

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4)
                      << std::setfill('0') << static_cast<int>(c);
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto unescape_json_string(const std::string& s) -> std::optional<std::string> {
    std::string result;
    result.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') {
            result += s[i];
            continue;
        }
        if (i + 1 >= s.size()) {
            return std::nullopt;
        }
        switch (s[i + 1]) {
            case '"': result += '"'; ++i; break;
            case '\\': result += '\\'; ++i; break;
            case '/': result += '/'; ++i; break;
            case 'b': result += '\b'; ++i; break;
            case 'f': result += '\f'; ++i; break;
            case 'n': result += '\n'; ++i; break;
            case 'r': result += '\r'; ++i; break;
            case 't': result += '\t'; ++i; break;
            case 'u': {
                if (i + 5 >= s.size()) {
                    return std::nullopt;
                }
                auto hex = checksum::from_hex(std::string_view(s).substr(i + 2, 4));
                if (!hex || (*hex)[0] != 0) {
                    return std::nullopt;
                }
                result += static_cast<char>((*hex)[1]);
                i += 5;
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return result;
}

auto time_point_to_int64(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto int64_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(
        std::chrono::milliseconds(ms));
}

auto crc_to_hex(uint32_t crc) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << crc;
    return oss.str();
}

// Scalar fields come first so their keys are found before any string value.
auto serialize_body(const transfer_state& state) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "    \"id\": \"" << state.id.to_string() << "\",\n";
    oss << "    \"direction\": \"" << to_string(state.direction) << "\",\n";
    oss << "    \"total_size\": " << state.total_size << ",\n";
    oss << "    \"chunk_size\": " << state.chunk_size << ",\n";
    oss << "    \"created_at\": " << time_point_to_int64(state.created_at) << ",\n";
    oss << "    \"updated_at\": " << time_point_to_int64(state.updated_at) << ",\n";
    oss << "    \"object_id\": \"" << escape_json_string(state.object_id) << "\",\n";
    oss << "    \"local_path\": \"" << escape_json_string(state.local_path) << "\",\n";
    oss << "    \"session_token\": \"" << escape_json_string(state.session_token) << "\",\n";
    oss << "    \"completed\": [";
    bool first = true;
    for (const auto& [index, sum] : state.completed) {
        oss << (first ? "\n" : ",\n");
        oss << "      {\"index\": " << index << ", \"checksum\": \""
            << escape_json_string(sum) << "\"}";
        first = false;
    }
    oss << (first ? "]\n" : "\n    ]\n");
    oss << "  }";
    return oss.str();
}

auto skip_whitespace(const std::string& json, std::size_t pos) -> std::size_t {
    while (pos < json.size() &&
           (json[pos] == ' ' || json[pos] == '\n' || json[pos] == '\t' || json[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

/// Raw value of a key: string contents without quotes, or the scalar text.
auto extract_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto key_pos = json.find("\"" + key + "\":");
    if (key_pos == std::string::npos) {
        return std::nullopt;
    }

    auto value_start = skip_whitespace(json, key_pos + key.size() + 3);
    if (value_start >= json.size()) {
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        bool escaped = false;
        for (auto i = value_start + 1; i < json.size(); ++i) {
            if (escaped) {
                escaped = false;
            } else if (json[i] == '\\') {
                escaped = true;
            } else if (json[i] == '"') {
                return json.substr(value_start + 1, i - value_start - 1);
            }
        }
        return std::nullopt;
    }

    auto value_end = value_start;
    while (value_end < json.size() &&
           json[value_end] != ',' && json[value_end] != '\n' &&
           json[value_end] != '}') {
        ++value_end;
    }

    auto value = json.substr(value_start, value_end - value_start);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.pop_back();
    }
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

auto extract_string(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto raw = extract_json_value(json, key);
    if (!raw) {
        return std::nullopt;
    }
    return unescape_json_string(*raw);
}

auto extract_u64(const std::string& json, const std::string& key) -> std::optional<uint64_t> {
    auto raw = extract_json_value(json, key);
    if (!raw || raw->empty() || (*raw)[0] < '0' || (*raw)[0] > '9') {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        auto value = std::stoull(*raw, &used);
        if (used != raw->size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto extract_i64(const std::string& json, const std::string& key) -> std::optional<int64_t> {
    auto raw = extract_json_value(json, key);
    if (!raw) {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        auto value = std::stoll(*raw, &used);
        if (used != raw->size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto corrupt(const std::string& what) -> unexpected {
    return unexpected(error(error_code::state_corruption, what));
}

auto parse_completed(const std::string& body, std::map<uint64_t, std::string>& out)
    -> result<void> {
    auto key_pos = body.find("\"completed\":");
    if (key_pos == std::string::npos) {
        return corrupt("missing completed field");
    }
    auto pos = skip_whitespace(body, key_pos + 12);
    if (pos >= body.size() || body[pos] != '[') {
        return corrupt("completed is not an array");
    }
    ++pos;

    while (true) {
        pos = skip_whitespace(body, pos);
        if (pos >= body.size()) {
            return corrupt("unterminated completed array");
        }
        if (body[pos] == ']') {
            return {};
        }
        if (body[pos] == ',') {
            ++pos;
            continue;
        }
        if (body[pos] != '{') {
            return corrupt("unexpected character in completed array");
        }
        auto end = body.find('}', pos);
        if (end == std::string::npos) {
            return corrupt("unterminated completed entry");
        }
        auto entry = body.substr(pos, end - pos + 1);
        auto index = extract_u64(entry, "index");
        auto sum = extract_string(entry, "checksum");
        if (!index || !sum || sum->empty()) {
            return corrupt("malformed completed entry");
        }
        if (!out.emplace(*index, *sum).second) {
            return corrupt("duplicate completed index " + std::to_string(*index));
        }
        pos = end + 1;
    }
}

auto parse_body(const std::string& body) -> result<transfer_state> {
    transfer_state state;

    auto id_str = extract_string(body, "id");
    if (!id_str) {
        return corrupt("missing id field");
    }
    auto parsed_id = job_id::from_string(*id_str);
    if (!parsed_id) {
        return corrupt("invalid job id");
    }
    state.id = *parsed_id;

    auto direction = extract_string(body, "direction");
    if (!direction) {
        return corrupt("missing direction field");
    }
    if (*direction == "upload") {
        state.direction = transfer_direction::upload;
    } else if (*direction == "download") {
        state.direction = transfer_direction::download;
    } else {
        return corrupt("unknown direction '" + *direction + "'");
    }

    auto total_size = extract_u64(body, "total_size");
    auto chunk_size = extract_u64(body, "chunk_size");
    auto created = extract_i64(body, "created_at");
    auto updated = extract_i64(body, "updated_at");
    if (!total_size || !chunk_size || !created || !updated) {
        return corrupt("invalid numeric field");
    }
    state.total_size = *total_size;
    state.chunk_size = *chunk_size;
    state.created_at = int64_to_time_point(*created);
    state.updated_at = int64_to_time_point(*updated);

    auto object_id = extract_string(body, "object_id");
    auto local_path = extract_string(body, "local_path");
    auto token = extract_string(body, "session_token");
    if (!object_id || !local_path || !token) {
        return corrupt("invalid string field");
    }
    state.object_id = std::move(*object_id);
    state.local_path = std::move(*local_path);
    state.session_token = std::move(*token);

    auto completed = parse_completed(body, state.completed);
    if (!completed) {
        return unexpected(completed.error());
    }

    if (state.chunk_size == 0 && !state.completed.empty() && state.total_size > 0) {
        return corrupt("completed chunks recorded with zero chunk size");
    }
    if (state.chunk_size > 0) {
        auto chunk_count =
            state.total_size == 0 ? 1 : (state.total_size + state.chunk_size - 1) / state.chunk_size;
        for (const auto& [index, sum] : state.completed) {
            if (index >= chunk_count) {
                return corrupt("completed index " + std::to_string(index) + " out of range");
            }
        }
    }

    return state;
}

}  // namespace

auto state_store::encode(const transfer_state& state) -> std::string {
    auto body = serialize_body(state);
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"format\": " << record_format << ",\n";
    oss << "  \"crc32\": \"" << crc_to_hex(checksum::crc32(body)) << "\",\n";
    oss << "  \"state\": " << body << "\n";
    oss << "}\n";
    return oss.str();
}

auto state_store::decode(const std::string& record) -> result<transfer_state> {
    auto format = extract_u64(record, "format");
    if (!format || *format != record_format) {
        return corrupt("unsupported record format");
    }
    auto crc = extract_string(record, "crc32");
    if (!crc) {
        return corrupt("missing crc32 field");
    }

    auto state_pos = record.find("\"state\":");
    if (state_pos == std::string::npos) {
        return corrupt("missing state field");
    }
    auto body_start = skip_whitespace(record, state_pos + 8);
    auto outer_end = record.rfind('}');
    if (body_start >= record.size() || record[body_start] != '{' ||
        outer_end == std::string::npos || outer_end <= body_start) {
        return corrupt("malformed record");
    }
    auto body_end = record.rfind('}', outer_end - 1);
    if (body_end == std::string::npos || body_end < body_start) {
        return corrupt("malformed record");
    }
    auto body = record.substr(body_start, body_end - body_start + 1);

    if (crc_to_hex(checksum::crc32(body)) != *crc) {
        return corrupt("crc32 mismatch");
    }

    return parse_body(body);
}

// ============================================================================
// state_store::impl
// ============================================================================

class state_store::impl {
public:
    explicit impl(const state_store_config& cfg) : config_(cfg) {
        std::error_code ec;
        std::filesystem::create_directories(config_.directory, ec);
        if (ec) {
            DXT_LOG_WARN(log_category::state,
                         "Cannot create state directory " + config_.directory.string() +
                             ": " + ec.message());
        }
    }

    auto path_for(const job_id& id) const -> std::filesystem::path {
        return config_.directory / (id.to_string() + ".json");
    }

    auto save(const transfer_state& state) -> result<void> {
        std::unique_lock lock(mutex_);

        DXT_LOG_DEBUG(log_category::state,
                      "Saving transfer state: " + state.id.to_string() + " (" +
                          std::to_string(state.completed.size()) + " chunks complete)");

        std::error_code ec;
        std::filesystem::create_directories(config_.directory, ec);
        if (ec) {
            return unexpected(error(error_code::state_io_error,
                                    "cannot create state directory: " + ec.message()));
        }

        auto path = path_for(state.id);
        auto tmp_path = path;
        tmp_path += ".tmp";

        {
            std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                DXT_LOG_ERROR(log_category::state,
                              "Failed to open state file for writing: " + tmp_path.string());
                return unexpected(error(error_code::state_io_error,
                                        "failed to open state file for writing"));
            }
            file << encode(state);
            file.flush();
            if (!file) {
                DXT_LOG_ERROR(log_category::state,
                              "Failed to write state file: " + tmp_path.string());
                std::filesystem::remove(tmp_path, ec);
                return unexpected(error(error_code::state_io_error,
                                        "failed to write state file"));
            }
        }

        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            DXT_LOG_ERROR(log_category::state,
                          "Failed to publish state file " + path.string() + ": " + ec.message());
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            return unexpected(error(error_code::state_io_error,
                                    "failed to publish state file: " + ec.message()));
        }

        DXT_LOG_TRACE(log_category::state, "State persisted to: " + path.string());
        return {};
    }

    auto load(const job_id& id) const -> result<transfer_state> {
        std::shared_lock lock(mutex_);
        return load_unlocked(id);
    }

    auto load_unlocked(const job_id& id) const -> result<transfer_state> {
        auto path = path_for(id);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            DXT_LOG_TRACE(log_category::state, "State file not found: " + path.string());
            return unexpected(error(error_code::state_not_found,
                                    "no persisted state for job " + id.to_string()));
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            DXT_LOG_ERROR(log_category::state, "Failed to open state file: " + path.string());
            return unexpected(error(error_code::state_io_error, "failed to open state file"));
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        auto decoded = decode(oss.str());
        if (!decoded) {
            DXT_LOG_ERROR(log_category::state,
                          "Corrupted state file " + path.string() + ": " +
                              decoded.error().message);
            return decoded;
        }
        if (!(decoded.value().id == id)) {
            DXT_LOG_ERROR(log_category::state,
                          "State file " + path.string() + " belongs to job " +
                              decoded.value().id.to_string());
            return unexpected(error(error_code::state_corruption,
                                    "state record names a different job"));
        }

        DXT_LOG_DEBUG(log_category::state,
                      "State recovered: " + id.to_string() + " (" +
                          std::to_string(decoded.value().completed.size()) +
                          " chunks complete)");
        return decoded;
    }

    auto exists(const job_id& id) const -> bool {
        std::shared_lock lock(mutex_);
        std::error_code ec;
        return std::filesystem::exists(path_for(id), ec);
    }

    auto remove(const job_id& id) -> result<void> {
        std::unique_lock lock(mutex_);
        return remove_unlocked(id);
    }

    auto remove_unlocked(const job_id& id) -> result<void> {
        auto path = path_for(id);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            DXT_LOG_ERROR(log_category::state,
                          "Failed to delete state file: " + path.string() + " (" +
                              ec.message() + ")");
            return unexpected(error(error_code::state_io_error,
                                    "failed to delete state file: " + ec.message()));
        }
        DXT_LOG_DEBUG(log_category::state, "Deleted transfer state: " + id.to_string());
        return {};
    }

    template <typename Visitor>
    void for_each_record(Visitor&& visit) const {
        std::error_code ec;
        if (!std::filesystem::exists(config_.directory, ec)) {
            return;
        }
        for (const auto& entry : std::filesystem::directory_iterator(config_.directory, ec)) {
            if (entry.path().extension() != ".json") {
                continue;
            }
            auto id = job_id::from_string(entry.path().stem().string());
            if (!id) {
                continue;
            }
            visit(*id, entry.path());
        }
        if (ec) {
            DXT_LOG_WARN(log_category::state,
                         "Cannot scan state directory: " + ec.message());
        }
    }

    auto list() const -> std::vector<transfer_state> {
        std::shared_lock lock(mutex_);
        std::vector<transfer_state> states;
        for_each_record([&](const job_id& id, const std::filesystem::path&) {
            auto loaded = load_unlocked(id);
            if (loaded) {
                states.push_back(std::move(loaded).value());
            }
        });
        DXT_LOG_DEBUG(log_category::state,
                      "Found " + std::to_string(states.size()) + " resumable transfers");
        return states;
    }

    auto cleanup_expired(std::chrono::seconds ttl) -> std::size_t {
        std::unique_lock lock(mutex_);
        auto now = std::chrono::system_clock::now();
        std::vector<job_id> expired;

        for_each_record([&](const job_id& id, const std::filesystem::path& path) {
            auto loaded = load_unlocked(id);
            if (loaded) {
                if (now - loaded.value().updated_at > ttl) {
                    expired.push_back(id);
                }
                return;
            }
            // Damaged records age by modification time
            std::error_code ec;
            auto written = std::filesystem::last_write_time(path, ec);
            if (!ec && std::filesystem::file_time_type::clock::now() - written > ttl) {
                expired.push_back(id);
            }
        });

        std::size_t removed = 0;
        for (const auto& id : expired) {
            if (remove_unlocked(id)) {
                ++removed;
            }
        }

        DXT_LOG_INFO(log_category::state,
                     "Cleanup completed: " + std::to_string(removed) +
                         " expired states removed");
        return removed;
    }

    state_store_config config_;
    mutable std::shared_mutex mutex_;
};

// ============================================================================
// state_store public interface
// ============================================================================

state_store::state_store(const state_store_config& config)
    : impl_(std::make_unique<impl>(config)) {}

state_store::~state_store() = default;

state_store::state_store(state_store&&) noexcept = default;
auto state_store::operator=(state_store&&) noexcept -> state_store& = default;

auto state_store::save(const transfer_state& state) -> result<void> {
    return impl_->save(state);
}

auto state_store::load(const job_id& id) const -> result<transfer_state> {
    return impl_->load(id);
}

auto state_store::exists(const job_id& id) const -> bool {
    return impl_->exists(id);
}

auto state_store::remove(const job_id& id) -> result<void> {
    return impl_->remove(id);
}

auto state_store::list() const -> std::vector<transfer_state> {
    return impl_->list();
}

auto state_store::cleanup_expired(std::chrono::seconds ttl) -> std::size_t {
    return impl_->cleanup_expired(ttl);
}

auto state_store::cleanup_expired() -> std::size_t {
    return impl_->cleanup_expired(impl_->config_.state_ttl);
}

auto state_store::record_path(const job_id& id) const -> std::filesystem::path {
    return impl_->path_for(id);
}

auto state_store::config() const -> const state_store_config& {
    return impl_->config_;
}

}  // namespace dx::transfer
