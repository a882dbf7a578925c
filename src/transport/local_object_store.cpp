/**
 * @file local_object_store.cpp
 * @brief Directory-backed object store implementation
 */

#include "dx/transfer/transport/local_object_store.h"

#include "dx/transfer/core/chunk_planner.h"
#include "dx/transfer/core/chunk_types.h"
#include "dx/transfer/core/file_naming.h"
#include "dx/transfer/core/integrity_verifier.h"
#include "dx/transfer/core/logging.h"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace dx::transfer {

namespace {

constexpr const char* OBJECTS_DIR = "objects";
constexpr const char* SESSIONS_DIR = "sessions";
constexpr const char* DATA_FILE = "data";
constexpr const char* META_FILE = "meta";
constexpr const char* SESSION_FILE = "session";
constexpr const char* PART_PREFIX = "part-";

auto not_found(const std::string& what) -> transport_error {
    return transport_error{error_kind::server_rejected, 404, what + " not found"};
}

auto read_all(const std::filesystem::path& path) -> std::optional<std::vector<std::byte>> {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        return std::nullopt;
    }
    auto size = static_cast<std::size_t>(in.tellg());
    std::vector<std::byte> data(size);
    in.seekg(0);
    if (size > 0 && !in.read(reinterpret_cast<char*>(data.data()),
                             static_cast<std::streamsize>(size))) {
        return std::nullopt;
    }
    return data;
}

// Write through a temporary name so readers never observe a partial file
auto write_atomically(const std::filesystem::path& path, std::span<const std::byte> data)
    -> bool {
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return false;
        }
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    return !ec;
}

auto write_text(const std::filesystem::path& path, const std::string& text) -> bool {
    return write_atomically(path, std::as_bytes(std::span<const char>(text.data(), text.size())));
}

auto format_meta(const object_metadata& meta, checksum_algorithm alg) -> std::string {
    std::ostringstream oss;
    oss << "size " << meta.size << "\n";
    oss << "chunk_size " << meta.chunk_size << "\n";
    oss << "algorithm " << to_string(alg) << "\n";
    if (meta.whole_checksum) {
        oss << "whole " << *meta.whole_checksum << "\n";
    }
    for (const auto& c : meta.chunk_checksums) {
        oss << "chunk " << c << "\n";
    }
    return oss.str();
}

auto parse_meta(const std::filesystem::path& path) -> std::optional<object_metadata> {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }

    object_metadata meta;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ls(line);
        std::string key;
        ls >> key;
        if (key == "size") {
            ls >> meta.size;
        } else if (key == "chunk_size") {
            ls >> meta.chunk_size;
        } else if (key == "whole") {
            std::string v;
            ls >> v;
            meta.whole_checksum = v;
        } else if (key == "chunk") {
            std::string v;
            ls >> v;
            meta.chunk_checksums.push_back(v);
        }
    }
    return meta;
}

auto new_token() -> std::string {
    auto text = job_id::generate().to_string();
    text.erase(std::remove(text.begin(), text.end(), '-'), text.end());
    return text;
}

}  // namespace

// ============================================================================
// impl
// ============================================================================

struct local_object_store::impl {
    std::filesystem::path base_path;
    checksum_algorithm alg;
    integrity_verifier verifier;

    mutable std::shared_mutex mutex;

    std::atomic<uint64_t> sessions_opened{0};
    std::atomic<uint64_t> chunks_put{0};
    std::atomic<uint64_t> chunks_get{0};
    std::atomic<uint64_t> objects_closed{0};
    std::atomic<uint64_t> sessions_aborted{0};

    impl(std::filesystem::path path, checksum_algorithm a)
        : base_path(std::move(path)), alg(a), verifier(a) {}

    auto object_dir(const std::string& object_id) const -> std::optional<std::filesystem::path> {
        auto name = make_unix_filename(object_id);
        if (!name) {
            return std::nullopt;
        }
        return base_path / OBJECTS_DIR / name.value();
    }

    auto session_dir(const std::string& token) const -> std::optional<std::filesystem::path> {
        if (token.empty() || token.find_first_of("/.") != std::string::npos) {
            return std::nullopt;
        }
        return base_path / SESSIONS_DIR / token;
    }

    // Committed parts of a session by index
    auto list_parts(const std::filesystem::path& dir) const
        -> std::map<uint64_t, std::filesystem::path> {
        std::map<uint64_t, std::filesystem::path> parts;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            auto name = entry.path().filename().string();
            if (name.rfind(PART_PREFIX, 0) != 0 || name.find(".tmp") != std::string::npos) {
                continue;
            }
            try {
                parts.emplace(std::stoull(name.substr(std::char_traits<char>::length(PART_PREFIX))),
                              entry.path());
            } catch (const std::exception&) {
                DXT_LOG_WARN(log_category::transport, "ignoring stray file " + name);
            }
        }
        return parts;
    }

    auto part_digests(const std::map<uint64_t, std::filesystem::path>& parts) const
        -> std::optional<std::vector<std::string>> {
        std::vector<std::string> digests;
        digests.reserve(parts.size());
        for (const auto& [index, path] : parts) {
            auto digest = checksum::file_digest(alg, path);
            if (!digest) {
                return std::nullopt;
            }
            digests.push_back(digest.value());
        }
        return digests;
    }

    auto publish(const std::string& object_id,
                 std::span<const std::byte> data,
                 object_metadata meta) -> transport_result<void> {
        auto dir = object_dir(object_id);
        if (!dir) {
            return transport_error{error_kind::server_rejected, 400, "invalid object id"};
        }
        std::error_code ec;
        std::filesystem::create_directories(*dir, ec);
        if (ec || !write_atomically(*dir / DATA_FILE, data) ||
            !write_text(*dir / META_FILE, format_meta(meta, alg))) {
            return transport_error{error_kind::server_rejected, 500,
                                   "failed to store object " + object_id};
        }
        return {};
    }
};

// ============================================================================
// local_object_store
// ============================================================================

local_object_store::local_object_store(const std::filesystem::path& base_path,
                                       checksum_algorithm alg)
    : impl_(std::make_unique<impl>(base_path, alg)) {}

local_object_store::~local_object_store() = default;

auto local_object_store::create(const std::filesystem::path& base_path, checksum_algorithm alg)
    -> std::shared_ptr<local_object_store> {
    std::error_code ec;
    std::filesystem::create_directories(base_path / OBJECTS_DIR, ec);
    std::filesystem::create_directories(base_path / SESSIONS_DIR, ec);
    if (ec) {
        DXT_LOG_ERROR(log_category::transport,
                      "cannot create object store at " + base_path.string());
        return nullptr;
    }
    return std::shared_ptr<local_object_store>(new local_object_store(base_path, alg));
}

auto local_object_store::open_upload_session(const std::string& object_id,
                                             uint64_t total_size,
                                             const call_options& /*options*/)
    -> transport_result<std::string> {
    if (!impl_->object_dir(object_id)) {
        return transport_error{error_kind::server_rejected, 400,
                               "invalid object id '" + object_id + "'"};
    }

    std::unique_lock lock(impl_->mutex);
    auto token = new_token();
    auto dir = *impl_->session_dir(token);

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec || !write_text(dir / SESSION_FILE,
                          object_id + "\n" + std::to_string(total_size) + "\n")) {
        return transport_error{error_kind::server_rejected, 500, "cannot create session"};
    }

    ++impl_->sessions_opened;
    return token;
}

auto local_object_store::put_chunk(const std::string& session_token,
                                   uint64_t index,
                                   std::span<const std::byte> data,
                                   const call_options& /*options*/)
    -> transport_result<chunk_ack> {
    std::shared_lock lock(impl_->mutex);
    auto dir = impl_->session_dir(session_token);
    std::error_code ec;
    if (!dir || !std::filesystem::exists(*dir / SESSION_FILE, ec)) {
        return not_found("session");
    }

    // A repeated part replaces the stored one until the object is closed
    auto part = *dir / (PART_PREFIX + std::to_string(index));
    if (std::filesystem::exists(part, ec)) {
        DXT_LOG_DEBUG(log_category::transport, "replacing part " + std::to_string(index));
    }

    if (!write_atomically(part, data)) {
        return transport_error{error_kind::server_rejected, 500,
                               "failed to store chunk " + std::to_string(index)};
    }

    ++impl_->chunks_put;
    return chunk_ack{impl_->verifier.compute(data)};
}

auto local_object_store::get_chunk(const std::string& object_id,
                                   uint64_t index,
                                   uint64_t offset,
                                   uint64_t length,
                                   const call_options& /*options*/)
    -> transport_result<std::vector<std::byte>> {
    std::shared_lock lock(impl_->mutex);
    auto dir = impl_->object_dir(object_id);
    if (!dir) {
        return not_found("object");
    }
    auto meta = parse_meta(*dir / META_FILE);
    if (!meta) {
        return not_found("object " + object_id);
    }
    if (offset + length > meta->size) {
        return transport_error{error_kind::server_rejected, 416,
                               "range of chunk " + std::to_string(index) + " out of bounds"};
    }

    std::ifstream in(*dir / DATA_FILE, std::ios::binary);
    if (!in) {
        return transport_error{error_kind::server_rejected, 500, "object data unreadable"};
    }

    std::vector<std::byte> data(static_cast<std::size_t>(length));
    in.seekg(static_cast<std::streamoff>(offset));
    if (length > 0 &&
        !in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length))) {
        return transport_error{error_kind::connection_error, "truncated object data"};
    }

    ++impl_->chunks_get;
    return data;
}

auto local_object_store::close_object(const std::string& session_token,
                                      const std::string& whole_checksum,
                                      const call_options& /*options*/)
    -> transport_result<void> {
    std::unique_lock lock(impl_->mutex);
    auto dir = impl_->session_dir(session_token);
    std::error_code ec;
    if (!dir || !std::filesystem::exists(*dir / SESSION_FILE, ec)) {
        return not_found("session");
    }

    std::ifstream session_in(*dir / SESSION_FILE);
    std::string object_id;
    uint64_t total_size = 0;
    std::getline(session_in, object_id);
    session_in >> total_size;

    auto parts = impl_->list_parts(*dir);
    if (parts.empty() || parts.rbegin()->first + 1 != parts.size()) {
        return transport_error{error_kind::server_rejected, 400,
                               "session has missing chunks"};
    }

    std::vector<std::byte> assembled;
    assembled.reserve(static_cast<std::size_t>(total_size));
    uint64_t first_size = 0;
    for (const auto& [index, path] : parts) {
        auto bytes = read_all(path);
        if (!bytes) {
            return transport_error{error_kind::server_rejected, 500, "chunk unreadable"};
        }
        if (index == 0) {
            first_size = bytes->size();
        }
        assembled.insert(assembled.end(), bytes->begin(), bytes->end());
    }
    if (assembled.size() != total_size) {
        return transport_error{error_kind::server_rejected, 400,
                               "assembled size " + std::to_string(assembled.size()) +
                                   " does not match declared " + std::to_string(total_size)};
    }

    auto digests = impl_->part_digests(parts);
    if (!digests) {
        return transport_error{error_kind::server_rejected, 500, "chunk unreadable"};
    }
    auto combined = impl_->verifier.combine(*digests);
    if (!combined) {
        return transport_error{error_kind::server_rejected, 500, combined.error().message};
    }
    if (!whole_checksum.empty() &&
        !integrity_verifier::same_digest(whole_checksum, combined.value())) {
        return transport_error{error_kind::server_rejected, 422,
                               "whole-object checksum does not match committed chunks"};
    }

    object_metadata meta;
    meta.size = total_size;
    meta.chunk_size = first_size;
    meta.chunk_checksums = *digests;
    meta.whole_checksum = combined.value();

    if (auto published = impl_->publish(object_id, assembled, std::move(meta)); !published) {
        return published;
    }

    std::filesystem::remove_all(*dir, ec);
    ++impl_->objects_closed;
    return {};
}

auto local_object_store::get_object_metadata(const std::string& object_id,
                                             const call_options& /*options*/)
    -> transport_result<object_metadata> {
    std::shared_lock lock(impl_->mutex);
    auto dir = impl_->object_dir(object_id);
    if (!dir) {
        return not_found("object");
    }
    auto meta = parse_meta(*dir / META_FILE);
    if (!meta) {
        return not_found("object " + object_id);
    }
    return *meta;
}

auto local_object_store::abort_upload_session(const std::string& session_token,
                                              const call_options& /*options*/)
    -> transport_result<void> {
    std::unique_lock lock(impl_->mutex);
    auto dir = impl_->session_dir(session_token);
    std::error_code ec;
    if (!dir || !std::filesystem::exists(*dir, ec)) {
        return not_found("session");
    }
    std::filesystem::remove_all(*dir, ec);
    if (ec) {
        return transport_error{error_kind::server_rejected, 500, ec.message()};
    }
    ++impl_->sessions_aborted;
    return {};
}

auto local_object_store::query_session_checksum(const std::string& session_token,
                                                const call_options& /*options*/)
    -> transport_result<std::optional<std::string>> {
    std::shared_lock lock(impl_->mutex);
    auto dir = impl_->session_dir(session_token);
    std::error_code ec;
    if (!dir || !std::filesystem::exists(*dir / SESSION_FILE, ec)) {
        return not_found("session");
    }

    auto parts = impl_->list_parts(*dir);
    auto digests = impl_->part_digests(parts);
    if (!digests) {
        return transport_error{error_kind::server_rejected, 500, "chunk unreadable"};
    }
    auto combined = impl_->verifier.combine(*digests);
    if (!combined) {
        return transport_error{error_kind::server_rejected, 500, combined.error().message};
    }
    return std::optional<std::string>{combined.value()};
}

auto local_object_store::import_object(const std::string& object_id,
                                       const std::filesystem::path& file_path,
                                       uint64_t chunk_size) -> transport_result<void> {
    auto data = read_all(file_path);
    if (!data) {
        return transport_error{error_kind::io_error, "cannot read " + file_path.string()};
    }

    auto plan = chunk_planner::plan_fixed(data->size(), chunk_size);
    if (!plan) {
        return transport_error{error_kind::server_rejected, 400, plan.error().message};
    }

    object_metadata meta;
    meta.size = data->size();
    meta.chunk_size = chunk_size;
    for (const auto& c : plan.value().chunks) {
        meta.chunk_checksums.push_back(impl_->verifier.compute(
            std::span<const std::byte>(data->data() + c.offset, static_cast<std::size_t>(c.length))));
    }
    auto combined = impl_->verifier.combine(meta.chunk_checksums);
    if (combined) {
        meta.whole_checksum = combined.value();
    }

    std::unique_lock lock(impl_->mutex);
    return impl_->publish(object_id, *data, std::move(meta));
}

auto local_object_store::object_exists(const std::string& object_id) const -> bool {
    auto dir = impl_->object_dir(object_id);
    std::error_code ec;
    return dir && std::filesystem::exists(*dir / META_FILE, ec);
}

auto local_object_store::session_exists(const std::string& session_token) const -> bool {
    auto dir = impl_->session_dir(session_token);
    std::error_code ec;
    return dir && std::filesystem::exists(*dir / SESSION_FILE, ec);
}

auto local_object_store::get_statistics() const -> object_store_statistics {
    object_store_statistics stats;
    stats.sessions_opened = impl_->sessions_opened.load();
    stats.chunks_put = impl_->chunks_put.load();
    stats.chunks_get = impl_->chunks_get.load();
    stats.objects_closed = impl_->objects_closed.load();
    stats.sessions_aborted = impl_->sessions_aborted.load();
    return stats;
}

auto local_object_store::base_path() const -> const std::filesystem::path& {
    return impl_->base_path;
}

}  // namespace dx::transfer
