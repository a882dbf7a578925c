/**
 * @file chunk_planner.cpp
 * @brief Implementation of chunk planning and range reads
 */

#include <dx/transfer/core/chunk_planner.h>

#include <dx/transfer/core/logging.h>

namespace dx::transfer {

namespace {

auto ceil_div(uint64_t a, uint64_t b) -> uint64_t {
    return (a + b - 1) / b;
}

auto round_up(uint64_t value, uint64_t alignment) -> uint64_t {
    return ceil_div(value, alignment) * alignment;
}

}  // namespace

// chunk_planner

chunk_planner::chunk_planner() : policy_() {}

chunk_planner::chunk_planner(const chunk_policy& policy) : policy_(policy) {}

auto chunk_planner::effective_chunk_size(uint64_t total_size) const -> result<uint64_t> {
    if (auto valid = policy_.validate(); !valid) {
        return unexpected(valid.error());
    }

    uint64_t size = policy_.chunk_size.value_or(policy_.default_chunk_size);

    if (total_size == 0 || ceil_div(total_size, size) <= policy_.max_chunk_count) {
        return size;
    }

    if (total_size > policy_.max_object_size()) {
        return unexpected(error{
            error_code::file_too_large,
            "object of " + std::to_string(total_size) + " bytes exceeds " +
                std::to_string(policy_.max_chunk_count) + " chunks of the maximum size"});
    }

    uint64_t scaled = round_up(ceil_div(total_size, policy_.max_chunk_count),
                               policy_.size_alignment);
    if (scaled > policy_.max_chunk_size) {
        scaled = policy_.max_chunk_size;
    }

    if (policy_.chunk_size) {
        DXT_LOG_WARN(log_category::planner,
                     "chunk size " + std::to_string(size) + " would need more than " +
                         std::to_string(policy_.max_chunk_count) + " chunks, using " +
                         std::to_string(scaled));
    } else {
        DXT_LOG_DEBUG(log_category::planner,
                      "scaled chunk size to " + std::to_string(scaled) + " for " +
                          std::to_string(total_size) + " bytes");
    }
    return scaled;
}

auto chunk_planner::plan(uint64_t total_size) const -> result<chunk_plan> {
    auto size = effective_chunk_size(total_size);
    if (!size) {
        return unexpected(size.error());
    }
    return plan_fixed(total_size, size.value());
}

auto chunk_planner::plan_fixed(uint64_t total_size, uint64_t chunk_size)
    -> result<chunk_plan> {
    if (chunk_size == 0) {
        return unexpected(error{error_code::invalid_chunk_size, "chunk size must be positive"});
    }

    chunk_plan out;
    out.total_size = total_size;
    out.chunk_size = chunk_size;

    // Empty objects still get one (empty) chunk so the remote object exists
    uint64_t count = total_size == 0 ? 1 : ceil_div(total_size, chunk_size);
    out.chunks.reserve(static_cast<std::size_t>(count));

    for (uint64_t i = 0; i < count; ++i) {
        chunk_descriptor c;
        c.index = i;
        c.offset = i * chunk_size;
        c.length = std::min(chunk_size, total_size - c.offset);
        out.chunks.push_back(std::move(c));
    }
    return out;
}

auto chunk_planner::plan_remote(uint64_t total_size, uint64_t chunk_size) const
    -> result<chunk_plan> {
    if (chunk_size == 0) {
        return unexpected(error{error_code::invalid_chunk_size, "remote chunk size is zero"});
    }
    if (chunk_size > policy_.max_chunk_size) {
        return unexpected(error{error_code::invalid_chunk_size,
                                "remote chunk size " + std::to_string(chunk_size) +
                                    " exceeds maximum " + std::to_string(policy_.max_chunk_size)});
    }

    // Remote sizes may be near UINT64_MAX, so no a + b - 1 rounding
    uint64_t count = total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
    if (count > 1 && chunk_size < policy_.min_chunk_size) {
        return unexpected(error{error_code::invalid_chunk_size,
                                "remote chunk size " + std::to_string(chunk_size) +
                                    " below minimum " + std::to_string(policy_.min_chunk_size)});
    }
    if (count > policy_.max_chunk_count) {
        return unexpected(error{error_code::file_too_large,
                                "remote object of " + std::to_string(total_size) + " bytes needs " +
                                    std::to_string(count) + " chunks, limit is " +
                                    std::to_string(policy_.max_chunk_count)});
    }
    return plan_fixed(total_size, chunk_size);
}

auto chunk_planner::plan_file(const std::filesystem::path& file_path) const
    -> result<chunk_plan> {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + file_path.string()});
    }
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return unexpected(
            error{error_code::invalid_file_path, "not a regular file: " + file_path.string()});
    }

    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot get file size: " + file_path.string()});
    }
    return plan(file_size);
}

auto chunk_planner::policy() const -> const chunk_policy& {
    return policy_;
}

// chunk_reader

chunk_reader::chunk_reader(std::filesystem::path file_path) : path_(std::move(file_path)) {}

auto chunk_reader::read(const chunk_descriptor& chunk, std::vector<std::byte>& buffer)
    -> result<std::size_t> {
    buffer.resize(static_cast<std::size_t>(chunk.length));
    if (chunk.length == 0) {
        return std::size_t{0};
    }

    if (!file_.is_open()) {
        file_.open(path_, std::ios::binary);
        if (!file_) {
            return unexpected(
                error{error_code::file_access_denied, "cannot open file: " + path_.string()});
        }
    }
    file_.clear();

    file_.seekg(static_cast<std::streamoff>(chunk.offset), std::ios::beg);
    if (!file_.good()) {
        return unexpected(error{error_code::file_read_error, "seek failed"});
    }

    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(chunk.length));
    auto bytes_read = static_cast<std::size_t>(file_.gcount());

    if (bytes_read != chunk.length) {
        return unexpected(error{error_code::file_read_error,
                                "short read for chunk " + std::to_string(chunk.index) +
                                    ": file changed since planning?"});
    }
    return bytes_read;
}

}  // namespace dx::transfer
