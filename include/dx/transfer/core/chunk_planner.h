/**
 * @file chunk_planner.h
 * @brief Splits an object into a deterministic chunk plan
 */

#ifndef DX_TRANSFER_CORE_CHUNK_PLANNER_H
#define DX_TRANSFER_CORE_CHUNK_PLANNER_H

#include <dx/transfer/core/chunk_policy.h>
#include <dx/transfer/core/chunk_types.h>
#include <dx/transfer/core/types.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <span>
#include <vector>

namespace dx::transfer {

/**
 * @brief Produces chunk plans
 *
 * The plan is a pure function of the total size and the policy, so a
 * restarted process regenerates exactly the plan its persisted state
 * refers to. Empty objects get one zero-length chunk.
 */
class chunk_planner {
public:
    chunk_planner();

    explicit chunk_planner(const chunk_policy& policy);

    /**
     * @brief Chunk size the policy yields for an object of this size
     * @return Effective chunk size, or invalid_chunk_size / file_too_large
     */
    [[nodiscard]] auto effective_chunk_size(uint64_t total_size) const -> result<uint64_t>;

    /**
     * @brief Plan an object of the given size
     */
    [[nodiscard]] auto plan(uint64_t total_size) const -> result<chunk_plan>;

    /**
     * @brief Plan with an explicit chunk size, without policy limits
     */
    [[nodiscard]] static auto plan_fixed(uint64_t total_size, uint64_t chunk_size)
        -> result<chunk_plan>;

    /**
     * @brief Plan with the chunk size a remote object was stored with
     *
     * The size must lie within the policy's limits, except that a
     * single-chunk object may be smaller than the minimum. More than
     * max_chunk_count chunks fails with file_too_large.
     */
    [[nodiscard]] auto plan_remote(uint64_t total_size, uint64_t chunk_size) const
        -> result<chunk_plan>;

    /**
     * @brief Plan a local file by its current size
     */
    [[nodiscard]] auto plan_file(const std::filesystem::path& file_path) const
        -> result<chunk_plan>;

    [[nodiscard]] auto policy() const -> const chunk_policy&;

private:
    chunk_policy policy_;
};

/**
 * @brief Reads planned chunk ranges from a local file
 *
 * Each worker owns its own reader, so reads never share a stream.
 */
class chunk_reader {
public:
    explicit chunk_reader(std::filesystem::path file_path);

    /**
     * @brief Read the bytes of one chunk into buffer
     * @return Number of bytes read (equals chunk.length) or file_read_error
     */
    [[nodiscard]] auto read(const chunk_descriptor& chunk, std::vector<std::byte>& buffer)
        -> result<std::size_t>;

private:
    std::filesystem::path path_;
    std::ifstream file_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_CHUNK_PLANNER_H
