/**
 * @file destination_file.h
 * @brief Shared positional-write target for downloads
 */

#ifndef DX_TRANSFER_ENGINE_DESTINATION_FILE_H
#define DX_TRANSFER_ENGINE_DESTINATION_FILE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include "dx/transfer/core/types.h"

namespace dx::transfer {

/**
 * @brief Download part file opened once and shared by all workers
 *
 * Writes go through pwrite at explicit offsets, so workers writing
 * disjoint chunk ranges need no lock. The file is sized up front; an
 * existing part file of a resumed job keeps its content.
 */
class destination_file {
public:
    /**
     * @brief Open or create the part file
     * @param path Part file path
     * @param size Final object size
     * @param truncate Discard existing content first
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path,
                                   uint64_t size,
                                   bool truncate) -> result<std::unique_ptr<destination_file>>;

    ~destination_file();

    destination_file(const destination_file&) = delete;
    auto operator=(const destination_file&) -> destination_file& = delete;

    /**
     * @brief Write data at offset (thread-safe for disjoint ranges)
     */
    [[nodiscard]] auto write_at(uint64_t offset, std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Read back a range, used to re-verify chunks
     */
    [[nodiscard]] auto read_at(uint64_t offset, uint64_t length) const
        -> result<std::vector<std::byte>>;

    [[nodiscard]] auto sync() -> result<void>;

    /**
     * @brief Flush, close and rename the part file to final_path
     */
    [[nodiscard]] auto commit(const std::filesystem::path& final_path) -> result<void>;

    /**
     * @brief Close and delete the part file
     */
    void discard();

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }

private:
    destination_file(std::filesystem::path path, int fd);

    void close() noexcept;

    std::filesystem::path path_;
    int fd_ = -1;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_ENGINE_DESTINATION_FILE_H
