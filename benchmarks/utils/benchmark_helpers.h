/**
 * @file benchmark_helpers.h
 * @brief Scratch files and formatting shared by the benchmarks
 */

#ifndef DX_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define DX_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dx::transfer::benchmark {

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_object = 1 * MB;
constexpr std::size_t medium_object = 16 * MB;
constexpr std::size_t large_object = 64 * MB;

constexpr std::size_t small_chunk = 256 * KB;
constexpr std::size_t default_chunk = 1 * MB;
constexpr std::size_t large_chunk = 8 * MB;
}  // namespace sizes

/**
 * @brief Deterministic pseudo-random payload; the same seed gives the same bytes
 */
auto random_bytes(std::size_t size, uint32_t seed) -> std::vector<std::byte>;

/**
 * @brief Directory under the system temp dir that holds one benchmark's
 *        source files, object store and state; removed on destruction
 */
class scratch_space {
public:
    scratch_space();
    ~scratch_space();

    scratch_space(const scratch_space&) = delete;
    auto operator=(const scratch_space&) -> scratch_space& = delete;

    /**
     * @brief Write size pseudo-random bytes to name, 4 MiB at a time
     */
    auto random_file(const std::string& name, std::size_t size, uint32_t seed)
        -> std::filesystem::path;

    /**
     * @brief Empty directory name, recreated if it already exists
     */
    auto fresh_dir(const std::string& name) -> std::filesystem::path;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

/**
 * @brief "1.50 MB" style label
 */
auto format_bytes(uint64_t bytes) -> std::string;

}  // namespace dx::transfer::benchmark

#endif  // DX_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
