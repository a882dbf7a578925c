/**
 * @file example_support.h
 * @brief Console formatting and sample data shared by the examples
 */

#ifndef DX_TRANSFER_EXAMPLES_EXAMPLE_SUPPORT_H
#define DX_TRANSFER_EXAMPLES_EXAMPLE_SUPPORT_H

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dx::transfer::examples {

inline auto format_bytes(uint64_t bytes) -> std::string {
    constexpr std::array<const char*, 4> units{"bytes", "KB", "MB", "GB"};

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    for (; value >= 1024.0 && unit + 1 < units.size(); ++unit) {
        value /= 1024.0;
    }
    if (unit == 0) {
        return std::to_string(bytes) + " bytes";
    }
    char text[32];
    std::snprintf(text, sizeof(text), "%.2f %s", value, units[unit]);
    return text;
}

inline auto format_rate(double bytes_per_second) -> std::string {
    return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

/**
 * @brief Positive decimal count such as a worker number
 */
inline auto parse_count(std::string_view text) -> std::optional<std::size_t> {
    std::size_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Fill path with size bytes of seeded pseudo-random data
 * @throws std::runtime_error if the file cannot be written
 */
inline void write_sample_file(const std::filesystem::path& path, uint64_t size,
                              uint32_t seed = 12345) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot create " + path.string());
    }

    std::minstd_rand gen(seed);
    std::vector<char> block(64 * 1024);
    for (uint64_t left = size; left > 0;) {
        auto n = static_cast<std::size_t>(std::min<uint64_t>(left, block.size()));
        for (std::size_t i = 0; i < n; ++i) {
            block[i] = static_cast<char>(gen() >> 7);
        }
        out.write(block.data(), static_cast<std::streamsize>(n));
        left -= n;
    }
    if (!out) {
        throw std::runtime_error("short write to " + path.string());
    }
}

}  // namespace dx::transfer::examples

#endif  // DX_TRANSFER_EXAMPLES_EXAMPLE_SUPPORT_H
