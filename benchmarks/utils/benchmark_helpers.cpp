/**
 * @file benchmark_helpers.cpp
 * @brief Scratch files and formatting shared by the benchmarks
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace dx::transfer::benchmark {

auto random_bytes(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> out(size);
    std::mt19937 gen(seed);

    std::size_t pos = 0;
    while (pos < size) {
        auto word = static_cast<uint32_t>(gen());
        auto n = std::min<std::size_t>(sizeof(word), size - pos);
        std::memcpy(out.data() + pos, &word, n);
        pos += n;
    }
    return out;
}

scratch_space::scratch_space() {
    std::random_device rd;
    root_ = std::filesystem::temp_directory_path() /
            ("dx_transfer_bench_" + std::to_string(rd()) + std::to_string(rd()));
    std::filesystem::create_directories(root_);
}

scratch_space::~scratch_space() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

auto scratch_space::random_file(const std::string& name, std::size_t size, uint32_t seed)
    -> std::filesystem::path {
    constexpr std::size_t slab = 4 * sizes::MB;

    auto path = root_ / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    for (std::size_t written = 0; written < size; written += slab, ++seed) {
        auto block = random_bytes(std::min(slab, size - written), seed);
        out.write(reinterpret_cast<const char*>(block.data()),
                  static_cast<std::streamsize>(block.size()));
    }
    return path;
}

auto scratch_space::fresh_dir(const std::string& name) -> std::filesystem::path {
    auto path = root_ / name;
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
    return path;
}

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr std::array<const char*, 4> units{"B", "KB", "MB", "GB"};

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << ' ' << units[0];
    } else {
        oss << std::fixed << std::setprecision(2) << value << ' ' << units[unit];
    }
    return oss.str();
}

}  // namespace dx::transfer::benchmark
