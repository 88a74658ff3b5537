/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::delta_fetch::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

scratch_tree::scratch_tree(const std::string& name)
    : base_(std::filesystem::temp_directory_path() /
            ("delta_fetch_bench_" + name + "_" + std::to_string(std::random_device{}()))) {
    std::error_code ec;
    std::filesystem::create_directories(remote_root(), ec);
}

scratch_tree::~scratch_tree() {
    std::error_code ec;
    std::filesystem::remove_all(base_, ec);
}

auto scratch_tree::add_remote_file(const std::filesystem::path& relative, std::size_t size,
                                   uint32_t seed) -> std::filesystem::path {
    auto path = remote_root() / relative;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    auto data = generate_random_data(size, seed);
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return path;
}

void scratch_tree::reset_local() {
    std::error_code ec;
    std::filesystem::remove_all(local_root(), ec);
}

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace kcenon::delta_fetch::benchmark
