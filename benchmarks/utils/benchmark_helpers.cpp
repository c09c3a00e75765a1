/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace kcenon::fastdrop::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::string& name)
    : base_dir_(std::filesystem::temp_directory_path() / name) {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

auto temp_file_manager::create_file(const std::string& name, const std::vector<std::byte>& data)
    -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    return path;
}

auto temp_file_manager::create_random_file(const std::string& name,
                                           std::size_t size,
                                           uint32_t seed) -> std::filesystem::path {
    return create_file(name, generate_random_data(size, seed));
}

auto temp_file_manager::fresh_dir(const std::string& name) -> std::filesystem::path {
    auto dir = base_dir_ / name;
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    return dir;
}

auto format_throughput(double bytes_per_second) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes_per_second >= static_cast<double>(sizes::MB)) {
        oss << bytes_per_second / static_cast<double>(sizes::MB) << " MB/s";
    } else if (bytes_per_second >= static_cast<double>(sizes::KB)) {
        oss << bytes_per_second / static_cast<double>(sizes::KB) << " KB/s";
    } else {
        oss << bytes_per_second << " B/s";
    }

    return oss.str();
}

}  // namespace kcenon::fastdrop::benchmark
