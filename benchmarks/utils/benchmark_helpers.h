/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_FASTDROP_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_FASTDROP_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::fastdrop::benchmark {

/**
 * @brief Deterministic random payloads
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Scratch directory for benchmark inputs and outputs
 *
 * The directory and everything created in it is removed on destruction.
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::string& name = "fastdrop_benchmarks");
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Empty subdirectory, recreated on every call
     */
    auto fresh_dir(const std::string& name) -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path& { return base_dir_; }

private:
    std::filesystem::path base_dir_;
};

/**
 * @brief Format throughput as human-readable string (e.g. "500.00 MB/s")
 */
auto format_throughput(double bytes_per_second) -> std::string;

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 100 * MB;

constexpr std::size_t min_chunk = 64 * KB;
constexpr std::size_t protocol_chunk = 1 * MB;
constexpr std::size_t max_chunk = 8 * MB;
}  // namespace sizes

}  // namespace kcenon::fastdrop::benchmark

#endif  // KCENON_FASTDROP_BENCHMARKS_BENCHMARK_HELPERS_H
