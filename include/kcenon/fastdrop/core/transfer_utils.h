/**
 * @file transfer_utils.h
 * @brief Formatting helpers for transfer progress reporting
 */

#ifndef KCENON_FASTDROP_CORE_TRANSFER_UTILS_H
#define KCENON_FASTDROP_CORE_TRANSFER_UTILS_H

#include <array>
#include <cstdint>
#include <cstdio>
#include <string>

namespace kcenon::fastdrop {

/**
 * @brief Render a byte count with two decimals ("1.50 MB")
 *
 * Units step by 1024 and stop at TB.
 */
[[nodiscard]] inline auto format_bytes(uint64_t bytes) -> std::string {
    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};

    auto size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (size >= 1024.0 && unit + 1 < units.size()) {
        size /= 1024.0;
        ++unit;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    return buf;
}

/**
 * @brief Percentage of total received, 0 when total is 0
 */
[[nodiscard]] constexpr auto calculate_progress(uint64_t received, uint64_t total) -> double {
    if (total == 0) return 0.0;
    return static_cast<double>(received) / static_cast<double>(total) * 100.0;
}

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_CORE_TRANSFER_UTILS_H
