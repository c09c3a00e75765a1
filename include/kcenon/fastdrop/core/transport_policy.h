/**
 * @file transport_policy.h
 * @brief Data-channel transport selection and manifest construction
 */

#ifndef KCENON_FASTDROP_CORE_TRANSPORT_POLICY_H
#define KCENON_FASTDROP_CORE_TRANSPORT_POLICY_H

#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/types.h>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace kcenon::fastdrop {

/**
 * @brief Size caps enforced before any network activity
 */
struct size_limits {
    uint64_t max_file_size = default_max_file_size;
    uint64_t max_total_size = default_max_total_size;
};

/// Transfers with more files than this always use the multiplexed profile
inline constexpr std::size_t multiplex_file_count_threshold = 5;

/// Transfers smaller than this always use the multiplexed profile (100MB)
inline constexpr uint64_t multiplex_total_size_threshold = 100ULL * 1024 * 1024;

/**
 * @brief Pick the transport for a transfer of the given shape
 *
 * quic when file_count > 5 or total_size < 100MB, tcp otherwise.
 */
[[nodiscard]] constexpr auto select_transport(std::size_t file_count, uint64_t total_size)
    -> transport_kind {
    if (file_count > multiplex_file_count_threshold ||
        total_size < multiplex_total_size_threshold) {
        return transport_kind::quic;
    }
    return transport_kind::tcp;
}

/**
 * @brief Outcome of analyzing the files to send
 */
struct transfer_plan {
    transport_kind transport = transport_kind::quic;
    file_manifest manifest;
    std::vector<std::filesystem::path> paths;  ///< Same order as manifest.files
};

/**
 * @brief Validate the input files, hash them and choose a transport
 *
 * Every path must exist and be a regular file. Sizes are checked against
 * @p limits before any file is hashed. Any failure aborts the whole analysis.
 *
 * @param paths Files to send, in manifest order
 * @param limits Per-file and aggregate caps
 * @return Plan, or a setup error (no_input_files, file_not_found,
 *         not_regular_file, file_too_large, aggregate_too_large, file_read_error)
 */
[[nodiscard]] auto analyze_files(
    const std::vector<std::filesystem::path>& paths,
    const size_limits& limits = {}) -> result<transfer_plan>;

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_CORE_TRANSPORT_POLICY_H
