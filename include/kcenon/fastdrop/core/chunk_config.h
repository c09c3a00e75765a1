/**
 * @file chunk_config.h
 * @brief Chunk sizing shared by the splitter and the receiver
 */

#ifndef KCENON_FASTDROP_CORE_CHUNK_CONFIG_H
#define KCENON_FASTDROP_CORE_CHUNK_CONFIG_H

#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/types.h>

#include <cstddef>
#include <string>

namespace kcenon::fastdrop {

/**
 * @brief Chunk sizing parameters
 *
 * Peers only interoperate at protocol_chunk_size. Other power-of-two sizes
 * exist for tests and benchmarks that exercise the chunk arithmetic.
 */
struct chunk_config {
    /// Protocol chunk size (1MB)
    static constexpr std::size_t default_chunk_size = protocol_chunk_size;

    /// Largest chunk that still fits one frame with its header (8MB)
    static constexpr std::size_t max_chunk_size = 8 * 1024 * 1024;

    std::size_t chunk_size = default_chunk_size;

    chunk_config() = default;

    explicit chunk_config(std::size_t size) : chunk_size(size) {}

    /**
     * @brief Validate configuration
     * @return Success if chunk_size is a power of two within limits
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0 || (chunk_size & (chunk_size - 1)) != 0) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunk size must be a power of two: " + std::to_string(chunk_size)});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_configuration,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        return {};
    }

    /**
     * @brief Number of chunks needed for a file
     *
     * An empty file still takes one (empty) chunk so that completion fires.
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 1;
        return (file_size + chunk_size - 1) / chunk_size;
    }
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_CORE_CHUNK_CONFIG_H
