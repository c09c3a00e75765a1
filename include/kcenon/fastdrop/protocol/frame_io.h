/**
 * @file frame_io.h
 * @brief Length-prefixed framing over a byte_stream
 *
 * A frame is `length:u32 (big-endian) || payload`. End of stream before a
 * length prefix is a clean close; end of stream inside a frame is an error.
 */

#ifndef KCENON_FASTDROP_PROTOCOL_FRAME_IO_H
#define KCENON_FASTDROP_PROTOCOL_FRAME_IO_H

#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/types.h>
#include <kcenon/fastdrop/transport/byte_stream.h>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace kcenon::fastdrop {

/// Size of the frame length prefix
inline constexpr std::size_t frame_header_size = 4;

/**
 * @brief Write one frame and flush
 * @return frame_too_large if payload exceeds max_frame_size, or the stream error
 */
[[nodiscard]] auto write_frame(byte_stream& stream, std::span<const std::byte> payload)
    -> result<void>;

/**
 * @brief Read one frame
 * @return Payload; std::nullopt on a clean close; truncated_frame when the
 *         stream ends inside a frame; frame_too_large when the declared
 *         length exceeds @p max_size
 */
[[nodiscard]] auto read_frame(byte_stream& stream, uint32_t max_size = max_frame_size)
    -> result<std::optional<std::vector<std::byte>>>;

// Typed helpers

[[nodiscard]] auto send_request(byte_stream& stream, const transfer_request& request)
    -> result<void>;
[[nodiscard]] auto send_response(byte_stream& stream, const transfer_response& response)
    -> result<void>;
[[nodiscard]] auto send_chunk(byte_stream& stream, const file_chunk& chunk) -> result<void>;

/**
 * @brief Read exactly one request; a close before it arrives is connection_lost
 */
[[nodiscard]] auto receive_request(byte_stream& stream) -> result<transfer_request>;

/**
 * @brief Read exactly one response; a close before it arrives is connection_lost
 */
[[nodiscard]] auto receive_response(byte_stream& stream) -> result<transfer_response>;

/**
 * @brief Read the next chunk
 * @return Chunk, or std::nullopt when the sender closed the stream cleanly
 */
[[nodiscard]] auto receive_chunk(byte_stream& stream) -> result<std::optional<file_chunk>>;

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_PROTOCOL_FRAME_IO_H
