/**
 * @file wire_codec.h
 * @brief Binary encoding of protocol messages
 *
 * Payload layout (all integers big-endian):
 * @code
 * version:u8 || kind:u8 || body
 *
 * transfer_request  : request_id:u64 || ready:u8
 * transfer_response : request_id:u64 || manifest || accepted:u8
 * file_chunk        : file_index:u64 || chunk_number:u64 || total_chunks:u64 || payload:bytes
 *
 * manifest          : count:u32 || descriptor* || total_size:u64
 * descriptor        : name:string || size:u64 || has_hash:u8 || [hash:32]
 * string, bytes     : length:u32 || raw
 * @endcode
 */

#ifndef KCENON_FASTDROP_PROTOCOL_WIRE_CODEC_H
#define KCENON_FASTDROP_PROTOCOL_WIRE_CODEC_H

#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/types.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace kcenon::fastdrop {

/**
 * @brief Appends big-endian fields to a byte buffer
 */
class binary_writer {
public:
    binary_writer() = default;

    void put_u8(uint8_t value);
    void put_u32(uint32_t value);
    void put_u64(uint64_t value);
    void put_bool(bool value);
    void put_raw(std::span<const std::byte> data);

    /// Length-prefixed (u32) string
    void put_string(const std::string& value);

    /// Length-prefixed (u32) byte blob
    void put_bytes(std::span<const std::byte> data);

    /// Writes version and kind
    void put_header(message_kind kind);

    [[nodiscard]] auto size() const noexcept -> std::size_t { return buffer_.size(); }
    [[nodiscard]] auto view() const noexcept -> std::span<const std::byte> { return buffer_; }
    [[nodiscard]] auto take() -> std::vector<std::byte> { return std::move(buffer_); }

    void reserve(std::size_t n) { buffer_.reserve(n); }

private:
    std::vector<std::byte> buffer_;
};

/**
 * @brief Reads big-endian fields from a byte span
 *
 * Every getter fails with message_decode_error when the input runs out.
 */
class binary_reader {
public:
    explicit binary_reader(std::span<const std::byte> data) : data_(data) {}

    [[nodiscard]] auto get_u8() -> result<uint8_t>;
    [[nodiscard]] auto get_u32() -> result<uint32_t>;
    [[nodiscard]] auto get_u64() -> result<uint64_t>;
    [[nodiscard]] auto get_bool() -> result<bool>;
    [[nodiscard]] auto get_raw(std::size_t n) -> result<std::span<const std::byte>>;
    [[nodiscard]] auto get_string(std::size_t max_length) -> result<std::string>;
    [[nodiscard]] auto get_bytes(std::size_t max_length) -> result<std::vector<std::byte>>;

    /**
     * @brief Check version and kind
     * @return protocol_mismatch or unexpected_message on disagreement
     */
    [[nodiscard]] auto expect_header(message_kind kind) -> result<void>;

    /**
     * @brief Fail unless every byte was consumed
     */
    [[nodiscard]] auto expect_end() const -> result<void>;

    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return data_.size() - pos_; }
    [[nodiscard]] auto position() const noexcept -> std::size_t { return pos_; }

private:
    std::span<const std::byte> data_;
    std::size_t pos_ = 0;
};

/// Longest file name accepted in a manifest
inline constexpr std::size_t max_filename_length = 4096;

/// Largest chunk payload accepted by the codec (8MB)
inline constexpr std::size_t max_chunk_payload_size = 8 * 1024 * 1024;

/**
 * @brief Read the message kind of an encoded payload without decoding it
 * @return protocol_mismatch for a foreign version, message_decode_error for
 *         unknown kinds or short input
 */
[[nodiscard]] auto peek_message_kind(std::span<const std::byte> payload) -> result<message_kind>;

[[nodiscard]] auto encode_message(const transfer_request& request) -> std::vector<std::byte>;

/**
 * @brief Encode a response
 * @return message_decode_error if the manifest total does not match its files
 */
[[nodiscard]] auto encode_message(const transfer_response& response)
    -> result<std::vector<std::byte>>;

/**
 * @brief Encode a chunk
 * @return frame_too_large if the payload exceeds max_chunk_payload_size
 */
[[nodiscard]] auto encode_message(const file_chunk& chunk) -> result<std::vector<std::byte>>;

[[nodiscard]] auto decode_request(std::span<const std::byte> payload) -> result<transfer_request>;
[[nodiscard]] auto decode_response(std::span<const std::byte> payload)
    -> result<transfer_response>;
[[nodiscard]] auto decode_chunk(std::span<const std::byte> payload) -> result<file_chunk>;

/**
 * @brief Encode a manifest body (no header)
 */
void write_manifest(binary_writer& writer, const file_manifest& manifest);

/**
 * @brief Decode a manifest body (no header)
 *
 * Rejects a total_size that differs from the sum of the file sizes.
 */
[[nodiscard]] auto read_manifest(binary_reader& reader) -> result<file_manifest>;

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_PROTOCOL_WIRE_CODEC_H
