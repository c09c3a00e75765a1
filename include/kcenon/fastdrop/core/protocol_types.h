/**
 * @file protocol_types.h
 * @brief Protocol constants, transport profiles and message types for fastdrop
 *
 * Every message travels as one frame: a big-endian u32 length followed by a
 * payload that starts with the wire version and the message kind.
 */

#ifndef KCENON_FASTDROP_CORE_PROTOCOL_TYPES_H
#define KCENON_FASTDROP_CORE_PROTOCOL_TYPES_H

#include <kcenon/fastdrop/core/checksum.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::fastdrop {

/**
 * @brief Stream protocol identifier negotiated on the peer network
 */
inline constexpr std::string_view protocol_id = "/fastdrop/transfer/1.0.0";

/**
 * @brief Payload wire version
 */
inline constexpr uint8_t wire_version = 1;

/**
 * @brief Fixed chunk size shared by both ends (1 MiB)
 *
 * Changing this breaks compatibility with existing peers.
 */
inline constexpr std::size_t protocol_chunk_size = 1024 * 1024;

/**
 * @brief Largest frame payload a reader accepts
 */
inline constexpr uint32_t max_frame_size = 16 * 1024 * 1024;

/**
 * @brief Largest value one out-of-band read can return (ATT attribute limit)
 */
inline constexpr std::size_t max_oob_payload_size = 512;

/**
 * @brief Name broadcast by the sender's advertisement
 */
inline constexpr std::string_view default_display_name = "Fastdrop";

/// Default per-file cap (100 MiB)
inline constexpr uint64_t default_max_file_size = 100ULL * 1024 * 1024;

/// Default aggregate cap (500 MiB)
inline constexpr uint64_t default_max_total_size = 500ULL * 1024 * 1024;

/**
 * @brief Data-channel transport profile
 */
enum class transport_kind : uint8_t {
    quic = 0,  ///< Profile A: multiplexed, low per-stream setup latency
    tcp = 1,   ///< Profile B: few large sequential transfers
};

[[nodiscard]] constexpr auto to_string(transport_kind kind) -> const char* {
    switch (kind) {
        case transport_kind::quic: return "quic";
        case transport_kind::tcp: return "tcp";
        default: return "unknown";
    }
}

/**
 * @brief Out-of-band identifiers for a transport profile
 */
struct transport_profile {
    transport_kind kind;
    std::string_view discovery_id;  ///< Advertised service identifier
    std::string_view payload_id;    ///< Readable characteristic carrying the ticket
};

inline constexpr transport_profile quic_profile{
    transport_kind::quic,
    "12345678-1234-5678-1234-56789ABCDEF0",
    "ABCDEFAB-CDEF-1234-5678-1234567890AB"};

inline constexpr transport_profile tcp_profile{
    transport_kind::tcp,
    "87654321-4321-8765-4321-FEDCBA9876543",
    "BAFEDCBA-FEDC-4321-8765-BA0987654321"};

[[nodiscard]] constexpr auto profile_for(transport_kind kind) -> const transport_profile& {
    return kind == transport_kind::quic ? quic_profile : tcp_profile;
}

/**
 * @brief Look up the profile advertising a discovery identifier
 */
[[nodiscard]] auto profile_for_discovery_id(std::string_view discovery_id)
    -> std::optional<transport_profile>;

/**
 * @brief Message kinds carried after the wire version byte
 */
enum class message_kind : uint8_t {
    transfer_request = 0x01,
    transfer_response = 0x02,
    file_chunk = 0x03,
    session_ticket = 0x10,
};

[[nodiscard]] constexpr auto to_string(message_kind kind) -> const char* {
    switch (kind) {
        case message_kind::transfer_request: return "transfer_request";
        case message_kind::transfer_response: return "transfer_response";
        case message_kind::file_chunk: return "file_chunk";
        case message_kind::session_ticket: return "session_ticket";
        default: return "unknown";
    }
}

/**
 * @brief One file offered by the sender
 */
struct file_descriptor {
    std::string name;
    uint64_t size = 0;
    std::optional<sha256_digest> content_hash;

    [[nodiscard]] auto operator==(const file_descriptor& other) const -> bool = default;
};

/**
 * @brief Ordered file list; the position of an entry is its file index
 */
struct file_manifest {
    std::vector<file_descriptor> files;
    uint64_t total_size = 0;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return files.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return files.empty(); }
    [[nodiscard]] auto operator==(const file_manifest& other) const -> bool = default;
};

/**
 * @brief Sent once by the receiver to open a transfer
 */
struct transfer_request {
    uint64_t request_id = 0;
    bool ready = false;

    [[nodiscard]] auto operator==(const transfer_request& other) const -> bool = default;
};

/**
 * @brief Sender's answer, always before any chunk
 */
struct transfer_response {
    uint64_t request_id = 0;
    file_manifest manifest;
    bool accepted = false;

    [[nodiscard]] auto operator==(const transfer_response& other) const -> bool = default;
};

/**
 * @brief Slice of one file's bytes
 */
struct file_chunk {
    uint64_t file_index = 0;
    uint64_t chunk_number = 0;
    uint64_t total_chunks = 0;
    std::vector<std::byte> payload;

    [[nodiscard]] auto operator==(const file_chunk& other) const -> bool = default;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_CORE_PROTOCOL_TYPES_H
