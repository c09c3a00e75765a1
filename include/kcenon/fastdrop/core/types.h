/**
 * @file types.h
 * @brief Core type definitions for fastdrop
 */

#ifndef KCENON_FASTDROP_CORE_TYPES_H
#define KCENON_FASTDROP_CORE_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::fastdrop {

/**
 * @brief Error codes for fastdrop operations
 *
 * Ranges follow the failure taxonomy: setup failures are fatal before any
 * network activity, everything else is local to one session or stream.
 */
enum class error_code {
    success = 0,

    // Setup errors (-100 to -119)
    no_input_files = -100,
    file_not_found = -101,
    not_regular_file = -102,
    file_read_error = -103,
    file_too_large = -104,
    aggregate_too_large = -105,
    ticket_too_large = -106,
    no_reachable_address = -107,
    invalid_configuration = -108,

    // Discovery errors (-120 to -139)
    radio_unavailable = -120,
    no_devices_found = -121,
    invalid_selection = -122,
    payload_unavailable = -123,
    already_advertising = -124,
    payload_too_large = -125,

    // Handshake errors (-140 to -159)
    ticket_decode_error = -140,
    ticket_auth_failed = -141,
    dial_failed = -142,
    connection_timeout = -143,
    stream_open_failed = -144,

    // Protocol and stream errors (-160 to -179)
    truncated_frame = -160,
    frame_too_large = -161,
    message_decode_error = -162,
    protocol_mismatch = -163,
    unexpected_message = -164,
    invalid_file_index = -165,
    chunk_sequence_error = -166,
    transfer_rejected = -167,
    invalid_filename = -168,
    connection_lost = -169,
    file_write_error = -170,

    // Integrity errors (-180 to -199)
    file_hash_mismatch = -180,
    file_size_mismatch = -181,
    incomplete_transfer = -182,

    // Internal errors (-200 to -219)
    internal_error = -200,
    not_initialized = -201,
    already_initialized = -202,
    invalid_state_transition = -203,
    cancelled = -204,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::no_input_files:
            return "no input files";
        case error_code::file_not_found:
            return "file not found";
        case error_code::not_regular_file:
            return "not a regular file";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_too_large:
            return "file exceeds per-file limit";
        case error_code::aggregate_too_large:
            return "transfer exceeds aggregate limit";
        case error_code::ticket_too_large:
            return "session ticket exceeds advertisable payload";
        case error_code::no_reachable_address:
            return "no reachable listen address";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::radio_unavailable:
            return "out-of-band radio unavailable";
        case error_code::no_devices_found:
            return "no devices found";
        case error_code::invalid_selection:
            return "invalid device selection";
        case error_code::payload_unavailable:
            return "advertised payload unavailable";
        case error_code::already_advertising:
            return "another advertisement is active";
        case error_code::payload_too_large:
            return "advertised payload too large";
        case error_code::ticket_decode_error:
            return "session ticket decode error";
        case error_code::ticket_auth_failed:
            return "session ticket authentication failed";
        case error_code::dial_failed:
            return "dial failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::stream_open_failed:
            return "stream open failed";
        case error_code::truncated_frame:
            return "truncated frame";
        case error_code::frame_too_large:
            return "frame too large";
        case error_code::message_decode_error:
            return "message decode error";
        case error_code::protocol_mismatch:
            return "protocol version mismatch";
        case error_code::unexpected_message:
            return "unexpected message kind";
        case error_code::invalid_file_index:
            return "file index out of range";
        case error_code::chunk_sequence_error:
            return "chunk sequence error";
        case error_code::transfer_rejected:
            return "transfer rejected by sender";
        case error_code::invalid_filename:
            return "invalid file name";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::file_write_error:
            return "file write error";
        case error_code::file_hash_mismatch:
            return "SHA-256 verification failed";
        case error_code::file_size_mismatch:
            return "file size mismatch";
        case error_code::incomplete_transfer:
            return "incomplete transfer";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        case error_code::already_initialized:
            return "already initialized";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::cancelled:
            return "cancelled";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Identity of a peer on the data-channel network
 */
struct peer_id {
    std::string value;

    peer_id() = default;
    explicit peer_id(std::string v) : value(std::move(v)) {}

    [[nodiscard]] auto empty() const noexcept -> bool { return value.empty(); }
    [[nodiscard]] auto operator==(const peer_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const peer_id& other) const -> bool {
        return value < other.value;
    }
};

}  // namespace kcenon::fastdrop

// Hash support for peer_id
template <>
struct std::hash<kcenon::fastdrop::peer_id> {
    auto operator()(const kcenon::fastdrop::peer_id& id) const noexcept -> std::size_t {
        return std::hash<std::string>{}(id.value);
    }
};

#endif  // KCENON_FASTDROP_CORE_TYPES_H
