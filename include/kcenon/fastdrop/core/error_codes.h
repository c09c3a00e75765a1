/**
 * @file error_codes.h
 * @brief Error categories and propagation helpers for fastdrop
 *
 * Error code ranges:
 * - -100 to -119: Setup Errors (fatal for the whole process)
 * - -120 to -139: Discovery Errors (recoverable, back to idle)
 * - -140 to -159: Handshake Errors (abort one session)
 * - -160 to -179: Protocol and Stream Errors (abort one stream)
 * - -180 to -199: Integrity Errors (file kept, flagged unverified)
 * - -200 to -219: Internal Errors
 */

#ifndef KCENON_FASTDROP_CORE_ERROR_CODES_H
#define KCENON_FASTDROP_CORE_ERROR_CODES_H

#include <kcenon/fastdrop/core/types.h>

#include <cstdint>
#include <string_view>

namespace kcenon::fastdrop {

/**
 * @brief Failure class an error code belongs to
 */
enum class error_category {
    none,
    setup,
    discovery,
    handshake,
    protocol,
    integrity,
    internal,
};

/**
 * @brief Convert error_category to string
 */
[[nodiscard]] constexpr auto to_string(error_category category) noexcept
    -> std::string_view {
    switch (category) {
        case error_category::none: return "none";
        case error_category::setup: return "setup";
        case error_category::discovery: return "discovery";
        case error_category::handshake: return "handshake";
        case error_category::protocol: return "protocol";
        case error_category::integrity: return "integrity";
        case error_category::internal: return "internal";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_setup_error(int32_t code) noexcept -> bool {
    return code <= -100 && code >= -119;
}

[[nodiscard]] constexpr auto is_discovery_error(int32_t code) noexcept -> bool {
    return code <= -120 && code >= -139;
}

[[nodiscard]] constexpr auto is_handshake_error(int32_t code) noexcept -> bool {
    return code <= -140 && code >= -159;
}

[[nodiscard]] constexpr auto is_protocol_error(int32_t code) noexcept -> bool {
    return code <= -160 && code >= -179;
}

[[nodiscard]] constexpr auto is_integrity_error(int32_t code) noexcept -> bool {
    return code <= -180 && code >= -199;
}

[[nodiscard]] constexpr auto is_internal_error(int32_t code) noexcept -> bool {
    return code <= -200 && code >= -219;
}

/**
 * @brief Classify an error code
 */
[[nodiscard]] constexpr auto category_of(error_code code) noexcept -> error_category {
    const auto value = static_cast<int32_t>(code);
    if (value == 0) return error_category::none;
    if (is_setup_error(value)) return error_category::setup;
    if (is_discovery_error(value)) return error_category::discovery;
    if (is_handshake_error(value)) return error_category::handshake;
    if (is_protocol_error(value)) return error_category::protocol;
    if (is_integrity_error(value)) return error_category::integrity;
    return error_category::internal;
}

/**
 * @brief Check if the error must terminate the process
 *
 * Only setup errors are terminal. Failures on one peer's stream never
 * propagate past that peer's session.
 */
[[nodiscard]] constexpr auto is_process_fatal(error_code code) noexcept -> bool {
    return category_of(code) == error_category::setup;
}

/**
 * @brief Check if the operator may simply retry discovery
 */
[[nodiscard]] constexpr auto is_recoverable(error_code code) noexcept -> bool {
    switch (category_of(code)) {
        case error_category::discovery:
        case error_category::handshake:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Process exit status for a failed operation
 */
[[nodiscard]] constexpr auto exit_status(error_code code) noexcept -> int {
    switch (category_of(code)) {
        case error_category::none: return 0;
        case error_category::setup: return 2;
        case error_category::discovery: return 3;
        case error_category::handshake: return 4;
        case error_category::protocol: return 5;
        case error_category::integrity: return 6;
        default: return 1;
    }
}

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_CORE_ERROR_CODES_H
