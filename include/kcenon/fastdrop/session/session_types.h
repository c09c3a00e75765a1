/**
 * @file session_types.h
 * @brief Configuration and result types for the sender and receiver orchestrators
 */

#ifndef KCENON_FASTDROP_SESSION_SESSION_TYPES_H
#define KCENON_FASTDROP_SESSION_SESSION_TYPES_H

#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/transfer_receiver.h>
#include <kcenon/fastdrop/core/transport_policy.h>
#include <kcenon/fastdrop/core/types.h>
#include <kcenon/fastdrop/discovery/oob_channel.h>
#include <kcenon/fastdrop/session/session_state.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::fastdrop {

/// Idle peer streams are torn down after this long without data
inline constexpr std::chrono::milliseconds default_idle_timeout{std::chrono::minutes(5)};

/// Wall-clock length of one discovery scan
inline constexpr std::chrono::milliseconds default_scan_window{std::chrono::seconds(15)};

/// How long the receiver waits for the connection to be confirmed
inline constexpr std::chrono::milliseconds default_connect_timeout{std::chrono::seconds(30)};

/// Concurrent sender sessions before new requests are declined
inline constexpr std::size_t default_max_sessions = 8;

/**
 * @brief Sender lifecycle
 */
enum class sender_state {
    stopped,
    starting,
    advertising,
    stopping,
};

[[nodiscard]] constexpr auto to_string(sender_state state) -> const char* {
    switch (state) {
        case sender_state::stopped: return "stopped";
        case sender_state::starting: return "starting";
        case sender_state::advertising: return "advertising";
        case sender_state::stopping: return "stopping";
        default: return "unknown";
    }
}

/**
 * @brief Sender configuration
 */
struct sender_config {
    std::vector<std::filesystem::path> files;
    size_limits limits;
    std::string display_name{default_display_name};
    std::chrono::milliseconds idle_timeout = default_idle_timeout;
    std::size_t max_sessions = default_max_sessions;
};

/**
 * @brief Receiver configuration
 */
struct receiver_config {
    std::filesystem::path output_dir;
    std::chrono::milliseconds scan_window = default_scan_window;
    std::chrono::milliseconds connect_timeout = default_connect_timeout;
    std::chrono::milliseconds idle_timeout = default_idle_timeout;
};

/**
 * @brief How one sender session ended
 */
struct session_summary {
    peer_id peer;
    uint64_t request_id = 0;
    bool ready = false;                  ///< What the receiver asked for
    bool accepted = false;               ///< What the sender answered
    session_state final_state = session_state::idle;
    error failure;                       ///< Set when final_state is failed
    uint64_t chunks_sent = 0;
    uint64_t bytes_sent = 0;
    uint64_t duration_ms = 0;
};

using session_complete_callback = std::function<void(const session_summary&)>;

/**
 * @brief Result of a receive session
 *
 * Returned even when streaming failed part way: files completed before the
 * failure are listed as such in report.
 */
struct transfer_outcome {
    peer_id peer;
    transport_kind transport = transport_kind::quic;
    uint64_t request_id = 0;
    file_manifest manifest;
    receive_report report;
    session_state final_state = session_state::idle;
    error failure;  ///< Set when final_state is failed
};

/**
 * @brief Picks a device from the discovered candidates
 * @return 1-based index, or std::nullopt to abort
 */
using device_selector =
    std::function<std::optional<std::size_t>(const std::vector<discovered_device>&)>;

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_SESSION_SESSION_TYPES_H
