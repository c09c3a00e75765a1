/**
 * @file fastdrop.h
 * @brief Main header for the fastdrop library
 * @version 0.1.0
 *
 * Include this header to access the sender and receiver orchestrators
 * together with the collaborator interfaces they consume.
 *
 * @code
 * #include <kcenon/fastdrop/fastdrop.h>
 *
 * using namespace kcenon::fastdrop;
 *
 * // Advertise files
 * auto sender = fastdrop_sender::builder()
 *     .with_files({"report.pdf"})
 *     .with_peer_network(network)
 *     .with_oob_channel(radio)
 *     .build();
 *
 * // Receive them on another device
 * auto receiver = fastdrop_receiver::builder()
 *     .with_peer_network(other_network)
 *     .with_oob_channel(other_radio)
 *     .with_output_directory("/downloads")
 *     .build();
 * @endcode
 */

#ifndef KCENON_FASTDROP_FASTDROP_H
#define KCENON_FASTDROP_FASTDROP_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/fastdrop/core/error_codes.h"
#include "kcenon/fastdrop/core/protocol_types.h"
#include "kcenon/fastdrop/core/transfer_utils.h"
#include "kcenon/fastdrop/core/transport_policy.h"
#include "kcenon/fastdrop/core/types.h"

// Protocol
#include "kcenon/fastdrop/protocol/session_ticket.h"

// Collaborators
#include "kcenon/fastdrop/discovery/oob_channel.h"
#include "kcenon/fastdrop/transport/peer_network.h"

// Sessions
#include "kcenon/fastdrop/session/fastdrop_receiver.h"
#include "kcenon/fastdrop/session/fastdrop_sender.h"
#include "kcenon/fastdrop/session/session_types.h"

// Adapters
#include "kcenon/fastdrop/adapters/worker_pool.h"

namespace kcenon::fastdrop {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_FASTDROP_H
