/**
 * @file session_event.h
 * @brief Closed set of events that drive a session state machine
 */

#ifndef KCENON_FASTDROP_SESSION_SESSION_EVENT_H
#define KCENON_FASTDROP_SESSION_SESSION_EVENT_H

#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace kcenon::fastdrop {

/// The peer network confirmed a live connection
struct connection_established {
    peer_id peer;
};

/// The peer network dropped the connection
struct connection_closed {
    peer_id peer;
    std::string reason;
};

/// Sender side: the one request of this stream arrived
struct request_received {
    transfer_request request;
};

/// Receiver side: the sender answered
struct response_received {
    uint64_t request_id = 0;
    bool accepted = false;
    std::size_t file_count = 0;
};

/// Receiver side: a chunk was written to disk
struct chunk_received {
    uint64_t file_index = 0;
    uint64_t chunk_number = 0;
    uint64_t total_chunks = 0;
    std::size_t bytes = 0;
};

/// The protocol stream ended
struct stream_closed {
    bool clean = true;       ///< End of stream at a frame boundary
    std::string reason;      ///< Set when not clean
};

/// A deadline elapsed (idle timeout, connect timeout)
struct timer_fired {
    std::string timer;
};

using session_event = std::variant<connection_established,
                                   connection_closed,
                                   request_received,
                                   response_received,
                                   chunk_received,
                                   stream_closed,
                                   timer_fired>;

/**
 * @brief Visitor built from lambdas
 *
 * @code
 * std::visit(overloaded{
 *     [](const chunk_received& e) { ... },
 *     [](const auto&) {},
 * }, event);
 * @endcode
 */
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

[[nodiscard]] inline auto event_name(const session_event& event) -> const char* {
    return std::visit(overloaded{
                          [](const connection_established&) { return "connection_established"; },
                          [](const connection_closed&) { return "connection_closed"; },
                          [](const request_received&) { return "request_received"; },
                          [](const response_received&) { return "response_received"; },
                          [](const chunk_received&) { return "chunk_received"; },
                          [](const stream_closed&) { return "stream_closed"; },
                          [](const timer_fired&) { return "timer_fired"; },
                      },
                      event);
}

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_SESSION_SESSION_EVENT_H
