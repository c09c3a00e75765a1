/**
 * @file peer_network.h
 * @brief Peer-to-peer overlay network consumed by the session layer
 *
 * The overlay provides peer identity, listening and dialing on a transport
 * profile, and bidirectional byte streams between connected peers. The
 * session layer never touches sockets directly.
 */

#ifndef KCENON_FASTDROP_TRANSPORT_PEER_NETWORK_H
#define KCENON_FASTDROP_TRANSPORT_PEER_NETWORK_H

#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/types.h>
#include <kcenon/fastdrop/transport/byte_stream.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::fastdrop {

/**
 * @brief Connection lifecycle event kinds
 */
enum class connection_event_kind {
    established,
    closed,
};

[[nodiscard]] constexpr auto to_string(connection_event_kind kind) -> const char* {
    switch (kind) {
        case connection_event_kind::established: return "established";
        case connection_event_kind::closed: return "closed";
        default: return "unknown";
    }
}

/**
 * @brief Connection lifecycle notification
 */
struct connection_event {
    connection_event_kind kind;
    peer_id peer;
    std::string reason;  ///< Set for closed events
};

using connection_event_callback = std::function<void(const connection_event&)>;

/**
 * @brief Stream opened by a remote peer
 */
struct inbound_stream {
    peer_id peer;
    std::unique_ptr<byte_stream> stream;
};

/**
 * @brief Peer network interface
 *
 * Implementations must be thread-safe: accept_stream() runs on the accept
 * loop while other tasks open streams and the operator may call shutdown().
 */
class peer_network {
public:
    virtual ~peer_network() = default;

    /**
     * @brief Create a fresh identity for this process
     */
    [[nodiscard]] virtual auto generate_identity() -> result<peer_id> = 0;

    [[nodiscard]] virtual auto local_peer() const -> peer_id = 0;

    /**
     * @brief Start listening on a transport profile
     * @return Bound addresses in multiaddr form
     */
    [[nodiscard]] virtual auto listen(transport_kind kind) -> result<std::vector<std::string>> = 0;

    /**
     * @brief Connect to a peer at any of the given addresses
     *
     * An established event follows on success.
     * @return dial_failed if no address leads to the peer
     */
    [[nodiscard]] virtual auto dial(const peer_id& peer,
                                    const std::vector<std::string>& addresses)
        -> result<void> = 0;

    /**
     * @brief Open a protocol stream on an established connection
     * @return stream_open_failed if the peer is not connected
     */
    [[nodiscard]] virtual auto open_stream(const peer_id& peer)
        -> result<std::unique_ptr<byte_stream>> = 0;

    /**
     * @brief Wait for the next stream opened by a remote peer
     * @return connection_timeout when @p timeout elapses, cancelled after shutdown()
     */
    [[nodiscard]] virtual auto accept_stream(std::chrono::milliseconds timeout)
        -> result<inbound_stream> = 0;

    /**
     * @brief Register the lifecycle observer (replaces any previous one)
     */
    virtual void on_connection_event(connection_event_callback callback) = 0;

    /**
     * @brief Drop the connection to one peer; a closed event follows
     */
    virtual void disconnect(const peer_id& peer) = 0;

    /**
     * @brief Stop listening and close every connection and stream
     */
    virtual void shutdown() = 0;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_TRANSPORT_PEER_NETWORK_H
