/**
 * @file loopback_network.h
 * @brief In-process peer network for tests and the local demo
 */

#ifndef KCENON_FASTDROP_TRANSPORT_LOOPBACK_NETWORK_H
#define KCENON_FASTDROP_TRANSPORT_LOOPBACK_NETWORK_H

#include <kcenon/fastdrop/transport/peer_network.h>

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>

namespace kcenon::fastdrop {

class loopback_peer_network;

/**
 * @brief Shared address space connecting loopback_peer_network instances
 *
 * Every listening network gets a private host address 10.0.0.N in addition
 * to 127.0.0.1, so tickets built from its addresses survive loopback
 * filtering.
 */
class loopback_hub : public std::enable_shared_from_this<loopback_hub> {
public:
    [[nodiscard]] static auto create() -> std::shared_ptr<loopback_hub>;

    /**
     * @brief Create a network attached to this hub
     */
    [[nodiscard]] auto create_network() -> std::shared_ptr<loopback_peer_network>;

    /**
     * @brief Make a network reachable by identity for lifecycle notifications
     */
    void join(const peer_id& peer, std::weak_ptr<loopback_peer_network> network);

    /**
     * @brief Bind addresses for a listening network
     */
    [[nodiscard]] auto register_listener(const peer_id& peer,
                                         transport_kind kind,
                                         std::weak_ptr<loopback_peer_network> network)
        -> std::vector<std::string>;

    void unregister(const peer_id& peer);

    /**
     * @brief Find the network of @p peer if it listens on one of @p addresses
     */
    [[nodiscard]] auto resolve(const peer_id& peer, const std::vector<std::string>& addresses)
        -> std::shared_ptr<loopback_peer_network>;

    [[nodiscard]] auto find(const peer_id& peer) -> std::shared_ptr<loopback_peer_network>;

private:
    loopback_hub() = default;

    struct listener_entry {
        std::weak_ptr<loopback_peer_network> network;
        std::vector<std::string> addresses;
        uint32_t host = 0;
    };

    std::mutex mutex_;
    std::map<peer_id, listener_entry> listeners_;
    std::map<peer_id, std::weak_ptr<loopback_peer_network>> members_;
    uint32_t next_host_ = 2;
    uint16_t next_port_ = 40000;
};

/**
 * @brief peer_network backed by memory_stream pairs
 */
class loopback_peer_network : public peer_network,
                              public std::enable_shared_from_this<loopback_peer_network> {
public:
    explicit loopback_peer_network(std::shared_ptr<loopback_hub> hub);
    ~loopback_peer_network() override;

    [[nodiscard]] auto generate_identity() -> result<peer_id> override;
    [[nodiscard]] auto local_peer() const -> peer_id override;
    [[nodiscard]] auto listen(transport_kind kind) -> result<std::vector<std::string>> override;
    [[nodiscard]] auto dial(const peer_id& peer, const std::vector<std::string>& addresses)
        -> result<void> override;
    [[nodiscard]] auto open_stream(const peer_id& peer)
        -> result<std::unique_ptr<byte_stream>> override;
    [[nodiscard]] auto accept_stream(std::chrono::milliseconds timeout)
        -> result<inbound_stream> override;
    void on_connection_event(connection_event_callback callback) override;
    void disconnect(const peer_id& peer) override;
    void shutdown() override;

    [[nodiscard]] auto is_connected(const peer_id& peer) const -> bool;

private:
    friend class loopback_hub;

    auto add_connection(const peer_id& peer) -> bool;
    void drop_connection(const peer_id& peer, const std::string& reason);
    auto deliver(const peer_id& from, std::unique_ptr<byte_stream> stream) -> bool;
    void track_stream(const peer_id& peer, std::function<void()> severer);
    void emit(const connection_event& event);

    std::shared_ptr<loopback_hub> hub_;

    mutable std::mutex mutex_;
    std::condition_variable inbound_ready_;
    peer_id self_;
    bool shut_down_ = false;
    std::set<peer_id> connections_;
    std::deque<inbound_stream> inbound_;
    std::multimap<peer_id, std::function<void()>> severers_;

    std::mutex callback_mutex_;
    connection_event_callback callback_;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_TRANSPORT_LOOPBACK_NETWORK_H
