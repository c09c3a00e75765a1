/**
 * @file loopback_network.cpp
 * @brief Implementation of the in-process peer network
 */

#include <kcenon/fastdrop/transport/loopback_network.h>

#include <kcenon/fastdrop/core/logging.h>
#include <kcenon/fastdrop/transport/memory_stream.h>

#include <algorithm>
#include <array>

#include <openssl/rand.h>

namespace kcenon::fastdrop {

namespace {

auto make_address(const std::string& host, uint16_t port, transport_kind kind) -> std::string {
    if (kind == transport_kind::quic) {
        return "/ip4/" + host + "/udp/" + std::to_string(port) + "/quic-v1";
    }
    return "/ip4/" + host + "/tcp/" + std::to_string(port);
}

}  // namespace

// loopback_hub implementation

auto loopback_hub::create() -> std::shared_ptr<loopback_hub> {
    return std::shared_ptr<loopback_hub>(new loopback_hub());
}

auto loopback_hub::create_network() -> std::shared_ptr<loopback_peer_network> {
    return std::make_shared<loopback_peer_network>(shared_from_this());
}

auto loopback_hub::register_listener(const peer_id& peer,
                                     transport_kind kind,
                                     std::weak_ptr<loopback_peer_network> network)
    -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& entry = listeners_[peer];
    if (entry.host == 0) {
        entry.host = next_host_++;
    }
    entry.network = std::move(network);

    auto port = next_port_++;
    std::vector<std::string> bound = {
        make_address("127.0.0.1", port, kind),
        make_address("10.0.0." + std::to_string(entry.host), port, kind),
    };
    entry.addresses.insert(entry.addresses.end(), bound.begin(), bound.end());
    return bound;
}

void loopback_hub::join(const peer_id& peer, std::weak_ptr<loopback_peer_network> network) {
    std::lock_guard<std::mutex> lock(mutex_);
    members_[peer] = std::move(network);
}

void loopback_hub::unregister(const peer_id& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(peer);
    members_.erase(peer);
}

auto loopback_hub::resolve(const peer_id& peer, const std::vector<std::string>& addresses)
    -> std::shared_ptr<loopback_peer_network> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(peer);
    if (it == listeners_.end()) {
        return nullptr;
    }
    const auto& bound = it->second.addresses;
    bool reachable = std::any_of(addresses.begin(), addresses.end(), [&bound](const auto& a) {
        return std::find(bound.begin(), bound.end(), a) != bound.end();
    });
    return reachable ? it->second.network.lock() : nullptr;
}

auto loopback_hub::find(const peer_id& peer) -> std::shared_ptr<loopback_peer_network> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(peer);
    return it == members_.end() ? nullptr : it->second.lock();
}

// loopback_peer_network implementation

loopback_peer_network::loopback_peer_network(std::shared_ptr<loopback_hub> hub)
    : hub_(std::move(hub)) {}

loopback_peer_network::~loopback_peer_network() {
    shutdown();
}

auto loopback_peer_network::generate_identity() -> result<peer_id> {
    std::array<unsigned char, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        return unexpected(error{error_code::internal_error, "cannot generate peer identity"});
    }

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string id = "12D3KooW";
    for (auto b : raw) {
        id.push_back(hex_chars[b >> 4]);
        id.push_back(hex_chars[b & 0x0F]);
    }

    peer_id self(std::move(id));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        self_ = self;
    }
    hub_->join(self, weak_from_this());
    return self;
}

auto loopback_peer_network::local_peer() const -> peer_id {
    std::lock_guard<std::mutex> lock(mutex_);
    return self_;
}

auto loopback_peer_network::listen(transport_kind kind) -> result<std::vector<std::string>> {
    peer_id self;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (self_.empty()) {
            return unexpected(error{error_code::not_initialized, "no identity; call generate_identity()"});
        }
        if (shut_down_) {
            return unexpected(error{error_code::cancelled, "network is shut down"});
        }
        self = self_;
    }

    auto bound = hub_->register_listener(self, kind, weak_from_this());
    for (const auto& address : bound) {
        FD_LOG_DEBUG(log_category::session, "Listening on " + address);
    }
    return bound;
}

auto loopback_peer_network::dial(const peer_id& peer, const std::vector<std::string>& addresses)
    -> result<void> {
    peer_id self = local_peer();
    if (self.empty()) {
        return unexpected(error{error_code::not_initialized, "no identity; call generate_identity()"});
    }
    if (peer == self) {
        return unexpected(error{error_code::dial_failed, "cannot dial self"});
    }

    auto target = hub_->resolve(peer, addresses);
    if (!target) {
        return unexpected(error{error_code::dial_failed,
                                "no listener for " + peer.value + " at " +
                                    std::to_string(addresses.size()) + " address(es)"});
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return unexpected(error{error_code::cancelled, "network is shut down"});
        }
    }

    target->add_connection(self);
    add_connection(peer);
    return {};
}

auto loopback_peer_network::open_stream(const peer_id& peer)
    -> result<std::unique_ptr<byte_stream>> {
    peer_id self;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return unexpected(error{error_code::stream_open_failed, "network is shut down"});
        }
        if (connections_.count(peer) == 0) {
            return unexpected(
                error{error_code::stream_open_failed, "not connected to " + peer.value});
        }
        self = self_;
    }

    auto target = hub_->find(peer);
    if (!target) {
        return unexpected(error{error_code::stream_open_failed, peer.value + " is gone"});
    }

    auto [local, remote] = make_stream_pair();
    auto severer = local->severer();
    track_stream(peer, severer);
    target->track_stream(self, severer);

    if (!target->deliver(self, std::move(remote))) {
        return unexpected(
            error{error_code::stream_open_failed, peer.value + " is not accepting streams"});
    }
    return std::unique_ptr<byte_stream>(std::move(local));
}

auto loopback_peer_network::accept_stream(std::chrono::milliseconds timeout)
    -> result<inbound_stream> {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = inbound_ready_.wait_for(lock, timeout, [this] {
        return shut_down_ || !inbound_.empty();
    });

    if (shut_down_) {
        return unexpected(error{error_code::cancelled, "network is shut down"});
    }
    if (!ready) {
        return unexpected(error{error_code::connection_timeout, "no inbound stream"});
    }

    auto next = std::move(inbound_.front());
    inbound_.pop_front();
    return next;
}

void loopback_peer_network::on_connection_event(connection_event_callback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(callback);
}

void loopback_peer_network::disconnect(const peer_id& peer) {
    peer_id self = local_peer();
    drop_connection(peer, "closed locally");
    if (auto target = hub_->find(peer)) {
        target->drop_connection(self, "closed by peer");
    }
}

void loopback_peer_network::shutdown() {
    std::set<peer_id> peers;
    std::multimap<peer_id, std::function<void()>> severers;
    std::deque<inbound_stream> pending;
    peer_id self;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        peers.swap(connections_);
        severers.swap(severers_);
        pending.swap(inbound_);
        self = self_;
    }
    inbound_ready_.notify_all();

    if (!self.empty()) {
        hub_->unregister(self);
    }
    for (auto& [peer, sever] : severers) {
        sever();
    }
    pending.clear();

    for (const auto& peer : peers) {
        emit(connection_event{connection_event_kind::closed, peer, "local shutdown"});
        if (auto target = hub_->find(peer)) {
            target->drop_connection(self, "peer shut down");
        }
    }
}

auto loopback_peer_network::is_connected(const peer_id& peer) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.count(peer) != 0;
}

auto loopback_peer_network::add_connection(const peer_id& peer) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_ || !connections_.insert(peer).second) {
            return false;
        }
    }
    emit(connection_event{connection_event_kind::established, peer, {}});
    return true;
}

void loopback_peer_network::drop_connection(const peer_id& peer, const std::string& reason) {
    std::vector<std::function<void()>> to_sever;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connections_.erase(peer) == 0) {
            return;
        }
        auto [first, last] = severers_.equal_range(peer);
        for (auto it = first; it != last; ++it) {
            to_sever.push_back(it->second);
        }
        severers_.erase(first, last);
    }

    for (auto& sever : to_sever) {
        sever();
    }
    emit(connection_event{connection_event_kind::closed, peer, reason});
}

auto loopback_peer_network::deliver(const peer_id& from, std::unique_ptr<byte_stream> stream)
    -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return false;
        }
        inbound_.push_back(inbound_stream{from, std::move(stream)});
    }
    inbound_ready_.notify_one();
    return true;
}

void loopback_peer_network::track_stream(const peer_id& peer, std::function<void()> severer) {
    std::lock_guard<std::mutex> lock(mutex_);
    severers_.emplace(peer, std::move(severer));
}

void loopback_peer_network::emit(const connection_event& event) {
    connection_event_callback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = callback_;
    }

    FD_LOG_DEBUG(log_category::session,
                 std::string("Connection ") + to_string(event.kind) + ": " + event.peer.value +
                     (event.reason.empty() ? "" : " (" + event.reason + ")"));
    if (callback) {
        callback(event);
    }
}

}  // namespace kcenon::fastdrop
