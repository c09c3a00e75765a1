/**
 * @file fastdrop_sender.cpp
 * @brief Sender orchestrator implementation
 */

#include <kcenon/fastdrop/session/fastdrop_sender.h>

#include <kcenon/fastdrop/adapters/worker_pool.h>
#include <kcenon/fastdrop/core/logging.h>
#include <kcenon/fastdrop/core/transfer_utils.h>
#include <kcenon/fastdrop/session/sender_session.h>
#include <kcenon/fastdrop/session/session_state.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <unordered_map>

namespace kcenon::fastdrop {

namespace {

/// How often the accept loop re-checks for stop()
constexpr std::chrono::milliseconds accept_poll_interval{250};

}  // namespace

struct fastdrop_sender::impl {
    sender_config config;
    std::shared_ptr<peer_network> network;
    std::shared_ptr<oob_channel> channel;
    std::shared_ptr<const ticket_authenticator> authenticator;
    std::shared_ptr<adapters::worker_pool_interface> pool;

    std::atomic<sender_state> current_state{sender_state::stopped};
    std::atomic<bool> accepting{false};

    mutable std::mutex mutex;
    session_state_machine machine{session_role::sender};
    std::shared_ptr<const transfer_plan> plan;
    std::vector<std::byte> ticket;
    peer_id local;

    // Peer table: one admitted session per peer identity
    std::unordered_map<peer_id, uint64_t> peer_table;
    std::unordered_map<uint64_t, std::shared_ptr<sender_session>> sessions;
    uint64_t next_session_id{1};
    std::vector<session_summary> history;
    session_complete_callback complete_callback;

    std::future<void> accept_task;
    std::vector<std::future<void>> session_tasks;

    impl(sender_config cfg,
         std::shared_ptr<peer_network> net,
         std::shared_ptr<oob_channel> chan,
         std::shared_ptr<const ticket_authenticator> auth,
         std::shared_ptr<adapters::worker_pool_interface> workers)
        : config(std::move(cfg)),
          network(std::move(net)),
          channel(std::move(chan)),
          authenticator(std::move(auth)),
          pool(std::move(workers)) {}

    auto prepare() -> result<void> {
        FD_LOG_INFO(log_category::sender,
                    "Preparing transfer of " + std::to_string(config.files.size()) + " file(s)");

        auto analyzed = analyze_files(config.files, config.limits);
        if (!analyzed) {
            FD_LOG_ERROR(log_category::sender, "Setup failed: " + analyzed.error().message);
            return unexpected(analyzed.error());
        }
        auto shared_plan = std::make_shared<const transfer_plan>(std::move(analyzed.value()));

        auto identity = network->generate_identity();
        if (!identity) {
            return unexpected(identity.error());
        }

        auto addresses = network->listen(shared_plan->transport);
        if (!addresses) {
            FD_LOG_ERROR(log_category::sender, "Setup failed: " + addresses.error().message);
            network->shutdown();
            return unexpected(addresses.error());
        }

        auto nonce = generate_nonce();
        if (!nonce) {
            network->shutdown();
            return unexpected(nonce.error());
        }

        auto encoded = build_ticket(identity.value(), addresses.value(), shared_plan->transport,
                                    nonce.value(), *authenticator);
        if (!encoded) {
            FD_LOG_ERROR(log_category::sender, "Setup failed: " + encoded.error().message);
            network->shutdown();
            return unexpected(encoded.error());
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            plan = shared_plan;
            ticket = encoded.value();
            local = identity.value();
        }

        network->on_connection_event(
            [this](const connection_event& event) { handle_connection_event(event); });

        if (auto powered = channel->await_powered_on(); !powered) {
            network->shutdown();
            return powered;
        }

        const auto& profile = profile_for(shared_plan->transport);
        advertisement ad;
        ad.display_name = config.display_name;
        ad.discovery_ids = {std::string(profile.discovery_id)};
        ad.payload_id = std::string(profile.payload_id);
        ad.payload = encoded.value();

        if (auto advertised = channel->advertise(ad); !advertised) {
            FD_LOG_ERROR(log_category::discovery,
                         "Advertising failed: " + advertised.error().message);
            network->shutdown();
            return advertised;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            if (auto moved = machine.transition(session_state::advertising); !moved) {
                channel->stop_advertising();
                network->shutdown();
                return moved;
            }
        }

        transfer_log_context ctx;
        ctx.peer = identity.value().value;
        ctx.file_size = shared_plan->manifest.total_size;
        ctx.transport = to_string(shared_plan->transport);
        ctx.address = addresses.value().empty() ? std::string{} : addresses.value().front();
        FD_LOG_INFO_CTX(log_category::sender,
                        "Advertising " + std::to_string(shared_plan->manifest.size()) +
                            " file(s), " + format_bytes(shared_plan->manifest.total_size),
                        ctx);

        accepting.store(true);
        accept_task = pool->submit_to_stage([this] { accept_loop(); }, adapters::accept_stage);
        return {};
    }

    void accept_loop() {
        while (accepting.load()) {
            auto inbound = network->accept_stream(accept_poll_interval);
            if (!inbound) {
                if (inbound.error().code == error_code::connection_timeout) {
                    continue;
                }
                if (inbound.error().code == error_code::cancelled) {
                    break;
                }
                FD_LOG_WARN(log_category::sender,
                            "Accept failed: " + inbound.error().message);
                continue;
            }
            dispatch(std::move(inbound.value()));
        }
        FD_LOG_DEBUG(log_category::sender, "Accept loop stopped");
    }

    void dispatch(inbound_stream inbound) {
        std::lock_guard<std::mutex> lock(mutex);

        if (!accepting.load()) {
            inbound.stream->close();
            return;
        }

        // Drop futures of sessions that already ended
        session_tasks.erase(
            std::remove_if(session_tasks.begin(), session_tasks.end(),
                           [](const std::future<void>& task) {
                               return task.wait_for(std::chrono::seconds(0)) ==
                                      std::future_status::ready;
                           }),
            session_tasks.end());

        const auto id = next_session_id++;
        const auto peer = inbound.peer;

        bool admitted = true;
        if (peer_table.count(peer) > 0) {
            admitted = false;
            FD_LOG_WARN(log_category::sender,
                        "Peer " + peer.value + " already has an active session");
        } else if (peer_table.size() >= config.max_sessions) {
            admitted = false;
            FD_LOG_WARN(log_category::sender,
                        "Session limit " + std::to_string(config.max_sessions) +
                            " reached, declining " + peer.value);
        }
        if (admitted) {
            peer_table.emplace(peer, id);
        }

        auto session = std::make_shared<sender_session>(peer, std::move(inbound.stream), plan,
                                                         config.idle_timeout);
        sessions.emplace(id, session);

        FD_LOG_DEBUG(log_category::sender,
                     "Accepted stream from " + peer.value + " as session " + std::to_string(id));

        session_tasks.push_back(pool->submit_to_stage(
            [this, id, admitted, session] {
                auto summary = session->run(
                    [admitted](const transfer_request&) { return admitted; });
                finish_session(id, admitted, summary);
            },
            adapters::session_stage));
    }

    void finish_session(uint64_t id, bool admitted, const session_summary& summary) {
        session_complete_callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            sessions.erase(id);
            if (admitted) {
                auto it = peer_table.find(summary.peer);
                if (it != peer_table.end() && it->second == id) {
                    peer_table.erase(it);
                }
            }
            history.push_back(summary);
            callback = complete_callback;
        }
        if (callback) {
            callback(summary);
        }
    }

    void handle_connection_event(const connection_event& event) {
        transfer_log_context ctx;
        ctx.peer = event.peer.value;

        if (event.kind == connection_event_kind::established) {
            FD_LOG_INFO_CTX(log_category::sender, "Peer connected", ctx);
            return;
        }

        ctx.error_message = event.reason;
        FD_LOG_INFO_CTX(log_category::sender, "Peer disconnected", ctx);

        std::shared_ptr<sender_session> session;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = peer_table.find(event.peer);
            if (it != peer_table.end()) {
                auto found = sessions.find(it->second);
                if (found != sessions.end()) {
                    session = found->second;
                }
            }
        }
        if (session) {
            session->on_connection_closed(event.reason);
        }
    }

    void shutdown() {
        accepting.store(false);
        channel->stop_advertising();

        std::vector<std::shared_ptr<sender_session>> running;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (machine.state() == session_state::advertising) {
                if (auto moved = machine.transition(session_state::idle); !moved) {
                    FD_LOG_WARN(log_category::session, moved.error().message);
                }
            }
            for (const auto& [id, session] : sessions) {
                running.push_back(session);
            }
        }

        for (const auto& session : running) {
            session->cancel();
        }
        network->shutdown();

        if (accept_task.valid()) {
            accept_task.wait();
        }

        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.swap(session_tasks);
        }
        for (auto& task : pending) {
            task.wait();
        }
    }
};

// Builder implementation
fastdrop_sender::builder::builder() = default;

auto fastdrop_sender::builder::with_files(std::vector<std::filesystem::path> files) -> builder& {
    config_.files = std::move(files);
    return *this;
}

auto fastdrop_sender::builder::with_peer_network(std::shared_ptr<peer_network> network)
    -> builder& {
    network_ = std::move(network);
    return *this;
}

auto fastdrop_sender::builder::with_oob_channel(std::shared_ptr<oob_channel> channel)
    -> builder& {
    channel_ = std::move(channel);
    return *this;
}

auto fastdrop_sender::builder::with_size_limits(size_limits limits) -> builder& {
    config_.limits = limits;
    return *this;
}

auto fastdrop_sender::builder::with_authenticator(
    std::shared_ptr<const ticket_authenticator> authenticator) -> builder& {
    authenticator_ = std::move(authenticator);
    return *this;
}

auto fastdrop_sender::builder::with_display_name(std::string name) -> builder& {
    config_.display_name = std::move(name);
    return *this;
}

auto fastdrop_sender::builder::with_idle_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.idle_timeout = timeout;
    return *this;
}

auto fastdrop_sender::builder::with_max_sessions(std::size_t count) -> builder& {
    config_.max_sessions = count;
    return *this;
}

auto fastdrop_sender::builder::with_worker_pool(
    std::shared_ptr<adapters::worker_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto fastdrop_sender::builder::build() -> result<fastdrop_sender> {
    if (!network_) {
        return unexpected(error{error_code::invalid_configuration, "peer network is required"});
    }
    if (!channel_) {
        return unexpected(error{error_code::invalid_configuration,
                                "out-of-band channel is required"});
    }
    if (config_.max_sessions == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "max_sessions must be at least 1"});
    }
    if (config_.idle_timeout.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "idle_timeout must be positive"});
    }

    if (!authenticator_) {
        authenticator_ = std::make_shared<nonce_tag_authenticator>();
    }
    if (!pool_) {
        pool_ = adapters::worker_pool_factory::create(config_.max_sessions + 2);
    }

    return fastdrop_sender{std::move(config_), std::move(network_), std::move(channel_),
                           std::move(authenticator_), std::move(pool_)};
}

// fastdrop_sender implementation
fastdrop_sender::fastdrop_sender(sender_config config,
                                 std::shared_ptr<peer_network> network,
                                 std::shared_ptr<oob_channel> channel,
                                 std::shared_ptr<const ticket_authenticator> authenticator,
                                 std::shared_ptr<adapters::worker_pool_interface> pool)
    : impl_(std::make_unique<impl>(std::move(config), std::move(network), std::move(channel),
                                   std::move(authenticator), std::move(pool))) {
    // Safe to call multiple times
    get_logger().initialize();
}

fastdrop_sender::fastdrop_sender(fastdrop_sender&&) noexcept = default;
auto fastdrop_sender::operator=(fastdrop_sender&&) noexcept -> fastdrop_sender& = default;

fastdrop_sender::~fastdrop_sender() {
    if (impl_ && is_running()) {
        (void)stop();
    }
}

auto fastdrop_sender::start() -> result<void> {
    auto expected = sender_state::stopped;
    if (!impl_->current_state.compare_exchange_strong(expected, sender_state::starting)) {
        FD_LOG_WARN(log_category::sender, "Sender start failed: already running");
        return unexpected(error{error_code::already_initialized, "sender is already running"});
    }

    if (auto prepared = impl_->prepare(); !prepared) {
        impl_->current_state = sender_state::stopped;
        return prepared;
    }

    impl_->current_state = sender_state::advertising;
    return {};
}

auto fastdrop_sender::stop() -> result<void> {
    auto expected = sender_state::advertising;
    if (!impl_->current_state.compare_exchange_strong(expected, sender_state::stopping)) {
        FD_LOG_WARN(log_category::sender, "Sender stop called but sender is not running");
        return unexpected(error{error_code::not_initialized, "sender is not running"});
    }

    FD_LOG_INFO(log_category::sender, "Stopping sender");
    impl_->shutdown();

    impl_->current_state = sender_state::stopped;
    FD_LOG_INFO(log_category::sender, "Sender stopped");
    return {};
}

auto fastdrop_sender::is_running() const -> bool {
    return impl_->current_state == sender_state::advertising;
}

auto fastdrop_sender::state() const -> sender_state {
    return impl_->current_state;
}

auto fastdrop_sender::plan() const -> std::optional<transfer_plan> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->plan) {
        return std::nullopt;
    }
    return *impl_->plan;
}

auto fastdrop_sender::ticket() const -> std::vector<std::byte> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->ticket;
}

auto fastdrop_sender::local_peer() const -> peer_id {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->local;
}

auto fastdrop_sender::active_sessions() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->peer_table.size();
}

auto fastdrop_sender::completed_sessions() const -> std::vector<session_summary> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->history;
}

void fastdrop_sender::on_session_complete(session_complete_callback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->complete_callback = std::move(callback);
}

auto fastdrop_sender::config() const -> const sender_config& {
    return impl_->config;
}

}  // namespace kcenon::fastdrop
