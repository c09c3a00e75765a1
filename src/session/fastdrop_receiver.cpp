/**
 * @file fastdrop_receiver.cpp
 * @brief Receiver orchestrator implementation
 */

#include <kcenon/fastdrop/session/fastdrop_receiver.h>

#include <kcenon/fastdrop/core/logging.h>
#include <kcenon/fastdrop/core/transfer_utils.h>
#include <kcenon/fastdrop/protocol/frame_io.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace kcenon::fastdrop {

struct fastdrop_receiver::impl {
    receiver_config config;
    std::shared_ptr<peer_network> network;
    std::shared_ptr<oob_channel> channel;
    std::shared_ptr<const ticket_authenticator> authenticator;
    device_selector selector;
    chunk_progress_callback progress_callback;

    session_state_machine machine{session_role::receiver};
    std::atomic<session_state> current_state{session_state::idle};
    std::atomic<bool> cancelled{false};

    // Stream in use, closed by cancel()
    std::mutex stream_mutex;
    byte_stream* active_stream{nullptr};

    // Lifecycle events for the peer being dialed
    std::mutex event_mutex;
    std::condition_variable event_cv;
    std::deque<connection_event> events;

    impl(receiver_config cfg,
         std::shared_ptr<peer_network> net,
         std::shared_ptr<oob_channel> chan,
         std::shared_ptr<const ticket_authenticator> auth,
         device_selector select)
        : config(std::move(cfg)),
          network(std::move(net)),
          channel(std::move(chan)),
          authenticator(std::move(auth)),
          selector(std::move(select)) {
        watch_machine();
    }

    void watch_machine() {
        machine.on_transition([this](session_state, session_state to) { current_state = to; });
    }

    void reset_machine() {
        machine = session_state_machine(session_role::receiver);
        watch_machine();
        current_state = session_state::idle;
    }

    /// Consume a pending cancel() request
    auto take_cancel() -> bool { return cancelled.exchange(false); }

    /// Leave scanning with cancelled when cancel() is pending
    auto check_cancelled_while_scanning() -> result<void> {
        if (!take_cancel()) {
            return {};
        }
        return_to_idle();
        FD_LOG_INFO(log_category::receiver, "Receive cancelled before dialing");
        return unexpected(error{error_code::cancelled, "receive cancelled"});
    }

    auto advance(session_state to) -> result<void> {
        if (auto moved = machine.transition(to); !moved) {
            machine.fail(moved.error());
            return moved;
        }
        return {};
    }

    void return_to_idle() {
        if (machine.state() == session_state::scanning) {
            if (auto moved = machine.transition(session_state::idle); !moved) {
                FD_LOG_WARN(log_category::session, moved.error().message);
            }
        }
    }

    /// Bring the machine to scanning from idle or a finished session
    auto ensure_scanning() -> result<void> {
        if (is_terminal(machine.state())) {
            reset_machine();
        }
        if (machine.state() == session_state::idle) {
            return advance(session_state::scanning);
        }
        if (machine.state() == session_state::scanning) {
            return {};
        }
        return unexpected(error{error_code::invalid_state_transition,
                                std::string("receiver is busy: ") + to_string(machine.state())});
    }

    auto failed(const error& err) -> unexpected {
        machine.fail(err);
        return unexpected(machine.last_error());
    }

    auto pending_close() -> std::optional<connection_event> {
        std::lock_guard<std::mutex> lock(event_mutex);
        for (const auto& event : events) {
            if (event.kind == connection_event_kind::closed) {
                return event;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Translate a stream failure into the matching session event
     */
    void fail_stream(const error& err) {
        // The event's effect is recorded in the machine's state and last_error
        if (take_cancel()) {
            machine.fail(error{error_code::cancelled, "receive cancelled"});
        } else if (auto closed = pending_close()) {
            (void)machine.apply(connection_closed{closed->peer, closed->reason});
        } else if (err.code == error_code::connection_timeout) {
            (void)machine.apply(timer_fired{"idle_timeout"});
        } else if (err.code == error_code::connection_lost ||
                   err.code == error_code::truncated_frame) {
            (void)machine.apply(stream_closed{false, err.message});
        } else {
            machine.fail(err);
        }
    }

    void watch_peer(const peer_id& peer) {
        {
            std::lock_guard<std::mutex> lock(event_mutex);
            events.clear();
        }
        network->on_connection_event([this, peer](const connection_event& event) {
            if (event.peer != peer) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(event_mutex);
                events.push_back(event);
            }
            event_cv.notify_all();
        });
    }

    /**
     * @brief Wait for the network to confirm the connection
     */
    auto await_connection(const peer_id& peer) -> result<void> {
        std::unique_lock<std::mutex> lock(event_mutex);
        auto arrived = event_cv.wait_for(lock, config.connect_timeout,
                                         [this] { return !events.empty() || cancelled; });

        if (take_cancel()) {
            lock.unlock();
            return failed(error{error_code::cancelled, "receive cancelled"});
        }
        if (!arrived) {
            lock.unlock();
            (void)machine.apply(timer_fired{"connect_timeout"});
            return unexpected(machine.last_error());
        }

        auto event = events.front();
        events.pop_front();
        lock.unlock();

        if (event.kind == connection_event_kind::closed) {
            (void)machine.apply(connection_closed{event.peer, event.reason});
            return unexpected(machine.last_error());
        }

        auto connected = machine.apply(connection_established{peer});
        if (!connected) {
            return unexpected(connected.error());
        }
        return {};
    }

    void attach(byte_stream* stream) {
        std::lock_guard<std::mutex> lock(stream_mutex);
        active_stream = stream;
    }

    void teardown(const peer_id& peer, byte_stream* stream) {
        if (stream != nullptr) {
            stream->close();
        }
        attach(nullptr);
        network->on_connection_event({});
        network->disconnect(peer);
    }

    auto receive(const session_ticket& ticket) -> result<transfer_outcome> {
        if (machine.state() != session_state::ticket_exchanged) {
            // Ticket obtained out of band
            if (auto scanning = ensure_scanning(); !scanning) {
                return unexpected(scanning.error());
            }
            if (auto exchanged = advance(session_state::ticket_exchanged); !exchanged) {
                return unexpected(exchanged.error());
            }
        }

        transfer_log_context ctx;
        ctx.peer = ticket.peer.value;
        ctx.transport = to_string(ticket.transport);
        ctx.address = ticket.addresses.empty() ? std::string{} : ticket.addresses.front();

        if (take_cancel()) {
            return failed(error{error_code::cancelled, "receive cancelled"});
        }
        FD_LOG_INFO_CTX(log_category::receiver, "Dialing sender", ctx);

        watch_peer(ticket.peer);
        if (auto dialed = network->dial(ticket.peer, ticket.addresses); !dialed) {
            network->on_connection_event({});
            FD_LOG_ERROR(log_category::receiver, "Dial failed: " + dialed.error().message);
            return failed(dialed.error());
        }

        if (auto connected = await_connection(ticket.peer); !connected) {
            teardown(ticket.peer, nullptr);
            return unexpected(connected.error());
        }

        auto opened = network->open_stream(ticket.peer);
        if (!opened) {
            teardown(ticket.peer, nullptr);
            return failed(opened.error());
        }
        std::unique_ptr<byte_stream> stream = std::move(opened.value());
        attach(stream.get());
        stream->set_read_timeout(config.idle_timeout);
        stream->set_write_timeout(config.idle_timeout);

        auto handshake = exchange(*stream);
        if (!handshake) {
            teardown(ticket.peer, stream.get());
            return unexpected(handshake.error());
        }

        transfer_outcome outcome;
        outcome.peer = ticket.peer;
        outcome.transport = ticket.transport;
        outcome.request_id = handshake.value().request_id;
        outcome.manifest = std::move(handshake.value().manifest);

        stream_into(*stream, outcome);
        teardown(ticket.peer, stream.get());
        // A cancel() racing the end of the stream has nothing left to stop
        cancelled = false;

        ctx.request_id = outcome.request_id;
        ctx.bytes_transferred = outcome.report.bytes_received;
        ctx.state = to_string(outcome.final_state);
        if (outcome.failure) {
            ctx.error_message = outcome.failure.message;
            FD_LOG_ERROR_CTX(log_category::receiver, "Transfer did not complete cleanly", ctx);
        } else {
            FD_LOG_INFO_CTX(log_category::receiver,
                            "Received " + std::to_string(outcome.manifest.size()) +
                                " file(s), " + format_bytes(outcome.report.bytes_received),
                            ctx);
        }
        return outcome;
    }

    /**
     * @brief Request/response half of the session
     */
    auto exchange(byte_stream& stream) -> result<transfer_response> {
        auto request_id = generate_nonce();
        if (!request_id) {
            return failed(request_id.error());
        }

        transfer_request request{request_id.value(), true};
        if (auto sent = send_request(stream, request); !sent) {
            fail_stream(sent.error());
            return unexpected(machine.last_error());
        }
        if (auto moved = advance(session_state::request_sent); !moved) {
            return unexpected(moved.error());
        }

        auto response = receive_response(stream);
        if (!response) {
            fail_stream(response.error());
            return unexpected(machine.last_error());
        }
        if (response.value().request_id != request.request_id) {
            return failed(error{error_code::unexpected_message,
                                "response echoes request " +
                                    std::to_string(response.value().request_id) +
                                    ", sent " + std::to_string(request.request_id)});
        }

        auto applied = machine.apply(response_received{response.value().request_id,
                                                       response.value().accepted,
                                                       response.value().manifest.size()});
        if (!applied) {
            if (applied.error().code == error_code::transfer_rejected) {
                FD_LOG_ERROR(log_category::receiver,
                             "Sender declined the transfer: " + applied.error().message);
            }
            return unexpected(applied.error());
        }

        FD_LOG_INFO(log_category::receiver,
                    "Sender offers " + std::to_string(response.value().manifest.size()) +
                        " file(s), " + format_bytes(response.value().manifest.total_size));

        if (auto moved = advance(session_state::streaming); !moved) {
            return unexpected(moved.error());
        }
        return response;
    }

    /**
     * @brief Streaming half: write every chunk, then classify the result
     */
    void stream_into(byte_stream& stream, transfer_outcome& outcome) {
        transfer_receiver receiver(config.output_dir);
        receiver.on_progress([this](const chunk_progress& progress) {
            // Within streaming this event only confirms the state
            (void)machine.apply(chunk_received{progress.file_index,
                                               progress.chunks_received - 1,
                                               progress.total_chunks,
                                               static_cast<std::size_t>(
                                                   progress.file_bytes_written)});
            if (progress_callback) {
                progress_callback(progress);
            }
        });

        outcome.report = receiver.receive_and_write(stream, outcome.manifest);

        if (outcome.report.failure) {
            fail_stream(outcome.report.failure);
        } else {
            (void)machine.apply(stream_closed{true, {}});
        }

        outcome.final_state = machine.state();
        if (outcome.final_state != session_state::complete) {
            outcome.failure = machine.last_error();
            return;
        }

        const auto& report = outcome.report;
        if (auto mismatched = report.count(file_outcome::hash_mismatch); mismatched > 0) {
            outcome.failure = error{error_code::file_hash_mismatch,
                                    std::to_string(mismatched) +
                                        " file(s) failed SHA-256 verification"};
        } else if (auto wrong_size = report.count(file_outcome::size_mismatch); wrong_size > 0) {
            outcome.failure = error{error_code::file_size_mismatch,
                                    std::to_string(wrong_size) +
                                        " file(s) differ from their declared size"};
        } else if (auto missing = report.count(file_outcome::incomplete) +
                                  report.count(file_outcome::not_started);
                   missing > 0) {
            outcome.failure = error{error_code::incomplete_transfer,
                                    std::to_string(missing) +
                                        " file(s) ended before their last chunk"};
        }
    }
};

// Builder implementation
fastdrop_receiver::builder::builder() = default;

auto fastdrop_receiver::builder::with_peer_network(std::shared_ptr<peer_network> network)
    -> builder& {
    network_ = std::move(network);
    return *this;
}

auto fastdrop_receiver::builder::with_oob_channel(std::shared_ptr<oob_channel> channel)
    -> builder& {
    channel_ = std::move(channel);
    return *this;
}

auto fastdrop_receiver::builder::with_output_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.output_dir = dir;
    return *this;
}

auto fastdrop_receiver::builder::with_scan_window(std::chrono::milliseconds window) -> builder& {
    config_.scan_window = window;
    return *this;
}

auto fastdrop_receiver::builder::with_connect_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.connect_timeout = timeout;
    return *this;
}

auto fastdrop_receiver::builder::with_idle_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.idle_timeout = timeout;
    return *this;
}

auto fastdrop_receiver::builder::with_authenticator(
    std::shared_ptr<const ticket_authenticator> authenticator) -> builder& {
    authenticator_ = std::move(authenticator);
    return *this;
}

auto fastdrop_receiver::builder::with_device_selector(device_selector selector) -> builder& {
    selector_ = std::move(selector);
    return *this;
}

auto fastdrop_receiver::builder::build() -> result<fastdrop_receiver> {
    if (!network_) {
        return unexpected(error{error_code::invalid_configuration, "peer network is required"});
    }
    if (!channel_) {
        return unexpected(error{error_code::invalid_configuration,
                                "out-of-band channel is required"});
    }
    if (config_.output_dir.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "output directory is required"});
    }
    if (config_.scan_window.count() <= 0 || config_.connect_timeout.count() <= 0 ||
        config_.idle_timeout.count() <= 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "scan window and timeouts must be positive"});
    }

    if (!selector_) {
        selector_ = [](const std::vector<discovered_device>&) -> std::optional<std::size_t> {
            return 1;
        };
    }

    return fastdrop_receiver{std::move(config_), std::move(network_), std::move(channel_),
                             std::move(authenticator_), std::move(selector_)};
}

// fastdrop_receiver implementation
fastdrop_receiver::fastdrop_receiver(receiver_config config,
                                     std::shared_ptr<peer_network> network,
                                     std::shared_ptr<oob_channel> channel,
                                     std::shared_ptr<const ticket_authenticator> authenticator,
                                     device_selector selector)
    : impl_(std::make_unique<impl>(std::move(config), std::move(network), std::move(channel),
                                   std::move(authenticator), std::move(selector))) {
    get_logger().initialize();
}

fastdrop_receiver::fastdrop_receiver(fastdrop_receiver&&) noexcept = default;
auto fastdrop_receiver::operator=(fastdrop_receiver&&) noexcept -> fastdrop_receiver& = default;
fastdrop_receiver::~fastdrop_receiver() = default;

auto fastdrop_receiver::discover() -> result<std::vector<discovered_device>> {
    if (auto scanning = impl_->ensure_scanning(); !scanning) {
        return unexpected(scanning.error());
    }

    if (auto powered = impl_->channel->await_powered_on(); !powered) {
        impl_->return_to_idle();
        return unexpected(powered.error());
    }

    if (auto pending = impl_->check_cancelled_while_scanning(); !pending) {
        return unexpected(pending.error());
    }

    FD_LOG_INFO(log_category::discovery,
                "Scanning for " + std::to_string(impl_->config.scan_window.count()) + " ms");
    auto scanned = impl_->channel->scan(impl_->config.scan_window);
    if (!scanned) {
        if (scanned.error().code == error_code::cancelled) {
            impl_->cancelled = false;
        }
        impl_->return_to_idle();
        return unexpected(scanned.error());
    }
    if (auto pending = impl_->check_cancelled_while_scanning(); !pending) {
        return unexpected(pending.error());
    }

    std::vector<discovered_device> candidates;
    for (auto& device : scanned.value()) {
        for (const auto& id : device.discovery_ids) {
            if (profile_for_discovery_id(id)) {
                candidates.push_back(std::move(device));
                break;
            }
        }
    }

    if (candidates.empty()) {
        FD_LOG_WARN(log_category::discovery,
                    "No senders among " + std::to_string(scanned.value().size()) +
                        " device(s) in range");
        impl_->return_to_idle();
        return unexpected(error{error_code::no_devices_found,
                                "no device advertises a known transport profile"});
    }

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        FD_LOG_INFO(log_category::discovery,
                    std::to_string(i + 1) + ": " + candidates[i].display_name + " (" +
                        candidates[i].address + ")");
    }
    return candidates;
}

auto fastdrop_receiver::fetch_ticket(const discovered_device& device)
    -> result<session_ticket> {
    if (auto scanning = impl_->ensure_scanning(); !scanning) {
        return unexpected(scanning.error());
    }

    std::optional<transport_profile> profile;
    for (const auto& id : device.discovery_ids) {
        profile = profile_for_discovery_id(id);
        if (profile) {
            break;
        }
    }
    if (!profile) {
        impl_->return_to_idle();
        return unexpected(error{error_code::invalid_selection,
                                device.address + " advertises no known transport profile"});
    }

    if (auto pending = impl_->check_cancelled_while_scanning(); !pending) {
        return unexpected(pending.error());
    }

    auto payload = impl_->channel->read(device, profile->payload_id);
    if (!payload) {
        FD_LOG_WARN(log_category::discovery,
                    "Cannot read ticket from " + device.address + ": " + payload.error().message);
        impl_->return_to_idle();
        return unexpected(payload.error());
    }

    auto ticket = parse_ticket(payload.value(), impl_->authenticator.get());
    if (!ticket) {
        FD_LOG_ERROR(log_category::ticket, ticket.error().message);
        return impl_->failed(ticket.error());
    }

    if (ticket.value().transport != profile->kind) {
        FD_LOG_WARN(log_category::ticket,
                    std::string("Ticket names ") + to_string(ticket.value().transport) +
                        " but was advertised under " + to_string(profile->kind));
    }

    if (auto pending = impl_->check_cancelled_while_scanning(); !pending) {
        return unexpected(pending.error());
    }
    if (auto exchanged = impl_->advance(session_state::ticket_exchanged); !exchanged) {
        return unexpected(exchanged.error());
    }

    transfer_log_context ctx;
    ctx.peer = ticket.value().peer.value;
    ctx.transport = to_string(ticket.value().transport);
    FD_LOG_INFO_CTX(log_category::ticket,
                    "Ticket with " + std::to_string(ticket.value().addresses.size()) +
                        " address(es)",
                    ctx);
    return ticket;
}

auto fastdrop_receiver::receive(const session_ticket& ticket) -> result<transfer_outcome> {
    return impl_->receive(ticket);
}

auto fastdrop_receiver::run() -> result<transfer_outcome> {
    auto candidates = discover();
    if (!candidates) {
        return unexpected(candidates.error());
    }

    auto choice = impl_->selector(candidates.value());
    if (!choice || *choice == 0 || *choice > candidates.value().size()) {
        FD_LOG_WARN(log_category::discovery, "Invalid device selection");
        impl_->return_to_idle();
        return unexpected(error{error_code::invalid_selection,
                                "choose a device between 1 and " +
                                    std::to_string(candidates.value().size())});
    }

    auto ticket = fetch_ticket(candidates.value()[*choice - 1]);
    if (!ticket) {
        return unexpected(ticket.error());
    }
    return receive(ticket.value());
}

void fastdrop_receiver::cancel() {
    impl_->cancelled = true;
    impl_->channel->stop_scan();
    {
        std::lock_guard<std::mutex> lock(impl_->stream_mutex);
        if (impl_->active_stream != nullptr) {
            impl_->active_stream->close();
        }
    }
    impl_->event_cv.notify_all();
    FD_LOG_INFO(log_category::receiver, "Receive cancelled");
}

void fastdrop_receiver::on_progress(chunk_progress_callback callback) {
    impl_->progress_callback = std::move(callback);
}

auto fastdrop_receiver::state() const -> session_state {
    return impl_->current_state;
}

auto fastdrop_receiver::config() const -> const receiver_config& {
    return impl_->config;
}

}  // namespace kcenon::fastdrop
