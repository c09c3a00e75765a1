/**
 * @file fastdrop_sender.h
 * @brief Sender orchestrator: advertise a ticket and serve every receiver
 */

#ifndef KCENON_FASTDROP_SESSION_FASTDROP_SENDER_H
#define KCENON_FASTDROP_SESSION_FASTDROP_SENDER_H

#include <kcenon/fastdrop/core/transport_policy.h>
#include <kcenon/fastdrop/core/types.h>
#include <kcenon/fastdrop/discovery/oob_channel.h>
#include <kcenon/fastdrop/protocol/session_ticket.h>
#include <kcenon/fastdrop/session/session_types.h>
#include <kcenon/fastdrop/transport/peer_network.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::fastdrop {

namespace adapters {
class worker_pool_interface;
}  // namespace adapters

/**
 * @brief Sender orchestrator
 *
 * start() analyzes the files, listens on the selected transport, builds the
 * session ticket and advertises it. Every inbound stream is then served by
 * its own sender_session on the worker pool. Sessions are indexed by peer;
 * a peer with an active session, or a request beyond max_sessions, is
 * declined.
 *
 * @code
 * auto sender = fastdrop_sender::builder()
 *     .with_files({"a.bin", "b.bin"})
 *     .with_peer_network(network)
 *     .with_oob_channel(radio)
 *     .build();
 *
 * if (sender.has_value()) {
 *     auto started = sender.value().start();
 * }
 * @endcode
 */
class fastdrop_sender {
public:
    /**
     * @brief Builder for fastdrop_sender
     */
    class builder {
    public:
        builder();

        /**
         * @brief Files to send, in manifest order
         */
        auto with_files(std::vector<std::filesystem::path> files) -> builder&;

        /**
         * @brief Peer network used for listening and streams (required)
         */
        auto with_peer_network(std::shared_ptr<peer_network> network) -> builder&;

        /**
         * @brief Out-of-band channel the ticket is advertised on (required)
         */
        auto with_oob_channel(std::shared_ptr<oob_channel> channel) -> builder&;

        /**
         * @brief Per-file and aggregate caps (default: 100MB / 500MB)
         */
        auto with_size_limits(size_limits limits) -> builder&;

        /**
         * @brief Ticket tag producer (default: nonce_tag_authenticator)
         */
        auto with_authenticator(std::shared_ptr<const ticket_authenticator> authenticator)
            -> builder&;

        /**
         * @brief Name shown to scanning receivers (default: "Fastdrop")
         */
        auto with_display_name(std::string name) -> builder&;

        /**
         * @brief Read timeout on every peer stream (default: 5 minutes)
         */
        auto with_idle_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Concurrent sessions before requests are declined (default: 8)
         */
        auto with_max_sessions(std::size_t count) -> builder&;

        /**
         * @brief Pool that runs the accept loop and the sessions
         *
         * Defaults to worker_pool_factory::create(max_sessions + 2): one worker
         * per session, one for the accept loop and one for declining requests.
         */
        auto with_worker_pool(std::shared_ptr<adapters::worker_pool_interface> pool)
            -> builder&;

        /**
         * @brief Build the sender
         * @return invalid_configuration if a collaborator is missing or a
         *         tunable is zero
         */
        [[nodiscard]] auto build() -> result<fastdrop_sender>;

    private:
        sender_config config_;
        std::shared_ptr<peer_network> network_;
        std::shared_ptr<oob_channel> channel_;
        std::shared_ptr<const ticket_authenticator> authenticator_;
        std::shared_ptr<adapters::worker_pool_interface> pool_;
    };

    // Non-copyable, movable
    fastdrop_sender(const fastdrop_sender&) = delete;
    auto operator=(const fastdrop_sender&) -> fastdrop_sender& = delete;
    fastdrop_sender(fastdrop_sender&&) noexcept;
    auto operator=(fastdrop_sender&&) noexcept -> fastdrop_sender&;
    ~fastdrop_sender();

    /**
     * @brief Prepare the transfer and start advertising
     *
     * Every setup error is reported before the out-of-band channel is
     * touched. Blocks until the radio is powered on.
     *
     * @return Setup errors from analyze_files() and build_ticket(), or the
     *         collaborator's error
     */
    [[nodiscard]] auto start() -> result<void>;

    /**
     * @brief Stop advertising, cancel every session and shut the network down
     *
     * Waits for all session tasks to return.
     */
    [[nodiscard]] auto stop() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto state() const -> sender_state;

    /**
     * @brief Manifest, transport and paths; std::nullopt before start()
     */
    [[nodiscard]] auto plan() const -> std::optional<transfer_plan>;

    /**
     * @brief Encoded ticket being advertised; empty before start()
     */
    [[nodiscard]] auto ticket() const -> std::vector<std::byte>;

    [[nodiscard]] auto local_peer() const -> peer_id;

    /**
     * @brief Sessions currently holding a slot in the peer table
     */
    [[nodiscard]] auto active_sessions() const -> std::size_t;

    /**
     * @brief Summaries of every session that has ended, in completion order
     */
    [[nodiscard]] auto completed_sessions() const -> std::vector<session_summary>;

    /**
     * @brief Called on a worker thread as each session ends
     */
    void on_session_complete(session_complete_callback callback);

    [[nodiscard]] auto config() const -> const sender_config&;

private:
    fastdrop_sender(sender_config config,
                    std::shared_ptr<peer_network> network,
                    std::shared_ptr<oob_channel> channel,
                    std::shared_ptr<const ticket_authenticator> authenticator,
                    std::shared_ptr<adapters::worker_pool_interface> pool);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_SESSION_FASTDROP_SENDER_H
