/**
 * @file fastdrop_receiver.h
 * @brief Receiver orchestrator: discover a sender, fetch its ticket, receive files
 */

#ifndef KCENON_FASTDROP_SESSION_FASTDROP_RECEIVER_H
#define KCENON_FASTDROP_SESSION_FASTDROP_RECEIVER_H

#include <kcenon/fastdrop/core/transfer_receiver.h>
#include <kcenon/fastdrop/core/types.h>
#include <kcenon/fastdrop/discovery/oob_channel.h>
#include <kcenon/fastdrop/protocol/session_ticket.h>
#include <kcenon/fastdrop/session/session_state.h>
#include <kcenon/fastdrop/session/session_types.h>
#include <kcenon/fastdrop/transport/peer_network.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <vector>

namespace kcenon::fastdrop {

/**
 * @brief Receiver orchestrator
 *
 * Drives one session at a time: scanning, ticket exchange, connection,
 * request, response and streaming. Errors before streaming starts are
 * returned as errors. Once streaming has started a transfer_outcome is
 * always returned so that files completed before a failure are reported.
 *
 * @code
 * auto receiver = fastdrop_receiver::builder()
 *     .with_peer_network(network)
 *     .with_oob_channel(radio)
 *     .with_output_directory("/downloads")
 *     .build();
 *
 * auto outcome = receiver.value().run();
 * @endcode
 */
class fastdrop_receiver {
public:
    /**
     * @brief Builder for fastdrop_receiver
     */
    class builder {
    public:
        builder();

        /**
         * @brief Peer network used to dial the sender (required)
         */
        auto with_peer_network(std::shared_ptr<peer_network> network) -> builder&;

        /**
         * @brief Out-of-band channel to scan (required)
         */
        auto with_oob_channel(std::shared_ptr<oob_channel> channel) -> builder&;

        /**
         * @brief Directory received files are written into (required)
         */
        auto with_output_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Length of one discovery scan (default: 15 seconds)
         */
        auto with_scan_window(std::chrono::milliseconds window) -> builder&;

        /**
         * @brief Time allowed for the connection to be confirmed (default: 30 seconds)
         */
        auto with_connect_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Read timeout on the protocol stream (default: 5 minutes)
         */
        auto with_idle_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Ticket verifier; none accepts any well-formed ticket
         */
        auto with_authenticator(std::shared_ptr<const ticket_authenticator> authenticator)
            -> builder&;

        /**
         * @brief Chooses among discovered senders (default: the first)
         */
        auto with_device_selector(device_selector selector) -> builder&;

        [[nodiscard]] auto build() -> result<fastdrop_receiver>;

    private:
        receiver_config config_;
        std::shared_ptr<peer_network> network_;
        std::shared_ptr<oob_channel> channel_;
        std::shared_ptr<const ticket_authenticator> authenticator_;
        device_selector selector_;
    };

    // Non-copyable, movable
    fastdrop_receiver(const fastdrop_receiver&) = delete;
    auto operator=(const fastdrop_receiver&) -> fastdrop_receiver& = delete;
    fastdrop_receiver(fastdrop_receiver&&) noexcept;
    auto operator=(fastdrop_receiver&&) noexcept -> fastdrop_receiver&;
    ~fastdrop_receiver();

    /**
     * @brief Scan once and keep devices advertising a known transport profile
     * @return Candidates, or no_devices_found; the session returns to idle
     */
    [[nodiscard]] auto discover() -> result<std::vector<discovered_device>>;

    /**
     * @brief Read and parse the ticket of a discovered device
     * @return Ticket, or payload_unavailable / ticket_decode_error / ticket_auth_failed
     */
    [[nodiscard]] auto fetch_ticket(const discovered_device& device) -> result<session_ticket>;

    /**
     * @brief Connect to the ticket's peer and receive the transfer
     * @return Outcome once streaming has started; handshake errors and
     *         transfer_rejected otherwise
     */
    [[nodiscard]] auto receive(const session_ticket& ticket) -> result<transfer_outcome>;

    /**
     * @brief discover(), select, fetch_ticket() and receive() in one call
     */
    [[nodiscard]] auto run() -> result<transfer_outcome>;

    /**
     * @brief Abort the session in progress from another thread
     */
    void cancel();

    /**
     * @brief Called on the receiving thread after each chunk is written
     */
    void on_progress(chunk_progress_callback callback);

    [[nodiscard]] auto state() const -> session_state;

    [[nodiscard]] auto config() const -> const receiver_config&;

private:
    fastdrop_receiver(receiver_config config,
                      std::shared_ptr<peer_network> network,
                      std::shared_ptr<oob_channel> channel,
                      std::shared_ptr<const ticket_authenticator> authenticator,
                      device_selector selector);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_SESSION_FASTDROP_RECEIVER_H
