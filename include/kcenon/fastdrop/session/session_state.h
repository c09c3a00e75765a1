/**
 * @file session_state.h
 * @brief Session states and the event-driven state machine
 */

#ifndef KCENON_FASTDROP_SESSION_SESSION_STATE_H
#define KCENON_FASTDROP_SESSION_SESSION_STATE_H

#include <kcenon/fastdrop/core/types.h>
#include <kcenon/fastdrop/session/session_event.h>

#include <functional>

namespace kcenon::fastdrop {

/**
 * @brief Which half of the protocol a session runs
 */
enum class session_role {
    sender,
    receiver,
};

[[nodiscard]] constexpr auto to_string(session_role role) -> const char* {
    switch (role) {
        case session_role::sender: return "sender";
        case session_role::receiver: return "receiver";
        default: return "unknown";
    }
}

/**
 * @brief Session states
 */
enum class session_state {
    idle,
    advertising,        ///< Sender: ticket is on air
    scanning,           ///< Receiver: looking for senders
    ticket_exchanged,   ///< Receiver: ticket read and parsed
    connected,
    request_sent,       ///< Receiver
    request_received,   ///< Sender
    response_sent,      ///< Sender
    response_received,  ///< Receiver
    streaming,
    complete,
    failed,
};

[[nodiscard]] constexpr auto to_string(session_state state) -> const char* {
    switch (state) {
        case session_state::idle: return "idle";
        case session_state::advertising: return "advertising";
        case session_state::scanning: return "scanning";
        case session_state::ticket_exchanged: return "ticket_exchanged";
        case session_state::connected: return "connected";
        case session_state::request_sent: return "request_sent";
        case session_state::request_received: return "request_received";
        case session_state::response_sent: return "response_sent";
        case session_state::response_received: return "response_received";
        case session_state::streaming: return "streaming";
        case session_state::complete: return "complete";
        case session_state::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(session_state state) noexcept -> bool {
    return state == session_state::complete || state == session_state::failed;
}

/**
 * @brief Check if a state transition is allowed for a role
 */
[[nodiscard]] constexpr auto is_valid_transition(
    session_role role, session_state from, session_state to) noexcept -> bool {
    // Terminal states cannot transition
    if (is_terminal(from)) {
        return false;
    }

    // Any non-terminal state can fail
    if (to == session_state::failed) {
        return true;
    }

    const bool sender = role == session_role::sender;
    switch (from) {
        case session_state::idle:
            return sender ? to == session_state::advertising : to == session_state::scanning;
        case session_state::advertising:
            return sender && (to == session_state::connected || to == session_state::idle);
        case session_state::scanning:
            return !sender &&
                   (to == session_state::ticket_exchanged || to == session_state::idle);
        case session_state::ticket_exchanged:
            return !sender && to == session_state::connected;
        case session_state::connected:
            return sender ? to == session_state::request_received
                          : to == session_state::request_sent;
        case session_state::request_received:
            // complete without a response when the receiver is not ready
            return sender &&
                   (to == session_state::response_sent || to == session_state::complete);
        case session_state::request_sent:
            return !sender && to == session_state::response_received;
        case session_state::response_sent:
            // complete directly after a rejection
            return sender && (to == session_state::streaming || to == session_state::complete);
        case session_state::response_received:
            return !sender && to == session_state::streaming;
        case session_state::streaming:
            return to == session_state::complete;
        default:
            return false;
    }
}

/**
 * @brief Per-session state machine
 *
 * Owned by exactly one task; not thread-safe.
 */
class session_state_machine {
public:
    using transition_callback = std::function<void(session_state from, session_state to)>;

    explicit session_state_machine(session_role role,
                                   session_state initial = session_state::idle);

    [[nodiscard]] auto role() const noexcept -> session_role { return role_; }
    [[nodiscard]] auto state() const noexcept -> session_state { return state_; }

    /**
     * @brief Error that moved the machine to failed (success otherwise)
     */
    [[nodiscard]] auto last_error() const -> const error& { return last_error_; }

    /**
     * @brief Explicit transition
     * @return invalid_state_transition if not allowed for this role
     */
    [[nodiscard]] auto transition(session_state to) -> result<void>;

    /**
     * @brief Move to failed and record why; no-op once terminal
     */
    void fail(error reason);

    /**
     * @brief Feed an event
     * @return The resulting state, or the error the event caused
     */
    [[nodiscard]] auto apply(const session_event& event) -> result<session_state>;

    void on_transition(transition_callback callback);

private:
    void set_state(session_state to);

    session_role role_;
    session_state state_;
    error last_error_;
    transition_callback callback_;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_SESSION_SESSION_STATE_H
