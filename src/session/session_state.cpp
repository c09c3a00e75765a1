/**
 * @file session_state.cpp
 * @brief Implementation of the session state machine
 */

#include <kcenon/fastdrop/session/session_state.h>

#include <kcenon/fastdrop/core/logging.h>

namespace kcenon::fastdrop {

session_state_machine::session_state_machine(session_role role, session_state initial)
    : role_(role), state_(initial) {}

auto session_state_machine::transition(session_state to) -> result<void> {
    if (!is_valid_transition(role_, state_, to)) {
        return unexpected(error{error_code::invalid_state_transition,
                                std::string(to_string(role_)) + " cannot move from " +
                                    to_string(state_) + " to " + to_string(to)});
    }
    set_state(to);
    return {};
}

void session_state_machine::fail(error reason) {
    if (is_terminal(state_)) {
        return;
    }
    last_error_ = std::move(reason);
    set_state(session_state::failed);
}

auto session_state_machine::apply(const session_event& event) -> result<session_state> {
    if (is_terminal(state_)) {
        // Late notifications (a connection closing after completion) change nothing
        return state_;
    }

    auto reject = [this, &event]() -> result<session_state> {
        error err{error_code::unexpected_message,
                  std::string(event_name(event)) + " while " + to_string(state_)};
        fail(err);
        return unexpected(std::move(err));
    };

    auto move_to = [this](session_state to) -> result<session_state> {
        if (auto r = transition(to); !r) {
            fail(r.error());
            return unexpected(r.error());
        }
        return state_;
    };

    return std::visit(
        overloaded{
            [&](const connection_established&) -> result<session_state> {
                if (state_ == session_state::ticket_exchanged ||
                    state_ == session_state::advertising) {
                    return move_to(session_state::connected);
                }
                // Duplicate notifications for an existing connection
                return state_;
            },
            [&](const connection_closed& e) -> result<session_state> {
                error err{error_code::connection_lost,
                          "connection to " + e.peer.value + " closed: " + e.reason};
                fail(err);
                return unexpected(std::move(err));
            },
            [&](const request_received&) -> result<session_state> {
                if (role_ != session_role::sender || state_ != session_state::connected) {
                    return reject();
                }
                return move_to(session_state::request_received);
            },
            [&](const response_received& e) -> result<session_state> {
                if (role_ != session_role::receiver || state_ != session_state::request_sent) {
                    return reject();
                }
                if (!e.accepted) {
                    error err{error_code::transfer_rejected,
                              "sender declined request " + std::to_string(e.request_id)};
                    fail(err);
                    return unexpected(std::move(err));
                }
                return move_to(session_state::response_received);
            },
            [&](const chunk_received&) -> result<session_state> {
                if (state_ != session_state::streaming) {
                    return reject();
                }
                return state_;
            },
            [&](const stream_closed& e) -> result<session_state> {
                if (state_ == session_state::streaming && e.clean) {
                    return move_to(session_state::complete);
                }
                error err{error_code::connection_lost,
                          e.clean ? "stream closed while " + std::string(to_string(state_))
                                  : e.reason};
                fail(err);
                return unexpected(std::move(err));
            },
            [&](const timer_fired& e) -> result<session_state> {
                error err{error_code::connection_timeout,
                          e.timer + " expired while " + to_string(state_)};
                fail(err);
                return unexpected(std::move(err));
            },
        },
        event);
}

void session_state_machine::on_transition(transition_callback callback) {
    callback_ = std::move(callback);
}

void session_state_machine::set_state(session_state to) {
    auto from = state_;
    state_ = to;

    FD_LOG_DEBUG(log_category::session,
                 std::string(to_string(role_)) + " " + to_string(from) + " -> " + to_string(to));
    if (callback_) {
        callback_(from, to);
    }
}

}  // namespace kcenon::fastdrop
