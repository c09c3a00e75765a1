/**
 * @file test_session_state.cpp
 * @brief Unit tests for the session state machine and its events
 */

#include <gtest/gtest.h>

#include <kcenon/fastdrop/session/session_state.h>

#include <utility>
#include <vector>

namespace kcenon::fastdrop::test {

namespace {

constexpr session_state all_states[] = {
    session_state::idle,           session_state::advertising,
    session_state::scanning,       session_state::ticket_exchanged,
    session_state::connected,      session_state::request_sent,
    session_state::request_received, session_state::response_sent,
    session_state::response_received, session_state::streaming,
    session_state::complete,       session_state::failed,
};

}  // namespace

// ============================================================================
// Transition table
// ============================================================================

TEST(SessionTransitionTest, SenderHappyPath) {
    const auto r = session_role::sender;
    EXPECT_TRUE(is_valid_transition(r, session_state::idle, session_state::advertising));
    EXPECT_TRUE(is_valid_transition(r, session_state::advertising, session_state::connected));
    EXPECT_TRUE(is_valid_transition(r, session_state::connected, session_state::request_received));
    EXPECT_TRUE(
        is_valid_transition(r, session_state::request_received, session_state::response_sent));
    EXPECT_TRUE(is_valid_transition(r, session_state::response_sent, session_state::streaming));
    EXPECT_TRUE(is_valid_transition(r, session_state::streaming, session_state::complete));
}

TEST(SessionTransitionTest, ReceiverHappyPath) {
    const auto r = session_role::receiver;
    EXPECT_TRUE(is_valid_transition(r, session_state::idle, session_state::scanning));
    EXPECT_TRUE(is_valid_transition(r, session_state::scanning, session_state::ticket_exchanged));
    EXPECT_TRUE(is_valid_transition(r, session_state::ticket_exchanged, session_state::connected));
    EXPECT_TRUE(is_valid_transition(r, session_state::connected, session_state::request_sent));
    EXPECT_TRUE(
        is_valid_transition(r, session_state::request_sent, session_state::response_received));
    EXPECT_TRUE(is_valid_transition(r, session_state::response_received, session_state::streaming));
    EXPECT_TRUE(is_valid_transition(r, session_state::streaming, session_state::complete));
}

TEST(SessionTransitionTest, RoleSpecificStatesAreNotShared) {
    EXPECT_FALSE(is_valid_transition(session_role::receiver, session_state::idle,
                                     session_state::advertising));
    EXPECT_FALSE(
        is_valid_transition(session_role::sender, session_state::idle, session_state::scanning));
    EXPECT_FALSE(is_valid_transition(session_role::sender, session_state::connected,
                                     session_state::request_sent));
    EXPECT_FALSE(is_valid_transition(session_role::receiver, session_state::connected,
                                     session_state::request_received));
}

TEST(SessionTransitionTest, ShortcutsAreAllowed) {
    // Not-ready request and declined request both end the sender session early
    EXPECT_TRUE(is_valid_transition(session_role::sender, session_state::request_received,
                                    session_state::complete));
    EXPECT_TRUE(is_valid_transition(session_role::sender, session_state::response_sent,
                                    session_state::complete));
    EXPECT_TRUE(is_valid_transition(session_role::sender, session_state::advertising,
                                    session_state::idle));
    EXPECT_TRUE(is_valid_transition(session_role::receiver, session_state::scanning,
                                    session_state::idle));
}

TEST(SessionTransitionTest, SkippingStepsIsRejected) {
    EXPECT_FALSE(is_valid_transition(session_role::sender, session_state::connected,
                                     session_state::streaming));
    EXPECT_FALSE(is_valid_transition(session_role::receiver, session_state::scanning,
                                     session_state::connected));
    EXPECT_FALSE(is_valid_transition(session_role::receiver, session_state::request_sent,
                                     session_state::streaming));
    EXPECT_FALSE(is_valid_transition(session_role::receiver, session_state::response_received,
                                     session_state::complete));
}

TEST(SessionTransitionTest, AnyLiveStateCanFail) {
    for (auto role : {session_role::sender, session_role::receiver}) {
        for (auto from : all_states) {
            EXPECT_EQ(is_valid_transition(role, from, session_state::failed), !is_terminal(from))
                << to_string(role) << " from " << to_string(from);
        }
    }
}

TEST(SessionTransitionTest, TerminalStatesNeverMove) {
    for (auto role : {session_role::sender, session_role::receiver}) {
        for (auto to : all_states) {
            EXPECT_FALSE(is_valid_transition(role, session_state::complete, to));
            EXPECT_FALSE(is_valid_transition(role, session_state::failed, to));
        }
    }
}

TEST(SessionTransitionTest, StateNames) {
    EXPECT_STREQ(to_string(session_state::ticket_exchanged), "ticket_exchanged");
    EXPECT_STREQ(to_string(session_state::response_sent), "response_sent");
    EXPECT_STREQ(to_string(session_role::receiver), "receiver");
    EXPECT_TRUE(is_terminal(session_state::complete));
    EXPECT_FALSE(is_terminal(session_state::streaming));
}

// ============================================================================
// State machine
// ============================================================================

TEST(SessionStateMachineTest, StartsInInitialState) {
    session_state_machine machine(session_role::sender, session_state::advertising);
    EXPECT_EQ(machine.role(), session_role::sender);
    EXPECT_EQ(machine.state(), session_state::advertising);
    EXPECT_FALSE(machine.last_error());
}

TEST(SessionStateMachineTest, InvalidTransitionLeavesStateUnchanged) {
    session_state_machine machine(session_role::receiver);

    auto moved = machine.transition(session_state::streaming);
    ASSERT_FALSE(moved.has_value());
    EXPECT_EQ(moved.error().code, error_code::invalid_state_transition);
    EXPECT_NE(moved.error().message.find("idle"), std::string::npos);
    EXPECT_EQ(machine.state(), session_state::idle);
}

TEST(SessionStateMachineTest, TransitionCallbackSeesEveryMove) {
    session_state_machine machine(session_role::receiver);
    std::vector<std::pair<session_state, session_state>> seen;
    machine.on_transition(
        [&seen](session_state from, session_state to) { seen.emplace_back(from, to); });

    ASSERT_TRUE(machine.transition(session_state::scanning).has_value());
    ASSERT_TRUE(machine.transition(session_state::ticket_exchanged).has_value());
    (void)machine.transition(session_state::complete);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, session_state::idle);
    EXPECT_EQ(seen[0].second, session_state::scanning);
    EXPECT_EQ(seen[1].second, session_state::ticket_exchanged);
}

TEST(SessionStateMachineTest, FailRecordsFirstErrorOnly) {
    session_state_machine machine(session_role::sender, session_state::advertising);

    machine.fail(error{error_code::dial_failed, "first"});
    machine.fail(error{error_code::connection_lost, "second"});

    EXPECT_EQ(machine.state(), session_state::failed);
    EXPECT_EQ(machine.last_error().code, error_code::dial_failed);
    EXPECT_EQ(machine.last_error().message, "first");
}

TEST(SessionStateMachineTest, FailAfterCompleteIsIgnored) {
    session_state_machine machine(session_role::sender, session_state::streaming);
    ASSERT_TRUE(machine.transition(session_state::complete).has_value());

    machine.fail(error{error_code::connection_lost, "late"});
    EXPECT_EQ(machine.state(), session_state::complete);
    EXPECT_FALSE(machine.last_error());
}

// ============================================================================
// Events
// ============================================================================

TEST(SessionEventTest, SenderFlowDrivenByEvents) {
    session_state_machine machine(session_role::sender, session_state::advertising);
    peer_id peer{"10.0.0.2:40001"};

    auto connected = machine.apply(connection_established{peer});
    ASSERT_TRUE(connected.has_value());
    EXPECT_EQ(connected.value(), session_state::connected);

    auto received = machine.apply(request_received{transfer_request{7, true}});
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received.value(), session_state::request_received);
}

TEST(SessionEventTest, DuplicateConnectionEventIsHarmless) {
    session_state_machine machine(session_role::sender, session_state::advertising);
    peer_id peer{"10.0.0.2:40001"};
    ASSERT_TRUE(machine.apply(connection_established{peer}).has_value());

    auto again = machine.apply(connection_established{peer});
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value(), session_state::connected);
}

TEST(SessionEventTest, ReceiverFlowDrivenByEvents) {
    session_state_machine machine(session_role::receiver, session_state::ticket_exchanged);
    ASSERT_TRUE(machine.apply(connection_established{peer_id{"10.0.0.1:40000"}}).has_value());
    ASSERT_TRUE(machine.transition(session_state::request_sent).has_value());

    auto response = machine.apply(response_received{42, true, 3});
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response.value(), session_state::response_received);

    ASSERT_TRUE(machine.transition(session_state::streaming).has_value());
    EXPECT_TRUE(machine.apply(chunk_received{0, 0, 1, 512}).has_value());

    auto done = machine.apply(stream_closed{});
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done.value(), session_state::complete);
}

TEST(SessionEventTest, DeclinedResponseFailsWithTransferRejected) {
    session_state_machine machine(session_role::receiver, session_state::request_sent);

    auto response = machine.apply(response_received{42, false, 0});
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::transfer_rejected);
    EXPECT_EQ(machine.state(), session_state::failed);
    EXPECT_EQ(machine.last_error().code, error_code::transfer_rejected);
}

TEST(SessionEventTest, ResponseOnSenderIsUnexpected) {
    session_state_machine machine(session_role::sender, session_state::connected);

    auto r = machine.apply(response_received{1, true, 1});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::unexpected_message);
    EXPECT_EQ(machine.state(), session_state::failed);
}

TEST(SessionEventTest, ChunkBeforeStreamingIsUnexpected) {
    session_state_machine machine(session_role::receiver, session_state::request_sent);

    auto r = machine.apply(chunk_received{0, 0, 1, 16});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::unexpected_message);
    EXPECT_NE(r.error().message.find("chunk_received"), std::string::npos);
}

TEST(SessionEventTest, ConnectionClosedFailsWithConnectionLost) {
    session_state_machine machine(session_role::sender, session_state::streaming);

    auto r = machine.apply(connection_closed{peer_id{"10.0.0.3:40002"}, "radio lost"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(machine.state(), session_state::failed);
    EXPECT_EQ(machine.last_error().code, error_code::connection_lost);
    EXPECT_NE(machine.last_error().message.find("radio lost"), std::string::npos);
}

TEST(SessionEventTest, CleanCloseBeforeStreamingIsConnectionLost) {
    session_state_machine machine(session_role::receiver, session_state::request_sent);

    auto r = machine.apply(stream_closed{});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::connection_lost);
    EXPECT_EQ(machine.state(), session_state::failed);
}

TEST(SessionEventTest, DirtyCloseWhileStreamingCarriesReason) {
    session_state_machine machine(session_role::receiver, session_state::streaming);

    auto r = machine.apply(stream_closed{false, "reset by peer"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(machine.last_error().code, error_code::connection_lost);
    EXPECT_EQ(machine.last_error().message, "reset by peer");
}

TEST(SessionEventTest, TimerFiredIsConnectionTimeout) {
    session_state_machine machine(session_role::sender, session_state::connected);

    auto r = machine.apply(timer_fired{"idle_timeout"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(machine.last_error().code, error_code::connection_timeout);
    EXPECT_NE(machine.last_error().message.find("idle_timeout"), std::string::npos);
}

TEST(SessionEventTest, EventsAfterTerminalStateChangeNothing) {
    session_state_machine machine(session_role::receiver, session_state::streaming);
    ASSERT_TRUE(machine.apply(stream_closed{}).has_value());

    auto late = machine.apply(connection_closed{peer_id{"10.0.0.1:40000"}, "closed"});
    ASSERT_TRUE(late.has_value());
    EXPECT_EQ(late.value(), session_state::complete);
    EXPECT_FALSE(machine.last_error());
}

TEST(SessionEventTest, EventNames) {
    EXPECT_STREQ(event_name(session_event{timer_fired{"x"}}), "timer_fired");
    EXPECT_STREQ(event_name(session_event{stream_closed{}}), "stream_closed");
    EXPECT_STREQ(event_name(session_event{connection_established{}}), "connection_established");
}

}  // namespace kcenon::fastdrop::test
