/**
 * @file sender_session.h
 * @brief Sender half of the protocol for one inbound stream
 */

#ifndef KCENON_FASTDROP_SESSION_SENDER_SESSION_H
#define KCENON_FASTDROP_SESSION_SENDER_SESSION_H

#include <kcenon/fastdrop/core/chunk_config.h>
#include <kcenon/fastdrop/core/transport_policy.h>
#include <kcenon/fastdrop/core/types.h>
#include <kcenon/fastdrop/session/session_state.h>
#include <kcenon/fastdrop/session/session_types.h>
#include <kcenon/fastdrop/transport/byte_stream.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace kcenon::fastdrop {

/**
 * @brief Serves one receiver on one stream
 *
 * Reads exactly one transfer_request. A request with ready == false gets
 * no response. Otherwise exactly one transfer_response is written, and
 * when it is accepted every file's chunks follow in manifest order. The
 * stream is closed when the session ends.
 *
 * The session owns its stream and its state machine; the plan is shared
 * read-only with every other session of the same sender.
 *
 * @code
 * sender_session session(peer, std::move(stream), plan, std::chrono::minutes(5));
 * auto summary = session.run([](const transfer_request&) { return true; });
 * @endcode
 */
class sender_session {
public:
    /// Decides whether a ready request is accepted
    using admission_check = std::function<bool(const transfer_request&)>;

    sender_session(peer_id peer,
                   std::unique_ptr<byte_stream> stream,
                   std::shared_ptr<const transfer_plan> plan,
                   std::chrono::milliseconds idle_timeout,
                   chunk_config config = {});
    ~sender_session();

    sender_session(const sender_session&) = delete;
    auto operator=(const sender_session&) -> sender_session& = delete;

    /**
     * @brief Run the session to completion on the calling thread
     * @param admit Consulted once for a ready request; null accepts
     */
    [[nodiscard]] auto run(const admission_check& admit) -> session_summary;

    /**
     * @brief Abort from another thread; run() returns with cancelled
     */
    void cancel();

    /**
     * @brief The peer network dropped this peer's connection
     *
     * Safe to call from any thread. run() fails with connection_lost.
     */
    void on_connection_closed(const std::string& reason);

    [[nodiscard]] auto peer() const -> const peer_id& { return peer_; }

    /// Snapshot of the state machine, readable from any thread
    [[nodiscard]] auto state() const -> session_state { return state_.load(); }

private:
    void serve(const admission_check& admit, session_summary& summary);
    auto stream_files(session_summary& summary) -> result<void>;
    auto advance(session_state to) -> bool;
    void fail_with(const error& err);

    peer_id peer_;
    std::unique_ptr<byte_stream> stream_;
    std::shared_ptr<const transfer_plan> plan_;
    std::chrono::milliseconds idle_timeout_;
    chunk_config config_;

    session_state_machine machine_;
    std::atomic<session_state> state_;
    std::atomic<bool> cancelled_{false};

    std::mutex close_mutex_;
    bool connection_closed_ = false;
    std::string close_reason_;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_SESSION_SENDER_SESSION_H
