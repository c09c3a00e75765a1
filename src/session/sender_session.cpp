/**
 * @file sender_session.cpp
 * @brief Implementation of the per-stream sender session
 */

#include <kcenon/fastdrop/session/sender_session.h>

#include <kcenon/fastdrop/core/chunk_splitter.h>
#include <kcenon/fastdrop/core/logging.h>
#include <kcenon/fastdrop/core/transfer_utils.h>
#include <kcenon/fastdrop/protocol/frame_io.h>

namespace kcenon::fastdrop {

sender_session::sender_session(peer_id peer,
                               std::unique_ptr<byte_stream> stream,
                               std::shared_ptr<const transfer_plan> plan,
                               std::chrono::milliseconds idle_timeout,
                               chunk_config config)
    : peer_(std::move(peer)),
      stream_(std::move(stream)),
      plan_(std::move(plan)),
      idle_timeout_(idle_timeout),
      config_(config),
      machine_(session_role::sender, session_state::advertising),
      state_(session_state::advertising) {
    machine_.on_transition([this](session_state, session_state to) { state_.store(to); });
}

sender_session::~sender_session() {
    if (stream_) {
        stream_->close();
    }
}

auto sender_session::run(const admission_check& admit) -> session_summary {
    const auto start_time = std::chrono::steady_clock::now();

    session_summary summary;
    summary.peer = peer_;

    serve(admit, summary);
    stream_->close();

    summary.final_state = machine_.state();
    summary.failure = machine_.last_error();
    summary.duration_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time)
            .count());

    transfer_log_context ctx;
    ctx.peer = peer_.value;
    ctx.request_id = summary.request_id;
    ctx.bytes_transferred = summary.bytes_sent;
    ctx.duration_ms = summary.duration_ms;
    ctx.state = to_string(summary.final_state);
    if (summary.final_state == session_state::failed) {
        ctx.error_message = summary.failure.message;
        FD_LOG_WARN_CTX(log_category::sender, "Session failed", ctx);
    } else {
        FD_LOG_INFO_CTX(log_category::sender, "Session finished", ctx);
    }
    return summary;
}

void sender_session::serve(const admission_check& admit, session_summary& summary) {
    if (auto connected = machine_.apply(connection_established{peer_}); !connected) {
        return;
    }

    stream_->set_read_timeout(idle_timeout_);
    stream_->set_write_timeout(idle_timeout_);

    auto request = receive_request(*stream_);
    if (!request) {
        fail_with(request.error());
        return;
    }
    summary.request_id = request.value().request_id;
    summary.ready = request.value().ready;

    if (auto received = machine_.apply(request_received{request.value()}); !received) {
        return;
    }

    if (!request.value().ready) {
        FD_LOG_INFO(log_category::sender,
                    "Receiver " + peer_.value + " not ready, closing stream without a response");
        stream_->close();
        advance(session_state::complete);
        return;
    }

    const bool accepted = !admit || admit(request.value());

    transfer_response response;
    response.request_id = request.value().request_id;
    response.accepted = accepted;
    if (accepted) {
        response.manifest = plan_->manifest;
    }

    if (auto sent = send_response(*stream_, response); !sent) {
        fail_with(sent.error());
        return;
    }
    summary.accepted = accepted;
    if (!advance(session_state::response_sent)) {
        return;
    }

    if (!accepted) {
        FD_LOG_INFO(log_category::sender, "Declined request from " + peer_.value);
        stream_->close();
        advance(session_state::complete);
        return;
    }

    if (!advance(session_state::streaming)) {
        return;
    }

    if (auto streamed = stream_files(summary); !streamed) {
        fail_with(streamed.error());
        return;
    }

    if (auto flushed = stream_->flush(); !flushed) {
        fail_with(flushed.error());
        return;
    }
    stream_->close();
    advance(session_state::complete);
}

auto sender_session::stream_files(session_summary& summary) -> result<void> {
    chunk_splitter splitter(config_);

    for (std::size_t i = 0; i < plan_->paths.size(); ++i) {
        auto chunks = splitter.send_file(plan_->paths[i], i);
        if (!chunks) {
            return unexpected(chunks.error());
        }

        auto& iter = chunks.value();
        while (iter.has_next()) {
            if (cancelled_.load()) {
                return unexpected(error{error_code::cancelled, "session cancelled"});
            }

            auto chunk = iter.next();
            if (!chunk) {
                return unexpected(chunk.error());
            }

            if (auto sent = send_chunk(*stream_, chunk.value()); !sent) {
                return sent;
            }
            summary.chunks_sent++;
            summary.bytes_sent += chunk.value().payload.size();
        }

        FD_LOG_DEBUG(log_category::sender,
                     "Sent " + plan_->manifest.files[i].name + " (" +
                         std::to_string(iter.total_chunks()) + " chunks, " +
                         format_bytes(iter.file_size()) + ") to " + peer_.value);
    }
    return {};
}

void sender_session::cancel() {
    cancelled_.store(true);
    stream_->close();
}

void sender_session::on_connection_closed(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        connection_closed_ = true;
        close_reason_ = reason;
    }
    stream_->close();
}

auto sender_session::advance(session_state to) -> bool {
    if (auto moved = machine_.transition(to); !moved) {
        machine_.fail(moved.error());
        return false;
    }
    return true;
}

void sender_session::fail_with(const error& err) {
    std::string closed_reason;
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        closed = connection_closed_;
        closed_reason = close_reason_;
    }

    // The event's effect is recorded in the machine's state and last_error
    if (cancelled_.load()) {
        machine_.fail(error{error_code::cancelled, "session cancelled"});
    } else if (closed) {
        (void)machine_.apply(connection_closed{peer_, closed_reason});
    } else if (err.code == error_code::connection_timeout) {
        (void)machine_.apply(timer_fired{"idle_timeout"});
    } else if (err.code == error_code::connection_lost || err.code == error_code::truncated_frame) {
        (void)machine_.apply(stream_closed{false, err.message});
    } else {
        machine_.fail(err);
    }
}

}  // namespace kcenon::fastdrop
