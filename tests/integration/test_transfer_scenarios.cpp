/**
 * @file test_transfer_scenarios.cpp
 * @brief End-to-end scenarios between a sender and a receiver over loopback collaborators
 */

#include "test_fixtures.h"

#include <kcenon/fastdrop/core/chunk_splitter.h>
#include <kcenon/fastdrop/protocol/frame_io.h>

#include <atomic>
#include <future>
#include <mutex>

namespace kcenon::fastdrop::test {

/**
 * @brief Hand-driven sender side for protocol misbehaviour
 */
class ScriptedSender {
public:
    using script = std::function<void(byte_stream&, const transfer_request&)>;

    explicit ScriptedSender(std::shared_ptr<loopback_peer_network> network)
        : network_(std::move(network)) {
        auto identity = network_->generate_identity();
        EXPECT_TRUE(identity.has_value());
        auto bound = network_->listen(transport_kind::quic);
        EXPECT_TRUE(bound.has_value());

        ticket_.peer = identity.value();
        ticket_.transport = transport_kind::quic;
        for (const auto& address : bound.value()) {
            if (!is_local_only_address(address)) {
                ticket_.addresses.push_back(address);
            }
        }
    }

    ~ScriptedSender() {
        if (worker_.valid()) {
            worker_.wait();
        }
    }

    void serve(script run) {
        worker_ = std::async(std::launch::async, [this, run = std::move(run)] {
            auto inbound = network_->accept_stream(std::chrono::seconds(5));
            ASSERT_TRUE(inbound.has_value());
            auto request = receive_request(*inbound.value().stream);
            ASSERT_TRUE(request.has_value());
            run(*inbound.value().stream, request.value());
            inbound.value().stream->close();
        });
    }

    [[nodiscard]] auto ticket() const -> const session_ticket& { return ticket_; }

private:
    std::shared_ptr<loopback_peer_network> network_;
    session_ticket ticket_;
    std::future<void> worker_;
};

/**
 * @brief Loopback network whose listen() always fails
 */
class UnbindableNetwork : public loopback_peer_network {
public:
    using loopback_peer_network::loopback_peer_network;

    auto listen(transport_kind) -> result<std::vector<std::string>> override {
        return unexpected(error{error_code::no_reachable_address, "no interface to bind"});
    }
};

class TransferScenarioTest : public LoopbackFixture {
protected:
    auto manifest_for(const std::vector<std::filesystem::path>& paths) -> file_manifest {
        auto plan = analyze_files(paths);
        EXPECT_TRUE(plan.has_value());
        return plan.value().manifest;
    }

    static void send_all_chunks(byte_stream& stream,
                                const std::filesystem::path& path,
                                uint64_t file_index,
                                uint64_t limit = UINT64_MAX) {
        chunk_splitter splitter;
        auto chunks = splitter.send_file(path, file_index);
        ASSERT_TRUE(chunks.has_value());
        uint64_t sent = 0;
        while (chunks.value().has_next() && sent < limit) {
            auto chunk = chunks.value().next();
            ASSERT_TRUE(chunk.has_value());
            ASSERT_TRUE(send_chunk(stream, chunk.value()).has_value());
            ++sent;
        }
    }
};

TEST_F(TransferScenarioTest, ThreeFilesArriveVerified) {
    auto a = create_test_file("video.bin", 10 * mib);
    auto b = create_test_file("photo.bin", 5 * mib);
    auto c = create_test_file("note.txt", 1 * kib);

    auto sender = make_sender({a, b, c});
    ASSERT_TRUE(sender.start().has_value());
    EXPECT_EQ(sender.state(), sender_state::advertising);
    EXPECT_TRUE(sender_radio_->is_advertising());

    auto plan = sender.plan();
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->transport, transport_kind::quic);
    EXPECT_EQ(plan->manifest.total_size, 15 * mib + 1 * kib);

    auto advertised = parse_ticket(sender.ticket());
    ASSERT_TRUE(advertised.has_value());
    ASSERT_FALSE(advertised.value().addresses.empty());
    for (const auto& address : advertised.value().addresses) {
        EXPECT_FALSE(is_local_only_address(address)) << address;
    }

    auto receiver = make_receiver();
    std::atomic<uint64_t> progress_calls{0};
    receiver.on_progress([&](const chunk_progress&) { progress_calls++; });

    auto outcome = receiver.run();
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;

    const auto& result = outcome.value();
    EXPECT_EQ(result.final_state, session_state::complete);
    EXPECT_FALSE(result.failure);
    EXPECT_EQ(result.manifest.size(), 3u);
    EXPECT_EQ(result.report.chunks_received, 16u);
    EXPECT_EQ(progress_calls.load(), 16u);
    EXPECT_TRUE(result.report.all_successful());
    EXPECT_EQ(result.report.count(file_outcome::verified), 3u);

    EXPECT_TRUE(files_equal(a, download_dir_ / "video.bin"));
    EXPECT_TRUE(files_equal(b, download_dir_ / "photo.bin"));
    EXPECT_TRUE(files_equal(c, download_dir_ / "note.txt"));

    ASSERT_TRUE(wait_for([&] { return sender.completed_sessions().size() == 1; }));
    auto summary = sender.completed_sessions().front();
    EXPECT_TRUE(summary.accepted);
    EXPECT_EQ(summary.final_state, session_state::complete);
    EXPECT_EQ(summary.chunks_sent, 16u);
    EXPECT_EQ(summary.request_id, result.request_id);

    EXPECT_TRUE(sender.stop().has_value());
    EXPECT_FALSE(sender_radio_->is_advertising());
    EXPECT_EQ(sender.state(), sender_state::stopped);
}

TEST_F(TransferScenarioTest, LargeTransferAdvertisesTcpProfile) {
    auto a = create_test_file("disk1.img", 60 * mib);
    auto b = create_test_file("disk2.img", 45 * mib);

    auto sender = fastdrop_sender::builder()
        .with_files({a, b})
        .with_peer_network(sender_network_)
        .with_oob_channel(sender_radio_)
        .with_size_limits(size_limits{100 * mib, 500 * mib})
        .build();
    ASSERT_TRUE(sender.has_value());
    ASSERT_TRUE(sender.value().start().has_value());

    auto ticket = parse_ticket(sender.value().ticket());
    ASSERT_TRUE(ticket.has_value());
    EXPECT_EQ(ticket.value().transport, transport_kind::tcp);

    auto found = receiver_radio_->scan(std::chrono::milliseconds(20));
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found.value().size(), 1u);
    ASSERT_EQ(found.value().front().discovery_ids.size(), 1u);
    EXPECT_EQ(found.value().front().discovery_ids.front(), tcp_profile.discovery_id);
    EXPECT_EQ(found.value().front().display_name, "Fastdrop");

    EXPECT_TRUE(sender.value().stop().has_value());
}

TEST_F(TransferScenarioTest, NotReadyRequestGetsNoResponse) {
    auto a = create_test_file("a.bin", 100 * kib);
    auto sender = make_sender({a});
    ASSERT_TRUE(sender.start().has_value());

    auto ticket = parse_ticket(sender.ticket());
    ASSERT_TRUE(ticket.has_value());

    ASSERT_TRUE(receiver_network_->generate_identity().has_value());
    ASSERT_TRUE(receiver_network_->dial(ticket.value().peer, ticket.value().addresses).has_value());
    auto stream = receiver_network_->open_stream(ticket.value().peer);
    ASSERT_TRUE(stream.has_value());
    stream.value()->set_read_timeout(std::chrono::seconds(5));

    ASSERT_TRUE(send_request(*stream.value(), transfer_request{7, false}).has_value());

    // Nothing but end of stream may follow
    auto frame = read_frame(*stream.value());
    ASSERT_TRUE(frame.has_value());
    EXPECT_FALSE(frame.value().has_value());

    ASSERT_TRUE(wait_for([&] { return sender.completed_sessions().size() == 1; }));
    auto summary = sender.completed_sessions().front();
    EXPECT_EQ(summary.request_id, 7u);
    EXPECT_FALSE(summary.ready);
    EXPECT_FALSE(summary.accepted);
    EXPECT_EQ(summary.chunks_sent, 0u);
    EXPECT_EQ(summary.final_state, session_state::complete);

    EXPECT_TRUE(sender.stop().has_value());
}

TEST_F(TransferScenarioTest, SecondStreamFromSamePeerIsDeclined) {
    auto a = create_test_file("a.bin", 100 * kib);
    auto sender = make_sender({a});
    ASSERT_TRUE(sender.start().has_value());

    auto ticket = parse_ticket(sender.ticket());
    ASSERT_TRUE(ticket.has_value());
    ASSERT_TRUE(receiver_network_->generate_identity().has_value());
    ASSERT_TRUE(receiver_network_->dial(ticket.value().peer, ticket.value().addresses).has_value());

    // The first stream holds the peer's slot while it waits for a request
    auto first = receiver_network_->open_stream(ticket.value().peer);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(wait_for([&] { return sender.active_sessions() == 1; }));

    auto second = receiver_network_->open_stream(ticket.value().peer);
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(send_request(*second.value(), transfer_request{11, true}).has_value());

    auto response = receive_response(*second.value());
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response.value().request_id, 11u);
    EXPECT_FALSE(response.value().accepted);
    EXPECT_TRUE(response.value().manifest.empty());

    auto after = read_frame(*second.value());
    ASSERT_TRUE(after.has_value());
    EXPECT_FALSE(after.value().has_value());

    first.value()->close();
    EXPECT_TRUE(sender.stop().has_value());
}

TEST_F(TransferScenarioTest, OutOfRangeFileIndexAbortsButKeepsCompletedFiles) {
    auto a = create_test_file("first.bin", 1 * mib + 100);
    auto b = create_test_file("second.bin", 300 * kib);
    auto c = create_test_file("third.bin", 10 * kib);
    auto manifest = manifest_for({a, b, c});

    ScriptedSender sender(sender_network_);
    sender.serve([&](byte_stream& stream, const transfer_request& request) {
        ASSERT_TRUE(send_response(stream, transfer_response{request.request_id, manifest, true})
                        .has_value());
        send_all_chunks(stream, a, 0);
        send_all_chunks(stream, b, 1);
        (void)send_chunk(stream, file_chunk{99, 0, 1, {}});
    });

    auto receiver = make_receiver();
    auto outcome = receiver.receive(sender.ticket());
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;

    const auto& result = outcome.value();
    EXPECT_EQ(result.final_state, session_state::failed);
    EXPECT_EQ(result.failure.code, error_code::invalid_file_index);
    ASSERT_EQ(result.report.files.size(), 3u);
    EXPECT_EQ(result.report.files[0].outcome, file_outcome::verified);
    EXPECT_EQ(result.report.files[1].outcome, file_outcome::verified);
    EXPECT_EQ(result.report.files[2].outcome, file_outcome::not_started);

    EXPECT_TRUE(files_equal(a, download_dir_ / "first.bin"));
    EXPECT_TRUE(files_equal(b, download_dir_ / "second.bin"));
    EXPECT_EQ(receiver.state(), session_state::failed);
}

TEST_F(TransferScenarioTest, TruncatedFileIsNeverVerified) {
    auto a = create_test_file("partial.bin", 2 * mib + 512 * kib);
    auto manifest = manifest_for({a});

    get_logger().set_level(log_level::debug);
    std::vector<std::string> messages;
    std::mutex messages_mutex;
    get_logger().set_callback([&](log_level, std::string_view, std::string_view message,
                                  const transfer_log_context*) {
        std::lock_guard<std::mutex> lock(messages_mutex);
        messages.emplace_back(message);
    });

    ScriptedSender sender(sender_network_);
    sender.serve([&](byte_stream& stream, const transfer_request& request) {
        ASSERT_TRUE(send_response(stream, transfer_response{request.request_id, manifest, true})
                        .has_value());
        send_all_chunks(stream, a, 0, 2);
    });

    auto receiver = make_receiver();
    auto outcome = receiver.receive(sender.ticket());
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;

    const auto& result = outcome.value();
    EXPECT_EQ(result.final_state, session_state::complete);
    EXPECT_EQ(result.failure.code, error_code::incomplete_transfer);
    ASSERT_EQ(result.report.files.size(), 1u);
    EXPECT_EQ(result.report.files[0].outcome, file_outcome::incomplete);
    EXPECT_EQ(result.report.files[0].chunks_received, 2u);
    EXPECT_EQ(result.report.files[0].expected_chunks, 3u);
    EXPECT_FALSE(result.report.all_successful());

    get_logger().set_callback(nullptr);
    std::lock_guard<std::mutex> lock(messages_mutex);
    for (const auto& message : messages) {
        EXPECT_EQ(message.find("SHA-256"), std::string::npos) << message;
        EXPECT_EQ(message.find("Verified"), std::string::npos) << message;
    }
}

TEST_F(TransferScenarioTest, HashMismatchKeepsFileButFlagsIt) {
    auto a = create_test_file("tampered.bin", 64 * kib);
    auto manifest = manifest_for({a});
    (*manifest.files[0].content_hash)[0] ^= std::byte{0xFF};

    ScriptedSender sender(sender_network_);
    sender.serve([&](byte_stream& stream, const transfer_request& request) {
        ASSERT_TRUE(send_response(stream, transfer_response{request.request_id, manifest, true})
                        .has_value());
        send_all_chunks(stream, a, 0);
    });

    auto receiver = make_receiver();
    auto outcome = receiver.receive(sender.ticket());
    ASSERT_TRUE(outcome.has_value());

    EXPECT_EQ(outcome.value().failure.code, error_code::file_hash_mismatch);
    EXPECT_EQ(outcome.value().report.files[0].outcome, file_outcome::hash_mismatch);
    EXPECT_TRUE(std::filesystem::exists(download_dir_ / "tampered.bin"));
    EXPECT_TRUE(files_equal(a, download_dir_ / "tampered.bin"));
}

TEST_F(TransferScenarioTest, RejectedResponseFailsReceiver) {
    ScriptedSender sender(sender_network_);
    sender.serve([](byte_stream& stream, const transfer_request& request) {
        ASSERT_TRUE(send_response(stream, transfer_response{request.request_id, {}, false})
                        .has_value());
    });

    auto receiver = make_receiver();
    auto outcome = receiver.receive(sender.ticket());
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::transfer_rejected);
    EXPECT_EQ(receiver.state(), session_state::failed);
    EXPECT_FALSE(std::filesystem::exists(download_dir_));
}

TEST_F(TransferScenarioTest, SilentReceiverHitsIdleTimeout) {
    auto a = create_test_file("a.bin", 10 * kib);
    auto built = fastdrop_sender::builder()
        .with_files({a})
        .with_peer_network(sender_network_)
        .with_oob_channel(sender_radio_)
        .with_idle_timeout(std::chrono::milliseconds(100))
        .build();
    ASSERT_TRUE(built.has_value());
    auto& sender = built.value();
    ASSERT_TRUE(sender.start().has_value());

    auto ticket = parse_ticket(sender.ticket());
    ASSERT_TRUE(ticket.has_value());
    ASSERT_TRUE(receiver_network_->generate_identity().has_value());
    ASSERT_TRUE(receiver_network_->dial(ticket.value().peer, ticket.value().addresses).has_value());
    auto stream = receiver_network_->open_stream(ticket.value().peer);
    ASSERT_TRUE(stream.has_value());

    ASSERT_TRUE(wait_for([&] { return sender.completed_sessions().size() == 1; }));
    auto summary = sender.completed_sessions().front();
    EXPECT_EQ(summary.final_state, session_state::failed);
    EXPECT_EQ(summary.failure.code, error_code::connection_timeout);

    EXPECT_TRUE(sender.stop().has_value());
}

TEST_F(TransferScenarioTest, MismatchedTicketKeyIsRefused) {
    auto a = create_test_file("a.bin", 10 * kib);
    auto key = [](uint8_t fill) { return std::vector<std::byte>(32, std::byte{fill}); };

    auto sender = fastdrop_sender::builder()
        .with_files({a})
        .with_peer_network(sender_network_)
        .with_oob_channel(sender_radio_)
        .with_authenticator(std::make_shared<hmac_ticket_authenticator>(key(0x11)))
        .build();
    ASSERT_TRUE(sender.has_value());
    ASSERT_TRUE(sender.value().start().has_value());

    auto receiver = fastdrop_receiver::builder()
        .with_peer_network(receiver_network_)
        .with_oob_channel(receiver_radio_)
        .with_output_directory(download_dir_)
        .with_scan_window(std::chrono::milliseconds(20))
        .with_authenticator(std::make_shared<hmac_ticket_authenticator>(key(0x22)))
        .build();
    ASSERT_TRUE(receiver.has_value());

    auto outcome = receiver.value().run();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::ticket_auth_failed);
    EXPECT_EQ(receiver.value().state(), session_state::failed);

    EXPECT_TRUE(sender.value().stop().has_value());
}

TEST_F(TransferScenarioTest, SetupErrorsStopBeforeAdvertising) {
    auto a = create_test_file("a.bin", 10 * kib);

    auto missing = make_sender({a, source_dir_ / "missing.bin"});
    auto started = missing.start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::file_not_found);
    EXPECT_TRUE(is_process_fatal(started.error().code));
    EXPECT_EQ(missing.state(), sender_state::stopped);
    EXPECT_FALSE(sender_radio_->is_advertising());

    auto directory = make_sender({source_dir_});
    auto dir_started = directory.start();
    ASSERT_FALSE(dir_started.has_value());
    EXPECT_EQ(dir_started.error().code, error_code::not_regular_file);

    auto capped = fastdrop_sender::builder()
        .with_files({a})
        .with_peer_network(sender_network_)
        .with_oob_channel(sender_radio_)
        .with_size_limits(size_limits{1 * kib, 1 * mib})
        .build();
    ASSERT_TRUE(capped.has_value());
    auto capped_started = capped.value().start();
    ASSERT_FALSE(capped_started.has_value());
    EXPECT_EQ(capped_started.error().code, error_code::file_too_large);
    EXPECT_FALSE(sender_radio_->is_advertising());
}

TEST_F(TransferScenarioTest, ListenFailureReleasesIdentity) {
    auto a = create_test_file("a.bin", 10 * kib);
    auto network = std::make_shared<UnbindableNetwork>(hub_);

    auto built = fastdrop_sender::builder()
        .with_files({a})
        .with_peer_network(network)
        .with_oob_channel(sender_radio_)
        .build();
    ASSERT_TRUE(built.has_value());

    auto started = built.value().start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::no_reachable_address);
    EXPECT_EQ(built.value().state(), sender_state::stopped);
    EXPECT_FALSE(sender_radio_->is_advertising());

    auto identity = network->local_peer();
    ASSERT_FALSE(identity.empty());
    EXPECT_EQ(hub_->find(identity), nullptr);
}

TEST_F(TransferScenarioTest, NoSenderInRangeReturnsToIdle) {
    auto receiver = make_receiver();
    auto outcome = receiver.run();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::no_devices_found);
    EXPECT_TRUE(is_recoverable(outcome.error().code));
    EXPECT_EQ(receiver.state(), session_state::idle);
}

TEST_F(TransferScenarioTest, OutOfRangeSelectionReturnsToIdle) {
    auto a = create_test_file("a.bin", 10 * kib);
    auto sender = make_sender({a});
    ASSERT_TRUE(sender.start().has_value());

    auto receiver = fastdrop_receiver::builder()
        .with_peer_network(receiver_network_)
        .with_oob_channel(receiver_radio_)
        .with_output_directory(download_dir_)
        .with_scan_window(std::chrono::milliseconds(20))
        .with_device_selector([](const std::vector<discovered_device>& devices) {
            return std::optional<std::size_t>(devices.size() + 1);
        })
        .build();
    ASSERT_TRUE(receiver.has_value());

    auto outcome = receiver.value().run();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::invalid_selection);
    EXPECT_EQ(receiver.value().state(), session_state::idle);

    EXPECT_TRUE(sender.stop().has_value());
}

TEST_F(TransferScenarioTest, CancelStopsStalledReceive) {
    auto a = create_test_file("stalled.bin", 3 * mib);
    auto manifest = manifest_for({a});
    std::promise<void> release;
    auto released = release.get_future().share();

    ScriptedSender sender(sender_network_);
    sender.serve([&, released](byte_stream& stream, const transfer_request& request) {
        ASSERT_TRUE(send_response(stream, transfer_response{request.request_id, manifest, true})
                        .has_value());
        send_all_chunks(stream, a, 0, 1);
        released.wait();
    });

    auto receiver = make_receiver();
    auto canceller = std::async(std::launch::async, [&] {
        ASSERT_TRUE(wait_for([&] { return receiver.state() == session_state::streaming; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        receiver.cancel();
    });

    auto outcome = receiver.receive(sender.ticket());
    canceller.wait();
    release.set_value();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome.value().final_state, session_state::failed);
    EXPECT_EQ(outcome.value().failure.code, error_code::cancelled);
    EXPECT_EQ(outcome.value().report.files[0].outcome, file_outcome::incomplete);
}

TEST_F(TransferScenarioTest, CancelDuringScanSkipsDialing) {
    auto a = create_test_file("a.bin", 10 * kib);
    auto sender = make_sender({a});
    ASSERT_TRUE(sender.start().has_value());

    auto built = fastdrop_receiver::builder()
        .with_peer_network(receiver_network_)
        .with_oob_channel(receiver_radio_)
        .with_output_directory(download_dir_)
        .with_scan_window(std::chrono::seconds(10))
        .build();
    ASSERT_TRUE(built.has_value());
    auto& receiver = built.value();

    auto start = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async, [&receiver] { return receiver.run(); });
    ASSERT_TRUE(wait_for([&] { return receiver.state() == session_state::scanning; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    receiver.cancel();

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    auto outcome = pending.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));

    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::cancelled);
    EXPECT_EQ(receiver.state(), session_state::idle);

    // The sender never saw a connection
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(sender.active_sessions(), 0u);
    EXPECT_TRUE(sender.completed_sessions().empty());

    EXPECT_TRUE(sender.stop().has_value());
}

TEST_F(TransferScenarioTest, CancelBetweenRunsAppliesToNextRunOnly) {
    auto a = create_test_file("a.bin", 10 * kib);
    auto sender = make_sender({a});
    ASSERT_TRUE(sender.start().has_value());

    auto receiver = make_receiver();
    auto first = receiver.run();
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(receiver.state(), session_state::complete);
    ASSERT_TRUE(wait_for([&] { return sender.completed_sessions().size() == 1; }));

    receiver.cancel();
    auto second = receiver.run();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::cancelled);
    EXPECT_EQ(receiver.state(), session_state::idle);
    EXPECT_EQ(sender.completed_sessions().size(), 1u);

    auto third = receiver.run();
    ASSERT_TRUE(third.has_value()) << third.error().message;
    EXPECT_EQ(third.value().final_state, session_state::complete);
    EXPECT_TRUE(third.value().report.all_successful());

    EXPECT_TRUE(sender.stop().has_value());
}

}  // namespace kcenon::fastdrop::test
