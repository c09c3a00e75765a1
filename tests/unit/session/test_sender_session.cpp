/**
 * @file test_sender_session.cpp
 * @brief Unit tests for the per-stream sender session
 */

#include <gtest/gtest.h>

#include <kcenon/fastdrop/core/error_codes.h>
#include <kcenon/fastdrop/core/transport_policy.h>
#include <kcenon/fastdrop/protocol/frame_io.h>
#include <kcenon/fastdrop/session/sender_session.h>
#include <kcenon/fastdrop/transport/memory_stream.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <thread>

namespace kcenon::fastdrop::test {

class SenderSessionTest : public ::testing::Test {
protected:
    static constexpr std::size_t chunk_size = 1024;

    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "fastdrop_test_sender_session";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        write_file("alpha.bin", 2500);
        write_file("beta.txt", 100);
        auto plan = analyze_files({test_dir_ / "alpha.bin", test_dir_ / "beta.txt"});
        ASSERT_TRUE(plan.has_value());
        plan_ = std::make_shared<const transfer_plan>(std::move(plan.value()));

        auto [local, remote] = make_stream_pair();
        remote->set_read_timeout(std::chrono::seconds(2));
        receiver_end_ = std::move(remote);
        session_ = std::make_unique<sender_session>(peer_id{"10.0.0.2:40001"}, std::move(local),
                                                    plan_, std::chrono::seconds(2),
                                                    chunk_config(chunk_size));
    }

    void TearDown() override {
        session_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    void write_file(const std::string& name, std::size_t size) {
        std::ofstream out(test_dir_ / name, std::ios::binary);
        for (std::size_t i = 0; i < size; ++i) {
            out.put(static_cast<char>(i % 251));
        }
    }

    auto run_async(sender_session::admission_check admit = {}) -> std::future<session_summary> {
        return std::async(std::launch::async,
                          [this, admit = std::move(admit)] { return session_->run(admit); });
    }

    std::filesystem::path test_dir_;
    std::shared_ptr<const transfer_plan> plan_;
    std::unique_ptr<memory_stream> receiver_end_;
    std::unique_ptr<sender_session> session_;
};

TEST_F(SenderSessionTest, StartsAdvertising) {
    EXPECT_EQ(session_->state(), session_state::advertising);
    EXPECT_EQ(session_->peer().value, "10.0.0.2:40001");
}

TEST_F(SenderSessionTest, AcceptedRequestStreamsEveryChunk) {
    auto summary_future = run_async();
    ASSERT_TRUE(send_request(*receiver_end_, transfer_request{77, true}).has_value());

    auto response = receive_response(*receiver_end_);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response.value().request_id, 77u);
    EXPECT_TRUE(response.value().accepted);
    EXPECT_EQ(response.value().manifest, plan_->manifest);

    // alpha: 3 chunks of 1024, beta: 1 chunk
    std::vector<file_chunk> chunks;
    while (true) {
        auto chunk = receive_chunk(*receiver_end_);
        ASSERT_TRUE(chunk.has_value());
        if (!chunk.value()) {
            break;
        }
        chunks.push_back(std::move(*chunk.value()));
    }

    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0].file_index, 0u);
    EXPECT_EQ(chunks[2].total_chunks, 3u);
    EXPECT_EQ(chunks[2].payload.size(), 2500u - 2 * chunk_size);
    EXPECT_EQ(chunks[3].file_index, 1u);
    EXPECT_EQ(chunks[3].payload.size(), 100u);

    auto summary = summary_future.get();
    EXPECT_EQ(summary.final_state, session_state::complete);
    EXPECT_EQ(summary.request_id, 77u);
    EXPECT_TRUE(summary.ready);
    EXPECT_TRUE(summary.accepted);
    EXPECT_EQ(summary.chunks_sent, 4u);
    EXPECT_EQ(summary.bytes_sent, 2600u);
    EXPECT_FALSE(summary.failure);
}

TEST_F(SenderSessionTest, NotReadyRequestGetsNoResponse) {
    auto summary_future = run_async();
    ASSERT_TRUE(send_request(*receiver_end_, transfer_request{5, false}).has_value());

    auto response = receive_response(*receiver_end_);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::connection_lost);

    auto summary = summary_future.get();
    EXPECT_EQ(summary.final_state, session_state::complete);
    EXPECT_FALSE(summary.ready);
    EXPECT_FALSE(summary.accepted);
    EXPECT_EQ(summary.chunks_sent, 0u);
}

TEST_F(SenderSessionTest, DeclinedRequestGetsEmptyRejection) {
    std::atomic<uint64_t> asked{0};
    auto summary_future = run_async([&asked](const transfer_request& request) {
        asked.store(request.request_id);
        return false;
    });
    ASSERT_TRUE(send_request(*receiver_end_, transfer_request{9, true}).has_value());

    auto response = receive_response(*receiver_end_);
    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response.value().accepted);
    EXPECT_TRUE(response.value().manifest.empty());

    auto after = receive_chunk(*receiver_end_);
    ASSERT_TRUE(after.has_value());
    EXPECT_FALSE(after.value().has_value());

    auto summary = summary_future.get();
    EXPECT_EQ(asked.load(), 9u);
    EXPECT_EQ(summary.final_state, session_state::complete);
    EXPECT_TRUE(summary.ready);
    EXPECT_FALSE(summary.accepted);
}

TEST_F(SenderSessionTest, SilentReceiverTimesOut) {
    auto [local, remote] = make_stream_pair();
    receiver_end_ = std::move(remote);
    session_ = std::make_unique<sender_session>(peer_id{"10.0.0.4:40003"}, std::move(local),
                                                plan_, std::chrono::milliseconds(50));

    auto summary = session_->run({});
    EXPECT_EQ(summary.final_state, session_state::failed);
    EXPECT_EQ(summary.failure.code, error_code::connection_timeout);
    EXPECT_EQ(session_->state(), session_state::failed);
}

TEST_F(SenderSessionTest, StalledReceiverMidStreamTimesOut) {
    write_file("large.bin", 1024 * 1024);
    auto plan = analyze_files({test_dir_ / "large.bin"});
    ASSERT_TRUE(plan.has_value());
    plan_ = std::make_shared<const transfer_plan>(std::move(plan.value()));

    auto [local, remote] = make_stream_pair();
    remote->set_read_timeout(std::chrono::seconds(2));
    receiver_end_ = std::move(remote);
    session_ = std::make_unique<sender_session>(peer_id{"10.0.0.7:40006"}, std::move(local),
                                                plan_, std::chrono::milliseconds(200),
                                                chunk_config(64 * 1024));

    auto summary_future = run_async();
    ASSERT_TRUE(send_request(*receiver_end_, transfer_request{21, true}).has_value());
    auto response = receive_response(*receiver_end_);
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response.value().accepted);

    // The pipe holds a quarter of the file; the sender blocks once it fills
    ASSERT_EQ(summary_future.wait_for(std::chrono::seconds(5)), std::future_status::ready);

    auto summary = summary_future.get();
    EXPECT_EQ(summary.final_state, session_state::failed);
    EXPECT_EQ(summary.failure.code, error_code::connection_timeout);
    EXPECT_LT(summary.bytes_sent, 1024u * 1024u);
}

TEST_F(SenderSessionTest, ReceiverHangingUpBeforeRequestIsConnectionLost) {
    auto summary_future = run_async();
    receiver_end_->close();

    auto summary = summary_future.get();
    EXPECT_EQ(summary.final_state, session_state::failed);
    EXPECT_EQ(summary.failure.code, error_code::connection_lost);
}

TEST_F(SenderSessionTest, GarbageRequestFailsSession) {
    auto summary_future = run_async();
    std::vector<std::byte> junk(4, std::byte{0x42});
    ASSERT_TRUE(write_frame(*receiver_end_, junk).has_value());

    auto summary = summary_future.get();
    EXPECT_EQ(summary.final_state, session_state::failed);
    EXPECT_EQ(category_of(summary.failure.code), error_category::protocol);
}

TEST_F(SenderSessionTest, CancelWhileWaitingForRequest) {
    auto summary_future = run_async();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    session_->cancel();

    auto summary = summary_future.get();
    EXPECT_EQ(summary.final_state, session_state::failed);
    EXPECT_EQ(summary.failure.code, error_code::cancelled);
}

TEST_F(SenderSessionTest, ConnectionDropReportsReason) {
    auto summary_future = run_async();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    session_->on_connection_closed("peer walked out of range");

    auto summary = summary_future.get();
    EXPECT_EQ(summary.final_state, session_state::failed);
    EXPECT_EQ(summary.failure.code, error_code::connection_lost);
    EXPECT_NE(summary.failure.message.find("peer walked out of range"), std::string::npos);
}

}  // namespace kcenon::fastdrop::test
