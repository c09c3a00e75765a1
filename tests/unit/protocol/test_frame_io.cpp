/**
 * @file test_frame_io.cpp
 * @brief Unit tests for length-prefixed framing over a byte stream
 */

#include <gtest/gtest.h>

#include <kcenon/fastdrop/protocol/frame_io.h>
#include <kcenon/fastdrop/protocol/wire_codec.h>
#include <kcenon/fastdrop/transport/memory_stream.h>

#include <array>
#include <thread>
#include <vector>

namespace kcenon::fastdrop::test {

class FrameIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto [a, b] = make_stream_pair();
        writer_ = std::move(a);
        reader_ = std::move(b);
        reader_->set_read_timeout(std::chrono::seconds(2));
    }

    void write_raw(std::initializer_list<uint8_t> bytes) {
        std::vector<std::byte> data;
        for (auto b : bytes) {
            data.push_back(static_cast<std::byte>(b));
        }
        ASSERT_TRUE(writer_->write_all(data).has_value());
    }

    std::unique_ptr<memory_stream> writer_;
    std::unique_ptr<memory_stream> reader_;
};

TEST_F(FrameIoTest, FrameCarriesLengthPrefix) {
    std::vector<std::byte> payload = {std::byte{0xAA}, std::byte{0xBB}};
    ASSERT_TRUE(write_frame(*writer_, payload).has_value());
    EXPECT_EQ(writer_->bytes_written(), frame_header_size + 2);

    std::array<std::byte, 4> header{};
    auto got = reader_->read_exact(header);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(header[3], std::byte{0x02});
    EXPECT_EQ(header[0], std::byte{0x00});
}

TEST_F(FrameIoTest, ReadFrameReturnsPayload) {
    std::vector<std::byte> payload(1000, std::byte{0x11});
    ASSERT_TRUE(write_frame(*writer_, payload).has_value());

    auto frame = read_frame(*reader_);
    ASSERT_TRUE(frame.has_value());
    ASSERT_TRUE(frame.value().has_value());
    EXPECT_EQ(*frame.value(), payload);
}

TEST_F(FrameIoTest, CloseAtBoundaryIsEndOfStream) {
    writer_->close();
    auto frame = read_frame(*reader_);
    ASSERT_TRUE(frame.has_value());
    EXPECT_FALSE(frame.value().has_value());
}

TEST_F(FrameIoTest, PartialLengthPrefixIsEndOfStream) {
    write_raw({0x00, 0x00});
    writer_->close();
    auto frame = read_frame(*reader_);
    ASSERT_TRUE(frame.has_value());
    EXPECT_FALSE(frame.value().has_value());
}

TEST_F(FrameIoTest, TruncatedBodyIsError) {
    write_raw({0x00, 0x00, 0x00, 0x10, 0x01, 0x02});
    writer_->close();
    auto frame = read_frame(*reader_);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error().code, error_code::truncated_frame);
}

TEST_F(FrameIoTest, DeclaredLengthOverLimitIsRejectedBeforeReading) {
    write_raw({0x01, 0x00, 0x00, 0x01});
    auto frame = read_frame(*reader_);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error().code, error_code::frame_too_large);
}

TEST_F(FrameIoTest, CustomLimit) {
    std::vector<std::byte> payload(100);
    ASSERT_TRUE(write_frame(*writer_, payload).has_value());
    auto frame = read_frame(*reader_, 50);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error().code, error_code::frame_too_large);
}

TEST_F(FrameIoTest, ReadTimeout) {
    reader_->set_read_timeout(std::chrono::milliseconds(20));
    auto frame = read_frame(*reader_);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error().code, error_code::connection_timeout);
}

// Typed helpers

TEST_F(FrameIoTest, RequestResponseExchange) {
    ASSERT_TRUE(send_request(*writer_, transfer_request{9, true}).has_value());
    auto request = receive_request(*reader_);
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request.value().request_id, 9u);
    EXPECT_TRUE(request.value().ready);
}

TEST_F(FrameIoTest, ReceiveRequestOnClosedStream) {
    writer_->close();
    auto request = receive_request(*reader_);
    ASSERT_FALSE(request.has_value());
    EXPECT_EQ(request.error().code, error_code::connection_lost);
}

TEST_F(FrameIoTest, ReceiveResponseRejectsChunk) {
    ASSERT_TRUE(send_chunk(*writer_, file_chunk{0, 0, 1, {}}).has_value());
    auto response = receive_response(*reader_);
    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::unexpected_message);
}

TEST_F(FrameIoTest, ChunkSequenceThenClose) {
    std::thread producer([this] {
        for (uint64_t i = 0; i < 3; ++i) {
            ASSERT_TRUE(send_chunk(*writer_, file_chunk{0, i, 3,
                                                        std::vector<std::byte>(100 * 1024)})
                            .has_value());
        }
        writer_->close();
    });

    uint64_t seen = 0;
    while (true) {
        auto chunk = receive_chunk(*reader_);
        ASSERT_TRUE(chunk.has_value());
        if (!chunk.value()) {
            break;
        }
        EXPECT_EQ(chunk.value()->chunk_number, seen++);
    }
    producer.join();
    EXPECT_EQ(seen, 3u);
}

TEST_F(FrameIoTest, WriteAfterPeerCloseFails) {
    reader_->close();
    auto sent = send_request(*writer_, transfer_request{1, true});
    ASSERT_FALSE(sent.has_value());
    EXPECT_EQ(sent.error().code, error_code::connection_lost);
}

}  // namespace kcenon::fastdrop::test
