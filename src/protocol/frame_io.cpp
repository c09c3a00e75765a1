/**
 * @file frame_io.cpp
 * @brief Implementation of length-prefixed framing
 */

#include <kcenon/fastdrop/protocol/frame_io.h>

#include <kcenon/fastdrop/core/logging.h>
#include <kcenon/fastdrop/protocol/wire_codec.h>

#include <array>

namespace kcenon::fastdrop {

auto write_frame(byte_stream& stream, std::span<const std::byte> payload) -> result<void> {
    if (payload.size() > max_frame_size) {
        return unexpected(error{error_code::frame_too_large,
                                "frame of " + std::to_string(payload.size()) +
                                    " bytes exceeds " + std::to_string(max_frame_size)});
    }

    auto length = static_cast<uint32_t>(payload.size());
    std::array<std::byte, frame_header_size> header = {
        static_cast<std::byte>((length >> 24) & 0xFF),
        static_cast<std::byte>((length >> 16) & 0xFF),
        static_cast<std::byte>((length >> 8) & 0xFF),
        static_cast<std::byte>(length & 0xFF),
    };

    if (auto r = stream.write_all(header); !r) {
        return r;
    }
    if (auto r = stream.write_all(payload); !r) {
        return r;
    }
    return stream.flush();
}

auto read_frame(byte_stream& stream, uint32_t max_size)
    -> result<std::optional<std::vector<std::byte>>> {
    std::array<std::byte, frame_header_size> header{};
    auto got = stream.read_exact(header);
    if (!got) {
        return unexpected(got.error());
    }
    if (got.value() == 0) {
        return std::optional<std::vector<std::byte>>{};
    }
    if (got.value() < header.size()) {
        // The peer closed mid-prefix; nothing decodable arrived
        FD_LOG_DEBUG(log_category::codec,
                     "Stream ended inside a length prefix after " +
                         std::to_string(got.value()) + " byte(s)");
        return std::optional<std::vector<std::byte>>{};
    }

    uint32_t length = (static_cast<uint32_t>(header[0]) << 24) |
                      (static_cast<uint32_t>(header[1]) << 16) |
                      (static_cast<uint32_t>(header[2]) << 8) |
                      static_cast<uint32_t>(header[3]);
    if (length > max_size) {
        return unexpected(error{error_code::frame_too_large,
                                "declared frame length " + std::to_string(length) +
                                    " exceeds " + std::to_string(max_size)});
    }

    std::vector<std::byte> payload(length);
    auto body = stream.read_exact(payload);
    if (!body) {
        return unexpected(body.error());
    }
    if (body.value() != length) {
        return unexpected(error{error_code::truncated_frame,
                                "frame declared " + std::to_string(length) + " bytes, got " +
                                    std::to_string(body.value())});
    }
    return std::optional<std::vector<std::byte>>(std::move(payload));
}

auto send_request(byte_stream& stream, const transfer_request& request) -> result<void> {
    return write_frame(stream, encode_message(request));
}

auto send_response(byte_stream& stream, const transfer_response& response) -> result<void> {
    auto payload = encode_message(response);
    if (!payload) {
        return unexpected(payload.error());
    }
    return write_frame(stream, payload.value());
}

auto send_chunk(byte_stream& stream, const file_chunk& chunk) -> result<void> {
    auto payload = encode_message(chunk);
    if (!payload) {
        return unexpected(payload.error());
    }
    return write_frame(stream, payload.value());
}

auto receive_request(byte_stream& stream) -> result<transfer_request> {
    auto frame = read_frame(stream);
    if (!frame) {
        return unexpected(frame.error());
    }
    if (!frame.value()) {
        return unexpected(error{error_code::connection_lost, "stream closed before request"});
    }
    return decode_request(*frame.value());
}

auto receive_response(byte_stream& stream) -> result<transfer_response> {
    auto frame = read_frame(stream);
    if (!frame) {
        return unexpected(frame.error());
    }
    if (!frame.value()) {
        return unexpected(error{error_code::connection_lost, "stream closed before response"});
    }
    return decode_response(*frame.value());
}

auto receive_chunk(byte_stream& stream) -> result<std::optional<file_chunk>> {
    auto frame = read_frame(stream);
    if (!frame) {
        return unexpected(frame.error());
    }
    if (!frame.value()) {
        return std::optional<file_chunk>{};
    }

    auto chunk = decode_chunk(*frame.value());
    if (!chunk) {
        return unexpected(chunk.error());
    }
    return std::optional<file_chunk>(std::move(chunk.value()));
}

}  // namespace kcenon::fastdrop
