/**
 * @file wire_codec.cpp
 * @brief Implementation of protocol message encoding
 */

#include <kcenon/fastdrop/protocol/wire_codec.h>

#include <algorithm>

namespace kcenon::fastdrop {

namespace {

auto truncated(const char* field) -> unexpected {
    return unexpected(error{error_code::message_decode_error,
                            std::string("input ends inside ") + field});
}

/// Smallest encoded descriptor: empty name, size, no hash
constexpr std::size_t min_descriptor_size = 4 + 8 + 1;

}  // namespace

// binary_writer implementation

void binary_writer::put_u8(uint8_t value) {
    buffer_.push_back(static_cast<std::byte>(value));
}

void binary_writer::put_u32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
    }
}

void binary_writer::put_u64(uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<std::byte>((value >> shift) & 0xFF));
    }
}

void binary_writer::put_bool(bool value) {
    put_u8(value ? 1 : 0);
}

void binary_writer::put_raw(std::span<const std::byte> data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void binary_writer::put_string(const std::string& value) {
    put_u32(static_cast<uint32_t>(value.size()));
    const auto* p = reinterpret_cast<const std::byte*>(value.data());
    buffer_.insert(buffer_.end(), p, p + value.size());
}

void binary_writer::put_bytes(std::span<const std::byte> data) {
    put_u32(static_cast<uint32_t>(data.size()));
    put_raw(data);
}

void binary_writer::put_header(message_kind kind) {
    put_u8(wire_version);
    put_u8(static_cast<uint8_t>(kind));
}

// binary_reader implementation

auto binary_reader::get_u8() -> result<uint8_t> {
    if (remaining() < 1) return truncated("u8");
    return static_cast<uint8_t>(data_[pos_++]);
}

auto binary_reader::get_u32() -> result<uint32_t> {
    if (remaining() < 4) return truncated("u32");
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | static_cast<uint8_t>(data_[pos_++]);
    }
    return value;
}

auto binary_reader::get_u64() -> result<uint64_t> {
    if (remaining() < 8) return truncated("u64");
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint8_t>(data_[pos_++]);
    }
    return value;
}

auto binary_reader::get_bool() -> result<bool> {
    auto v = get_u8();
    if (!v) return unexpected(v.error());
    if (v.value() > 1) {
        return unexpected(error{error_code::message_decode_error,
                                "invalid boolean byte " + std::to_string(v.value())});
    }
    return v.value() == 1;
}

auto binary_reader::get_raw(std::size_t n) -> result<std::span<const std::byte>> {
    if (remaining() < n) return truncated("raw field");
    auto view = data_.subspan(pos_, n);
    pos_ += n;
    return view;
}

auto binary_reader::get_string(std::size_t max_length) -> result<std::string> {
    auto len = get_u32();
    if (!len) return unexpected(len.error());
    if (len.value() > max_length) {
        return unexpected(error{error_code::message_decode_error,
                                "string length " + std::to_string(len.value()) +
                                    " exceeds " + std::to_string(max_length)});
    }
    auto raw = get_raw(len.value());
    if (!raw) return unexpected(raw.error());
    return std::string(reinterpret_cast<const char*>(raw.value().data()), raw.value().size());
}

auto binary_reader::get_bytes(std::size_t max_length) -> result<std::vector<std::byte>> {
    auto len = get_u32();
    if (!len) return unexpected(len.error());
    if (len.value() > max_length) {
        return unexpected(error{error_code::message_decode_error,
                                "blob length " + std::to_string(len.value()) + " exceeds " +
                                    std::to_string(max_length)});
    }
    auto raw = get_raw(len.value());
    if (!raw) return unexpected(raw.error());
    return std::vector<std::byte>(raw.value().begin(), raw.value().end());
}

auto binary_reader::expect_header(message_kind kind) -> result<void> {
    auto version = get_u8();
    if (!version) return unexpected(version.error());
    if (version.value() != wire_version) {
        return unexpected(error{error_code::protocol_mismatch,
                                "wire version " + std::to_string(version.value()) +
                                    ", expected " + std::to_string(wire_version)});
    }

    auto actual = get_u8();
    if (!actual) return unexpected(actual.error());
    if (actual.value() != static_cast<uint8_t>(kind)) {
        return unexpected(error{error_code::unexpected_message,
                                "expected " + std::string(to_string(kind)) + ", got kind " +
                                    std::to_string(actual.value())});
    }
    return {};
}

auto binary_reader::expect_end() const -> result<void> {
    if (remaining() != 0) {
        return unexpected(error{error_code::message_decode_error,
                                std::to_string(remaining()) + " trailing byte(s)"});
    }
    return {};
}

// Manifest

void write_manifest(binary_writer& writer, const file_manifest& manifest) {
    writer.put_u32(static_cast<uint32_t>(manifest.files.size()));
    for (const auto& file : manifest.files) {
        writer.put_string(file.name);
        writer.put_u64(file.size);
        writer.put_bool(file.content_hash.has_value());
        if (file.content_hash) {
            writer.put_raw(*file.content_hash);
        }
    }
    writer.put_u64(manifest.total_size);
}

auto read_manifest(binary_reader& reader) -> result<file_manifest> {
    auto count = reader.get_u32();
    if (!count) return unexpected(count.error());
    if (count.value() > reader.remaining() / min_descriptor_size) {
        return unexpected(error{error_code::message_decode_error,
                                "manifest claims " + std::to_string(count.value()) +
                                    " files but only " + std::to_string(reader.remaining()) +
                                    " bytes remain"});
    }

    file_manifest manifest;
    manifest.files.reserve(count.value());
    uint64_t sum = 0;

    for (uint32_t i = 0; i < count.value(); ++i) {
        file_descriptor desc;

        auto name = reader.get_string(max_filename_length);
        if (!name) return unexpected(name.error());
        desc.name = std::move(name.value());

        auto size = reader.get_u64();
        if (!size) return unexpected(size.error());
        desc.size = size.value();

        auto has_hash = reader.get_bool();
        if (!has_hash) return unexpected(has_hash.error());
        if (has_hash.value()) {
            auto raw = reader.get_raw(sizeof(sha256_digest));
            if (!raw) return unexpected(raw.error());
            sha256_digest digest{};
            std::copy(raw.value().begin(), raw.value().end(), digest.begin());
            desc.content_hash = digest;
        }

        if (desc.size > UINT64_MAX - sum) {
            return unexpected(error{error_code::message_decode_error, "manifest size overflow"});
        }
        sum += desc.size;
        manifest.files.push_back(std::move(desc));
    }

    auto total = reader.get_u64();
    if (!total) return unexpected(total.error());
    if (total.value() != sum) {
        return unexpected(error{error_code::message_decode_error,
                                "manifest total " + std::to_string(total.value()) +
                                    " does not match file sizes " + std::to_string(sum)});
    }
    manifest.total_size = total.value();
    return manifest;
}

// Messages

auto peek_message_kind(std::span<const std::byte> payload) -> result<message_kind> {
    if (payload.size() < 2) {
        return unexpected(error{error_code::message_decode_error, "payload shorter than header"});
    }
    auto version = static_cast<uint8_t>(payload[0]);
    if (version != wire_version) {
        return unexpected(error{error_code::protocol_mismatch,
                                "wire version " + std::to_string(version)});
    }
    auto kind = static_cast<message_kind>(payload[1]);
    switch (kind) {
        case message_kind::transfer_request:
        case message_kind::transfer_response:
        case message_kind::file_chunk:
        case message_kind::session_ticket:
            return kind;
        default:
            return unexpected(error{error_code::message_decode_error,
                                    "unknown message kind " +
                                        std::to_string(static_cast<uint8_t>(payload[1]))});
    }
}

auto encode_message(const transfer_request& request) -> std::vector<std::byte> {
    binary_writer writer;
    writer.reserve(2 + 8 + 1);
    writer.put_header(message_kind::transfer_request);
    writer.put_u64(request.request_id);
    writer.put_bool(request.ready);
    return writer.take();
}

auto encode_message(const transfer_response& response) -> result<std::vector<std::byte>> {
    uint64_t sum = 0;
    for (const auto& file : response.manifest.files) {
        sum += file.size;
    }
    if (sum != response.manifest.total_size) {
        return unexpected(error{error_code::message_decode_error,
                                "manifest total_size does not match its files"});
    }

    binary_writer writer;
    writer.put_header(message_kind::transfer_response);
    writer.put_u64(response.request_id);
    write_manifest(writer, response.manifest);
    writer.put_bool(response.accepted);
    return writer.take();
}

auto encode_message(const file_chunk& chunk) -> result<std::vector<std::byte>> {
    if (chunk.payload.size() > max_chunk_payload_size) {
        return unexpected(error{error_code::frame_too_large,
                                "chunk payload of " + std::to_string(chunk.payload.size()) +
                                    " bytes exceeds " + std::to_string(max_chunk_payload_size)});
    }

    binary_writer writer;
    writer.reserve(2 + 3 * 8 + 4 + chunk.payload.size());
    writer.put_header(message_kind::file_chunk);
    writer.put_u64(chunk.file_index);
    writer.put_u64(chunk.chunk_number);
    writer.put_u64(chunk.total_chunks);
    writer.put_bytes(chunk.payload);
    return writer.take();
}

auto decode_request(std::span<const std::byte> payload) -> result<transfer_request> {
    binary_reader reader(payload);
    if (auto h = reader.expect_header(message_kind::transfer_request); !h) {
        return unexpected(h.error());
    }

    transfer_request request;
    auto id = reader.get_u64();
    if (!id) return unexpected(id.error());
    request.request_id = id.value();

    auto ready = reader.get_bool();
    if (!ready) return unexpected(ready.error());
    request.ready = ready.value();

    if (auto end = reader.expect_end(); !end) return unexpected(end.error());
    return request;
}

auto decode_response(std::span<const std::byte> payload) -> result<transfer_response> {
    binary_reader reader(payload);
    if (auto h = reader.expect_header(message_kind::transfer_response); !h) {
        return unexpected(h.error());
    }

    transfer_response response;
    auto id = reader.get_u64();
    if (!id) return unexpected(id.error());
    response.request_id = id.value();

    auto manifest = read_manifest(reader);
    if (!manifest) return unexpected(manifest.error());
    response.manifest = std::move(manifest.value());

    auto accepted = reader.get_bool();
    if (!accepted) return unexpected(accepted.error());
    response.accepted = accepted.value();

    if (auto end = reader.expect_end(); !end) return unexpected(end.error());
    return response;
}

auto decode_chunk(std::span<const std::byte> payload) -> result<file_chunk> {
    binary_reader reader(payload);
    if (auto h = reader.expect_header(message_kind::file_chunk); !h) {
        return unexpected(h.error());
    }

    file_chunk chunk;
    auto file_index = reader.get_u64();
    if (!file_index) return unexpected(file_index.error());
    auto chunk_number = reader.get_u64();
    if (!chunk_number) return unexpected(chunk_number.error());
    auto total_chunks = reader.get_u64();
    if (!total_chunks) return unexpected(total_chunks.error());

    chunk.file_index = file_index.value();
    chunk.chunk_number = chunk_number.value();
    chunk.total_chunks = total_chunks.value();

    auto data = reader.get_bytes(max_chunk_payload_size);
    if (!data) return unexpected(data.error());
    chunk.payload = std::move(data.value());

    if (auto end = reader.expect_end(); !end) return unexpected(end.error());
    return chunk;
}

}  // namespace kcenon::fastdrop
