/**
 * @file session_ticket.cpp
 * @brief Implementation of session ticket encoding and authentication
 */

#include <kcenon/fastdrop/protocol/session_ticket.h>

#include <kcenon/fastdrop/core/logging.h>
#include <kcenon/fastdrop/protocol/wire_codec.h>

#include <algorithm>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace kcenon::fastdrop {

namespace {

constexpr std::size_t max_peer_id_length = 256;
constexpr std::size_t max_address_length = 256;
constexpr std::size_t hmac_size = 32;

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

auto decode_failure(const error& cause) -> unexpected {
    return unexpected(error{error_code::ticket_decode_error, "malformed ticket: " + cause.message});
}

/**
 * @brief Host component of a multiaddr ("/ip4/10.0.0.2/udp/9/quic-v1")
 *        or of a bare "host[:port]" string
 */
auto host_of(const std::string& address) -> std::string {
    if (!address.empty() && address.front() == '/') {
        auto proto_end = address.find('/', 1);
        if (proto_end == std::string::npos) {
            return {};
        }
        auto host_end = address.find('/', proto_end + 1);
        return address.substr(proto_end + 1, host_end == std::string::npos
                                                 ? std::string::npos
                                                 : host_end - proto_end - 1);
    }

    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        return address.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    }
    // A single colon separates an IPv4 host from its port
    if (std::count(address.begin(), address.end(), ':') == 1) {
        return address.substr(0, address.find(':'));
    }
    return address;
}

auto encode_signing_bytes(const session_ticket& ticket) -> std::vector<std::byte> {
    binary_writer writer;
    writer.put_header(message_kind::session_ticket);
    writer.put_string(ticket.peer.value);
    writer.put_u32(static_cast<uint32_t>(ticket.addresses.size()));
    for (const auto& address : ticket.addresses) {
        writer.put_string(address);
    }
    writer.put_u8(static_cast<uint8_t>(ticket.transport));
    writer.put_u64(ticket.nonce);
    return writer.take();
}

}  // namespace

// nonce_tag_authenticator implementation

auto nonce_tag_authenticator::sign(std::span<const std::byte> signing_bytes) const
    -> result<auth_tag> {
    if (signing_bytes.size() < sizeof(uint64_t)) {
        return unexpected(error{error_code::internal_error, "signing bytes lack a nonce"});
    }

    // The nonce is the last big-endian field of the signing bytes
    auto nonce_be = signing_bytes.last(sizeof(uint64_t));
    auth_tag tag{};
    for (std::size_t i = 0; i < sizeof(uint64_t); ++i) {
        tag[i] = nonce_be[sizeof(uint64_t) - 1 - i];
    }
    return tag;
}

auto nonce_tag_authenticator::verify(std::span<const std::byte> signing_bytes,
                                     const auth_tag& tag) const -> bool {
    auto expected = sign(signing_bytes);
    return expected && expected.value() == tag;
}

// hmac_ticket_authenticator implementation

hmac_ticket_authenticator::hmac_ticket_authenticator(std::vector<std::byte> key)
    : key_(std::move(key)) {}

auto hmac_ticket_authenticator::sign(std::span<const std::byte> signing_bytes) const
    -> result<auth_tag> {
    if (key_.empty()) {
        return unexpected(error{error_code::invalid_configuration, "HMAC key is empty"});
    }

    auth_tag tag{};
    unsigned int len = 0;
    auto* out = HMAC(EVP_sha256(),
                     key_.data(), static_cast<int>(key_.size()),
                     reinterpret_cast<const unsigned char*>(signing_bytes.data()),
                     signing_bytes.size(),
                     reinterpret_cast<unsigned char*>(tag.data()), &len);
    if (out == nullptr || len != hmac_size) {
        return unexpected(error{error_code::internal_error, get_openssl_error()});
    }
    return tag;
}

auto hmac_ticket_authenticator::verify(std::span<const std::byte> signing_bytes,
                                       const auth_tag& tag) const -> bool {
    auto expected = sign(signing_bytes);
    if (!expected) {
        return false;
    }
    if (CRYPTO_memcmp(expected.value().data(), tag.data(), hmac_size) != 0) {
        return false;
    }
    return std::all_of(tag.begin() + hmac_size, tag.end(),
                       [](std::byte b) { return b == std::byte{0}; });
}

// Ticket encoding

auto is_local_only_address(const std::string& address) -> bool {
    auto host = host_of(address);
    if (host.empty()) {
        return true;
    }
    if (host == "localhost" || host == "0.0.0.0" || host == "::" || host == "::1") {
        return true;
    }
    return host.rfind("127.", 0) == 0;
}

auto build_ticket(const peer_id& peer,
                  const std::vector<std::string>& addresses,
                  transport_kind transport,
                  uint64_t nonce,
                  const ticket_authenticator& authenticator,
                  std::size_t max_payload) -> result<std::vector<std::byte>> {
    session_ticket ticket;
    ticket.peer = peer;
    ticket.transport = transport;
    ticket.nonce = nonce;

    for (const auto& address : addresses) {
        if (is_local_only_address(address)) {
            FD_LOG_DEBUG(log_category::ticket, "Skipping local-only address " + address);
            continue;
        }
        ticket.addresses.push_back(address);
    }

    if (ticket.addresses.empty()) {
        return unexpected(error{error_code::no_reachable_address,
                                "no non-loopback address among " +
                                    std::to_string(addresses.size()) + " listen address(es)"});
    }

    auto signing_bytes = encode_signing_bytes(ticket);
    auto tag = authenticator.sign(signing_bytes);
    if (!tag) {
        return unexpected(tag.error());
    }

    binary_writer writer;
    writer.put_raw(signing_bytes);
    writer.put_raw(tag.value());

    if (writer.size() > max_payload) {
        return unexpected(error{error_code::ticket_too_large,
                                "ticket is " + std::to_string(writer.size()) +
                                    " bytes, advertisable payload is " +
                                    std::to_string(max_payload)});
    }

    FD_LOG_DEBUG(log_category::ticket,
                 "Built " + std::to_string(writer.size()) + "-byte ticket with " +
                     std::to_string(ticket.addresses.size()) + " address(es), " +
                     authenticator.name());
    return writer.take();
}

auto parse_ticket(std::span<const std::byte> bytes, const ticket_authenticator* authenticator)
    -> result<session_ticket> {
    binary_reader reader(bytes);
    if (auto h = reader.expect_header(message_kind::session_ticket); !h) {
        return decode_failure(h.error());
    }

    session_ticket ticket;

    auto peer = reader.get_string(max_peer_id_length);
    if (!peer) return decode_failure(peer.error());
    if (peer.value().empty()) {
        return unexpected(error{error_code::ticket_decode_error, "ticket has no peer identity"});
    }
    ticket.peer = peer_id(std::move(peer.value()));

    auto count = reader.get_u32();
    if (!count) return decode_failure(count.error());
    if (count.value() == 0) {
        return unexpected(error{error_code::ticket_decode_error, "ticket has no addresses"});
    }
    if (count.value() > reader.remaining() / sizeof(uint32_t)) {
        return unexpected(error{error_code::ticket_decode_error,
                                "address count " + std::to_string(count.value()) +
                                    " exceeds ticket size"});
    }
    for (uint32_t i = 0; i < count.value(); ++i) {
        auto address = reader.get_string(max_address_length);
        if (!address) return decode_failure(address.error());
        ticket.addresses.push_back(std::move(address.value()));
    }

    auto transport = reader.get_u8();
    if (!transport) return decode_failure(transport.error());
    if (transport.value() > static_cast<uint8_t>(transport_kind::tcp)) {
        return unexpected(error{error_code::ticket_decode_error,
                                "unknown transport " + std::to_string(transport.value())});
    }
    ticket.transport = static_cast<transport_kind>(transport.value());

    auto nonce = reader.get_u64();
    if (!nonce) return decode_failure(nonce.error());
    ticket.nonce = nonce.value();

    auto signed_length = reader.position();

    auto tag = reader.get_raw(ticket.tag.size());
    if (!tag) return decode_failure(tag.error());
    std::copy(tag.value().begin(), tag.value().end(), ticket.tag.begin());

    if (auto end = reader.expect_end(); !end) {
        return decode_failure(end.error());
    }

    if (authenticator != nullptr &&
        !authenticator->verify(bytes.first(signed_length), ticket.tag)) {
        FD_LOG_WARN(log_category::ticket,
                    std::string("Ticket from ") + ticket.peer.value + " failed " +
                        authenticator->name() + " verification");
        return unexpected(error{error_code::ticket_auth_failed,
                                std::string(authenticator->name()) + " verification failed"});
    }

    return ticket;
}

auto generate_nonce() -> result<uint64_t> {
    std::array<unsigned char, sizeof(uint64_t)> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        return unexpected(error{error_code::internal_error,
                                "failed to generate nonce: " + get_openssl_error()});
    }

    uint64_t value = 0;
    for (auto b : raw) {
        value = (value << 8) | b;
    }
    return value;
}

}  // namespace kcenon::fastdrop
