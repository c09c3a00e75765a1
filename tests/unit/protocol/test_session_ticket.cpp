/**
 * @file test_session_ticket.cpp
 * @brief Unit tests for session ticket encoding and authentication
 */

#include <gtest/gtest.h>

#include <kcenon/fastdrop/core/error_codes.h>
#include <kcenon/fastdrop/protocol/session_ticket.h>

#include <string>
#include <vector>

namespace kcenon::fastdrop::test {

class SessionTicketTest : public ::testing::Test {
protected:
    const peer_id peer_{"12D3KooW0123456789abcdef0123456789abcdef"};
    const std::vector<std::string> listen_ = {
        "/ip4/127.0.0.1/udp/40000/quic-v1",
        "/ip4/10.0.0.2/udp/40000/quic-v1",
    };
    nonce_tag_authenticator nonce_auth_;
};

// Address filtering

TEST_F(SessionTicketTest, LocalOnlyAddresses) {
    EXPECT_TRUE(is_local_only_address("/ip4/127.0.0.1/udp/1/quic-v1"));
    EXPECT_TRUE(is_local_only_address("/ip4/127.8.8.8/tcp/1"));
    EXPECT_TRUE(is_local_only_address("/ip6/::1/tcp/1"));
    EXPECT_TRUE(is_local_only_address("localhost:8080"));
    EXPECT_TRUE(is_local_only_address("0.0.0.0:9000"));
    EXPECT_TRUE(is_local_only_address(""));

    EXPECT_FALSE(is_local_only_address("/ip4/10.0.0.2/udp/40000/quic-v1"));
    EXPECT_FALSE(is_local_only_address("192.168.1.5:9000"));
    EXPECT_FALSE(is_local_only_address("/ip6/fe80::1/tcp/1"));
}

// Building and parsing

TEST_F(SessionTicketTest, BuildDropsLoopbackAndParses) {
    auto bytes = build_ticket(peer_, listen_, transport_kind::quic, 0x1122334455667788,
                              nonce_auth_);
    ASSERT_TRUE(bytes.has_value()) << bytes.error().message;
    EXPECT_LE(bytes.value().size(), max_oob_payload_size);

    auto ticket = parse_ticket(bytes.value(), &nonce_auth_);
    ASSERT_TRUE(ticket.has_value()) << ticket.error().message;
    EXPECT_EQ(ticket.value().peer, peer_);
    ASSERT_EQ(ticket.value().addresses.size(), 1u);
    EXPECT_EQ(ticket.value().addresses[0], "/ip4/10.0.0.2/udp/40000/quic-v1");
    EXPECT_EQ(ticket.value().transport, transport_kind::quic);
    EXPECT_EQ(ticket.value().nonce, 0x1122334455667788u);
}

TEST_F(SessionTicketTest, NonceTagLayout) {
    auto bytes = build_ticket(peer_, listen_, transport_kind::tcp, 0x0102, nonce_auth_);
    ASSERT_TRUE(bytes.has_value());
    auto ticket = parse_ticket(bytes.value());
    ASSERT_TRUE(ticket.has_value());

    // Nonce in little-endian order, rest zero
    EXPECT_EQ(ticket.value().tag[0], std::byte{0x02});
    EXPECT_EQ(ticket.value().tag[1], std::byte{0x01});
    for (std::size_t i = 2; i < ticket.value().tag.size(); ++i) {
        EXPECT_EQ(ticket.value().tag[i], std::byte{0}) << "tag byte " << i;
    }
    EXPECT_EQ(ticket.value().transport, transport_kind::tcp);
}

TEST_F(SessionTicketTest, OnlyLoopbackAddresses) {
    auto bytes = build_ticket(peer_, {"/ip4/127.0.0.1/tcp/40001"}, transport_kind::tcp, 1,
                              nonce_auth_);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, error_code::no_reachable_address);
}

TEST_F(SessionTicketTest, TooManyAddressesForPayload) {
    std::vector<std::string> many;
    for (int i = 0; i < 20; ++i) {
        many.push_back("/ip4/10.0.1." + std::to_string(i + 1) + "/udp/40000/quic-v1");
    }
    auto bytes = build_ticket(peer_, many, transport_kind::quic, 1, nonce_auth_);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, error_code::ticket_too_large);
    EXPECT_TRUE(is_process_fatal(bytes.error().code));
}

TEST_F(SessionTicketTest, CustomPayloadLimit) {
    auto bytes = build_ticket(peer_, listen_, transport_kind::quic, 1, nonce_auth_, 64);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, error_code::ticket_too_large);
}

// Malformed input

TEST_F(SessionTicketTest, ParseEmpty) {
    auto ticket = parse_ticket(std::span<const std::byte>{});
    ASSERT_FALSE(ticket.has_value());
    EXPECT_EQ(ticket.error().code, error_code::ticket_decode_error);
}

TEST_F(SessionTicketTest, ParseTruncated) {
    auto bytes = build_ticket(peer_, listen_, transport_kind::quic, 5, nonce_auth_);
    ASSERT_TRUE(bytes.has_value());
    bytes.value().resize(bytes.value().size() - 10);
    auto ticket = parse_ticket(bytes.value());
    ASSERT_FALSE(ticket.has_value());
    EXPECT_EQ(ticket.error().code, error_code::ticket_decode_error);
}

TEST_F(SessionTicketTest, ParseTrailingGarbage) {
    auto bytes = build_ticket(peer_, listen_, transport_kind::quic, 5, nonce_auth_);
    ASSERT_TRUE(bytes.has_value());
    bytes.value().push_back(std::byte{0xEE});
    EXPECT_FALSE(parse_ticket(bytes.value()).has_value());
}

TEST_F(SessionTicketTest, ParseWrongKind) {
    std::vector<std::byte> bytes = {std::byte{wire_version},
                                    static_cast<std::byte>(message_kind::transfer_request)};
    auto ticket = parse_ticket(bytes);
    ASSERT_FALSE(ticket.has_value());
    EXPECT_EQ(ticket.error().code, error_code::ticket_decode_error);
}

// Authentication

TEST_F(SessionTicketTest, NonceTagDetectsTampering) {
    auto bytes = build_ticket(peer_, listen_, transport_kind::quic, 99, nonce_auth_);
    ASSERT_TRUE(bytes.has_value());

    // Last tag byte is zero for the nonce scheme
    bytes.value().back() = std::byte{0x01};
    auto ticket = parse_ticket(bytes.value(), &nonce_auth_);
    ASSERT_FALSE(ticket.has_value());
    EXPECT_EQ(ticket.error().code, error_code::ticket_auth_failed);
}

TEST_F(SessionTicketTest, HmacRoundTripAndWrongKey) {
    hmac_ticket_authenticator signer(std::vector<std::byte>(32, std::byte{0x5C}));
    hmac_ticket_authenticator other(std::vector<std::byte>(32, std::byte{0x36}));

    auto bytes = build_ticket(peer_, listen_, transport_kind::quic, 7, signer);
    ASSERT_TRUE(bytes.has_value());

    EXPECT_TRUE(parse_ticket(bytes.value(), &signer).has_value());

    auto rejected = parse_ticket(bytes.value(), &other);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, error_code::ticket_auth_failed);

    auto unsigned_check = parse_ticket(bytes.value(), &nonce_auth_);
    EXPECT_FALSE(unsigned_check.has_value());
}

TEST_F(SessionTicketTest, HmacCoversAddresses) {
    hmac_ticket_authenticator signer(std::vector<std::byte>(16, std::byte{0x01}));
    auto bytes = build_ticket(peer_, listen_, transport_kind::quic, 7, signer);
    ASSERT_TRUE(bytes.has_value());

    // Flip a character inside the advertised address
    auto& raw = bytes.value();
    std::string text(reinterpret_cast<const char*>(raw.data()), raw.size());
    auto pos = text.find("10.0.0.2");
    ASSERT_NE(pos, std::string::npos);
    raw[pos + 7] = std::byte{'3'};

    auto ticket = parse_ticket(raw, &signer);
    ASSERT_FALSE(ticket.has_value());
    EXPECT_EQ(ticket.error().code, error_code::ticket_auth_failed);
}

TEST_F(SessionTicketTest, HmacEmptyKeyCannotSign) {
    hmac_ticket_authenticator empty_key({});
    auto bytes = build_ticket(peer_, listen_, transport_kind::quic, 7, empty_key);
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, error_code::invalid_configuration);
}

TEST_F(SessionTicketTest, NoncesDiffer) {
    auto a = generate_nonce();
    auto b = generate_nonce();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a.value(), b.value());
}

}  // namespace kcenon::fastdrop::test
