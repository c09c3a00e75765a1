/**
 * @file session_ticket.h
 * @brief Compact descriptor advertised over the out-of-band channel
 *
 * The ticket tells a receiver which peer to dial, where, and with which
 * transport. It must fit in a single out-of-band read.
 *
 * @code
 * header || peer:string || count:u32 || address:string* || transport:u8 || nonce:u64 || tag:64
 * @endcode
 *
 * The signing bytes are the encoding up to and including the nonce.
 */

#ifndef KCENON_FASTDROP_PROTOCOL_SESSION_TICKET_H
#define KCENON_FASTDROP_PROTOCOL_SESSION_TICKET_H

#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace kcenon::fastdrop {

/// Fixed-size authentication tag carried by every ticket
using auth_tag = std::array<std::byte, 64>;

/**
 * @brief Decoded session ticket
 */
struct session_ticket {
    peer_id peer;
    std::vector<std::string> addresses;
    transport_kind transport = transport_kind::quic;
    uint64_t nonce = 0;
    auth_tag tag{};

    [[nodiscard]] auto operator==(const session_ticket& other) const -> bool = default;
};

/**
 * @brief Pluggable ticket authentication
 */
class ticket_authenticator {
public:
    virtual ~ticket_authenticator() = default;

    /**
     * @brief Produce a tag over the ticket's signing bytes
     */
    [[nodiscard]] virtual auto sign(std::span<const std::byte> signing_bytes) const
        -> result<auth_tag> = 0;

    /**
     * @brief Check a tag against the ticket's signing bytes
     */
    [[nodiscard]] virtual auto verify(std::span<const std::byte> signing_bytes,
                                      const auth_tag& tag) const -> bool = 0;

    [[nodiscard]] virtual auto name() const -> const char* = 0;
};

/**
 * @brief Freshness-only tag: the nonce, little-endian, in the first 8 bytes
 *
 * Offers no authenticity. Anyone who can read the ticket can forge one.
 */
class nonce_tag_authenticator : public ticket_authenticator {
public:
    [[nodiscard]] auto sign(std::span<const std::byte> signing_bytes) const
        -> result<auth_tag> override;
    [[nodiscard]] auto verify(std::span<const std::byte> signing_bytes,
                              const auth_tag& tag) const -> bool override;
    [[nodiscard]] auto name() const -> const char* override { return "nonce-tag"; }
};

/**
 * @brief HMAC-SHA256 over the signing bytes with a pre-shared key
 *
 * The MAC occupies the first 32 bytes of the tag; the rest is zero.
 */
class hmac_ticket_authenticator : public ticket_authenticator {
public:
    explicit hmac_ticket_authenticator(std::vector<std::byte> key);

    [[nodiscard]] auto sign(std::span<const std::byte> signing_bytes) const
        -> result<auth_tag> override;
    [[nodiscard]] auto verify(std::span<const std::byte> signing_bytes,
                              const auth_tag& tag) const -> bool override;
    [[nodiscard]] auto name() const -> const char* override { return "hmac-sha256"; }

private:
    std::vector<std::byte> key_;
};

/**
 * @brief True for loopback (127.0.0.0/8, ::1, localhost) and unspecified
 *        (0.0.0.0, ::) hosts, in multiaddr or bare form
 */
[[nodiscard]] auto is_local_only_address(const std::string& address) -> bool;

/**
 * @brief Encode a ticket for advertisement
 *
 * Loopback and unspecified addresses are dropped first.
 *
 * @return Encoded ticket, no_reachable_address if nothing is left after
 *         filtering, ticket_too_large if it exceeds @p max_payload
 */
[[nodiscard]] auto build_ticket(const peer_id& peer,
                                const std::vector<std::string>& addresses,
                                transport_kind transport,
                                uint64_t nonce,
                                const ticket_authenticator& authenticator,
                                std::size_t max_payload = max_oob_payload_size)
    -> result<std::vector<std::byte>>;

/**
 * @brief Decode a ticket read from the out-of-band channel
 * @param authenticator When non-null the tag must verify
 * @return Ticket, ticket_decode_error for malformed input, ticket_auth_failed
 *         when verification fails
 */
[[nodiscard]] auto parse_ticket(std::span<const std::byte> bytes,
                                const ticket_authenticator* authenticator = nullptr)
    -> result<session_ticket>;

/**
 * @brief Fresh random nonce from the OpenSSL CSPRNG
 */
[[nodiscard]] auto generate_nonce() -> result<uint64_t>;

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_PROTOCOL_SESSION_TICKET_H
