/**
 * @file byte_stream.h
 * @brief Bidirectional byte stream between two peers
 */

#ifndef KCENON_FASTDROP_TRANSPORT_BYTE_STREAM_H
#define KCENON_FASTDROP_TRANSPORT_BYTE_STREAM_H

#include <kcenon/fastdrop/core/types.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>

namespace kcenon::fastdrop {

/**
 * @brief Abstract bidirectional byte stream
 *
 * One stream is owned by exactly one task. Reads and writes block; the
 * optional timeouts bound how long a read may wait for data and how long
 * a write may wait for the peer to drain.
 */
class byte_stream {
public:
    virtual ~byte_stream() = default;

    /**
     * @brief Fill @p buffer completely unless the peer closes first
     * @return Bytes read; fewer than buffer.size() only at end of stream.
     *         connection_timeout when the read timeout expires.
     */
    [[nodiscard]] virtual auto read_exact(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Write every byte of @p data
     * @return connection_lost if the peer has gone away,
     *         connection_timeout when the write timeout expires
     */
    [[nodiscard]] virtual auto write_all(std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Push buffered bytes to the peer
     */
    [[nodiscard]] virtual auto flush() -> result<void> = 0;

    /**
     * @brief Close both directions; the peer reads end of stream
     *
     * Safe to call from another thread to unblock a pending read or write.
     */
    virtual void close() = 0;

    /**
     * @brief Bound blocking reads; std::nullopt waits indefinitely
     */
    virtual void set_read_timeout(std::optional<std::chrono::milliseconds> timeout) = 0;

    /**
     * @brief Bound how long a write may block without progress
     */
    virtual void set_write_timeout(std::optional<std::chrono::milliseconds> timeout) = 0;

    [[nodiscard]] virtual auto is_open() const -> bool = 0;

protected:
    byte_stream() = default;
    byte_stream(const byte_stream&) = delete;
    auto operator=(const byte_stream&) -> byte_stream& = delete;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_TRANSPORT_BYTE_STREAM_H
