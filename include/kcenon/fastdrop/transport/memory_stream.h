/**
 * @file memory_stream.h
 * @brief In-process byte stream pair with bounded buffers
 */

#ifndef KCENON_FASTDROP_TRANSPORT_MEMORY_STREAM_H
#define KCENON_FASTDROP_TRANSPORT_MEMORY_STREAM_H

#include <kcenon/fastdrop/transport/byte_stream.h>

#include <functional>
#include <memory>
#include <mutex>
#include <utility>

namespace kcenon::fastdrop {

namespace detail {
struct memory_pipe;
}  // namespace detail

/**
 * @brief One end of an in-process duplex pipe
 *
 * Each direction is a bounded buffer: a writer blocks while the buffer is
 * full, which gives the same back-pressure a socket would. Closing an end
 * lets the peer drain what was written and then read end of stream; writes
 * from the peer fail with connection_lost from then on.
 */
class memory_stream : public byte_stream {
public:
    memory_stream(std::shared_ptr<detail::memory_pipe> inbound,
                  std::shared_ptr<detail::memory_pipe> outbound);
    ~memory_stream() override;

    [[nodiscard]] auto read_exact(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto write_all(std::span<const std::byte> data) -> result<void> override;
    [[nodiscard]] auto flush() -> result<void> override;
    void close() override;
    void set_read_timeout(std::optional<std::chrono::milliseconds> timeout) override;
    void set_write_timeout(std::optional<std::chrono::milliseconds> timeout) override;
    [[nodiscard]] auto is_open() const -> bool override;

    /**
     * @brief Total bytes written by this end
     */
    [[nodiscard]] auto bytes_written() const -> uint64_t;

    /**
     * @brief Handle that drops the link from outside the owning task
     *
     * Invoking it fails pending and future reads and writes on both ends
     * with connection_lost, as a dropped connection would.
     */
    [[nodiscard]] auto severer() const -> std::function<void()>;

private:
    std::shared_ptr<detail::memory_pipe> inbound_;
    std::shared_ptr<detail::memory_pipe> outbound_;
    std::optional<std::chrono::milliseconds> read_timeout_;
    std::optional<std::chrono::milliseconds> write_timeout_;
    uint64_t bytes_written_ = 0;
    mutable std::mutex mutex_;
};

/// Default per-direction buffer (256KB)
inline constexpr std::size_t default_pipe_capacity = 256 * 1024;

/**
 * @brief Create two connected stream ends
 * @param capacity Bytes buffered per direction before writers block
 */
[[nodiscard]] auto make_stream_pair(std::size_t capacity = default_pipe_capacity)
    -> std::pair<std::unique_ptr<memory_stream>, std::unique_ptr<memory_stream>>;

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_TRANSPORT_MEMORY_STREAM_H
