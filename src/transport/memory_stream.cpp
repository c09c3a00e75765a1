/**
 * @file memory_stream.cpp
 * @brief Implementation of the in-process stream pair
 */

#include <kcenon/fastdrop/transport/memory_stream.h>

#include <algorithm>
#include <condition_variable>
#include <deque>

namespace kcenon::fastdrop {

namespace detail {

/**
 * @brief One direction of a memory_stream pair
 */
struct memory_pipe {
    explicit memory_pipe(std::size_t cap) : capacity(cap) {}

    std::mutex mutex;
    std::condition_variable readable;
    std::condition_variable writable;
    std::deque<std::byte> buffer;
    std::size_t capacity;
    bool writer_closed = false;  ///< No more bytes will arrive
    bool reader_closed = false;  ///< Nobody will read what is written
};

void sever(memory_pipe& pipe) {
    {
        std::lock_guard<std::mutex> lock(pipe.mutex);
        pipe.writer_closed = true;
        pipe.reader_closed = true;
        pipe.buffer.clear();
    }
    pipe.readable.notify_all();
    pipe.writable.notify_all();
}

}  // namespace detail

memory_stream::memory_stream(std::shared_ptr<detail::memory_pipe> inbound,
                             std::shared_ptr<detail::memory_pipe> outbound)
    : inbound_(std::move(inbound)), outbound_(std::move(outbound)) {}

memory_stream::~memory_stream() {
    close();
}

auto memory_stream::read_exact(std::span<std::byte> buffer) -> result<std::size_t> {
    std::optional<std::chrono::milliseconds> timeout;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timeout = read_timeout_;
    }

    auto& pipe = *inbound_;
    std::unique_lock<std::mutex> lock(pipe.mutex);

    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto ready = [&pipe] {
            return !pipe.buffer.empty() || pipe.writer_closed || pipe.reader_closed;
        };

        if (timeout) {
            if (!pipe.readable.wait_for(lock, *timeout, ready)) {
                return unexpected(error{error_code::connection_timeout,
                                        "no data from peer within " +
                                            std::to_string(timeout->count()) + " ms"});
            }
        } else {
            pipe.readable.wait(lock, ready);
        }

        if (pipe.reader_closed) {
            return unexpected(error{error_code::connection_lost, "stream closed locally"});
        }
        if (pipe.buffer.empty()) {
            // writer_closed and drained
            break;
        }

        auto n = std::min(buffer.size() - filled, pipe.buffer.size());
        std::copy_n(pipe.buffer.begin(), n, buffer.begin() + static_cast<std::ptrdiff_t>(filled));
        pipe.buffer.erase(pipe.buffer.begin(), pipe.buffer.begin() + static_cast<std::ptrdiff_t>(n));
        filled += n;
        pipe.writable.notify_all();
    }

    return filled;
}

auto memory_stream::write_all(std::span<const std::byte> data) -> result<void> {
    std::optional<std::chrono::milliseconds> timeout;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timeout = write_timeout_;
    }

    auto& pipe = *outbound_;
    std::unique_lock<std::mutex> lock(pipe.mutex);

    std::size_t written = 0;
    while (written < data.size()) {
        auto ready = [&pipe] {
            return pipe.buffer.size() < pipe.capacity || pipe.reader_closed ||
                   pipe.writer_closed;
        };

        // The timeout restarts whenever the peer drains some bytes
        if (timeout) {
            if (!pipe.writable.wait_for(lock, *timeout, ready)) {
                return unexpected(error{error_code::connection_timeout,
                                        "peer read nothing within " +
                                            std::to_string(timeout->count()) + " ms"});
            }
        } else {
            pipe.writable.wait(lock, ready);
        }

        if (pipe.writer_closed) {
            return unexpected(error{error_code::connection_lost, "stream closed locally"});
        }
        if (pipe.reader_closed) {
            return unexpected(error{error_code::connection_lost, "peer closed the stream"});
        }

        auto n = std::min(data.size() - written, pipe.capacity - pipe.buffer.size());
        pipe.buffer.insert(pipe.buffer.end(), data.begin() + static_cast<std::ptrdiff_t>(written),
                           data.begin() + static_cast<std::ptrdiff_t>(written + n));
        written += n;
        pipe.readable.notify_all();
    }

    lock.unlock();
    std::lock_guard<std::mutex> stats_lock(mutex_);
    bytes_written_ += data.size();
    return {};
}

auto memory_stream::flush() -> result<void> {
    std::lock_guard<std::mutex> lock(outbound_->mutex);
    if (outbound_->writer_closed) {
        return unexpected(error{error_code::connection_lost, "stream closed locally"});
    }
    return {};
}

void memory_stream::close() {
    {
        std::lock_guard<std::mutex> lock(outbound_->mutex);
        outbound_->writer_closed = true;
    }
    outbound_->readable.notify_all();
    outbound_->writable.notify_all();

    {
        std::lock_guard<std::mutex> lock(inbound_->mutex);
        inbound_->reader_closed = true;
        inbound_->buffer.clear();
    }
    inbound_->readable.notify_all();
    inbound_->writable.notify_all();
}

void memory_stream::set_read_timeout(std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    read_timeout_ = timeout;
}

void memory_stream::set_write_timeout(std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_timeout_ = timeout;
}

auto memory_stream::is_open() const -> bool {
    std::lock_guard<std::mutex> lock(outbound_->mutex);
    return !outbound_->writer_closed;
}

auto memory_stream::bytes_written() const -> uint64_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_written_;
}

auto memory_stream::severer() const -> std::function<void()> {
    return [inbound = inbound_, outbound = outbound_] {
        detail::sever(*inbound);
        detail::sever(*outbound);
    };
}

auto make_stream_pair(std::size_t capacity)
    -> std::pair<std::unique_ptr<memory_stream>, std::unique_ptr<memory_stream>> {
    auto a_to_b = std::make_shared<detail::memory_pipe>(capacity);
    auto b_to_a = std::make_shared<detail::memory_pipe>(capacity);
    return {std::make_unique<memory_stream>(b_to_a, a_to_b),
            std::make_unique<memory_stream>(a_to_b, b_to_a)};
}

}  // namespace kcenon::fastdrop
