/**
 * @file chunk_splitter.cpp
 * @brief Implementation of lazy file chunking
 */

#include <kcenon/fastdrop/core/chunk_splitter.h>

namespace kcenon::fastdrop {

// chunk_iterator implementation

chunk_splitter::chunk_iterator::chunk_iterator(
    std::ifstream file,
    chunk_config config,
    uint64_t file_index,
    uint64_t file_size,
    uint64_t total_chunks)
    : file_(std::move(file)),
      config_(config),
      file_index_(file_index),
      file_size_(file_size),
      total_chunks_(total_chunks),
      current_index_(0) {}

chunk_splitter::chunk_iterator::chunk_iterator(chunk_iterator&& other) noexcept
    : file_(std::move(other.file_)),
      config_(other.config_),
      file_index_(other.file_index_),
      file_size_(other.file_size_),
      total_chunks_(other.total_chunks_),
      current_index_(other.current_index_) {
    other.total_chunks_ = 0;
    other.current_index_ = 0;
}

auto chunk_splitter::chunk_iterator::operator=(chunk_iterator&& other) noexcept
    -> chunk_iterator& {
    if (this != &other) {
        file_ = std::move(other.file_);
        config_ = other.config_;
        file_index_ = other.file_index_;
        file_size_ = other.file_size_;
        total_chunks_ = other.total_chunks_;
        current_index_ = other.current_index_;

        other.total_chunks_ = 0;
        other.current_index_ = 0;
    }
    return *this;
}

chunk_splitter::chunk_iterator::~chunk_iterator() = default;

auto chunk_splitter::chunk_iterator::has_next() const -> bool {
    return current_index_ < total_chunks_;
}

auto chunk_splitter::chunk_iterator::next() -> result<file_chunk> {
    if (!has_next()) {
        return unexpected(error{error_code::internal_error, "no more chunks available"});
    }

    if (!file_.good()) {
        return unexpected(error{error_code::file_read_error, "file stream error"});
    }

    // Reads are sequential, so the stream position is already at the offset
    uint64_t offset = current_index_ * config_.chunk_size;
    std::size_t bytes_to_read = config_.chunk_size;
    if (current_index_ == total_chunks_ - 1) {
        bytes_to_read = static_cast<std::size_t>(file_size_ - offset);
    }

    file_chunk c;
    c.file_index = file_index_;
    c.chunk_number = current_index_;
    c.total_chunks = total_chunks_;
    c.payload.resize(bytes_to_read);

    if (bytes_to_read > 0) {
        file_.read(reinterpret_cast<char*>(c.payload.data()),
                   static_cast<std::streamsize>(bytes_to_read));
        auto bytes_read = static_cast<std::size_t>(file_.gcount());
        if (bytes_read != bytes_to_read) {
            return unexpected(error{
                error_code::file_read_error,
                "short read at offset " + std::to_string(offset) + ": expected " +
                    std::to_string(bytes_to_read) + ", got " + std::to_string(bytes_read)});
        }
    }

    ++current_index_;
    return c;
}

auto chunk_splitter::chunk_iterator::current_index() const -> uint64_t {
    return current_index_;
}

auto chunk_splitter::chunk_iterator::total_chunks() const -> uint64_t {
    return total_chunks_;
}

auto chunk_splitter::chunk_iterator::file_size() const -> uint64_t {
    return file_size_;
}

auto chunk_splitter::chunk_iterator::file_index() const -> uint64_t {
    return file_index_;
}

// chunk_splitter implementation

chunk_splitter::chunk_splitter() : config_() {}

chunk_splitter::chunk_splitter(const chunk_config& config) : config_(config) {}

auto chunk_splitter::send_file(const std::filesystem::path& file_path, uint64_t file_index)
    -> result<chunk_iterator> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + file_path.string()});
    }
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return unexpected(
            error{error_code::not_regular_file, "not a regular file: " + file_path.string()});
    }

    auto file_size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return unexpected(
            error{error_code::file_read_error, "cannot get file size: " + file_path.string()});
    }

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + file_path.string()});
    }

    uint64_t total_chunks = config_.calculate_chunk_count(file_size);
    return chunk_iterator(std::move(file), config_, file_index, file_size, total_chunks);
}

auto chunk_splitter::config() const -> const chunk_config& {
    return config_;
}

}  // namespace kcenon::fastdrop
