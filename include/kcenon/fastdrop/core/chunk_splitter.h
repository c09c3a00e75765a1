/**
 * @file chunk_splitter.h
 * @brief Lazy splitting of files into protocol chunks
 */

#ifndef KCENON_FASTDROP_CORE_CHUNK_SPLITTER_H
#define KCENON_FASTDROP_CORE_CHUNK_SPLITTER_H

#include <kcenon/fastdrop/core/chunk_config.h>
#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/types.h>

#include <filesystem>
#include <fstream>
#include <vector>

namespace kcenon::fastdrop {

/**
 * @brief Splits files into chunks for streaming transfer
 *
 * Files are read one chunk at a time; the whole file is never held in memory.
 * Each call to send_file() reopens the file and starts again at offset 0.
 */
class chunk_splitter {
public:
    /**
     * @brief Finite, non-restartable sequence of one file's chunks
     */
    class chunk_iterator {
    public:
        /**
         * @brief Check if more chunks are available
         */
        [[nodiscard]] auto has_next() const -> bool;

        /**
         * @brief Read the next chunk from disk
         * @return Next chunk, or file_read_error if the file shrank or failed
         */
        [[nodiscard]] auto next() -> result<file_chunk>;

        [[nodiscard]] auto current_index() const -> uint64_t;
        [[nodiscard]] auto total_chunks() const -> uint64_t;
        [[nodiscard]] auto file_size() const -> uint64_t;
        [[nodiscard]] auto file_index() const -> uint64_t;

        // Move-only
        chunk_iterator(chunk_iterator&&) noexcept;
        auto operator=(chunk_iterator&&) noexcept -> chunk_iterator&;
        ~chunk_iterator();

        chunk_iterator(const chunk_iterator&) = delete;
        auto operator=(const chunk_iterator&) -> chunk_iterator& = delete;

    private:
        friend class chunk_splitter;

        chunk_iterator(
            std::ifstream file,
            chunk_config config,
            uint64_t file_index,
            uint64_t file_size,
            uint64_t total_chunks);

        std::ifstream file_;
        chunk_config config_;
        uint64_t file_index_;
        uint64_t file_size_;
        uint64_t total_chunks_;
        uint64_t current_index_;
    };

    chunk_splitter();

    /**
     * @brief Construct with custom configuration
     * @param config Chunk configuration
     */
    explicit chunk_splitter(const chunk_config& config);

    /**
     * @brief Open a file and prepare its chunk sequence
     * @param file_path Path to the file to split
     * @param file_index Manifest position stamped on every chunk
     * @return Chunk iterator or error
     */
    [[nodiscard]] auto send_file(const std::filesystem::path& file_path, uint64_t file_index)
        -> result<chunk_iterator>;

    [[nodiscard]] auto config() const -> const chunk_config&;

private:
    chunk_config config_;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_CORE_CHUNK_SPLITTER_H
