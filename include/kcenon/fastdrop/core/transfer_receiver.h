/**
 * @file transfer_receiver.h
 * @brief Streaming reassembly of a multi-file transfer
 */

#ifndef KCENON_FASTDROP_CORE_TRANSFER_RECEIVER_H
#define KCENON_FASTDROP_CORE_TRANSFER_RECEIVER_H

#include <kcenon/fastdrop/core/chunk_config.h>
#include <kcenon/fastdrop/core/protocol_types.h>
#include <kcenon/fastdrop/core/types.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon::fastdrop {

class byte_stream;

/**
 * @brief Final state of one manifest entry
 */
enum class file_outcome {
    not_started,        ///< No chunk arrived
    incomplete,         ///< Some chunks arrived; never verified
    verified,           ///< Complete and digest matched
    complete_unhashed,  ///< Complete; manifest declared no digest
    hash_mismatch,      ///< Complete but digest differs; file kept on disk
    size_mismatch,      ///< Last chunk arrived but byte count differs from manifest
};

[[nodiscard]] constexpr auto to_string(file_outcome outcome) -> const char* {
    switch (outcome) {
        case file_outcome::not_started: return "not_started";
        case file_outcome::incomplete: return "incomplete";
        case file_outcome::verified: return "verified";
        case file_outcome::complete_unhashed: return "complete_unhashed";
        case file_outcome::hash_mismatch: return "hash_mismatch";
        case file_outcome::size_mismatch: return "size_mismatch";
        default: return "unknown";
    }
}

/**
 * @brief Only verified and complete-without-digest files count as received
 */
[[nodiscard]] constexpr auto is_successful(file_outcome outcome) -> bool {
    return outcome == file_outcome::verified || outcome == file_outcome::complete_unhashed;
}

/**
 * @brief Per-file result in a receive_report
 */
struct received_file {
    std::string name;                 ///< Name from the manifest
    std::filesystem::path path;       ///< Where the bytes were written
    uint64_t expected_size = 0;
    uint64_t bytes_written = 0;
    uint64_t chunks_received = 0;
    uint64_t expected_chunks = 0;
    file_outcome outcome = file_outcome::not_started;
};

/**
 * @brief Outcome of draining one stream
 */
struct receive_report {
    std::vector<received_file> files;  ///< Same order as the manifest
    error failure;                     ///< Protocol or I/O error that aborted the stream
    uint64_t chunks_received = 0;
    uint64_t bytes_received = 0;

    /// Stream closed cleanly and every file is successful
    [[nodiscard]] auto all_successful() const -> bool;

    [[nodiscard]] auto count(file_outcome outcome) const -> std::size_t;
};

/**
 * @brief Progress notification after each written chunk
 */
struct chunk_progress {
    uint64_t file_index = 0;
    uint64_t chunks_received = 0;
    uint64_t total_chunks = 0;
    uint64_t file_bytes_written = 0;
    uint64_t file_size = 0;
    uint64_t bytes_received = 0;  ///< Across all files
    uint64_t total_size = 0;      ///< Manifest total
};

using chunk_progress_callback = std::function<void(const chunk_progress&)>;

/**
 * @brief Writes chunks to disk as they arrive and verifies completed files
 *
 * One instance handles one inbound stream and exclusively owns its file
 * handles. Chunks are demultiplexed by file index; within a file they must
 * arrive in order. Nothing is buffered beyond the chunk being written.
 *
 * @code
 * transfer_receiver receiver("/downloads");
 * auto report = receiver.receive_and_write(stream, response.manifest);
 * if (!report.all_successful()) { ... }
 * @endcode
 */
class transfer_receiver {
public:
    /**
     * @param output_dir Directory files are written into (created if missing)
     * @param config Chunk sizing; must match the sender's
     */
    explicit transfer_receiver(std::filesystem::path output_dir, chunk_config config = {});
    ~transfer_receiver();

    transfer_receiver(transfer_receiver&&) noexcept;
    auto operator=(transfer_receiver&&) noexcept -> transfer_receiver&;

    transfer_receiver(const transfer_receiver&) = delete;
    auto operator=(const transfer_receiver&) -> transfer_receiver& = delete;

    void on_progress(chunk_progress_callback callback);

    /**
     * @brief Prepare for a manifest: create the output directory, assign paths
     * @return invalid_filename for names without a usable final component,
     *         file_write_error if the directory cannot be created
     */
    [[nodiscard]] auto begin(const file_manifest& manifest) -> result<void>;

    /**
     * @brief Validate and write one chunk
     *
     * Completes the file when chunk_number + 1 == total_chunks.
     *
     * @return invalid_file_index, chunk_sequence_error, file_size_mismatch or
     *         file_write_error; any error means the stream must be aborted
     */
    [[nodiscard]] auto process_chunk(const file_chunk& chunk) -> result<void>;

    /**
     * @brief Flush and close every open file; they stay incomplete
     */
    void abort();

    /**
     * @brief Close out the session and report per-file outcomes
     *
     * Files still open are flushed, closed and reported incomplete.
     */
    [[nodiscard]] auto finish() -> receive_report;

    /**
     * @brief Drain @p stream until it closes, then report
     *
     * A protocol error stops reading, leaves completed files intact and is
     * recorded in receive_report::failure.
     */
    [[nodiscard]] auto receive_and_write(byte_stream& stream, const file_manifest& manifest)
        -> receive_report;

    [[nodiscard]] auto output_dir() const -> const std::filesystem::path&;

private:
    struct receiver_file_state {
        std::ofstream output;
        uint64_t chunks_received = 0;
        uint64_t expected_chunks = 0;
        uint64_t bytes_written = 0;
    };

    void complete_file(uint64_t file_index, receiver_file_state& state);

    std::filesystem::path output_dir_;
    chunk_config config_;
    file_manifest manifest_;
    receive_report report_;
    std::unordered_map<uint64_t, receiver_file_state> open_files_;
    chunk_progress_callback progress_callback_;
    bool started_ = false;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_CORE_TRANSFER_RECEIVER_H
