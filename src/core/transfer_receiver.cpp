/**
 * @file transfer_receiver.cpp
 * @brief Implementation of streaming multi-file reassembly
 */

#include <kcenon/fastdrop/core/transfer_receiver.h>

#include <kcenon/fastdrop/core/checksum.h>
#include <kcenon/fastdrop/core/logging.h>
#include <kcenon/fastdrop/core/transfer_utils.h>
#include <kcenon/fastdrop/protocol/frame_io.h>
#include <kcenon/fastdrop/transport/byte_stream.h>

#include <algorithm>
#include <set>

namespace kcenon::fastdrop {

// receive_report implementation

auto receive_report::all_successful() const -> bool {
    if (failure) {
        return false;
    }
    return std::all_of(files.begin(), files.end(),
                       [](const received_file& f) { return is_successful(f.outcome); });
}

auto receive_report::count(file_outcome outcome) const -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(files.begin(), files.end(),
                       [outcome](const received_file& f) { return f.outcome == outcome; }));
}

// transfer_receiver implementation

transfer_receiver::transfer_receiver(std::filesystem::path output_dir, chunk_config config)
    : output_dir_(std::move(output_dir)), config_(config) {}

transfer_receiver::~transfer_receiver() {
    abort();
}

transfer_receiver::transfer_receiver(transfer_receiver&&) noexcept = default;

auto transfer_receiver::operator=(transfer_receiver&&) noexcept -> transfer_receiver& = default;

void transfer_receiver::on_progress(chunk_progress_callback callback) {
    progress_callback_ = std::move(callback);
}

auto transfer_receiver::begin(const file_manifest& manifest) -> result<void> {
    if (started_) {
        return unexpected(error{error_code::already_initialized, "receiver already started"});
    }
    if (auto valid = config_.validate(); !valid) {
        return valid;
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        return unexpected(error{error_code::file_write_error,
                                "cannot create " + output_dir_.string() + ": " + ec.message()});
    }

    report_ = receive_report{};
    report_.files.reserve(manifest.files.size());

    std::set<std::string> used_names;
    for (std::size_t i = 0; i < manifest.files.size(); ++i) {
        const auto& desc = manifest.files[i];

        // Directory components from the sender are never honored
        auto base = std::filesystem::path(desc.name).filename();
        auto base_str = base.string();
        if (base_str.empty() || base_str == "." || base_str == "..") {
            return unexpected(error{error_code::invalid_filename,
                                    "manifest entry " + std::to_string(i) +
                                        " has no usable file name: '" + desc.name + "'"});
        }

        if (!used_names.insert(base_str).second) {
            // A renamed entry must not land on a name another entry already owns
            const auto stem = base.stem().string() + "_" + std::to_string(i);
            const auto extension = base.extension().string();
            auto renamed = stem + extension;
            for (std::size_t n = 1; !used_names.insert(renamed).second; ++n) {
                renamed = stem + "_" + std::to_string(n) + extension;
            }
            FD_LOG_WARN(log_category::receiver,
                        "Duplicate name " + base_str + " written as " + renamed);
            base_str = renamed;
        }

        received_file file;
        file.name = desc.name;
        file.path = output_dir_ / base_str;
        file.expected_size = desc.size;
        file.expected_chunks = config_.calculate_chunk_count(desc.size);
        report_.files.push_back(std::move(file));
    }

    manifest_ = manifest;
    started_ = true;
    return {};
}

auto transfer_receiver::process_chunk(const file_chunk& chunk) -> result<void> {
    if (!started_) {
        return unexpected(error{error_code::not_initialized, "receiver has no manifest"});
    }

    if (chunk.file_index >= manifest_.files.size()) {
        return unexpected(error{error_code::invalid_file_index,
                                "chunk for file " + std::to_string(chunk.file_index) +
                                    " but manifest has " +
                                    std::to_string(manifest_.files.size())});
    }

    auto& file = report_.files[chunk.file_index];
    if (chunk.total_chunks != file.expected_chunks) {
        return unexpected(error{error_code::chunk_sequence_error,
                                file.name + ": total_chunks " +
                                    std::to_string(chunk.total_chunks) + ", expected " +
                                    std::to_string(file.expected_chunks)});
    }
    if (file.outcome != file_outcome::not_started && file.outcome != file_outcome::incomplete) {
        return unexpected(error{error_code::chunk_sequence_error,
                                file.name + ": chunk " + std::to_string(chunk.chunk_number) +
                                    " after completion"});
    }

    auto it = open_files_.find(chunk.file_index);
    if (it == open_files_.end()) {
        receiver_file_state state;
        state.expected_chunks = chunk.total_chunks;
        state.output.open(file.path, std::ios::binary | std::ios::trunc);
        if (!state.output) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot open " + file.path.string() + " for writing"});
        }
        it = open_files_.emplace(chunk.file_index, std::move(state)).first;
        file.outcome = file_outcome::incomplete;
    }
    auto& state = it->second;

    if (chunk.chunk_number != state.chunks_received) {
        return unexpected(error{error_code::chunk_sequence_error,
                                file.name + ": chunk " + std::to_string(chunk.chunk_number) +
                                    ", expected " + std::to_string(state.chunks_received)});
    }
    if (state.bytes_written + chunk.payload.size() > file.expected_size) {
        return unexpected(error{error_code::file_size_mismatch,
                                file.name + ": data exceeds declared size " +
                                    std::to_string(file.expected_size)});
    }

    if (!chunk.payload.empty()) {
        state.output.write(reinterpret_cast<const char*>(chunk.payload.data()),
                           static_cast<std::streamsize>(chunk.payload.size()));
        if (!state.output) {
            return unexpected(error{error_code::file_write_error,
                                    "write failed: " + file.path.string()});
        }
    }

    state.chunks_received++;
    state.bytes_written += chunk.payload.size();
    file.chunks_received = state.chunks_received;
    file.bytes_written = state.bytes_written;
    report_.chunks_received++;
    report_.bytes_received += chunk.payload.size();

    if (progress_callback_) {
        chunk_progress progress;
        progress.file_index = chunk.file_index;
        progress.chunks_received = state.chunks_received;
        progress.total_chunks = state.expected_chunks;
        progress.file_bytes_written = state.bytes_written;
        progress.file_size = file.expected_size;
        progress.bytes_received = report_.bytes_received;
        progress.total_size = manifest_.total_size;
        progress_callback_(progress);
    }

    if (chunk.chunk_number + 1 == chunk.total_chunks) {
        complete_file(chunk.file_index, state);
        open_files_.erase(it);
    }
    return {};
}

void transfer_receiver::complete_file(uint64_t file_index, receiver_file_state& state) {
    auto& file = report_.files[file_index];
    const auto& desc = manifest_.files[file_index];

    state.output.flush();
    state.output.close();

    transfer_log_context ctx;
    ctx.filename = file.path.string();
    ctx.file_index = file_index;
    ctx.file_size = desc.size;
    ctx.bytes_transferred = state.bytes_written;

    if (state.bytes_written != desc.size) {
        file.outcome = file_outcome::size_mismatch;
        ctx.error_message = "wrote " + std::to_string(state.bytes_written) + " of " +
                            std::to_string(desc.size) + " bytes";
        FD_LOG_ERROR_CTX(log_category::receiver, "File size mismatch", ctx);
        return;
    }

    if (!desc.content_hash) {
        file.outcome = file_outcome::complete_unhashed;
        FD_LOG_INFO_CTX(log_category::receiver, "File complete (no digest declared)", ctx);
        return;
    }

    auto actual = checksum::sha256_file(file.path);
    if (!actual) {
        file.outcome = file_outcome::hash_mismatch;
        ctx.error_message = actual.error().message;
        FD_LOG_ERROR_CTX(log_category::receiver, "Cannot re-read file for verification", ctx);
        return;
    }

    if (actual.value() != *desc.content_hash) {
        file.outcome = file_outcome::hash_mismatch;
        ctx.error_message = "expected " + checksum::to_hex(*desc.content_hash) + ", got " +
                            checksum::to_hex(actual.value());
        FD_LOG_ERROR_CTX(log_category::receiver,
                         "SHA-256 MISMATCH: file kept on disk but is NOT verified", ctx);
        return;
    }

    file.outcome = file_outcome::verified;
    FD_LOG_INFO_CTX(log_category::receiver,
                    "Verified " + desc.name + " (" + format_bytes(desc.size) + ")", ctx);
}

void transfer_receiver::abort() {
    for (auto& [index, state] : open_files_) {
        if (state.output.is_open()) {
            state.output.flush();
            state.output.close();
        }
    }
    open_files_.clear();
}

auto transfer_receiver::finish() -> receive_report {
    for (const auto& [index, state] : open_files_) {
        const auto& file = report_.files[index];
        FD_LOG_WARN(log_category::receiver,
                    file.name + " incomplete: " + std::to_string(state.chunks_received) + " of " +
                        std::to_string(state.expected_chunks) + " chunks");
    }
    abort();
    started_ = false;
    return std::move(report_);
}

auto transfer_receiver::receive_and_write(byte_stream& stream, const file_manifest& manifest)
    -> receive_report {
    if (auto ready = begin(manifest); !ready) {
        receive_report report;
        report.failure = ready.error();
        return report;
    }

    while (true) {
        auto next = receive_chunk(stream);
        if (!next) {
            report_.failure = next.error();
            FD_LOG_ERROR(log_category::receiver,
                         "Stream aborted: " + next.error().message);
            break;
        }
        if (!next.value()) {
            break;
        }

        if (auto written = process_chunk(*next.value()); !written) {
            report_.failure = written.error();
            FD_LOG_ERROR(log_category::receiver,
                         "Protocol error, aborting stream: " + written.error().message);
            stream.close();
            break;
        }
    }

    return finish();
}

auto transfer_receiver::output_dir() const -> const std::filesystem::path& {
    return output_dir_;
}

}  // namespace kcenon::fastdrop
