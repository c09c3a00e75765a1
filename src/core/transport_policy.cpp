/**
 * @file transport_policy.cpp
 * @brief Implementation of file analysis and transport selection
 */

#include <kcenon/fastdrop/core/transport_policy.h>

#include <kcenon/fastdrop/core/checksum.h>
#include <kcenon/fastdrop/core/logging.h>
#include <kcenon/fastdrop/core/transfer_utils.h>

namespace kcenon::fastdrop {

auto analyze_files(const std::vector<std::filesystem::path>& paths, const size_limits& limits)
    -> result<transfer_plan> {
    if (paths.empty()) {
        return unexpected(error{error_code::no_input_files, "no files to send"});
    }

    transfer_plan plan;
    plan.paths = paths;
    plan.manifest.files.reserve(paths.size());

    for (const auto& path : paths) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return unexpected(
                error{error_code::file_not_found, "file not found: " + path.string()});
        }
        if (!std::filesystem::is_regular_file(path, ec)) {
            return unexpected(
                error{error_code::not_regular_file, "not a regular file: " + path.string()});
        }

        auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            return unexpected(error{
                error_code::file_read_error, "cannot get file size: " + path.string()});
        }
        if (size > limits.max_file_size) {
            return unexpected(error{
                error_code::file_too_large,
                path.filename().string() + " is " + format_bytes(size) + " (limit " +
                    format_bytes(limits.max_file_size) + ")"});
        }

        plan.manifest.total_size += size;
        if (plan.manifest.total_size > limits.max_total_size) {
            return unexpected(error{
                error_code::aggregate_too_large,
                "transfer exceeds " + format_bytes(limits.max_total_size)});
        }

        file_descriptor desc;
        desc.name = path.filename().string();
        desc.size = size;
        plan.manifest.files.push_back(std::move(desc));
    }

    // Hash only once every size check has passed
    for (std::size_t i = 0; i < paths.size(); ++i) {
        auto digest = checksum::sha256_file(paths[i]);
        if (!digest) {
            return unexpected(digest.error());
        }
        plan.manifest.files[i].content_hash = digest.value();
    }

    plan.transport = select_transport(plan.manifest.size(), plan.manifest.total_size);

    FD_LOG_INFO(log_category::sender,
                "Prepared " + std::to_string(plan.manifest.size()) + " file(s), " +
                    format_bytes(plan.manifest.total_size) + ", transport " +
                    to_string(plan.transport));
    return plan;
}

}  // namespace kcenon::fastdrop
