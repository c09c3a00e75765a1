/**
 * @file checksum.h
 * @brief SHA-256 digests for file integrity verification
 */

#ifndef KCENON_FASTDROP_CORE_CHECKSUM_H
#define KCENON_FASTDROP_CORE_CHECKSUM_H

#include <kcenon/fastdrop/core/types.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace kcenon::fastdrop {

/// Raw 32-byte SHA-256 digest as carried in file descriptors
using sha256_digest = std::array<std::byte, 32>;

/**
 * @brief Incremental SHA-256 hasher backed by OpenSSL EVP
 *
 * @code
 * sha256_hasher hasher;
 * hasher.update(first_block);
 * hasher.update(second_block);
 * auto digest = hasher.finalize();
 * @endcode
 */
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(sha256_hasher&&) noexcept;
    auto operator=(sha256_hasher&&) noexcept -> sha256_hasher&;

    sha256_hasher(const sha256_hasher&) = delete;
    auto operator=(const sha256_hasher&) -> sha256_hasher& = delete;

    /**
     * @brief Feed more data into the digest
     * @return Error if the underlying context failed
     */
    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Produce the digest; the hasher is reset afterwards
     */
    [[nodiscard]] auto finalize() -> result<sha256_digest>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief SHA-256 helpers
 */
class checksum {
public:
    /// Read block size used when hashing files
    static constexpr std::size_t file_read_block = 64 * 1024;

    /**
     * @brief Calculate SHA-256 of in-memory data
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> sha256_digest;

    /**
     * @brief Calculate SHA-256 of a file, streaming it in blocks
     * @param path Path to the file
     * @return Digest, or file_not_found / file_read_error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<sha256_digest>;

    /**
     * @brief Verify SHA-256 of a file against an expected digest
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, const sha256_digest& expected) -> bool;

    /**
     * @brief Lower-case hex rendering of a digest
     */
    [[nodiscard]] static auto to_hex(const sha256_digest& digest) -> std::string;
};

}  // namespace kcenon::fastdrop

#endif  // KCENON_FASTDROP_CORE_CHECKSUM_H
