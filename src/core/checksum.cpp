/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 helpers on OpenSSL EVP
 */

#include <kcenon/fastdrop/core/checksum.h>

#include <fstream>
#include <vector>

#include <openssl/err.h>
#include <openssl/evp.h>

namespace kcenon::fastdrop {

namespace {

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

}  // namespace

// sha256_hasher implementation

struct sha256_hasher::impl {
    md_ctx_ptr ctx{EVP_MD_CTX_new()};
    bool ready{false};

    auto reset() -> result<void> {
        if (!ctx) {
            return unexpected(error{error_code::internal_error, "cannot allocate digest context"});
        }
        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            ready = false;
            return unexpected(error{error_code::internal_error, get_openssl_error()});
        }
        ready = true;
        return {};
    }
};

sha256_hasher::sha256_hasher() : impl_(std::make_unique<impl>()) {
    // A failed init is reported by the first update() or finalize().
    (void)impl_->reset();
}

sha256_hasher::~sha256_hasher() = default;

sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;

auto sha256_hasher::operator=(sha256_hasher&&) noexcept -> sha256_hasher& = default;

auto sha256_hasher::update(std::span<const std::byte> data) -> result<void> {
    if (!impl_->ready) {
        return unexpected(error{error_code::internal_error, "digest context not initialized"});
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        return unexpected(error{error_code::internal_error, get_openssl_error()});
    }
    return {};
}

auto sha256_hasher::finalize() -> result<sha256_digest> {
    if (!impl_->ready) {
        return unexpected(error{error_code::internal_error, "digest context not initialized"});
    }

    sha256_digest digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(),
                           reinterpret_cast<unsigned char*>(digest.data()), &len) != 1 ||
        len != digest.size()) {
        return unexpected(error{error_code::internal_error, get_openssl_error()});
    }

    if (auto reset = impl_->reset(); !reset) {
        return unexpected(reset.error());
    }
    return digest;
}

// checksum implementation

auto checksum::sha256(std::span<const std::byte> data) -> sha256_digest {
    sha256_digest digest{};
    unsigned int len = 0;
    EVP_Digest(data.data(), data.size(),
               reinterpret_cast<unsigned char*>(digest.data()), &len,
               EVP_sha256(), nullptr);
    return digest;
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<sha256_digest> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected(error{error_code::file_not_found, "file not found: " + path.string()});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + path.string()});
    }

    sha256_hasher hasher;
    std::vector<std::byte> buffer(file_read_block);

    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read == 0) {
            break;
        }
        if (auto r = hasher.update(std::span<const std::byte>(buffer.data(), bytes_read)); !r) {
            return unexpected(r.error());
        }
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return hasher.finalize();
}

auto checksum::verify_sha256(const std::filesystem::path& path, const sha256_digest& expected)
    -> bool {
    auto actual = sha256_file(path);
    return actual.has_value() && actual.value() == expected;
}

auto checksum::to_hex(const sha256_digest& digest) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(digest.size() * 2);
    for (auto byte : digest) {
        result.push_back(hex_chars[static_cast<uint8_t>(byte) >> 4]);
        result.push_back(hex_chars[static_cast<uint8_t>(byte) & 0x0F]);
    }
    return result;
}

}  // namespace kcenon::fastdrop
