/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include "kcenon/delta_fetch/core/checksum.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

namespace kcenon::delta_fetch {

namespace {

constexpr std::size_t FILE_READ_BUFFER = 64 * 1024;

auto to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += hex_chars[(digest[i] >> 4) & 0x0F];
        out += hex_chars[digest[i] & 0x0F];
    }
    return out;
}

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_ && EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    evp_md_ctx_wrapper& operator=(const evp_md_ctx_wrapper&) = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }

private:
    EVP_MD_CTX* ctx_;
};

}  // namespace

// ============================================================================
// sha256_hasher
// ============================================================================

class sha256_hasher::impl {
public:
    void update(std::span<const std::byte> data) {
        if (ctx_.get() && !data.empty()) {
            EVP_DigestUpdate(ctx_.get(), data.data(), data.size());
        }
    }

    auto finish() -> std::string {
        if (!ctx_.get()) {
            return {};
        }
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
            return {};
        }
        return to_hex(digest.data(), length);
    }

    [[nodiscard]] auto valid() const -> bool { return ctx_.get() != nullptr; }

private:
    evp_md_ctx_wrapper ctx_;
};

sha256_hasher::sha256_hasher() : impl_(std::make_unique<impl>()) {}

sha256_hasher::~sha256_hasher() = default;

sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;

auto sha256_hasher::operator=(sha256_hasher&&) noexcept -> sha256_hasher& = default;

void sha256_hasher::update(std::span<const std::byte> data) {
    impl_->update(data);
}

auto sha256_hasher::finish() -> std::string {
    return impl_->finish();
}

// ============================================================================
// checksum
// ============================================================================

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    sha256_hasher hasher;
    hasher.update(data);
    return hasher.finish();
}

auto checksum::sha256(const std::string& text) -> std::string {
    return sha256(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(error{error_code::file_not_found,
                                "file not found: " + path.string()});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_read_error,
                                "failed to open file: " + path.string()});
    }

    sha256_hasher hasher;
    std::vector<char> buffer(FILE_READ_BUFFER);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = file.gcount();
        if (count > 0) {
            hasher.update(std::as_bytes(
                std::span<const char>(buffer.data(), static_cast<std::size_t>(count))));
        }
    }
    if (file.bad()) {
        return unexpected(error{error_code::file_read_error,
                                "failed to read file: " + path.string()});
    }

    auto digest = hasher.finish();
    if (digest.empty()) {
        return unexpected(error{error_code::internal_error, "SHA-256 digest failed"});
    }
    return digest;
}

auto checksum::verify_sha256(const std::filesystem::path& path, const std::string& expected)
    -> bool {
    auto actual = sha256_file(path);
    if (!actual) {
        return false;
    }
    return std::equal(actual.value().begin(), actual.value().end(),
                      expected.begin(), expected.end(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

}  // namespace kcenon::delta_fetch
