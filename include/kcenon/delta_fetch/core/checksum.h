/**
 * @file checksum.h
 * @brief Checksum utilities for data integrity verification
 */

#ifndef KCENON_DELTA_FETCH_CORE_CHECKSUM_H
#define KCENON_DELTA_FETCH_CORE_CHECKSUM_H

#include "kcenon/delta_fetch/core/types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace kcenon::delta_fetch {

/**
 * @brief SHA-256 utilities for content verification
 *
 * SHA-256 is computed with OpenSSL EVP and returned as lowercase hex.
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of data
     * @return SHA-256 hash as hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a string
     */
    [[nodiscard]] static auto sha256(const std::string& text) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Verify SHA-256 hash of a file (case-insensitive hex compare)
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, const std::string& expected) -> bool;
};

/**
 * @brief Incremental SHA-256 over a byte stream
 */
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(const sha256_hasher&) = delete;
    auto operator=(const sha256_hasher&) -> sha256_hasher& = delete;
    sha256_hasher(sha256_hasher&&) noexcept;
    auto operator=(sha256_hasher&&) noexcept -> sha256_hasher&;

    void update(std::span<const std::byte> data);

    /**
     * @brief Finish the digest; the hasher must not be updated afterwards
     */
    [[nodiscard]] auto finish() -> std::string;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_CHECKSUM_H
