/**
 * @file destination_file.h
 * @brief Random-access writable file shared by the workers of one transfer
 */

#ifndef KCENON_DELTA_FETCH_CORE_DESTINATION_FILE_H
#define KCENON_DELTA_FETCH_CORE_DESTINATION_FILE_H

#include "kcenon/delta_fetch/core/types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace kcenon::delta_fetch {

/**
 * @brief Staging file written at arbitrary offsets
 *
 * Writes use positional I/O, so workers may write disjoint ranges
 * concurrently without coordinating a shared file position. Existing
 * content is kept on open, which lets a resumed transfer keep chunks
 * committed by an earlier run.
 */
class destination_file {
public:
    /**
     * @brief Open (creating if needed) and size the file
     * @param path File path; parent directories are created
     * @param size Final file size; the file is extended or truncated to it
     * @param sync_on_close fdatasync before close
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path,
                                   uint64_t size,
                                   bool sync_on_close = true)
        -> result<std::shared_ptr<destination_file>>;

    ~destination_file();

    destination_file(const destination_file&) = delete;
    auto operator=(const destination_file&) -> destination_file& = delete;

    /**
     * @brief Write data at offset
     * @return disk_full on ENOSPC, file_write_error otherwise
     */
    [[nodiscard]] auto write_at(uint64_t offset, std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Flush written data to stable storage
     */
    [[nodiscard]] auto sync() -> result<void>;

    /**
     * @brief Sync (if configured) and close; further writes fail
     */
    [[nodiscard]] auto close() -> result<void>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto size() const -> uint64_t { return size_; }
    [[nodiscard]] auto is_open() const -> bool { return fd_ >= 0; }

private:
    destination_file(std::filesystem::path path, int fd, uint64_t size, bool sync_on_close);

    std::filesystem::path path_;
    int fd_;
    uint64_t size_;
    bool sync_on_close_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_DESTINATION_FILE_H
