/**
 * @file chunk_types.h
 * @brief Remote item and chunk plan types
 */

#ifndef KCENON_DELTA_FETCH_CORE_CHUNK_TYPES_H
#define KCENON_DELTA_FETCH_CORE_CHUNK_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::delta_fetch {

/**
 * @brief Kind of a remote tree entry
 */
enum class item_kind {
    file,
    directory
};

[[nodiscard]] constexpr auto to_string(item_kind kind) -> const char* {
    switch (kind) {
        case item_kind::file: return "file";
        case item_kind::directory: return "directory";
        default: return "unknown";
    }
}

/**
 * @brief Value used to detect whether a remote file changed
 *
 * Two fingerprints match when size and modification time (millisecond
 * resolution) are equal and, if both sides carry a content hash, the hashes
 * are equal too.
 */
struct item_fingerprint {
    uint64_t size = 0;
    int64_t mtime_ms = 0;
    std::string content_hash;

    /**
     * @brief Serialized form: "size:mtime_ms" or "size:mtime_ms:hash"
     */
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] static auto from_string(const std::string& text)
        -> std::optional<item_fingerprint>;

    [[nodiscard]] auto matches(const item_fingerprint& other) const -> bool;
};

/**
 * @brief Descriptor of one remote tree entry
 *
 * Produced by the remote session; the engine treats it as read-only input.
 */
struct remote_item {
    std::string path;                          ///< Remote path, '/' separated
    std::string name;                          ///< Last path component
    item_kind kind = item_kind::file;
    uint64_t size = 0;
    std::chrono::system_clock::time_point modified;
    std::optional<std::string> sha256;         ///< Content hash when the remote provides one

    [[nodiscard]] auto is_file() const -> bool { return kind == item_kind::file; }
    [[nodiscard]] auto is_directory() const -> bool { return kind == item_kind::directory; }

    [[nodiscard]] auto fingerprint() const -> item_fingerprint;
};

/**
 * @brief State of one chunk within a plan
 */
enum class chunk_status {
    pending,
    committed,
    failed   ///< Exhausted its attempts in this run; persisted as pending
};

[[nodiscard]] constexpr auto to_string(chunk_status status) -> const char* {
    switch (status) {
        case chunk_status::pending: return "pending";
        case chunk_status::committed: return "committed";
        case chunk_status::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief One byte range of a file
 */
struct chunk_spec {
    uint64_t offset = 0;
    uint64_t length = 0;
    chunk_status status = chunk_status::pending;

    [[nodiscard]] auto end() const -> uint64_t { return offset + length; }

    [[nodiscard]] auto operator==(const chunk_spec& other) const -> bool = default;
};

/**
 * @brief Ordered chunk ranges covering one file
 *
 * Built by chunk_planner and mutated in place as chunks commit. Ranges are
 * contiguous and non-overlapping and their union is [0, file_size).
 * Not synchronized; the scheduler guards each plan with the file's mutex.
 */
class chunk_plan {
public:
    chunk_plan() = default;
    chunk_plan(uint64_t file_size, std::size_t chunk_size, std::vector<chunk_spec> chunks);

    [[nodiscard]] auto file_size() const -> uint64_t { return file_size_; }
    [[nodiscard]] auto chunk_size() const -> std::size_t { return chunk_size_; }
    [[nodiscard]] auto chunks() const -> const std::vector<chunk_spec>& { return chunks_; }
    [[nodiscard]] auto size() const -> std::size_t { return chunks_.size(); }
    [[nodiscard]] auto empty() const -> bool { return chunks_.empty(); }

    [[nodiscard]] auto pending_chunks() const -> std::vector<chunk_spec>;
    [[nodiscard]] auto pending_count() const -> std::size_t;
    [[nodiscard]] auto committed_count() const -> std::size_t;
    [[nodiscard]] auto failed_count() const -> std::size_t;
    [[nodiscard]] auto committed_bytes() const -> uint64_t;

    /**
     * @brief True when every chunk is committed (an empty plan is complete)
     */
    [[nodiscard]] auto is_complete() const -> bool;

    /**
     * @brief True when at least one chunk failed permanently
     */
    [[nodiscard]] auto is_incomplete() const -> bool;

    /**
     * @brief Check the coverage invariant: contiguous, no overlap, ends at file_size
     */
    [[nodiscard]] auto covers_file() const -> bool;

    /**
     * @brief Update the status of the chunk starting at offset
     * @return false if no chunk starts at offset
     */
    auto set_status(uint64_t offset, chunk_status status) -> bool;

private:
    [[nodiscard]] auto count_status(chunk_status status) const -> std::size_t;

    uint64_t file_size_ = 0;
    std::size_t chunk_size_ = 0;
    std::vector<chunk_spec> chunks_;
};

/**
 * @brief One chunk fetch unit
 *
 * Owned by exactly one worker at a time. attempt is 1-based.
 */
struct transfer_task {
    std::filesystem::path destination;
    chunk_spec chunk;
    uint32_t attempt = 1;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_CHUNK_TYPES_H
