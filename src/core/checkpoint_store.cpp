/**
 * @file checkpoint_store.cpp
 * @brief Implementation of checkpoint_store
 */

#include "kcenon/delta_fetch/core/checkpoint_store.h"
#include "kcenon/delta_fetch/core/checksum.h"
#include "kcenon/delta_fetch/core/json_utils.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sstream>
#include <unordered_map>

namespace kcenon::delta_fetch {

// ============================================================================
// checkpoint
// ============================================================================

auto checkpoint::expected_chunk_count() const -> uint64_t {
    if (file_size == 0 || chunk_size == 0) {
        return 0;
    }
    return (file_size + chunk_size - 1) / chunk_size;
}

auto checkpoint::all_chunks_committed() const -> bool {
    return committed_offsets.size() == expected_chunk_count();
}

// ============================================================================
// checkpoint_store_config
// ============================================================================

checkpoint_store_config::checkpoint_store_config()
    : state_directory(std::filesystem::temp_directory_path() / "delta_fetch_state") {
}

checkpoint_store_config::checkpoint_store_config(std::filesystem::path dir)
    : state_directory(std::move(dir)) {
}

// ============================================================================
// Serialization helpers
// ============================================================================

namespace {

auto destination_key(const std::filesystem::path& destination) -> std::string {
    return destination.lexically_normal().string();
}

auto serialize_checkpoint(const checkpoint& cp) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"destination\": \"" << detail::escape_json_string(cp.destination.string()) << "\",\n";
    oss << "  \"fingerprint\": \"" << detail::escape_json_string(cp.fingerprint) << "\",\n";
    oss << "  \"file_size\": " << cp.file_size << ",\n";
    oss << "  \"chunk_size\": " << cp.chunk_size << ",\n";
    oss << "  \"state\": \"" << to_string(cp.state) << "\",\n";
    oss << "  \"committed_offsets\": [";
    bool first = true;
    for (auto offset : cp.committed_offsets) {
        if (!first) oss << ", ";
        oss << offset;
        first = false;
    }
    oss << "],\n";
    oss << "  \"created_at\": " << detail::to_epoch_ms(cp.created_at) << ",\n";
    oss << "  \"updated_at\": " << detail::to_epoch_ms(cp.updated_at) << "\n";
    oss << "}\n";
    return oss.str();
}

auto deserialize_checkpoint(const std::string& json) -> result<checkpoint> {
    checkpoint cp;

    auto destination = detail::extract_json_value(json, "destination");
    auto fingerprint = detail::extract_json_value(json, "fingerprint");
    auto state = detail::extract_json_value(json, "state");
    auto offsets = detail::extract_json_array(json, "committed_offsets");
    if (!destination || !fingerprint || !state || !offsets) {
        return unexpected(error(error_code::checkpoint_corrupted, "missing checkpoint field"));
    }

    cp.destination = *destination;
    cp.fingerprint = *fingerprint;

    if (*state == "complete") {
        cp.state = checkpoint_state::complete;
    } else if (*state == "in_progress") {
        cp.state = checkpoint_state::in_progress;
    } else {
        return unexpected(error(error_code::checkpoint_corrupted, "unknown state: " + *state));
    }

    try {
        cp.file_size = std::stoull(detail::extract_json_value(json, "file_size").value_or(""));
        cp.chunk_size = std::stoull(detail::extract_json_value(json, "chunk_size").value_or(""));
        cp.created_at = detail::from_epoch_ms(
            std::stoll(detail::extract_json_value(json, "created_at").value_or("0")));
        cp.updated_at = detail::from_epoch_ms(
            std::stoll(detail::extract_json_value(json, "updated_at").value_or("0")));
        for (const auto& token : *offsets) {
            cp.committed_offsets.insert(std::stoull(token));
        }
    } catch (const std::exception&) {
        return unexpected(error(error_code::checkpoint_corrupted, "invalid numeric field"));
    }

    return cp;
}

auto read_text_file(const std::filesystem::path& path) -> std::optional<std::string> {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief Replace path with content atomically: temp file, fsync, rename
 */
auto write_file_atomically(const std::filesystem::path& path,
                           const std::string& content,
                           bool sync) -> result<void> {
    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return unexpected(error(error_code::checkpoint_write_failed,
            "failed to open " + tmp_path.string() + ": " + std::strerror(errno)));
    }

    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        auto written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            auto code = errno == ENOSPC ? error_code::disk_full : error_code::checkpoint_write_failed;
            auto message = std::string("failed to write checkpoint: ") + std::strerror(errno);
            ::close(fd);
            return unexpected(error(code, message));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (sync && ::fsync(fd) != 0) {
        auto message = std::string("failed to sync checkpoint: ") + std::strerror(errno);
        ::close(fd);
        return unexpected(error(error_code::checkpoint_write_failed, message));
    }
    if (::close(fd) != 0) {
        return unexpected(error(error_code::checkpoint_write_failed,
            std::string("failed to close checkpoint: ") + std::strerror(errno)));
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        return unexpected(error(error_code::checkpoint_write_failed,
            "failed to replace checkpoint: " + ec.message()));
    }

    if (sync) {
        int dir_fd = ::open(path.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (dir_fd >= 0) {
            ::fsync(dir_fd);
            ::close(dir_fd);
        }
    }
    return {};
}

}  // namespace

// ============================================================================
// checkpoint_store::impl
// ============================================================================

class checkpoint_store::impl {
public:
    impl(const checkpoint_store_config& cfg, std::shared_ptr<fetch_logger> logger)
        : config_(cfg)
        , logger_(logger ? std::move(logger) : make_quiet_logger()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.state_directory, ec);
        if (ec) {
            DF_LOG_ERROR(*logger_, log_category::checkpoint,
                "Failed to create state directory " + config_.state_directory.string() +
                ": " + ec.message());
        }
    }

    auto load(const std::filesystem::path& destination) -> result<checkpoint> {
        auto slot = slot_for(destination);
        std::lock_guard lock(slot->mutex);

        auto loaded = ensure_loaded(*slot, destination);
        if (!loaded) {
            return unexpected(loaded.error());
        }
        if (!slot->record) {
            DF_LOG_TRACE(*logger_, log_category::checkpoint,
                "No checkpoint for " + destination.string());
            return unexpected(error(error_code::checkpoint_not_found,
                "no checkpoint for " + destination.string()));
        }
        return *slot->record;
    }

    auto begin(const std::filesystem::path& destination,
               const std::string& fingerprint,
               uint64_t file_size,
               uint64_t chunk_size,
               checkpoint_state state) -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error(error_code::invalid_chunk_size, "chunk size must be positive"));
        }

        auto slot = slot_for(destination);
        std::lock_guard lock(slot->mutex);

        checkpoint cp;
        cp.destination = destination;
        cp.fingerprint = fingerprint;
        cp.file_size = file_size;
        cp.chunk_size = chunk_size;
        cp.state = state;
        cp.created_at = std::chrono::system_clock::now();
        cp.updated_at = cp.created_at;
        if (state == checkpoint_state::complete) {
            for (uint64_t offset = 0; offset < file_size; offset += chunk_size) {
                cp.committed_offsets.insert(offset);
            }
        }

        auto written = persist(destination, cp);
        if (!written) {
            return written;
        }
        slot->record = std::move(cp);
        slot->loaded = true;

        DF_LOG_DEBUG(*logger_, log_category::checkpoint,
            "Checkpoint started for " + destination.string() +
            " (" + to_string(state) + ", fingerprint " + fingerprint + ")");
        return {};
    }

    auto commit(const std::filesystem::path& destination, uint64_t chunk_offset) -> result<void> {
        auto slot = slot_for(destination);
        std::lock_guard lock(slot->mutex);

        auto loaded = ensure_loaded(*slot, destination);
        if (!loaded) {
            return loaded;
        }
        if (!slot->record) {
            return unexpected(error(error_code::checkpoint_not_found,
                "commit without checkpoint for " + destination.string()));
        }

        auto& cp = *slot->record;
        if (chunk_offset % cp.chunk_size != 0 || chunk_offset >= cp.file_size) {
            return unexpected(error(error_code::invalid_chunk_offset,
                "offset " + std::to_string(chunk_offset) + " is not a chunk of " +
                destination.string()));
        }

        auto [it, inserted] = cp.committed_offsets.insert(chunk_offset);
        if (!inserted) {
            return {};
        }
        auto previous_update = cp.updated_at;
        cp.updated_at = std::chrono::system_clock::now();

        auto written = persist(destination, cp);
        if (!written) {
            cp.committed_offsets.erase(it);
            cp.updated_at = previous_update;
            DF_LOG_ERROR(*logger_, log_category::checkpoint,
                "Failed to commit offset " + std::to_string(chunk_offset) + " of " +
                destination.string() + ": " + written.error().message);
            return written;
        }

        DF_LOG_TRACE(*logger_, log_category::checkpoint,
            "Committed offset " + std::to_string(chunk_offset) + " of " + destination.string() +
            " (" + std::to_string(cp.committed_offsets.size()) + "/" +
            std::to_string(cp.expected_chunk_count()) + ")");
        return {};
    }

    auto finalize(const std::filesystem::path& destination) -> result<void> {
        auto slot = slot_for(destination);
        std::lock_guard lock(slot->mutex);

        auto loaded = ensure_loaded(*slot, destination);
        if (!loaded) {
            return loaded;
        }
        if (!slot->record) {
            return unexpected(error(error_code::checkpoint_not_found,
                "finalize without checkpoint for " + destination.string()));
        }

        auto& cp = *slot->record;
        if (!cp.all_chunks_committed()) {
            return unexpected(error(error_code::missing_chunks,
                std::to_string(cp.expected_chunk_count() - cp.committed_offsets.size()) +
                " chunk(s) of " + destination.string() + " not committed"));
        }
        if (cp.state == checkpoint_state::complete) {
            return {};
        }

        cp.state = checkpoint_state::complete;
        cp.updated_at = std::chrono::system_clock::now();
        auto written = persist(destination, cp);
        if (!written) {
            cp.state = checkpoint_state::in_progress;
            return written;
        }

        DF_LOG_DEBUG(*logger_, log_category::checkpoint,
            "Checkpoint complete for " + destination.string());
        return {};
    }

    auto invalidate(const std::filesystem::path& destination) -> result<void> {
        auto slot = slot_for(destination);
        std::lock_guard lock(slot->mutex);

        slot->record.reset();
        slot->loaded = true;

        auto path = record_path(destination);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            DF_LOG_ERROR(*logger_, log_category::checkpoint,
                "Failed to delete checkpoint " + path.string() + " (" + ec.message() + ")");
            return unexpected(error(error_code::checkpoint_write_failed,
                "failed to delete checkpoint: " + ec.message()));
        }

        DF_LOG_DEBUG(*logger_, log_category::checkpoint,
            "Checkpoint invalidated for " + destination.string());
        return {};
    }

    auto has_checkpoint(const std::filesystem::path& destination) const -> bool {
        {
            std::shared_lock lock(slots_mutex_);
            auto it = slots_.find(destination_key(destination));
            if (it != slots_.end()) {
                std::lock_guard slot_lock(it->second->mutex);
                if (it->second->loaded) {
                    return it->second->record.has_value();
                }
            }
        }
        std::error_code ec;
        return std::filesystem::exists(record_path(destination), ec);
    }

    auto list_checkpoints() const -> std::vector<checkpoint> {
        std::vector<checkpoint> records;
        std::error_code ec;
        if (!std::filesystem::exists(config_.state_directory, ec)) {
            return records;
        }

        for (const auto& entry : std::filesystem::directory_iterator(config_.state_directory, ec)) {
            if (entry.path().extension() != ".json") {
                continue;
            }
            auto text = read_text_file(entry.path());
            if (!text) {
                continue;
            }
            auto parsed = deserialize_checkpoint(*text);
            if (parsed) {
                records.push_back(std::move(parsed.value()));
            } else {
                DF_LOG_WARN(*logger_, log_category::checkpoint,
                    "Skipping unreadable checkpoint " + entry.path().string());
            }
        }
        return records;
    }

    auto cleanup_expired() -> std::size_t {
        auto now = std::chrono::system_clock::now();
        std::size_t removed = 0;

        for (const auto& cp : list_checkpoints()) {
            if (cp.state == checkpoint_state::complete) {
                continue;
            }
            if (now - cp.updated_at <= config_.state_ttl) {
                continue;
            }
            if (invalidate(cp.destination)) {
                ++removed;
            }
        }

        if (removed > 0) {
            DF_LOG_INFO(*logger_, log_category::checkpoint,
                "Removed " + std::to_string(removed) + " expired checkpoint(s)");
        }
        return removed;
    }

    [[nodiscard]] auto config() const -> const checkpoint_store_config& { return config_; }

private:
    struct record_slot {
        std::mutex mutex;
        bool loaded = false;
        std::optional<checkpoint> record;
    };

    auto slot_for(const std::filesystem::path& destination) -> std::shared_ptr<record_slot> {
        auto key = destination_key(destination);
        {
            std::shared_lock lock(slots_mutex_);
            auto it = slots_.find(key);
            if (it != slots_.end()) {
                return it->second;
            }
        }
        std::unique_lock lock(slots_mutex_);
        auto& slot = slots_[key];
        if (!slot) {
            slot = std::make_shared<record_slot>();
        }
        return slot;
    }

    [[nodiscard]] auto record_path(const std::filesystem::path& destination) const
        -> std::filesystem::path {
        return config_.state_directory / (checksum::sha256(destination_key(destination)) + ".json");
    }

    // Caller holds slot.mutex.
    auto ensure_loaded(record_slot& slot, const std::filesystem::path& destination)
        -> result<void> {
        if (slot.loaded) {
            return {};
        }

        auto path = record_path(destination);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            slot.loaded = true;
            return {};
        }

        auto text = read_text_file(path);
        if (!text) {
            return unexpected(error(error_code::file_read_error,
                "failed to open checkpoint " + path.string()));
        }

        auto parsed = deserialize_checkpoint(*text);
        if (!parsed) {
            DF_LOG_ERROR(*logger_, log_category::checkpoint,
                "Corrupted checkpoint " + path.string() + ": " + parsed.error().message);
            return unexpected(parsed.error());
        }

        slot.record = std::move(parsed.value());
        slot.loaded = true;
        DF_LOG_DEBUG(*logger_, log_category::checkpoint,
            "Checkpoint recovered for " + destination.string() + " (" +
            std::to_string(slot.record->committed_offsets.size()) + "/" +
            std::to_string(slot.record->expected_chunk_count()) + " chunks, " +
            to_string(slot.record->state) + ")");
        return {};
    }

    auto persist(const std::filesystem::path& destination, const checkpoint& cp) -> result<void> {
        return write_file_atomically(record_path(destination), serialize_checkpoint(cp),
                                     config_.sync_on_commit);
    }

    checkpoint_store_config config_;
    std::shared_ptr<fetch_logger> logger_;
    mutable std::shared_mutex slots_mutex_;
    std::unordered_map<std::string, std::shared_ptr<record_slot>> slots_;
};

// ============================================================================
// checkpoint_store
// ============================================================================

checkpoint_store::checkpoint_store(const checkpoint_store_config& config,
                                   std::shared_ptr<fetch_logger> logger)
    : impl_(std::make_unique<impl>(config, std::move(logger))) {
}

checkpoint_store::checkpoint_store(checkpoint_store&&) noexcept = default;
auto checkpoint_store::operator=(checkpoint_store&&) noexcept -> checkpoint_store& = default;
checkpoint_store::~checkpoint_store() = default;

auto checkpoint_store::load(const std::filesystem::path& destination) -> result<checkpoint> {
    return impl_->load(destination);
}

auto checkpoint_store::begin(const std::filesystem::path& destination,
                             const std::string& fingerprint,
                             uint64_t file_size,
                             uint64_t chunk_size) -> result<void> {
    return impl_->begin(destination, fingerprint, file_size, chunk_size,
                        checkpoint_state::in_progress);
}

auto checkpoint_store::commit(const std::filesystem::path& destination, uint64_t chunk_offset)
    -> result<void> {
    return impl_->commit(destination, chunk_offset);
}

auto checkpoint_store::finalize(const std::filesystem::path& destination) -> result<void> {
    return impl_->finalize(destination);
}

auto checkpoint_store::mark_complete(const std::filesystem::path& destination,
                                     const std::string& fingerprint,
                                     uint64_t file_size,
                                     uint64_t chunk_size) -> result<void> {
    return impl_->begin(destination, fingerprint, file_size, chunk_size,
                        checkpoint_state::complete);
}

auto checkpoint_store::invalidate(const std::filesystem::path& destination) -> result<void> {
    return impl_->invalidate(destination);
}

auto checkpoint_store::has_checkpoint(const std::filesystem::path& destination) const -> bool {
    return impl_->has_checkpoint(destination);
}

auto checkpoint_store::list_checkpoints() const -> std::vector<checkpoint> {
    return impl_->list_checkpoints();
}

auto checkpoint_store::cleanup_expired() -> std::size_t {
    return impl_->cleanup_expired();
}

auto checkpoint_store::config() const -> const checkpoint_store_config& {
    return impl_->config();
}

}  // namespace kcenon::delta_fetch
