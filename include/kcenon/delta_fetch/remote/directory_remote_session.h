/**
 * @file directory_remote_session.h
 * @brief remote_session served from a local directory tree
 */

#ifndef KCENON_DELTA_FETCH_REMOTE_DIRECTORY_REMOTE_SESSION_H
#define KCENON_DELTA_FETCH_REMOTE_DIRECTORY_REMOTE_SESSION_H

#include "kcenon/delta_fetch/remote/remote_session.h"

#include <filesystem>
#include <memory>
#include <string>

namespace kcenon::delta_fetch {

/**
 * @brief Options for directory_remote_session
 */
struct directory_session_options {
    std::string account = "local";
    bool compute_hashes = false;   ///< Report a SHA-256 for every file (reads it fully)
};

/**
 * @brief Treats a mounted or local directory as the remote store
 *
 * Remote paths are '/' separated and relative to the root; "" and "/" both
 * name the root itself. Paths that escape the root are rejected with
 * remote_access_denied.
 */
class directory_remote_session final : public remote_session {
public:
    explicit directory_remote_session(std::filesystem::path root,
                                      directory_session_options options = {});

    [[nodiscard]] auto authenticate() -> result<session_info> override;

    [[nodiscard]] auto stat(const std::string& remote_path) -> result<remote_item> override;

    [[nodiscard]] auto list_children(const std::string& remote_path)
        -> result<std::vector<remote_item>> override;

    [[nodiscard]] auto open_range(const remote_item& item, uint64_t offset, uint64_t length)
        -> result<std::vector<std::byte>> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    [[nodiscard]] auto resolve(const std::string& remote_path) const
        -> result<std::filesystem::path>;

    [[nodiscard]] auto describe(const std::filesystem::path& local,
                                const std::string& remote_path,
                                bool with_hash) const -> result<remote_item>;

    std::filesystem::path root_;
    directory_session_options options_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_REMOTE_DIRECTORY_REMOTE_SESSION_H
