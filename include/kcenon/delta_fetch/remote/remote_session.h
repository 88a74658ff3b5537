/**
 * @file remote_session.h
 * @brief Interface to the remote file store
 */

#ifndef KCENON_DELTA_FETCH_REMOTE_REMOTE_SESSION_H
#define KCENON_DELTA_FETCH_REMOTE_REMOTE_SESSION_H

#include "kcenon/delta_fetch/core/chunk_types.h"
#include "kcenon/delta_fetch/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon::delta_fetch {

/**
 * @brief Established remote session
 */
struct session_info {
    std::string account;
    std::string session_id;
    std::chrono::system_clock::time_point authenticated_at;
};

/**
 * @brief Remote file store the engine pulls from
 *
 * Implementations must allow open_range to be called concurrently from
 * several worker threads. Transient failures are reported with the codes
 * is_retryable() accepts (connection_*, remote_unavailable, remote_throttled,
 * remote_short_read); anything else is treated as final.
 */
class remote_session {
public:
    virtual ~remote_session() = default;

    /**
     * @brief Establish the session
     * @return session_info, or auth_failed
     */
    [[nodiscard]] virtual auto authenticate() -> result<session_info> = 0;

    /**
     * @brief Describe a single remote path
     * @return remote_item, or remote_not_found
     */
    [[nodiscard]] virtual auto stat(const std::string& remote_path) -> result<remote_item> = 0;

    /**
     * @brief List the direct children of a remote directory
     */
    [[nodiscard]] virtual auto list_children(const std::string& remote_path)
        -> result<std::vector<remote_item>> = 0;

    /**
     * @brief Read length bytes of item starting at offset
     *
     * A read of a file whose content no longer matches item's fingerprint
     * reports remote_content_changed.
     */
    [[nodiscard]] virtual auto open_range(const remote_item& item, uint64_t offset, uint64_t length)
        -> result<std::vector<std::byte>> = 0;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_REMOTE_REMOTE_SESSION_H
