/**
 * @file delta_fetch.h
 * @brief Main header for the delta_fetch library
 * @version 0.1.0
 *
 * Pulls a remote file tree into a local directory in resumable chunks.
 *
 * @code
 * #include <kcenon/delta_fetch/delta_fetch.h>
 *
 * using namespace kcenon::delta_fetch;
 *
 * auto session = std::make_shared<directory_remote_session>("/mnt/share");
 * auto coordinator = transfer_coordinator::builder()
 *     .with_chunk_size(4 * 1024 * 1024)
 *     .build(session);
 * @endcode
 */

#ifndef KCENON_DELTA_FETCH_DELTA_FETCH_H
#define KCENON_DELTA_FETCH_DELTA_FETCH_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/delta_fetch/core/types.h"
#include "kcenon/delta_fetch/core/error_codes.h"
#include "kcenon/delta_fetch/core/chunk_types.h"
#include "kcenon/delta_fetch/core/fetch_config.h"
#include "kcenon/delta_fetch/core/transfer_types.h"
#include "kcenon/delta_fetch/core/event_bus.h"
#include "kcenon/delta_fetch/core/logging.h"

// Remote
#include "kcenon/delta_fetch/remote/remote_session.h"
#include "kcenon/delta_fetch/remote/directory_remote_session.h"
#include "kcenon/delta_fetch/remote/path_filter.h"

// Engine
#include "kcenon/delta_fetch/engine/transfer_coordinator.h"

// Adapters
#include "kcenon/delta_fetch/adapters/thread_pool_adapter.h"

namespace kcenon::delta_fetch {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_DELTA_FETCH_H
