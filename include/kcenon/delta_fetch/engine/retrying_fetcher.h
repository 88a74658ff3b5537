/**
 * @file retrying_fetcher.h
 * @brief Single-attempt chunk fetch with retry classification
 */

#ifndef KCENON_DELTA_FETCH_ENGINE_RETRYING_FETCHER_H
#define KCENON_DELTA_FETCH_ENGINE_RETRYING_FETCHER_H

#include "kcenon/delta_fetch/core/chunk_types.h"
#include "kcenon/delta_fetch/core/destination_file.h"
#include "kcenon/delta_fetch/core/fetch_config.h"
#include "kcenon/delta_fetch/core/logging.h"
#include "kcenon/delta_fetch/core/types.h"
#include "kcenon/delta_fetch/remote/remote_session.h"

#include <chrono>
#include <cstdint>
#include <memory>

namespace kcenon::delta_fetch {

/**
 * @brief Result of one fetch attempt
 */
enum class fetch_outcome {
    committed,        ///< Bytes written to the destination, ready for checkpoint commit
    retry_scheduled,  ///< Transient failure; run the task again after retry_delay
    failed            ///< Permanent failure for this chunk
};

[[nodiscard]] constexpr auto to_string(fetch_outcome outcome) -> const char* {
    switch (outcome) {
        case fetch_outcome::committed: return "committed";
        case fetch_outcome::retry_scheduled: return "retry_scheduled";
        case fetch_outcome::failed: return "failed";
        default: return "unknown";
    }
}

struct fetch_attempt {
    fetch_outcome outcome = fetch_outcome::failed;
    error err;                                  ///< Set for retry_scheduled and failed
    std::chrono::milliseconds retry_delay{0};   ///< Backoff before the next attempt
    uint64_t bytes = 0;                         ///< Bytes written on success
};

/**
 * @brief Fetches one chunk per call and decides how a failure continues
 *
 * The fetcher never sleeps. A transient failure with attempts left bumps
 * task.attempt and returns retry_scheduled with the backoff delay; the
 * caller re-queues the task after that delay. Exhausting max_attempts
 * yields failed with retries_exhausted. Any other error fails at once.
 *
 * A chunk counts as written only once the full range has been stored;
 * a short payload is treated as a transient remote_short_read.
 */
class retrying_fetcher {
public:
    retrying_fetcher(std::shared_ptr<remote_session> session,
                     retry_policy policy,
                     std::shared_ptr<fetch_logger> logger = nullptr);

    /**
     * @brief Run one attempt of task
     * @param task Chunk to fetch; attempt is incremented on retry_scheduled
     * @param item Remote file the chunk belongs to
     * @param destination Open staging file sized to item.size
     */
    [[nodiscard]] auto attempt(transfer_task& task,
                               const remote_item& item,
                               destination_file& destination) -> fetch_attempt;

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

private:
    [[nodiscard]] auto fetch_and_write(const transfer_task& task,
                                       const remote_item& item,
                                       destination_file& destination) -> result<uint64_t>;

    std::shared_ptr<remote_session> session_;
    retry_policy policy_;
    std::shared_ptr<fetch_logger> logger_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_ENGINE_RETRYING_FETCHER_H
