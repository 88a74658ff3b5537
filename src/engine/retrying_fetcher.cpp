/**
 * @file retrying_fetcher.cpp
 * @brief Implementation of retrying_fetcher
 */

#include "kcenon/delta_fetch/engine/retrying_fetcher.h"
#include "kcenon/delta_fetch/core/error_codes.h"

#include <span>

namespace kcenon::delta_fetch {

retrying_fetcher::retrying_fetcher(std::shared_ptr<remote_session> session,
                                   retry_policy policy,
                                   std::shared_ptr<fetch_logger> logger)
    : session_(std::move(session))
    , policy_(policy)
    , logger_(logger ? std::move(logger) : make_quiet_logger()) {
}

auto retrying_fetcher::fetch_and_write(const transfer_task& task,
                                       const remote_item& item,
                                       destination_file& destination) -> result<uint64_t> {
    const auto& chunk = task.chunk;
    auto data = session_->open_range(item, chunk.offset, chunk.length);
    if (!data) {
        return unexpected(data.error());
    }

    if (data.value().size() != chunk.length) {
        return unexpected(error(error_code::remote_short_read,
            "expected " + std::to_string(chunk.length) + " bytes at offset " +
            std::to_string(chunk.offset) + ", got " + std::to_string(data.value().size())));
    }

    auto written = destination.write_at(chunk.offset, std::span<const std::byte>(data.value()));
    if (!written) {
        return unexpected(written.error());
    }
    return static_cast<uint64_t>(data.value().size());
}

auto retrying_fetcher::attempt(transfer_task& task,
                               const remote_item& item,
                               destination_file& destination) -> fetch_attempt {
    fetch_log_context ctx;
    ctx.remote_path = item.path;
    ctx.destination = task.destination.string();
    ctx.chunk_offset = task.chunk.offset;
    ctx.chunk_length = task.chunk.length;
    ctx.attempt = task.attempt;

    fetch_attempt outcome;

    auto fetched = fetch_and_write(task, item, destination);
    if (fetched) {
        outcome.outcome = fetch_outcome::committed;
        outcome.bytes = fetched.value();
        DF_LOG_TRACE(*logger_, log_category::fetcher,
            "Fetched " + std::to_string(outcome.bytes) + " bytes of " + item.path +
            " at offset " + std::to_string(task.chunk.offset));
        return outcome;
    }

    const auto& err = fetched.error();
    ctx.error_message = err.message;

    if (!is_retryable(err.code)) {
        outcome.outcome = fetch_outcome::failed;
        outcome.err = err;
        ctx.outcome = "failed";
        DF_LOG_ERROR_CTX(*logger_, log_category::fetcher,
            "Chunk fetch failed: " + std::string(to_string(classify(err.code))), ctx);
        return outcome;
    }

    if (task.attempt >= policy_.max_attempts) {
        outcome.outcome = fetch_outcome::failed;
        outcome.err = error(error_code::retries_exhausted,
            "gave up after " + std::to_string(task.attempt) + " attempts: " + err.message);
        ctx.outcome = "exhausted";
        DF_LOG_ERROR_CTX(*logger_, log_category::fetcher,
            "Chunk retries exhausted", ctx);
        return outcome;
    }

    outcome.outcome = fetch_outcome::retry_scheduled;
    outcome.err = err;
    outcome.retry_delay = policy_.delay_after(task.attempt);
    ++task.attempt;

    ctx.outcome = "retry";
    ctx.delay_ms = static_cast<uint64_t>(outcome.retry_delay.count());
    DF_LOG_WARN_CTX(*logger_, log_category::fetcher,
        "Transient failure, retrying chunk", ctx);
    return outcome;
}

}  // namespace kcenon::delta_fetch
