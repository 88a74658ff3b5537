/**
 * @file event_bus.h
 * @brief Synchronous lifecycle notifications for registered observers
 */

#ifndef KCENON_DELTA_FETCH_CORE_EVENT_BUS_H
#define KCENON_DELTA_FETCH_CORE_EVENT_BUS_H

#include "kcenon/delta_fetch/core/chunk_types.h"
#include "kcenon/delta_fetch/core/logging.h"
#include "kcenon/delta_fetch/core/transfer_types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kcenon::delta_fetch {

/**
 * @brief Hooks an observer implements
 */
enum class observer_capability : uint8_t {
    none = 0,
    auth = 1 << 0,
    listing = 1 << 1,
    start = 1 << 2,
    progress = 1 << 3,
    complete = 1 << 4,
    session = 1 << 5,
    all = 0x3F,
};

[[nodiscard]] constexpr auto operator|(observer_capability a, observer_capability b)
    -> observer_capability {
    return static_cast<observer_capability>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr auto operator&(observer_capability a, observer_capability b)
    -> observer_capability {
    return static_cast<observer_capability>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr auto has_capability(observer_capability set, observer_capability flag)
    -> bool {
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Fired after the remote session authenticated (or failed to)
 */
struct auth_event {
    std::string account;
    std::string session_id;
    bool success = false;
    std::optional<std::string> error_message;
};

/**
 * @brief Fired after one remote directory was listed
 */
struct listing_event {
    std::string remote_path;
    std::vector<remote_item> children;
};

/**
 * @brief Fired before the chunks of a file are scheduled
 */
struct start_event {
    remote_item item;
    std::filesystem::path destination;
    std::size_t chunks_pending = 0;
    std::size_t chunks_total = 0;
};

/**
 * @brief Fired after each committed chunk
 */
struct progress_event {
    remote_item item;
    std::filesystem::path destination;
    uint64_t bytes_committed = 0;
    uint64_t total_bytes = 0;
    std::size_t chunks_committed = 0;
    std::size_t chunks_total = 0;

    [[nodiscard]] auto percentage() const -> double {
        if (total_bytes == 0) return 100.0;
        return static_cast<double>(bytes_committed) / static_cast<double>(total_bytes) * 100.0;
    }
};

/**
 * @brief Fired once per file after its outcome is final
 */
struct complete_event {
    remote_item item;
    std::filesystem::path destination;
    bool success = false;
    file_outcome outcome = file_outcome::failed;
    std::optional<std::string> error_message;
};

/**
 * @brief Fired once at the end of a run
 */
struct session_event {
    std::size_t total_files = 0;
    std::size_t committed = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    uint64_t bytes_fetched = 0;
    bool cancelled = false;
};

using fetch_event = std::variant<auth_event, listing_event, start_event, progress_event,
                                 complete_event, session_event>;

/**
 * @brief Capability needed to receive an event
 */
[[nodiscard]] auto capability_of(const fetch_event& event) -> observer_capability;

/**
 * @brief Observer of transfer lifecycle events
 *
 * Hooks run synchronously on the dispatching thread, which may be a worker
 * thread for progress events. Exceptions thrown from a hook are caught and
 * logged by the bus.
 */
class fetch_observer {
public:
    virtual ~fetch_observer() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
    [[nodiscard]] virtual auto capabilities() const -> observer_capability = 0;

    virtual void on_auth(const auth_event&) {}
    virtual void on_listing(const listing_event&) {}
    virtual void on_start(const start_event&) {}
    virtual void on_progress(const progress_event&) {}
    virtual void on_complete(const complete_event&) {}
    virtual void on_session_complete(const session_event&) {}
};

/**
 * @brief Observer assembled from callbacks
 *
 * Its capabilities are exactly the hooks that have a callback set.
 *
 * @code
 * auto observer = std::make_shared<callback_observer>("progress-printer");
 * observer->on_progress([](const progress_event& e) {
 *     std::cout << e.item.path << " " << e.percentage() << "%\n";
 * });
 * bus.register_observer(observer);
 * @endcode
 */
class callback_observer : public fetch_observer {
public:
    explicit callback_observer(std::string name) : name_(std::move(name)) {}

    void on_auth(std::function<void(const auth_event&)> callback);
    void on_listing(std::function<void(const listing_event&)> callback);
    void on_start(std::function<void(const start_event&)> callback);
    void on_progress(std::function<void(const progress_event&)> callback);
    void on_complete(std::function<void(const complete_event&)> callback);
    void on_session_complete(std::function<void(const session_event&)> callback);

    [[nodiscard]] auto name() const -> std::string override { return name_; }
    [[nodiscard]] auto capabilities() const -> observer_capability override;

    void on_auth(const auth_event& event) override;
    void on_listing(const listing_event& event) override;
    void on_start(const start_event& event) override;
    void on_progress(const progress_event& event) override;
    void on_complete(const complete_event& event) override;
    void on_session_complete(const session_event& event) override;

private:
    std::string name_;
    std::function<void(const auth_event&)> auth_cb_;
    std::function<void(const listing_event&)> listing_cb_;
    std::function<void(const start_event&)> start_cb_;
    std::function<void(const progress_event&)> progress_cb_;
    std::function<void(const complete_event&)> complete_cb_;
    std::function<void(const session_event&)> session_cb_;
};

/**
 * @brief Ordered registry of observers with isolated dispatch
 */
class event_bus {
public:
    explicit event_bus(std::shared_ptr<fetch_logger> logger = nullptr);

    event_bus(const event_bus&) = delete;
    auto operator=(const event_bus&) -> event_bus& = delete;

    /**
     * @brief Append an observer; dispatch order is registration order
     */
    void register_observer(std::shared_ptr<fetch_observer> observer);

    /**
     * @brief Remove every observer with the given name
     * @return Number of observers removed
     */
    auto unregister_observer(const std::string& name) -> std::size_t;

    [[nodiscard]] auto observer_count() const -> std::size_t;

    /**
     * @brief Deliver an event to every observer having its capability
     *
     * Runs synchronously on the calling thread. A hook that throws is
     * logged and skipped; the remaining observers still run.
     *
     * @return Number of observers whose hook failed
     */
    auto dispatch(const fetch_event& event) -> std::size_t;

private:
    std::shared_ptr<fetch_logger> logger_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<fetch_observer>> observers_;
};

}  // namespace kcenon::delta_fetch

#endif  // KCENON_DELTA_FETCH_CORE_EVENT_BUS_H
