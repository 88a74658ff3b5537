/**
 * @file event_bus.cpp
 * @brief Implementation of event_bus and callback_observer
 */

#include "kcenon/delta_fetch/core/event_bus.h"

#include <algorithm>
#include <exception>
#include <type_traits>

namespace kcenon::delta_fetch {

namespace {

template <typename>
inline constexpr bool always_false = false;

void deliver(fetch_observer& observer, const fetch_event& event) {
    std::visit([&observer](const auto& e) {
        using event_type = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<event_type, auth_event>) {
            observer.on_auth(e);
        } else if constexpr (std::is_same_v<event_type, listing_event>) {
            observer.on_listing(e);
        } else if constexpr (std::is_same_v<event_type, start_event>) {
            observer.on_start(e);
        } else if constexpr (std::is_same_v<event_type, progress_event>) {
            observer.on_progress(e);
        } else if constexpr (std::is_same_v<event_type, complete_event>) {
            observer.on_complete(e);
        } else if constexpr (std::is_same_v<event_type, session_event>) {
            observer.on_session_complete(e);
        } else {
            static_assert(always_false<event_type>, "unhandled fetch_event alternative");
        }
    }, event);
}

auto event_name(observer_capability capability) -> const char* {
    switch (capability) {
        case observer_capability::auth: return "on_auth";
        case observer_capability::listing: return "on_listing";
        case observer_capability::start: return "on_start";
        case observer_capability::progress: return "on_progress";
        case observer_capability::complete: return "on_complete";
        case observer_capability::session: return "on_session_complete";
        default: return "unknown";
    }
}

}  // namespace

auto capability_of(const fetch_event& event) -> observer_capability {
    static constexpr observer_capability by_index[] = {
        observer_capability::auth,
        observer_capability::listing,
        observer_capability::start,
        observer_capability::progress,
        observer_capability::complete,
        observer_capability::session,
    };
    return by_index[event.index()];
}

// ============================================================================
// callback_observer
// ============================================================================

void callback_observer::on_auth(std::function<void(const auth_event&)> callback) {
    auth_cb_ = std::move(callback);
}

void callback_observer::on_listing(std::function<void(const listing_event&)> callback) {
    listing_cb_ = std::move(callback);
}

void callback_observer::on_start(std::function<void(const start_event&)> callback) {
    start_cb_ = std::move(callback);
}

void callback_observer::on_progress(std::function<void(const progress_event&)> callback) {
    progress_cb_ = std::move(callback);
}

void callback_observer::on_complete(std::function<void(const complete_event&)> callback) {
    complete_cb_ = std::move(callback);
}

void callback_observer::on_session_complete(std::function<void(const session_event&)> callback) {
    session_cb_ = std::move(callback);
}

auto callback_observer::capabilities() const -> observer_capability {
    auto caps = observer_capability::none;
    if (auth_cb_) caps = caps | observer_capability::auth;
    if (listing_cb_) caps = caps | observer_capability::listing;
    if (start_cb_) caps = caps | observer_capability::start;
    if (progress_cb_) caps = caps | observer_capability::progress;
    if (complete_cb_) caps = caps | observer_capability::complete;
    if (session_cb_) caps = caps | observer_capability::session;
    return caps;
}

void callback_observer::on_auth(const auth_event& event) {
    if (auth_cb_) auth_cb_(event);
}

void callback_observer::on_listing(const listing_event& event) {
    if (listing_cb_) listing_cb_(event);
}

void callback_observer::on_start(const start_event& event) {
    if (start_cb_) start_cb_(event);
}

void callback_observer::on_progress(const progress_event& event) {
    if (progress_cb_) progress_cb_(event);
}

void callback_observer::on_complete(const complete_event& event) {
    if (complete_cb_) complete_cb_(event);
}

void callback_observer::on_session_complete(const session_event& event) {
    if (session_cb_) session_cb_(event);
}

// ============================================================================
// event_bus
// ============================================================================

event_bus::event_bus(std::shared_ptr<fetch_logger> logger)
    : logger_(logger ? std::move(logger) : make_quiet_logger()) {
}

void event_bus::register_observer(std::shared_ptr<fetch_observer> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard lock(mutex_);
    DF_LOG_DEBUG(*logger_, log_category::events, "Registered observer: " + observer->name());
    observers_.push_back(std::move(observer));
}

auto event_bus::unregister_observer(const std::string& name) -> std::size_t {
    std::lock_guard lock(mutex_);
    auto before = observers_.size();
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                    [&name](const auto& o) { return o->name() == name; }),
                     observers_.end());
    return before - observers_.size();
}

auto event_bus::observer_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return observers_.size();
}

auto event_bus::dispatch(const fetch_event& event) -> std::size_t {
    // Snapshot so hooks may register observers without deadlocking.
    std::vector<std::shared_ptr<fetch_observer>> snapshot;
    {
        std::lock_guard lock(mutex_);
        snapshot = observers_;
    }

    const auto capability = capability_of(event);
    std::size_t failures = 0;

    for (const auto& observer : snapshot) {
        if (!has_capability(observer->capabilities(), capability)) {
            continue;
        }
        try {
            deliver(*observer, event);
        } catch (const std::exception& e) {
            ++failures;
            fetch_log_context ctx;
            ctx.error_message = e.what();
            DF_LOG_ERROR_CTX(*logger_, log_category::events,
                "Observer " + observer->name() + " failed in " + event_name(capability), ctx);
        } catch (...) {
            ++failures;
            DF_LOG_ERROR(*logger_, log_category::events,
                "Observer " + observer->name() + " failed in " + event_name(capability) +
                " with a non-standard exception");
        }
    }
    return failures;
}

}  // namespace kcenon::delta_fetch
