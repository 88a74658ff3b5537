/**
 * @file test_event_bus.cpp
 * @brief Unit tests for event_bus and callback_observer
 */

#include <gtest/gtest.h>

#include <kcenon/delta_fetch/core/event_bus.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace kcenon::delta_fetch::test {

namespace {

class recording_observer : public fetch_observer {
public:
    recording_observer(std::string name, observer_capability caps, std::vector<std::string>& log)
        : name_(std::move(name)), caps_(caps), log_(log) {}

    [[nodiscard]] auto name() const -> std::string override { return name_; }
    [[nodiscard]] auto capabilities() const -> observer_capability override { return caps_; }

    void on_start(const start_event&) override { log_.push_back(name_ + ":start"); }
    void on_complete(const complete_event&) override { log_.push_back(name_ + ":complete"); }

private:
    std::string name_;
    observer_capability caps_;
    std::vector<std::string>& log_;
};

class throwing_observer : public fetch_observer {
public:
    [[nodiscard]] auto name() const -> std::string override { return "thrower"; }
    [[nodiscard]] auto capabilities() const -> observer_capability override {
        return observer_capability::all;
    }
    void on_complete(const complete_event&) override {
        throw std::runtime_error("observer exploded");
    }
};

}  // namespace

class EventBusTest : public ::testing::Test {
protected:
    event_bus bus_;
    std::vector<std::string> log_;
};

TEST_F(EventBusTest, CapabilityOfEachEvent) {
    EXPECT_EQ(capability_of(auth_event{}), observer_capability::auth);
    EXPECT_EQ(capability_of(listing_event{}), observer_capability::listing);
    EXPECT_EQ(capability_of(start_event{}), observer_capability::start);
    EXPECT_EQ(capability_of(progress_event{}), observer_capability::progress);
    EXPECT_EQ(capability_of(complete_event{}), observer_capability::complete);
    EXPECT_EQ(capability_of(session_event{}), observer_capability::session);
}

TEST_F(EventBusTest, DispatchFollowsRegistrationOrder) {
    bus_.register_observer(std::make_shared<recording_observer>(
        "first", observer_capability::all, log_));
    bus_.register_observer(std::make_shared<recording_observer>(
        "second", observer_capability::all, log_));

    EXPECT_EQ(bus_.dispatch(start_event{}), 0u);
    ASSERT_EQ(log_.size(), 2u);
    EXPECT_EQ(log_[0], "first:start");
    EXPECT_EQ(log_[1], "second:start");
}

TEST_F(EventBusTest, ObserversOnlyReceiveDeclaredCapabilities) {
    bus_.register_observer(std::make_shared<recording_observer>(
        "completer", observer_capability::complete, log_));

    bus_.dispatch(start_event{});
    bus_.dispatch(complete_event{});

    ASSERT_EQ(log_.size(), 1u);
    EXPECT_EQ(log_[0], "completer:complete");
}

TEST_F(EventBusTest, ThrowingObserverDoesNotStopOthers) {
    bus_.register_observer(std::make_shared<throwing_observer>());
    bus_.register_observer(std::make_shared<recording_observer>(
        "after", observer_capability::complete, log_));

    EXPECT_EQ(bus_.dispatch(complete_event{}), 1u);
    ASSERT_EQ(log_.size(), 1u);
    EXPECT_EQ(log_[0], "after:complete");
}

TEST_F(EventBusTest, UnregisterByName) {
    bus_.register_observer(std::make_shared<recording_observer>(
        "a", observer_capability::all, log_));
    bus_.register_observer(std::make_shared<recording_observer>(
        "b", observer_capability::all, log_));
    bus_.register_observer(nullptr);
    EXPECT_EQ(bus_.observer_count(), 2u);

    EXPECT_EQ(bus_.unregister_observer("a"), 1u);
    EXPECT_EQ(bus_.unregister_observer("missing"), 0u);
    EXPECT_EQ(bus_.observer_count(), 1u);

    bus_.dispatch(start_event{});
    ASSERT_EQ(log_.size(), 1u);
    EXPECT_EQ(log_[0], "b:start");
}

TEST_F(EventBusTest, CallbackObserverCapabilitiesFollowCallbacks) {
    auto observer = std::make_shared<callback_observer>("cb");
    EXPECT_EQ(observer->capabilities(), observer_capability::none);

    int progress_calls = 0;
    double last_percentage = 0.0;
    observer->on_progress([&](const progress_event& e) {
        ++progress_calls;
        last_percentage = e.percentage();
    });
    EXPECT_EQ(observer->capabilities(), observer_capability::progress);

    observer->on_session_complete([](const session_event&) {});
    EXPECT_TRUE(has_capability(observer->capabilities(), observer_capability::session));
    EXPECT_FALSE(has_capability(observer->capabilities(), observer_capability::auth));

    bus_.register_observer(observer);

    progress_event progress;
    progress.bytes_committed = 25;
    progress.total_bytes = 100;
    bus_.dispatch(progress);
    bus_.dispatch(auth_event{});

    EXPECT_EQ(progress_calls, 1);
    EXPECT_DOUBLE_EQ(last_percentage, 25.0);
}

TEST_F(EventBusTest, EmptyFileProgressIsComplete) {
    progress_event progress;
    EXPECT_DOUBLE_EQ(progress.percentage(), 100.0);
}

TEST_F(EventBusTest, HookMayRegisterAnotherObserver) {
    auto observer = std::make_shared<callback_observer>("registrar");
    observer->on_start([this](const start_event&) {
        bus_.register_observer(std::make_shared<callback_observer>("late"));
    });
    bus_.register_observer(observer);

    EXPECT_EQ(bus_.dispatch(start_event{}), 0u);
    EXPECT_EQ(bus_.observer_count(), 2u);
}

}  // namespace kcenon::delta_fetch::test
