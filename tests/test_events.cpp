#include <gtest/gtest.h>
#include <licenseguard/events.hpp>

#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace licenseguard {
namespace {

// ==================== EventBus Tests ====================

class EventBusTest : public ::testing::Test {
  protected:
    EventBus bus;
};

TEST_F(EventBusTest, HandlerReceivesValidationResult) {
    std::optional<LicenseStatus> received;

    auto sub = bus.on(events::VALIDATION_FAILED, [&](const EventData& data) {
        received = std::any_cast<const LicenseValidationResult&>(data).status;
    });

    LicenseValidationResult result;
    result.status = LicenseStatus::DeviceMismatch;
    bus.emit(events::VALIDATION_FAILED, result);

    EXPECT_EQ(received, LicenseStatus::DeviceMismatch);
}

TEST_F(EventBusTest, EmitWithoutPayload) {
    bool empty = false;
    auto sub = bus.on(events::GUARD_STOPPED, [&](const EventData& data) { empty = !data.has_value(); });

    bus.emit(events::GUARD_STOPPED);

    EXPECT_TRUE(empty);
}

TEST_F(EventBusTest, SubscriptionCanBeCancelled) {
    int call_count = 0;

    auto sub = bus.on(events::STATUS_CHANGED, [&](const EventData& /*data*/) { call_count++; });

    bus.emit(events::STATUS_CHANGED);
    EXPECT_EQ(call_count, 1);

    sub.cancel();
    EXPECT_FALSE(sub.is_active());

    bus.emit(events::STATUS_CHANGED);
    EXPECT_EQ(call_count, 1);
}

TEST_F(EventBusTest, MultipleSubscribersReceiveEvents) {
    int count1 = 0;
    int count2 = 0;

    auto sub1 = bus.on(events::STATUS_CHANGED, [&](const EventData& /*data*/) { count1++; });
    auto sub2 = bus.on(events::STATUS_CHANGED, [&](const EventData& /*data*/) { count2++; });

    bus.emit(events::STATUS_CHANGED);

    EXPECT_EQ(count1, 1);
    EXPECT_EQ(count2, 1);
    EXPECT_EQ(bus.handler_count(events::STATUS_CHANGED), 2u);
}

TEST_F(EventBusTest, DifferentEventsAreIndependent) {
    int count_a = 0;
    int count_b = 0;

    auto sub_a = bus.on(events::LICENSE_BLOCKED, [&](const EventData& /*data*/) { count_a++; });
    auto sub_b = bus.on(events::GUARD_CYCLE, [&](const EventData& /*data*/) { count_b++; });

    bus.emit(events::LICENSE_BLOCKED);

    EXPECT_EQ(count_a, 1);
    EXPECT_EQ(count_b, 0);
}

TEST_F(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    int count = 0;

    auto bad = bus.on(events::STATUS_CHANGED, [](const EventData& /*data*/) {
        throw std::runtime_error("handler failure");
    });
    auto good = bus.on(events::STATUS_CHANGED, [&](const EventData& /*data*/) { count++; });

    EXPECT_NO_THROW(bus.emit(events::STATUS_CHANGED));
    EXPECT_EQ(count, 1);
}

TEST_F(EventBusTest, HandlerMayCancelItselfDuringEmit) {
    int count = 0;
    Subscription sub;
    sub = bus.on(events::STATUS_CHANGED, [&](const EventData& /*data*/) {
        count++;
        sub.cancel();
    });

    bus.emit(events::STATUS_CHANGED);
    bus.emit(events::STATUS_CHANGED);

    EXPECT_EQ(count, 1);
}

TEST_F(EventBusTest, ClearAllRemovesEverything) {
    int count = 0;

    auto sub1 = bus.on(events::ACTIVATION_SUCCESS, [&](const EventData& /*data*/) { count++; });
    auto sub2 = bus.on(events::DEACTIVATION_SUCCESS, [&](const EventData& /*data*/) { count++; });

    bus.clear_all();
    bus.emit(events::ACTIVATION_SUCCESS);
    bus.emit(events::DEACTIVATION_SUCCESS);

    EXPECT_EQ(count, 0);
    EXPECT_EQ(bus.handler_count(events::ACTIVATION_SUCCESS), 0u);
}

TEST_F(EventBusTest, ConcurrentEmitIsSafe) {
    std::atomic<int> count{0};
    auto sub = bus.on(events::STATUS_CHANGED, [&](const EventData& /*data*/) { count++; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this]() {
            for (int j = 0; j < 100; ++j) {
                bus.emit(events::STATUS_CHANGED);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count.load(), 400);
}

TEST(EventNamesTest, Constants) {
    EXPECT_STREQ(events::STATUS_CHANGED, "license:status-changed");
    EXPECT_STREQ(events::LICENSE_BLOCKED, "license:blocked");
    EXPECT_STREQ(events::GUARD_CYCLE, "guard:cycle");
    EXPECT_STREQ(events::ACTIVATION_SUCCESS, "activation:success");
    EXPECT_STREQ(events::DEACTIVATION_ERROR, "deactivation:error");
}

}  // namespace
}  // namespace licenseguard
