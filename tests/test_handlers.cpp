#include <gtest/gtest.h>
#include <stillhere/bootstrap.hpp>
#include <stillhere/handlers.hpp>

#include "test_helpers.hpp"

#include <memory>
#include <vector>

namespace stillhere {
namespace {

using testing_helpers::LogCapture;
using testing_helpers::ManualClock;

class HandlersTest : public ::testing::Test {
  protected:
    HandlersTest()
        : store(std::make_shared<MemoryDeviceStore>()), bootstrap(store, clock.clock()) {
        bootstrap.add_observers([this](HandlerRegistry& registry) {
            registry.on_event<DeviceRegistered>(
                [this](const DeviceRegistered& event) { registered.push_back(event); });
            registry.on_event<DeviceRemoved>(
                [this](const DeviceRemoved& event) { removed.push_back(event); });
            registry.on_event<DeviceKeptAlive>(
                [this](const DeviceKeptAlive& event) { kept_alive.push_back(event); });
        });
    }

    void dispatch(const Message& message) { bootstrap.make_bus()->dispatch(message); }

    ManualClock clock{100};
    std::shared_ptr<MemoryDeviceStore> store;
    Bootstrap bootstrap;
    std::vector<DeviceRegistered> registered;
    std::vector<DeviceRemoved> removed;
    std::vector<DeviceKeptAlive> kept_alive;
};

// ==================== Register ====================

TEST_F(HandlersTest, RegisterStoresDeviceAndEmitsOneEvent) {
    dispatch(RegisterDevice("d1", "sensor", "help", 10));

    auto device = store->get("d1");
    ASSERT_NE(device, nullptr);
    EXPECT_EQ(device->created_at(), 100);
    EXPECT_EQ(device->fire_at(), 110);

    ASSERT_EQ(registered.size(), 1u);
    EXPECT_EQ(registered[0].uuid, "d1");
    EXPECT_EQ(registered[0].fire_at, 110);
    EXPECT_EQ(registered[0].ttl, 10);
}

TEST_F(HandlersTest, ReRegisterReplacesWillAndTtl) {
    dispatch(RegisterDevice("d1", "sensor", "help", 10));
    clock.advance(5);

    dispatch(RegisterDevice("d1", "other", "other will", 99));

    auto device = store->get("d1");
    ASSERT_NE(device, nullptr);
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(device->name(), "other");
    EXPECT_EQ(device->last_will(), "other will");
    EXPECT_EQ(device->created_at(), 105);
    EXPECT_EQ(device->fire_at(), 204);

    // Old expiry bucket is gone
    EXPECT_TRUE(store->get_fire_at_between(110, 110).empty());
    ASSERT_EQ(registered.size(), 2u);
    EXPECT_EQ(registered[1].fire_at, 204);
}

// ==================== Keep-Alive ====================

TEST_F(HandlersTest, KeepAliveRecomputesFireAtFromNow) {
    dispatch(RegisterDevice("d1", "sensor", "help", 10));
    clock.set(105);

    dispatch(KeepAliveDevice("d1"));

    EXPECT_EQ(store->get("d1")->fire_at(), 115);
    EXPECT_TRUE(store->get_fire_at_between(110, 110).empty());
    EXPECT_EQ(store->get_fire_at_between(115, 115).size(), 1u);

    ASSERT_EQ(kept_alive.size(), 1u);
    EXPECT_EQ(kept_alive[0].fire_at, 115);
}

TEST_F(HandlersTest, LateKeepAliveGetsFullTtl) {
    dispatch(RegisterDevice("d1", "sensor", "help", 10));
    clock.set(500);

    dispatch(KeepAliveDevice("d1"));

    EXPECT_EQ(store->get("d1")->fire_at(), 510);
}

TEST_F(HandlersTest, KeepAliveUnknownIsNotFoundWithoutMutation) {
    dispatch(RegisterDevice("d1", "sensor", "help", 10));
    auto before = store->get_all();

    try {
        dispatch(KeepAliveDevice("ghost"));
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }

    EXPECT_EQ(store->size(), before.size());
    EXPECT_EQ(store->get("d1")->fire_at(), 110);
    EXPECT_TRUE(kept_alive.empty());
}

// ==================== Remove ====================

TEST_F(HandlersTest, RemoveDeletesAndEmitsEvent) {
    dispatch(RegisterDevice("d1", "sensor", "help", 10));

    dispatch(RemoveDevice("d1"));

    EXPECT_EQ(store->get("d1"), nullptr);
    EXPECT_EQ(store->bucket_count(), 0u);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].uuid, "d1");
}

TEST_F(HandlersTest, RemoveUnknownIsNotFoundWithoutMutation) {
    dispatch(RegisterDevice("d1", "sensor", "help", 10));

    try {
        dispatch(RemoveDevice("ghost"));
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }

    EXPECT_EQ(store->size(), 1u);
    EXPECT_TRUE(removed.empty());
}

// ==================== Event Handlers ====================

TEST_F(HandlersTest, DefaultObserversLogEventsAsJson) {
    LogCapture logs;

    dispatch(RegisterDevice("d1", "sensor", "help", 10));
    dispatch(KeepAliveDevice("d1"));
    dispatch(RemoveDevice("d1"));

    EXPECT_TRUE(logs.contains(R"("type":"DeviceRegistered")"));
    EXPECT_TRUE(logs.contains(R"("type":"DeviceKeptAlive")"));
    EXPECT_TRUE(logs.contains(R"("type":"DeviceRemoved")"));
}

TEST(CommandHandlerTest, HandlersUseGivenUnitOfWork) {
    MemoryDeviceStore store;
    MemoryUnitOfWork uow(store);
    Clock clock = []() -> UnixSeconds { return 1000; };

    handlers::register_device(RegisterDevice("d1", "n", "w", 60), uow, clock);

    EXPECT_EQ(store.get("d1")->fire_at(), 1060);
    auto events = uow.collect_new_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_STREQ(events[0]->type_name(), "DeviceRegistered");
}

}  // namespace
}  // namespace stillhere
