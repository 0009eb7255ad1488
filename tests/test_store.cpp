#include <gtest/gtest.h>
#include <stillhere/store.hpp>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

namespace stillhere {
namespace {

DevicePtr make_device(const std::string& uuid, int64_t ttl, UnixSeconds now) {
    return std::make_shared<Device>(uuid, "name-" + uuid, "will-" + uuid, ttl, now);
}

std::vector<std::string> uuids(const std::vector<DevicePtr>& devices) {
    std::vector<std::string> result;
    for (const auto& device : devices) {
        result.push_back(device->uuid());
    }
    return result;
}

// ==================== MemoryDeviceStore Tests ====================

class MemoryDeviceStoreTest : public ::testing::Test {
  protected:
    MemoryDeviceStore store;
};

TEST_F(MemoryDeviceStoreTest, InitiallyEmpty) {
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.get("missing"), nullptr);
    EXPECT_TRUE(store.get_all().empty());
    EXPECT_TRUE(store.get_fire_at_between(0, 1000).empty());
}

TEST_F(MemoryDeviceStoreTest, AddAndGet) {
    auto device = make_device("a", 10, 100);
    store.add(device);

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get("a"), device);
    EXPECT_EQ(store.get_all().count("a"), 1u);
}

TEST_F(MemoryDeviceStoreTest, AddExistingUuidReplacesAndReindexes) {
    store.add(make_device("a", 10, 100));
    auto replacement = make_device("a", 50, 100);
    store.add(replacement);

    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.get("a"), replacement);
    EXPECT_TRUE(store.get_fire_at_between(110, 110).empty());
    EXPECT_EQ(uuids(store.get_fire_at_between(150, 150)), std::vector<std::string>{"a"});
    EXPECT_EQ(store.bucket_count(), 1u);
}

TEST_F(MemoryDeviceStoreTest, RangeIsInclusiveOnBothEnds) {
    store.add(make_device("a", 10, 100));  // 110
    store.add(make_device("b", 15, 100));  // 115
    store.add(make_device("c", 20, 100));  // 120

    EXPECT_EQ(uuids(store.get_fire_at_between(110, 120)),
              (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(uuids(store.get_fire_at_between(111, 119)), std::vector<std::string>{"b"});
    EXPECT_TRUE(store.get_fire_at_between(121, 200).empty());
    EXPECT_TRUE(store.get_fire_at_between(120, 110).empty());
}

TEST_F(MemoryDeviceStoreTest, GetFireAtBetweenDoesNotClaim) {
    store.add(make_device("a", 10, 100));

    EXPECT_EQ(store.get_fire_at_between(110, 110).size(), 1u);
    EXPECT_EQ(store.get_fire_at_between(110, 110).size(), 1u);
}

TEST_F(MemoryDeviceStoreTest, ClaimIsOneShot) {
    store.add(make_device("a", 10, 100));
    store.add(make_device("b", 12, 100));

    EXPECT_EQ(uuids(store.claim_fire_at_between(100, 115)), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(store.claim_fire_at_between(100, 115).empty());

    // Claimed devices stay registered
    EXPECT_EQ(store.size(), 2u);
    EXPECT_NE(store.get("a"), nullptr);
    EXPECT_EQ(store.bucket_count(), 0u);
}

TEST_F(MemoryDeviceStoreTest, ClaimSingleSecondWindowIsOneShot) {
    store.add(make_device("a", 10, 100));

    EXPECT_EQ(store.claim_fire_at_between(110, 110).size(), 1u);
    EXPECT_TRUE(store.claim_fire_at_between(110, 110).empty());
}

TEST_F(MemoryDeviceStoreTest, ClaimExcludesOneSecondPastEnd) {
    store.add(make_device("a", 10, 100));  // 110
    store.add(make_device("b", 11, 100));  // 111

    EXPECT_EQ(uuids(store.claim_fire_at_between(105, 110)), std::vector<std::string>{"a"});
    EXPECT_EQ(uuids(store.claim_fire_at_between(111, 111)), std::vector<std::string>{"b"});
}

TEST_F(MemoryDeviceStoreTest, ClaimOrdersByFireAtThenUuid) {
    store.add(make_device("z", 10, 100));
    store.add(make_device("m", 5, 100));
    store.add(make_device("a", 10, 100));

    EXPECT_EQ(uuids(store.claim_fire_at_between(0, 1000)),
              (std::vector<std::string>{"m", "a", "z"}));
}

TEST_F(MemoryDeviceStoreTest, UpdateMovesTimeIndex) {
    store.add(make_device("a", 10, 100));

    DeviceUpdate changes;
    changes.fire_at = 140;
    store.update("a", changes);

    EXPECT_EQ(store.get("a")->fire_at(), 140);
    EXPECT_TRUE(store.get_fire_at_between(110, 110).empty());
    EXPECT_EQ(store.get_fire_at_between(140, 140).size(), 1u);
    EXPECT_EQ(store.bucket_count(), 1u);
}

TEST_F(MemoryDeviceStoreTest, UpdateRearmsClaimedDevice) {
    store.add(make_device("a", 10, 100));
    ASSERT_EQ(store.claim_fire_at_between(110, 110).size(), 1u);

    DeviceUpdate changes;
    changes.fire_at = 130;
    store.update("a", changes);

    EXPECT_EQ(store.claim_fire_at_between(111, 130).size(), 1u);
}

TEST_F(MemoryDeviceStoreTest, UpdatePartialAttributes) {
    store.add(make_device("a", 10, 100));

    DeviceUpdate changes;
    changes.last_will = "new will";
    changes.consumed = true;
    changes.consumer_id = std::optional<std::string>("node");
    changes.version_number = 7;
    store.update("a", changes);

    auto device = store.get("a");
    EXPECT_EQ(device->last_will(), "new will");
    EXPECT_TRUE(device->consumed());
    EXPECT_EQ(device->consumer_id().value_or(""), "node");
    EXPECT_EQ(device->version_number(), 7);
    EXPECT_EQ(device->fire_at(), 110);
}

TEST_F(MemoryDeviceStoreTest, UpdateUnknownIsNoOp) {
    DeviceUpdate changes;
    changes.fire_at = 10;
    EXPECT_NO_THROW(store.update("missing", changes));
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(MemoryDeviceStoreTest, RemovePrunesEmptyBuckets) {
    store.add(make_device("a", 10, 100));
    store.add(make_device("b", 10, 100));
    EXPECT_EQ(store.bucket_count(), 1u);

    store.remove("a");
    EXPECT_EQ(store.bucket_count(), 1u);
    EXPECT_EQ(uuids(store.get_fire_at_between(110, 110)), std::vector<std::string>{"b"});

    store.remove("b");
    EXPECT_EQ(store.bucket_count(), 0u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(MemoryDeviceStoreTest, RemoveUnknownIsNoOp) {
    store.add(make_device("a", 10, 100));
    store.remove("missing");
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(MemoryDeviceStoreTest, RemoveAllClearsBothIndexes) {
    store.add(make_device("a", 10, 100));
    store.add(make_device("b", 20, 100));

    store.remove_all();

    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.bucket_count(), 0u);
    EXPECT_TRUE(store.get_fire_at_between(0, 1000).empty());
}

// ==================== Snapshot / Restore ====================

TEST_F(MemoryDeviceStoreTest, SnapshotRecordsIndexedUuidsOnly) {
    store.add(make_device("a", 10, 100));
    store.add(make_device("b", 20, 100));
    store.claim_fire_at_between(110, 110);

    auto snapshot = store.snapshot();

    EXPECT_EQ(snapshot.devices.size(), 2u);
    EXPECT_EQ(snapshot.indexed, (std::set<std::string>{"b"}));
}

TEST_F(MemoryDeviceStoreTest, RestoreKeepsClaimedDevicesUnindexed) {
    store.add(make_device("a", 10, 100));
    store.add(make_device("b", 20, 100));
    store.claim_fire_at_between(110, 110);
    auto snapshot = store.snapshot();

    store.remove_all();
    store.add(make_device("c", 5, 100));
    store.restore(snapshot);

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.get("c"), nullptr);
    ASSERT_NE(store.get("a"), nullptr);
    EXPECT_TRUE(store.claim_fire_at_between(110, 110).empty());
    EXPECT_EQ(uuids(store.claim_fire_at_between(120, 120)), (std::vector<std::string>{"b"}));
    EXPECT_EQ(store.bucket_count(), 0u);
}

TEST_F(MemoryDeviceStoreTest, RestoreCopiesDevices) {
    store.add(make_device("a", 10, 100));
    auto snapshot = store.snapshot();

    store.get("a")->consume("node");
    store.restore(snapshot);

    EXPECT_FALSE(store.get("a")->consumed());
}

// ==================== Thread Safety ====================

TEST_F(MemoryDeviceStoreTest, ConcurrentClaimsNeverReturnADeviceTwice) {
    constexpr int kDevices = 500;
    for (int i = 0; i < kDevices; ++i) {
        store.add(make_device("d" + std::to_string(i), i % 50, 100));
    }

    std::atomic<int> claimed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &claimed]() {
            for (UnixSeconds second = 100; second < 150; ++second) {
                claimed += static_cast<int>(store.claim_fire_at_between(second, second).size());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(claimed.load(), kDevices);
}

}  // namespace
}  // namespace stillhere
