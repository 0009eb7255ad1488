#pragma once

/**
 * @file store.hpp
 * @brief Device storage for stillhere
 *
 * The store owns every registered Device and indexes it twice: by uuid and
 * by the second at which it expires. All operations are atomic with respect
 * to each other.
 */

#include "stillhere/device.hpp"
#include "stillhere/stillhere.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace stillhere {

/// Shared handle to a stored device
using DevicePtr = std::shared_ptr<Device>;

/// Identity index snapshot
using DeviceMap = std::map<std::string, DevicePtr>;

/**
 * @brief Partial update applied by DeviceStoreInterface::update
 *
 * Only engaged fields are written.
 */
struct DeviceUpdate {
    std::optional<UnixSeconds> fire_at;
    std::optional<std::string> last_will;
    std::optional<bool> consumed;
    std::optional<std::optional<std::string>> consumer_id;
    std::optional<int64_t> version_number;
};

/**
 * @brief Contents of both indexes at one point in time
 */
struct StoreSnapshot {
    std::vector<Device> devices;
    std::set<std::string> indexed;  ///< uuids present in the time index
};

/**
 * @brief Storage interface for devices
 */
class DeviceStoreInterface {
  public:
    virtual ~DeviceStoreInterface() = default;

    /// Look up a device by uuid (nullptr if absent)
    virtual DevicePtr get(const std::string& uuid) = 0;

    /// Snapshot of the identity index
    virtual DeviceMap get_all() = 0;

    /// Devices whose fire_at lies in [start, end], without claiming them
    virtual std::vector<DevicePtr> get_fire_at_between(UnixSeconds start, UnixSeconds end) = 0;

    /**
     * @brief Claim every device whose fire_at lies in [start, end]
     *
     * The matching buckets leave the time index in the same critical section,
     * so a second claim over the same window returns nothing. Results are
     * ordered by fire_at, then uuid.
     */
    virtual std::vector<DevicePtr> claim_fire_at_between(UnixSeconds start, UnixSeconds end) = 0;

    /// Insert a device (replaces and re-indexes an existing uuid)
    virtual void add(DevicePtr device) = 0;

    /// Apply a partial update; a new fire_at re-indexes the device. No-op if absent.
    virtual void update(const std::string& uuid, const DeviceUpdate& changes) = 0;

    /// Delete a device from both indexes. No-op if absent.
    virtual void remove(const std::string& uuid) = 0;

    /// Clear both indexes
    virtual void remove_all() = 0;

    /// Number of indexed devices
    [[nodiscard]] virtual std::size_t size() = 0;

    /// Deep copy of every device plus the uuids currently in the time index
    virtual StoreSnapshot snapshot() = 0;

    /**
     * @brief Replace the contents of both indexes with a snapshot
     *
     * Devices absent from the snapshot's time index (already claimed) stay
     * unindexed.
     */
    virtual void restore(const StoreSnapshot& snapshot) = 0;

    /// Lock serializing unit-of-work scopes over this store
    virtual std::mutex& transaction_mutex() = 0;
};

/**
 * @brief In-memory storage implementation
 */
class MemoryDeviceStore : public DeviceStoreInterface {
  public:
    MemoryDeviceStore() = default;

    MemoryDeviceStore(const MemoryDeviceStore&) = delete;
    MemoryDeviceStore& operator=(const MemoryDeviceStore&) = delete;

    DevicePtr get(const std::string& uuid) override;
    DeviceMap get_all() override;
    std::vector<DevicePtr> get_fire_at_between(UnixSeconds start, UnixSeconds end) override;
    std::vector<DevicePtr> claim_fire_at_between(UnixSeconds start, UnixSeconds end) override;

    void add(DevicePtr device) override;
    void update(const std::string& uuid, const DeviceUpdate& changes) override;
    void remove(const std::string& uuid) override;
    void remove_all() override;

    [[nodiscard]] std::size_t size() override;
    StoreSnapshot snapshot() override;
    void restore(const StoreSnapshot& snapshot) override;
    std::mutex& transaction_mutex() override { return transaction_mutex_; }

    /// Number of non-empty expiry buckets (exposed for tests)
    [[nodiscard]] std::size_t bucket_count();

  private:
    // Callers hold mutex_
    void index_locked(const std::string& uuid, UnixSeconds fire_at);
    void unindex_locked(const std::string& uuid, UnixSeconds fire_at);
    std::vector<DevicePtr> collect_range_locked(UnixSeconds start, UnixSeconds end) const;

    std::unordered_map<std::string, DevicePtr> devices_;
    std::map<UnixSeconds, std::set<std::string>> by_fire_at_;
    std::mutex mutex_;
    std::mutex transaction_mutex_;
};

}  // namespace stillhere
