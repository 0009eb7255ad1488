#include "stillhere/store.hpp"
#include "stillhere/logger.hpp"

#include <algorithm>

namespace stillhere {

// ==================== MemoryDeviceStore ====================

DevicePtr MemoryDeviceStore::get(const std::string& uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(uuid);
    if (it == devices_.end()) {
        return nullptr;
    }
    return it->second;
}

DeviceMap MemoryDeviceStore::get_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return DeviceMap(devices_.begin(), devices_.end());
}

std::vector<DevicePtr> MemoryDeviceStore::get_fire_at_between(UnixSeconds start, UnixSeconds end) {
    std::lock_guard<std::mutex> lock(mutex_);
    return collect_range_locked(start, end);
}

std::vector<DevicePtr> MemoryDeviceStore::claim_fire_at_between(UnixSeconds start,
                                                                 UnixSeconds end) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto claimed = collect_range_locked(start, end);
    if (start <= end) {
        by_fire_at_.erase(by_fire_at_.lower_bound(start), by_fire_at_.upper_bound(end));
    }
    return claimed;
}

void MemoryDeviceStore::add(DevicePtr device) {
    if (!device) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device->uuid());
    if (it != devices_.end()) {
        unindex_locked(it->first, it->second->fire_at());
        it->second = device;
    } else {
        devices_.emplace(device->uuid(), device);
    }
    index_locked(device->uuid(), device->fire_at());
}

void MemoryDeviceStore::update(const std::string& uuid, const DeviceUpdate& changes) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(uuid);
    if (it == devices_.end()) {
        STILLHERE_LOG_DEBUG("update of unknown device {} ignored", uuid);
        return;
    }

    Device& device = *it->second;
    if (changes.fire_at) {
        unindex_locked(uuid, device.fire_at());
        device.set_fire_at(*changes.fire_at);
        index_locked(uuid, device.fire_at());
    }
    if (changes.last_will) {
        device.set_last_will(*changes.last_will);
    }
    if (changes.consumed) {
        device.set_consumed(*changes.consumed);
    }
    if (changes.consumer_id) {
        device.set_consumer_id(*changes.consumer_id);
    }
    if (changes.version_number) {
        device.set_version_number(*changes.version_number);
    }
}

void MemoryDeviceStore::remove(const std::string& uuid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(uuid);
    if (it == devices_.end()) {
        return;
    }
    unindex_locked(uuid, it->second->fire_at());
    devices_.erase(it);
}

void MemoryDeviceStore::remove_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
    by_fire_at_.clear();
}

std::size_t MemoryDeviceStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

StoreSnapshot MemoryDeviceStore::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    StoreSnapshot snapshot;
    snapshot.devices.reserve(devices_.size());
    for (const auto& [uuid, device] : devices_) {
        snapshot.devices.push_back(*device);
    }
    for (const auto& [fire_at, bucket] : by_fire_at_) {
        snapshot.indexed.insert(bucket.begin(), bucket.end());
    }
    return snapshot;
}

void MemoryDeviceStore::restore(const StoreSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_.clear();
    by_fire_at_.clear();
    for (const auto& device : snapshot.devices) {
        devices_[device.uuid()] = std::make_shared<Device>(device);
        if (snapshot.indexed.count(device.uuid()) > 0) {
            index_locked(device.uuid(), device.fire_at());
        }
    }
}

std::size_t MemoryDeviceStore::bucket_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_fire_at_.size();
}

void MemoryDeviceStore::index_locked(const std::string& uuid, UnixSeconds fire_at) {
    by_fire_at_[fire_at].insert(uuid);
}

void MemoryDeviceStore::unindex_locked(const std::string& uuid, UnixSeconds fire_at) {
    auto bucket = by_fire_at_.find(fire_at);
    if (bucket == by_fire_at_.end()) {
        // already claimed
        return;
    }
    bucket->second.erase(uuid);
    if (bucket->second.empty()) {
        by_fire_at_.erase(bucket);
    }
}

std::vector<DevicePtr> MemoryDeviceStore::collect_range_locked(UnixSeconds start,
                                                               UnixSeconds end) const {
    std::vector<DevicePtr> result;
    if (end < start) {
        return result;
    }

    // std::map and std::set iterate in order, giving fire_at then uuid
    for (auto bucket = by_fire_at_.lower_bound(start);
         bucket != by_fire_at_.end() && bucket->first <= end; ++bucket) {
        for (const auto& uuid : bucket->second) {
            auto it = devices_.find(uuid);
            if (it != devices_.end()) {
                result.push_back(it->second);
            }
        }
    }
    return result;
}

}  // namespace stillhere
