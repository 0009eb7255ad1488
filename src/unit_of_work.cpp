#include "stillhere/unit_of_work.hpp"
#include "stillhere/logger.hpp"

namespace stillhere {

// ==================== DeviceRepository ====================

DevicePtr DeviceRepository::get(const std::string& uuid) {
    auto device = store_.get(uuid);
    track(device);
    return device;
}

DeviceMap DeviceRepository::get_all() {
    auto devices = store_.get_all();
    for (const auto& [uuid, device] : devices) {
        track(device);
    }
    return devices;
}

std::vector<DevicePtr> DeviceRepository::get_fire_at_between(UnixSeconds start, UnixSeconds end) {
    auto devices = store_.get_fire_at_between(start, end);
    for (const auto& device : devices) {
        track(device);
    }
    return devices;
}

std::vector<DevicePtr> DeviceRepository::claim_fire_at_between(UnixSeconds start,
                                                               UnixSeconds end) {
    auto devices = store_.claim_fire_at_between(start, end);
    for (const auto& device : devices) {
        track(device);
    }
    return devices;
}

void DeviceRepository::add(const DevicePtr& device) {
    store_.add(device);
    track(device);
}

void DeviceRepository::update(const std::string& uuid, const DeviceUpdate& changes) {
    store_.update(uuid, changes);
    track(store_.get(uuid));
}

void DeviceRepository::remove(const std::string& uuid) {
    // Track before removal so events recorded on the instance are still collected
    track(store_.get(uuid));
    store_.remove(uuid);
}

void DeviceRepository::remove_all() {
    for (const auto& [uuid, device] : store_.get_all()) {
        track(device);
    }
    store_.remove_all();
}

void DeviceRepository::track(const DevicePtr& device) {
    if (!device) {
        return;
    }
    if (seen_ids_.insert(device->uuid()).second) {
        seen_.push_back(device);
    }
}

// ==================== UnitOfWork ====================

UnitOfWork::Scope::Scope(UnitOfWork& uow) : uow_(&uow) { uow_->begin(); }

UnitOfWork::Scope::Scope(Scope&& other) noexcept : uow_(other.uow_) { other.uow_ = nullptr; }

UnitOfWork::Scope::~Scope() {
    if (uow_ == nullptr) {
        return;
    }
    try {
        uow_->rollback();
    } catch (const std::exception& e) {
        STILLHERE_LOG_ERROR("rollback on scope exit failed: {}", e.what());
    }
}

void UnitOfWork::Scope::commit() {
    if (uow_ == nullptr) {
        throw Error(ErrorCode::InitializationError, "scope already ended");
    }
    UnitOfWork* uow = uow_;
    uow_ = nullptr;
    uow->commit();
}

void UnitOfWork::Scope::rollback() {
    if (uow_ == nullptr) {
        throw Error(ErrorCode::InitializationError, "scope already ended");
    }
    UnitOfWork* uow = uow_;
    uow_ = nullptr;
    uow->rollback();
}

std::vector<std::shared_ptr<const Event>> UnitOfWork::collect_new_events() {
    std::vector<std::shared_ptr<const Event>> events;
    for (const auto& device : seen_devices()) {
        while (auto event = device->pop_event()) {
            events.push_back(std::move(event));
        }
    }
    return events;
}

// ==================== MemoryUnitOfWork ====================

MemoryUnitOfWork::~MemoryUnitOfWork() {
    if (in_scope()) {
        STILLHERE_LOG_WARN("unit of work destroyed inside an open scope, rolling back");
        rollback();
    }
}

void MemoryUnitOfWork::begin() {
    if (in_scope()) {
        throw Error(ErrorCode::InitializationError, "unit of work scope already open");
    }

    std::unique_lock<std::mutex> lock(store_.transaction_mutex());

    snapshot_ = store_.snapshot();
    repository_ = std::make_unique<DeviceRepository>(store_);
    lock_ = std::move(lock);
}

void MemoryUnitOfWork::commit() {
    if (!in_scope()) {
        throw Error(ErrorCode::InitializationError, "commit outside of a unit of work scope");
    }
    snapshot_ = StoreSnapshot{};
    lock_.unlock();
}

void MemoryUnitOfWork::rollback() {
    if (!in_scope()) {
        throw Error(ErrorCode::InitializationError, "rollback outside of a unit of work scope");
    }

    store_.restore(snapshot_);
    STILLHERE_LOG_DEBUG("unit of work rolled back to {} device(s)", snapshot_.devices.size());

    // Events raised by the abandoned scope describe changes that never happened
    for (const auto& device : repository_->seen()) {
        device->pop_events();
    }
    repository_ = std::make_unique<DeviceRepository>(store_);

    snapshot_ = StoreSnapshot{};
    lock_.unlock();
}

std::vector<std::shared_ptr<const Event>> MemoryUnitOfWork::collect_new_events() {
    if (in_scope()) {
        return UnitOfWork::collect_new_events();
    }
    std::lock_guard<std::mutex> lock(store_.transaction_mutex());
    return UnitOfWork::collect_new_events();
}

DeviceRepository& MemoryUnitOfWork::devices() {
    if (!in_scope() || !repository_) {
        throw Error(ErrorCode::InitializationError,
                    "devices accessed outside of a unit of work scope");
    }
    return *repository_;
}

std::vector<DevicePtr> MemoryUnitOfWork::seen_devices() const {
    if (!repository_) {
        return {};
    }
    return repository_->seen();
}

}  // namespace stillhere
